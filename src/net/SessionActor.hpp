//
// SessionActor.hpp — per-connection actor between a transport and the store actor
//

#ifndef CARDCLASH_SESSIONACTOR_HPP
#define CARDCLASH_SESSIONACTOR_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "core/Codec.hpp"
#include "core/Mailbox.hpp"
#include "core/Messages.hpp"
#include "core/Session.hpp"
#include "core/StoreActor.hpp"
#include "core/Types.hpp"

namespace clash::net
{
    // Lifecycle: Initializing until the store answers Create with Connected(id).
    struct Initializing
    {
    };

    struct Active
    {
        core::PlayerId id{};
    };

    using SessionState = std::variant<Initializing, Active>;

    struct InboundFrame
    {
        std::string payload;
    };

    struct OutboundEvent
    {
        core::OutboundMessage msg;
    };

    struct CloseEvent
    {
    };

    using SessionEvent = std::variant<InboundFrame, OutboundEvent, CloseEvent>;

    class SessionActor final : public core::Session, public std::enable_shared_from_this<SessionActor>
    {
    public:
        // Writes one binary frame; false if the transport refused it.
        using SendFn = std::function<bool(std::string const&)>;

        SessionActor(std::uint64_t conn_no,
                     core::StoreActor& store,
                     std::shared_ptr<core::Codec const> codec,
                     SendFn send,
                     std::chrono::milliseconds connect_wait = std::chrono::seconds(5));
        ~SessionActor() override;

        SessionActor(SessionActor const&) = delete;
        auto operator=(SessionActor const&) -> SessionActor& = delete;

        // Spawns the worker and registers with the store. Call once, on a shared_ptr.
        auto Start() -> void;

        // Transport side
        auto Deliver(std::string payload) -> void;
        auto Close() -> void;

        // Store side
        auto Publish(core::OutboundMessage msg) -> void override;

        // Blocks until the worker exits (after Close).
        auto Join() -> void;

        auto Id() const -> std::optional<core::PlayerId>;
        auto ConnNo() const noexcept -> std::uint64_t { return conn_no_; }
        auto FramesSent() const noexcept -> std::uint64_t { return sent_.load(); }

    private:
        auto Run() -> void;
        // false once the session is done
        auto Handle(SessionEvent& ev) -> bool;
        auto OnOutbound(core::OutboundMessage const& msg) -> void;
        auto Activate(core::PlayerId id) -> void;
        auto Shutdown() -> void;
        // Deletes a player the store registered after this session stopped listening.
        auto ReleaseUnclaimed(core::PlayerId id) -> void;

    private:
        std::uint64_t conn_no_;
        core::StoreActor& store_;
        std::shared_ptr<core::Codec const> codec_;
        SendFn send_;
        std::chrono::milliseconds connect_wait_;

        core::Mailbox<SessionEvent> mailbox_;
        std::thread worker_;

        // Written by the worker only; the mutex covers readers on other threads.
        mutable std::mutex state_mx_;
        SessionState state_{Initializing{}};

        std::vector<std::string> early_frames_; // received before Connected
        std::uint64_t next_msg_id_{1};
        std::atomic<std::uint64_t> sent_{0};
    };
} // namespace clash::net

#endif //CARDCLASH_SESSIONACTOR_HPP
