//
// StoreActor.hpp — the one thread allowed to touch the Store
//

#ifndef CARDCLASH_STOREACTOR_HPP
#define CARDCLASH_STOREACTOR_HPP

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <variant>

#include "Mailbox.hpp"
#include "Store.hpp"

namespace clash::core
{
    struct CreateEvent
    {
        std::shared_ptr<Session> session;
    };

    struct DeleteEvent
    {
        PlayerId id{};
    };

    struct ReceiveEvent
    {
        PlayerId id{};
        std::string payload;
    };

    using StoreEvent = std::variant<CreateEvent, DeleteEvent, ReceiveEvent>;

    class StoreActor
    {
    public:
        explicit StoreActor(Store store);
        ~StoreActor();

        StoreActor(StoreActor const&) = delete;
        auto operator=(StoreActor const&) -> StoreActor& = delete;

        auto Start() -> void;
        // Closes the mailbox, processes what is already queued, joins the worker.
        auto Stop() -> void;

        // Fire-and-forget from any thread. False once stopped.
        auto Post(StoreEvent ev) -> bool;
        auto Create(std::shared_ptr<Session> session) -> bool { return Post(CreateEvent{std::move(session)}); }
        auto Delete(PlayerId id) -> bool { return Post(DeleteEvent{id}); }
        auto Receive(PlayerId id, std::string payload) -> bool { return Post(ReceiveEvent{id, std::move(payload)}); }

        auto Processed() const noexcept -> std::uint64_t { return processed_.load(); }

        // Only safe to call once Stop() returned.
        auto Inspect() const -> Store const& { return store_; }

    private:
        auto Run() -> void;
        auto Handle(StoreEvent& ev) -> Outbox;
        auto Deliver(Outbox& out) -> void;

    private:
        Store store_;
        Mailbox<StoreEvent> mailbox_;
        std::thread worker_;
        std::atomic<std::uint64_t> processed_{0};
    };
}

#endif //CARDCLASH_STOREACTOR_HPP
