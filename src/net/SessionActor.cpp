//
// SessionActor.cpp
//

#include "net/SessionActor.hpp"

#include <exception>
#include <print>
#include <type_traits>
#include <utility>

#include "core/Exception.hpp"

namespace clash::net
{
    SessionActor::SessionActor(std::uint64_t conn_no,
                               core::StoreActor& store,
                               std::shared_ptr<core::Codec const> codec,
                               SendFn send,
                               std::chrono::milliseconds connect_wait)
        : conn_no_{conn_no}
          , store_{store}
          , codec_{std::move(codec)}
          , send_{std::move(send)}
          , connect_wait_{connect_wait}
    {
        CLS_ASSERT(codec_ != nullptr, "SessionActor needs a codec");
    }

    SessionActor::~SessionActor()
    {
        mailbox_.Close();
        if (worker_.joinable())
        {
            if (worker_.get_id() == std::this_thread::get_id())
            {
                worker_.detach();
            }
            else
            {
                worker_.join();
            }
        }
    }

    auto SessionActor::Start() -> void
    {
        CLS_ASSERT(!worker_.joinable(), "SessionActor started twice");
        worker_ = std::thread([this]() { Run(); });
        if (!store_.Create(shared_from_this()))
        {
            std::print("[Session {}] Store is not accepting sessions\n", conn_no_);
            mailbox_.Close();
        }
    }

    auto SessionActor::Deliver(std::string payload) -> void
    {
        if (!mailbox_.Push(InboundFrame{std::move(payload)}))
        {
            std::print("[Session {}] Closed, dropping inbound frame\n", conn_no_);
        }
    }

    auto SessionActor::Close() -> void
    {
        if (!mailbox_.Push(CloseEvent{}))
        {
            std::print("[Session {}] Already stopped\n", conn_no_);
        }
    }

    auto SessionActor::Publish(core::OutboundMessage msg) -> void
    {
        std::optional<core::PlayerId> assigned;
        if (auto const* c = std::get_if<core::ConnectedMsg>(&msg))
        {
            assigned = c->id;
        }
        if (mailbox_.Push(OutboundEvent{std::move(msg)}))
        {
            return;
        }
        if (assigned)
        {
            ReleaseUnclaimed(*assigned);
            return;
        }
        std::print("[Session {}] Closed, dropping outbound message\n", conn_no_);
    }

    auto SessionActor::Join() -> void
    {
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
        {
            worker_.join();
        }
    }

    auto SessionActor::Id() const -> std::optional<core::PlayerId>
    {
        std::lock_guard<std::mutex> lock(state_mx_);
        if (auto const* a = std::get_if<Active>(&state_))
        {
            return a->id;
        }
        return std::nullopt;
    }

    auto SessionActor::Run() -> void
    {
        SessionEvent ev{};
        while (mailbox_.Pop(ev))
        {
            try
            {
                if (!Handle(ev))
                {
                    break;
                }
            }
            catch (core::OmegaException<core::error::Code> const& e)
            {
                std::print("[Session {}] Event dropped: {}\n", conn_no_, e);
            }
            catch (std::exception const& e)
            {
                std::print("[Session {}] Event dropped: {}\n", conn_no_, e.what());
            }
        }
        mailbox_.Close();

        // a Connected that raced the close still owns a player in the store
        SessionEvent left{};
        while (mailbox_.TryPop(left))
        {
            if (auto const* out = std::get_if<OutboundEvent>(&left))
            {
                if (auto const* c = std::get_if<core::ConnectedMsg>(&out->msg); c != nullptr && !Id())
                {
                    ReleaseUnclaimed(c->id);
                }
            }
        }
        std::print("[Session {}] Worker stopped after {} frame(s) sent\n", conn_no_, sent_.load());
    }

    auto SessionActor::Handle(SessionEvent& ev) -> bool
    {
        return std::visit([&]<typename T0>(T0& e) -> bool
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, InboundFrame>)
            {
                std::optional<core::PlayerId> const id = Id();
                if (!id)
                {
                    early_frames_.push_back(std::move(e.payload));
                    return true;
                }
                if (!store_.Receive(*id, std::move(e.payload)))
                {
                    std::print("[Session {}] Store stopped, dropping inbound frame\n", conn_no_);
                }
                return true;
            }
            else if constexpr (std::is_same_v<T, OutboundEvent>)
            {
                OnOutbound(e.msg);
                return true;
            }
            else
            {
                Shutdown();
                return false;
            }
        }, ev);
    }

    auto SessionActor::OnOutbound(core::OutboundMessage const& msg) -> void
    {
        if (auto const* c = std::get_if<core::ConnectedMsg>(&msg))
        {
            Activate(c->id);
        }

        std::string const frame = codec_->Encode(msg, next_msg_id_++);
        if (!send_(frame))
        {
            std::print("[Session {}] Send failed for {}\n", conn_no_, core::describe(msg));
            return;
        }
        ++sent_;
    }

    auto SessionActor::Activate(core::PlayerId id) -> void
    {
        {
            std::lock_guard<std::mutex> lock(state_mx_);
            if (std::holds_alternative<Active>(state_))
            {
                std::print("[Session {}] Ignoring second Connected(P{})\n", conn_no_, id);
                return;
            }
            state_ = Active{id};
        }
        std::print("[Session {}] Active as P{}\n", conn_no_, id);

        for (std::string& f : early_frames_)
        {
            if (!store_.Receive(id, std::move(f)))
            {
                std::print("[Session {}] Store stopped, dropping inbound frame\n", conn_no_);
            }
        }
        early_frames_.clear();
    }

    // The player must be deleted exactly once; if the store has not answered Create yet, wait for it.
    auto SessionActor::Shutdown() -> void
    {
        if (!Id())
        {
            auto const deadline = std::chrono::steady_clock::now() + connect_wait_;
            SessionEvent ev{};
            while (!Id() && mailbox_.PopUntil(ev, deadline))
            {
                if (auto* in = std::get_if<InboundFrame>(&ev))
                {
                    early_frames_.push_back(std::move(in->payload));
                }
                else if (auto* out = std::get_if<OutboundEvent>(&ev))
                {
                    if (auto const* c = std::get_if<core::ConnectedMsg>(&out->msg))
                    {
                        Activate(c->id);
                    }
                }
            }
        }

        std::optional<core::PlayerId> const id = Id();
        if (!id)
        {
            std::print("[Session {}] Closed before the store assigned an id\n", conn_no_);
            return;
        }
        if (!store_.Delete(*id))
        {
            std::print("[Session {}] Store stopped, P{} not deleted\n", conn_no_, *id);
            return;
        }
        std::print("[Session {}] Closed, P{} released\n", conn_no_, *id);
    }

    auto SessionActor::ReleaseUnclaimed(core::PlayerId id) -> void
    {
        if (!store_.Delete(id))
        {
            std::print("[Session {}] Store stopped, P{} not deleted\n", conn_no_, id);
            return;
        }
        std::print("[Session {}] Connected(P{}) arrived after close, released\n", conn_no_, id);
    }
} // namespace clash::net
