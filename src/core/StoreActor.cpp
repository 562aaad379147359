//
// StoreActor.cpp
//

#include "StoreActor.hpp"

#include <exception>
#include <print>
#include <type_traits>
#include <utility>

#include "Session.hpp"

namespace clash::core
{
    StoreActor::StoreActor(Store store) :
        store_(std::move(store))
    {
    }

    StoreActor::~StoreActor()
    {
        Stop();
    }

    auto StoreActor::Start() -> void
    {
        CLS_ASSERT(!worker_.joinable(), "StoreActor started twice");
        worker_ = std::thread([this]() { Run(); });
    }

    auto StoreActor::Stop() -> void
    {
        mailbox_.Close();
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
        {
            worker_.join();
        }
    }

    auto StoreActor::Post(StoreEvent ev) -> bool
    {
        return mailbox_.Push(std::move(ev));
    }

    auto StoreActor::Run() -> void
    {
        StoreEvent ev{};
        while (mailbox_.Pop(ev))
        {
            // one event is fully applied and delivered before the next is looked at
            try
            {
                Outbox out = Handle(ev);
                Deliver(out);
            }
            catch (OmegaException<error::Code> const& e)
            {
                std::print("[Store] Event dropped: {}\n", e);
            }
            catch (std::exception const& e)
            {
                std::print("[Store] Event dropped: {}\n", e.what());
            }
            ++processed_;
        }
        std::print("[Store] Worker stopped after {} event(s)\n", processed_.load());
    }

    auto StoreActor::Handle(StoreEvent& ev) -> Outbox
    {
        return std::visit([&]<typename T0>(T0& e) -> Outbox
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, CreateEvent>)
            {
                return store_.Create(std::move(e.session));
            }
            else if constexpr (std::is_same_v<T, DeleteEvent>)
            {
                return store_.Delete(e.id);
            }
            else
            {
                return store_.Receive(e.id, e.payload);
            }
        }, ev);
    }

    auto StoreActor::Deliver(Outbox& out) -> void
    {
        for (Outbound& o : out)
        {
            PlayerRecord const* rec = store_.Players().Find(o.to);
            if (rec == nullptr || !rec->session)
            {
                std::print("[Store] No session for P{}, dropping {}\n", o.to, describe(o.msg));
                continue;
            }
            rec->session->Publish(std::move(o.msg));
        }
    }
}
