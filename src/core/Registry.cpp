//
// Registry.cpp
//

#include "Registry.hpp"

#include <format>
#include <utility>

#include "Session.hpp"

namespace clash::core
{
    using error::Viol;
    using RVC = error::RuleViolationCode;

    auto Registry::Add(std::shared_ptr<Session> session) -> PlayerId
    {
        PlayerId const id = next_id_++;
        players_.emplace(id, PlayerRecord{.id = id, .session = std::move(session), .phase = Idle{}});
        return id;
    }

    auto Registry::Remove(PlayerId const id) -> bool
    {
        return players_.erase(id) != 0;
    }

    auto Registry::Find(PlayerId const id) -> PlayerRecord*
    {
        auto const it = players_.find(id);
        return it != players_.end() ? &it->second : nullptr;
    }

    auto Registry::Find(PlayerId const id) const -> PlayerRecord const*
    {
        auto const it = players_.find(id);
        return it != players_.end() ? &it->second : nullptr;
    }

    auto Registry::ValidateChallenge(PlayerId const from, PlayerId const target) const -> CheckResult
    {
        PlayerRecord const* me = Find(from);
        if (me == nullptr)
            return std::unexpected(Viol(RVC::IdNotFound_Player).with_target(from));

        if (std::holds_alternative<Challenging>(me->phase))
            return std::unexpected(Viol(RVC::Challenge_AlreadyChallenging)
                                   .with_actor(from)
                                   .with_target(std::get<Challenging>(me->phase).target));

        if (auto const* m = std::get_if<InMatch>(&me->phase))
            return std::unexpected(Viol(RVC::Challenge_AlreadyInMatch).with_actor(from).with_match(m->match));

        if (from == target)
            return std::unexpected(Viol(RVC::Challenge_Self).with_actor(from));

        if (!Contains(target))
            return std::unexpected(Viol(RVC::IdNotFound_Player).with_actor(from).with_target(target));

        return {};
    }

    auto Registry::ValidateResponse(PlayerId const responder, PlayerId const challenger, bool const accepted) const
        -> CheckResult
    {
        PlayerRecord const* other = Find(challenger);
        if (other == nullptr)
            return std::unexpected(Viol(RVC::IdNotFound_Player).with_actor(responder).with_target(challenger));

        auto const* ch = std::get_if<Challenging>(&other->phase);
        if (ch == nullptr || ch->target != responder)
            return std::unexpected(Viol(RVC::Response_NotChallenged)
                                   .with_actor(responder)
                                   .with_target(challenger)
                                   .with_detail(std::format("challenger is {}", describe(other->phase))));

        if (accepted)
        {
            PlayerRecord const* me = Find(responder);
            if (me == nullptr)
                return std::unexpected(Viol(RVC::IdNotFound_Player).with_target(responder));

            if (auto const* m = std::get_if<InMatch>(&me->phase))
                return std::unexpected(Viol(RVC::Response_ResponderInMatch)
                                       .with_actor(responder).with_match(m->match));
        }

        return {};
    }

    auto Registry::SetPhase(PlayerId const id, GamePhase phase) -> void
    {
        PlayerRecord* rec = Find(id);
        if (rec == nullptr)
            CLS_THROW(error::Code::State, std::format("SetPhase on unknown player P{}", id));
        rec->phase = std::move(phase);
    }

    auto Registry::PhaseOf(PlayerId const id) const -> GamePhase const&
    {
        PlayerRecord const* rec = Find(id);
        if (rec == nullptr)
            CLS_THROW(error::Code::State, std::format("PhaseOf on unknown player P{}", id));
        return rec->phase;
    }

    auto Registry::ChallengersOf(PlayerId const target) const -> std::vector<PlayerId>
    {
        std::vector<PlayerId> out;
        for (auto const& [id, rec] : players_)
        {
            if (auto const* ch = std::get_if<Challenging>(&rec.phase); ch != nullptr && ch->target == target)
            {
                out.push_back(id);
            }
        }
        return out;
    }
}
