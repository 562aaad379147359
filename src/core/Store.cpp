//
// Store.cpp
//

#include "Store.hpp"

#include <format>
#include <print>
#include <type_traits>
#include <utility>

#include "ClassicRules.hpp"
#include "Session.hpp"
#include "Util.hpp"

namespace clash::core
{
    using error::Viol;
    using RVC = error::RuleViolationCode;

    Store::Store(Config const& config,
                 std::shared_ptr<Codec const> codec,
                 std::shared_ptr<MatchObserver> observer) :
        cfg_(config),
        codec_(std::move(codec)),
        observer_(std::move(observer)),
        rules_(std::make_shared<ClassicRules>(config.strict_card_check))
    {
        CLS_ASSERT(codec_ != nullptr, "Store constructed without a codec");
    }

    auto Store::Create(std::shared_ptr<Session> session) -> Outbox
    {
        CLS_ASSERT(session != nullptr, "Create without a session");
        PlayerId const id = registry_.Add(std::move(session));
        std::print("[Store] P{} connected ({} online)\n", id, registry_.Size());
        return Outbox{Outbound{id, ConnectedMsg{id}}};
    }

    auto Store::Delete(PlayerId const id) -> Outbox
    {
        Outbox out;
        PlayerRecord const* rec = registry_.Find(id);
        if (rec == nullptr)
        {
            std::print("[Store] Delete for unknown P{} ignored\n", id);
            return out;
        }
        GamePhase const phase = rec->phase;
        registry_.Remove(id);
        std::print("[Store] P{} disconnected while {} ({} online)\n", id, describe(phase), registry_.Size());

        if (!cfg_.forfeit_on_disconnect)
        {
            return out;
        }

        if (auto const* in = std::get_if<InMatch>(&phase))
        {
            if (Match* match = FindMatch(in->match); match != nullptr && !match->IsFinished())
            {
                match->Forfeit(id);
                std::print("[Store] M{} forfeited by P{}\n", match->Id(), id);
                if (observer_)
                {
                    observer_->OnMatchEnd(*match);
                }
                PublishResults(*match, out);
                CloseMatch(*match, out);
            }
        }

        for (PlayerId const challenger : registry_.ChallengersOf(id))
        {
            registry_.SetPhase(challenger, Idle{});
            out.push_back(Outbound{challenger, PhaseUpdateMsg{Idle{}}});
        }
        return out;
    }

    auto Store::Receive(PlayerId const id, std::string_view const payload) -> Outbox
    {
        if (!registry_.Contains(id))
        {
            std::print("[Store] Dropping {} byte payload from unknown P{}\n", payload.size(), id);
            return {};
        }

        auto decoded = codec_->Decode(payload);
        if (!decoded.has_value())
        {
            Outbox out;
            Reject(id, Viol(RVC::Message_Undecodable).with_actor(id).with_detail(decoded.error().message), out);
            return out;
        }
        return Dispatch(id, *decoded);
    }

    auto Store::Dispatch(PlayerId const sender, InboundMessage const& msg) -> Outbox
    {
        Outbox out;
        if (!registry_.Contains(sender))
        {
            std::print("[Store] Dropping {} from unknown P{}\n", describe(msg), sender);
            return out;
        }

        std::visit([&]<typename T0>(T0 const& m)
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, ChatMsg>)
            {
                OnChat(sender, m, out);
            }
            else if constexpr (std::is_same_v<T, ChallengeRequestMsg>)
            {
                OnChallengeRequest(sender, m, out);
            }
            else if constexpr (std::is_same_v<T, ChallengeResponseMsg>)
            {
                OnChallengeResponse(sender, m, out);
            }
            else if constexpr (std::is_same_v<T, PlayCardMsg>)
            {
                OnMatchAction(sender, PlayCardAction{m.card}, out);
            }
            else if constexpr (std::is_same_v<T, PickCardMsg>)
            {
                OnMatchAction(sender, PickCardAction{m.card}, out);
            }
        }, msg);
        return out;
    }

    auto Store::OnChat(PlayerId const sender, ChatMsg const& m, Outbox& out) -> void
    {
        if (!registry_.Contains(m.to))
        {
            Reject(sender, Viol(RVC::IdNotFound_Player).with_actor(sender).with_target(m.to), out);
            return;
        }
        out.push_back(Outbound{m.to, DirectMsg{sender, m.text}});
    }

    auto Store::OnChallengeRequest(PlayerId const sender, ChallengeRequestMsg const& m, Outbox& out) -> void
    {
        if (auto const ok = registry_.ValidateChallenge(sender, m.target); !ok.has_value())
        {
            Reject(sender, ok.error(), out);
            return;
        }
        registry_.SetPhase(sender, Challenging{m.target});
        out.push_back(Outbound{sender, PhaseUpdateMsg{Challenging{m.target}}});
        out.push_back(Outbound{m.target, ChallengeMsg{sender}});
    }

    auto Store::OnChallengeResponse(PlayerId const sender, ChallengeResponseMsg const& m, Outbox& out) -> void
    {
        if (auto const ok = registry_.ValidateResponse(sender, m.challenger, m.accepted); !ok.has_value())
        {
            Reject(sender, ok.error(), out);
            return;
        }

        if (!m.accepted)
        {
            registry_.SetPhase(m.challenger, Idle{});
            out.push_back(Outbound{m.challenger, PhaseUpdateMsg{Idle{}}});
            return;
        }
        StartMatch(m.challenger, sender, out);
    }

    auto Store::StartMatch(PlayerId const challenger, PlayerId const responder, Outbox& out) -> void
    {
        auto const id = static_cast<MatchId>(matches_.size());
        Match const& match = matches_.emplace_back(id, challenger, responder, cfg_, rules_);

        registry_.SetPhase(challenger, InMatch{id});
        registry_.SetPhase(responder, InMatch{id});
        std::print("[Store] M{} started: P{} vs P{}\n", id, challenger, responder);
        if (observer_)
        {
            observer_->OnMatchStart(match);
        }

        out.push_back(Outbound{challenger, ChallengeAcceptedMsg{}});
        out.push_back(Outbound{challenger, PhaseUpdateMsg{InMatch{id}}});
        out.push_back(Outbound{responder, PhaseUpdateMsg{InMatch{id}}});
        PublishResults(match, out);
    }

    auto Store::OnMatchAction(PlayerId const sender, MatchAction const& action, Outbox& out) -> void
    {
        auto const* in = std::get_if<InMatch>(&registry_.PhaseOf(sender));
        if (in == nullptr)
        {
            Reject(sender, Viol(RVC::Match_NotInMatch).with_actor(sender)
                           .with_detail(describe(registry_.PhaseOf(sender))), out);
            return;
        }

        Match* match = FindMatch(in->match);
        if (match == nullptr)
        {
            Reject(sender, Viol(RVC::IdNotFound_Match).with_actor(sender).with_match(in->match), out);
            return;
        }

        auto const res = match->Step(sender, action);
        if (!res.has_value())
        {
            Reject(sender, res.error(), out);
            return;
        }

        if (observer_)
        {
            observer_->OnAction(*match, sender, action, *res);
        }

        PublishResults(*match, out);
        if (*res == MoveOutcome::MatchEnded)
        {
            std::print("[Store] M{} ended: {}\n", match->Id(), util::describe(*match->End()));
            if (observer_)
            {
                observer_->OnMatchEnd(*match);
            }
            CloseMatch(*match, out);
        }
    }

    auto Store::PublishResults(Match const& match, Outbox& out) -> void
    {
        for (auto& [player, result] : match.RoundResults())
        {
            if (registry_.Contains(player))
            {
                out.push_back(Outbound{player, RoundResultMsg{std::move(result)}});
            }
        }
    }

    auto Store::CloseMatch(Match const& match, Outbox& out) -> void
    {
        CLS_ASSERT(match.IsFinished(), "CloseMatch on a live match");
        for (PlayerId const p : match.Players())
        {
            PlayerRecord const* rec = registry_.Find(p);
            if (rec == nullptr)
            {
                continue;
            }
            // only reset players still bound to this match
            if (auto const* in = std::get_if<InMatch>(&rec->phase); in != nullptr && in->match == match.Id())
            {
                registry_.SetPhase(p, Idle{});
                out.push_back(Outbound{p, PhaseUpdateMsg{Idle{}}});
            }
        }
    }

    auto Store::FindMatch(MatchId const id) const -> Match const*
    {
        return id < matches_.size() ? &matches_[id] : nullptr;
    }

    auto Store::FindMatch(MatchId const id) -> Match*
    {
        return id < matches_.size() ? &matches_[id] : nullptr;
    }

    auto Store::Reject(PlayerId const to, error::RuleViolation const& v, Outbox& out) -> void
    {
        std::string text = error::describe(v);
        std::print("[Store] P{} rejected: {}\n", to, text);
        out.push_back(Outbound{to, ErrMsg{std::move(text)}});
    }
}
