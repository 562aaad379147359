//
// Util.cpp
//

#include "Util.hpp"

#include <format>
#include <type_traits>

namespace clash::core::util
{
    auto describe(Hand const& h) -> std::string
    {
        return std::format("A{}/C{}/R{}", h.attacks, h.counters, h.rests);
    }

    auto describe(EndState const& end) -> std::string
    {
        return std::visit([]<typename T0>(T0 const& e) -> std::string
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, Draw>)
            {
                return "Draw";
            }
            else
            {
                return std::format("Victory(P{})", e.winner);
            }
        }, end);
    }

    auto describe(PlayerMatchState const& s) -> std::string
    {
        std::string out = std::format("P{} hp={} hand={}", s.player_id, static_cast<int>(s.health), describe(s.hand));
        if (s.chosen_card)
        {
            out += std::format(" chosen={}", to_string(*s.chosen_card));
        }
        if (s.pending_choice)
        {
            out += std::format(" choice={}|{}",
                               to_string((*s.pending_choice)[0]), to_string((*s.pending_choice)[1]));
        }
        return out;
    }

    auto describe(RoundResult const& r) -> std::string
    {
        return std::visit([]<typename T0>(T0 const& rr) -> std::string
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, MatchEnded>)
            {
                return std::format("MatchEnded({})", describe(rr.end));
            }
            else
            {
                return std::format("NextRound({} | opp cards={} hp={})", describe(rr.own),
                                   rr.opponent.card_count, static_cast<int>(rr.opponent.health));
            }
        }, r);
    }
}

namespace clash::core
{
    auto describe(GamePhase const& phase) -> std::string
    {
        return std::visit([]<typename T0>(T0 const& p) -> std::string
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, Idle>)
            {
                return "Idle";
            }
            else if constexpr (std::is_same_v<T, Challenging>)
            {
                return std::format("Challenging(P{})", p.target);
            }
            else
            {
                return std::format("InMatch(M{})", p.match);
            }
        }, phase);
    }

    auto describe(InboundMessage const& msg) -> std::string
    {
        return std::visit([]<typename T0>(T0 const& m) -> std::string
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, ChatMsg>)
            {
                return std::format("Chat(to=P{}, {} bytes)", m.to, m.text.size());
            }
            else if constexpr (std::is_same_v<T, ChallengeRequestMsg>)
            {
                return std::format("ChallengeRequest(P{})", m.target);
            }
            else if constexpr (std::is_same_v<T, ChallengeResponseMsg>)
            {
                return std::format("ChallengeResponse(P{}, {})", m.challenger, m.accepted ? "accept" : "decline");
            }
            else if constexpr (std::is_same_v<T, PlayCardMsg>)
            {
                return std::format("PlayCard({})", to_string(m.card));
            }
            else
            {
                return std::format("PickCard({})", to_string(m.card));
            }
        }, msg);
    }

    auto describe(OutboundMessage const& msg) -> std::string
    {
        return std::visit([]<typename T0>(T0 const& m) -> std::string
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, ConnectedMsg>)
            {
                return std::format("Connected(P{})", m.id);
            }
            else if constexpr (std::is_same_v<T, ErrMsg>)
            {
                return std::format("Err({})", m.text);
            }
            else if constexpr (std::is_same_v<T, PhaseUpdateMsg>)
            {
                return std::format("PhaseUpdate({})", describe(m.phase));
            }
            else if constexpr (std::is_same_v<T, DirectMsg>)
            {
                return std::format("Direct(from=P{}, {} bytes)", m.from, m.text.size());
            }
            else if constexpr (std::is_same_v<T, ChallengeMsg>)
            {
                return std::format("Challenge(from=P{})", m.from);
            }
            else if constexpr (std::is_same_v<T, ChallengeAcceptedMsg>)
            {
                return "ChallengeAccepted";
            }
            else
            {
                return std::format("RoundResult({})", util::describe(m.result));
            }
        }, msg);
    }
}
