//
// Invariants.hpp — structural checks on a match, used by tests and self-play
//

#ifndef CARDCLASH_INVARIANTS_HPP
#define CARDCLASH_INVARIANTS_HPP

#include <type_traits>
#include <variant>

#include "../core/Exception.hpp"
#include "../core/Match.hpp"
#include "../core/Types.hpp"

namespace clash::core::debug
{
    // A second layer of checks on top of the rules. Throws error::AssertionError on the first broken invariant.
    inline auto CheckInvariants(Match const& m) -> void
    {
#if CLS_ENABLE_TEST_HOOKS == false
        (void)m;
#else
        auto const& ids = m.Players();

        // 1) Two distinct participants
        CLS_ASSERT(ids[0] != ids[1], "Match participants are not distinct");

        // 2) Round counter agrees with the last reveal
        if (m.LastRound())
        {
            CLS_ASSERT(m.LastRound()->round_no == m.RoundsPlayed(), "Last reveal is not the last round played");
            for (std::uint8_t const h : m.LastRound()->health_after)
            {
                CLS_ASSERT(h <= constants::MaxHealth, "Revealed health above maximum");
            }
        }
        else
        {
            CLS_ASSERT(m.RoundsPlayed() == 0, "Rounds played without a reveal");
        }

        std::visit([&]<typename T0>(T0 const& st)
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, ResolvingRound>)
            {
                for (std::size_t i = 0; i < st.players.size(); ++i)
                {
                    PlayerMatchState const& p = st.players[i];

                    // 3) Per-participant state stays in participant order
                    CLS_ASSERT(p.player_id == ids[i], "Participant state out of order");

                    // 4) A live match has nobody at zero health
                    CLS_ASSERT(p.health >= 1 && p.health <= constants::MaxHealth, "Live health out of [1, MaxHealth]");

                    // 5) Rewards are chosen before the next commit, so both never coexist
                    CLS_ASSERT(!(p.pending_choice && p.chosen_card), "Committed card while a reward choice is pending");

                    // 6) The only choice ever offered is Attack or Counter
                    if (p.pending_choice)
                    {
                        CardChoice const& c = *p.pending_choice;
                        CLS_ASSERT(c[0] == Card::Attack && c[1] == Card::Counter, "Unexpected reward choice");
                    }
                }

                // 7) A round resolves as soon as both sides commit
                CLS_ASSERT(!(st.players[0].chosen_card && st.players[1].chosen_card),
                           "Both participants committed but the round did not resolve");
            }
            else
            {
                // 8) Finished keeps the roster and names a participant as winner
                CLS_ASSERT(st.players == ids, "Finished roster differs from participants");
                if (auto const* v = std::get_if<Victory>(&st.end))
                {
                    CLS_ASSERT(v->winner == ids[0] || v->winner == ids[1], "Winner is not a participant");
                }
                CLS_ASSERT(m.StateOf(ids[0]) == nullptr, "Finished match still exposes player state");
            }
        }, m.StateNow());
#endif // CLS_ENABLE_TEST_HOOKS == true
    }
}

#endif //CARDCLASH_INVARIANTS_HPP
