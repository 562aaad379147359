//
// RandomBot.cpp
//

#include "RandomBot.hpp"

#include <vector>

namespace clash::core
{
    RandomBot::RandomBot(std::uint64_t rng_seed):
        rng_(static_cast<std::mt19937::result_type>(rng_seed)) {}

    auto RandomBot::Decide(NextRound const& view) -> std::optional<MatchAction>
    {
        PlayerMatchState const& me = view.own;

        if (me.pending_choice)
        {
            CardChoice const& choice = *me.pending_choice;
            return PickCardAction{choice[pick(choice)]};
        }

        if (me.chosen_card)
        {
            return std::nullopt;
        }

        std::vector<Card> cand;
        for (Card const c : AllCards)
        {
            if (me.hand.Count(c) > 0)
            {
                cand.push_back(c);
            }
        }

        if (cand.empty()) return std::nullopt;

        return PlayCardAction{cand[pick(cand)]};
    }
}
