//
// Actions.hpp — what a participant may do inside a match
//

#ifndef CARDCLASH_ACTIONS_HPP
#define CARDCLASH_ACTIONS_HPP

#include <variant>

#include "Types.hpp"

namespace clash::core
{
    // Commit (or re-commit) a card for the current round.
    struct PlayCardAction { Card card; };
    // Resolve a pending reward choice.
    struct PickCardAction { Card card; };

    using MatchAction = std::variant<PlayCardAction, PickCardAction>;

    enum class MoveOutcome : std::uint8_t
    {
        Applied,
        RoundResolved,
        MatchEnded
    };
} // namespace clash::core

#endif //CARDCLASH_ACTIONS_HPP
