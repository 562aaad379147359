//
// Resolution.hpp — the card interaction table
//

#ifndef CARDCLASH_RESOLUTION_HPP
#define CARDCLASH_RESOLUTION_HPP

#include <cstdint>
#include <variant>
#include <vector>

#include "State.hpp"
#include "Types.hpp"

namespace clash::core
{
    // A reward is either a card added straight to hand or a choice deferred to a pick.
    using Reward = std::variant<Card, CardChoice>;

    struct Resolution
    {
        std::int8_t health_delta{0};
        std::vector<Reward> rewards;
    };

    // Outcome for the player who played `own` against `opponent`. Pure and total.
    auto Resolve(Card own, Card opponent) -> Resolution;
}

#endif //CARDCLASH_RESOLUTION_HPP
