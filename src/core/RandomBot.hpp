//
// RandomBot.hpp — seeded bot that answers a NextRound view with a legal action
//

#ifndef CARDCLASH_RANDOMBOT_HPP
#define CARDCLASH_RANDOMBOT_HPP

#include <cstdint>
#include <optional>
#include <random>

#include "Actions.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace clash::core
{
    class RandomBot final
    {
    public:
        explicit RandomBot(std::uint64_t rng_seed);

        // nullopt when there is nothing to do: already committed this round, or nothing left to play.
        auto Decide(NextRound const& view) -> std::optional<MatchAction>;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> std::size_t
        {
            return std::uniform_int_distribution<std::size_t>{0, v.size() - 1}(rng_);
        }

    private:
        std::mt19937 rng_;
    };
}

#endif //CARDCLASH_RANDOMBOT_HPP
