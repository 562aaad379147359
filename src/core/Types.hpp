//
// Types.hpp — card, hand and id vocabulary shared by every layer
//

#ifndef CARDCLASH_TYPES_HPP
#define CARDCLASH_TYPES_HPP

#define CLS_ENABLE_TEST_HOOKS true

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace clash::core::constants
{
    inline constexpr std::uint8_t MaxHealth = 5;
    inline constexpr std::size_t ParticipantCount = 2;
    inline constexpr std::size_t ChoiceSize = 2;
}

namespace clash::core
{
    using PlayerId = std::uint64_t;
    using MatchId = std::uint64_t;

    enum class Card : std::uint8_t
    {
        Attack = 0,
        Counter,
        Rest
    };

    inline constexpr std::array<Card, 3> AllCards{Card::Attack, Card::Counter, Card::Rest};

    // Counted multiset of cards; the three kinds are interchangeable copies.
    struct Hand
    {
        std::uint32_t attacks{};
        std::uint32_t counters{};
        std::uint32_t rests{};

        [[nodiscard]]
        auto Count(Card const c) const noexcept -> std::uint32_t
        {
            switch (c)
            {
            case Card::Attack: return attacks;
            case Card::Counter: return counters;
            case Card::Rest: return rests;
            }
            return 0;
        }

        [[nodiscard]]
        auto Total() const noexcept -> std::uint32_t { return attacks + counters + rests; }

        auto Add(Card const c) noexcept -> void
        {
            switch (c)
            {
            case Card::Attack: ++attacks; break;
            case Card::Counter: ++counters; break;
            case Card::Rest: ++rests; break;
            }
        }

        // Removes one copy; false (and no change) when none is left.
        auto Take(Card const c) noexcept -> bool
        {
            std::uint32_t* slot = nullptr;
            switch (c)
            {
            case Card::Attack: slot = &attacks; break;
            case Card::Counter: slot = &counters; break;
            case Card::Rest: slot = &rests; break;
            }
            if (slot == nullptr || *slot == 0)
            {
                return false;
            }
            --*slot;
            return true;
        }

        auto operator==(Hand const&) const -> bool = default;
    };

    struct Config
    {
        std::uint8_t start_health{constants::MaxHealth};
        Hand start_hand{.attacks = 2, .counters = 1, .rests = 1};
        // false: playing a card with no copies left keeps the refunded state silently
        bool strict_card_check{false};
        // true: a disconnect forfeits the live match and releases pending challengers
        bool forfeit_on_disconnect{false};
    };

    inline auto to_string(Card const c) -> std::string_view
    {
        switch (c)
        {
        case Card::Attack: return "Attack";
        case Card::Counter: return "Counter";
        case Card::Rest: return "Rest";
        }
        return "?";
    }
}

#endif //CARDCLASH_TYPES_HPP
