//
// State.hpp — per-participant match state and the views built from it
//

#ifndef CARDCLASH_STATE_HPP
#define CARDCLASH_STATE_HPP

#include <array>
#include <optional>
#include <variant>

#include "Types.hpp"

namespace clash::core
{
    using CardChoice = std::array<Card, constants::ChoiceSize>;

    struct PlayerMatchState
    {
        PlayerId player_id{};
        Hand hand{};
        std::optional<Card> chosen_card{};
        std::uint8_t health{constants::MaxHealth};
        std::optional<CardChoice> pending_choice{};

        auto operator==(PlayerMatchState const&) const -> bool = default;
    };

    // The part of a participant's state the opponent is allowed to see.
    struct OpponentView
    {
        std::uint32_t card_count{};
        std::uint8_t health{};

        auto operator==(OpponentView const&) const -> bool = default;
    };

    struct Draw
    {
        auto operator==(Draw const&) const -> bool = default;
    };

    struct Victory
    {
        PlayerId winner{};

        auto operator==(Victory const&) const -> bool = default;
    };

    using EndState = std::variant<Draw, Victory>;

    struct MatchEnded
    {
        EndState end{};

        auto operator==(MatchEnded const&) const -> bool = default;
    };

    struct NextRound
    {
        PlayerMatchState own{};
        OpponentView opponent{};

        auto operator==(NextRound const&) const -> bool = default;
    };

    using RoundResult = std::variant<MatchEnded, NextRound>;

    inline auto Redact(PlayerMatchState const& s) noexcept -> OpponentView
    {
        return OpponentView{.card_count = s.hand.Total(), .health = s.health};
    }
} // namespace clash::core

#endif //CARDCLASH_STATE_HPP
