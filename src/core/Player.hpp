//
// Player.hpp — registry record of a connected player and its lobby phase
//

#ifndef CARDCLASH_PLAYER_HPP
#define CARDCLASH_PLAYER_HPP

#include <memory>
#include <string>
#include <variant>

#include "Types.hpp"

namespace clash::core
{
    class Session;

    struct Idle
    {
        auto operator==(Idle const&) const -> bool = default;
    };

    struct Challenging
    {
        PlayerId target{};

        auto operator==(Challenging const&) const -> bool = default;
    };

    struct InMatch
    {
        MatchId match{};

        auto operator==(InMatch const&) const -> bool = default;
    };

    using GamePhase = std::variant<Idle, Challenging, InMatch>;

    struct PlayerRecord
    {
        PlayerId id{};
        std::shared_ptr<Session> session;
        GamePhase phase{Idle{}};
    };

    auto describe(GamePhase const& phase) -> std::string;
}
#endif //CARDCLASH_PLAYER_HPP
