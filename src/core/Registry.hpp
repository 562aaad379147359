//
// Registry.hpp — connected players, their phases and the challenge protocol
//

#ifndef CARDCLASH_REGISTRY_HPP
#define CARDCLASH_REGISTRY_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <vector>

#include "Exception.hpp"
#include "Player.hpp"
#include "Types.hpp"

namespace clash::core
{
    class Session;

    class Registry
    {
    public:
        using CheckResult = error::ValidateResult;

        // Inserts an Idle player under the next id. Ids are never reused.
        auto Add(std::shared_ptr<Session> session) -> PlayerId;
        auto Remove(PlayerId id) -> bool;

        //returns nullptr if doesnt exist
        auto Find(PlayerId id) -> PlayerRecord*;
        auto Find(PlayerId id) const -> PlayerRecord const*;
        auto Contains(PlayerId id) const -> bool { return players_.contains(id); }
        auto Size() const noexcept -> std::size_t { return players_.size(); }

        // Idle --(challenge target)--> Challenging(target)
        auto ValidateChallenge(PlayerId from, PlayerId target) const -> CheckResult;
        // Only the player `challenger` declared as target may answer.
        auto ValidateResponse(PlayerId responder, PlayerId challenger, bool accepted) const -> CheckResult;

        // Throws on an unknown id; callers validate first.
        auto SetPhase(PlayerId id, GamePhase phase) -> void;
        auto PhaseOf(PlayerId id) const -> GamePhase const&;

        // Players whose phase is Challenging(target).
        auto ChallengersOf(PlayerId target) const -> std::vector<PlayerId>;

    private:
        std::map<PlayerId, PlayerRecord> players_;
        PlayerId next_id_{0};
    };
}

#endif //CARDCLASH_REGISTRY_HPP
