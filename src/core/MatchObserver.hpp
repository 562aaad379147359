//
// MatchObserver.hpp — read-only hook on match progress (audit transcripts)
//

#ifndef CARDCLASH_MATCHOBSERVER_HPP
#define CARDCLASH_MATCHOBSERVER_HPP

#include "Actions.hpp"
#include "Types.hpp"

namespace clash::core
{
    class Match;

    class MatchObserver
    {
    public:
        virtual ~MatchObserver() = default;

        virtual auto OnMatchStart(Match const& match) -> void = 0;
        // After an action was applied (never for rejected ones).
        virtual auto OnAction(Match const& match, PlayerId actor, MatchAction const& action, MoveOutcome out) -> void = 0;
        virtual auto OnMatchEnd(Match const& match) -> void = 0;
    };
}

#endif //CARDCLASH_MATCHOBSERVER_HPP
