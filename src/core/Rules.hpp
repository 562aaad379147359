//
// Rules.hpp — validate / apply / advance seam for match actions
//

#ifndef CARDCLASH_RULES_HPP
#define CARDCLASH_RULES_HPP

#include "Actions.hpp"
#include "Exception.hpp"
#include "Types.hpp"

namespace clash::core
{
    //forward declaration
    class Match;

    class Rules
    {
    public:
        using CheckResult = error::ValidateResult;

        virtual ~Rules() = default;

        // Returns unexpected(reason) for ordinary rule violations (NOT exceptions).
        // Throw only for engine misuse / broken invariants.
        virtual auto Validate(Match const& match, PlayerId actor, MatchAction const& a) const -> CheckResult = 0;

        // Mutate the authoritative match state. Only called after Validate succeeded.
        virtual auto Apply(Match& match, PlayerId actor, MatchAction const& a) -> void = 0;

        // Resolve the round once both sides committed; detect the end of the match.
        virtual auto Advance(Match& match) -> MoveOutcome = 0;
    };
}

#endif //CARDCLASH_RULES_HPP
