//
// ClassicRules.hpp — Attack / Counter / Rest rules with simultaneous reveal
//

#ifndef CARDCLASH_CLASSICRULES_HPP
#define CARDCLASH_CLASSICRULES_HPP

#include "Resolution.hpp"
#include "Rules.hpp"
#include "State.hpp"

namespace clash::core
{
    class ClassicRules final : public Rules
    {
    public:
        explicit ClassicRules(bool strict_card_check = false) : strict_card_check_{strict_card_check} {}

        auto Validate(Match const& match, PlayerId actor, MatchAction const& a) const -> CheckResult override;
        auto Apply(Match& match, PlayerId actor, MatchAction const& a) -> void override;
        auto Advance(Match& match) -> MoveOutcome override;

        // Health floor at 0; fixed rewards to hand, a choice becomes the pending pick.
        static auto ApplyResolution(PlayerMatchState& p, Resolution const& r) -> void;

    private:
        bool strict_card_check_;
    };
}

#endif //CARDCLASH_CLASSICRULES_HPP
