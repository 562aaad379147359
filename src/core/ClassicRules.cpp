//
// ClassicRules.cpp
//

#include "ClassicRules.hpp"

#include <algorithm>
#include <type_traits>

#include "Match.hpp"

namespace clash::core
{
    using error::Viol;

    auto ClassicRules::ApplyResolution(PlayerMatchState& p, Resolution const& r) -> void
    {
        if (r.health_delta < 0 && p.health > 0)
        {
            --p.health;
        }

        for (Reward const& reward : r.rewards)
        {
            std::visit([&]<typename T0>(T0 const& rw)
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, Card>)
                {
                    p.hand.Add(rw);
                }
                else
                {
                    p.pending_choice = rw;
                }
            }, reward);
        }
    }

auto ClassicRules::Validate(Match const& match, PlayerId const actor, MatchAction const& a) const -> CheckResult
{
    using RVC = ::clash::core::error::RuleViolationCode;

    if (match.IsFinished())
        return std::unexpected(Viol(RVC::Match_Concluded).with_actor(actor).with_match(match.Id()));

    PlayerMatchState const* me = match.StateOf(actor);
    if (me == nullptr)
        return std::unexpected(Viol(RVC::Match_NotParticipant).with_actor(actor).with_match(match.Id()));

    return std::visit([&]<typename T0>(T0 const& act) -> CheckResult
    {
        using T = std::decay_t<T0>;

        if constexpr (std::is_same_v<T, PlayCardAction>)
        {
            if (me->pending_choice.has_value())
                return std::unexpected(Viol(RVC::Play_RewardChoicePending)
                                       .with_actor(actor).with_match(match.Id()).with_card(act.card));

            // the current commit is refunded before the new one is drawn
            std::uint32_t const available =
                me->hand.Count(act.card) + (me->chosen_card == act.card ? 1u : 0u);

            if (strict_card_check_ && available == 0)
                return std::unexpected(Viol(RVC::Play_CardUnavailable)
                                       .with_actor(actor).with_match(match.Id()).with_card(act.card));

            return {};
        }
        else if constexpr (std::is_same_v<T, PickCardAction>)
        {
            if (!me->pending_choice.has_value())
                return std::unexpected(Viol(RVC::Pick_NoPendingChoice)
                                       .with_actor(actor).with_match(match.Id()));

            if (std::ranges::find(*me->pending_choice, act.card) == me->pending_choice->end())
                return std::unexpected(Viol(RVC::Pick_ChoiceNotOffered)
                                       .with_actor(actor).with_match(match.Id()).with_card(act.card));

            return {};
        }

        CLS_THROW(error::Code::Unknown, "Unreachable variant in Validate");
    }, a);
}

    auto ClassicRules::Apply(Match& match, PlayerId const actor, MatchAction const& a) -> void
    {
        PlayerMatchState* me = match.MutableStateOf(actor);
        CLS_ASSERT(me != nullptr, "Apply on a participant without live state");

        std::visit([&]<typename T0>(T0 const& act)
            {
                using T = std::decay_t<T0>;
                if constexpr (std::is_same_v<T, PlayCardAction>)
                {
                    if (me->chosen_card.has_value())
                    {
                        me->hand.Add(*me->chosen_card);
                        me->chosen_card.reset();
                    }
                    // Without a copy left the refunded state stands and nothing is committed.
                    if (me->hand.Take(act.card))
                    {
                        me->chosen_card = act.card;
                    }
                }
                else if constexpr (std::is_same_v<T, PickCardAction>)
                {
                    me->pending_choice.reset();
                    me->hand.Add(act.card);
                }
            }, a);
    }

    auto ClassicRules::Advance(Match& match) -> MoveOutcome
    {
        auto* round = std::get_if<ResolvingRound>(&match.state_);
        if (round == nullptr)
            CLS_THROW(error::Code::State, "Advance on a finished match");

        PlayerMatchState& first = round->players[0];
        PlayerMatchState& second = round->players[1];

        if (!first.chosen_card || !second.chosen_card)
            return MoveOutcome::Applied;

        //both committed: reveal simultaneously
        Card const c_first = *first.chosen_card;
        Card const c_second = *second.chosen_card;
        Resolution const r_first = Resolve(c_first, c_second);
        Resolution const r_second = Resolve(c_second, c_first);

        first.chosen_card.reset();
        second.chosen_card.reset();
        ApplyResolution(first, r_first);
        ApplyResolution(second, r_second);

        ++match.rounds_played_;
        match.last_round_ = RoundReveal{
            .round_no = match.rounds_played_,
            .cards = {c_first, c_second},
            .health_after = {first.health, second.health}
        };

        bool const first_out = first.health == 0;
        bool const second_out = second.health == 0;
        if (!first_out && !second_out)
            return MoveOutcome::RoundResolved;

        PlayerId const id_first = first.player_id;
        PlayerId const id_second = second.player_id;

        EndState end{};
        if (first_out && second_out)
            end = Draw{};
        else
            end = Victory{first_out ? id_second : id_first};

        // references into the round die here
        match.state_ = Finished{match.players_, end};
        return MoveOutcome::MatchEnded;
    }

} // clash
