//
// Match.cpp
//

#include "Match.hpp"

#include <algorithm>

namespace clash::core
{
    namespace
    {
        auto FreshState(PlayerId id, Config const& cfg) -> PlayerMatchState
        {
            return PlayerMatchState{
                .player_id = id,
                .hand = cfg.start_hand,
                .chosen_card = std::nullopt,
                .health = cfg.start_health,
                .pending_choice = std::nullopt
            };
        }
    }

    Match::Match(MatchId const id,
                 PlayerId const first,
                 PlayerId const second,
                 Config const& config,
                 std::shared_ptr<Rules> rules) :
        id_(id),
        players_{first, second},
        rules_(std::move(rules)),
        state_(ResolvingRound{{FreshState(first, config), FreshState(second, config)}})
    {
        CLS_ASSERT(first != second, "A match needs two distinct players");
        CLS_ASSERT(rules_ != nullptr, "Match constructed without rules");
        CLS_ASSERT(config.start_health > 0 && config.start_health <= constants::MaxHealth,
                   "Start health out of range");
    }

    auto Match::PlayCard(PlayerId const actor, Card const card) -> std::expected<MoveOutcome, error::RuleViolation>
    {
        return Step(actor, PlayCardAction{card});
    }

    auto Match::PickCard(PlayerId const actor, Card const card) -> std::expected<MoveOutcome, error::RuleViolation>
    {
        return Step(actor, PickCardAction{card});
    }

    auto Match::Step(PlayerId const actor, MatchAction const& action)
        -> std::expected<MoveOutcome, error::RuleViolation>
    {
        if (auto const ok = rules_->Validate(*this, actor, action); !ok.has_value())
        {
            return std::unexpected(ok.error());
        }
        rules_->Apply(*this, actor, action);
        return rules_->Advance(*this);
    }

    auto Match::ResultFor(PlayerId const player) const -> RoundResult
    {
        return std::visit([&]<typename T0>(T0 const& st) -> RoundResult
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, Finished>)
            {
                return MatchEnded{st.end};
            }
            else
            {
                auto const own = std::ranges::find(st.players, player, &PlayerMatchState::player_id);
                auto const opp = std::ranges::find_if(st.players,
                                                      [player](PlayerMatchState const& p)
                                                      {
                                                          return p.player_id != player;
                                                      });
                CLS_ASSERT(own != st.players.end() && opp != st.players.end(),
                           "Round result requested for a non-participant");
                return NextRound{.own = *own, .opponent = Redact(*opp)};
            }
        }, state_);
    }

    auto Match::RoundResults() const -> std::vector<std::pair<PlayerId, RoundResult>>
    {
        std::vector<std::pair<PlayerId, RoundResult>> out;
        out.reserve(players_.size());
        for (PlayerId const p : players_)
        {
            out.emplace_back(p, ResultFor(p));
        }
        return out;
    }

    auto Match::Forfeit(PlayerId const leaver) -> void
    {
        CLS_ASSERT(Has(leaver), "Forfeit by a non-participant");
        if (IsFinished())
        {
            return;
        }
        state_ = Finished{players_, Victory{Opponent(leaver)}};
    }

    auto Match::End() const -> std::optional<EndState>
    {
        if (auto const* fin = std::get_if<Finished>(&state_))
        {
            return fin->end;
        }
        return std::nullopt;
    }

    auto Match::Has(PlayerId const player) const noexcept -> bool
    {
        return std::ranges::find(players_, player) != players_.end();
    }

    auto Match::Opponent(PlayerId const player) const -> PlayerId
    {
        CLS_ASSERT(Has(player), "Opponent requested for a non-participant");
        return players_[0] == player ? players_[1] : players_[0];
    }

    auto Match::StateOf(PlayerId const player) const -> PlayerMatchState const*
    {
        auto const* round = std::get_if<ResolvingRound>(&state_);
        if (round == nullptr)
        {
            return nullptr;
        }
        auto const it = std::ranges::find(round->players, player, &PlayerMatchState::player_id);
        return it != round->players.end() ? &*it : nullptr;
    }

    auto Match::MutableStateOf(PlayerId const player) -> PlayerMatchState*
    {
        return const_cast<PlayerMatchState*>(std::as_const(*this).StateOf(player));
    }
}
