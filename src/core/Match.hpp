//
// Match.hpp — authoritative state of one two-player match
//

#ifndef CARDCLASH_MATCH_HPP
#define CARDCLASH_MATCH_HPP

#include <array>
#include <expected>
#include <memory>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include "Actions.hpp"
#include "Exception.hpp"
#include "Rules.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace clash::core
{
    struct ResolvingRound
    {
        std::array<PlayerMatchState, constants::ParticipantCount> players;
    };

    struct Finished
    {
        std::array<PlayerId, constants::ParticipantCount> players;
        EndState end;
    };

    using MatchState = std::variant<ResolvingRound, Finished>;

    // Cards revealed by the most recent resolved round, in participant order.
    struct RoundReveal
    {
        std::uint32_t round_no{};
        std::array<Card, constants::ParticipantCount> cards{};
        std::array<std::uint8_t, constants::ParticipantCount> health_after{};
    };

    class Match
    {
    public:
        Match() = delete;
        Match(MatchId id,
              PlayerId first,
              PlayerId second,
              Config const& config,
              std::shared_ptr<Rules> rules);

        // playCard / pickCard: validate, apply, advance. State untouched on violation.
        auto PlayCard(PlayerId actor, Card card) -> std::expected<MoveOutcome, error::RuleViolation>;
        auto PickCard(PlayerId actor, Card card) -> std::expected<MoveOutcome, error::RuleViolation>;
        auto Step(PlayerId actor, MatchAction const& action) -> std::expected<MoveOutcome, error::RuleViolation>;

        // getRoundResults: one entry per participant, in participant order.
        auto RoundResults() const -> std::vector<std::pair<PlayerId, RoundResult>>;
        auto ResultFor(PlayerId player) const -> RoundResult;

        // Ends a live match in favour of the participant who stayed.
        auto Forfeit(PlayerId leaver) -> void;

        auto Id() const noexcept -> MatchId { return id_; }
        auto Players() const noexcept -> std::array<PlayerId, constants::ParticipantCount> const& { return players_; }
        auto StateNow() const noexcept -> MatchState const& { return state_; }
        auto IsFinished() const noexcept -> bool { return std::holds_alternative<Finished>(state_); }
        auto End() const -> std::optional<EndState>;
        auto LastRound() const noexcept -> std::optional<RoundReveal> const& { return last_round_; }
        auto RoundsPlayed() const noexcept -> std::uint32_t { return rounds_played_; }

        auto Has(PlayerId player) const noexcept -> bool;
        auto Opponent(PlayerId player) const -> PlayerId;

        //returns nullptr once finished or for a non-participant
        auto StateOf(PlayerId player) const -> PlayerMatchState const*;

        friend class ClassicRules;

    private:
        auto MutableStateOf(PlayerId player) -> PlayerMatchState*;

    private:
        MatchId id_;
        std::array<PlayerId, constants::ParticipantCount> players_;
        std::shared_ptr<Rules> rules_;
        MatchState state_;
        std::optional<RoundReveal> last_round_{};
        std::uint32_t rounds_played_{0};
    };
}

#endif //CARDCLASH_MATCH_HPP
