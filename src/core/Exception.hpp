//
// Exception.hpp — engine exceptions and value-typed rule violations
//

#ifndef CARDCLASH_EXCEPTION_HPP
#define CARDCLASH_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "Types.hpp"

namespace clash::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        State, // store/match engine misuse (not a player rule violation)
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define CLS_THROW(code_enum, msg) ::clash::core::error::fail((code_enum), (msg))
#define CLS_ASSERT(cond, msg) do { if(!(cond)) ::clash::core::error::fail(::clash::core::error::Code::Assertion, (msg)); } while(0)

    // The three families a client can be told about.
    enum class Kind : std::uint8_t
    {
        IdNotFound,
        InvalidRequest,
        MessageUndecodable
    };

    // Fine-grained reasons; grouped by the request that triggers them.
    enum class RuleViolationCode : std::uint16_t
    {
        // Lookup
        IdNotFound_Player,
        IdNotFound_Match,

        // Challenge protocol
        Challenge_AlreadyChallenging,
        Challenge_AlreadyInMatch,
        Challenge_Self,
        Response_NotChallenged,
        Response_ResponderInMatch,

        // Match flow
        Match_NotInMatch,
        Match_Concluded,
        Match_NotParticipant,

        // Play
        Play_RewardChoicePending,
        Play_CardUnavailable,

        // Pick
        Pick_NoPendingChoice,
        Pick_ChoiceNotOffered,

        // Wire
        Message_Undecodable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<PlayerId> actor{};
        std::optional<PlayerId> target{};
        std::optional<MatchId> match{};
        std::optional<Card> card{};
        std::optional<std::string> detail{};

        auto with_actor(PlayerId p) -> RuleViolation&
        {
            actor = p;
            return *this;
        }

        auto with_target(PlayerId p) -> RuleViolation&
        {
            target = p;
            return *this;
        }

        auto with_match(MatchId m) -> RuleViolation&
        {
            match = m;
            return *this;
        }

        auto with_card(Card c) -> RuleViolation&
        {
            card = c;
            return *this;
        }

        auto with_detail(std::string d) -> RuleViolation&
        {
            detail = std::move(d);
            return *this;
        }
    };

    inline auto Viol(RuleViolationCode code) -> RuleViolation
    {
        return RuleViolation{.code = code};
    }

    inline auto kind_of(RuleViolationCode c) noexcept -> Kind
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::IdNotFound_Player:
        case E::IdNotFound_Match:
            return Kind::IdNotFound;
        case E::Message_Undecodable:
            return Kind::MessageUndecodable;
        default:
            return Kind::InvalidRequest;
        }
    }

    inline auto to_string(Kind k) -> std::string_view
    {
        switch (k)
        {
        case Kind::IdNotFound: return "IdNotFound";
        case Kind::InvalidRequest: return "InvalidRequest";
        case Kind::MessageUndecodable: return "MessageUndecodable";
        }
        return "Unknown";
    }

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        case E::IdNotFound_Player: return "No such player";
        case E::IdNotFound_Match: return "No such match";

        case E::Challenge_AlreadyChallenging: return "Challenge: already challenging someone";
        case E::Challenge_AlreadyInMatch: return "Challenge: already in a match";
        case E::Challenge_Self: return "Challenge: cannot challenge yourself";
        case E::Response_NotChallenged: return "Response: that player is not challenging you";
        case E::Response_ResponderInMatch: return "Response: cannot accept while in a match";

        case E::Match_NotInMatch: return "Match: not in a match";
        case E::Match_Concluded: return "Match: already concluded";
        case E::Match_NotParticipant: return "Match: not a participant";

        case E::Play_RewardChoicePending: return "Play: pick your reward first";
        case E::Play_CardUnavailable: return "Play: no copies of that card left";

        case E::Pick_NoPendingChoice: return "Pick: no reward choice pending";
        case E::Pick_ChoiceNotOffered: return "Pick: card not among the offered choices";

        case E::Message_Undecodable: return "Message could not be decoded";

        }
        return "Unknown";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Compact, reproducible message for logs, tests and Err payloads.
        auto s = std::format("{}: {}", to_string(kind_of(v.code)), to_string(v.code));
        if (v.actor) s += std::format(" | actor=P{}", *v.actor);
        if (v.target) s += std::format(" | target=P{}", *v.target);
        if (v.match) s += std::format(" | match=M{}", *v.match);
        if (v.card) s += std::format(" | card={}", to_string(*v.card));
        if (v.detail) s += std::format(" | {}", *v.detail);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //CARDCLASH_EXCEPTION_HPP
