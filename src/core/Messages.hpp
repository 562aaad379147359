//
// Messages.hpp — decoded domain messages exchanged with clients
//

#ifndef CARDCLASH_MESSAGES_HPP
#define CARDCLASH_MESSAGES_HPP

#include <string>
#include <variant>
#include <vector>

#include "Player.hpp"
#include "State.hpp"
#include "Types.hpp"

namespace clash::core
{
    // ----- client -> server -----
    struct ChatMsg
    {
        PlayerId to{};
        std::string text;

        auto operator==(ChatMsg const&) const -> bool = default;
    };

    struct ChallengeRequestMsg
    {
        PlayerId target{};

        auto operator==(ChallengeRequestMsg const&) const -> bool = default;
    };

    struct ChallengeResponseMsg
    {
        PlayerId challenger{};
        bool accepted{false};

        auto operator==(ChallengeResponseMsg const&) const -> bool = default;
    };

    struct PlayCardMsg
    {
        Card card{};

        auto operator==(PlayCardMsg const&) const -> bool = default;
    };

    struct PickCardMsg
    {
        Card card{};

        auto operator==(PickCardMsg const&) const -> bool = default;
    };

    using InboundMessage = std::variant<
        ChatMsg, ChallengeRequestMsg, ChallengeResponseMsg, PlayCardMsg, PickCardMsg>;

    // ----- server -> client -----
    struct ConnectedMsg
    {
        PlayerId id{};

        auto operator==(ConnectedMsg const&) const -> bool = default;
    };

    struct ErrMsg
    {
        std::string text;

        auto operator==(ErrMsg const&) const -> bool = default;
    };

    struct PhaseUpdateMsg
    {
        GamePhase phase{};

        auto operator==(PhaseUpdateMsg const&) const -> bool = default;
    };

    struct DirectMsg
    {
        PlayerId from{};
        std::string text;

        auto operator==(DirectMsg const&) const -> bool = default;
    };

    struct ChallengeMsg
    {
        PlayerId from{};

        auto operator==(ChallengeMsg const&) const -> bool = default;
    };

    struct ChallengeAcceptedMsg
    {
        auto operator==(ChallengeAcceptedMsg const&) const -> bool = default;
    };

    struct RoundResultMsg
    {
        RoundResult result{};

        auto operator==(RoundResultMsg const&) const -> bool = default;
    };

    using OutboundMessage = std::variant<
        ConnectedMsg, ErrMsg, PhaseUpdateMsg, DirectMsg, ChallengeMsg, ChallengeAcceptedMsg, RoundResultMsg>;

    // An outbound message addressed by player id; the store resolves the session.
    struct Outbound
    {
        PlayerId to{};
        OutboundMessage msg;
    };

    using Outbox = std::vector<Outbound>;

    auto describe(InboundMessage const& msg) -> std::string;
    auto describe(OutboundMessage const& msg) -> std::string;
} // namespace clash::core

#endif //CARDCLASH_MESSAGES_HPP
