//
// Store.hpp — the authoritative owner of players and matches
//

#ifndef CARDCLASH_STORE_HPP
#define CARDCLASH_STORE_HPP

#include <memory>
#include <string_view>
#include <vector>

#include "Codec.hpp"
#include "Exception.hpp"
#include "Match.hpp"
#include "MatchObserver.hpp"
#include "Messages.hpp"
#include "Registry.hpp"
#include "Rules.hpp"
#include "Types.hpp"

namespace clash::core
{
    // Synchronous, single-threaded state machine. Every entry point validates,
    // mutates and returns the notifications to deliver; StoreActor serializes
    // calls and performs the delivery.
    class Store
    {
    public:
        Store() = delete;
        Store(Config const& config,
              std::shared_ptr<Codec const> codec,
              std::shared_ptr<MatchObserver> observer = nullptr);

        // Lifecycle
        auto Create(std::shared_ptr<Session> session) -> Outbox;
        auto Delete(PlayerId id) -> Outbox;

        // Decode through the codec, then Dispatch. Unknown senders are dropped.
        auto Receive(PlayerId id, std::string_view payload) -> Outbox;
        auto Dispatch(PlayerId sender, InboundMessage const& msg) -> Outbox;

        auto Players() const noexcept -> Registry const& { return registry_; }
        auto MatchCount() const noexcept -> std::size_t { return matches_.size(); }
        //returns nullptr if doesnt exist
        auto FindMatch(MatchId id) const -> Match const*;

    private:
        auto OnChat(PlayerId sender, ChatMsg const& m, Outbox& out) -> void;
        auto OnChallengeRequest(PlayerId sender, ChallengeRequestMsg const& m, Outbox& out) -> void;
        auto OnChallengeResponse(PlayerId sender, ChallengeResponseMsg const& m, Outbox& out) -> void;
        auto OnMatchAction(PlayerId sender, MatchAction const& action, Outbox& out) -> void;

        auto StartMatch(PlayerId challenger, PlayerId responder, Outbox& out) -> void;
        // Reset both participants to Idle and tell whoever is still connected.
        auto CloseMatch(Match const& match, Outbox& out) -> void;
        auto PublishResults(Match const& match, Outbox& out) -> void;

        auto FindMatch(MatchId id) -> Match*;
        static auto Reject(PlayerId to, error::RuleViolation const& v, Outbox& out) -> void;

    private:
        Config cfg_;
        std::shared_ptr<Codec const> codec_;
        std::shared_ptr<MatchObserver> observer_;
        std::shared_ptr<Rules> rules_;

        Registry registry_;
        std::vector<Match> matches_; // index == MatchId, finished matches are kept
    };
}

#endif //CARDCLASH_STORE_HPP
