//
// codec.cpp
//
#include "codec.hpp"

#include <cstring>
#include <format>
#include <type_traits>
#include <utility>
#include <vector>

namespace clash::net
{
    auto ToFbCard(core::Card c) noexcept -> gen::net::Card
    {
        switch (c)
        {
        case core::Card::Attack: return gen::net::Card::Attack;
        case core::Card::Counter: return gen::net::Card::Counter;
        case core::Card::Rest: return gen::net::Card::Rest;
        }
        return gen::net::Card::Attack;
    }

    auto FromFbCard(gen::net::Card c) noexcept -> std::optional<core::Card>
    {
        switch (c)
        {
        case gen::net::Card::Attack: return core::Card::Attack;
        case gen::net::Card::Counter: return core::Card::Counter;
        case gen::net::Card::Rest: return core::Card::Rest;
        }
        return std::nullopt;
    }
}

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)clash::core::Card::Attack == (int)clash::gen::net::Card::Attack);
    static_assert((int)clash::core::Card::Rest == (int)clash::gen::net::Card::Rest);

    using clash::core::ParseError;

    auto Finish(flatbuffers::FlatBufferBuilder& fbb,
                std::uint64_t msg_id,
                clash::gen::net::Message type,
                flatbuffers::Offset<void> body) -> flatbuffers::DetachedBuffer
    {
        auto const env = clash::gen::net::CreateEnvelope(fbb, msg_id, type, body);
        fbb.Finish(env);
        return fbb.Release();
    }

    // Verifies and returns the root. The verifier also checks alignment, so the bytes are copied
    // into storage the allocator aligned.
    auto Open(std::span<std::byte const> bytes, std::vector<std::uint8_t>& storage)
        -> std::expected<clash::gen::net::Envelope const*, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        storage.resize(bytes.size());
        std::memcpy(storage.data(), bytes.data(), bytes.size());

        flatbuffers::Verifier verifier(storage.data(), storage.size());
        if (!clash::gen::net::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"verification failed"});

        auto const* env = clash::gen::net::GetEnvelope(storage.data());
        if (env == nullptr)
            return std::unexpected(ParseError{"bad root"});
        return env;
    }

    auto CardOrError(clash::gen::net::Card c) -> std::expected<clash::core::Card, ParseError>
    {
        if (auto const card = clash::net::FromFbCard(c))
            return *card;
        return std::unexpected(ParseError{std::format("unknown card value {}", static_cast<int>(c))});
    }

    auto Text(flatbuffers::String const* s) -> std::string
    {
        return s != nullptr ? s->str() : std::string{};
    }

    // ---------- RoundResult pieces ----------

    auto BuildRoundResult(flatbuffers::FlatBufferBuilder& fbb, clash::core::RoundResult const& rr)
        -> flatbuffers::Offset<clash::gen::net::RoundResult>
    {
        using namespace clash;
        return std::visit([&]<typename T0>(T0 const& r) -> flatbuffers::Offset<gen::net::RoundResult>
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, core::MatchEnded>)
            {
                flatbuffers::Offset<gen::net::MatchEnded> me{};
                if (auto const* v = std::get_if<core::Victory>(&r.end))
                    me = gen::net::CreateMatchEnded(fbb, gen::net::EndKind::Victory, v->winner);
                else
                    me = gen::net::CreateMatchEnded(fbb, gen::net::EndKind::Draw, 0);
                return gen::net::CreateRoundResult(fbb, gen::net::RoundOutcome::MatchEnded, me.Union());
            }
            else
            {
                core::PlayerMatchState const& own = r.own;

                auto const hand = gen::net::CreateHand(fbb, own.hand.attacks, own.hand.counters, own.hand.rests);

                std::vector<std::uint8_t> choice;
                if (own.pending_choice)
                {
                    for (core::Card c : *own.pending_choice)
                        choice.push_back(static_cast<std::uint8_t>(net::ToFbCard(c)));
                }
                auto const choice_vec = fbb.CreateVector(choice);

                auto const view = gen::net::CreatePlayerView(
                    fbb,
                    /*player_id*/ own.player_id,
                    /*hand*/ hand,
                    /*has_chosen*/ own.chosen_card.has_value(),
                    /*chosen_card*/ net::ToFbCard(own.chosen_card.value_or(core::Card::Attack)),
                    /*health*/ own.health,
                    /*pending_choice*/ choice_vec);

                auto const opp = gen::net::CreateOpponentView(fbb, r.opponent.card_count, r.opponent.health);
                auto const nr = gen::net::CreateNextRound(fbb, view, opp);
                return gen::net::CreateRoundResult(fbb, gen::net::RoundOutcome::NextRound, nr.Union());
            }
        }, rr);
    }

    auto DecodeRoundResult(clash::gen::net::RoundResult const* rr)
        -> std::expected<clash::core::RoundResult, ParseError>
    {
        using namespace clash;
        if (rr->outcome_type() != gen::net::RoundOutcome::NONE && rr->outcome() == nullptr)
            return std::unexpected(ParseError{"round outcome missing"});

        switch (rr->outcome_type())
        {
        case gen::net::RoundOutcome::MatchEnded:
        {
            auto const* me = rr->outcome_as_MatchEnded();
            switch (me->kind())
            {
            case gen::net::EndKind::Draw: return core::MatchEnded{core::Draw{}};
            case gen::net::EndKind::Victory: return core::MatchEnded{core::Victory{me->winner()}};
            }
            return std::unexpected(ParseError{"unknown end kind"});
        }
        case gen::net::RoundOutcome::NextRound:
        {
            auto const* nr = rr->outcome_as_NextRound();
            if (nr->own() == nullptr || nr->opponent() == nullptr)
                return std::unexpected(ParseError{"next round without views"});

            auto const* pv = nr->own();
            core::NextRound out{};
            out.own.player_id = pv->player_id();
            if (auto const* h = pv->hand())
                out.own.hand = core::Hand{h->attacks(), h->counters(), h->rests()};
            if (pv->has_chosen())
            {
                auto const c = CardOrError(pv->chosen_card());
                if (!c) return std::unexpected(c.error());
                out.own.chosen_card = *c;
            }
            out.own.health = pv->health();
            if (auto const* v = pv->pending_choice(); v != nullptr && v->size() != 0)
            {
                if (v->size() != clash::core::constants::ChoiceSize)
                    return std::unexpected(ParseError{"reward choice must offer exactly two cards"});
                core::CardChoice choice{};
                for (flatbuffers::uoffset_t i = 0; i < v->size(); ++i)
                {
                    auto const c = CardOrError(static_cast<gen::net::Card>(v->Get(i)));
                    if (!c) return std::unexpected(c.error());
                    choice[i] = *c;
                }
                out.own.pending_choice = choice;
            }
            out.opponent = core::OpponentView{nr->opponent()->card_count(), nr->opponent()->health()};
            return out;
        }
        default:
            return std::unexpected(ParseError{"round result without outcome"});
        }
    }
} // anonymous

namespace clash::net
{
    // ---------- Builders (client → server) ----------

    auto BuildChat(core::PlayerId to, std::string_view text, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(text.data(), text.size());
        auto const m = gen::net::CreateChat(fbb, to, txt);
        return Finish(fbb, msg_id, gen::net::Message::Chat, m.Union());
    }

    auto BuildChallengeRequest(core::PlayerId target, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const m = gen::net::CreateChallengeRequest(fbb, target);
        return Finish(fbb, msg_id, gen::net::Message::ChallengeRequest, m.Union());
    }

    auto BuildChallengeResponse(core::PlayerId challenger, bool accepted, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const m = gen::net::CreateChallengeResponse(fbb, challenger, accepted);
        return Finish(fbb, msg_id, gen::net::Message::ChallengeResponse, m.Union());
    }

    auto BuildPlayCard(core::Card card, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const m = gen::net::CreatePlayCard(fbb, ToFbCard(card));
        return Finish(fbb, msg_id, gen::net::Message::PlayCard, m.Union());
    }

    auto BuildPickCard(core::Card card, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const m = gen::net::CreatePickCard(fbb, ToFbCard(card));
        return Finish(fbb, msg_id, gen::net::Message::PickCard, m.Union());
    }

    auto EncodeInbound(core::InboundMessage const& msg, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        return std::visit([&]<typename T0>(T0 const& m) -> flatbuffers::DetachedBuffer
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, core::ChatMsg>)
                return BuildChat(m.to, m.text, msg_id);
            else if constexpr (std::is_same_v<T, core::ChallengeRequestMsg>)
                return BuildChallengeRequest(m.target, msg_id);
            else if constexpr (std::is_same_v<T, core::ChallengeResponseMsg>)
                return BuildChallengeResponse(m.challenger, m.accepted, msg_id);
            else if constexpr (std::is_same_v<T, core::PlayCardMsg>)
                return BuildPlayCard(m.card, msg_id);
            else
                return BuildPickCard(m.card, msg_id);
        }, msg);
    }

    // ---------- Server → client ----------

    auto EncodeOutbound(core::OutboundMessage const& msg, std::uint64_t msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::visit([&]<typename T0>(T0 const& m)
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, core::ConnectedMsg>)
            {
                auto const o = gen::net::CreateConnected(fbb, m.id);
                fbb.Finish(gen::net::CreateEnvelope(fbb, msg_id, gen::net::Message::Connected, o.Union()));
            }
            else if constexpr (std::is_same_v<T, core::ErrMsg>)
            {
                auto const txt = fbb.CreateString(m.text);
                auto const o = gen::net::CreateErr(fbb, txt);
                fbb.Finish(gen::net::CreateEnvelope(fbb, msg_id, gen::net::Message::Err, o.Union()));
            }
            else if constexpr (std::is_same_v<T, core::PhaseUpdateMsg>)
            {
                gen::net::PhaseKind kind = gen::net::PhaseKind::Idle;
                std::uint64_t target = 0;
                std::uint64_t match_id = 0;
                if (auto const* c = std::get_if<core::Challenging>(&m.phase))
                {
                    kind = gen::net::PhaseKind::Challenging;
                    target = c->target;
                }
                else if (auto const* im = std::get_if<core::InMatch>(&m.phase))
                {
                    kind = gen::net::PhaseKind::InMatch;
                    match_id = im->match;
                }
                auto const o = gen::net::CreatePhaseUpdate(fbb, kind, target, match_id);
                fbb.Finish(gen::net::CreateEnvelope(fbb, msg_id, gen::net::Message::PhaseUpdate, o.Union()));
            }
            else if constexpr (std::is_same_v<T, core::DirectMsg>)
            {
                auto const txt = fbb.CreateString(m.text);
                auto const o = gen::net::CreateDirect(fbb, m.from, txt);
                fbb.Finish(gen::net::CreateEnvelope(fbb, msg_id, gen::net::Message::Direct, o.Union()));
            }
            else if constexpr (std::is_same_v<T, core::ChallengeMsg>)
            {
                auto const o = gen::net::CreateChallenge(fbb, m.from);
                fbb.Finish(gen::net::CreateEnvelope(fbb, msg_id, gen::net::Message::Challenge, o.Union()));
            }
            else if constexpr (std::is_same_v<T, core::ChallengeAcceptedMsg>)
            {
                auto const o = gen::net::CreateChallengeAccepted(fbb);
                fbb.Finish(gen::net::CreateEnvelope(fbb, msg_id, gen::net::Message::ChallengeAccepted, o.Union()));
            }
            else
            {
                auto const o = BuildRoundResult(fbb, m.result);
                fbb.Finish(gen::net::CreateEnvelope(fbb, msg_id, gen::net::Message::RoundResult, o.Union()));
            }
        }, msg);

        return fbb.Release();
    }

    // ---------- Decode ----------

    auto DecodeInbound(std::span<std::byte const> bytes) -> std::expected<core::InboundMessage, ParseError>
    {
        std::vector<std::uint8_t> storage;
        auto const env = Open(bytes, storage);
        if (!env)
            return std::unexpected(env.error());

        auto const* e = *env;
        if (e->message_type() != gen::net::Message::NONE && e->message() == nullptr)
            return std::unexpected(ParseError{"message body missing"});

        switch (e->message_type())
        {
        case gen::net::Message::Chat:
        {
            auto const* m = e->message_as_Chat();
            return core::ChatMsg{m->to(), Text(m->text())};
        }
        case gen::net::Message::ChallengeRequest:
            return core::ChallengeRequestMsg{e->message_as_ChallengeRequest()->target()};
        case gen::net::Message::ChallengeResponse:
        {
            auto const* m = e->message_as_ChallengeResponse();
            return core::ChallengeResponseMsg{m->challenger(), m->accepted()};
        }
        case gen::net::Message::PlayCard:
        {
            auto const c = CardOrError(e->message_as_PlayCard()->card());
            if (!c) return std::unexpected(c.error());
            return core::PlayCardMsg{*c};
        }
        case gen::net::Message::PickCard:
        {
            auto const c = CardOrError(e->message_as_PickCard()->card());
            if (!c) return std::unexpected(c.error());
            return core::PickCardMsg{*c};
        }
        case gen::net::Message::NONE:
            return std::unexpected(ParseError{"empty envelope"});
        default:
            return std::unexpected(ParseError{
                std::format("not a client message ({})", gen::net::EnumNameMessage(e->message_type()))});
        }
    }

    auto DecodeOutbound(std::span<std::byte const> bytes) -> std::expected<core::OutboundMessage, ParseError>
    {
        std::vector<std::uint8_t> storage;
        auto const env = Open(bytes, storage);
        if (!env)
            return std::unexpected(env.error());

        auto const* e = *env;
        if (e->message_type() != gen::net::Message::NONE && e->message() == nullptr)
            return std::unexpected(ParseError{"message body missing"});

        switch (e->message_type())
        {
        case gen::net::Message::Connected:
            return core::ConnectedMsg{e->message_as_Connected()->id()};
        case gen::net::Message::Err:
            return core::ErrMsg{Text(e->message_as_Err()->text())};
        case gen::net::Message::PhaseUpdate:
        {
            auto const* m = e->message_as_PhaseUpdate();
            switch (m->kind())
            {
            case gen::net::PhaseKind::Idle: return core::PhaseUpdateMsg{core::Idle{}};
            case gen::net::PhaseKind::Challenging: return core::PhaseUpdateMsg{core::Challenging{m->target()}};
            case gen::net::PhaseKind::InMatch: return core::PhaseUpdateMsg{core::InMatch{m->match_id()}};
            }
            return std::unexpected(ParseError{"unknown phase kind"});
        }
        case gen::net::Message::Direct:
        {
            auto const* m = e->message_as_Direct();
            return core::DirectMsg{m->from(), Text(m->text())};
        }
        case gen::net::Message::Challenge:
            return core::ChallengeMsg{e->message_as_Challenge()->from()};
        case gen::net::Message::ChallengeAccepted:
            return core::ChallengeAcceptedMsg{};
        case gen::net::Message::RoundResult:
        {
            auto rr = DecodeRoundResult(e->message_as_RoundResult());
            if (!rr) return std::unexpected(rr.error());
            return core::RoundResultMsg{std::move(*rr)};
        }
        case gen::net::Message::NONE:
            return std::unexpected(ParseError{"empty envelope"});
        default:
            return std::unexpected(ParseError{
                std::format("not a server message ({})", gen::net::EnumNameMessage(e->message_type()))});
        }
    }

    auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }

    auto AsBytes(std::string_view payload) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(payload.data()), payload.size()};
    }

    auto ToPayload(flatbuffers::DetachedBuffer const& buf) -> std::string
    {
        return std::string(reinterpret_cast<char const*>(buf.data()), buf.size());
    }

    // ---------- FbCodec ----------

    auto FbCodec::Decode(std::string_view payload) const -> std::expected<core::InboundMessage, ParseError>
    {
        return DecodeInbound(AsBytes(payload));
    }

    auto FbCodec::Encode(core::OutboundMessage const& msg, std::uint64_t msg_id) const -> std::string
    {
        return ToPayload(EncodeOutbound(msg, msg_id));
    }
} // namespace clash::net
