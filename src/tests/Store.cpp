#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "../core/Codec.hpp"
#include "../core/Messages.hpp"
#include "../core/Store.hpp"
#include "../core/Types.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/RecordingSession.hpp"
#include "TableCodec.hpp"

using namespace clash::core;
using clash::core::fixtures::TableCodec;

namespace
{
    auto To(Outbox const& out, PlayerId p) -> std::vector<OutboundMessage>
    {
        std::vector<OutboundMessage> v;
        for (Outbound const& o : out)
        {
            if (o.to == p) v.push_back(o.msg);
        }
        return v;
    }

    template <typename T>
    auto CountOf(std::vector<OutboundMessage> const& v) -> std::size_t
    {
        std::size_t n = 0;
        for (OutboundMessage const& m : v) n += std::holds_alternative<T>(m) ? 1 : 0;
        return n;
    }

    auto ErrText(Outbox const& out, PlayerId p) -> std::string
    {
        for (OutboundMessage const& m : To(out, p))
        {
            if (auto const* e = std::get_if<ErrMsg>(&m)) return e->text;
        }
        return {};
    }

    class StoreTest : public ::testing::Test
    {
    protected:
        auto Make(Config cfg = Config{}) -> void
        {
            codec_ = std::make_shared<TableCodec>();
            store_ = std::make_unique<Store>(cfg, codec_);
        }

        auto Join() -> PlayerId
        {
            Outbox const out = store_->Create(std::make_shared<debug::RecordingSession>());
            EXPECT_EQ(out.size(), 1u);
            auto const* c = std::get_if<ConnectedMsg>(&out.front().msg);
            EXPECT_NE(c, nullptr);
            EXPECT_EQ(out.front().to, c->id);
            return c->id;
        }

        auto Phase(PlayerId p) const -> GamePhase const& { return store_->Players().PhaseOf(p); }

        // challenger challenges responder, responder accepts; returns the match id
        auto StartMatch(PlayerId challenger, PlayerId responder) -> MatchId
        {
            Outbox const a = store_->Dispatch(challenger, ChallengeRequestMsg{responder});
            EXPECT_TRUE(ErrText(a, challenger).empty()) << ErrText(a, challenger);
            Outbox const b = store_->Dispatch(responder, ChallengeResponseMsg{challenger, true});
            EXPECT_TRUE(ErrText(b, responder).empty()) << ErrText(b, responder);
            return std::get<InMatch>(Phase(challenger)).match;
        }

        std::shared_ptr<TableCodec> codec_;
        std::unique_ptr<Store> store_;
    };
}

TEST_F(StoreTest, CreateAssignsIncreasingIds)
{
    Make();
    PlayerId const a = Join();
    PlayerId const b = Join();
    EXPECT_EQ(a, 0u);
    EXPECT_EQ(b, 1u);
    EXPECT_TRUE(std::holds_alternative<Idle>(Phase(a)));

    ASSERT_TRUE(store_->Delete(a).empty());
    EXPECT_EQ(Join(), 2u) << "ids are never reused";
    EXPECT_EQ(store_->Players().Size(), 2u);
}

TEST_F(StoreTest, ChatIsRelayed)
{
    Make();
    PlayerId const a = Join();
    PlayerId const b = Join();

    Outbox const out = store_->Dispatch(a, ChatMsg{b, "hello"});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].to, b);
    EXPECT_EQ(std::get<DirectMsg>(out[0].msg), (DirectMsg{a, "hello"}));
}

TEST_F(StoreTest, ChatToUnknownPlayerIsAnError)
{
    Make();
    PlayerId const a = Join();

    Outbox const out = store_->Dispatch(a, ChatMsg{42, "anyone?"});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].to, a);
    EXPECT_NE(ErrText(out, a).find("IdNotFound"), std::string::npos);
}

TEST_F(StoreTest, ChallengeNotifiesBothSides)
{
    Make();
    PlayerId const a = Join();
    PlayerId const b = Join();

    Outbox const out = store_->Dispatch(a, ChallengeRequestMsg{b});
    EXPECT_EQ(Phase(a), (GamePhase{Challenging{b}}));
    EXPECT_EQ(Phase(b), (GamePhase{Idle{}})) << "target is unaffected until it answers";

    auto const to_a = To(out, a);
    auto const to_b = To(out, b);
    ASSERT_EQ(to_a.size(), 1u);
    EXPECT_EQ(std::get<PhaseUpdateMsg>(to_a[0]).phase, (GamePhase{Challenging{b}}));
    ASSERT_EQ(to_b.size(), 1u);
    EXPECT_EQ(std::get<ChallengeMsg>(to_b[0]).from, a);
}

TEST_F(StoreTest, ChallengeUnknownTargetKeepsIdle)
{
    Make();
    PlayerId const a = Join();

    Outbox const out = store_->Dispatch(a, ChallengeRequestMsg{7});
    EXPECT_TRUE(std::holds_alternative<Idle>(Phase(a)));
    EXPECT_EQ(CountOf<ErrMsg>(To(out, a)), 1u);
    EXPECT_NE(ErrText(out, a).find("IdNotFound"), std::string::npos);
}

TEST_F(StoreTest, SelfChallengeRejected)
{
    Make();
    PlayerId const a = Join();

    Outbox const out = store_->Dispatch(a, ChallengeRequestMsg{a});
    EXPECT_TRUE(std::holds_alternative<Idle>(Phase(a)));
    EXPECT_NE(ErrText(out, a).find("InvalidRequest"), std::string::npos);
}

TEST_F(StoreTest, ScenarioD_ResponseFromNonTargetRejected)
{
    Make();
    PlayerId const a = Join();
    PlayerId const b = Join();
    PlayerId const c = Join();

    ASSERT_EQ(store_->Dispatch(a, ChallengeRequestMsg{b}).size(), 2u);

    // c was never challenged by a
    Outbox const out = store_->Dispatch(c, ChallengeResponseMsg{a, true});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].to, c);
    EXPECT_NE(ErrText(out, c).find("InvalidRequest"), std::string::npos);

    EXPECT_EQ(Phase(a), (GamePhase{Challenging{b}}));
    EXPECT_EQ(Phase(c), (GamePhase{Idle{}}));
    EXPECT_EQ(store_->MatchCount(), 0u);

    // an Idle player cannot be answered either
    Outbox const idle = store_->Dispatch(a, ChallengeResponseMsg{c, true});
    EXPECT_NE(ErrText(idle, a).find("InvalidRequest"), std::string::npos);
    EXPECT_EQ(Phase(a), (GamePhase{Challenging{b}}));
}

TEST_F(StoreTest, ScenarioE_ChallengeWhileBusyRejected)
{
    Make();
    PlayerId const a = Join();
    PlayerId const b = Join();
    PlayerId const c = Join();
    PlayerId const d = Join();

    ASSERT_TRUE(ErrText(store_->Dispatch(a, ChallengeRequestMsg{b}), a).empty());
    Outbox const again = store_->Dispatch(a, ChallengeRequestMsg{c});
    EXPECT_NE(ErrText(again, a).find("already challenging"), std::string::npos);
    EXPECT_EQ(Phase(a), (GamePhase{Challenging{b}}));
    EXPECT_EQ(CountOf<ChallengeMsg>(To(again, c)), 0u);

    MatchId const m = StartMatch(c, d);
    Outbox const busy = store_->Dispatch(c, ChallengeRequestMsg{a});
    EXPECT_NE(ErrText(busy, c).find("already in a match"), std::string::npos);
    EXPECT_EQ(Phase(c), (GamePhase{InMatch{m}}));
}

TEST_F(StoreTest, AcceptStartsMatch)
{
    Make();
    PlayerId const a = Join();
    PlayerId const b = Join();

    ASSERT_TRUE(ErrText(store_->Dispatch(a, ChallengeRequestMsg{b}), a).empty());
    Outbox const out = store_->Dispatch(b, ChallengeResponseMsg{a, true});

    EXPECT_EQ(Phase(a), (GamePhase{InMatch{0}}));
    EXPECT_EQ(Phase(b), (GamePhase{InMatch{0}}));
    EXPECT_EQ(store_->MatchCount(), 1u);

    auto const to_a = To(out, a);
    auto const to_b = To(out, b);
    EXPECT_EQ(CountOf<ChallengeAcceptedMsg>(to_a), 1u);
    EXPECT_EQ(CountOf<ChallengeAcceptedMsg>(to_b), 0u);
    EXPECT_EQ(CountOf<PhaseUpdateMsg>(to_a), 1u);
    EXPECT_EQ(CountOf<PhaseUpdateMsg>(to_b), 1u);
    ASSERT_EQ(CountOf<RoundResultMsg>(to_a), 1u);
    ASSERT_EQ(CountOf<RoundResultMsg>(to_b), 1u);

    for (OutboundMessage const& msg : to_b)
    {
        if (auto const* rr = std::get_if<RoundResultMsg>(&msg))
        {
            auto const& nr = std::get<NextRound>(rr->result);
            EXPECT_EQ(nr.own.player_id, b);
            EXPECT_EQ(nr.own.hand, (Hand{.attacks = 2, .counters = 1, .rests = 1}));
            EXPECT_EQ(nr.own.health, 5);
            EXPECT_EQ(nr.opponent, (OpponentView{.card_count = 4, .health = 5}));
        }
    }

    Match const* match = store_->FindMatch(0);
    ASSERT_NE(match, nullptr);
    EXPECT_EQ(match->Players()[0], a);
    EXPECT_EQ(match->Players()[1], b);
}

TEST_F(StoreTest, MatchIdsAreMonotonic)
{
    Make();
    PlayerId const a = Join();
    PlayerId const b = Join();
    PlayerId const c = Join();
    PlayerId const d = Join();

    EXPECT_EQ(StartMatch(a, b), 0u);
    EXPECT_EQ(StartMatch(c, d), 1u);
    EXPECT_EQ(store_->MatchCount(), 2u);
}

TEST_F(StoreTest, DeclineReturnsChallengerToIdle)
{
    Make();
    PlayerId const a = Join();
    PlayerId const b = Join();

    ASSERT_TRUE(ErrText(store_->Dispatch(a, ChallengeRequestMsg{b}), a).empty());
    Outbox const out = store_->Dispatch(b, ChallengeResponseMsg{a, false});

    EXPECT_TRUE(std::holds_alternative<Idle>(Phase(a)));
    EXPECT_TRUE(std::holds_alternative<Idle>(Phase(b)));
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].to, a);
    EXPECT_EQ(std::get<PhaseUpdateMsg>(out[0].msg).phase, (GamePhase{Idle{}}));
    EXPECT_EQ(store_->MatchCount(), 0u);
}

TEST_F(StoreTest, ResponderInMatchCannotAccept)
{
    Make();
    PlayerId const a = Join();
    PlayerId const b = Join();
    PlayerId const c = Join();

    ASSERT_TRUE(ErrText(store_->Dispatch(c, ChallengeRequestMsg{a}), c).empty());
    MatchId const m = StartMatch(a, b);

    Outbox const out = store_->Dispatch(a, ChallengeResponseMsg{c, true});
    EXPECT_NE(ErrText(out, a).find("cannot accept while in a match"), std::string::npos);
    EXPECT_EQ(Phase(a), (GamePhase{InMatch{m}}));
    EXPECT_EQ(Phase(c), (GamePhase{Challenging{a}}));

    // declining is still allowed
    Outbox const no = store_->Dispatch(a, ChallengeResponseMsg{c, false});
    EXPECT_TRUE(ErrText(no, a).empty());
    EXPECT_TRUE(std::holds_alternative<Idle>(Phase(c)));
}

TEST_F(StoreTest, PlayOutsideMatchRejected)
{
    Make();
    PlayerId const a = Join();

    Outbox const out = store_->Dispatch(a, PlayCardMsg{Card::Attack});
    EXPECT_NE(ErrText(out, a).find("not in a match"), std::string::npos);
    Outbox const pick = store_->Dispatch(a, PickCardMsg{Card::Attack});
    EXPECT_NE(ErrText(pick, a).find("not in a match"), std::string::npos);
}

TEST_F(StoreTest, RoundsFanOutAndMatchEndResetsPhases)
{
    Config cfg{};
    cfg.start_health = 1;
    Make(cfg);
    PlayerId const a = Join();
    PlayerId const b = Join();
    MatchId const m = StartMatch(a, b);

    // first commit: both still receive a fresh result
    Outbox const first = store_->Dispatch(a, PlayCardMsg{Card::Attack});
    EXPECT_EQ(CountOf<RoundResultMsg>(To(first, a)), 1u);
    EXPECT_EQ(CountOf<RoundResultMsg>(To(first, b)), 1u);
    for (OutboundMessage const& msg : To(first, b))
    {
        auto const& nr = std::get<NextRound>(std::get<RoundResultMsg>(msg).result);
        EXPECT_FALSE(nr.own.chosen_card.has_value());
        EXPECT_EQ(nr.opponent.card_count, 3u) << "opponent's commit is hidden";
    }

    Outbox const last = store_->Dispatch(b, PlayCardMsg{Card::Rest});
    for (PlayerId const p : {a, b})
    {
        auto const to_p = To(last, p);
        ASSERT_EQ(to_p.size(), 2u);
        auto const& ended = std::get<MatchEnded>(std::get<RoundResultMsg>(to_p[0]).result);
        EXPECT_EQ(ended.end, (EndState{Victory{a}}));
        EXPECT_EQ(std::get<PhaseUpdateMsg>(to_p[1]).phase, (GamePhase{Idle{}}));
        EXPECT_TRUE(std::holds_alternative<Idle>(Phase(p)));
    }

    Match const* match = store_->FindMatch(m);
    ASSERT_NE(match, nullptr);
    EXPECT_TRUE(match->IsFinished());
    EXPECT_NO_THROW(debug::CheckInvariants(*match));

    // both can start over
    EXPECT_EQ(StartMatch(b, a), m + 1);
}

TEST_F(StoreTest, RuleViolationGoesToSenderOnly)
{
    Make();
    PlayerId const a = Join();
    PlayerId const b = Join();
    StartMatch(a, b);

    ASSERT_TRUE(ErrText(store_->Dispatch(a, PlayCardMsg{Card::Rest}), a).empty());
    ASSERT_TRUE(ErrText(store_->Dispatch(b, PlayCardMsg{Card::Rest}), b).empty());

    Outbox const out = store_->Dispatch(a, PlayCardMsg{Card::Attack});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].to, a);
    EXPECT_NE(ErrText(out, a).find("pick your reward first"), std::string::npos);

    Outbox const picked = store_->Dispatch(a, PickCardMsg{Card::Counter});
    EXPECT_EQ(CountOf<RoundResultMsg>(To(picked, a)), 1u);
    EXPECT_EQ(CountOf<RoundResultMsg>(To(picked, b)), 1u);
}

TEST_F(StoreTest, DisconnectLeavesMatchByDefault)
{
    Make();
    PlayerId const a = Join();
    PlayerId const b = Join();
    MatchId const m = StartMatch(a, b);

    EXPECT_TRUE(store_->Delete(a).empty());
    EXPECT_FALSE(store_->Players().Contains(a));
    EXPECT_EQ(Phase(b), (GamePhase{InMatch{m}}));
    EXPECT_FALSE(store_->FindMatch(m)->IsFinished());

    // the survivor can still commit; results reach only connected players
    Outbox const out = store_->Dispatch(b, PlayCardMsg{Card::Attack});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].to, b);

    EXPECT_TRUE(store_->Delete(a).empty()) << "second delete is ignored";
}

TEST_F(StoreTest, DisconnectForfeitsWhenConfigured)
{
    Config cfg{};
    cfg.forfeit_on_disconnect = true;
    Make(cfg);
    PlayerId const a = Join();
    PlayerId const b = Join();
    PlayerId const c = Join();
    MatchId const m = StartMatch(a, b);
    ASSERT_TRUE(ErrText(store_->Dispatch(c, ChallengeRequestMsg{a}), c).empty());

    Outbox const out = store_->Delete(a);

    auto const to_b = To(out, b);
    ASSERT_EQ(to_b.size(), 2u);
    auto const& ended = std::get<MatchEnded>(std::get<RoundResultMsg>(to_b[0]).result);
    EXPECT_EQ(ended.end, (EndState{Victory{b}}));
    EXPECT_EQ(std::get<PhaseUpdateMsg>(to_b[1]).phase, (GamePhase{Idle{}}));
    EXPECT_TRUE(std::holds_alternative<Idle>(Phase(b)));

    auto const to_c = To(out, c);
    ASSERT_EQ(to_c.size(), 1u);
    EXPECT_EQ(std::get<PhaseUpdateMsg>(to_c[0]).phase, (GamePhase{Idle{}}));
    EXPECT_TRUE(std::holds_alternative<Idle>(Phase(c)));

    EXPECT_TRUE(To(out, a).empty());
    EXPECT_TRUE(store_->FindMatch(m)->IsFinished());
}

TEST_F(StoreTest, ReceiveDecodesThenDispatches)
{
    Make();
    PlayerId const a = Join();
    PlayerId const b = Join();
    codec_->Teach("hi-b", ChatMsg{b, "hi"});

    Outbox const out = store_->Receive(a, "hi-b");
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(std::get<DirectMsg>(out[0].msg), (DirectMsg{a, "hi"}));
}

TEST_F(StoreTest, UndecodablePayloadReported)
{
    Make();
    PlayerId const a = Join();

    Outbox const out = store_->Receive(a, "\x01\x02garbage");
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].to, a);
    std::string const text = ErrText(out, a);
    EXPECT_NE(text.find("MessageUndecodable"), std::string::npos);
    EXPECT_NE(text.find("unknown payload"), std::string::npos);
    EXPECT_TRUE(std::holds_alternative<Idle>(Phase(a)));
}

TEST_F(StoreTest, UnknownSenderDropped)
{
    Make();
    codec_->Teach("req", ChallengeRequestMsg{0});
    EXPECT_TRUE(store_->Receive(5, "req").empty());
    EXPECT_TRUE(store_->Dispatch(5, ChallengeRequestMsg{0}).empty());
}
