#include <gtest/gtest.h>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "../core/Messages.hpp"
#include "../core/Store.hpp"
#include "../core/StoreActor.hpp"
#include "../net/SessionActor.hpp"
#include "../net/codec.hpp"
#include "generated/flatbuffers/clash_net_generated.h"

using namespace clash;
using core::PlayerId;

namespace
{
    constexpr std::chrono::milliseconds Patience{2000};

    // Plays the transport: keeps every frame the session wrote.
    class FrameSink
    {
    public:
        auto Fn() -> net::SessionActor::SendFn
        {
            return [this](std::string const& frame)
            {
                {
                    std::lock_guard<std::mutex> lock(mx_);
                    frames_.push_back(frame);
                }
                cv_.notify_all();
                return true;
            };
        }

        auto WaitFor(std::size_t n) -> bool
        {
            std::unique_lock<std::mutex> lock(mx_);
            return cv_.wait_for(lock, Patience, [&]() { return frames_.size() >= n; });
        }

        auto Decoded() const -> std::vector<core::OutboundMessage>
        {
            std::lock_guard<std::mutex> lock(mx_);
            std::vector<core::OutboundMessage> out;
            for (std::string const& f : frames_)
            {
                auto const m = net::DecodeOutbound(net::AsBytes(f));
                EXPECT_TRUE(m.has_value()) << (m.has_value() ? "" : m.error().message);
                if (m) out.push_back(*m);
            }
            return out;
        }

        template <typename T>
        auto Last() const -> std::optional<T>
        {
            auto const all = Decoded();
            for (auto it = all.rbegin(); it != all.rend(); ++it)
            {
                if (auto const* m = std::get_if<T>(&*it)) return *m;
            }
            return std::nullopt;
        }

    private:
        mutable std::mutex mx_;
        std::condition_variable cv_;
        std::vector<std::string> frames_;
    };

    struct Client
    {
        FrameSink sink;
        std::shared_ptr<net::SessionActor> session;
    };

    class SessionActorTest : public ::testing::Test
    {
    protected:
        SessionActorTest() :
            codec_(std::make_shared<net::FbCodec>()),
            store_(core::Store(core::Config{}, codec_))
        {
            store_.Start();
        }

        ~SessionActorTest() override
        {
            for (auto& c : clients_)
            {
                c->session->Close();
                c->session->Join();
            }
            store_.Stop();
        }

        // Starts a session and waits for its Connected frame.
        auto Connect() -> Client&
        {
            Client& c = Open();
            EXPECT_TRUE(c.sink.WaitFor(1));
            return c;
        }

        auto Open() -> Client&
        {
            auto& c = *clients_.emplace_back(std::make_unique<Client>());
            c.session = std::make_shared<net::SessionActor>(clients_.size(), store_, codec_, c.sink.Fn());
            c.session->Start();
            return c;
        }

        static auto IdOf(Client const& c) -> PlayerId
        {
            auto const connected = c.sink.Last<core::ConnectedMsg>();
            EXPECT_TRUE(connected.has_value());
            return connected ? connected->id : 0;
        }

        std::shared_ptr<core::Codec const> codec_;
        core::StoreActor store_;
        std::vector<std::unique_ptr<Client>> clients_;
    };
}

TEST_F(SessionActorTest, ConnectedIsTheFirstFrame)
{
    Client& a = Connect();
    auto const frames = a.sink.Decoded();
    ASSERT_EQ(frames.size(), 1u);
    ASSERT_TRUE(std::holds_alternative<core::ConnectedMsg>(frames[0]));
    EXPECT_EQ(a.session->Id(), std::get<core::ConnectedMsg>(frames[0]).id);
}

TEST_F(SessionActorTest, ChatIsRelayedBetweenSessions)
{
    Client& a = Connect();
    Client& b = Connect();

    a.session->Deliver(net::ToPayload(net::BuildChat(IdOf(b), "good luck", 1)));
    ASSERT_TRUE(b.sink.WaitFor(2));

    auto const direct = b.sink.Last<core::DirectMsg>();
    ASSERT_TRUE(direct.has_value());
    EXPECT_EQ(direct->from, IdOf(a));
    EXPECT_EQ(direct->text, "good luck");
    EXPECT_GE(b.session->FramesSent(), 2u);
}

TEST_F(SessionActorTest, FramesBeforeConnectedAreForwarded)
{
    Client& b = Connect();
    PlayerId const target = IdOf(b);

    // delivered while the session may still be waiting for its id
    Client& a = Open();
    a.session->Deliver(net::ToPayload(net::BuildChat(target, "first", 1)));
    a.session->Deliver(net::ToPayload(net::BuildChat(target, "second", 2)));

    ASSERT_TRUE(b.sink.WaitFor(3));
    auto const frames = b.sink.Decoded();
    ASSERT_EQ(frames.size(), 3u);
    EXPECT_EQ(std::get<core::DirectMsg>(frames[1]).text, "first");
    EXPECT_EQ(std::get<core::DirectMsg>(frames[2]).text, "second");
}

TEST_F(SessionActorTest, UndecodableFrameIsAnsweredWithErr)
{
    Client& a = Connect();
    a.session->Deliver("not a flatbuffer at all");
    ASSERT_TRUE(a.sink.WaitFor(2));

    auto const err = a.sink.Last<core::ErrMsg>();
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->text.find("MessageUndecodable"), std::string::npos);
}

TEST_F(SessionActorTest, ChallengeAndAcceptOverTheWire)
{
    Client& a = Connect();
    Client& b = Connect();

    a.session->Deliver(net::ToPayload(net::BuildChallengeRequest(IdOf(b), 1)));
    ASSERT_TRUE(b.sink.WaitFor(2));
    EXPECT_EQ(b.sink.Last<core::ChallengeMsg>()->from, IdOf(a));

    b.session->Deliver(net::ToPayload(net::BuildChallengeResponse(IdOf(a), true, 1)));
    // Connected, Challenge, PhaseUpdate(InMatch), RoundResult
    ASSERT_TRUE(b.sink.WaitFor(4));
    ASSERT_TRUE(a.sink.WaitFor(5));

    auto const round = b.sink.Last<core::RoundResultMsg>();
    ASSERT_TRUE(round.has_value());
    auto const* view = std::get_if<core::NextRound>(&round->result);
    ASSERT_NE(view, nullptr);
    EXPECT_EQ(view->own.player_id, IdOf(b));
    EXPECT_EQ(view->own.hand, core::Config{}.start_hand);
    EXPECT_EQ(view->opponent.health, core::Config{}.start_health);
}

TEST_F(SessionActorTest, CloseReleasesThePlayer)
{
    Client& a = Connect();
    Client& b = Connect();
    PlayerId const gone = IdOf(a);

    a.session->Close();
    a.session->Join();

    // Delete was posted before Join returned, so it precedes this chat in the store's queue
    b.session->Deliver(net::ToPayload(net::BuildChat(gone, "still there?", 1)));
    ASSERT_TRUE(b.sink.WaitFor(2));
    auto const err = b.sink.Last<core::ErrMsg>();
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->text.find("IdNotFound"), std::string::npos);

    // after close nothing more is written
    a.session->Deliver(net::ToPayload(net::BuildChat(IdOf(b), "ghost", 2)));
    EXPECT_EQ(a.sink.Decoded().size(), 1u);
}

TEST_F(SessionActorTest, FrameWithoutBodyIsAnsweredAndServingContinues)
{
    Client& a = Connect();
    Client& b = Connect();

    flatbuffers::FlatBufferBuilder fbb;
    gen::net::EnvelopeBuilder env(fbb);
    env.add_message_type(gen::net::Message::PlayCard);
    fbb.Finish(env.Finish());
    a.session->Deliver(net::ToPayload(fbb.Release()));

    ASSERT_TRUE(a.sink.WaitFor(2));
    auto const err = a.sink.Last<core::ErrMsg>();
    ASSERT_TRUE(err.has_value());
    EXPECT_NE(err->text.find("message body missing"), std::string::npos);

    a.session->Deliver(net::ToPayload(net::BuildChat(IdOf(b), "still up", 2)));
    ASSERT_TRUE(b.sink.WaitFor(2));
    EXPECT_EQ(b.sink.Last<core::DirectMsg>()->text, "still up");
}

// The store answers Create only after the session gave up waiting and closed.
TEST(SessionActorLifecycle, ConnectedAfterCloseReleasesThePlayer)
{
    auto codec = std::make_shared<net::FbCodec>();
    core::StoreActor store(core::Store(core::Config{}, codec));

    FrameSink sink;
    auto session = std::make_shared<net::SessionActor>(1, store, codec, sink.Fn(), std::chrono::milliseconds(20));
    session->Start();
    session->Close();
    session->Join();
    EXPECT_FALSE(session->Id().has_value());

    // Create, then the Delete posted for the unclaimed id
    store.Start();
    auto const deadline = std::chrono::steady_clock::now() + Patience;
    while (store.Processed() < 2 && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    store.Stop();

    EXPECT_EQ(store.Processed(), 2u);
    EXPECT_EQ(store.Inspect().Players().Size(), 0u);
    EXPECT_EQ(session->FramesSent(), 0u);
}
