//
// ServerMain.cpp — card clash server using WebSocket++ (no TLS) on Boost.Asio
//
// One StoreActor owns every player and match. Each WebSocket connection gets a
// SessionActor that forwards binary frames to the store and writes the store's
// notifications back as FlatBuffers envelopes.
//

#include <charconv>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <exception>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <print>
#include <string>
#include <string_view>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Exception.hpp"
#include "core/Store.hpp"
#include "core/StoreActor.hpp"
#include "core/Types.hpp"
#include "debug/AuditLogger.hpp"
#include "net/SessionActor.hpp"
#include "net/codec.hpp"

namespace
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    struct ServerConfig
    {
        std::uint16_t port{9002};
        clash::core::Config game{};
        std::optional<std::filesystem::path> audit_dir{};
    };

    auto ParseArgs(int argc, char** argv) -> ServerConfig
    {
        ServerConfig cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string_view const arg = argv[i];

            auto next_uint = [&](std::uint64_t& out)
            {
                if (i + 1 >= argc) { return false; }
                char const* s = argv[++i];
                auto res = std::from_chars(s, s + std::strlen(s), out);
                return res.ec == std::errc{};
            };

            if (arg == "--port")
            {
                std::uint64_t v{};
                if (next_uint(v) && v <= 0xFFFF) { cfg.port = static_cast<std::uint16_t>(v); }
                else { std::print("[Server] Bad --port value, keeping {}\n", cfg.port); }
            }
            else if (arg == "--start-health")
            {
                std::uint64_t v{};
                if (next_uint(v) && v >= 1 && v <= clash::core::constants::MaxHealth)
                {
                    cfg.game.start_health = static_cast<std::uint8_t>(v);
                }
                else
                {
                    std::print("[Server] --start-health must be 1..{}, keeping {}\n",
                               clash::core::constants::MaxHealth, cfg.game.start_health);
                }
            }
            else if (arg == "--strict-cards")
            {
                cfg.game.strict_card_check = true;
            }
            else if (arg == "--forfeit-on-disconnect")
            {
                cfg.game.forfeit_on_disconnect = true;
            }
            else if (arg == "--audit-dir")
            {
                if (i + 1 < argc) { cfg.audit_dir = std::filesystem::path(argv[++i]); }
                else { std::print("[Server] --audit-dir needs a path\n"); }
            }
            else
            {
                std::print("[Server] Ignoring unknown argument '{}'\n", arg);
            }
        }
        return cfg;
    }
}

int main(int argc, char** argv)
{
    using namespace clash;

    ServerConfig const sc = ParseArgs(argc, argv);

    std::print("[Server] Booting on port {} | start health {} | strict cards {} | forfeit on disconnect {}\n",
               sc.port, sc.game.start_health, sc.game.strict_card_check, sc.game.forfeit_on_disconnect);

    std::shared_ptr<core::Codec const> codec = std::make_shared<net::FbCodec>();

    std::shared_ptr<core::MatchObserver> audit{};
    if (sc.audit_dir)
    {
        try
        {
            audit = std::make_shared<core::debug::AuditLogger>(*sc.audit_dir);
            std::print("[Server] Writing match transcripts to {}\n", sc.audit_dir->string());
        }
        catch (std::exception const& e)
        {
            std::print("[Server] Audit disabled: {}\n", e.what());
        }
    }

    core::StoreActor store(core::Store(sc.game, codec, audit));
    store.Start();

    auto ep = std::make_shared<WsServer>();
    ep->clear_access_channels(websocketpp::log::alevel::all);
    ep->set_access_channels(websocketpp::log::alevel::connect |
                            websocketpp::log::alevel::disconnect);
    ep->clear_error_channels(websocketpp::log::elevel::all);

    ep->init_asio();
    ep->set_reuse_addr(true);

    std::mutex sessions_mx;
    std::map<Hdl, std::shared_ptr<net::SessionActor>, std::owner_less<Hdl>> sessions;
    std::uint64_t next_conn_no{0};

    ep->set_open_handler([&](Hdl hdl)
    {
        std::weak_ptr<WsServer> weak_ep = ep;
        net::SessionActor::SendFn send = [weak_ep, hdl](std::string const& frame)
        {
            auto ep_sp = weak_ep.lock();
            if (!ep_sp)
            {
                return false;
            }
            websocketpp::lib::error_code ec;
            ep_sp->send(hdl, frame, websocketpp::frame::opcode::binary, ec);
            return !ec;
        };

        std::shared_ptr<net::SessionActor> session;
        std::size_t live{0};
        {
            std::lock_guard<std::mutex> lock(sessions_mx);
            session = std::make_shared<net::SessionActor>(next_conn_no++, store, codec, std::move(send));
            sessions[hdl] = session;
            live = sessions.size();
        }
        std::print("[Server] Connection {} opened ({} live)\n", session->ConnNo(), live);
        session->Start();
    });

    ep->set_close_handler([&](Hdl hdl)
    {
        std::shared_ptr<net::SessionActor> session;
        {
            std::lock_guard<std::mutex> lock(sessions_mx);
            auto it = sessions.find(hdl);
            if (it == sessions.end())
            {
                return;
            }
            session = std::move(it->second);
            sessions.erase(it);
        }
        std::print("[Server] Connection {} closed\n", session->ConnNo());
        session->Close();
    });

    ep->set_message_handler([&](Hdl hdl, WsServer::message_ptr msg)
    {
        // Only binary frames are valid
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            std::print("[Server] Ignoring non-binary frame from client\n");
            return;
        }

        std::shared_ptr<net::SessionActor> session;
        {
            std::lock_guard<std::mutex> lock(sessions_mx);
            auto it = sessions.find(hdl);
            if (it == sessions.end())
            {
                return;
            }
            session = it->second;
        }
        session->Deliver(msg->get_payload());
    });

    websocketpp::lib::asio::signal_set signals(ep->get_io_service(), SIGINT, SIGTERM);
    signals.async_wait([&](auto const& ec, int sig)
    {
        if (ec)
        {
            return;
        }
        std::print("[Server] Signal {}, shutting down\n", sig);
        websocketpp::lib::error_code stop_ec;
        ep->stop_listening(stop_ec);

        std::lock_guard<std::mutex> lock(sessions_mx);
        for (auto const& [hdl, session] : sessions)
        {
            websocketpp::lib::error_code close_ec;
            ep->close(hdl, websocketpp::close::status::going_away, "Server shutdown", close_ec);
            if (close_ec)
            {
                std::print("[Server] close() error on connection {}: {}\n", session->ConnNo(), close_ec.message());
            }
        }
    });

    try
    {
        ep->listen(sc.port);
        ep->start_accept();
        ep->run();
    }
    catch (websocketpp::exception const& e)
    {
        std::print("[Server] WebSocket error: {}\n", e.what());
        store.Stop();
        return 1;
    }

    // Connections that never saw a close handler still need their players released.
    {
        std::lock_guard<std::mutex> lock(sessions_mx);
        for (auto& [hdl, session] : sessions)
        {
            session->Close();
            session->Join();
        }
        sessions.clear();
    }

    store.Stop();
    std::print("[Server] Stopped after {} store event(s)\n", store.Processed());
    return 0;
}
