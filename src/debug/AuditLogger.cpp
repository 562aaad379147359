#include "AuditLogger.hpp"

#include <format>
#include <print>
#include <string_view>
#include <type_traits>
#include <utility>

#include "../core/Util.hpp"

using namespace clash::core;

namespace
{

auto s_action(MatchAction const& a) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlayCardAction>)
            {
                return std::format("Play({})", to_string(act.card));
            }
            else
            {
                return std::format("Pick({})", to_string(act.card));
            }
        },
        a
    );
}

auto s_outcome(MoveOutcome const m) -> std::string_view
{
    switch (m)
    {
        case MoveOutcome::Applied:       return "Applied";
        case MoveOutcome::RoundResolved: return "RoundResolved";
        case MoveOutcome::MatchEnded:    return "MatchEnded";
    }
    return "?";
}

} // anonymous namespace

namespace clash::core::debug
{

AuditLogger::AuditLogger(std::filesystem::path dir)
    : dir_(std::move(dir))
{
    std::filesystem::create_directories(dir_);
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::PathFor(MatchId const id) const -> std::filesystem::path
{
    return dir_ / std::format("match_{}.log", id);
}

auto AuditLogger::Stream(MatchId const id) -> std::ofstream*
{
    auto it = files_.find(id);
    return it == files_.end() ? nullptr : &it->second;
}

auto AuditLogger::OnMatchStart(Match const& match) -> void
{
    std::ofstream out(PathFor(match.Id()), std::ios::out | std::ios::trunc);
    if (!out)
    {
        std::print("[Audit] Cannot open {}\n", PathFor(match.Id()).string());
        return;
    }

    auto const& [p0, p1] = match.Players();
    out << std::format("Match=M{}\n", match.Id());
    out << std::format("Players=P{},P{}\n", p0, p1);
    for (PlayerId const p : match.Players())
    {
        if (PlayerMatchState const* s = match.StateOf(p))
        {
            out << std::format("Start: {}\n", util::describe(*s));
        }
    }
    out.flush();

    files_.insert_or_assign(match.Id(), std::move(out));
}

auto AuditLogger::OnAction(Match const& match,
                           PlayerId const actor,
                           MatchAction const& action,
                           MoveOutcome const out) -> void
{
    std::ofstream* f = Stream(match.Id());
    if (f == nullptr)
    {
        return;
    }

    *f << std::format("Action actor=P{} {}\n", actor, s_action(action));

    if (out != MoveOutcome::Applied && match.LastRound())
    {
        RoundReveal const& r = *match.LastRound();
        *f << std::format(
            "Round {} cards={}/{} health={}/{}\n",
            r.round_no,
            to_string(r.cards[0]),
            to_string(r.cards[1]),
            static_cast<int>(r.health_after[0]),
            static_cast<int>(r.health_after[1])
        );
    }

    *f << std::format("Outcome: {}\n", s_outcome(out));
}

auto AuditLogger::OnMatchEnd(Match const& match) -> void
{
    std::ofstream* f = Stream(match.Id());
    if (f == nullptr)
    {
        return;
    }

    if (std::optional<EndState> const end = match.End())
    {
        *f << std::format("End={}\n", util::describe(*end));
    }
    *f << std::format("Rounds={}\n", match.RoundsPlayed());
    f->flush();

    files_.erase(match.Id());
}

} // namespace clash::core::debug
