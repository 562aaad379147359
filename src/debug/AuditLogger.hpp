//
// AuditLogger.hpp — per-match transcript files, one line per event
//

#ifndef CARDCLASH_AUDITLOGGER_HPP
#define CARDCLASH_AUDITLOGGER_HPP

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>

#include "../core/Actions.hpp"
#include "../core/Match.hpp"
#include "../core/MatchObserver.hpp"
#include "../core/Types.hpp"

namespace clash::core::debug
{
    // Called from the store thread only.
    class AuditLogger final : public MatchObserver
    {
    public:
        // Creates the directory if needed; throws std::filesystem::filesystem_error otherwise.
        explicit AuditLogger(std::filesystem::path dir);
        ~AuditLogger() override;

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        // Header: participants, starting health and hands
        auto OnMatchStart(Match const& match) -> void override;

        // Committed play or pick, plus the revealed round when one resolved
        auto OnAction(Match const& match, PlayerId actor, MatchAction const& action, MoveOutcome out) -> void override;

        // Footer: end state and round count; closes the file
        auto OnMatchEnd(Match const& match) -> void override;

        auto PathFor(MatchId id) const -> std::filesystem::path;
        auto OpenFiles() const noexcept -> std::size_t { return files_.size(); }

    private:
        auto Stream(MatchId id) -> std::ofstream*;

    private:
        std::filesystem::path dir_;
        std::map<MatchId, std::ofstream> files_;
    };
}

#endif //CARDCLASH_AUDITLOGGER_HPP
