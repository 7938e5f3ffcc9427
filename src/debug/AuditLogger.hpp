//
// Created by Malik T on 20/08/2025.
//

#ifndef DUEL_AUDITLOGGER_HPP
#define DUEL_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <string>

#include "../core/Battle.hpp"
#include "../core/State.hpp"
#include "../core/Actions.hpp"
#include "../core/Types.hpp"

namespace duel::core::debug
{
    // Plain-text battle transcript, one line per event.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        AuditLogger(AuditLogger&&) noexcept = default;
        auto operator=(AuditLogger&&) noexcept -> AuditLogger& = default;

        auto IsOpen() const -> bool { return out_.is_open(); }

        // Session header (seed, queue kind, both players)
        auto start(Battle& battle) -> void;

        // Per turn (before Apply): snapshot and the action the actor chose
        auto turn(BattleSnapshot const& s, Action a) -> void;

        // Per step outcome
        auto outcome(MoveOutcome m) -> void;

        // Battle end footer (winner name, or "none" on a tie)
        auto end(Battle& battle) -> void;

    private:
        std::ofstream out_;
    };
}

#endif //DUEL_AUDITLOGGER_HPP
