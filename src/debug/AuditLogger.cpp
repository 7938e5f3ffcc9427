#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <utility>

#include "../core/Character.hpp"
#include "../core/Util.hpp"

using namespace duel::core;

namespace
{

auto s_actor(ActorView const& a) -> std::string
{
    return std::format("{} ({}): {}/{}", a.name, util::to_string(a.archetype), a.hp, a.sp);
}

// "p1 p2* p2" - a star marks a ticket that may not enqueue
auto serialize_queue(BattleSnapshot const& s) -> std::string
{
    std::string serial;
    for (size_t i{}; i < s.ticket_seats.size(); ++i)
    {
        serial += (i ? " " : "");
        serial += s.players[s.ticket_seats[i]].name;
        if (s.restricted && i < s.can_add.size() && !s.can_add[i])
        {
            serial += "*";
        }
    }
    return serial;
}

} // anonymous namespace

namespace duel::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(Battle& battle) -> void
{
    Config const& cfg = battle.GetConfig();
    BattleSnapshot const snap = battle.Snapshot();

    out_ << std::format("Seed={}\n", cfg.seed);
    out_ << std::format("Queue={}\n", cfg.restricted ? "restricted" : "plain");
    for (size_t i{}; i < snap.players.size(); ++i)
    {
        out_ << std::format("P{}={} style={}\n", i + 1, s_actor(snap.players[i]),
                            util::to_string(cfg.actors[i].playstyle));
    }
    out_.flush();
}

auto AuditLogger::turn(BattleSnapshot const& s, Action const a) -> void
{
    std::string_view const actor = s.front_seat ? std::string_view{s.players[*s.front_seat].name}
                                                : std::string_view{"-"};
    out_ << std::format(
        "Turn {} actor={} hp=[{},{}] sp=[{},{}] queue=[{}]\n",
        s.turn,
        actor,
        s.players[0].hp, s.players[1].hp,
        s.players[0].sp, s.players[1].sp,
        serialize_queue(s)
    );

    out_ << std::format("Action: {}\n", util::ToChar(a));
}

auto AuditLogger::outcome(MoveOutcome const m) -> void
{
    char const* txt =
        (m == MoveOutcome::Applied   ? "Applied" :
        (m == MoveOutcome::GameEnded ? "GameEnded" : "Invalid"));
    out_ << std::format("Outcome: {}\n", txt);
}

auto AuditLogger::end(Battle& battle) -> void
{
    CharacterSP const winner = battle.Winner();
    out_ << std::format("Turns={}\n", battle.Turn());
    out_ << std::format("Winner={}\n", winner ? winner->Describe() : std::string{"none"});
    out_.flush();
}

} // namespace duel::core::debug
