//
// Created by Malik T on 13/08/2025.
//

//
// main.cpp - runs one two-actor battle from the command line
//

#include <cstdio>
#include <format>
#include <memory>
#include <optional>
#include <print>

#include "core/Battle.hpp"
#include "core/Character.hpp"
#include "core/Exception.hpp"
#include "core/Options.hpp"
#include "core/TurnQueue.hpp"
#include "debug/AuditLogger.hpp"

int main(int argc, char** argv)
{
    using namespace duel::core;

    try
    {
        std::optional<Config> const parsed = ParseArgs(argc, argv);
        if (!parsed)
        {
            Usage();
            return 0;
        }
        Config const& cfg = *parsed;
        Battle battle(cfg);

        std::unique_ptr<debug::AuditLogger> audit;
        if (cfg.audit_path)
        {
            audit = std::make_unique<debug::AuditLogger>(*cfg.audit_path);
            if (!audit->IsOpen())
            {
                DUEL_THROW(error::Code::Config, std::format("cannot open log '{}'", *cfg.audit_path));
            }
            audit->start(battle);
        }

        std::print("[duel] seed={} queue={}\n", cfg.seed, cfg.restricted ? "restricted" : "plain");
        std::print("[duel] {}\n", battle.Queue().Describe());

        while (!battle.IsOver())
        {
            CharacterSP const actor = battle.Queue().Peek();
            BattleSnapshot const before = battle.Snapshot();

            MoveOutcome const m = battle.Step();

            std::print("[duel] turn {:>3} {:<24} -> {}\n",
                       battle.Turn(), actor->Name(), battle.Queue().Describe());
            if (audit)
            {
                audit->turn(before, battle.LastAction());
                audit->outcome(m);
            }
        }

        CharacterSP const winner = battle.Winner();
        if (winner)
        {
            std::print("[duel] winner: {}\n", winner->Describe());
        }
        else
        {
            std::print("[duel] tie\n");
        }

        if (audit) { audit->end(battle); }
        return 0;
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print(stderr, "{}\n", e.to_str());
        Usage();
        return 1;
    }
}
