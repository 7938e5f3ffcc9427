//
// Created by Malik T on 22/08/2025.
//

#include "StateScorer.hpp"

#include <algorithm>
#include <format>
#include <limits>

#include "Character.hpp"
#include "Exception.hpp"
#include "Resolution.hpp"
#include "TurnQueue.hpp"

namespace
{
    using namespace duel::core;

    auto ScoreAt(CharacterSP const& perspective, TurnQueue& queue, SearchStats* stats, size_t const ply) -> int
    {
        if (stats)
        {
            ++stats->nodes;
            stats->depth = std::max(stats->depth, ply);
        }

        if (queue.IsOver()) return TerminalScore(queue, *perspective);

        CharacterSP const front = queue.Peek();
        ActionList const actions = front->GetAvailableActions();
        if (actions.empty())
            DUEL_THROW(error::Code::InvariantViolation,
                       std::format("{} is at the front of a running battle with no actions", front->Name()));

        // zero-sum: the opponent's view is the negation by construction of the terminal rule
        int best = std::numeric_limits<int>::min();
        for (Action const a : actions)
        {
            Simulation sim = Simulate(queue, perspective, a);
            best = std::max(best, ScoreAt(sim.perspective, *sim.queue, stats, ply + 1));
        }
        return best;
    }
}

namespace duel::core
{
    auto TerminalScore(TurnQueue& queue, Character const& perspective) -> int
    {
        CharacterSP const winner = queue.Winner();
        if (!winner) return 0;
        return winner.get() == &perspective ? winner->Hp() : -winner->Hp();
    }

    auto ScoreState(TurnQueue const& queue, SearchStats* const stats) -> int
    {
        TurnQueueUP const copy = queue.Copy();
        CharacterSP const player = copy->Peek();
        DUEL_ASSERT(player != nullptr, "Scoring a queue that never had players");
        return ScoreFor(player, *copy, stats);
    }

    auto ScoreFor(CharacterSP const& perspective, TurnQueue& queue, SearchStats* const stats) -> int
    {
        return ScoreAt(perspective, queue, stats, 0);
    }
}
