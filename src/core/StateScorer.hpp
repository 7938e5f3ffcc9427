//
// Created by Malik T on 22/08/2025.
//

#ifndef DUEL_STATESCORER_HPP
#define DUEL_STATESCORER_HPP

#include <cstddef>
#include "Types.hpp"

namespace duel::core
{
    // Size of a searched tree: states scored, and the deepest ply reached (root = 0).
    struct SearchStats
    {
        size_t nodes{};
        size_t depth{};
    };

    // Winner's HP if perspective won, its negation if the opponent won, 0 on a tie.
    auto TerminalScore(TurnQueue& queue, Character const& perspective) -> int;

    // Best score the front actor of queue can reach. queue is left untouched.
    auto ScoreState(TurnQueue const& queue, SearchStats* stats = nullptr) -> int;

    // Best score perspective can reach from queue; every branch runs on a clone.
    auto ScoreFor(CharacterSP const& perspective, TurnQueue& queue, SearchStats* stats = nullptr) -> int;
}

#endif //DUEL_STATESCORER_HPP
