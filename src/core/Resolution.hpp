//
// Created by Malik T on 15/08/2025.
//

#ifndef DUEL_RESOLUTION_HPP
#define DUEL_RESOLUTION_HPP

#include "Actions.hpp"
#include "Types.hpp"
#include "Exception.hpp"

namespace duel::core
{
    // Returns unexpected(reason) for choices the front actor cannot make (NOT exceptions).
    auto ValidateAction(TurnQueue& queue, Action a) -> error::ValidateResult;

    // Front actor performs a. Its ticket is consumed afterwards only if it can still
    // act; an exhausted actor's ticket is left for lazy cleaning.
    auto ApplyAction(TurnQueue& queue, Action a) -> void;

    // A clone of some queue with one action applied, plus the clone of the actor whose
    // point of view is being tracked.
    struct Simulation
    {
        TurnQueueUP queue;
        CharacterSP perspective;
        Action action{Action::NoAction};
    };

    // Never mutates source beyond its lazy cleaning.
    auto Simulate(TurnQueue& source, CharacterSP const& perspective, Action a) -> Simulation;
}

#endif //DUEL_RESOLUTION_HPP
