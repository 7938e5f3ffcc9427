//
// Created by Malik T on 18/08/2025.
//

#include "RandomPlaystyle.hpp"

#include "Character.hpp"
#include "TurnQueue.hpp"

namespace duel::core
{
    RandomPlaystyle::RandomPlaystyle(TurnQueue& queue, uint64_t const rng_seed) :
        Playstyle(queue),
        rng_(static_cast<std::mt19937::result_type>(rng_seed)) {}

    auto RandomPlaystyle::SelectAction() -> Action
    {
        CharacterSP const actor = queue_->Peek();
        if (!actor) return Action::NoAction;

        ActionList const actions = actor->GetAvailableActions();
        if (actions.empty()) return Action::NoAction;

        return actions[pick(actions)];
    }
}
