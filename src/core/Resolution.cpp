//
// Created by Malik T on 15/08/2025.
//

#include "Resolution.hpp"

#include <utility>

#include "Character.hpp"
#include "TurnQueue.hpp"

namespace
{
    inline auto Viol(duel::core::error::ActionViolationCode code) -> duel::core::error::ActionViolation
    {
        return duel::core::error::ActionViolation{ .code = code };
    }
}

namespace duel::core
{
    auto ValidateAction(TurnQueue& queue, Action const a) -> error::ValidateResult
    {
        using AVC = error::ActionViolationCode;

        if (queue.IsOver())
            return std::unexpected(Viol(AVC::Battle_Over).with_action(a));

        CharacterSP const actor = queue.Peek();
        if (!actor)
            return std::unexpected(Viol(AVC::Battle_NoActor).with_action(a));

        if (a == Action::NoAction)
            return std::unexpected(Viol(AVC::Action_NoneSelected).with_actor(actor->Name()));

        if (!actor->CanPerform(a))
            return std::unexpected(Viol(AVC::Action_Unavailable)
                                   .with_actor(actor->Name())
                                   .with_action(a)
                                   .with_sp(actor->Sp()));
        return {};
    }

    auto ApplyAction(TurnQueue& queue, Action const a) -> void
    {
        CharacterSP const actor = queue.Peek();
        DUEL_ASSERT(actor != nullptr, "Applying an action on a queue that never had players");

        actor->Perform(a);

        if (!actor->GetAvailableActions().empty())
        {
            queue.Remove();
        }
    }

    auto Simulate(TurnQueue& source, CharacterSP const& perspective, Action const a) -> Simulation
    {
        CharacterSP const front = source.Peek();

        Simulation sim{ .queue = source.Copy(), .perspective = nullptr, .action = a };
        // clones are new objects, so identity has to be re-derived through the front
        CharacterSP const actor = sim.queue->Peek();
        DUEL_ASSERT(actor != nullptr, "Simulating on a queue that never had players");
        sim.perspective = (perspective == front) ? actor : actor->Enemy();

        ApplyAction(*sim.queue, a);
        return sim;
    }
}
