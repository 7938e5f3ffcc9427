//
// Created by Malik T on 19/08/2025.
//

#ifndef DUEL_INVARIANTS_HPP
#define DUEL_INVARIANTS_HPP

#include "../core/TurnQueue.hpp"
#include "../core/Character.hpp"
#include <cassert>
#include <cstddef>

namespace duel::core::debug
{
    // A second layer of checks over a queue and both of its players. Used by the
    // self-play tests after every step.
    inline auto CheckInvariants(TurnQueue const& q) -> void
    {
#if DUEL_ENABLE_TEST_HOOKS == false
        (void)q;
#else
        CharacterSP const& p1 = q.Player1();
        CharacterSP const& p2 = q.Player2();

        // 1) Players are fixed once anyone has been queued, and are mutual enemies
        if (!q.Tickets().empty())
        {
            assert(p1 && "Tickets without a captured player1");
        }
        if (p1 && p2)
        {
            assert(p1->Enemy() == p2 && p2->Enemy() == p1 && "Players are not linked as enemies");
            assert(&p1->Queue() == &q && &p2->Queue() == &q && "Player bound to a foreign queue");
        }

        // 2) Every ticket names one of the two players
        for (auto const& t : q.Tickets())
        {
            assert((t == p1 || t == p2) && "Ticket for an actor outside the battle");
        }

        // 3) Resources never go negative
        for (auto const* p : {p1.get(), p2.get()})
        {
            if (!p) continue;
            assert(p->Hp() >= 0 && p->Sp() >= 0 && "Negative hp/sp");
        }

        // 4) Restricted: permission table parallel to tickets, at most two eligible per actor
        if (auto const* r = dynamic_cast<RestrictedTurnQueue const*>(&q))
        {
            assert(r->Permissions().size() == r->Tickets().size() && "Permission table misaligned");
            for (auto const* p : {&p1, &p2})
            {
                if (!*p) continue;
                assert(r->AddAbilityCount(*p) <= constants::MaxEligibleCopies
                    && "Actor holds too many eligible tickets");
            }
        }
#endif // DUEL_ENABLE_TEST_HOOKS == true
    }
}
#endif //DUEL_INVARIANTS_HPP
