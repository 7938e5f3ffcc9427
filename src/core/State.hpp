//
// Created by Malik T on 14/08/2025.
//

#ifndef DUEL_STATE_HPP
#define DUEL_STATE_HPP

#include <array>
#include <optional>
#include <string>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"

namespace duel::core
{
    struct ActorView
    {
        std::string name;
        Archetype archetype{};
        int hp{};
        int sp{};
    };

    // Value snapshot of a battle for logs and UI (owns nothing of the battle)
    struct BattleSnapshot
    {
        std::array<ActorView, 2> players{};
        std::optional<PlyrIdxT> front_seat{};
        std::vector<PlyrIdxT> ticket_seats;
        // empty unless the queue is restricted
        std::vector<bool> can_add;
        bool restricted{false};
        bool over{false};
        size_t turn{};
    };

} // namespace duel::core

#endif //DUEL_STATE_HPP
