//
// Created by Malik T on 14/08/2025.
//

#ifndef DUEL_ACTIONS_HPP
#define DUEL_ACTIONS_HPP

#include "Types.hpp"

namespace duel::core
{
    // Enumeration order is also the tie-break order used by the searches.
    enum class Action : uint8_t
    {
        Attack,
        Special,
        NoAction
    };

    using ActionList = std::vector<Action>;

    enum class MoveOutcome : uint8_t
    {
        Invalid,
        Applied,
        GameEnded
    };
} // namespace duel::core

#endif //DUEL_ACTIONS_HPP
