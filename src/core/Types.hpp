//
// Created by Malik T on 14/08/2025.
//

#ifndef DUEL_TYPES_HPP
#define DUEL_TYPES_HPP

#define DUEL_ENABLE_TEST_HOOKS true

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace duel::core::constants
{
    inline constexpr int StartingHp = 100;
    inline constexpr int StartingSp = 100;
    // restricted queue: eligible tickets one actor may hold at once
    inline constexpr size_t MaxEligibleCopies = 2;
}

namespace duel::core
{
    class Character;
    class TurnQueue;

    using CharacterSP = std::shared_ptr<Character>;
    using CharacterWP = std::weak_ptr<Character>;

    using TurnQueueUP = std::unique_ptr<TurnQueue>;

    enum class Archetype : uint8_t
    {
        Rogue = 0,
        Mage,
        Vampire,
        Sorcerer
    };

    enum class PlaystyleKind : uint8_t
    {
        Random = 0,
        MinimaxRecursive,
        MinimaxIterative
    };

    using PlyrIdxT = uint8_t;

    struct ActorSetup
    {
        std::string   name{};
        Archetype     archetype{Archetype::Rogue};
        PlaystyleKind playstyle{PlaystyleKind::Random};
        int           hp{constants::StartingHp};
        int           sp{constants::StartingSp};
    };

    struct Config
    {
        std::array<ActorSetup, 2> actors{
            ActorSetup{.name = "p1", .archetype = Archetype::Rogue},
            ActorSetup{.name = "p2", .archetype = Archetype::Mage}
        };
        // true = RestrictedTurnQueue, false = plain TurnQueue
        bool     restricted{false};
        uint64_t seed{std::random_device{}()};
        std::optional<std::string> audit_path{};
    };
}

#endif //DUEL_TYPES_HPP
