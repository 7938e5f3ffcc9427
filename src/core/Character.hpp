//
// Created by Malik T on 15/08/2025.
//

#ifndef DUEL_CHARACTER_HPP
#define DUEL_CHARACTER_HPP

#include <memory>
#include <string>
#include "Types.hpp"
#include "Actions.hpp"
#include "Skills.hpp"

namespace duel::core
{
    struct ArchetypeProfile
    {
        int   defense;
        Skill attack;
        Skill special;
    };

    [[nodiscard]] auto ProfileFor(Archetype archetype) -> ArchetypeProfile;

    // One combatant. Identity is the object itself: two characters with equal stats
    // are still different actors as far as the queues are concerned.
    class Character : public std::enable_shared_from_this<Character>
    {
    public:
        Character() = delete;
        Character(std::string name, Archetype archetype, TurnQueue& queue);

        Character(Character const&) = delete;
        auto operator=(Character const&) -> Character& = delete;

        auto Name() const noexcept -> std::string const& { return name_; }
        auto Kind() const noexcept -> Archetype { return archetype_; }
        auto Hp() const noexcept -> int { return hp_; }
        auto Sp() const noexcept -> int { return sp_; }
        auto Defense() const noexcept -> int { return defense_; }

        auto SetHp(int hp) -> void;
        auto SetSp(int sp) -> void;
        // Loses max(0, damage - defense) HP, never going below 0.
        auto ApplyDamage(int damage) -> void;
        auto ReduceSp(int cost) -> void;

        auto Queue() const noexcept -> TurnQueue& { return *queue_; }
        auto Enemy() const -> CharacterSP { return enemy_.lock(); }
        auto SetEnemy(CharacterSP const& enemy) -> void { enemy_ = enemy; }

        // Attack first, then Special; empty once SP runs out.
        auto GetAvailableActions() const -> ActionList;
        auto CanPerform(Action a) const -> bool;

        auto Attack() -> void;
        auto SpecialAttack() -> void;
        // Throws InvalidAction if a is unavailable or no enemy is linked.
        auto Perform(Action a) -> void;

        auto AttackSkill() const noexcept -> Skill const& { return attack_; }
        auto SpecialSkill() const noexcept -> Skill const& { return special_; }
        // Sorcerers only.
        auto SetSkillDecisionTree(SkillDecisionTreeCSP tree) -> void;

        // Independent clone bound to queue; the enemy link is left for the caller.
        auto Copy(TurnQueue& queue) const -> CharacterSP;

        // "name (Archetype): hp/sp"
        auto Describe() const -> std::string;

    private:
        std::string name_;
        Archetype archetype_;
        int hp_{constants::StartingHp};
        int sp_{constants::StartingSp};
        int defense_;
        Skill attack_;
        Skill special_;

        TurnQueue* queue_;   // non-owning, the queue outlives its characters' turns
        CharacterWP enemy_;  // non-owning back-reference
    };

    auto MakeCharacter(std::string name, Archetype archetype, TurnQueue& queue) -> CharacterSP;
    // Sets both sides of the enemy relation.
    auto LinkEnemies(CharacterSP const& a, CharacterSP const& b) -> void;
}

#endif //DUEL_CHARACTER_HPP
