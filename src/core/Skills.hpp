//
// Created by Malik T on 15/08/2025.
//

#ifndef DUEL_SKILLS_HPP
#define DUEL_SKILLS_HPP

#include <memory>
#include <string_view>
#include <variant>
#include "Types.hpp"

namespace duel::core
{
    //forward declaration
    class SkillDecisionTree;
    using SkillDecisionTreeCSP = std::shared_ptr<SkillDecisionTree const>;

    // Damage, then the caster re-queues itself once.
    struct NormalAttack
    {
        std::string_view name;
        int cost;
        int damage;
    };
    inline constexpr auto MageAttack() -> NormalAttack { return {"MageAttack", 5, 20}; }
    inline constexpr auto RogueAttack() -> NormalAttack { return {"RogueAttack", 3, 15}; }

    // Damage, then target and caster are queued.
    struct MageSpecial
    {
        static constexpr int cost = 30;
        static constexpr int damage = 40;
    };

    // Damage, then the caster is queued twice.
    struct RogueSpecial
    {
        static constexpr int cost = 10;
        static constexpr int damage = 20;
    };

    // Caster heals by the HP the target actually lost.
    struct VampireAttack
    {
        static constexpr int cost = 15;
        static constexpr int damage = 20;
    };

    struct VampireSpecial
    {
        static constexpr int cost = 20;
        static constexpr int damage = 30;
    };

    // Resolves to whatever the decision tree picks; always charges its own cost.
    struct SorcererAttack
    {
        static constexpr int cost = 15;
        SkillDecisionTreeCSP tree;
    };

    // Collapses the queue to one ticket per actor, queues the caster, then hits.
    struct SorcererSpecial
    {
        static constexpr int cost = 20;
        static constexpr int damage = 25;
    };

    using Skill = std::variant<
        NormalAttack, MageSpecial, RogueSpecial, VampireAttack,
        VampireSpecial, SorcererAttack, SorcererSpecial>;

    [[nodiscard]] auto SkillCost(Skill const& skill) -> int;
    [[nodiscard]] auto SkillName(Skill const& skill) -> std::string_view;

    // Makes caster use skill on target; queue side effects go to caster's queue.
    auto UseSkill(Skill const& skill, Character& caster, Character& target) -> void;
}

#endif //DUEL_SKILLS_HPP
