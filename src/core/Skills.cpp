//
// Created by Malik T on 15/08/2025.
//

#include "Skills.hpp"

#include <algorithm>
#include <optional>
#include <type_traits>
#include <vector>

#include "Character.hpp"
#include "Exception.hpp"
#include "SkillDecisionTree.hpp"
#include "TurnQueue.hpp"

namespace
{
    using duel::core::Character;

    inline auto DealDamage(Character& caster, Character& target, int const cost, int const damage) -> void
    {
        caster.ReduceSp(cost);
        target.ApplyDamage(damage);
    }

    // Caster gains exactly what the target lost.
    inline auto DrainLife(Character& caster, Character& target, int const cost, int const damage) -> void
    {
        int const before = target.Hp();
        DealDamage(caster, target, cost, damage);
        caster.SetHp(caster.Hp() + before - target.Hp());
    }
}

namespace duel::core
{
    auto SkillCost(Skill const& skill) -> int
    {
        return std::visit([]<typename T0>(T0 const& s) -> int
        {
            return s.cost;
        }, skill);
    }

    auto SkillName(Skill const& skill) -> std::string_view
    {
        return std::visit([]<typename T0>(T0 const& s) -> std::string_view
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, NormalAttack>) return s.name;
            else if constexpr (std::is_same_v<T, MageSpecial>) return "MageSpecial";
            else if constexpr (std::is_same_v<T, RogueSpecial>) return "RogueSpecial";
            else if constexpr (std::is_same_v<T, VampireAttack>) return "VampireAttack";
            else if constexpr (std::is_same_v<T, VampireSpecial>) return "VampireSpecial";
            else if constexpr (std::is_same_v<T, SorcererAttack>) return "SorcererAttack";
            else return "SorcererSpecial";
        }, skill);
    }

    auto UseSkill(Skill const& skill, Character& caster, Character& target) -> void
    {
        TurnQueue& queue = caster.Queue();
        CharacterSP const self = caster.shared_from_this();

        std::visit([&]<typename T0>(T0 const& s)
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, NormalAttack>)
            {
                DealDamage(caster, target, s.cost, s.damage);
                queue.Add(self);
            }
            else if constexpr (std::is_same_v<T, MageSpecial>)
            {
                DealDamage(caster, target, s.cost, s.damage);
                queue.Add(target.shared_from_this());
                queue.Add(self);
            }
            else if constexpr (std::is_same_v<T, RogueSpecial>)
            {
                DealDamage(caster, target, s.cost, s.damage);
                queue.Add(self);
                queue.Add(self);
            }
            else if constexpr (std::is_same_v<T, VampireAttack>)
            {
                DrainLife(caster, target, s.cost, s.damage);
                queue.Add(self);
            }
            else if constexpr (std::is_same_v<T, VampireSpecial>)
            {
                DrainLife(caster, target, s.cost, s.damage);
                queue.Add(self);
                queue.Add(self);
                queue.Add(target.shared_from_this());
            }
            else if constexpr (std::is_same_v<T, SorcererAttack>)
            {
                DUEL_ASSERT(s.tree != nullptr, "Sorcerer attack without a decision tree");
                int const sp_before = caster.Sp();

                if (std::optional<Skill> const chosen = s.tree->PickSkill(caster, target))
                {
                    if (std::holds_alternative<SorcererAttack>(*chosen))
                        DUEL_THROW(error::Code::InvariantViolation, "Decision tree resolved to a sorcerer attack");
                    UseSkill(*chosen, caster, target);
                }
                // flat cost whatever the tree picked
                caster.SetSp(sp_before - s.cost);
            }
            else
            {
                std::vector<CharacterSP> order;
                while (!queue.IsEmpty())
                {
                    CharacterSP c = queue.Remove();
                    if (std::ranges::find(order, c) == std::end(order)) order.push_back(std::move(c));
                }
                for (CharacterSP const& c : order) queue.Add(c);
                queue.Add(self);

                DealDamage(caster, target, s.cost, s.damage);
            }
        }, skill);
    }
}
