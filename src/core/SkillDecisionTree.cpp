//
// Created by Malik T on 22/08/2025.
//

#include "SkillDecisionTree.hpp"

#include <algorithm>
#include <utility>

#include "Character.hpp"
#include "Exception.hpp"

namespace
{
    using duel::core::Character;

    auto Never(Character const&, Character const&) -> bool { return false; }
    auto TargetHpBelow30(Character const&, Character const& target) -> bool { return target.Hp() < 30; }
    auto CasterSpAbove20(Character const& caster, Character const&) -> bool { return caster.Sp() > 20; }
    auto TargetSpAbove40(Character const&, Character const& target) -> bool { return target.Sp() > 40; }
    auto CasterHpAbove90(Character const& caster, Character const&) -> bool { return caster.Hp() > 90; }
    auto CasterHpAbove50(Character const& caster, Character const&) -> bool { return caster.Hp() > 50; }
}

namespace duel::core
{
    SkillDecisionTree::SkillDecisionTree(Skill skill,
                                         SkillCondition condition,
                                         int const priority,
                                         std::vector<SkillDecisionTree> children) :
        skill_(std::move(skill)),
        condition_(std::move(condition)),
        priority_(priority),
        children_(std::move(children))
    {
        DUEL_ASSERT(static_cast<bool>(condition_), "Decision tree node without a condition");
    }

    auto SkillDecisionTree::CollectCandidates(Character const& caster, Character const& target,
                                              std::vector<SkillDecisionTree const*>& out) const -> void
    {
        if (IsLeaf() || !condition_(caster, target))
        {
            out.push_back(this);
            return;
        }
        for (SkillDecisionTree const& child : children_)
        {
            child.CollectCandidates(caster, target, out);
        }
    }

    auto SkillDecisionTree::GetCandidates(Character const& caster, Character const& target) const
        -> std::vector<SkillDecisionTree const*>
    {
        std::vector<SkillDecisionTree const*> out;
        CollectCandidates(caster, target, out);
        return out;
    }

    auto SkillDecisionTree::PickSkill(Character const& caster, Character const& target) const
        -> std::optional<Skill>
    {
        std::vector<SkillDecisionTree const*> const candidates = GetCandidates(caster, target);
        if (candidates.empty()) return std::nullopt;

        // min_element keeps the first of equal priorities
        auto const best = std::ranges::min_element(candidates, {},
                                                   [](SkillDecisionTree const* n) { return n->Priority(); });
        return (*best)->Value();
    }

    auto MakeDefaultSkillDecisionTree() -> SkillDecisionTree
    {
        SkillDecisionTree sdt6{RogueAttack(), Never, 6};
        SkillDecisionTree sdt4{RogueSpecial{}, TargetHpBelow30, 4, {std::move(sdt6)}};
        SkillDecisionTree sdt3{MageAttack(), CasterSpAbove20, 3, {std::move(sdt4)}};

        SkillDecisionTree sdt8{RogueAttack(), Never, 8};
        SkillDecisionTree sdt2{MageSpecial{}, TargetSpAbove40, 2, {std::move(sdt8)}};

        SkillDecisionTree sdt7{RogueSpecial{}, Never, 7};
        SkillDecisionTree sdt1{RogueAttack(), CasterHpAbove90, 1, {std::move(sdt7)}};

        return SkillDecisionTree{MageAttack(), CasterHpAbove50, 5,
                                 {std::move(sdt3), std::move(sdt2), std::move(sdt1)}};
    }

    auto DefaultSkillDecisionTree() -> SkillDecisionTreeCSP
    {
        static SkillDecisionTreeCSP const tree =
            std::make_shared<SkillDecisionTree const>(MakeDefaultSkillDecisionTree());
        return tree;
    }
}
