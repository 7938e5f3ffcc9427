//
// Created by Malik T on 22/08/2025.
//

#ifndef DUEL_SKILLDECISIONTREE_HPP
#define DUEL_SKILLDECISIONTREE_HPP

#include <functional>
#include <optional>
#include <vector>
#include "Types.hpp"
#include "Skills.hpp"

namespace duel::core
{
    using SkillCondition = std::function<bool(Character const& caster, Character const& target)>;

    // Conditions gate descent, not selection: a node whose condition holds hands the
    // decision to its children, so its own skill is only reachable when the condition
    // fails or the node is a leaf. Among the reachable nodes the smallest priority wins.
    class SkillDecisionTree
    {
    public:
        SkillDecisionTree(Skill skill,
                          SkillCondition condition,
                          int priority,
                          std::vector<SkillDecisionTree> children = {});

        auto PickSkill(Character const& caster, Character const& target) const -> std::optional<Skill>;
        auto GetCandidates(Character const& caster, Character const& target) const
            -> std::vector<SkillDecisionTree const*>;

        auto Value() const noexcept -> Skill const& { return skill_; }
        auto Priority() const noexcept -> int { return priority_; }
        auto Children() const noexcept -> std::vector<SkillDecisionTree> const& { return children_; }
        auto IsLeaf() const noexcept -> bool { return children_.empty(); }

    private:
        auto CollectCandidates(Character const& caster, Character const& target,
                               std::vector<SkillDecisionTree const*>& out) const -> void;

    private:
        Skill skill_;
        SkillCondition condition_;
        int priority_;
        std::vector<SkillDecisionTree> children_;
    };

    // Preorder priorities 5, 3, 4, 6, 2, 8, 1, 7.
    auto MakeDefaultSkillDecisionTree() -> SkillDecisionTree;
    // Shared instance of the default tree, built on first use.
    auto DefaultSkillDecisionTree() -> SkillDecisionTreeCSP;
}

#endif //DUEL_SKILLDECISIONTREE_HPP
