#include <gtest/gtest.h>
#include <functional>
#include <vector>

#include "../core/Character.hpp"
#include "../core/SkillDecisionTree.hpp"
#include "../core/TurnQueue.hpp"

using namespace duel::core;

namespace
{
auto always(Character const&, Character const&) -> bool { return true; }
auto never(Character const&, Character const&) -> bool { return false; }

auto preorder(SkillDecisionTree const& node, std::vector<int>& out) -> void
{
    out.push_back(node.Priority());
    for (SkillDecisionTree const& c : node.Children()) preorder(c, out);
}

auto priorities(std::vector<SkillDecisionTree const*> const& nodes) -> std::vector<int>
{
    std::vector<int> out;
    for (auto const* n : nodes) out.push_back(n->Priority());
    return out;
}

struct Pair
{
    TurnQueueUP q{MakeTurnQueue(false)};
    CharacterSP s{MakeCharacter("s", Archetype::Sorcerer, *q)};
    CharacterSP r{MakeCharacter("r", Archetype::Rogue, *q)};
};
} // anonymous namespace

TEST(SkillDecisionTree, Default_Tree_Shape)
{
    SkillDecisionTree const tree = MakeDefaultSkillDecisionTree();
    std::vector<int> order;
    preorder(tree, order);
    EXPECT_EQ(order, (std::vector<int>{5, 3, 4, 6, 2, 8, 1, 7}));
    EXPECT_EQ(DefaultSkillDecisionTree(), DefaultSkillDecisionTree());
}

TEST(SkillDecisionTree, Fresh_Actors_Pick_Priority_Four)
{
    Pair p;
    SkillDecisionTree const tree = MakeDefaultSkillDecisionTree();
    EXPECT_EQ(priorities(tree.GetCandidates(*p.s, *p.r)), (std::vector<int>{4, 8, 7}));

    auto const pick = tree.PickSkill(*p.s, *p.r);
    ASSERT_TRUE(pick.has_value());
    EXPECT_EQ(SkillName(*pick), "RogueSpecial");
}

TEST(SkillDecisionTree, Wounded_Target_Descends_To_Leaf)
{
    Pair p;
    p.r->SetHp(20);
    SkillDecisionTree const tree = MakeDefaultSkillDecisionTree();
    EXPECT_EQ(priorities(tree.GetCandidates(*p.s, *p.r)), (std::vector<int>{6, 8, 7}));
    EXPECT_EQ(SkillName(*tree.PickSkill(*p.s, *p.r)), "RogueAttack");
}

TEST(SkillDecisionTree, False_Condition_Selects_The_Node_Itself)
{
    Pair p;
    p.s->SetHp(40);
    SkillDecisionTree const tree = MakeDefaultSkillDecisionTree();
    EXPECT_EQ(priorities(tree.GetCandidates(*p.s, *p.r)), (std::vector<int>{5}));
    EXPECT_EQ(SkillName(*tree.PickSkill(*p.s, *p.r)), "MageAttack");
}

TEST(SkillDecisionTree, Smaller_Priority_Wins)
{
    Pair p;
    SkillDecisionTree const tree{
        VampireAttack{}, always, 10,
        {SkillDecisionTree{RogueSpecial{}, never, 7}, SkillDecisionTree{MageAttack(), never, 3}}
    };
    EXPECT_EQ(SkillName(*tree.PickSkill(*p.s, *p.r)), "MageAttack");

    // the gating node never competes once its condition holds
    SkillDecisionTree const gate{MageSpecial{}, always, 1, {SkillDecisionTree{RogueAttack(), always, 9}}};
    EXPECT_EQ(SkillName(*gate.PickSkill(*p.s, *p.r)), "RogueAttack");
}

TEST(SkillDecisionTree, Leaf_Is_Always_A_Candidate)
{
    Pair p;
    SkillDecisionTree const leaf{VampireSpecial{}, always, 4};
    EXPECT_TRUE(leaf.IsLeaf());
    EXPECT_EQ(priorities(leaf.GetCandidates(*p.s, *p.r)), (std::vector<int>{4}));
}
