#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "../core/Character.hpp"
#include "../core/Exception.hpp"
#include "../core/SkillDecisionTree.hpp"
#include "../core/Skills.hpp"
#include "../core/TurnQueue.hpp"

using namespace duel::core;

namespace
{
auto names(TurnQueue const& q) -> std::vector<std::string>
{
    std::vector<std::string> out;
    for (CharacterSP const& t : q.Tickets()) out.push_back(t->Name());
    return out;
}

struct Arena
{
    TurnQueueUP q{MakeTurnQueue(false)};
    CharacterSP caster;
    CharacterSP target;

    Arena(Archetype c, std::string cn, Archetype t, std::string tn)
    {
        caster = MakeCharacter(std::move(cn), c, *q);
        target = MakeCharacter(std::move(tn), t, *q);
        LinkEnemies(caster, target);
        q->Add(caster);
        q->Add(target);
    }
};
} // anonymous namespace

TEST(Character, Profiles_And_Available_Actions)
{
    Arena a{Archetype::Mage, "m", Archetype::Rogue, "r"};
    EXPECT_EQ(a.caster->Defense(), 8);
    EXPECT_EQ(a.target->Defense(), 10);
    EXPECT_EQ(a.caster->GetAvailableActions(), (ActionList{Action::Attack, Action::Special}));

    a.caster->SetSp(29);
    EXPECT_EQ(a.caster->GetAvailableActions(), (ActionList{Action::Attack}));
    a.caster->SetSp(4);
    EXPECT_TRUE(a.caster->GetAvailableActions().empty());

    a.caster->SetSp(-5);
    EXPECT_EQ(a.caster->Sp(), 0);
    a.caster->ApplyDamage(3);
    EXPECT_EQ(a.caster->Hp(), 100);
}

TEST(Character, Perform_Rejects_Unavailable_Action)
{
    Arena a{Archetype::Rogue, "r", Archetype::Mage, "m"};
    a.caster->SetSp(5);
    EXPECT_THROW(a.caster->SpecialAttack(), error::InvalidActionError);
    EXPECT_THROW(a.caster->Perform(Action::NoAction), error::InvalidActionError);
    EXPECT_EQ(a.caster->Sp(), 5);
    EXPECT_EQ(a.target->Hp(), 100);
}

TEST(Character, Copy_Keeps_Stats_But_Not_The_Enemy)
{
    Arena a{Archetype::Vampire, "v", Archetype::Rogue, "r"};
    a.caster->SetHp(42);
    TurnQueueUP other = MakeTurnQueue(false);
    CharacterSP const c = a.caster->Copy(*other);

    EXPECT_EQ(c->Describe(), "v (Vampire): 42/100");
    EXPECT_EQ(c->Enemy(), nullptr);
    EXPECT_EQ(&c->Queue(), other.get());
    EXPECT_NE(c, a.caster);
}

TEST(Skills, Mage_Special_Queues_Target_Then_Caster)
{
    Arena a{Archetype::Mage, "m", Archetype::Rogue, "r"};
    a.caster->SpecialAttack();
    EXPECT_EQ(a.caster->Sp(), 70);
    EXPECT_EQ(a.target->Hp(), 70);
    EXPECT_EQ(names(*a.q), (std::vector<std::string>{"m", "r", "r", "m"}));
}

TEST(Skills, Rogue_Special_Queues_Caster_Twice)
{
    Arena a{Archetype::Rogue, "r", Archetype::Mage, "m"};
    a.caster->SpecialAttack();
    EXPECT_EQ(a.caster->Sp(), 90);
    EXPECT_EQ(a.target->Hp(), 88);
    EXPECT_EQ(names(*a.q), (std::vector<std::string>{"r", "m", "r", "r"}));
}

TEST(Skills, Vampire_Drains_What_It_Deals)
{
    Arena a{Archetype::Vampire, "v", Archetype::Rogue, "r"};
    a.caster->Attack();
    EXPECT_EQ(a.caster->Sp(), 85);
    EXPECT_EQ(a.target->Hp(), 90);
    EXPECT_EQ(a.caster->Hp(), 110);

    Arena b{Archetype::Vampire, "v", Archetype::Rogue, "r"};
    b.caster->SpecialAttack();
    EXPECT_EQ(b.caster->Sp(), 80);
    EXPECT_EQ(b.target->Hp(), 80);
    EXPECT_EQ(b.caster->Hp(), 120);
    EXPECT_EQ(names(*b.q), (std::vector<std::string>{"v", "r", "v", "v", "r"}));

    // nothing to drain past zero
    Arena c{Archetype::Vampire, "v", Archetype::Rogue, "r"};
    c.target->SetHp(5);
    c.caster->Attack();
    EXPECT_EQ(c.target->Hp(), 0);
    EXPECT_EQ(c.caster->Hp(), 105);
}

TEST(Skills, Sorcerer_Special_Collapses_The_Queue)
{
    Arena a{Archetype::Sorcerer, "s", Archetype::Rogue, "r"};
    a.q->Add(a.target);
    a.q->Add(a.caster);
    a.q->Add(a.target);
    ASSERT_EQ(names(*a.q), (std::vector<std::string>{"s", "r", "r", "s", "r"}));

    a.caster->SpecialAttack();
    EXPECT_EQ(a.caster->Sp(), 80);
    EXPECT_EQ(a.target->Hp(), 85);
    EXPECT_EQ(names(*a.q), (std::vector<std::string>{"s", "r", "s"}));
}

TEST(Skills, Sorcerer_Attack_Follows_The_Tree)
{
    Arena a{Archetype::Sorcerer, "s", Archetype::Rogue, "r"};
    a.caster->Attack();
    // RogueSpecial picked, flat sorcerer cost charged
    EXPECT_EQ(a.caster->Sp(), 85);
    EXPECT_EQ(a.target->Hp(), 90);
    EXPECT_EQ(names(*a.q), (std::vector<std::string>{"s", "r", "s", "s"}));

    Arena b{Archetype::Sorcerer, "s", Archetype::Rogue, "r"};
    b.caster->SetSp(40);
    b.target->SetHp(50);
    b.target->SetSp(30);
    b.caster->Attack();
    // MageSpecial picked
    EXPECT_EQ(b.target->Hp(), 20);
    EXPECT_EQ(b.caster->Sp(), 25);
    EXPECT_EQ(names(*b.q), (std::vector<std::string>{"s", "r", "r", "s"}));
}

TEST(Skills, Sorcerer_Attack_Charges_Its_Own_Cost)
{
    Arena a{Archetype::Sorcerer, "s", Archetype::Rogue, "r"};
    a.caster->SetSkillDecisionTree(std::make_shared<SkillDecisionTree const>(
        RogueAttack(), [](Character const&, Character const&) { return true; }, 1));
    a.caster->Attack();
    EXPECT_EQ(a.caster->Sp(), 85);
    EXPECT_EQ(a.target->Hp(), 95);
}

TEST(Skills, Tree_Resolving_To_Sorcerer_Attack_Is_Rejected)
{
    Arena a{Archetype::Sorcerer, "s", Archetype::Rogue, "r"};
    a.caster->SetSkillDecisionTree(std::make_shared<SkillDecisionTree const>(
        SorcererAttack{DefaultSkillDecisionTree()}, [](Character const&, Character const&) { return false; }, 1));
    EXPECT_THROW(a.caster->Attack(), error::InvariantError);
}

TEST(Skills, Names_And_Costs)
{
    EXPECT_EQ(SkillName(MageAttack()), "MageAttack");
    EXPECT_EQ(SkillName(VampireSpecial{}), "VampireSpecial");
    EXPECT_EQ(SkillCost(RogueAttack()), 3);
    EXPECT_EQ(SkillCost(SorcererAttack{}), 15);
    EXPECT_EQ(SkillCost(MageSpecial{}), 30);
}
