//
// Created by Malik T on 15/08/2025.
//

#include "Character.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include "Exception.hpp"
#include "SkillDecisionTree.hpp"
#include "TurnQueue.hpp"
#include "Util.hpp"

namespace duel::core
{
    auto ProfileFor(Archetype const archetype) -> ArchetypeProfile
    {
        switch (archetype)
        {
        case Archetype::Rogue: return {10, RogueAttack(), RogueSpecial{}};
        case Archetype::Mage: return {8, MageAttack(), MageSpecial{}};
        case Archetype::Vampire: return {3, VampireAttack{}, VampireSpecial{}};
        case Archetype::Sorcerer: return {10, SorcererAttack{DefaultSkillDecisionTree()}, SorcererSpecial{}};
        }
        DUEL_THROW(error::Code::Unknown, "Unknown archetype");
    }

    Character::Character(std::string name, Archetype const archetype, TurnQueue& queue) :
        name_(std::move(name)),
        archetype_(archetype),
        defense_(0),
        attack_(RogueAttack()),
        special_(RogueSpecial{}),
        queue_(&queue)
    {
        ArchetypeProfile profile = ProfileFor(archetype_);
        defense_ = profile.defense;
        attack_ = std::move(profile.attack);
        special_ = std::move(profile.special);
    }

    auto Character::SetHp(int const hp) -> void
    {
        hp_ = std::max(0, hp);
    }

    auto Character::SetSp(int const sp) -> void
    {
        sp_ = std::max(0, sp);
    }

    auto Character::ApplyDamage(int const damage) -> void
    {
        SetHp(hp_ - std::max(0, damage - defense_));
    }

    auto Character::ReduceSp(int const cost) -> void
    {
        SetSp(sp_ - cost);
    }

    auto Character::GetAvailableActions() const -> ActionList
    {
        ActionList actions;
        if (sp_ >= SkillCost(attack_)) actions.push_back(Action::Attack);
        if (sp_ >= SkillCost(special_)) actions.push_back(Action::Special);
        return actions;
    }

    auto Character::CanPerform(Action const a) const -> bool
    {
        ActionList const actions = GetAvailableActions();
        return util::contains(std::span<Action const>{actions}, a);
    }

    auto Character::Attack() -> void
    {
        Perform(Action::Attack);
    }

    auto Character::SpecialAttack() -> void
    {
        Perform(Action::Special);
    }

    auto Character::Perform(Action const a) -> void
    {
        if (!CanPerform(a))
            DUEL_THROW(error::Code::InvalidAction,
                       std::format("{} cannot perform '{}' with {} SP", name_, util::ToChar(a), sp_));

        CharacterSP const target = Enemy();
        if (!target)
            DUEL_THROW(error::Code::InvalidAction, std::format("{} has no enemy to act on", name_));

        UseSkill(a == Action::Attack ? attack_ : special_, *this, *target);
    }

    auto Character::SetSkillDecisionTree(SkillDecisionTreeCSP tree) -> void
    {
        DUEL_ASSERT(archetype_ == Archetype::Sorcerer, "Only sorcerers attack through a decision tree");
        DUEL_ASSERT(tree != nullptr, "Null decision tree");
        attack_ = SorcererAttack{std::move(tree)};
    }

    auto Character::Copy(TurnQueue& queue) const -> CharacterSP
    {
        auto clone = std::make_shared<Character>(name_, archetype_, queue);
        clone->hp_ = hp_;
        clone->sp_ = sp_;
        clone->attack_ = attack_;
        clone->special_ = special_;
        return clone;
    }

    auto Character::Describe() const -> std::string
    {
        return std::format("{} ({}): {}/{}", name_, util::to_string(archetype_), hp_, sp_);
    }

    auto MakeCharacter(std::string name, Archetype const archetype, TurnQueue& queue) -> CharacterSP
    {
        return std::make_shared<Character>(std::move(name), archetype, queue);
    }

    auto LinkEnemies(CharacterSP const& a, CharacterSP const& b) -> void
    {
        DUEL_ASSERT(a && b, "Cannot link a null character");
        DUEL_ASSERT(a != b, "A character cannot be its own enemy");
        a->SetEnemy(b);
        b->SetEnemy(a);
    }
}
