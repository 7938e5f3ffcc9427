//
// Created by Malik T on 15/08/2025.
//

#include "TurnQueue.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include "Character.hpp"
#include "Exception.hpp"

namespace duel::core
{
    auto TurnQueue::CapturePlayers(CharacterSP const& actor) -> void
    {
        if (!p1_)
        {
            p1_ = actor;
            p2_ = actor->Enemy();
            return;
        }
        // enemy was not linked yet when player1 arrived
        if (!p2_ && actor != p1_) p2_ = actor;
    }

    auto TurnQueue::Holds(CharacterSP const& actor) const -> bool
    {
        return std::ranges::find(tickets_, actor) != std::cend(tickets_);
    }

    auto TurnQueue::Add(CharacterSP const& actor) -> void
    {
        DUEL_ASSERT(actor != nullptr, "Null actor added to turn queue");
        tickets_.push_back(actor);
        CapturePlayers(actor);
    }

    auto TurnQueue::Clean() -> void
    {
        while (!tickets_.empty() && tickets_.front()->GetAvailableActions().empty())
        {
            tickets_.pop_front();
        }
    }

    auto TurnQueue::Remove() -> CharacterSP
    {
        Clean();
        if (tickets_.empty())
            DUEL_THROW(error::Code::EmptyQueue, "Remove from a turn queue without live tickets");

        CharacterSP front = std::move(tickets_.front());
        tickets_.pop_front();
        return front;
    }

    auto TurnQueue::Peek() -> CharacterSP
    {
        Clean();
        return tickets_.empty() ? p1_ : tickets_.front();
    }

    auto TurnQueue::IsEmpty() -> bool
    {
        Clean();
        return tickets_.empty();
    }

    auto TurnQueue::IsOver() -> bool
    {
        if (IsEmpty()) return true;
        return (p1_ && p1_->Hp() == 0) || (p2_ && p2_->Hp() == 0);
    }

    auto TurnQueue::Winner() -> CharacterSP
    {
        if (!IsOver() || !p1_ || !p2_) return nullptr;

        bool const p1_down = p1_->Hp() == 0;
        bool const p2_down = p2_->Hp() == 0;
        if (p1_down == p2_down) return nullptr;
        return p1_down ? p2_ : p1_;
    }

    auto TurnQueue::MakeEmpty() const -> TurnQueueUP
    {
        return std::make_unique<TurnQueue>();
    }

    auto TurnQueue::Copy() const -> TurnQueueUP
    {
        TurnQueueUP copy = MakeEmpty();
        if (!p1_) return copy;

        CharacterSP const p1 = p1_->Copy(*copy);
        CharacterSP const p2 = p2_ ? p2_->Copy(*copy) : nullptr;
        if (p2) LinkEnemies(p1, p2);

        // fixes the pairing on the copy without leaving a ticket behind
        copy->Add(p1);
        if (!copy->IsEmpty()) copy->Remove();

        for (CharacterSP const& t : tickets_)
        {
            if (t == p1_) copy->Add(p1);
            else if (p2 && t == p2_) copy->Add(p2);
            else DUEL_THROW(error::Code::InvariantViolation,
                            std::format("Ticket for {} belongs to neither player", t->Name()));
        }
        return copy;
    }

    auto TurnQueue::Describe() const -> std::string
    {
        std::string out;
        for (size_t i{}; i < tickets_.size(); ++i)
        {
            out += (i ? " -> " : "");
            out += tickets_[i]->Describe();
        }
        return out;
    }

    auto RestrictedTurnQueue::Push(CharacterSP const& actor, bool const can_add) -> void
    {
        tickets_.push_back(actor);
        permissions_.push_back(can_add);
    }

    auto RestrictedTurnQueue::Add(CharacterSP const& actor) -> void
    {
        DUEL_ASSERT(actor != nullptr, "Null actor added to turn queue");
        CapturePlayers(actor);

        if (!Holds(actor))
        {
            Push(actor, true);
            return;
        }

        if (permissions_.size() != tickets_.size())
            DUEL_THROW(error::Code::InvariantViolation,
                       std::format("Permission table ({}) misaligned with tickets ({})",
                                   permissions_.size(), tickets_.size()));

        // only an eligible front ticket may enqueue; anything else is dropped
        if (!permissions_.front()) return;

        if (tickets_.front() == actor)
        {
            Push(actor, AddAbilityCount(actor) < constants::MaxEligibleCopies);
        }
        else
        {
            Push(actor, false);
        }
    }

    auto RestrictedTurnQueue::AddAbilityCount(CharacterSP const& actor) const -> size_t
    {
        size_t count{};
        size_t const n = std::min(tickets_.size(), permissions_.size());
        for (size_t i{}; i < n; ++i)
        {
            if (tickets_[i] == actor && permissions_[i]) ++count;
        }
        return count;
    }

    auto RestrictedTurnQueue::Clean() -> void
    {
        TurnQueue::Clean();

        if (permissions_.size() < tickets_.size())
            DUEL_THROW(error::Code::InvariantViolation,
                       std::format("Permission table ({}) shorter than tickets ({})",
                                   permissions_.size(), tickets_.size()));

        while (permissions_.size() > tickets_.size())
        {
            permissions_.pop_front();
        }
    }

    auto RestrictedTurnQueue::Remove() -> CharacterSP
    {
        Clean();
        if (tickets_.empty())
            DUEL_THROW(error::Code::EmptyQueue, "Remove from a turn queue without live tickets");

        permissions_.pop_front();
        CharacterSP front = std::move(tickets_.front());
        tickets_.pop_front();
        return front;
    }

    auto RestrictedTurnQueue::MakeEmpty() const -> TurnQueueUP
    {
        return std::make_unique<RestrictedTurnQueue>();
    }

    auto MakeTurnQueue(bool const restricted) -> TurnQueueUP
    {
        if (restricted) return std::make_unique<RestrictedTurnQueue>();
        return std::make_unique<TurnQueue>();
    }
}
