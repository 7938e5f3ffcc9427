//
// Created by Malik T on 15/08/2025.
//

#ifndef DUEL_TURNQUEUE_HPP
#define DUEL_TURNQUEUE_HPP

#include <deque>
#include <memory>
#include <string>
#include "Types.hpp"

namespace duel::core
{
    // Pending turns in order. A ticket is one opportunity to act; an actor may hold
    // several. Tickets of actors with nothing left to do are purged lazily from the
    // front whenever the queue is inspected.
    class TurnQueue
    {
    public:
        TurnQueue() = default;
        virtual ~TurnQueue() = default;

        TurnQueue(TurnQueue const&) = delete;
        auto operator=(TurnQueue const&) -> TurnQueue& = delete;

        // First add fixes player1 = actor, player2 = actor's enemy.
        virtual auto Add(CharacterSP const& actor) -> void;
        // Throws EmptyQueue when no live ticket remains.
        virtual auto Remove() -> CharacterSP;

        // Front ticket, or player1 when nothing is pending.
        auto Peek() -> CharacterSP;
        auto IsEmpty() -> bool;
        auto IsOver() -> bool;
        // nullptr while running and on a tie.
        auto Winner() -> CharacterSP;

        // Deep copy: fresh player clones bound to the new queue, same ticket order.
        auto Copy() const -> TurnQueueUP;

        auto Player1() const noexcept -> CharacterSP const& { return p1_; }
        auto Player2() const noexcept -> CharacterSP const& { return p2_; }
        auto Size() const noexcept -> size_t { return tickets_.size(); }
        virtual auto IsRestricted() const noexcept -> bool { return false; }

        // Raw tickets, front first, as of the last cleaning.
        auto Tickets() const noexcept -> std::deque<CharacterSP> const& { return tickets_; }

        // "a (Rogue): 100/100 -> b (Mage): 93/100"
        auto Describe() const -> std::string;

    protected:
        virtual auto Clean() -> void;
        virtual auto MakeEmpty() const -> TurnQueueUP;

        auto CapturePlayers(CharacterSP const& actor) -> void;
        auto Holds(CharacterSP const& actor) const -> bool;

    protected:
        std::deque<CharacterSP> tickets_;
        CharacterSP p1_;
        CharacterSP p2_;
    };

    // Each ticket carries a permission bit saying whether it may authorize new
    // tickets while it is at the front.
    class RestrictedTurnQueue final : public TurnQueue
    {
    public:
        RestrictedTurnQueue() = default;

        auto Add(CharacterSP const& actor) -> void override;
        auto Remove() -> CharacterSP override;

        // Eligible tickets currently held by actor.
        auto AddAbilityCount(CharacterSP const& actor) const -> size_t;
        auto IsRestricted() const noexcept -> bool override { return true; }
        // Parallel to Tickets().
        auto Permissions() const noexcept -> std::deque<bool> const& { return permissions_; }

    protected:
        auto Clean() -> void override;
        auto MakeEmpty() const -> TurnQueueUP override;

    private:
        auto Push(CharacterSP const& actor, bool can_add) -> void;

    private:
        std::deque<bool> permissions_;
    };

    auto MakeTurnQueue(bool restricted) -> TurnQueueUP;
}

#endif //DUEL_TURNQUEUE_HPP
