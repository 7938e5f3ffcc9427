//
// Created by Malik T on 15/08/2025.
//
#include "Battle.hpp"

#include <format>
#include <print>
#include <utility>

#include "Character.hpp"
#include "Exception.hpp"
#include "Resolution.hpp"
#include "TurnQueue.hpp"

namespace duel::core
{
    Battle::Battle(Config const& config) :
        Battle(config, [&config](PlyrIdxT const seat, TurnQueue& queue)
        {
            return MakePlaystyle(config.actors[seat].playstyle, queue,
                                 config.seed + static_cast<uint64_t>(seat * 1337u));
        })
    {
    }

    Battle::Battle(Config const& config, PlaystyleFactory const& make_playstyle) :
        cfg_(config),
        queue_(MakeTurnQueue(cfg_.restricted))
    {
        DUEL_ASSERT(static_cast<bool>(make_playstyle), "No playstyle factory while initialising battle");
        BuildPlayers();

        for (PlyrIdxT seat{}; seat < players_.size(); ++seat)
        {
            playstyles_[seat] = make_playstyle(seat, *queue_);
            DUEL_ASSERT(playstyles_[seat] != nullptr, "Invalid playstyle in battle");
        }
    }

    auto Battle::BuildPlayers() -> void
    {
        for (PlyrIdxT seat{}; seat < players_.size(); ++seat)
        {
            ActorSetup const& setup = cfg_.actors[seat];
            if (setup.name.empty())
                DUEL_THROW(error::Code::Config, std::format("Player {} has no name", seat + 1));
            if (setup.hp < 0 || setup.sp < 0)
                DUEL_THROW(error::Code::Config,
                           std::format("Player {} starts with negative HP/SP ({}/{})", seat + 1, setup.hp, setup.sp));

            players_[seat] = MakeCharacter(setup.name, setup.archetype, *queue_);
            players_[seat]->SetHp(setup.hp);
            players_[seat]->SetSp(setup.sp);
        }
        LinkEnemies(players_[0], players_[1]);

        // player 1 opens
        queue_->Add(players_[0]);
        queue_->Add(players_[1]);
    }

    auto Battle::SeatOf(CharacterSP const& actor) const -> std::optional<PlyrIdxT>
    {
        for (PlyrIdxT seat{}; seat < players_.size(); ++seat)
        {
            if (players_[seat] == actor) return seat;
        }
        return std::nullopt;
    }

    auto Battle::IsOver() -> bool
    {
        return queue_->IsOver();
    }

    auto Battle::Winner() -> CharacterSP
    {
        return queue_->Winner();
    }

    auto Battle::Step() -> MoveOutcome
    {
        if (queue_->IsOver()) return MoveOutcome::GameEnded;

        CharacterSP const actor = queue_->Peek();
        std::optional<PlyrIdxT> const seat = SeatOf(actor);
        DUEL_ASSERT(seat.has_value(), "Front ticket belongs to neither player");

        Action const action = playstyles_[*seat]->SelectAction();
        last_action_ = action;
        ++turn_;

        if (auto const ok = ValidateAction(*queue_, action); !ok.has_value())
        {
            std::print("{}\n", error::describe(ok.error()));
            // an unusable choice forfeits the ticket
            queue_->Remove();
            return MoveOutcome::Invalid;
        }

        ApplyAction(*queue_, action);
        return queue_->IsOver() ? MoveOutcome::GameEnded : MoveOutcome::Applied;
    }

    auto Battle::Run() -> size_t
    {
        size_t const start = turn_;
        while (Step() != MoveOutcome::GameEnded)
        {
        }
        return turn_ - start;
    }

    auto Battle::Snapshot() -> BattleSnapshot
    {
        BattleSnapshot snap{};
        for (PlyrIdxT seat{}; seat < players_.size(); ++seat)
        {
            Character const& c = *players_[seat];
            snap.players[seat] = ActorView{c.Name(), c.Kind(), c.Hp(), c.Sp()};
        }

        snap.over = queue_->IsOver();
        if (!queue_->IsEmpty()) snap.front_seat = SeatOf(queue_->Peek());

        for (CharacterSP const& t : queue_->Tickets())
        {
            std::optional<PlyrIdxT> const seat = SeatOf(t);
            DUEL_ASSERT(seat.has_value(), "Ticket belongs to neither player");
            snap.ticket_seats.push_back(*seat);
        }

        snap.restricted = queue_->IsRestricted();
        if (auto const* rq = dynamic_cast<RestrictedTurnQueue const*>(queue_.get()))
        {
            snap.can_add.assign(rq->Permissions().begin(), rq->Permissions().end());
        }
        snap.turn = turn_;
        return snap;
    }
}
