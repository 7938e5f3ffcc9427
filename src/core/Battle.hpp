//
// Created by Malik T on 15/08/2025.
//

#ifndef DUEL_BATTLE_HPP
#define DUEL_BATTLE_HPP

#include <array>
#include <functional>
#include <optional>
#include "Types.hpp"
#include "Actions.hpp"
#include "State.hpp"
#include "Playstyle.hpp"

namespace duel::core
{
    using PlaystyleFactory = std::function<PlaystyleUP(PlyrIdxT seat, TurnQueue& queue)>;

    // Authoritative two-actor battle: owns the turn queue, both characters and the
    // playstyle driving each seat.
    class Battle
    {
    public:
        Battle() = delete;
        // Playstyles built from config.actors[seat].playstyle.
        explicit Battle(Config const& config);
        Battle(Config const& config, PlaystyleFactory const& make_playstyle);

        Battle(Battle const&) = delete;
        auto operator=(Battle const&) -> Battle& = delete;

        // One turn: ask the front actor's playstyle, validate, apply.
        auto Step() -> MoveOutcome;
        // Steps until the battle ends, returns the number of turns taken.
        auto Run() -> size_t;

        auto Snapshot() -> BattleSnapshot;
        auto Winner() -> CharacterSP;
        auto IsOver() -> bool;

        auto Queue() noexcept -> TurnQueue& { return *queue_; }
        auto PlayerAt(PlyrIdxT seat) const -> CharacterSP const& { return players_.at(seat); }
        auto PlaystyleAt(PlyrIdxT seat) -> Playstyle* { return playstyles_.at(seat).get(); }
        auto SeatOf(CharacterSP const& actor) const -> std::optional<PlyrIdxT>;
        auto Turn() const noexcept -> size_t { return turn_; }
        // Action chosen by the most recent Step (NoAction before the first).
        auto LastAction() const noexcept -> Action { return last_action_; }
        auto GetConfig() const noexcept -> Config const& { return cfg_; }

    private:
        auto BuildPlayers() -> void;

    private:
        Config cfg_;
        TurnQueueUP queue_;
        std::array<CharacterSP, 2> players_{};
        std::array<PlaystyleUP, 2> playstyles_{};
        size_t turn_{};
        Action last_action_{Action::NoAction};
    };
}
#endif //DUEL_BATTLE_HPP
