//
// Created by Malik T on 14/08/2025.
//

#ifndef DUEL_PLAYSTYLE_HPP
#define DUEL_PLAYSTYLE_HPP

#include <memory>
#include "Actions.hpp"
#include "Types.hpp"

namespace duel::core
{
    // Chooses the move of whoever is at the front of the bound queue.
    class Playstyle
    {
    public:
        explicit Playstyle(TurnQueue& queue) : queue_(&queue) {}
        virtual ~Playstyle() = default;

        // Action::NoAction when no valid move can be found.
        virtual auto SelectAction() -> Action = 0;

        auto Queue() const noexcept -> TurnQueue& { return *queue_; }

    protected:
        TurnQueue* queue_;  // non-owning
    };

    using PlaystyleUP = std::unique_ptr<Playstyle>;

    auto MakePlaystyle(PlaystyleKind kind, TurnQueue& queue, uint64_t seed) -> PlaystyleUP;
}
#endif //DUEL_PLAYSTYLE_HPP
