//
// Created by Malik T on 24/08/2025.
//

#ifndef DUEL_MINIMAXPLAYSTYLE_HPP
#define DUEL_MINIMAXPLAYSTYLE_HPP

#include <memory>
#include <optional>
#include <vector>
#include "Playstyle.hpp"
#include "TurnQueue.hpp"
#include "Types.hpp"

namespace duel::core
{
    struct SearchResult
    {
        Action action{Action::NoAction};
        std::optional<int> score{};  // guaranteed score of the root state, when searched
        size_t nodes{};  // states in the root's game tree
        size_t depth{};  // deepest ply of that tree
    };

    // Walks the game tree through ScoreState/ScoreFor. Ties go to the first action in
    // Attack, Special order.
    class MinimaxRecursivePlaystyle final : public Playstyle
    {
    public:
        using Playstyle::Playstyle;

        auto SelectAction() -> Action override;
        auto Evaluate() -> SearchResult;
    };

    struct SearchNode
    {
        TurnQueueUP queue;
        CharacterSP perspective;  // lives in queue
        Action action{Action::NoAction};  // move that produced this node
        size_t ply{};
        std::optional<int> best_score{};
        std::optional<std::vector<std::unique_ptr<SearchNode>>> children{};  // unset until expanded
    };

    // Same search as the recursive playstyle, built as an explicit tree and walked
    // post-order with a stack so depth never grows the call stack.
    class MinimaxIterativePlaystyle final : public Playstyle
    {
    public:
        using Playstyle::Playstyle;

        auto SelectAction() -> Action override;
        auto Evaluate() -> SearchResult;

        // One child per available action of the node's front actor.
        static auto Expand(SearchNode& node) -> std::vector<std::unique_ptr<SearchNode>>;
    };
}

#endif //DUEL_MINIMAXPLAYSTYLE_HPP
