//
// Created by Malik T on 24/08/2025.
//

#include "MinimaxPlaystyle.hpp"

#include <algorithm>
#include <format>
#include <limits>
#include <utility>

#include "Character.hpp"
#include "Exception.hpp"
#include "Resolution.hpp"
#include "StateScorer.hpp"
#include "TurnQueue.hpp"

namespace duel::core
{
    auto MinimaxRecursivePlaystyle::SelectAction() -> Action
    {
        return Evaluate().action;
    }

    auto MinimaxRecursivePlaystyle::Evaluate() -> SearchResult
    {
        TurnQueue& queue = *queue_;
        CharacterSP const actor = queue.Peek();
        if (!actor) return {};

        ActionList const actions = actor->GetAvailableActions();
        if (actions.empty()) return {};
        SearchStats stats{};
        // a finished battle has no move to pick, even if the front actor could still act
        if (queue.IsOver())
        {
            int const score = ScoreState(queue, &stats);
            return {Action::NoAction, score, stats.nodes, stats.depth};
        }

        int const root_score = ScoreState(queue, &stats);
        for (Action const a : actions)
        {
            Simulation sim = Simulate(queue, actor, a);
            if (ScoreFor(sim.perspective, *sim.queue) == root_score)
            {
                return {a, root_score, stats.nodes, stats.depth};
            }
        }
        return {Action::NoAction, root_score, stats.nodes, stats.depth};
    }

    auto MinimaxIterativePlaystyle::SelectAction() -> Action
    {
        return Evaluate().action;
    }

    auto MinimaxIterativePlaystyle::Expand(SearchNode& node) -> std::vector<std::unique_ptr<SearchNode>>
    {
        CharacterSP const front = node.queue->Peek();
        ActionList const actions = front->GetAvailableActions();
        if (actions.empty())
            DUEL_THROW(error::Code::InvariantViolation,
                       std::format("{} is at the front of a running battle with no actions", front->Name()));

        std::vector<std::unique_ptr<SearchNode>> children;
        children.reserve(actions.size());
        for (Action const a : actions)
        {
            Simulation sim = Simulate(*node.queue, node.perspective, a);
            auto child = std::make_unique<SearchNode>();
            child->queue = std::move(sim.queue);
            child->perspective = std::move(sim.perspective);
            child->action = a;
            child->ply = node.ply + 1;
            children.push_back(std::move(child));
        }
        return children;
    }

    auto MinimaxIterativePlaystyle::Evaluate() -> SearchResult
    {
        CharacterSP const actor = queue_->Peek();
        if (!actor || actor->GetAvailableActions().empty()) return {};

        auto root = std::make_unique<SearchNode>();
        root->queue = queue_->Copy();
        root->perspective = root->queue->Peek();
        SearchStats stats{.nodes = 1, .depth = 0};

        std::vector<SearchNode*> stack{root.get()};
        while (!stack.empty())
        {
            SearchNode* const node = stack.back();
            stack.pop_back();

            bool const over = node->queue->IsOver();
            if (!over && !node->children)
            {
                node->children = Expand(*node);
                stats.nodes += node->children->size();
                if (!node->children->empty()) stats.depth = std::max(stats.depth, node->ply + 1);

                // revisit the parent once every child is scored
                stack.push_back(node);
                for (std::unique_ptr<SearchNode> const& child : *node->children)
                {
                    stack.push_back(child.get());
                }
            }
            else if (!over)
            {
                int best = std::numeric_limits<int>::min();
                for (std::unique_ptr<SearchNode> const& child : *node->children)
                {
                    DUEL_ASSERT(child->best_score.has_value(), "Parent revisited before its children were scored");
                    best = std::max(best, *child->best_score);
                }
                node->best_score = best;
            }
            else
            {
                node->best_score = TerminalScore(*node->queue, *node->perspective);
            }
        }

        // finished battle, same answer as the recursive search
        if (!root->children) return {Action::NoAction, root->best_score, stats.nodes, stats.depth};

        auto const it = std::ranges::find_if(*root->children,
                                             [&](std::unique_ptr<SearchNode> const& child)
                                             {
                                                 return child->best_score == root->best_score;
                                             });
        if (it == std::cend(*root->children)) return {Action::NoAction, root->best_score, stats.nodes, stats.depth};
        return {(*it)->action, root->best_score, stats.nodes, stats.depth};
    }
}
