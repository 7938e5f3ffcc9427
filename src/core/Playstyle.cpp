//
// Created by Malik T on 24/08/2025.
//

#include "Playstyle.hpp"

#include "Exception.hpp"
#include "MinimaxPlaystyle.hpp"
#include "RandomPlaystyle.hpp"

namespace duel::core
{
    auto MakePlaystyle(PlaystyleKind const kind, TurnQueue& queue, uint64_t const seed) -> PlaystyleUP
    {
        switch (kind)
        {
        case PlaystyleKind::Random: return std::make_unique<RandomPlaystyle>(queue, seed);
        case PlaystyleKind::MinimaxRecursive: return std::make_unique<MinimaxRecursivePlaystyle>(queue);
        case PlaystyleKind::MinimaxIterative: return std::make_unique<MinimaxIterativePlaystyle>(queue);
        }
        DUEL_THROW(error::Code::Config, "Unknown playstyle kind");
    }
}
