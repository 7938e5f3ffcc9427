//
// Created by Malik T on 18/08/2025.
//

#ifndef DUEL_RANDOMPLAYSTYLE_HPP
#define DUEL_RANDOMPLAYSTYLE_HPP

#include <random>
#include "Playstyle.hpp"
#include "Types.hpp"

namespace duel::core
{
    class RandomPlaystyle final : public Playstyle
    {
    public:
        RandomPlaystyle(TurnQueue& queue, uint64_t rng_seed);

        auto SelectAction() -> Action override;

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

    private:
        std::mt19937 rng_;
    };
}

#endif //DUEL_RANDOMPLAYSTYLE_HPP
