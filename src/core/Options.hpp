//
// Created by Malik T on 13/08/2025.
//

#ifndef DUEL_OPTIONS_HPP
#define DUEL_OPTIONS_HPP

#include <optional>
#include "Types.hpp"

namespace duel::core
{
    // Command line to Config. Throws Config errors on unknown options, unknown names and
    // numbers that do not fit; nullopt when help was asked for.
    auto ParseArgs(int argc, char const* const* argv) -> std::optional<Config>;

    auto Usage() -> void;
}

#endif //DUEL_OPTIONS_HPP
