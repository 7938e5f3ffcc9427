//
// Created by Malik T on 14/08/2025.
//

#ifndef DUEL_UTIL_HPP
#define DUEL_UTIL_HPP

#include <algorithm>
#include <cctype>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include "Types.hpp"
#include "Actions.hpp"

namespace duel::core::util
{
    inline auto to_string(Archetype const a) -> std::string_view
    {
        switch (a)
        {
        case Archetype::Rogue: return "Rogue";
        case Archetype::Mage: return "Mage";
        case Archetype::Vampire: return "Vampire";
        case Archetype::Sorcerer: return "Sorcerer";
        }
        return "?";
    }

    inline auto to_string(PlaystyleKind const k) -> std::string_view
    {
        switch (k)
        {
        case PlaystyleKind::Random: return "random";
        case PlaystyleKind::MinimaxRecursive: return "recursive";
        case PlaystyleKind::MinimaxIterative: return "iterative";
        }
        return "?";
    }

    // 'A', 'S' or 'X'
    inline auto ToChar(Action const a) -> char
    {
        switch (a)
        {
        case Action::Attack: return 'A';
        case Action::Special: return 'S';
        case Action::NoAction: return 'X';
        }
        return 'X';
    }

    inline auto ToLower(std::string_view v) -> std::string
    {
        std::string out(v);
        std::ranges::transform(out, out.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    inline auto ParseArchetype(std::string_view v) -> std::optional<Archetype>
    {
        std::string const s = ToLower(v);
        if (s == "rogue") return Archetype::Rogue;
        if (s == "mage") return Archetype::Mage;
        if (s == "vampire") return Archetype::Vampire;
        if (s == "sorcerer") return Archetype::Sorcerer;
        return std::nullopt;
    }

    inline auto ParsePlaystyleKind(std::string_view v) -> std::optional<PlaystyleKind>
    {
        std::string const s = ToLower(v);
        if (s == "random") return PlaystyleKind::Random;
        if (s == "recursive") return PlaystyleKind::MinimaxRecursive;
        if (s == "iterative") return PlaystyleKind::MinimaxIterative;
        return std::nullopt;
    }

    template <typename T>
    inline auto contains(std::span<T const> items, T const& value) -> bool
    {
        return std::ranges::find(items, value) != std::ranges::end(items);
    }
}

#endif //DUEL_UTIL_HPP
