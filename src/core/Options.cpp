//
// Created by Malik T on 13/08/2025.
//

#include "Options.hpp"

#include <charconv>
#include <cstdint>
#include <format>
#include <limits>
#include <print>
#include <string>
#include <string_view>

#include "Exception.hpp"
#include "Util.hpp"

namespace duel::core
{
    auto Usage() -> void
    {
        std::print("usage: duel [--p1|--p2 rogue|mage|vampire|sorcerer]\n"
                   "            [--style1|--style2 random|recursive|iterative]\n"
                   "            [--hp1|--sp1|--hp2|--sp2 <n>] [--restricted 0|1]\n"
                   "            [--seed <n>] [--log <path>]\n");
    }

    auto ParseArgs(int const argc, char const* const* argv) -> std::optional<Config>
    {
        Config cfg{};

        for (int i = 1; i < argc; ++i)
        {
            std::string_view const arg = argv[i];

            auto next_str = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                {
                    DUEL_THROW(error::Code::Config, std::format("missing value after {}", arg));
                }
                return argv[++i];
            };

            auto next_uint = [&](std::uint64_t& out)
            {
                std::string_view const s = next_str();
                auto const res = std::from_chars(s.data(), s.data() + s.size(), out);
                if (res.ec != std::errc{} || res.ptr != s.data() + s.size())
                {
                    DUEL_THROW(error::Code::Config, std::format("{} expects a number, got '{}'", arg, s));
                }
            };

            auto next_archetype = [&]() -> Archetype
            {
                std::string_view const s = next_str();
                std::optional<Archetype> const a = util::ParseArchetype(s);
                if (!a) { DUEL_THROW(error::Code::Config, std::format("unknown archetype '{}'", s)); }
                return *a;
            };

            auto next_style = [&]() -> PlaystyleKind
            {
                std::string_view const s = next_str();
                std::optional<PlaystyleKind> const k = util::ParsePlaystyleKind(s);
                if (!k) { DUEL_THROW(error::Code::Config, std::format("unknown playstyle '{}'", s)); }
                return *k;
            };

            auto next_int = [&](int& out)
            {
                std::uint64_t v{};
                next_uint(v);
                if (v > static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
                {
                    DUEL_THROW(error::Code::Config, std::format("{} value {} is out of range", arg, v));
                }
                out = static_cast<int>(v);
            };

            if      (arg == "--p1")     { cfg.actors[0].archetype = next_archetype(); }
            else if (arg == "--p2")     { cfg.actors[1].archetype = next_archetype(); }
            else if (arg == "--style1") { cfg.actors[0].playstyle = next_style(); }
            else if (arg == "--style2") { cfg.actors[1].playstyle = next_style(); }
            else if (arg == "--hp1")    { next_int(cfg.actors[0].hp); }
            else if (arg == "--sp1")    { next_int(cfg.actors[0].sp); }
            else if (arg == "--hp2")    { next_int(cfg.actors[1].hp); }
            else if (arg == "--sp2")    { next_int(cfg.actors[1].sp); }
            else if (arg == "--restricted")
            {
                std::uint64_t v{};
                next_uint(v);
                cfg.restricted = (v != 0);
            }
            else if (arg == "--seed")
            {
                next_uint(cfg.seed);
            }
            else if (arg == "--log")
            {
                cfg.audit_path = std::string{next_str()};
            }
            else if (arg == "--help" || arg == "-h")
            {
                return std::nullopt;
            }
            else
            {
                DUEL_THROW(error::Code::Config, std::format("unknown option '{}'", arg));
            }
        }
        return cfg;
    }
}
