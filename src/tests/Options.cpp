#include <gtest/gtest.h>
#include <optional>
#include <vector>

#include "../core/Exception.hpp"
#include "../core/Options.hpp"

using namespace duel::core;

namespace
{
auto parse(std::vector<char const*> args) -> std::optional<Config>
{
    args.insert(args.begin(), "duel");
    return ParseArgs(static_cast<int>(args.size()), args.data());
}
} // anonymous namespace

TEST(Options, Fills_Both_Seats)
{
    std::optional<Config> const cfg = parse({"--p1", "Vampire", "--p2", "sorcerer", "--style1", "iterative",
                                             "--hp2", "40", "--sp1", "25", "--restricted", "1", "--seed", "99",
                                             "--log", "out.log"});
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->actors[0].archetype, Archetype::Vampire);
    EXPECT_EQ(cfg->actors[1].archetype, Archetype::Sorcerer);
    EXPECT_EQ(cfg->actors[0].playstyle, PlaystyleKind::MinimaxIterative);
    EXPECT_EQ(cfg->actors[1].playstyle, PlaystyleKind::Random);
    EXPECT_EQ(cfg->actors[0].sp, 25);
    EXPECT_EQ(cfg->actors[1].hp, 40);
    EXPECT_EQ(cfg->actors[0].hp, constants::StartingHp);
    EXPECT_TRUE(cfg->restricted);
    EXPECT_EQ(cfg->seed, 99u);
    EXPECT_EQ(cfg->audit_path, "out.log");
}

TEST(Options, Help_Yields_No_Config)
{
    EXPECT_FALSE(parse({"--help"}).has_value());
}

TEST(Options, Rejects_Bad_Input)
{
    EXPECT_THROW(parse({"--p1", "paladin"}), error::ConfigError);
    EXPECT_THROW(parse({"--style2", "greedy"}), error::ConfigError);
    EXPECT_THROW(parse({"--hp1", "12x"}), error::ConfigError);
    EXPECT_THROW(parse({"--hp1", "-5"}), error::ConfigError);
    EXPECT_THROW(parse({"--seed"}), error::ConfigError);
    EXPECT_THROW(parse({"--turbo"}), error::ConfigError);
}

TEST(Options, Rejects_Stats_That_Do_Not_Fit_An_Int)
{
    // 2^32 + 100 would wrap to 100
    EXPECT_THROW(parse({"--hp1", "4294967396"}), error::ConfigError);
    EXPECT_THROW(parse({"--sp2", "2147483648"}), error::ConfigError);

    std::optional<Config> const cfg = parse({"--sp2", "2147483647"});
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->actors[1].sp, 2147483647);
}
