#include <gtest/gtest.h>
#include <algorithm>
#include <limits>
#include <string>

#include "../core/RuleAnalyzer.hpp"
#include "../core/Presets.hpp"

using namespace polyboard::core;

namespace
{
    auto HasConflict(Analysis const& a, ConflictCode code) -> bool
    {
        return std::ranges::any_of(a.conflicts, [code](ConfigConflict const& c) { return c.code == code; });
    }
}

TEST(RuleAnalyzer, Presets_Classify)
{
    Analysis const trading = RuleAnalyzer::Classify(presets::Trading());
    EXPECT_TRUE(trading.valid);
    EXPECT_TRUE(std::holds_alternative<Trading>(trading.archetype));

    Analysis const grid = RuleAnalyzer::Classify(presets::GridCombat());
    EXPECT_TRUE(grid.valid);
    EXPECT_TRUE(std::holds_alternative<GridCombat>(grid.archetype));

    Analysis const race = RuleAnalyzer::Classify(presets::Race());
    EXPECT_TRUE(race.valid);
    EXPECT_TRUE(std::holds_alternative<Race>(race.archetype));

    // separate boards without ship placement matches none of the pure shapes
    Analysis const custom = RuleAnalyzer::Classify(presets::Custom());
    EXPECT_TRUE(custom.valid);
    EXPECT_TRUE(std::holds_alternative<Hybrid>(custom.archetype));
    EXPECT_TRUE(custom.conflicts.empty());
}

TEST(RuleAnalyzer, Classify_Is_Pure)
{
    RuleConfiguration const rules = presets::Trading();
    Analysis const a = RuleAnalyzer::Classify(rules);
    Analysis const b = RuleAnalyzer::Classify(rules);

    EXPECT_EQ(a.archetype.index(), b.archetype.index());
    EXPECT_EQ(a.valid, b.valid);
    EXPECT_EQ(a.conflicts.size(), b.conflicts.size());
    // input untouched
    EXPECT_EQ(rules.currency.starting_balance, presets::Trading().currency.starting_balance);
    EXPECT_EQ(rules.property.tradable, presets::Trading().property.tradable);
}

TEST(RuleAnalyzer, Trading_Without_Purchase_Fails_Closed)
{
    RuleConfiguration r = presets::Trading();
    r.property.purchasable = false;

    Analysis const a = RuleAnalyzer::Classify(r);
    EXPECT_FALSE(a.valid);
    EXPECT_TRUE(std::holds_alternative<Hybrid>(a.archetype));
    EXPECT_TRUE(HasConflict(a, ConflictCode::TradingRequiresPurchase));
    EXPECT_TRUE(HasConflict(a, ConflictCode::RentRequiresPurchase));
}

TEST(RuleAnalyzer, Reports_Every_Conflict)
{
    RuleConfiguration r = presets::Race();
    r.property.bankruptcy_enabled = true;  // no currency
    r.combat.ship_placement = true;        // no combat
    r.board.tiles_per_side = 3;
    r.players = PlayerBounds{ .min = 3, .max = 2 };
    r.visibility.range = -2;

    Analysis const a = RuleAnalyzer::Classify(r);
    EXPECT_FALSE(a.valid);
    EXPECT_TRUE(HasConflict(a, ConflictCode::BankruptcyRequiresCurrency));
    EXPECT_TRUE(HasConflict(a, ConflictCode::ShipPlacementRequiresCombat));
    EXPECT_TRUE(HasConflict(a, ConflictCode::BoardTooSmall));
    EXPECT_TRUE(HasConflict(a, ConflictCode::MaxBelowMin));
    EXPECT_TRUE(HasConflict(a, ConflictCode::VisibilityRangeInvalid));
    EXPECT_EQ(a.conflicts.size(), 5u);
}

TEST(RuleAnalyzer, Threshold_Needs_Currency_And_Positive_Target)
{
    RuleConfiguration r = presets::Race();
    r.win.condition = WinCondition::BalanceThreshold;
    r.win.balance_threshold = 0;

    Analysis const a = RuleAnalyzer::Classify(r);
    EXPECT_TRUE(HasConflict(a, ConflictCode::ThresholdRequiresCurrency));
    EXPECT_TRUE(HasConflict(a, ConflictCode::ThresholdNotPositive));
}

TEST(RuleAnalyzer, Money_Stays_Inside_Bounds)
{
    RuleConfiguration r = presets::Trading();
    r.currency.starting_balance = std::numeric_limits<MoneyT>::max() - 10;
    r.currency.pass_bonus = constants::MaxPassBonus + 1;

    Analysis const a = RuleAnalyzer::Classify(r);
    EXPECT_FALSE(a.valid);
    EXPECT_TRUE(HasConflict(a, ConflictCode::StartingBalanceTooHigh));
    EXPECT_TRUE(HasConflict(a, ConflictCode::PassBonusTooHigh));

    r.currency.starting_balance = constants::MaxStartingBalance;
    r.currency.pass_bonus = constants::MaxPassBonus;
    EXPECT_TRUE(RuleAnalyzer::Classify(r).valid);
}

TEST(RuleAnalyzer, Combat_Ranges_Checked)
{
    RuleConfiguration r = presets::GridCombat();
    r.combat.max_health = 0;
    r.combat.encounter = DamageRange{ .min = 10, .max = 5 };
    r.combat.direct_attack = DamageRange{ .min = -1, .max = 5 };

    auto const conflicts = RuleAnalyzer::Conflicts(r);
    EXPECT_EQ(std::ranges::count_if(conflicts, [](ConfigConflict const& c)
              { return c.code == ConflictCode::DamageRangeInvalid; }), 2);
    EXPECT_TRUE(std::ranges::any_of(conflicts, [](ConfigConflict const& c)
                { return c.code == ConflictCode::MaxHealthNotPositive && c.field == "combat.max_health"; }));
}

TEST(RuleAnalyzer, Dice_Constraints)
{
    RuleConfiguration r = presets::Race();
    r.dice.count = 2;
    r.dice.duplicates_grant_extra_turn = true;
    r.dice.duplicates_required = 3;
    EXPECT_TRUE(HasConflict(RuleAnalyzer::Classify(r), ConflictCode::DuplicatesRequiredInvalid));

    r.dice.duplicates_required = 2;
    EXPECT_TRUE(RuleAnalyzer::Classify(r).valid);

    r.dice.sides = 1;
    r.dice.count = 0;
    Analysis const a = RuleAnalyzer::Classify(r);
    EXPECT_TRUE(HasConflict(a, ConflictCode::DiceSidesTooLow));
    EXPECT_TRUE(HasConflict(a, ConflictCode::DiceCountTooLow));
}

TEST(RuleAnalyzer, Resource_Names)
{
    RuleConfiguration r = presets::Custom();
    EXPECT_TRUE(RuleAnalyzer::Classify(r).valid);

    r.resources.names.push_back("Ore");
    EXPECT_TRUE(HasConflict(RuleAnalyzer::Classify(r), ConflictCode::ResourceNamesMismatch));

    r.resources.names = {"Wood", "  ", "Wheat"};
    Analysis const a = RuleAnalyzer::Classify(r);
    ASSERT_TRUE(HasConflict(a, ConflictCode::ResourceNameBlank));
    auto const it = std::ranges::find_if(a.conflicts, [](ConfigConflict const& c)
                                         { return c.code == ConflictCode::ResourceNameBlank; });
    EXPECT_EQ(it->field, "resources.names[1]");

    r.resources.names = {"Wood", "Stone", "Wheat"};
    r.resources.per_type_cap = 0;
    EXPECT_TRUE(HasConflict(RuleAnalyzer::Classify(r), ConflictCode::ResourceCapTooLow));

    // disabled block is not looked at
    r.resources.enabled = false;
    EXPECT_TRUE(RuleAnalyzer::Classify(r).valid);
}

TEST(RuleAnalyzer, Report_Names_Archetype_And_Conflicts)
{
    std::string const ok = RuleAnalyzer::Report(presets::Trading());
    EXPECT_NE(ok.find("Archetype: Trading"), std::string::npos);
    EXPECT_EQ(ok.find("Conflict"), std::string::npos);

    RuleConfiguration r = presets::Trading();
    r.property.purchasable = false;
    std::string const bad = RuleAnalyzer::Report(r);
    EXPECT_NE(bad.find("Valid: false"), std::string::npos);
    EXPECT_NE(bad.find("Conflict [property.tradable]"), std::string::npos);
}

TEST(Presets, ByName_And_Summary)
{
    EXPECT_TRUE(presets::ByName("trading").has_value());
    EXPECT_TRUE(presets::ByName("gridcombat").has_value());
    EXPECT_TRUE(presets::ByName("race").has_value());
    EXPECT_TRUE(presets::ByName("custom").has_value());
    EXPECT_FALSE(presets::ByName("chess").has_value());

    std::string const s = presets::Summary(presets::Custom());
    EXPECT_NE(s.find("Win: balance-threshold at 3000"), std::string::npos);
    EXPECT_NE(s.find("Dice: 2d6"), std::string::npos);
}
