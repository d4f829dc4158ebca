//
// Presets.cpp
//

#include "Presets.hpp"

#include <format>

namespace polyboard::core::presets
{
    auto Trading() -> RuleConfiguration
    {
        RuleConfiguration r{};
        r.currency = CurrencyRules{ .enabled = true, .starting_balance = 1500, .pass_bonus = 200 };
        r.board = BoardRules{ .separate_boards = false, .tiles_per_side = 40 };
        r.property = PropertyRules{ .purchasable = true, .tradable = true, .rent_collectible = true, .bankruptcy_enabled = true };
        r.combat.enabled = false;
        r.visibility = VisibilityRules{ .enemy_tokens_visible = true, .range = -1 };
        r.players = PlayerBounds{ .min = 2, .max = 4 };
        r.win = WinRules{ .condition = WinCondition::Elimination, .balance_threshold = 5000 };
        r.dice = DiceRules{ .count = 2, .sides = 6, .duplicates_grant_extra_turn = true, .duplicates_required = 2 };
        return r;
    }

    auto GridCombat() -> RuleConfiguration
    {
        RuleConfiguration r{};
        r.currency = CurrencyRules{ .enabled = false, .starting_balance = 0, .pass_bonus = 0 };
        r.board = BoardRules{ .separate_boards = true, .tiles_per_side = 10 };
        r.property = PropertyRules{};
        r.combat.enabled = true;
        r.combat.ship_placement = true;
        r.visibility = VisibilityRules{ .enemy_tokens_visible = false, .range = 0 };
        r.players = PlayerBounds{ .min = 2, .max = 2 };
        r.win = WinRules{ .condition = WinCondition::Elimination, .balance_threshold = 5000 };
        r.dice = DiceRules{ .count = 1, .sides = 6, .duplicates_grant_extra_turn = false, .duplicates_required = 2 };
        return r;
    }

    auto Race() -> RuleConfiguration
    {
        RuleConfiguration r{};
        r.currency = CurrencyRules{ .enabled = false, .starting_balance = 0, .pass_bonus = 0 };
        r.board = BoardRules{ .separate_boards = false, .tiles_per_side = 20 };
        r.property = PropertyRules{};
        r.combat.enabled = false;
        r.visibility = VisibilityRules{ .enemy_tokens_visible = true, .range = -1 };
        r.players = PlayerBounds{ .min = 2, .max = 4 };
        r.win = WinRules{ .condition = WinCondition::ReachGoal, .balance_threshold = 5000 };
        r.dice = DiceRules{ .count = 1, .sides = 6, .duplicates_grant_extra_turn = false, .duplicates_required = 2 };
        return r;
    }

    auto Custom() -> RuleConfiguration
    {
        RuleConfiguration r{};
        r.currency = CurrencyRules{ .enabled = true, .starting_balance = 1000, .pass_bonus = 100 };
        r.board = BoardRules{ .separate_boards = true, .tiles_per_side = 20 };
        r.property = PropertyRules{ .purchasable = true, .tradable = true, .rent_collectible = true, .bankruptcy_enabled = true };
        r.combat.enabled = true;
        r.combat.ship_placement = false;
        r.visibility = VisibilityRules{ .enemy_tokens_visible = true, .range = 5 };
        r.players = PlayerBounds{ .min = 2, .max = 4 };
        r.win = WinRules{ .condition = WinCondition::BalanceThreshold, .balance_threshold = 3000 };
        r.dice = DiceRules{ .count = 2, .sides = 6, .duplicates_grant_extra_turn = true, .duplicates_required = 2 };
        r.resources = ResourceRules{ .enabled = true, .count = 3, .names = {"Wood", "Stone", "Wheat"},
                                     .capped = true, .per_type_cap = 10 };
        return r;
    }

    auto ByName(std::string_view const name) -> std::optional<RuleConfiguration>
    {
        if (name == "trading") return Trading();
        if (name == "gridcombat") return GridCombat();
        if (name == "race") return Race();
        if (name == "custom") return Custom();
        return std::nullopt;
    }

    static auto WinName(WinCondition const c) -> std::string_view
    {
        switch (c)
        {
        case WinCondition::Elimination: return "elimination";
        case WinCondition::BalanceThreshold: return "balance-threshold";
        case WinCondition::ReachGoal: return "reach-goal";
        }
        return "?";
    }

    auto Summary(RuleConfiguration const& r) -> std::string
    {
        std::string s;
        s += std::format("Players: {}-{}\n", static_cast<int>(r.players.min), static_cast<int>(r.players.max));
        s += std::format("Board: {} | tiles per side: {}\n",
                         r.board.separate_boards ? "separate" : "shared", r.board.tiles_per_side);
        if (r.currency.enabled)
            s += std::format("Currency: start {} | pass bonus {}\n", r.currency.starting_balance, r.currency.pass_bonus);
        if (r.property.AnyEnabled())
            s += std::format("Property: buy={} trade={} rent={} bankruptcy={}\n", r.property.purchasable,
                             r.property.tradable, r.property.rent_collectible, r.property.bankruptcy_enabled);
        if (r.combat.enabled)
            s += std::format("Combat: health {} | ships={}\n", r.combat.max_health, r.combat.ship_placement);
        s += std::format("Visibility: tokens={} | range {}\n", r.visibility.enemy_tokens_visible, r.visibility.range);
        s += std::format("Dice: {}d{}{}\n", static_cast<int>(r.dice.count), static_cast<int>(r.dice.sides),
                         r.dice.duplicates_grant_extra_turn
                             ? std::format(" | {} of a kind rolls again", static_cast<int>(r.dice.duplicates_required))
                             : std::string{});
        if (r.resources.enabled)
            s += std::format("Resources: {}\n", r.resources.names.size());
        s += std::format("Win: {}", WinName(r.win.condition));
        if (r.win.condition == WinCondition::BalanceThreshold)
            s += std::format(" at {}", r.win.balance_threshold);
        s += "\n";
        return s;
    }
}
