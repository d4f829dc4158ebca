//
// RuleAnalyzer.cpp
//

#include "RuleAnalyzer.hpp"

#include <algorithm>
#include <format>
#include "Util.hpp"

namespace
{
    using polyboard::core::ConfigConflict;
    using polyboard::core::ConflictCode;

    inline auto Conflict(ConflictCode code, std::string field, std::string detail) -> ConfigConflict
    {
        return ConfigConflict{ .code = code, .field = std::move(field), .detail = std::move(detail) };
    }

    auto CheckRange(std::vector<ConfigConflict>& out,
                    polyboard::core::DamageRange const& r,
                    std::string_view field) -> void
    {
        if (r.min < 0 || r.min > r.max)
        {
            out.push_back(Conflict(ConflictCode::DamageRangeInvalid, std::string{field},
                                   std::format("damage range [{}, {}] must satisfy 0 <= min <= max", r.min, r.max)));
        }
    }
}

namespace polyboard::core
{
    auto to_string(Archetype const& a) -> std::string_view
    {
        return std::visit([]<typename T0>(T0 const&) -> std::string_view
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, Trading>) return "Trading";
            else if constexpr (std::is_same_v<T, GridCombat>) return "GridCombat";
            else if constexpr (std::is_same_v<T, Race>) return "Race";
            else if constexpr (std::is_same_v<T, Hybrid>) return "Hybrid";
            else static_assert(util::always_false_v<T>, "unhandled archetype");
        }, a);
    }

    auto RuleAnalyzer::IsGridCombat(RuleConfiguration const& rules) noexcept -> bool
    {
        return rules.board.separate_boards && rules.combat.ship_placement;
    }

    auto RuleAnalyzer::IsTrading(RuleConfiguration const& rules) noexcept -> bool
    {
        return rules.currency.enabled && rules.property.purchasable && !rules.board.separate_boards;
    }

    auto RuleAnalyzer::IsRace(RuleConfiguration const& rules) noexcept -> bool
    {
        // only movement and dice are on
        return !rules.currency.enabled
            && !rules.property.purchasable
            && !rules.property.tradable
            && !rules.property.rent_collectible
            && !rules.property.bankruptcy_enabled
            && !rules.combat.enabled
            && !rules.combat.ship_placement
            && !rules.board.separate_boards;
    }

    auto RuleAnalyzer::Conflicts(RuleConfiguration const& rules) -> std::vector<ConfigConflict>
    {
        std::vector<ConfigConflict> out;

        // Cross-block implications
        if (rules.property.tradable && !rules.property.purchasable)
            out.push_back(Conflict(ConflictCode::TradingRequiresPurchase, "property.tradable",
                                   "trading requires purchasable properties"));

        if (rules.property.rent_collectible && !rules.property.purchasable)
            out.push_back(Conflict(ConflictCode::RentRequiresPurchase, "property.rent_collectible",
                                   "rent collection requires purchasable properties"));

        if (rules.property.bankruptcy_enabled && !rules.currency.enabled)
            out.push_back(Conflict(ConflictCode::BankruptcyRequiresCurrency, "property.bankruptcy_enabled",
                                   "bankruptcy requires currency"));

        if (rules.combat.ship_placement && !rules.combat.enabled)
            out.push_back(Conflict(ConflictCode::ShipPlacementRequiresCombat, "combat.ship_placement",
                                   "ship placement requires combat"));

        // Board
        if (rules.combat.enabled && rules.board.tiles_per_side == 0)
            out.push_back(Conflict(ConflictCode::CombatRequiresBoard, "board.tiles_per_side",
                                   "combat requires a board"));

        if (rules.board.tiles_per_side < constants::MinTilesPerSide)
            out.push_back(Conflict(ConflictCode::BoardTooSmall, "board.tiles_per_side",
                                   std::format("board needs at least {} tiles per side, got {}",
                                               constants::MinTilesPerSide, rules.board.tiles_per_side)));

        // Players
        if (rules.players.min < 1)
            out.push_back(Conflict(ConflictCode::MinPlayersTooLow, "players.min",
                                   "minimum players must be at least 1"));

        if (rules.players.max < rules.players.min)
            out.push_back(Conflict(ConflictCode::MaxBelowMin, "players.max",
                                   std::format("maximum players {} is below minimum {}",
                                               rules.players.max, rules.players.min)));

        // Currency
        if (rules.currency.enabled && rules.currency.starting_balance < 0)
            out.push_back(Conflict(ConflictCode::NegativeStartingBalance, "currency.starting_balance",
                                   "starting balance cannot be negative"));

        if (rules.currency.enabled && rules.currency.pass_bonus < 0)
            out.push_back(Conflict(ConflictCode::NegativePassBonus, "currency.pass_bonus",
                                   "pass bonus cannot be negative"));

        if (rules.currency.enabled && rules.currency.starting_balance > constants::MaxStartingBalance)
            out.push_back(Conflict(ConflictCode::StartingBalanceTooHigh, "currency.starting_balance",
                                   std::format("starting balance {} exceeds {}",
                                               rules.currency.starting_balance, constants::MaxStartingBalance)));

        if (rules.currency.enabled && rules.currency.pass_bonus > constants::MaxPassBonus)
            out.push_back(Conflict(ConflictCode::PassBonusTooHigh, "currency.pass_bonus",
                                   std::format("pass bonus {} exceeds {}",
                                               rules.currency.pass_bonus, constants::MaxPassBonus)));

        // Win condition
        if (rules.win.condition == WinCondition::BalanceThreshold)
        {
            if (!rules.currency.enabled)
                out.push_back(Conflict(ConflictCode::ThresholdRequiresCurrency, "win.condition",
                                       "balance threshold victory requires currency"));
            if (rules.win.balance_threshold <= 0)
                out.push_back(Conflict(ConflictCode::ThresholdNotPositive, "win.balance_threshold",
                                       "balance threshold must be greater than 0"));
        }

        // Combat
        if (rules.combat.enabled)
        {
            if (rules.combat.max_health <= 0)
                out.push_back(Conflict(ConflictCode::MaxHealthNotPositive, "combat.max_health",
                                       "max health must be greater than 0"));
            CheckRange(out, rules.combat.encounter, "combat.encounter");
            CheckRange(out, rules.combat.landing_pvp, "combat.landing_pvp");
            CheckRange(out, rules.combat.direct_attack, "combat.direct_attack");
        }

        // Visibility
        if (rules.visibility.range < -1)
            out.push_back(Conflict(ConflictCode::VisibilityRangeInvalid, "visibility.range",
                                   "visibility range must be -1 (unlimited) or >= 0"));

        // Dice
        if (rules.dice.count < 1)
            out.push_back(Conflict(ConflictCode::DiceCountTooLow, "dice.count",
                                   "number of dice must be at least 1"));

        if (rules.dice.sides < 2)
            out.push_back(Conflict(ConflictCode::DiceSidesTooLow, "dice.sides",
                                   "dice must have at least 2 sides"));

        if (rules.dice.duplicates_grant_extra_turn &&
            (rules.dice.duplicates_required < 2 || rules.dice.duplicates_required > rules.dice.count))
            out.push_back(Conflict(ConflictCode::DuplicatesRequiredInvalid, "dice.duplicates_required",
                                   std::format("duplicates required must be in [2, {}], got {}",
                                               rules.dice.count, rules.dice.duplicates_required)));

        // Resources
        if (rules.resources.enabled)
        {
            if (rules.resources.count < 1)
                out.push_back(Conflict(ConflictCode::ResourceCountTooLow, "resources.count",
                                       "at least one resource type is required"));

            if (rules.resources.names.size() != rules.resources.count)
                out.push_back(Conflict(ConflictCode::ResourceNamesMismatch, "resources.names",
                                       std::format("expected {} resource names, got {}",
                                                   rules.resources.count, rules.resources.names.size())));

            for (std::size_t i{}; i < rules.resources.names.size(); ++i)
            {
                std::string const& n = rules.resources.names[i];
                bool const blank = std::ranges::all_of(n, [](char c) { return c == ' ' || c == '\t' || c == '\n'; });
                if (blank)
                    out.push_back(Conflict(ConflictCode::ResourceNameBlank, std::format("resources.names[{}]", i),
                                           std::format("resource {} name cannot be empty", i + 1)));
            }

            if (rules.resources.capped && rules.resources.per_type_cap < 1)
                out.push_back(Conflict(ConflictCode::ResourceCapTooLow, "resources.per_type_cap",
                                       "maximum resources per type must be at least 1"));
        }

        return out;
    }

    auto RuleAnalyzer::Classify(RuleConfiguration const& rules) -> Analysis
    {
        Analysis res{};
        res.conflicts = Conflicts(rules);
        if (!res.conflicts.empty())
        {
            // fail closed
            res.archetype = Hybrid{};
            res.valid = false;
            return res;
        }

        res.valid = true;

        bool const grid = IsGridCombat(rules);
        bool const trading = IsTrading(rules);
        bool const race = IsRace(rules);
        int const matched = static_cast<int>(grid) + static_cast<int>(trading) + static_cast<int>(race);

        if (matched >= 2)     res.archetype = Hybrid{};
        else if (grid)        res.archetype = GridCombat{};
        else if (trading)     res.archetype = Trading{};
        else if (race)        res.archetype = Race{};
        else                  res.archetype = Hybrid{};

        return res;
    }

    auto RuleAnalyzer::Report(RuleConfiguration const& rules) -> std::string
    {
        Analysis const a = Classify(rules);

        std::string s = "=== Rule analysis ===\n";
        s += std::format("Archetype: {}\n", to_string(a.archetype));
        s += std::format("Valid: {}\n", a.valid);
        s += std::format("Currency: {} | Property: {} | Combat: {} | Separate boards: {}\n",
                         rules.currency.enabled, rules.property.AnyEnabled(),
                         rules.combat.enabled, rules.board.separate_boards);
        for (ConfigConflict const& c : a.conflicts)
        {
            s += std::format("Conflict [{}]: {}\n", c.field, c.detail);
        }
        return s;
    }
}
