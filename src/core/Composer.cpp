//
// Composer.cpp
//

#include "Composer.hpp"

#include <algorithm>
#include <format>
#include <set>
#include "Util.hpp"

namespace polyboard::core
{
    auto describe(ConstructionError const& e) -> std::string
    {
        auto s = std::format("{}", e.message);
        for (ConfigConflict const& c : e.conflicts)
        {
            s += std::format(" | {}: {}", c.field, c.detail);
        }
        return s;
    }

    auto Composer::RequiredBy(Archetype const& archetype) -> ModulePlan
    {
        return std::visit([]<typename T0>(T0 const&) -> ModulePlan
        {
            using T = std::decay_t<T0>;
            if constexpr (std::is_same_v<T, Trading>)
                return ModulePlan{ .currency = true, .property = true, .combat = false };
            else if constexpr (std::is_same_v<T, GridCombat>)
                return ModulePlan{ .currency = false, .property = false, .combat = true };
            else if constexpr (std::is_same_v<T, Race>)
                return ModulePlan{};
            else if constexpr (std::is_same_v<T, Hybrid>)
                return ModulePlan{};
            else
                static_assert(util::always_false_v<T>, "archetype without a module plan");
        }, archetype);
    }

    auto Composer::EnabledBy(RuleConfiguration const& rules) noexcept -> ModulePlan
    {
        return ModulePlan{
            .currency = rules.currency.enabled,
            .property = rules.property.AnyEnabled(),
            .combat = rules.combat.enabled };
    }

    auto Composer::ClampPlayers(PlayerBounds const bounds, uint8_t const requested) noexcept -> uint8_t
    {
        return std::clamp(requested, bounds.min, std::max(bounds.min, bounds.max));
    }

    auto Composer::Build(RuleConfiguration const& rules, uint8_t const requested_players, uint64_t const seed) -> BuildResult
    {
        Analysis analysis = RuleAnalyzer::Classify(rules);
        if (!analysis.valid)
        {
            return std::unexpected(ConstructionError{
                .code = ConstructionErrorCode::InvalidConfiguration,
                .message = std::format("Rule configuration has {} conflict(s)", analysis.conflicts.size()),
                .conflicts = std::move(analysis.conflicts) });
        }

        ModulePlan const required = RequiredBy(analysis.archetype);
        ModulePlan const enabled = EnabledBy(rules);
        std::string_view const kind = to_string(analysis.archetype);

        // A module is never built behind a disabled flag.
        if (required.currency && !enabled.currency)
            return std::unexpected(ConstructionError{ .code = ConstructionErrorCode::ModuleDisabled,
                .message = std::format("{} archetype requires Currency module", kind) });
        if (required.property && !enabled.property)
            return std::unexpected(ConstructionError{ .code = ConstructionErrorCode::ModuleDisabled,
                .message = std::format("{} archetype requires Property module", kind) });
        if (required.combat && !enabled.combat)
            return std::unexpected(ConstructionError{ .code = ConstructionErrorCode::ModuleDisabled,
                .message = std::format("{} archetype requires Combat module", kind) });

        if (enabled.property && !enabled.currency)
            return std::unexpected(ConstructionError{ .code = ConstructionErrorCode::MissingDependency,
                .message = "Property module requires Currency module" });

        uint8_t const players = ClampPlayers(rules.players, requested_players);
        auto match = std::make_unique<MatchState>(rules, analysis.archetype, players, seed);

        match->board_ = std::make_unique<BoardModel>(match->rules_);
        if (enabled.currency)
            match->ledger_ = std::make_unique<CurrencyLedger>(match->roster_);
        if (enabled.property)
        {
            match->property_ = std::make_unique<PropertyRegistry>(match->rules_, match->roster_, *match->ledger_);
            PlaceProperties(*match);
        }
        if (enabled.combat)
            match->combat_ = std::make_unique<CombatModel>(match->rules_, match->roster_, match->rng_);
        match->movement_ = std::make_unique<MovementModel>(match->rules_, match->roster_, *match->board_,
                                                           match->ledger_.get());

        match->current_ = 0;
        match->phase_ = TurnPhase::AwaitingIntent;
        match->turn_number_ = 1;
        return match;
    }

    auto Composer::PlaceProperties(MatchState& match) -> void
    {
        uint32_t const size = match.board_->Size();
        PBD_ASSERT(size >= 2, "Board too small for properties");

        uint32_t const attempts = std::max(constants::MinPropertyCount, size / 4);
        std::uniform_int_distribution<uint32_t> dist{1, size - 1};
        std::set<PosT> used;

        for (uint32_t i{}; i < attempts; ++i)
        {
            PosT const pos = dist(match.rng_);
            // a collision just skips this slot
            if (!used.insert(pos).second) continue;

            MoneyT const price = constants::PropertyBasePrice + constants::PropertyPriceStep * static_cast<MoneyT>(i);
            match.property_->AddRecord(PropertyRecord{
                .position = pos,
                .name = std::format("Property {}", i + 1),
                .price = price,
                .rent = price / constants::RentDivisor });
        }
    }
}
