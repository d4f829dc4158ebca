//
// RuleAnalyzer.hpp
//

#ifndef POLYBOARD_RULEANALYZER_HPP
#define POLYBOARD_RULEANALYZER_HPP

#include <string>
#include <string_view>
#include <vector>
#include "Types.hpp"

namespace polyboard::core
{
    struct Trading    {};
    struct GridCombat {};
    struct Race       {};
    struct Hybrid     {};

    using Archetype = std::variant<Trading, GridCombat, Race, Hybrid>;

    auto to_string(Archetype const& a) -> std::string_view;

    enum class ConflictCode : uint8_t
    {
        TradingRequiresPurchase,
        RentRequiresPurchase,
        BankruptcyRequiresCurrency,
        ShipPlacementRequiresCombat,
        CombatRequiresBoard,
        BoardTooSmall,
        MinPlayersTooLow,
        MaxBelowMin,
        NegativeStartingBalance,
        NegativePassBonus,
        StartingBalanceTooHigh,
        PassBonusTooHigh,
        ThresholdRequiresCurrency,
        ThresholdNotPositive,
        MaxHealthNotPositive,
        DamageRangeInvalid,
        VisibilityRangeInvalid,
        DiceCountTooLow,
        DiceSidesTooLow,
        DuplicatesRequiredInvalid,
        ResourceCountTooLow,
        ResourceNamesMismatch,
        ResourceNameBlank,
        ResourceCapTooLow
    };

    struct ConfigConflict
    {
        ConflictCode code{};
        // dotted path of the offending field, e.g. "property.tradable"
        std::string  field{};
        std::string  detail{};
    };

    struct Analysis
    {
        Archetype                   archetype{Hybrid{}};
        bool                        valid{false};
        std::vector<ConfigConflict> conflicts{};
    };

    class RuleAnalyzer
    {
    public:
        // Pure: the same configuration always yields the same analysis.
        static auto Classify(RuleConfiguration const& rules) -> Analysis;

        static auto Conflicts(RuleConfiguration const& rules) -> std::vector<ConfigConflict>;

        // Multi-line report for logs.
        static auto Report(RuleConfiguration const& rules) -> std::string;

        static auto IsGridCombat(RuleConfiguration const& rules) noexcept -> bool;
        static auto IsTrading(RuleConfiguration const& rules) noexcept -> bool;
        static auto IsRace(RuleConfiguration const& rules) noexcept -> bool;
    };
}

#endif //POLYBOARD_RULEANALYZER_HPP
