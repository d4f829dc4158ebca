//
// Types.hpp
//

#ifndef POLYBOARD_TYPES_HPP
#define POLYBOARD_TYPES_HPP

#define PBD_ALLOW_EXCEPTIONS true
#define PBD_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <array>
#include <random>
#include <variant>

namespace polyboard::core::constants
{
    // Shared trading board used whenever currency and purchasable property are both on.
    inline constexpr uint32_t StandardLoopSize = 40;
    inline constexpr uint32_t MinTilesPerSide = 4;
    // Combat triggers on non-zero multiples of this.
    inline constexpr uint32_t CombatInterval = 7;

    inline constexpr uint32_t MinPropertyCount = 2;
    inline constexpr int32_t PropertyBasePrice = 100;
    inline constexpr int32_t PropertyPriceStep = 50;
    inline constexpr int32_t RentDivisor = 10;
    // Keeps configured money well inside MoneyT.
    inline constexpr int32_t MaxStartingBalance = 100'000'000;
    inline constexpr int32_t MaxPassBonus = 1'000'000;

    inline constexpr uint16_t RuleDocumentVersion = 1;
}

namespace polyboard::core
{
    using PlayerIdT = uint8_t;
    using PosT = uint32_t;
    using MoneyT = int32_t;
    using TxnIdT = uint64_t;

    enum class WinCondition : uint8_t
    {
        Elimination = 0,
        BalanceThreshold,
        ReachGoal
    };

    enum class BoardShape : uint8_t
    {
        LinearLoop = 0,
        SquareGrid
    };

    enum class SpaceKind : uint8_t
    {
        Start = 0,
        Goal,
        Special,
        Normal
    };

    // Inclusive on both ends.
    struct DamageRange
    {
        int32_t min{0};
        int32_t max{0};
    };

    struct CurrencyRules
    {
        bool    enabled{true};
        MoneyT  starting_balance{1500};
        MoneyT  pass_bonus{200};
    };

    struct BoardRules
    {
        bool     separate_boards{false};
        uint32_t tiles_per_side{20};
    };

    struct PropertyRules
    {
        bool purchasable{false};
        bool tradable{false};
        bool rent_collectible{false};
        bool bankruptcy_enabled{false};

        [[nodiscard]]
        auto AnyEnabled() const noexcept -> bool { return purchasable || tradable || rent_collectible; }
    };

    struct CombatRules
    {
        bool        enabled{false};
        bool        ship_placement{false};
        int32_t     max_health{100};
        DamageRange encounter{5, 19};
        DamageRange landing_pvp{10, 29};
        DamageRange direct_attack{15, 34};
    };

    struct VisibilityRules
    {
        bool    enemy_tokens_visible{true};
        // -1 = unlimited, 0 = nothing, >0 = tiles
        int32_t range{-1};
    };

    struct PlayerBounds
    {
        uint8_t min{2};
        uint8_t max{4};
    };

    struct WinRules
    {
        WinCondition condition{WinCondition::Elimination};
        MoneyT       balance_threshold{5000};
    };

    struct DiceRules
    {
        uint8_t count{1};
        uint8_t sides{6};
        bool    duplicates_grant_extra_turn{false};
        uint8_t duplicates_required{2};
    };

    struct ResourceRules
    {
        bool                     enabled{false};
        uint8_t                  count{0};
        std::vector<std::string> names;
        bool                     capped{false};
        uint32_t                 per_type_cap{10};
    };

    // Immutable once a match is built. Flags gate the block they sit in.
    struct RuleConfiguration
    {
        CurrencyRules   currency{};
        BoardRules      board{};
        PropertyRules   property{};
        CombatRules     combat{};
        VisibilityRules visibility{};
        PlayerBounds    players{};
        WinRules        win{};
        DiceRules       dice{};
        ResourceRules   resources{};
    };

    struct GridCoord
    {
        uint32_t x{};
        uint32_t y{};
    };
    inline auto operator==(GridCoord const& a, GridCoord const& b) -> bool { return a.x == b.x && a.y == b.y; }

    struct BoardTopology
    {
        uint32_t   size{};
        BoardShape shape{BoardShape::LinearLoop};
        // grid edge length, 0 on loops
        uint32_t   side{};
    };
}

#endif //POLYBOARD_TYPES_HPP
