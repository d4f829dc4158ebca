//
// Property.hpp
//

#ifndef POLYBOARD_PROPERTY_HPP
#define POLYBOARD_PROPERTY_HPP

#include <map>
#include "Types.hpp"
#include "State.hpp"
#include "Exception.hpp"

namespace polyboard::core::debug {struct Inspector;}
namespace polyboard::core
{
    class CurrencyLedger;

    enum class LandingKind : uint8_t
    {
        None,
        Purchased,
        PurchaseDeclined,
        OwnProperty,
        RentPaid,
        Bankrupt  // lander went inactive, see released
    };

    struct LandingOutcome
    {
        LandingKind              kind{LandingKind::None};
        PosT                     position{};
        std::optional<PlayerIdT> owner{};
        MoneyT                   amount{};
        std::vector<PosT>        released{};
    };

    auto to_string(LandingKind k) -> std::string_view;

    class PropertyRegistry
    {
    public:
        PropertyRegistry() = delete;
        PropertyRegistry(RuleConfiguration const& rules, Roster& roster, CurrencyLedger& ledger);

        // Throws on position 0 or a position already holding a record.
        auto AddRecord(PropertyRecord record) -> void;

        auto LandOn(PlayerIdT player, PosT position) -> LandingOutcome;

        // Validation only, nothing is touched.
        auto CheckPurchase(PlayerIdT player, PosT position) const -> error::ValidateResult;
        auto CheckTrade(PlayerIdT seller, PlayerIdT buyer, PosT position, MoneyT price) const -> error::ValidateResult;

        auto Purchase(PlayerIdT player, PosT position) -> error::ValidateResult;
        auto Trade(PlayerIdT seller, PlayerIdT buyer, PosT position, MoneyT price) -> error::ValidateResult;

        // Returns the released positions in ascending order.
        auto ReleaseAll(PlayerIdT player) -> std::vector<PosT>;

        auto Find(PosT position) const -> PropertyRecord const*;
        auto Records() const -> std::vector<PropertyRecord>;
        auto Count() const noexcept -> std::size_t { return records_.size(); }
        auto OwnerOf(PosT position) const -> std::optional<PlayerIdT>;

        friend struct debug::Inspector;

    private:
        auto Assign(PropertyRecord& rec, PlayerIdT owner) -> void;
        auto Unassign(PropertyRecord& rec) -> void;

    private:
        PropertyRules   flags_;
        Roster&         roster_;
        CurrencyLedger& ledger_;
        std::map<PosT, PropertyRecord> records_;
    };
}

#endif //POLYBOARD_PROPERTY_HPP
