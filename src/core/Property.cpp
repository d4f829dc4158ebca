//
// Property.cpp
//

#include "Property.hpp"

#include <format>
#include "Ledger.hpp"
#include "Util.hpp"

namespace
{
    inline auto Viol(polyboard::core::error::RuleViolationCode code) -> polyboard::core::error::RuleViolation
    {
        return polyboard::core::error::RuleViolation{ .code = code };
    }
}

namespace polyboard::core
{
    auto to_string(LandingKind const k) -> std::string_view
    {
        switch (k)
        {
        case LandingKind::None: return "none";
        case LandingKind::Purchased: return "purchased";
        case LandingKind::PurchaseDeclined: return "purchase-declined";
        case LandingKind::OwnProperty: return "own-property";
        case LandingKind::RentPaid: return "rent-paid";
        case LandingKind::Bankrupt: return "bankrupt";
        }
        return "?";
    }

    PropertyRegistry::PropertyRegistry(RuleConfiguration const& rules, Roster& roster, CurrencyLedger& ledger) :
        flags_(rules.property),
        roster_(roster),
        ledger_(ledger)
    {
    }

    auto PropertyRegistry::AddRecord(PropertyRecord record) -> void
    {
        if (record.position == 0)
            PBD_THROW(error::Code::Rules, "Property record cannot sit on the start space");
        if (records_.contains(record.position))
            PBD_THROW(error::Code::Rules, std::format("Duplicate property record at {}", record.position));
        if (record.price < 0 || record.rent < 0)
            PBD_THROW(error::Code::Rules, std::format("Negative price/rent for record at {}", record.position));

        std::optional<PlayerIdT> const owner = record.owner;
        if (owner.has_value() && !util::IsKnownPlayer(roster_, *owner))
            PBD_THROW(error::Code::State, std::format("Unknown owner {}", static_cast<int>(*owner)));
        record.owner.reset();
        auto [it, inserted] = records_.emplace(record.position, std::move(record));
        PBD_ASSERT(inserted, "Record insertion failed");
        if (owner.has_value()) Assign(it->second, *owner);
    }

    auto PropertyRegistry::Assign(PropertyRecord& rec, PlayerIdT const owner) -> void
    {
        if (!util::IsKnownPlayer(roster_, owner))
            PBD_THROW(error::Code::State, std::format("Unknown owner {}", static_cast<int>(owner)));
        PBD_ASSERT(!rec.owner.has_value(), "Assigning an owned record");
        rec.owner = owner;
        roster_[owner].owned.insert(rec.position);
    }

    auto PropertyRegistry::Unassign(PropertyRecord& rec) -> void
    {
        PBD_ASSERT(rec.owner.has_value(), "Releasing an unowned record");
        roster_[*rec.owner].owned.erase(rec.position);
        rec.owner.reset();
    }

    auto PropertyRegistry::Find(PosT const position) const -> PropertyRecord const*
    {
        auto const it = records_.find(position);
        return (it != std::cend(records_)) ? &it->second : nullptr;
    }

    auto PropertyRegistry::OwnerOf(PosT const position) const -> std::optional<PlayerIdT>
    {
        PropertyRecord const* rec = Find(position);
        return rec ? rec->owner : std::nullopt;
    }

    auto PropertyRegistry::Records() const -> std::vector<PropertyRecord>
    {
        std::vector<PropertyRecord> out;
        out.reserve(records_.size());
        for (auto const& [pos, rec] : records_) out.push_back(rec);
        return out;
    }

    auto PropertyRegistry::LandOn(PlayerIdT const player, PosT const position) -> LandingOutcome
    {
        if (!util::IsKnownPlayer(roster_, player))
            PBD_THROW(error::Code::State, std::format("LandOn: unknown player {}", static_cast<int>(player)));

        LandingOutcome out{ .position = position };
        auto const it = records_.find(position);
        if (it == std::end(records_)) return out;

        PropertyRecord& rec = it->second;
        out.owner = rec.owner;

        if (!rec.owner.has_value())
        {
            if (!flags_.purchasable) return out;

            out.amount = rec.price;
            // all or nothing
            if (ledger_.Debit(player, rec.price).has_value())
            {
                Assign(rec, player);
                out.kind = LandingKind::Purchased;
                out.owner = player;
            }
            else
            {
                out.kind = LandingKind::PurchaseDeclined;
            }
            return out;
        }

        PlayerIdT const owner = *rec.owner;
        if (owner == player)
        {
            out.kind = LandingKind::OwnProperty;
            return out;
        }

        if (!flags_.rent_collectible || !roster_[owner].active) return out;

        out.amount = rec.rent;
        if (ledger_.Transfer(player, owner, rec.rent).has_value())
        {
            out.kind = LandingKind::RentPaid;
            return out;
        }

        // could not cover the rent: out, along with everything owned
        roster_[player].active = false;
        out.released = ReleaseAll(player);
        out.kind = LandingKind::Bankrupt;
        return out;
    }

    auto PropertyRegistry::CheckPurchase(PlayerIdT const player, PosT const position) const -> error::ValidateResult
    {
        using RVC = error::RuleViolationCode;

        if (!flags_.purchasable)
            return std::unexpected(Viol(RVC::Feature_PurchaseDisabled).with_actor(player));

        if (!util::IsKnownPlayer(roster_, player))
            return std::unexpected(Viol(RVC::UnknownPlayer).with_actor(player));

        PropertyRecord const* rec = Find(position);
        if (rec == nullptr)
            return std::unexpected(Viol(RVC::Purchase_NoProperty).with_actor(player).with_position(position));

        if (rec->owner.has_value())
            return std::unexpected(Viol(RVC::Purchase_AlreadyOwned)
                                   .with_actor(player).with_position(position).with_target(*rec->owner));

        if (!ledger_.CanAfford(player, rec->price))
            return std::unexpected(Viol(RVC::Purchase_InsufficientFunds)
                                   .with_actor(player).with_position(position)
                                   .with_amount(rec->price).with_balance(ledger_.Balance(player)));
        return {};
    }

    auto PropertyRegistry::Purchase(PlayerIdT const player, PosT const position) -> error::ValidateResult
    {
        if (auto const ok = CheckPurchase(player, position); !ok.has_value())
            return ok;

        PropertyRecord& rec = records_.at(position);
        auto const paid = ledger_.Debit(player, rec.price);
        PBD_ASSERT(paid.has_value(), "Debit failed after affordability check");
        Assign(rec, player);
        return {};
    }

    auto PropertyRegistry::CheckTrade(PlayerIdT const seller, PlayerIdT const buyer,
                                      PosT const position, MoneyT const price) const -> error::ValidateResult
    {
        using RVC = error::RuleViolationCode;

        if (!flags_.tradable)
            return std::unexpected(Viol(RVC::Feature_TradingDisabled).with_actor(seller));

        if (!util::IsKnownPlayer(roster_, seller))
            return std::unexpected(Viol(RVC::UnknownPlayer).with_actor(seller));

        PropertyRecord const* rec = Find(position);
        if (rec == nullptr)
            return std::unexpected(Viol(RVC::Trade_NoProperty).with_position(position));

        if (rec->owner != seller)
            return std::unexpected(Viol(RVC::Trade_SellerNotOwner).with_actor(seller).with_position(position));

        if (!util::IsKnownPlayer(roster_, buyer))
            return std::unexpected(Viol(RVC::Trade_UnknownBuyer).with_target(buyer));

        if (buyer == seller)
            return std::unexpected(Viol(RVC::Trade_SamePlayer).with_actor(seller).with_target(buyer));

        if (!roster_[buyer].active)
            return std::unexpected(Viol(RVC::Trade_BuyerInactive).with_target(buyer));

        if (price < 0)
            return std::unexpected(Viol(RVC::Trade_NegativePrice).with_amount(price));

        if (!ledger_.CanAfford(buyer, price))
            return std::unexpected(Viol(RVC::Trade_InsufficientFunds)
                                   .with_target(buyer).with_amount(price).with_balance(ledger_.Balance(buyer)));
        return {};
    }

    auto PropertyRegistry::Trade(PlayerIdT const seller, PlayerIdT const buyer,
                                 PosT const position, MoneyT const price) -> error::ValidateResult
    {
        if (auto const ok = CheckTrade(seller, buyer, position, price); !ok.has_value())
            return ok;

        // money first, ownership only once it cleared
        if (auto const paid = ledger_.Transfer(buyer, seller, price); !paid.has_value())
        {
            return std::unexpected(Viol(error::RuleViolationCode::Trade_InsufficientFunds)
                                   .with_target(buyer).with_amount(price).with_balance(paid.error().balance));
        }

        PropertyRecord& rec = records_.at(position);
        Unassign(rec);
        Assign(rec, buyer);
        return {};
    }

    auto PropertyRegistry::ReleaseAll(PlayerIdT const player) -> std::vector<PosT>
    {
        std::vector<PosT> released;
        for (auto& [pos, rec] : records_)
        {
            if (rec.owner == player)
            {
                Unassign(rec);
                released.push_back(pos);
            }
        }
        PBD_ASSERT(!util::IsKnownPlayer(roster_, player) || roster_[player].owned.empty(),
                   "Owned set not empty after release");
        return released;
    }
}
