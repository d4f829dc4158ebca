//
// RandomAgent.cpp
//

#include "RandomAgent.hpp"

#include <algorithm>
#include <ranges>

namespace polyboard::core
{
    RandomAgent::RandomAgent(uint64_t rng_seed, RuleConfiguration const& rules):
        rng_(static_cast<std::mt19937::result_type>(rng_seed)),
        property_(rules.property),
        combat_(rules.combat.enabled) {}

    auto RandomAgent::Decide(std::shared_ptr<MatchSnapshot const> snapshot) -> Intent
    {
        MatchSnapshot const& s = *snapshot;

        if (auto buy = TryPurchase(s); buy.has_value()) return *buy;
        if (auto trade = TryTrade(s); trade.has_value()) return *trade;
        if (auto attack = TryAttack(s); attack.has_value()) return *attack;

        return Intent{ .player = s.viewer, .action = RollIntent{} };
    }

    auto RandomAgent::TryPurchase(MatchSnapshot const& s) -> std::optional<Intent>
    {
        if (!s.has_property || !property_.purchasable) return std::nullopt;

        PlayerView const& me = s.players[s.viewer];
        if (!me.position.has_value()) return std::nullopt;

        auto const it = std::ranges::find_if(s.properties,
                                             [&me](PropertyRecord const& r) { return r.position == *me.position; });
        if (it == std::cend(s.properties) || it->owner.has_value() || it->price > me.balance) return std::nullopt;

        if (!chance(2)) return std::nullopt;
        return Intent{ .player = s.viewer, .action = PurchaseIntent{} };
    }

    auto RandomAgent::TryTrade(MatchSnapshot const& s) -> std::optional<Intent>
    {
        if (!s.has_property || !property_.tradable) return std::nullopt;
        if (!chance(10)) return std::nullopt;

        std::vector<PropertyRecord const*> mine;
        for (PropertyRecord const& r : s.properties)
        {
            if (r.owner == s.viewer) mine.push_back(&r);
        }
        std::vector<PlayerView const*> buyers;
        for (PlayerView const& p : s.players)
        {
            if (p.id != s.viewer && p.active) buyers.push_back(&p);
        }
        if (mine.empty() || buyers.empty()) return std::nullopt;

        PropertyRecord const* rec = mine[pick(mine)];
        PlayerView const* buyer = buyers[pick(buyers)];
        MoneyT const price = std::min(rec->price / 2, buyer->balance);

        return Intent{ .player = s.viewer,
                       .action = TradeIntent{ .seller = s.viewer, .buyer = buyer->id,
                                              .position = rec->position, .price = price } };
    }

    auto RandomAgent::TryAttack(MatchSnapshot const& s) -> std::optional<Intent>
    {
        if (!s.has_combat || !combat_) return std::nullopt;
        if (!chance(4)) return std::nullopt;

        std::vector<PlayerIdT> targets;
        for (PlayerView const& p : s.players)
        {
            if (p.id != s.viewer && p.active) targets.push_back(p.id);
        }
        if (targets.empty()) return std::nullopt;

        return Intent{ .player = s.viewer, .action = AttackIntent{ .target = targets[pick(targets)] } };
    }
}
