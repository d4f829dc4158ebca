//
// Match.cpp
//

#include "Match.hpp"

#include <format>
#include "Exception.hpp"
#include "Util.hpp"

namespace polyboard::core
{
    MatchState::MatchState(RuleConfiguration const& rules, Archetype archetype, uint8_t const players, uint64_t const seed) :
        rules_(rules),
        archetype_(archetype),
        seed_(seed),
        rng_{seed},
        roster_(players)
    {
        PBD_ASSERT(players >= 1, "Match built without players");
        for (std::size_t i{}; i < roster_.size(); ++i)
        {
            PlayerState& p = roster_[i];
            p.id = static_cast<PlayerIdT>(i);
            p.position = 0;
            p.balance = rules_.currency.enabled ? rules_.currency.starting_balance : 0;
            p.active = true;
            p.health = rules_.combat.enabled ? rules_.combat.max_health : 0;
        }
    }

    auto MatchState::Player(PlayerIdT const id) const -> PlayerState const&
    {
        if (!util::IsKnownPlayer(roster_, id))
            PBD_THROW(error::Code::State, std::format("Unknown player {}", static_cast<int>(id)));
        return roster_[id];
    }

    auto MatchState::NextActivePlayer(PlayerIdT const from) const -> PlayerIdT
    {
        std::size_t const n = roster_.size();
        std::size_t i{from};
        for (std::size_t j{}; j < n; ++j)
        {
            i = (i + 1) % n;
            if (roster_[i].active) return static_cast<PlayerIdT>(i);
        }
        PBD_THROW(error::Code::State, "No active players");
    }

    auto MatchState::CanSee(PlayerIdT const viewer, PlayerIdT const other) const -> bool
    {
        if (viewer == other) return true;
        if (!rules_.visibility.enemy_tokens_visible) return false;
        if (rules_.visibility.range < 0) return true;

        uint32_t const d = board_->Distance(roster_[viewer].position, roster_[other].position);
        return d <= static_cast<uint32_t>(rules_.visibility.range);
    }

    auto MatchState::SnapshotFor(PlayerIdT const viewer) const -> std::shared_ptr<MatchSnapshot const>
    {
        if (!util::IsKnownPlayer(roster_, viewer))
            PBD_THROW(error::Code::State, std::format("Snapshot for unknown viewer {}", static_cast<int>(viewer)));

        std::shared_ptr<MatchSnapshot> snap = std::make_shared<MatchSnapshot>();
        snap->viewer = viewer;
        snap->turn_player = current_;
        snap->phase = phase_;
        snap->topology = board_->Topology();
        snap->turn_number = turn_number_;
        snap->has_currency = HasCurrency();
        snap->has_property = HasProperty();
        snap->has_combat = HasCombat();

        snap->players.reserve(roster_.size());
        for (PlayerState const& p : roster_)
        {
            PlayerView v{};
            v.id = p.id;
            if (CanSee(viewer, p.id)) v.position = p.position;
            v.balance = p.balance;
            v.active = p.active;
            v.health = p.health;
            v.owned_count = static_cast<uint32_t>(p.owned.size());
            snap->players.push_back(v);
        }

        if (property_) snap->properties = property_->Records();
        return snap;
    }
}
