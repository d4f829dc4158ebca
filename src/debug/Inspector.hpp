//
// Inspector.hpp
//

#ifndef POLYBOARD_INSPECTOR_HPP
#define POLYBOARD_INSPECTOR_HPP

#include <vector>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ranges>

#include "../core/Types.hpp"
#include "../core/Match.hpp"

namespace polyboard::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            Roster players;
            std::vector<PropertyRecord> properties;
            PlayerIdT current{};
            TurnPhase phase{};
            uint32_t turn_number{};
            std::optional<PlayerIdT> winner{};

            uint32_t board_size{};
            bool has_currency{}, has_property{}, has_combat{};
            int32_t max_health{};
        };

        static inline auto Gather(MatchState const& m) -> SnapshotAll
        {
            SnapshotAll ret{};
            ret.players = m.roster_;
            ret.current = m.current_;
            ret.phase = m.phase_;
            ret.turn_number = m.turn_number_;
            ret.winner = m.winner_;
            ret.board_size = m.board_->Size();
            ret.has_currency = static_cast<bool>(m.ledger_);
            ret.has_property = static_cast<bool>(m.property_);
            ret.has_combat = static_cast<bool>(m.combat_);
            ret.max_health = m.rules_.combat.max_health;

            if (m.property_)
            {
                ret.properties.reserve(m.property_->records_.size());
                std::ranges::copy(m.property_->records_ | std::views::values, std::back_inserter(ret.properties));
            }
            return ret;
        }

        // ----- test setup; bypasses every rule -----

        static inline auto SetPosition(MatchState& m, PlayerIdT p, PosT pos) -> void
        {
            m.roster_.at(p).position = pos;
        }

        static inline auto SetBalance(MatchState& m, PlayerIdT p, MoneyT balance) -> void
        {
            m.roster_.at(p).balance = balance;
        }

        static inline auto SetHealth(MatchState& m, PlayerIdT p, int32_t health) -> void
        {
            m.roster_.at(p).health = health;
        }

        static inline auto SetActive(MatchState& m, PlayerIdT p, bool active) -> void
        {
            m.roster_.at(p).active = active;
        }

        static inline auto SetCurrent(MatchState& m, PlayerIdT p) -> void
        {
            m.current_ = p;
        }

        static inline auto Rng(MatchState& m) -> std::mt19937_64&
        {
            return m.rng_;
        }

        // Replaces whatever the composer placed with the given records.
        static inline auto ResetProperties(MatchState& m, std::vector<PropertyRecord> const& records) -> void
        {
            PropertyRegistry& reg = *m.property_;
            for (PlayerState& p : m.roster_) p.owned.clear();
            reg.records_.clear();
            for (PropertyRecord const& r : records) reg.AddRecord(r);
        }

        static inline auto GiveProperty(MatchState& m, PosT position, PlayerIdT owner) -> void
        {
            PropertyRegistry& reg = *m.property_;
            PropertyRecord& rec = reg.records_.at(position);
            if (rec.owner.has_value()) reg.Unassign(rec);
            reg.Assign(rec, owner);
        }
    };
}

#endif //POLYBOARD_INSPECTOR_HPP
