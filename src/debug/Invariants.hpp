//
// Invariants.hpp
//

#ifndef POLYBOARD_INVARIANTS_HPP
#define POLYBOARD_INVARIANTS_HPP

#include "../core/Match.hpp"
#include "../core/Exception.hpp"
#include "Inspector.hpp"
#include <algorithm>
#include <set>

namespace polyboard::core::debug
{
    // Cross-module checks that no single module can see on its own.
    inline auto CheckInvariants(MatchState const& m) -> void
    {
#if PBD_ENABLE_TEST_HOOKS == false
        (void)m;
#else
        Inspector::SnapshotAll const s = Inspector::Gather(m);

        // 1) Tokens stay on the board
        for (PlayerState const& p : s.players)
        {
            PBD_ASSERT(p.position < s.board_size, "Token off the board");
        }

        // 2) No negative balance survives a resolution
        if (s.has_currency)
        {
            for (PlayerState const& p : s.players)
                PBD_ASSERT(p.balance >= 0, "Negative balance after resolution");
        }

        // 3) Health within [0, max], zero health means eliminated
        if (s.has_combat)
        {
            for (PlayerState const& p : s.players)
            {
                PBD_ASSERT(p.health >= 0 && p.health <= s.max_health, "Health out of range");
                PBD_ASSERT(p.health > 0 || !p.active, "Active player with zero health");
            }
        }

        // 4) Ownership: record owner <=> owned set, owners are active
        {
            std::size_t owned_total{};
            for (PlayerState const& p : s.players) owned_total += p.owned.size();

            std::size_t owned_records{};
            for (PropertyRecord const& r : s.properties)
            {
                if (!r.owner.has_value()) continue;
                ++owned_records;
                PBD_ASSERT(*r.owner < s.players.size(), "Owner is not on the roster");
                PlayerState const& owner = s.players[*r.owner];
                PBD_ASSERT(owner.active, "Inactive player still owns property");
                PBD_ASSERT(owner.owned.contains(r.position), "Owner's set is missing a record");
            }
            PBD_ASSERT(owned_total == owned_records, "Owned sets and records disagree");
        }

        // 5) Turn holder is active while the match runs
        if (s.phase != TurnPhase::MatchOver)
        {
            PBD_ASSERT(s.current < s.players.size() && s.players[s.current].active, "Turn held by an inactive player");
        }
        else if (s.winner.has_value())
        {
            PBD_ASSERT(s.players.at(*s.winner).active, "Winner is not active");
        }
#endif // PBD_ENABLE_TEST_HOOKS == true
    }
}

#endif //POLYBOARD_INVARIANTS_HPP
