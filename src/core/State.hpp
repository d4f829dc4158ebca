//
// State.hpp
//

#ifndef POLYBOARD_STATE_HPP
#define POLYBOARD_STATE_HPP

#include <set>
#include "Types.hpp"
#include "Actions.hpp"

namespace polyboard::core
{
    struct PlayerState
    {
        PlayerIdT     id{};
        PosT          position{0};
        MoneyT        balance{0};
        bool          active{true};
        std::set<PosT> owned{};
        int32_t       health{0};
    };

    // Indexed by PlayerIdT; ids are stable for the lifetime of a match.
    using Roster = std::vector<PlayerState>;

    struct PropertyRecord
    {
        PosT                     position{};
        std::string              name{};
        MoneyT                   price{};
        MoneyT                   rent{};
        std::optional<PlayerIdT> owner{};
    };

    struct CombatRecord
    {
        PlayerIdT player{};
        int32_t   health{};
        int32_t   max_health{};
        bool      alive{};
    };

    // Immutable per-viewer view exposed to presentation/network (no references into the match)
    struct PlayerView
    {
        PlayerIdT           id{};
        // empty when the viewer cannot see this token
        std::optional<PosT> position{};
        MoneyT              balance{};
        bool                active{};
        int32_t             health{};
        uint32_t            owned_count{};
    };

    struct MatchSnapshot
    {
        PlayerIdT               viewer{};
        PlayerIdT               turn_player{};
        TurnPhase               phase{TurnPhase::AwaitingIntent};
        BoardTopology           topology{};
        uint32_t                turn_number{};
        std::vector<PlayerView> players;
        std::vector<PropertyRecord> properties;

        bool has_currency{false};
        bool has_property{false};
        bool has_combat{false};
    };

} // namespace polyboard::core

#endif //POLYBOARD_STATE_HPP
