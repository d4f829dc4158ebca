//
// Events.hpp
//

#ifndef POLYBOARD_EVENTS_HPP
#define POLYBOARD_EVENTS_HPP

#include <string_view>
#include "Types.hpp"

namespace polyboard::core
{
    enum class DamageKind : uint8_t
    {
        Encounter,    // environment, separate boards
        LandingPvp,   // nearest opponent, shared board
        DirectAttack
    };

    enum class MatchEndReason : uint8_t
    {
        LastPlayerStanding,
        Elimination,
        BalanceThreshold,
        ReachGoal
    };

    struct PlayerMoved       { PlayerIdT player; PosT from; PosT to; uint32_t spaces; };
    struct PassedStart       { PlayerIdT player; };
    struct BonusCredited     { PlayerIdT player; MoneyT amount; MoneyT balance; };
    struct DiceRolled        { PlayerIdT player; std::vector<uint8_t> faces; uint32_t total; bool extra_turn; };
    struct PropertyPurchased { PlayerIdT player; PosT position; MoneyT price; MoneyT balance; };
    struct PurchaseDeclined  { PlayerIdT player; PosT position; MoneyT price; MoneyT balance; };
    struct RentPaid          { PlayerIdT payer; PlayerIdT owner; PosT position; MoneyT amount; MoneyT payer_balance; MoneyT owner_balance; };
    struct PlayerBankrupt    { PlayerIdT player; PlayerIdT creditor; MoneyT balance; };
    struct PropertyReleased  { PosT position; PlayerIdT previous_owner; };
    struct PropertyTraded    { PlayerIdT seller; PlayerIdT buyer; PosT position; MoneyT price; };
    struct DamageDealt       { std::optional<PlayerIdT> attacker; PlayerIdT target; DamageKind kind; int32_t amount; int32_t health; };
    struct PlayerEliminated  { PlayerIdT player; std::optional<PlayerIdT> by; };
    struct TurnChanged       { PlayerIdT player; uint32_t turn_number; };
    struct MatchOver         { std::optional<PlayerIdT> winner; MatchEndReason reason; };

    using MatchEvent = std::variant<
      PlayerMoved, PassedStart, BonusCredited, DiceRolled,
      PropertyPurchased, PurchaseDeclined, RentPaid,
      PlayerBankrupt, PropertyReleased, PropertyTraded,
      DamageDealt, PlayerEliminated, TurnChanged, MatchOver>;

    inline auto to_string(DamageKind k) -> std::string_view
    {
        switch (k)
        {
        case DamageKind::Encounter: return "encounter";
        case DamageKind::LandingPvp: return "landing-pvp";
        case DamageKind::DirectAttack: return "attack";
        }
        return "?";
    }

    inline auto to_string(MatchEndReason r) -> std::string_view
    {
        switch (r)
        {
        case MatchEndReason::LastPlayerStanding: return "last-player-standing";
        case MatchEndReason::Elimination: return "elimination";
        case MatchEndReason::BalanceThreshold: return "balance-threshold";
        case MatchEndReason::ReachGoal: return "reach-goal";
        }
        return "?";
    }

    // Subscribers are owned by the caller and must outlive their subscription.
    class EventSink
    {
    public:
        virtual ~EventSink() = default;

        // Called once per event, in resolution order, after the intent fully resolved.
        virtual auto Publish(MatchEvent const& event) -> void = 0;
    };
}

#endif //POLYBOARD_EVENTS_HPP
