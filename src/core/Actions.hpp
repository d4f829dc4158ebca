//
// Actions.hpp
//

#ifndef POLYBOARD_ACTIONS_HPP
#define POLYBOARD_ACTIONS_HPP

#include "Types.hpp"

namespace polyboard::core
{
    struct MoveIntent     { uint32_t spaces{}; };
    // Engine rolls the configured dice and resolves the total as a move.
    struct RollIntent     {};
    // Buys the unowned record under the actor's token.
    struct PurchaseIntent {};
    struct TradeIntent
    {
        PlayerIdT seller{};
        PlayerIdT buyer{};
        PosT      position{};
        MoneyT    price{};
    };
    struct AttackIntent   { PlayerIdT target{}; };

    using IntentAction = std::variant<
      MoveIntent, RollIntent, PurchaseIntent, TradeIntent, AttackIntent>;

    struct Intent
    {
        PlayerIdT    player{};
        IntentAction action{};
    };

    enum class TurnPhase : uint8_t
    {
        AwaitingIntent,
        Resolving,
        MatchOver
    };

    enum class ResolutionOutcome : uint8_t
    {
        Applied,     // turn stays with the actor
        TurnAdvanced,
        ExtraTurn,
        MatchEnded
    };
} // namespace polyboard::core

#endif //POLYBOARD_ACTIONS_HPP
