//
// Movement.hpp
//

#ifndef POLYBOARD_MOVEMENT_HPP
#define POLYBOARD_MOVEMENT_HPP

#include "Types.hpp"
#include "State.hpp"
#include "Board.hpp"

namespace polyboard::core
{
    class CurrencyLedger;

    struct MoveResult
    {
        PlayerIdT player{};
        PosT      from{};
        PosT      to{};
        uint32_t  spaces{};
        // set at most once per move, never by Teleport
        bool      passed_start{false};
    };

    class MovementModel
    {
    public:
        MovementModel() = delete;
        // ledger is null when the currency module is not part of the match
        MovementModel(RuleConfiguration const& rules,
                      Roster& roster,
                      BoardModel const& board,
                      CurrencyLedger* ledger);

        auto Move(PlayerIdT player, uint32_t spaces) -> MoveResult;
        auto Teleport(PlayerIdT player, PosT target) -> void;
        auto Distance(PosT a, PosT b) const -> uint32_t { return board_.Distance(a, b); }
        auto PositionOf(PlayerIdT player) const -> PosT;

        // Returns the amount credited, empty when nothing was paid.
        auto ApplyPassBonus(MoveResult const& move) -> std::optional<MoneyT>;

    private:
        auto At(PlayerIdT player) -> PlayerState&;

    private:
        MoneyT            pass_bonus_;
        Roster&           roster_;
        BoardModel const& board_;
        CurrencyLedger*   ledger_;
    };
}

#endif //POLYBOARD_MOVEMENT_HPP
