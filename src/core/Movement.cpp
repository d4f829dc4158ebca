//
// Movement.cpp
//

#include "Movement.hpp"

#include <algorithm>
#include <format>
#include "Exception.hpp"
#include "Ledger.hpp"
#include "Util.hpp"

namespace polyboard::core
{
    MovementModel::MovementModel(RuleConfiguration const& rules,
                                 Roster& roster,
                                 BoardModel const& board,
                                 CurrencyLedger* ledger) :
        pass_bonus_(rules.currency.enabled ? rules.currency.pass_bonus : 0),
        roster_(roster),
        board_(board),
        ledger_(ledger)
    {
    }

    auto MovementModel::At(PlayerIdT const player) -> PlayerState&
    {
        if (!util::IsKnownPlayer(roster_, player))
            PBD_THROW(error::Code::State, std::format("Movement: unknown player {}", static_cast<int>(player)));
        return roster_[player];
    }

    auto MovementModel::PositionOf(PlayerIdT const player) const -> PosT
    {
        if (!util::IsKnownPlayer(roster_, player))
            PBD_THROW(error::Code::State, std::format("Movement: unknown player {}", static_cast<int>(player)));
        return roster_[player].position;
    }

    auto MovementModel::Move(PlayerIdT const player, uint32_t const spaces) -> MoveResult
    {
        PlayerState& p = At(player);
        uint32_t const size = board_.Size();

        MoveResult res{ .player = player, .from = p.position, .to = p.position, .spaces = spaces };

        if (board_.IsGrid())
        {
            uint64_t const target = static_cast<uint64_t>(p.position) + spaces;
            res.to = static_cast<PosT>(std::min<uint64_t>(target, board_.Goal()));
        }
        else
        {
            res.to = static_cast<PosT>((static_cast<uint64_t>(p.position) + spaces) % size);
            // one flag no matter how many laps
            res.passed_start = (res.to < res.from) || (spaces >= size);
        }

        p.position = res.to;
        PBD_ASSERT(board_.IsValid(p.position), "Move left the board");
        return res;
    }

    auto MovementModel::Teleport(PlayerIdT const player, PosT const target) -> void
    {
        if (!board_.IsValid(target))
            PBD_THROW(error::Code::State, std::format("Teleport target {} outside board of {}", target, board_.Size()));
        At(player).position = target;
    }

    auto MovementModel::ApplyPassBonus(MoveResult const& move) -> std::optional<MoneyT>
    {
        if (!move.passed_start || ledger_ == nullptr || pass_bonus_ <= 0)
            return std::nullopt;

        ledger_->Credit(move.player, pass_bonus_);
        return pass_bonus_;
    }
}
