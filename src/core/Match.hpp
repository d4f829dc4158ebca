//
// Match.hpp
//

#ifndef POLYBOARD_MATCH_HPP
#define POLYBOARD_MATCH_HPP

#include <memory>
#include <random>
#include "Types.hpp"
#include "State.hpp"
#include "Events.hpp"
#include "RuleAnalyzer.hpp"
#include "Board.hpp"
#include "Ledger.hpp"
#include "Property.hpp"
#include "Combat.hpp"
#include "Movement.hpp"

namespace polyboard::core::debug {struct Inspector;}
namespace polyboard::core
{
    // Owns the roster, the rng and every module of one match. Modules hold references into
    // this object, so it never moves once the Composer built it.
    class MatchState
    {
    public:
        MatchState() = delete;
        MatchState(RuleConfiguration const& rules, Archetype archetype, uint8_t players, uint64_t seed);

        MatchState(MatchState const&) = delete;
        auto operator=(MatchState const&) -> MatchState& = delete;
        MatchState(MatchState&&) = delete;
        auto operator=(MatchState&&) -> MatchState& = delete;

        auto Rules() const noexcept      -> RuleConfiguration const& { return rules_; }
        auto Kind() const noexcept       -> Archetype const& { return archetype_; }
        auto Seed() const noexcept       -> uint64_t { return seed_; }
        auto Players() const noexcept    -> Roster const& { return roster_; }
        auto PlayerCount() const noexcept -> std::size_t { return roster_.size(); }
        auto Player(PlayerIdT id) const  -> PlayerState const&;

        auto Board() const noexcept    -> BoardModel const& { return *board_; }
        auto Movement() const noexcept -> MovementModel const& { return *movement_; }
        // null when the module is not part of this match
        auto Ledger() const noexcept   -> CurrencyLedger const* { return ledger_.get(); }
        auto Property() const noexcept -> PropertyRegistry const* { return property_.get(); }
        auto Combat() const noexcept   -> CombatModel const* { return combat_.get(); }

        auto HasCurrency() const noexcept -> bool { return static_cast<bool>(ledger_); }
        auto HasProperty() const noexcept -> bool { return static_cast<bool>(property_); }
        auto HasCombat() const noexcept   -> bool { return static_cast<bool>(combat_); }

        auto CurrentPlayer() const noexcept -> PlayerIdT { return current_; }
        auto PhaseNow() const noexcept      -> TurnPhase { return phase_; }
        auto TurnNumber() const noexcept    -> uint32_t { return turn_number_; }
        auto Winner() const noexcept        -> std::optional<PlayerIdT> { return winner_; }
        auto EndReason() const noexcept     -> std::optional<MatchEndReason> { return end_reason_; }
        auto IsOver() const noexcept        -> bool { return phase_ == TurnPhase::MatchOver; }

        auto SnapshotFor(PlayerIdT viewer) const -> std::shared_ptr<MatchSnapshot const>;

        // Next active player after `from`, wrapping; throws when nobody is active.
        auto NextActivePlayer(PlayerIdT from) const -> PlayerIdT;

        friend class Composer;
        friend class TurnResolver;
        friend struct debug::Inspector;

    private:
        auto CanSee(PlayerIdT viewer, PlayerIdT other) const -> bool;

    private:
        RuleConfiguration rules_;
        Archetype         archetype_;
        uint64_t          seed_;
        std::mt19937_64   rng_;
        Roster            roster_;

        // construction order: board, ledger, property, combat, movement
        std::unique_ptr<BoardModel>       board_;
        std::unique_ptr<CurrencyLedger>   ledger_;
        std::unique_ptr<PropertyRegistry> property_;
        std::unique_ptr<CombatModel>      combat_;
        std::unique_ptr<MovementModel>    movement_;

        PlayerIdT                     current_{0};
        TurnPhase                     phase_{TurnPhase::AwaitingIntent};
        uint32_t                      turn_number_{1};
        std::optional<PlayerIdT>      winner_{};
        std::optional<MatchEndReason> end_reason_{};
    };
}

#endif //POLYBOARD_MATCH_HPP
