//
// TurnResolver.hpp
//

#ifndef POLYBOARD_TURNRESOLVER_HPP
#define POLYBOARD_TURNRESOLVER_HPP

#include <expected>
#include <vector>
#include "Actions.hpp"
#include "Events.hpp"
#include "Exception.hpp"
#include "Match.hpp"

namespace polyboard::core
{
    struct Resolution
    {
        ResolutionOutcome       outcome{ResolutionOutcome::Applied};
        // whose turn it is once this resolution finished
        PlayerIdT               next_player{};
        std::vector<MatchEvent> events{};
    };

    class TurnResolver
    {
    public:
        using Result = std::expected<Resolution, error::RuleViolation>;

        TurnResolver() = delete;
        explicit TurnResolver(MatchState& match);

        // Validate, apply, advance. A rejected intent leaves the match untouched and publishes nothing.
        auto ResolveIntent(Intent const& intent) -> Result;
        auto Validate(Intent const& intent) const -> error::ValidateResult;

        // Sinks are not owned; a sink subscribed twice receives each event twice.
        auto Subscribe(EventSink* sink) -> void;
        auto Unsubscribe(EventSink* sink) -> void;

        auto Match() const noexcept -> MatchState const& { return match_; }

    private:
        auto Apply(Intent const& intent, std::vector<MatchEvent>& events) -> bool;
        auto ResolveMove(PlayerIdT player, uint32_t spaces, std::vector<MatchEvent>& events) -> void;
        auto ResolveLanding(PlayerIdT player, PosT position, std::vector<MatchEvent>& events) -> bool;
        auto ApplyCombat(CombatOutcome const& outcome, std::vector<MatchEvent>& events) -> void;
        auto ReleaseProperties(PlayerIdT player, std::vector<MatchEvent>& events) -> void;
        auto CheckWin(PlayerIdT actor) const -> std::optional<MatchOver>;
        auto Advance(Intent const& intent, bool extra_turn, std::vector<MatchEvent>& events) -> ResolutionOutcome;
        auto Publish(std::vector<MatchEvent> const& events) -> void;

    private:
        MatchState&             match_;
        std::vector<EventSink*> sinks_;
    };
}

#endif //POLYBOARD_TURNRESOLVER_HPP
