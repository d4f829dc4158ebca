//
// Combat.hpp
//

#ifndef POLYBOARD_COMBAT_HPP
#define POLYBOARD_COMBAT_HPP

#include <expected>
#include <random>
#include "Types.hpp"
#include "State.hpp"
#include "Events.hpp"
#include "Exception.hpp"

namespace polyboard::core
{
    struct CombatOutcome
    {
        std::optional<PlayerIdT> attacker{};   // empty for environment encounters
        PlayerIdT                target{};
        DamageKind               kind{DamageKind::Encounter};
        int32_t                  damage{};
        int32_t                  health{};
        bool                     eliminated{false};
    };

    class CombatModel
    {
    public:
        CombatModel() = delete;
        CombatModel(RuleConfiguration const& rules, Roster& roster, std::mt19937_64& rng);

        static auto IsCombatSpace(PosT position) noexcept -> bool
        {
            return position != 0 && position % constants::CombatInterval == 0;
        }

        auto ResolveLanding(PlayerIdT player, PosT position) -> std::optional<CombatOutcome>;
        auto Attack(PlayerIdT attacker, PlayerIdT target) -> std::expected<CombatOutcome, error::RuleViolation>;
        auto CheckAttack(PlayerIdT attacker, PlayerIdT target) const -> error::ValidateResult;

        // Health clamps at 0; reaching 0 eliminates. Returns the health left.
        auto ApplyDamage(PlayerIdT target, int32_t amount) -> int32_t;
        auto Heal(PlayerIdT player, int32_t amount) -> int32_t;

        auto Record(PlayerIdT player) const -> CombatRecord;
        auto HasPlayerWon(PlayerIdT player) const -> bool;
        auto MaxHealth() const noexcept -> int32_t { return max_health_; }

    private:
        auto Roll(DamageRange range) -> int32_t;
        auto NearestOpponent(PlayerIdT player) const -> std::optional<PlayerIdT>;
        auto At(PlayerIdT player) -> PlayerState&;
        auto At(PlayerIdT player) const -> PlayerState const&;

    private:
        bool             separate_boards_;
        int32_t          max_health_;
        DamageRange      encounter_;
        DamageRange      landing_pvp_;
        DamageRange      direct_attack_;
        Roster&          roster_;
        std::mt19937_64& rng_;
    };
}

#endif //POLYBOARD_COMBAT_HPP
