//
// Combat.cpp
//

#include "Combat.hpp"

#include <algorithm>
#include <format>
#include "Util.hpp"

namespace
{
    inline auto Viol(polyboard::core::error::RuleViolationCode code) -> polyboard::core::error::RuleViolation
    {
        return polyboard::core::error::RuleViolation{ .code = code };
    }
}

namespace polyboard::core
{
    CombatModel::CombatModel(RuleConfiguration const& rules, Roster& roster, std::mt19937_64& rng) :
        separate_boards_(rules.board.separate_boards),
        max_health_(rules.combat.max_health),
        encounter_(rules.combat.encounter),
        landing_pvp_(rules.combat.landing_pvp),
        direct_attack_(rules.combat.direct_attack),
        roster_(roster),
        rng_(rng)
    {
        PBD_ASSERT(max_health_ > 0, "Combat built with non-positive max health");
    }

    auto CombatModel::At(PlayerIdT const player) -> PlayerState&
    {
        if (!util::IsKnownPlayer(roster_, player))
            PBD_THROW(error::Code::State, std::format("Combat: unknown player {}", static_cast<int>(player)));
        return roster_[player];
    }

    auto CombatModel::At(PlayerIdT const player) const -> PlayerState const&
    {
        if (!util::IsKnownPlayer(roster_, player))
            PBD_THROW(error::Code::State, std::format("Combat: unknown player {}", static_cast<int>(player)));
        return roster_[player];
    }

    auto CombatModel::Roll(DamageRange const range) -> int32_t
    {
        return std::uniform_int_distribution<int32_t>{range.min, range.max}(rng_);
    }

    auto CombatModel::NearestOpponent(PlayerIdT const player) const -> std::optional<PlayerIdT>
    {
        PosT const from = roster_[player].position;
        std::optional<PlayerIdT> best{};
        uint32_t best_dist{};

        // ascending id order, so strict less keeps the lowest id on ties
        for (PlayerState const& p : roster_)
        {
            if (p.id == player || !p.active) continue;
            uint32_t const d = (p.position > from) ? p.position - from : from - p.position;
            if (!best.has_value() || d < best_dist)
            {
                best = p.id;
                best_dist = d;
            }
        }
        return best;
    }

    auto CombatModel::ResolveLanding(PlayerIdT const player, PosT const position) -> std::optional<CombatOutcome>
    {
        if (!IsCombatSpace(position)) return std::nullopt;
        if (!At(player).active) return std::nullopt;

        if (separate_boards_)
        {
            int32_t const dmg = Roll(encounter_);
            int32_t const left = ApplyDamage(player, dmg);
            return CombatOutcome{
                .target = player, .kind = DamageKind::Encounter,
                .damage = dmg, .health = left, .eliminated = left <= 0 };
        }

        std::optional<PlayerIdT> const opp = NearestOpponent(player);
        if (!opp.has_value()) return std::nullopt;

        int32_t const dmg = Roll(landing_pvp_);
        int32_t const left = ApplyDamage(*opp, dmg);
        return CombatOutcome{
            .attacker = player, .target = *opp, .kind = DamageKind::LandingPvp,
            .damage = dmg, .health = left, .eliminated = left <= 0 };
    }

    auto CombatModel::CheckAttack(PlayerIdT const attacker, PlayerIdT const target) const -> error::ValidateResult
    {
        using RVC = error::RuleViolationCode;

        if (!util::IsKnownPlayer(roster_, attacker))
            return std::unexpected(Viol(RVC::UnknownPlayer).with_actor(attacker));
        if (attacker == target)
            return std::unexpected(Viol(RVC::Attack_SelfTarget).with_actor(attacker).with_target(target));
        if (!util::IsKnownPlayer(roster_, target))
            return std::unexpected(Viol(RVC::Attack_UnknownTarget).with_actor(attacker).with_target(target));
        if (!roster_[target].active)
            return std::unexpected(Viol(RVC::Attack_TargetInactive).with_actor(attacker).with_target(target));
        return {};
    }

    auto CombatModel::Attack(PlayerIdT const attacker, PlayerIdT const target)
        -> std::expected<CombatOutcome, error::RuleViolation>
    {
        if (auto const ok = CheckAttack(attacker, target); !ok.has_value())
            return std::unexpected(ok.error());

        int32_t const dmg = Roll(direct_attack_);
        int32_t const left = ApplyDamage(target, dmg);
        return CombatOutcome{
            .attacker = attacker, .target = target, .kind = DamageKind::DirectAttack,
            .damage = dmg, .health = left, .eliminated = left <= 0 };
    }

    auto CombatModel::ApplyDamage(PlayerIdT const target, int32_t const amount) -> int32_t
    {
        if (amount < 0)
            PBD_THROW(error::Code::Rules, std::format("Negative damage {}", amount));

        PlayerState& p = At(target);
        p.health = std::max(0, p.health - amount);
        if (p.health == 0) p.active = false;

        PBD_ASSERT(p.health >= 0 && p.health <= max_health_, "Health out of range after damage");
        return p.health;
    }

    auto CombatModel::Heal(PlayerIdT const player, int32_t const amount) -> int32_t
    {
        if (amount < 0)
            PBD_THROW(error::Code::Rules, std::format("Negative heal {}", amount));

        PlayerState& p = At(player);
        // no revival
        if (p.health == 0) return 0;
        p.health = amount >= max_health_ - p.health ? max_health_ : p.health + amount;
        return p.health;
    }

    auto CombatModel::Record(PlayerIdT const player) const -> CombatRecord
    {
        PlayerState const& p = At(player);
        return CombatRecord{ .player = player, .health = p.health, .max_health = max_health_, .alive = p.health > 0 };
    }

    auto CombatModel::HasPlayerWon(PlayerIdT const player) const -> bool
    {
        if (!util::IsKnownPlayer(roster_, player)) return false;
        return util::CountActive(roster_) == 1 && roster_[player].active;
    }
}
