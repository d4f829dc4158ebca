#include <gtest/gtest.h>
#include <limits>
#include <random>

#include "../core/Combat.hpp"
#include "../core/Presets.hpp"
#include "../core/Exception.hpp"
#include "Fixtures.hpp"

using namespace polyboard::core;
using polyboard::test::MakeRoster;

namespace
{
    auto SharedBoardRules() -> RuleConfiguration
    {
        RuleConfiguration r = presets::Race();
        r.combat.enabled = true;
        return r;
    }
}

TEST(Combat, Combat_Spaces)
{
    EXPECT_FALSE(CombatModel::IsCombatSpace(0));
    EXPECT_TRUE(CombatModel::IsCombatSpace(7));
    EXPECT_TRUE(CombatModel::IsCombatSpace(14));
    EXPECT_TRUE(CombatModel::IsCombatSpace(98));
    EXPECT_FALSE(CombatModel::IsCombatSpace(8));
}

TEST(Combat, Separate_Boards_Hit_The_Lander)
{
    RuleConfiguration const rules = presets::GridCombat();
    Roster roster = MakeRoster(2, 0, 100);
    std::mt19937_64 rng{5};
    CombatModel combat(rules, roster, rng);

    EXPECT_FALSE(combat.ResolveLanding(0, 8).has_value());

    auto const hit = combat.ResolveLanding(0, 7);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->kind, DamageKind::Encounter);
    EXPECT_FALSE(hit->attacker.has_value());
    EXPECT_EQ(hit->target, 0);
    EXPECT_GE(hit->damage, rules.combat.encounter.min);
    EXPECT_LE(hit->damage, rules.combat.encounter.max);
    EXPECT_EQ(hit->health, 100 - hit->damage);
    EXPECT_EQ(roster[0].health, hit->health);
    EXPECT_EQ(roster[1].health, 100);
}

TEST(Combat, Shared_Board_Hits_Nearest_Opponent)
{
    RuleConfiguration const rules = SharedBoardRules();
    Roster roster = MakeRoster(3, 0, 100);
    std::mt19937_64 rng{5};
    CombatModel combat(rules, roster, rng);

    roster[0].position = 7;
    roster[1].position = 11;
    roster[2].position = 4;
    auto const hit = combat.ResolveLanding(0, 7);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->kind, DamageKind::LandingPvp);
    EXPECT_EQ(hit->attacker, PlayerIdT{0});
    EXPECT_EQ(hit->target, 2);
    EXPECT_GE(hit->damage, rules.combat.landing_pvp.min);
    EXPECT_LE(hit->damage, rules.combat.landing_pvp.max);
}

TEST(Combat, Nearest_Opponent_Tie_Goes_To_Lowest_Id)
{
    RuleConfiguration const rules = SharedBoardRules();
    Roster roster = MakeRoster(3, 0, 100);
    std::mt19937_64 rng{5};
    CombatModel combat(rules, roster, rng);

    roster[0].position = 14;
    roster[1].position = 17;
    roster[2].position = 11;
    auto const hit = combat.ResolveLanding(0, 14);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->target, 1);

    // eliminated players are skipped
    roster[1].active = false;
    EXPECT_EQ(combat.ResolveLanding(0, 14)->target, 2);

    roster[2].active = false;
    EXPECT_FALSE(combat.ResolveLanding(0, 14).has_value());
}

TEST(Combat, Damage_Clamps_And_Eliminates)
{
    RuleConfiguration const rules = presets::GridCombat();
    Roster roster = MakeRoster(2, 0, 100);
    std::mt19937_64 rng{5};
    CombatModel combat(rules, roster, rng);

    EXPECT_EQ(combat.ApplyDamage(1, 30), 70);
    EXPECT_TRUE(roster[1].active);
    EXPECT_FALSE(combat.HasPlayerWon(0));

    EXPECT_EQ(combat.ApplyDamage(1, 500), 0);
    EXPECT_FALSE(roster[1].active);
    EXPECT_FALSE(combat.Record(1).alive);
    EXPECT_TRUE(combat.HasPlayerWon(0));
    EXPECT_FALSE(combat.HasPlayerWon(1));

    EXPECT_THROW((void)combat.ApplyDamage(0, -1), OmegaException<error::Code>);
}

TEST(Combat, Heal_Caps_And_Never_Revives)
{
    RuleConfiguration const rules = presets::GridCombat();
    Roster roster = MakeRoster(2, 0, 100);
    std::mt19937_64 rng{5};
    CombatModel combat(rules, roster, rng);

    (void)combat.ApplyDamage(0, 40);
    EXPECT_EQ(combat.Heal(0, 25), 85);
    EXPECT_EQ(combat.Heal(0, 25), 100);
    (void)combat.ApplyDamage(0, 1);
    EXPECT_EQ(combat.Heal(0, std::numeric_limits<int32_t>::max()), 100);

    (void)combat.ApplyDamage(1, 100);
    EXPECT_EQ(combat.Heal(1, 50), 0);
    EXPECT_FALSE(roster[1].active);

    CombatRecord const rec = combat.Record(0);
    EXPECT_EQ(rec.max_health, 100);
    EXPECT_TRUE(rec.alive);
}

TEST(Combat, Direct_Attack)
{
    RuleConfiguration const rules = presets::GridCombat();
    Roster roster = MakeRoster(2, 0, 100);
    std::mt19937_64 rng{5};
    CombatModel combat(rules, roster, rng);

    using RVC = error::RuleViolationCode;
    EXPECT_EQ(combat.CheckAttack(0, 0).error().code, RVC::Attack_SelfTarget);
    EXPECT_EQ(combat.CheckAttack(0, 4).error().code, RVC::Attack_UnknownTarget);

    auto const out = combat.Attack(0, 1);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->kind, DamageKind::DirectAttack);
    EXPECT_GE(out->damage, rules.combat.direct_attack.min);
    EXPECT_LE(out->damage, rules.combat.direct_attack.max);
    EXPECT_EQ(roster[1].health, 100 - out->damage);

    roster[1].active = false;
    EXPECT_EQ(combat.Attack(0, 1).error().code, RVC::Attack_TargetInactive);
}
