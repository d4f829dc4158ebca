#include <gtest/gtest.h>

#include "../core/TurnResolver.hpp"
#include "../core/Presets.hpp"
#include "../debug/Inspector.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/RecordingSink.hpp"
#include "Fixtures.hpp"

using namespace polyboard::core;
using polyboard::core::debug::Inspector;
using polyboard::core::debug::RecordingSink;
using polyboard::test::MakeMatch;
using polyboard::test::Move;
using polyboard::test::Record;

namespace
{
    using RVC = error::RuleViolationCode;

    auto NoDoubles(RuleConfiguration r) -> RuleConfiguration
    {
        r.dice.duplicates_grant_extra_turn = false;
        return r;
    }
}

TEST(TurnResolver, Rejects_Out_Of_Turn_Without_Side_Effects)
{
    auto m = MakeMatch(presets::Race(), 3);
    TurnResolver resolver(*m);
    RecordingSink sink;
    resolver.Subscribe(&sink);

    auto const r = resolver.ResolveIntent(Move(1, 3));
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::OutOfTurn);
    EXPECT_EQ(r.error().current, PlayerIdT{0});
    EXPECT_EQ(m->Player(1).position, 0u);
    EXPECT_EQ(m->TurnNumber(), 1u);
    EXPECT_TRUE(sink.Events().empty());

    EXPECT_EQ(resolver.ResolveIntent(Move(9, 3)).error().code, RVC::UnknownPlayer);
    EXPECT_EQ(resolver.Validate(Intent{ .player = 0, .action = AttackIntent{ .target = 1 } }).error().code,
              RVC::Feature_CombatDisabled);
    EXPECT_EQ(resolver.Validate(Intent{ .player = 0, .action = PurchaseIntent{} }).error().code,
              RVC::Feature_PurchaseDisabled);
}

TEST(TurnResolver, Move_Advances_Turn)
{
    auto m = MakeMatch(presets::Race(), 3);
    TurnResolver resolver(*m);

    auto const r = resolver.ResolveIntent(Move(0, 4));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->outcome, ResolutionOutcome::TurnAdvanced);
    EXPECT_EQ(r->next_player, 1);
    EXPECT_EQ(m->CurrentPlayer(), 1);
    EXPECT_EQ(m->TurnNumber(), 2u);
    EXPECT_EQ(m->Player(0).position, 4u);

    ASSERT_EQ(r->events.size(), 2u);
    auto const* moved = std::get_if<PlayerMoved>(&r->events[0]);
    ASSERT_NE(moved, nullptr);
    EXPECT_EQ(moved->to, 4u);
    auto const* turn = std::get_if<TurnChanged>(&r->events[1]);
    ASSERT_NE(turn, nullptr);
    EXPECT_EQ(turn->player, 1);
    EXPECT_EQ(turn->turn_number, 2u);

    // inactive players are skipped
    Inspector::SetActive(*m, 2, false);
    ASSERT_TRUE(resolver.ResolveIntent(Move(1, 1)).has_value());
    EXPECT_EQ(m->CurrentPlayer(), 0);
}

TEST(TurnResolver, Pass_Bonus_Lands_Before_Purchase)
{
    auto m = MakeMatch(NoDoubles(presets::Trading()));
    Inspector::ResetProperties(*m, {Record(5, 150, 15)});
    Inspector::SetPosition(*m, 0, 35);
    TurnResolver resolver(*m);
    RecordingSink sink;
    resolver.Subscribe(&sink);

    auto const r = resolver.ResolveIntent(Move(0, 10));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(m->Player(0).position, 5u);

    std::size_t const passed = sink.IndexOf<PassedStart>();
    std::size_t const bonus = sink.IndexOf<BonusCredited>();
    std::size_t const bought = sink.IndexOf<PropertyPurchased>();
    ASSERT_LT(bought, r->events.size());
    EXPECT_LT(passed, bonus);
    EXPECT_LT(bonus, bought);

    EXPECT_EQ(std::get<BonusCredited>(r->events[bonus]).balance, 1700);
    EXPECT_EQ(std::get<PropertyPurchased>(r->events[bought]).balance, 1550);
    EXPECT_EQ(m->Player(0).balance, 1550);
    EXPECT_EQ(m->Property()->OwnerOf(5), PlayerIdT{0});
    polyboard::core::debug::CheckInvariants(*m);
}

TEST(TurnResolver, Full_Lap_Fires_Passed_Start_Once)
{
    auto m = MakeMatch(NoDoubles(presets::Trading()));
    Inspector::ResetProperties(*m, {});
    Inspector::SetPosition(*m, 0, 12);
    TurnResolver resolver(*m);
    RecordingSink sink;
    resolver.Subscribe(&sink);

    ASSERT_TRUE(resolver.ResolveIntent(Move(0, 40)).has_value());
    EXPECT_EQ(m->Player(0).position, 12u);
    EXPECT_EQ(sink.Count<PassedStart>(), 1u);
    EXPECT_EQ(sink.Count<BonusCredited>(), 1u);
    EXPECT_EQ(m->Player(0).balance, 1700);
}

TEST(TurnResolver, Unaffordable_Landing_Is_Declined)
{
    auto m = MakeMatch(NoDoubles(presets::Trading()));
    Inspector::ResetProperties(*m, {Record(3, 150, 15)});
    Inspector::SetBalance(*m, 0, 100);
    TurnResolver resolver(*m);

    auto const r = resolver.ResolveIntent(Move(0, 3));
    ASSERT_TRUE(r.has_value());
    auto const declined = std::ranges::find_if(r->events, [](MatchEvent const& e)
                                               { return std::holds_alternative<PurchaseDeclined>(e); });
    ASSERT_NE(declined, r->events.end());
    EXPECT_EQ(std::get<PurchaseDeclined>(*declined).price, 150);
    EXPECT_EQ(m->Player(0).balance, 100);
    EXPECT_FALSE(m->Property()->OwnerOf(3).has_value());
}

TEST(TurnResolver, Unpayable_Rent_Ends_Two_Player_Match)
{
    auto m = MakeMatch(NoDoubles(presets::Trading()));
    Inspector::ResetProperties(*m, {Record(4, 500, 50, PlayerIdT{1}), Record(8, 100, 10, PlayerIdT{0})});
    Inspector::SetBalance(*m, 0, 30);
    TurnResolver resolver(*m);
    RecordingSink sink;
    resolver.Subscribe(&sink);

    auto const r = resolver.ResolveIntent(Move(0, 4));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->outcome, ResolutionOutcome::MatchEnded);

    EXPECT_EQ(sink.Count<PlayerBankrupt>(), 1u);
    auto const released = sink.OfType<PropertyReleased>();
    ASSERT_EQ(released.size(), 1u);
    EXPECT_EQ(released[0].position, 8u);
    EXPECT_EQ(released[0].previous_owner, 0);
    EXPECT_EQ(sink.Count<PlayerEliminated>(), 0u);

    EXPECT_FALSE(m->Player(0).active);
    EXPECT_EQ(m->Player(0).balance, 30);
    EXPECT_TRUE(m->Player(0).owned.empty());
    EXPECT_TRUE(m->IsOver());
    EXPECT_EQ(m->Winner(), PlayerIdT{1});
    EXPECT_EQ(m->EndReason(), MatchEndReason::LastPlayerStanding);

    auto const over = sink.OfType<MatchOver>();
    ASSERT_EQ(over.size(), 1u);
    EXPECT_EQ(over[0].winner, PlayerIdT{1});
    polyboard::core::debug::CheckInvariants(*m);

    EXPECT_EQ(resolver.ResolveIntent(Move(1, 2)).error().code, RVC::Match_Over);
}

TEST(TurnResolver, Bankrupt_Player_Loses_Turn_In_Bigger_Match)
{
    auto m = MakeMatch(NoDoubles(presets::Trading()), 3);
    Inspector::ResetProperties(*m, {Record(4, 500, 50, PlayerIdT{2})});
    Inspector::SetBalance(*m, 0, 30);
    TurnResolver resolver(*m);

    auto const r = resolver.ResolveIntent(Move(0, 4));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->outcome, ResolutionOutcome::TurnAdvanced);
    EXPECT_FALSE(m->IsOver());
    EXPECT_EQ(m->CurrentPlayer(), 1);

    Inspector::SetCurrent(*m, 0);
    EXPECT_EQ(resolver.ResolveIntent(Move(0, 1)).error().code, RVC::PlayerInactive);
}

TEST(TurnResolver, Purchase_And_Trade_Keep_The_Turn)
{
    auto m = MakeMatch(NoDoubles(presets::Trading()));
    Inspector::ResetProperties(*m, {Record(6, 200, 20)});
    Inspector::SetPosition(*m, 0, 6);
    TurnResolver resolver(*m);

    auto const bought = resolver.ResolveIntent(Intent{ .player = 0, .action = PurchaseIntent{} });
    ASSERT_TRUE(bought.has_value());
    EXPECT_EQ(bought->outcome, ResolutionOutcome::Applied);
    EXPECT_EQ(m->CurrentPlayer(), 0);
    EXPECT_EQ(m->TurnNumber(), 1u);
    EXPECT_EQ(m->Player(0).balance, 1300);

    EXPECT_EQ(resolver.ResolveIntent(Intent{ .player = 0, .action = PurchaseIntent{} }).error().code,
              RVC::Purchase_AlreadyOwned);

    Intent const sell{ .player = 0, .action = TradeIntent{ .seller = 0, .buyer = 1, .position = 6, .price = 250 } };
    auto const traded = resolver.ResolveIntent(sell);
    ASSERT_TRUE(traded.has_value());
    EXPECT_EQ(traded->outcome, ResolutionOutcome::Applied);
    EXPECT_EQ(m->Property()->OwnerOf(6), PlayerIdT{1});
    EXPECT_EQ(m->Player(0).balance, 1550);
    EXPECT_EQ(m->Player(1).balance, 1250);
    ASSERT_EQ(traded->events.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<PropertyTraded>(traded->events[0]));

    Intent const stranger{ .player = 0, .action = TradeIntent{ .seller = 1, .buyer = 1, .position = 6, .price = 1 } };
    EXPECT_EQ(resolver.ResolveIntent(stranger).error().code, RVC::Trade_NotSeller);
    polyboard::core::debug::CheckInvariants(*m);
}

TEST(TurnResolver, Buyer_Cannot_Take_A_Property)
{
    auto m = MakeMatch(NoDoubles(presets::Trading()));
    Inspector::ResetProperties(*m, {Record(6, 200, 20, PlayerIdT{1})});
    TurnResolver resolver(*m);
    RecordingSink sink;
    resolver.Subscribe(&sink);

    Intent const grab{ .player = 0, .action = TradeIntent{ .seller = 1, .buyer = 0, .position = 6, .price = 0 } };
    auto const r = resolver.ResolveIntent(grab);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, RVC::Trade_NotSeller);
    EXPECT_EQ(m->Property()->OwnerOf(6), PlayerIdT{1});
    EXPECT_EQ(m->Player(0).balance, 1500);
    EXPECT_EQ(m->Player(1).balance, 1500);
    EXPECT_EQ(m->CurrentPlayer(), 0);
    EXPECT_EQ(sink.Events().size(), 0u);
    polyboard::core::debug::CheckInvariants(*m);
}

TEST(TurnResolver, Pass_Bonus_Lands_Before_Combat)
{
    RuleConfiguration rules = presets::Race();
    rules.currency = CurrencyRules{ .enabled = true, .starting_balance = 100, .pass_bonus = 50 };
    rules.combat.enabled = true;
    rules.win.condition = WinCondition::Elimination;

    auto m = MakeMatch(rules, 3);
    ASSERT_EQ(m->Board().Size(), 20u);
    Inspector::SetPosition(*m, 0, 19);
    Inspector::SetPosition(*m, 1, 6);
    Inspector::SetHealth(*m, 1, 1);
    TurnResolver resolver(*m);
    RecordingSink sink;
    resolver.Subscribe(&sink);

    // wraps onto 7, a combat space, with P1 one tile away
    auto const r = resolver.ResolveIntent(Move(0, 8));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(m->Player(0).position, 7u);

    std::size_t const bonus = sink.IndexOf<BonusCredited>();
    std::size_t const damage = sink.IndexOf<DamageDealt>();
    std::size_t const out = sink.IndexOf<PlayerEliminated>();
    ASSERT_LT(out, sink.Events().size());
    EXPECT_LT(bonus, damage);
    EXPECT_LT(damage, out);
    EXPECT_EQ(sink.Count<BonusCredited>(), 1u);
    EXPECT_EQ(std::get<PlayerEliminated>(sink.Events()[out]).player, PlayerIdT{1});

    EXPECT_EQ(m->Player(0).balance, 150);
    EXPECT_FALSE(m->Player(1).active);
    EXPECT_FALSE(m->IsOver());
    EXPECT_EQ(m->CurrentPlayer(), 2);
    polyboard::core::debug::CheckInvariants(*m);
}

TEST(TurnResolver, Grid_Encounter_Applies_Damage_Once)
{
    auto m = MakeMatch(presets::GridCombat());
    TurnResolver resolver(*m);

    auto const r = resolver.ResolveIntent(Move(0, 7));
    ASSERT_TRUE(r.has_value());

    std::size_t hits{};
    int32_t dealt{};
    for (MatchEvent const& e : r->events)
    {
        if (auto const* d = std::get_if<DamageDealt>(&e))
        {
            ++hits;
            dealt = d->amount;
            EXPECT_EQ(d->kind, DamageKind::Encounter);
            EXPECT_EQ(d->target, 0);
        }
    }
    EXPECT_EQ(hits, 1u);
    EXPECT_EQ(m->Player(0).health, 100 - dealt);
    EXPECT_EQ(m->Player(1).health, 100);

    // off the combat spaces nothing happens
    auto const quiet = resolver.ResolveIntent(Move(1, 5));
    ASSERT_TRUE(quiet.has_value());
    EXPECT_EQ(m->Player(1).health, 100);
}

TEST(TurnResolver, Attack_Elimination_Ends_Match)
{
    auto m = MakeMatch(presets::GridCombat());
    Inspector::SetHealth(*m, 1, 1);
    TurnResolver resolver(*m);
    RecordingSink sink;
    resolver.Subscribe(&sink);

    EXPECT_EQ(resolver.ResolveIntent(Intent{ .player = 0, .action = AttackIntent{ .target = 0 } }).error().code,
              RVC::Attack_SelfTarget);

    auto const r = resolver.ResolveIntent(Intent{ .player = 0, .action = AttackIntent{ .target = 1 } });
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->outcome, ResolutionOutcome::MatchEnded);

    auto const killed = sink.OfType<PlayerEliminated>();
    ASSERT_EQ(killed.size(), 1u);
    EXPECT_EQ(killed[0].player, 1);
    EXPECT_EQ(killed[0].by, PlayerIdT{0});
    EXPECT_LT(sink.IndexOf<DamageDealt>(), sink.IndexOf<PlayerEliminated>());
    EXPECT_LT(sink.IndexOf<PlayerEliminated>(), sink.IndexOf<MatchOver>());

    EXPECT_EQ(m->Winner(), PlayerIdT{0});
    EXPECT_EQ(m->Player(1).health, 0);
    EXPECT_EQ(m->PhaseNow(), TurnPhase::MatchOver);
}

TEST(TurnResolver, Reaching_Goal_Wins_Race)
{
    auto m = MakeMatch(presets::Race());
    Inspector::SetPosition(*m, 0, 15);
    TurnResolver resolver(*m);

    // overshooting wraps past the goal
    ASSERT_TRUE(resolver.ResolveIntent(Move(0, 6)).has_value());
    EXPECT_EQ(m->Player(0).position, 1u);
    EXPECT_FALSE(m->IsOver());

    Inspector::SetPosition(*m, 1, 15);
    auto const r = resolver.ResolveIntent(Move(1, 4));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->outcome, ResolutionOutcome::MatchEnded);
    EXPECT_EQ(m->Winner(), PlayerIdT{1});
    EXPECT_EQ(m->EndReason(), MatchEndReason::ReachGoal);
}

TEST(TurnResolver, Balance_Threshold_Wins)
{
    auto m = MakeMatch(NoDoubles(presets::Custom()));
    Inspector::ResetProperties(*m, {});
    Inspector::SetBalance(*m, 0, 3000);
    TurnResolver resolver(*m);

    auto const r = resolver.ResolveIntent(Move(0, 1));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->outcome, ResolutionOutcome::MatchEnded);
    EXPECT_EQ(m->Winner(), PlayerIdT{0});
    EXPECT_EQ(m->EndReason(), MatchEndReason::BalanceThreshold);
}

TEST(TurnResolver, Doubles_Grant_Extra_Turn)
{
    RuleConfiguration rules = presets::Race();
    rules.win.condition = WinCondition::Elimination;  // never ends without combat
    rules.dice = DiceRules{ .count = 2, .sides = 2, .duplicates_grant_extra_turn = true, .duplicates_required = 2 };
    auto m = MakeMatch(rules, 2, 2024);
    TurnResolver resolver(*m);

    std::size_t extra{};
    for (int i = 0; i < 60; ++i)
    {
        PlayerIdT const actor = m->CurrentPlayer();
        uint32_t const turn = m->TurnNumber();
        auto const r = resolver.ResolveIntent(Intent{ .player = actor, .action = RollIntent{} });
        ASSERT_TRUE(r.has_value());

        auto const& rolled = std::get<DiceRolled>(r->events.front());
        ASSERT_EQ(rolled.faces.size(), 2u);
        EXPECT_EQ(rolled.total, static_cast<uint32_t>(rolled.faces[0] + rolled.faces[1]));
        EXPECT_EQ(rolled.extra_turn, rolled.faces[0] == rolled.faces[1]);
        EXPECT_EQ(m->TurnNumber(), turn + 1);

        if (rolled.extra_turn)
        {
            ++extra;
            EXPECT_EQ(r->outcome, ResolutionOutcome::ExtraTurn);
            EXPECT_EQ(m->CurrentPlayer(), actor);
        }
        else
        {
            EXPECT_EQ(r->outcome, ResolutionOutcome::TurnAdvanced);
            EXPECT_NE(m->CurrentPlayer(), actor);
        }
    }
    EXPECT_GT(extra, 0u);
}

TEST(TurnResolver, Sinks_See_Exactly_The_Resolution_Events)
{
    auto m = MakeMatch(presets::Race());
    TurnResolver resolver(*m);
    RecordingSink a, b;
    resolver.Subscribe(&a);
    resolver.Subscribe(&b);

    auto const r = resolver.ResolveIntent(Intent{ .player = 0, .action = RollIntent{} });
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(a.Events().size(), r->events.size());
    EXPECT_EQ(b.Events().size(), r->events.size());

    resolver.Unsubscribe(&b);
    ASSERT_TRUE(resolver.ResolveIntent(Move(1, 1)).has_value());
    EXPECT_GT(a.Events().size(), r->events.size());
    EXPECT_EQ(b.Events().size(), r->events.size());

    EXPECT_THROW(resolver.Subscribe(nullptr), OmegaException<error::Code>);
}
