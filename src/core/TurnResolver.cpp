//
// TurnResolver.cpp
//

#include "TurnResolver.hpp"

#include <algorithm>
#include <print>
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
    TurnResolver::TurnResolver(MatchState& match) :
        match_(match)
    {
    }

    auto TurnResolver::Subscribe(EventSink* sink) -> void
    {
        PBD_ASSERT(sink != nullptr, "Null event sink");
        sinks_.push_back(sink);
    }

    auto TurnResolver::Unsubscribe(EventSink* sink) -> void
    {
        std::erase(sinks_, sink);
    }

    auto TurnResolver::Validate(Intent const& intent) const -> error::ValidateResult
    {
        using RVC = error::RuleViolationCode;
        MatchState const& m = match_;
        PlayerIdT const actor = intent.player;

        if (m.phase_ == TurnPhase::MatchOver)
            return std::unexpected(Viol(RVC::Match_Over).with_phase(m.phase_).with_actor(actor));

        if (!util::IsKnownPlayer(m.roster_, actor))
            return std::unexpected(Viol(RVC::UnknownPlayer).with_actor(actor));

        if (actor != m.current_)
            return std::unexpected(Viol(RVC::OutOfTurn).with_phase(m.phase_).with_actor(actor).with_current(m.current_));

        if (!m.roster_[actor].active)
            return std::unexpected(Viol(RVC::PlayerInactive).with_actor(actor));

        return std::visit([&]<typename T0>(T0 const& act) -> error::ValidateResult
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, MoveIntent> || std::is_same_v<T, RollIntent>)
            {
                return {};
            }
            else if constexpr (std::is_same_v<T, PurchaseIntent>)
            {
                if (!m.property_)
                    return std::unexpected(Viol(RVC::Feature_PurchaseDisabled).with_actor(actor));
                return m.property_->CheckPurchase(actor, m.roster_[actor].position);
            }
            else if constexpr (std::is_same_v<T, TradeIntent>)
            {
                if (!m.property_)
                    return std::unexpected(Viol(RVC::Feature_TradingDisabled).with_actor(actor));
                // offers come from the owner; a buyer cannot take a property
                if (actor != act.seller)
                    return std::unexpected(Viol(RVC::Trade_NotSeller)
                                           .with_actor(actor).with_target(act.seller).with_position(act.position));
                return m.property_->CheckTrade(act.seller, act.buyer, act.position, act.price);
            }
            else if constexpr (std::is_same_v<T, AttackIntent>)
            {
                if (!m.combat_)
                    return std::unexpected(Viol(RVC::Feature_CombatDisabled).with_actor(actor));
                return m.combat_->CheckAttack(actor, act.target);
            }
            else
            {
                static_assert(util::always_false_v<T>, "unhandled intent");
            }
        }, intent.action);
    }

    auto TurnResolver::ResolveIntent(Intent const& intent) -> Result
    {
        if (auto const ok = Validate(intent); !ok.has_value())
        {
            std::print("{}\n", error::describe(ok.error()));
            return std::unexpected(ok.error());
        }

        match_.phase_ = TurnPhase::Resolving;

        Resolution res{};
        bool const extra_turn = Apply(intent, res.events);
        res.outcome = Advance(intent, extra_turn, res.events);
        res.next_player = match_.current_;

        PBD_ASSERT(std::ranges::all_of(match_.roster_, [](PlayerState const& p) { return p.balance >= 0; }),
                   "Negative balance after resolution");

        Publish(res.events);
        return res;
    }

    auto TurnResolver::Apply(Intent const& intent, std::vector<MatchEvent>& events) -> bool
    {
        PlayerIdT const actor = intent.player;

        return std::visit([&]<typename T0>(T0 const& act) -> bool
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, MoveIntent>)
            {
                ResolveMove(actor, act.spaces, events);
                return false;
            }
            else if constexpr (std::is_same_v<T, RollIntent>)
            {
                DiceRules const& dice = match_.rules_.dice;
                std::uniform_int_distribution<int> face{1, dice.sides};
                util::DuplicateCounter dup{};

                DiceRolled rolled{ .player = actor, .faces = {}, .total = 0, .extra_turn = false };
                rolled.faces.reserve(dice.count);
                for (uint8_t i{}; i < dice.count; ++i)
                {
                    auto const f = static_cast<uint8_t>(face(match_.rng_));
                    rolled.faces.push_back(f);
                    rolled.total += f;
                    dup.Add(f);
                }
                rolled.extra_turn = dice.duplicates_grant_extra_turn && dup.Largest() >= dice.duplicates_required;

                uint32_t const total = rolled.total;
                bool const extra = rolled.extra_turn;
                events.emplace_back(std::move(rolled));
                ResolveMove(actor, total, events);
                return extra;
            }
            else if constexpr (std::is_same_v<T, PurchaseIntent>)
            {
                PosT const pos = match_.roster_[actor].position;
                auto const ok = match_.property_->Purchase(actor, pos);
                PBD_ASSERT(ok.has_value(), "Purchase failed after validation");
                PropertyRecord const* rec = match_.property_->Find(pos);
                events.emplace_back(PropertyPurchased{
                    .player = actor, .position = pos, .price = rec->price, .balance = match_.roster_[actor].balance });
                return false;
            }
            else if constexpr (std::is_same_v<T, TradeIntent>)
            {
                auto const ok = match_.property_->Trade(act.seller, act.buyer, act.position, act.price);
                PBD_ASSERT(ok.has_value(), "Trade failed after validation");
                events.emplace_back(PropertyTraded{
                    .seller = act.seller, .buyer = act.buyer, .position = act.position, .price = act.price });
                return false;
            }
            else if constexpr (std::is_same_v<T, AttackIntent>)
            {
                auto const out = match_.combat_->Attack(actor, act.target);
                PBD_ASSERT(out.has_value(), "Attack failed after validation");
                ApplyCombat(*out, events);
                return false;
            }
            else
            {
                static_assert(util::always_false_v<T>, "unhandled intent");
            }
        }, intent.action);
    }

    auto TurnResolver::ResolveMove(PlayerIdT const player, uint32_t const spaces, std::vector<MatchEvent>& events) -> void
    {
        // movement -> pass bonus -> property landing -> combat landing
        MoveResult const mv = match_.movement_->Move(player, spaces);
        events.emplace_back(PlayerMoved{ .player = player, .from = mv.from, .to = mv.to, .spaces = mv.spaces });

        if (mv.passed_start)
        {
            events.emplace_back(PassedStart{ .player = player });
            if (auto const bonus = match_.movement_->ApplyPassBonus(mv); bonus.has_value())
            {
                events.emplace_back(BonusCredited{
                    .player = player, .amount = *bonus, .balance = match_.roster_[player].balance });
            }
        }

        bool const bankrupt = ResolveLanding(player, mv.to, events);

        if (match_.combat_ && !bankrupt)
        {
            if (auto const hit = match_.combat_->ResolveLanding(player, mv.to); hit.has_value())
                ApplyCombat(*hit, events);
        }
    }

    auto TurnResolver::ResolveLanding(PlayerIdT const player, PosT const position, std::vector<MatchEvent>& events) -> bool
    {
        if (!match_.property_) return false;

        LandingOutcome const lo = match_.property_->LandOn(player, position);
        MoneyT const balance = match_.roster_[player].balance;

        switch (lo.kind)
        {
        case LandingKind::None:
        case LandingKind::OwnProperty:
            return false;
        case LandingKind::Purchased:
            events.emplace_back(PropertyPurchased{
                .player = player, .position = position, .price = lo.amount, .balance = balance });
            return false;
        case LandingKind::PurchaseDeclined:
            events.emplace_back(PurchaseDeclined{
                .player = player, .position = position, .price = lo.amount, .balance = balance });
            return false;
        case LandingKind::RentPaid:
            events.emplace_back(RentPaid{
                .payer = player, .owner = *lo.owner, .position = position, .amount = lo.amount,
                .payer_balance = balance, .owner_balance = match_.roster_[*lo.owner].balance });
            return false;
        case LandingKind::Bankrupt:
            events.emplace_back(PlayerBankrupt{ .player = player, .creditor = *lo.owner, .balance = balance });
            for (PosT const pos : lo.released)
                events.emplace_back(PropertyReleased{ .position = pos, .previous_owner = player });
            return true;
        }
        PBD_THROW(error::Code::State, "Unhandled landing outcome");
    }

    auto TurnResolver::ApplyCombat(CombatOutcome const& outcome, std::vector<MatchEvent>& events) -> void
    {
        events.emplace_back(DamageDealt{
            .attacker = outcome.attacker, .target = outcome.target, .kind = outcome.kind,
            .amount = outcome.damage, .health = outcome.health });

        if (!outcome.eliminated) return;

        events.emplace_back(PlayerEliminated{ .player = outcome.target, .by = outcome.attacker });
        // an eliminated player keeps nothing
        ReleaseProperties(outcome.target, events);
    }

    auto TurnResolver::ReleaseProperties(PlayerIdT const player, std::vector<MatchEvent>& events) -> void
    {
        if (!match_.property_) return;
        for (PosT const pos : match_.property_->ReleaseAll(player))
            events.emplace_back(PropertyReleased{ .position = pos, .previous_owner = player });
    }

    auto TurnResolver::CheckWin(PlayerIdT const actor) const -> std::optional<MatchOver>
    {
        Roster const& roster = match_.roster_;
        std::size_t const active = util::CountActive(roster);

        if (active == 0)
            return MatchOver{ .winner = std::nullopt, .reason = MatchEndReason::LastPlayerStanding };

        // a solo match only ends through its win condition
        if (roster.size() > 1 && active == 1)
            return MatchOver{ .winner = util::FirstActive(roster), .reason = MatchEndReason::LastPlayerStanding };

        switch (match_.rules_.win.condition)
        {
        case WinCondition::Elimination:
            if (match_.combat_)
            {
                for (PlayerState const& p : roster)
                {
                    if (match_.combat_->HasPlayerWon(p.id))
                        return MatchOver{ .winner = p.id, .reason = MatchEndReason::Elimination };
                }
            }
            return std::nullopt;

        case WinCondition::BalanceThreshold:
            for (PlayerState const& p : roster)
            {
                if (p.active && p.balance >= match_.rules_.win.balance_threshold)
                    return MatchOver{ .winner = p.id, .reason = MatchEndReason::BalanceThreshold };
            }
            return std::nullopt;

        case WinCondition::ReachGoal:
            if (roster[actor].active && roster[actor].position == match_.board_->Goal())
                return MatchOver{ .winner = actor, .reason = MatchEndReason::ReachGoal };
            return std::nullopt;
        }
        return std::nullopt;
    }

    auto TurnResolver::Advance(Intent const& intent, bool const extra_turn, std::vector<MatchEvent>& events) -> ResolutionOutcome
    {
        if (auto over = CheckWin(intent.player); over.has_value())
        {
            match_.phase_ = TurnPhase::MatchOver;
            match_.winner_ = over->winner;
            match_.end_reason_ = over->reason;
            events.emplace_back(*over);
            return ResolutionOutcome::MatchEnded;
        }

        match_.phase_ = TurnPhase::AwaitingIntent;

        bool const keeps_turn = std::holds_alternative<PurchaseIntent>(intent.action)
                             || std::holds_alternative<TradeIntent>(intent.action);
        if (keeps_turn && match_.roster_[intent.player].active)
            return ResolutionOutcome::Applied;

        ++match_.turn_number_;
        if (extra_turn && match_.roster_[intent.player].active)
        {
            events.emplace_back(TurnChanged{ .player = intent.player, .turn_number = match_.turn_number_ });
            return ResolutionOutcome::ExtraTurn;
        }

        match_.current_ = match_.NextActivePlayer(match_.current_);
        events.emplace_back(TurnChanged{ .player = match_.current_, .turn_number = match_.turn_number_ });
        return ResolutionOutcome::TurnAdvanced;
    }

    auto TurnResolver::Publish(std::vector<MatchEvent> const& events) -> void
    {
        for (EventSink* sink : sinks_)
        {
            for (MatchEvent const& e : events) sink->Publish(e);
        }
    }
}
