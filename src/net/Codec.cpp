//
// Codec.cpp
//
#include "Codec.hpp"

#include <format>
#include <fstream>
#include <iterator>
#include <utility>
#include <vector>

#include "../core/Util.hpp"

namespace
{
    namespace fbn = polyboard::gen::net;
    namespace fbr = polyboard::gen::rules;

    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert((int)polyboard::core::TurnPhase::MatchOver == (int)fbn::Phase::MatchOver);
    static_assert((int)polyboard::core::BoardShape::SquareGrid == (int)fbn::BoardShape::SquareGrid);
    static_assert((int)polyboard::core::WinCondition::ReachGoal == (int)fbr::WinCondition::ReachGoal);

    constexpr int16_t NoPlayer = -1;

    inline auto AsId(polyboard::core::PlayerIdT p) -> int16_t
    {
        return static_cast<int16_t>(p);
    }

    inline auto AsId(std::optional<polyboard::core::PlayerIdT> const& p) -> int16_t
    {
        return p.has_value() ? static_cast<int16_t>(*p) : NoPlayer;
    }

    // Flat view of one event before it is written.
    struct EventFields
    {
        fbn::EventKind       kind{fbn::EventKind::PlayerMoved};
        int16_t              actor{NoPlayer};
        int16_t              counterpart{NoPlayer};
        uint32_t             position{};
        uint32_t             from_position{};
        int32_t              amount{};
        int32_t              balance{};
        int32_t              counterpart_balance{};
        uint8_t              detail{};
        bool                 flag{false};
        std::vector<uint8_t> faces{};
    };

    auto Flatten(polyboard::core::MatchEvent const& event) -> EventFields
    {
        using namespace polyboard::core;

        return std::visit([]<typename T0>(T0 const& e) -> EventFields
        {
            using T = std::decay_t<T0>;
            EventFields f{};

            if constexpr (std::is_same_v<T, PlayerMoved>)
            {
                f.kind = fbn::EventKind::PlayerMoved;
                f.actor = AsId(e.player);
                f.from_position = e.from;
                f.position = e.to;
                f.amount = static_cast<int32_t>(e.spaces);
            }
            else if constexpr (std::is_same_v<T, PassedStart>)
            {
                f.kind = fbn::EventKind::PassedStart;
                f.actor = AsId(e.player);
            }
            else if constexpr (std::is_same_v<T, BonusCredited>)
            {
                f.kind = fbn::EventKind::BonusCredited;
                f.actor = AsId(e.player);
                f.amount = e.amount;
                f.balance = e.balance;
            }
            else if constexpr (std::is_same_v<T, DiceRolled>)
            {
                f.kind = fbn::EventKind::DiceRolled;
                f.actor = AsId(e.player);
                f.amount = static_cast<int32_t>(e.total);
                f.flag = e.extra_turn;
                f.faces = e.faces;
            }
            else if constexpr (std::is_same_v<T, PropertyPurchased>)
            {
                f.kind = fbn::EventKind::PropertyPurchased;
                f.actor = AsId(e.player);
                f.position = e.position;
                f.amount = e.price;
                f.balance = e.balance;
            }
            else if constexpr (std::is_same_v<T, PurchaseDeclined>)
            {
                f.kind = fbn::EventKind::PurchaseDeclined;
                f.actor = AsId(e.player);
                f.position = e.position;
                f.amount = e.price;
                f.balance = e.balance;
            }
            else if constexpr (std::is_same_v<T, RentPaid>)
            {
                f.kind = fbn::EventKind::RentPaid;
                f.actor = AsId(e.payer);
                f.counterpart = AsId(e.owner);
                f.position = e.position;
                f.amount = e.amount;
                f.balance = e.payer_balance;
                f.counterpart_balance = e.owner_balance;
            }
            else if constexpr (std::is_same_v<T, PlayerBankrupt>)
            {
                f.kind = fbn::EventKind::PlayerBankrupt;
                f.actor = AsId(e.player);
                f.counterpart = AsId(e.creditor);
                f.balance = e.balance;
            }
            else if constexpr (std::is_same_v<T, PropertyReleased>)
            {
                f.kind = fbn::EventKind::PropertyReleased;
                f.actor = AsId(e.previous_owner);
                f.position = e.position;
            }
            else if constexpr (std::is_same_v<T, PropertyTraded>)
            {
                f.kind = fbn::EventKind::PropertyTraded;
                f.actor = AsId(e.seller);
                f.counterpart = AsId(e.buyer);
                f.position = e.position;
                f.amount = e.price;
            }
            else if constexpr (std::is_same_v<T, DamageDealt>)
            {
                f.kind = fbn::EventKind::DamageDealt;
                f.actor = AsId(e.target);
                f.counterpart = AsId(e.attacker);
                f.amount = e.amount;
                f.balance = e.health;
                f.detail = static_cast<uint8_t>(e.kind);
            }
            else if constexpr (std::is_same_v<T, PlayerEliminated>)
            {
                f.kind = fbn::EventKind::PlayerEliminated;
                f.actor = AsId(e.player);
                f.counterpart = AsId(e.by);
            }
            else if constexpr (std::is_same_v<T, TurnChanged>)
            {
                f.kind = fbn::EventKind::TurnChanged;
                f.actor = AsId(e.player);
                f.amount = static_cast<int32_t>(e.turn_number);
            }
            else if constexpr (std::is_same_v<T, MatchOver>)
            {
                f.kind = fbn::EventKind::MatchOver;
                f.actor = AsId(e.winner);
                f.detail = static_cast<uint8_t>(e.reason);
            }
            else
            {
                static_assert(polyboard::core::util::always_false_v<T>, "unhandled event");
            }
            return f;
        }, event);
    }

    inline auto Finish(flatbuffers::FlatBufferBuilder& fbb, fbn::Message type, flatbuffers::Offset<void> msg)
        -> flatbuffers::DetachedBuffer
    {
        auto const env = fbn::CreateEnvelope(fbb, type, msg);
        fbn::FinishEnvelopeBuffer(fbb, env);
        return fbb.Release();
    }
} // anonymous

namespace polyboard::core::net
{
    auto ToFbPhase(polyboard::core::TurnPhase p) noexcept -> polyboard::gen::net::Phase
    {
        switch (p)
        {
        case polyboard::core::TurnPhase::AwaitingIntent: return fbn::Phase::AwaitingIntent;
        case polyboard::core::TurnPhase::Resolving: return fbn::Phase::Resolving;
        case polyboard::core::TurnPhase::MatchOver: return fbn::Phase::MatchOver;
        }
        return fbn::Phase::AwaitingIntent;
    }

    auto FromFbPhase(polyboard::gen::net::Phase p) noexcept -> polyboard::core::TurnPhase
    {
        switch (p)
        {
        case fbn::Phase::AwaitingIntent: return polyboard::core::TurnPhase::AwaitingIntent;
        case fbn::Phase::Resolving: return polyboard::core::TurnPhase::Resolving;
        case fbn::Phase::MatchOver: return polyboard::core::TurnPhase::MatchOver;
        }
        return polyboard::core::TurnPhase::AwaitingIntent;
    }

    auto ToFbShape(polyboard::core::BoardShape s) noexcept -> polyboard::gen::net::BoardShape
    {
        switch (s)
        {
        case polyboard::core::BoardShape::LinearLoop: return fbn::BoardShape::LinearLoop;
        case polyboard::core::BoardShape::SquareGrid: return fbn::BoardShape::SquareGrid;
        }
        return fbn::BoardShape::LinearLoop;
    }

    auto FromFbShape(polyboard::gen::net::BoardShape s) noexcept -> polyboard::core::BoardShape
    {
        switch (s)
        {
        case fbn::BoardShape::LinearLoop: return polyboard::core::BoardShape::LinearLoop;
        case fbn::BoardShape::SquareGrid: return polyboard::core::BoardShape::SquareGrid;
        }
        return polyboard::core::BoardShape::LinearLoop;
    }

    auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }

    // ---------- Rule document ----------

    auto EncodeRuleDocument(polyboard::core::RuleConfiguration const& r) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        // every field on disk, so a later default change cannot reinterpret old documents
        fbb.ForceDefaults(true);

        std::vector<flatbuffers::Offset<flatbuffers::String>> names;
        names.reserve(r.resources.names.size());
        for (std::string const& n : r.resources.names)
        {
            names.push_back(fbb.CreateString(n));
        }
        auto const names_vec = fbb.CreateVector(names);

        fbr::RuleDocumentBuilder b(fbb);
        b.add_schema_version(polyboard::core::constants::RuleDocumentVersion);

        b.add_currency_enabled(r.currency.enabled);
        b.add_starting_balance(r.currency.starting_balance);
        b.add_pass_bonus(r.currency.pass_bonus);

        b.add_separate_boards(r.board.separate_boards);
        b.add_tiles_per_side(r.board.tiles_per_side);

        b.add_purchasable(r.property.purchasable);
        b.add_tradable(r.property.tradable);
        b.add_rent_collectible(r.property.rent_collectible);
        b.add_bankruptcy_enabled(r.property.bankruptcy_enabled);

        b.add_combat_enabled(r.combat.enabled);
        b.add_ship_placement(r.combat.ship_placement);
        b.add_max_health(r.combat.max_health);
        b.add_encounter_min(r.combat.encounter.min);
        b.add_encounter_max(r.combat.encounter.max);
        b.add_landing_pvp_min(r.combat.landing_pvp.min);
        b.add_landing_pvp_max(r.combat.landing_pvp.max);
        b.add_direct_attack_min(r.combat.direct_attack.min);
        b.add_direct_attack_max(r.combat.direct_attack.max);

        b.add_enemy_tokens_visible(r.visibility.enemy_tokens_visible);
        b.add_visibility_range(r.visibility.range);

        b.add_min_players(r.players.min);
        b.add_max_players(r.players.max);

        b.add_win_condition(static_cast<fbr::WinCondition>(r.win.condition));
        b.add_balance_threshold(r.win.balance_threshold);

        b.add_dice_count(r.dice.count);
        b.add_dice_sides(r.dice.sides);
        b.add_duplicates_grant_extra_turn(r.dice.duplicates_grant_extra_turn);
        b.add_duplicates_required(r.dice.duplicates_required);

        b.add_resources_enabled(r.resources.enabled);
        b.add_resource_count(r.resources.count);
        b.add_resource_names(names_vec);
        b.add_resources_capped(r.resources.capped);
        b.add_per_type_cap(r.resources.per_type_cap);

        auto const doc = b.Finish();
        fbr::FinishRuleDocumentBuffer(fbb, doc);
        return fbb.Release();
    }

    auto DecodeRuleDocument(std::span<std::byte const> bytes)
        -> std::expected<polyboard::core::RuleConfiguration, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t) + flatbuffers::kFileIdentifierLength)
            return std::unexpected(ParseError{"buffer too small"});

        auto const* buf = reinterpret_cast<uint8_t const*>(bytes.data());
        if (!fbr::RuleDocumentBufferHasIdentifier(buf))
            return std::unexpected(ParseError{"not a rule document"});

        flatbuffers::Verifier verifier(buf, bytes.size());
        if (!fbr::VerifyRuleDocumentBuffer(verifier))
            return std::unexpected(ParseError{"rule document failed verification"});

        fbr::RuleDocument const* d = fbr::GetRuleDocument(buf);
        polyboard::core::RuleConfiguration r{};

        r.currency.enabled = d->currency_enabled();
        r.currency.starting_balance = d->starting_balance();
        r.currency.pass_bonus = d->pass_bonus();

        r.board.separate_boards = d->separate_boards();
        r.board.tiles_per_side = d->tiles_per_side();

        r.property.purchasable = d->purchasable();
        r.property.tradable = d->tradable();
        r.property.rent_collectible = d->rent_collectible();
        r.property.bankruptcy_enabled = d->bankruptcy_enabled();

        r.combat.enabled = d->combat_enabled();
        r.combat.ship_placement = d->ship_placement();
        r.combat.max_health = d->max_health();
        r.combat.encounter = {d->encounter_min(), d->encounter_max()};
        r.combat.landing_pvp = {d->landing_pvp_min(), d->landing_pvp_max()};
        r.combat.direct_attack = {d->direct_attack_min(), d->direct_attack_max()};

        r.visibility.enemy_tokens_visible = d->enemy_tokens_visible();
        r.visibility.range = d->visibility_range();

        r.players.min = d->min_players();
        r.players.max = d->max_players();

        switch (d->win_condition())
        {
        case fbr::WinCondition::Elimination: r.win.condition = polyboard::core::WinCondition::Elimination; break;
        case fbr::WinCondition::BalanceThreshold: r.win.condition = polyboard::core::WinCondition::BalanceThreshold; break;
        case fbr::WinCondition::ReachGoal: r.win.condition = polyboard::core::WinCondition::ReachGoal; break;
        default:
            return std::unexpected(ParseError{std::format("unknown win condition {}",
                                                          static_cast<int>(d->win_condition()))});
        }
        r.win.balance_threshold = d->balance_threshold();

        r.dice.count = d->dice_count();
        r.dice.sides = d->dice_sides();
        r.dice.duplicates_grant_extra_turn = d->duplicates_grant_extra_turn();
        r.dice.duplicates_required = d->duplicates_required();

        r.resources.enabled = d->resources_enabled();
        r.resources.count = d->resource_count();
        if (auto const* names = d->resource_names())
        {
            r.resources.names.reserve(names->size());
            for (auto const* n : *names)
            {
                r.resources.names.emplace_back(n ? n->str() : std::string{});
            }
        }
        r.resources.capped = d->resources_capped();
        r.resources.per_type_cap = d->per_type_cap();
        return r;
    }

    auto SaveRuleDocument(std::string const& path, polyboard::core::RuleConfiguration const& rules)
        -> std::expected<void, ParseError>
    {
        flatbuffers::DetachedBuffer const buf = EncodeRuleDocument(rules);
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
            return std::unexpected(ParseError{std::format("cannot open {} for writing", path)});
        out.write(reinterpret_cast<char const*>(buf.data()), static_cast<std::streamsize>(buf.size()));
        if (!out)
            return std::unexpected(ParseError{std::format("write to {} failed", path)});
        return {};
    }

    auto LoadRuleDocument(std::string const& path)
        -> std::expected<polyboard::core::RuleConfiguration, ParseError>
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
            return std::unexpected(ParseError{std::format("cannot open {}", path)});
        std::vector<char> const data{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
        return DecodeRuleDocument(std::as_bytes(std::span{data}));
    }

    // ---------- Snapshot (authority → client) ----------

    auto BuildSnapshot(polyboard::core::MatchSnapshot const& snap,
                       std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        std::vector<flatbuffers::Offset<fbn::PlayerView>> players;
        players.reserve(snap.players.size());
        for (polyboard::core::PlayerView const& p : snap.players)
        {
            players.push_back(fbn::CreatePlayerView(
                fbb,
                /*id*/ p.id,
                /*position_visible*/ p.position.has_value(),
                /*position*/ p.position.value_or(0),
                /*balance*/ p.balance,
                /*active*/ p.active,
                /*health*/ p.health,
                /*owned_count*/ p.owned_count));
        }
        auto const players_vec = fbb.CreateVector(players);

        std::vector<flatbuffers::Offset<fbn::PropertyView>> props;
        props.reserve(snap.properties.size());
        for (polyboard::core::PropertyRecord const& r : snap.properties)
        {
            auto const name = fbb.CreateString(r.name);
            props.push_back(fbn::CreatePropertyView(fbb, r.position, name, r.price, r.rent, AsId(r.owner)));
        }
        auto const props_vec = fbb.CreateVector(props);

        auto const sm = fbn::CreateSnapshotMsg(
            fbb,
            /*msg_id*/ msg_id,
            /*schema_version*/ 1,
            /*viewer*/ snap.viewer,
            /*turn_player*/ snap.turn_player,
            /*phase*/ ToFbPhase(snap.phase),
            /*board_size*/ snap.topology.size,
            /*shape*/ ToFbShape(snap.topology.shape),
            /*side*/ snap.topology.side,
            /*turn_number*/ snap.turn_number,
            /*players*/ players_vec,
            /*properties*/ props_vec,
            /*has_currency*/ snap.has_currency,
            /*has_property*/ snap.has_property,
            /*has_combat*/ snap.has_combat);

        return Finish(fbb, fbn::Message::SnapshotMsg, sm.Union());
    }

    // ---------- Event (authority → client) ----------

    auto BuildEvent(polyboard::core::MatchEvent const& event,
                    std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        EventFields const f = Flatten(event);

        flatbuffers::FlatBufferBuilder fbb;
        auto const faces = f.faces.empty() ? flatbuffers::Offset<flatbuffers::Vector<uint8_t>>{}
                                           : fbb.CreateVector(f.faces);
        auto const em = fbn::CreateEventMsg(
            fbb, msg_id, f.kind, f.actor, f.counterpart, f.position, f.from_position,
            f.amount, f.balance, f.counterpart_balance, f.detail, f.flag, faces);

        return Finish(fbb, fbn::Message::EventMsg, em.Union());
    }

    // ---------- Violation (authority → client) ----------

    auto BuildViolation(polyboard::core::error::RuleViolation const& v,
                        std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const txt = fbb.CreateString(polyboard::core::error::describe(v));
        auto const vio = fbn::CreateViolation(
            fbb, msg_id, static_cast<int16_t>(v.code), txt);
        return Finish(fbb, fbn::Message::Violation, vio.Union());
    }

    // ---------- Intent (client → authority) ----------

    auto BuildIntent(polyboard::core::Intent const& intent,
                     std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;

        auto const [type, body] = std::visit([&fbb]<typename T0>(T0 const& act)
            -> std::pair<fbn::Action, flatbuffers::Offset<void>>
        {
            using T = std::decay_t<T0>;
            using namespace polyboard::core;

            if constexpr (std::is_same_v<T, MoveIntent>)
                return {fbn::Action::Intent_Move, fbn::CreateIntent_Move(fbb, act.spaces).Union()};
            else if constexpr (std::is_same_v<T, RollIntent>)
                return {fbn::Action::Intent_Roll, fbn::CreateIntent_Roll(fbb).Union()};
            else if constexpr (std::is_same_v<T, PurchaseIntent>)
                return {fbn::Action::Intent_Purchase, fbn::CreateIntent_Purchase(fbb).Union()};
            else if constexpr (std::is_same_v<T, TradeIntent>)
                return {fbn::Action::Intent_Trade,
                        fbn::CreateIntent_Trade(fbb, act.seller, act.buyer, act.position, act.price).Union()};
            else if constexpr (std::is_same_v<T, AttackIntent>)
                return {fbn::Action::Intent_Attack, fbn::CreateIntent_Attack(fbb, act.target).Union()};
            else
                static_assert(polyboard::core::util::always_false_v<T>, "unhandled intent");
        }, intent.action);

        auto const m = fbn::CreateIntentMsg(fbb, msg_id, intent.player, type, body);
        return Finish(fbb, fbn::Message::IntentMsg, m.Union());
    }

    auto ReadEnvelope(std::span<std::byte const> bytes)
        -> std::expected<polyboard::gen::net::Envelope const*, ParseError>
    {
        if (bytes.size() < sizeof(flatbuffers::uoffset_t) + flatbuffers::kFileIdentifierLength)
            return std::unexpected(ParseError{"buffer too small"});

        auto const* buf = reinterpret_cast<uint8_t const*>(bytes.data());
        if (!fbn::EnvelopeBufferHasIdentifier(buf))
            return std::unexpected(ParseError{"bad identifier"});

        flatbuffers::Verifier verifier(buf, bytes.size());
        if (!fbn::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"envelope failed verification"});

        auto const* env = fbn::GetEnvelope(buf);
        if (!env)
            return std::unexpected(ParseError{"bad root"});
        return env;
    }

    auto DecodeIntent(std::span<std::byte const> bytes)
        -> std::expected<DecodedIntent, ParseError>
    {
        auto const env = ReadEnvelope(bytes);
        if (!env.has_value())
            return std::unexpected(env.error());

        if ((*env)->message_type() != fbn::Message::IntentMsg)
            return std::unexpected(ParseError{"not an IntentMsg"});

        auto const* msg = (*env)->message_as_IntentMsg();
        DecodedIntent out{};
        out.msg_id = msg->msg_id();
        out.intent.player = static_cast<polyboard::core::PlayerIdT>(msg->player());

        switch (msg->action_type())
        {
        case fbn::Action::Intent_Move:
        {
            auto const* a = msg->action_as_Intent_Move();
            out.intent.action = polyboard::core::MoveIntent{ .spaces = a->spaces() };
            return out;
        }
        case fbn::Action::Intent_Roll:
            out.intent.action = polyboard::core::RollIntent{};
            return out;

        case fbn::Action::Intent_Purchase:
            out.intent.action = polyboard::core::PurchaseIntent{};
            return out;

        case fbn::Action::Intent_Trade:
        {
            auto const* t = msg->action_as_Intent_Trade();
            out.intent.action = polyboard::core::TradeIntent{
                .seller = t->seller(), .buyer = t->buyer(), .position = t->position(), .price = t->price() };
            return out;
        }
        case fbn::Action::Intent_Attack:
        {
            auto const* a = msg->action_as_Intent_Attack();
            out.intent.action = polyboard::core::AttackIntent{ .target = a->target() };
            return out;
        }
        default:
            return std::unexpected(ParseError{"unknown intent variant"});
        }
    }
} // namespace polyboard::core::net
