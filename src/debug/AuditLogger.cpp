#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <vector>

#include "../core/Presets.hpp"
#include "../core/RuleAnalyzer.hpp"
#include "../core/Util.hpp"

using namespace polyboard::core;

namespace
{

auto s_player(PlayerIdT p) -> std::string
{
    return std::format("P{}", static_cast<int>(p));
}

auto s_player(std::optional<PlayerIdT> const& p) -> std::string
{
    return p.has_value() ? s_player(*p) : std::string("--");
}

auto s_shape(BoardShape s) -> std::string_view
{
    switch (s)
    {
        case BoardShape::LinearLoop: return "loop";
        case BoardShape::SquareGrid: return "grid";
    }
    return "?";
}

auto s_outcome(ResolutionOutcome o) -> std::string_view
{
    switch (o)
    {
        case ResolutionOutcome::Applied:      return "Applied";
        case ResolutionOutcome::TurnAdvanced: return "TurnAdvanced";
        case ResolutionOutcome::ExtraTurn:    return "ExtraTurn";
        case ResolutionOutcome::MatchEnded:   return "MatchEnded";
    }
    return "?";
}

auto s_faces(std::vector<uint8_t> const& faces) -> std::string
{
    std::string body;
    for (size_t i{}; i < faces.size(); ++i)
    {
        body += (i ? "," : "");
        body += std::format("{}", static_cast<int>(faces[i]));
    }
    return body;
}

} // anonymous namespace

namespace polyboard::core::debug
{

auto describe(Intent const& i) -> std::string
{
    return std::visit(
        [&]<typename T0>(T0 const& act) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, MoveIntent>)
            {
                return std::format("{} Move({})", s_player(i.player), act.spaces);
            }
            else if constexpr (std::is_same_v<T, RollIntent>)
            {
                return std::format("{} Roll", s_player(i.player));
            }
            else if constexpr (std::is_same_v<T, PurchaseIntent>)
            {
                return std::format("{} Purchase", s_player(i.player));
            }
            else if constexpr (std::is_same_v<T, TradeIntent>)
            {
                return std::format("{} Trade(#{} {}->{} for {})", s_player(i.player),
                                   act.position, s_player(act.seller), s_player(act.buyer), act.price);
            }
            else if constexpr (std::is_same_v<T, AttackIntent>)
            {
                return std::format("{} Attack({})", s_player(i.player), s_player(act.target));
            }
            else
            {
                static_assert(util::always_false_v<T>, "unhandled intent");
            }
        },
        i.action
    );
}

auto describe(MatchEvent const& e) -> std::string
{
    return std::visit(
        []<typename T0>(T0 const& ev) -> std::string
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, PlayerMoved>)
                return std::format("Moved {} {}->{} ({})", s_player(ev.player), ev.from, ev.to, ev.spaces);
            else if constexpr (std::is_same_v<T, PassedStart>)
                return std::format("PassedStart {}", s_player(ev.player));
            else if constexpr (std::is_same_v<T, BonusCredited>)
                return std::format("Bonus {} +{} ={}", s_player(ev.player), ev.amount, ev.balance);
            else if constexpr (std::is_same_v<T, DiceRolled>)
                return std::format("Dice {} [{}]={}{}", s_player(ev.player), s_faces(ev.faces), ev.total,
                                   ev.extra_turn ? " again" : "");
            else if constexpr (std::is_same_v<T, PropertyPurchased>)
                return std::format("Bought {} #{} for {} ={}", s_player(ev.player), ev.position, ev.price, ev.balance);
            else if constexpr (std::is_same_v<T, PurchaseDeclined>)
                return std::format("Declined {} #{} price {} ={}", s_player(ev.player), ev.position, ev.price, ev.balance);
            else if constexpr (std::is_same_v<T, RentPaid>)
                return std::format("Rent {}->{} #{} {} ={}/{}", s_player(ev.payer), s_player(ev.owner), ev.position,
                                   ev.amount, ev.payer_balance, ev.owner_balance);
            else if constexpr (std::is_same_v<T, PlayerBankrupt>)
                return std::format("Bankrupt {} owing {} ={}", s_player(ev.player), s_player(ev.creditor), ev.balance);
            else if constexpr (std::is_same_v<T, PropertyReleased>)
                return std::format("Released #{} from {}", ev.position, s_player(ev.previous_owner));
            else if constexpr (std::is_same_v<T, PropertyTraded>)
                return std::format("Traded #{} {}->{} for {}", ev.position, s_player(ev.seller), s_player(ev.buyer), ev.price);
            else if constexpr (std::is_same_v<T, DamageDealt>)
                return std::format("Damage {} {}->{} {} hp={}", to_string(ev.kind), s_player(ev.attacker),
                                   s_player(ev.target), ev.amount, ev.health);
            else if constexpr (std::is_same_v<T, PlayerEliminated>)
                return std::format("Eliminated {} by {}", s_player(ev.player), s_player(ev.by));
            else if constexpr (std::is_same_v<T, TurnChanged>)
                return std::format("Turn {} #{}", s_player(ev.player), ev.turn_number);
            else if constexpr (std::is_same_v<T, MatchOver>)
                return std::format("MatchOver winner={} ({})", s_player(ev.winner), to_string(ev.reason));
            else
                static_assert(util::always_false_v<T>, "unhandled event");
        },
        e
    );
}

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
    if (!out_.is_open())
        PBD_THROW(error::Code::State, "AuditLogger could not open its transcript file");
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(MatchState const& match) -> void
{
    BoardTopology const topo = match.Board().Topology();
    out_ << std::format("Seed={}\n", match.Seed());
    out_ << std::format("Archetype={}\n", to_string(match.Kind()));
    out_ << std::format("Board={} size={} side={}\n", s_shape(topo.shape), topo.size, topo.side);
    out_ << std::format("Players={}\n", static_cast<int>(match.PlayerCount()));
    out_ << std::format("Modules: currency={} property={} combat={}\n",
                        match.HasCurrency(), match.HasProperty(), match.HasCombat());
    if (PropertyRegistry const* reg = match.Property())
    {
        for (PropertyRecord const& r : reg->Records())
        {
            out_ << std::format("Property #{} \"{}\" price={} rent={}\n", r.position, r.name, r.price, r.rent);
        }
    }
    out_ << presets::Summary(match.Rules());
    out_.flush();
}

auto AuditLogger::intent(Intent const& i) -> void
{
    out_ << std::format("Intent: {}\n", describe(i));
}

auto AuditLogger::rejected(error::RuleViolation const& v) -> void
{
    out_ << std::format("Rejected: {}\n", error::describe(v));
}

auto AuditLogger::outcome(ResolutionOutcome o) -> void
{
    out_ << std::format("Outcome: {}\n", s_outcome(o));
}

auto AuditLogger::Publish(MatchEvent const& event) -> void
{
    out_ << std::format("Event: {}\n", describe(event));
}

auto AuditLogger::end(MatchState const& match) -> void
{
    int const winner = match.Winner().has_value() ? static_cast<int>(*match.Winner()) : -1;
    out_ << std::format("Winner={}\n", winner);
    if (auto const reason = match.EndReason(); reason.has_value())
        out_ << std::format("Reason={}\n", to_string(*reason));
    out_ << std::format("Turns={}\n", match.TurnNumber());
    for (PlayerState const& p : match.Players())
    {
        out_ << std::format("{} pos={} balance={} health={} active={} owned={}\n",
                            s_player(p.id), p.position, p.balance, p.health, p.active, p.owned.size());
    }
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    out_.flush();
}

} // namespace polyboard::core::debug
