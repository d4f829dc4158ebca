//
// Exception.hpp
//

#ifndef POLYBOARD_EXCEPTION_HPP
#define POLYBOARD_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <stdexcept>
#include <format>
#include <utility>
#include "Types.hpp"
#include "Actions.hpp"

namespace polyboard::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Rules, // module misuse (not a player intent that broke a rule)
        State, // match state misuse (not a player intent that broke a rule)
        InvalidAction, // intent cannot be applied
        Configuration, // contradictory rule configuration
        Construction, // composer could not wire a module
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct RulesError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigurationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConstructionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c);
        case Code::Rules: throw RulesError(std::move(msg), c);
        case Code::State: throw StateError(std::move(msg), c);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c);
        case Code::Configuration: throw ConfigurationError(std::move(msg), c);
        case Code::Construction: throw ConstructionError(std::move(msg), c);
        case Code::Serialization: throw SerializationError(std::move(msg), c);
        case Code::Assertion: throw AssertionError(std::move(msg), c);
        }
        throw std::runtime_error(msg);
    }

#define PBD_THROW(code_enum, msg) ::polyboard::core::error::fail((code_enum), (msg))
#define PBD_ASSERT(cond, msg) do { if(!(cond)) ::polyboard::core::error::fail(::polyboard::core::error::Code::Assertion, (msg)); } while(0)

    // Fine-grained reasons; grouped by intent type.
    enum class RuleViolationCode : std::uint16_t
    {
        // Generic/flow
        Match_Over,
        Match_Aborted,
        UnknownPlayer,
        OutOfTurn,
        PlayerInactive,

        // Feature gates
        Feature_PurchaseDisabled,
        Feature_TradingDisabled,
        Feature_CombatDisabled,

        // Purchase
        Purchase_NoProperty,
        Purchase_AlreadyOwned,
        Purchase_InsufficientFunds,

        // Trade
        Trade_NotSeller,
        Trade_NoProperty,
        Trade_SellerNotOwner,
        Trade_SamePlayer,
        Trade_UnknownBuyer,
        Trade_BuyerInactive,
        Trade_NegativePrice,
        Trade_InsufficientFunds,

        // Attack
        Attack_SelfTarget,
        Attack_UnknownTarget,
        Attack_TargetInactive,

        // Safety net
        Internal_Unreachable
    };

    // Compact, optional context carried with the violation.
    struct RuleViolation
    {
        RuleViolationCode code{};
        std::optional<TurnPhase> phase{};
        std::optional<PlayerIdT> actor{};
        std::optional<PlayerIdT> current{};
        std::optional<PlayerIdT> target{};
        std::optional<PosT> position{};
        std::optional<MoneyT> amount{};
        std::optional<MoneyT> balance{};

        auto with_phase(TurnPhase p) -> RuleViolation&
        {
            phase = p;
            return *this;
        }

        auto with_actor(PlayerIdT s) -> RuleViolation&
        {
            actor = s;
            return *this;
        }

        auto with_current(PlayerIdT s) -> RuleViolation&
        {
            current = s;
            return *this;
        }

        auto with_target(PlayerIdT s) -> RuleViolation&
        {
            target = s;
            return *this;
        }

        auto with_position(PosT p) -> RuleViolation&
        {
            position = p;
            return *this;
        }

        auto with_amount(MoneyT v) -> RuleViolation&
        {
            amount = v;
            return *this;
        }

        auto with_balance(MoneyT v) -> RuleViolation&
        {
            balance = v;
            return *this;
        }
    };

    inline auto to_string(RuleViolationCode c) -> std::string_view
    {
        using E = RuleViolationCode;
        switch (c)
        {
        // Flow
        case E::Match_Over: return "Match is over";
        case E::Match_Aborted: return "Match was aborted";
        case E::UnknownPlayer: return "Unknown player";
        case E::OutOfTurn: return "Out of turn";
        case E::PlayerInactive: return "Player is no longer active";

        // Features
        case E::Feature_PurchaseDisabled: return "Purchasing is disabled";
        case E::Feature_TradingDisabled: return "Trading is disabled";
        case E::Feature_CombatDisabled: return "Combat is disabled";

        // Purchase
        case E::Purchase_NoProperty: return "Purchase: no property at position";
        case E::Purchase_AlreadyOwned: return "Purchase: property already owned";
        case E::Purchase_InsufficientFunds: return "Purchase: insufficient funds";

        // Trade
        case E::Trade_NotSeller: return "Trade: only the owner can offer a trade";
        case E::Trade_NoProperty: return "Trade: no property at position";
        case E::Trade_SellerNotOwner: return "Trade: seller does not own property";
        case E::Trade_SamePlayer: return "Trade: seller and buyer are the same player";
        case E::Trade_UnknownBuyer: return "Trade: unknown buyer";
        case E::Trade_BuyerInactive: return "Trade: buyer is not active";
        case E::Trade_NegativePrice: return "Trade: negative price";
        case E::Trade_InsufficientFunds: return "Trade: buyer cannot pay";

        // Attack
        case E::Attack_SelfTarget: return "Attack: cannot target self";
        case E::Attack_UnknownTarget: return "Attack: unknown target";
        case E::Attack_TargetInactive: return "Attack: target is not active";

        case E::Internal_Unreachable: return "Internal: unreachable";
        }
        return "Unknown";
    }

    inline auto to_string(TurnPhase p) -> std::string_view
    {
        switch (p)
        {
        case TurnPhase::AwaitingIntent: return "awaiting";
        case TurnPhase::Resolving: return "resolving";
        case TurnPhase::MatchOver: return "over";
        }
        return "?";
    }

    inline auto describe(RuleViolation const& v) -> std::string
    {
        // Build a compact, reproducible message for logs/tests.
        auto s = std::format("{}", to_string(v.code));
        if (v.phase) s += std::format(" | phase={}", to_string(*v.phase));
        if (v.actor) s += std::format(" | actor=P{}", static_cast<int>(*v.actor));
        if (v.current) s += std::format(" | turn=P{}", static_cast<int>(*v.current));
        if (v.target) s += std::format(" | target=P{}", static_cast<int>(*v.target));
        if (v.position) s += std::format(" | pos={}", *v.position);
        if (v.amount) s += std::format(" | amount={}", *v.amount);
        if (v.balance) s += std::format(" | balance={}", *v.balance);
        return s;
    }

    using ValidateResult = std::expected<void, RuleViolation>;
}

#endif //POLYBOARD_EXCEPTION_HPP
