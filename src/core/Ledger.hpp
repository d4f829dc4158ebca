//
// Ledger.hpp
//

#ifndef POLYBOARD_LEDGER_HPP
#define POLYBOARD_LEDGER_HPP

#include <expected>
#include <limits>
#include <unordered_set>
#include "Types.hpp"
#include "State.hpp"

namespace polyboard::core
{
    enum class LedgerErrorCode : uint8_t
    {
        InsufficientFunds
    };

    struct LedgerError
    {
        LedgerErrorCode code{LedgerErrorCode::InsufficientFunds};
        PlayerIdT       player{};
        MoneyT          balance{};
        MoneyT          requested{};
    };

    auto describe(LedgerError const& e) -> std::string;

    class CurrencyLedger
    {
    public:
        using Result = std::expected<void, LedgerError>;

        CurrencyLedger() = delete;
        explicit CurrencyLedger(Roster& roster);

        // A credit carrying a txn id is applied at most once. Throws if the balance would overflow MoneyT.
        auto Credit(PlayerIdT player, MoneyT amount, std::optional<TxnIdT> txn = std::nullopt) -> void;
        auto Debit(PlayerIdT player, MoneyT amount) -> Result;
        // Debit then credit; a failed debit leaves both balances as they were.
        auto Transfer(PlayerIdT from, PlayerIdT to, MoneyT amount) -> Result;

        auto Balance(PlayerIdT player) const -> MoneyT;
        auto CanAfford(PlayerIdT player, MoneyT amount) const -> bool;
        auto IsBankrupt(PlayerIdT player) const -> bool;

    private:
        auto At(PlayerIdT player) -> PlayerState&;
        auto At(PlayerIdT player) const -> PlayerState const&;
        static auto CheckAmount(MoneyT amount) -> void;
        static auto CheckHeadroom(PlayerState const& p, MoneyT amount) -> void;

    private:
        Roster& roster_;
        std::unordered_set<TxnIdT> applied_;
    };
}

#endif //POLYBOARD_LEDGER_HPP
