//
// Ledger.cpp
//

#include "Ledger.hpp"

#include <format>
#include "Exception.hpp"
#include "Util.hpp"

namespace polyboard::core
{
    auto describe(LedgerError const& e) -> std::string
    {
        switch (e.code)
        {
        case LedgerErrorCode::InsufficientFunds:
            return std::format("Insufficient funds | player=P{} | balance={} | requested={}",
                               static_cast<int>(e.player), e.balance, e.requested);
        }
        return "Unknown ledger error";
    }

    CurrencyLedger::CurrencyLedger(Roster& roster) :
        roster_(roster)
    {
    }

    auto CurrencyLedger::At(PlayerIdT const player) -> PlayerState&
    {
        if (!util::IsKnownPlayer(roster_, player))
            PBD_THROW(error::Code::State, std::format("Ledger: unknown player {}", static_cast<int>(player)));
        return roster_[player];
    }

    auto CurrencyLedger::At(PlayerIdT const player) const -> PlayerState const&
    {
        if (!util::IsKnownPlayer(roster_, player))
            PBD_THROW(error::Code::State, std::format("Ledger: unknown player {}", static_cast<int>(player)));
        return roster_[player];
    }

    auto CurrencyLedger::CheckAmount(MoneyT const amount) -> void
    {
        if (amount < 0)
            PBD_THROW(error::Code::Rules, std::format("Ledger: negative amount {}", amount));
    }

    auto CurrencyLedger::CheckHeadroom(PlayerState const& p, MoneyT const amount) -> void
    {
        if (amount > std::numeric_limits<MoneyT>::max() - p.balance)
            PBD_THROW(error::Code::State, std::format("Ledger: credit of {} overflows balance {} of P{}",
                                                      amount, p.balance, static_cast<int>(p.id)));
    }

    auto CurrencyLedger::Credit(PlayerIdT const player, MoneyT const amount, std::optional<TxnIdT> const txn) -> void
    {
        CheckAmount(amount);
        PlayerState& p = At(player);
        CheckHeadroom(p, amount);

        if (txn.has_value() && !applied_.insert(*txn).second)
            return; // retried

        p.balance += amount;
        PBD_ASSERT(p.balance >= 0, "Negative balance after credit");
    }

    auto CurrencyLedger::Debit(PlayerIdT const player, MoneyT const amount) -> Result
    {
        CheckAmount(amount);
        PlayerState& p = At(player);

        if (p.balance < amount)
        {
            return std::unexpected(LedgerError{
                .code = LedgerErrorCode::InsufficientFunds,
                .player = player,
                .balance = p.balance,
                .requested = amount });
        }

        p.balance -= amount;
        PBD_ASSERT(p.balance >= 0, "Negative balance after debit");
        return {};
    }

    auto CurrencyLedger::Transfer(PlayerIdT const from, PlayerIdT const to, MoneyT const amount) -> Result
    {
        CheckAmount(amount);
        // validate both ends before touching anything
        PlayerState const& payee = At(to);
        if (from != to) CheckHeadroom(payee, amount);

        if (auto const ok = Debit(from, amount); !ok.has_value())
            return ok;

        Credit(to, amount);
        return {};
    }

    auto CurrencyLedger::Balance(PlayerIdT const player) const -> MoneyT
    {
        return At(player).balance;
    }

    auto CurrencyLedger::CanAfford(PlayerIdT const player, MoneyT const amount) const -> bool
    {
        return At(player).balance >= amount;
    }

    auto CurrencyLedger::IsBankrupt(PlayerIdT const player) const -> bool
    {
        return At(player).balance <= 0;
    }
}
