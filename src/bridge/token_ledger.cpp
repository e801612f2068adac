// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <bridge/token_ledger.h>

#include <util.h>

namespace bridge {

InMemoryTokenLedger::InMemoryTokenLedger(const Address& custody)
    : custody_(custody)
{
}

CAmount InMemoryTokenLedger::BalanceOf(const Address& account) const
{
    LOCK(cs_ledger_);
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

bool InMemoryTokenLedger::Transfer(const Address& to, CAmount amount)
{
    LOCK(cs_ledger_);
    return Move(custody_, to, amount);
}

bool InMemoryTokenLedger::TransferFrom(const Address& from, const Address& to, CAmount amount)
{
    LOCK(cs_ledger_);
    return Move(from, to, amount);
}

bool InMemoryTokenLedger::Mint(const Address& to, CAmount amount)
{
    LOCK(cs_ledger_);
    if (to.IsNull() || !MoneyRange(amount)) return false;
    CAmount newBalance = 0;
    if (!CheckedAdd(balances_[to], amount, newBalance) || !MoneyRange(newBalance)) return false;
    balances_[to] = newBalance;
    return true;
}

CAmount InMemoryTokenLedger::TotalSupply() const
{
    LOCK(cs_ledger_);
    CAmount total = 0;
    for (const auto& entry : balances_) {
        total += entry.second;
    }
    return total;
}

void InMemoryTokenLedger::FailNextTransfers(uint32_t n)
{
    LOCK(cs_ledger_);
    failNext_ = n;
}

bool InMemoryTokenLedger::Move(const Address& from, const Address& to, CAmount amount)
{
    if (failNext_ > 0) {
        --failNext_;
        LogPrint(BCLog::BRIDGE, "TokenLedger: injected transfer failure %s -> %s\n",
                 from.ToString(), to.ToString());
        return false;
    }
    if (to.IsNull() || amount < 0 || !MoneyRange(amount)) return false;
    if (amount == 0 || from == to) return true;

    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return false;
    }
    it->second -= amount;
    balances_[to] += amount;
    return true;
}

} // namespace bridge
