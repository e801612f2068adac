// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUORUM_BRIDGE_TOKEN_LEDGER_H
#define QUORUM_BRIDGE_TOKEN_LEDGER_H

/**
 * @file token_ledger.h
 * @brief Fungible token ledger consumed by the bridge core
 *
 * The bridge only ever reads balances and moves tokens. A false return
 * from Transfer or TransferFrom is treated as a hard failure by callers.
 */

#include <bridge/bridge_common.h>
#include <amount.h>
#include <sync.h>

#include <map>

namespace bridge {

class TokenLedger {
public:
    virtual ~TokenLedger() = default;

    virtual CAmount BalanceOf(const Address& account) const = 0;

    /** Move amount from the bridge custody account to another account */
    virtual bool Transfer(const Address& to, CAmount amount) = 0;

    /** Move amount between two accounts on behalf of the bridge */
    virtual bool TransferFrom(const Address& from, const Address& to, CAmount amount) = 0;
};

/**
 * @brief Balance map implementation of TokenLedger
 *
 * Transfer() debits the configured custody account. Used by the node
 * tooling and by tests.
 */
class InMemoryTokenLedger : public TokenLedger {
public:
    explicit InMemoryTokenLedger(const Address& custody);

    CAmount BalanceOf(const Address& account) const override;
    bool Transfer(const Address& to, CAmount amount) override;
    bool TransferFrom(const Address& from, const Address& to, CAmount amount) override;

    /** Create tokens out of thin air (test and tooling setup) */
    bool Mint(const Address& to, CAmount amount);

    /** Sum of all balances */
    CAmount TotalSupply() const;

    /** Make the next n transfers fail */
    void FailNextTransfers(uint32_t n);

private:
    mutable CCriticalSection cs_ledger_;
    Address custody_;
    std::map<Address, CAmount> balances_;
    uint32_t failNext_ = 0;

    bool Move(const Address& from, const Address& to, CAmount amount);
};

} // namespace bridge

#endif // QUORUM_BRIDGE_TOKEN_LEDGER_H
