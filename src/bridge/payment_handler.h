// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUORUM_BRIDGE_PAYMENT_HANDLER_H
#define QUORUM_BRIDGE_PAYMENT_HANDLER_H

/**
 * @file payment_handler.h
 * @brief Off-chain payment collaborator
 *
 * Lets a bridge fee be settled outside the token ledger. The bridge
 * identifies the paid resource by a hash and asks the handler to confirm
 * a payment id before accepting a prepaid transfer.
 */

#include <amount.h>
#include <sync.h>
#include <uint256.h>

#include <map>
#include <optional>

namespace bridge {

class PaymentHandler {
public:
    virtual ~PaymentHandler() = default;

    /** Charge amount for resourceId. Returns the payment id, or nullopt if rejected. */
    virtual std::optional<uint256> ProcessPayment(const uint256& resourceId, CAmount amount) = 0;

    /** True if paymentId is a settled payment for resourceId */
    virtual bool VerifyPayment(const uint256& paymentId, const uint256& resourceId) const = 0;
};

/** Payment handler that records payments in memory */
class InMemoryPaymentHandler : public PaymentHandler {
public:
    std::optional<uint256> ProcessPayment(const uint256& resourceId, CAmount amount) override;
    bool VerifyPayment(const uint256& paymentId, const uint256& resourceId) const override;

    /** Amount recorded for a payment, 0 if unknown */
    CAmount GetPaymentAmount(const uint256& paymentId) const;

private:
    struct Payment {
        uint256 resourceId;
        CAmount amount;
    };

    mutable CCriticalSection cs_payments_;
    std::map<uint256, Payment> payments_;
    uint64_t sequence_ = 0;
};

} // namespace bridge

#endif // QUORUM_BRIDGE_PAYMENT_HANDLER_H
