// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <bridge/payment_handler.h>

#include <hash.h>
#include <util.h>

namespace bridge {

std::optional<uint256> InMemoryPaymentHandler::ProcessPayment(const uint256& resourceId, CAmount amount)
{
    if (resourceId.IsNull() || amount <= 0 || !MoneyRange(amount)) {
        return std::nullopt;
    }

    LOCK(cs_payments_);
    CHashWriter ss(SER_GETHASH, 0);
    ss << std::string("QUORUM_PAYMENT");
    ss << resourceId;
    ss << amount;
    ss << ++sequence_;
    uint256 paymentId = ss.GetHash();

    payments_[paymentId] = Payment{resourceId, amount};
    LogPrint(BCLog::BRIDGE, "Payment: recorded %s for resource %s amount=%s\n",
             paymentId.ToString(), resourceId.ToString(), FormatMoney(amount));
    return paymentId;
}

bool InMemoryPaymentHandler::VerifyPayment(const uint256& paymentId, const uint256& resourceId) const
{
    LOCK(cs_payments_);
    auto it = payments_.find(paymentId);
    return it != payments_.end() && it->second.resourceId == resourceId;
}

CAmount InMemoryPaymentHandler::GetPaymentAmount(const uint256& paymentId) const
{
    LOCK(cs_payments_);
    auto it = payments_.find(paymentId);
    return it == payments_.end() ? 0 : it->second.amount;
}

} // namespace bridge
