// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUORUM_BRIDGE_BRIDGE_STATE_MACHINE_H
#define QUORUM_BRIDGE_BRIDGE_STATE_MACHINE_H

/**
 * @file bridge_state_machine.h
 * @brief Lifecycle of bridge transfers
 *
 * A transfer is created PENDING when the user's principal and fee are
 * locked in custody, and leaves PENDING exactly once:
 *
 *   PENDING -> COMPLETED   eligible attesters reach the validator threshold
 *   PENDING -> FAILED      eligible fail votes reach the validator threshold
 *   PENDING -> CANCELLED   the user cancels after the transaction timeout
 *
 * Attesters are re-checked for eligibility whenever quorum is evaluated,
 * so an attester that was slashed out of eligibility, or whose attestation
 * was invalidated by a challenge, no longer counts.
 *
 * Every token transfer happens before any state is touched. A rejected
 * call leaves the state machine unchanged.
 */

#include <bridge/attestation.h>
#include <bridge/bridge_common.h>
#include <bridge/bridge_params.h>
#include <bridge/bridge_signals.h>
#include <bridge/payment_handler.h>
#include <bridge/token_ledger.h>
#include <bridge/validator_registry.h>
#include <bridge/volume_limiter.h>
#include <amount.h>
#include <serialize.h>
#include <sync.h>
#include <uint256.h>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace bridge {

struct BridgeTransaction {
    uint64_t nonce;
    Address user;
    CAmount amount;
    ChainId sourceChain;
    ChainId destChain;
    CAmount fee;
    uint64_t createdAt;
    TxStatus status;

    /** Destination side proof, set on completion */
    uint256 proofHash;

    uint64_t completedAt;
    TrustStatus trustStatus;
    std::string failureReason;

    /** Fee settled through the payment handler instead of the ledger */
    bool feePrepaid;
    uint256 paymentId;

    BridgeTransaction()
        : nonce(0)
        , amount(0)
        , sourceChain(0)
        , destChain(0)
        , fee(0)
        , createdAt(0)
        , status(TxStatus::PENDING)
        , completedAt(0)
        , trustStatus(TrustStatus::TRUSTED)
        , feePrepaid(false)
    {}

    bool IsPending() const { return status == TxStatus::PENDING; }

    /** Fee held in custody for this transfer */
    CAmount GetCustodyFee() const { return feePrepaid ? 0 : fee; }

    /** Amount returned to the user on failure or cancellation */
    CAmount GetRefund() const { return amount + GetCustodyFee(); }

    AttestationMessage GetMessage() const {
        return AttestationMessage(nonce, user, amount, sourceChain, destChain);
    }

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(nonce);
        READWRITE(user);
        READWRITE(amount);
        READWRITE(sourceChain);
        READWRITE(destChain);
        READWRITE(fee);
        READWRITE(createdAt);
        uint8_t statusByte = static_cast<uint8_t>(status);
        READWRITE(statusByte);
        READWRITE(proofHash);
        READWRITE(completedAt);
        uint8_t trustByte = static_cast<uint8_t>(trustStatus);
        READWRITE(trustByte);
        READWRITE(failureReason);
        READWRITE(feePrepaid);
        READWRITE(paymentId);
        if (ser_action.ForRead()) {
            status = static_cast<TxStatus>(statusByte);
            trustStatus = static_cast<TrustStatus>(trustByte);
        }
    }
};

/** Per destination chain activity */
struct ChainMetrics {
    uint64_t transfers;
    CAmount volume;
    CAmount fees;

    ChainMetrics() : transfers(0), volume(0), fees(0) {}
};

/**
 * @brief Bridge statistics for monitoring
 *
 * Principal conservation: totalLocked == pendingPrincipal + totalReleased + totalRefunded.
 */
struct BridgeStats {
    CAmount totalLocked;
    CAmount pendingPrincipal;
    CAmount totalReleased;
    CAmount totalRefunded;

    /** Fees of completed transfers, including prepaid ones */
    CAmount totalFees;

    /** Collected fees still held in custody */
    CAmount feePool;

    uint64_t totalTransactions;
    uint64_t pendingCount;
    uint64_t completedCount;
    uint64_t failedCount;
    uint64_t cancelledCount;
    uint64_t disputedCount;

    /** completed / finished, in bps */
    uint32_t successRateBps;

    /** Mean seconds from creation to completion */
    uint64_t averageCompletionTime;

    std::map<ChainId, ChainMetrics> chains;

    BridgeStats()
        : totalLocked(0)
        , pendingPrincipal(0)
        , totalReleased(0)
        , totalRefunded(0)
        , totalFees(0)
        , feePool(0)
        , totalTransactions(0)
        , pendingCount(0)
        , completedCount(0)
        , failedCount(0)
        , cancelledCount(0)
        , disputedCount(0)
        , successRateBps(0)
        , averageCompletionTime(0)
    {}
};

/**
 * @brief Health summary of the bridge
 *
 * The bridge is healthy when no transfer is stuck past the transaction
 * timeout, enough eligible validators remain to reach the threshold and
 * at least one destination chain is active.
 */
struct BridgeHealth {
    bool healthy;
    std::vector<std::string> issues;

    uint64_t stuckCount;
    size_t activeValidators;
    size_t eligibleValidators;
    uint32_t threshold;

    /** isActive flag of every configured chain */
    std::map<ChainId, bool> chainStatus;

    BridgeHealth()
        : healthy(false)
        , stuckCount(0)
        , activeValidators(0)
        , eligibleValidators(0)
        , threshold(0)
    {}
};

/** Resource id a prepaid fee must be paid for */
uint256 GetPrepaidFeeResource(const Address& user, CAmount amount, ChainId destChain);

/**
 * Proof handed to the destination chain: commits to the attested message
 * and the attesters that completed it.
 */
uint256 ComputeProofHash(const uint256& messageHash, const std::vector<Address>& attesters);

class BridgeStateMachine {
public:
    /**
     * @param payments optional off-chain payment handler, may be null
     */
    BridgeStateMachine(const BridgeParams& params, TokenLedger& ledger, ValidatorRegistry& registry,
                       AttestationLedger& attestations, BridgeSignals& signals,
                       PaymentHandler* payments = nullptr);

    /** Fee for a transfer toward destChain, validating chain and amount bounds */
    BridgeResult QuoteFee(CAmount amount, ChainId destChain, CAmount& feeOut) const;

    /**
     * Lock amount + fee from the user's wallet and create a PENDING transfer.
     * @param[out] nonceOut nonce of the new transfer
     */
    BridgeResult Initiate(const Address& user, CAmount amount, ChainId destChain, uint64_t now, uint64_t& nonceOut);

    /**
     * Like Initiate, with the fee settled by the payment handler.
     * Only the principal is locked and refunded.
     */
    BridgeResult InitiatePrepaid(const Address& user, CAmount amount, ChainId destChain,
                                 const uint256& paymentId, uint64_t now, uint64_t& nonceOut);

    /** Commit phase of the commit-reveal attestation mode */
    BridgeResult Commit(const Address& validator, uint64_t nonce, const uint256& commitment, uint64_t now);

    /** Record an attestation and complete the transfer once quorum is reached */
    BridgeResult Attest(const Address& validator, uint64_t nonce, const AttestationSubmission& submission, uint64_t now);

    /**
     * Cast a fail vote. Once eligible fail votes reach the threshold the
     * transfer becomes FAILED and is refunded.
     */
    BridgeResult VoteFail(const Address& validator, uint64_t nonce, const std::string& reason, uint64_t now);

    /** Refund a transfer that stayed PENDING past the timeout. User only. */
    BridgeResult Cancel(const Address& user, uint64_t nonce, uint64_t now);

    /**
     * Re-evaluate quorum of a pending transfer with current eligibility.
     * Returns true if the transfer completed.
     */
    bool Finalize(uint64_t nonce, uint64_t now);

    /** Flag a transfer as disputed after a successful challenge */
    BridgeResult MarkDisputed(uint64_t nonce, uint64_t challengeId);

    /** Pay out collected fees. Owner only. */
    BridgeResult WithdrawFees(const Address& caller, const Address& to, CAmount amount);

    std::optional<BridgeTransaction> GetTransaction(uint64_t nonce) const;
    std::vector<BridgeTransaction> GetTransactions() const;
    std::vector<BridgeTransaction> GetPending() const;
    std::vector<BridgeTransaction> GetUserTransactions(const Address& user) const;

    /** Attesters that currently count toward quorum */
    std::vector<Address> GetCountedAttesters(uint64_t nonce, uint64_t now) const;

    uint64_t GetNextNonce() const;
    CAmount GetFeePool() const;
    CAmount GetFeesWithdrawn() const;

    BridgeStats GetStats() const;

    /** PENDING transfers with now >= createdAt + transactionTimeout, oldest first */
    std::vector<BridgeTransaction> GetStuckTransactions(uint64_t now) const;

    BridgeHealth GetHealth(uint64_t now) const;

    const VolumeLimiter& GetVolumeLimiter() const { return volume_; }
    VolumeLimiter& GetVolumeLimiter() { return volume_; }

    /** Restore persisted state. Counters are rebuilt from the transactions. */
    void LoadTransaction(const BridgeTransaction& tx);
    void LoadCounters(uint64_t nextNonce, CAmount feesWithdrawn);

    void Clear();

    /** Held by BridgeNode across a snapshot, in the order given in challenge_manager.h */
    CCriticalSection& GetLock() const { return cs_bridge_; }

private:
    const BridgeParams& params_;
    TokenLedger& ledger_;
    ValidatorRegistry& registry_;
    AttestationLedger& attestations_;
    BridgeSignals& signals_;
    PaymentHandler* payments_;

    mutable CCriticalSection cs_bridge_;
    std::map<uint64_t, BridgeTransaction> transactions_;
    uint64_t nextNonce_;

    /** Fees of pending transfers held in custody */
    CAmount pendingFees_;

    /** Fees of completed transfers not yet withdrawn */
    CAmount feePool_;
    CAmount feesWithdrawn_;

    std::set<uint256> usedPayments_;
    VolumeLimiter volume_;

    // Callers hold cs_bridge_
    BridgeResult CreateTransfer(const Address& user, CAmount amount, ChainId destChain, CAmount fee,
                                bool prepaid, const uint256& paymentId, uint64_t now, uint64_t& nonceOut);
    std::vector<Address> CountEligible(const std::vector<Address>& voters, uint64_t now) const;
    bool TryComplete(BridgeTransaction& tx, uint64_t now);
    void ApplyLoadedTransaction(const BridgeTransaction& tx);
};

} // namespace bridge

#endif // QUORUM_BRIDGE_BRIDGE_STATE_MACHINE_H
