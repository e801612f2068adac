// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <bridge/bridge_state_machine.h>

#include <hash.h>
#include <util.h>

#include <algorithm>

namespace bridge {

uint256 GetPrepaidFeeResource(const Address& user, CAmount amount, ChainId destChain)
{
    CHashWriter ss(SER_GETHASH, 0);
    ss << std::string("QUORUM_BRIDGE_FEE");
    ss << user;
    ss << amount;
    ss << destChain;
    return ss.GetHash();
}

uint256 ComputeProofHash(const uint256& messageHash, const std::vector<Address>& attesters)
{
    std::vector<Address> sorted(attesters);
    std::sort(sorted.begin(), sorted.end());

    CHashWriter ss(SER_GETHASH, 0);
    ss << messageHash;
    ss << sorted;
    return ss.GetHash();
}

BridgeStateMachine::BridgeStateMachine(const BridgeParams& params, TokenLedger& ledger, ValidatorRegistry& registry,
                                       AttestationLedger& attestations, BridgeSignals& signals,
                                       PaymentHandler* payments)
    : params_(params)
    , ledger_(ledger)
    , registry_(registry)
    , attestations_(attestations)
    , signals_(signals)
    , payments_(payments)
    , nextNonce_(1)
    , pendingFees_(0)
    , feePool_(0)
    , feesWithdrawn_(0)
    , volume_(params.globalDailyLimit, params.userDailyLimit, params.volumeEpoch)
{
}

// ============================================================================
// Initiation
// ============================================================================

BridgeResult BridgeStateMachine::QuoteFee(CAmount amount, ChainId destChain, CAmount& feeOut) const
{
    if (destChain == params_.sourceChainId) {
        return BridgeResult::Fail(BridgeError::UNSUPPORTED_CHAIN, "Destination equals source chain");
    }
    const ChainConfig* chain = params_.GetChain(destChain);
    if (chain == nullptr) {
        return BridgeResult::Fail(BridgeError::UNSUPPORTED_CHAIN, strprintf("Chain %u is not supported", destChain));
    }
    if (amount <= 0 || !MoneyRange(amount)) {
        return BridgeResult::Fail(BridgeError::INVALID_AMOUNT);
    }
    if (amount < chain->minAmount || amount > chain->maxAmount) {
        return BridgeResult::Fail(BridgeError::AMOUNT_OUT_OF_BOUNDS,
            strprintf("Amount %s outside [%s, %s] for %s", FormatMoney(amount),
                      FormatMoney(chain->minAmount), FormatMoney(chain->maxAmount), chain->name));
    }
    if (!chain->ComputeFee(amount, feeOut)) {
        return BridgeResult::Fail(BridgeError::ARITHMETIC_OVERFLOW);
    }
    return BridgeResult::Ok();
}

BridgeResult BridgeStateMachine::CreateTransfer(const Address& user, CAmount amount, ChainId destChain, CAmount fee,
                                                bool prepaid, const uint256& paymentId, uint64_t now, uint64_t& nonceOut)
{
    CAmount pull = amount;
    if (!prepaid && !CheckedAdd(amount, fee, pull)) {
        return BridgeResult::Fail(BridgeError::ARITHMETIC_OVERFLOW);
    }

    BridgeResult limit = volume_.Check(user, amount, now);
    if (!limit) {
        return limit;
    }
    if (ledger_.BalanceOf(user) < pull) {
        return BridgeResult::Fail(BridgeError::INSUFFICIENT_BALANCE,
            strprintf("Balance below %s", FormatMoney(pull)));
    }
    if (!ledger_.TransferFrom(user, params_.custody, pull)) {
        return BridgeResult::Fail(BridgeError::TOKEN_TRANSFER_FAILED, "Lock transfer failed");
    }

    BridgeTransaction tx;
    tx.nonce = nextNonce_++;
    tx.user = user;
    tx.amount = amount;
    tx.sourceChain = params_.sourceChainId;
    tx.destChain = destChain;
    tx.fee = fee;
    tx.createdAt = now;
    tx.status = TxStatus::PENDING;
    tx.feePrepaid = prepaid;
    tx.paymentId = paymentId;
    transactions_[tx.nonce] = tx;

    volume_.Record(user, amount, now);
    pendingFees_ += tx.GetCustodyFee();
    if (prepaid) {
        usedPayments_.insert(paymentId);
    }

    nonceOut = tx.nonce;
    LogPrint(BCLog::BRIDGE, "BridgeStateMachine: Transfer %u initiated by %s amount=%s fee=%s dest=%u%s\n",
             tx.nonce, user.ToString(), FormatMoney(amount), FormatMoney(fee), destChain,
             prepaid ? " (fee prepaid)" : "");
    return BridgeResult::Ok();
}

BridgeResult BridgeStateMachine::Initiate(const Address& user, CAmount amount, ChainId destChain,
                                          uint64_t now, uint64_t& nonceOut)
{
    CAmount fee = 0;
    {
        LOCK(cs_bridge_);

        if (user.IsNull() || user == params_.custody) {
            return BridgeResult::Fail(BridgeError::INVALID_ADDRESS);
        }
        BridgeResult quote = QuoteFee(amount, destChain, fee);
        if (!quote) {
            return quote;
        }
        BridgeResult result = CreateTransfer(user, amount, destChain, fee, false, uint256(), now, nonceOut);
        if (!result) {
            return result;
        }
    }

    signals_.TransferInitiated(nonceOut, user, amount, destChain, fee);
    return BridgeResult::Ok();
}

BridgeResult BridgeStateMachine::InitiatePrepaid(const Address& user, CAmount amount, ChainId destChain,
                                                 const uint256& paymentId, uint64_t now, uint64_t& nonceOut)
{
    CAmount fee = 0;
    {
        LOCK(cs_bridge_);

        if (payments_ == nullptr) {
            return BridgeResult::Fail(BridgeError::UNSUPPORTED_OPERATION, "No payment handler configured");
        }
        if (user.IsNull() || user == params_.custody) {
            return BridgeResult::Fail(BridgeError::INVALID_ADDRESS);
        }
        BridgeResult quote = QuoteFee(amount, destChain, fee);
        if (!quote) {
            return quote;
        }
        if (paymentId.IsNull() || usedPayments_.count(paymentId)) {
            return BridgeResult::Fail(BridgeError::PAYMENT_INVALID, "Payment already used");
        }
        if (!payments_->VerifyPayment(paymentId, GetPrepaidFeeResource(user, amount, destChain))) {
            return BridgeResult::Fail(BridgeError::PAYMENT_INVALID,
                strprintf("Payment %s does not cover this transfer", paymentId.ToString()));
        }
        BridgeResult result = CreateTransfer(user, amount, destChain, fee, true, paymentId, now, nonceOut);
        if (!result) {
            return result;
        }
    }

    signals_.TransferInitiated(nonceOut, user, amount, destChain, fee);
    return BridgeResult::Ok();
}

// ============================================================================
// Attestation
// ============================================================================

std::vector<Address> BridgeStateMachine::CountEligible(const std::vector<Address>& voters, uint64_t now) const
{
    std::vector<Address> result;
    for (const Address& voter : voters) {
        if (registry_.IsEligible(voter, now)) {
            result.push_back(voter);
        }
    }
    return result;
}

bool BridgeStateMachine::TryComplete(BridgeTransaction& tx, uint64_t now)
{
    const std::vector<Address> counted = CountEligible(attestations_.GetValidAttesters(tx.nonce), now);
    if (counted.size() < params_.validatorThreshold) {
        return false;
    }

    const CAmount custodyFee = tx.GetCustodyFee();
    tx.status = TxStatus::COMPLETED;
    tx.completedAt = now;
    tx.proofHash = ComputeProofHash(tx.GetMessage().GetHash(), counted);
    pendingFees_ -= custodyFee;
    feePool_ += custodyFee;
    attestations_.ClearCommitments(tx.nonce);

    LogPrintf("BridgeStateMachine: Transfer %u completed with %u attestations, proof %s\n",
              tx.nonce, counted.size(), tx.proofHash.ToString());
    return true;
}

BridgeResult BridgeStateMachine::Commit(const Address& validator, uint64_t nonce, const uint256& commitment, uint64_t now)
{
    LOCK(cs_bridge_);

    auto it = transactions_.find(nonce);
    if (it == transactions_.end()) {
        return BridgeResult::Fail(BridgeError::TX_NOT_FOUND);
    }
    const BridgeTransaction& tx = it->second;
    if (!tx.IsPending()) {
        return BridgeResult::Fail(BridgeError::INVALID_STATE, strprintf("Transfer is %s", TxStatusToString(tx.status)));
    }
    if (now >= tx.createdAt + params_.transactionTimeout) {
        return BridgeResult::Fail(BridgeError::ATTESTATION_WINDOW_EXPIRED);
    }
    if (!registry_.IsEligible(validator, now)) {
        return BridgeResult::Fail(BridgeError::NOT_ELIGIBLE_VALIDATOR);
    }
    return attestations_.Commit(nonce, validator, commitment, now);
}

BridgeResult BridgeStateMachine::Attest(const Address& validator, uint64_t nonce,
                                        const AttestationSubmission& submission, uint64_t now)
{
    BridgeTransaction tx;
    uint32_t count = 0;
    bool completed = false;
    {
        LOCK(cs_bridge_);

        auto it = transactions_.find(nonce);
        if (it == transactions_.end()) {
            return BridgeResult::Fail(BridgeError::TX_NOT_FOUND);
        }
        BridgeTransaction& entry = it->second;
        if (!entry.IsPending()) {
            return BridgeResult::Fail(BridgeError::INVALID_STATE, strprintf("Transfer is %s", TxStatusToString(entry.status)));
        }
        if (now >= entry.createdAt + params_.transactionTimeout) {
            return BridgeResult::Fail(BridgeError::ATTESTATION_WINDOW_EXPIRED);
        }
        if (!registry_.IsEligible(validator, now)) {
            return BridgeResult::Fail(BridgeError::NOT_ELIGIBLE_VALIDATOR);
        }
        const std::vector<Address> failVoters = attestations_.GetFailVoters(nonce);
        if (std::find(failVoters.begin(), failVoters.end(), validator) != failVoters.end()) {
            return BridgeResult::Fail(BridgeError::DUPLICATE_ATTESTATION, "Validator already voted to fail this transfer");
        }

        BridgeResult result = attestations_.Record(entry.GetMessage(), validator, submission, now);
        if (!result) {
            return result;
        }
        if (!registry_.RecordAttestation(validator, now)) {
            LogPrintf("BridgeStateMachine: Attester %s missing from registry\n", validator.ToString());
        }
        count = attestations_.GetAttestationCount(nonce);
        completed = TryComplete(entry, now);
        tx = entry;
    }

    signals_.TransferAttested(nonce, validator, count);
    if (completed) {
        signals_.TransferCompleted(tx.nonce, tx.user, tx.amount, tx.proofHash);
    }
    return BridgeResult::Ok();
}

bool BridgeStateMachine::Finalize(uint64_t nonce, uint64_t now)
{
    BridgeTransaction tx;
    {
        LOCK(cs_bridge_);

        auto it = transactions_.find(nonce);
        if (it == transactions_.end() || !it->second.IsPending()) {
            return false;
        }
        if (now >= it->second.createdAt + params_.transactionTimeout) {
            return false;
        }
        if (!TryComplete(it->second, now)) {
            return false;
        }
        tx = it->second;
    }

    signals_.TransferCompleted(tx.nonce, tx.user, tx.amount, tx.proofHash);
    return true;
}

BridgeResult BridgeStateMachine::VoteFail(const Address& validator, uint64_t nonce, const std::string& reason, uint64_t now)
{
    BridgeTransaction tx;
    bool failed = false;
    {
        LOCK(cs_bridge_);

        auto it = transactions_.find(nonce);
        if (it == transactions_.end()) {
            return BridgeResult::Fail(BridgeError::TX_NOT_FOUND);
        }
        BridgeTransaction& entry = it->second;
        if (!entry.IsPending()) {
            return BridgeResult::Fail(BridgeError::INVALID_STATE, strprintf("Transfer is %s", TxStatusToString(entry.status)));
        }
        if (!registry_.IsEligible(validator, now)) {
            return BridgeResult::Fail(BridgeError::NOT_ELIGIBLE_VALIDATOR);
        }
        if (attestations_.HasAttested(nonce, validator)) {
            return BridgeResult::Fail(BridgeError::DUPLICATE_ATTESTATION, "Validator already attested this transfer");
        }
        std::vector<Address> voters = attestations_.GetFailVoters(nonce);
        if (std::find(voters.begin(), voters.end(), validator) != voters.end()) {
            return BridgeResult::Fail(BridgeError::DUPLICATE_ATTESTATION, "Fail vote already cast");
        }
        voters.push_back(validator);
        failed = CountEligible(voters, now).size() >= params_.validatorThreshold;

        if (failed) {
            // Refund before recording so a failed transfer leaves no trace
            if (!ledger_.Transfer(entry.user, entry.GetRefund())) {
                return BridgeResult::Fail(BridgeError::TOKEN_TRANSFER_FAILED, "Refund transfer failed");
            }
        }

        BridgeResult voted = attestations_.RecordFailVote(nonce, validator);
        if (!voted) {
            LogPrintf("BridgeStateMachine: Fail vote of %s on transfer %u not recorded: %s\n",
                      validator.ToString(), nonce, voted.ToString());
        }

        if (failed) {
            pendingFees_ -= entry.GetCustodyFee();
            entry.status = TxStatus::FAILED;
            entry.failureReason = reason;
            attestations_.ClearCommitments(nonce);
            LogPrintf("BridgeStateMachine: Transfer %u failed by validator quorum (%s), refunded %s\n",
                      nonce, reason, FormatMoney(entry.GetRefund()));
        } else {
            LogPrint(BCLog::BRIDGE, "BridgeStateMachine: %s voted to fail transfer %u (%s)\n",
                     validator.ToString(), nonce, reason);
        }
        tx = entry;
    }

    if (failed) {
        signals_.TransferFailed(tx.nonce, tx.user, tx.failureReason);
    }
    return BridgeResult::Ok();
}

BridgeResult BridgeStateMachine::Cancel(const Address& user, uint64_t nonce, uint64_t now)
{
    {
        LOCK(cs_bridge_);

        auto it = transactions_.find(nonce);
        if (it == transactions_.end()) {
            return BridgeResult::Fail(BridgeError::TX_NOT_FOUND);
        }
        BridgeTransaction& tx = it->second;
        if (tx.user != user) {
            return BridgeResult::Fail(BridgeError::NOT_TRANSACTION_OWNER);
        }
        if (!tx.IsPending()) {
            return BridgeResult::Fail(BridgeError::INVALID_STATE, strprintf("Transfer is %s", TxStatusToString(tx.status)));
        }
        if (now < tx.createdAt + params_.transactionTimeout) {
            return BridgeResult::Fail(BridgeError::TIMEOUT_NOT_ELAPSED,
                strprintf("Cancellable from %u", tx.createdAt + params_.transactionTimeout));
        }
        if (!ledger_.Transfer(user, tx.GetRefund())) {
            return BridgeResult::Fail(BridgeError::TOKEN_TRANSFER_FAILED, "Refund transfer failed");
        }

        pendingFees_ -= tx.GetCustodyFee();
        tx.status = TxStatus::CANCELLED;
        attestations_.ClearCommitments(nonce);

        LogPrint(BCLog::BRIDGE, "BridgeStateMachine: Transfer %u cancelled, refunded %s\n",
                 nonce, FormatMoney(tx.GetRefund()));
    }

    signals_.TransferCancelled(nonce, user);
    return BridgeResult::Ok();
}

BridgeResult BridgeStateMachine::MarkDisputed(uint64_t nonce, uint64_t challengeId)
{
    {
        LOCK(cs_bridge_);

        auto it = transactions_.find(nonce);
        if (it == transactions_.end()) {
            return BridgeResult::Fail(BridgeError::TX_NOT_FOUND);
        }
        it->second.trustStatus = TrustStatus::DISPUTED;
        LogPrint(BCLog::BRIDGE, "BridgeStateMachine: Transfer %u disputed by challenge %u\n", nonce, challengeId);
    }

    signals_.TransferDisputed(nonce, challengeId);
    return BridgeResult::Ok();
}

BridgeResult BridgeStateMachine::WithdrawFees(const Address& caller, const Address& to, CAmount amount)
{
    LOCK(cs_bridge_);

    if (caller != params_.owner) {
        return BridgeResult::Fail(BridgeError::NOT_OWNER);
    }
    if (to.IsNull()) {
        return BridgeResult::Fail(BridgeError::INVALID_ADDRESS);
    }
    if (amount <= 0) {
        return BridgeResult::Fail(BridgeError::INVALID_AMOUNT);
    }
    if (amount > feePool_) {
        return BridgeResult::Fail(BridgeError::INSUFFICIENT_FUND_BALANCE,
            strprintf("Fee pool holds %s", FormatMoney(feePool_)));
    }
    if (!ledger_.Transfer(to, amount)) {
        return BridgeResult::Fail(BridgeError::TOKEN_TRANSFER_FAILED);
    }
    feePool_ -= amount;
    feesWithdrawn_ += amount;

    LogPrintf("BridgeStateMachine: Withdrew %s fees to %s\n", FormatMoney(amount), to.ToString());
    return BridgeResult::Ok();
}

// ============================================================================
// Queries
// ============================================================================

std::optional<BridgeTransaction> BridgeStateMachine::GetTransaction(uint64_t nonce) const
{
    LOCK(cs_bridge_);
    auto it = transactions_.find(nonce);
    if (it == transactions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<BridgeTransaction> BridgeStateMachine::GetTransactions() const
{
    LOCK(cs_bridge_);
    std::vector<BridgeTransaction> result;
    result.reserve(transactions_.size());
    for (const auto& entry : transactions_) {
        result.push_back(entry.second);
    }
    return result;
}

std::vector<BridgeTransaction> BridgeStateMachine::GetPending() const
{
    LOCK(cs_bridge_);
    std::vector<BridgeTransaction> result;
    for (const auto& entry : transactions_) {
        if (entry.second.IsPending()) {
            result.push_back(entry.second);
        }
    }
    return result;
}

std::vector<BridgeTransaction> BridgeStateMachine::GetUserTransactions(const Address& user) const
{
    LOCK(cs_bridge_);
    std::vector<BridgeTransaction> result;
    for (const auto& entry : transactions_) {
        if (entry.second.user == user) {
            result.push_back(entry.second);
        }
    }
    return result;
}

std::vector<Address> BridgeStateMachine::GetCountedAttesters(uint64_t nonce, uint64_t now) const
{
    LOCK(cs_bridge_);
    return CountEligible(attestations_.GetValidAttesters(nonce), now);
}

uint64_t BridgeStateMachine::GetNextNonce() const
{
    LOCK(cs_bridge_);
    return nextNonce_;
}

CAmount BridgeStateMachine::GetFeePool() const
{
    LOCK(cs_bridge_);
    return feePool_;
}

CAmount BridgeStateMachine::GetFeesWithdrawn() const
{
    LOCK(cs_bridge_);
    return feesWithdrawn_;
}

BridgeStats BridgeStateMachine::GetStats() const
{
    LOCK(cs_bridge_);

    BridgeStats stats;
    uint64_t completionTime = 0;
    for (const auto& entry : transactions_) {
        const BridgeTransaction& tx = entry.second;
        stats.totalTransactions++;
        stats.totalLocked += tx.amount;

        ChainMetrics& chain = stats.chains[tx.destChain];
        chain.transfers++;
        chain.volume += tx.amount;

        switch (tx.status) {
        case TxStatus::PENDING:
            stats.pendingCount++;
            stats.pendingPrincipal += tx.amount;
            break;
        case TxStatus::COMPLETED:
            stats.completedCount++;
            stats.totalReleased += tx.amount;
            stats.totalFees += tx.fee;
            chain.fees += tx.fee;
            completionTime += tx.completedAt - tx.createdAt;
            break;
        case TxStatus::FAILED:
            stats.failedCount++;
            stats.totalRefunded += tx.amount;
            break;
        case TxStatus::CANCELLED:
            stats.cancelledCount++;
            stats.totalRefunded += tx.amount;
            break;
        }
        if (tx.trustStatus == TrustStatus::DISPUTED) {
            stats.disputedCount++;
        }
    }

    const uint64_t finished = stats.completedCount + stats.failedCount + stats.cancelledCount;
    if (finished > 0) {
        stats.successRateBps = static_cast<uint32_t>(stats.completedCount * BPS_DENOMINATOR / finished);
    }
    if (stats.completedCount > 0) {
        stats.averageCompletionTime = completionTime / stats.completedCount;
    }
    stats.feePool = feePool_;
    return stats;
}

std::vector<BridgeTransaction> BridgeStateMachine::GetStuckTransactions(uint64_t now) const
{
    LOCK(cs_bridge_);
    std::vector<BridgeTransaction> result;
    for (const auto& entry : transactions_) {
        const BridgeTransaction& tx = entry.second;
        if (tx.IsPending() && now >= tx.createdAt + params_.transactionTimeout) {
            result.push_back(tx);
        }
    }
    std::stable_sort(result.begin(), result.end(), [](const BridgeTransaction& a, const BridgeTransaction& b) {
        return a.createdAt < b.createdAt;
    });
    return result;
}

BridgeHealth BridgeStateMachine::GetHealth(uint64_t now) const
{
    BridgeHealth health;
    health.threshold = params_.validatorThreshold;
    health.stuckCount = GetStuckTransactions(now).size();
    if (health.stuckCount > 0) {
        health.issues.push_back(strprintf("%u transfers pending past the %us timeout",
                                          health.stuckCount, params_.transactionTimeout));
    }

    for (const ValidatorInfo& info : registry_.GetActiveValidators()) {
        health.activeValidators++;
        if (registry_.IsEligible(info.address, now)) {
            health.eligibleValidators++;
        }
    }
    if (health.eligibleValidators < params_.validatorThreshold) {
        health.issues.push_back(strprintf("%u eligible validators, threshold is %u",
                                          health.eligibleValidators, params_.validatorThreshold));
    }

    bool anyChain = false;
    for (const auto& entry : params_.chains) {
        health.chainStatus[entry.first] = entry.second.isActive;
        anyChain |= entry.second.isActive;
    }
    if (!anyChain) {
        health.issues.push_back("No active destination chain");
    }

    health.healthy = health.issues.empty();
    if (!health.healthy) {
        LogPrint(BCLog::BRIDGE, "BridgeStateMachine: Unhealthy at %u: %u issues\n", now, health.issues.size());
    }
    return health;
}

// ============================================================================
// Persistence
// ============================================================================

void BridgeStateMachine::ApplyLoadedTransaction(const BridgeTransaction& tx)
{
    transactions_[tx.nonce] = tx;
    nextNonce_ = std::max(nextNonce_, tx.nonce + 1);
    if (tx.IsPending()) {
        pendingFees_ += tx.GetCustodyFee();
    } else if (tx.status == TxStatus::COMPLETED) {
        feePool_ += tx.GetCustodyFee();
    }
    if (tx.feePrepaid) {
        usedPayments_.insert(tx.paymentId);
    }
}

void BridgeStateMachine::LoadTransaction(const BridgeTransaction& tx)
{
    LOCK(cs_bridge_);
    ApplyLoadedTransaction(tx);
}

void BridgeStateMachine::LoadCounters(uint64_t nextNonce, CAmount feesWithdrawn)
{
    LOCK(cs_bridge_);
    nextNonce_ = std::max(nextNonce_, nextNonce);
    feePool_ -= feesWithdrawn - feesWithdrawn_;
    feesWithdrawn_ = feesWithdrawn;
}

void BridgeStateMachine::Clear()
{
    LOCK(cs_bridge_);
    transactions_.clear();
    nextNonce_ = 1;
    pendingFees_ = 0;
    feePool_ = 0;
    feesWithdrawn_ = 0;
    usedPayments_.clear();
    volume_.Clear();
}

} // namespace bridge
