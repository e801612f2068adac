// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <bridge/attestation.h>

#include <hash.h>
#include <util.h>

namespace bridge {

uint256 AttestationMessage::GetHash() const
{
    CHashWriter ss(SER_GETHASH, 0);
    ss << ATTESTATION_DOMAIN_TAG;
    ss << nonce;
    ss << user;
    ss << amount;
    ss << sourceChain;
    ss << destChain;
    return ss.GetHash();
}

uint256 ComputeCommitment(const uint256& txHash, const uint256& secret)
{
    CHashWriter ss(SER_GETHASH, 0);
    ss << txHash;
    ss << secret;
    return ss.GetHash();
}

Address AddressFromPubKey(const CPubKey& pubkey)
{
    return Address(pubkey.GetID());
}

std::optional<Address> RecoverSigner(const uint256& hash, const std::vector<unsigned char>& signature)
{
    if (signature.size() != CPubKey::COMPACT_SIGNATURE_SIZE) {
        return std::nullopt;
    }
    CPubKey pubkey;
    if (!pubkey.RecoverCompact(hash, signature)) {
        return std::nullopt;
    }
    return AddressFromPubKey(pubkey);
}

// ============================================================================
// Strategies
// ============================================================================

BridgeResult DirectSignatureStrategy::GetSignedDigest(const uint256& txHash, const AttestationSubmission& submission,
                                                      const AttestationCommitment* commitment, uint64_t now,
                                                      uint256& digestOut) const
{
    digestOut = txHash;
    return BridgeResult::Ok();
}

BridgeResult CommitRevealStrategy::GetSignedDigest(const uint256& txHash, const AttestationSubmission& submission,
                                                   const AttestationCommitment* commitment, uint64_t now,
                                                   uint256& digestOut) const
{
    if (commitment == nullptr) {
        return BridgeResult::Fail(BridgeError::COMMITMENT_NOT_FOUND);
    }
    if (!IsCommitmentLive(*commitment, now)) {
        return BridgeResult::Fail(BridgeError::REVEAL_WINDOW_EXPIRED,
            strprintf("Commitment made at %u expired at %u", commitment->committedAt, commitment->committedAt + revealWindow_));
    }
    if (ComputeCommitment(txHash, submission.secret) != commitment->commitment) {
        return BridgeResult::Fail(BridgeError::COMMITMENT_MISMATCH);
    }
    digestOut = commitment->commitment;
    return BridgeResult::Ok();
}

std::unique_ptr<AttestationStrategy> MakeAttestationStrategy(AttestationMode mode, uint64_t revealWindow)
{
    switch (mode) {
    case AttestationMode::COMMIT_REVEAL:
        return std::unique_ptr<AttestationStrategy>(new CommitRevealStrategy(revealWindow));
    case AttestationMode::DIRECT_SIGNATURE:
        break;
    }
    return std::unique_ptr<AttestationStrategy>(new DirectSignatureStrategy());
}

// ============================================================================
// Ledger
// ============================================================================

AttestationLedger::AttestationLedger(std::unique_ptr<AttestationStrategy> strategy)
    : strategy_(std::move(strategy))
{
}

uint256 AttestationLedger::GetSignatureId(const std::vector<unsigned char>& signature)
{
    return Hash(signature.begin(), signature.end());
}

BridgeResult AttestationLedger::Commit(uint64_t nonce, const Address& validator, const uint256& commitment, uint64_t now)
{
    if (!strategy_->RequiresCommitment()) {
        return BridgeResult::Fail(BridgeError::UNSUPPORTED_OPERATION, "Active attestation mode has no commit phase");
    }
    if (commitment.IsNull()) {
        return BridgeResult::Fail(BridgeError::INVALID_PARAMETER, "Empty commitment");
    }

    LOCK(cs_attest_);

    auto rec = records_.find(nonce);
    if (rec != records_.end() && rec->second.HasAttested(validator)) {
        return BridgeResult::Fail(BridgeError::DUPLICATE_ATTESTATION);
    }

    const auto key = std::make_pair(nonce, validator);
    auto it = commitments_.find(key);
    if (it != commitments_.end() && strategy_->IsCommitmentLive(it->second, now)) {
        return BridgeResult::Fail(BridgeError::DUPLICATE_ATTESTATION, "Commitment already pending");
    }

    AttestationCommitment entry;
    entry.nonce = nonce;
    entry.validator = validator;
    entry.commitment = commitment;
    entry.committedAt = now;
    commitments_[key] = entry;

    LogPrint(BCLog::ATTEST, "AttestationLedger: %s committed to transfer %u\n", validator.ToString(), nonce);
    return BridgeResult::Ok();
}

BridgeResult AttestationLedger::Record(const AttestationMessage& message, const Address& validator,
                                       const AttestationSubmission& submission, uint64_t now)
{
    LOCK(cs_attest_);

    auto rec = records_.find(message.nonce);
    if (rec != records_.end() && rec->second.HasAttested(validator)) {
        return BridgeResult::Fail(BridgeError::DUPLICATE_ATTESTATION,
            strprintf("Validator %s already attested transfer %u", validator.ToString(), message.nonce));
    }

    const uint256 signatureId = GetSignatureId(submission.signature);
    if (consumedSignatures_.count(signatureId)) {
        return BridgeResult::Fail(BridgeError::DUPLICATE_ATTESTATION, "Signature already consumed");
    }

    const auto key = std::make_pair(message.nonce, validator);
    auto pending = commitments_.find(key);
    const AttestationCommitment* commitment = pending == commitments_.end() ? nullptr : &pending->second;

    uint256 digest;
    BridgeResult result = strategy_->GetSignedDigest(message.GetHash(), submission, commitment, now, digest);
    if (!result) {
        return result;
    }

    std::optional<Address> signer = RecoverSigner(digest, submission.signature);
    if (!signer || *signer != validator) {
        return BridgeResult::Fail(BridgeError::INVALID_SIGNATURE,
            strprintf("Signature does not recover to %s", validator.ToString()));
    }

    AttestationRecord& record = records_[message.nonce];
    record.nonce = message.nonce;
    record.attestations[validator] = now;
    consumedSignatures_.insert(signatureId);
    if (pending != commitments_.end()) {
        commitments_.erase(pending);
    }

    LogPrint(BCLog::ATTEST, "AttestationLedger: %s attested transfer %u (%u total)\n",
             validator.ToString(), message.nonce, record.Count());
    return BridgeResult::Ok();
}

BridgeResult AttestationLedger::RecordFailVote(uint64_t nonce, const Address& validator)
{
    LOCK(cs_attest_);

    AttestationRecord& record = records_[nonce];
    record.nonce = nonce;
    if (!record.failVotes.insert(validator).second) {
        return BridgeResult::Fail(BridgeError::DUPLICATE_ATTESTATION, "Fail vote already cast");
    }
    LogPrint(BCLog::ATTEST, "AttestationLedger: %s voted to fail transfer %u (%u votes)\n",
             validator.ToString(), nonce, record.failVotes.size());
    return BridgeResult::Ok();
}

bool AttestationLedger::Invalidate(uint64_t nonce, const Address& validator)
{
    LOCK(cs_attest_);

    auto it = records_.find(nonce);
    if (it == records_.end() || !it->second.HasAttested(validator)) {
        return false;
    }
    return it->second.invalidated.insert(validator).second;
}

bool AttestationLedger::HasAttested(uint64_t nonce, const Address& validator) const
{
    LOCK(cs_attest_);
    auto it = records_.find(nonce);
    return it != records_.end() && it->second.HasAttested(validator);
}

bool AttestationLedger::IsInvalidated(uint64_t nonce, const Address& validator) const
{
    LOCK(cs_attest_);
    auto it = records_.find(nonce);
    return it != records_.end() && it->second.invalidated.count(validator) > 0;
}

size_t AttestationLedger::GetAttestationCount(uint64_t nonce) const
{
    LOCK(cs_attest_);
    auto it = records_.find(nonce);
    return it == records_.end() ? 0 : it->second.Count();
}

std::vector<Address> AttestationLedger::GetValidAttesters(uint64_t nonce) const
{
    LOCK(cs_attest_);
    std::vector<Address> result;
    auto it = records_.find(nonce);
    if (it == records_.end()) {
        return result;
    }
    for (const auto& entry : it->second.attestations) {
        if (!it->second.invalidated.count(entry.first)) {
            result.push_back(entry.first);
        }
    }
    return result;
}

std::vector<Address> AttestationLedger::GetFailVoters(uint64_t nonce) const
{
    LOCK(cs_attest_);
    auto it = records_.find(nonce);
    if (it == records_.end()) {
        return std::vector<Address>();
    }
    return std::vector<Address>(it->second.failVotes.begin(), it->second.failVotes.end());
}

std::optional<AttestationRecord> AttestationLedger::GetRecord(uint64_t nonce) const
{
    LOCK(cs_attest_);
    auto it = records_.find(nonce);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<AttestationCommitment> AttestationLedger::GetCommitment(uint64_t nonce, const Address& validator) const
{
    LOCK(cs_attest_);
    auto it = commitments_.find(std::make_pair(nonce, validator));
    if (it == commitments_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void AttestationLedger::ClearCommitments(uint64_t nonce)
{
    LOCK(cs_attest_);
    auto it = commitments_.lower_bound(std::make_pair(nonce, Address()));
    while (it != commitments_.end() && it->first.first == nonce) {
        it = commitments_.erase(it);
    }
}

size_t AttestationLedger::PurgeExpiredCommitments(uint64_t now, uint64_t revealWindow)
{
    LOCK(cs_attest_);
    size_t purged = 0;
    for (auto it = commitments_.begin(); it != commitments_.end();) {
        if (now > it->second.committedAt + revealWindow) {
            it = commitments_.erase(it);
            purged++;
        } else {
            ++it;
        }
    }
    if (purged > 0) {
        LogPrint(BCLog::ATTEST, "AttestationLedger: Purged %u expired commitments\n", purged);
    }
    return purged;
}

bool AttestationLedger::IsSignatureConsumed(const uint256& signatureId) const
{
    LOCK(cs_attest_);
    return consumedSignatures_.count(signatureId) > 0;
}

std::vector<AttestationRecord> AttestationLedger::GetAllRecords() const
{
    LOCK(cs_attest_);
    std::vector<AttestationRecord> result;
    result.reserve(records_.size());
    for (const auto& entry : records_) {
        result.push_back(entry.second);
    }
    return result;
}

std::vector<AttestationCommitment> AttestationLedger::GetAllCommitments() const
{
    LOCK(cs_attest_);
    std::vector<AttestationCommitment> result;
    for (const auto& entry : commitments_) {
        result.push_back(entry.second);
    }
    return result;
}

std::set<uint256> AttestationLedger::GetConsumedSignatures() const
{
    LOCK(cs_attest_);
    return consumedSignatures_;
}

void AttestationLedger::LoadRecord(const AttestationRecord& record)
{
    LOCK(cs_attest_);
    records_[record.nonce] = record;
}

void AttestationLedger::LoadCommitment(const AttestationCommitment& commitment)
{
    LOCK(cs_attest_);
    commitments_[std::make_pair(commitment.nonce, commitment.validator)] = commitment;
}

void AttestationLedger::LoadConsumedSignature(const uint256& signatureId)
{
    LOCK(cs_attest_);
    consumedSignatures_.insert(signatureId);
}

void AttestationLedger::Clear()
{
    LOCK(cs_attest_);
    records_.clear();
    consumedSignatures_.clear();
    commitments_.clear();
}

} // namespace bridge
