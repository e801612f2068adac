// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUORUM_BRIDGE_ATTESTATION_H
#define QUORUM_BRIDGE_ATTESTATION_H

/**
 * @file attestation.h
 * @brief Validator attestations and their signature protocol
 *
 * A validator attests a pending transfer by signing the canonical
 * attestation message with a compact recoverable secp256k1 signature.
 * The ledger recovers the signer and requires it to be the submitting
 * validator.
 *
 * Two interchangeable strategies decide what exactly is signed:
 *
 * - Direct signature: the signature covers the message hash.
 * - Commit-reveal: the validator first publishes
 *   commitment = Hash(messageHash || secret), then reveals the secret
 *   together with a signature over the commitment. A commitment that is
 *   not revealed within the reveal window is void.
 *
 * Consumed signatures are remembered so a signature can never be counted
 * twice, even for a different validator.
 */

#include <bridge/bridge_common.h>
#include <amount.h>
#include <key.h>
#include <pubkey.h>
#include <serialize.h>
#include <sync.h>
#include <uint256.h>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace bridge {

/** Domain separation tag of the attestation message */
static const std::string ATTESTATION_DOMAIN_TAG = "QUORUM_BRIDGE_ATTESTATION_V1";

/** Fields of a transfer that a validator vouches for */
struct AttestationMessage {
    uint64_t nonce;
    Address user;
    CAmount amount;
    ChainId sourceChain;
    ChainId destChain;

    AttestationMessage() : nonce(0), amount(0), sourceChain(0), destChain(0) {}

    AttestationMessage(uint64_t nonceIn, const Address& userIn, CAmount amountIn, ChainId src, ChainId dst)
        : nonce(nonceIn), user(userIn), amount(amountIn), sourceChain(src), destChain(dst) {}

    /** Double SHA-256 of the domain tag followed by the fields */
    uint256 GetHash() const;
};

/** commitment = Hash(txHash || secret) */
uint256 ComputeCommitment(const uint256& txHash, const uint256& secret);

/** Address controlled by a public key */
Address AddressFromPubKey(const CPubKey& pubkey);

/** Signer of a compact signature, or nullopt if it does not recover */
std::optional<Address> RecoverSigner(const uint256& hash, const std::vector<unsigned char>& signature);

/** What a validator submits to attest a transfer */
struct AttestationSubmission {
    /** Compact recoverable signature (65 bytes) */
    std::vector<unsigned char> signature;

    /** Commitment secret, commit-reveal only */
    uint256 secret;

    AttestationSubmission() {}
    explicit AttestationSubmission(const std::vector<unsigned char>& sig) : signature(sig) {}
    AttestationSubmission(const std::vector<unsigned char>& sig, const uint256& secretIn)
        : signature(sig), secret(secretIn) {}
};

/** A published, not yet revealed commitment */
struct AttestationCommitment {
    uint64_t nonce;
    Address validator;
    uint256 commitment;
    uint64_t committedAt;

    AttestationCommitment() : nonce(0), committedAt(0) {}

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(nonce);
        READWRITE(validator);
        READWRITE(commitment);
        READWRITE(committedAt);
    }
};

/**
 * @brief Attestations and fail votes gathered for one transaction
 *
 * Entries are never removed. Attesters whose attestation was proven
 * fraudulent are moved into invalidated and stop counting toward quorum,
 * but stay in attestations so the count never decreases.
 */
struct AttestationRecord {
    uint64_t nonce;

    /** validator -> time of attestation */
    std::map<Address, uint64_t> attestations;

    std::set<Address> failVotes;
    std::set<Address> invalidated;

    AttestationRecord() : nonce(0) {}

    size_t Count() const { return attestations.size(); }
    bool HasAttested(const Address& validator) const { return attestations.count(validator) > 0; }

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(nonce);
        READWRITE(attestations);
        READWRITE(failVotes);
        READWRITE(invalidated);
    }
};

// ============================================================================
// Strategies
// ============================================================================

/**
 * @brief Decides which digest a validator's signature must cover
 */
class AttestationStrategy {
public:
    virtual ~AttestationStrategy() = default;

    virtual AttestationMode GetMode() const = 0;

    /** Whether a commit phase precedes the attestation */
    virtual bool RequiresCommitment() const = 0;

    /** Whether a published commitment can still be revealed */
    virtual bool IsCommitmentLive(const AttestationCommitment& commitment, uint64_t now) const = 0;

    /**
     * Resolve the digest the submitted signature has to cover.
     * @param[in] commitment the validator's pending commitment, if any
     * @param[out] digestOut digest to recover the signer from
     */
    virtual BridgeResult GetSignedDigest(const uint256& txHash, const AttestationSubmission& submission,
                                         const AttestationCommitment* commitment, uint64_t now,
                                         uint256& digestOut) const = 0;
};

class DirectSignatureStrategy : public AttestationStrategy {
public:
    AttestationMode GetMode() const override { return AttestationMode::DIRECT_SIGNATURE; }
    bool RequiresCommitment() const override { return false; }
    bool IsCommitmentLive(const AttestationCommitment&, uint64_t) const override { return false; }
    BridgeResult GetSignedDigest(const uint256& txHash, const AttestationSubmission& submission,
                                 const AttestationCommitment* commitment, uint64_t now,
                                 uint256& digestOut) const override;
};

class CommitRevealStrategy : public AttestationStrategy {
public:
    explicit CommitRevealStrategy(uint64_t revealWindow) : revealWindow_(revealWindow) {}

    AttestationMode GetMode() const override { return AttestationMode::COMMIT_REVEAL; }
    bool RequiresCommitment() const override { return true; }
    bool IsCommitmentLive(const AttestationCommitment& commitment, uint64_t now) const override {
        return now <= commitment.committedAt + revealWindow_;
    }
    BridgeResult GetSignedDigest(const uint256& txHash, const AttestationSubmission& submission,
                                 const AttestationCommitment* commitment, uint64_t now,
                                 uint256& digestOut) const override;

private:
    const uint64_t revealWindow_;
};

std::unique_ptr<AttestationStrategy> MakeAttestationStrategy(AttestationMode mode, uint64_t revealWindow);

// ============================================================================
// Ledger
// ============================================================================

class AttestationLedger {
public:
    explicit AttestationLedger(std::unique_ptr<AttestationStrategy> strategy);

    AttestationMode GetMode() const { return strategy_->GetMode(); }

    /**
     * Publish a commitment for a transaction.
     * UNSUPPORTED_OPERATION when the active strategy has no commit phase.
     */
    BridgeResult Commit(uint64_t nonce, const Address& validator, const uint256& commitment, uint64_t now);

    /**
     * Verify a submission and record the attestation.
     *
     * Checks, in order: the validator has not attested yet, the signature
     * has not been consumed, the strategy accepts the submission, and the
     * signature recovers to the validator. Eligibility is the caller's
     * responsibility.
     */
    BridgeResult Record(const AttestationMessage& message, const Address& validator,
                        const AttestationSubmission& submission, uint64_t now);

    /** Record a fail vote. DUPLICATE_ATTESTATION if already cast. */
    BridgeResult RecordFailVote(uint64_t nonce, const Address& validator);

    /** Stop counting a validator's attestation toward quorum */
    bool Invalidate(uint64_t nonce, const Address& validator);

    bool HasAttested(uint64_t nonce, const Address& validator) const;
    bool IsInvalidated(uint64_t nonce, const Address& validator) const;

    /** Number of recorded attestations, including invalidated ones */
    size_t GetAttestationCount(uint64_t nonce) const;

    /** Attesters whose attestation still stands */
    std::vector<Address> GetValidAttesters(uint64_t nonce) const;

    std::vector<Address> GetFailVoters(uint64_t nonce) const;

    std::optional<AttestationRecord> GetRecord(uint64_t nonce) const;
    std::optional<AttestationCommitment> GetCommitment(uint64_t nonce, const Address& validator) const;

    /** Drop commitments of a transaction that left PENDING */
    void ClearCommitments(uint64_t nonce);

    /** Drop commitments older than the reveal window, returns how many */
    size_t PurgeExpiredCommitments(uint64_t now, uint64_t revealWindow);

    bool IsSignatureConsumed(const uint256& signatureId) const;

    /** Identifier of a signature in the replay set */
    static uint256 GetSignatureId(const std::vector<unsigned char>& signature);

    std::vector<AttestationRecord> GetAllRecords() const;
    std::vector<AttestationCommitment> GetAllCommitments() const;
    std::set<uint256> GetConsumedSignatures() const;

    void LoadRecord(const AttestationRecord& record);
    void LoadCommitment(const AttestationCommitment& commitment);
    void LoadConsumedSignature(const uint256& signatureId);

    void Clear();

    /** Held by BridgeNode across a snapshot, in the order given in challenge_manager.h */
    CCriticalSection& GetLock() const { return cs_attest_; }

private:
    std::unique_ptr<AttestationStrategy> strategy_;

    mutable CCriticalSection cs_attest_;
    std::map<uint64_t, AttestationRecord> records_;
    std::set<uint256> consumedSignatures_;
    std::map<std::pair<uint64_t, Address>, AttestationCommitment> commitments_;
};

} // namespace bridge

#endif // QUORUM_BRIDGE_ATTESTATION_H
