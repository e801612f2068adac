// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUORUM_BRIDGE_CHALLENGE_MANAGER_H
#define QUORUM_BRIDGE_CHALLENGE_MANAGER_H

/**
 * @file challenge_manager.h
 * @brief Disputes against validator attestations
 *
 * Anyone may contest a validator's attestation of a transfer by posting
 * the challenge stake, while the transfer is pending or within the
 * post-completion window. Opening a challenge reserves the largest slash
 * it could cause from the validator's stake. An attestation is under at
 * most one open challenge at a time.
 *
 * A challenge is resolved exactly once, either by the bridge owner after
 * the challenge period or by a token-weighted community vote:
 *
 * - Succeeded: the validator is slashed (stake * slashBps / 10000 of the
 *   stake it held when the challenge opened, capped at what it still
 *   holds), the slash is split between the challenger and the
 *   insurance fund, the challenger gets back its stake plus its share, and
 *   the attestation stops counting toward quorum.
 * - Failed: the challenger gets back its stake and the reservation is
 *   released.
 *
 * Lock order: challenge manager, then state machine, attestation ledger,
 * registry and token ledger.
 */

#include <bridge/attestation.h>
#include <bridge/bridge_common.h>
#include <bridge/bridge_params.h>
#include <bridge/bridge_signals.h>
#include <bridge/bridge_state_machine.h>
#include <bridge/token_ledger.h>
#include <bridge/validator_registry.h>
#include <amount.h>
#include <serialize.h>
#include <sync.h>

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace bridge {

struct Challenge {
    uint64_t id;
    Address challenger;
    Address validator;
    uint64_t nonce;

    /** Stake posted by the challenger */
    CAmount stake;

    std::vector<unsigned char> proof;
    uint64_t createdAt;
    uint64_t periodEnd;
    ChallengeStatus status;
    ResolutionPath resolution;

    /** Slash owed on success, from the stake at open time */
    CAmount intendedSlash;

    /** Validator stake reserved while the challenge is open */
    CAmount reservedSlash;

    /** Vote weight for and against slashing the validator */
    CAmount votesAgainstValidator;
    CAmount votesForValidator;

    /** voter -> voted against the validator */
    std::map<Address, bool> voters;

    CAmount slashedAmount;
    CAmount challengerReward;
    CAmount insuranceShare;
    uint64_t resolvedAt;

    Challenge()
        : id(0)
        , nonce(0)
        , stake(0)
        , createdAt(0)
        , periodEnd(0)
        , status(ChallengeStatus::OPEN)
        , resolution(ResolutionPath::NONE)
        , intendedSlash(0)
        , reservedSlash(0)
        , votesAgainstValidator(0)
        , votesForValidator(0)
        , slashedAmount(0)
        , challengerReward(0)
        , insuranceShare(0)
        , resolvedAt(0)
    {}

    bool IsOpen() const { return status == ChallengeStatus::OPEN; }

    CAmount TotalVoteWeight() const { return votesAgainstValidator + votesForValidator; }

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(id);
        READWRITE(challenger);
        READWRITE(validator);
        READWRITE(nonce);
        READWRITE(stake);
        READWRITE(proof);
        READWRITE(createdAt);
        READWRITE(periodEnd);
        uint8_t statusByte = static_cast<uint8_t>(status);
        READWRITE(statusByte);
        uint8_t resolutionByte = static_cast<uint8_t>(resolution);
        READWRITE(resolutionByte);
        READWRITE(intendedSlash);
        READWRITE(reservedSlash);
        READWRITE(votesAgainstValidator);
        READWRITE(votesForValidator);
        READWRITE(voters);
        READWRITE(slashedAmount);
        READWRITE(challengerReward);
        READWRITE(insuranceShare);
        READWRITE(resolvedAt);
        if (ser_action.ForRead()) {
            status = static_cast<ChallengeStatus>(statusByte);
            resolution = static_cast<ResolutionPath>(resolutionByte);
        }
    }
};

/**
 * Split a slashed amount by the distribution table. The challenger gets
 * its share rounded down; everything else goes to the insurance fund.
 */
bool SplitSlash(const BridgeParams& params, CAmount slashed, CAmount& challengerOut, CAmount& insuranceOut);

class ChallengeManager {
public:
    ChallengeManager(const BridgeParams& params, TokenLedger& ledger, ValidatorRegistry& registry,
                     AttestationLedger& attestations, BridgeStateMachine& stateMachine, BridgeSignals& signals);

    /**
     * Contest the attestation of transfer nonce by validator.
     * @param[out] idOut id of the new challenge
     */
    BridgeResult OpenChallenge(const Address& challenger, const Address& validator, uint64_t nonce,
                               const std::vector<unsigned char>& proof, uint64_t now, uint64_t& idOut);

    /**
     * Cast a token-weighted vote. Weight is the voter's balance, which must
     * be at least minVotingPower. Open until the period ends or a
     * supermajority is reached.
     */
    BridgeResult VoteOnChallenge(const Address& voter, uint64_t id, bool againstValidator, uint64_t now);

    /** Arbitrated resolution. Owner only, after the challenge period. */
    BridgeResult ResolveChallenge(const Address& caller, uint64_t id, bool successful, uint64_t now);

    /**
     * Community resolution. Anyone, after the period or once a
     * supermajority is reached. Ties and empty ballots fail the challenge.
     */
    BridgeResult ResolveByVote(uint64_t id, uint64_t now);

    /** Pay out of the insurance fund. Owner only. */
    BridgeResult WithdrawInsuranceFund(const Address& caller, const Address& to, CAmount amount);

    /** supermajorityBps of cast weight, with at least voteQuorumWeight cast */
    bool HasSupermajority(const Challenge& challenge) const;

    std::optional<Challenge> GetChallenge(uint64_t id) const;
    std::vector<Challenge> GetChallenges() const;
    std::vector<Challenge> GetChallengesForValidator(const Address& validator) const;
    std::vector<Challenge> GetOpenChallenges() const;

    CAmount GetInsuranceFund() const;
    uint64_t GetNextChallengeId() const;

    void LoadChallenge(const Challenge& challenge);
    void LoadCounters(uint64_t nextId, CAmount insuranceFund);

    void Clear();

    /** Held by BridgeNode across a snapshot, in the order given in challenge_manager.h */
    CCriticalSection& GetLock() const { return cs_challenge_; }

private:
    const BridgeParams& params_;
    TokenLedger& ledger_;
    ValidatorRegistry& registry_;
    AttestationLedger& attestations_;
    BridgeStateMachine& stateMachine_;
    BridgeSignals& signals_;

    mutable CCriticalSection cs_challenge_;
    std::map<uint64_t, Challenge> challenges_;
    uint64_t nextId_;
    CAmount insuranceFund_;

    // Callers hold cs_challenge_
    BridgeResult Settle(Challenge& challenge, bool successful, ResolutionPath path, uint64_t now);
};

} // namespace bridge

#endif // QUORUM_BRIDGE_CHALLENGE_MANAGER_H
