// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUORUM_BRIDGE_VALIDATOR_REGISTRY_H
#define QUORUM_BRIDGE_VALIDATOR_REGISTRY_H

/**
 * @file validator_registry.h
 * @brief Staked validator set for the bridge
 *
 * Owns every validator that was ever registered. Entries are never
 * deleted; removal and automatic deactivation only clear isActive so the
 * history stays auditable.
 *
 * Stake policy: stake is escrowed in the custody account on registration.
 * Removal returns stake minus the part reserved by open challenges. Stake
 * that is left on an inactive validator (released reservations, automatic
 * deactivation) is pulled back with WithdrawStake().
 *
 * Reputation lives on [0, MAX_REPUTATION] and decays linearly with
 * inactivity. Decay is applied lazily: readers compute the effective value
 * from (reputation, decayAnchor, now), and writers fold the decay into the
 * stored value, advancing the anchor by whole days only.
 */

#include <bridge/bridge_common.h>
#include <bridge/bridge_params.h>
#include <bridge/bridge_signals.h>
#include <bridge/token_ledger.h>
#include <amount.h>
#include <serialize.h>
#include <sync.h>
#include <uint256.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bridge {

struct ValidatorInfo {
    Address address;

    /** Stake held in custody for this validator */
    CAmount stake;

    /** Part of stake reserved by open challenges */
    CAmount lockedStake;

    /** Stored reputation, before pending decay */
    uint32_t reputation;

    bool isActive;
    uint32_t slashCount;
    uint64_t validatedTransactions;
    uint64_t lastActivityTime;

    /** Time up to which decay has been folded into reputation */
    uint64_t decayAnchor;

    uint64_t registeredAt;
    uint64_t deactivatedAt;
    std::string deactivationReason;

    ValidatorInfo()
        : stake(0)
        , lockedStake(0)
        , reputation(0)
        , isActive(false)
        , slashCount(0)
        , validatedTransactions(0)
        , lastActivityTime(0)
        , decayAnchor(0)
        , registeredAt(0)
        , deactivatedAt(0)
    {}

    CAmount AvailableStake() const { return stake - lockedStake; }

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(address);
        READWRITE(stake);
        READWRITE(lockedStake);
        READWRITE(reputation);
        READWRITE(isActive);
        READWRITE(slashCount);
        READWRITE(validatedTransactions);
        READWRITE(lastActivityTime);
        READWRITE(decayAnchor);
        READWRITE(registeredAt);
        READWRITE(deactivatedAt);
        READWRITE(deactivationReason);
    }
};

/** Result of applying a slash to a validator */
struct SlashOutcome {
    CAmount slashed = 0;
    bool deactivated = false;
};

/**
 * Apply linear decay: reputation - rate * whole days since anchor, floor 0.
 */
uint32_t ComputeDecayedReputation(uint32_t reputation, uint64_t anchor, uint64_t now, uint32_t ratePerDay);

class ValidatorRegistry {
public:
    ValidatorRegistry(const BridgeParams& params, TokenLedger& ledger, BridgeSignals& signals);

    /**
     * Register (or re-register) a validator and escrow its stake.
     * Owner only.
     */
    BridgeResult AddValidator(const Address& caller, const Address& validator, CAmount stake, uint64_t now);

    /**
     * Deactivate a validator and return its unreserved stake.
     * Owner only. Refuses to go below the configured quorum minimum.
     */
    BridgeResult RemoveValidator(const Address& caller, const Address& validator,
                                 const std::string& reason, uint64_t now);

    /** Return any stake still held for an inactive validator. Validator only. */
    BridgeResult WithdrawStake(const Address& caller, uint64_t now);

    /**
     * Apply pending decay then a signed delta, clamped to [0, MAX_REPUTATION].
     * @return false if the validator is unknown
     */
    bool UpdateReputation(const Address& validator, int64_t delta, uint64_t now);

    /** Reputation including decay up to now */
    uint32_t GetEffectiveReputation(const Address& validator, uint64_t now) const;

    /** Active, stake >= minimum, effective reputation >= minimum */
    bool IsEligible(const Address& validator, uint64_t now) const;

    bool IsActive(const Address& validator) const;

    size_t ActiveCount() const;

    /** Credit an accepted attestation: counter, activity time, reputation gain */
    bool RecordAttestation(const Address& validator, uint64_t now);

    /** Reserve stake for an open challenge */
    BridgeResult LockStake(const Address& validator, CAmount amount);

    /** Release a reservation made with LockStake */
    bool ReleaseLockedStake(const Address& validator, CAmount amount);

    /**
     * Release a reservation and slash from stake.
     * The slash is capped at the stake actually held. Applies the
     * reputation penalty, bumps slashCount and deactivates the validator
     * once slashCount or reputation crosses its floor.
     */
    std::optional<SlashOutcome> Slash(const Address& validator, CAmount reserved, CAmount amount, uint64_t now);

    std::optional<ValidatorInfo> GetValidator(const Address& validator) const;
    std::vector<ValidatorInfo> GetActiveValidators() const;
    std::vector<ValidatorInfo> GetAllValidators() const;

    /** Sum of stake held in custody for all validators */
    CAmount GetTotalStake() const;

    /** Restore a persisted entry */
    void LoadValidator(const ValidatorInfo& info);

    void Clear();

    /** Held by BridgeNode across a snapshot, in the order given in challenge_manager.h */
    CCriticalSection& GetLock() const { return cs_registry_; }

private:
    const BridgeParams& params_;
    TokenLedger& ledger_;
    BridgeSignals& signals_;

    mutable CCriticalSection cs_registry_;
    std::map<Address, ValidatorInfo> validators_;

    /** Active validator addresses, bounded by MAX_ACTIVE_VALIDATORS */
    std::vector<Address> active_;

    void FoldDecay(ValidatorInfo& info, uint64_t now) const;
    void Deactivate(ValidatorInfo& info, const std::string& reason, uint64_t now);
};

} // namespace bridge

#endif // QUORUM_BRIDGE_VALIDATOR_REGISTRY_H
