// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUORUM_BRIDGE_BRIDGE_PARAMS_H
#define QUORUM_BRIDGE_BRIDGE_PARAMS_H

/**
 * @file bridge_params.h
 * @brief Tunable parameters of the bridge core
 *
 * All constants that shape quorum, stake, reputation, timing and fee
 * behaviour live in one BridgeParams value. Per destination chain fee and
 * amount limits are kept in a chain table keyed by ChainId, and the split
 * of slashed stake is kept in a distribution table. Both tables are
 * validated together by BridgeParams::Check().
 *
 * Parameters are read from the command line and quorum.conf through
 * gArgs by InitBridgeParams().
 */

#include <bridge/bridge_common.h>
#include <amount.h>
#include <serialize.h>

#include <cstdint>
#include <map>
#include <string>

namespace bridge {

// ============================================================================
// Fixed Limits
// ============================================================================

/** Upper bound of the reputation scale */
static constexpr uint32_t MAX_REPUTATION = 1000;

/** Reputation assigned on first registration (mid-scale) */
static constexpr uint32_t INITIAL_REPUTATION = 500;

/** Hard cap on the active validator list */
static constexpr uint32_t MAX_ACTIVE_VALIDATORS = 21;

/** Slashing may never exceed 20% of stake per challenge */
static constexpr uint32_t MAX_SLASH_BPS = 2000;

static constexpr uint64_t SECONDS_PER_DAY = 24 * 60 * 60;

// ============================================================================
// Defaults
// ============================================================================

static const ChainId DEFAULT_SOURCE_CHAIN_ID = 1;
static const CAmount DEFAULT_MIN_VALIDATOR_STAKE = 1000 * COIN;
static const uint32_t DEFAULT_VALIDATOR_THRESHOLD = 3;
static const uint32_t DEFAULT_MIN_VALIDATORS_FOR_QUORUM = 3;
static const uint32_t DEFAULT_MIN_REPUTATION_TO_VALIDATE = 200;
static const uint32_t DEFAULT_REPUTATION_DECAY_PER_DAY = 1;
static const uint32_t DEFAULT_ATTESTATION_REPUTATION_GAIN = 1;
static const uint32_t DEFAULT_SLASH_REPUTATION_PENALTY = 100;
static const uint32_t DEFAULT_MAX_SLASH_COUNT = 3;
static const uint64_t DEFAULT_TRANSACTION_TIMEOUT = 24 * 60 * 60;
static const uint64_t DEFAULT_REVEAL_WINDOW = 60 * 60;
static const CAmount DEFAULT_CHALLENGE_STAKE = 100 * COIN;
static const uint64_t DEFAULT_CHALLENGE_PERIOD = 3 * 24 * 60 * 60;
static const uint64_t DEFAULT_POST_COMPLETION_WINDOW = 24 * 60 * 60;
static const uint32_t DEFAULT_SLASH_BPS = 1000;
static const uint32_t DEFAULT_CHALLENGER_SHARE_BPS = 5000;
static const CAmount DEFAULT_MIN_VOTING_POWER = 100 * COIN;
static const uint32_t DEFAULT_SUPERMAJORITY_BPS = 6667;
static const CAmount DEFAULT_VOTE_QUORUM_WEIGHT = 1000 * COIN;
static const CAmount DEFAULT_GLOBAL_DAILY_LIMIT = 1000000 * COIN;
static const CAmount DEFAULT_USER_DAILY_LIMIT = 100000 * COIN;
static const uint64_t DEFAULT_VOLUME_EPOCH = 24 * 60 * 60;
static const CAmount DEFAULT_CHAIN_BASE_FEE = 1 * COIN;
static const uint32_t DEFAULT_CHAIN_FEE_BPS = 10;
static const CAmount DEFAULT_CHAIN_MIN_AMOUNT = 1 * COIN;
static const CAmount DEFAULT_CHAIN_MAX_AMOUNT = 100000 * COIN;
static const std::string DEFAULT_ATTESTATION_MODE = "direct";

// ============================================================================
// Tables
// ============================================================================

/** Fee and amount limits for transfers toward one destination chain */
struct ChainConfig {
    ChainId chainId;
    std::string name;
    CAmount baseFee;
    uint32_t feeBps;
    CAmount minAmount;
    CAmount maxAmount;
    bool isActive;

    ChainConfig()
        : chainId(0)
        , baseFee(0)
        , feeBps(0)
        , minAmount(0)
        , maxAmount(0)
        , isActive(false)
    {}

    ChainConfig(ChainId id, const std::string& n, CAmount base, uint32_t bps, CAmount minAmt, CAmount maxAmt)
        : chainId(id)
        , name(n)
        , baseFee(base)
        , feeBps(bps)
        , minAmount(minAmt)
        , maxAmount(maxAmt)
        , isActive(true)
    {}

    /** baseFee + amount * feeBps / 10000, false on overflow */
    bool ComputeFee(CAmount amount, CAmount& feeOut) const;

    ADD_SERIALIZE_METHODS;

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream& s, Operation ser_action) {
        READWRITE(chainId);
        READWRITE(name);
        READWRITE(baseFee);
        READWRITE(feeBps);
        READWRITE(minAmount);
        READWRITE(maxAmount);
        READWRITE(isActive);
    }
};

/** Recipients of slashed validator stake */
enum class SlashRecipient : uint8_t {
    CHALLENGER = 0,
    INSURANCE_FUND = 1
};

/**
 * Split of a slashed amount, in bps per recipient. Shares must sum to
 * 10000. Rounding remainders go to the insurance fund.
 */
typedef std::map<SlashRecipient, uint32_t> SlashDistribution;

// ============================================================================
// Parameters
// ============================================================================

struct BridgeParams {
    /** Bridge administrator (validator set management, arbitration) */
    Address owner;

    /** Account that holds stakes, locked transfers, fees and the insurance fund */
    Address custody;

    ChainId sourceChainId;

    // Validator set
    CAmount minValidatorStake;
    uint32_t validatorThreshold;
    uint32_t minValidatorsForQuorum;

    // Reputation
    uint32_t minReputationToValidate;
    uint32_t reputationDecayPerDay;
    uint32_t attestationReputationGain;
    uint32_t slashReputationPenalty;
    uint32_t maxSlashCount;

    // Transaction lifecycle
    uint64_t transactionTimeout;
    uint64_t revealWindow;
    AttestationMode attestationMode;

    // Challenges
    CAmount challengeStake;
    uint64_t challengePeriod;
    uint64_t postCompletionWindow;
    uint32_t slashBps;
    SlashDistribution slashDistribution;
    CAmount minVotingPower;
    uint32_t supermajorityBps;
    CAmount voteQuorumWeight;

    // Volume limits (0 disables)
    CAmount globalDailyLimit;
    CAmount userDailyLimit;
    uint64_t volumeEpoch;

    /** Destination chain table */
    std::map<ChainId, ChainConfig> chains;

    BridgeParams();

    /** Look up an active destination chain */
    const ChainConfig* GetChain(ChainId chainId) const;

    /** Share of a slashed amount for a recipient, in bps */
    uint32_t GetSlashShare(SlashRecipient recipient) const;

    /**
     * Validate every parameter and table together.
     * @param[out] strError description of the first problem found
     */
    bool Check(std::string& strError) const;

    /** Default parameters with a single destination chain, used by tests and tooling */
    static BridgeParams Default(const Address& owner, const Address& custody);
};

/** Help text for bridge command line options */
std::string GetBridgeHelpMessage();

/**
 * Parse "<id>:<name>:<baseFee>:<feeBps>:<minAmount>:<maxAmount>".
 * Amounts are in base units.
 */
bool ParseChainConfig(const std::string& str, ChainConfig& configOut, std::string& strError);

/**
 * Build bridge parameters from gArgs.
 * @param[out] paramsOut parameters, only written on success
 * @param[out] strError reason for rejection
 * @return true if the resulting parameters pass Check()
 */
bool InitBridgeParams(BridgeParams& paramsOut, std::string& strError);

} // namespace bridge

#endif // QUORUM_BRIDGE_BRIDGE_PARAMS_H
