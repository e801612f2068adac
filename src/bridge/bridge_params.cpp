// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <bridge/bridge_params.h>

#include <util.h>
#include <utilstrencodings.h>

#include <limits>

namespace bridge {

bool ChainConfig::ComputeFee(CAmount amount, CAmount& feeOut) const
{
    CAmount variable = 0;
    if (!MulBps(amount, feeBps, variable)) return false;
    return CheckedAdd(baseFee, variable, feeOut);
}

BridgeParams::BridgeParams()
    : sourceChainId(DEFAULT_SOURCE_CHAIN_ID)
    , minValidatorStake(DEFAULT_MIN_VALIDATOR_STAKE)
    , validatorThreshold(DEFAULT_VALIDATOR_THRESHOLD)
    , minValidatorsForQuorum(DEFAULT_MIN_VALIDATORS_FOR_QUORUM)
    , minReputationToValidate(DEFAULT_MIN_REPUTATION_TO_VALIDATE)
    , reputationDecayPerDay(DEFAULT_REPUTATION_DECAY_PER_DAY)
    , attestationReputationGain(DEFAULT_ATTESTATION_REPUTATION_GAIN)
    , slashReputationPenalty(DEFAULT_SLASH_REPUTATION_PENALTY)
    , maxSlashCount(DEFAULT_MAX_SLASH_COUNT)
    , transactionTimeout(DEFAULT_TRANSACTION_TIMEOUT)
    , revealWindow(DEFAULT_REVEAL_WINDOW)
    , attestationMode(AttestationMode::DIRECT_SIGNATURE)
    , challengeStake(DEFAULT_CHALLENGE_STAKE)
    , challengePeriod(DEFAULT_CHALLENGE_PERIOD)
    , postCompletionWindow(DEFAULT_POST_COMPLETION_WINDOW)
    , slashBps(DEFAULT_SLASH_BPS)
    , minVotingPower(DEFAULT_MIN_VOTING_POWER)
    , supermajorityBps(DEFAULT_SUPERMAJORITY_BPS)
    , voteQuorumWeight(DEFAULT_VOTE_QUORUM_WEIGHT)
    , globalDailyLimit(DEFAULT_GLOBAL_DAILY_LIMIT)
    , userDailyLimit(DEFAULT_USER_DAILY_LIMIT)
    , volumeEpoch(DEFAULT_VOLUME_EPOCH)
{
    slashDistribution[SlashRecipient::CHALLENGER] = DEFAULT_CHALLENGER_SHARE_BPS;
    slashDistribution[SlashRecipient::INSURANCE_FUND] = BPS_DENOMINATOR - DEFAULT_CHALLENGER_SHARE_BPS;
}

const ChainConfig* BridgeParams::GetChain(ChainId chainId) const
{
    auto it = chains.find(chainId);
    if (it == chains.end() || !it->second.isActive) {
        return nullptr;
    }
    return &it->second;
}

uint32_t BridgeParams::GetSlashShare(SlashRecipient recipient) const
{
    auto it = slashDistribution.find(recipient);
    return it == slashDistribution.end() ? 0 : it->second;
}

bool BridgeParams::Check(std::string& strError) const
{
    if (owner.IsNull()) {
        strError = "bridge owner address is not set";
        return false;
    }
    if (custody.IsNull()) {
        strError = "custody address is not set";
        return false;
    }
    if (owner == custody) {
        strError = "custody address must differ from the owner";
        return false;
    }
    if (!MoneyRange(minValidatorStake) || minValidatorStake == 0) {
        strError = "minimum validator stake out of range";
        return false;
    }
    if (validatorThreshold == 0 || validatorThreshold > MAX_ACTIVE_VALIDATORS) {
        strError = strprintf("validator threshold must be in [1, %u]", MAX_ACTIVE_VALIDATORS);
        return false;
    }
    if (minValidatorsForQuorum < validatorThreshold || minValidatorsForQuorum > MAX_ACTIVE_VALIDATORS) {
        strError = "minimum validators for quorum must be between the threshold and the active set cap";
        return false;
    }
    if (minReputationToValidate > MAX_REPUTATION || slashReputationPenalty > MAX_REPUTATION ||
        attestationReputationGain > MAX_REPUTATION) {
        strError = strprintf("reputation parameters must not exceed %u", MAX_REPUTATION);
        return false;
    }
    if (maxSlashCount == 0) {
        strError = "maximum slash count must be positive";
        return false;
    }
    if (transactionTimeout == 0 || revealWindow == 0 || challengePeriod == 0 || volumeEpoch == 0) {
        strError = "timeouts, windows and epochs must be positive";
        return false;
    }
    if (revealWindow > transactionTimeout) {
        strError = "reveal window must not exceed the transaction timeout";
        return false;
    }
    if (!MoneyRange(challengeStake) || challengeStake == 0) {
        strError = "challenge stake out of range";
        return false;
    }
    if (slashBps > MAX_SLASH_BPS) {
        strError = strprintf("slash percentage %u bps exceeds cap of %u bps", slashBps, MAX_SLASH_BPS);
        return false;
    }
    if (!MoneyRange(minVotingPower) || !MoneyRange(voteQuorumWeight)) {
        strError = "voting weights out of range";
        return false;
    }
    if (supermajorityBps <= BPS_DENOMINATOR / 2 || supermajorityBps > BPS_DENOMINATOR) {
        strError = "supermajority must be above 50% and at most 100%";
        return false;
    }
    if (!MoneyRange(globalDailyLimit) || !MoneyRange(userDailyLimit)) {
        strError = "daily volume limits out of range";
        return false;
    }

    uint32_t slashTotal = 0;
    for (const auto& share : slashDistribution) {
        slashTotal += share.second;
    }
    if (slashTotal != BPS_DENOMINATOR) {
        strError = strprintf("slash distribution sums to %u bps, expected %u", slashTotal, BPS_DENOMINATOR);
        return false;
    }

    if (chains.empty()) {
        strError = "no destination chains configured";
        return false;
    }
    for (const auto& entry : chains) {
        const ChainConfig& chain = entry.second;
        if (entry.first != chain.chainId) {
            strError = strprintf("chain table key %u does not match chain id %u", entry.first, chain.chainId);
            return false;
        }
        if (chain.chainId == sourceChainId) {
            strError = strprintf("chain %u is the source chain", chain.chainId);
            return false;
        }
        if (chain.feeBps > BPS_DENOMINATOR) {
            strError = strprintf("chain %u fee exceeds 100%%", chain.chainId);
            return false;
        }
        if (!MoneyRange(chain.baseFee) || chain.minAmount <= 0 ||
            chain.maxAmount < chain.minAmount || !MoneyRange(chain.maxAmount)) {
            strError = strprintf("chain %u has invalid fee or amount bounds", chain.chainId);
            return false;
        }
    }
    return true;
}

BridgeParams BridgeParams::Default(const Address& owner, const Address& custody)
{
    BridgeParams params;
    params.owner = owner;
    params.custody = custody;
    ChainConfig dest(2, "destination", DEFAULT_CHAIN_BASE_FEE, DEFAULT_CHAIN_FEE_BPS,
                     DEFAULT_CHAIN_MIN_AMOUNT, DEFAULT_CHAIN_MAX_AMOUNT);
    params.chains[dest.chainId] = dest;
    return params;
}

std::string GetBridgeHelpMessage()
{
    std::string strUsage;

    strUsage += HelpMessageGroup("Bridge options:");
    strUsage += HelpMessageOpt("-bridgeowner=<hex>", "Key id of the bridge owner (required)");
    strUsage += HelpMessageOpt("-custody=<hex>", "Key id of the custody account (required)");
    strUsage += HelpMessageOpt("-sourcechain=<n>", strprintf("Chain id of this side of the bridge (default: %u)", DEFAULT_SOURCE_CHAIN_ID));
    strUsage += HelpMessageOpt("-chain=<id>:<name>:<basefee>:<feebps>:<min>:<max>", "Add a destination chain. Can be specified multiple times");
    strUsage += HelpMessageOpt("-minstake=<amt>", strprintf("Minimum validator stake in base units (default: %d)", DEFAULT_MIN_VALIDATOR_STAKE));
    strUsage += HelpMessageOpt("-threshold=<n>", strprintf("Attestations required to complete a transfer (default: %u)", DEFAULT_VALIDATOR_THRESHOLD));
    strUsage += HelpMessageOpt("-minquorum=<n>", strprintf("Active validators that must remain after a removal (default: %u)", DEFAULT_MIN_VALIDATORS_FOR_QUORUM));
    strUsage += HelpMessageOpt("-minreputation=<n>", strprintf("Minimum reputation to validate (default: %u)", DEFAULT_MIN_REPUTATION_TO_VALIDATE));
    strUsage += HelpMessageOpt("-reputationdecay=<n>", strprintf("Reputation lost per day of inactivity (default: %u)", DEFAULT_REPUTATION_DECAY_PER_DAY));
    strUsage += HelpMessageOpt("-slashpenalty=<n>", strprintf("Reputation lost per successful challenge (default: %u)", DEFAULT_SLASH_REPUTATION_PENALTY));
    strUsage += HelpMessageOpt("-maxslashcount=<n>", strprintf("Slashes before automatic deactivation (default: %u)", DEFAULT_MAX_SLASH_COUNT));
    strUsage += HelpMessageOpt("-txtimeout=<secs>", strprintf("Seconds before a pending transfer can be cancelled (default: %u)", DEFAULT_TRANSACTION_TIMEOUT));
    strUsage += HelpMessageOpt("-revealwindow=<secs>", strprintf("Seconds a commitment stays revealable (default: %u)", DEFAULT_REVEAL_WINDOW));
    strUsage += HelpMessageOpt("-attestationmode=<mode>", strprintf("Attestation strategy: direct or commitreveal (default: %s)", DEFAULT_ATTESTATION_MODE));
    strUsage += HelpMessageOpt("-challengestake=<amt>", strprintf("Stake posted by a challenger (default: %d)", DEFAULT_CHALLENGE_STAKE));
    strUsage += HelpMessageOpt("-challengeperiod=<secs>", strprintf("Length of a challenge (default: %u)", DEFAULT_CHALLENGE_PERIOD));
    strUsage += HelpMessageOpt("-challengewindow=<secs>", strprintf("Seconds after completion during which attestations stay challengeable (default: %u)", DEFAULT_POST_COMPLETION_WINDOW));
    strUsage += HelpMessageOpt("-slashbps=<n>", strprintf("Stake slashed per successful challenge in bps, at most %u (default: %u)", MAX_SLASH_BPS, DEFAULT_SLASH_BPS));
    strUsage += HelpMessageOpt("-challengershare=<n>", strprintf("Share of a slash paid to the challenger in bps (default: %u)", DEFAULT_CHALLENGER_SHARE_BPS));
    strUsage += HelpMessageOpt("-minvotingpower=<amt>", strprintf("Token balance required to vote on challenges (default: %d)", DEFAULT_MIN_VOTING_POWER));
    strUsage += HelpMessageOpt("-supermajority=<n>", strprintf("Vote share in bps that closes a challenge early (default: %u)", DEFAULT_SUPERMAJORITY_BPS));
    strUsage += HelpMessageOpt("-votequorum=<amt>", strprintf("Cast weight required before a supermajority can close a vote (default: %d)", DEFAULT_VOTE_QUORUM_WEIGHT));
    strUsage += HelpMessageOpt("-globaldailylimit=<amt>", strprintf("Bridge-wide volume per epoch, 0 to disable (default: %d)", DEFAULT_GLOBAL_DAILY_LIMIT));
    strUsage += HelpMessageOpt("-userdailylimit=<amt>", strprintf("Per user volume per epoch, 0 to disable (default: %d)", DEFAULT_USER_DAILY_LIMIT));

    return strUsage;
}

bool ParseChainConfig(const std::string& str, ChainConfig& configOut, std::string& strError)
{
    std::vector<std::string> parts = SplitString(str, ':');
    if (parts.size() != 6) {
        strError = strprintf("invalid -chain value '%s', expected <id>:<name>:<basefee>:<feebps>:<min>:<max>", str);
        return false;
    }

    int64_t id, baseFee, feeBps, minAmount, maxAmount;
    if (!ParseInt64(parts[0], &id) || id <= 0 || id > std::numeric_limits<ChainId>::max() ||
        !ParseInt64(parts[2], &baseFee) || !ParseInt64(parts[3], &feeBps) || feeBps < 0 ||
        feeBps > BPS_DENOMINATOR || !ParseInt64(parts[4], &minAmount) || !ParseInt64(parts[5], &maxAmount)) {
        strError = strprintf("invalid number in -chain value '%s'", str);
        return false;
    }

    configOut = ChainConfig(static_cast<ChainId>(id), parts[1], baseFee, static_cast<uint32_t>(feeBps), minAmount, maxAmount);
    return true;
}

namespace {

bool GetUInt32Arg(const std::string& name, uint32_t def, uint32_t& out, std::string& strError)
{
    int64_t value = gArgs.GetArg(name, (int64_t)def);
    if (value < 0 || value > std::numeric_limits<uint32_t>::max()) {
        strError = strprintf("%s out of range", name);
        return false;
    }
    out = static_cast<uint32_t>(value);
    return true;
}

bool GetUInt64Arg(const std::string& name, uint64_t def, uint64_t& out, std::string& strError)
{
    int64_t value = gArgs.GetArg(name, (int64_t)def);
    if (value < 0) {
        strError = strprintf("%s must not be negative", name);
        return false;
    }
    out = static_cast<uint64_t>(value);
    return true;
}

} // namespace

bool InitBridgeParams(BridgeParams& paramsOut, std::string& strError)
{
    BridgeParams params;

    std::string ownerHex = gArgs.GetArg("-bridgeowner", "");
    std::string custodyHex = gArgs.GetArg("-custody", "");
    if (!IsHex(ownerHex) || ownerHex.size() != 40 || !IsHex(custodyHex) || custodyHex.size() != 40) {
        strError = "-bridgeowner and -custody must be 40-character hex key ids";
        return false;
    }
    params.owner = uint160S(ownerHex);
    params.custody = uint160S(custodyHex);

    if (!GetUInt32Arg("-sourcechain", DEFAULT_SOURCE_CHAIN_ID, params.sourceChainId, strError)) return false;
    params.minValidatorStake = gArgs.GetArg("-minstake", DEFAULT_MIN_VALIDATOR_STAKE);
    if (!GetUInt32Arg("-threshold", DEFAULT_VALIDATOR_THRESHOLD, params.validatorThreshold, strError)) return false;
    if (!GetUInt32Arg("-minquorum", DEFAULT_MIN_VALIDATORS_FOR_QUORUM, params.minValidatorsForQuorum, strError)) return false;
    if (!GetUInt32Arg("-minreputation", DEFAULT_MIN_REPUTATION_TO_VALIDATE, params.minReputationToValidate, strError)) return false;
    if (!GetUInt32Arg("-reputationdecay", DEFAULT_REPUTATION_DECAY_PER_DAY, params.reputationDecayPerDay, strError)) return false;
    if (!GetUInt32Arg("-slashpenalty", DEFAULT_SLASH_REPUTATION_PENALTY, params.slashReputationPenalty, strError)) return false;
    if (!GetUInt32Arg("-maxslashcount", DEFAULT_MAX_SLASH_COUNT, params.maxSlashCount, strError)) return false;
    if (!GetUInt64Arg("-txtimeout", DEFAULT_TRANSACTION_TIMEOUT, params.transactionTimeout, strError)) return false;
    if (!GetUInt64Arg("-revealwindow", DEFAULT_REVEAL_WINDOW, params.revealWindow, strError)) return false;

    std::string mode = gArgs.GetArg("-attestationmode", DEFAULT_ATTESTATION_MODE);
    if (mode == "direct") {
        params.attestationMode = AttestationMode::DIRECT_SIGNATURE;
    } else if (mode == "commitreveal") {
        params.attestationMode = AttestationMode::COMMIT_REVEAL;
    } else {
        strError = strprintf("unknown -attestationmode '%s'", mode);
        return false;
    }

    params.challengeStake = gArgs.GetArg("-challengestake", DEFAULT_CHALLENGE_STAKE);
    if (!GetUInt64Arg("-challengeperiod", DEFAULT_CHALLENGE_PERIOD, params.challengePeriod, strError)) return false;
    if (!GetUInt64Arg("-challengewindow", DEFAULT_POST_COMPLETION_WINDOW, params.postCompletionWindow, strError)) return false;
    if (!GetUInt32Arg("-slashbps", DEFAULT_SLASH_BPS, params.slashBps, strError)) return false;

    uint32_t challengerShare = 0;
    if (!GetUInt32Arg("-challengershare", DEFAULT_CHALLENGER_SHARE_BPS, challengerShare, strError)) return false;
    if (challengerShare > BPS_DENOMINATOR) {
        strError = "-challengershare exceeds 10000 bps";
        return false;
    }
    params.slashDistribution[SlashRecipient::CHALLENGER] = challengerShare;
    params.slashDistribution[SlashRecipient::INSURANCE_FUND] = BPS_DENOMINATOR - challengerShare;

    params.minVotingPower = gArgs.GetArg("-minvotingpower", DEFAULT_MIN_VOTING_POWER);
    if (!GetUInt32Arg("-supermajority", DEFAULT_SUPERMAJORITY_BPS, params.supermajorityBps, strError)) return false;
    params.voteQuorumWeight = gArgs.GetArg("-votequorum", DEFAULT_VOTE_QUORUM_WEIGHT);
    params.globalDailyLimit = gArgs.GetArg("-globaldailylimit", DEFAULT_GLOBAL_DAILY_LIMIT);
    params.userDailyLimit = gArgs.GetArg("-userdailylimit", DEFAULT_USER_DAILY_LIMIT);

    for (const std::string& chainArg : gArgs.GetArgs("-chain")) {
        ChainConfig chain;
        if (!ParseChainConfig(chainArg, chain, strError)) return false;
        if (params.chains.count(chain.chainId)) {
            strError = strprintf("destination chain %u configured twice", chain.chainId);
            return false;
        }
        params.chains[chain.chainId] = chain;
    }

    if (!params.Check(strError)) {
        return false;
    }

    LogPrintf("Bridge: Initialized - source=%u, chains=%u, threshold=%u, mode=%s, slash=%ubps\n",
              params.sourceChainId, params.chains.size(), params.validatorThreshold,
              AttestationModeToString(params.attestationMode), params.slashBps);

    paramsOut = params;
    return true;
}

} // namespace bridge
