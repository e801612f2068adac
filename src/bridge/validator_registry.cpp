// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <bridge/validator_registry.h>

#include <util.h>

#include <algorithm>

namespace bridge {

uint32_t ComputeDecayedReputation(uint32_t reputation, uint64_t anchor, uint64_t now, uint32_t ratePerDay)
{
    if (now <= anchor || ratePerDay == 0) {
        return reputation;
    }
    const uint64_t days = (now - anchor) / SECONDS_PER_DAY;
    const uint64_t decay = days * ratePerDay;
    if (decay >= reputation) {
        return 0;
    }
    return reputation - static_cast<uint32_t>(decay);
}

ValidatorRegistry::ValidatorRegistry(const BridgeParams& params, TokenLedger& ledger, BridgeSignals& signals)
    : params_(params)
    , ledger_(ledger)
    , signals_(signals)
{
}

void ValidatorRegistry::FoldDecay(ValidatorInfo& info, uint64_t now) const
{
    if (now <= info.decayAnchor) return;
    const uint64_t days = (now - info.decayAnchor) / SECONDS_PER_DAY;
    if (days == 0) return;
    info.reputation = ComputeDecayedReputation(info.reputation, info.decayAnchor, now, params_.reputationDecayPerDay);
    // Keep the partial day so decay stays a pure function of the anchor
    info.decayAnchor += days * SECONDS_PER_DAY;
}

void ValidatorRegistry::Deactivate(ValidatorInfo& info, const std::string& reason, uint64_t now)
{
    info.isActive = false;
    info.deactivatedAt = now;
    info.deactivationReason = reason;
    active_.erase(std::remove(active_.begin(), active_.end(), info.address), active_.end());
}

BridgeResult ValidatorRegistry::AddValidator(const Address& caller, const Address& validator, CAmount stake, uint64_t now)
{
    {
        LOCK(cs_registry_);

        if (caller != params_.owner) {
            return BridgeResult::Fail(BridgeError::NOT_OWNER);
        }
        if (validator.IsNull() || validator == params_.custody) {
            return BridgeResult::Fail(BridgeError::INVALID_ADDRESS);
        }

        auto it = validators_.find(validator);
        if (it != validators_.end() && it->second.isActive) {
            return BridgeResult::Fail(BridgeError::ALREADY_REGISTERED);
        }
        if (active_.size() >= MAX_ACTIVE_VALIDATORS) {
            return BridgeResult::Fail(BridgeError::CAPACITY_EXCEEDED,
                strprintf("Active validator set is at its limit of %u", MAX_ACTIVE_VALIDATORS));
        }
        if (!MoneyRange(stake)) {
            return BridgeResult::Fail(BridgeError::INVALID_AMOUNT);
        }
        if (stake < params_.minValidatorStake) {
            return BridgeResult::Fail(BridgeError::INSUFFICIENT_STAKE,
                strprintf("Stake %s below minimum %s", FormatMoney(stake), FormatMoney(params_.minValidatorStake)));
        }
        if (it != validators_.end() && it->second.slashCount >= params_.maxSlashCount) {
            return BridgeResult::Fail(BridgeError::NOT_ELIGIBLE_VALIDATOR, "Validator exceeded the slash limit");
        }

        CAmount newStake = stake;
        if (it != validators_.end() && !CheckedAdd(it->second.stake, stake, newStake)) {
            return BridgeResult::Fail(BridgeError::ARITHMETIC_OVERFLOW);
        }

        if (ledger_.BalanceOf(validator) < stake) {
            return BridgeResult::Fail(BridgeError::INSUFFICIENT_BALANCE);
        }
        if (!ledger_.TransferFrom(validator, params_.custody, stake)) {
            return BridgeResult::Fail(BridgeError::TOKEN_TRANSFER_FAILED, "Stake escrow transfer failed");
        }

        if (it == validators_.end()) {
            ValidatorInfo info;
            info.address = validator;
            info.stake = stake;
            info.reputation = INITIAL_REPUTATION;
            info.isActive = true;
            info.lastActivityTime = now;
            info.decayAnchor = now;
            info.registeredAt = now;
            validators_[validator] = info;
        } else {
            // Re-registration keeps reputation and slash history
            ValidatorInfo& info = it->second;
            FoldDecay(info, now);
            info.stake = newStake;
            info.isActive = true;
            info.lastActivityTime = now;
            info.decayAnchor = now;
            info.deactivatedAt = 0;
            info.deactivationReason.clear();
        }
        active_.push_back(validator);

        LogPrint(BCLog::VALIDATOR, "ValidatorRegistry: Added %s stake=%s active=%u\n",
                 validator.ToString(), FormatMoney(stake), active_.size());
    }

    signals_.ValidatorAdded(validator, stake);
    return BridgeResult::Ok();
}

BridgeResult ValidatorRegistry::RemoveValidator(const Address& caller, const Address& validator,
                                                const std::string& reason, uint64_t now)
{
    {
        LOCK(cs_registry_);

        if (caller != params_.owner) {
            return BridgeResult::Fail(BridgeError::NOT_OWNER);
        }

        auto it = validators_.find(validator);
        if (it == validators_.end() || !it->second.isActive) {
            return BridgeResult::Fail(BridgeError::NOT_REGISTERED);
        }
        if (active_.size() - 1 < params_.minValidatorsForQuorum) {
            return BridgeResult::Fail(BridgeError::BELOW_QUORUM_THRESHOLD,
                strprintf("Removal would leave %u active validators, minimum is %u",
                          active_.size() - 1, params_.minValidatorsForQuorum));
        }

        ValidatorInfo& info = it->second;
        const CAmount refund = info.AvailableStake();
        if (refund > 0 && !ledger_.Transfer(validator, refund)) {
            return BridgeResult::Fail(BridgeError::TOKEN_TRANSFER_FAILED, "Stake return transfer failed");
        }
        info.stake -= refund;
        Deactivate(info, reason, now);

        LogPrint(BCLog::VALIDATOR, "ValidatorRegistry: Removed %s (%s) returned=%s reserved=%s\n",
                 validator.ToString(), reason, FormatMoney(refund), FormatMoney(info.lockedStake));
    }

    signals_.ValidatorRemoved(validator, reason);
    return BridgeResult::Ok();
}

BridgeResult ValidatorRegistry::WithdrawStake(const Address& caller, uint64_t now)
{
    LOCK(cs_registry_);

    auto it = validators_.find(caller);
    if (it == validators_.end()) {
        return BridgeResult::Fail(BridgeError::NOT_REGISTERED);
    }
    ValidatorInfo& info = it->second;
    if (info.isActive) {
        return BridgeResult::Fail(BridgeError::INVALID_STATE, "Active validators cannot withdraw stake");
    }
    const CAmount amount = info.AvailableStake();
    if (amount <= 0) {
        return BridgeResult::Fail(BridgeError::INSUFFICIENT_STAKE, "No withdrawable stake");
    }
    if (!ledger_.Transfer(caller, amount)) {
        return BridgeResult::Fail(BridgeError::TOKEN_TRANSFER_FAILED);
    }
    info.stake -= amount;

    LogPrint(BCLog::VALIDATOR, "ValidatorRegistry: %s withdrew %s at %u\n",
             caller.ToString(), FormatMoney(amount), now);
    return BridgeResult::Ok();
}

bool ValidatorRegistry::UpdateReputation(const Address& validator, int64_t delta, uint64_t now)
{
    LOCK(cs_registry_);

    auto it = validators_.find(validator);
    if (it == validators_.end()) {
        return false;
    }
    ValidatorInfo& info = it->second;
    FoldDecay(info, now);

    int64_t updated = static_cast<int64_t>(info.reputation) + delta;
    if (updated < 0) updated = 0;
    if (updated > MAX_REPUTATION) updated = MAX_REPUTATION;
    info.reputation = static_cast<uint32_t>(updated);
    return true;
}

uint32_t ValidatorRegistry::GetEffectiveReputation(const Address& validator, uint64_t now) const
{
    LOCK(cs_registry_);

    auto it = validators_.find(validator);
    if (it == validators_.end()) {
        return 0;
    }
    return ComputeDecayedReputation(it->second.reputation, it->second.decayAnchor, now, params_.reputationDecayPerDay);
}

bool ValidatorRegistry::IsEligible(const Address& validator, uint64_t now) const
{
    LOCK(cs_registry_);

    auto it = validators_.find(validator);
    if (it == validators_.end()) {
        return false;
    }
    const ValidatorInfo& info = it->second;
    return info.isActive &&
           info.stake >= params_.minValidatorStake &&
           ComputeDecayedReputation(info.reputation, info.decayAnchor, now, params_.reputationDecayPerDay) >= params_.minReputationToValidate;
}

bool ValidatorRegistry::IsActive(const Address& validator) const
{
    LOCK(cs_registry_);
    auto it = validators_.find(validator);
    return it != validators_.end() && it->second.isActive;
}

size_t ValidatorRegistry::ActiveCount() const
{
    LOCK(cs_registry_);
    return active_.size();
}

bool ValidatorRegistry::RecordAttestation(const Address& validator, uint64_t now)
{
    LOCK(cs_registry_);

    auto it = validators_.find(validator);
    if (it == validators_.end()) {
        return false;
    }
    ValidatorInfo& info = it->second;
    FoldDecay(info, now);
    info.reputation = std::min<uint32_t>(MAX_REPUTATION, info.reputation + params_.attestationReputationGain);
    info.validatedTransactions++;
    info.lastActivityTime = now;
    info.decayAnchor = now;
    return true;
}

BridgeResult ValidatorRegistry::LockStake(const Address& validator, CAmount amount)
{
    LOCK(cs_registry_);

    auto it = validators_.find(validator);
    if (it == validators_.end()) {
        return BridgeResult::Fail(BridgeError::NOT_REGISTERED);
    }
    if (amount < 0) {
        return BridgeResult::Fail(BridgeError::INVALID_AMOUNT);
    }
    if (it->second.AvailableStake() < amount) {
        return BridgeResult::Fail(BridgeError::INSUFFICIENT_STAKE, "Stake already reserved by open challenges");
    }
    it->second.lockedStake += amount;
    return BridgeResult::Ok();
}

bool ValidatorRegistry::ReleaseLockedStake(const Address& validator, CAmount amount)
{
    LOCK(cs_registry_);

    auto it = validators_.find(validator);
    if (it == validators_.end() || amount < 0) {
        return false;
    }
    it->second.lockedStake -= std::min(amount, it->second.lockedStake);
    return true;
}

std::optional<SlashOutcome> ValidatorRegistry::Slash(const Address& validator, CAmount reserved, CAmount amount, uint64_t now)
{
    SlashOutcome outcome;
    {
        LOCK(cs_registry_);

        auto it = validators_.find(validator);
        if (it == validators_.end() || amount < 0 || reserved < 0) {
            return std::nullopt;
        }
        ValidatorInfo& info = it->second;

        info.lockedStake -= std::min(reserved, info.lockedStake);

        // Degrade instead of failing when stake ran short
        outcome.slashed = std::min(amount, info.stake);
        info.stake -= outcome.slashed;
        if (info.lockedStake > info.stake) {
            info.lockedStake = info.stake;
        }

        FoldDecay(info, now);
        info.reputation = info.reputation > params_.slashReputationPenalty ?
                          info.reputation - params_.slashReputationPenalty : 0;
        info.slashCount++;

        if (info.isActive &&
            (info.slashCount >= params_.maxSlashCount || info.reputation < params_.minReputationToValidate)) {
            Deactivate(info, "automatic deactivation after slashing", now);
            outcome.deactivated = true;
            LogPrintf("ValidatorRegistry: %s auto-deactivated (slashCount=%u reputation=%u)\n",
                      validator.ToString(), info.slashCount, info.reputation);
        }

        LogPrint(BCLog::VALIDATOR, "ValidatorRegistry: Slashed %s by %s, stake now %s\n",
                 validator.ToString(), FormatMoney(outcome.slashed), FormatMoney(info.stake));
    }

    signals_.ValidatorSlashed(validator, outcome.slashed, outcome.deactivated);
    return outcome;
}

std::optional<ValidatorInfo> ValidatorRegistry::GetValidator(const Address& validator) const
{
    LOCK(cs_registry_);
    auto it = validators_.find(validator);
    if (it == validators_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ValidatorInfo> ValidatorRegistry::GetActiveValidators() const
{
    LOCK(cs_registry_);
    std::vector<ValidatorInfo> result;
    result.reserve(active_.size());
    for (const Address& addr : active_) {
        result.push_back(validators_.at(addr));
    }
    return result;
}

std::vector<ValidatorInfo> ValidatorRegistry::GetAllValidators() const
{
    LOCK(cs_registry_);
    std::vector<ValidatorInfo> result;
    result.reserve(validators_.size());
    for (const auto& entry : validators_) {
        result.push_back(entry.second);
    }
    return result;
}

CAmount ValidatorRegistry::GetTotalStake() const
{
    LOCK(cs_registry_);
    CAmount total = 0;
    for (const auto& entry : validators_) {
        total += entry.second.stake;
    }
    return total;
}

void ValidatorRegistry::LoadValidator(const ValidatorInfo& info)
{
    LOCK(cs_registry_);
    validators_[info.address] = info;
    active_.erase(std::remove(active_.begin(), active_.end(), info.address), active_.end());
    if (info.isActive) {
        active_.push_back(info.address);
    }
}

void ValidatorRegistry::Clear()
{
    LOCK(cs_registry_);
    validators_.clear();
    active_.clear();
}

} // namespace bridge
