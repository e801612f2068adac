// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <bridge/challenge_manager.h>

#include <util.h>

#include <algorithm>

namespace bridge {

bool SplitSlash(const BridgeParams& params, CAmount slashed, CAmount& challengerOut, CAmount& insuranceOut)
{
    CAmount challenger = 0;
    if (!MulBps(slashed, params.GetSlashShare(SlashRecipient::CHALLENGER), challenger)) {
        return false;
    }
    challengerOut = challenger;
    insuranceOut = slashed - challenger;
    return true;
}

ChallengeManager::ChallengeManager(const BridgeParams& params, TokenLedger& ledger, ValidatorRegistry& registry,
                                   AttestationLedger& attestations, BridgeStateMachine& stateMachine,
                                   BridgeSignals& signals)
    : params_(params)
    , ledger_(ledger)
    , registry_(registry)
    , attestations_(attestations)
    , stateMachine_(stateMachine)
    , signals_(signals)
    , nextId_(1)
    , insuranceFund_(0)
{
}

BridgeResult ChallengeManager::OpenChallenge(const Address& challenger, const Address& validator, uint64_t nonce,
                                             const std::vector<unsigned char>& proof, uint64_t now, uint64_t& idOut)
{
    {
        LOCK(cs_challenge_);

        if (challenger.IsNull() || challenger == params_.custody) {
            return BridgeResult::Fail(BridgeError::INVALID_ADDRESS);
        }
        if (challenger == validator) {
            return BridgeResult::Fail(BridgeError::INVALID_PARAMETER, "Validator cannot challenge itself");
        }

        std::optional<ValidatorInfo> info = registry_.GetValidator(validator);
        if (!info) {
            return BridgeResult::Fail(BridgeError::NOT_REGISTERED);
        }
        if (!info->isActive) {
            return BridgeResult::Fail(BridgeError::VALIDATOR_INACTIVE);
        }

        std::optional<BridgeTransaction> tx = stateMachine_.GetTransaction(nonce);
        if (!tx) {
            return BridgeResult::Fail(BridgeError::TX_NOT_FOUND);
        }
        if (!attestations_.HasAttested(nonce, validator) || attestations_.IsInvalidated(nonce, validator)) {
            return BridgeResult::Fail(BridgeError::NO_ATTESTATION_TO_CHALLENGE);
        }
        for (const auto& entry : challenges_) {
            const Challenge& other = entry.second;
            if (other.IsOpen() && other.validator == validator && other.nonce == nonce) {
                return BridgeResult::Fail(BridgeError::CHALLENGE_ALREADY_OPEN,
                    strprintf("Challenge %u is still open", other.id));
            }
        }
        switch (tx->status) {
        case TxStatus::PENDING:
            break;
        case TxStatus::COMPLETED:
            if (now > tx->completedAt + params_.postCompletionWindow) {
                return BridgeResult::Fail(BridgeError::CHALLENGE_WINDOW_CLOSED,
                    strprintf("Window closed at %u", tx->completedAt + params_.postCompletionWindow));
            }
            break;
        case TxStatus::FAILED:
        case TxStatus::CANCELLED:
            return BridgeResult::Fail(BridgeError::INVALID_STATE,
                strprintf("Transfer is %s", TxStatusToString(tx->status)));
        }

        CAmount intended = 0;
        if (!MulBps(info->stake, params_.slashBps, intended)) {
            return BridgeResult::Fail(BridgeError::ARITHMETIC_OVERFLOW);
        }
        CAmount reserve = std::min(intended, info->AvailableStake());

        if (ledger_.BalanceOf(challenger) < params_.challengeStake) {
            return BridgeResult::Fail(BridgeError::INSUFFICIENT_BALANCE,
                strprintf("Challenge stake is %s", FormatMoney(params_.challengeStake)));
        }
        if (!ledger_.TransferFrom(challenger, params_.custody, params_.challengeStake)) {
            return BridgeResult::Fail(BridgeError::TOKEN_TRANSFER_FAILED, "Challenge stake transfer failed");
        }
        BridgeResult locked = registry_.LockStake(validator, reserve);
        if (!locked) {
            LogPrintf("ChallengeManager: Could not reserve %s of %s: %s\n",
                      FormatMoney(reserve), validator.ToString(), locked.ToString());
            reserve = 0;
        }

        Challenge challenge;
        challenge.id = nextId_++;
        challenge.challenger = challenger;
        challenge.validator = validator;
        challenge.nonce = nonce;
        challenge.stake = params_.challengeStake;
        challenge.proof = proof;
        challenge.createdAt = now;
        challenge.periodEnd = now + params_.challengePeriod;
        challenge.intendedSlash = intended;
        challenge.reservedSlash = reserve;
        challenges_[challenge.id] = challenge;
        idOut = challenge.id;

        LogPrintf("ChallengeManager: Challenge %u opened by %s against %s on transfer %u (reserved %s)\n",
                  challenge.id, challenger.ToString(), validator.ToString(), nonce, FormatMoney(reserve));
    }

    signals_.ChallengeOpened(idOut, challenger, validator, nonce);
    return BridgeResult::Ok();
}

bool ChallengeManager::HasSupermajority(const Challenge& challenge) const
{
    const CAmount total = challenge.TotalVoteWeight();
    if (total <= 0 || total < params_.voteQuorumWeight) {
        return false;
    }
    CAmount needed = 0;
    if (!MulBps(total, params_.supermajorityBps, needed)) {
        return false;
    }
    return std::max(challenge.votesAgainstValidator, challenge.votesForValidator) >= needed;
}

BridgeResult ChallengeManager::VoteOnChallenge(const Address& voter, uint64_t id, bool againstValidator, uint64_t now)
{
    LOCK(cs_challenge_);

    auto it = challenges_.find(id);
    if (it == challenges_.end()) {
        return BridgeResult::Fail(BridgeError::CHALLENGE_NOT_FOUND);
    }
    Challenge& challenge = it->second;
    if (!challenge.IsOpen()) {
        return BridgeResult::Fail(BridgeError::ALREADY_RESOLVED);
    }
    if (now >= challenge.periodEnd || HasSupermajority(challenge)) {
        return BridgeResult::Fail(BridgeError::VOTING_CLOSED);
    }
    if (voter == challenge.validator || voter == challenge.challenger) {
        return BridgeResult::Fail(BridgeError::INVALID_PARAMETER, "Challenge parties cannot vote");
    }
    if (challenge.voters.count(voter)) {
        return BridgeResult::Fail(BridgeError::ALREADY_VOTED);
    }

    const CAmount weight = ledger_.BalanceOf(voter);
    if (weight < params_.minVotingPower) {
        return BridgeResult::Fail(BridgeError::INSUFFICIENT_VOTING_POWER,
            strprintf("Voting requires a balance of %s", FormatMoney(params_.minVotingPower)));
    }

    CAmount& tally = againstValidator ? challenge.votesAgainstValidator : challenge.votesForValidator;
    CAmount updated = 0;
    if (!CheckedAdd(tally, weight, updated)) {
        return BridgeResult::Fail(BridgeError::ARITHMETIC_OVERFLOW);
    }
    tally = updated;
    challenge.voters[voter] = againstValidator;

    LogPrint(BCLog::CHALLENGE, "ChallengeManager: %s voted %s validator on challenge %u with weight %s\n",
             voter.ToString(), againstValidator ? "against" : "for", id, FormatMoney(weight));
    return BridgeResult::Ok();
}

BridgeResult ChallengeManager::Settle(Challenge& challenge, bool successful, ResolutionPath path, uint64_t now)
{
    if (successful && attestations_.IsInvalidated(challenge.nonce, challenge.validator)) {
        LogPrintf("ChallengeManager: Attestation of %s on %u was already punished, challenge %u fails\n",
                  challenge.validator.ToString(), challenge.nonce, challenge.id);
        successful = false;
    }
    if (!successful) {
        if (!ledger_.Transfer(challenge.challenger, challenge.stake)) {
            return BridgeResult::Fail(BridgeError::TOKEN_TRANSFER_FAILED, "Challenger stake return failed");
        }
        if (!registry_.ReleaseLockedStake(challenge.validator, challenge.reservedSlash)) {
            LogPrintf("ChallengeManager: No reservation to release for %s\n", challenge.validator.ToString());
        }
        challenge.status = ChallengeStatus::FAILED;
        challenge.resolution = path;
        challenge.resolvedAt = now;

        LogPrintf("ChallengeManager: Challenge %u failed, returned %s to %s\n",
                  challenge.id, FormatMoney(challenge.stake), challenge.challenger.ToString());
        return BridgeResult::Ok();
    }

    std::optional<ValidatorInfo> info = registry_.GetValidator(challenge.validator);
    if (!info) {
        return BridgeResult::Fail(BridgeError::NOT_REGISTERED);
    }

    // Stake reserved by other open challenges stays untouched
    CAmount slash = std::min(challenge.intendedSlash, challenge.reservedSlash + info->AvailableStake());
    slash = std::min(slash, info->stake);

    CAmount reward = 0;
    CAmount insurance = 0;
    if (!SplitSlash(params_, slash, reward, insurance)) {
        return BridgeResult::Fail(BridgeError::ARITHMETIC_OVERFLOW);
    }
    CAmount payout = 0;
    if (!CheckedAdd(challenge.stake, reward, payout)) {
        return BridgeResult::Fail(BridgeError::ARITHMETIC_OVERFLOW);
    }
    if (!ledger_.Transfer(challenge.challenger, payout)) {
        return BridgeResult::Fail(BridgeError::TOKEN_TRANSFER_FAILED, "Challenger payout failed");
    }

    std::optional<SlashOutcome> outcome = registry_.Slash(challenge.validator, challenge.reservedSlash, slash, now);
    if (!outcome) {
        return BridgeResult::Fail(BridgeError::NOT_REGISTERED);
    }
    insuranceFund_ += insurance;

    if (!attestations_.Invalidate(challenge.nonce, challenge.validator)) {
        LogPrintf("ChallengeManager: Attestation of %s on %u vanished before invalidation\n",
                  challenge.validator.ToString(), challenge.nonce);
    }
    BridgeResult disputed = stateMachine_.MarkDisputed(challenge.nonce, challenge.id);
    if (!disputed) {
        LogPrintf("ChallengeManager: Could not flag transfer %u: %s\n", challenge.nonce, disputed.ToString());
    }

    challenge.status = ChallengeStatus::SUCCEEDED;
    challenge.resolution = path;
    challenge.resolvedAt = now;
    challenge.slashedAmount = slash;
    challenge.challengerReward = reward;
    challenge.insuranceShare = insurance;

    LogPrintf("ChallengeManager: Challenge %u succeeded, slashed %s from %s (challenger %s, insurance %s)%s\n",
              challenge.id, FormatMoney(slash), challenge.validator.ToString(), FormatMoney(reward),
              FormatMoney(insurance), outcome->deactivated ? ", validator deactivated" : "");
    return BridgeResult::Ok();
}

BridgeResult ChallengeManager::ResolveChallenge(const Address& caller, uint64_t id, bool successful, uint64_t now)
{
    ChallengeStatus outcome = ChallengeStatus::OPEN;
    {
        LOCK(cs_challenge_);

        if (caller != params_.owner) {
            return BridgeResult::Fail(BridgeError::NOT_OWNER);
        }
        auto it = challenges_.find(id);
        if (it == challenges_.end()) {
            return BridgeResult::Fail(BridgeError::CHALLENGE_NOT_FOUND);
        }
        Challenge& challenge = it->second;
        if (!challenge.IsOpen()) {
            return BridgeResult::Fail(BridgeError::ALREADY_RESOLVED);
        }
        if (now < challenge.periodEnd) {
            return BridgeResult::Fail(BridgeError::CHALLENGE_PERIOD_ACTIVE,
                strprintf("Resolvable from %u", challenge.periodEnd));
        }

        BridgeResult result = Settle(challenge, successful, ResolutionPath::ARBITRATOR, now);
        if (!result) {
            return result;
        }
        outcome = challenge.status;
    }

    signals_.ChallengeResolved(id, outcome);
    return BridgeResult::Ok();
}

BridgeResult ChallengeManager::ResolveByVote(uint64_t id, uint64_t now)
{
    ChallengeStatus outcome = ChallengeStatus::OPEN;
    {
        LOCK(cs_challenge_);

        auto it = challenges_.find(id);
        if (it == challenges_.end()) {
            return BridgeResult::Fail(BridgeError::CHALLENGE_NOT_FOUND);
        }
        Challenge& challenge = it->second;
        if (!challenge.IsOpen()) {
            return BridgeResult::Fail(BridgeError::ALREADY_RESOLVED);
        }
        if (now < challenge.periodEnd && !HasSupermajority(challenge)) {
            return BridgeResult::Fail(BridgeError::CHALLENGE_PERIOD_ACTIVE,
                strprintf("Resolvable from %u or on supermajority", challenge.periodEnd));
        }

        const bool successful = challenge.votesAgainstValidator > challenge.votesForValidator;
        BridgeResult result = Settle(challenge, successful, ResolutionPath::COMMUNITY_VOTE, now);
        if (!result) {
            return result;
        }
        outcome = challenge.status;
    }

    signals_.ChallengeResolved(id, outcome);
    return BridgeResult::Ok();
}

BridgeResult ChallengeManager::WithdrawInsuranceFund(const Address& caller, const Address& to, CAmount amount)
{
    LOCK(cs_challenge_);

    if (caller != params_.owner) {
        return BridgeResult::Fail(BridgeError::NOT_OWNER);
    }
    if (to.IsNull()) {
        return BridgeResult::Fail(BridgeError::INVALID_ADDRESS);
    }
    if (amount <= 0) {
        return BridgeResult::Fail(BridgeError::INVALID_AMOUNT);
    }
    if (amount > insuranceFund_) {
        return BridgeResult::Fail(BridgeError::INSUFFICIENT_FUND_BALANCE,
            strprintf("Insurance fund holds %s", FormatMoney(insuranceFund_)));
    }
    if (!ledger_.Transfer(to, amount)) {
        return BridgeResult::Fail(BridgeError::TOKEN_TRANSFER_FAILED);
    }
    insuranceFund_ -= amount;

    LogPrintf("ChallengeManager: Paid %s from the insurance fund to %s\n", FormatMoney(amount), to.ToString());
    return BridgeResult::Ok();
}

std::optional<Challenge> ChallengeManager::GetChallenge(uint64_t id) const
{
    LOCK(cs_challenge_);
    auto it = challenges_.find(id);
    if (it == challenges_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Challenge> ChallengeManager::GetChallenges() const
{
    LOCK(cs_challenge_);
    std::vector<Challenge> result;
    result.reserve(challenges_.size());
    for (const auto& entry : challenges_) {
        result.push_back(entry.second);
    }
    return result;
}

std::vector<Challenge> ChallengeManager::GetChallengesForValidator(const Address& validator) const
{
    LOCK(cs_challenge_);
    std::vector<Challenge> result;
    for (const auto& entry : challenges_) {
        if (entry.second.validator == validator) {
            result.push_back(entry.second);
        }
    }
    return result;
}

std::vector<Challenge> ChallengeManager::GetOpenChallenges() const
{
    LOCK(cs_challenge_);
    std::vector<Challenge> result;
    for (const auto& entry : challenges_) {
        if (entry.second.IsOpen()) {
            result.push_back(entry.second);
        }
    }
    return result;
}

CAmount ChallengeManager::GetInsuranceFund() const
{
    LOCK(cs_challenge_);
    return insuranceFund_;
}

uint64_t ChallengeManager::GetNextChallengeId() const
{
    LOCK(cs_challenge_);
    return nextId_;
}

void ChallengeManager::LoadChallenge(const Challenge& challenge)
{
    LOCK(cs_challenge_);
    challenges_[challenge.id] = challenge;
    nextId_ = std::max(nextId_, challenge.id + 1);
}

void ChallengeManager::LoadCounters(uint64_t nextId, CAmount insuranceFund)
{
    LOCK(cs_challenge_);
    nextId_ = std::max(nextId_, nextId);
    insuranceFund_ = insuranceFund;
}

void ChallengeManager::Clear()
{
    LOCK(cs_challenge_);
    challenges_.clear();
    nextId_ = 1;
    insuranceFund_ = 0;
}

} // namespace bridge
