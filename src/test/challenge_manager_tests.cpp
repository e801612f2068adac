// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file challenge_manager_tests.cpp
 * @brief Challenges, community votes, slashing and the insurance fund
 */

#include <bridge/challenge_manager.h>
#include <test/test_quorum.h>

#include <boost/test/unit_test.hpp>

#include <vector>

using namespace bridge;

namespace {

const CAmount STAKE = 1000 * COIN;
const std::vector<unsigned char> PROOF = {0xde, 0xad, 0xbe, 0xef};

struct ChallengeTestingSetup : public BridgeTestingSetup {
    Address challenger;

    ChallengeTestingSetup()
    {
        challenger = RandomTestAddress(rng);
        RegisterValidators(3, STAKE);
    }

    uint64_t OpenChallenge(size_t validator, uint64_t nonce, uint64_t now)
    {
        BOOST_REQUIRE(ledger->Mint(challenger, params.challengeStake));
        uint64_t id = 0;
        BridgeResult result = Challenges().OpenChallenge(challenger, validators[validator], nonce, PROOF, now, id);
        BOOST_REQUIRE_MESSAGE(result, result.ToString());
        return id;
    }

    Address FundedVoter(CAmount balance)
    {
        Address voter = RandomTestAddress(rng);
        BOOST_REQUIRE(ledger->Mint(voter, balance));
        return voter;
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(challenge_manager_tests, ChallengeTestingSetup)

BOOST_AUTO_TEST_CASE(successful_challenge_slashes_and_splits)
{
    const uint64_t nonce = InitiateTransfer(users[0], 1000 * COIN, TEST_T0);
    BOOST_REQUIRE(AttestTransfer(0, nonce, TEST_T0 + 10));

    std::vector<ChallengeStatus> resolved;
    boost::signals2::scoped_connection conn = node->Signals().ChallengeResolved.connect(
        [&resolved](uint64_t, ChallengeStatus status) { resolved.push_back(status); });

    const CAmount custodyBefore = ledger->BalanceOf(custody);
    const uint64_t id = OpenChallenge(0, nonce, TEST_T0 + 20);
    BOOST_CHECK_EQUAL(ledger->BalanceOf(challenger), 0);
    BOOST_CHECK_EQUAL(ledger->BalanceOf(custody), custodyBefore + params.challengeStake);
    BOOST_CHECK_EQUAL(Registry().GetValidator(validators[0])->lockedStake, 100 * COIN);

    std::optional<Challenge> challenge = Challenges().GetChallenge(id);
    BOOST_REQUIRE(challenge);
    BOOST_CHECK(challenge->IsOpen());
    BOOST_CHECK_EQUAL(challenge->periodEnd, TEST_T0 + 20 + params.challengePeriod);
    BOOST_CHECK_EQUAL(challenge->reservedSlash, 100 * COIN);
    BOOST_CHECK_EQUAL(challenge->intendedSlash, 100 * COIN);
    BOOST_CHECK(challenge->proof == PROOF);

    BOOST_CHECK_EQUAL(Challenges().ResolveChallenge(users[0], id, true, challenge->periodEnd).error, BridgeError::NOT_OWNER);
    BridgeResult early = Challenges().ResolveChallenge(owner, id, true, challenge->periodEnd - 1);
    BOOST_CHECK_EQUAL(early.error, BridgeError::CHALLENGE_PERIOD_ACTIVE);
    BOOST_CHECK(IsRetryable(early.error));

    const CAmount supplyBefore = ledger->TotalSupply();
    BOOST_REQUIRE(Challenges().ResolveChallenge(owner, id, true, challenge->periodEnd));
    BOOST_CHECK_EQUAL(ledger->TotalSupply(), supplyBefore);

    // 10% of 1000 slashed, half to the challenger on top of its stake
    BOOST_CHECK_EQUAL(ledger->BalanceOf(challenger), params.challengeStake + 50 * COIN);
    BOOST_CHECK_EQUAL(Challenges().GetInsuranceFund(), 50 * COIN);

    std::optional<ValidatorInfo> info = Registry().GetValidator(validators[0]);
    BOOST_CHECK_EQUAL(info->stake, 900 * COIN);
    BOOST_CHECK_EQUAL(info->lockedStake, 0);
    BOOST_CHECK_EQUAL(info->slashCount, 1U);
    // Three days of inactivity decay are folded in before the penalty
    BOOST_CHECK_EQUAL(info->reputation,
                      INITIAL_REPUTATION + params.attestationReputationGain -
                      3 * params.reputationDecayPerDay - params.slashReputationPenalty);
    BOOST_CHECK(info->isActive);

    challenge = Challenges().GetChallenge(id);
    BOOST_CHECK(challenge->status == ChallengeStatus::SUCCEEDED);
    BOOST_CHECK(challenge->resolution == ResolutionPath::ARBITRATOR);
    BOOST_CHECK_EQUAL(challenge->slashedAmount, 100 * COIN);
    BOOST_CHECK_EQUAL(challenge->challengerReward + challenge->insuranceShare, challenge->slashedAmount);
    BOOST_REQUIRE_EQUAL(resolved.size(), 1U);
    BOOST_CHECK(resolved[0] == ChallengeStatus::SUCCEEDED);

    // The attestation no longer counts and the transfer is flagged
    BOOST_CHECK(Attestations().IsInvalidated(nonce, validators[0]));
    BOOST_CHECK(StateMachine().GetTransaction(nonce)->trustStatus == TrustStatus::DISPUTED);
    BOOST_REQUIRE(AttestTransfer(1, nonce, TEST_T0 + 30));
    BOOST_CHECK(StateMachine().GetTransaction(nonce)->IsPending());

    BOOST_CHECK_EQUAL(Challenges().ResolveChallenge(owner, id, false, challenge->periodEnd).error,
                      BridgeError::ALREADY_RESOLVED);
    BOOST_CHECK_EQUAL(Challenges().ResolveByVote(id, challenge->periodEnd).error, BridgeError::ALREADY_RESOLVED);
    BOOST_CHECK_EQUAL(resolved.size(), 1U);
}

BOOST_AUTO_TEST_CASE(failed_challenge_returns_stake)
{
    const uint64_t nonce = InitiateTransfer(users[0], 10 * COIN, TEST_T0);
    BOOST_REQUIRE(AttestTransfer(0, nonce, TEST_T0));
    const uint64_t id = OpenChallenge(0, nonce, TEST_T0);
    const uint64_t end = TEST_T0 + params.challengePeriod;

    ledger->FailNextTransfers(1);
    BOOST_CHECK_EQUAL(Challenges().ResolveChallenge(owner, id, false, end).error, BridgeError::TOKEN_TRANSFER_FAILED);
    BOOST_CHECK(Challenges().GetChallenge(id)->IsOpen());

    BOOST_REQUIRE(Challenges().ResolveChallenge(owner, id, false, end));
    BOOST_CHECK_EQUAL(ledger->BalanceOf(challenger), params.challengeStake);
    BOOST_CHECK_EQUAL(Challenges().GetInsuranceFund(), 0);

    std::optional<ValidatorInfo> info = Registry().GetValidator(validators[0]);
    BOOST_CHECK_EQUAL(info->stake, STAKE);
    BOOST_CHECK_EQUAL(info->lockedStake, 0);
    BOOST_CHECK_EQUAL(info->slashCount, 0U);
    BOOST_CHECK(!Attestations().IsInvalidated(nonce, validators[0]));
    BOOST_CHECK(StateMachine().GetTransaction(nonce)->trustStatus == TrustStatus::TRUSTED);
    BOOST_CHECK(Challenges().GetChallenge(id)->status == ChallengeStatus::FAILED);
}

BOOST_AUTO_TEST_CASE(open_challenge_rejections)
{
    const uint64_t nonce = InitiateTransfer(users[0], 10 * COIN, TEST_T0);
    BOOST_REQUIRE(AttestTransfer(0, nonce, TEST_T0));
    uint64_t id = 0;

    BOOST_CHECK_EQUAL(Challenges().OpenChallenge(challenger, validators[1], nonce, PROOF, TEST_T0, id).error,
                      BridgeError::NO_ATTESTATION_TO_CHALLENGE);
    BOOST_CHECK_EQUAL(Challenges().OpenChallenge(challenger, validators[4], nonce, PROOF, TEST_T0, id).error,
                      BridgeError::NOT_REGISTERED);
    BOOST_CHECK_EQUAL(Challenges().OpenChallenge(challenger, validators[0], nonce + 1, PROOF, TEST_T0, id).error,
                      BridgeError::TX_NOT_FOUND);
    BOOST_CHECK_EQUAL(Challenges().OpenChallenge(validators[0], validators[0], nonce, PROOF, TEST_T0, id).error,
                      BridgeError::INVALID_PARAMETER);
    BOOST_CHECK_EQUAL(Challenges().OpenChallenge(custody, validators[0], nonce, PROOF, TEST_T0, id).error,
                      BridgeError::INVALID_ADDRESS);
    BOOST_CHECK_EQUAL(Challenges().OpenChallenge(challenger, validators[0], nonce, PROOF, TEST_T0, id).error,
                      BridgeError::INSUFFICIENT_BALANCE);

    BOOST_CHECK(Challenges().GetChallenges().empty());
    BOOST_CHECK_EQUAL(Challenges().GetNextChallengeId(), 1U);
    BOOST_CHECK_EQUAL(Registry().GetValidator(validators[0])->lockedStake, 0);

    // Cancelled transfers can no longer be disputed
    BOOST_REQUIRE(StateMachine().Cancel(users[0], nonce, TEST_T0 + params.transactionTimeout));
    BOOST_REQUIRE(ledger->Mint(challenger, params.challengeStake));
    BOOST_CHECK_EQUAL(Challenges().OpenChallenge(challenger, validators[0], nonce, PROOF, TEST_T0, id).error,
                      BridgeError::INVALID_STATE);

    // Nor can validators that left the set
    const uint64_t other = InitiateTransfer(users[1], 10 * COIN, TEST_T0 + 10);
    BOOST_REQUIRE(AttestTransfer(2, other, TEST_T0 + 10));
    BOOST_REQUIRE(Registry().RemoveValidator(owner, validators[2], "exit", TEST_T0 + 20));
    BOOST_CHECK_EQUAL(Challenges().OpenChallenge(challenger, validators[2], other, PROOF, TEST_T0 + 30, id).error,
                      BridgeError::VALIDATOR_INACTIVE);
}

BOOST_AUTO_TEST_CASE(completed_transfer_challenge_window)
{
    const uint64_t nonce = InitiateTransfer(users[0], 10 * COIN, TEST_T0);
    BOOST_REQUIRE(AttestTransfer(0, nonce, TEST_T0 + 5));
    BOOST_REQUIRE(AttestTransfer(1, nonce, TEST_T0 + 10));
    BOOST_REQUIRE(StateMachine().GetTransaction(nonce)->status == TxStatus::COMPLETED);

    const uint64_t closes = TEST_T0 + 10 + params.postCompletionWindow;
    BOOST_REQUIRE(ledger->Mint(challenger, params.challengeStake));
    uint64_t id = 0;
    BOOST_CHECK_EQUAL(Challenges().OpenChallenge(challenger, validators[0], nonce, PROOF, closes + 1, id).error,
                      BridgeError::CHALLENGE_WINDOW_CLOSED);
    BOOST_CHECK(Challenges().OpenChallenge(challenger, validators[1], nonce, PROOF, closes, id));

    // Completion is final even when an attester is slashed afterwards
    BOOST_REQUIRE(Challenges().ResolveChallenge(owner, id, true, closes + params.challengePeriod));
    BOOST_CHECK(StateMachine().GetTransaction(nonce)->status == TxStatus::COMPLETED);
    BOOST_CHECK(StateMachine().GetTransaction(nonce)->trustStatus == TrustStatus::DISPUTED);
}

BOOST_AUTO_TEST_CASE(community_vote_reaches_supermajority)
{
    const uint64_t nonce = InitiateTransfer(users[0], 10 * COIN, TEST_T0);
    BOOST_REQUIRE(AttestTransfer(0, nonce, TEST_T0));
    const uint64_t id = OpenChallenge(0, nonce, TEST_T0);

    const Address heavy = FundedVoter(800 * COIN);
    const Address light = FundedVoter(200 * COIN);
    const Address late = FundedVoter(500 * COIN);
    const Address poor = FundedVoter(params.minVotingPower - 1);

    BOOST_CHECK_EQUAL(Challenges().VoteOnChallenge(heavy, id + 1, true, TEST_T0).error, BridgeError::CHALLENGE_NOT_FOUND);
    BOOST_CHECK_EQUAL(Challenges().VoteOnChallenge(validators[0], id, false, TEST_T0).error, BridgeError::INVALID_PARAMETER);
    BOOST_CHECK_EQUAL(Challenges().VoteOnChallenge(challenger, id, true, TEST_T0).error, BridgeError::INVALID_PARAMETER);
    BOOST_CHECK_EQUAL(Challenges().VoteOnChallenge(poor, id, true, TEST_T0).error, BridgeError::INSUFFICIENT_VOTING_POWER);

    BOOST_REQUIRE(Challenges().VoteOnChallenge(heavy, id, true, TEST_T0 + 1));
    BOOST_CHECK_EQUAL(Challenges().VoteOnChallenge(heavy, id, true, TEST_T0 + 2).error, BridgeError::ALREADY_VOTED);

    // 800 of 800 is not enough: the quorum weight is not met yet
    BOOST_CHECK(!Challenges().HasSupermajority(*Challenges().GetChallenge(id)));
    BOOST_CHECK_EQUAL(Challenges().ResolveByVote(id, TEST_T0 + 3).error, BridgeError::CHALLENGE_PERIOD_ACTIVE);

    BOOST_REQUIRE(Challenges().VoteOnChallenge(light, id, false, TEST_T0 + 4));
    std::optional<Challenge> challenge = Challenges().GetChallenge(id);
    BOOST_CHECK_EQUAL(challenge->votesAgainstValidator, 800 * COIN);
    BOOST_CHECK_EQUAL(challenge->votesForValidator, 200 * COIN);
    BOOST_CHECK(Challenges().HasSupermajority(*challenge));

    // Ballot closes as soon as the outcome is decided
    BOOST_CHECK_EQUAL(Challenges().VoteOnChallenge(late, id, false, TEST_T0 + 5).error, BridgeError::VOTING_CLOSED);

    BOOST_REQUIRE(Challenges().ResolveByVote(id, TEST_T0 + 6));
    challenge = Challenges().GetChallenge(id);
    BOOST_CHECK(challenge->status == ChallengeStatus::SUCCEEDED);
    BOOST_CHECK(challenge->resolution == ResolutionPath::COMMUNITY_VOTE);
    BOOST_CHECK_EQUAL(challenge->resolvedAt, TEST_T0 + 6);
    BOOST_CHECK_EQUAL(Registry().GetValidator(validators[0])->stake, 900 * COIN);
}

BOOST_AUTO_TEST_CASE(tied_or_empty_vote_fails_challenge)
{
    const uint64_t nonce = InitiateTransfer(users[0], 10 * COIN, TEST_T0);
    BOOST_REQUIRE(AttestTransfer(0, nonce, TEST_T0));
    BOOST_REQUIRE(AttestTransfer(1, nonce, TEST_T0));
    const uint64_t tied = OpenChallenge(0, nonce, TEST_T0);
    const uint64_t empty = OpenChallenge(1, nonce, TEST_T0);
    const uint64_t end = TEST_T0 + params.challengePeriod;

    BOOST_REQUIRE(Challenges().VoteOnChallenge(FundedVoter(500 * COIN), tied, true, TEST_T0 + 1));
    BOOST_REQUIRE(Challenges().VoteOnChallenge(FundedVoter(500 * COIN), tied, false, TEST_T0 + 2));
    BOOST_CHECK_EQUAL(Challenges().ResolveByVote(tied, TEST_T0 + 3).error, BridgeError::CHALLENGE_PERIOD_ACTIVE);
    BOOST_CHECK_EQUAL(Challenges().VoteOnChallenge(FundedVoter(500 * COIN), tied, true, end).error,
                      BridgeError::VOTING_CLOSED);

    BOOST_REQUIRE(Challenges().ResolveByVote(tied, end));
    BOOST_REQUIRE(Challenges().ResolveByVote(empty, end));
    BOOST_CHECK(Challenges().GetChallenge(tied)->status == ChallengeStatus::FAILED);
    BOOST_CHECK(Challenges().GetChallenge(empty)->status == ChallengeStatus::FAILED);
    BOOST_CHECK_EQUAL(ledger->BalanceOf(challenger), 2 * params.challengeStake);
    BOOST_CHECK(Challenges().GetOpenChallenges().empty());
}

BOOST_AUTO_TEST_CASE(repeated_slashing_deactivates_validator)
{
    std::vector<uint64_t> ids;
    for (int i = 0; i < 3; ++i) {
        const uint64_t nonce = InitiateTransfer(users[i], 10 * COIN, TEST_T0 + i);
        BOOST_REQUIRE(AttestTransfer(0, nonce, TEST_T0 + i));
        ids.push_back(OpenChallenge(0, nonce, TEST_T0 + i));
    }
    BOOST_CHECK_EQUAL(Registry().GetValidator(validators[0])->lockedStake, 300 * COIN);
    BOOST_CHECK_EQUAL(Challenges().GetChallengesForValidator(validators[0]).size(), 3U);

    const uint64_t end = TEST_T0 + 10 + params.challengePeriod;
    BOOST_REQUIRE(Challenges().ResolveChallenge(owner, ids[0], true, end));
    BOOST_CHECK(Registry().IsActive(validators[0]));
    BOOST_CHECK_EQUAL(Registry().GetValidator(validators[0])->lockedStake, 200 * COIN);

    // Each slash follows the stake held when its challenge was opened
    BOOST_REQUIRE(Challenges().ResolveChallenge(owner, ids[1], true, end));
    BOOST_CHECK_EQUAL(Challenges().GetChallenge(ids[1])->slashedAmount, 100 * COIN);
    BOOST_CHECK(Registry().IsActive(validators[0]));

    BOOST_REQUIRE(Challenges().ResolveChallenge(owner, ids[2], true, end));
    BOOST_CHECK_EQUAL(Challenges().GetChallenge(ids[2])->slashedAmount, 100 * COIN);

    std::optional<ValidatorInfo> info = Registry().GetValidator(validators[0]);
    BOOST_CHECK(!info->isActive);
    BOOST_CHECK_EQUAL(info->slashCount, 3U);
    BOOST_CHECK_EQUAL(info->stake, 700 * COIN);
    BOOST_CHECK_EQUAL(info->lockedStake, 0);
    BOOST_CHECK_EQUAL(Registry().ActiveCount(), 2U);
    BOOST_CHECK_EQUAL(Challenges().GetInsuranceFund(), 150 * COIN);

    // What is left can be pulled out once inactive
    BOOST_REQUIRE(Registry().WithdrawStake(validators[0], end));
    BOOST_CHECK_EQUAL(ledger->BalanceOf(validators[0]), 700 * COIN);
}

BOOST_AUTO_TEST_CASE(one_open_challenge_per_attestation)
{
    const uint64_t nonce = InitiateTransfer(users[0], 10 * COIN, TEST_T0);
    BOOST_REQUIRE(AttestTransfer(0, nonce, TEST_T0));
    const uint64_t first = OpenChallenge(0, nonce, TEST_T0);

    BOOST_REQUIRE(ledger->Mint(challenger, params.challengeStake));
    uint64_t id = 0;
    BridgeResult result = Challenges().OpenChallenge(challenger, validators[0], nonce, PROOF, TEST_T0 + 1, id);
    BOOST_CHECK_EQUAL(result.error, BridgeError::CHALLENGE_ALREADY_OPEN);
    BOOST_CHECK(IsRetryable(result.error));
    BOOST_CHECK_EQUAL(ledger->BalanceOf(challenger), params.challengeStake);
    BOOST_CHECK_EQUAL(Registry().GetValidator(validators[0])->lockedStake, 100 * COIN);

    // A failed challenge frees the attestation for a new one
    const uint64_t end = TEST_T0 + params.challengePeriod;
    BOOST_REQUIRE(Challenges().ResolveChallenge(owner, first, false, end));
    const uint64_t second = OpenChallenge(0, nonce, end);
    BOOST_REQUIRE(Challenges().ResolveChallenge(owner, second, true, end + params.challengePeriod));
    BOOST_CHECK_EQUAL(Registry().GetValidator(validators[0])->slashCount, 1U);

    // Once punished the attestation is gone
    BOOST_REQUIRE(ledger->Mint(challenger, params.challengeStake));
    BOOST_CHECK_EQUAL(Challenges().OpenChallenge(challenger, validators[0], nonce, PROOF, end + params.challengePeriod,
                                                 id).error,
                      BridgeError::NO_ATTESTATION_TO_CHALLENGE);
}

BOOST_AUTO_TEST_CASE(removal_does_not_shrink_pending_slash)
{
    const uint64_t nonce = InitiateTransfer(users[0], 10 * COIN, TEST_T0);
    BOOST_REQUIRE(AttestTransfer(0, nonce, TEST_T0));
    const uint64_t id = OpenChallenge(0, nonce, TEST_T0);

    // Only the reserved slice stays behind on removal
    BOOST_REQUIRE(Registry().RemoveValidator(owner, validators[0], "exit", TEST_T0 + 1));
    BOOST_CHECK_EQUAL(ledger->BalanceOf(validators[0]), 900 * COIN);
    BOOST_CHECK_EQUAL(Registry().GetValidator(validators[0])->stake, 100 * COIN);

    BOOST_REQUIRE(Challenges().ResolveChallenge(owner, id, true, TEST_T0 + params.challengePeriod));
    std::optional<Challenge> challenge = Challenges().GetChallenge(id);
    BOOST_CHECK_EQUAL(challenge->slashedAmount, 100 * COIN);
    BOOST_CHECK_EQUAL(ledger->BalanceOf(challenger), params.challengeStake + 50 * COIN);
    BOOST_CHECK_EQUAL(Challenges().GetInsuranceFund(), 50 * COIN);

    std::optional<ValidatorInfo> info = Registry().GetValidator(validators[0]);
    BOOST_CHECK_EQUAL(info->stake, 0);
    BOOST_CHECK_EQUAL(info->lockedStake, 0);
    BOOST_CHECK_EQUAL(Registry().WithdrawStake(validators[0], TEST_T0 + params.challengePeriod).error,
                      BridgeError::INSUFFICIENT_STAKE);
    BOOST_CHECK_EQUAL(ledger->BalanceOf(validators[0]), 900 * COIN);
}

BOOST_AUTO_TEST_CASE(insurance_fund_withdrawal)
{
    const uint64_t nonce = InitiateTransfer(users[0], 10 * COIN, TEST_T0);
    BOOST_REQUIRE(AttestTransfer(0, nonce, TEST_T0));
    const uint64_t id = OpenChallenge(0, nonce, TEST_T0);
    BOOST_REQUIRE(Challenges().ResolveChallenge(owner, id, true, TEST_T0 + params.challengePeriod));
    const CAmount fund = Challenges().GetInsuranceFund();
    BOOST_REQUIRE_EQUAL(fund, 50 * COIN);

    const Address victim = RandomTestAddress(rng);
    BOOST_CHECK_EQUAL(Challenges().WithdrawInsuranceFund(users[0], victim, fund).error, BridgeError::NOT_OWNER);
    BOOST_CHECK_EQUAL(Challenges().WithdrawInsuranceFund(owner, Address(), fund).error, BridgeError::INVALID_ADDRESS);
    BOOST_CHECK_EQUAL(Challenges().WithdrawInsuranceFund(owner, victim, -1).error, BridgeError::INVALID_AMOUNT);
    BOOST_CHECK_EQUAL(Challenges().WithdrawInsuranceFund(owner, victim, fund + 1).error,
                      BridgeError::INSUFFICIENT_FUND_BALANCE);

    BOOST_REQUIRE(Challenges().WithdrawInsuranceFund(owner, victim, fund));
    BOOST_CHECK_EQUAL(ledger->BalanceOf(victim), fund);
    BOOST_CHECK_EQUAL(Challenges().GetInsuranceFund(), 0);
}

BOOST_AUTO_TEST_CASE(slash_split_rounds_toward_insurance)
{
    CAmount challengerShare = 0;
    CAmount insuranceShare = 0;
    BOOST_CHECK(SplitSlash(params, 101, challengerShare, insuranceShare));
    BOOST_CHECK_EQUAL(challengerShare, 50);
    BOOST_CHECK_EQUAL(insuranceShare, 51);
    BOOST_CHECK(SplitSlash(params, 0, challengerShare, insuranceShare));
    BOOST_CHECK_EQUAL(challengerShare + insuranceShare, 0);
}

BOOST_AUTO_TEST_SUITE_END()
