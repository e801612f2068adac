// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file validator_registry_tests.cpp
 * @brief Registration, removal, stake escrow and reputation of validators
 */

#include <bridge/validator_registry.h>
#include <test/test_quorum.h>

#include <boost/test/unit_test.hpp>

#include <vector>

using namespace bridge;

namespace {

const CAmount STAKE = 1000 * COIN;

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(validator_registry_tests, BridgeTestingSetup)

// ============================================================================
// Registration
// ============================================================================

BOOST_AUTO_TEST_CASE(add_validator_escrows_stake)
{
    const Address& v = validators[0];
    BOOST_REQUIRE(ledger->Mint(v, STAKE));

    size_t added = 0;
    boost::signals2::scoped_connection conn = node->Signals().ValidatorAdded.connect(
        [&added](const Address&, CAmount) { ++added; });

    BridgeResult result = Registry().AddValidator(owner, v, STAKE, TEST_T0);
    BOOST_REQUIRE_MESSAGE(result, result.ToString());
    BOOST_CHECK_EQUAL(added, 1U);

    BOOST_CHECK_EQUAL(ledger->BalanceOf(v), 0);
    BOOST_CHECK_EQUAL(ledger->BalanceOf(custody), STAKE);

    std::optional<ValidatorInfo> info = Registry().GetValidator(v);
    BOOST_REQUIRE(info);
    BOOST_CHECK(info->isActive);
    BOOST_CHECK_EQUAL(info->stake, STAKE);
    BOOST_CHECK_EQUAL(info->reputation, INITIAL_REPUTATION);
    BOOST_CHECK_EQUAL(info->registeredAt, TEST_T0);
    BOOST_CHECK_EQUAL(info->slashCount, 0U);
    BOOST_CHECK(Registry().IsEligible(v, TEST_T0));
    BOOST_CHECK_EQUAL(Registry().ActiveCount(), 1U);
    BOOST_CHECK_EQUAL(Registry().GetTotalStake(), STAKE);
}

BOOST_AUTO_TEST_CASE(add_validator_rejections)
{
    const Address& v = validators[0];
    BOOST_REQUIRE(ledger->Mint(v, 2 * STAKE));

    BOOST_CHECK_EQUAL(Registry().AddValidator(v, v, STAKE, TEST_T0).error, BridgeError::NOT_OWNER);
    BOOST_CHECK_EQUAL(Registry().AddValidator(owner, custody, STAKE, TEST_T0).error, BridgeError::INVALID_ADDRESS);
    BOOST_CHECK_EQUAL(Registry().AddValidator(owner, Address(), STAKE, TEST_T0).error, BridgeError::INVALID_ADDRESS);
    BOOST_CHECK_EQUAL(Registry().AddValidator(owner, v, STAKE - 1, TEST_T0).error, BridgeError::INSUFFICIENT_STAKE);
    BOOST_CHECK_EQUAL(Registry().AddValidator(owner, v, -1, TEST_T0).error, BridgeError::INVALID_AMOUNT);
    BOOST_CHECK_EQUAL(Registry().AddValidator(owner, validators[1], STAKE, TEST_T0).error, BridgeError::INSUFFICIENT_BALANCE);

    BOOST_CHECK(Registry().AddValidator(owner, v, STAKE, TEST_T0));
    BOOST_CHECK_EQUAL(Registry().AddValidator(owner, v, STAKE, TEST_T0).error, BridgeError::ALREADY_REGISTERED);

    // None of the rejections moved tokens
    BOOST_CHECK_EQUAL(ledger->BalanceOf(v), STAKE);
    BOOST_CHECK_EQUAL(ledger->BalanceOf(custody), STAKE);
}

BOOST_AUTO_TEST_CASE(add_validator_transfer_failure_leaves_no_trace)
{
    const Address& v = validators[0];
    BOOST_REQUIRE(ledger->Mint(v, STAKE));
    ledger->FailNextTransfers(1);

    BOOST_CHECK_EQUAL(Registry().AddValidator(owner, v, STAKE, TEST_T0).error, BridgeError::TOKEN_TRANSFER_FAILED);
    BOOST_CHECK(!Registry().GetValidator(v));
    BOOST_CHECK_EQUAL(Registry().ActiveCount(), 0U);
    BOOST_CHECK_EQUAL(ledger->BalanceOf(v), STAKE);
}

BOOST_AUTO_TEST_CASE(active_set_is_capped)
{
    std::vector<Address> addrs;
    for (uint32_t i = 0; i <= MAX_ACTIVE_VALIDATORS; ++i) {
        addrs.push_back(RandomTestAddress(rng));
        BOOST_REQUIRE(ledger->Mint(addrs.back(), STAKE));
    }
    for (uint32_t i = 0; i < MAX_ACTIVE_VALIDATORS; ++i) {
        BOOST_REQUIRE(Registry().AddValidator(owner, addrs[i], STAKE, TEST_T0));
    }
    BOOST_CHECK_EQUAL(Registry().ActiveCount(), static_cast<size_t>(MAX_ACTIVE_VALIDATORS));
    BOOST_CHECK_EQUAL(Registry().AddValidator(owner, addrs.back(), STAKE, TEST_T0).error,
                      BridgeError::CAPACITY_EXCEEDED);
}

// ============================================================================
// Removal
// ============================================================================

BOOST_AUTO_TEST_CASE(remove_validator_respects_quorum_minimum)
{
    RegisterValidators(3, STAKE);

    BOOST_CHECK_EQUAL(Registry().RemoveValidator(validators[0], validators[0], "quit", TEST_T0).error,
                      BridgeError::NOT_OWNER);

    BridgeResult result = Registry().RemoveValidator(owner, validators[0], "rotation", TEST_T0 + 10);
    BOOST_REQUIRE_MESSAGE(result, result.ToString());
    BOOST_CHECK_EQUAL(ledger->BalanceOf(validators[0]), STAKE);
    BOOST_CHECK_EQUAL(Registry().ActiveCount(), 2U);
    for (const ValidatorInfo& active : Registry().GetActiveValidators()) {
        BOOST_CHECK(active.address != validators[0]);
    }
    BOOST_CHECK_EQUAL(Registry().GetActiveValidators().size(), 2U);

    // Entry is kept for history
    std::optional<ValidatorInfo> info = Registry().GetValidator(validators[0]);
    BOOST_REQUIRE(info);
    BOOST_CHECK(!info->isActive);
    BOOST_CHECK_EQUAL(info->stake, 0);
    BOOST_CHECK_EQUAL(info->deactivationReason, "rotation");
    BOOST_CHECK_EQUAL(info->deactivatedAt, TEST_T0 + 10);
    BOOST_CHECK(!Registry().IsEligible(validators[0], TEST_T0 + 10));

    BOOST_CHECK_EQUAL(Registry().RemoveValidator(owner, validators[0], "again", TEST_T0).error,
                      BridgeError::NOT_REGISTERED);
    BOOST_CHECK_EQUAL(Registry().RemoveValidator(owner, validators[1], "too many", TEST_T0).error,
                      BridgeError::BELOW_QUORUM_THRESHOLD);
    BOOST_CHECK(Registry().IsActive(validators[1]));
}

BOOST_AUTO_TEST_CASE(reregistration_keeps_history)
{
    RegisterValidators(3, STAKE);
    BOOST_REQUIRE(Registry().UpdateReputation(validators[0], 100, TEST_T0));
    BOOST_REQUIRE(Registry().RemoveValidator(owner, validators[0], "maintenance", TEST_T0));

    BOOST_REQUIRE(Registry().AddValidator(owner, validators[0], STAKE, TEST_T0 + 100));
    std::optional<ValidatorInfo> info = Registry().GetValidator(validators[0]);
    BOOST_REQUIRE(info);
    BOOST_CHECK(info->isActive);
    BOOST_CHECK_EQUAL(info->reputation, INITIAL_REPUTATION + 100);
    BOOST_CHECK_EQUAL(info->registeredAt, TEST_T0);
    BOOST_CHECK(info->deactivationReason.empty());
    BOOST_CHECK_EQUAL(Registry().ActiveCount(), 3U);
}

// ============================================================================
// Reputation
// ============================================================================

BOOST_AUTO_TEST_CASE(reputation_decay_is_linear_per_whole_day)
{
    BOOST_CHECK_EQUAL(ComputeDecayedReputation(500, TEST_T0, TEST_T0, 1), 500U);
    BOOST_CHECK_EQUAL(ComputeDecayedReputation(500, TEST_T0, TEST_T0 + SECONDS_PER_DAY - 1, 1), 500U);
    BOOST_CHECK_EQUAL(ComputeDecayedReputation(500, TEST_T0, TEST_T0 + 3 * SECONDS_PER_DAY + 100, 1), 497U);
    BOOST_CHECK_EQUAL(ComputeDecayedReputation(500, TEST_T0, TEST_T0 + 10 * SECONDS_PER_DAY, 60), 0U);
    BOOST_CHECK_EQUAL(ComputeDecayedReputation(500, TEST_T0, TEST_T0 - 5, 60), 500U);
    BOOST_CHECK_EQUAL(ComputeDecayedReputation(500, TEST_T0, TEST_T0 + 100 * SECONDS_PER_DAY, 0), 500U);
}

BOOST_AUTO_TEST_CASE(inactivity_decay_removes_eligibility)
{
    params.reputationDecayPerDay = 100;
    ResetNode();
    RegisterValidators(2, STAKE);

    // 500 -> 200 after three days, still at the minimum
    BOOST_CHECK_EQUAL(Registry().GetEffectiveReputation(validators[0], TEST_T0 + 3 * SECONDS_PER_DAY), 200U);
    BOOST_CHECK(Registry().IsEligible(validators[0], TEST_T0 + 3 * SECONDS_PER_DAY));
    BOOST_CHECK(!Registry().IsEligible(validators[0], TEST_T0 + 4 * SECONDS_PER_DAY));

    // Activity folds decay and restarts the clock
    BOOST_REQUIRE(Registry().RecordAttestation(validators[1], TEST_T0 + 2 * SECONDS_PER_DAY + 500));
    std::optional<ValidatorInfo> info = Registry().GetValidator(validators[1]);
    BOOST_REQUIRE(info);
    BOOST_CHECK_EQUAL(info->reputation, 300U + params.attestationReputationGain);
    BOOST_CHECK_EQUAL(info->validatedTransactions, 1U);
    BOOST_CHECK_EQUAL(info->lastActivityTime, TEST_T0 + 2 * SECONDS_PER_DAY + 500);
    BOOST_CHECK(Registry().IsEligible(validators[1], TEST_T0 + 4 * SECONDS_PER_DAY));
}

BOOST_AUTO_TEST_CASE(reputation_is_clamped)
{
    RegisterValidators(1, STAKE);
    BOOST_CHECK(Registry().UpdateReputation(validators[0], 5000, TEST_T0));
    BOOST_CHECK_EQUAL(Registry().GetEffectiveReputation(validators[0], TEST_T0), MAX_REPUTATION);
    BOOST_CHECK(Registry().UpdateReputation(validators[0], -5000, TEST_T0));
    BOOST_CHECK_EQUAL(Registry().GetEffectiveReputation(validators[0], TEST_T0), 0U);
    BOOST_CHECK(!Registry().IsEligible(validators[0], TEST_T0));
    BOOST_CHECK(!Registry().UpdateReputation(validators[1], 1, TEST_T0));
}

// ============================================================================
// Stake reservation and slashing
// ============================================================================

BOOST_AUTO_TEST_CASE(lock_and_release_stake)
{
    RegisterValidators(1, STAKE);
    BOOST_CHECK(Registry().LockStake(validators[0], 600 * COIN));
    BOOST_CHECK_EQUAL(Registry().LockStake(validators[0], 600 * COIN).error, BridgeError::INSUFFICIENT_STAKE);
    BOOST_CHECK_EQUAL(Registry().GetValidator(validators[0])->AvailableStake(), 400 * COIN);

    BOOST_CHECK(Registry().ReleaseLockedStake(validators[0], 600 * COIN));
    BOOST_CHECK_EQUAL(Registry().GetValidator(validators[0])->lockedStake, 0);
    BOOST_CHECK(!Registry().ReleaseLockedStake(validators[1], 1));
}

BOOST_AUTO_TEST_CASE(slash_caps_at_stake_and_deactivates)
{
    RegisterValidators(3, STAKE);

    std::optional<SlashOutcome> outcome = Registry().Slash(validators[0], 0, 100 * COIN, TEST_T0);
    BOOST_REQUIRE(outcome);
    BOOST_CHECK_EQUAL(outcome->slashed, 100 * COIN);
    BOOST_CHECK(!outcome->deactivated);
    std::optional<ValidatorInfo> info = Registry().GetValidator(validators[0]);
    BOOST_CHECK_EQUAL(info->stake, 900 * COIN);
    BOOST_CHECK_EQUAL(info->reputation, INITIAL_REPUTATION - params.slashReputationPenalty);
    BOOST_CHECK_EQUAL(info->slashCount, 1U);

    // Requested slash larger than the stake degrades to the stake
    outcome = Registry().Slash(validators[0], 0, 5000 * COIN, TEST_T0);
    BOOST_REQUIRE(outcome);
    BOOST_CHECK_EQUAL(outcome->slashed, 900 * COIN);
    BOOST_CHECK_EQUAL(Registry().GetValidator(validators[0])->stake, 0);

    // Third slash reaches maxSlashCount
    outcome = Registry().Slash(validators[0], 0, 1, TEST_T0);
    BOOST_REQUIRE(outcome);
    BOOST_CHECK(outcome->deactivated);
    info = Registry().GetValidator(validators[0]);
    BOOST_CHECK(!info->isActive);
    BOOST_CHECK_EQUAL(info->deactivationReason, "automatic deactivation after slashing");
    BOOST_CHECK_EQUAL(Registry().ActiveCount(), 2U);

    // Slash limit also blocks re-registration
    BOOST_REQUIRE(ledger->Mint(validators[0], STAKE));
    BOOST_CHECK_EQUAL(Registry().AddValidator(owner, validators[0], STAKE, TEST_T0).error,
                      BridgeError::NOT_ELIGIBLE_VALIDATOR);

    BOOST_CHECK(!Registry().Slash(RandomTestAddress(rng), 0, 1, TEST_T0));
}

BOOST_AUTO_TEST_CASE(withdraw_stake_after_deactivation)
{
    RegisterValidators(3, STAKE);
    BOOST_CHECK_EQUAL(Registry().WithdrawStake(validators[0], TEST_T0).error, BridgeError::INVALID_STATE);
    BOOST_CHECK_EQUAL(Registry().WithdrawStake(users[0], TEST_T0).error, BridgeError::NOT_REGISTERED);

    // Reserve half, remove: only the free half comes back
    BOOST_REQUIRE(Registry().LockStake(validators[0], 500 * COIN));
    BOOST_REQUIRE(Registry().RemoveValidator(owner, validators[0], "exit", TEST_T0));
    BOOST_CHECK_EQUAL(ledger->BalanceOf(validators[0]), 500 * COIN);
    BOOST_CHECK_EQUAL(Registry().WithdrawStake(validators[0], TEST_T0).error, BridgeError::INSUFFICIENT_STAKE);

    // Reservation released: the rest can be withdrawn
    BOOST_REQUIRE(Registry().ReleaseLockedStake(validators[0], 500 * COIN));
    BOOST_CHECK(Registry().WithdrawStake(validators[0], TEST_T0));
    BOOST_CHECK_EQUAL(ledger->BalanceOf(validators[0]), STAKE);
    BOOST_CHECK_EQUAL(Registry().GetValidator(validators[0])->stake, 0);
}

BOOST_AUTO_TEST_SUITE_END()
