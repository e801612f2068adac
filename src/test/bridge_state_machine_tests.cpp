// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file bridge_state_machine_tests.cpp
 * @brief Transfer lifecycle: lock, complete, fail, cancel and fees
 */

#include <bridge/bridge_node.h>
#include <bridge/bridge_state_machine.h>
#include <test/test_quorum.h>

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

using namespace bridge;

namespace {

const CAmount STAKE = 1000 * COIN;

/** Fee charged by the default destination chain */
CAmount DefaultFee(CAmount amount)
{
    return 1 * COIN + amount * 10 / BPS_DENOMINATOR;
}

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(bridge_state_machine_tests, BridgeTestingSetup)

// ============================================================================
// Initiation
// ============================================================================

BOOST_AUTO_TEST_CASE(initiate_locks_principal_and_fee)
{
    const Address& user = users[0];
    std::vector<uint64_t> initiated;
    boost::signals2::scoped_connection conn = node->Signals().TransferInitiated.connect(
        [&initiated](uint64_t nonce, const Address&, CAmount, ChainId, CAmount) { initiated.push_back(nonce); });

    BOOST_CHECK_EQUAL(StateMachine().GetNextNonce(), 1U);
    const uint64_t nonce = InitiateTransfer(user, 1000 * COIN, TEST_T0);
    BOOST_CHECK_EQUAL(nonce, 1U);
    BOOST_CHECK_EQUAL(StateMachine().GetNextNonce(), 2U);
    BOOST_REQUIRE_EQUAL(initiated.size(), 1U);
    BOOST_CHECK_EQUAL(initiated[0], nonce);

    std::optional<BridgeTransaction> tx = StateMachine().GetTransaction(nonce);
    BOOST_REQUIRE(tx);
    BOOST_CHECK(tx->status == TxStatus::PENDING);
    BOOST_CHECK(tx->trustStatus == TrustStatus::TRUSTED);
    BOOST_CHECK(tx->user == user);
    BOOST_CHECK_EQUAL(tx->amount, 1000 * COIN);
    BOOST_CHECK_EQUAL(tx->fee, DefaultFee(1000 * COIN));
    BOOST_CHECK_EQUAL(tx->sourceChain, params.sourceChainId);
    BOOST_CHECK_EQUAL(tx->destChain, 2U);
    BOOST_CHECK_EQUAL(tx->createdAt, TEST_T0);

    BOOST_CHECK_EQUAL(ledger->BalanceOf(user), 0);
    BOOST_CHECK_EQUAL(ledger->BalanceOf(custody), 1000 * COIN + DefaultFee(1000 * COIN));

    // Nonces are never reused
    BOOST_CHECK_EQUAL(InitiateTransfer(user, 5 * COIN, TEST_T0), 2U);
    BOOST_CHECK_EQUAL(StateMachine().GetUserTransactions(user).size(), 2U);
    BOOST_CHECK_EQUAL(StateMachine().GetPending().size(), 2U);
    BOOST_CHECK(StateMachine().GetUserTransactions(users[1]).empty());
}

BOOST_AUTO_TEST_CASE(initiate_rejections_leave_no_trace)
{
    const Address& user = users[0];
    BOOST_REQUIRE(ledger->Mint(user, 1000 * COIN));
    uint64_t nonce = 0;

    BOOST_CHECK_EQUAL(StateMachine().Initiate(user, 10 * COIN, 99, TEST_T0, nonce).error, BridgeError::UNSUPPORTED_CHAIN);
    BOOST_CHECK_EQUAL(StateMachine().Initiate(user, 10 * COIN, params.sourceChainId, TEST_T0, nonce).error,
                      BridgeError::UNSUPPORTED_CHAIN);
    BOOST_CHECK_EQUAL(StateMachine().Initiate(user, 0, 2, TEST_T0, nonce).error, BridgeError::INVALID_AMOUNT);
    BOOST_CHECK_EQUAL(StateMachine().Initiate(user, -5, 2, TEST_T0, nonce).error, BridgeError::INVALID_AMOUNT);
    BOOST_CHECK_EQUAL(StateMachine().Initiate(user, COIN - 1, 2, TEST_T0, nonce).error, BridgeError::AMOUNT_OUT_OF_BOUNDS);
    BOOST_CHECK_EQUAL(StateMachine().Initiate(user, 100000 * COIN + 1, 2, TEST_T0, nonce).error,
                      BridgeError::AMOUNT_OUT_OF_BOUNDS);
    BOOST_CHECK_EQUAL(StateMachine().Initiate(custody, 10 * COIN, 2, TEST_T0, nonce).error, BridgeError::INVALID_ADDRESS);
    BOOST_CHECK_EQUAL(StateMachine().Initiate(Address(), 10 * COIN, 2, TEST_T0, nonce).error, BridgeError::INVALID_ADDRESS);

    // Principal fits the balance but principal plus fee does not
    BOOST_CHECK_EQUAL(StateMachine().Initiate(user, 1000 * COIN, 2, TEST_T0, nonce).error,
                      BridgeError::INSUFFICIENT_BALANCE);

    ledger->FailNextTransfers(1);
    BOOST_CHECK_EQUAL(StateMachine().Initiate(user, 10 * COIN, 2, TEST_T0, nonce).error,
                      BridgeError::TOKEN_TRANSFER_FAILED);

    BOOST_CHECK(StateMachine().GetTransactions().empty());
    BOOST_CHECK_EQUAL(StateMachine().GetNextNonce(), 1U);
    BOOST_CHECK_EQUAL(StateMachine().GetVolumeLimiter().GetUserVolume(user, TEST_T0), 0);
    BOOST_CHECK_EQUAL(ledger->BalanceOf(user), 1000 * COIN);
    BOOST_CHECK_EQUAL(ledger->BalanceOf(custody), 0);
}

BOOST_AUTO_TEST_CASE(volume_limits_apply_to_initiation)
{
    params.userDailyLimit = 150 * COIN;
    params.globalDailyLimit = 200 * COIN;
    ResetNode();

    InitiateTransfer(users[0], 100 * COIN, TEST_T0);

    CAmount fee = 0;
    BOOST_REQUIRE(StateMachine().QuoteFee(60 * COIN, 2, fee));
    BOOST_REQUIRE(ledger->Mint(users[0], 60 * COIN + fee));
    uint64_t nonce = 0;
    BridgeResult result = StateMachine().Initiate(users[0], 60 * COIN, 2, TEST_T0 + 10, nonce);
    BOOST_CHECK_EQUAL(result.error, BridgeError::VOLUME_LIMIT_EXCEEDED);
    BOOST_CHECK(IsRetryable(result.error));

    InitiateTransfer(users[1], 100 * COIN, TEST_T0 + 20);
    BOOST_REQUIRE(ledger->Mint(users[2], 10 * COIN + fee));
    BOOST_CHECK_EQUAL(StateMachine().Initiate(users[2], 10 * COIN, 2, TEST_T0 + 30, nonce).error,
                      BridgeError::VOLUME_LIMIT_EXCEEDED);

    // Counters reset with the next epoch
    const uint64_t tomorrow = StateMachine().GetVolumeLimiter().GetNextReset(TEST_T0);
    BOOST_CHECK(StateMachine().Initiate(users[0], 60 * COIN, 2, tomorrow, nonce));
}

// ============================================================================
// Cancellation
// ============================================================================

BOOST_AUTO_TEST_CASE(cancel_after_timeout_refunds_everything)
{
    RegisterValidators(3, STAKE);
    const Address& user = users[0];
    const uint64_t nonce = InitiateTransfer(user, 1000 * COIN, TEST_T0);
    const CAmount locked = 1000 * COIN + DefaultFee(1000 * COIN);
    const uint64_t timeout = TEST_T0 + params.transactionTimeout;

    BOOST_CHECK_EQUAL(StateMachine().Cancel(user, nonce, timeout - 1).error, BridgeError::TIMEOUT_NOT_ELAPSED);
    BOOST_CHECK_EQUAL(StateMachine().Cancel(users[1], nonce, timeout).error, BridgeError::NOT_TRANSACTION_OWNER);
    BOOST_CHECK_EQUAL(StateMachine().Cancel(user, nonce + 1, timeout).error, BridgeError::TX_NOT_FOUND);

    ledger->FailNextTransfers(1);
    BOOST_CHECK_EQUAL(StateMachine().Cancel(user, nonce, timeout).error, BridgeError::TOKEN_TRANSFER_FAILED);
    BOOST_CHECK(StateMachine().GetTransaction(nonce)->IsPending());

    BOOST_REQUIRE(StateMachine().Cancel(user, nonce, timeout));
    BOOST_CHECK(StateMachine().GetTransaction(nonce)->status == TxStatus::CANCELLED);
    BOOST_CHECK_EQUAL(ledger->BalanceOf(user), locked);
    BOOST_CHECK_EQUAL(ledger->BalanceOf(custody), 3 * STAKE);

    // Terminal: no further transitions
    BOOST_CHECK_EQUAL(AttestTransfer(0, nonce, timeout).error, BridgeError::INVALID_STATE);
    BOOST_CHECK_EQUAL(StateMachine().Cancel(user, nonce, timeout).error, BridgeError::INVALID_STATE);
    BOOST_CHECK_EQUAL(StateMachine().VoteFail(validators[0], nonce, "late", timeout).error, BridgeError::INVALID_STATE);
    BOOST_CHECK_EQUAL(StateMachine().GetFeePool(), 0);
}

// ============================================================================
// Failure by validator vote
// ============================================================================

BOOST_AUTO_TEST_CASE(fail_requires_threshold_of_votes)
{
    RegisterValidators(3, STAKE);
    const Address& user = users[0];
    const uint64_t nonce = InitiateTransfer(user, 100 * COIN, TEST_T0);

    std::string failReason;
    boost::signals2::scoped_connection conn = node->Signals().TransferFailed.connect(
        [&failReason](uint64_t, const Address&, const std::string& reason) { failReason = reason; });

    BOOST_CHECK_EQUAL(StateMachine().VoteFail(validators[3], nonce, "bad", TEST_T0).error,
                      BridgeError::NOT_ELIGIBLE_VALIDATOR);

    BOOST_REQUIRE(StateMachine().VoteFail(validators[0], nonce, "not observed", TEST_T0 + 1));
    BOOST_CHECK(StateMachine().GetTransaction(nonce)->IsPending());
    BOOST_CHECK_EQUAL(StateMachine().VoteFail(validators[0], nonce, "again", TEST_T0 + 2).error,
                      BridgeError::DUPLICATE_ATTESTATION);
    BOOST_CHECK_EQUAL(AttestTransfer(0, nonce, TEST_T0 + 2).error, BridgeError::DUPLICATE_ATTESTATION);

    // An attester cannot also vote to fail
    BOOST_REQUIRE(AttestTransfer(2, nonce, TEST_T0 + 3));
    BOOST_CHECK_EQUAL(StateMachine().VoteFail(validators[2], nonce, "flip", TEST_T0 + 4).error,
                      BridgeError::DUPLICATE_ATTESTATION);

    // Refund failure on the deciding vote changes nothing
    ledger->FailNextTransfers(1);
    BOOST_CHECK_EQUAL(StateMachine().VoteFail(validators[1], nonce, "not observed", TEST_T0 + 5).error,
                      BridgeError::TOKEN_TRANSFER_FAILED);
    BOOST_CHECK_EQUAL(Attestations().GetFailVoters(nonce).size(), 1U);
    BOOST_CHECK(StateMachine().GetTransaction(nonce)->IsPending());

    BOOST_REQUIRE(StateMachine().VoteFail(validators[1], nonce, "not observed", TEST_T0 + 6));
    std::optional<BridgeTransaction> tx = StateMachine().GetTransaction(nonce);
    BOOST_CHECK(tx->status == TxStatus::FAILED);
    BOOST_CHECK_EQUAL(tx->failureReason, "not observed");
    BOOST_CHECK_EQUAL(failReason, "not observed");
    BOOST_CHECK_EQUAL(ledger->BalanceOf(user), 100 * COIN + DefaultFee(100 * COIN));
}

// ============================================================================
// Fees and accounting
// ============================================================================

BOOST_AUTO_TEST_CASE(completed_fees_can_be_withdrawn_by_owner)
{
    RegisterValidators(3, STAKE);
    const uint64_t nonce = InitiateTransfer(users[0], 1000 * COIN, TEST_T0);
    const CAmount fee = DefaultFee(1000 * COIN);
    BOOST_CHECK_EQUAL(StateMachine().GetFeePool(), 0);

    BOOST_REQUIRE(AttestTransfer(0, nonce, TEST_T0 + 1));
    BOOST_REQUIRE(AttestTransfer(1, nonce, TEST_T0 + 2));
    BOOST_CHECK_EQUAL(StateMachine().GetFeePool(), fee);

    const Address treasury = RandomTestAddress(rng);
    BOOST_CHECK_EQUAL(StateMachine().WithdrawFees(users[0], treasury, fee).error, BridgeError::NOT_OWNER);
    BOOST_CHECK_EQUAL(StateMachine().WithdrawFees(owner, Address(), fee).error, BridgeError::INVALID_ADDRESS);
    BOOST_CHECK_EQUAL(StateMachine().WithdrawFees(owner, treasury, 0).error, BridgeError::INVALID_AMOUNT);
    BOOST_CHECK_EQUAL(StateMachine().WithdrawFees(owner, treasury, fee + 1).error,
                      BridgeError::INSUFFICIENT_FUND_BALANCE);

    BOOST_REQUIRE(StateMachine().WithdrawFees(owner, treasury, fee / 2));
    BOOST_CHECK_EQUAL(ledger->BalanceOf(treasury), fee / 2);
    BOOST_CHECK_EQUAL(StateMachine().GetFeePool(), fee - fee / 2);
    BOOST_CHECK_EQUAL(StateMachine().GetFeesWithdrawn(), fee / 2);
}

BOOST_AUTO_TEST_CASE(principal_is_conserved)
{
    RegisterValidators(3, STAKE);
    const uint64_t completed = InitiateTransfer(users[0], 500 * COIN, TEST_T0);
    const uint64_t failed = InitiateTransfer(users[1], 200 * COIN, TEST_T0);
    const uint64_t cancelled = InitiateTransfer(users[2], 100 * COIN, TEST_T0);
    const uint64_t pending = InitiateTransfer(users[0], 50 * COIN, TEST_T0 + 100);

    BOOST_REQUIRE(AttestTransfer(0, completed, TEST_T0 + 600));
    BOOST_REQUIRE(AttestTransfer(1, completed, TEST_T0 + 600));
    BOOST_REQUIRE(StateMachine().VoteFail(validators[0], failed, "reorg", TEST_T0 + 700));
    BOOST_REQUIRE(StateMachine().VoteFail(validators[1], failed, "reorg", TEST_T0 + 700));
    BOOST_REQUIRE(StateMachine().Cancel(users[2], cancelled, TEST_T0 + params.transactionTimeout));

    BridgeStats stats = StateMachine().GetStats();
    BOOST_CHECK_EQUAL(stats.totalTransactions, 4U);
    BOOST_CHECK_EQUAL(stats.pendingCount, 1U);
    BOOST_CHECK_EQUAL(stats.completedCount, 1U);
    BOOST_CHECK_EQUAL(stats.failedCount, 1U);
    BOOST_CHECK_EQUAL(stats.cancelledCount, 1U);
    BOOST_CHECK_EQUAL(stats.totalLocked, 850 * COIN);
    BOOST_CHECK_EQUAL(stats.pendingPrincipal, 50 * COIN);
    BOOST_CHECK_EQUAL(stats.totalReleased, 500 * COIN);
    BOOST_CHECK_EQUAL(stats.totalRefunded, 300 * COIN);
    BOOST_CHECK_EQUAL(stats.totalLocked, stats.pendingPrincipal + stats.totalReleased + stats.totalRefunded);
    BOOST_CHECK_EQUAL(stats.totalFees, DefaultFee(500 * COIN));
    BOOST_CHECK_EQUAL(stats.feePool, DefaultFee(500 * COIN));
    BOOST_CHECK_EQUAL(stats.successRateBps, 3333U);
    BOOST_CHECK_EQUAL(stats.averageCompletionTime, 600U);
    BOOST_CHECK_EQUAL(stats.chains[2].transfers, 4U);

    // Custody holds stake, released principal, the pending transfer and collected fees
    const CAmount expected = 3 * STAKE + 500 * COIN + DefaultFee(500 * COIN) + 50 * COIN + DefaultFee(50 * COIN);
    BOOST_CHECK_EQUAL(ledger->BalanceOf(custody), expected);
    BOOST_CHECK(StateMachine().GetTransaction(pending)->IsPending());
}

BOOST_AUTO_TEST_CASE(mark_disputed_flags_trust_status)
{
    RegisterValidators(3, STAKE);
    const uint64_t nonce = InitiateTransfer(users[0], 10 * COIN, TEST_T0);

    uint64_t disputedBy = 0;
    boost::signals2::scoped_connection conn = node->Signals().TransferDisputed.connect(
        [&disputedBy](uint64_t, uint64_t challengeId) { disputedBy = challengeId; });

    BOOST_CHECK(StateMachine().MarkDisputed(nonce, 42));
    BOOST_CHECK(StateMachine().GetTransaction(nonce)->trustStatus == TrustStatus::DISPUTED);
    BOOST_CHECK(StateMachine().GetTransaction(nonce)->IsPending());
    BOOST_CHECK_EQUAL(disputedBy, 42U);
    BOOST_CHECK_EQUAL(StateMachine().GetStats().disputedCount, 1U);
    BOOST_CHECK_EQUAL(StateMachine().MarkDisputed(nonce + 1, 43).error, BridgeError::TX_NOT_FOUND);
}

BOOST_AUTO_TEST_CASE(proof_hash_ignores_attester_order)
{
    const uint256 message = rng.rand256();
    std::vector<Address> forward = {validators[0], validators[1], validators[2]};
    std::vector<Address> reverse = {validators[2], validators[1], validators[0]};
    BOOST_CHECK(ComputeProofHash(message, forward) == ComputeProofHash(message, reverse));
    forward.pop_back();
    BOOST_CHECK(ComputeProofHash(message, forward) != ComputeProofHash(message, reverse));
}

// ============================================================================
// Prepaid fees
// ============================================================================

BOOST_AUTO_TEST_CASE(prepaid_fee_locks_principal_only)
{
    RegisterValidators(3, STAKE);
    const Address& user = users[0];
    const CAmount amount = 200 * COIN;
    CAmount fee = 0;
    BOOST_REQUIRE(StateMachine().QuoteFee(amount, 2, fee));

    std::optional<uint256> paymentId = payments.ProcessPayment(GetPrepaidFeeResource(user, amount, 2), fee);
    BOOST_REQUIRE(paymentId);
    BOOST_CHECK_EQUAL(payments.GetPaymentAmount(*paymentId), fee);

    BOOST_REQUIRE(ledger->Mint(user, 2 * amount));
    uint64_t nonce = 0;

    // Payment for a different transfer
    std::optional<uint256> otherPayment = payments.ProcessPayment(GetPrepaidFeeResource(user, amount, 3), fee);
    BOOST_REQUIRE(otherPayment);
    BOOST_CHECK_EQUAL(StateMachine().InitiatePrepaid(user, amount, 2, *otherPayment, TEST_T0, nonce).error,
                      BridgeError::PAYMENT_INVALID);
    BOOST_CHECK_EQUAL(StateMachine().InitiatePrepaid(user, amount, 2, uint256(), TEST_T0, nonce).error,
                      BridgeError::PAYMENT_INVALID);

    BOOST_REQUIRE(StateMachine().InitiatePrepaid(user, amount, 2, *paymentId, TEST_T0, nonce));
    BOOST_CHECK_EQUAL(ledger->BalanceOf(user), amount);
    std::optional<BridgeTransaction> tx = StateMachine().GetTransaction(nonce);
    BOOST_REQUIRE(tx);
    BOOST_CHECK(tx->feePrepaid);
    BOOST_CHECK_EQUAL(tx->fee, fee);
    BOOST_CHECK_EQUAL(tx->GetRefund(), amount);

    // A payment settles exactly one transfer
    uint64_t again = 0;
    BOOST_CHECK_EQUAL(StateMachine().InitiatePrepaid(user, amount, 2, *paymentId, TEST_T0, again).error,
                      BridgeError::PAYMENT_INVALID);

    BOOST_REQUIRE(StateMachine().Cancel(user, nonce, TEST_T0 + params.transactionTimeout));
    BOOST_CHECK_EQUAL(ledger->BalanceOf(user), 2 * amount);
    BOOST_CHECK_EQUAL(StateMachine().GetFeePool(), 0);
}

BOOST_AUTO_TEST_CASE(prepaid_requires_payment_handler)
{
    BridgeNode bare(params, *ledger);
    BOOST_REQUIRE(ledger->Mint(users[0], 100 * COIN));
    uint64_t nonce = 0;
    BOOST_CHECK_EQUAL(bare.StateMachine().InitiatePrepaid(users[0], 10 * COIN, 2, rng.rand256(), TEST_T0, nonce).error,
                      BridgeError::UNSUPPORTED_OPERATION);
}

// ============================================================================
// Health
// ============================================================================

BOOST_AUTO_TEST_CASE(stuck_transfers_are_pending_past_timeout)
{
    RegisterValidators(3, STAKE);
    const uint64_t first = InitiateTransfer(users[0], 10 * COIN, TEST_T0);
    const uint64_t second = InitiateTransfer(users[1], 10 * COIN, TEST_T0 + 100);
    const uint64_t done = InitiateTransfer(users[2], 10 * COIN, TEST_T0 + 200);
    BOOST_REQUIRE(AttestTransfer(0, done, TEST_T0 + 200));
    BOOST_REQUIRE(AttestTransfer(1, done, TEST_T0 + 200));

    const uint64_t timeout = params.transactionTimeout;
    BOOST_CHECK(StateMachine().GetStuckTransactions(TEST_T0 + timeout - 1).empty());

    std::vector<BridgeTransaction> stuck = StateMachine().GetStuckTransactions(TEST_T0 + timeout);
    BOOST_REQUIRE_EQUAL(stuck.size(), 1U);
    BOOST_CHECK_EQUAL(stuck[0].nonce, first);

    // Completed transfers never count
    stuck = StateMachine().GetStuckTransactions(TEST_T0 + 200 + timeout);
    BOOST_REQUIRE_EQUAL(stuck.size(), 2U);
    BOOST_CHECK_EQUAL(stuck[0].nonce, first);
    BOOST_CHECK_EQUAL(stuck[1].nonce, second);

    BridgeHealth health = StateMachine().GetHealth(TEST_T0 + 200 + timeout);
    BOOST_CHECK(!health.healthy);
    BOOST_CHECK_EQUAL(health.stuckCount, 2U);
    BOOST_CHECK_EQUAL(health.issues.size(), 1U);
    BOOST_CHECK_EQUAL(health.activeValidators, 3U);
    BOOST_CHECK_EQUAL(health.eligibleValidators, 3U);

    BOOST_REQUIRE(StateMachine().Cancel(users[0], first, TEST_T0 + timeout));
    BOOST_REQUIRE(StateMachine().Cancel(users[1], second, TEST_T0 + 100 + timeout));
    BOOST_CHECK(StateMachine().GetStuckTransactions(TEST_T0 + 200 + timeout).empty());
    BOOST_CHECK(StateMachine().GetHealth(TEST_T0 + 200 + timeout).healthy);
}

BOOST_AUTO_TEST_CASE(health_tracks_validators_and_chains)
{
    BridgeHealth health = StateMachine().GetHealth(TEST_T0);
    BOOST_CHECK(!health.healthy);
    BOOST_CHECK_EQUAL(health.eligibleValidators, 0U);
    BOOST_CHECK_EQUAL(health.threshold, params.validatorThreshold);
    BOOST_REQUIRE_EQUAL(health.issues.size(), 1U);
    BOOST_REQUIRE_EQUAL(health.chainStatus.count(2), 1U);
    BOOST_CHECK(health.chainStatus[2]);

    RegisterValidators(2, STAKE);
    health = StateMachine().GetHealth(TEST_T0);
    BOOST_CHECK(health.healthy);
    BOOST_CHECK(health.issues.empty());
    BOOST_CHECK_EQUAL(health.eligibleValidators, 2U);

    params.chains[2].isActive = false;
    ResetNode();
    RegisterValidators(2, STAKE);
    health = StateMachine().GetHealth(TEST_T0);
    BOOST_CHECK(!health.healthy);
    BOOST_REQUIRE_EQUAL(health.issues.size(), 1U);
    BOOST_CHECK(!health.chainStatus[2]);
}

BOOST_AUTO_TEST_SUITE_END()
