// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <bridge/bridge_common.h>

#include <util.h>

#include <limits>

namespace bridge {

std::string TxStatusToString(TxStatus status)
{
    switch (status) {
        case TxStatus::PENDING: return "PENDING";
        case TxStatus::COMPLETED: return "COMPLETED";
        case TxStatus::FAILED: return "FAILED";
        case TxStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

std::string ChallengeStatusToString(ChallengeStatus status)
{
    switch (status) {
        case ChallengeStatus::OPEN: return "OPEN";
        case ChallengeStatus::SUCCEEDED: return "SUCCEEDED";
        case ChallengeStatus::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

std::string AttestationModeToString(AttestationMode mode)
{
    switch (mode) {
        case AttestationMode::DIRECT_SIGNATURE: return "direct";
        case AttestationMode::COMMIT_REVEAL: return "commitreveal";
    }
    return "unknown";
}

std::string BridgeErrorToString(BridgeError error)
{
    switch (error) {
        case BridgeError::NONE: return "None";
        case BridgeError::INVALID_ADDRESS: return "Invalid address";
        case BridgeError::INVALID_AMOUNT: return "Invalid amount";
        case BridgeError::AMOUNT_OUT_OF_BOUNDS: return "Amount outside configured bounds";
        case BridgeError::UNSUPPORTED_CHAIN: return "Unsupported chain";
        case BridgeError::INVALID_SIGNATURE: return "Invalid signature";
        case BridgeError::COMMITMENT_MISMATCH: return "Revealed secret does not match commitment";
        case BridgeError::INVALID_PARAMETER: return "Invalid parameter";
        case BridgeError::NOT_OWNER: return "Caller is not the owner";
        case BridgeError::NOT_ELIGIBLE_VALIDATOR: return "Caller is not an eligible validator";
        case BridgeError::NOT_TRANSACTION_OWNER: return "Caller did not initiate the transaction";
        case BridgeError::INSUFFICIENT_VOTING_POWER: return "Insufficient voting power";
        case BridgeError::ALREADY_REGISTERED: return "Validator already registered";
        case BridgeError::NOT_REGISTERED: return "Validator not registered";
        case BridgeError::CAPACITY_EXCEEDED: return "Active validator set is full";
        case BridgeError::BELOW_QUORUM_THRESHOLD: return "Removal would drop below quorum minimum";
        case BridgeError::DUPLICATE_ATTESTATION: return "Duplicate attestation";
        case BridgeError::ATTESTATION_WINDOW_EXPIRED: return "Attestation window expired";
        case BridgeError::COMMITMENT_NOT_FOUND: return "Commitment not found";
        case BridgeError::REVEAL_WINDOW_EXPIRED: return "Reveal window expired";
        case BridgeError::UNSUPPORTED_OPERATION: return "Operation not supported by the attestation mode";
        case BridgeError::TX_NOT_FOUND: return "Transaction not found";
        case BridgeError::INVALID_STATE: return "Invalid state for operation";
        case BridgeError::TIMEOUT_NOT_ELAPSED: return "Timeout has not elapsed";
        case BridgeError::CHALLENGE_NOT_FOUND: return "Challenge not found";
        case BridgeError::CHALLENGE_ALREADY_OPEN: return "Attestation already under challenge";
        case BridgeError::ALREADY_RESOLVED: return "Challenge already resolved";
        case BridgeError::CHALLENGE_PERIOD_ACTIVE: return "Challenge period still active";
        case BridgeError::CHALLENGE_WINDOW_CLOSED: return "Challenge window closed";
        case BridgeError::VOTING_CLOSED: return "Voting closed";
        case BridgeError::NO_ATTESTATION_TO_CHALLENGE: return "Validator did not attest this transaction";
        case BridgeError::VALIDATOR_INACTIVE: return "Validator inactive";
        case BridgeError::ALREADY_VOTED: return "Already voted";
        case BridgeError::PAYMENT_INVALID: return "Payment could not be verified";
        case BridgeError::INSUFFICIENT_STAKE: return "Insufficient stake";
        case BridgeError::INSUFFICIENT_BALANCE: return "Insufficient balance";
        case BridgeError::INSUFFICIENT_FUND_BALANCE: return "Insufficient fund balance";
        case BridgeError::TOKEN_TRANSFER_FAILED: return "Token transfer failed";
        case BridgeError::VOLUME_LIMIT_EXCEEDED: return "Volume limit exceeded";
        case BridgeError::ARITHMETIC_OVERFLOW: return "Arithmetic overflow";
    }
    return "Unknown error";
}

ErrorCategory GetErrorCategory(BridgeError error)
{
    switch (error) {
        case BridgeError::NONE:
            return ErrorCategory::NONE;

        case BridgeError::INVALID_ADDRESS:
        case BridgeError::INVALID_AMOUNT:
        case BridgeError::AMOUNT_OUT_OF_BOUNDS:
        case BridgeError::UNSUPPORTED_CHAIN:
        case BridgeError::INVALID_SIGNATURE:
        case BridgeError::COMMITMENT_MISMATCH:
        case BridgeError::INVALID_PARAMETER:
            return ErrorCategory::VALIDATION;

        case BridgeError::NOT_OWNER:
        case BridgeError::NOT_ELIGIBLE_VALIDATOR:
        case BridgeError::NOT_TRANSACTION_OWNER:
        case BridgeError::INSUFFICIENT_VOTING_POWER:
            return ErrorCategory::AUTHORIZATION;

        case BridgeError::INSUFFICIENT_STAKE:
        case BridgeError::INSUFFICIENT_BALANCE:
        case BridgeError::INSUFFICIENT_FUND_BALANCE:
        case BridgeError::TOKEN_TRANSFER_FAILED:
        case BridgeError::VOLUME_LIMIT_EXCEEDED:
        case BridgeError::ARITHMETIC_OVERFLOW:
            return ErrorCategory::ECONOMIC;

        default:
            return ErrorCategory::STATE;
    }
}

bool IsRetryable(BridgeError error)
{
    switch (error) {
        case BridgeError::TIMEOUT_NOT_ELAPSED:
        case BridgeError::CHALLENGE_PERIOD_ACTIVE:
        case BridgeError::CHALLENGE_ALREADY_OPEN:
        case BridgeError::VOLUME_LIMIT_EXCEEDED:
        case BridgeError::INSUFFICIENT_BALANCE:
            return true;
        default:
            return false;
    }
}

std::string BridgeResult::ToString() const
{
    if (success) return "OK";
    return strprintf("%s (%s)", BridgeErrorToString(error), message);
}

bool CheckedAdd(CAmount a, CAmount b, CAmount& out)
{
    if (a < 0 || b < 0) return false;
    if (a > std::numeric_limits<CAmount>::max() - b) return false;
    out = a + b;
    return true;
}

bool CheckedSub(CAmount a, CAmount b, CAmount& out)
{
    if (b < 0 || a < b) return false;
    out = a - b;
    return true;
}

bool MulBps(CAmount amount, uint32_t bps, CAmount& out)
{
    if (amount < 0 || bps > BPS_DENOMINATOR) return false;
    // Split so amount * bps never exceeds int64: (q * d + r) * bps / d
    const CAmount q = amount / BPS_DENOMINATOR;
    const CAmount r = amount % BPS_DENOMINATOR;
    out = q * bps + (r * bps) / BPS_DENOMINATOR;
    return true;
}

} // namespace bridge
