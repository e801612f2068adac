// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUORUM_BRIDGE_BRIDGE_COMMON_H
#define QUORUM_BRIDGE_BRIDGE_COMMON_H

/**
 * @file bridge_common.h
 * @brief Shared types for the bridge core
 *
 * Status enums, the error taxonomy returned by every bridge entry point,
 * and the checked integer helpers used by fee, slash and refund math.
 */

#include <amount.h>
#include <uint256.h>

#include <cstdint>
#include <ostream>
#include <string>

namespace bridge {

/** Account identifier: Hash160 of a secp256k1 public key */
typedef uint160 Address;

/** Chain identifier (EIP-155 style numeric id) */
typedef uint32_t ChainId;

/** Basis point denominator (100% = 10000 bps) */
static constexpr uint32_t BPS_DENOMINATOR = 10000;

// ============================================================================
// Status Enums
// ============================================================================

/** Bridge transaction lifecycle. Transitions only leave PENDING. */
enum class TxStatus : uint8_t {
    PENDING = 0,
    COMPLETED = 1,
    FAILED = 2,
    CANCELLED = 3
};

/** Trust status, flipped to DISPUTED by a successful challenge */
enum class TrustStatus : uint8_t {
    TRUSTED = 0,
    DISPUTED = 1
};

enum class ChallengeStatus : uint8_t {
    OPEN = 0,
    SUCCEEDED = 1,      // Validator slashed
    FAILED = 2          // Challenger stake returned
};

/** How a challenge was resolved */
enum class ResolutionPath : uint8_t {
    NONE = 0,
    ARBITRATOR = 1,
    COMMUNITY_VOTE = 2
};

enum class AttestationMode : uint8_t {
    DIRECT_SIGNATURE = 0,
    COMMIT_REVEAL = 1
};

std::string TxStatusToString(TxStatus status);
std::string ChallengeStatusToString(ChallengeStatus status);
std::string AttestationModeToString(AttestationMode mode);

inline std::ostream& operator<<(std::ostream& os, TxStatus status) {
    return os << TxStatusToString(status);
}

inline std::ostream& operator<<(std::ostream& os, TrustStatus status) {
    return os << (status == TrustStatus::TRUSTED ? "TRUSTED" : "DISPUTED");
}

inline std::ostream& operator<<(std::ostream& os, ChallengeStatus status) {
    return os << ChallengeStatusToString(status);
}

inline std::ostream& operator<<(std::ostream& os, AttestationMode mode) {
    return os << AttestationModeToString(mode);
}

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief Error codes returned by bridge operations
 *
 * Grouped by category; see GetErrorCategory().
 */
enum class BridgeError {
    NONE = 0,

    // Validation errors (malformed input)
    INVALID_ADDRESS,
    INVALID_AMOUNT,
    AMOUNT_OUT_OF_BOUNDS,
    UNSUPPORTED_CHAIN,
    INVALID_SIGNATURE,
    COMMITMENT_MISMATCH,
    INVALID_PARAMETER,

    // Authorization errors
    NOT_OWNER,
    NOT_ELIGIBLE_VALIDATOR,
    NOT_TRANSACTION_OWNER,
    INSUFFICIENT_VOTING_POWER,

    // State errors
    ALREADY_REGISTERED,
    NOT_REGISTERED,
    CAPACITY_EXCEEDED,
    BELOW_QUORUM_THRESHOLD,
    DUPLICATE_ATTESTATION,
    ATTESTATION_WINDOW_EXPIRED,
    COMMITMENT_NOT_FOUND,
    REVEAL_WINDOW_EXPIRED,
    UNSUPPORTED_OPERATION,
    TX_NOT_FOUND,
    INVALID_STATE,
    TIMEOUT_NOT_ELAPSED,
    CHALLENGE_NOT_FOUND,
    CHALLENGE_ALREADY_OPEN,
    ALREADY_RESOLVED,
    CHALLENGE_PERIOD_ACTIVE,
    CHALLENGE_WINDOW_CLOSED,
    VOTING_CLOSED,
    NO_ATTESTATION_TO_CHALLENGE,
    VALIDATOR_INACTIVE,
    ALREADY_VOTED,
    PAYMENT_INVALID,

    // Economic errors
    INSUFFICIENT_STAKE,
    INSUFFICIENT_BALANCE,
    INSUFFICIENT_FUND_BALANCE,
    TOKEN_TRANSFER_FAILED,
    VOLUME_LIMIT_EXCEEDED,
    ARITHMETIC_OVERFLOW
};

enum class ErrorCategory {
    NONE,
    VALIDATION,
    AUTHORIZATION,
    STATE,
    ECONOMIC
};

std::string BridgeErrorToString(BridgeError error);
ErrorCategory GetErrorCategory(BridgeError error);

/**
 * Whether a rejected call may succeed later without any change by the
 * caller (a timeout or window that has not opened yet, a volume limit
 * that resets at the next epoch).
 */
bool IsRetryable(BridgeError error);

inline std::ostream& operator<<(std::ostream& os, BridgeError error) {
    return os << BridgeErrorToString(error);
}

/**
 * @brief Outcome of a bridge entry point
 *
 * A failed result guarantees that no state was modified.
 */
struct BridgeResult {
    bool success = false;
    BridgeError error = BridgeError::NONE;
    std::string message;

    static BridgeResult Ok() {
        BridgeResult result;
        result.success = true;
        return result;
    }

    static BridgeResult Fail(BridgeError err, const std::string& msg = "") {
        BridgeResult result;
        result.success = false;
        result.error = err;
        result.message = msg.empty() ? BridgeErrorToString(err) : msg;
        return result;
    }

    explicit operator bool() const { return success; }

    std::string ToString() const;
};

// ============================================================================
// Checked Arithmetic
// ============================================================================

/** a + b, false on overflow or if either operand is negative */
bool CheckedAdd(CAmount a, CAmount b, CAmount& out);

/** a - b, false if the result would be negative */
bool CheckedSub(CAmount a, CAmount b, CAmount& out);

/**
 * amount * bps / 10000 with the intermediate product kept in range.
 * Truncates toward zero. Returns false for negative input or bps > 10000.
 */
bool MulBps(CAmount amount, uint32_t bps, CAmount& out);

} // namespace bridge

#endif // QUORUM_BRIDGE_BRIDGE_COMMON_H
