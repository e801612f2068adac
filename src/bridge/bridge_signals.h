// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUORUM_BRIDGE_BRIDGE_SIGNALS_H
#define QUORUM_BRIDGE_BRIDGE_SIGNALS_H

/**
 * @file bridge_signals.h
 * @brief Event hub for bridge state changes
 *
 * Components fire these after their lock is released. TransferCompleted
 * is the durable signal for downstream release on the destination chain
 * and fires exactly once per transaction.
 */

#include <bridge/bridge_common.h>
#include <uint256.h>

#include <boost/signals2/signal.hpp>

#include <string>

namespace bridge {

struct BridgeSignals {
    boost::signals2::signal<void (uint64_t nonce, const Address& user, CAmount amount, ChainId destChain, CAmount fee)> TransferInitiated;
    boost::signals2::signal<void (uint64_t nonce, const Address& validator, uint32_t count)> TransferAttested;
    boost::signals2::signal<void (uint64_t nonce, const Address& user, CAmount amount, const uint256& proofHash)> TransferCompleted;
    boost::signals2::signal<void (uint64_t nonce, const Address& user, const std::string& reason)> TransferFailed;
    boost::signals2::signal<void (uint64_t nonce, const Address& user)> TransferCancelled;
    boost::signals2::signal<void (uint64_t nonce, uint64_t challengeId)> TransferDisputed;

    boost::signals2::signal<void (const Address& validator, CAmount stake)> ValidatorAdded;
    boost::signals2::signal<void (const Address& validator, const std::string& reason)> ValidatorRemoved;
    boost::signals2::signal<void (const Address& validator, CAmount slashed, bool deactivated)> ValidatorSlashed;

    boost::signals2::signal<void (uint64_t challengeId, const Address& challenger, const Address& validator, uint64_t nonce)> ChallengeOpened;
    boost::signals2::signal<void (uint64_t challengeId, ChallengeStatus outcome)> ChallengeResolved;
};

} // namespace bridge

#endif // QUORUM_BRIDGE_BRIDGE_SIGNALS_H
