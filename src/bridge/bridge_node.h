// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUORUM_BRIDGE_BRIDGE_NODE_H
#define QUORUM_BRIDGE_BRIDGE_NODE_H

/**
 * @file bridge_node.h
 * @brief Owner of one bridge instance and its persistence
 *
 * BridgeNode builds the validator registry, the attestation ledger, the
 * transaction state machine and the challenge manager around a shared
 * parameter set and token ledger, and moves their state to and from a
 * BridgeDB. Components are reached through the accessors; the node itself
 * adds no business rules.
 *
 * Flush() writes a complete snapshot in one database transaction while
 * holding every component lock, so the snapshot is a single moment even
 * with other threads calling into the components. Load() clears every
 * component before restoring, so a failed load never leaves a mix of old
 * and new state.
 */

#include <bridge/attestation.h>
#include <bridge/bridge_db.h>
#include <bridge/bridge_params.h>
#include <bridge/bridge_signals.h>
#include <bridge/bridge_state_machine.h>
#include <bridge/challenge_manager.h>
#include <bridge/payment_handler.h>
#include <bridge/token_ledger.h>
#include <bridge/validator_registry.h>
#include <sync.h>

#include <boost/signals2/connection.hpp>

#include <vector>

namespace bridge {

/** Meta keys used by BridgeNode snapshots */
static const char* const META_NEXT_NONCE = "next_nonce";
static const char* const META_FEES_WITHDRAWN = "fees_withdrawn";
static const char* const META_NEXT_CHALLENGE_ID = "next_challenge_id";
static const char* const META_INSURANCE_FUND = "insurance_fund";
static const char* const META_VOLUME = "volume";

class BridgeNode {
public:
    /**
     * @param params bridge parameters, copied; must pass BridgeParams::Check()
     * @param ledger token ledger, must outlive the node
     * @param payments optional payment handler for prepaid transfers
     */
    BridgeNode(const BridgeParams& params, TokenLedger& ledger, PaymentHandler* payments = nullptr);
    ~BridgeNode();

    BridgeNode(const BridgeNode&) = delete;
    BridgeNode& operator=(const BridgeNode&) = delete;

    BridgeSignals& Signals() { return signals_; }
    ValidatorRegistry& Registry() { return registry_; }
    AttestationLedger& Attestations() { return attestations_; }
    BridgeStateMachine& StateMachine() { return stateMachine_; }
    ChallengeManager& Challenges() { return challenges_; }

    /** Write the full state to db in a single transaction */
    bool Flush(BridgeDB& db);

    /** Replace the in-memory state with what db holds */
    bool Load(BridgeDB& db);

    /** Drop every component's state */
    void Clear();

private:
    const BridgeParams params_;
    TokenLedger& ledger_;

    BridgeSignals signals_;
    ValidatorRegistry registry_;
    AttestationLedger attestations_;
    BridgeStateMachine stateMachine_;
    ChallengeManager challenges_;

    /** Serialises Flush, Load and Clear */
    CCriticalSection cs_node_;

    std::vector<boost::signals2::connection> logConnections_;

    void ConnectLogging();
    bool WriteSnapshot(BridgeDB& db);
};

} // namespace bridge

#endif // QUORUM_BRIDGE_BRIDGE_NODE_H
