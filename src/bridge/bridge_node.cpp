// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <bridge/bridge_node.h>

#include <streams.h>
#include <util.h>
#include <utilstrencodings.h>

#include <ios>

namespace bridge {

/** Every component lock, in the documented order */
#define LOCK_COMPONENTS()                    \
    LOCK(challenges_.GetLock());             \
    LOCK(stateMachine_.GetLock());           \
    LOCK(attestations_.GetLock());           \
    LOCK(registry_.GetLock())

BridgeNode::BridgeNode(const BridgeParams& params, TokenLedger& ledger, PaymentHandler* payments)
    : params_(params)
    , ledger_(ledger)
    , registry_(params_, ledger_, signals_)
    , attestations_(MakeAttestationStrategy(params_.attestationMode, params_.revealWindow))
    , stateMachine_(params_, ledger_, registry_, attestations_, signals_, payments)
    , challenges_(params_, ledger_, registry_, attestations_, stateMachine_, signals_)
{
    ConnectLogging();
}

BridgeNode::~BridgeNode()
{
    for (boost::signals2::connection& conn : logConnections_) {
        conn.disconnect();
    }
}

void BridgeNode::ConnectLogging()
{
    logConnections_.push_back(signals_.TransferCompleted.connect(
        [](uint64_t nonce, const Address& user, CAmount amount, const uint256& proofHash) {
            LogPrint(BCLog::BRIDGE, "BridgeNode: transfer %u completed, release %s to %s (proof %s)\n",
                     nonce, FormatMoney(amount), user.ToString(), proofHash.ToString());
        }));
    logConnections_.push_back(signals_.TransferFailed.connect(
        [](uint64_t nonce, const Address& user, const std::string& reason) {
            LogPrint(BCLog::BRIDGE, "BridgeNode: transfer %u of %s failed: %s\n", nonce, user.ToString(), reason);
        }));
    logConnections_.push_back(signals_.ValidatorSlashed.connect(
        [](const Address& validator, CAmount slashed, bool deactivated) {
            LogPrintf("BridgeNode: validator %s slashed %s%s\n", validator.ToString(), FormatMoney(slashed),
                      deactivated ? " and deactivated" : "");
        }));
    logConnections_.push_back(signals_.ChallengeResolved.connect(
        [](uint64_t challengeId, ChallengeStatus outcome) {
            LogPrint(BCLog::CHALLENGE, "BridgeNode: challenge %u resolved %s\n", challengeId, ChallengeStatusToString(outcome));
        }));
}

bool BridgeNode::WriteSnapshot(BridgeDB& db)
{
    for (const ValidatorInfo& info : registry_.GetAllValidators()) {
        if (!db.WriteValidator(info)) return false;
    }
    for (const BridgeTransaction& tx : stateMachine_.GetTransactions()) {
        if (!db.WriteTransaction(tx)) return false;
    }
    for (const AttestationRecord& record : attestations_.GetAllRecords()) {
        if (!db.WriteAttestationRecord(record)) return false;
    }
    if (!db.WriteCommitments(attestations_.GetAllCommitments())) return false;
    for (const uint256& id : attestations_.GetConsumedSignatures()) {
        if (!db.WriteConsumedSignature(id)) return false;
    }
    for (const Challenge& challenge : challenges_.GetChallenges()) {
        if (!db.WriteChallenge(challenge)) return false;
    }

    CDataStream ssVolume(SER_DISK, BRIDGE_DB_VERSION);
    ssVolume << stateMachine_.GetVolumeLimiter();

    return db.WriteMetaInt(META_NEXT_NONCE, static_cast<int64_t>(stateMachine_.GetNextNonce())) &&
           db.WriteMetaInt(META_FEES_WITHDRAWN, stateMachine_.GetFeesWithdrawn()) &&
           db.WriteMetaInt(META_NEXT_CHALLENGE_ID, static_cast<int64_t>(challenges_.GetNextChallengeId())) &&
           db.WriteMetaInt(META_INSURANCE_FUND, challenges_.GetInsuranceFund()) &&
           db.WriteMeta(META_VOLUME, HexStr(ssVolume.begin(), ssVolume.end()));
}

bool BridgeNode::Flush(BridgeDB& db)
{
    LOCK(cs_node_);
    LOCK_COMPONENTS();

    if (!db.IsOpen()) {
        return error("BridgeNode::Flush: database not open");
    }
    if (!db.TxnBegin()) {
        return error("BridgeNode::Flush: cannot begin transaction");
    }
    if (!WriteSnapshot(db)) {
        if (!db.TxnAbort()) {
            LogPrintf("BridgeNode::Flush: rollback failed\n");
        }
        return error("BridgeNode::Flush: snapshot write failed");
    }
    if (!db.TxnCommit()) {
        return error("BridgeNode::Flush: commit failed");
    }

    LogPrint(BCLog::DB, "BridgeNode: flushed state to %s\n", db.GetPath());
    return true;
}

bool BridgeNode::Load(BridgeDB& db)
{
    LOCK(cs_node_);
    LOCK_COMPONENTS();

    if (!db.IsOpen()) {
        return error("BridgeNode::Load: database not open");
    }

    challenges_.Clear();
    stateMachine_.Clear();
    attestations_.Clear();
    registry_.Clear();

    for (const ValidatorInfo& info : db.ReadValidators()) {
        registry_.LoadValidator(info);
    }
    for (const AttestationRecord& record : db.ReadAttestationRecords()) {
        attestations_.LoadRecord(record);
    }
    for (const AttestationCommitment& commitment : db.ReadCommitments()) {
        attestations_.LoadCommitment(commitment);
    }
    for (const uint256& id : db.ReadConsumedSignatures()) {
        attestations_.LoadConsumedSignature(id);
    }
    for (const BridgeTransaction& tx : db.ReadTransactions()) {
        stateMachine_.LoadTransaction(tx);
    }
    stateMachine_.LoadCounters(static_cast<uint64_t>(db.ReadMetaInt(META_NEXT_NONCE, 1)),
                               db.ReadMetaInt(META_FEES_WITHDRAWN, 0));

    for (const Challenge& challenge : db.ReadChallenges()) {
        challenges_.LoadChallenge(challenge);
    }
    challenges_.LoadCounters(static_cast<uint64_t>(db.ReadMetaInt(META_NEXT_CHALLENGE_ID, 1)),
                             db.ReadMetaInt(META_INSURANCE_FUND, 0));

    std::optional<std::string> volumeHex = db.ReadMeta(META_VOLUME);
    if (volumeHex && !volumeHex->empty()) {
        if (!IsHex(*volumeHex)) {
            Clear();
            return error("BridgeNode::Load: volume record is not hex");
        }
        try {
            CDataStream ssVolume(ParseHex(*volumeHex), SER_DISK, BRIDGE_DB_VERSION);
            ssVolume >> stateMachine_.GetVolumeLimiter();
        } catch (const std::ios_base::failure& e) {
            Clear();
            return error("BridgeNode::Load: corrupt volume record: %s", e.what());
        }
    }

    LogPrintf("BridgeNode: loaded %u validators, %u transfers, %u challenges from %s\n",
              registry_.GetAllValidators().size(), stateMachine_.GetTransactions().size(),
              challenges_.GetChallenges().size(), db.GetPath());
    return true;
}

void BridgeNode::Clear()
{
    LOCK(cs_node_);
    LOCK_COMPONENTS();
    challenges_.Clear();
    stateMachine_.Clear();
    attestations_.Clear();
    registry_.Clear();
}

} // namespace bridge
