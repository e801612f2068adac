// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef QUORUM_BRIDGE_BRIDGE_DB_H
#define QUORUM_BRIDGE_BRIDGE_DB_H

/**
 * @file bridge_db.h
 * @brief SQLite storage for bridge state
 *
 * Each record is stored as a serialized blob next to the key columns used
 * for point lookups and filtered enumeration. Counters and the volume
 * limiter live in the meta table.
 */

#include <bridge/attestation.h>
#include <bridge/bridge_common.h>
#include <bridge/bridge_state_machine.h>
#include <bridge/challenge_manager.h>
#include <bridge/validator_registry.h>

#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace bridge {

/** Version passed to the serializer for stored blobs */
static const int BRIDGE_DB_VERSION = 1;

static const std::string BRIDGE_DB_FILENAME = "bridge.sqlite";

class BridgeDB {
public:
    static const int SCHEMA_VERSION = 1;

    BridgeDB();
    ~BridgeDB();

    BridgeDB(const BridgeDB&) = delete;
    BridgeDB& operator=(const BridgeDB&) = delete;

    /** Open (creating if needed) the database file at path. ":memory:" is accepted. */
    bool Open(const std::string& path);
    void Close();
    bool IsOpen() const;

    const std::string& GetPath() const { return dbPath; }
    int GetSchemaVersion();

    // Batches
    bool TxnBegin();
    bool TxnCommit();
    bool TxnAbort();

    // Validators
    bool WriteValidator(const ValidatorInfo& info);
    std::optional<ValidatorInfo> ReadValidator(const Address& address);
    std::vector<ValidatorInfo> ReadValidators(bool activeOnly = false);

    // Transactions
    bool WriteTransaction(const BridgeTransaction& tx);
    std::optional<BridgeTransaction> ReadTransaction(uint64_t nonce);
    std::vector<BridgeTransaction> ReadTransactions();
    std::vector<BridgeTransaction> ReadTransactionsByStatus(TxStatus status);
    std::vector<BridgeTransaction> ReadTransactionsByUser(const Address& user);

    // Attestations
    bool WriteAttestationRecord(const AttestationRecord& record);
    std::optional<AttestationRecord> ReadAttestationRecord(uint64_t nonce);
    std::vector<AttestationRecord> ReadAttestationRecords();

    /** Replace the stored set of pending commitments */
    bool WriteCommitments(const std::vector<AttestationCommitment>& commitments);
    std::vector<AttestationCommitment> ReadCommitments();

    bool WriteConsumedSignature(const uint256& signatureId);
    std::set<uint256> ReadConsumedSignatures();

    // Challenges
    bool WriteChallenge(const Challenge& challenge);
    std::optional<Challenge> ReadChallenge(uint64_t id);
    std::vector<Challenge> ReadChallenges();
    std::vector<Challenge> ReadChallengesForValidator(const Address& validator);

    // Meta
    bool WriteMeta(const std::string& key, const std::string& value);
    std::optional<std::string> ReadMeta(const std::string& key);
    bool WriteMetaInt(const std::string& key, int64_t value);
    int64_t ReadMetaInt(const std::string& key, int64_t defaultValue);

    /** Remove all rows, keeping the schema */
    bool ClearAllData();

private:
    sqlite3* db = nullptr;
    std::string dbPath;
    mutable std::mutex dbMutex;

    bool CreateSchema();
    bool UpgradeSchema(int fromVersion, int toVersion);
    int ReadSchemaVersion();
    bool SetSchemaVersion(int version);
    bool ExecuteSQL(const std::string& sql);

    bool WriteAttestationRow(uint64_t nonce, const Address& validator, const std::string& kind,
                             uint64_t attestedAt, bool invalidated);
    bool RunStatement(sqlite3_stmt* stmt, const char* what);
};

} // namespace bridge

#endif // QUORUM_BRIDGE_BRIDGE_DB_H
