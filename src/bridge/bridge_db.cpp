// Copyright (c) 2026 The Quorum Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <bridge/bridge_db.h>

#include <streams.h>
#include <util.h>
#include <utilstrencodings.h>
#include <utiltime.h>

#include <sqlite3.h>

#include <map>

namespace bridge {

namespace {

template <typename T>
std::vector<unsigned char> ToBlob(const T& obj)
{
    CDataStream ss(SER_DISK, BRIDGE_DB_VERSION);
    ss << obj;
    return std::vector<unsigned char>(ss.begin(), ss.end());
}

template <typename T>
bool FromBlob(sqlite3_stmt* stmt, int column, T& obj)
{
    const char* data = static_cast<const char*>(sqlite3_column_blob(stmt, column));
    const int size = sqlite3_column_bytes(stmt, column);
    try {
        CDataStream ss(data, data + size, SER_DISK, BRIDGE_DB_VERSION);
        ss >> obj;
        if (!ss.eof()) {
            LogPrintf("BridgeDB: Corrupt record skipped: %u trailing bytes\n", ss.size());
            return false;
        }
    } catch (const std::ios_base::failure& e) {
        LogPrintf("BridgeDB: Corrupt record skipped: %s\n", e.what());
        return false;
    }
    return true;
}

void BindBlob(sqlite3_stmt* stmt, int index, const std::vector<unsigned char>& blob)
{
    sqlite3_bind_blob(stmt, index, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
}

void BindText(sqlite3_stmt* stmt, int index, const std::string& text)
{
    sqlite3_bind_text(stmt, index, text.c_str(), -1, SQLITE_TRANSIENT);
}

void NoBind(sqlite3_stmt*) {}

/** Run a SELECT whose first column is a record blob */
template <typename T, typename Binder>
std::vector<T> QueryRecords(sqlite3* db, const char* sql, Binder bind)
{
    std::vector<T> result;
    if (db == nullptr) return result;

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("BridgeDB: Failed to prepare query: %s\n", sqlite3_errmsg(db));
        return result;
    }
    bind(stmt);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        T obj;
        if (FromBlob(stmt, 0, obj)) {
            result.push_back(obj);
        }
    }
    sqlite3_finalize(stmt);
    return result;
}

template <typename T, typename Binder>
std::optional<T> QueryRecord(sqlite3* db, const char* sql, Binder bind)
{
    std::vector<T> records = QueryRecords<T>(db, sql, bind);
    if (records.empty()) {
        return std::nullopt;
    }
    return records.front();
}

} // namespace

BridgeDB::BridgeDB() {}

BridgeDB::~BridgeDB()
{
    Close();
}

bool BridgeDB::Open(const std::string& path)
{
    std::lock_guard<std::mutex> lock(dbMutex);

    if (db != nullptr) {
        return true;
    }

    dbPath = path;
    int rc = sqlite3_open(dbPath.c_str(), &db);
    if (rc != SQLITE_OK) {
        LogPrintf("BridgeDB: Failed to open database: %s\n", sqlite3_errmsg(db));
        sqlite3_close(db);
        db = nullptr;
        return false;
    }

    if (!ExecuteSQL("PRAGMA journal_mode=WAL;") || !ExecuteSQL("PRAGMA synchronous=NORMAL;")) {
        LogPrintf("BridgeDB: Could not tune %s, using sqlite defaults\n", dbPath);
    }

    int currentVersion = ReadSchemaVersion();
    if (currentVersion < 0) {
        if (!CreateSchema()) {
            LogPrintf("BridgeDB: Failed to create schema\n");
            sqlite3_close(db);
            db = nullptr;
            return false;
        }
    } else if (currentVersion < SCHEMA_VERSION) {
        if (!UpgradeSchema(currentVersion, SCHEMA_VERSION)) {
            LogPrintf("BridgeDB: Failed to upgrade schema from %d to %d\n", currentVersion, SCHEMA_VERSION);
            sqlite3_close(db);
            db = nullptr;
            return false;
        }
    } else if (currentVersion > SCHEMA_VERSION) {
        LogPrintf("BridgeDB: Schema version %d is newer than supported %d\n", currentVersion, SCHEMA_VERSION);
        sqlite3_close(db);
        db = nullptr;
        return false;
    }

    LogPrintf("BridgeDB: Opened %s\n", dbPath);
    return true;
}

void BridgeDB::Close()
{
    std::lock_guard<std::mutex> lock(dbMutex);

    if (db != nullptr) {
        sqlite3_close(db);
        db = nullptr;
        LogPrint(BCLog::DB, "BridgeDB: Closed %s\n", dbPath);
    }
}

bool BridgeDB::IsOpen() const
{
    std::lock_guard<std::mutex> lock(dbMutex);
    return db != nullptr;
}

int BridgeDB::GetSchemaVersion()
{
    std::lock_guard<std::mutex> lock(dbMutex);
    return ReadSchemaVersion();
}

bool BridgeDB::CreateSchema()
{
    const char* schema = R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version INTEGER PRIMARY KEY,
            applied_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS validators (
            address TEXT PRIMARY KEY,
            is_active INTEGER NOT NULL,
            stake INTEGER NOT NULL,
            data BLOB NOT NULL
        );

        CREATE TABLE IF NOT EXISTS transactions (
            nonce INTEGER PRIMARY KEY,
            user TEXT NOT NULL,
            status INTEGER NOT NULL,
            dest_chain INTEGER NOT NULL,
            amount INTEGER NOT NULL,
            data BLOB NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_transactions_user ON transactions(user);
        CREATE INDEX IF NOT EXISTS idx_transactions_status ON transactions(status);

        -- One row per attestation or fail vote
        CREATE TABLE IF NOT EXISTS attestations (
            nonce INTEGER NOT NULL,
            validator TEXT NOT NULL,
            kind TEXT NOT NULL,
            attested_at INTEGER NOT NULL,
            invalidated INTEGER NOT NULL DEFAULT 0,
            PRIMARY KEY (nonce, validator, kind)
        );

        CREATE TABLE IF NOT EXISTS commitments (
            nonce INTEGER NOT NULL,
            validator TEXT NOT NULL,
            data BLOB NOT NULL,
            PRIMARY KEY (nonce, validator)
        );

        CREATE TABLE IF NOT EXISTS consumed_signatures (
            id TEXT PRIMARY KEY
        );

        CREATE TABLE IF NOT EXISTS challenges (
            id INTEGER PRIMARY KEY,
            validator TEXT NOT NULL,
            nonce INTEGER NOT NULL,
            status INTEGER NOT NULL,
            data BLOB NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_challenges_validator ON challenges(validator);

        CREATE TABLE IF NOT EXISTS meta (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL
        );
    )";

    if (!ExecuteSQL(schema)) {
        return false;
    }
    return SetSchemaVersion(SCHEMA_VERSION);
}

bool BridgeDB::UpgradeSchema(int fromVersion, int toVersion)
{
    LogPrintf("BridgeDB: Upgrading schema from version %d to %d\n", fromVersion, toVersion);

    for (int version = fromVersion + 1; version <= toVersion; version++) {
        bool success = false;
        switch (version) {
            case 1:
                // Pre-versioned database: the initial schema is idempotent
                success = CreateSchema();
                break;
            default:
                LogPrintf("BridgeDB: Unknown migration version %d\n", version);
                break;
        }
        if (!success || !SetSchemaVersion(version)) {
            LogPrintf("BridgeDB: Migration to version %d failed\n", version);
            return false;
        }
    }
    return true;
}

int BridgeDB::ReadSchemaVersion()
{
    if (db == nullptr) return -1;

    sqlite3_stmt* stmt;
    const char* sql = "SELECT version FROM schema_version ORDER BY version DESC LIMIT 1;";
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return -1;
    }

    int version = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    return version;
}

bool BridgeDB::SetSchemaVersion(int version)
{
    return ExecuteSQL(strprintf("INSERT OR REPLACE INTO schema_version (version, applied_at) VALUES (%d, %d);",
                                version, GetTime()));
}

bool BridgeDB::ExecuteSQL(const std::string& sql)
{
    if (db == nullptr) return false;

    char* errMsg = nullptr;
    int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        LogPrintf("BridgeDB: SQL error: %s\n", errMsg ? errMsg : "unknown");
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

bool BridgeDB::RunStatement(sqlite3_stmt* stmt, const char* what)
{
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        LogPrintf("BridgeDB: Failed to write %s: %s\n", what, sqlite3_errmsg(db));
        return false;
    }
    return true;
}

bool BridgeDB::TxnBegin()
{
    std::lock_guard<std::mutex> lock(dbMutex);
    return ExecuteSQL("BEGIN TRANSACTION;");
}

bool BridgeDB::TxnCommit()
{
    std::lock_guard<std::mutex> lock(dbMutex);
    return ExecuteSQL("COMMIT;");
}

bool BridgeDB::TxnAbort()
{
    std::lock_guard<std::mutex> lock(dbMutex);
    return ExecuteSQL("ROLLBACK;");
}

// ============================================================================
// Validators
// ============================================================================

bool BridgeDB::WriteValidator(const ValidatorInfo& info)
{
    std::lock_guard<std::mutex> lock(dbMutex);
    if (db == nullptr) return false;

    const char* sql = "INSERT OR REPLACE INTO validators (address, is_active, stake, data) VALUES (?, ?, ?, ?);";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("BridgeDB: Failed to prepare validator insert: %s\n", sqlite3_errmsg(db));
        return false;
    }
    BindText(stmt, 1, info.address.GetHex());
    sqlite3_bind_int(stmt, 2, info.isActive ? 1 : 0);
    sqlite3_bind_int64(stmt, 3, info.stake);
    BindBlob(stmt, 4, ToBlob(info));
    return RunStatement(stmt, "validator");
}

std::optional<ValidatorInfo> BridgeDB::ReadValidator(const Address& address)
{
    std::lock_guard<std::mutex> lock(dbMutex);
    const std::string hex = address.GetHex();
    return QueryRecord<ValidatorInfo>(db, "SELECT data FROM validators WHERE address = ?;",
        [&hex](sqlite3_stmt* stmt) { BindText(stmt, 1, hex); });
}

std::vector<ValidatorInfo> BridgeDB::ReadValidators(bool activeOnly)
{
    std::lock_guard<std::mutex> lock(dbMutex);
    if (activeOnly) {
        return QueryRecords<ValidatorInfo>(db, "SELECT data FROM validators WHERE is_active = 1 ORDER BY address;", NoBind);
    }
    return QueryRecords<ValidatorInfo>(db, "SELECT data FROM validators ORDER BY address;", NoBind);
}

// ============================================================================
// Transactions
// ============================================================================

bool BridgeDB::WriteTransaction(const BridgeTransaction& tx)
{
    std::lock_guard<std::mutex> lock(dbMutex);
    if (db == nullptr) return false;

    const char* sql = "INSERT OR REPLACE INTO transactions (nonce, user, status, dest_chain, amount, data) "
                      "VALUES (?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("BridgeDB: Failed to prepare transaction insert: %s\n", sqlite3_errmsg(db));
        return false;
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(tx.nonce));
    BindText(stmt, 2, tx.user.GetHex());
    sqlite3_bind_int(stmt, 3, static_cast<int>(tx.status));
    sqlite3_bind_int64(stmt, 4, tx.destChain);
    sqlite3_bind_int64(stmt, 5, tx.amount);
    BindBlob(stmt, 6, ToBlob(tx));
    return RunStatement(stmt, "transaction");
}

std::optional<BridgeTransaction> BridgeDB::ReadTransaction(uint64_t nonce)
{
    std::lock_guard<std::mutex> lock(dbMutex);
    return QueryRecord<BridgeTransaction>(db, "SELECT data FROM transactions WHERE nonce = ?;",
        [nonce](sqlite3_stmt* stmt) { sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(nonce)); });
}

std::vector<BridgeTransaction> BridgeDB::ReadTransactions()
{
    std::lock_guard<std::mutex> lock(dbMutex);
    return QueryRecords<BridgeTransaction>(db, "SELECT data FROM transactions ORDER BY nonce;", NoBind);
}

std::vector<BridgeTransaction> BridgeDB::ReadTransactionsByStatus(TxStatus status)
{
    std::lock_guard<std::mutex> lock(dbMutex);
    return QueryRecords<BridgeTransaction>(db, "SELECT data FROM transactions WHERE status = ? ORDER BY nonce;",
        [status](sqlite3_stmt* stmt) { sqlite3_bind_int(stmt, 1, static_cast<int>(status)); });
}

std::vector<BridgeTransaction> BridgeDB::ReadTransactionsByUser(const Address& user)
{
    std::lock_guard<std::mutex> lock(dbMutex);
    const std::string hex = user.GetHex();
    return QueryRecords<BridgeTransaction>(db, "SELECT data FROM transactions WHERE user = ? ORDER BY nonce;",
        [&hex](sqlite3_stmt* stmt) { BindText(stmt, 1, hex); });
}

// ============================================================================
// Attestations
// ============================================================================

bool BridgeDB::WriteAttestationRow(uint64_t nonce, const Address& validator, const std::string& kind,
                                   uint64_t attestedAt, bool invalidated)
{
    const char* sql = "INSERT OR REPLACE INTO attestations (nonce, validator, kind, attested_at, invalidated) "
                      "VALUES (?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("BridgeDB: Failed to prepare attestation insert: %s\n", sqlite3_errmsg(db));
        return false;
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(nonce));
    BindText(stmt, 2, validator.GetHex());
    BindText(stmt, 3, kind);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(attestedAt));
    sqlite3_bind_int(stmt, 5, invalidated ? 1 : 0);
    return RunStatement(stmt, "attestation");
}

bool BridgeDB::WriteAttestationRecord(const AttestationRecord& record)
{
    std::lock_guard<std::mutex> lock(dbMutex);
    if (db == nullptr) return false;

    for (const auto& entry : record.attestations) {
        if (!WriteAttestationRow(record.nonce, entry.first, "attest", entry.second,
                                 record.invalidated.count(entry.first) > 0)) {
            return false;
        }
    }
    for (const Address& voter : record.failVotes) {
        if (!WriteAttestationRow(record.nonce, voter, "fail", 0, false)) {
            return false;
        }
    }
    return true;
}

namespace {

/** Group attestation rows (nonce, validator, kind, attested_at, invalidated) by nonce */
std::vector<AttestationRecord> ReadAttestationRows(sqlite3* db, const char* sql, std::optional<uint64_t> nonce)
{
    std::vector<AttestationRecord> result;
    if (db == nullptr) return result;

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("BridgeDB: Failed to prepare attestation query: %s\n", sqlite3_errmsg(db));
        return result;
    }
    if (nonce) {
        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(*nonce));
    }

    std::map<uint64_t, AttestationRecord> records;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const uint64_t rowNonce = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
        const Address validator = uint160S(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1)));
        const std::string kind = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));

        AttestationRecord& record = records[rowNonce];
        record.nonce = rowNonce;
        if (kind == "fail") {
            record.failVotes.insert(validator);
        } else {
            record.attestations[validator] = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
            if (sqlite3_column_int(stmt, 4) != 0) {
                record.invalidated.insert(validator);
            }
        }
    }
    sqlite3_finalize(stmt);

    for (const auto& entry : records) {
        result.push_back(entry.second);
    }
    return result;
}

} // namespace

std::optional<AttestationRecord> BridgeDB::ReadAttestationRecord(uint64_t nonce)
{
    std::lock_guard<std::mutex> lock(dbMutex);
    std::vector<AttestationRecord> records = ReadAttestationRows(db,
        "SELECT nonce, validator, kind, attested_at, invalidated FROM attestations WHERE nonce = ?;", nonce);
    if (records.empty()) {
        return std::nullopt;
    }
    return records.front();
}

std::vector<AttestationRecord> BridgeDB::ReadAttestationRecords()
{
    std::lock_guard<std::mutex> lock(dbMutex);
    return ReadAttestationRows(db,
        "SELECT nonce, validator, kind, attested_at, invalidated FROM attestations ORDER BY nonce;", std::nullopt);
}

bool BridgeDB::WriteCommitments(const std::vector<AttestationCommitment>& commitments)
{
    std::lock_guard<std::mutex> lock(dbMutex);
    if (db == nullptr) return false;

    if (!ExecuteSQL("DELETE FROM commitments;")) {
        return false;
    }
    for (const AttestationCommitment& commitment : commitments) {
        const char* sql = "INSERT OR REPLACE INTO commitments (nonce, validator, data) VALUES (?, ?, ?);";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            LogPrintf("BridgeDB: Failed to prepare commitment insert: %s\n", sqlite3_errmsg(db));
            return false;
        }
        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(commitment.nonce));
        BindText(stmt, 2, commitment.validator.GetHex());
        BindBlob(stmt, 3, ToBlob(commitment));
        if (!RunStatement(stmt, "commitment")) {
            return false;
        }
    }
    return true;
}

std::vector<AttestationCommitment> BridgeDB::ReadCommitments()
{
    std::lock_guard<std::mutex> lock(dbMutex);
    return QueryRecords<AttestationCommitment>(db, "SELECT data FROM commitments ORDER BY nonce;", NoBind);
}

bool BridgeDB::WriteConsumedSignature(const uint256& signatureId)
{
    std::lock_guard<std::mutex> lock(dbMutex);
    if (db == nullptr) return false;

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, "INSERT OR IGNORE INTO consumed_signatures (id) VALUES (?);", -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("BridgeDB: Failed to prepare signature insert: %s\n", sqlite3_errmsg(db));
        return false;
    }
    BindText(stmt, 1, signatureId.GetHex());
    return RunStatement(stmt, "consumed signature");
}

std::set<uint256> BridgeDB::ReadConsumedSignatures()
{
    std::lock_guard<std::mutex> lock(dbMutex);
    std::set<uint256> result;
    if (db == nullptr) return result;

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, "SELECT id FROM consumed_signatures;", -1, &stmt, nullptr) != SQLITE_OK) {
        return result;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        result.insert(uint256S(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0))));
    }
    sqlite3_finalize(stmt);
    return result;
}

// ============================================================================
// Challenges
// ============================================================================

bool BridgeDB::WriteChallenge(const Challenge& challenge)
{
    std::lock_guard<std::mutex> lock(dbMutex);
    if (db == nullptr) return false;

    const char* sql = "INSERT OR REPLACE INTO challenges (id, validator, nonce, status, data) VALUES (?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("BridgeDB: Failed to prepare challenge insert: %s\n", sqlite3_errmsg(db));
        return false;
    }
    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(challenge.id));
    BindText(stmt, 2, challenge.validator.GetHex());
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(challenge.nonce));
    sqlite3_bind_int(stmt, 4, static_cast<int>(challenge.status));
    BindBlob(stmt, 5, ToBlob(challenge));
    return RunStatement(stmt, "challenge");
}

std::optional<Challenge> BridgeDB::ReadChallenge(uint64_t id)
{
    std::lock_guard<std::mutex> lock(dbMutex);
    return QueryRecord<Challenge>(db, "SELECT data FROM challenges WHERE id = ?;",
        [id](sqlite3_stmt* stmt) { sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(id)); });
}

std::vector<Challenge> BridgeDB::ReadChallenges()
{
    std::lock_guard<std::mutex> lock(dbMutex);
    return QueryRecords<Challenge>(db, "SELECT data FROM challenges ORDER BY id;", NoBind);
}

std::vector<Challenge> BridgeDB::ReadChallengesForValidator(const Address& validator)
{
    std::lock_guard<std::mutex> lock(dbMutex);
    const std::string hex = validator.GetHex();
    return QueryRecords<Challenge>(db, "SELECT data FROM challenges WHERE validator = ? ORDER BY id;",
        [&hex](sqlite3_stmt* stmt) { BindText(stmt, 1, hex); });
}

// ============================================================================
// Meta
// ============================================================================

bool BridgeDB::WriteMeta(const std::string& key, const std::string& value)
{
    std::lock_guard<std::mutex> lock(dbMutex);
    if (db == nullptr) return false;

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);", -1, &stmt, nullptr) != SQLITE_OK) {
        LogPrintf("BridgeDB: Failed to prepare meta insert: %s\n", sqlite3_errmsg(db));
        return false;
    }
    BindText(stmt, 1, key);
    BindText(stmt, 2, value);
    return RunStatement(stmt, "meta");
}

std::optional<std::string> BridgeDB::ReadMeta(const std::string& key)
{
    std::lock_guard<std::mutex> lock(dbMutex);
    if (db == nullptr) return std::nullopt;

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db, "SELECT value FROM meta WHERE key = ?;", -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    BindText(stmt, 1, key);

    std::optional<std::string> value;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        value = std::string(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0)));
    }
    sqlite3_finalize(stmt);
    return value;
}

bool BridgeDB::WriteMetaInt(const std::string& key, int64_t value)
{
    return WriteMeta(key, strprintf("%d", value));
}

int64_t BridgeDB::ReadMetaInt(const std::string& key, int64_t defaultValue)
{
    std::optional<std::string> value = ReadMeta(key);
    int64_t result;
    if (!value || !ParseInt64(*value, &result)) {
        return defaultValue;
    }
    return result;
}

bool BridgeDB::ClearAllData()
{
    std::lock_guard<std::mutex> lock(dbMutex);
    return ExecuteSQL("DELETE FROM validators; DELETE FROM transactions; DELETE FROM attestations; "
                      "DELETE FROM commitments; DELETE FROM consumed_signatures; DELETE FROM challenges; "
                      "DELETE FROM meta;");
}

} // namespace bridge
