// File: src/storage/sqlite_tier_store.cpp
#include "storage/sqlite_tier_store.hpp"
#include "core/errors.hpp"
#include "spatial/coordinate_hasher.hpp"
#include <memory>
#include <sstream>

namespace dpcm {

namespace {

struct StatementDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Pattern ReadBlob(sqlite3_stmt* stmt, int column) {
    const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, column));
    int size = sqlite3_column_bytes(stmt, column);
    auto pattern = Pattern::FromBytes(data, static_cast<size_t>(size));
    if (!pattern) {
        throw std::runtime_error("corrupt pattern record");
    }
    return *pattern;
}

} // anonymous namespace

bool SqliteTierStore::Config::IsValid() const {
    if (db_path.empty()) return false;
    if (busy_timeout_ms < 0) return false;
    return synchronous == "FULL" || synchronous == "NORMAL" || synchronous == "OFF";
}

// ============================================================================
// Constructor and Destructor
// ============================================================================

SqliteTierStore::SqliteTierStore(StorageTier tier, const Config& config)
    : tier_(tier), config_(config) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid SqliteTierStore configuration");
    }

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw TierUnavailableError(tier_, "failed to open database: " + error);
    }

    try {
        InitializeDatabase();
    } catch (const TierUnavailableError&) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteTierStore::~SqliteTierStore() {
    if (db_) {
        // close_v2 defers the close until outstanding statements are finalized
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

std::string SqliteTierStore::GetName() const {
    return std::string("sqlite:") + ToString(tier_);
}

void SqliteTierStore::Fail(const std::string& what) const {
    throw TierUnavailableError(tier_, what + ": " + sqlite3_errmsg(db_));
}

// ============================================================================
// Database Initialization
// ============================================================================

void SqliteTierStore::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");
    ExecuteSQL("PRAGMA cache_size=-" + std::to_string(config_.cache_size_kb) + ";");

    ExecuteSQL(R"(
        CREATE TABLE IF NOT EXISTS patterns (
            id INTEGER PRIMARY KEY,
            category TEXT NOT NULL,
            x REAL NOT NULL,
            y REAL NOT NULL,
            z REAL NOT NULL,
            access_count INTEGER NOT NULL,
            last_access INTEGER NOT NULL,
            data BLOB NOT NULL
        );
    )");
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_category ON patterns(category);");
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_last_access ON patterns(last_access);");
}

void SqliteTierStore::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "unknown error";
        sqlite3_free(error_msg);
        throw TierUnavailableError(tier_, "SQL failed: " + error);
    }
}

// ============================================================================
// Core CRUD Operations
// ============================================================================

void SqliteTierStore::PutLocked(const Pattern& pattern) {
    const char* sql =
        "INSERT OR REPLACE INTO patterns "
        "(id, category, x, y, z, access_count, last_access, data) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?);";

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        Fail("prepare insert");
    }
    Statement stmt(raw);

    std::string category = CoordinateHasher::NormalizeCategory(pattern.profile.category);
    std::vector<uint8_t> blob = pattern.ToBytes();

    sqlite3_bind_int64(raw, 1, static_cast<sqlite3_int64>(pattern.id.value()));
    sqlite3_bind_text(raw, 2, category.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(raw, 3, pattern.coordinate.x);
    sqlite3_bind_double(raw, 4, pattern.coordinate.y);
    sqlite3_bind_double(raw, 5, pattern.coordinate.z);
    sqlite3_bind_int64(raw, 6, static_cast<sqlite3_int64>(pattern.access.access_count));
    sqlite3_bind_int64(raw, 7, pattern.access.last_accessed.ToMicros());
    sqlite3_bind_blob(raw, 8, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);

    if (sqlite3_step(raw) != SQLITE_DONE) {
        Fail("insert " + pattern.id.ToString());
    }
    total_writes_.fetch_add(1, std::memory_order_relaxed);
}

void SqliteTierStore::Put(const Pattern& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);
    PutLocked(pattern);
}

void SqliteTierStore::PutBatch(const std::vector<Pattern>& patterns) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (patterns.empty()) {
        return;
    }

    ExecuteSQL("BEGIN TRANSACTION;");
    try {
        for (const auto& p : patterns) {
            PutLocked(p);
        }
    } catch (const TierUnavailableError&) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
    ExecuteSQL("COMMIT;");
}

std::optional<Pattern> SqliteTierStore::Get(PatternID id) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_reads_.fetch_add(1, std::memory_order_relaxed);

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT data FROM patterns WHERE id = ?;", -1, &raw, nullptr) != SQLITE_OK) {
        Fail("prepare select");
    }
    Statement stmt(raw);
    sqlite3_bind_int64(raw, 1, static_cast<sqlite3_int64>(id.value()));

    int rc = sqlite3_step(raw);
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        Fail("select " + id.ToString());
    }
    try {
        return ReadBlob(raw, 0);
    } catch (const std::runtime_error& e) {
        throw TierUnavailableError(tier_, id.ToString() + ": " + e.what());
    }
}

bool SqliteTierStore::Delete(PatternID id) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM patterns WHERE id = ?;", -1, &raw, nullptr) != SQLITE_OK) {
        Fail("prepare delete");
    }
    Statement stmt(raw);
    sqlite3_bind_int64(raw, 1, static_cast<sqlite3_int64>(id.value()));

    if (sqlite3_step(raw) != SQLITE_DONE) {
        Fail("delete " + id.ToString());
    }
    total_writes_.fetch_add(1, std::memory_order_relaxed);
    return sqlite3_changes(db_) > 0;
}

// ============================================================================
// Query Operations
// ============================================================================

std::vector<Pattern> SqliteTierStore::Scan(const ScanFilter& filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_reads_.fetch_add(1, std::memory_order_relaxed);

    std::ostringstream sql;
    sql << "SELECT data FROM patterns WHERE 1 = 1";
    if (filter.category) {
        sql << " AND category = ?";
    }
    if (filter.region) {
        sql << " AND x BETWEEN ? AND ? AND y BETWEEN ? AND ? AND z BETWEEN ? AND ?";
    }
    if (filter.accessed_before) {
        sql << " AND last_access < ?";
    }
    sql << " ORDER BY id";
    if (filter.limit > 0) {
        sql << " LIMIT " << filter.limit;
    }
    sql << ";";

    const std::string text = sql.str();
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, text.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        Fail("prepare scan");
    }
    Statement stmt(raw);

    int index = 1;
    std::string category;
    if (filter.category) {
        category = CoordinateHasher::NormalizeCategory(*filter.category);
        sqlite3_bind_text(raw, index++, category.c_str(), -1, SQLITE_TRANSIENT);
    }
    if (filter.region) {
        for (size_t axis = 0; axis < 3; ++axis) {
            sqlite3_bind_double(raw, index++, filter.region->min[axis]);
            sqlite3_bind_double(raw, index++, filter.region->max[axis]);
        }
    }
    if (filter.accessed_before) {
        sqlite3_bind_int64(raw, index++, filter.accessed_before->ToMicros());
    }

    std::vector<Pattern> result;
    int rc;
    while ((rc = sqlite3_step(raw)) == SQLITE_ROW) {
        try {
            result.push_back(ReadBlob(raw, 0));
        } catch (const std::runtime_error& e) {
            throw TierUnavailableError(tier_, std::string("scan: ") + e.what());
        }
    }
    if (rc != SQLITE_DONE) {
        Fail("scan");
    }
    return result;
}

size_t SqliteTierStore::Count() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM patterns;", -1, &raw, nullptr) != SQLITE_OK) {
        Fail("prepare count");
    }
    Statement stmt(raw);
    if (sqlite3_step(raw) != SQLITE_ROW) {
        Fail("count");
    }
    return static_cast<size_t>(sqlite3_column_int64(raw, 0));
}

void SqliteTierStore::Compact() {
    std::lock_guard<std::mutex> lock(mutex_);
    ExecuteSQL("VACUUM;");
}

std::unique_ptr<ITierStore> CreateSqliteTierStore(StorageTier tier, const std::string& db_path) {
    SqliteTierStore::Config config;
    config.db_path = db_path;
    return std::make_unique<SqliteTierStore>(tier, config);
}

} // namespace dpcm
