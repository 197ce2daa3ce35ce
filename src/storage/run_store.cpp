// File: src/storage/run_store.cpp
#include "storage/run_store.hpp"
#include "core/errors.hpp"

namespace algoseq {

namespace {

void BindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

std::string ColumnText(sqlite3_stmt* stmt, int index) {
    const unsigned char* text = sqlite3_column_text(stmt, index);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

} // anonymous namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

RunStore::RunStore(const Config& config)
    : config_(config) {

    // Open SQLite database
    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw RunStoreError("Failed to open run store " + config_.db_path + ": " + error);
    }

    try {
        InitializeDatabase();
    } catch (const RunStoreError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

RunStore::~RunStore() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void RunStore::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, 5000);

    if (config_.enable_wal && config_.db_path != ":memory:") {
        ExecuteSQL("PRAGMA journal_mode=WAL;", "enable WAL");
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";", "set synchronous mode");

    CreateTables();
}

void RunStore::CreateTables() {
    ExecuteSQL(R"(
        CREATE TABLE IF NOT EXISTS checkpoints (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            run_id TEXT NOT NULL,
            phase TEXT NOT NULL,
            episode INTEGER NOT NULL,
            min_sequence_length INTEGER NOT NULL,
            max_sequence_length INTEGER NOT NULL,
            current_allowed_max INTEGER NOT NULL,
            policy TEXT NOT NULL,
            last_loss REAL NOT NULL,
            transitions INTEGER NOT NULL,
            done INTEGER NOT NULL
        );
    )", "create checkpoints table");

    ExecuteSQL(R"(
        CREATE TABLE IF NOT EXISTS statistics (
            run_id TEXT NOT NULL,
            phase TEXT NOT NULL,
            episode INTEGER NOT NULL,
            metric TEXT NOT NULL,
            count INTEGER NOT NULL,
            mean REAL NOT NULL,
            std REAL NOT NULL,
            min REAL NOT NULL,
            max REAL NOT NULL,
            PRIMARY KEY (run_id, phase, episode, metric)
        );
    )", "create statistics table");

    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_checkpoints_run "
               "ON checkpoints(run_id, phase, episode);", "create checkpoint index");
}

void RunStore::ExecuteSQL(const std::string& sql, const std::string& context) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : LastError();
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        throw RunStoreError("Failed to " + context + ": " + error);
    }
}

std::string RunStore::LastError() const {
    return sqlite3_errmsg(db_);
}

// ============================================================================
// Curriculum checkpoints
// ============================================================================

void RunStore::SaveCheckpoint(const std::string& run_id, const std::string& phase,
                              uint64_t episode, const CurriculumState& state) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "INSERT INTO checkpoints (run_id, phase, episode, min_sequence_length, "
        "max_sequence_length, current_allowed_max, policy, last_loss, transitions, done) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw RunStoreError("Failed to prepare checkpoint insert: " + LastError());
    }

    BindText(stmt, 1, run_id);
    BindText(stmt, 2, phase);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(episode));
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(state.min_sequence_length));
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(state.max_sequence_length));
    sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(state.current_allowed_max));
    BindText(stmt, 7, ToString(state.policy));
    sqlite3_bind_double(stmt, 8, state.last_loss);
    sqlite3_bind_int64(stmt, 9, static_cast<sqlite3_int64>(state.transitions));
    sqlite3_bind_int(stmt, 10, state.IsDone() ? 1 : 0);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw RunStoreError("Failed to save checkpoint: " + LastError());
    }
}

std::optional<RunStore::Checkpoint> RunStore::LoadLatestCheckpoint(
        const std::string& run_id, const std::string& phase) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "SELECT episode, min_sequence_length, max_sequence_length, current_allowed_max, "
        "policy, last_loss, transitions FROM checkpoints WHERE run_id = ? AND phase = ? "
        "ORDER BY episode DESC, id DESC LIMIT 1;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw RunStoreError("Failed to prepare checkpoint query: " + LastError());
    }

    BindText(stmt, 1, run_id);
    BindText(stmt, 2, phase);

    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            throw RunStoreError("Failed to load checkpoint: " + LastError());
        }
        return std::nullopt;
    }

    Checkpoint checkpoint;
    checkpoint.run_id = run_id;
    checkpoint.phase = phase;
    checkpoint.episode = static_cast<uint64_t>(sqlite3_column_int64(stmt, 0));
    checkpoint.state.min_sequence_length = static_cast<size_t>(sqlite3_column_int64(stmt, 1));
    checkpoint.state.max_sequence_length = static_cast<size_t>(sqlite3_column_int64(stmt, 2));
    checkpoint.state.current_allowed_max = static_cast<size_t>(sqlite3_column_int64(stmt, 3));
    std::string policy = ColumnText(stmt, 4);
    checkpoint.state.last_loss = sqlite3_column_double(stmt, 5);
    checkpoint.state.transitions = static_cast<uint64_t>(sqlite3_column_int64(stmt, 6));
    checkpoint.state.last_episode = checkpoint.episode;
    sqlite3_finalize(stmt);

    try {
        checkpoint.state.policy = ParseCurriculumPolicy(policy);
    } catch (const ConfigError& e) {
        throw RunStoreError("Corrupt checkpoint for run " + run_id + ": " + e.what());
    }

    return checkpoint;
}

size_t RunStore::CountCheckpoints(const std::string& run_id, const std::string& phase) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "SELECT COUNT(*) FROM checkpoints WHERE run_id = ? AND phase = ?;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw RunStoreError("Failed to prepare checkpoint count: " + LastError());
    }

    BindText(stmt, 1, run_id);
    BindText(stmt, 2, phase);

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return count;
}

// ============================================================================
// Statistics
// ============================================================================

void RunStore::SaveStatistics(const std::string& run_id, const std::string& phase,
                              uint64_t episode, const StatisticsRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (record.IsEmpty()) {
        return;
    }

    ExecuteSQL("BEGIN TRANSACTION;", "begin transaction");

    const char* sql =
        "INSERT OR REPLACE INTO statistics (run_id, phase, episode, metric, count, mean, std, "
        "min, max) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::string error = LastError();
        ExecuteSQL("ROLLBACK;", "roll back statistics");
        throw RunStoreError("Failed to prepare statistics insert: " + error);
    }

    for (const auto& [metric, aggregate] : record) {
        BindText(stmt, 1, run_id);
        BindText(stmt, 2, phase);
        sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(episode));
        BindText(stmt, 4, metric);
        sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(aggregate.count));
        sqlite3_bind_double(stmt, 6, aggregate.Mean());
        sqlite3_bind_double(stmt, 7, aggregate.StdDev());
        sqlite3_bind_double(stmt, 8, aggregate.min);
        sqlite3_bind_double(stmt, 9, aggregate.max);

        if (sqlite3_step(stmt) != SQLITE_DONE) {
            std::string error = LastError();
            sqlite3_finalize(stmt);
            ExecuteSQL("ROLLBACK;", "roll back statistics");
            throw RunStoreError("Failed to save statistics for " + metric + ": " + error);
        }

        // Reset statement for next iteration
        sqlite3_reset(stmt);
    }

    sqlite3_finalize(stmt);
    ExecuteSQL("COMMIT;", "commit statistics");
}

std::vector<RunStore::StatisticsRow> RunStore::LoadStatistics(const std::string& run_id,
                                                              const std::string& phase) const {
    return QueryStatistics(
        "SELECT run_id, phase, episode, metric, count, mean, std, min, max FROM statistics "
        "WHERE run_id = ? AND phase = ? ORDER BY episode, metric;",
        {run_id, phase});
}

std::vector<RunStore::StatisticsRow> RunStore::LoadMetricHistory(const std::string& run_id,
                                                                 const std::string& phase,
                                                                 const std::string& metric) const {
    return QueryStatistics(
        "SELECT run_id, phase, episode, metric, count, mean, std, min, max FROM statistics "
        "WHERE run_id = ? AND phase = ? AND metric = ? ORDER BY episode;",
        {run_id, phase, metric});
}

std::vector<RunStore::StatisticsRow> RunStore::QueryStatistics(
        const std::string& sql, const std::vector<std::string>& params) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<StatisticsRow> rows;
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        throw RunStoreError("Failed to prepare statistics query: " + LastError());
    }

    for (size_t i = 0; i < params.size(); ++i) {
        BindText(stmt, static_cast<int>(i + 1), params[i]);
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        StatisticsRow row;
        row.run_id = ColumnText(stmt, 0);
        row.phase = ColumnText(stmt, 1);
        row.episode = static_cast<uint64_t>(sqlite3_column_int64(stmt, 2));
        row.metric = ColumnText(stmt, 3);
        row.count = static_cast<size_t>(sqlite3_column_int64(stmt, 4));
        row.mean = sqlite3_column_double(stmt, 5);
        row.std = sqlite3_column_double(stmt, 6);
        row.min = sqlite3_column_double(stmt, 7);
        row.max = sqlite3_column_double(stmt, 8);
        rows.push_back(row);
    }

    sqlite3_finalize(stmt);
    return rows;
}

// ============================================================================
// Maintenance
// ============================================================================

std::vector<std::string> RunStore::ListRuns() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> runs;
    const char* sql =
        "SELECT run_id FROM checkpoints UNION SELECT run_id FROM statistics ORDER BY run_id;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw RunStoreError("Failed to prepare run listing: " + LastError());
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        runs.push_back(ColumnText(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return runs;
}

size_t RunStore::DeleteRun(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t deleted = 0;
    for (const char* sql : {"DELETE FROM checkpoints WHERE run_id = ?;",
                            "DELETE FROM statistics WHERE run_id = ?;"}) {
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw RunStoreError("Failed to prepare delete: " + LastError());
        }

        BindText(stmt, 1, run_id);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            throw RunStoreError("Failed to delete run " + run_id + ": " + LastError());
        }
        deleted += static_cast<size_t>(sqlite3_changes(db_));
    }
    return deleted;
}

} // namespace algoseq
