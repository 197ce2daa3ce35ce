// File: src/storage/run_store.hpp
#pragma once

#include "problems/curriculum.hpp"
#include "problems/statistics.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace algoseq {

/// SQLite failure while reading or writing the run store
class RunStoreError : public std::runtime_error {
public:
    explicit RunStoreError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Persistent record of training runs using SQLite
///
/// Keeps, per run and phase:
/// - curriculum checkpoints, so a trainer can resume a curriculum where it
///   stopped (see Problem::RestoreCurriculum)
/// - statistics aggregates per episode and metric
///
/// The store lives outside the generation core; problems never touch it.
class RunStore {
public:
    /// Configuration for RunStore
    struct Config {
        /// Path to the SQLite database file (":memory:" for a private
        /// in-memory database)
        std::string db_path;

        /// Enable Write-Ahead Logging
        bool enable_wal{true};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};
    };

    /// Curriculum snapshot at a given episode
    struct Checkpoint {
        std::string run_id;
        std::string phase;
        uint64_t episode{0};
        CurriculumState state;
    };

    /// One stored statistics aggregate
    struct StatisticsRow {
        std::string run_id;
        std::string phase;
        uint64_t episode{0};
        std::string metric;
        size_t count{0};
        double mean{0.0};
        double std{0.0};
        double min{0.0};
        double max{0.0};
    };

    /// Open (and create if needed) the database
    /// @throws RunStoreError if the database cannot be opened or initialized
    explicit RunStore(const Config& config);

    /// Destructor - closes database connection
    ~RunStore();

    // Prevent copying (SQLite connection is not copyable)
    RunStore(const RunStore&) = delete;
    RunStore& operator=(const RunStore&) = delete;

    // ========================================================================
    // Curriculum checkpoints
    // ========================================================================

    /// @throws RunStoreError on write failure
    void SaveCheckpoint(const std::string& run_id, const std::string& phase,
                        uint64_t episode, const CurriculumState& state);

    /// Checkpoint with the highest episode (latest write wins on ties)
    /// @throws RunStoreError on read failure or a corrupt row
    std::optional<Checkpoint> LoadLatestCheckpoint(const std::string& run_id,
                                                   const std::string& phase) const;

    size_t CountCheckpoints(const std::string& run_id, const std::string& phase) const;

    // ========================================================================
    // Statistics
    // ========================================================================

    /// Store every metric of record for an episode (replaces earlier rows
    /// of the same episode and metric); written in one transaction
    /// @throws RunStoreError on write failure
    void SaveStatistics(const std::string& run_id, const std::string& phase,
                        uint64_t episode, const StatisticsRecord& record);

    /// Rows of a run and phase ordered by episode, then metric
    std::vector<StatisticsRow> LoadStatistics(const std::string& run_id,
                                              const std::string& phase) const;

    /// Rows of one metric ordered by episode
    std::vector<StatisticsRow> LoadMetricHistory(const std::string& run_id,
                                                 const std::string& phase,
                                                 const std::string& metric) const;

    // ========================================================================
    // Maintenance
    // ========================================================================

    /// Run ids in lexicographic order
    std::vector<std::string> ListRuns() const;

    /// Remove every row of a run
    /// @return Number of rows deleted
    size_t DeleteRun(const std::string& run_id);

    const std::string& GetPath() const { return config_.db_path; }

private:
    Config config_;
    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;

    void InitializeDatabase();
    void CreateTables();

    /// @throws RunStoreError with context on failure
    void ExecuteSQL(const std::string& sql, const std::string& context);

    std::vector<StatisticsRow> QueryStatistics(const std::string& sql,
                                               const std::vector<std::string>& params) const;

    std::string LastError() const;
};

} // namespace algoseq
