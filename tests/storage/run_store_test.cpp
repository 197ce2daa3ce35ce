// File: tests/storage/run_store_test.cpp
#include "storage/run_store.hpp"
#include <gtest/gtest.h>
#include <ctime>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

namespace algoseq {
namespace {

// ============================================================================
// Helper Functions
// ============================================================================

std::string GetTempDbPath() {
    static int counter = 0;
    return "/tmp/test_run_store_" + std::to_string(std::time(nullptr)) +
           "_" + std::to_string(counter++) + ".db";
}

void RemoveDatabase(const std::string& db_path) {
    std::filesystem::remove(db_path);
    std::filesystem::remove(db_path + "-wal");
    std::filesystem::remove(db_path + "-shm");
}

CurriculumState MakeState(size_t current_max,
                          CurriculumPolicy policy = CurriculumPolicy::EPISODE_INTERVAL) {
    CurriculumState state;
    state.min_sequence_length = 1;
    state.max_sequence_length = 10;
    state.current_allowed_max = current_max;
    state.policy = policy;
    state.last_loss = 0.25;
    state.transitions = current_max - 1;
    return state;
}

class RunStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path_ = GetTempDbPath();
        RunStore::Config config;
        config.db_path = db_path_;
        store_ = std::make_unique<RunStore>(config);
    }

    void TearDown() override {
        store_.reset();
        RemoveDatabase(db_path_);
    }

    std::string db_path_;
    std::unique_ptr<RunStore> store_;
};

// ============================================================================
// Constructor and Configuration Tests
// ============================================================================

TEST(RunStoreConfigTest, ConstructorCreatesDatabase) {
    std::string db_path = GetTempDbPath();

    {
        RunStore::Config config;
        config.db_path = db_path;
        RunStore store(config);

        EXPECT_EQ(db_path, store.GetPath());
        EXPECT_TRUE(store.ListRuns().empty());
    }

    EXPECT_TRUE(std::filesystem::exists(db_path));
    RemoveDatabase(db_path);
}

TEST(RunStoreConfigTest, InMemoryDatabase) {
    RunStore::Config config;
    config.db_path = ":memory:";
    RunStore store(config);

    store.SaveCheckpoint("run", "training", 1, MakeState(2));
    EXPECT_EQ(1u, store.CountCheckpoints("run", "training"));
}

TEST(RunStoreConfigTest, UnopenablePathThrows) {
    RunStore::Config config;
    config.db_path = "/nonexistent_directory/run.db";
    EXPECT_THROW(RunStore store(config), RunStoreError);
}

TEST(RunStoreConfigTest, DataSurvivesReopen) {
    std::string db_path = GetTempDbPath();
    RunStore::Config config;
    config.db_path = db_path;

    {
        RunStore store(config);
        store.SaveCheckpoint("run", "training", 500, MakeState(4));
    }
    {
        RunStore store(config);
        auto checkpoint = store.LoadLatestCheckpoint("run", "training");
        ASSERT_TRUE(checkpoint.has_value());
        EXPECT_EQ(4u, checkpoint->state.current_allowed_max);
    }

    RemoveDatabase(db_path);
}

// ============================================================================
// Checkpoint Tests
// ============================================================================

TEST_F(RunStoreTest, MissingCheckpoint) {
    EXPECT_FALSE(store_->LoadLatestCheckpoint("run", "training").has_value());
    EXPECT_EQ(0u, store_->CountCheckpoints("run", "training"));
}

TEST_F(RunStoreTest, CheckpointRoundTrip) {
    CurriculumState state = MakeState(6, CurriculumPolicy::LOSS_THRESHOLD);
    store_->SaveCheckpoint("run", "training", 1200, state);

    auto checkpoint = store_->LoadLatestCheckpoint("run", "training");
    ASSERT_TRUE(checkpoint.has_value());
    EXPECT_EQ("run", checkpoint->run_id);
    EXPECT_EQ("training", checkpoint->phase);
    EXPECT_EQ(1200u, checkpoint->episode);
    EXPECT_EQ(1u, checkpoint->state.min_sequence_length);
    EXPECT_EQ(10u, checkpoint->state.max_sequence_length);
    EXPECT_EQ(6u, checkpoint->state.current_allowed_max);
    EXPECT_EQ(CurriculumPolicy::LOSS_THRESHOLD, checkpoint->state.policy);
    EXPECT_DOUBLE_EQ(0.25, checkpoint->state.last_loss);
    EXPECT_EQ(5u, checkpoint->state.transitions);
    EXPECT_EQ(1200u, checkpoint->state.last_episode);
}

TEST_F(RunStoreTest, LatestCheckpointWins) {
    store_->SaveCheckpoint("run", "training", 100, MakeState(2));
    store_->SaveCheckpoint("run", "training", 300, MakeState(4));
    store_->SaveCheckpoint("run", "training", 200, MakeState(3));

    EXPECT_EQ(3u, store_->CountCheckpoints("run", "training"));
    EXPECT_EQ(4u, store_->LoadLatestCheckpoint("run", "training")->state.current_allowed_max);

    // Same episode saved again: the newer row wins
    store_->SaveCheckpoint("run", "training", 300, MakeState(5));
    EXPECT_EQ(5u, store_->LoadLatestCheckpoint("run", "training")->state.current_allowed_max);
}

TEST_F(RunStoreTest, CheckpointsAreScopedByRunAndPhase) {
    store_->SaveCheckpoint("a", "training", 10, MakeState(2));
    store_->SaveCheckpoint("a", "validation", 10, MakeState(7));
    store_->SaveCheckpoint("b", "training", 10, MakeState(9));

    EXPECT_EQ(2u, store_->LoadLatestCheckpoint("a", "training")->state.current_allowed_max);
    EXPECT_EQ(7u, store_->LoadLatestCheckpoint("a", "validation")->state.current_allowed_max);
    EXPECT_EQ(9u, store_->LoadLatestCheckpoint("b", "training")->state.current_allowed_max);
    EXPECT_FALSE(store_->LoadLatestCheckpoint("b", "validation").has_value());
}

// ============================================================================
// Statistics Tests
// ============================================================================

TEST_F(RunStoreTest, StatisticsRoundTrip) {
    StatisticsRecord record;
    record.Add("loss", 0.5);
    record.Add("loss", 0.3);
    record.Add("acc", 0.75);
    store_->SaveStatistics("run", "training", 100, record);

    auto rows = store_->LoadStatistics("run", "training");
    ASSERT_EQ(2u, rows.size());

    // Ordered by episode, then metric
    EXPECT_EQ("acc", rows[0].metric);
    EXPECT_EQ(1u, rows[0].count);
    EXPECT_DOUBLE_EQ(0.75, rows[0].mean);

    EXPECT_EQ("loss", rows[1].metric);
    EXPECT_EQ("run", rows[1].run_id);
    EXPECT_EQ("training", rows[1].phase);
    EXPECT_EQ(100u, rows[1].episode);
    EXPECT_EQ(2u, rows[1].count);
    EXPECT_DOUBLE_EQ(0.4, rows[1].mean);
    EXPECT_NEAR(0.1, rows[1].std, 1e-9);
    EXPECT_DOUBLE_EQ(0.3, rows[1].min);
    EXPECT_DOUBLE_EQ(0.5, rows[1].max);
}

TEST_F(RunStoreTest, EmptyRecordIsNotStored) {
    store_->SaveStatistics("run", "training", 1, StatisticsRecord{});
    EXPECT_TRUE(store_->LoadStatistics("run", "training").empty());
    EXPECT_TRUE(store_->ListRuns().empty());
}

TEST_F(RunStoreTest, SavingTheSameEpisodeReplacesRows) {
    StatisticsRecord first;
    first.Add("acc", 0.1);
    store_->SaveStatistics("run", "training", 5, first);

    StatisticsRecord second;
    second.Add("acc", 0.9);
    store_->SaveStatistics("run", "training", 5, second);

    auto rows = store_->LoadStatistics("run", "training");
    ASSERT_EQ(1u, rows.size());
    EXPECT_DOUBLE_EQ(0.9, rows[0].mean);
}

TEST_F(RunStoreTest, MetricHistory) {
    for (uint64_t episode = 1; episode <= 3; ++episode) {
        StatisticsRecord record;
        record.Add("loss", 1.0 / static_cast<double>(episode));
        record.Add("acc", 0.5);
        store_->SaveStatistics("run", "training", episode * 10, record);
    }

    auto history = store_->LoadMetricHistory("run", "training", "loss");
    ASSERT_EQ(3u, history.size());
    EXPECT_EQ(10u, history[0].episode);
    EXPECT_EQ(30u, history[2].episode);
    EXPECT_DOUBLE_EQ(1.0, history[0].mean);
    EXPECT_NEAR(1.0 / 3.0, history[2].mean, 1e-12);

    EXPECT_TRUE(store_->LoadMetricHistory("run", "training", "frame_acc").empty());
}

// ============================================================================
// Maintenance Tests
// ============================================================================

TEST_F(RunStoreTest, ListAndDeleteRuns) {
    store_->SaveCheckpoint("beta", "training", 1, MakeState(2));
    StatisticsRecord record;
    record.Add("acc", 1.0);
    record.Add("loss", 0.0);
    store_->SaveStatistics("alpha", "training", 1, record);
    store_->SaveStatistics("beta", "training", 1, record);

    EXPECT_EQ((std::vector<std::string>{"alpha", "beta"}), store_->ListRuns());

    // One checkpoint plus two statistics rows
    EXPECT_EQ(3u, store_->DeleteRun("beta"));
    EXPECT_EQ(std::vector<std::string>{"alpha"}, store_->ListRuns());
    EXPECT_FALSE(store_->LoadLatestCheckpoint("beta", "training").has_value());

    EXPECT_EQ(0u, store_->DeleteRun("missing"));
}

// ============================================================================
// Concurrency Tests
// ============================================================================

TEST_F(RunStoreTest, ConcurrentWriters) {
    const int num_threads = 4;
    const int per_thread = 25;
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < per_thread; ++i) {
                uint64_t episode = static_cast<uint64_t>(t * per_thread + i);
                store_->SaveCheckpoint("run", "training", episode, MakeState(3));
                StatisticsRecord record;
                record.Add("acc", 0.5);
                store_->SaveStatistics("run", "training", episode, record);
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<size_t>(num_threads * per_thread),
              store_->CountCheckpoints("run", "training"));
    EXPECT_EQ(static_cast<size_t>(num_threads * per_thread),
              store_->LoadMetricHistory("run", "training", "acc").size());
}

} // namespace
} // namespace algoseq
