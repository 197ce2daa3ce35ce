// File: tests/problems/curriculum_test.cpp
#include "problems/curriculum.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <limits>

namespace algoseq {
namespace {

// ============================================================================
// Helper Functions
// ============================================================================

CurriculumConfig EpisodeConfig(uint64_t interval, size_t initial, size_t step = 1) {
    CurriculumConfig config;
    config.policy = CurriculumPolicy::EPISODE_INTERVAL;
    config.interval = interval;
    config.initial_max_sequence_length = initial;
    config.step = step;
    return config;
}

CurriculumConfig LossConfig(double threshold, size_t step = 1) {
    CurriculumConfig config;
    config.policy = CurriculumPolicy::LOSS_THRESHOLD;
    config.loss_threshold = threshold;
    config.step = step;
    return config;
}

// ============================================================================
// Policy parsing
// ============================================================================

TEST(CurriculumConfigTest, PolicyNames) {
    EXPECT_STREQ("fixed", ToString(CurriculumPolicy::FIXED));
    EXPECT_STREQ("episode", ToString(CurriculumPolicy::EPISODE_INTERVAL));
    EXPECT_STREQ("loss", ToString(CurriculumPolicy::LOSS_THRESHOLD));

    EXPECT_EQ(CurriculumPolicy::LOSS_THRESHOLD, ParseCurriculumPolicy("loss"));
    EXPECT_THROW(ParseCurriculumPolicy("linear"), ConfigError);
}

TEST(CurriculumConfigTest, FromParamsForms) {
    EXPECT_EQ(CurriculumPolicy::FIXED, CurriculumConfig::FromParams(ParamMap{}).policy);

    ParamMap scalar{{"curriculum_learning", "true"}};
    EXPECT_EQ(CurriculumPolicy::EPISODE_INTERVAL, CurriculumConfig::FromParams(scalar).policy);

    ParamMap scalar_off{{"curriculum_learning", "false"}};
    EXPECT_EQ(CurriculumPolicy::FIXED, CurriculumConfig::FromParams(scalar_off).policy);

    ParamMap disabled{{"curriculum_learning.enabled", "false"},
                      {"curriculum_learning.interval", "10"}};
    EXPECT_EQ(CurriculumPolicy::FIXED, CurriculumConfig::FromParams(disabled).policy);

    ParamMap section{{"curriculum_learning.interval", "250"},
                     {"curriculum_learning.initial_max_sequence_length", "4"},
                     {"curriculum_learning.must_finish", "no"}};
    CurriculumConfig config = CurriculumConfig::FromParams(section);
    EXPECT_EQ(CurriculumPolicy::EPISODE_INTERVAL, config.policy);
    EXPECT_EQ(250u, config.interval);
    EXPECT_EQ(4u, config.initial_max_sequence_length);
    EXPECT_FALSE(config.must_finish);
}

TEST(CurriculumConfigTest, Validation) {
    EXPECT_TRUE(EpisodeConfig(100, 0).Validate());
    EXPECT_FALSE(EpisodeConfig(0, 0).Validate());
    EXPECT_FALSE(EpisodeConfig(100, 0, 0).Validate());
    EXPECT_FALSE(LossConfig(0.0).Validate());
    EXPECT_FALSE(LossConfig(std::numeric_limits<double>::quiet_NaN()).Validate());
    EXPECT_FALSE(LossConfig(std::numeric_limits<double>::infinity()).Validate());

    // Fixed curricula ignore the progression keys
    CurriculumConfig fixed;
    fixed.interval = 0;
    fixed.step = 0;
    EXPECT_TRUE(fixed.Validate());
}

// ============================================================================
// Curriculum
// ============================================================================

TEST(CurriculumConfigTest, NonFiniteLossThresholdIsRejected) {
    ParamMap params{
        {"curriculum_learning.policy", "loss"},
        {"curriculum_learning.loss_threshold", "nan"},
    };
    try {
        CurriculumConfig::FromParams(params);
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ("loss_threshold", e.key());
    }
}

TEST(CurriculumTest, FixedStartsAtMaximum) {
    Curriculum curriculum(1, 10, CurriculumConfig{});

    EXPECT_EQ(10u, curriculum.GetCurrentMax());
    EXPECT_TRUE(curriculum.IsDone());
    EXPECT_FALSE(curriculum.Advance(ProgressSignal::Episode(100000)));
    EXPECT_EQ(10u, curriculum.GetCurrentMax());
}

TEST(CurriculumTest, ConstructorRejectsBadRange) {
    EXPECT_THROW(Curriculum(0, 10, CurriculumConfig{}), ConfigError);
    EXPECT_THROW(Curriculum(5, 4, CurriculumConfig{}), ConfigError);
    EXPECT_THROW(Curriculum(1, 4, EpisodeConfig(0, 1)), ConfigError);
}

TEST(CurriculumTest, InitialMaximumIsClamped) {
    EXPECT_EQ(1u, Curriculum(1, 10, EpisodeConfig(10, 0)).GetCurrentMax());
    EXPECT_EQ(3u, Curriculum(3, 10, EpisodeConfig(10, 1)).GetCurrentMax());
    EXPECT_EQ(10u, Curriculum(1, 10, EpisodeConfig(10, 50)).GetCurrentMax());
}

TEST(CurriculumTest, EpisodeIntervalSchedule) {
    Curriculum curriculum(1, 10, EpisodeConfig(100, 2, 2));
    EXPECT_EQ(2u, curriculum.GetCurrentMax());

    EXPECT_FALSE(curriculum.Advance(ProgressSignal::Episode(99)));
    EXPECT_EQ(2u, curriculum.GetCurrentMax());

    EXPECT_TRUE(curriculum.Advance(ProgressSignal::Episode(100)));
    EXPECT_EQ(4u, curriculum.GetCurrentMax());

    EXPECT_TRUE(curriculum.Advance(ProgressSignal::Episode(350)));
    EXPECT_EQ(8u, curriculum.GetCurrentMax());
    EXPECT_EQ(2u, curriculum.GetState().transitions);

    EXPECT_TRUE(curriculum.Advance(ProgressSignal::Episode(1000)));
    EXPECT_EQ(10u, curriculum.GetCurrentMax());
    EXPECT_TRUE(curriculum.IsDone());
}

TEST(CurriculumTest, NeverDecreases) {
    Curriculum curriculum(1, 10, EpisodeConfig(10, 1));
    curriculum.Advance(ProgressSignal::Episode(50));
    EXPECT_EQ(6u, curriculum.GetCurrentMax());

    // An earlier episode replayed does not shrink the maximum
    EXPECT_FALSE(curriculum.Advance(ProgressSignal::Episode(20)));
    EXPECT_EQ(6u, curriculum.GetCurrentMax());
    EXPECT_EQ(20u, curriculum.GetState().last_episode);
}

TEST(CurriculumTest, EpisodePolicyIgnoresLossSignals) {
    Curriculum curriculum(1, 10, EpisodeConfig(10, 1));
    EXPECT_FALSE(curriculum.Advance(ProgressSignal::Loss(0.0)));
    EXPECT_EQ(1u, curriculum.GetCurrentMax());
    EXPECT_DOUBLE_EQ(0.0, curriculum.GetState().last_loss);
}

TEST(CurriculumTest, HugeEpisodeSaturates) {
    Curriculum curriculum(1, 10, EpisodeConfig(1, 1, 1000));
    EXPECT_TRUE(curriculum.Advance(ProgressSignal::Episode(UINT64_MAX)));
    EXPECT_EQ(10u, curriculum.GetCurrentMax());
}

TEST(CurriculumTest, LossThresholdSchedule) {
    Curriculum curriculum(2, 6, LossConfig(0.1, 3));
    EXPECT_EQ(2u, curriculum.GetCurrentMax());

    EXPECT_FALSE(curriculum.Advance(ProgressSignal::Loss(0.5)));
    EXPECT_FALSE(curriculum.Advance(ProgressSignal::Loss(0.1)));
    EXPECT_EQ(2u, curriculum.GetCurrentMax());

    EXPECT_TRUE(curriculum.Advance(ProgressSignal::Loss(0.05)));
    EXPECT_EQ(5u, curriculum.GetCurrentMax());
    EXPECT_DOUBLE_EQ(0.05, curriculum.GetState().last_loss);

    EXPECT_TRUE(curriculum.Advance(ProgressSignal::Loss(0.01)));
    EXPECT_EQ(6u, curriculum.GetCurrentMax());
    EXPECT_TRUE(curriculum.IsDone());

    // Terminal
    EXPECT_FALSE(curriculum.Advance(ProgressSignal::Loss(0.0)));
    EXPECT_EQ(6u, curriculum.GetCurrentMax());
    EXPECT_EQ(2u, curriculum.GetState().transitions);
}

TEST(CurriculumTest, LossPolicyIgnoresEpisodeSignals) {
    Curriculum curriculum(1, 5, LossConfig(0.5));
    EXPECT_FALSE(curriculum.Advance(ProgressSignal::Episode(1000)));
    EXPECT_EQ(1u, curriculum.GetCurrentMax());
}

TEST(CurriculumTest, RestoreValidatesState) {
    Curriculum curriculum(1, 10, EpisodeConfig(10, 1));

    CurriculumState state = curriculum.GetState();
    state.current_allowed_max = 7;
    state.last_episode = 60;
    state.transitions = 3;
    curriculum.Restore(state);
    EXPECT_EQ(7u, curriculum.GetCurrentMax());
    EXPECT_EQ(60u, curriculum.GetState().last_episode);

    CurriculumState out_of_range = state;
    out_of_range.current_allowed_max = 11;
    EXPECT_THROW(curriculum.Restore(out_of_range), ConfigError);

    CurriculumState other_range = state;
    other_range.max_sequence_length = 20;
    EXPECT_THROW(curriculum.Restore(other_range), ConfigError);

    CurriculumState other_policy = state;
    other_policy.policy = CurriculumPolicy::LOSS_THRESHOLD;
    EXPECT_THROW(curriculum.Restore(other_policy), ConfigError);

    // A failed restore leaves the state untouched
    EXPECT_EQ(7u, curriculum.GetCurrentMax());
}

TEST(CurriculumStateTest, ToString) {
    Curriculum curriculum(1, 4, LossConfig(0.2));
    std::string text = curriculum.GetState().ToString();
    EXPECT_NE(std::string::npos, text.find("loss"));
    EXPECT_NE(std::string::npos, text.find("range=[1, 4]"));
    EXPECT_NE(std::string::npos, text.find("current_max=1"));
    EXPECT_EQ(std::string::npos, text.find("done"));
}

} // namespace
} // namespace algoseq
