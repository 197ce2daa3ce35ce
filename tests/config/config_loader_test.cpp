// File: tests/config/config_loader_test.cpp
//
// Tests for the YAML experiment configuration

#include "config/config_loader.hpp"
#include "problems/problem_config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace algoseq;

class ConfigLoaderTest : public ::testing::Test {
protected:
    std::string temp_config_path = "/tmp/algoseq_test_experiment.yaml";

    void TearDown() override {
        // Clean up temp file
        std::filesystem::remove(temp_config_path);
    }
};

TEST_F(ConfigLoaderTest, FlattensNestedMappings) {
    std::string yaml = R"(
training:
  problem:
    name: SerialRecall
    batch_size: 64
    control_bits: 2
    data_bits: 8
    min_sequence_length: 1
    max_sequence_length: 10
  seed_numpy: 42
)";

    auto config = ExperimentConfig::LoadFromString(yaml);
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ("SerialRecall", config->values.GetString("training.problem.name", ""));
    EXPECT_EQ("64", config->values.GetString("training.problem.batch_size", ""));
    EXPECT_EQ("42", config->values.GetString("training.seed_numpy", ""));
    EXPECT_EQ(std::vector<std::string>{"training"}, config->GetPhases());
    EXPECT_TRUE(config->HasPhase("training"));
    EXPECT_FALSE(config->HasPhase("testing"));
}

TEST_F(ConfigLoaderTest, LoadProblemParamsCollectsPhaseKeys) {
    std::string yaml = R"(
training:
  problem:
    name: ReverseRecall
    batch_size: 32
    control_bits: 2
    data_bits: 8
    min_sequence_length: 1
    max_sequence_length: 10
  curriculum_learning:
    interval: 100
    initial_max_sequence_length: 3
  seed_numpy: 7
validation:
  problem:
    name: ReverseRecall
    batch_size: 16
    control_bits: 2
    data_bits: 8
    min_sequence_length: 5
    max_sequence_length: 20
    seed: 3
  seed_numpy: 99
)";

    auto config = ExperimentConfig::LoadFromString(yaml);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ((std::vector<std::string>{"training", "validation"}), config->GetPhases());

    ParamMap training = config->LoadProblemParams("training");
    EXPECT_EQ("ReverseRecall", training.GetString("name", ""));
    EXPECT_EQ("100", training.GetString("curriculum_learning.interval", ""));
    EXPECT_EQ("3", training.GetString("curriculum_learning.initial_max_sequence_length", ""));
    EXPECT_EQ("7", training.GetString("seed", ""));

    ProblemConfig problem = ProblemConfig::FromParams(training);
    EXPECT_EQ(CurriculumPolicy::EPISODE_INTERVAL, problem.curriculum.policy);
    EXPECT_EQ(100u, problem.curriculum.interval);
    EXPECT_EQ(7u, problem.seed);

    // The problem section's own seed wins over seed_numpy
    ParamMap validation = config->LoadProblemParams("validation");
    EXPECT_EQ("3", validation.GetString("seed", ""));
    EXPECT_FALSE(validation.HasSection("curriculum_learning"));
}

TEST_F(ConfigLoaderTest, ScalarCurriculumFlag) {
    std::string yaml = R"(
training:
  problem:
    name: SerialRecall
  curriculum_learning: true
)";

    auto config = ExperimentConfig::LoadFromString(yaml);
    ASSERT_TRUE(config.has_value());

    ParamMap params = config->LoadProblemParams("training");
    EXPECT_EQ("true", params.GetString("curriculum_learning", ""));
}

TEST_F(ConfigLoaderTest, ResolvesAnchorsAndAliases) {
    std::string yaml = R"(
training:
  problem: &problem
    name: SerialRecall
    batch_size: 64
    control_bits: 2
    data_bits: 8
    min_sequence_length: 1
    max_sequence_length: 10
testing:
  problem: *problem
)";

    auto config = ExperimentConfig::LoadFromString(yaml);
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ(config->LoadProblemParams("training"), config->LoadProblemParams("testing"));
}

TEST_F(ConfigLoaderTest, MergeKeysKeepExplicitValues) {
    std::string yaml = R"(
training:
  problem: &problem
    name: SerialRecall
    batch_size: 64
    control_bits: 2
    data_bits: 8
    min_sequence_length: 1
    max_sequence_length: 10
validation:
  problem:
    batch_size: 8
    <<: *problem
    max_sequence_length: 20
)";

    auto config = ExperimentConfig::LoadFromString(yaml);
    ASSERT_TRUE(config.has_value());

    ParamMap validation = config->LoadProblemParams("validation");
    EXPECT_EQ("SerialRecall", validation.GetString("name", ""));
    EXPECT_EQ("8", validation.GetString("batch_size", ""));
    EXPECT_EQ("20", validation.GetString("max_sequence_length", ""));
    EXPECT_EQ("8", validation.GetString("data_bits", ""));
}

TEST_F(ConfigLoaderTest, ScalarAnchorsAndSequences) {
    std::string yaml = R"(
bits: &bits 8
training:
  problem:
    name: SerialRecall
    data_bits: *bits
  tags: [recall, short]
)";

    auto config = ExperimentConfig::LoadFromString(yaml);
    ASSERT_TRUE(config.has_value());

    EXPECT_EQ("8", config->values.GetString("training.problem.data_bits", ""));
    EXPECT_EQ("recall", config->values.GetString("training.tags.0", ""));
    EXPECT_EQ("short", config->values.GetString("training.tags.1", ""));
}

TEST_F(ConfigLoaderTest, UnknownAliasFails) {
    std::string yaml = R"(
training:
  problem: *missing
)";

    EXPECT_FALSE(ExperimentConfig::LoadFromString(yaml).has_value());
}

TEST_F(ConfigLoaderTest, InvalidYamlFails) {
    std::string yaml = "training: [unclosed\n  problem: {";
    EXPECT_FALSE(ExperimentConfig::LoadFromString(yaml).has_value());
}

TEST_F(ConfigLoaderTest, ValidationRequiresProblemSection) {
    EXPECT_FALSE(ExperimentConfig::LoadFromString("training:\n  seed_numpy: 1\n").has_value());

    std::string missing_name = R"(
training:
  problem:
    batch_size: 8
)";
    EXPECT_FALSE(ExperimentConfig::LoadFromString(missing_name).has_value());

    ExperimentConfig empty;
    EXPECT_FALSE(empty.Validate());
    EXPECT_FALSE(empty.GetValidationErrors().empty());
}

TEST_F(ConfigLoaderTest, LoadFromFile) {
    std::ofstream file(temp_config_path);
    file << "training:\n"
         << "  problem:\n"
         << "    name: ScratchPad\n"
         << "    max_subsequences: 4\n";
    file.close();

    auto config = ExperimentConfig::LoadFromFile(temp_config_path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ("4", config->LoadProblemParams("training").GetString("max_subsequences", ""));
}

TEST_F(ConfigLoaderTest, MissingFileFails) {
    EXPECT_FALSE(ExperimentConfig::LoadFromFile("/tmp/algoseq_does_not_exist.yaml").has_value());
}
