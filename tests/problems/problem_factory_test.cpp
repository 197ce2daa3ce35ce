// File: tests/problems/problem_factory_test.cpp
#include "problems/problem_factory.hpp"
#include "problems/variants/recall_variants.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>

namespace algoseq {
namespace {

ProblemConfig MakeConfig() {
    ProblemConfig config;
    config.batch_size = 8;
    config.control_bits = 4;
    config.data_bits = 8;
    config.min_sequence_length = 1;
    config.max_sequence_length = 6;
    config.seed = 3;
    return config;
}

// ============================================================================
// Registry
// ============================================================================

TEST(ProblemRegistryTest, BuiltinNames) {
    std::vector<std::string> expected = {
        "DistractionCarry",
        "DistractionForget",
        "DistractionIgnore",
        "InterruptionNot",
        "InterruptionReverseRecall",
        "InterruptionSwapRecall",
        "ManipulationSpatialNot",
        "ManipulationSpatialRotation",
        "ManipulationTemporalSwap",
        "OperationSpan",
        "ReadingSpan",
        "RepeatReverseRecall",
        "RepeatSerialRecall",
        "ReverseRecall",
        "ScratchPad",
        "SerialRecall",
        "SkipRecall",
    };

    EXPECT_EQ(17u, BuiltinRegistry().Size());
    EXPECT_EQ(expected, BuiltinRegistry().GetNames());
    EXPECT_EQ(&BuiltinRegistry(), &BuiltinRegistry());
}

TEST(ProblemRegistryTest, CreatorNamesMatchRegistration) {
    const ProblemRegistry& registry = BuiltinRegistry();
    for (const auto& name : registry.GetNames()) {
        auto variant = registry.Get(name)();
        ASSERT_NE(nullptr, variant);
        EXPECT_EQ(name, variant->GetName());
    }
}

TEST(ProblemRegistryTest, LookupIsCaseSensitive) {
    EXPECT_TRUE(BuiltinRegistry().Contains("SerialRecall"));
    EXPECT_FALSE(BuiltinRegistry().Contains("serialrecall"));
    EXPECT_THROW(BuiltinRegistry().Get("serialrecall"), UnknownProblemError);
}

TEST(ProblemRegistryTest, RegisterRejectsBadEntries) {
    ProblemRegistry registry;
    registry.Register("SerialRecall", [] { return std::make_unique<SerialRecall>(); });

    EXPECT_THROW(registry.Register("SerialRecall",
                                   [] { return std::make_unique<SerialRecall>(); }),
                 std::invalid_argument);
    EXPECT_THROW(registry.Register("", [] { return std::make_unique<SerialRecall>(); }),
                 std::invalid_argument);
    EXPECT_THROW(registry.Register("Empty", ProblemRegistry::VariantCreator{}),
                 std::invalid_argument);
    EXPECT_EQ(1u, registry.Size());
}

// ============================================================================
// Factory
// ============================================================================

TEST(ProblemFactoryTest, UnknownNameThrows) {
    ProblemFactory factory(BuiltinRegistry());
    try {
        factory.Create("Nonexistent", MakeConfig());
        FAIL() << "Expected UnknownProblemError";
    } catch (const UnknownProblemError& e) {
        EXPECT_EQ("Nonexistent", e.name());
    }
}

TEST(ProblemFactoryTest, CreatesConfiguredProblems) {
    ProblemFactory factory(BuiltinRegistry());
    EXPECT_EQ(17u, factory.GetRegisteredNames().size());

    for (const auto& name : factory.GetRegisteredNames()) {
        auto problem = factory.Create(name, MakeConfig());
        ASSERT_NE(nullptr, problem);
        EXPECT_EQ(name, problem->GetName());
        EXPECT_EQ(name, problem->GetConfig().name);

        SampleBatch batch = problem->GenerateBatch(0);
        ASSERT_EQ(8u, batch.Size()) << name;
        for (const auto& sample : batch.samples) {
            EXPECT_TRUE(sample.IsConsistent()) << name;
            EXPECT_GT(sample.CountMasked(), 0u) << name;
            EXPECT_EQ(name, sample.metadata.variant);
        }
    }
}

TEST(ProblemFactoryTest, CreateByConfigName) {
    ProblemFactory factory(BuiltinRegistry());
    ProblemConfig config = MakeConfig();
    config.name = "ReverseRecall";

    auto problem = factory.Create(config);
    EXPECT_EQ("ReverseRecall", problem->GetName());

    config.name = "";
    EXPECT_THROW(factory.Create(config), UnknownProblemError);
}

TEST(ProblemFactoryTest, ConfigErrorsPropagate) {
    ProblemFactory factory(BuiltinRegistry());
    ProblemConfig config = MakeConfig();
    config.control_bits = 3;

    EXPECT_NO_THROW(factory.Create("DistractionCarry", config));
    EXPECT_THROW(factory.Create("DistractionForget", config), ConfigError);
}

TEST(ProblemFactoryTest, CustomRegistry) {
    ProblemRegistry registry;
    registry.Register("SerialRecall", [] { return std::make_unique<SerialRecall>(); });
    ProblemFactory factory(registry);

    EXPECT_EQ(std::vector<std::string>{"SerialRecall"}, factory.GetRegisteredNames());
    EXPECT_EQ(&registry, &factory.GetRegistry());
    EXPECT_THROW(factory.Create("ReverseRecall", MakeConfig()), UnknownProblemError);
}

} // namespace
} // namespace algoseq
