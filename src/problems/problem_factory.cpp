// File: src/problems/problem_factory.cpp
#include "problems/problem_factory.hpp"
#include "core/errors.hpp"
#include "problems/algorithmic_seq_to_seq_problem.hpp"
#include "problems/variants/distraction_variants.hpp"
#include "problems/variants/interruption_variants.hpp"
#include "problems/variants/manipulation_variants.hpp"
#include "problems/variants/recall_variants.hpp"
#include "problems/variants/span_variants.hpp"
#include <stdexcept>

namespace algoseq {

// ============================================================================
// ProblemRegistry
// ============================================================================

void ProblemRegistry::Register(const std::string& name, VariantCreator creator) {
    if (name.empty()) {
        throw std::invalid_argument("ProblemRegistry: name must not be empty");
    }
    if (!creator) {
        throw std::invalid_argument("ProblemRegistry: creator for " + name + " is empty");
    }
    if (!creators_.emplace(name, std::move(creator)).second) {
        throw std::invalid_argument("ProblemRegistry: " + name + " is already registered");
    }
}

bool ProblemRegistry::Contains(const std::string& name) const {
    return creators_.find(name) != creators_.end();
}

const ProblemRegistry::VariantCreator& ProblemRegistry::Get(const std::string& name) const {
    auto it = creators_.find(name);
    if (it == creators_.end()) {
        throw UnknownProblemError(name);
    }
    return it->second;
}

std::vector<std::string> ProblemRegistry::GetNames() const {
    std::vector<std::string> names;
    names.reserve(creators_.size());
    for (const auto& [name, creator] : creators_) {
        names.push_back(name);
    }
    return names;
}

// ============================================================================
// Built-in variants
// ============================================================================

namespace {

ProblemRegistry MakeBuiltinRegistry() {
    ProblemRegistry registry;

    // Recall
    registry.Register("SerialRecall", [] { return std::make_unique<SerialRecall>(); });
    registry.Register("ReverseRecall", [] { return std::make_unique<ReverseRecall>(); });
    registry.Register("RepeatSerialRecall", [] { return std::make_unique<RepeatRecall>(false); });
    registry.Register("RepeatReverseRecall", [] { return std::make_unique<RepeatRecall>(true); });
    registry.Register("ScratchPad", [] { return std::make_unique<ScratchPad>(); });
    registry.Register("SkipRecall", [] { return std::make_unique<SkipRecall>(); });

    // Manipulation
    registry.Register("ManipulationSpatialNot",
                      [] { return std::make_unique<ManipulationSpatialNot>(); });
    registry.Register("ManipulationSpatialRotation",
                      [] { return std::make_unique<ManipulationSpatialRotation>(); });
    registry.Register("ManipulationTemporalSwap",
                      [] { return std::make_unique<ManipulationTemporalSwap>(); });

    // Distraction
    registry.Register("DistractionIgnore",
                      [] { return std::make_unique<DistractionVariant>(DistractionMode::IGNORE); });
    registry.Register("DistractionCarry",
                      [] { return std::make_unique<DistractionVariant>(DistractionMode::CARRY); });
    registry.Register("DistractionForget",
                      [] { return std::make_unique<DistractionVariant>(DistractionMode::FORGET); });

    // Interruption
    registry.Register("InterruptionNot",
                      [] { return std::make_unique<InterruptionVariant>(InterruptionTask::NOT); });
    registry.Register("InterruptionReverseRecall", [] {
        return std::make_unique<InterruptionVariant>(InterruptionTask::REVERSE_RECALL);
    });
    registry.Register("InterruptionSwapRecall", [] {
        return std::make_unique<InterruptionVariant>(InterruptionTask::SWAP_RECALL);
    });

    // Complex span
    registry.Register("OperationSpan", [] { return std::make_unique<OperationSpan>(); });
    registry.Register("ReadingSpan", [] { return std::make_unique<ReadingSpan>(); });

    return registry;
}

} // anonymous namespace

const ProblemRegistry& BuiltinRegistry() {
    static const ProblemRegistry registry = MakeBuiltinRegistry();
    return registry;
}

// ============================================================================
// ProblemFactory
// ============================================================================

ProblemFactory::ProblemFactory(const ProblemRegistry& registry)
    : registry_(registry) {
}

std::unique_ptr<Problem> ProblemFactory::Create(const std::string& name,
                                                const ProblemConfig& config) const {
    const auto& creator = registry_.Get(name);

    ProblemConfig named = config;
    named.name = name;
    return std::make_unique<AlgorithmicSeqToSeqProblem>(creator(), named);
}

std::unique_ptr<Problem> ProblemFactory::Create(const ProblemConfig& config) const {
    return Create(config.name, config);
}

} // namespace algoseq
