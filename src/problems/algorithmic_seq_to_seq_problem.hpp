// File: src/problems/algorithmic_seq_to_seq_problem.hpp
#pragma once

#include "core/encoding.hpp"
#include "problems/curriculum.hpp"
#include "problems/problem.hpp"
#include "problems/variant_strategy.hpp"
#include <memory>

namespace algoseq {

/// Shared engine of every algorithmic sequence-to-sequence task
///
/// Composes a Curriculum (allowed length range) with a VariantStrategy
/// (frame layout and target rule). The engine owns both; batches are
/// assembled as follows:
///
/// 1. The batch stream is seeded with MixSeed(seed, batch_index)
/// 2. For each sample the batch engine draws L ~ U[min, current_allowed_max]
///    and a per-sample seed
/// 3. The variant synthesizes the sample from an engine seeded with the
///    per-sample seed (so any sample can be regenerated on its own)
/// 4. All samples are right-padded to the longest frame count
///
/// Example:
///   AlgorithmicSeqToSeqProblem problem(std::make_unique<SerialRecall>(), config);
///   SampleBatch batch = problem.GenerateBatch(0);
///   problem.CollectStatistics(predictions, batch);
///   problem.AdvanceCurriculum(ProgressSignal::Episode(1));
class AlgorithmicSeqToSeqProblem : public Problem {
public:
    /// @throws std::invalid_argument if variant is null
    /// @throws ConfigError if the configuration is invalid
    AlgorithmicSeqToSeqProblem(std::unique_ptr<VariantStrategy> variant,
                               const ProblemConfig& config);

    // ========================================================================
    // Problem interface
    // ========================================================================

    /// Reconfigure; resets the curriculum to its initial state.
    /// The previous configuration stays active if validation fails.
    void Configure(const ProblemConfig& config) override;

    SampleBatch GenerateBatch(uint64_t batch_index) override;

    StatisticsRecord CollectStatistics(const Predictions& predictions,
                                       const SampleBatch& batch) override;

    void AdvanceCurriculum(const ProgressSignal& signal) override;

    bool IsCurriculumDone() const override { return curriculum_->IsDone(); }
    CurriculumState GetCurriculumState() const override { return curriculum_->GetState(); }
    void RestoreCurriculum(const CurriculumState& state) override;

    std::string GetName() const override { return variant_->GetName(); }
    const ProblemConfig& GetConfig() const override { return config_; }

    // ========================================================================
    // Engine specific
    // ========================================================================

    /// Synthesize one unpadded sample of the given length from its own seed
    /// @throws std::invalid_argument if length == 0
    Sample GenerateSample(size_t length, uint64_t sample_seed) const;

    const VariantStrategy& GetVariant() const { return *variant_; }

private:
    std::unique_ptr<VariantStrategy> variant_;
    ProblemConfig config_;
    std::unique_ptr<Curriculum> curriculum_;

    /// Throws ShapeMismatchError if predictions cannot be scored
    void ValidatePredictions(const Predictions& predictions, const SampleBatch& batch) const;

    /// Score a validated batch into a fresh record
    StatisticsRecord ScoreBatch(const Predictions& predictions, const SampleBatch& batch) const;
};

} // namespace algoseq
