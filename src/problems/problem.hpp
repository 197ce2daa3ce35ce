// File: src/problems/problem.hpp
#pragma once

#include "core/sample.hpp"
#include "core/types.hpp"
#include "problems/curriculum.hpp"
#include "problems/problem_config.hpp"
#include "problems/statistics.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace algoseq {

/// Model outputs for a batch: one frame sequence per sample, each frame
/// shaped like the corresponding target frame (data_bits wide).
using Predictions = std::vector<FrameSequence>;

/// Abstract contract of a data generator
///
/// The external training loop depends on exactly three calls:
/// GenerateBatch(), CollectStatistics() and AdvanceCurriculum(). A single
/// instance must not be used from several threads at once; independent
/// instances share no state.
class Problem {
public:
    /// Sizes the model has to agree with (model/problem handshake)
    struct DefaultValues {
        size_t input_item_size{0};     ///< control_bits + data_bits
        size_t output_item_size{0};    ///< data_bits
        size_t control_bits{0};
        size_t data_bits{0};
    };

    virtual ~Problem() = default;

    // ========================================================================
    // Trainer-facing API
    // ========================================================================

    /// Validate and apply a configuration
    /// @throws ConfigError if the configuration is invalid
    virtual void Configure(const ProblemConfig& config) = 0;

    /// Generate a batch
    ///
    /// Pure function of the curriculum state, batch_index and the seed
    /// configured for this problem.
    virtual SampleBatch GenerateBatch(uint64_t batch_index) = 0;

    /// Score predictions against the batch targets (masked frames only)
    /// @return Updated statistics snapshot
    /// @throws ShapeMismatchError if prediction and target frame widths
    ///         differ; the statistics record is left unchanged
    virtual StatisticsRecord CollectStatistics(const Predictions& predictions,
                                               const SampleBatch& batch) = 0;

    /// Report training progress to the curriculum
    virtual void AdvanceCurriculum(const ProgressSignal& signal) = 0;

    // ========================================================================
    // Curriculum inspection
    // ========================================================================

    virtual bool IsCurriculumDone() const = 0;
    virtual CurriculumState GetCurriculumState() const = 0;

    /// Resume a curriculum from a checkpoint
    /// @throws ConfigError if the state does not belong to this problem
    virtual void RestoreCurriculum(const CurriculumState& state) = 0;

    // ========================================================================
    // Information
    // ========================================================================

    virtual std::string GetName() const = 0;
    virtual const ProblemConfig& GetConfig() const = 0;

    DefaultValues GetDefaultValues() const;

    /// Number of batches per epoch: ceil(size / batch_size)
    size_t GetEpochSize() const;

    // ========================================================================
    // Statistics & epochs
    // ========================================================================

    /// Read-only snapshot of the statistics record
    StatisticsRecord GetStatistics() const { return statistics_; }

    void ResetStatistics() { statistics_.Clear(); }

    /// Called by the trainer when an epoch starts; resets statistics
    virtual void InitializeEpoch(size_t epoch);

    /// Called by the trainer when an epoch ends
    virtual void FinalizeEpoch(size_t epoch);

protected:
    StatisticsRecord statistics_;

    void LogDebug(const std::string& message) const;
};

} // namespace algoseq
