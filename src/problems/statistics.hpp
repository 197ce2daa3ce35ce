// File: src/problems/statistics.hpp
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace algoseq {

/// Running aggregate of one metric (count, mean, std, min, max)
///
/// Welford's online update; Merge() uses the pairwise (Chan et al.)
/// combination so merged records match a single pass over the data.
struct RunningAggregate {
    size_t count{0};
    double mean{0.0};
    double m2{0.0};          ///< Sum of squared deviations from the mean
    double min{0.0};
    double max{0.0};

    /// Add one observation
    void Add(double value);

    /// Fold another aggregate into this one
    void Merge(const RunningAggregate& other);

    /// Mean of observations (0.0 when empty)
    double Mean() const;

    /// Population standard deviation (0.0 when empty)
    double StdDev() const;

    bool operator==(const RunningAggregate& other) const;
};

/// Mapping from metric name to running aggregate
///
/// Owned by the problem that collects it and reset at epoch boundaries.
/// Callers receive copies (read-only snapshots).
class StatisticsRecord {
public:
    using StorageType = std::map<std::string, RunningAggregate>;
    using const_iterator = StorageType::const_iterator;

    void Add(const std::string& metric, double value);

    /// Fold every aggregate of other into this record
    void Merge(const StatisticsRecord& other);

    bool Has(const std::string& metric) const;
    std::optional<RunningAggregate> Get(const std::string& metric) const;

    /// Mean of a metric (0.0 if absent)
    double Mean(const std::string& metric) const;

    std::vector<std::string> GetMetricNames() const;

    void Clear() { data_.clear(); }
    size_t Size() const { return data_.size(); }
    bool IsEmpty() const { return data_.empty(); }

    /// One line per metric: "name: mean=.. std=.. min=.. max=.. n=.."
    std::string ToString() const;

    bool operator==(const StatisticsRecord& other) const { return data_ == other.data_; }
    bool operator!=(const StatisticsRecord& other) const { return !(*this == other); }

    const_iterator begin() const { return data_.begin(); }
    const_iterator end() const { return data_.end(); }

private:
    StorageType data_;
};

} // namespace algoseq
