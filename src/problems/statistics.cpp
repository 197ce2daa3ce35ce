// File: src/problems/statistics.cpp
#include "problems/statistics.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace algoseq {

// ============================================================================
// RunningAggregate
// ============================================================================

void RunningAggregate::Add(double value) {
    if (count == 0) {
        min = value;
        max = value;
    } else {
        min = std::min(min, value);
        max = std::max(max, value);
    }
    count++;
    double delta = value - mean;
    mean += delta / static_cast<double>(count);
    m2 += delta * (value - mean);
}

void RunningAggregate::Merge(const RunningAggregate& other) {
    if (other.count == 0) {
        return;
    }
    if (count == 0) {
        *this = other;
        return;
    }
    double n_a = static_cast<double>(count);
    double n_b = static_cast<double>(other.count);
    double total = n_a + n_b;
    double delta = other.mean - mean;

    mean += delta * n_b / total;
    m2 += other.m2 + delta * delta * n_a * n_b / total;
    count += other.count;
    min = std::min(min, other.min);
    max = std::max(max, other.max);
}

double RunningAggregate::Mean() const {
    return count == 0 ? 0.0 : mean;
}

double RunningAggregate::StdDev() const {
    if (count == 0) {
        return 0.0;
    }
    double variance = m2 / static_cast<double>(count);
    return variance > 0.0 ? std::sqrt(variance) : 0.0;
}

bool RunningAggregate::operator==(const RunningAggregate& other) const {
    return count == other.count && mean == other.mean &&
           m2 == other.m2 && min == other.min && max == other.max;
}

// ============================================================================
// StatisticsRecord
// ============================================================================

void StatisticsRecord::Add(const std::string& metric, double value) {
    data_[metric].Add(value);
}

void StatisticsRecord::Merge(const StatisticsRecord& other) {
    for (const auto& [metric, aggregate] : other.data_) {
        data_[metric].Merge(aggregate);
    }
}

bool StatisticsRecord::Has(const std::string& metric) const {
    return data_.find(metric) != data_.end();
}

std::optional<RunningAggregate> StatisticsRecord::Get(const std::string& metric) const {
    auto it = data_.find(metric);
    if (it == data_.end()) {
        return std::nullopt;
    }
    return it->second;
}

double StatisticsRecord::Mean(const std::string& metric) const {
    auto it = data_.find(metric);
    return it == data_.end() ? 0.0 : it->second.Mean();
}

std::vector<std::string> StatisticsRecord::GetMetricNames() const {
    std::vector<std::string> names;
    names.reserve(data_.size());
    for (const auto& [metric, _] : data_) {
        names.push_back(metric);
    }
    return names;
}

std::string StatisticsRecord::ToString() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6);
    for (const auto& [metric, aggregate] : data_) {
        oss << metric << ": mean=" << aggregate.Mean()
            << " std=" << aggregate.StdDev()
            << " min=" << aggregate.min
            << " max=" << aggregate.max
            << " n=" << aggregate.count << "\n";
    }
    return oss.str();
}

} // namespace algoseq
