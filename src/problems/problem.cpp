// File: src/problems/problem.cpp
#include "problems/problem.hpp"
#include <iostream>

namespace algoseq {

Problem::DefaultValues Problem::GetDefaultValues() const {
    const ProblemConfig& config = GetConfig();

    DefaultValues values;
    values.input_item_size = config.InputWidth();
    values.output_item_size = config.OutputWidth();
    values.control_bits = config.control_bits;
    values.data_bits = config.data_bits;
    return values;
}

size_t Problem::GetEpochSize() const {
    const ProblemConfig& config = GetConfig();
    if (config.batch_size == 0) {
        return 0;
    }
    return (config.size + config.batch_size - 1) / config.batch_size;
}

void Problem::InitializeEpoch(size_t epoch) {
    statistics_.Clear();
    LogDebug("Epoch " + std::to_string(epoch) + " started");
}

void Problem::FinalizeEpoch(size_t epoch) {
    LogDebug("Epoch " + std::to_string(epoch) + " finished\n" + statistics_.ToString());
}

void Problem::LogDebug(const std::string& message) const {
    if (GetConfig().debug_logging) {
        std::cout << "[" << GetName() << "] " << message << std::endl;
    }
}

} // namespace algoseq
