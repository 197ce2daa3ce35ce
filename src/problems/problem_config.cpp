// File: src/problems/problem_config.cpp
#include "problems/problem_config.hpp"
#include "core/errors.hpp"
#include <sstream>

namespace algoseq {

namespace {
    // Required integer that must be > 0
    size_t RequirePositive(const ParamMap& params, const std::string& key) {
        int64_t value = params.RequireInt(key);
        if (value <= 0) {
            throw ConfigError(key, "must be greater than 0 (got " + std::to_string(value) + ")");
        }
        return static_cast<size_t>(value);
    }

    std::string FormatDouble(double value) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    }
}

const std::vector<std::string>& ProblemConfig::RequiredKeys() {
    static const std::vector<std::string> keys = {
        "name",
        "batch_size",
        "control_bits",
        "data_bits",
        "min_sequence_length",
        "max_sequence_length",
    };
    return keys;
}

ProblemConfig ProblemConfig::FromParams(const ParamMap& params) {
    // Report missing keys before any value is parsed
    for (const auto& key : RequiredKeys()) {
        if (!params.Has(key)) {
            throw ConfigError(key, "missing required key");
        }
    }

    ProblemConfig config;
    config.name = params.RequireString("name");
    config.batch_size = RequirePositive(params, "batch_size");
    config.control_bits = RequirePositive(params, "control_bits");
    config.data_bits = RequirePositive(params, "data_bits");
    config.min_sequence_length = RequirePositive(params, "min_sequence_length");
    config.max_sequence_length = RequirePositive(params, "max_sequence_length");

    config.bias = params.GetDouble("bias", config.bias);
    config.seed = params.GetUint64("seed", config.seed);
    config.size = params.GetSize("size", config.size);
    config.debug_logging = params.GetBool("debug_logging", config.debug_logging);

    config.curriculum = CurriculumConfig::FromParams(params);
    config.params = params;

    auto errors = config.GetValidationErrors();
    if (!errors.empty()) {
        throw ConfigError(errors.front());
    }

    return config;
}

ParamMap ProblemConfig::ToParams() const {
    ParamMap result = params;
    result.Set("name", name);
    result.Set("batch_size", std::to_string(batch_size));
    result.Set("control_bits", std::to_string(control_bits));
    result.Set("data_bits", std::to_string(data_bits));
    result.Set("min_sequence_length", std::to_string(min_sequence_length));
    result.Set("max_sequence_length", std::to_string(max_sequence_length));
    result.Set("bias", FormatDouble(bias));
    result.Set("seed", std::to_string(seed));
    result.Set("size", std::to_string(size));
    return result;
}

bool ProblemConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> ProblemConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    if (name.empty()) {
        errors.push_back("name must not be empty");
    }

    // Sizes
    if (batch_size == 0) {
        errors.push_back("batch_size must be greater than 0");
    }
    if (control_bits == 0) {
        errors.push_back("control_bits must be greater than 0");
    }
    if (data_bits == 0) {
        errors.push_back("data_bits must be greater than 0");
    }

    // Sequence lengths
    if (min_sequence_length == 0) {
        errors.push_back("min_sequence_length must be greater than 0");
    }
    if (min_sequence_length > max_sequence_length) {
        errors.push_back("min_sequence_length must be <= max_sequence_length");
    }

    if (!(bias >= 0.0 && bias <= 1.0)) {
        errors.push_back("bias must be between 0.0 and 1.0");
    }

    if (size == 0) {
        errors.push_back("size must be greater than 0");
    }

    for (const auto& error : curriculum.GetValidationErrors()) {
        errors.push_back(error);
    }

    return errors;
}

} // namespace algoseq
