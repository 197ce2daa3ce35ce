// File: src/config/param_map.cpp
#include "config/param_map.hpp"
#include "core/errors.hpp"
#include <cmath>
#include <sstream>

namespace algoseq {

std::optional<bool> ParseBool(const std::string& value) {
    if (value == "true" || value == "True" || value == "TRUE" ||
        value == "yes" || value == "Yes" || value == "YES" ||
        value == "1" || value == "on" || value == "On" || value == "ON") {
        return true;
    }
    if (value == "false" || value == "False" || value == "FALSE" ||
        value == "no" || value == "No" || value == "NO" ||
        value == "0" || value == "off" || value == "Off" || value == "OFF") {
        return false;
    }
    return std::nullopt;
}

void ParamMap::Set(const std::string& key, const std::string& value) {
    data_[key] = value;
}

bool ParamMap::Has(const std::string& key) const {
    return data_.find(key) != data_.end();
}

bool ParamMap::HasSection(const std::string& prefix) const {
    std::string dotted = prefix + ".";
    auto it = data_.lower_bound(dotted);
    return it != data_.end() && it->first.compare(0, dotted.size(), dotted) == 0;
}

std::optional<std::string> ParamMap::Get(const std::string& key) const {
    auto it = data_.find(key);
    if (it == data_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ParamMap::Remove(const std::string& key) {
    data_.erase(key);
}

std::vector<std::string> ParamMap::GetKeys() const {
    std::vector<std::string> keys;
    keys.reserve(data_.size());
    for (const auto& [key, _] : data_) {
        keys.push_back(key);
    }
    return keys;
}

ParamMap ParamMap::WithPrefix(const std::string& prefix) const {
    ParamMap result;
    std::string dotted = prefix + ".";
    for (auto it = data_.lower_bound(dotted); it != data_.end(); ++it) {
        if (it->first.compare(0, dotted.size(), dotted) != 0) {
            break;
        }
        result.Set(it->first.substr(dotted.size()), it->second);
    }
    return result;
}

void ParamMap::Merge(const ParamMap& other) {
    for (const auto& [key, value] : other.data_) {
        data_[key] = value;
    }
}

// ============================================================================
// Typed access
// ============================================================================

std::string ParamMap::GetString(const std::string& key, const std::string& default_value) const {
    auto value = Get(key);
    return value.has_value() ? value.value() : default_value;
}

int64_t ParamMap::GetInt(const std::string& key, int64_t default_value) const {
    auto value = Get(key);
    if (!value.has_value()) {
        return default_value;
    }

    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value.value(), &consumed);
    } catch (const std::invalid_argument&) {
        throw ConfigError(key, "expected an integer, got '" + value.value() + "'");
    } catch (const std::out_of_range&) {
        throw ConfigError(key, "integer out of range: '" + value.value() + "'");
    }

    if (consumed != value->size()) {
        throw ConfigError(key, "expected an integer, got '" + value.value() + "'");
    }
    return static_cast<int64_t>(parsed);
}

double ParamMap::GetDouble(const std::string& key, double default_value) const {
    auto value = Get(key);
    if (!value.has_value()) {
        return default_value;
    }

    size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value.value(), &consumed);
    } catch (const std::invalid_argument&) {
        throw ConfigError(key, "expected a number, got '" + value.value() + "'");
    } catch (const std::out_of_range&) {
        throw ConfigError(key, "number out of range: '" + value.value() + "'");
    }

    if (consumed != value->size()) {
        throw ConfigError(key, "expected a number, got '" + value.value() + "'");
    }
    if (!std::isfinite(parsed)) {
        throw ConfigError(key, "must be a finite number, got '" + value.value() + "'");
    }
    return parsed;
}

bool ParamMap::GetBool(const std::string& key, bool default_value) const {
    auto value = Get(key);
    if (!value.has_value()) {
        return default_value;
    }

    auto parsed = ParseBool(value.value());
    if (!parsed.has_value()) {
        throw ConfigError(key, "expected a boolean, got '" + value.value() + "'");
    }
    return parsed.value();
}

uint64_t ParamMap::GetUint64(const std::string& key, uint64_t default_value) const {
    auto value = Get(key);
    if (!value.has_value()) {
        return default_value;
    }

    // stoull silently wraps negative input
    if (value->find_first_of("-+") != std::string::npos) {
        throw ConfigError(key, "expected an unsigned integer, got '" + value.value() + "'");
    }

    size_t consumed = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(value.value(), &consumed);
    } catch (const std::invalid_argument&) {
        throw ConfigError(key, "expected an unsigned integer, got '" + value.value() + "'");
    } catch (const std::out_of_range&) {
        throw ConfigError(key, "integer out of range: '" + value.value() + "'");
    }

    if (consumed != value->size()) {
        throw ConfigError(key, "expected an unsigned integer, got '" + value.value() + "'");
    }
    return static_cast<uint64_t>(parsed);
}

size_t ParamMap::GetSize(const std::string& key, size_t default_value) const {
    if (!Has(key)) {
        return default_value;
    }
    int64_t value = GetInt(key, 0);
    if (value < 0) {
        throw ConfigError(key, "must not be negative (got " + std::to_string(value) + ")");
    }
    return static_cast<size_t>(value);
}

std::string ParamMap::RequireString(const std::string& key) const {
    auto value = Get(key);
    if (!value.has_value()) {
        throw ConfigError(key, "missing required key");
    }
    return value.value();
}

int64_t ParamMap::RequireInt(const std::string& key) const {
    if (!Has(key)) {
        throw ConfigError(key, "missing required key");
    }
    return GetInt(key, 0);
}

std::string ParamMap::ToString() const {
    std::ostringstream oss;
    for (const auto& [key, value] : data_) {
        oss << key << ": " << value << "\n";
    }
    return oss.str();
}

} // namespace algoseq
