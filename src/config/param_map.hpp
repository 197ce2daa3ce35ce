// File: src/config/param_map.hpp
#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace algoseq {

/// Declarative key/value description of a problem
///
/// Values are kept as the scalar strings the configuration source provided.
/// Nested sections are flattened into dotted keys
/// ("curriculum_learning.interval"). Typed accessors convert on read and
/// throw ConfigError naming the key when a value does not parse.
class ParamMap {
public:
    using StorageType = std::map<std::string, std::string>;
    using const_iterator = StorageType::const_iterator;

    ParamMap() = default;
    ParamMap(std::initializer_list<StorageType::value_type> values) : data_(values) {}

    /// Set (or overwrite) a value
    void Set(const std::string& key, const std::string& value);

    /// Check if a key is present
    bool Has(const std::string& key) const;

    /// Check if any key lives under "<prefix>."
    bool HasSection(const std::string& prefix) const;

    /// Raw value lookup
    std::optional<std::string> Get(const std::string& key) const;

    void Remove(const std::string& key);

    size_t Size() const { return data_.size(); }
    bool IsEmpty() const { return data_.empty(); }

    /// All keys in sorted order
    std::vector<std::string> GetKeys() const;

    /// Keys under "<prefix>." with the prefix stripped
    ParamMap WithPrefix(const std::string& prefix) const;

    /// Copy every entry of other into this map, overriding existing keys
    void Merge(const ParamMap& other);

    // ========================================================================
    // Typed access
    // ========================================================================

    std::string GetString(const std::string& key, const std::string& default_value) const;
    int64_t GetInt(const std::string& key, int64_t default_value) const;
    double GetDouble(const std::string& key, double default_value) const;
    bool GetBool(const std::string& key, bool default_value) const;

    /// Non-negative integer; negative values are rejected with ConfigError
    size_t GetSize(const std::string& key, size_t default_value) const;

    /// Full unsigned 64-bit range (seeds); signs are rejected
    uint64_t GetUint64(const std::string& key, uint64_t default_value) const;

    /// Required variants: throw ConfigError naming the key when missing
    std::string RequireString(const std::string& key) const;
    int64_t RequireInt(const std::string& key) const;

    /// Human-readable "key: value" listing
    std::string ToString() const;

    bool operator==(const ParamMap& other) const { return data_ == other.data_; }

    const_iterator begin() const { return data_.begin(); }
    const_iterator end() const { return data_.end(); }

private:
    StorageType data_;
};

/// Parse a YAML-style boolean scalar (true/yes/on/1, false/no/off/0)
/// @return std::nullopt for anything else
std::optional<bool> ParseBool(const std::string& value);

} // namespace algoseq
