// File: src/config/config_loader.cpp
//
// YAML Experiment Configuration Implementation

#include "config/config_loader.hpp"
#include <yaml.h>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <vector>

namespace algoseq {

namespace {

const char* kProblemSection = "problem";
const char* kCurriculumSection = "curriculum_learning";
const char* kSeedKey = "seed_numpy";
const char* kMergeKey = "<<";

// Helper function to read string from YAML scalar
std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                       event->data.scalar.length);
}

std::string GetAnchor(yaml_char_t* anchor) {
    return anchor ? std::string(reinterpret_cast<char*>(anchor)) : std::string();
}

std::string JoinKey(const std::string& prefix, const std::string& key) {
    if (prefix.empty()) return key;
    if (key.empty()) return prefix;
    return prefix + "." + key;
}

/// Entries at or below path, keyed relative to it ("" for path itself)
ParamMap Subtree(const ParamMap& values, const std::string& path) {
    ParamMap result;
    for (const auto& [key, value] : values) {
        if (path.empty()) {
            result.Set(key, value);
        } else if (key == path) {
            result.Set("", value);
        } else if (key.size() > path.size() && key.compare(0, path.size(), path) == 0 &&
                   key[path.size()] == '.') {
            result.Set(key.substr(path.size() + 1), value);
        }
    }
    return result;
}

/// Flattens the event stream of one document into dotted keys
class YamlFlattener {
public:
    explicit YamlFlattener(ParamMap& values) : values_(values) {}

    void OnScalar(const std::string& value, const std::string& anchor) {
        if (!stack_.empty() && !stack_.back().is_sequence && !stack_.back().has_pending_key) {
            stack_.back().pending_key = value;
            stack_.back().has_pending_key = true;
            return;
        }

        std::string path = NextValuePath();
        values_.Set(path, value);
        if (!anchor.empty()) {
            anchors_[anchor] = ParamMap{{"", value}};
        }
    }

    void OnCollectionStart(bool is_sequence, const std::string& anchor) {
        Node node;
        node.is_sequence = is_sequence;
        node.anchor = anchor;
        node.path = stack_.empty() ? std::string() : NextValuePath();
        stack_.push_back(node);
    }

    void OnCollectionEnd() {
        if (stack_.empty()) {
            return;
        }
        Node node = stack_.back();
        stack_.pop_back();
        if (!node.anchor.empty()) {
            anchors_[node.anchor] = Subtree(values_, node.path);
        }
    }

    /// @return false if the alias has no matching anchor
    bool OnAlias(const std::string& anchor) {
        auto it = anchors_.find(anchor);
        if (it == anchors_.end()) {
            return false;
        }

        // "<<: *anchor" merges into the enclosing mapping without
        // overriding keys that are already set
        if (!stack_.empty() && !stack_.back().is_sequence && stack_.back().has_pending_key &&
            stack_.back().pending_key == kMergeKey) {
            Node& node = stack_.back();
            node.has_pending_key = false;
            node.pending_key.clear();
            for (const auto& [key, value] : it->second) {
                std::string path = JoinKey(node.path, key);
                if (!values_.Has(path)) {
                    values_.Set(path, value);
                }
            }
            return true;
        }

        std::string path = NextValuePath();
        for (const auto& [key, value] : it->second) {
            values_.Set(JoinKey(path, key), value);
        }
        return true;
    }

private:
    struct Node {
        bool is_sequence{false};
        std::string path;
        std::string anchor;
        std::string pending_key;
        bool has_pending_key{false};
        size_t next_index{0};
    };

    ParamMap& values_;
    std::vector<Node> stack_;
    std::map<std::string, ParamMap> anchors_;

    /// Path of the value that follows in the innermost collection
    std::string NextValuePath() {
        if (stack_.empty()) {
            return std::string();
        }
        Node& node = stack_.back();
        if (node.is_sequence) {
            return JoinKey(node.path, std::to_string(node.next_index++));
        }
        node.has_pending_key = false;
        return JoinKey(node.path, node.pending_key);
    }
};

} // anonymous namespace

std::optional<ExperimentConfig> ExperimentConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<ExperimentConfig> ExperimentConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    // Set input string
    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    ExperimentConfig config;
    YamlFlattener flattener(config.values);

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error";
            if (parser.problem) {
                std::cerr << ": " << parser.problem << " (line "
                          << parser.problem_mark.line + 1 << ")";
            }
            std::cerr << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_MAPPING_START_EVENT:
                flattener.OnCollectionStart(false, GetAnchor(event.data.mapping_start.anchor));
                break;

            case YAML_SEQUENCE_START_EVENT:
                flattener.OnCollectionStart(true, GetAnchor(event.data.sequence_start.anchor));
                break;

            case YAML_MAPPING_END_EVENT:
            case YAML_SEQUENCE_END_EVENT:
                flattener.OnCollectionEnd();
                break;

            case YAML_SCALAR_EVENT:
                flattener.OnScalar(GetScalarValue(&event), GetAnchor(event.data.scalar.anchor));
                break;

            case YAML_ALIAS_EVENT: {
                std::string anchor = GetAnchor(event.data.alias.anchor);
                if (!flattener.OnAlias(anchor)) {
                    std::cerr << "YAML alias refers to unknown anchor: " << anchor << std::endl;
                    yaml_event_delete(&event);
                    yaml_parser_delete(&parser);
                    return std::nullopt;
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    // Validate configuration
    if (!config.Validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

ParamMap ExperimentConfig::LoadProblemParams(const std::string& phase) const {
    ParamMap params = values.WithPrefix(JoinKey(phase, kProblemSection));

    std::string curriculum_path = JoinKey(phase, kCurriculumSection);
    if (auto flag = values.Get(curriculum_path)) {
        params.Set(kCurriculumSection, *flag);
    }
    for (const auto& [key, value] : values.WithPrefix(curriculum_path)) {
        params.Set(JoinKey(kCurriculumSection, key), value);
    }

    if (!params.Has("seed")) {
        if (auto seed = values.Get(JoinKey(phase, kSeedKey))) {
            params.Set("seed", *seed);
        }
    }
    return params;
}

std::vector<std::string> ExperimentConfig::GetPhases() const {
    std::vector<std::string> phases;
    std::string suffix = std::string(".") + kProblemSection + ".";
    for (const auto& [key, value] : values) {
        size_t pos = key.find(suffix);
        if (pos == std::string::npos || pos == 0 || key.find('.') != pos) {
            continue;
        }
        std::string phase = key.substr(0, pos);
        if (phases.empty() || phases.back() != phase) {
            phases.push_back(phase);
        }
    }
    return phases;
}

bool ExperimentConfig::HasPhase(const std::string& phase) const {
    return values.HasSection(JoinKey(phase, kProblemSection));
}

bool ExperimentConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> ExperimentConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    std::vector<std::string> phases = GetPhases();
    if (phases.empty()) {
        errors.push_back("no section contains a problem definition");
    }

    for (const auto& phase : phases) {
        if (!values.Has(JoinKey(phase, kProblemSection) + ".name")) {
            errors.push_back(phase + ".problem.name is missing");
        }
    }

    return errors;
}

} // namespace algoseq
