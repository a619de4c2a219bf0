/**
 * @file Config.cpp
 * @brief Layered settings: defaults, file, environment and overrides
 */

#include "ontodiff/Config.hpp"
#include "ontodiff/DotPath.hpp"
#include "ontodiff/Errors.hpp"
#include "ontodiff/Loader.hpp"
#include "ontodiff/Log.hpp"
#include "ontodiff/Parse.hpp"
#include "ontodiff/Util.hpp"

#include <algorithm>
#include <cctype>

namespace ontodiff {

Value default_settings() {
    return {
        {"analysis", {
            {"similarity_threshold", 0.8},
            {"review_warning_threshold", 3},
        }},
        {"merge", {{"strategy", "ours"}}},
        {"validation", {{"reject_duplicates", false}}},
        {"logging", {{"level", "warn"}}},
        {"output", {{"indent", 2}}},
    };
}

namespace {

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

void collect_leaves(const Value& node, const std::string& prefix, std::set<std::string>& out) {
    if (!node.is_object() || node.empty()) {
        if (!prefix.empty()) out.insert(prefix);
        return;
    }
    for (auto it = node.begin(); it != node.end(); ++it) {
        collect_leaves(it.value(), prefix.empty() ? it.key() : prefix + "." + it.key(), out);
    }
}

} // anonymous namespace

std::set<std::string> leaf_paths(const Value& data) {
    std::set<std::string> out;
    collect_leaves(data, "", out);
    return out;
}

std::string env_name_to_path(const std::string& name, const std::set<std::string>& known_keys) {
    const std::string lower = to_lower(name);

    // "\x1F" marks a literal underscore while single ones become dots
    const std::string path = replace_all(
        replace_all(replace_all(lower, "__", "\x1F"), "_", "."), "\x1F", "_");
    if (known_keys.count(path) > 0) {
        return path;
    }

    for (const auto& key : known_keys) {
        if (replace_all(key, ".", "_") == lower) {
            return key;
        }
    }
    return path;
}

Config Config::load(const LoadOptions& opts) {
    Value merged = Value::object();

    // 1) defaults
    deep_merge(merged, opts.defaults);

    // 2) file
    if (opts.file_path.has_value() && !opts.file_path->empty()) {
        deep_merge(merged, load_document(*opts.file_path));
    }

    Config cfg(merged);

    // 3) env
    if (opts.prefix.has_value() && !opts.prefix->empty()) {
        cfg.apply_env_prefix(*opts.prefix);
    }

    // 4) overrides
    cfg.apply_overrides(opts.overrides);

    // 5) mandatory
    cfg.enforce_mandatory(opts.mandatory);

    return cfg;
}

const Value& Config::at(const std::string& path) const {
    return *get_by_dot(data_, path);
}

bool Config::contains(const std::string& path) const {
    return contains_dot(data_, path);
}

void Config::set(const std::string& path, const Value& v) {
    set_by_dot(data_, path, v);
}

void Config::enforce_mandatory(const std::vector<std::string>& keys) const {
    std::vector<std::string> missing;
    for (const auto& k : keys) {
        if (!contains(k)) missing.push_back(k);
    }
    if (!missing.empty()) throw MissingMandatoryConfig(missing);
}

std::string Config::to_json_string(int indent) const {
    return data_.dump(indent);
}

void Config::apply_env_prefix(const std::string& prefix) {
    // prefix is normalized to end with '_'
    std::string normalized = prefix;
    while (!normalized.empty() && normalized.back() == '_') normalized.pop_back();
    normalized += "_";

    const std::set<std::string> known = leaf_paths(data_);

    for (const auto& [name, value] : enumerate_environment()) {
        if (name.size() <= normalized.size() || name.rfind(normalized, 0) != 0) {
            continue;
        }
        const std::string key = env_name_to_path(name.substr(normalized.size()), known);
        if (key.empty()) continue;

        logger()->debug("setting {} from {}", key, name);
        set_by_dot(data_, key, parse_value(value));
    }
}

void Config::apply_overrides(const std::map<std::string, Value>& kv) {
    for (const auto& [k, v] : kv) {
        set_by_dot(data_, k, v);
    }
}

EngineSettings EngineSettings::from(const Config& config) {
    EngineSettings s;

    const double threshold = config.get<double>("analysis.similarity_threshold", 0.8);
    if (threshold < 0.0 || threshold > 1.0) {
        throw Error("analysis.similarity_threshold must be within [0, 1], got " +
                    std::to_string(threshold));
    }
    s.analyzer.similarity_threshold = threshold;

    const int review = config.get<int>("analysis.review_warning_threshold", 3);
    s.analyzer.review_warning_threshold = static_cast<std::size_t>(std::max(review, 0));

    s.merge_strategy = parse_merge_strategy(config.get<std::string>("merge.strategy", "ours"));
    s.reject_duplicates = config.get<bool>("validation.reject_duplicates", false);
    s.log_level = config.get<std::string>("logging.level", "warn");
    s.indent = config.get<int>("output.indent", 2);
    return s;
}

} // namespace ontodiff
