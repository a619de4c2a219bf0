/**
 * @file Config.hpp
 * @brief Layered tool settings with dot-path access
 *
 * Precedence (later wins):
 * 1. default_settings()
 * 2. Optional JSON/TOML settings file
 * 3. Environment variables with the prefix (ONTODIFF_MERGE_STRATEGY →
 *    merge.strategy), values typed by parse_value()
 * 4. Explicit overrides ("merge.strategy:theirs, ...")
 * 5. Mandatory-key enforcement
 */

#ifndef ONTODIFF_CONFIG_HPP
#define ONTODIFF_CONFIG_HPP

#include "ontodiff/Merge.hpp"
#include "ontodiff/SemanticDebt.hpp"
#include "ontodiff/Value.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace ontodiff {

/// Environment prefix used by the command-line tool
inline constexpr const char* kEnvPrefix = "ONTODIFF";

/**
 * @brief Built-in settings
 *
 * | Key                                 | Default |
 * |-------------------------------------|---------|
 * | analysis.similarity_threshold       | 0.8     |
 * | analysis.review_warning_threshold   | 3       |
 * | merge.strategy                      | "ours"  |
 * | validation.reject_duplicates        | false   |
 * | logging.level                       | "warn"  |
 * | output.indent                       | 2       |
 */
Value default_settings();

/**
 * @brief Options for constructing a Config from multiple sources.
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> prefix;      // Environment variable prefix, e.g. "ONTODIFF"
    std::map<std::string, Value> overrides; // final precedence
    Value defaults = default_settings();
    std::vector<std::string> mandatory;
};

/**
 * @brief Map an environment variable name (prefix stripped) to a dot-path
 *
 * "__" stands for a literal underscore and "_" for a dot. When that path
 * is not a known key, a known key whose underscores and dots all read as
 * "_" is used instead, so ANALYSIS_SIMILARITY_THRESHOLD finds
 * "analysis.similarity_threshold".
 */
std::string env_name_to_path(const std::string& name, const std::set<std::string>& known_keys);

/**
 * @brief Dot-paths of every leaf in a tree
 */
std::set<std::string> leaf_paths(const Value& data);

class Config {
public:
    Config() = default;
    explicit Config(Value data) : data_(std::move(data)) {}

    // Load using the precedence: defaults -> file -> env (prefix) -> overrides
    static Config load(const LoadOptions& opts);

    const Value& data() const noexcept { return data_; }
    Value& data() noexcept { return data_; }

    // Dot helpers
    const Value& at(const std::string& path) const;
    bool contains(const std::string& path) const;
    void set(const std::string& path, const Value& v);

    /**
     * @brief Typed lookup with fallback for missing or mistyped values
     */
    template <typename T>
    T get(const std::string& path, const T& fallback) const {
        if (!contains(path)) return fallback;
        try {
            return at(path).get<T>();
        } catch (const nlohmann::json::exception&) {
            return fallback;
        }
    }

    // Enforcement
    void enforce_mandatory(const std::vector<std::string>& keys) const;

    std::string to_json_string(int indent = 2) const;

    // ENV / Overrides
    void apply_env_prefix(const std::string& prefix);
    void apply_overrides(const std::map<std::string, Value>& kv);

private:
    Value data_ = Value::object();
};

/**
 * @brief Typed view of the settings the engines consume
 */
struct EngineSettings {
    AnalyzerOptions analyzer;
    MergeStrategy merge_strategy = MergeStrategy::Ours;
    bool reject_duplicates = false;
    std::string log_level = "warn";
    int indent = 2;

    /**
     * @throws Error for an unknown merge strategy or a threshold outside [0, 1]
     */
    static EngineSettings from(const Config& config);
};

} // namespace ontodiff

#endif // ONTODIFF_CONFIG_HPP
