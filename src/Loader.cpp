/**
 * @file Loader.cpp
 * @brief File loading implementation
 */

#include "ontodiff/Loader.hpp"
#include "ontodiff/Errors.hpp"
#include "ontodiff/Log.hpp"
#include "ontodiff/Serialize.hpp"
#include "ontodiff/Util.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace ontodiff {

namespace {

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

template <typename T>
Value streamed(const T& v) {
    std::ostringstream ss;
    ss << v;
    return Value(ss.str());
}

Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date:
            return streamed(node.as_date()->get());

        case toml::node_type::time:
            return streamed(node.as_time()->get());

        case toml::node_type::date_time:
            return streamed(node.as_date_time()->get());

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string content = read_file(path);
    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ModelParseError(path, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << e.source().begin.line << ":" << e.source().begin.column
                << ": " << e.description();
        throw ModelParseError(path, details.str());
    }
    return toml_value_to_json(table);
}

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

Value load_document(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw UnsupportedFormatError(ext);
}

Model load_model_file(const std::string& path) {
    Model model = model_from_value(load_document(path));
    if (model.source.empty()) {
        model.source = path;
    }
    logger()->debug("loaded model '{}' v{} from {} ({} entities)",
                    model.name, model.version, path, model.entities.size());
    return model;
}

std::map<std::string, Model> load_model_directory(const std::string& dir,
                                                  const std::string& extension,
                                                  bool reject_duplicates) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw FileNotFoundError(dir);
    }

    std::string wanted = to_lower(extension);
    if (!wanted.empty() && wanted.front() != '.') {
        wanted.insert(wanted.begin(), '.');
    }

    std::map<std::string, Model> models;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        const std::string path = entry.path().string();
        if (get_file_extension(path) != wanted) continue;

        try {
            Model model = load_model_file(path);
            validate_model(model, reject_duplicates);
            models[entry.path().filename().string()] = std::move(model);
        } catch (const Error& e) {
            logger()->warn("skipping {}: {}", path, e.what());
        }
    }
    return models;
}

void write_json_file(const std::string& path, const Value& data, int indent) {
    std::ofstream ofs(path);
    if (!ofs) {
        throw Error("Failed to open for write: " + path);
    }
    ofs << data.dump(indent) << "\n";
}

} // namespace ontodiff
