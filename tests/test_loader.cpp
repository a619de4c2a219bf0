/**
 * @file test_loader.cpp
 * @brief Tests for model document loading from JSON and TOML files
 */

#include <catch2/catch_all.hpp>
#include "ontodiff/Errors.hpp"
#include "ontodiff/Loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace ontodiff;

// ============================================================================
// Test fixtures and helpers
// ============================================================================

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension = ".json")
        : path_(fs::temp_directory_path() /
                ("ontodiff_test_" + std::to_string(std::rand()) + extension)) {
        std::ofstream out(path_);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

/**
 * @brief RAII helper for creating temporary directories.
 */
class TempDir {
public:
    TempDir() : path_(fs::temp_directory_path() /
                      ("ontodiff_test_dir_" + std::to_string(std::rand()))) {
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }

    std::string create_file(const std::string& name, const std::string& content) {
        fs::path file_path = path_ / name;
        std::ofstream out(file_path);
        out << content;
        return file_path.string();
    }

private:
    fs::path path_;
};

namespace {

const char* kSalesJson = R"({
    "name": "Sales",
    "version": "1.2",
    "entities": [
        {"name": "Customer", "properties": [
            {"name": "Id", "data_type": "Integer", "required": true},
            {"name": "Name"}
        ]}
    ],
    "relationships": [{"from_entity": "Order", "to_entity": "Customer", "cardinality": "many-to-one"}],
    "business_rules": [{"name": "HighValueOrder", "condition": "Amount > 10000", "action": "flag"}]
})";

const char* kFinanceToml = R"(
name = "Finance"
version = "3.0"

[[entities]]
name = "Customer"
entity_type = "dimension"

[[entities.properties]]
name = "CustomerId"
data_type = "String"

[metadata]
owner = "finance"
reviewed = 2024-05-01
)";

} // anonymous namespace

// ============================================================================
// Raw documents
// ============================================================================

TEST_CASE("load_json_file - documents and errors", "[loader][json]") {
    SECTION("Parses objects") {
        TempFile f(R"({"name": "Sales", "entities": []})");
        Value v = load_json_file(f.path());
        REQUIRE(v["name"] == "Sales");
        REQUIRE(v["entities"].is_array());
    }

    SECTION("Missing file throws FileNotFoundError") {
        REQUIRE_THROWS_AS(load_json_file("/nonexistent/model.json"), FileNotFoundError);
    }

    SECTION("Malformed JSON throws ModelParseError") {
        TempFile f(R"({"name": "Sales",)");
        try {
            load_json_file(f.path());
            FAIL("expected ModelParseError");
        } catch (const ModelParseError& e) {
            REQUIRE(e.file() == f.path());
        }
    }
}

TEST_CASE("load_toml_file - documents and errors", "[loader][toml]") {
    SECTION("Tables become nested objects") {
        TempFile f("[merge]\nstrategy = \"union\"\n[analysis]\nsimilarity_threshold = 0.7\n", ".toml");
        Value v = load_toml_file(f.path());
        REQUIRE(v["merge"]["strategy"] == "union");
        REQUIRE(v["analysis"]["similarity_threshold"].get<double>() == Catch::Approx(0.7));
    }

    SECTION("Dates are rendered as text") {
        TempFile f("reviewed = 2024-05-01\n", ".toml");
        Value v = load_toml_file(f.path());
        REQUIRE(v["reviewed"] == "2024-05-01");
    }

    SECTION("Syntax errors carry a position") {
        TempFile f("name = \n", ".toml");
        try {
            load_toml_file(f.path());
            FAIL("expected ModelParseError");
        } catch (const ModelParseError& e) {
            REQUIRE(e.details().find(':') != std::string::npos);
        }
    }
}

TEST_CASE("load_document - dispatch on extension", "[loader]") {
    SECTION("Extension is lowercased") {
        REQUIRE(get_file_extension("models/Sales.JSON") == ".json");
        REQUIRE(get_file_extension("finance.toml") == ".toml");
        REQUIRE(get_file_extension("README").empty());
    }

    SECTION("Unknown extension is rejected") {
        TempFile f("name: Sales\n", ".yaml");
        REQUIRE_THROWS_AS(load_document(f.path()), UnsupportedFormatError);
    }

    SECTION("Missing file is reported before the extension") {
        REQUIRE_THROWS_AS(load_document("/nonexistent/model.yaml"), FileNotFoundError);
    }
}

// ============================================================================
// Models
// ============================================================================

TEST_CASE("load_model_file - JSON and TOML models", "[loader][model]") {
    SECTION("JSON model") {
        TempFile f(kSalesJson);
        Model m = load_model_file(f.path());
        REQUIRE(m.name == "Sales");
        REQUIRE(m.version == "1.2");
        REQUIRE(m.source == f.path());
        REQUIRE(m.entities.size() == 1);
        REQUIRE(m.entities[0].properties[0].required);
        REQUIRE(find_relationship(m, "Order→Customer") != nullptr);
    }

    SECTION("TOML model") {
        TempFile f(kFinanceToml, ".toml");
        Model m = load_model_file(f.path());
        REQUIRE(m.name == "Finance");
        REQUIRE(m.entities[0].entity_type == "dimension");
        REQUIRE(m.entities[0].properties[0].name == "CustomerId");
        REQUIRE(m.metadata.at("owner") == "finance");
        REQUIRE(m.metadata.at("reviewed") == "2024-05-01");
    }

    SECTION("Declared source is kept") {
        TempFile f(R"({"name": "Ops", "source": "ops.pbix"})");
        REQUIRE(load_model_file(f.path()).source == "ops.pbix");
    }

    SECTION("Invalid shape throws ModelValidationError") {
        TempFile f(R"({"name": "Ops", "entities": [{"description": "no name"}]})");
        REQUIRE_THROWS_AS(load_model_file(f.path()), ModelValidationError);
    }
}

TEST_CASE("load_model_directory - keyed by file name", "[loader][model]") {
    TempDir dir;
    dir.create_file("sales.json", kSalesJson);
    dir.create_file("finance.toml", kFinanceToml);
    dir.create_file("broken.json", "{ not json");
    dir.create_file("notes.txt", "ignored");

    SECTION("Loads matching files and skips unreadable ones") {
        auto models = load_model_directory(dir.path());
        REQUIRE(models.size() == 1);
        REQUIRE(models.count("sales.json") == 1);
        REQUIRE(models.at("sales.json").name == "Sales");
    }

    SECTION("Extension may be given without a dot") {
        auto models = load_model_directory(dir.path(), "toml");
        REQUIRE(models.size() == 1);
        REQUIRE(models.at("finance.toml").name == "Finance");
    }

    SECTION("Duplicate identities are skipped only when rejected") {
        dir.create_file("dup.json",
                        R"({"name": "Dup", "entities": [{"name": "Customer"}, {"name": "Customer"}]})");

        auto lenient = load_model_directory(dir.path());
        REQUIRE(lenient.count("dup.json") == 1);

        auto strict = load_model_directory(dir.path(), ".json", true);
        REQUIRE(strict.count("dup.json") == 0);
        REQUIRE(strict.count("sales.json") == 1);
    }

    SECTION("Missing directory throws FileNotFoundError") {
        REQUIRE_THROWS_AS(load_model_directory(dir.path() + "/missing"), FileNotFoundError);
    }
}

TEST_CASE("write_json_file - pretty printed output", "[loader]") {
    TempDir dir;
    const std::string path = dir.path() + "/out.json";

    write_json_file(path, Value{{"name", "Merged"}, {"version", "1.1"}}, 4);
    Value back = load_json_file(path);
    REQUIRE(back["name"] == "Merged");

    REQUIRE_THROWS_AS(write_json_file(dir.path() + "/missing/out.json", Value::object()), Error);
}
