#include <cxxopts.hpp>
#include <iostream>
#include <fstream>
#include "ontodiff/Config.hpp"
#include "ontodiff/Diff.hpp"
#include "ontodiff/Errors.hpp"
#include "ontodiff/Loader.hpp"
#include "ontodiff/Log.hpp"
#include "ontodiff/Merge.hpp"
#include "ontodiff/Render.hpp"
#include "ontodiff/SemanticDebt.hpp"
#include "ontodiff/Serialize.hpp"
#include "ontodiff/Util.hpp"

using namespace ontodiff;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFound = 1;   // differences, conflicts or invalid models
constexpr int kExitError = 2;

/**
 * @brief Print to the --output file, or stdout when none was given
 */
void emit(const std::string& text, const std::string& output) {
    if (output.empty()) {
        std::cout << text << "\n";
        return;
    }
    std::ofstream ofs(output);
    if (!ofs) {
        throw Error("cannot write to " + output);
    }
    ofs << text << "\n";
    logger()->info("wrote {}", output);
}

Model load_checked(const std::string& path, const EngineSettings& settings) {
    Model model = load_model_file(path);
    validate_model(model, settings.reject_duplicates);
    return model;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("ontodiff", "Diff, merge and cross-check semantic models (JSON/TOML)");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("c,config", "Path to JSON/TOML settings file", cxxopts::value<std::string>())
            ("overrides", "Comma-separated dot.key:value pairs", cxxopts::value<std::string>()->default_value(""))
            ("v,verbose", "Log at debug level")
            ("o,output", "Write the result to FILE instead of stdout", cxxopts::value<std::string>()->default_value(""))
            ("f,format", "Output format (diff: changelog|unified|json, analyze: markdown|json)",
                cxxopts::value<std::string>()->default_value(""))
            ("strategy", "Merge strategy: ours|theirs|union", cxxopts::value<std::string>())
            ("dir", "Analyze every model file in DIR", cxxopts::value<std::string>())
            ("ext", "Model file extension used with --dir", cxxopts::value<std::string>()->default_value(".json"))
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: diff SOURCE TARGET | merge BASE OURS THEIRS [--strategy S] | "
                         "analyze FILE... | analyze --dir DIR | validate FILE...\n";
            return kExitOk;
        }

        // Settings: defaults -> file -> ONTODIFF_* env -> --overrides
        LoadOptions load;
        load.prefix = kEnvPrefix;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        load.overrides = parse_overrides(result["overrides"].as<std::string>());
        if (result.count("strategy")) load.overrides["merge.strategy"] = result["strategy"].as<std::string>();
        if (result.count("verbose")) load.overrides["logging.level"] = "debug";

        Config cfg = Config::load(load);
        const EngineSettings settings = EngineSettings::from(cfg);
        if (!set_log_level(settings.log_level)) {
            logger()->warn("unknown log level '{}'", settings.log_level);
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];
        const std::vector<std::string> args(cmdv.begin() + 1, cmdv.end());
        const std::string output = result["output"].as<std::string>();
        const std::string format = result["format"].as<std::string>();

        auto expect_args = [&](size_t want) {
            if (args.size() < want) {
                throw Error("insufficient arguments for command '" + cmd + "'");
            }
        };

        // DIFF
        if (cmd == "diff") {
            expect_args(2);
            const Model source = load_checked(args[0], settings);
            const Model target = load_checked(args[1], settings);
            const DiffReport report = diff_models(source, target);

            const std::string fmt = format.empty() ? "changelog" : format;
            if (fmt == "changelog") {
                emit(to_changelog(report), output);
            } else if (fmt == "unified") {
                emit(to_unified_diff(report), output);
            } else if (fmt == "json") {
                emit(to_value(report).dump(settings.indent), output);
            } else {
                throw Error("unknown diff format '" + fmt + "' (expected changelog, unified or json)");
            }
            return report.has_changes() ? kExitFound : kExitOk;
        }

        // MERGE
        if (cmd == "merge") {
            expect_args(3);
            const Model base = load_checked(args[0], settings);
            const Model ours = load_checked(args[1], settings);
            const Model theirs = load_checked(args[2], settings);

            const MergeResult merged = MergeEngine(settings.merge_strategy).merge(base, ours, theirs);
            emit(model_to_value(merged.model).dump(settings.indent), output);

            if (merged.has_conflicts()) {
                std::cerr << merged.conflicts.size() << " conflict(s) resolved with '"
                          << to_string(settings.merge_strategy) << "':\n"
                          << conflict_summary(merged);
                return kExitFound;
            }
            return kExitOk;
        }

        // ANALYZE
        if (cmd == "analyze") {
            CrossModelConflictAnalyzer analyzer(settings.analyzer);
            if (result.count("dir")) {
                for (auto& [name, model] :
                         load_model_directory(result["dir"].as<std::string>(), result["ext"].as<std::string>(),
                                              settings.reject_duplicates)) {
                    analyzer.add_model(name, std::move(model));
                }
            }
            for (const auto& path : args) {
                analyzer.add_model(path, load_checked(path, settings));
            }

            const SemanticDebtReport report = analyzer.analyze();
            const std::string fmt = format.empty() ? "markdown" : format;
            if (fmt == "markdown") {
                emit(to_markdown(report), output);
            } else if (fmt == "json") {
                emit(to_value(report).dump(settings.indent), output);
            } else {
                throw Error("unknown analyze format '" + fmt + "' (expected markdown or json)");
            }
            return kExitOk;
        }

        // VALIDATE
        if (cmd == "validate") {
            expect_args(1);
            int rc = kExitOk;
            for (const auto& path : args) {
                try {
                    const Model model = load_checked(path, settings);
                    std::cout << "OK " << path << " (" << model.name << " v" << model.version << ", "
                              << model.entities.size() << " entities)\n";
                } catch (const ModelValidationError& e) {
                    std::cout << "INVALID " << path << ": " << e.what() << "\n";
                    rc = kExitFound;
                } catch (const ModelParseError& e) {
                    std::cout << "INVALID " << path << ": " << e.what() << "\n";
                    rc = kExitFound;
                }
            }
            return rc;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return kExitError;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return kExitError;
    }
}
