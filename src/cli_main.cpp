#include <cxxopts.hpp>
#include <fmt/format.h>
#include <iostream>

#include "patchmaker/Errors.hpp"
#include "patchmaker/Loader.hpp"
#include "patchmaker/Logger.hpp"
#include "patchmaker/PatchMaker.hpp"
#include "patchmaker/Settings.hpp"

using namespace patchmaker;

int main(int argc, char** argv) {
    try {
        Logger::ConfigureFromEnvironment();

        cxxopts::Options options("patchmaker", "Compute a verified three-way JSON merge patch");

        options.add_options()
            ("current", "Live document (JSON/TOML)", cxxopts::value<std::string>())
            ("modified", "Desired document (JSON/TOML)", cxxopts::value<std::string>())
            ("original", "Last applied document (JSON/TOML); omit if none", cxxopts::value<std::string>())
            ("c,config", "Path to JSON/TOML settings file", cxxopts::value<std::string>())
            ("ignore", "Comma-separated dot-paths to leave out of the diff", cxxopts::value<std::string>()->default_value(""))
            ("show", "What to print: patch | patched | all", cxxopts::value<std::string>()->default_value("patch"))
            ("exit-code", "Exit with 2 when the patch is not empty")
            ("v,verbose", "Log every calculation step")
            ("h,help", "Show help");

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }
        if (!result.count("current") || !result.count("modified")) {
            std::cerr << "Error: --current and --modified are required\n";
            return 1;
        }

        const std::string show = result["show"].as<std::string>();
        if (show != "patch" && show != "patched" && show != "all") {
            std::cerr << "Error: --show must be one of patch, patched, all\n";
            return 1;
        }

        LoadOptions load;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        const auto extra = split_list(result["ignore"].as<std::string>());
        if (!extra.empty()) {
            Value fields = Value::array();
            for (const auto& f : extra) fields.push_back(f);
            load.overrides["ignore.fields"] = fields;
        }
        if (result.count("verbose")) load.overrides["log.level"] = "debug";

        Settings settings = Settings::load(load);
        Logger::SetLevel(settings.log_level());

        Value current = load_document(result["current"].as<std::string>());
        Value modified = load_document(result["modified"].as<std::string>());
        Value original = result.count("original")
            ? load_document(result["original"].as<std::string>())
            : Value();

        auto patch = default_patch_maker().calculate(current, modified, original,
                                                     settings.calculate_options());
        Logger::Info("patch is {}", patch.is_empty() ? "empty" : "not empty");

        const int indent = settings.indent();
        if (show == "patch") {
            std::cout << Value::parse(patch.patch).dump(indent) << "\n";
        } else if (show == "patched") {
            std::cout << patch.patched.dump(indent) << "\n";
        } else {
            Value all = {
                {"patch", Value::parse(patch.patch)},
                {"current", Value::parse(patch.current)},
                {"modified", Value::parse(patch.modified)},
                {"original", Value::parse(patch.original)},
                {"patched", patch.patched},
                {"empty", patch.is_empty()}
            };
            std::cout << all.dump(indent) << "\n";
        }

        if (result.count("exit-code") && !patch.is_empty()) {
            return 2;
        }
        return 0;

    } catch (const PatchError& ex) {
        std::cerr << fmt::format("Error: {} (step: {})\n", ex.what(), ex.step());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
