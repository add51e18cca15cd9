/**
 * @file Settings.hpp
 * @brief Layered settings for the patch calculation tool
 *
 * Precedence (lowest to highest):
 * 1. Built-in defaults
 * 2. Settings file (JSON or TOML)
 * 3. Environment variables with the PATCHMAKER_ prefix
 * 4. Explicit overrides
 *
 * Recognized keys:
 * - log.level      "debug" | "info" | "warning" | "error" | "off"
 * - output.indent  JSON indent for printed documents, -1 = compact
 * - ignore.status  drop the top-level "status" field before diffing
 * - ignore.nulls   drop null members before diffing
 * - ignore.fields  dot-paths to drop before diffing (array or "a,b")
 */

#ifndef PATCHMAKER_SETTINGS_HPP
#define PATCHMAKER_SETTINGS_HPP

#include "patchmaker/Logger.hpp"
#include "patchmaker/Options.hpp"
#include "patchmaker/Value.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace patchmaker {

/**
 * @brief Sources for Settings::load
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    std::string env_prefix = "PATCHMAKER";          // empty = skip environment
    std::map<std::string, Value> overrides;         // dot-path -> value
};

class Settings {
public:
    /**
     * @brief Settings with built-in defaults only
     */
    Settings();

    /**
     * @brief Build settings from a merged settings tree
     * @throws ConfigError if a recognized key has the wrong type
     */
    explicit Settings(const Value& data);

    /**
     * @brief Load using defaults -> file -> environment -> overrides
     *
     * @throws FileNotFoundError, ConfigParseError if the file is bad
     * @throws ConfigError if a recognized key has the wrong type
     */
    static Settings load(const LoadOptions& opts);

    /**
     * @brief The built-in defaults tree
     */
    static Value defaults();

    LogLevel log_level() const noexcept { return log_level_; }
    int indent() const noexcept { return indent_; }
    bool ignore_status() const noexcept { return ignore_status_; }
    bool ignore_nulls() const noexcept { return ignore_nulls_; }
    const std::vector<std::string>& ignore_fields() const noexcept { return ignore_fields_; }

    /**
     * @brief Build the option pipeline these settings describe
     *
     * Order: delete_null_in_json, ignore_status_fields, ignore_fields.
     */
    std::vector<CalculateOption> calculate_options() const;

private:
    LogLevel log_level_ = LogLevel::Warning;
    int indent_ = -1;
    bool ignore_status_ = false;
    bool ignore_nulls_ = false;
    std::vector<std::string> ignore_fields_;
};

/**
 * @brief Split a comma-separated list, trimming blanks and dropping empties
 */
std::vector<std::string> split_list(const std::string& s);

} // namespace patchmaker

#endif // PATCHMAKER_SETTINGS_HPP
