/**
 * @file Settings.cpp
 * @brief Settings layering and validation
 */

#include "patchmaker/Settings.hpp"
#include "patchmaker/DotPath.hpp"
#include "patchmaker/Errors.hpp"
#include "patchmaker/Loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>
#include <sstream>
#include <utility>

#if defined(_WIN32)
  #include <windows.h>
  #include <cstring>
#else
  #include <unistd.h>
  extern char **environ;
#endif

namespace patchmaker {

namespace {

    // Merge b into a (recursively). Values in b take precedence.
    void deep_merge(Value& a, const Value& b) {
        if (!a.is_object() || !b.is_object()) {
            a = b;
            return;
        }
        for (auto it = b.begin(); it != b.end(); ++it) {
            const auto& key = it.key();
            if (a.contains(key) && a[key].is_object() && it.value().is_object()) {
                deep_merge(a[key], it.value());
            } else {
                a[key] = it.value();
            }
        }
    }

    std::vector<std::pair<std::string, std::string>> enumerate_environment() {
        std::vector<std::pair<std::string, std::string>> envs;
#if defined(_WIN32)
        LPCH env = GetEnvironmentStringsA();
        if (!env) return envs;
        for (LPSTR var = env; *var != '\0'; var += strlen(var) + 1) {
            std::string entry(var);
            auto pos = entry.find('=');
            if (pos == std::string::npos) continue;
            envs.emplace_back(entry.substr(0, pos), entry.substr(pos + 1));
        }
        FreeEnvironmentStringsA(env);
#else
        if (environ) {
            for (char **env = environ; *env; ++env) {
                std::string entry(*env);
                auto pos = entry.find('=');
                if (pos == std::string::npos) continue;
                envs.emplace_back(entry.substr(0, pos), entry.substr(pos + 1));
            }
        }
#endif
        return envs;
    }

    // Try parsing string as JSON, otherwise return it as a string.
    Value parse_json_or_string(const std::string& raw) {
        try {
            return Value::parse(raw);
        } catch (const Value::parse_error&) {
            return Value(raw);
        }
    }

    /**
     * @brief PATCHMAKER_IGNORE_STATUS=true -> {"ignore": {"status": true}}
     *
     * The prefix is matched case-sensitively; the rest is lowercased and
     * underscores become dots.
     */
    Value load_env_layer(const std::string& prefix) {
        Value layer = Value::object();
        const std::string normalized = prefix + "_";

        for (const auto& [name, raw] : enumerate_environment()) {
            if (name.rfind(normalized, 0) != 0) continue;

            std::string key = name.substr(normalized.size());
            std::transform(key.begin(), key.end(), key.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            std::replace(key.begin(), key.end(), '_', '.');
            if (key.empty()) continue;

            set_by_dot(layer, key, parse_json_or_string(raw));
        }
        return layer;
    }

    const Value* setting(const Value& data, const char* path) {
        const Value* v = find_by_dot(data, path);
        return (v == nullptr || v->is_null()) ? nullptr : v;
    }

    [[noreturn]] void bad_setting(const char* path, const char* expected, const Value& got) {
        throw ConfigError(std::string("Setting '") + path + "' must be " + expected +
                          ", got " + type_name(got));
    }

} // anonymous namespace

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> parts;
    std::string tok;
    std::istringstream iss(s);
    while (std::getline(iss, tok, ',')) {
        auto begin = tok.find_first_not_of(" \t");
        if (begin == std::string::npos) continue;
        auto end = tok.find_last_not_of(" \t");
        parts.push_back(tok.substr(begin, end - begin + 1));
    }
    return parts;
}

Value Settings::defaults() {
    return {
        {"log", {{"level", "warning"}}},
        {"output", {{"indent", -1}}},
        {"ignore", {
            {"status", false},
            {"nulls", false},
            {"fields", Value::array()}
        }}
    };
}

Settings::Settings() : Settings(defaults()) {}

Settings::Settings(const Value& data) {
    if (const Value* v = setting(data, "log.level")) {
        if (!v->is_string()) bad_setting("log.level", "a string", *v);
        auto level = parse_log_level(v->get<std::string>());
        if (!level) {
            throw ConfigError("Setting 'log.level' has unknown level '" + v->get<std::string>() + "'");
        }
        log_level_ = *level;
    }

    if (const Value* v = setting(data, "output.indent")) {
        if (!v->is_number_integer()) bad_setting("output.indent", "an integer", *v);
        const bool in_range = v->is_number_unsigned()
            ? v->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            : v->get<std::int64_t>() >= std::numeric_limits<int>::min() &&
              v->get<std::int64_t>() <= std::numeric_limits<int>::max();
        if (!in_range) {
            throw ConfigError("Setting 'output.indent' is out of range: " + v->dump());
        }
        indent_ = std::max(-1, v->get<int>());
    }

    if (const Value* v = setting(data, "ignore.status")) {
        if (!v->is_boolean()) bad_setting("ignore.status", "a boolean", *v);
        ignore_status_ = v->get<bool>();
    }

    if (const Value* v = setting(data, "ignore.nulls")) {
        if (!v->is_boolean()) bad_setting("ignore.nulls", "a boolean", *v);
        ignore_nulls_ = v->get<bool>();
    }

    if (const Value* v = setting(data, "ignore.fields")) {
        if (v->is_string()) {
            ignore_fields_ = split_list(v->get<std::string>());
        } else if (v->is_array()) {
            for (const auto& field : *v) {
                if (!field.is_string()) bad_setting("ignore.fields", "an array of strings", field);
                ignore_fields_.push_back(field.get<std::string>());
            }
        } else {
            bad_setting("ignore.fields", "an array or a comma-separated string", *v);
        }
    }
}

Settings Settings::load(const LoadOptions& opts) {
    Value merged = defaults();

    if (opts.file_path.has_value()) {
        deep_merge(merged, load_document(*opts.file_path));
    }

    if (!opts.env_prefix.empty()) {
        deep_merge(merged, load_env_layer(opts.env_prefix));
    }

    for (const auto& [path, value] : opts.overrides) {
        set_by_dot(merged, path, value);
    }

    return Settings(merged);
}

std::vector<CalculateOption> Settings::calculate_options() const {
    std::vector<CalculateOption> options;
    if (ignore_nulls_) {
        options.push_back(delete_null_in_json());
    }
    if (ignore_status_) {
        options.push_back(ignore_status_fields());
    }
    if (!ignore_fields_.empty()) {
        options.push_back(patchmaker::ignore_fields(ignore_fields_));
    }
    return options;
}

} // namespace patchmaker
