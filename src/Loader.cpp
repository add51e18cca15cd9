/**
 * @file Loader.cpp
 * @brief JSON/TOML file loading
 */

#include "patchmaker/Loader.hpp"
#include "patchmaker/Errors.hpp"

#include <toml++/toml.hpp>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <type_traits>

namespace fs = std::filesystem;

namespace patchmaker {

namespace {

void require_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw FileNotFoundError(path);
    }
}

std::string slurp(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw FileNotFoundError(path);
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/**
 * @brief Convert a toml++ node into the JSON value model
 *
 * Dates and times have no JSON counterpart and keep their TOML text.
 */
Value to_value(const toml::node& node) {
    return node.visit([](const auto& n) -> Value {
        using Node = std::decay_t<decltype(n)>;

        if constexpr (std::is_same_v<Node, toml::table>) {
            Value obj = Value::object();
            for (const auto& [key, child] : n) {
                obj[std::string(key.str())] = to_value(child);
            }
            return obj;
        } else if constexpr (std::is_same_v<Node, toml::array>) {
            Value arr = Value::array();
            for (const auto& child : n) {
                arr.push_back(to_value(child));
            }
            return arr;
        } else if constexpr (std::is_same_v<Node, toml::value<toml::date>> ||
                             std::is_same_v<Node, toml::value<toml::time>> ||
                             std::is_same_v<Node, toml::value<toml::date_time>>) {
            std::ostringstream text;
            text << n.get();
            return Value(text.str());
        } else {
            return Value(n.get());
        }
    });
}

} // anonymous namespace

Value load_json_file(const std::string& path) {
    require_file(path);
    try {
        return Value::parse(slurp(path));
    } catch (const Value::parse_error& e) {
        throw ConfigParseError(path, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    require_file(path);
    try {
        return to_value(toml::parse_file(path));
    } catch (const toml::parse_error& e) {
        const auto& where = e.source().begin;
        std::ostringstream details;
        details << e.description() << " (line " << where.line << ", column " << where.column << ")";
        throw ConfigParseError(path, details.str());
    }
}

std::string get_file_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    for (auto& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

Value load_document(const std::string& path) {
    const std::string ext = get_file_extension(path);
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    if (ext != ".json") {
        throw ConfigError("Unsupported document format '" + ext + "' in " + path +
                          " (expected .json or .toml)");
    }
    return load_json_file(path);
}

} // namespace patchmaker
