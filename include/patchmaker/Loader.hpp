/**
 * @file Loader.hpp
 * @brief Reading documents from disk
 *
 * The CLI inputs (current, modified, original) and the settings file all
 * go through load_document, so either of them may be JSON or TOML.
 */

#ifndef PATCHMAKER_LOADER_HPP
#define PATCHMAKER_LOADER_HPP

#include "patchmaker/Value.hpp"
#include <string>

namespace patchmaker {

/**
 * @brief Read and parse a JSON document
 * @throws FileNotFoundError when `path` is not a readable regular file
 * @throws ConfigParseError on malformed JSON
 */
Value load_json_file(const std::string& path);

/**
 * @brief Read a TOML document as a Value
 *
 * Tables map to objects and arrays to arrays. Dates and times are kept
 * as their TOML text, e.g. "2024-05-01".
 *
 * @throws FileNotFoundError when `path` is not a readable regular file
 * @throws ConfigParseError with line and column on malformed TOML
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Read a document, picking the parser from the extension
 *
 * @param path File ending in .json or .toml (any case)
 * @throws FileNotFoundError, ConfigParseError
 * @throws ConfigError for any other extension
 */
Value load_document(const std::string& path);

/// Lowercased extension with its leading dot, "" when there is none.
std::string get_file_extension(const std::string& path);

} // namespace patchmaker

#endif // PATCHMAKER_LOADER_HPP
