/**
 * @file Errors.hpp
 * @brief Exception types for patch calculation and configuration
 *
 * Patch calculation errors (all derive from PatchError):
 * - EncodingError: Domain object could not be serialized
 * - OptionError: A calculate option failed
 * - PatchGenerationError: A merge patch could not be computed
 * - PatchApplyError: A merge patch could not be applied
 * - DecodingError: Patched bytes could not be deserialized
 *
 * Configuration errors (all derive from ConfigError):
 * - FileNotFoundError: Input or settings file not found
 * - ConfigParseError: JSON/TOML syntax errors
 *
 * None of these are retryable: the same inputs always fail the same way.
 */

#ifndef PATCHMAKER_ERRORS_HPP
#define PATCHMAKER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace patchmaker {

/**
 * @brief Base class for patch calculation failures
 *
 * Carries the step that failed and the message of the wrapped cause.
 */
class PatchError : public std::runtime_error {
public:
    /**
     * @brief Construct with failing step and cause
     * @param step Step being performed (e.g., "convert current object to byte sequence")
     * @param details Message of the underlying error
     */
    PatchError(std::string step, std::string details)
        : std::runtime_error("Failed to " + step + ": " + details)
        , step_(std::move(step))
        , details_(std::move(details))
    {}

    /**
     * @brief Get the step that failed
     */
    const std::string& step() const noexcept {
        return step_;
    }

    /**
     * @brief Get the message of the wrapped cause
     */
    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string step_;
    std::string details_;
};

/**
 * @brief A domain object could not be serialized to bytes
 */
class EncodingError : public PatchError {
public:
    using PatchError::PatchError;
};

/**
 * @brief A calculate option failed
 */
class OptionError : public PatchError {
public:
    using PatchError::PatchError;
};

/**
 * @brief A merge patch diff could not be computed
 *
 * Raised for malformed documents or documents that are not JSON objects.
 */
class PatchGenerationError : public PatchError {
public:
    using PatchError::PatchError;
};

/**
 * @brief A merge patch could not be applied to a document
 */
class PatchApplyError : public PatchError {
public:
    using PatchError::PatchError;
};

/**
 * @brief Bytes could not be deserialized into the target type
 */
class DecodingError : public PatchError {
public:
    using PatchError::PatchError;
};

/**
 * @brief Base class for configuration and input file errors
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Input or settings file not found
 */
class FileNotFoundError : public ConfigError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : ConfigError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief File parse error (JSON/TOML syntax)
 */
class ConfigParseError : public ConfigError {
public:
    /**
     * @brief Construct with file path and error details
     * @param file Path to the file with parse error
     * @param details Detailed error message from parser
     */
    ConfigParseError(std::string file, std::string details)
        : ConfigError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    std::string details_;
};

} // namespace patchmaker

#endif // PATCHMAKER_ERRORS_HPP
