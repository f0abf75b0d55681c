/**
 * @file Errors.hpp
 * @brief Exception types for paramtree
 *
 * Two families, both rooted in std::runtime_error:
 * - ParamsError: failures while folding or decoding request parameters
 *   (SyntaxError, IncompleteInput, ParameterTypeError, ParamsTooDeep,
 *   InvalidParameter, MergeError, DecodeError)
 * - ConfigError: failures while resolving ParserOptions
 *   (FileNotFoundError, ConfigParseError, OptionError)
 *
 * None of these are process-fatal; callers catch them per request.
 */

#ifndef PARAMTREE_ERRORS_HPP
#define PARAMTREE_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace paramtree {

// ============================================================================
// Engine errors
// ============================================================================

/**
 * @brief Base class for all parameter parsing, merging and decoding errors
 */
class ParamsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Malformed JSON input
 *
 * Carries the byte offset and the 1-based line/column of the offending
 * character.
 */
class SyntaxError : public ParamsError {
public:
    SyntaxError(const std::string& reason, std::size_t offset,
                std::size_t line, std::size_t column)
        : ParamsError("JSON syntax error: " + reason + " at line " +
                      std::to_string(line) + ", column " +
                      std::to_string(column))
        , reason_(reason)
        , offset_(offset)
        , line_(line)
        , column_(column)
    {}

    const std::string& reason() const noexcept { return reason_; }
    std::size_t offset() const noexcept { return offset_; }
    std::size_t line() const noexcept { return line_; }
    std::size_t column() const noexcept { return column_; }

private:
    std::string reason_;
    std::size_t offset_;
    std::size_t line_;
    std::size_t column_;
};

/**
 * @brief JSON input ended before a root value was complete
 */
class IncompleteInput : public ParamsError {
public:
    IncompleteInput() : ParamsError("Incomplete JSON input") {}
};

/**
 * @brief A nested key implies a container shape that conflicts with the tree
 *
 * Raised e.g. for "a=1&a[]=2": `a` already holds a string, so it cannot
 * become an array.
 */
class ParameterTypeError : public ParamsError {
public:
    /**
     * @param key The offending root key
     * @param expected Shape the key path requires ("array" or "object")
     * @param actual Shape currently stored under the key
     */
    ParameterTypeError(std::string key, std::string expected, std::string actual)
        : ParamsError("expected " + expected + " (got " + actual +
                      ") for param `" + key + "`")
        , key_(std::move(key))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& key() const noexcept { return key_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string key_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Bracket or JSON container nesting exceeded the configured limit
 */
class ParamsTooDeep : public ParamsError {
public:
    explicit ParamsTooDeep(std::size_t limit)
        : ParamsError("Parameters nested too deep (limit " +
                      std::to_string(limit) + ")")
        , limit_(limit)
    {}

    std::size_t limit() const noexcept { return limit_; }

private:
    std::size_t limit_;
};

/**
 * @brief A parameter key is structurally acceptable but refused
 *
 * Currently raised for indexed keys (`a[N]`) whose index exceeds the
 * configured array_index_limit.
 */
class InvalidParameter : public ParamsError {
public:
    InvalidParameter(std::string key, const std::string& details)
        : ParamsError("Invalid parameter `" + key + "`: " + details)
        , key_(std::move(key))
    {}

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

/**
 * @brief Two value shapes cannot be merged
 */
class MergeError : public ParamsError {
public:
    /**
     * @param target Shape of the value being merged into
     * @param source Shape of the incoming value
     */
    MergeError(std::string target, std::string source)
        : ParamsError("cannot merge " + source + " into " + target)
        , target_(std::move(target))
        , source_(std::move(source))
    {}

    const std::string& target() const noexcept { return target_; }
    const std::string& source() const noexcept { return source_; }

private:
    std::string target_;
    std::string source_;
};

/**
 * @brief Typed decoding failed
 *
 * Names the path of the failing node, what the destination expected and
 * what the source actually held (kind and, for scalars, raw text).
 */
class DecodeError : public ParamsError {
public:
    DecodeError(std::string path, std::string expected, std::string actual)
        : ParamsError(format_message(path, expected, actual))
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;

    static std::string format_message(const std::string& path,
                                      const std::string& expected,
                                      const std::string& actual) {
        std::string msg = "Failed to decode parameters: expected " + expected +
                          ", found " + actual;
        if (!path.empty()) {
            msg += " at `" + path + "`";
        }
        return msg;
    }
};

// ============================================================================
// Options errors
// ============================================================================

/**
 * @brief Base class for options loading errors
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Options file not found
 */
class FileNotFoundError : public ConfigError {
public:
    explicit FileNotFoundError(std::string path)
        : ConfigError("Options file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief Options file parse error (JSON/TOML syntax)
 */
class ConfigParseError : public ConfigError {
public:
    ConfigParseError(std::string file, std::string details)
        : ConfigError("Parse error in '" + file + "': " + details)
        , file_(std::move(file))
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string file_;
    std::string details_;
};

/**
 * @brief Unknown option name or value of the wrong type
 */
class OptionError : public ConfigError {
public:
    OptionError(std::string option, const std::string& details)
        : ConfigError("Invalid option '" + option + "': " + details)
        , option_(std::move(option))
    {}

    const std::string& option() const noexcept { return option_; }

private:
    std::string option_;
};

} // namespace paramtree

#endif // PARAMTREE_ERRORS_HPP
