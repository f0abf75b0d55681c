/**
 * @file Options.hpp
 * @brief Parser options and their layered loading
 *
 * Options are resolved with this precedence (lowest to highest):
 *   1. Defaults (ParserOptions{})
 *   2. Options file (.json or .toml)
 *   3. Environment variables <PREFIX>_<NAME>
 *   4. Explicit overrides
 *
 * Recognised options:
 * | Name                          | Type             | Default                    |
 * |-------------------------------|------------------|----------------------------|
 * | depth_limit                   | positive integer | 100                        |
 * | default_upload_content_type   | string           | "application/octet-stream" |
 * | ignore_form_body_on_get       | boolean          | true                       |
 * | array_index_limit             | integer >= 0     | 10000                      |
 * | json_depth_limit              | positive integer | 1000                       |
 */

#ifndef PARAMTREE_OPTIONS_HPP
#define PARAMTREE_OPTIONS_HPP

#include "paramtree/Errors.hpp"
#include "paramtree/JsonParser.hpp"
#include "paramtree/QueryParser.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace paramtree {

struct ParserOptions {
    std::size_t depth_limit = DEFAULT_DEPTH_LIMIT;
    std::string default_upload_content_type = "application/octet-stream";
    bool ignore_form_body_on_get = true;
    std::size_t array_index_limit = DEFAULT_ARRAY_INDEX_LIMIT;
    std::size_t json_depth_limit = DEFAULT_JSON_DEPTH_LIMIT;

    /// Query parser configured with these limits.
    QueryParser query_parser() const noexcept {
        return QueryParser(depth_limit, array_index_limit);
    }
};

void to_json(nlohmann::json& j, const ParserOptions& opts);

struct LoadOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> prefix;
    std::map<std::string, nlohmann::json> overrides;
};

// ============================================================================
// File loading
// ============================================================================

/**
 * @brief Load a JSON options file
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError if the JSON is invalid
 */
nlohmann::json load_json_file(const std::string& path);

/**
 * @brief Load a TOML options file, converted to JSON
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError if the TOML is invalid
 */
nlohmann::json load_toml_file(const std::string& path);

/**
 * @brief Load an options file, detecting the format by extension
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError on syntax errors or a non-table root
 * @throws ConfigError for an extension other than .json/.toml
 */
nlohmann::json read_options_file(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

/**
 * @brief Collect options from environment variables
 *
 * Every variable named `<prefix>_<NAME>` (prefix matched case-insensitively)
 * contributes option `<name>` in lower case. Values are parsed as JSON when
 * possible ("50" → 50, "false" → false) and kept as strings otherwise.
 *
 * Example (prefix "PARAMTREE"):
 *   PARAMTREE_DEPTH_LIMIT=20 → {"depth_limit": 20}
 */
nlohmann::json collect_env_options(const std::string& prefix);

// ============================================================================
// Validation and layering
// ============================================================================

/**
 * @brief Build ParserOptions from a JSON object of option values
 *
 * Options absent from `j` keep their defaults.
 *
 * @throws OptionError for unknown names or wrongly typed values
 */
ParserOptions options_from_json(const nlohmann::json& j);

/**
 * @brief Resolve options from defaults, file, environment and overrides
 * @throws ConfigError (or a subclass) on any failure
 */
ParserOptions load_options(const LoadOptions& opts);

} // namespace paramtree

#endif // PARAMTREE_OPTIONS_HPP
