/**
 * @file Options.cpp
 * @brief Options file loading, environment mapping and validation
 */

#include "paramtree/Options.hpp"
#include "paramtree/Util.hpp"

#include <toml++/toml.hpp>

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

#ifdef _WIN32
    #include <stdlib.h>
#else
    extern char** environ;
#endif

namespace fs = std::filesystem;

namespace paramtree {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

nlohmann::json toml_node_to_json(const toml::node& node) {
    using nlohmann::json;

    if (auto v = node.as_string()) {
        return json(v->get());
    } else if (auto v = node.as_integer()) {
        return json(v->get());
    } else if (auto v = node.as_floating_point()) {
        return json(v->get());
    } else if (auto v = node.as_boolean()) {
        return json(v->get());
    } else if (auto v = node.as_array()) {
        json arr = json::array();
        for (const auto& elem : *v) {
            arr.push_back(toml_node_to_json(elem));
        }
        return arr;
    } else if (auto v = node.as_table()) {
        json obj = json::object();
        for (const auto& [key, val] : *v) {
            obj[std::string(key.str())] = toml_node_to_json(val);
        }
        return obj;
    }

    // Dates and times
    std::ostringstream ss;
    if (auto v = node.as_date()) {
        ss << *v;
    } else if (auto v = node.as_time()) {
        ss << *v;
    } else if (auto v = node.as_date_time()) {
        ss << *v;
    }
    return json(ss.str());
}

std::vector<std::pair<std::string, std::string>> environment_variables() {
    std::vector<std::pair<std::string, std::string>> vars;
#ifdef _WIN32
    char** env = _environ;
#else
    char** env = environ;
#endif
    if (env == nullptr) return vars;

    for (char** entry = env; *entry != nullptr; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string::npos) continue;
        vars.emplace_back(kv.substr(0, eq), kv.substr(eq + 1));
    }
    return vars;
}

std::size_t require_size(const std::string& name, const nlohmann::json& v, std::size_t min) {
    if (!v.is_number_integer()) {
        throw OptionError(name, "expected an integer, got " + std::string(v.type_name()));
    }
    if (v.is_number_unsigned()) {
        auto u = v.get<std::uint64_t>();
        if (u >= min && u <= std::numeric_limits<std::size_t>::max()) {
            return static_cast<std::size_t>(u);
        }
    } else {
        auto i = v.get<std::int64_t>();
        if (i >= 0 && static_cast<std::uint64_t>(i) >= min) {
            return static_cast<std::size_t>(i);
        }
    }
    throw OptionError(name, "must be an integer >= " + std::to_string(min) + ", got " + v.dump());
}

} // anonymous namespace

void to_json(nlohmann::json& j, const ParserOptions& opts) {
    j = nlohmann::json{
        {"depth_limit", opts.depth_limit},
        {"default_upload_content_type", opts.default_upload_content_type},
        {"ignore_form_body_on_get", opts.ignore_form_body_on_get},
        {"array_index_limit", opts.array_index_limit},
        {"json_depth_limit", opts.json_depth_limit},
    };
}

// ============================================================================
// File loading
// ============================================================================

nlohmann::json load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string content = read_file(path);
    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigParseError(path, e.what());
    }
}

nlohmann::json load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << e.description() << " at line " << e.source().begin.line
                << ", column " << e.source().begin.column;
        throw ConfigParseError(path, details.str());
    }

    return toml_node_to_json(table);
}

nlohmann::json read_options_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = to_lower(fs::path(path).extension().string());

    nlohmann::json data;
    if (ext == ".json") {
        data = load_json_file(path);
    } else if (ext == ".toml") {
        data = load_toml_file(path);
    } else {
        throw ConfigError("Unsupported options file type: " + ext +
                          " (expected .json or .toml)");
    }

    if (!data.is_object()) {
        throw ConfigParseError(path, "top-level value must be an object, got " +
                                         std::string(data.type_name()));
    }
    return data;
}

// ============================================================================
// Environment
// ============================================================================

nlohmann::json collect_env_options(const std::string& prefix) {
    nlohmann::json out = nlohmann::json::object();
    if (prefix.empty()) {
        return out;
    }

    const std::string full_prefix = prefix + "_";
    for (const auto& [name, raw] : environment_variables()) {
        if (name.size() <= full_prefix.size() || !istarts_with(name, full_prefix)) {
            continue;
        }
        out[to_lower(name.substr(full_prefix.size()))] = parse_json_or_string(raw);
    }
    return out;
}

// ============================================================================
// Validation and layering
// ============================================================================

ParserOptions options_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Options must be a JSON object, got " + std::string(j.type_name()));
    }

    ParserOptions opts;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const std::string& name = it.key();
        const nlohmann::json& v = it.value();

        if (name == "depth_limit") {
            opts.depth_limit = require_size(name, v, 1);
        } else if (name == "array_index_limit") {
            opts.array_index_limit = require_size(name, v, 0);
        } else if (name == "json_depth_limit") {
            opts.json_depth_limit = require_size(name, v, 1);
        } else if (name == "default_upload_content_type") {
            if (!v.is_string() || v.get<std::string>().empty()) {
                throw OptionError(name, "expected a non-empty string, got " + v.dump());
            }
            opts.default_upload_content_type = v.get<std::string>();
        } else if (name == "ignore_form_body_on_get") {
            if (!v.is_boolean()) {
                throw OptionError(name, "expected a boolean, got " + v.dump());
            }
            opts.ignore_form_body_on_get = v.get<bool>();
        } else {
            throw OptionError(name, "unknown option");
        }
    }
    return opts;
}

ParserOptions load_options(const LoadOptions& opts) {
    nlohmann::json merged = ParserOptions{};

    // 1) file
    if (opts.file_path.has_value()) {
        merged.update(read_options_file(*opts.file_path));
    }

    // 2) env
    if (opts.prefix.has_value() && !opts.prefix->empty()) {
        merged.update(collect_env_options(*opts.prefix));
    }

    // 3) overrides
    for (const auto& [name, value] : opts.overrides) {
        merged[name] = value;
    }

    return options_from_json(merged);
}

} // namespace paramtree
