#include <cxxopts.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <nlohmann/json.hpp>
#include "paramtree/Errors.hpp"
#include "paramtree/JsonParser.hpp"
#include "paramtree/Options.hpp"
#include "paramtree/Params.hpp"
#include "paramtree/Util.hpp"

using namespace paramtree;

namespace {

bool verbose = false;

void trace(const std::string& msg) {
    if (verbose) std::cerr << "[paramtree] " << msg << "\n";
}

std::string read_input(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) throw FileNotFoundError(path);
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

// "name=value" → (name, value); a missing '=' leaves the value empty
std::pair<std::string, std::string> split_assignment(const std::string& arg) {
    auto eq = arg.find('=');
    if (eq == std::string::npos) return {arg, ""};
    return {arg.substr(0, eq), arg.substr(eq + 1)};
}

MultipartField upload_field(const std::string& arg) {
    auto [name, spec] = split_assignment(arg);
    MultipartField field;
    field.name = name;
    auto semi = spec.find(';');
    if (semi != std::string::npos) {
        field.content_type = spec.substr(semi + 1);
        spec = spec.substr(0, semi);
    }
    if (spec.empty()) {
        throw std::runtime_error("--file expects name=path[;type], got '" + arg + "'");
    }
    field.file_name = std::filesystem::path(spec).filename().string();
    field.locator = spec;
    return field;
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("paramtree", "Fold request parameters into a nested tree");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("c,config", "Path to JSON/TOML options file", cxxopts::value<std::string>())
            ("p,prefix", "Env-var prefix for options", cxxopts::value<std::string>())
            ("depth-limit", "Maximum key nesting depth", cxxopts::value<std::size_t>())
            ("v,verbose", "Trace every folded source on stderr")
            ("h,help", "Show help");

        // `request` sources
        options.add_options("request")
            ("path", "Path parameter name=value (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("query", "Raw query string", cxxopts::value<std::string>())
            ("content-type", "Body content type", cxxopts::value<std::string>())
            ("body", "Body file, or - for stdin", cxxopts::value<std::string>())
            ("field", "Multipart text field name=value (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("file", "Multipart upload name=path[;type] (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("method", "Request method", cxxopts::value<std::string>()->default_value("POST"));

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help({"", "request"}) << "\n";
            std::cout << "Commands: query QS | json FILE|- | request [--path k=v]... [--query QS] "
                         "[--content-type CT --body FILE] [--field k=v]... [--file k=path[;type]]...\n";
            return 0;
        }
        verbose = result.count("verbose") > 0;

        // Resolve parser options
        LoadOptions load;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        if (result.count("prefix")) load.prefix = result["prefix"].as<std::string>();
        if (result.count("depth-limit")) {
            load.overrides["depth_limit"] = result["depth-limit"].as<std::size_t>();
        }
        ParserOptions parser_options = load_options(load);
        trace("options " + nlohmann::json(parser_options).dump());

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                throw std::runtime_error("insufficient arguments for command '" + cmd + "'");
            }
        };

        // QUERY
        if (cmd == "query") {
            expect_args(2);
            Object tree = parser_options.query_parser().parse_nested_query(cmdv[1]);
            trace("folded query (" + std::to_string(cmdv[1].size()) + " bytes)");
            std::cout << Value(std::move(tree)).dump(2) << "\n";
            return 0;
        }

        // JSON
        if (cmd == "json") {
            expect_args(2);
            const std::string bytes = read_input(cmdv[1]);
            Value doc = parse_json(bytes, parser_options.json_depth_limit);
            trace(std::string("parsed ") + type_name(doc) + " from " + std::to_string(bytes.size()) + " bytes");
            std::cout << doc.dump(2) << "\n";
            return 0;
        }

        // REQUEST
        if (cmd == "request") {
            ParamsBuilder params(parser_options);

            if (result.count("path")) {
                for (const auto& arg : result["path"].as<std::vector<std::string>>()) {
                    auto [key, value] = split_assignment(arg);
                    params.add_path_param(key, value);
                    trace("folded path param " + key);
                }
            }

            if (result.count("query")) {
                params.add_query(result["query"].as<std::string>());
                trace("folded query");
            }

            if (result.count("body")) {
                if (!result.count("content-type")) {
                    throw std::runtime_error("--body requires --content-type");
                }
                const std::string content_type = result["content-type"].as<std::string>();
                const std::string body = read_input(result["body"].as<std::string>());
                const std::string method = result["method"].as<std::string>();
                if (params.add_body(content_type, body, method)) {
                    trace("folded " + content_type + " body");
                } else {
                    trace("skipped " + content_type + " body for " + method);
                }
            }

            if (result.count("field")) {
                for (const auto& arg : result["field"].as<std::vector<std::string>>()) {
                    auto [name, value] = split_assignment(arg);
                    MultipartField field;
                    field.name = name;
                    field.text = value;
                    params.add_multipart_field(field);
                    trace("folded multipart field " + name);
                }
            }

            if (result.count("file")) {
                for (const auto& arg : result["file"].as<std::vector<std::string>>()) {
                    MultipartField field = upload_field(arg);
                    params.add_multipart_field(field);
                    trace("folded upload " + field.name + " -> " + field.locator);
                }
            }

            Object tree = params.take();
            trace("tree has " + std::to_string(tree.size()) + " top-level keys");
            std::cout << Value(std::move(tree)).dump(2) << "\n";
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
