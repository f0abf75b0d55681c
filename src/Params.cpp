/**
 * @file Params.cpp
 * @brief Implementation of ParamsBuilder
 */

#include "paramtree/Params.hpp"
#include "paramtree/JsonParser.hpp"
#include "paramtree/KeyPath.hpp"
#include "paramtree/Merge.hpp"
#include "paramtree/Util.hpp"

namespace paramtree {

namespace {

constexpr std::string_view JSON_MEDIA_TYPE = "application/json";
constexpr std::string_view FORM_MEDIA_TYPE = "application/x-www-form-urlencoded";
constexpr std::string_view MULTIPART_MEDIA_TYPE = "multipart/form-data";

bool is_bodyless_method(std::string_view method) {
    const std::string m = to_lower(std::string(method));
    return m == "get" || m == "head";
}

} // anonymous namespace

void ParamsBuilder::add_path_param(std::string_view key, std::string_view value) {
    auto q = value.find('?');
    if (q != std::string_view::npos) {
        value = value.substr(0, q);
    }
    parser_.parse_nested_value(tree_, key, Value::loose(std::string(value)));
}

void ParamsBuilder::add_query(std::string_view query) {
    parser_.parse_nested_query_into(tree_, query);
}

bool ParamsBuilder::add_body(std::string_view content_type, std::string_view body,
                             std::string_view method) {
    const std::string media_type = trim(content_type);

    if (istarts_with(media_type, JSON_MEDIA_TYPE)) {
        add_json_body(body);
        return true;
    }

    if (istarts_with(media_type, FORM_MEDIA_TYPE)) {
        if (options_.ignore_form_body_on_get && is_bodyless_method(method)) {
            return false;
        }
        add_form_body(body);
        return true;
    }

    if (istarts_with(media_type, MULTIPART_MEDIA_TYPE)) {
        throw ParamsError("multipart/form-data bodies must be added field by field");
    }

    return false;
}

void ParamsBuilder::add_json_body(std::string_view bytes) {
    tree_ = merge_into(parse_json(bytes, options_.json_depth_limit), std::move(tree_));
}

void ParamsBuilder::add_form_body(std::string_view body) {
    parser_.parse_nested_query_into(tree_, body);
}

void ParamsBuilder::add_multipart_field(const MultipartField& field) {
    const bool is_json = field.content_type.has_value() &&
                         istarts_with(*field.content_type, JSON_MEDIA_TYPE);

    if (is_json) {
        Value parsed = parse_json(field.text, options_.json_depth_limit);

        if (field.name.empty()) {
            tree_ = merge_into(std::move(parsed), std::move(tree_));
        } else if (!has_nested_key(field.name)) {
            auto it = tree_.find(field.name);
            if (it == tree_.end()) {
                tree_.emplace(field.name, std::move(parsed));
            } else {
                it->second = merge(std::move(it->second), std::move(parsed));
            }
        } else {
            parser_.parse_nested_value(tree_, field.name, std::move(parsed));
        }
        return;
    }

    if (field.file_name.has_value()) {
        UploadFile file;
        file.name = *field.file_name;
        file.content_type = field.content_type.value_or(options_.default_upload_content_type);
        file.locator = field.locator;
        parser_.parse_nested_value(tree_, field.name, Value(std::move(file)));
        return;
    }

    parser_.parse_nested_value(tree_, field.name, Value::loose(field.text));
}

} // namespace paramtree
