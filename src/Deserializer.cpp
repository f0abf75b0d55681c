/**
 * @file Deserializer.cpp
 * @brief Implementation of the non-template decoding steps
 */

#include "paramtree/Deserializer.hpp"

namespace paramtree {

std::string describe(const Value& value) {
    switch (value.kind()) {
        case Value::Kind::Null:
            return "null";
        case Value::Kind::Bool:
            return value.as_bool() ? "boolean true" : "boolean false";
        case Value::Kind::Number:
            return "number " + value.as_number().to_string();
        case Value::Kind::String:
        case Value::Kind::LooseString:
            return describe_text(value.as_string());
        case Value::Kind::Object:
        case Value::Kind::Array:
        case Value::Kind::UploadFile:
            break;
    }
    return type_name(value);
}

// ============================================================================
// Deserializer
// ============================================================================

void Deserializer::deserialize_unit() const {
    if (!value_->is_null()) {
        invalid_type("unit");
    }
}

bool Deserializer::deserialize_bool() const {
    if (value_->is_bool()) {
        return value_->as_bool();
    }
    if (value_->is_loose_string()) {
        return parse_loose_bool(value_->as_string(), path_);
    }
    invalid_type("bool");
}

char32_t Deserializer::deserialize_char() const {
    // A plain String of exactly one scalar is also accepted
    if (value_->is_text()) {
        return parse_loose_char(value_->as_string(), path_);
    }
    invalid_type("char");
}

std::string Deserializer::deserialize_string() const {
    if (value_->is_text()) {
        return value_->as_string();
    }
    invalid_type("string");
}

MapAccess Deserializer::deserialize_map() const {
    if (value_->is_object()) {
        return MapAccess(path_, value_->as_object());
    }

    if (value_->is_upload_file()) {
        const UploadFile& file = value_->as_upload_file();
        auto fields = std::make_shared<Object>();
        (*fields)["name"] = Value::string(file.name);
        (*fields)["content_type"] = Value::string(file.content_type);
        (*fields)["locator"] = Value::string(file.locator);
        return MapAccess(path_, std::shared_ptr<const Object>(std::move(fields)));
    }

    invalid_type("map");
}

SeqAccess Deserializer::deserialize_seq() const {
    if (value_->is_array()) {
        return SeqAccess(path_, value_->as_array());
    }
    invalid_type("sequence");
}

std::string Deserializer::child_path(const std::string& key) const {
    return path_.empty() ? key : path_ + "." + key;
}

std::string Deserializer::element_path(std::size_t index) const {
    return path_ + "[" + std::to_string(index) + "]";
}

void Deserializer::invalid_type(const std::string& expected) const {
    throw DecodeError(path_, expected, describe(*value_));
}

// ============================================================================
// MapAccess
// ============================================================================

Deserializer MapAccess::at(const std::string& key) const {
    auto it = entries_->find(key);
    if (it == entries_->end()) {
        missing_field(key);
    }
    return Deserializer(it->second, child_path(key));
}

std::string MapAccess::child_path(const std::string& key) const {
    return path_.empty() ? key : path_ + "." + key;
}

void MapAccess::missing_field(const std::string& key) const {
    throw DecodeError(path_, "field `" + key + "`", "missing field");
}

// ============================================================================
// Deserialize<UploadFile>
// ============================================================================

UploadFile Deserialize<UploadFile>::decode(const Deserializer& de) {
    if (de.value().is_upload_file()) {
        return de.value().as_upload_file();
    }

    MapAccess map = de.deserialize_map();
    UploadFile file;
    file.name = map.field<std::string>("name");
    file.content_type = map.field<std::string>("content_type");
    file.locator = map.field<std::string>("locator");
    return file;
}

} // namespace paramtree
