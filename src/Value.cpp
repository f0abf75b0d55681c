/**
 * @file Value.cpp
 * @brief Implementation of the value model and its JSON interchange
 */

#include "paramtree/Value.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

namespace paramtree {

// ============================================================================
// Number
// ============================================================================

double Number::to_double() const noexcept {
    switch (kind()) {
        case NumberKind::PosInt: return static_cast<double>(std::get<0>(repr_));
        case NumberKind::NegInt: return static_cast<double>(std::get<1>(repr_));
        case NumberKind::Float: return std::get<2>(repr_);
    }
    return 0.0;
}

std::string Number::to_string() const {
    nlohmann::json j;
    to_json(j, *this);
    return j.dump();
}

std::ostream& operator<<(std::ostream& os, const Number& n) {
    return os << n.to_string();
}

// ============================================================================
// Value
// ============================================================================

const Value& Value::at(const std::string& key) const {
    if (!is_object()) {
        throw std::out_of_range(std::string("Value::at(\"") + key + "\") on " +
                                type_name(*this));
    }
    const auto& obj = as_object();
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw std::out_of_range("Missing key: " + key);
    }
    return it->second;
}

const Value& Value::at(std::size_t index) const {
    if (!is_array()) {
        throw std::out_of_range("Value::at(" + std::to_string(index) + ") on " +
                                type_name(*this));
    }
    const auto& arr = as_array();
    if (index >= arr.size()) {
        throw std::out_of_range("Index out of range: " + std::to_string(index));
    }
    return arr[index];
}

std::size_t Value::size() const noexcept {
    if (is_object()) return std::get<Object>(data_).size();
    if (is_array()) return std::get<Array>(data_).size();
    return 0;
}

std::string Value::dump(int indent) const {
    nlohmann::json j;
    to_json(j, *this);
    return j.dump(indent);
}

bool operator==(const Value& a, const Value& b) {
    // String and LooseString are interchangeable for equality
    if (a.is_text() && b.is_text()) {
        return a.as_string() == b.as_string();
    }
    if (a.kind_ != b.kind_) {
        return false;
    }
    return a.data_ == b.data_;
}

const char* type_name(Value::Kind kind) noexcept {
    switch (kind) {
        case Value::Kind::Null: return "null";
        case Value::Kind::Bool: return "boolean";
        case Value::Kind::Number: return "number";
        case Value::Kind::String: return "string";
        case Value::Kind::LooseString: return "string";
        case Value::Kind::Object: return "object";
        case Value::Kind::Array: return "array";
        case Value::Kind::UploadFile: return "file";
    }
    return "unknown";
}

std::ostream& operator<<(std::ostream& os, const Value& v) {
    return os << v.dump();
}

// ============================================================================
// nlohmann::json interchange
// ============================================================================

void to_json(nlohmann::json& j, const Number& n) {
    switch (n.kind()) {
        case NumberKind::PosInt: j = n.as_u64(); break;
        case NumberKind::NegInt: j = n.as_i64(); break;
        case NumberKind::Float: j = n.as_f64(); break;
    }
}

void to_json(nlohmann::json& j, const UploadFile& file) {
    j = nlohmann::json{
        {"name", file.name},
        {"content_type", file.content_type},
        {"locator", file.locator},
    };
}

void from_json(const nlohmann::json& j, UploadFile& file) {
    j.at("name").get_to(file.name);
    j.at("content_type").get_to(file.content_type);
    j.at("locator").get_to(file.locator);
}

void to_json(nlohmann::json& j, const Value& v) {
    switch (v.kind()) {
        case Value::Kind::Null:
            j = nullptr;
            break;
        case Value::Kind::Bool:
            j = v.as_bool();
            break;
        case Value::Kind::Number:
            to_json(j, v.as_number());
            break;
        case Value::Kind::String:
        case Value::Kind::LooseString:
            j = v.as_string();
            break;
        case Value::Kind::Object: {
            j = nlohmann::json::object();
            for (const auto& [key, child] : v.as_object()) {
                to_json(j[key], child);
            }
            break;
        }
        case Value::Kind::Array: {
            j = nlohmann::json::array();
            for (const auto& child : v.as_array()) {
                nlohmann::json elem;
                to_json(elem, child);
                j.push_back(std::move(elem));
            }
            break;
        }
        case Value::Kind::UploadFile:
            to_json(j, v.as_upload_file());
            break;
    }
}

void from_json(const nlohmann::json& j, Value& v) {
    using nlohmann::json;
    switch (j.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            v = Value();
            break;
        case json::value_t::boolean:
            v = Value(j.get<bool>());
            break;
        case json::value_t::number_unsigned:
            v = Number::from_u64(j.get<std::uint64_t>());
            break;
        case json::value_t::number_integer:
            v = Number::from_i64(j.get<std::int64_t>());
            break;
        case json::value_t::number_float: {
            double d = j.get<double>();
            v = std::isnan(d) ? Value() : Value(Number::from_f64(d));
            break;
        }
        case json::value_t::string:
            v = Value::string(j.get<std::string>());
            break;
        case json::value_t::array: {
            Array arr;
            arr.reserve(j.size());
            for (const auto& elem : j) {
                Value child;
                from_json(elem, child);
                arr.push_back(std::move(child));
            }
            v = std::move(arr);
            break;
        }
        case json::value_t::object: {
            Object obj;
            for (auto it = j.begin(); it != j.end(); ++it) {
                Value child;
                from_json(it.value(), child);
                obj.emplace(it.key(), std::move(child));
            }
            v = std::move(obj);
            break;
        }
        case json::value_t::binary:
            throw std::invalid_argument("binary JSON values have no Value counterpart");
    }
}

} // namespace paramtree
