/**
 * @file Value.hpp
 * @brief Value model shared by every parameter source
 *
 * A Value is one of:
 * - Null
 * - Bool
 * - Number (PosInt u64 >= 0 | NegInt i64 < 0 | Float f64, always finite)
 * - String      (text already known to be a string, e.g. from JSON)
 * - LooseString (text of unknown final type, coerced on demand)
 * - Object      ({String: Value, ...})
 * - Array       ([Value, ...])
 * - UploadFile  ({name, content_type, locator})
 *
 * String and LooseString compare equal when they carry the same text; they
 * differ only in how the Deserializer treats them.
 *
 * nlohmann::json is used as the interchange format: to_json/from_json are
 * provided so a Value can be dumped or built from a JSON document.
 */

#ifndef PARAMTREE_VALUE_HPP
#define PARAMTREE_VALUE_HPP

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace paramtree {

// ============================================================================
// Number
// ============================================================================

enum class NumberKind {
    PosInt,  ///< u64, always >= 0
    NegInt,  ///< i64, always < 0
    Float,   ///< f64, always finite
};

/**
 * @brief JSON-style number that remembers how it was written
 *
 * The three kinds partition all numbers: an integral double stays a Float,
 * and equality requires the same kind and the same value.
 */
class Number {
public:
    Number() noexcept : repr_(std::in_place_index<0>, std::uint64_t{0}) {}

    static Number from_u64(std::uint64_t v) noexcept {
        return Number(Repr(std::in_place_index<0>, v));
    }

    /// Non-negative values are stored as PosInt.
    static Number from_i64(std::int64_t v) noexcept {
        if (v >= 0) {
            return from_u64(static_cast<std::uint64_t>(v));
        }
        return Number(Repr(std::in_place_index<1>, v));
    }

    static Number from_f64(double v) noexcept {
        return Number(Repr(std::in_place_index<2>, v));
    }

    NumberKind kind() const noexcept {
        return static_cast<NumberKind>(repr_.index());
    }

    bool is_pos_int() const noexcept { return kind() == NumberKind::PosInt; }
    bool is_neg_int() const noexcept { return kind() == NumberKind::NegInt; }
    bool is_float() const noexcept { return kind() == NumberKind::Float; }

    /// @throws std::bad_variant_access if the number is not a PosInt
    std::uint64_t as_u64() const { return std::get<0>(repr_); }
    /// @throws std::bad_variant_access if the number is not a NegInt
    std::int64_t as_i64() const { return std::get<1>(repr_); }
    /// @throws std::bad_variant_access if the number is not a Float
    double as_f64() const { return std::get<2>(repr_); }

    /// Value of any kind widened to double.
    double to_double() const noexcept;

    /// Shortest textual form ("42", "-7", "1.5").
    std::string to_string() const;

    friend bool operator==(const Number& a, const Number& b) noexcept {
        return a.repr_ == b.repr_;
    }
    friend bool operator!=(const Number& a, const Number& b) noexcept {
        return !(a == b);
    }

private:
    using Repr = std::variant<std::uint64_t, std::int64_t, double>;

    explicit Number(Repr repr) noexcept : repr_(repr) {}

    Repr repr_;
};

// ============================================================================
// UploadFile
// ============================================================================

/**
 * @brief Handle to an uploaded file
 *
 * `locator` is opaque to paramtree (typically a temporary file path owned
 * by the request layer); it is stored verbatim and never opened.
 */
struct UploadFile {
    std::string name;
    std::string content_type;
    std::string locator;
};

inline bool operator==(const UploadFile& a, const UploadFile& b) {
    return a.name == b.name && a.content_type == b.content_type &&
           a.locator == b.locator;
}

inline bool operator!=(const UploadFile& a, const UploadFile& b) {
    return !(a == b);
}

// ============================================================================
// Value
// ============================================================================

class Value;

/// Keys are unique; order carries no meaning.
using Object = std::map<std::string, Value>;
using Array = std::vector<Value>;

class Value {
public:
    enum class Kind {
        Null,
        Bool,
        Number,
        String,
        LooseString,
        Object,
        Array,
        UploadFile,
    };

    Value() noexcept = default;
    Value(std::nullptr_t) noexcept {}
    explicit Value(bool b) noexcept : kind_(Kind::Bool), data_(b) {}
    Value(Number n) noexcept : kind_(Kind::Number), data_(n) {}
    Value(UploadFile file) : kind_(Kind::UploadFile), data_(std::move(file)) {}
    Value(Object obj) : kind_(Kind::Object), data_(std::move(obj)) {}
    Value(Array arr) : kind_(Kind::Array), data_(std::move(arr)) {}

    // Text must go through string() or loose() so the flavour is explicit.
    Value(const char*) = delete;

    static Value string(std::string text) {
        return Value(Kind::String, std::move(text));
    }

    static Value loose(std::string text) {
        return Value(Kind::LooseString, std::move(text));
    }

    static Value object() { return Value(Object{}); }
    static Value array() { return Value(Array{}); }

    Kind kind() const noexcept { return kind_; }

    bool is_null() const noexcept { return kind_ == Kind::Null; }
    bool is_bool() const noexcept { return kind_ == Kind::Bool; }
    bool is_number() const noexcept { return kind_ == Kind::Number; }
    bool is_string() const noexcept { return kind_ == Kind::String; }
    bool is_loose_string() const noexcept { return kind_ == Kind::LooseString; }
    /// String or LooseString.
    bool is_text() const noexcept { return is_string() || is_loose_string(); }
    bool is_object() const noexcept { return kind_ == Kind::Object; }
    bool is_array() const noexcept { return kind_ == Kind::Array; }
    bool is_upload_file() const noexcept { return kind_ == Kind::UploadFile; }

    // Accessors throw std::bad_variant_access on a kind mismatch.
    bool as_bool() const { return std::get<bool>(data_); }
    const Number& as_number() const { return std::get<Number>(data_); }
    /// Text of a String or LooseString.
    const std::string& as_string() const { return std::get<std::string>(data_); }
    const Object& as_object() const { return std::get<Object>(data_); }
    Object& as_object() { return std::get<Object>(data_); }
    const Array& as_array() const { return std::get<Array>(data_); }
    Array& as_array() { return std::get<Array>(data_); }
    const UploadFile& as_upload_file() const { return std::get<UploadFile>(data_); }

    /**
     * @brief Object member lookup
     * @throws std::out_of_range if the key is missing or this is not an object
     */
    const Value& at(const std::string& key) const;

    /**
     * @brief Array element lookup
     * @throws std::out_of_range if out of range or this is not an array
     */
    const Value& at(std::size_t index) const;

    /// Number of members/elements; 0 for scalars.
    std::size_t size() const noexcept;

    /**
     * @brief Render as JSON text
     * @param indent Pretty-print indentation (-1 for compact)
     */
    std::string dump(int indent = -1) const;

    friend bool operator==(const Value& a, const Value& b);
    friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

private:
    Value(Kind kind, std::string text) : kind_(kind), data_(std::move(text)) {}

    Kind kind_ = Kind::Null;
    std::variant<std::monostate, bool, Number, std::string, Object, Array, UploadFile> data_;
};

/**
 * @brief Human-readable kind name used in error messages
 *
 * "null", "boolean", "number", "string", "object", "array" or "file".
 * String and LooseString are both reported as "string".
 */
const char* type_name(Value::Kind kind) noexcept;

inline const char* type_name(const Value& val) noexcept {
    return type_name(val.kind());
}

/**
 * @brief Check if value is a container (array or object)
 */
inline bool is_container(const Value& val) noexcept {
    return val.is_array() || val.is_object();
}

std::ostream& operator<<(std::ostream& os, const Number& n);
std::ostream& operator<<(std::ostream& os, const Value& v);

// ============================================================================
// nlohmann::json interchange
// ============================================================================

void to_json(nlohmann::json& j, const Number& n);
void to_json(nlohmann::json& j, const UploadFile& file);
void from_json(const nlohmann::json& j, UploadFile& file);

/**
 * @brief Convert a Value to JSON
 *
 * String and LooseString both become JSON strings; UploadFile becomes
 * {"name", "content_type", "locator"}.
 */
void to_json(nlohmann::json& j, const Value& v);

/**
 * @brief Build a Value from JSON
 *
 * Strings become String, unsigned integers PosInt, signed integers
 * PosInt/NegInt by sign, floats Float (NaN becomes Null).
 */
void from_json(const nlohmann::json& j, Value& v);

} // namespace paramtree

#endif // PARAMTREE_VALUE_HPP
