/**
 * @file Deserializer.hpp
 * @brief Typed decoding of a Value tree
 *
 * The destination type drives decoding: Deserialize<T>::decode() asks the
 * Deserializer for "a value of roughly this shape" (a bool, an integer, a
 * map, ...) and the Deserializer answers from whatever the Value holds.
 *
 * | Source        | bool       | integer/float | char       | string | map  | seq   |
 * |---------------|------------|---------------|------------|--------|------|-------|
 * | Null          | -          | -             | -          | -      | -    | -     |
 * | Bool          | yes        | -             | -          | -      | -    | -     |
 * | Number        | -          | range checked | -          | -      | -    | -     |
 * | String        | -          | -             | one scalar | yes    | -    | -     |
 * | LooseString   | coerced    | coerced       | one scalar | yes    | -    | -     |
 * | Object        | -          | -             | -          | -      | yes  | -     |
 * | Array         | -          | -             | -          | -      | -    | yes   |
 * | UploadFile    | -          | -             | -          | -      | yes* | -     |
 *
 * (*) presented as {"name", "content_type", "locator"}, all strings.
 * Integers never decode from a Float; floats accept any Number.
 * std::optional<T> maps Null to nullopt and anything else to T.
 *
 * Caller records opt in through an ADL hook:
 * ```cpp
 * struct User {
 *     std::string name;
 *     int age = 0;
 *     std::optional<std::string> email;
 * };
 *
 * void from_params(const paramtree::Deserializer& de, User& user) {
 *     auto map = de.deserialize_map();
 *     user.name = map.field<std::string>("name");
 *     user.age = map.field<int>("age");
 *     user.email = map.optional_field<std::string>("email");
 * }
 *
 * User u = paramtree::decode<User>(tree);
 * ```
 */

#ifndef PARAMTREE_DESERIALIZER_HPP
#define PARAMTREE_DESERIALIZER_HPP

#include "paramtree/Coerce.hpp"
#include "paramtree/Errors.hpp"
#include "paramtree/Value.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace paramtree {

class MapAccess;
class SeqAccess;

template <typename T, typename Enable = void>
struct Deserialize;

/**
 * @brief Short description of a value for error messages
 *
 * Scalars include their raw value: `string "abc"`, `number 42`,
 * `boolean true`; containers are named by kind.
 */
std::string describe(const Value& value);

// ============================================================================
// Deserializer
// ============================================================================

/**
 * @brief Read-only view of one node of a Value tree plus its path
 *
 * The referenced Value must outlive the Deserializer.
 */
class Deserializer {
public:
    explicit Deserializer(const Value& value, std::string path = {})
        : value_(&value)
        , path_(std::move(path))
    {}

    const Value& value() const noexcept { return *value_; }

    /// Location of this node, e.g. "attachments[1].file.name" ("" at the root).
    const std::string& path() const noexcept { return path_; }

    /// Decode this node as T.
    template <typename T>
    T get() const;

    /// Null only.
    void deserialize_unit() const;

    bool deserialize_bool() const;

    template <typename T>
    T deserialize_integer() const;

    template <typename T>
    T deserialize_float() const;

    char32_t deserialize_char() const;

    std::string deserialize_string() const;

    /// true for Null, which option-shaped destinations read as "absent".
    bool is_none() const noexcept { return value_->is_null(); }

    /// Object or UploadFile.
    MapAccess deserialize_map() const;

    /// Array.
    SeqAccess deserialize_seq() const;

    /// Path of a member of this node.
    std::string child_path(const std::string& key) const;

    /// Path of an element of this node.
    std::string element_path(std::size_t index) const;

    /**
     * @brief Reject this node
     * @param expected What the destination wanted ("map", "int32", ...)
     * @throws DecodeError always
     */
    [[noreturn]] void invalid_type(const std::string& expected) const;

private:
    const Value* value_;
    std::string path_;
};

// ============================================================================
// MapAccess
// ============================================================================

/**
 * @brief Field access for map-shaped destinations
 *
 * Unknown entries are ignored; only the fields a destination asks for are
 * decoded.
 */
class MapAccess {
public:
    using const_iterator = Object::const_iterator;

    MapAccess(std::string path, const Object& entries)
        : path_(std::move(path))
        , entries_(&entries)
    {}

    /// Takes ownership of a synthesized map (used for UploadFile).
    MapAccess(std::string path, std::shared_ptr<const Object> owned)
        : path_(std::move(path))
        , entries_(owned.get())
        , owned_(std::move(owned))
    {}

    const std::string& path() const noexcept { return path_; }
    std::size_t size() const noexcept { return entries_->size(); }
    const_iterator begin() const noexcept { return entries_->begin(); }
    const_iterator end() const noexcept { return entries_->end(); }

    bool has(const std::string& key) const {
        return entries_->find(key) != entries_->end();
    }

    /**
     * @brief Deserializer for an entry; valid while this MapAccess lives
     * @throws DecodeError if the entry is missing
     */
    Deserializer at(const std::string& key) const;

    /**
     * @brief Decode a field
     *
     * A missing field decodes as nullopt when T is a std::optional and is
     * a DecodeError ("missing field") otherwise.
     */
    template <typename T>
    T field(const std::string& key) const;

    /// Missing or null → nullopt.
    template <typename T>
    std::optional<T> optional_field(const std::string& key) const;

    /// Missing or null → fallback.
    template <typename T>
    T field_or(const std::string& key, T fallback) const;

private:
    std::string child_path(const std::string& key) const;
    [[noreturn]] void missing_field(const std::string& key) const;

    std::string path_;
    const Object* entries_;
    std::shared_ptr<const Object> owned_;
};

// ============================================================================
// SeqAccess
// ============================================================================

class SeqAccess {
public:
    SeqAccess(std::string path, const Array& items)
        : path_(std::move(path))
        , items_(&items)
    {}

    std::size_t size() const noexcept { return items_->size(); }

    /// @pre index < size()
    Deserializer element(std::size_t index) const {
        return Deserializer((*items_)[index], path_ + "[" + std::to_string(index) + "]");
    }

private:
    std::string path_;
    const Array* items_;
};

// ============================================================================
// Deserialize<T>
// ============================================================================

namespace detail {

template <typename T, typename = void>
struct has_from_params : std::false_type {};

template <typename T>
struct has_from_params<T, std::void_t<decltype(from_params(
                              std::declval<const Deserializer&>(), std::declval<T&>()))>>
    : std::true_type {};

template <typename T>
struct is_decodable_integer
    : std::bool_constant<std::is_integral_v<T> && !std::is_same_v<T, bool> &&
                         !std::is_same_v<T, char> && !std::is_same_v<T, char16_t> &&
                         !std::is_same_v<T, char32_t> && !std::is_same_v<T, wchar_t>> {};

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

} // namespace detail

/**
 * @brief Caller-defined types: dispatches to `from_params(de, out)` found by ADL
 */
template <typename T, typename Enable>
struct Deserialize {
    static T decode(const Deserializer& de) {
        static_assert(detail::has_from_params<T>::value,
                      "no from_params(const paramtree::Deserializer&, T&) overload for T");
        static_assert(std::is_default_constructible_v<T>,
                      "types decoded through from_params() must be default constructible");
        T out{};
        from_params(de, out);
        return out;
    }
};

template <>
struct Deserialize<bool> {
    static bool decode(const Deserializer& de) { return de.deserialize_bool(); }
};

template <typename T>
struct Deserialize<T, std::enable_if_t<detail::is_decodable_integer<T>::value>> {
    static T decode(const Deserializer& de) { return de.deserialize_integer<T>(); }
};

template <typename T>
struct Deserialize<T, std::enable_if_t<std::is_floating_point_v<T>>> {
    static T decode(const Deserializer& de) { return de.deserialize_float<T>(); }
};

template <>
struct Deserialize<char32_t> {
    static char32_t decode(const Deserializer& de) { return de.deserialize_char(); }
};

/// ASCII only.
template <>
struct Deserialize<char> {
    static char decode(const Deserializer& de) {
        char32_t cp = de.deserialize_char();
        if (cp > 0x7F) {
            throw DecodeError(de.path(), "ASCII char", describe(de.value()));
        }
        return static_cast<char>(cp);
    }
};

template <>
struct Deserialize<std::string> {
    static std::string decode(const Deserializer& de) { return de.deserialize_string(); }
};

template <>
struct Deserialize<std::monostate> {
    static std::monostate decode(const Deserializer& de) {
        de.deserialize_unit();
        return {};
    }
};

template <>
struct Deserialize<Value> {
    static Value decode(const Deserializer& de) { return de.value(); }
};

template <>
struct Deserialize<UploadFile> {
    static UploadFile decode(const Deserializer& de);
};

template <typename T>
struct Deserialize<std::optional<T>> {
    static std::optional<T> decode(const Deserializer& de) {
        if (de.is_none()) {
            return std::nullopt;
        }
        return Deserialize<T>::decode(de);
    }
};

template <typename T, typename Alloc>
struct Deserialize<std::vector<T, Alloc>> {
    static std::vector<T, Alloc> decode(const Deserializer& de) {
        SeqAccess seq = de.deserialize_seq();
        std::vector<T, Alloc> out;
        out.reserve(seq.size());
        for (std::size_t i = 0; i < seq.size(); ++i) {
            out.push_back(Deserialize<T>::decode(seq.element(i)));
        }
        return out;
    }
};

template <typename T, typename Compare, typename Alloc>
struct Deserialize<std::map<std::string, T, Compare, Alloc>> {
    static std::map<std::string, T, Compare, Alloc> decode(const Deserializer& de) {
        MapAccess map = de.deserialize_map();
        std::map<std::string, T, Compare, Alloc> out;
        for (const auto& entry : map) {
            out.emplace(entry.first, Deserialize<T>::decode(map.at(entry.first)));
        }
        return out;
    }
};

// ============================================================================
// Template member definitions
// ============================================================================

template <typename T>
T Deserializer::get() const {
    return Deserialize<T>::decode(*this);
}

template <typename T>
T Deserializer::deserialize_integer() const {
    const Value& v = *value_;

    if (v.is_loose_string()) {
        return parse_loose_integer<T>(v.as_string(), path_);
    }

    if (v.is_number()) {
        const Number& n = v.as_number();
        if (n.is_pos_int()) {
            const std::uint64_t u = n.as_u64();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
                return static_cast<T>(u);
            }
        } else if (n.is_neg_int()) {
            if constexpr (std::is_signed_v<T>) {
                const std::int64_t i = n.as_i64();
                if (i >= static_cast<std::int64_t>(std::numeric_limits<T>::min())) {
                    return static_cast<T>(i);
                }
            }
        } else {
            invalid_type(type_label<T>());
        }
        throw DecodeError(path_, type_label<T>(), describe(v) + " (out of range)");
    }

    invalid_type(type_label<T>());
}

template <typename T>
T Deserializer::deserialize_float() const {
    const Value& v = *value_;

    if (v.is_loose_string()) {
        return parse_loose_float<T>(v.as_string(), path_);
    }
    if (v.is_number()) {
        const double d = v.as_number().to_double();
        if constexpr (sizeof(T) < sizeof(double)) {
            if (std::isfinite(d) && std::fabs(d) > static_cast<double>(std::numeric_limits<T>::max())) {
                throw DecodeError(path_, type_label<T>(), describe(v) + " (out of range)");
            }
        }
        return static_cast<T>(d);
    }

    invalid_type(type_label<T>());
}

template <typename T>
T MapAccess::field(const std::string& key) const {
    auto it = entries_->find(key);
    if (it == entries_->end()) {
        if constexpr (detail::is_optional<T>::value) {
            return T{};
        } else {
            missing_field(key);
        }
    }
    return Deserialize<T>::decode(Deserializer(it->second, child_path(key)));
}

template <typename T>
std::optional<T> MapAccess::optional_field(const std::string& key) const {
    return field<std::optional<T>>(key);
}

template <typename T>
T MapAccess::field_or(const std::string& key, T fallback) const {
    auto value = optional_field<T>(key);
    if (!value) {
        return fallback;
    }
    return std::move(*value);
}

// ============================================================================
// Entry points
// ============================================================================

/**
 * @brief Decode a whole tree into T
 *
 * Stops at the first failure; no partially decoded value is returned.
 *
 * @throws DecodeError
 */
template <typename T>
T decode(const Value& tree) {
    return Deserialize<T>::decode(Deserializer(tree));
}

/**
 * @brief Non-throwing form of decode()
 *
 * @param error If non-null, receives the failure message
 * @return The decoded value, or nullopt on failure
 */
template <typename T>
std::optional<T> try_decode(const Value& tree, std::string* error = nullptr) {
    try {
        return decode<T>(tree);
    } catch (const ParamsError& e) {
        if (error) {
            *error = e.what();
        }
        return std::nullopt;
    }
}

} // namespace paramtree

#endif // PARAMTREE_DESERIALIZER_HPP
