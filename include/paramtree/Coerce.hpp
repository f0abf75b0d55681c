/**
 * @file Coerce.hpp
 * @brief Loose-string to primitive coercion
 *
 * Text that arrived through a query string, form body, path segment or
 * multipart text field is kept as a LooseString until a destination type
 * asks for something specific. These functions implement that request:
 *
 * - bool:    "true"/"1"/"on"/"yes" → true, "false"/"0"/"off"/"no" → false
 *            (case-insensitive)
 * - integer: optional sign followed by decimal digits, range checked
 * - float:   decimal with optional fraction/exponent, or inf/infinity/nan
 * - char:    exactly one Unicode scalar value
 *
 * Every failure throws DecodeError naming the target type and the raw text.
 */

#ifndef PARAMTREE_COERCE_HPP
#define PARAMTREE_COERCE_HPP

#include "paramtree/Errors.hpp"
#include "paramtree/Util.hpp"

#include <charconv>
#include <string>
#include <string_view>
#include <type_traits>

namespace paramtree {

/**
 * @brief Short name of an arithmetic type for error messages
 *
 * "bool", "int8".."int64", "uint8".."uint64", "float", "double".
 */
template <typename T>
const char* type_label() noexcept {
    if constexpr (std::is_same_v<T, bool>) {
        return "bool";
    } else if constexpr (std::is_floating_point_v<T>) {
        return sizeof(T) <= sizeof(float) ? "float" : "double";
    } else if constexpr (std::is_signed_v<T>) {
        switch (sizeof(T)) {
            case 1: return "int8";
            case 2: return "int16";
            case 4: return "int32";
            default: return "int64";
        }
    } else {
        switch (sizeof(T)) {
            case 1: return "uint8";
            case 2: return "uint16";
            case 4: return "uint32";
            default: return "uint64";
        }
    }
}

/// Renders text as `string "text"` for error messages.
std::string describe_text(std::string_view text);

/**
 * @brief Coerce loose text to bool
 * @param path Location of the value, for the error message
 * @throws DecodeError
 */
bool parse_loose_bool(std::string_view text, const std::string& path);

/**
 * @brief Coerce loose text to a single Unicode scalar
 * @throws DecodeError if the text is empty or holds more than one scalar
 */
char32_t parse_loose_char(std::string_view text, const std::string& path);

/// Checks the float grammar: [+-]digits[.digits][(e|E)[+-]digits] or inf/infinity/nan.
bool is_float_literal(std::string_view text);

/**
 * @brief Coerce loose text to an integer type
 *
 * A single leading '+' is accepted; whitespace is not.
 *
 * Examples:
 * ```cpp
 * parse_loose_integer<int>("42", "age")      // 42
 * parse_loose_integer<int>("+7", "age")      // 7
 * parse_loose_integer<uint8_t>("256", "n")   // throws DecodeError
 * parse_loose_integer<int>("4.2", "age")     // throws DecodeError
 * ```
 */
template <typename T>
T parse_loose_integer(std::string_view text, const std::string& path) {
    static_assert(std::is_integral_v<T>, "integer type required");

    std::string_view digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
        if (!digits.empty() && digits.front() == '-') {
            throw DecodeError(path, type_label<T>(), describe_text(text));
        }
    }

    T out{};
    const char* first = digits.data();
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (digits.empty() || ec != std::errc() || ptr != last) {
        throw DecodeError(path, type_label<T>(), describe_text(text));
    }
    return out;
}

/**
 * @brief Coerce loose text to a floating-point type
 *
 * Out-of-range magnitudes saturate to infinity.
 */
template <typename T>
T parse_loose_float(std::string_view text, const std::string& path) {
    static_assert(std::is_floating_point_v<T>, "floating-point type required");

    if (!is_float_literal(text)) {
        throw DecodeError(path, type_label<T>(), describe_text(text));
    }

    auto out = parse_decimal_float<T>(text);
    if (!out) {
        throw DecodeError(path, type_label<T>(), describe_text(text));
    }
    return *out;
}

} // namespace paramtree

#endif // PARAMTREE_COERCE_HPP
