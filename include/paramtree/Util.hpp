#ifndef PARAMTREE_UTIL_HPP
#define PARAMTREE_UTIL_HPP

#include <nlohmann/json.hpp>

#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace paramtree {

// Decode one application/x-www-form-urlencoded component: '+' becomes a
// space, %XX becomes the byte XX (malformed escapes are kept verbatim), and
// the result is passed through repair_utf8().
std::string form_url_decode(std::string_view s);

// Replace every maximal invalid UTF-8 subsequence with U+FFFD.
std::string repair_utf8(std::string_view s);

// Split a raw query/form string into decoded (key, value) pairs. Empty
// pairs are skipped; a pair without '=' has no value.
std::vector<std::pair<std::string, std::optional<std::string>>>
split_form_pairs(std::string_view s);

// Decode the UTF-8 text as exactly one Unicode scalar value.
std::optional<char32_t> single_scalar(std::string_view s);

// Append the UTF-8 encoding of a scalar value.
void append_utf8(std::string& out, char32_t cp);

// Helpers
std::string to_lower(std::string s);
std::string trim(std::string_view s);
bool starts_with(std::string_view s, std::string_view prefix) noexcept;
bool istarts_with(std::string_view s, std::string_view prefix) noexcept;

// Try parsing string as JSON, otherwise return it as a string.
nlohmann::json parse_json_or_string(const std::string& raw);

// For an unsigned decimal literal outside a float type's range: true if it
// is too large, false if it is too small.
bool decimal_literal_overflows(std::string_view literal) noexcept;

// Parse [+-]digits[.digits][(e|E)[+-]digits], inf, infinity or nan
// regardless of LC_NUMERIC. Magnitudes beyond T's range become infinity and
// those below it become zero. nullopt unless the whole text is consumed.
template <typename T>
std::optional<T> parse_decimal_float(std::string_view text) {
    bool negative = false;
    if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    if (text.empty() || text.front() == '+' || text.front() == '-') {
        return std::nullopt;
    }

    T out{};
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, out);
    if (ptr != last) {
        return std::nullopt;
    }
    if (ec == std::errc::result_out_of_range) {
        out = decimal_literal_overflows(text) ? std::numeric_limits<T>::infinity() : T(0);
    } else if (ec != std::errc()) {
        return std::nullopt;
    }
    return negative ? -out : out;
}

} // namespace paramtree

#endif // PARAMTREE_UTIL_HPP
