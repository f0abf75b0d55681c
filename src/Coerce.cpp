/**
 * @file Coerce.cpp
 * @brief Implementation of loose-string coercion
 */

#include "paramtree/Coerce.hpp"
#include "paramtree/Util.hpp"

namespace paramtree {

namespace {

bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

std::size_t count_digits(std::string_view s, std::size_t from) noexcept {
    std::size_t i = from;
    while (i < s.size() && is_digit(s[i])) ++i;
    return i - from;
}

} // namespace

std::string describe_text(std::string_view text) {
    std::string out = "string \"";
    out.append(text.data(), text.size());
    out += '"';
    return out;
}

bool parse_loose_bool(std::string_view text, const std::string& path) {
    const std::string lower = to_lower(std::string(text));
    if (lower == "true" || lower == "1" || lower == "on" || lower == "yes") {
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "off" || lower == "no") {
        return false;
    }
    throw DecodeError(path, "bool", describe_text(text));
}

char32_t parse_loose_char(std::string_view text, const std::string& path) {
    if (auto cp = single_scalar(text)) {
        return *cp;
    }
    throw DecodeError(path, "char", describe_text(text));
}

bool is_float_literal(std::string_view text) {
    std::size_t i = 0;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) ++i;

    const std::string rest = to_lower(std::string(text.substr(i)));
    if (rest == "inf" || rest == "infinity" || rest == "nan") {
        return true;
    }

    const std::size_t whole = count_digits(text, i);
    i += whole;

    std::size_t fraction = 0;
    if (i < text.size() && text[i] == '.') {
        ++i;
        fraction = count_digits(text, i);
        i += fraction;
    }

    if (whole + fraction == 0) {
        return false;
    }

    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        if (i < text.size() && (text[i] == '+' || text[i] == '-')) ++i;
        const std::size_t exponent = count_digits(text, i);
        if (exponent == 0) {
            return false;
        }
        i += exponent;
    }

    return i == text.size();
}

} // namespace paramtree
