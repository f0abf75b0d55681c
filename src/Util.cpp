#include "paramtree/Util.hpp"

#include <algorithm>
#include <cctype>

namespace paramtree {

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Length of the valid UTF-8 sequence starting at s[i], or 0 if the bytes
// there do not start one. On failure `consumed` is the length of the
// maximal invalid subpart (at least 1).
std::size_t utf8_sequence(std::string_view s, std::size_t i, std::size_t& consumed) {
    const auto b0 = static_cast<unsigned char>(s[i]);
    consumed = 1;
    if (b0 < 0x80) return 1;

    std::size_t len = 0;
    unsigned char lo = 0x80, hi = 0xBF;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
    } else if (b0 == 0xE0) {
        len = 3; lo = 0xA0;
    } else if ((b0 >= 0xE1 && b0 <= 0xEC) || b0 == 0xEE || b0 == 0xEF) {
        len = 3;
    } else if (b0 == 0xED) {
        len = 3; hi = 0x9F;
    } else if (b0 == 0xF0) {
        len = 4; lo = 0x90;
    } else if (b0 >= 0xF1 && b0 <= 0xF3) {
        len = 4;
    } else if (b0 == 0xF4) {
        len = 4; hi = 0x8F;
    } else {
        return 0;
    }

    for (std::size_t k = 1; k < len; ++k) {
        if (i + k >= s.size()) return 0;
        const auto b = static_cast<unsigned char>(s[i + k]);
        // Only the second byte has a restricted range
        const unsigned char min = (k == 1) ? lo : 0x80;
        const unsigned char max = (k == 1) ? hi : 0xBF;
        if (b < min || b > max) return 0;
        consumed = k + 1;
    }
    return len;
}

} // namespace

std::string repair_utf8(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    std::size_t i = 0;
    while (i < s.size()) {
        std::size_t consumed = 0;
        std::size_t len = utf8_sequence(s, i, consumed);
        if (len == 0) {
            out += "\xEF\xBF\xBD";
            i += consumed;
        } else {
            out.append(s.substr(i, len));
            i += len;
        }
    }
    return out;
}

std::string form_url_decode(std::string_view s) {
    std::string bytes;
    bytes.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            bytes += ' ';
        } else if (c == '%' && i + 2 < s.size() &&
                   hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
            bytes += static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2]));
            i += 2;
        } else {
            bytes += c;
        }
    }
    return repair_utf8(bytes);
}

std::vector<std::pair<std::string, std::optional<std::string>>>
split_form_pairs(std::string_view s) {
    std::vector<std::pair<std::string, std::optional<std::string>>> pairs;
    std::size_t start = 0;
    while (start <= s.size()) {
        std::size_t amp = s.find('&', start);
        std::string_view pair = s.substr(start, amp == std::string_view::npos
                                                    ? std::string_view::npos
                                                    : amp - start);
        if (!pair.empty()) {
            std::size_t eq = pair.find('=');
            if (eq == std::string_view::npos) {
                pairs.emplace_back(form_url_decode(pair), std::nullopt);
            } else {
                pairs.emplace_back(form_url_decode(pair.substr(0, eq)),
                                   form_url_decode(pair.substr(eq + 1)));
            }
        }
        if (amp == std::string_view::npos) break;
        start = amp + 1;
    }
    return pairs;
}

std::optional<char32_t> single_scalar(std::string_view s) {
    if (s.empty()) return std::nullopt;
    std::size_t consumed = 0;
    std::size_t len = utf8_sequence(s, 0, consumed);
    if (len == 0 || len != s.size()) return std::nullopt;

    const auto b0 = static_cast<unsigned char>(s[0]);
    if (len == 1) return static_cast<char32_t>(b0);

    static const unsigned char lead_mask[] = {0, 0, 0x1F, 0x0F, 0x07};
    char32_t cp = b0 & lead_mask[len];
    for (std::size_t k = 1; k < len; ++k) {
        cp = (cp << 6) | (static_cast<unsigned char>(s[k]) & 0x3F);
    }
    return cp;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(start, end - start + 1));
}

bool starts_with(std::string_view s, std::string_view prefix) noexcept {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool istarts_with(std::string_view s, std::string_view prefix) noexcept {
    if (s.size() < prefix.size()) return false;
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

nlohmann::json parse_json_or_string(const std::string& raw) {
    auto parsed = nlohmann::json::parse(raw, nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return nlohmann::json(raw);
    }
    return parsed;
}

bool decimal_literal_overflows(std::string_view literal) noexcept {
    const std::size_t e = literal.find_first_of("eE");
    const std::string_view mantissa = literal.substr(0, e);

    long exponent = 0;
    if (e != std::string_view::npos) {
        std::size_t i = e + 1;
        bool negative = false;
        if (i < literal.size() && (literal[i] == '+' || literal[i] == '-')) {
            negative = literal[i] == '-';
            ++i;
        }
        for (; i < literal.size(); ++i) {
            // Saturate; anything this large is out of every float range
            if (exponent < 1000000) {
                exponent = exponent * 10 + (literal[i] - '0');
            }
        }
        if (negative) exponent = -exponent;
    }

    // mantissa = 0.d1d2... * 10^scale, with d1 the first non-zero digit
    const std::size_t dot = std::min(mantissa.find('.'), mantissa.size());
    const std::size_t first = mantissa.find_first_of("123456789");
    if (first == std::string_view::npos) {
        return false;
    }
    const long scale = first < dot ? static_cast<long>(dot - first)
                                   : -static_cast<long>(first - dot - 1);
    return exponent + scale > 0;
}

} // namespace paramtree
