/**
 * @file JsonParser.cpp
 * @brief Implementation of the incremental JSON parser and value reader
 */

#include "paramtree/JsonParser.hpp"
#include "paramtree/Util.hpp"

#include <charconv>
#include <cmath>
#include <stdexcept>

namespace paramtree {

namespace {

constexpr std::size_t COMPACT_THRESHOLD = 4096;

bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

int hex_digit(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

const char* to_string(JsonEvent event) noexcept {
    switch (event) {
        case JsonEvent::NeedMoreInput: return "NeedMoreInput";
        case JsonEvent::StartObject: return "StartObject";
        case JsonEvent::EndObject: return "EndObject";
        case JsonEvent::StartArray: return "StartArray";
        case JsonEvent::EndArray: return "EndArray";
        case JsonEvent::FieldName: return "FieldName";
        case JsonEvent::ValueString: return "ValueString";
        case JsonEvent::ValueInt: return "ValueInt";
        case JsonEvent::ValueFloat: return "ValueFloat";
        case JsonEvent::ValueTrue: return "ValueTrue";
        case JsonEvent::ValueFalse: return "ValueFalse";
        case JsonEvent::ValueNull: return "ValueNull";
        case JsonEvent::Eof: return "Eof";
    }
    return "Unknown";
}

// ============================================================================
// JsonParser
// ============================================================================

void JsonParser::feed(std::string_view bytes) {
    if (finished_) {
        throw std::logic_error("JsonParser::feed() called after finish()");
    }
    buffer_.append(bytes.data(), bytes.size());
}

JsonEvent JsonParser::need_more() const {
    if (finished_) {
        throw IncompleteInput();
    }
    return JsonEvent::NeedMoreInput;
}

void JsonParser::syntax_error(const std::string& reason, std::size_t at) const {
    // Tokens never span lines, so the column is relative to pos_
    throw SyntaxError(reason, consumed_ + at, line_, column_ + (at - pos_));
}

void JsonParser::skip_whitespace() noexcept {
    while (pos_ < buffer_.size()) {
        const char c = buffer_[pos_];
        if (c == '\n') {
            ++line_;
            column_ = 1;
        } else if (c == ' ' || c == '\t' || c == '\r') {
            ++column_;
        } else {
            break;
        }
        ++pos_;
    }
}

void JsonParser::advance(std::size_t n) noexcept {
    pos_ += n;
    column_ += n;
}

void JsonParser::compact() {
    if (pos_ >= COMPACT_THRESHOLD) {
        buffer_.erase(0, pos_);
        consumed_ += pos_;
        pos_ = 0;
    }
}

void JsonParser::after_value() noexcept {
    expect_ = containers_.empty() ? Expect::Done : Expect::CommaOrEnd;
}

JsonEvent JsonParser::close(Container which) {
    advance(1);
    containers_.pop_back();
    after_value();
    return which == Container::Object ? JsonEvent::EndObject : JsonEvent::EndArray;
}

JsonEvent JsonParser::next_event() {
    compact();

    for (;;) {
        skip_whitespace();

        if (pos_ >= buffer_.size()) {
            if (expect_ == Expect::Done && finished_) {
                return JsonEvent::Eof;
            }
            return need_more();
        }

        const char c = buffer_[pos_];

        switch (expect_) {
            case Expect::Done:
                syntax_error("unexpected data after root value", pos_);

            case Expect::Colon:
                if (c != ':') {
                    syntax_error("expected ':'", pos_);
                }
                advance(1);
                expect_ = Expect::Value;
                continue;

            case Expect::CommaOrEnd: {
                const Container top = containers_.back();
                if (c == ',') {
                    advance(1);
                    expect_ = (top == Container::Object) ? Expect::Key : Expect::Value;
                    continue;
                }
                if (c == '}' && top == Container::Object) {
                    return close(Container::Object);
                }
                if (c == ']' && top == Container::Array) {
                    return close(Container::Array);
                }
                syntax_error(top == Container::Object ? "expected ',' or '}'"
                                                      : "expected ',' or ']'",
                             pos_);
            }

            case Expect::KeyOrObjectEnd:
                if (c == '}') {
                    return close(Container::Object);
                }
                [[fallthrough]];

            case Expect::Key:
                if (c != '"') {
                    syntax_error("expected string key", pos_);
                }
                if (!scan_string()) {
                    return need_more();
                }
                expect_ = Expect::Colon;
                return JsonEvent::FieldName;

            case Expect::ValueOrArrayEnd:
                if (c == ']') {
                    return close(Container::Array);
                }
                [[fallthrough]];

            case Expect::Value:
                switch (c) {
                    case '{':
                        advance(1);
                        containers_.push_back(Container::Object);
                        expect_ = Expect::KeyOrObjectEnd;
                        return JsonEvent::StartObject;
                    case '[':
                        advance(1);
                        containers_.push_back(Container::Array);
                        expect_ = Expect::ValueOrArrayEnd;
                        return JsonEvent::StartArray;
                    case '"':
                        if (!scan_string()) return need_more();
                        after_value();
                        return JsonEvent::ValueString;
                    case 't':
                        if (!scan_literal("true")) return need_more();
                        after_value();
                        return JsonEvent::ValueTrue;
                    case 'f':
                        if (!scan_literal("false")) return need_more();
                        after_value();
                        return JsonEvent::ValueFalse;
                    case 'n':
                        if (!scan_literal("null")) return need_more();
                        after_value();
                        return JsonEvent::ValueNull;
                    default:
                        break;
                }
                if (c == '-' || is_digit(c)) {
                    bool is_float = false;
                    if (!scan_number(is_float)) return need_more();
                    after_value();
                    return is_float ? JsonEvent::ValueFloat : JsonEvent::ValueInt;
                }
                syntax_error("unexpected character", pos_);
        }
    }
}

bool JsonParser::read_hex4(std::size_t at, char32_t& out) const {
    char32_t cp = 0;
    for (std::size_t k = 0; k < 4; ++k) {
        int d = hex_digit(buffer_[at + k]);
        if (d < 0) return false;
        cp = (cp << 4) | static_cast<char32_t>(d);
    }
    out = cp;
    return true;
}

bool JsonParser::scan_string() {
    std::string out;
    std::size_t i = pos_ + 1;

    for (;;) {
        if (i >= buffer_.size()) return false;

        const auto c = static_cast<unsigned char>(buffer_[i]);
        if (c == '"') {
            ++i;
            break;
        }
        if (c < 0x20) {
            syntax_error("control character in string", i);
        }
        if (c != '\\') {
            out += static_cast<char>(c);
            ++i;
            continue;
        }

        if (i + 1 >= buffer_.size()) return false;
        switch (buffer_[i + 1]) {
            case '"': out += '"'; break;
            case '\\': out += '\\'; break;
            case '/': out += '/'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'u': {
                if (i + 6 > buffer_.size()) return false;
                char32_t cp = 0;
                if (!read_hex4(i + 2, cp)) {
                    syntax_error("invalid \\u escape", i);
                }
                std::size_t len = 6;
                if (cp >= 0xD800 && cp <= 0xDBFF) {
                    if (i + 6 < buffer_.size() && buffer_[i + 6] != '\\') {
                        syntax_error("unpaired surrogate", i);
                    }
                    if (i + 7 < buffer_.size() && buffer_[i + 7] != 'u') {
                        syntax_error("unpaired surrogate", i);
                    }
                    if (i + 12 > buffer_.size()) return false;
                    char32_t low = 0;
                    if (!read_hex4(i + 8, low)) {
                        syntax_error("invalid \\u escape", i + 6);
                    }
                    if (low < 0xDC00 || low > 0xDFFF) {
                        syntax_error("unpaired surrogate", i);
                    }
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    len = 12;
                } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                    syntax_error("unpaired surrogate", i);
                }
                append_utf8(out, cp);
                i += len;
                continue;
            }
            default:
                syntax_error("invalid escape", i);
        }
        i += 2;
    }

    current_ = repair_utf8(out);
    advance(i - pos_);
    return true;
}

bool JsonParser::scan_number(bool& is_float) {
    const std::size_t size = buffer_.size();
    std::size_t i = pos_;
    is_float = false;

    // Returns false (wait) or raises, for a number cut off at the buffer end
    auto truncated = [&](std::size_t at) {
        if (!finished_) return false;
        syntax_error("incomplete number", at);
    };

    if (buffer_[i] == '-') ++i;
    if (i >= size) return truncated(i);

    if (buffer_[i] == '0') {
        ++i;
        if (i < size && is_digit(buffer_[i])) {
            syntax_error("leading zero in number", i);
        }
    } else if (is_digit(buffer_[i])) {
        while (i < size && is_digit(buffer_[i])) ++i;
    } else {
        syntax_error("invalid number", i);
    }

    if (i < size && buffer_[i] == '.') {
        is_float = true;
        ++i;
        if (i >= size) return truncated(i);
        if (!is_digit(buffer_[i])) syntax_error("expected digit after '.'", i);
        while (i < size && is_digit(buffer_[i])) ++i;
    }

    if (i < size && (buffer_[i] == 'e' || buffer_[i] == 'E')) {
        is_float = true;
        ++i;
        if (i >= size) return truncated(i);
        if (buffer_[i] == '+' || buffer_[i] == '-') ++i;
        if (i >= size) return truncated(i);
        if (!is_digit(buffer_[i])) syntax_error("expected digit in exponent", i);
        while (i < size && is_digit(buffer_[i])) ++i;
    }

    // The number might continue in the next chunk
    if (i >= size && !finished_) return false;

    current_.assign(buffer_, pos_, i - pos_);
    advance(i - pos_);
    return true;
}

bool JsonParser::scan_literal(std::string_view word) {
    const std::size_t avail = buffer_.size() - pos_;
    const std::size_t n = avail < word.size() ? avail : word.size();
    for (std::size_t k = 0; k < n; ++k) {
        if (buffer_[pos_ + k] != word[k]) {
            syntax_error("invalid literal", pos_ + k);
        }
    }
    if (n < word.size()) return false;
    advance(word.size());
    return true;
}

// ============================================================================
// JsonValueReader
// ============================================================================

void JsonValueReader::feed(std::string_view bytes) {
    parser_.feed(bytes);
    drain();
}

Value JsonValueReader::finish() {
    parser_.finish();
    drain();
    if (!root_) {
        throw IncompleteInput();
    }
    return std::move(*root_);
}

void JsonValueReader::drain() {
    for (;;) {
        const JsonEvent event = parser_.next_event();
        switch (event) {
            case JsonEvent::NeedMoreInput:
            case JsonEvent::Eof:
                return;

            case JsonEvent::StartObject:
                enter_container();
                frames_.emplace_back(std::move(pending_key_), Value::object());
                pending_key_.reset();
                break;

            case JsonEvent::StartArray:
                enter_container();
                frames_.emplace_back(std::move(pending_key_), Value::array());
                pending_key_.reset();
                break;

            case JsonEvent::EndObject:
            case JsonEvent::EndArray: {
                auto frame = std::move(frames_.back());
                frames_.pop_back();
                pending_key_ = std::move(frame.first);
                attach(std::move(frame.second));
                break;
            }

            case JsonEvent::FieldName:
                pending_key_ = parser_.current_str();
                break;

            default:
                attach(scalar(event));
                break;
        }
    }
}

void JsonValueReader::enter_container() const {
    if (frames_.size() >= depth_limit_) {
        throw ParamsTooDeep(depth_limit_);
    }
}

void JsonValueReader::attach(Value v) {
    if (frames_.empty()) {
        root_ = std::move(v);
        return;
    }

    Value& top = frames_.back().second;
    if (top.is_object()) {
        top.as_object()[pending_key_.value_or(std::string())] = std::move(v);
    } else {
        top.as_array().push_back(std::move(v));
    }
    pending_key_.reset();
}

Value JsonValueReader::scalar(JsonEvent event) const {
    const std::string& text = parser_.current_str();

    switch (event) {
        case JsonEvent::ValueString:
            return Value::string(text);
        case JsonEvent::ValueTrue:
            return Value(true);
        case JsonEvent::ValueFalse:
            return Value(false);
        case JsonEvent::ValueNull:
            return Value();
        case JsonEvent::ValueInt: {
            const char* first = text.data();
            const char* last = text.data() + text.size();
            std::int64_t i = 0;
            auto [ptr, ec] = std::from_chars(first, last, i);
            if (ec == std::errc() && ptr == last) {
                return Number::from_i64(i);
            }
            if (text.front() != '-') {
                std::uint64_t u = 0;
                auto [uptr, uec] = std::from_chars(first, last, u);
                if (uec == std::errc() && uptr == last) {
                    return Number::from_u64(u);
                }
            }
            // Too large for any integer kind
            [[fallthrough]];
        }
        case JsonEvent::ValueFloat: {
            auto d = parse_decimal_float<double>(text);
            if (!d || !std::isfinite(*d)) {
                return Value();
            }
            return Number::from_f64(*d);
        }
        default:
            break;
    }
    throw std::logic_error(std::string("unexpected JSON event ") + to_string(event));
}

Value parse_json(std::string_view bytes, std::size_t depth_limit) {
    JsonValueReader reader(depth_limit);
    reader.feed(bytes);
    return reader.finish();
}

} // namespace paramtree
