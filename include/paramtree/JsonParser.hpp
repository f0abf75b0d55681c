/**
 * @file JsonParser.hpp
 * @brief Incremental JSON pull parser producing paramtree Values
 *
 * JsonParser is an event-driven scanner: bytes are supplied with feed(),
 * end of input is signalled with finish(), and next_event() yields one
 * event at a time. While a token is split across feeds it reports
 * NeedMoreInput without consuming anything.
 *
 * JsonValueReader folds those events onto an explicit stack of
 * (pending key, partially built Value) frames, so nesting depth never
 * turns into native recursion. Nesting is still capped (json_depth_limit)
 * because the finished tree is torn down, compared and dumped recursively.
 *
 * Example:
 * ```cpp
 * JsonValueReader reader;
 * reader.feed(R"({"a": [1, )");
 * reader.feed(R"(-2, 3.5]})");
 * Value v = reader.finish();   // {"a": [1, -2, 3.5]}
 * ```
 */

#ifndef PARAMTREE_JSONPARSER_HPP
#define PARAMTREE_JSONPARSER_HPP

#include "paramtree/Errors.hpp"
#include "paramtree/Value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace paramtree {

constexpr std::size_t DEFAULT_JSON_DEPTH_LIMIT = 1000;

enum class JsonEvent {
    NeedMoreInput,
    StartObject,
    EndObject,
    StartArray,
    EndArray,
    FieldName,
    ValueString,
    ValueInt,
    ValueFloat,
    ValueTrue,
    ValueFalse,
    ValueNull,
    Eof,
};

const char* to_string(JsonEvent event) noexcept;

class JsonParser {
public:
    JsonParser() = default;

    /**
     * @brief Append input bytes
     * @throws std::logic_error if called after finish()
     */
    void feed(std::string_view bytes);

    /// Mark the end of input.
    void finish() noexcept { finished_ = true; }

    bool finished() const noexcept { return finished_; }

    /**
     * @brief Produce the next event
     *
     * @throws SyntaxError on malformed input (position points at the
     *         offending byte)
     * @throws IncompleteInput if input was finished mid-document
     */
    JsonEvent next_event();

    /**
     * @brief Text of the last FieldName/ValueString (unescaped) or
     *        ValueInt/ValueFloat (raw number text) event
     */
    const std::string& current_str() const noexcept { return current_; }

    /// Absolute byte offset of the next unconsumed byte.
    std::size_t offset() const noexcept { return consumed_ + pos_; }
    std::size_t line() const noexcept { return line_; }
    std::size_t column() const noexcept { return column_; }

private:
    enum class Expect {
        Value,
        ValueOrArrayEnd,
        KeyOrObjectEnd,
        Key,
        Colon,
        CommaOrEnd,
        Done,
    };

    enum class Container { Object, Array };

    JsonEvent need_more() const;
    [[noreturn]] void syntax_error(const std::string& reason, std::size_t at) const;

    void skip_whitespace() noexcept;
    void advance(std::size_t n) noexcept;
    void compact();
    void after_value() noexcept;
    JsonEvent close(Container which);

    // Token scanners: return true when a full token was consumed into
    // current_, false when more input is needed.
    bool scan_string();
    bool scan_number(bool& is_float);
    bool scan_literal(std::string_view word);
    bool read_hex4(std::size_t at, char32_t& out) const;

    std::string buffer_;
    std::size_t pos_ = 0;
    std::size_t consumed_ = 0;
    std::size_t line_ = 1;
    std::size_t column_ = 1;
    bool finished_ = false;

    Expect expect_ = Expect::Value;
    std::vector<Container> containers_;
    std::string current_;
};

/**
 * @brief Builds one root Value from a JSON event stream
 *
 * - strings          → String
 * - integers         → PosInt / NegInt (beyond u64: Float)
 * - fractions/exponents → Float (non-finite: Null)
 * - true/false       → Bool
 * - null             → Null
 * Duplicate object keys keep the last value.
 */
class JsonValueReader {
public:
    explicit JsonValueReader(std::size_t depth_limit = DEFAULT_JSON_DEPTH_LIMIT) noexcept
        : depth_limit_(depth_limit)
    {}

    /**
     * @brief Feed more bytes and fold every complete event
     * @throws SyntaxError
     * @throws ParamsTooDeep when containers nest beyond the depth limit
     */
    void feed(std::string_view bytes);

    /**
     * @brief Finish input and return the root value
     * @throws SyntaxError, IncompleteInput
     */
    Value finish();

private:
    void drain();
    void enter_container() const;
    void attach(Value v);
    Value scalar(JsonEvent event) const;

    std::size_t depth_limit_;
    JsonParser parser_;
    std::vector<std::pair<std::optional<std::string>, Value>> frames_;
    std::optional<std::string> pending_key_;
    std::optional<Value> root_;
};

/**
 * @brief One-shot parse of a complete JSON document
 *
 * @throws SyntaxError on malformed JSON
 * @throws IncompleteInput if the document is truncated or empty
 * @throws ParamsTooDeep if containers nest deeper than depth_limit
 */
Value parse_json(std::string_view bytes, std::size_t depth_limit = DEFAULT_JSON_DEPTH_LIMIT);

} // namespace paramtree

#endif // PARAMTREE_JSONPARSER_HPP
