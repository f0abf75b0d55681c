/**
 * @file Params.hpp
 * @brief Folding every request parameter source into one tree
 *
 * ParamsBuilder is the entry point for a request layer. Sources are folded
 * in the order they are added, usually:
 *   1. path parameters       (add_path_param)
 *   2. the query string      (add_query)
 *   3. the body              (add_body / add_json_body / add_multipart_field)
 * then the tree is decoded into the handler's record with decode<T>().
 *
 * Example:
 * ```cpp
 * ParamsBuilder params;
 * params.add_path_param("id", "42");
 * params.add_query("tags[]=a&tags[]=b");
 * params.add_body("application/json", R"({"name": "Ada"})", "POST");
 * auto req = params.decode<CreateRequest>();
 * ```
 *
 * Any failure aborts the whole parameter set: the exception propagates and
 * the builder should be discarded.
 */

#ifndef PARAMTREE_PARAMS_HPP
#define PARAMTREE_PARAMS_HPP

#include "paramtree/Deserializer.hpp"
#include "paramtree/Errors.hpp"
#include "paramtree/Options.hpp"
#include "paramtree/QueryParser.hpp"
#include "paramtree/Value.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace paramtree {

/**
 * @brief One already-read multipart/form-data field
 *
 * A field with a file_name is an upload: its bytes were written to
 * collaborator-owned storage identified by `locator`. Otherwise `text`
 * holds the field body.
 */
struct MultipartField {
    std::string name;
    std::optional<std::string> content_type;
    std::optional<std::string> file_name;
    std::string text;
    std::string locator;
};

class ParamsBuilder {
public:
    ParamsBuilder() = default;

    explicit ParamsBuilder(ParserOptions options)
        : options_(std::move(options))
        , parser_(options_.query_parser())
    {}

    const ParserOptions& options() const noexcept { return options_; }

    /**
     * @brief Fold a path parameter
     *
     * Anything from the first '?' on is dropped; the rest is a LooseString.
     */
    void add_path_param(std::string_view key, std::string_view value);

    /// Fold a raw query string.
    void add_query(std::string_view query);

    /**
     * @brief Fold a request body according to its content type
     *
     * - application/json...                  → add_json_body()
     * - application/x-www-form-urlencoded... → add_form_body(), skipped for
     *   GET/HEAD when ignore_form_body_on_get is set
     * - multipart/form-data...               → ParamsError; multipart bodies
     *   arrive field by field through add_multipart_field()
     * - anything else                        → ignored
     *
     * Content-type matching is case-insensitive.
     *
     * @return true if the body was folded
     */
    bool add_body(std::string_view content_type, std::string_view body,
                  std::string_view method = "POST");

    /// Parse a JSON document and merge it (must be an object) into the tree.
    void add_json_body(std::string_view bytes);

    /// Fold an application/x-www-form-urlencoded body.
    void add_form_body(std::string_view body);

    /**
     * @brief Fold one multipart field
     *
     * JSON fields (content type application/json) are parsed; with an empty
     * name the document is merged into the tree, with a plain name it is
     * merged with the value already under that key, and with a bracketed
     * name it is folded at that path. Uploads become an UploadFile; other
     * fields are LooseString text.
     */
    void add_multipart_field(const MultipartField& field);

    const Object& tree() const noexcept { return tree_; }

    /// Move the tree out; the builder is left empty.
    Object take() noexcept { return std::exchange(tree_, Object{}); }

    /// Decode the tree as T.
    template <typename T>
    T decode() const {
        return paramtree::decode<T>(Value(tree_));
    }

private:
    ParserOptions options_;
    QueryParser parser_;
    Object tree_;
};

} // namespace paramtree

#endif // PARAMTREE_PARAMS_HPP
