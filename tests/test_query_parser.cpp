/**
 * @file test_query_parser.cpp
 * @brief Tests for the nested bracket-key normalizer using Google Test
 *
 * The table-style cases follow Rack's nested query behaviour; the indexed
 * array cases cover the `a[N]` extension.
 */

#include <gtest/gtest.h>
#include "paramtree/QueryParser.hpp"

using namespace paramtree;
using nlohmann::json;

namespace {

json parsed(std::string_view qs, const QueryParser& parser = QueryParser()) {
    return json(Value(parser.parse_nested_query(qs)));
}

json expected(const char* text) {
    return json::parse(text);
}

} // namespace

// ============================================================================
// Flat keys
// ============================================================================

TEST(NestedQuery, EmptyQuery) {
    EXPECT_EQ(parsed(""), expected("{}"));
    EXPECT_EQ(parsed("&&"), expected("{}"));
}

TEST(NestedQuery, KeyWithoutValueIsNull) {
    EXPECT_EQ(parsed("foo"), expected(R"({"foo": null})"));
    EXPECT_EQ(parsed("foo&bar="), expected(R"({"foo": null, "bar": ""})"));
}

TEST(NestedQuery, EmptyValue) {
    EXPECT_EQ(parsed("foo="), expected(R"({"foo": ""})"));
    EXPECT_EQ(parsed("foo&foo="), expected(R"({"foo": ""})"));
}

TEST(NestedQuery, SimplePairs) {
    EXPECT_EQ(parsed("foo=bar"), expected(R"({"foo": "bar"})"));
    EXPECT_EQ(parsed("foo=\"bar\""), expected(R"({"foo": "\"bar\""})"));
    EXPECT_EQ(parsed("foo=1&bar=2"), expected(R"({"foo": "1", "bar": "2"})"));
    EXPECT_EQ(parsed("&foo=1&&bar=2"), expected(R"({"foo": "1", "bar": "2"})"));
}

TEST(NestedQuery, LastPlainKeyWins) {
    EXPECT_EQ(parsed("foo=bar&foo=quux"), expected(R"({"foo": "quux"})"));
}

TEST(NestedQuery, ValueKeepsEverythingAfterFirstEquals) {
    EXPECT_EQ(parsed("a=b=c"), expected(R"({"a": "b=c"})"));
}

TEST(NestedQuery, PercentAndPlusDecoding) {
    EXPECT_EQ(parsed("my+weird+field=q1%212%22%27w%245%267%2Fz8%29%3F"),
              expected(R"({"my weird field": "q1!2\"'w$5&7/z8)?"})"));
    EXPECT_EQ(parsed("a=b&pid%3D1234=1023"),
              expected(R"({"pid=1234": "1023", "a": "b"})"));
}

TEST(NestedQuery, MalformedEscapesKeptVerbatim) {
    EXPECT_EQ(parsed("a=%zz&b=%4"), expected(R"({"a": "%zz", "b": "%4"})"));
}

TEST(NestedQuery, InvalidUtf8IsReplaced) {
    Object tree = QueryParser().parse_nested_query("foo=%ff&b%fe=1");
    EXPECT_EQ(tree.at("foo").as_string(), "\xEF\xBF\xBD");
    EXPECT_EQ(tree.count("b\xEF\xBF\xBD"), 1u);
}

TEST(NestedQuery, ValuesAreLooseStrings) {
    Object tree = QueryParser().parse_nested_query("a=1&b[]=2&c[d]=3");
    EXPECT_TRUE(tree.at("a").is_loose_string());
    EXPECT_TRUE(tree.at("b").at(0).is_loose_string());
    EXPECT_TRUE(tree.at("c").at("d").is_loose_string());
}

// ============================================================================
// Arrays
// ============================================================================

TEST(NestedQuery, AppendedArray) {
    EXPECT_EQ(parsed("foo[]"), expected(R"({"foo": [null]})"));
    EXPECT_EQ(parsed("foo[]="), expected(R"({"foo": [""]})"));
    EXPECT_EQ(parsed("foo[]=bar"), expected(R"({"foo": ["bar"]})"));
    EXPECT_EQ(parsed("foo[]=1&foo[]=2"), expected(R"({"foo": ["1", "2"]})"));
    EXPECT_EQ(parsed("foo=bar&baz[]=1&baz[]=2&baz[]=3"),
              expected(R"({"foo": "bar", "baz": ["1", "2", "3"]})"));
    EXPECT_EQ(parsed("foo[]=bar&baz[]=1&baz[]=2&baz[]=3"),
              expected(R"({"foo": ["bar"], "baz": ["1", "2", "3"]})"));
}

// ============================================================================
// Nested hashes
// ============================================================================

TEST(NestedQuery, NestedHashes) {
    EXPECT_EQ(parsed("x[y][z]=1"), expected(R"({"x": {"y": {"z": "1"}}})"));
    EXPECT_EQ(parsed("x[y][z][]=1"), expected(R"({"x": {"y": {"z": ["1"]}}})"));
    EXPECT_EQ(parsed("x[y][z]=1&x[y][z]=2"), expected(R"({"x": {"y": {"z": "2"}}})"));
    EXPECT_EQ(parsed("x[y][z][]=1&x[y][z][]=2"),
              expected(R"({"x": {"y": {"z": ["1", "2"]}}})"));
}

TEST(NestedQuery, SiblingsShareParent) {
    EXPECT_EQ(parsed("user[name]=Ada&user[role]=admin"),
              expected(R"({"user": {"name": "Ada", "role": "admin"}})"));
}

TEST(NestedQuery, PlainKeyReplacesNestedValue) {
    EXPECT_EQ(parsed("a[b]=c&a=d"), expected(R"({"a": "d"})"));
}

// ============================================================================
// Hashes inside arrays
// ============================================================================

TEST(NestedQuery, HashInArray) {
    EXPECT_EQ(parsed("x[y][][z]=1"), expected(R"({"x": {"y": [{"z": "1"}]}})"));
    EXPECT_EQ(parsed("x[y][][z][]=1"), expected(R"({"x": {"y": [{"z": ["1"]}]}})"));
    EXPECT_EQ(parsed("x[y][][z]=1&x[y][][w]=2"),
              expected(R"({"x": {"y": [{"z": "1", "w": "2"}]}})"));
    EXPECT_EQ(parsed("x[y][][v][w]=1"), expected(R"({"x": {"y": [{"v": {"w": "1"}}]}})"));
    EXPECT_EQ(parsed("x[y][][z]=1&x[y][][v][w]=2"),
              expected(R"({"x": {"y": [{"z": "1", "v": {"w": "2"}}]}})"));
}

TEST(NestedQuery, RepeatedKeyStartsNewElement) {
    EXPECT_EQ(parsed("x[y][][z]=1&x[y][][z]=2"),
              expected(R"({"x": {"y": [{"z": "1"}, {"z": "2"}]}})"));
    EXPECT_EQ(parsed("x[y][][z]=1&x[y][][w]=a&x[y][][z]=2&x[y][][w]=3"),
              expected(R"({"x": {"y": [{"z": "1", "w": "a"}, {"z": "2", "w": "3"}]}})"));
    EXPECT_EQ(parsed("x[][y]=1&x[][y]=2"), expected(R"({"x": [{"y": "1"}, {"y": "2"}]})"));
    EXPECT_EQ(parsed("x[][y]=1&x[][z]=2"), expected(R"({"x": [{"y": "1", "z": "2"}]})"));
}

TEST(NestedQuery, NestedHashInsideArrayElement) {
    EXPECT_EQ(parsed("x[][y]=1&x[][z][w]=a&x[][y]=2&x[][z][w]=b"),
              expected(R"({"x": [{"y": "1", "z": {"w": "a"}}, {"y": "2", "z": {"w": "b"}}]})"));
    EXPECT_EQ(parsed("x[][z][w]=a&x[][z][w]=b"),
              expected(R"({"x": [{"z": {"w": "a"}}, {"z": {"w": "b"}}]})"));
}

TEST(NestedQuery, ManyFieldsPerElement) {
    EXPECT_EQ(parsed("x[][id]=1&x[][y][a]=5&x[][y][b]=7&x[][z][id]=3&x[][z][w]=0"
                     "&x[][id]=2&x[][y][a]=6&x[][y][b]=8&x[][z][id]=4&x[][z][w]=0"),
              expected(R"({"x": [
                  {"id": "1", "y": {"a": "5", "b": "7"}, "z": {"id": "3", "w": "0"}},
                  {"id": "2", "y": {"a": "6", "b": "8"}, "z": {"id": "4", "w": "0"}}
              ]})"));
}

TEST(NestedQuery, ArrayOfHashesInsideArrayElement) {
    EXPECT_EQ(parsed("x[][y][][z]=1&x[][y][][w]=2"),
              expected(R"({"x": [{"y": [{"z": "1", "w": "2"}]}]})"));
}

TEST(NestedQuery, DeeplyNamedCollection) {
    EXPECT_EQ(parsed("data[books][][data][page]=1&data[books][][data][page]=2"),
              expected(R"({"data": {"books": [{"data": {"page": "1"}}, {"data": {"page": "2"}}]}})"));
}

// ============================================================================
// Odd bracket placement
// ============================================================================

TEST(NestedQuery, UnbalancedBracketsAreLiteral) {
    EXPECT_EQ(parsed("foo]=bar"), expected(R"({"foo]": "bar"})"));
    EXPECT_EQ(parsed("foo[=bar"), expected(R"({"foo[": "bar"})"));
}

TEST(NestedQuery, LeadingBracketIsPartOfRoot) {
    EXPECT_EQ(parsed("[foo]=bar"), expected(R"({"[foo]": "bar"})"));
    EXPECT_EQ(parsed("[]=1"), expected(R"({"[]": "1"})"));
}

TEST(NestedQuery, TextAfterClosingBracket) {
    EXPECT_EQ(parsed("foo[bar]baz=1"), expected(R"({"foo": {"bar": {"baz": "1"}}})"));
}

// ============================================================================
// Indexed arrays
// ============================================================================

TEST(IndexedArray, ZeroExtends) {
    EXPECT_EQ(parsed("a[1]=x"), expected(R"({"a": [{}, "x"]})"));
    EXPECT_EQ(parsed("a[0]=x&a[2]=z"), expected(R"({"a": ["x", {}, "z"]})"));
}

TEST(IndexedArray, LaterIndexOverwrites) {
    EXPECT_EQ(parsed("a[0]=x&a[0]=y"), expected(R"({"a": ["y"]})"));
}

TEST(IndexedArray, NestedObjectsShareElement) {
    EXPECT_EQ(parsed("a[0][b]=1&a[0][c]=2&a[1][b]=3"),
              expected(R"({"a": [{"b": "1", "c": "2"}, {"b": "3"}]})"));
}

TEST(IndexedArray, AppendedAndIndexedAppliedInOrder) {
    EXPECT_EQ(parsed("a[]=x&a[0]=y"), expected(R"({"a": ["y"]})"));
    EXPECT_EQ(parsed("a[0]=x&a[]=y"), expected(R"({"a": ["x", "y"]})"));
}

TEST(IndexedArray, PlaceholderTakesAnyShape) {
    EXPECT_EQ(parsed("a[1][]=x&a[0][]=y"), expected(R"({"a": [["y"], ["x"]]})"));
    EXPECT_EQ(parsed("a[0][]=y&a[1][]=x"), expected(R"({"a": [["y"], ["x"]]})"));
    EXPECT_EQ(parsed("a[2][b]=1&a[0][1]=z"), expected(R"({"a": [[{}, "z"], {}, {"b": "1"}]})"));
}

TEST(IndexedArray, FilledElementKeepsItsShape) {
    EXPECT_THROW(QueryParser().parse_nested_query("a[0][b]=1&a[0][]=x"), ParameterTypeError);
}

TEST(IndexedArray, LeadingZeroIsObjectKey) {
    EXPECT_EQ(parsed("a[01]=x"), expected(R"({"a": {"01": "x"}})"));
}

TEST(IndexedArray, IndexAboveLimit) {
    QueryParser parser(DEFAULT_DEPTH_LIMIT, 5);
    EXPECT_EQ(parsed("a[5]=x", parser), expected(R"({"a": [{}, {}, {}, {}, {}, "x"]})"));

    try {
        parser.parse_nested_query("a[6]=x");
        FAIL() << "Expected InvalidParameter";
    } catch (const InvalidParameter& e) {
        EXPECT_EQ(e.key(), "a");
    }

    EXPECT_THROW(QueryParser().parse_nested_query("a[99999999999999999999]=x"),
                 InvalidParameter);
}

TEST(IndexedArray, ScalarElementCannotBecomeObject) {
    EXPECT_THROW(QueryParser().parse_nested_query("a[0]=1&a[0][b]=2"), ParameterTypeError);
}

// ============================================================================
// Type conflicts
// ============================================================================

TEST(TypeConflict, StringThenHash) {
    try {
        QueryParser().parse_nested_query("x[y]=1&x[y]z=2");
        FAIL() << "Expected ParameterTypeError";
    } catch (const ParameterTypeError& e) {
        EXPECT_EQ(e.key(), "y");
        EXPECT_EQ(e.expected(), "object");
        EXPECT_EQ(e.actual(), "string");
        EXPECT_STREQ(e.what(), "expected object (got string) for param `y`");
    }
}

TEST(TypeConflict, HashThenArray) {
    try {
        QueryParser().parse_nested_query("x[y]=1&x[]=1");
        FAIL() << "Expected ParameterTypeError";
    } catch (const ParameterTypeError& e) {
        EXPECT_EQ(e.key(), "x");
        EXPECT_EQ(e.expected(), "array");
        EXPECT_EQ(e.actual(), "object");
    }
}

TEST(TypeConflict, StringThenHashInArray) {
    EXPECT_THROW(QueryParser().parse_nested_query("x[y]=1&x[y][][w]=2"), ParameterTypeError);
}

TEST(TypeConflict, ExplicitNullIsNotReplaced) {
    try {
        QueryParser().parse_nested_query("a&a[]=1");
        FAIL() << "Expected ParameterTypeError";
    } catch (const ParameterTypeError& e) {
        EXPECT_EQ(e.actual(), "null");
    }
}

TEST(TypeConflict, PairsBeforeFailureStayFolded) {
    Object tree;
    EXPECT_THROW(QueryParser().parse_nested_query_into(tree, "a=1&b[c]=2&b[]=3&d=4"),
                 ParameterTypeError);
    EXPECT_EQ(json(Value(tree)), expected(R"({"a": "1", "b": {"c": "2"}})"));
}

// ============================================================================
// Depth limit
// ============================================================================

TEST(DepthLimit, WithinLimit) {
    QueryParser parser(3);
    EXPECT_EQ(parsed("a[b][c]=1", parser), expected(R"({"a": {"b": {"c": "1"}}})"));
}

TEST(DepthLimit, TooDeep) {
    QueryParser parser(3);
    try {
        parser.parse_nested_query("a[b][c][d]=1");
        FAIL() << "Expected ParamsTooDeep";
    } catch (const ParamsTooDeep& e) {
        EXPECT_EQ(e.limit(), 3u);
    }
}

TEST(DepthLimit, CountsHashInArrayLevels) {
    QueryParser parser(2);
    EXPECT_NO_THROW(parser.parse_nested_query("x[][y]=1"));
    EXPECT_THROW(parser.parse_nested_query("x[][y][z]=1"), ParamsTooDeep);
}

TEST(DepthLimit, DefaultAllowsDeepKeys) {
    std::string key = "a";
    for (int i = 0; i < 50; ++i) key += "[b]";
    EXPECT_NO_THROW(QueryParser().parse_nested_query(key + "=1"));

    for (int i = 0; i < 60; ++i) key += "[b]";
    EXPECT_THROW(QueryParser().parse_nested_query(key + "=1"), ParamsTooDeep);
}

// ============================================================================
// parse_nested_value
// ============================================================================

TEST(NestedValue, FoldsTypedValue) {
    Object tree;
    QueryParser parser;
    parser.parse_nested_value(tree, "user[age]", Value(Number::from_u64(42)));
    parser.parse_nested_value(tree, "user[admin]", Value(true));

    EXPECT_EQ(tree.at("user").at("age"), Value(Number::from_u64(42)));
    EXPECT_EQ(tree.at("user").at("admin"), Value(true));
}

TEST(NestedValue, EmptyKeyIsNoop) {
    Object tree;
    QueryParser().parse_nested_value(tree, "", Value::loose("x"));
    EXPECT_TRUE(tree.empty());
}

TEST(NestedValue, KeepsKeyUndecoded) {
    Object tree;
    QueryParser().parse_nested_value(tree, "a+b%20c", Value::loose("x"));
    EXPECT_EQ(tree.count("a+b%20c"), 1u);
}

// ============================================================================
// params_hash_has_key
// ============================================================================

TEST(HashHasKey, Lookup) {
    Object tree = QueryParser().parse_nested_query("y=1&z[w]=2");
    EXPECT_TRUE(params_hash_has_key(tree, "y"));
    EXPECT_TRUE(params_hash_has_key(tree, "z"));
    EXPECT_TRUE(params_hash_has_key(tree, "[z][w]"));
    EXPECT_FALSE(params_hash_has_key(tree, "[z][v]"));
    EXPECT_FALSE(params_hash_has_key(tree, "q"));
}

TEST(HashHasKey, AppendPathsNeverPresent) {
    Object tree = QueryParser().parse_nested_query("y[]=1");
    EXPECT_FALSE(params_hash_has_key(tree, "y[]"));
    EXPECT_FALSE(params_hash_has_key(tree, "[y][]"));
}
