/**
 * @file test_value.cpp
 * @brief Tests for the value model and its JSON interchange
 */

#include <gtest/gtest.h>
#include "paramtree/Value.hpp"

#include <limits>
#include <sstream>

using namespace paramtree;
using nlohmann::json;

// ============================================================================
// Number
// ============================================================================

TEST(Number, KindsPartition) {
    EXPECT_TRUE(Number::from_u64(5).is_pos_int());
    EXPECT_TRUE(Number::from_i64(5).is_pos_int());
    EXPECT_TRUE(Number::from_i64(0).is_pos_int());
    EXPECT_TRUE(Number::from_i64(-5).is_neg_int());
    EXPECT_TRUE(Number::from_f64(5.0).is_float());
}

TEST(Number, EqualityRequiresSameKind) {
    EXPECT_EQ(Number::from_i64(5), Number::from_u64(5));
    EXPECT_NE(Number::from_u64(5), Number::from_f64(5.0));
}

TEST(Number, ToDouble) {
    EXPECT_DOUBLE_EQ(Number::from_u64(3).to_double(), 3.0);
    EXPECT_DOUBLE_EQ(Number::from_i64(-3).to_double(), -3.0);
    EXPECT_DOUBLE_EQ(Number::from_f64(2.5).to_double(), 2.5);
}

TEST(Number, ToString) {
    EXPECT_EQ(Number::from_u64(42).to_string(), "42");
    EXPECT_EQ(Number::from_i64(-7).to_string(), "-7");
    EXPECT_EQ(Number::from_f64(1.5).to_string(), "1.5");
}

TEST(Number, AccessorMismatchThrows) {
    EXPECT_THROW(Number::from_u64(1).as_i64(), std::bad_variant_access);
}

// ============================================================================
// Value
// ============================================================================

TEST(Value, DefaultIsNull) {
    Value v;
    EXPECT_TRUE(v.is_null());
    EXPECT_EQ(v.kind(), Value::Kind::Null);
}

TEST(Value, TextFlavours) {
    Value s = Value::string("x");
    Value l = Value::loose("x");
    EXPECT_TRUE(s.is_string());
    EXPECT_TRUE(l.is_loose_string());
    EXPECT_TRUE(s.is_text());
    EXPECT_TRUE(l.is_text());
    EXPECT_EQ(s, l);
    EXPECT_NE(s, Value::loose("y"));
}

TEST(Value, EqualityAcrossKinds) {
    EXPECT_NE(Value(), Value(false));
    EXPECT_NE(Value::object(), Value::array());
    EXPECT_NE(Value(Number::from_u64(0)), Value(false));
}

TEST(Value, ContainerAccess) {
    Object obj;
    obj["a"] = Value(Array{Value::string("x"), Value(true)});
    Value v(obj);

    EXPECT_EQ(v.size(), 1u);
    EXPECT_EQ(v.at("a").size(), 2u);
    EXPECT_EQ(v.at("a").at(1), Value(true));
    EXPECT_THROW(v.at("missing"), std::out_of_range);
    EXPECT_THROW(v.at("a").at(5), std::out_of_range);
    EXPECT_THROW(v.at(0), std::out_of_range);
    EXPECT_EQ(Value::string("abc").size(), 0u);
}

TEST(Value, TypeNames) {
    EXPECT_STREQ(type_name(Value()), "null");
    EXPECT_STREQ(type_name(Value(true)), "boolean");
    EXPECT_STREQ(type_name(Value(Number::from_u64(1))), "number");
    EXPECT_STREQ(type_name(Value::string("")), "string");
    EXPECT_STREQ(type_name(Value::loose("")), "string");
    EXPECT_STREQ(type_name(Value::object()), "object");
    EXPECT_STREQ(type_name(Value::array()), "array");
    EXPECT_STREQ(type_name(Value(UploadFile{})), "file");
}

TEST(Value, IsContainer) {
    EXPECT_TRUE(is_container(Value::object()));
    EXPECT_TRUE(is_container(Value::array()));
    EXPECT_FALSE(is_container(Value::string("x")));
    EXPECT_FALSE(is_container(Value(UploadFile{})));
}

// ============================================================================
// UploadFile
// ============================================================================

TEST(UploadFile, EqualityComparesAllFields) {
    UploadFile a{"a.txt", "text/plain", "/tmp/1"};
    UploadFile b = a;
    EXPECT_EQ(a, b);

    b.locator = "/tmp/2";
    EXPECT_NE(a, b);

    b = a;
    b.content_type = "text/csv";
    EXPECT_NE(a, b);
}

// ============================================================================
// JSON interchange
// ============================================================================

TEST(ValueJson, ToJson) {
    Object obj;
    obj["s"] = Value::string("x");
    obj["l"] = Value::loose("y");
    obj["p"] = Number::from_u64(1);
    obj["n"] = Number::from_i64(-1);
    obj["f"] = Number::from_f64(0.5);
    obj["b"] = Value(true);
    obj["z"] = nullptr;
    obj["a"] = Value(Array{Value::string("e")});
    obj["u"] = UploadFile{"a.png", "image/png", "/tmp/up1"};

    json j = Value(obj);
    EXPECT_EQ(j, json::parse(R"({
        "s": "x", "l": "y", "p": 1, "n": -1, "f": 0.5, "b": true, "z": null,
        "a": ["e"],
        "u": {"name": "a.png", "content_type": "image/png", "locator": "/tmp/up1"}
    })"));
    EXPECT_TRUE(j["p"].is_number_unsigned());
    EXPECT_TRUE(j["n"].is_number_integer());
}

TEST(ValueJson, FromJson) {
    Value v = json::parse(R"({"s": "x", "p": 1, "n": -1, "f": 0.5, "b": false, "z": null, "a": [1]})")
                  .get<Value>();

    EXPECT_TRUE(v.at("s").is_string());
    EXPECT_EQ(v.at("p").as_number(), Number::from_u64(1));
    EXPECT_EQ(v.at("n").as_number(), Number::from_i64(-1));
    EXPECT_EQ(v.at("f").as_number(), Number::from_f64(0.5));
    EXPECT_EQ(v.at("b"), Value(false));
    EXPECT_TRUE(v.at("z").is_null());
    EXPECT_EQ(v.at("a").size(), 1u);
}

TEST(ValueJson, SignedNonNegativeBecomesPosInt) {
    json j = std::int64_t{7};
    EXPECT_TRUE(j.get<Value>().as_number().is_pos_int());
}

TEST(ValueJson, NanBecomesNull) {
    json j = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(j.get<Value>().is_null());
}

TEST(ValueJson, DumpAndStream) {
    Object obj;
    obj["a"] = Value::loose("1");
    Value v(obj);

    EXPECT_EQ(v.dump(), R"({"a":"1"})");
    EXPECT_EQ(v.dump(2), "{\n  \"a\": \"1\"\n}");

    std::ostringstream os;
    os << v;
    EXPECT_EQ(os.str(), R"({"a":"1"})");
}
