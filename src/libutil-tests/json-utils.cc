#include <gtest/gtest.h>

#include "arbor/util/json-utils.hh"

namespace arbor {

using nlohmann::json;

TEST(valueAt, simpleObject)
{
    auto simple = json::parse(R"({ "hello": "world" })");

    ASSERT_EQ(valueAt(getObject(simple), "hello"), "world");

    auto nested = json::parse(R"({ "hello": { "world": "" } })");

    auto & nestedObject = valueAt(getObject(nested), "hello");

    ASSERT_EQ(valueAt(getObject(nestedObject), "world"), "");
}

TEST(valueAt, missingKeyThrows)
{
    auto simple = json::parse(R"({ "hello": "world" })");

    ASSERT_THROW(valueAt(getObject(simple), "goodbye"), Error);
}

TEST(optionalValueAt, existing)
{
    auto v = json::parse(R"({ "string": "ssh-rsa" })");

    auto * p = optionalValueAt(getObject(v), "string");
    ASSERT_NE(p, nullptr);
    ASSERT_EQ(*p, "ssh-rsa");
}

TEST(optionalValueAt, empty)
{
    auto v = json::parse(R"({})");

    ASSERT_EQ(optionalValueAt(getObject(v), "string"), nullptr);
}

TEST(getObject, rightAssertions)
{
    auto simple = json::parse(R"({ "object": {} })");

    ASSERT_EQ(getObject(valueAt(getObject(simple), "object")), (json::object_t{}));
}

TEST(getObject, wrongAssertions)
{
    auto v = json::parse(R"({ "object": {}, "array": [], "string": "", "int": 0, "boolean": false })");

    auto & obj = getObject(v);

    ASSERT_THROW(getObject(valueAt(obj, "array")), Error);
    ASSERT_THROW(getObject(valueAt(obj, "string")), Error);
    ASSERT_THROW(getObject(valueAt(obj, "int")), Error);
    ASSERT_THROW(getObject(valueAt(obj, "boolean")), Error);
}

TEST(getArray, wrongAssertions)
{
    auto v = json::parse(R"({ "object": {}, "string": "" })");

    ASSERT_THROW(getArray(valueAt(getObject(v), "object")), Error);
    ASSERT_THROW(getArray(valueAt(getObject(v), "string")), Error);
}

TEST(getString, wrongAssertions)
{
    auto v = json::parse(R"({ "object": {}, "array": [], "int": 0 })");

    ASSERT_THROW(getString(valueAt(getObject(v), "object")), Error);
    ASSERT_THROW(getString(valueAt(getObject(v), "array")), Error);
    ASSERT_THROW(getString(valueAt(getObject(v), "int")), Error);
}

TEST(getUnsigned, rightAssertions)
{
    auto v = json::parse(R"({ "partition": 3 })");

    ASSERT_EQ(getUnsigned(valueAt(getObject(v), "partition")), 3u);
}

TEST(getUnsigned, wrongAssertions)
{
    auto v = json::parse(R"({ "negative": -1, "float": 1.5, "string": "3" })");

    ASSERT_THROW(getUnsigned(valueAt(getObject(v), "negative")), Error);
    ASSERT_THROW(getUnsigned(valueAt(getObject(v), "float")), Error);
    ASSERT_THROW(getUnsigned(valueAt(getObject(v), "string")), Error);
}

TEST(getBoolean, wrongAssertions)
{
    auto v = json::parse(R"({ "int": 0 })");

    ASSERT_THROW(getBoolean(valueAt(getObject(v), "int")), Error);
}

TEST(getStringSet, deduplicates)
{
    auto v = json::parse(R"(["CAP_SYS_ADMIN", "CAP_CHOWN", "CAP_SYS_ADMIN"])");

    ASSERT_EQ(getStringSet(v), (StringSet{"CAP_CHOWN", "CAP_SYS_ADMIN"}));
}

TEST(getStringSet, rejectsNonStrings)
{
    auto v = json::parse(R"(["CAP_CHOWN", 1])");

    ASSERT_THROW(getStringSet(v), Error);
}

/* ----------------------------------------------------------------------------
 * canonicalJSON
 * --------------------------------------------------------------------------*/

TEST(canonicalJSON, sortsKeysAndDropsWhitespace)
{
    auto a = json::parse(R"({ "b": 1, "a": { "y": [1, 2], "x": null } })");

    ASSERT_EQ(canonicalJSON(a), R"({"a":{"x":null,"y":[1,2]},"b":1})");
}

TEST(canonicalJSON, independentOfSourceFormatting)
{
    auto a = json::parse(R"({"options": {"paths": ["/etc"], "mode": 420}, "type": "org.osbuild.chmod"})");
    auto b = json::parse(R"(
        {
          "type": "org.osbuild.chmod",
          "options": { "mode": 420, "paths": [ "/etc" ] }
        })");

    ASSERT_EQ(canonicalJSON(a), canonicalJSON(b));
}

TEST(canonicalJSON, escapesNonASCII)
{
    auto a = json::parse(R"({"name": "café"})");

    ASSERT_EQ(canonicalJSON(a), R"({"name":"caf\u00e9"})");
}

TEST(canonicalJSON, arrayOrderMatters)
{
    ASSERT_NE(canonicalJSON(json::parse("[1, 2]")), canonicalJSON(json::parse("[2, 1]")));
}

} // namespace arbor
