/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE JsonReaderTest
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>
#include <string>

using namespace LockboxEngine;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.getType(), JsonType::Null);

  JsonValue trueVal(true);
  BOOST_CHECK(trueVal.isBool());
  BOOST_CHECK_EQUAL(trueVal.asBool(), true);

  JsonValue number(3.5);
  BOOST_CHECK(number.isNumber());
  BOOST_CHECK_CLOSE(number.asNumber(), 3.5, 0.001);
  BOOST_CHECK_EQUAL(number.asInt(), 3);

  JsonValue str("hello");
  BOOST_CHECK(str.isString());
  BOOST_CHECK_EQUAL(str.asString(), "hello");
}

BOOST_AUTO_TEST_CASE(TestTryAccessors) {
  JsonValue number(42.0);
  BOOST_CHECK(number.tryAsInt().has_value());
  BOOST_CHECK_EQUAL(*number.tryAsInt(), 42);
  BOOST_CHECK(!number.tryAsBool().has_value());
  BOOST_CHECK(!number.tryAsString().has_value());
  BOOST_CHECK(number.tryAsArray() == nullptr);
  BOOST_CHECK(number.tryAsObject() == nullptr);
}

BOOST_AUTO_TEST_CASE(TestMissingLookupsYieldNull) {
  JsonObject obj;
  obj["id"] = JsonValue(4151.0);
  JsonValue objVal(obj);

  BOOST_CHECK(objVal.hasKey("id"));
  BOOST_CHECK(!objVal.hasKey("name"));
  BOOST_CHECK(objVal["name"].isNull());
  BOOST_CHECK(objVal["name"]["deeper"].isNull());
  BOOST_CHECK(objVal[size_t{3}].isNull());
  BOOST_CHECK_EQUAL(objVal.size(), 1);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderTests)

BOOST_AUTO_TEST_CASE(TestParseItemDocument) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"({
    "items": [
      { "id": 4151, "name": "Abyssal whip", "tradeable": true, "linked_note_id": 4152 },
      { "id": 6570, "name": "Fire cape", "tradeable": false, "extra": null }
    ]
  })"));

  const JsonValue& root = reader.getRoot();
  BOOST_REQUIRE(root.isObject());
  const JsonValue& items = root["items"];
  BOOST_REQUIRE(items.isArray());
  BOOST_CHECK_EQUAL(items.size(), 2);
  BOOST_CHECK_EQUAL(items[size_t{0}]["id"].asInt(), 4151);
  BOOST_CHECK_EQUAL(items[size_t{0}]["name"].asString(), "Abyssal whip");
  BOOST_CHECK_EQUAL(items[size_t{1}]["tradeable"].asBool(), false);
  BOOST_CHECK(items[size_t{1}]["extra"].isNull());
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestNumbers) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse("[0, -17, 2.5, 1e3, -4.25E-2]"));
  const JsonValue& root = reader.getRoot();
  BOOST_CHECK_EQUAL(root[size_t{0}].asInt(), 0);
  BOOST_CHECK_EQUAL(root[size_t{1}].asInt(), -17);
  BOOST_CHECK_CLOSE(root[size_t{2}].asNumber(), 2.5, 0.001);
  BOOST_CHECK_CLOSE(root[size_t{3}].asNumber(), 1000.0, 0.001);
  BOOST_CHECK_CLOSE(root[size_t{4}].asNumber(), -0.0425, 0.001);
}

BOOST_AUTO_TEST_CASE(TestIntegerConversionLimits) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(
      "[2147483647, -2147483648, 2147483648, 1e20, -1e20, 100.9, -0.5, 4294967396, 1e3]"));
  const JsonValue& root = reader.getRoot();

  BOOST_CHECK_EQUAL(root[size_t{0}].tryAsInt().value_or(0), 2147483647);
  BOOST_CHECK_EQUAL(root[size_t{1}].tryAsInt().value_or(0), -2147483647 - 1);
  BOOST_CHECK(!root[size_t{2}].tryAsInt().has_value());
  BOOST_CHECK(!root[size_t{3}].tryAsInt().has_value());
  BOOST_CHECK(!root[size_t{4}].tryAsInt().has_value());
  BOOST_CHECK(!root[size_t{5}].tryAsInt().has_value());
  BOOST_CHECK(!root[size_t{6}].tryAsInt().has_value());
  BOOST_CHECK(!root[size_t{7}].tryAsInt().has_value());
  BOOST_CHECK_EQUAL(root[size_t{8}].tryAsInt().value_or(0), 1000);

  // asInt saturates instead of overflowing
  BOOST_CHECK_EQUAL(root[size_t{3}].asInt(), 2147483647);
  BOOST_CHECK_EQUAL(root[size_t{4}].asInt(), -2147483647 - 1);
  BOOST_CHECK_EQUAL(root[size_t{5}].asInt(), 100);
}

BOOST_AUTO_TEST_CASE(TestStringEscapes) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"(["a\"b", "line\nbreak", "tab\t", "\u00e9", "\ud83d\ude00", "slash\/"])"));
  const JsonValue& root = reader.getRoot();
  BOOST_CHECK_EQUAL(root[size_t{0}].asString(), "a\"b");
  BOOST_CHECK_EQUAL(root[size_t{1}].asString(), "line\nbreak");
  BOOST_CHECK_EQUAL(root[size_t{2}].asString(), "tab\t");
  BOOST_CHECK_EQUAL(root[size_t{3}].asString(), "\xc3\xa9");
  BOOST_CHECK_EQUAL(root[size_t{4}].asString(), "\xf0\x9f\x98\x80");
  BOOST_CHECK_EQUAL(root[size_t{5}].asString(), "slash/");
}

BOOST_AUTO_TEST_CASE(TestMalformedInput) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse(""));
  BOOST_CHECK(!reader.parse("{"));
  BOOST_CHECK(!reader.parse("{\"a\" 1}"));
  BOOST_CHECK(!reader.parse("[1, 2,]"));
  BOOST_CHECK(!reader.parse("[1 2]"));
  BOOST_CHECK(!reader.parse("tru"));
  BOOST_CHECK(!reader.parse("+5"));
  BOOST_CHECK(!reader.parse("\"unterminated"));
  BOOST_CHECK(!reader.parse("\"bad \\x escape\""));
  BOOST_CHECK(!reader.parse("{} trailing"));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestErrorReportsPosition) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("{\n  \"id\": 1,\n  \"name\" \"whip\"\n}"));
  BOOST_CHECK(reader.getLastError().find("Line 3") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestSuccessfulParseClearsError) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("[1,"));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(reader.parse("[1]"));
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestNestingDepthLimit) {
  JsonReader reader;
  const std::string deep = std::string(200, '[') + std::string(200, ']');
  BOOST_CHECK(!reader.parse(deep));

  const std::string shallow = std::string(10, '[') + std::string(10, ']');
  BOOST_CHECK(reader.parse(shallow));
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
  std::filesystem::create_directories("tests/test_data");
  const std::string path = "tests/test_data/json_reader_test.json";
  {
    std::ofstream file(path);
    file << R"({"unlocked": [2, 995]})";
  }

  JsonReader reader;
  BOOST_REQUIRE(reader.loadFromFile(path));
  BOOST_CHECK_EQUAL(reader.getRoot()["unlocked"].size(), 2);

  std::error_code ec;
  std::filesystem::remove(path, ec);

  BOOST_CHECK(!reader.loadFromFile("tests/test_data/missing.json"));
  BOOST_CHECK(reader.getLastError().find("Failed to open file") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
