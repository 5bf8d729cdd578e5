#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <string>

using tracr::core::json::Value;

TEST_CASE("Parse reads nested objects arrays and scalars", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(tracr::core::json::Parse(
      R"({"id":"abc","deviceConstraints":[{"role":"a","order":0},{"role":"b"}],"flag":true,"n":null,"x":-1.5e2})",
      root, error));
  REQUIRE(error.empty());
  REQUIRE(root.IsObject());

  const Value* id = root.Find("id");
  REQUIRE(id != nullptr);
  REQUIRE(id->IsString());
  REQUIRE(id->string_value == "abc");

  const Value* constraints = root.Find("deviceConstraints");
  REQUIRE(constraints != nullptr);
  REQUIRE(constraints->IsArray());
  REQUIRE(constraints->array_value.size() == 2U);
  REQUIRE(constraints->array_value[0].Find("order")->number_value == 0.0);
  REQUIRE(constraints->array_value[1].Find("order") == nullptr);

  REQUIRE(root.Find("flag")->IsBool());
  REQUIRE(root.Find("flag")->bool_value);
  REQUIRE(root.Find("n")->IsNull());
  REQUIRE(root.Find("x")->number_value == -150.0);
  REQUIRE(root.Find("missing") == nullptr);
}

TEST_CASE("Parse decodes string escapes", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(tracr::core::json::Parse(R"({"s":"a\"b\\c\ndA"})", root, error));
  REQUIRE(root.Find("s")->string_value == "a\"b\\c\ndA");
}

TEST_CASE("Parse reports line and column for malformed input", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE_FALSE(tracr::core::json::Parse("{\n  \"id\": \"x\",\n  \"order\": }", root, error));
  REQUIRE(error.find("line 3") != std::string::npos);

  REQUIRE_FALSE(tracr::core::json::Parse(R"({"a":1} trailing)", root, error));
  REQUIRE(error.find("trailing") != std::string::npos);
}

TEST_CASE("Parse rejects duplicate keys and runaway nesting", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE_FALSE(tracr::core::json::Parse(R"({"metric":"a","metric":"b"})", root, error));
  REQUIRE(error.find("duplicate object key 'metric'") != std::string::npos);

  const std::string deep = std::string(tracr::core::json::kMaxNestingDepth + 1U, '[') +
                           std::string(tracr::core::json::kMaxNestingDepth + 1U, ']');
  REQUIRE_FALSE(tracr::core::json::Parse(deep, root, error));
  REQUIRE(error.find("nesting deeper than") != std::string::npos);

  const std::string limit = std::string(tracr::core::json::kMaxNestingDepth, '[') +
                            std::string(tracr::core::json::kMaxNestingDepth, ']');
  REQUIRE(tracr::core::json::Parse(limit, root, error));
}

TEST_CASE("Parse decodes unicode escapes including surrogate pairs", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(tracr::core::json::Parse(R"({"s":"\u00e9\ud83d\ude00"})", root, error));
  REQUIRE(root.Find("s")->string_value == "\xC3\xA9\xF0\x9F\x98\x80");
  REQUIRE_FALSE(tracr::core::json::Parse(R"({"s":"\ud83d\u0041"})", root, error));
  REQUIRE_FALSE(tracr::core::json::Parse(R"({"s":"\u12g4"})", root, error));
}

TEST_CASE("Parse enforces the number grammar", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(tracr::core::json::Parse("[1E+2,-0.5,0]", root, error));
  REQUIRE(root.array_value[0].number_value == 100.0);
  REQUIRE(root.array_value[1].number_value == -0.5);
  REQUIRE_FALSE(tracr::core::json::Parse("[1.]", root, error));
  REQUIRE_FALSE(tracr::core::json::Parse("[01]", root, error));
  REQUIRE_FALSE(tracr::core::json::Parse("[1e999]", root, error));
}

TEST_CASE("SerializeJson sorts object keys", "[core][json]") {
  Value root;
  std::string error;
  REQUIRE(tracr::core::json::Parse(R"({"b":[1,2.5,"x"],"a":{"z":false,"y":null}})", root, error));
  REQUIRE(tracr::core::SerializeJson(root) == R"({"a":{"y":null,"z":false},"b":[1,2.5,"x"]})");
}

TEST_CASE("JsonObjectWriter keeps insertion order and escapes", "[core][json]") {
  tracr::core::JsonObjectWriter writer;
  writer.String("name", "tab\there").Int("count", -3).Bool("ok", true).Null("none");
  REQUIRE(writer.Finish() == R"({"name":"tab\there","count":-3,"ok":true,"none":null})");
}

TEST_CASE("FormatJsonDouble prefers the shortest exact form", "[core][json]") {
  REQUIRE(tracr::core::FormatJsonDouble(0.1) == "0.1");
  REQUIRE(tracr::core::FormatJsonDouble(42.0) == "42");
  REQUIRE(tracr::core::FormatJsonDouble(10.0) == "10");
  REQUIRE(tracr::core::FormatJsonDouble(100.0) == "100");
  REQUIRE(tracr::core::FormatJsonDouble(1500.0) == "1500");
  REQUIRE(tracr::core::FormatJsonDouble(-63.0) == "-63");
  REQUIRE(tracr::core::FormatJsonDouble(0.25) == "0.25");
  REQUIRE(tracr::core::FormatJsonDouble(std::numeric_limits<double>::infinity()) == "0");
}
