#include "comment_json.hpp"

#include <catch2/catch.hpp>

#include <string>

using namespace CommentScan;
using nlohmann::json;

TEST_CASE("plain output is an array of strings", "[json]") {
  std::string code = "// a\nx(); /* b */";
  auto segments = comments::extractCommentSegments(code, "c");

  json result = segmentsToJson(code, segments, OutputConfig{});
  CHECK(result == json::array({"// a", "/* b */"}));
}

TEST_CASE("kinds and ranges produce objects", "[json]") {
  std::string code = "x = 1\n# note\n'''doc\nmore'''";
  auto segments = comments::extractCommentSegments(code, "python");

  OutputConfig output;
  output.includeKind = true;
  output.includeRanges = true;
  json result = segmentsToJson(code, segments, output);

  REQUIRE(result.size() == 2);
  CHECK(result[0]["text"] == "# note");
  CHECK(result[0]["kind"] == "line");
  CHECK(result[0]["range"]["startByte"] == 6);
  CHECK(result[0]["range"]["endByte"] == 12);
  CHECK(result[0]["range"]["start"]["line"] == 1);
  CHECK(result[0]["range"]["start"]["character"] == 0);
  CHECK(result[0]["range"]["end"]["character"] == 6);

  CHECK(result[1]["kind"] == "block");
  CHECK(result[1]["range"]["start"]["line"] == 2);
  CHECK(result[1]["range"]["end"]["line"] == 3);
  CHECK(result[1]["range"]["end"]["character"] == 7);
}

TEST_CASE("kind without ranges omits the range key", "[json]") {
  std::string code = "/* only */";
  auto segments = comments::extractCommentSegments(code, "java");

  OutputConfig output;
  output.includeKind = true;
  json result = segmentsToJson(code, segments, output);

  REQUIRE(result.size() == 1);
  CHECK(result[0]["text"] == "/* only */");
  CHECK_FALSE(result[0].contains("range"));
}

TEST_CASE("invalid utf-8 in a comment is replaced when dumped", "[json]") {
  std::string code = "x = 1; // caf\xE9\n";
  auto segments = comments::extractCommentSegments(code, "c");
  REQUIRE(segments.size() == 1);
  CHECK(segments[0].text == "// caf\xE9");

  json result = segmentsToJson(code, segments, OutputConfig{});
  CHECK(dumpJson(result) == "[\"// caf\xEF\xBF\xBD\"]");
  CHECK(dumpJson(result, 2) == "[\n  \"// caf\xEF\xBF\xBD\"\n]");
}

TEST_CASE("valid utf-8 is written unescaped", "[json]") {
  json value = json::array({"# \xE3\x81\x82"});
  CHECK(dumpJson(value) == "[\"# \xE3\x81\x82\"]");
}
