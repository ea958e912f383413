#include "comment_extractor.hpp"
#include "dialect_registry.hpp"
#include "pattern_compiler.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

using namespace CommentScan;
using comments::extractComments;
using Strings = std::vector<std::string>;

TEST_CASE("python hash inside a string is not a comment", "[extract]") {
  std::string code = "# top comment\n"
                     "x = \"has # not a comment\"\n";
  CHECK(extractComments(code, "python") == Strings{"# top comment"});
}

TEST_CASE("c++ line, trailing and block comments", "[extract]") {
  std::string code = "// line\n"
                     "char* s = \"http://x.com\"; // trailing\n"
                     "/* block\n"
                     "   comment */\n";
  CHECK(extractComments(code, "C++") ==
        Strings{"// line", "// trailing", "/* block\n   comment */"});
}

TEST_CASE("js template literal content is skipped", "[extract]") {
  std::string code = "// JS Comment\n"
                     "const s = `template // not a comment`;\n"
                     "/* Block */\n";
  CHECK(extractComments(code, "JS") == Strings{"// JS Comment", "/* Block */"});
}

TEST_CASE("php c-style, shell-style and block comments", "[extract]") {
  std::string code = "// c-style\n"
                     "# shell-style\n"
                     "$u = \"http://x.com\";\n"
                     "/* block */\n";
  CHECK(extractComments(code, "PHP") ==
        Strings{"// c-style", "# shell-style", "/* block */"});
}

TEST_CASE("python docstrings are reported with their quotes", "[extract]") {
  std::string code = "def f():\n"
                     "    '''\n"
                     "    Doc string.\n"
                     "    '''\n"
                     "    s = \"\"\n"
                     "    t = '' # empty\n"
                     "    return \"\"\"inline\"\"\" # done\n";
  CHECK(extractComments(code, "python") ==
        Strings{"'''\n    Doc string.\n    '''", "# empty",
                "\"\"\"inline\"\"\"", "# done"});
}

TEST_CASE("escaped quote inside a python string", "[extract]") {
  std::string code = "s = 'it\\'s # fine'  # real\n";
  CHECK(extractComments(code, "python") == Strings{"# real"});
}

TEST_CASE("go raw strings hide block comment openers", "[extract]") {
  std::string code = "var re = `/* not */ // either`\n"
                     "/* yes */ x := \"//\" // also\n";
  CHECK(extractComments(code, "go") == Strings{"/* yes */", "// also"});
}

TEST_CASE("char literals are skipped in c-style dialects", "[extract]") {
  std::string code = "char q = '\"'; // quote\n"
                     "char s = '/'; char t = '*'; /* slash star */\n";
  CHECK(extractComments(code, "java") ==
        Strings{"// quote", "/* slash star */"});
  CHECK(extractComments(code, "c#") == Strings{"// quote", "/* slash star */"});
}

TEST_CASE("hash is not a comment in c", "[extract]") {
  std::string code = "#include <stdio.h> // io\n";
  CHECK(extractComments(code, "c") == Strings{"// io"});
}

TEST_CASE("escaped backslash ends before the delimiter", "[extract]") {
  std::string code = "s = \"a\\\\\" // c\n";
  CHECK(extractComments(code, "c") == Strings{"// c"});
}

TEST_CASE("escape consumes a line break inside a string", "[extract]") {
  std::string code = "s = \"a\\\n// x\" // y\n";
  CHECK(extractComments(code, "c") == Strings{"// y"});
}

TEST_CASE("unterminated block constructs run to end of input", "[extract]") {
  CHECK(extractComments("int x; /* open\nstill", "c") ==
        Strings{"/* open\nstill"});
  CHECK(extractComments("x = 1\n\"\"\"never closed\n", "python") ==
        Strings{"\"\"\"never closed\n"});
}

TEST_CASE("unterminated string lets later comments through", "[extract]") {
  CHECK(extractComments("s = 'abc // x", "javascript") == Strings{"// x"});
}

TEST_CASE("comment at end of input without newline", "[extract]") {
  CHECK(extractComments("x = 1 # tail", "python") == Strings{"# tail"});
}

TEST_CASE("empty and comment-free input yield nothing", "[extract]") {
  CHECK(extractComments("", "python").empty());
  CHECK(extractComments("int main() { return 0; }", "c").empty());
  CHECK(extractComments("s = \"// only a string\"", "php").empty());
}

TEST_CASE("extraction is idempotent", "[extract]") {
  std::string code = "a = 1 # one\nb = '#' # two\n";
  auto first = extractComments(code, "python");
  auto second = extractComments(code, "python");
  CHECK(first == second);
  CHECK(first == Strings{"# one", "# two"});
}

TEST_CASE("dialect names are case-insensitive", "[extract]") {
  std::string code = "x = \"#\" # c\n";
  auto expected = extractComments(code, "python");
  CHECK(extractComments(code, "Python") == expected);
  CHECK(extractComments(code, "PYTHON") == expected);
}

TEST_CASE("unsupported dialect fails even on empty input", "[extract]") {
  CHECK_THROWS_AS(extractComments("// x", "cobol"),
                  dialects::UnsupportedDialectError);
  CHECK_THROWS_AS(extractComments("", "cobol"),
                  dialects::UnsupportedDialectError);
}

TEST_CASE("segments keep byte ranges and kinds in source order",
          "[extract]") {
  std::string code = "a(); // one\n/* two */ b(\"/* no */\");\n// three";
  auto segments = comments::extractCommentSegments(code, "c");

  REQUIRE(segments.size() == 3);
  CHECK(segments[0].text == "// one");
  CHECK(segments[0].kind == comments::CommentKind::Line);
  CHECK(segments[1].text == "/* two */");
  CHECK(segments[1].kind == comments::CommentKind::Block);
  CHECK(segments[2].text == "// three");

  for (size_t i = 0; i < segments.size(); ++i) {
    const auto &segment = segments[i];
    CHECK(code.substr(segment.startByte, segment.endByte - segment.startByte) ==
          segment.text);
    if (i > 0) {
      CHECK(segments[i - 1].endByte <= segment.startByte);
    }
  }
}

TEST_CASE("string contents never leak into comments", "[extract]") {
  const std::vector<std::string> literals = {
      "\"// a\"", "\"/* b */\"", "'// c'", "\"# d\"", "'# e'"};

  for (const char *language : {"c", "c++", "java", "c#", "js", "go", "php"}) {
    for (const auto &literal : literals) {
      std::string code = "x = " + literal + ";\n";
      auto found = extractComments(code, language);
      CHECK(found.empty());
    }
  }

  for (const auto &literal : literals) {
    CHECK(extractComments("x = " + literal + "\n", "python").empty());
  }
}

TEST_CASE("a run of unmatched quotes stays linear", "[extract]") {
  std::string code = "\"";
  for (int i = 0; i < 50000; ++i) {
    code += "\\\"";
  }
  code += " // end";

  CHECK(extractComments(code, "c") == Strings{"// end"});
}

TEST_CASE("segments can be extracted with a prebuilt matcher", "[extract]") {
  auto matcher = patterns::compile(dialects::lookup("php"));
  auto segments = comments::extractCommentSegments("# a\n// b", *matcher);
  REQUIRE(segments.size() == 2);
  CHECK(segments[0].text == "# a");
  CHECK(segments[1].text == "// b");
  CHECK(std::string(comments::kindName(segments[1].kind)) == "line");
}
