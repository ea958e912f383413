#include "dialect_registry.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace {

using CommentScan::dialects::Dialect;

using DialectMap =
    std::unordered_map<std::string, std::shared_ptr<const Dialect>>;

std::string toLower(std::string input) {
  std::transform(
      input.begin(), input.end(), input.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return input;
}

DialectMap buildDialectMap() {
  using namespace CommentScan::dialects;

  auto python = std::make_shared<const Dialect>(
      "Python",
      std::vector<Rule>{strictQuotedString('"'), strictQuotedString('\'')},
      std::vector<Rule>{lineComment("#"), tripleQuotedBlock('"'),
                        tripleQuotedBlock('\'')});

  auto cStyle = [](const std::string &name) {
    return std::make_shared<const Dialect>(
        name, std::vector<Rule>{quotedString('"'), quotedString('\'')},
        std::vector<Rule>{lineComment("//"), blockComment("/*", "*/")});
  };

  auto jsStyle = [](const std::string &name) {
    return std::make_shared<const Dialect>(
        name,
        std::vector<Rule>{quotedString('"'), quotedString('\''),
                          quotedString('`')},
        std::vector<Rule>{lineComment("//"), blockComment("/*", "*/")});
  };

  auto php = std::make_shared<const Dialect>(
      "PHP", std::vector<Rule>{quotedString('"'), quotedString('\'')},
      std::vector<Rule>{lineComment("//"), lineComment("#"),
                        blockComment("/*", "*/")});

  auto js = jsStyle("JS");

  return DialectMap{{"python", python},
                    {"c", cStyle("C")},
                    {"c++", cStyle("C++")},
                    {"java", cStyle("Java")},
                    {"c#", cStyle("C#")},
                    {"js", js},
                    {"javascript", js},
                    {"go", jsStyle("Go")},
                    {"php", php}};
}

const DialectMap &dialectMap() {
  static const DialectMap map = buildDialectMap();
  return map;
}

} // namespace

namespace CommentScan {
namespace dialects {

Rule quotedString(char delimiter) {
  Rule rule;
  rule.shape = RuleShape::QuotedString;
  rule.open = std::string(1, delimiter);
  rule.close = rule.open;
  return rule;
}

Rule strictQuotedString(char delimiter) {
  Rule rule = quotedString(delimiter);
  rule.refuseTripleOpen = true;
  return rule;
}

Rule tripleQuotedBlock(char quote) {
  Rule rule;
  rule.shape = RuleShape::DelimitedBlock;
  rule.open = std::string(3, quote);
  rule.close = rule.open;
  return rule;
}

Rule lineComment(const std::string &token) {
  Rule rule;
  rule.shape = RuleShape::LineComment;
  rule.open = token;
  return rule;
}

Rule blockComment(const std::string &open, const std::string &close) {
  Rule rule;
  rule.shape = RuleShape::DelimitedBlock;
  rule.open = open;
  rule.close = close;
  return rule;
}

Dialect::Dialect(std::string name, std::vector<Rule> skipRules,
                 std::vector<Rule> keepRules)
    : name_(std::move(name)), skipRules_(std::move(skipRules)),
      keepRules_(std::move(keepRules)) {}

UnsupportedDialectError::UnsupportedDialectError(const std::string &name)
    : std::invalid_argument("Unsupported language: " + name), name_(name) {}

const Dialect &lookup(const std::string &name) {
  const auto &map = dialectMap();
  auto it = map.find(toLower(name));
  if (it == map.end()) {
    throw UnsupportedDialectError(name);
  }
  return *it->second;
}

bool isDialectSupported(const std::string &name) {
  const auto &map = dialectMap();
  return map.find(toLower(name)) != map.end();
}

std::vector<std::string> supportedDialectNames() {
  std::vector<std::string> names;
  names.reserve(dialectMap().size());
  for (const auto &entry : dialectMap()) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace dialects
} // namespace CommentScan
