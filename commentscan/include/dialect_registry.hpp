#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace CommentScan {
namespace dialects {

enum class RuleShape {
  QuotedString,   // "..." '...' `...` (backslash escapes one character)
  DelimitedBlock, // /* ... */ """ ... """ (non-greedy, may span lines)
  LineComment,    // // ... # ... (up to the next '\n')
};

struct Rule {
  RuleShape shape{RuleShape::QuotedString};
  std::string open;
  std::string close;
  // Python: a quote followed by two more of the same quote opens a triple
  // quoted block, never a plain string.
  bool refuseTripleOpen{false};
};

Rule quotedString(char delimiter);
Rule strictQuotedString(char delimiter);
Rule tripleQuotedBlock(char quote);
Rule lineComment(const std::string &token);
Rule blockComment(const std::string &open, const std::string &close);

class Dialect {
public:
  Dialect(std::string name, std::vector<Rule> skipRules,
          std::vector<Rule> keepRules);

  const std::string &name() const { return name_; }
  // 文字列リテラル等、読み飛ばす規則 (優先)
  const std::vector<Rule> &skipRules() const { return skipRules_; }
  // コメントとして報告する規則
  const std::vector<Rule> &keepRules() const { return keepRules_; }

private:
  std::string name_;
  std::vector<Rule> skipRules_;
  std::vector<Rule> keepRules_;
};

class UnsupportedDialectError : public std::invalid_argument {
public:
  explicit UnsupportedDialectError(const std::string &name);

  const std::string &dialectName() const { return name_; }

private:
  std::string name_;
};

// 大文字小文字を区別せずに方言を解決する (未対応の場合は例外)
const Dialect &lookup(const std::string &name);

bool isDialectSupported(const std::string &name);

// Accepted dialect names, sorted.
std::vector<std::string> supportedDialectNames();

} // namespace dialects
} // namespace CommentScan
