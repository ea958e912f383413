#include "pattern_compiler.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace CommentScan {
namespace patterns {

static bool isDebugEnabled() {
  static bool initialized = false;
  static bool debug = false;
  if (!initialized) {
    debug = (std::getenv("COMMENTSCAN_DEBUG") != nullptr);
    initialized = true;
  }
  return debug;
}

using dialects::RuleShape;

Matcher::Matcher(const dialects::Dialect &dialect)
    : dialectName_(dialect.name()) {
  alternatives_.reserve(dialect.skipRules().size() +
                        dialect.keepRules().size());
  for (const auto &rule : dialect.skipRules()) {
    alternatives_.push_back(Alternative{MatchKind::Skip, rule});
  }
  for (const auto &rule : dialect.keepRules()) {
    alternatives_.push_back(Alternative{MatchKind::Keep, rule});
  }

  for (size_t i = 0; i < alternatives_.size(); ++i) {
    const std::string &open = alternatives_[i].rule.open;
    if (open.empty())
      continue;
    byFirstByte_[static_cast<unsigned char>(open[0])].push_back(i);
  }
}

std::optional<Match> Matcher::findNext(std::string_view text,
                                       size_t offset) const {
  ScanMemo memo;
  return findNext(text, offset, memo);
}

std::optional<Match> Matcher::findNext(std::string_view text, size_t offset,
                                       ScanMemo &memo) const {
  for (size_t pos = offset; pos < text.size(); ++pos) {
    if (byFirstByte_[static_cast<unsigned char>(text[pos])].empty())
      continue;
    if (auto match = matchAt(text, pos, memo)) {
      return match;
    }
  }
  return std::nullopt;
}

std::optional<Match> Matcher::matchAt(std::string_view text, size_t pos,
                                      ScanMemo &memo) const {
  for (size_t index : byFirstByte_[static_cast<unsigned char>(text[pos])]) {
    if (auto match = tryAlternative(alternatives_[index], text, pos, memo)) {
      return match;
    }
  }
  return std::nullopt;
}

std::optional<Match> Matcher::tryAlternative(const Alternative &alt,
                                             std::string_view text, size_t pos,
                                             ScanMemo &memo) const {
  const dialects::Rule &rule = alt.rule;
  const size_t len = text.size();

  if (text.compare(pos, rule.open.size(), rule.open) != 0) {
    return std::nullopt;
  }

  size_t end = len;
  switch (rule.shape) {
  case RuleShape::QuotedString: {
    const char delimiter = rule.open[0];
    const auto slot = static_cast<unsigned char>(delimiter);

    if (rule.refuseTripleOpen && pos + 2 < len && text[pos + 1] == delimiter &&
        text[pos + 2] == delimiter) {
      return std::nullopt;
    }
    if (memo.unterminatedFrom[slot] != std::string_view::npos &&
        pos >= memo.unterminatedFrom[slot]) {
      return std::nullopt;
    }

    size_t i = pos + 1;
    bool closed = false;
    while (i < len) {
      char c = text[i];
      if (c == '\\') {
        // エスケープは直後の1文字をそのまま消費する
        i += 2;
        continue;
      }
      if (c == delimiter) {
        closed = true;
        break;
      }
      ++i;
    }

    if (!closed) {
      memo.unterminatedFrom[slot] =
          std::min(memo.unterminatedFrom[slot], pos);
      return std::nullopt;
    }
    end = i + 1;
    break;
  }
  case RuleShape::DelimitedBlock: {
    // Unterminated blocks run to the end of the input.
    size_t close = text.find(rule.close, pos + rule.open.size());
    if (close != std::string_view::npos) {
      end = close + rule.close.size();
    }
    break;
  }
  case RuleShape::LineComment: {
    size_t newline = text.find('\n', pos + rule.open.size());
    if (newline != std::string_view::npos) {
      end = newline;
    }
    break;
  }
  }

  Match match;
  match.kind = alt.kind;
  match.shape = rule.shape;
  match.start = pos;
  match.end = end;
  match.text = text.substr(pos, end - pos);
  return match;
}

std::shared_ptr<const Matcher> compile(const dialects::Dialect &dialect) {
  return std::make_shared<const Matcher>(dialect);
}

std::shared_ptr<const Matcher> compile(const std::string &dialectName) {
  return MatcherCache::getInstance().get(dialects::lookup(dialectName));
}

MatcherCache &MatcherCache::getInstance() {
  static MatcherCache instance;
  return instance;
}

std::shared_ptr<const Matcher>
MatcherCache::get(const dialects::Dialect &dialect) {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  auto it = cache_.find(dialect.name());
  if (it != cache_.end()) {
    return it->second;
  }

  auto matcher = compile(dialect);
  cache_.emplace(dialect.name(), matcher);
  if (isDebugEnabled()) {
    std::cerr << "[DEBUG] compiled matcher for " << dialect.name() << " ("
              << dialect.skipRules().size() << " skip, "
              << dialect.keepRules().size() << " keep)" << std::endl;
  }
  return matcher;
}

size_t MatcherCache::size() const {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  return cache_.size();
}

} // namespace patterns
} // namespace CommentScan
