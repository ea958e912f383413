#pragma once

#include "dialect_registry.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace CommentScan {
namespace patterns {

enum class MatchKind { Skip, Keep };

struct Match {
  MatchKind kind{MatchKind::Skip};
  dialects::RuleShape shape{dialects::RuleShape::QuotedString};
  size_t start{0};
  size_t end{0};
  std::string_view text;
};

// Scan-local knowledge carried between calls of Matcher::findNext. A quoted
// string that runs off the end of the input from offset p does so from every
// later opener of the same delimiter as well.
struct ScanMemo {
  std::array<size_t, 256> unterminatedFrom;

  ScanMemo() { unterminatedFrom.fill(std::string_view::npos); }
};

class Matcher {
public:
  explicit Matcher(const dialects::Dialect &dialect);

  const std::string &dialectName() const { return dialectName_; }

  // offset 以降で最も手前から始まり、優先度の高いマッチを返す
  std::optional<Match> findNext(std::string_view text, size_t offset) const;
  std::optional<Match> findNext(std::string_view text, size_t offset,
                                ScanMemo &memo) const;

private:
  struct Alternative {
    MatchKind kind;
    dialects::Rule rule;
  };

  std::optional<Match> matchAt(std::string_view text, size_t pos,
                               ScanMemo &memo) const;
  std::optional<Match> tryAlternative(const Alternative &alt,
                                      std::string_view text, size_t pos,
                                      ScanMemo &memo) const;

  std::string dialectName_;
  // skip alternatives first, then keep alternatives, in registration order
  std::vector<Alternative> alternatives_;
  // opener first byte -> alternative indices in priority order
  std::array<std::vector<size_t>, 256> byFirstByte_;
};

std::shared_ptr<const Matcher> compile(const dialects::Dialect &dialect);

// Resolves the name through the registry and reuses the cached matcher.
std::shared_ptr<const Matcher> compile(const std::string &dialectName);

class MatcherCache {
public:
  static MatcherCache &getInstance();

  std::shared_ptr<const Matcher> get(const dialects::Dialect &dialect);
  size_t size() const;

private:
  MatcherCache() = default;
  mutable std::mutex cache_mutex_;
  std::unordered_map<std::string, std::shared_ptr<const Matcher>> cache_;
};

} // namespace patterns
} // namespace CommentScan
