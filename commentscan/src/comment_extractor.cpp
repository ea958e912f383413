#include "comment_extractor.hpp"
#include "pattern_compiler.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

static bool isDebugEnabled() {
  static bool initialized = false;
  static bool debug = false;
  if (!initialized) {
    debug = (std::getenv("COMMENTSCAN_DEBUG") != nullptr);
    initialized = true;
  }
  return debug;
}

namespace CommentScan {
namespace comments {

const char *kindName(CommentKind kind) {
  switch (kind) {
  case CommentKind::Line:
    return "line";
  case CommentKind::Block:
    return "block";
  }
  return "line";
}

std::vector<CommentSegment>
extractCommentSegments(const std::string &text,
                       const patterns::Matcher &matcher) {
  std::vector<CommentSegment> segments;
  std::string_view view(text);

  patterns::ScanMemo memo;
  size_t offset = 0;
  size_t skipped = 0;

  while (offset < view.size()) {
    auto match = matcher.findNext(view, offset, memo);
    if (!match) {
      break;
    }

    if (match->kind == patterns::MatchKind::Keep) {
      CommentSegment segment;
      segment.startByte = match->start;
      segment.endByte = match->end;
      segment.text = std::string(match->text);
      segment.kind = match->shape == dialects::RuleShape::LineComment
                         ? CommentKind::Line
                         : CommentKind::Block;
      segments.push_back(std::move(segment));
    } else {
      ++skipped;
    }

    // 空マッチでも必ず前進する
    offset = match->end > match->start ? match->end : match->start + 1;
  }

  if (isDebugEnabled()) {
    std::cerr << "[DEBUG] " << matcher.dialectName() << ": "
              << segments.size() << " comments, " << skipped
              << " literals skipped in " << text.size() << " bytes"
              << std::endl;
  }

  return segments;
}

std::vector<CommentSegment>
extractCommentSegments(const std::string &text,
                       const std::string &dialectName) {
  auto matcher = patterns::compile(dialectName);
  return extractCommentSegments(text, *matcher);
}

std::vector<std::string> extractComments(const std::string &text,
                                         const std::string &dialectName) {
  std::vector<std::string> comments;
  auto segments = extractCommentSegments(text, dialectName);
  comments.reserve(segments.size());
  for (auto &segment : segments) {
    comments.push_back(std::move(segment.text));
  }
  return comments;
}

} // namespace comments
} // namespace CommentScan
