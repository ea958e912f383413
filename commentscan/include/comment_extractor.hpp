#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace CommentScan {

namespace patterns {
class Matcher;
}

namespace comments {

enum class CommentKind { Line, Block };

struct CommentSegment {
  size_t startByte{0};
  size_t endByte{0};
  std::string text; // delimiters included
  CommentKind kind{CommentKind::Line};
};

const char *kindName(CommentKind kind);

// 指定方言のコメントを出現順に抽出する (区切り記号を含む原文のまま)
// Throws dialects::UnsupportedDialectError for an unknown dialect name.
std::vector<std::string> extractComments(const std::string &text,
                                         const std::string &dialectName);

std::vector<CommentSegment>
extractCommentSegments(const std::string &text,
                       const std::string &dialectName);

std::vector<CommentSegment>
extractCommentSegments(const std::string &text,
                       const patterns::Matcher &matcher);

} // namespace comments
} // namespace CommentScan
