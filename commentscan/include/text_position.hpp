#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace CommentScan {
namespace text {

struct Position {
  int line{0};
  int character{0}; // UTF-16 code units
};

class LineIndex {
public:
  explicit LineIndex(std::string text);

  // オフセットを行番号と UTF-16 列位置に変換 (テキスト長で制限)
  Position positionAt(size_t offset) const;

  size_t lineCount() const { return lineStarts_.size(); }

private:
  std::string text_;
  std::vector<size_t> lineStarts_;
};

size_t utf8ToUtf16Length(const std::string &utf8Str);

} // namespace text
} // namespace CommentScan
