#include "text_position.hpp"

#include <utility>

namespace CommentScan {
namespace text {

namespace {

// Number of UTF-16 code units for the UTF-8 sequence starting at i; advances
// i past it. Truncated or invalid sequences count as one unit per byte.
unsigned int consumeUtf16Units(const std::string &s, size_t &i, size_t limit) {
  unsigned char c = static_cast<unsigned char>(s[i]);
  size_t seqLen = 1;
  if ((c >> 5) == 0x6)
    seqLen = 2;
  else if ((c >> 4) == 0xE)
    seqLen = 3;
  else if ((c >> 3) == 0x1E)
    seqLen = 4;

  if (seqLen == 1 || i + seqLen > limit) {
    ++i;
    return 1;
  }
  for (size_t k = 1; k < seqLen; ++k) {
    if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) {
      ++i;
      return 1;
    }
  }

  i += seqLen;
  // 4バイト列は BMP 外 (サロゲートペア)
  return seqLen == 4 ? 2 : 1;
}

} // namespace

LineIndex::LineIndex(std::string text) : text_(std::move(text)) {
  lineStarts_.push_back(0);
  for (size_t i = 0; i < text_.size(); ++i)
    if (text_[i] == '\n')
      lineStarts_.push_back(i + 1);
}

Position LineIndex::positionAt(size_t offset) const {
  if (offset > text_.size())
    offset = text_.size();

  // offset 以下で最後の行頭を二分探索
  size_t lo = 0, hi = lineStarts_.size();
  while (lo + 1 < hi) {
    size_t mid = (lo + hi) / 2;
    if (lineStarts_[mid] <= offset)
      lo = mid;
    else
      hi = mid;
  }

  size_t i = lineStarts_[lo];
  unsigned int col16 = 0;
  while (i < offset) {
    col16 += consumeUtf16Units(text_, i, offset);
  }

  return Position{static_cast<int>(lo), static_cast<int>(col16)};
}

size_t utf8ToUtf16Length(const std::string &utf8Str) {
  size_t i = 0;
  size_t units = 0;
  while (i < utf8Str.size()) {
    units += consumeUtf16Units(utf8Str, i, utf8Str.size());
  }
  return units;
}

} // namespace text
} // namespace CommentScan
