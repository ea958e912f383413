#include "comment_json.hpp"
#include "text_position.hpp"

#include <utility>

namespace CommentScan {

nlohmann::json
segmentsToJson(const std::string &text,
               const std::vector<comments::CommentSegment> &segments,
               const OutputConfig &output) {
  using nlohmann::json;

  json result = json::array();
  if (!output.includeRanges && !output.includeKind) {
    for (const auto &segment : segments) {
      result.push_back(segment.text);
    }
    return result;
  }

  text::LineIndex lines(text);
  for (const auto &segment : segments) {
    json entry = {{"text", segment.text}};
    if (output.includeKind) {
      entry["kind"] = comments::kindName(segment.kind);
    }
    if (output.includeRanges) {
      text::Position start = lines.positionAt(segment.startByte);
      text::Position end = lines.positionAt(segment.endByte);
      entry["range"] = {
          {"startByte", segment.startByte},
          {"endByte", segment.endByte},
          {"start", {{"line", start.line}, {"character", start.character}}},
          {"end", {{"line", end.line}, {"character", end.character}}}};
    }
    result.push_back(std::move(entry));
  }
  return result;
}

std::string dumpJson(const nlohmann::json &value, int indent) {
  return value.dump(indent, ' ', false,
                    nlohmann::json::error_handler_t::replace);
}

} // namespace CommentScan
