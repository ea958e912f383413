#pragma once

#include "comment_extractor.hpp"
#include "config.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace CommentScan {

// Plain strings unless the output config asks for kinds or ranges, in which
// case every element is an object {text, kind?, range?}.
nlohmann::json
segmentsToJson(const std::string &text,
               const std::vector<comments::CommentSegment> &segments,
               const OutputConfig &output);

// Serializes for stdout. Bytes that are not valid UTF-8 (a Latin-1 comment,
// say) become U+FFFD instead of failing the whole dump.
std::string dumpJson(const nlohmann::json &value, int indent = -1);

} // namespace CommentScan
