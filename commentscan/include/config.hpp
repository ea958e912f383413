#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace CommentScan {

struct OutputConfig {
  bool includeRanges = false; // byte range + line/character positions
  bool includeKind = false;   // "line" / "block"
};

struct CommentScanConfig {
  std::string defaultLanguage; // used when a request names no language
  OutputConfig output;
};

// Overlays the recognised keys of opts onto config. Keys with an unexpected
// JSON type are ignored.
void applyConfigOptions(const nlohmann::json &opts, CommentScanConfig &config);

// Throws std::runtime_error when the file cannot be read or is not JSON.
CommentScanConfig loadConfigFile(const std::string &path);

} // namespace CommentScan
