#include "config.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace CommentScan {

void applyConfigOptions(const nlohmann::json &opts, CommentScanConfig &config) {
  if (!opts.is_object())
    return;

  if (opts.contains("defaultLanguage") &&
      opts["defaultLanguage"].is_string()) {
    config.defaultLanguage = opts["defaultLanguage"].get<std::string>();
  }

  // 出力設定
  if (opts.contains("output") && opts["output"].is_object()) {
    const auto &output = opts["output"];
    if (output.contains("includeRanges") &&
        output["includeRanges"].is_boolean()) {
      config.output.includeRanges = output["includeRanges"];
    }
    if (output.contains("includeKind") && output["includeKind"].is_boolean()) {
      config.output.includeKind = output["includeKind"];
    }
  }
}

CommentScanConfig loadConfigFile(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open config file: " + path);
  }
  std::ostringstream ss;
  ss << in.rdbuf();

  nlohmann::json opts;
  try {
    opts = nlohmann::json::parse(ss.str());
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error("invalid config file " + path + ": " + e.what());
  }

  CommentScanConfig config;
  applyConfigOptions(opts, config);
  return config;
}

} // namespace CommentScan
