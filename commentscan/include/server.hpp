#pragma once

#include "config.hpp"

#include <istream>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

using json = nlohmann::json;

namespace CommentScan {

// JSON-RPC 2.0 over a Content-Length framed stream (LSP base protocol).
class CommentServer {
public:
  CommentServer(std::istream &in, std::ostream &out,
                CommentScanConfig config = {});

  // Returns the process exit code: 0 when "exit" followed "shutdown".
  int run();

  const CommentScanConfig &config() const { return config_; }

private:
  std::istream &in_;
  std::ostream &out_;

  CommentScanConfig config_;
  bool shutdownRequested_{false};
  bool exitRequested_{false};

  bool readMessage(std::string &jsonPayload);
  void reply(const json &msg);
  void replyError(const json &id, int code, const std::string &message,
                  const json &data = nullptr);

  void handle(const json &req);

  json onInitialize(const json &id, const json &params);
  json onExtract(const json &id, const json &params);
  json onLanguages(const json &id);
};

} // namespace CommentScan
