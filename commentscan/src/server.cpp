#include "server.hpp"
#include "comment_extractor.hpp"
#include "comment_json.hpp"
#include "dialect_registry.hpp"
#include "pattern_compiler.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

static bool isDebugEnabled() {
  static bool initialized = false;
  static bool debug = false;
  if (!initialized) {
    debug = (std::getenv("COMMENTSCAN_DEBUG") != nullptr);
    initialized = true;
  }
  return debug;
}

namespace {

constexpr int kInvalidParams = -32602;
constexpr int kMethodNotFound = -32601;
constexpr int kInternalError = -32603;

struct InvalidParams : std::runtime_error {
  using std::runtime_error::runtime_error;
};

} // namespace

namespace CommentScan {

CommentServer::CommentServer(std::istream &in, std::ostream &out,
                             CommentScanConfig config)
    : in_(in), out_(out), config_(std::move(config)) {}

bool CommentServer::readMessage(std::string &jsonPayload) {
  // ヘッダー読み取り: Content-Length、空行、本文の順
  std::string line;
  size_t contentLength = 0;

  while (std::getline(in_, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.rfind("Content-Length:", 0) == 0) {
      try {
        contentLength = static_cast<size_t>(std::stoul(line.substr(15)));
      } catch (const std::exception &e) {
        if (isDebugEnabled()) {
          std::cerr << "[DEBUG] bad Content-Length header: " << e.what()
                    << std::endl;
        }
        contentLength = 0;
      }
    }
    if (line.empty())
      break; // 空行はヘッダー終了
  }

  if (!contentLength || !in_.good())
    return false;

  jsonPayload.resize(contentLength);
  in_.read(&jsonPayload[0], static_cast<std::streamsize>(contentLength));
  return in_.gcount() == static_cast<std::streamsize>(contentLength);
}

void CommentServer::reply(const json &msg) {
  std::string payload = dumpJson(msg);
  out_ << "Content-Length: " << payload.size() << "\r\n\r\n" << payload;
  out_.flush();
}

void CommentServer::replyError(const json &id, int code,
                               const std::string &message, const json &data) {
  json error = {{"code", code}, {"message", message}};
  if (!data.is_null()) {
    error["data"] = data;
  }
  reply(json{{"jsonrpc", "2.0"}, {"id", id}, {"error", error}});
}

void CommentServer::handle(const json &req) {
  if (!req.is_object() || !req.contains("method") ||
      !req["method"].is_string()) {
    return;
  }

  const std::string method = req["method"];
  const bool isRequest = req.contains("id");
  const json id = isRequest ? req["id"] : json(nullptr);

  try {
    if (method == "initialize") {
      reply(onInitialize(id, req.value("params", json::object())));
    } else if (method == "initialized") {
      // 初期化完了
    } else if (method == "comments/extract") {
      reply(onExtract(id, req.value("params", json::object())));
    } else if (method == "comments/languages") {
      reply(onLanguages(id));
    } else if (method == "shutdown") {
      shutdownRequested_ = true;
      reply(json{{"jsonrpc", "2.0"}, {"id", id}, {"result", nullptr}});
    } else if (method == "exit") {
      exitRequested_ = true;
    } else if (isRequest) {
      replyError(id, kMethodNotFound, "Method not found: " + method);
    }
  } catch (const dialects::UnsupportedDialectError &e) {
    if (isRequest) {
      replyError(id, kInvalidParams, e.what(),
                 json{{"language", e.dialectName()}});
    }
  } catch (const InvalidParams &e) {
    if (isRequest) {
      replyError(id, kInvalidParams, e.what());
    }
  } catch (const std::exception &e) {
    if (isDebugEnabled()) {
      std::cerr << "[DEBUG] " << method << " failed: " << e.what()
                << std::endl;
    }
    if (isRequest) {
      replyError(id, kInternalError, e.what());
    }
  }
}

int CommentServer::run() {
  std::string jsonPayload;
  while (!exitRequested_ && readMessage(jsonPayload)) {
    json req;
    try {
      req = json::parse(jsonPayload);
    } catch (const json::parse_error &e) {
      if (isDebugEnabled()) {
        std::cerr << "[DEBUG] JSON parse error: " << e.what() << std::endl;
      }
      continue;
    }
    handle(req);
  }
  return shutdownRequested_ ? 0 : 1;
}

json CommentServer::onInitialize(const json &id, const json &params) {
  // initializationOptions から設定を抽出
  if (params.contains("initializationOptions")) {
    applyConfigOptions(params["initializationOptions"], config_);
  }

  return json{
      {"jsonrpc", "2.0"},
      {"id", id},
      {"result",
       {{"capabilities",
         {{"commentScan",
           {{"languages", dialects::supportedDialectNames()}}}}}}}};
}

json CommentServer::onExtract(const json &id, const json &params) {
  if (!params.contains("text") || !params["text"].is_string()) {
    throw InvalidParams("comments/extract requires a string 'text'");
  }

  std::string language = config_.defaultLanguage;
  if (params.contains("language") && params["language"].is_string()) {
    language = params["language"].get<std::string>();
  }
  if (language.empty()) {
    throw InvalidParams("comments/extract requires a 'language'");
  }

  const std::string text = params["text"];
  auto matcher = patterns::compile(language);
  auto segments = comments::extractCommentSegments(text, *matcher);

  return json{{"jsonrpc", "2.0"},
              {"id", id},
              {"result",
               {{"language", matcher->dialectName()},
                {"comments", segmentsToJson(text, segments, config_.output)}}}};
}

json CommentServer::onLanguages(const json &id) {
  return json{{"jsonrpc", "2.0"},
              {"id", id},
              {"result", dialects::supportedDialectNames()}};
}

} // namespace CommentScan
