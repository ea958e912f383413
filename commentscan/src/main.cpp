#include "comment_extractor.hpp"
#include "comment_json.hpp"
#include "config.hpp"
#include "dialect_registry.hpp"
#include "pattern_compiler.hpp"
#include "server.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#ifndef COMMENTSCAN_VERSION
#define COMMENTSCAN_VERSION "0.0.0"
#endif

static constexpr int kExitSuccess = 0;
static constexpr int kExitUsage = 1;
static constexpr int kExitIo = 2;
static constexpr int kExitUnsupported = 3;

struct CliOptions {
  std::string language;
  std::string configFile;
  std::string inputFile; // empty: stdin
  bool ranges = false;
  bool kinds = false;
  bool stdio = false;
  bool listLanguages = false;
  bool showHelp = false;
  bool showVersion = false;
};

static void printUsage(std::ostream &os) {
  os << "Usage: commentscan [options] [file]\n"
     << "\n"
     << "Extracts comments from source code (stdin when no file is given)\n"
     << "and prints them as a JSON array.\n"
     << "\n"
     << "Options:\n"
     << "  -l, --language <name>  Language of the input (python, c, c++, "
        "java,\n"
     << "                         c#, js, javascript, go, php)\n"
     << "  -c, --config <file>    JSON configuration file\n"
     << "  --ranges               Include byte ranges and line/character "
        "positions\n"
     << "  --kinds                Include the comment kind (line/block)\n"
     << "  --list-languages       Print the supported language names\n"
     << "  --stdio                Serve JSON-RPC requests on stdin/stdout\n"
     << "  -h, --help             Show this help message\n"
     << "  --version              Show version information\n";
}

static CliOptions parseArgs(int argc, char *argv[]) {
  CliOptions opts;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.showHelp = true;
      return opts;
    }

    if (arg == "--version") {
      opts.showVersion = true;
      return opts;
    }

    if (arg == "-l" || arg == "--language") {
      if (i + 1 >= argc) {
        std::cerr << "commentscan: " << arg << " requires an argument\n";
        std::exit(kExitUsage);
      }
      opts.language = argv[++i];
      continue;
    }

    if (arg == "-c" || arg == "--config") {
      if (i + 1 >= argc) {
        std::cerr << "commentscan: " << arg << " requires an argument\n";
        std::exit(kExitUsage);
      }
      opts.configFile = argv[++i];
      continue;
    }

    if (arg == "--ranges") {
      opts.ranges = true;
      continue;
    }

    if (arg == "--kinds") {
      opts.kinds = true;
      continue;
    }

    if (arg == "--list-languages") {
      opts.listLanguages = true;
      continue;
    }

    if (arg == "--stdio") {
      opts.stdio = true;
      continue;
    }

    if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "commentscan: unknown option: " << arg << "\n";
      std::exit(kExitUsage);
    }

    if (!opts.inputFile.empty()) {
      std::cerr << "commentscan: only one input file may be given\n";
      std::exit(kExitUsage);
    }
    opts.inputFile = arg;
  }

  return opts;
}

static bool readInput(const std::string &path, std::string &content) {
  std::ostringstream ss;
  if (path.empty() || path == "-") {
    ss << std::cin.rdbuf();
  } else {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      std::cerr << "commentscan: cannot open file: " << path << "\n";
      return false;
    }
    ss << in.rdbuf();
  }
  content = ss.str();
  return true;
}

static int run(const CliOptions &opts) {
  CommentScan::CommentScanConfig config;
  if (!opts.configFile.empty()) {
    try {
      config = CommentScan::loadConfigFile(opts.configFile);
    } catch (const std::exception &e) {
      std::cerr << "commentscan: " << e.what() << "\n";
      return kExitIo;
    }
  }
  if (!opts.language.empty())
    config.defaultLanguage = opts.language;
  if (opts.ranges)
    config.output.includeRanges = true;
  if (opts.kinds)
    config.output.includeKind = true;

  if (opts.stdio) {
    CommentScan::CommentServer server(std::cin, std::cout, config);
    return server.run();
  }

  if (config.defaultLanguage.empty()) {
    std::cerr << "commentscan: no language given (use --language)\n";
    printUsage(std::cerr);
    return kExitUsage;
  }

  // 入力を読む前に言語を解決する
  std::shared_ptr<const CommentScan::patterns::Matcher> matcher;
  try {
    matcher = CommentScan::patterns::compile(config.defaultLanguage);
  } catch (const CommentScan::dialects::UnsupportedDialectError &e) {
    std::cerr << "commentscan: " << e.what() << "\n";
    return kExitUnsupported;
  }

  std::string code;
  if (!readInput(opts.inputFile, code))
    return kExitIo;

  auto segments = CommentScan::comments::extractCommentSegments(code, *matcher);
  std::cout << CommentScan::dumpJson(
                   CommentScan::segmentsToJson(code, segments, config.output),
                   2)
            << "\n";
  return kExitSuccess;
}

int main(int argc, char *argv[]) {
  CliOptions opts = parseArgs(argc, argv);

  if (opts.showHelp) {
    printUsage(std::cerr);
    return kExitSuccess;
  }

  if (opts.showVersion) {
    std::cerr << "commentscan " << COMMENTSCAN_VERSION << "\n";
    return kExitSuccess;
  }

  if (opts.listLanguages) {
    for (const auto &name : CommentScan::dialects::supportedDialectNames())
      std::cout << name << "\n";
    return kExitSuccess;
  }

  return run(opts);
}
