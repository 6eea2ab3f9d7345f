#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>
#include "core/Log.hpp"
#include "io/StdioTransport.hpp"
#include "remote/LibraryLocator.hpp"
#include "remote/RemoteLibrary.hpp"
#include "server/JsonRpc.hpp"
#include "server/McpServer.hpp"
#include "session/RemoteSession.hpp"

static std::atomic<bool> gRunning{true};

static void onSignal(int) {
  gRunning.store(false);
}

struct ServerConfig {
  std::string libraryPath;
  std::vector<std::string> extraSearchPaths;
  LogLevel level = LogLevel::Info;
  bool listTools = false;
  bool listResources = false;
};

static void printUsage(const char* exe) {
  std::fprintf(stderr,
               "Usage: %s [--library path] [--verbose|-v] [--quiet]\n"
               "          [--list-tools] [--list-resources] [--version] [--help]\n"
               "\nServes the Voicemeeter Remote API as MCP tools and resources over stdin/stdout.\n"
               "  --library PATH     Load the remote library from PATH before the default locations\n"
               "  --verbose, -v      Debug diagnostics on stderr\n"
               "  --quiet            Errors only on stderr\n"
               "  --list-tools       Print the tool catalogue as JSON and exit\n"
               "  --list-resources   Print the static resource list as JSON and exit\n"
               "\nEnvironment:\n"
               "  VMMCP_DEBUG=1           Same as --verbose\n"
               "  VMMCP_LIBRARY_PATHS     Extra library candidates, '%c' separated\n"
               "\n"
               "Examples:\n"
               "  vmmcp                               # serve over stdio\n"
               "  vmmcp --library /opt/vb/libVoicemeeterRemote.so -v\n",
               exe, kSearchPathSeparator);
}

static int runLoop(McpServer& server) {
  LineReader reader(STDIN_FILENO);
  std::string line;
  while (gRunning.load()) {
    const LineReader::Status st = reader.next(line, 200);
    if (st == LineReader::Status::Idle) continue;
    if (st == LineReader::Status::Eof) {
      logDebug("stdin closed");
      break;
    }
    if (st == LineReader::Status::Error) {
      logError("stdin read failed: %s", std::strerror(errno));
      return 1;
    }
    if (st == LineReader::Status::Overflow) {
      logWarn("dropped a message longer than %zu bytes", kMaxLineBytes);
      if (!writeLine(STDOUT_FILENO, makeError(nullptr, RpcCode::InvalidRequest, "Message too large").dump())) {
        logError("stdout write failed: %s", std::strerror(errno));
        return 1;
      }
      continue;
    }
    std::optional<std::string> reply;
    try {
      reply = server.handleLine(line);
    } catch (const std::exception& e) {
      logError("request failed: %s", e.what());
      reply = makeError(nullptr, RpcCode::InternalError, e.what()).dump();
    }
    if (reply && !writeLine(STDOUT_FILENO, *reply)) {
      logError("stdout write failed: %s", std::strerror(errno));
      return 1;
    }
  }
  return 0;
}

int main(int argc, char** argv) {
  ServerConfig cfg;
  if (debugRequestedByEnv()) cfg.level = LogLevel::Debug;

  for (int i = 1; i < argc; ++i) {
    const char* a = argv[i];
    auto need = [&](int remain) {
      if (i + remain >= argc) {
        printUsage(argv[0]);
        std::exit(1);
      }
    };
    if (std::strcmp(a, "--help") == 0 || std::strcmp(a, "-h") == 0) {
      printUsage(argv[0]);
      return 0;
    } else if (std::strcmp(a, "--version") == 0) {
      std::printf("%s %s\n", kServerName, kServerVersion);
      return 0;
    } else if (std::strcmp(a, "--verbose") == 0 || std::strcmp(a, "-v") == 0) {
      cfg.level = LogLevel::Debug;
    } else if (std::strcmp(a, "--quiet") == 0) {
      cfg.level = LogLevel::Quiet;
    } else if (std::strcmp(a, "--library") == 0) {
      need(1); cfg.libraryPath = argv[++i];
    } else if (std::strcmp(a, "--list-tools") == 0) {
      cfg.listTools = true;
    } else if (std::strcmp(a, "--list-resources") == 0) {
      cfg.listResources = true;
    } else {
      std::fprintf(stderr, "Unknown option: %s\n", a);
      printUsage(argv[0]);
      return 1;
    }
  }
  setLogLevel(cfg.level);
  if (const char* env = std::getenv("VMMCP_LIBRARY_PATHS")) cfg.extraSearchPaths = splitSearchPathList(env);

  // Startup banner (binary identity)
  if (logLevel() >= LogLevel::Info) {
    std::fprintf(stderr, "%s -- version %s starting up (built %s %s)\n", kServerName, kServerVersion, __DATE__, __TIME__);
  }

  RemoteSession session(std::make_unique<RemoteLibrary>(cfg.libraryPath, cfg.extraSearchPaths));
  McpServer server(session);

  if (cfg.listTools || cfg.listResources) {
    nlohmann::json out = nlohmann::json::object();
    if (cfg.listTools) out["tools"] = server.tools().list();
    if (cfg.listResources) {
      out["resources"] = server.resources().list();
      out["resourceTemplates"] = server.resources().templates();
    }
    std::printf("%s\n", out.dump(2).c_str());
    return 0;
  }

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);
#ifdef SIGPIPE
  std::signal(SIGPIPE, SIG_IGN);
#endif

  logDebug("serving on stdio; %zu extra library path(s)", cfg.extraSearchPaths.size());
  const int rc = runLoop(server);
  if (session.connected()) session.disconnect();
  logInfo("shutting down");
  return rc;
}
