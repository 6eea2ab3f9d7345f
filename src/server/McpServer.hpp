#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "Resources.hpp"
#include "ToolRegistry.hpp"

class RemoteSession;

constexpr const char* kServerName = "voicemeeter-mcp-server";
constexpr const char* kServerVersion = "0.1.0";

// Newest first; an unknown client version is answered with the first entry.
constexpr const char* kProtocolVersions[] = {"2025-06-18", "2025-03-26", "2024-11-05"};

// JSON-RPC dispatcher for the MCP methods. Transport agnostic: it takes one
// message line and returns the reply line, if any.
class McpServer {
public:
  explicit McpServer(RemoteSession& session);

  // Empty optional for notifications and blank lines.
  std::optional<std::string> handleLine(const std::string& line);
  std::optional<nlohmann::json> handleMessage(const nlohmann::json& msg);

  const ToolRegistry& tools() const { return tools_; }
  const ResourceCatalog& resources() const { return resources_; }
  bool initialized() const { return initialized_; }

private:
  nlohmann::json dispatch(const std::string& method, const nlohmann::json& params);
  nlohmann::json initialize(const nlohmann::json& params);
  nlohmann::json callTool(const nlohmann::json& params);
  nlohmann::json readResource(const nlohmann::json& params);

  ToolRegistry tools_;
  ResourceCatalog resources_;
  bool initialized_ = false;
};
