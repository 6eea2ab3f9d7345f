#pragma once

#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../core/SchemaValidate.hpp"

struct ToolResult {
  std::string text;
  nlohmann::json structured = nlohmann::json::object();
  bool isError = false;

  nlohmann::json toJson() const;
};

using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments)>;

struct ToolDef {
  std::string name;
  std::string description;
  nlohmann::json inputSchema;
  ToolHandler handler;
};

// Named tools with JSON-schema checked arguments. A call never throws a
// RemoteError out: validation and session failures come back as isError results.
class ToolRegistry {
public:
  void add(ToolDef def);

  bool has(const std::string& name) const { return find(name) != nullptr; }
  const std::vector<ToolDef>& defs() const { return tools_; }

  // MCP tools/list payload: [{name, description, inputSchema}, ...]
  nlohmann::json list() const;

  // Throws JsonRpcError(InvalidParams) for an unknown tool.
  ToolResult call(const std::string& name, const nlohmann::json& arguments) const;

private:
  struct Entry { size_t index; ArgumentValidator validator; };
  const ToolDef* find(const std::string& name) const;

  std::vector<ToolDef> tools_;
  std::vector<Entry> validators_;
};

ToolResult errorResult(const char* kind, const std::string& message);
