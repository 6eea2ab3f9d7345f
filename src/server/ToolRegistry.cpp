#include "ToolRegistry.hpp"
#include <stdexcept>
#include "JsonRpc.hpp"
#include "../core/Errors.hpp"
#include "../core/Log.hpp"

nlohmann::json ToolResult::toJson() const {
  nlohmann::json j;
  j["content"] = nlohmann::json::array({nlohmann::json{{"type", "text"}, {"text", text}}});
  j["structuredContent"] = structured;
  j["isError"] = isError;
  return j;
}

ToolResult errorResult(const char* kind, const std::string& message) {
  ToolResult r;
  r.isError = true;
  r.text = std::string(kind) + ": " + message;
  r.structured = nlohmann::json{{"error", {{"kind", kind}, {"message", message}}}};
  return r;
}

void ToolRegistry::add(ToolDef def) {
  if (has(def.name)) throw std::logic_error("duplicate tool: " + def.name);
  validators_.push_back(Entry{tools_.size(), ArgumentValidator(def.inputSchema)});
  tools_.push_back(std::move(def));
}

const ToolDef* ToolRegistry::find(const std::string& name) const {
  for (const auto& t : tools_) if (t.name == name) return &t;
  return nullptr;
}

nlohmann::json ToolRegistry::list() const {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& t : tools_) {
    arr.push_back(nlohmann::json{{"name", t.name}, {"description", t.description}, {"inputSchema", t.inputSchema}});
  }
  return arr;
}

ToolResult ToolRegistry::call(const std::string& name, const nlohmann::json& arguments) const {
  const ToolDef* tool = nullptr;
  const ArgumentValidator* validator = nullptr;
  for (const auto& e : validators_) {
    if (tools_[e.index].name == name) { tool = &tools_[e.index]; validator = &e.validator; break; }
  }
  if (!tool) throw JsonRpcError(RpcCode::InvalidParams, "Unknown tool: " + name);

  std::string diag;
  if (!validator->validate(arguments, diag)) {
    logDebug("%s: arguments rejected: %s", name.c_str(), diag.c_str());
    return errorResult(toStr(ErrorKind::Request), "invalid arguments for " + name + ": " + diag);
  }
  try {
    return tool->handler(arguments);
  } catch (const RemoteError& e) {
    logDebug("%s: %s: %s", name.c_str(), toStr(e.kind()), e.what());
    return errorResult(toStr(e.kind()), e.what());
  } catch (const nlohmann::json::exception& e) {
    logError("%s: malformed arguments slipped past the schema: %s", name.c_str(), e.what());
    return errorResult(toStr(ErrorKind::Request), e.what());
  } catch (const std::exception& e) {
    logError("%s failed: %s", name.c_str(), e.what());
    return errorResult("InternalError", e.what());
  }
}
