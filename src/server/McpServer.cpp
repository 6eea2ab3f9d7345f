#include "McpServer.hpp"
#include "JsonRpc.hpp"
#include "Tools.hpp"
#include "../core/Log.hpp"

using nlohmann::json;

McpServer::McpServer(RemoteSession& session) : resources_(session) {
  registerVoicemeeterTools(tools_, session);
}

std::optional<std::string> McpServer::handleLine(const std::string& line) {
  if (line.find_first_not_of(" \t\r\n") == std::string::npos) return std::nullopt;
  json msg;
  try {
    msg = json::parse(line);
  } catch (const json::parse_error& e) {
    logDebug("parse error: %s", e.what());
    return makeError(nullptr, RpcCode::ParseError, "Parse error").dump();
  }
  std::optional<json> reply;
  try {
    reply = handleMessage(msg);
  } catch (const std::exception& e) {
    logError("request escaped dispatch: %s", e.what());
    return makeError(nullptr, RpcCode::InternalError, e.what()).dump();
  }
  if (!reply) return std::nullopt;
  return reply->dump();
}

std::optional<json> McpServer::handleMessage(const json& msg) {
  if (msg.is_array()) {
    return makeError(nullptr, RpcCode::InvalidRequest, "Batch requests are not supported");
  }
  if (!msg.is_object()) return makeError(nullptr, RpcCode::InvalidRequest, "Request must be an object");

  const bool isNotification = !msg.contains("id");
  const json id = isNotification ? json(nullptr) : msg["id"];
  if (!isNotification && !id.is_string() && !id.is_number_integer() && !id.is_null()) {
    return makeError(nullptr, RpcCode::InvalidRequest, "Invalid id");
  }
  auto version = msg.find("jsonrpc");
  auto method = msg.find("method");
  const bool versionOk = version != msg.end() && version->is_string() && *version == "2.0";
  if (!versionOk || method == msg.end() || !method->is_string()) {
    if (isNotification) return std::nullopt;
    return makeError(id, RpcCode::InvalidRequest, "Invalid request");
  }
  const std::string name = method->get<std::string>();
  const json params = msg.contains("params") ? msg["params"] : json::object();

  if (isNotification) {
    if (name == "notifications/initialized") initialized_ = true;
    else logDebug("ignoring notification %s", name.c_str());
    return std::nullopt;
  }

  logDebug("-> %s", name.c_str());
  try {
    if (!params.is_object()) throw JsonRpcError(RpcCode::InvalidParams, "params must be an object");
    return makeResult(id, dispatch(name, params));
  } catch (const JsonRpcError& e) {
    logDebug("%s failed (%d): %s", name.c_str(), e.code(), e.what());
    return makeError(id, e.code(), e.what(), e.data());
  } catch (const json::exception& e) {
    return makeError(id, RpcCode::InvalidParams, e.what());
  } catch (const std::exception& e) {
    logError("%s: %s", name.c_str(), e.what());
    return makeError(id, RpcCode::InternalError, e.what());
  }
}

json McpServer::dispatch(const std::string& method, const json& params) {
  if (method == "initialize") return initialize(params);
  if (method == "ping") return json::object();
  if (method == "tools/list") return json{{"tools", tools_.list()}};
  if (method == "tools/call") return callTool(params);
  if (method == "resources/list") return json{{"resources", resources_.list()}};
  if (method == "resources/templates/list") return json{{"resourceTemplates", resources_.templates()}};
  if (method == "resources/read") return readResource(params);
  throw JsonRpcError(RpcCode::MethodNotFound, "Method not found: " + method);
}

json McpServer::initialize(const json& params) {
  std::string version = kProtocolVersions[0];
  auto requested = params.find("protocolVersion");
  if (requested != params.end() && requested->is_string()) {
    for (const char* v : kProtocolVersions) {
      if (*requested == v) { version = v; break; }
    }
    if (version != requested->get<std::string>()) {
      logInfo("client asked for protocol %s, answering %s", requested->get<std::string>().c_str(), version.c_str());
    }
  }
  if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
    logInfo("client: %s %s", params["clientInfo"].value("name", std::string("?")).c_str(),
            params["clientInfo"].value("version", std::string("")).c_str());
  }
  return json{{"protocolVersion", version},
              {"capabilities", {{"tools", json::object()}, {"resources", json::object()}}},
              {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}}};
}

json McpServer::callTool(const json& params) {
  auto name = params.find("name");
  if (name == params.end() || !name->is_string()) {
    throw JsonRpcError(RpcCode::InvalidParams, "tools/call needs a string 'name'");
  }
  json arguments = json::object();
  auto args = params.find("arguments");
  if (args != params.end() && !args->is_null()) {
    if (!args->is_object()) throw JsonRpcError(RpcCode::InvalidParams, "tools/call 'arguments' must be an object");
    arguments = *args;
  }
  return tools_.call(name->get<std::string>(), arguments).toJson();
}

json McpServer::readResource(const json& params) {
  auto uri = params.find("uri");
  if (uri == params.end() || !uri->is_string()) {
    throw JsonRpcError(RpcCode::InvalidParams, "resources/read needs a string 'uri'");
  }
  return resources_.read(uri->get<std::string>());
}
