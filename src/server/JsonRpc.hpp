#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace RpcCode {
  constexpr int ParseError = -32700;
  constexpr int InvalidRequest = -32600;
  constexpr int MethodNotFound = -32601;
  constexpr int InvalidParams = -32602;
  constexpr int InternalError = -32603;
  constexpr int ServerError = -32000;      // session/device failure on a resource read
  constexpr int ResourceNotFound = -32002;
}

// Protocol-level failure; becomes a JSON-RPC error object.
class JsonRpcError : public std::runtime_error {
public:
  JsonRpcError(int code, const std::string& message, nlohmann::json data = nullptr)
      : std::runtime_error(message), code_(code), data_(std::move(data)) {}
  int code() const { return code_; }
  const nlohmann::json& data() const { return data_; }

private:
  int code_;
  nlohmann::json data_;
};

inline nlohmann::json makeResult(const nlohmann::json& id, nlohmann::json result) {
  return nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

inline nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message,
                                const nlohmann::json& data = nullptr) {
  nlohmann::json err{{"code", code}, {"message", message}};
  if (!data.is_null()) err["data"] = data;
  return nlohmann::json{{"jsonrpc", "2.0"}, {"id", id}, {"error", std::move(err)}};
}
