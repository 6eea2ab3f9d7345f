#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

class RemoteSession;

constexpr const char* kApiVersion = "1.0.0";

// Read-only voicemeeter:// resources computed on demand from the session.
class ResourceCatalog {
public:
  explicit ResourceCatalog(RemoteSession& session) : session_(session) {}

  // Static resources always; strip/bus resources only while connected.
  nlohmann::json list() const;
  nlohmann::json templates() const;

  // MCP resources/read payload. Throws JsonRpcError for unknown URIs and
  // for session/device failures.
  nlohmann::json read(const std::string& uri) const;

  nlohmann::json status() const;
  nlohmann::json version() const;
  nlohmann::json levels() const;
  nlohmann::json strip(uint32_t index) const;
  nlohmann::json bus(uint32_t index) const;

private:
  RemoteSession& session_;
};

// "voicemeeter://strip/3" with prefix "voicemeeter://strip/" -> 3. False on anything else.
bool parseIndexedUri(const std::string& uri, const std::string& prefix, uint32_t& outIndex);
