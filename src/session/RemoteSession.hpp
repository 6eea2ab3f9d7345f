#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "../remote/DeviceGateway.hpp"
#include "../remote/VoicemeeterTypes.hpp"

enum class SessionState { Disconnected, Connecting, Connected };

inline const char* toStr(SessionState s) {
  switch (s) {
    case SessionState::Disconnected: return "disconnected";
    case SessionState::Connecting: return "connecting";
    case SessionState::Connected: return "connected";
  }
  return "disconnected";
}

// Largest preset file handed to the vendor loader.
constexpr uint64_t kMaxPresetBytes = 10ull * 1024ull * 1024ull;

// The single remote-API session of the process. Owns the gateway; every
// vendor return code is turned into a value or a RemoteError here.
//
// Policies:
//  - connect() while connected is a no-op that reports the connected type.
//  - a "no server" code while connected logs out, drops to Disconnected and
//    raises ConnectionError on that call.
class RemoteSession {
public:
  explicit RemoteSession(std::unique_ptr<DeviceGateway> gateway);
  ~RemoteSession();
  RemoteSession(const RemoteSession&) = delete;
  RemoteSession& operator=(const RemoteSession&) = delete;

  DeviceType connect();
  // Returns false when there was no session to close.
  bool disconnect();

  // Needs the library, not a session.
  void runApplication(DeviceType type);

  float getParameterFloat(const std::string& name);
  std::string getParameterString(const std::string& name);
  void setParameterFloat(const std::string& name, float value);
  void setParameterString(const std::string& name, const std::string& value);

  std::vector<float> getLevels(LevelType type, const std::vector<long>& channels);

  std::string version();
  // False while disconnected.
  bool parametersDirty();

  // Checks the file, then asks the vendor to load it (Command.Load).
  void loadPreset(const std::string& path);

  bool connected() const { return state_ == SessionState::Connected; }
  SessionState state() const { return state_; }
  std::optional<DeviceType> deviceType() const { return type_; }
  Topology topology() const;
  uint32_t loginCount() const { return loginCount_; }
  std::string libraryOrigin() const { return gateway_->origin(); }

private:
  void ensureLibrary();
  void requireConnected(const std::string& operation) const;
  void checkTopology(const std::string& name) const;
  void refreshParameters();
  [[noreturn]] void failParameter(long rc, const std::string& name);
  [[noreturn]] void connectionLost(const std::string& during);

  std::unique_ptr<DeviceGateway> gateway_;
  SessionState state_ = SessionState::Disconnected;
  std::optional<DeviceType> type_;
  uint32_t loginCount_ = 0;
};

// Throws RequestError when the file is missing, not .xml, or too large.
// Returns the absolute path.
std::string checkPresetFile(const std::string& path);
