#include "RemoteSession.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <utility>
#include "ParameterRef.hpp"
#include "../core/Errors.hpp"
#include "../core/Log.hpp"

RemoteSession::RemoteSession(std::unique_ptr<DeviceGateway> gateway) : gateway_(std::move(gateway)) {}

RemoteSession::~RemoteSession() {
  if (connected()) {
    const long rc = gateway_->logout();
    if (rc != VendorCode::Ok) logWarn("logout on shutdown returned %ld", rc);
  }
}

void RemoteSession::ensureLibrary() {
  if (gateway_->loaded()) return;
  std::string diag;
  if (!gateway_->load(diag)) throw ConnectionError(diag);
}

void RemoteSession::requireConnected(const std::string& operation) const {
  if (!connected()) {
    throw ConnectionError("not connected to Voicemeeter (" + operation + "); call voicemeeter_connect first");
  }
}

Topology RemoteSession::topology() const {
  requireConnected("topology");
  return topologyFor(*type_);
}

DeviceType RemoteSession::connect() {
  if (connected()) {
    logDebug("connect: already connected to %s", displayName(*type_));
    return *type_;
  }
  state_ = SessionState::Connecting;
  try {
    ensureLibrary();
    const long rc = gateway_->login();
    if (rc == VendorCode::LoginHostNotRunning) {
      gateway_->logout();
      throw ConnectionError("Voicemeeter is not running; launch it with voicemeeter_run first");
    }
    if (rc == VendorCode::NoServer) {
      throw ConnectionError("remote login is already held (logout expected before login)");
    }
    if (rc != VendorCode::Ok) {
      throw ConnectionError("login failed (vendor code " + std::to_string(rc) + ")");
    }
    long rawType = 0;
    DeviceType t = DeviceType::Voicemeeter;
    const long trc = gateway_->getDeviceType(rawType);
    if (trc != VendorCode::Ok || !deviceTypeFromVendor(rawType, t)) {
      gateway_->logout();
      throw ConnectionError("could not determine Voicemeeter type (vendor code " + std::to_string(trc) +
                            ", type " + std::to_string(rawType) + ")");
    }
    type_ = t;
    state_ = SessionState::Connected;
    ++loginCount_;
    logInfo("connected to %s", displayName(t));
    return t;
  } catch (...) {
    state_ = SessionState::Disconnected;
    type_.reset();
    throw;
  }
}

bool RemoteSession::disconnect() {
  if (!connected()) return false;
  const long rc = gateway_->logout();
  state_ = SessionState::Disconnected;
  type_.reset();
  if (rc != VendorCode::Ok) logWarn("logout returned %ld", rc);
  logInfo("disconnected");
  return true;
}

void RemoteSession::connectionLost(const std::string& during) {
  logWarn("connection lost during %s", during.c_str());
  gateway_->logout();
  state_ = SessionState::Disconnected;
  type_.reset();
  throw ConnectionError("connection to Voicemeeter lost during " + during);
}

void RemoteSession::failParameter(long rc, const std::string& name) {
  switch (rc) {
    case VendorCode::NoServer:
      connectionLost("'" + name + "'");
    case VendorCode::UnknownParameter:
      throw DeviceError("unknown parameter '" + name + "'", rc);
    case VendorCode::StructureMismatch:
      throw DeviceError("structure mismatch for parameter '" + name + "'", rc);
    default:
      throw DeviceError("vendor call failed for parameter '" + name + "' (code " + std::to_string(rc) + ")", rc);
  }
}

void RemoteSession::checkTopology(const std::string& name) const {
  ParameterRef ref;
  if (!parseParameterRef(name, ref)) return;
  const Topology t = topologyFor(*type_);
  const uint32_t count = (ref.kind == EntityKind::Strip) ? t.strips() : t.buses();
  if (ref.index >= count) {
    throw DeviceError(std::string(toStr(ref.kind)) + " index " + std::to_string(ref.index) + " out of range for " +
                      toStr(*type_) + " (" + std::to_string(count) + " available)",
                      VendorCode::UnknownParameter);
  }
}

// The vendor refreshes its parameter cache when the dirty flag is polled.
void RemoteSession::refreshParameters() {
  const long rc = gateway_->isParametersDirty();
  if (rc == VendorCode::NoServer) connectionLost("parameter refresh");
  if (rc < 0) logDebug("dirty poll returned %ld", rc);
}

float RemoteSession::getParameterFloat(const std::string& name) {
  requireConnected("get '" + name + "'");
  checkTopology(name);
  refreshParameters();
  float v = 0.0f;
  const long rc = gateway_->getParameterFloat(name, v);
  if (rc != VendorCode::Ok) failParameter(rc, name);
  return v;
}

std::string RemoteSession::getParameterString(const std::string& name) {
  requireConnected("get '" + name + "'");
  checkTopology(name);
  refreshParameters();
  std::string v;
  const long rc = gateway_->getParameterString(name, v);
  if (rc != VendorCode::Ok) failParameter(rc, name);
  return v;
}

void RemoteSession::setParameterFloat(const std::string& name, float value) {
  requireConnected("set '" + name + "'");
  checkTopology(name);
  const long rc = gateway_->setParameterFloat(name, value);
  if (rc != VendorCode::Ok) failParameter(rc, name);
  logDebug("set %s = %g", name.c_str(), static_cast<double>(value));
}

void RemoteSession::setParameterString(const std::string& name, const std::string& value) {
  requireConnected("set '" + name + "'");
  checkTopology(name);
  if (value.size() >= kVendorStringCapacity) {
    throw RequestError("string value for '" + name + "' exceeds " + std::to_string(kVendorStringCapacity - 1) + " bytes");
  }
  const long rc = gateway_->setParameterString(name, value);
  if (rc != VendorCode::Ok) failParameter(rc, name);
  logDebug("set %s = \"%s\"", name.c_str(), value.c_str());
}

std::vector<float> RemoteSession::getLevels(LevelType type, const std::vector<long>& channels) {
  requireConnected("levels");
  std::vector<float> out;
  out.reserve(channels.size());
  for (long ch : channels) {
    float v = 0.0f;
    const long rc = gateway_->getLevel(static_cast<long>(type), ch, v);
    switch (rc) {
      case VendorCode::Ok: break;
      case VendorCode::NoServer: connectionLost("level read");
      case VendorCode::UnknownParameter:
        throw DeviceError(std::string("no level available at ") + toStr(type), rc);
      case VendorCode::OutOfRange:
        throw DeviceError("level channel " + std::to_string(ch) + " out of range", rc);
      default:
        throw DeviceError("level read failed on channel " + std::to_string(ch) + " (code " + std::to_string(rc) + ")", rc);
    }
    out.push_back(v);
  }
  return out;
}

void RemoteSession::runApplication(DeviceType type) {
  ensureLibrary();
  const long rc = gateway_->runApplication(static_cast<long>(type));
  if (rc == VendorCode::Ok) {
    logInfo("launched %s", displayName(type));
    return;
  }
  if (rc == VendorCode::Error) {
    throw DeviceError(std::string(displayName(type)) + " is not installed", rc);
  }
  if (rc == VendorCode::NoServer) {
    throw DeviceError(std::string("vendor does not know variant ") + toStr(type), rc);
  }
  throw DeviceError(std::string("could not launch ") + displayName(type) + " (code " + std::to_string(rc) + ")", rc);
}

std::string RemoteSession::version() {
  requireConnected("version");
  long packed = 0;
  const long rc = gateway_->getVersion(packed);
  if (rc == VendorCode::NoServer) connectionLost("version query");
  if (rc != VendorCode::Ok) throw DeviceError("version query failed (code " + std::to_string(rc) + ")", rc);
  return formatVersion(packed);
}

bool RemoteSession::parametersDirty() {
  if (!connected()) return false;
  const long rc = gateway_->isParametersDirty();
  if (rc == VendorCode::NoServer) connectionLost("dirty poll");
  if (rc < 0) throw DeviceError("dirty poll failed (code " + std::to_string(rc) + ")", rc);
  return rc > 0;
}

std::string checkPresetFile(const std::string& path) {
  namespace fs = std::filesystem;
  if (path.empty()) throw RequestError("preset_path is empty");
  std::error_code ec;
  const fs::path p(path);
  if (!fs::exists(p, ec)) throw RequestError("Preset file not found: '" + path + "'");
  if (!fs::is_regular_file(p, ec)) throw RequestError("Preset path is not a regular file: '" + path + "'");
  std::string ext = p.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (ext != ".xml") throw RequestError("Invalid file type. Only .xml files are supported: '" + path + "'");
  const uintmax_t size = fs::file_size(p, ec);
  if (ec) throw RequestError("Cannot stat preset file '" + path + "': " + ec.message());
  if (size > kMaxPresetBytes) throw RequestError("Preset file too large (max 10MB): '" + path + "'");
  const std::string absolute = fs::absolute(p, ec).string();
  if (ec) throw RequestError("Cannot resolve preset path '" + path + "': " + ec.message());
  if (absolute.size() >= kVendorStringCapacity) throw RequestError("Preset path too long: '" + path + "'");
  return absolute;
}

void RemoteSession::loadPreset(const std::string& path) {
  const std::string absolute = checkPresetFile(path);
  requireConnected("load preset");
  const long rc = gateway_->setParameterString("Command.Load", absolute);
  if (rc != VendorCode::Ok) failParameter(rc, "Command.Load");
  logInfo("preset %s handed to Voicemeeter", absolute.c_str());
}
