#include "RemoteLibrary.hpp"
#include <cstring>
#include <utility>
#include "LibraryLocator.hpp"
#include "VoicemeeterTypes.hpp"
#include "../core/Log.hpp"

namespace {

template <typename Fn>
bool resolve(const DynamicLibraryHandle& lib, const char* name, Fn& out, std::string& missing) {
  out = reinterpret_cast<Fn>(lib.symbol(name));
  if (!out) {
    if (!missing.empty()) missing += ", ";
    missing += name;
    return false;
  }
  return true;
}

// Vendor entry points take non-const char*; they do not write through the name.
inline char* mutableCStr(std::string& s) { return &s[0]; }

} // namespace

RemoteLibrary::RemoteLibrary(std::string explicitPath, std::vector<std::string> extraSearchPaths)
    : explicitPath_(std::move(explicitPath)), extraSearchPaths_(std::move(extraSearchPaths)) {}

bool RemoteLibrary::bind(std::string& outMissing) {
  bool ok = true;
  ok &= resolve(lib_, "VBVMR_Login", fn_.login, outMissing);
  ok &= resolve(lib_, "VBVMR_Logout", fn_.logout, outMissing);
  ok &= resolve(lib_, "VBVMR_RunVoicemeeter", fn_.runVoicemeeter, outMissing);
  ok &= resolve(lib_, "VBVMR_GetVoicemeeterType", fn_.getType, outMissing);
  ok &= resolve(lib_, "VBVMR_GetVoicemeeterVersion", fn_.getVersion, outMissing);
  ok &= resolve(lib_, "VBVMR_IsParametersDirty", fn_.isParametersDirty, outMissing);
  ok &= resolve(lib_, "VBVMR_GetParameterFloat", fn_.getParameterFloat, outMissing);
  ok &= resolve(lib_, "VBVMR_GetParameterStringA", fn_.getParameterString, outMissing);
  ok &= resolve(lib_, "VBVMR_SetParameterFloat", fn_.setParameterFloat, outMissing);
  ok &= resolve(lib_, "VBVMR_SetParameterStringA", fn_.setParameterString, outMissing);
  ok &= resolve(lib_, "VBVMR_GetLevel", fn_.getLevel, outMissing);
  return ok;
}

bool RemoteLibrary::load(std::string& outDiagnostics) {
  if (lib_.valid()) return true;
  std::string tried;
  for (const auto& candidate : libraryCandidates(explicitPath_, extraSearchPaths_)) {
    if (shouldSkipCandidate(candidate)) {
      logDebug("library candidate %s does not exist", candidate.c_str());
      continue;
    }
    std::string err;
    if (!lib_.open(candidate, err)) {
      logDebug("library candidate %s: %s", candidate.c_str(), err.c_str());
      if (!tried.empty()) tried += "; ";
      tried += candidate + ": " + err;
      continue;
    }
    std::string missing;
    if (!bind(missing)) {
      logWarn("%s lacks vendor entry points: %s", candidate.c_str(), missing.c_str());
      if (!tried.empty()) tried += "; ";
      tried += candidate + ": missing " + missing;
      lib_.release();
      fn_ = Entry{};
      continue;
    }
    logInfo("loaded remote library %s", candidate.c_str());
    return true;
  }
  outDiagnostics = tried.empty() ? std::string("no VoicemeeterRemote library candidate found")
                                 : std::string("VoicemeeterRemote library not loadable (") + tried + ")";
  return false;
}

long RemoteLibrary::login() {
  if (!fn_.login) return VendorCode::Error;
  return fn_.login();
}

long RemoteLibrary::logout() {
  if (!fn_.logout) return VendorCode::Error;
  return fn_.logout();
}

long RemoteLibrary::runApplication(long vendorType) {
  if (!fn_.runVoicemeeter) return VendorCode::Error;
  return fn_.runVoicemeeter(vendorType);
}

long RemoteLibrary::getDeviceType(long& outType) {
  if (!fn_.getType) return VendorCode::Error;
  long v = 0;
  const long rc = fn_.getType(&v);
  if (rc == VendorCode::Ok) outType = v;
  return rc;
}

long RemoteLibrary::getVersion(long& outVersion) {
  if (!fn_.getVersion) return VendorCode::Error;
  long v = 0;
  const long rc = fn_.getVersion(&v);
  if (rc == VendorCode::Ok) outVersion = v;
  return rc;
}

long RemoteLibrary::isParametersDirty() {
  if (!fn_.isParametersDirty) return VendorCode::Error;
  return fn_.isParametersDirty();
}

long RemoteLibrary::getParameterFloat(const std::string& name, float& outValue) {
  if (!fn_.getParameterFloat) return VendorCode::Error;
  std::string n = name;
  float v = 0.0f;
  const long rc = fn_.getParameterFloat(mutableCStr(n), &v);
  if (rc == VendorCode::Ok) outValue = v;
  return rc;
}

long RemoteLibrary::getParameterString(const std::string& name, std::string& outValue) {
  if (!fn_.getParameterString) return VendorCode::Error;
  std::string n = name;
  char buf[kVendorStringCapacity];
  std::memset(buf, 0, sizeof(buf));
  const long rc = fn_.getParameterString(mutableCStr(n), buf);
  if (rc == VendorCode::Ok) {
    buf[kVendorStringCapacity - 1] = '\0';
    outValue = buf;
  }
  return rc;
}

long RemoteLibrary::setParameterFloat(const std::string& name, float value) {
  if (!fn_.setParameterFloat) return VendorCode::Error;
  std::string n = name;
  return fn_.setParameterFloat(mutableCStr(n), value);
}

long RemoteLibrary::setParameterString(const std::string& name, const std::string& value) {
  if (!fn_.setParameterString) return VendorCode::Error;
  std::string n = name;
  std::string v = value.substr(0, kVendorStringCapacity - 1);
  return fn_.setParameterString(mutableCStr(n), mutableCStr(v));
}

long RemoteLibrary::getLevel(long levelType, long channel, float& outValue) {
  if (!fn_.getLevel) return VendorCode::Error;
  float v = 0.0f;
  const long rc = fn_.getLevel(levelType, channel, &v);
  if (rc == VendorCode::Ok) outValue = v;
  return rc;
}
