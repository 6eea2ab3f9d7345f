#pragma once

#include <string>
#include <vector>
#include "DeviceGateway.hpp"
#include "DynamicLibrary.hpp"

#if defined(_WIN32) && !defined(_WIN64)
#define VMMCP_VENDOR_CALL __stdcall
#else
#define VMMCP_VENDOR_CALL
#endif

// DeviceGateway backed by the vendor's VoicemeeterRemote dynamic library.
class RemoteLibrary : public DeviceGateway {
public:
  RemoteLibrary(std::string explicitPath, std::vector<std::string> extraSearchPaths);

  bool load(std::string& outDiagnostics) override;
  bool loaded() const override { return lib_.valid(); }
  std::string origin() const override { return lib_.path(); }

  long login() override;
  long logout() override;
  long runApplication(long vendorType) override;
  long getDeviceType(long& outType) override;
  long getVersion(long& outVersion) override;
  long isParametersDirty() override;

  long getParameterFloat(const std::string& name, float& outValue) override;
  long getParameterString(const std::string& name, std::string& outValue) override;
  long setParameterFloat(const std::string& name, float value) override;
  long setParameterString(const std::string& name, const std::string& value) override;

  long getLevel(long levelType, long channel, float& outValue) override;

private:
  using FnVoid = long (VMMCP_VENDOR_CALL*)();
  using FnLong = long (VMMCP_VENDOR_CALL*)(long);
  using FnLongOut = long (VMMCP_VENDOR_CALL*)(long*);
  using FnGetFloat = long (VMMCP_VENDOR_CALL*)(char*, float*);
  using FnGetString = long (VMMCP_VENDOR_CALL*)(char*, char*);
  using FnSetFloat = long (VMMCP_VENDOR_CALL*)(char*, float);
  using FnSetString = long (VMMCP_VENDOR_CALL*)(char*, char*);
  using FnGetLevel = long (VMMCP_VENDOR_CALL*)(long, long, float*);

  struct Entry {
    FnVoid login = nullptr;
    FnVoid logout = nullptr;
    FnLong runVoicemeeter = nullptr;
    FnLongOut getType = nullptr;
    FnLongOut getVersion = nullptr;
    FnVoid isParametersDirty = nullptr;
    FnGetFloat getParameterFloat = nullptr;
    FnGetString getParameterString = nullptr;
    FnSetFloat setParameterFloat = nullptr;
    FnSetString setParameterString = nullptr;
    FnGetLevel getLevel = nullptr;
  };

  bool bind(std::string& outMissing);

  std::string explicitPath_;
  std::vector<std::string> extraSearchPaths_;
  DynamicLibraryHandle lib_;
  Entry fn_;
};
