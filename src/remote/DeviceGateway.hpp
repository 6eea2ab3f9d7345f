#pragma once

#include <string>

// Thin seam over the vendor remote API. Every call returns the vendor return
// code unchanged (see VendorCode); interpretation happens in RemoteSession.
class DeviceGateway {
public:
  virtual ~DeviceGateway() = default;

  // Make the vendor entry points available. Idempotent.
  virtual bool load(std::string& outDiagnostics) = 0;
  virtual bool loaded() const = 0;
  virtual std::string origin() const = 0;

  virtual long login() = 0;
  virtual long logout() = 0;
  virtual long runApplication(long vendorType) = 0;
  virtual long getDeviceType(long& outType) = 0;
  virtual long getVersion(long& outVersion) = 0;
  virtual long isParametersDirty() = 0;

  virtual long getParameterFloat(const std::string& name, float& outValue) = 0;
  virtual long getParameterString(const std::string& name, std::string& outValue) = 0;
  virtual long setParameterFloat(const std::string& name, float value) = 0;
  virtual long setParameterString(const std::string& name, const std::string& value) = 0;

  virtual long getLevel(long levelType, long channel, float& outValue) = 0;
};
