#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind { Request, Connection, Device };

inline const char* toStr(ErrorKind k) {
  switch (k) {
    case ErrorKind::Request: return "RequestError";
    case ErrorKind::Connection: return "ConnectionError";
    case ErrorKind::Device: return "DeviceError";
  }
  return "DeviceError";
}

// Base of every failure the session and server report to a caller.
class RemoteError : public std::runtime_error {
public:
  RemoteError(ErrorKind kind, const std::string& what) : std::runtime_error(what), kind_(kind) {}
  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

// Malformed arguments; raised before the device is touched.
class RequestError : public RemoteError {
public:
  explicit RequestError(const std::string& what) : RemoteError(ErrorKind::Request, what) {}
};

// No session, session held elsewhere, host not running, or session lost.
class ConnectionError : public RemoteError {
public:
  explicit ConnectionError(const std::string& what) : RemoteError(ErrorKind::Connection, what) {}
};

// Vendor call returned a failure code.
class DeviceError : public RemoteError {
public:
  DeviceError(const std::string& what, long code = 0) : RemoteError(ErrorKind::Device, what), code_(code) {}
  long vendorCode() const { return code_; }

private:
  long code_;
};
