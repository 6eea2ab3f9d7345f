#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

// Return codes shared by the VBVMR_* entry points.
namespace VendorCode {
  constexpr long Ok = 0;
  constexpr long LoginHostNotRunning = 1;  // login ok, application not launched
  constexpr long Error = -1;
  constexpr long NoServer = -2;            // also: login already held (logout expected)
  constexpr long UnknownParameter = -3;    // also: level not available
  constexpr long OutOfRange = -4;          // level channel out of range
  constexpr long StructureMismatch = -5;
}

constexpr size_t kVendorStringCapacity = 512;

enum class DeviceType : long { Voicemeeter = 1, Banana = 2, Potato = 3 };

inline const char* toStr(DeviceType t) {
  switch (t) {
    case DeviceType::Voicemeeter: return "voicemeeter";
    case DeviceType::Banana: return "banana";
    case DeviceType::Potato: return "potato";
  }
  return "voicemeeter";
}

inline const char* displayName(DeviceType t) {
  switch (t) {
    case DeviceType::Voicemeeter: return "VOICEMEETER";
    case DeviceType::Banana: return "VOICEMEETER_BANANA";
    case DeviceType::Potato: return "VOICEMEETER_POTATO";
  }
  return "VOICEMEETER";
}

inline bool parseDeviceType(const std::string& s, DeviceType& out) {
  if (s == "voicemeeter") { out = DeviceType::Voicemeeter; return true; }
  if (s == "banana") { out = DeviceType::Banana; return true; }
  if (s == "potato") { out = DeviceType::Potato; return true; }
  return false;
}

inline bool deviceTypeFromVendor(long v, DeviceType& out) {
  switch (v) {
    case 1: out = DeviceType::Voicemeeter; return true;
    case 2: out = DeviceType::Banana; return true;
    case 3: out = DeviceType::Potato; return true;
    default: return false;
  }
}

// Channel layout of a connected variant. Physical strips carry 2 level
// channels, virtual strips 8; every bus carries 8.
struct Topology {
  uint32_t physicalStrips = 0;
  uint32_t virtualStrips = 0;
  uint32_t physicalBuses = 0;
  uint32_t virtualBuses = 0;

  static constexpr uint32_t kPhysicalStripChannels = 2;
  static constexpr uint32_t kVirtualStripChannels = 8;
  static constexpr uint32_t kBusChannels = 8;

  uint32_t strips() const { return physicalStrips + virtualStrips; }
  uint32_t buses() const { return physicalBuses + virtualBuses; }
  bool isPhysicalStrip(uint32_t i) const { return i < physicalStrips; }
  bool isPhysicalBus(uint32_t i) const { return i < physicalBuses; }

  uint32_t stripChannelCount(uint32_t i) const {
    return isPhysicalStrip(i) ? kPhysicalStripChannels : kVirtualStripChannels;
  }
  uint32_t stripChannelOffset(uint32_t i) const {
    if (i <= physicalStrips) return i * kPhysicalStripChannels;
    return physicalStrips * kPhysicalStripChannels + (i - physicalStrips) * kVirtualStripChannels;
  }
  uint32_t inputChannels() const { return stripChannelOffset(strips()); }
  uint32_t busChannelOffset(uint32_t i) const { return i * kBusChannels; }
  uint32_t outputChannels() const { return buses() * kBusChannels; }
};

inline Topology topologyFor(DeviceType t) {
  switch (t) {
    case DeviceType::Voicemeeter: return Topology{2, 1, 2, 1};
    case DeviceType::Banana: return Topology{3, 2, 3, 2};
    case DeviceType::Potato: return Topology{5, 3, 5, 3};
  }
  return Topology{2, 1, 2, 1};
}

// Measurement point selector passed straight to VBVMR_GetLevel.
enum class LevelType : long { PreFaderInput = 0, PreFaderOutput = 1, PostFaderOutput = 2, PostMuteOutput = 3 };

inline const char* toStr(LevelType t) {
  switch (t) {
    case LevelType::PreFaderInput: return "pre_fader_input";
    case LevelType::PreFaderOutput: return "pre_fader_output";
    case LevelType::PostFaderOutput: return "post_fader_output";
    case LevelType::PostMuteOutput: return "post_mute_output";
  }
  return "pre_fader_input";
}

inline bool levelTypeFromInt(long v, LevelType& out) {
  if (v < 0 || v > 3) return false;
  out = static_cast<LevelType>(v);
  return true;
}

// Packed version 0xAABBCCDD renders as "AA.BB.CC.DD" in decimal.
inline std::string formatVersion(long packed) {
  const uint32_t v = static_cast<uint32_t>(packed);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%u.%u.%u.%u",
                (v >> 24) & 0xFFu, (v >> 16) & 0xFFu, (v >> 8) & 0xFFu, v & 0xFFu);
  return std::string(buf);
}
