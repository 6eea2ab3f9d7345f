#pragma once

#include <cctype>
#include <cstdint>
#include <string>
#include <vector>
#include "../remote/VoicemeeterTypes.hpp"

enum class EntityKind : uint8_t { Strip = 0, Bus = 1 };

inline const char* toStr(EntityKind k) { return k == EntityKind::Strip ? "Strip" : "Bus"; }

// Address of one mixer control: Kind[index].field
struct ParameterRef {
  EntityKind kind = EntityKind::Strip;
  uint32_t index = 0;
  std::string field;

  std::string toString() const {
    return std::string(toStr(kind)) + "[" + std::to_string(index) + "]." + field;
  }
};

inline std::string formatParameterRef(EntityKind kind, uint32_t index, const std::string& field) {
  return ParameterRef{kind, index, field}.toString();
}

constexpr size_t kMaxParameterRefLength = 100;

// Accepts Strip[<n>].<field> and Bus[<n>].<field>, field = [A-Za-z][A-Za-z0-9_.]*.
// Anything else (vendor keys such as Command.Restart) is not a strip/bus reference.
inline bool parseParameterRef(const std::string& s, ParameterRef& out) {
  if (s.size() > kMaxParameterRefLength) return false;
  size_t pos = 0;
  EntityKind kind;
  if (s.compare(0, 6, "Strip[") == 0) { kind = EntityKind::Strip; pos = 6; }
  else if (s.compare(0, 4, "Bus[") == 0) { kind = EntityKind::Bus; pos = 4; }
  else return false;

  const size_t digitsStart = pos;
  uint64_t index = 0;
  while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
    index = index * 10u + static_cast<uint64_t>(s[pos] - '0');
    if (index > UINT32_MAX) return false;
    ++pos;
  }
  if (pos == digitsStart) return false;
  if (pos + 1 >= s.size() || s[pos] != ']' || s[pos + 1] != '.') return false;
  pos += 2;

  if (pos >= s.size() || !std::isalpha(static_cast<unsigned char>(s[pos]))) return false;
  for (size_t i = pos; i < s.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(s[i]);
    if (!(std::isalnum(c) || c == '_' || c == '.')) return false;
  }
  out.kind = kind;
  out.index = static_cast<uint32_t>(index);
  out.field = s.substr(pos);
  return true;
}

enum class FieldValue : uint8_t { Float = 0, String = 1 };
enum class FieldScope : uint8_t { Any = 0, Physical = 1, Virtual = 2 };

struct FieldDef {
  const char* name;
  FieldValue value;
  FieldScope scope;
  const char* unit;
  float minValue;
  float maxValue;
};

struct FieldMap {
  const char* entity;
  const FieldDef* defs;
  size_t count;
};

// unit/minValue/maxValue document the device ranges; nothing here clamps a set.
// Strip controls read by the strip view. Routing flags (A1.., B1..) depend on
// the bus count and are appended per topology.
static constexpr FieldDef kStripFields[] = {
  {"mute",        FieldValue::Float,  FieldScope::Any,      "bool",  0.0f,   1.0f},
  {"mono",        FieldValue::Float,  FieldScope::Any,      "bool",  0.0f,   1.0f},
  {"solo",        FieldValue::Float,  FieldScope::Any,      "bool",  0.0f,   1.0f},
  {"gain",        FieldValue::Float,  FieldScope::Any,      "dB",  -60.0f,  12.0f},
  {"comp",        FieldValue::Float,  FieldScope::Physical, "",      0.0f,  10.0f},
  {"gate",        FieldValue::Float,  FieldScope::Physical, "",      0.0f,  10.0f},
  {"limit",       FieldValue::Float,  FieldScope::Any,      "dB",  -40.0f,  12.0f},
  {"label",       FieldValue::String, FieldScope::Any,      "",      0.0f,   0.0f},
  {"device.name", FieldValue::String, FieldScope::Physical, "",      0.0f,   0.0f},
};

static constexpr FieldDef kBusFields[] = {
  {"mute",         FieldValue::Float,  FieldScope::Any, "bool",  0.0f,  1.0f},
  {"mono",         FieldValue::Float,  FieldScope::Any, "bool",  0.0f,  1.0f},
  {"gain",         FieldValue::Float,  FieldScope::Any, "dB",  -60.0f, 12.0f},
  {"eq.on",        FieldValue::Float,  FieldScope::Any, "bool",  0.0f,  1.0f},
  {"eq.ab",        FieldValue::Float,  FieldScope::Any, "bool",  0.0f,  1.0f},
  {"sel",          FieldValue::Float,  FieldScope::Any, "bool",  0.0f,  1.0f},
  {"returnreverb", FieldValue::Float,  FieldScope::Any, "",      0.0f, 10.0f},
  {"returndelay",  FieldValue::Float,  FieldScope::Any, "",      0.0f, 10.0f},
  {"returnfx1",    FieldValue::Float,  FieldScope::Any, "",      0.0f, 10.0f},
  {"returnfx2",    FieldValue::Float,  FieldScope::Any, "",      0.0f, 10.0f},
  {"label",        FieldValue::String, FieldScope::Any, "",      0.0f,  0.0f},
};

static constexpr FieldMap kStripFieldMap{"Strip", kStripFields, sizeof(kStripFields) / sizeof(kStripFields[0])};
static constexpr FieldMap kBusFieldMap{"Bus", kBusFields, sizeof(kBusFields) / sizeof(kBusFields[0])};

inline const FieldMap& fieldMapFor(EntityKind k) { return k == EntityKind::Strip ? kStripFieldMap : kBusFieldMap; }

inline const FieldDef* findField(const FieldMap& map, const std::string& name) {
  for (size_t i = 0; i < map.count; ++i) {
    if (name == map.defs[i].name) return &map.defs[i];
  }
  return nullptr;
}

// Mirrors the range the mixer enforces; the device does the real clamping.
// Ranged float fields only; bool and string fields come back unchanged.
inline float clampToField(const FieldDef& d, float value) {
  if (d.value != FieldValue::Float || !(d.minValue < d.maxValue)) return value;
  if (value < d.minValue) return d.minValue;
  if (value > d.maxValue) return d.maxValue;
  return value;
}

// Strip routing flags for a topology: A1..A<physical buses>, B1..B<virtual buses>.
inline std::vector<std::string> stripRoutingFields(const Topology& t) {
  std::vector<std::string> out;
  out.reserve(t.buses());
  for (uint32_t i = 1; i <= t.physicalBuses; ++i) out.push_back("A" + std::to_string(i));
  for (uint32_t i = 1; i <= t.virtualBuses; ++i) out.push_back("B" + std::to_string(i));
  return out;
}

inline bool fieldApplies(const FieldDef& d, bool physical) {
  if (d.scope == FieldScope::Any) return true;
  return (d.scope == FieldScope::Physical) == physical;
}
