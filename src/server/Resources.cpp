#include "Resources.hpp"
#include <cctype>
#include "JsonRpc.hpp"
#include "../core/Errors.hpp"
#include "../core/Log.hpp"
#include "../session/ParameterRef.hpp"
#include "../session/RemoteSession.hpp"

using nlohmann::json;

namespace {

constexpr const char* kStatusUri = "voicemeeter://status";
constexpr const char* kVersionUri = "voicemeeter://version";
constexpr const char* kLevelsUri = "voicemeeter://levels";
constexpr const char* kStripPrefix = "voicemeeter://strip/";
constexpr const char* kBusPrefix = "voicemeeter://bus/";

json describe(const std::string& uri, const std::string& name, const std::string& description) {
  return json{{"uri", uri}, {"name", name}, {"description", description}, {"mimeType", "application/json"}};
}

// Fields the vendor does not know for this strip/bus are left out of the view.
void readInto(RemoteSession& session, json& out, const std::string& key, const std::string& ref, FieldValue kind) {
  try {
    if (kind == FieldValue::String) out[key] = session.getParameterString(ref);
    else out[key] = session.getParameterFloat(ref);
  } catch (const DeviceError& e) {
    if (e.vendorCode() != VendorCode::UnknownParameter) throw;
    logDebug("view omits %s: %s", ref.c_str(), e.what());
  }
}

std::vector<long> channelRange(uint32_t offset, uint32_t count) {
  std::vector<long> out;
  out.reserve(count);
  for (uint32_t c = 0; c < count; ++c) out.push_back(static_cast<long>(offset + c));
  return out;
}

} // namespace

bool parseIndexedUri(const std::string& uri, const std::string& prefix, uint32_t& outIndex) {
  if (uri.compare(0, prefix.size(), prefix) != 0) return false;
  const std::string tail = uri.substr(prefix.size());
  if (tail.empty() || tail.size() > 9) return false;
  uint32_t v = 0;
  for (char c : tail) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    v = v * 10u + static_cast<uint32_t>(c - '0');
  }
  outIndex = v;
  return true;
}

json ResourceCatalog::list() const {
  json arr = json::array();
  arr.push_back(describe(kStatusUri, "Voicemeeter Status", "Current status and connection information"));
  arr.push_back(describe(kVersionUri, "Voicemeeter Version", "Voicemeeter version information"));
  arr.push_back(describe(kLevelsUri, "Audio Levels", "Current audio levels for all channels"));
  if (!session_.connected()) return arr;

  const Topology t = session_.topology();
  for (uint32_t i = 0; i < t.strips(); ++i) {
    arr.push_back(describe(kStripPrefix + std::to_string(i), "Strip " + std::to_string(i),
                           "Input strip " + std::to_string(i) + " parameters"));
  }
  for (uint32_t i = 0; i < t.buses(); ++i) {
    arr.push_back(describe(kBusPrefix + std::to_string(i), "Bus " + std::to_string(i),
                           "Output bus " + std::to_string(i) + " parameters"));
  }
  return arr;
}

json ResourceCatalog::templates() const {
  json arr = json::array();
  arr.push_back(json{{"uriTemplate", std::string(kStripPrefix) + "{index}"}, {"name", "Strip"},
                     {"description", "Input strip parameters by index"}, {"mimeType", "application/json"}});
  arr.push_back(json{{"uriTemplate", std::string(kBusPrefix) + "{index}"}, {"name", "Bus"},
                     {"description", "Output bus parameters by index"}, {"mimeType", "application/json"}});
  return arr;
}

json ResourceCatalog::status() const {
  bool dirty = false;
  try {
    dirty = session_.parametersDirty();
  } catch (const RemoteError& e) {
    // A lost session has already dropped to disconnected; report that state.
    logWarn("status: %s", e.what());
  }
  json j;
  j["connected"] = session_.connected();
  j["state"] = toStr(session_.state());
  j["type"] = session_.deviceType() ? json(displayName(*session_.deviceType())) : json(nullptr);
  j["login_count"] = session_.loginCount();
  const std::string origin = session_.libraryOrigin();
  j["library"] = origin.empty() ? json(nullptr) : json(origin);
  j["parameters_dirty"] = dirty;
  return j;
}

json ResourceCatalog::version() const {
  return json{{"version", session_.version()}, {"api_version", kApiVersion}};
}

json ResourceCatalog::levels() const {
  const Topology t = session_.topology();
  json inputs = json::array();
  for (uint32_t i = 0; i < t.strips(); ++i) {
    const auto channels = channelRange(t.stripChannelOffset(i), t.stripChannelCount(i));
    inputs.push_back(json{{"strip", i}, {"channels", channels},
                          {"levels", session_.getLevels(LevelType::PreFaderInput, channels)}});
  }
  json outputs = json::array();
  for (uint32_t i = 0; i < t.buses(); ++i) {
    const auto channels = channelRange(t.busChannelOffset(i), Topology::kBusChannels);
    outputs.push_back(json{{"bus", i}, {"channels", channels},
                           {"levels", session_.getLevels(LevelType::PostMuteOutput, channels)}});
  }
  return json{{"input_point", toStr(LevelType::PreFaderInput)},
              {"output_point", toStr(LevelType::PostMuteOutput)},
              {"inputs", inputs},
              {"outputs", outputs}};
}

json ResourceCatalog::strip(uint32_t index) const {
  const Topology t = session_.topology();
  if (index >= t.strips()) {
    throw JsonRpcError(RpcCode::ResourceNotFound, "Strip " + std::to_string(index) + " does not exist on " +
                       toStr(*session_.deviceType()));
  }
  const bool physical = t.isPhysicalStrip(index);
  json params = json::object();
  for (size_t i = 0; i < kStripFieldMap.count; ++i) {
    const FieldDef& d = kStripFieldMap.defs[i];
    if (!fieldApplies(d, physical)) continue;
    readInto(session_, params, d.name, formatParameterRef(EntityKind::Strip, index, d.name), d.value);
  }
  for (const auto& route : stripRoutingFields(t)) {
    readInto(session_, params, route, formatParameterRef(EntityKind::Strip, index, route), FieldValue::Float);
  }
  return json{{"strip", index}, {"virtual", !physical}, {"parameters", params}};
}

json ResourceCatalog::bus(uint32_t index) const {
  const Topology t = session_.topology();
  if (index >= t.buses()) {
    throw JsonRpcError(RpcCode::ResourceNotFound, "Bus " + std::to_string(index) + " does not exist on " +
                       toStr(*session_.deviceType()));
  }
  const bool physical = t.isPhysicalBus(index);
  json params = json::object();
  for (size_t i = 0; i < kBusFieldMap.count; ++i) {
    const FieldDef& d = kBusFieldMap.defs[i];
    if (!fieldApplies(d, physical)) continue;
    readInto(session_, params, d.name, formatParameterRef(EntityKind::Bus, index, d.name), d.value);
  }
  return json{{"bus", index}, {"virtual", !physical}, {"parameters", params}};
}

json ResourceCatalog::read(const std::string& uri) const {
  json payload;
  try {
    uint32_t index = 0;
    if (uri == kStatusUri) payload = status();
    else if (uri == kVersionUri) payload = version();
    else if (uri == kLevelsUri) payload = levels();
    else if (parseIndexedUri(uri, kStripPrefix, index)) payload = strip(index);
    else if (parseIndexedUri(uri, kBusPrefix, index)) payload = bus(index);
    else throw JsonRpcError(RpcCode::ResourceNotFound, "Unknown resource: " + uri, json{{"uri", uri}});
  } catch (const RemoteError& e) {
    throw JsonRpcError(RpcCode::ServerError, e.what(), json{{"kind", toStr(e.kind())}, {"uri", uri}});
  }
  json content{{"uri", uri}, {"mimeType", "application/json"}, {"text", payload.dump()}};
  return json{{"contents", json::array({content})}};
}
