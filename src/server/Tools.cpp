#include "Tools.hpp"
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include "../core/Errors.hpp"
#include "../session/RemoteSession.hpp"

using nlohmann::json;

namespace {

// Highest channel index accepted by voicemeeter_get_levels.
constexpr long kMaxLevelChannel = 4095;

// Shortest decimal that round-trips the float, so 0.1f is reported as 0.1.
json floatJson(float f) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.9g", static_cast<double>(f));
  for (int precision = 6; precision < 9; ++precision) {
    char shorter[32];
    std::snprintf(shorter, sizeof(shorter), "%.*g", precision, static_cast<double>(f));
    if (std::strtof(shorter, nullptr) == f) {
      std::snprintf(buf, sizeof(buf), "%s", shorter);
      break;
    }
  }
  return json(std::strtod(buf, nullptr));
}

json emptyObjectSchema() {
  return json{{"type", "object"}, {"properties", json::object()}, {"required", json::array()}};
}

json parameterTypeSchema() {
  return json{{"type", "string"}, {"enum", {"float", "string"}}, {"default", "float"},
              {"description", "Parameter type"}};
}

float parseFloatValue(const json& value, const std::string& parameter) {
  if (value.is_number()) {
    const double d = value.get<double>();
    if (!std::isfinite(d) || std::fabs(d) > static_cast<double>(std::numeric_limits<float>::max())) {
      throw RequestError("value " + value.dump() + " for '" + parameter + "' is outside the float range");
    }
    return static_cast<float>(d);
  }
  const std::string s = value.get<std::string>();
  errno = 0;
  char* end = nullptr;
  const float f = std::strtof(s.c_str(), &end);
  if (s.empty() || end != s.c_str() + s.size() || errno == ERANGE || !std::isfinite(f)) {
    throw RequestError("value '" + s + "' for '" + parameter + "' is not a number; pass type \"string\" for text");
  }
  return f;
}

std::string stringValue(const json& value) {
  if (value.is_string()) return value.get<std::string>();
  return value.dump();
}

ToolResult connectTool(RemoteSession& session) {
  const bool already = session.connected();
  const DeviceType t = session.connect();
  ToolResult r;
  r.text = already ? std::string("Already connected to ") + displayName(t)
                   : std::string("Successfully connected to ") + displayName(t);
  r.structured = json{{"connected", true}, {"type", displayName(t)}, {"already_connected", already},
                      {"login_count", session.loginCount()}};
  return r;
}

ToolResult disconnectTool(RemoteSession& session) {
  const bool closed = session.disconnect();
  ToolResult r;
  r.text = closed ? "Disconnected from Voicemeeter" : "Not connected; nothing to disconnect";
  r.structured = json{{"connected", false}, {"was_connected", closed}};
  return r;
}

ToolResult runTool(RemoteSession& session, const json& args) {
  const std::string name = args.at("type").get<std::string>();
  DeviceType t = DeviceType::Voicemeeter;
  if (!parseDeviceType(name, t)) throw RequestError("Invalid Voicemeeter type: " + name);
  session.runApplication(t);
  ToolResult r;
  r.text = std::string("Successfully launched ") + displayName(t);
  r.structured = json{{"launched", displayName(t)}};
  return r;
}

ToolResult getParameterTool(RemoteSession& session, const json& args) {
  const std::string parameter = args.at("parameter").get<std::string>();
  const std::string type = args.value("type", std::string("float"));
  json value;
  if (type == "string") value = session.getParameterString(parameter);
  else value = floatJson(session.getParameterFloat(parameter));
  ToolResult r;
  r.text = "Parameter '" + parameter + "' = " + stringValue(value);
  r.structured = json{{"parameter", parameter}, {"type", type}, {"value", value}};
  return r;
}

ToolResult setParameterTool(RemoteSession& session, const json& args) {
  const std::string parameter = args.at("parameter").get<std::string>();
  const std::string type = args.value("type", std::string("float"));
  const json& raw = args.at("value");
  json applied;
  if (type == "string") {
    const std::string v = stringValue(raw);
    session.setParameterString(parameter, v);
    applied = v;
  } else {
    const float v = parseFloatValue(raw, parameter);
    session.setParameterFloat(parameter, v);
    applied = floatJson(v);
  }
  ToolResult r;
  r.text = "Successfully set parameter '" + parameter + "' to " + stringValue(applied);
  r.structured = json{{"parameter", parameter}, {"type", type}, {"value", applied}};
  return r;
}

ToolResult getLevelsTool(RemoteSession& session, const json& args) {
  const long raw = args.value("level_type", 0L);
  LevelType point = LevelType::PreFaderInput;
  if (!levelTypeFromInt(raw, point)) throw RequestError("level_type must be 0..3, got " + std::to_string(raw));
  const std::vector<long> channels = args.value("channels", std::vector<long>{0, 1});
  const std::vector<float> levels = session.getLevels(point, channels);

  json levelArray = json::array();
  for (float v : levels) levelArray.push_back(floatJson(v));
  std::string listing;
  for (size_t i = 0; i < channels.size(); ++i) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%schannel %ld: %.6g", i ? ", " : "", channels[i], static_cast<double>(levels[i]));
    listing += buf;
  }
  ToolResult r;
  r.text = std::string("Audio levels (") + toStr(point) + "): " + (listing.empty() ? "no channels" : listing);
  r.structured = json{{"level_type", raw}, {"measurement_point", toStr(point)},
                      {"channels", channels}, {"levels", levelArray}};
  return r;
}

ToolResult loadPresetTool(RemoteSession& session, const json& args) {
  const std::string path = args.at("preset_path").get<std::string>();
  session.loadPreset(path);
  ToolResult r;
  r.text = "Preset '" + path + "' handed to Voicemeeter";
  r.structured = json{{"preset_path", path}, {"loaded", true}};
  return r;
}

} // namespace

void registerVoicemeeterTools(ToolRegistry& registry, RemoteSession& session) {
  registry.add(ToolDef{
    "voicemeeter_connect", "Connect to Voicemeeter Remote API", emptyObjectSchema(),
    [&session](const json&) { return connectTool(session); }});

  registry.add(ToolDef{
    "voicemeeter_disconnect", "Disconnect from Voicemeeter Remote API", emptyObjectSchema(),
    [&session](const json&) { return disconnectTool(session); }});

  registry.add(ToolDef{
    "voicemeeter_run", "Launch Voicemeeter application",
    json{{"type", "object"},
         {"properties", {{"type", {{"type", "string"}, {"enum", {"voicemeeter", "banana", "potato"}},
                                   {"description", "Type of Voicemeeter to launch"}}}}},
         {"required", {"type"}}},
    [&session](const json& a) { return runTool(session, a); }});

  registry.add(ToolDef{
    "voicemeeter_get_parameter", "Get a Voicemeeter parameter value",
    json{{"type", "object"},
         {"properties", {{"parameter", {{"type", "string"}, {"minLength", 1},
                                        {"description", "Parameter name (e.g., 'Strip[0].mute', 'Bus[1].gain')"}}},
                         {"type", parameterTypeSchema()}}},
         {"required", {"parameter"}}},
    [&session](const json& a) { return getParameterTool(session, a); }});

  registry.add(ToolDef{
    "voicemeeter_set_parameter", "Set a Voicemeeter parameter value",
    json{{"type", "object"},
         {"properties", {{"parameter", {{"type", "string"}, {"minLength", 1},
                                        {"description", "Parameter name (e.g., 'Strip[0].mute', 'Bus[1].gain')"}}},
                         {"value", {{"type", {"number", "string"}}, {"description", "Parameter value"}}},
                         {"type", parameterTypeSchema()}}},
         {"required", {"parameter", "value"}}},
    [&session](const json& a) { return setParameterTool(session, a); }});

  registry.add(ToolDef{
    "voicemeeter_get_levels", "Get audio levels for specified channels",
    json{{"type", "object"},
         {"properties",
          {{"level_type", {{"type", "integer"}, {"minimum", 0}, {"maximum", 3}, {"default", 0},
                           {"description", "Level type (0=input, 1=output pre-fader, 2=output post-fader, 3=output post-mute)"}}},
           {"channels", {{"type", "array"}, {"items", {{"type", "integer"}, {"minimum", 0}, {"maximum", kMaxLevelChannel}}}, {"default", {0, 1}},
                         {"description", "Channel indices to get levels for"}}}}},
         {"required", json::array()}},
    [&session](const json& a) { return getLevelsTool(session, a); }});

  registry.add(ToolDef{
    "voicemeeter_load_preset", "Load a Voicemeeter preset from XML file",
    json{{"type", "object"},
         {"properties", {{"preset_path", {{"type", "string"}, {"description", "Path to the XML preset file"}}}}},
         {"required", {"preset_path"}}},
    [&session](const json& a) { return loadPresetTool(session, a); }});
}
