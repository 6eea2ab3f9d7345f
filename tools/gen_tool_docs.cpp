#include <algorithm>
#include <cstdio>
#include <memory>
#include <string>
#include "../src/remote/RemoteLibrary.hpp"
#include "../src/server/ToolRegistry.hpp"
#include "../src/server/Tools.hpp"
#include "../src/session/ParameterRef.hpp"
#include "../src/session/RemoteSession.hpp"

static std::string describeArgs(const nlohmann::json& schema) {
  std::string out;
  const auto& props = schema.at("properties");
  const auto required = schema.value("required", nlohmann::json::array());
  for (auto it = props.begin(); it != props.end(); ++it) {
    if (!out.empty()) out += ", ";
    out += "`" + it.key() + "`";
    const bool isRequired = std::find(required.begin(), required.end(), it.key()) != required.end();
    if (!isRequired) out += " (optional)";
  }
  return out.empty() ? "none" : out;
}

static void emitTools(const ToolRegistry& registry) {
  std::printf("## Tools\n\n");
  std::printf("| name | description | arguments |\n");
  std::printf("|------|-------------|-----------|\n");
  for (const auto& t : registry.defs()) {
    std::printf("| %s | %s | %s |\n", t.name.c_str(), t.description.c_str(), describeArgs(t.inputSchema).c_str());
  }
  std::printf("\n");
}

static void emitFields(const FieldMap& map) {
  std::printf("### %s fields\n\n", map.entity);
  std::printf("| field | value | scope | unit | min | max |\n");
  std::printf("|-------|-------|-------|------|----:|----:|\n");
  for (size_t i = 0; i < map.count; ++i) {
    const auto& d = map.defs[i];
    const char* scope = d.scope == FieldScope::Physical ? "physical" : (d.scope == FieldScope::Virtual ? "virtual" : "any");
    if (d.value == FieldValue::String) {
      std::printf("| %s | string | %s | | | |\n", d.name, scope);
    } else {
      std::printf("| %s | float | %s | %s | %.1f | %.1f |\n", d.name, scope, d.unit, d.minValue, d.maxValue);
    }
  }
  std::printf("\n");
}

int main() {
  // The library is never loaded: registering tools does not touch the device.
  RemoteSession session(std::make_unique<RemoteLibrary>(std::string(), std::vector<std::string>()));
  ToolRegistry registry;
  registerVoicemeeterTools(registry, session);

  std::printf("# Tool Catalogue\n\n");
  std::printf("Auto-generated from the tool registry and ParameterRef.hpp. Do not edit by hand.\n\n");
  emitTools(registry);
  std::printf("## Resource views\n\n");
  emitFields(kStripFieldMap);
  emitFields(kBusFieldMap);
  return 0;
}
