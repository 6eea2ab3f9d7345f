#pragma once

#include "ToolRegistry.hpp"

class RemoteSession;

// Registers voicemeeter_connect, _disconnect, _run, _get_parameter,
// _set_parameter, _get_levels and _load_preset against one session.
void registerVoicemeeterTools(ToolRegistry& registry, RemoteSession& session);
