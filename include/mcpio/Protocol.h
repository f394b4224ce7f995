//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol constants and the small set of structures the client engine exchanges
//==========================================================================================================

#pragma once

#include "mcpio/JSONRPCTypes.h"
#include <string>
#include <optional>

namespace mcpio {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Method names, version, and the capability subset the engine acts on.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
constexpr const char* PROTOCOL_VERSION = "2025-06-18";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

//==========================================================================================================
// ServerCapabilities
// Purpose: Capabilities advertised by a server in its initialize result. Only the fields the engine
//          consults are modelled; the raw object is kept for callers that need more.
//==========================================================================================================
struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
    JSONValue raw;

    bool supportsSubscriptions() const { return resources.has_value() && resources->subscribe; }
};

// Parses the "capabilities" object of an initialize result. Unknown members are ignored.
ServerCapabilities ParseServerCapabilities(const JSONValue& capabilities);

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Lifecycle
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Ping = "ping";

    // Tools
    constexpr const char* CallTool = "tools/call";

    // Resources
    constexpr const char* Subscribe = "resources/subscribe";
    constexpr const char* Unsubscribe = "resources/unsubscribe";

    // Notifications
    constexpr const char* Cancelled = "notifications/cancelled";
    constexpr const char* Progress = "notifications/progress";
    constexpr const char* ResourceUpdated = "notifications/resources/updated";
    constexpr const char* ResourceListChanged = "notifications/resources/list_changed";
}

} // namespace mcpio
