//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Capability parsing for initialize results
//==========================================================================================================

#include "mcpio/Protocol.h"

namespace mcpio {

ServerCapabilities ParseServerCapabilities(const JSONValue& capabilities) {
    ServerCapabilities caps;
    caps.raw = capabilities;
    if (!capabilities.isObject()) {
        return caps;
    }
    if (const JSONValue* tools = FindMember(capabilities, "tools"); tools && tools->isObject()) {
        ToolsCapability t;
        t.listChanged = GetBoolMember(*tools, "listChanged").value_or(false);
        caps.tools = t;
    }
    if (const JSONValue* res = FindMember(capabilities, "resources"); res && res->isObject()) {
        ResourcesCapability r;
        r.subscribe = GetBoolMember(*res, "subscribe").value_or(false);
        r.listChanged = GetBoolMember(*res, "listChanged").value_or(false);
        caps.resources = r;
    }
    return caps;
}

} // namespace mcpio
