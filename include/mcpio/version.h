//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Library version, reported as clientInfo during the initialize handshake.
//==========================================================================================================
#pragma once

#include <string>

namespace mcpio {

struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

// Implementation name sent as clientInfo.name
constexpr const char* CLIENT_NAME = "mcpio";

} // namespace mcpio
