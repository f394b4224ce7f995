//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables and numeric overrides safely.
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

//==========================================================================================================
// GetEnvOrDefault
// Purpose: Returns the value of the environment variable or a provided default when unset.
// Args:
//   name: C-string name of the environment variable. When null or empty, returns defaultValue.
//   defaultValue: Value to return when the variable is not set.
// Returns:
//   std::string with the environment value (when set) or defaultValue otherwise.
//==========================================================================================================
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    if (name == nullptr || *name == '\0') {
        return defaultValue;
    }
    const char* v = std::getenv(name);
    return v ? std::string(v) : defaultValue;
}

//==========================================================================================================
// GetEnvUInt64
// Purpose: Reads an unsigned decimal override such as MCPIO_STARTUP_TIMEOUT_MS.
// Returns:
//   The parsed value, or std::nullopt when unset, empty, or not a plain decimal number.
//==========================================================================================================
inline std::optional<uint64_t> GetEnvUInt64(const char* name) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return std::nullopt;
    }
    for (char c : raw) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
    }
    try {
        return static_cast<uint64_t>(std::stoull(raw));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}
