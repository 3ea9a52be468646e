//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Helpers to read environment variables safely (strings, flags, unsigned integers).
//==========================================================================================================
#pragma once
#include <cstdint>
#include <cstdlib>
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
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

//==========================================================================================================
// ParseFlagValue
// Purpose: Interprets "1"/"true"/"TRUE"/"yes"/"on" as true; everything else as false.
//==========================================================================================================
inline bool ParseFlagValue(const std::string& v) {
    return v == "1" || v == "true" || v == "TRUE" || v == "yes" || v == "on";
}

//==========================================================================================================
// GetEnvFlag
// Purpose: Reads a boolean toggle such as MCP_DEBUG=1.
// Args:
//   name: Environment variable name.
//   defaultValue: Returned when the variable is unset or empty.
//==========================================================================================================
inline bool GetEnvFlag(const char* name, bool defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    return ParseFlagValue(v);
}

//==========================================================================================================
// GetEnvUint
// Purpose: Reads an unsigned integer; malformed or unset values yield defaultValue.
//==========================================================================================================
inline uint64_t GetEnvUint(const char* name, uint64_t defaultValue) {
    const std::string v = GetEnvOrDefault(name, "");
    if (v.empty()) {
        return defaultValue;
    }
    try {
        return static_cast<uint64_t>(std::stoull(v));
    } catch (const std::exception&) {
        return defaultValue;
    }
}
