//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Environment variable lookups used by configuration and logging.
//==========================================================================================================
#pragma once
#include <cstdlib>
#include <optional>
#include <string>

//==========================================================================================================
// GetEnvIfSet
// Purpose: Value of the variable, or nullopt when the name is null/empty or the variable is unset or
//          set to an empty string.
//==========================================================================================================
inline std::optional<std::string> GetEnvIfSet(const char* name) {
    if (name == nullptr || *name == '\0') {
        return std::nullopt;
    }
    const char* v = std::getenv(name);
    if (v == nullptr || *v == '\0') {
        return std::nullopt;
    }
    return std::string(v);
}

// Value of the variable, or 'defaultValue' when GetEnvIfSet yields nothing.
inline std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    return GetEnvIfSet(name).value_or(defaultValue);
}
