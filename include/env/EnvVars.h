//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: EnvVars.h
// Purpose: Cross-platform helpers to read environment variables safely (string, boolean, integer).
//==========================================================================================================
#pragma once
#include <cctype>
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
// ParseBoolString
// Purpose: Interprets common truthy/falsy spellings (1/0, true/false, yes/no, on/off; case-insensitive).
// Returns:
//   The boolean value, or std::nullopt when the text is not recognized.
//==========================================================================================================
inline std::optional<bool> ParseBoolString(const std::string& text) {
    std::string s; s.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return std::nullopt;
}

//==========================================================================================================
// GetEnvBool
// Purpose: Reads a boolean environment variable, falling back to defaultValue when unset or unparseable.
//==========================================================================================================
inline bool GetEnvBool(const char* name, bool defaultValue) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return defaultValue;
    }
    return ParseBoolString(raw).value_or(defaultValue);
}

//==========================================================================================================
// GetEnvInt
// Purpose: Reads a base-10 integer environment variable.
// Returns:
//   The parsed value; std::nullopt when the variable is unset or not entirely numeric.
//==========================================================================================================
inline std::optional<int64_t> GetEnvInt(const char* name) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return std::nullopt;
    }
    try {
        std::size_t used = 0;
        long long v = std::stoll(raw, &used, 10);
        if (used != raw.size()) {
            return std::nullopt;
        }
        return static_cast<int64_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}
