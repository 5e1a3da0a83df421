//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validation.h
// Purpose: Opt-in result shape validation mode for the dispatcher (Off by default)
//==========================================================================================================

#pragma once

#include <cctype>
#include <string>

namespace mcpserve {
namespace validation {

// Validation modes for runtime shape checks of handler results
enum class ValidationMode {
    Off = 0,
    Strict = 1,
};

// Utility to convert to/from string for docs/config friendliness
inline const char* toString(ValidationMode mode) {
    switch (mode) {
        case ValidationMode::Strict: return "Strict";
        case ValidationMode::Off:
        default: return "Off";
    }
}

// Case-insensitive; anything other than "strict" is Off
inline ValidationMode parseMode(const std::string& s) {
    std::string lower;
    lower.reserve(s.size());
    for (char c : s) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (lower == "strict") return ValidationMode::Strict;
    return ValidationMode::Off;
}

} // namespace validation
} // namespace mcpserve
