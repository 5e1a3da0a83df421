//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ParamValidator.h
// Purpose: Pipe-separated rule validation of request parameters (required|string|min:1 ...)
//==========================================================================================================

#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "mcpserve/JSONRPCTypes.h"

namespace mcpserve {
namespace validation {

// Ordered field -> rule string pairs; messages are reported in this order
using RuleSet = std::vector<std::pair<std::string, std::string>>;

// Custom messages keyed "field.rule" (most specific) or "field"
using MessageMap = std::unordered_map<std::string, std::string>;

//==========================================================================================================
// ValidateParams
// Purpose: Applies per-field rules to a params object.
// Args:
//   params: Request params.
//   rules: Field rules. Supported: required, nullable, string, integer, numeric, boolean, array (JSON array
//          or object), object, in:a,b,c, min:N, max:N. min/max compare string length in characters, the
//          element count of arrays and objects, or the value of numbers.
//   messages: Optional overrides for the default messages.
// Returns:
//   Failure messages in rule order; empty when every rule passes.
// Notes:
//   An absent field only fails "required"; a null field passes everything when "nullable" is present.
//   A failed "required" suppresses the remaining rules of that field. Unknown rule names are ignored
//   with a warning.
//==========================================================================================================
std::vector<std::string> ValidateParams(const JSONValue::Object& params, const RuleSet& rules,
                                        const MessageMap& messages = {});

} // namespace validation
} // namespace mcpserve
