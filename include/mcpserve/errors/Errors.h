//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures and JSON-RPC error mapping helpers for the dispatch core
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "mcpserve/JSONRPCTypes.h"
#include "mcpserve/errors/ProtocolException.h"

namespace mcpserve {
namespace errors {

// Categorization of JSON-RPC and lifecycle error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    UnsupportedProtocolVersion,
    CapabilityNegotiationFailed,
    MessageTooLarge,
    InitializationRequired,
    AlreadyInitialized,
    Unknown
};

// Typed error representation used across the dispatch core.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::UnsupportedProtocolVersion: return ErrorCategory::UnsupportedProtocolVersion;
        case JSONRPCErrorCodes::CapabilityNegotiationFailed: return ErrorCategory::CapabilityNegotiationFailed;
        case JSONRPCErrorCodes::MessageTooLarge: return ErrorCategory::MessageTooLarge;
        case JSONRPCErrorCodes::InitializationRequired: return ErrorCategory::InitializationRequired;
        case JSONRPCErrorCodes::AlreadyInitialized: return ErrorCategory::AlreadyInitialized;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    if (!errVal.IsObject()) {
        return std::nullopt;
    }
    const auto& obj = std::get<JSONValue::Object>(errVal.value);
    auto itCode = obj.find("code");
    auto itMsg = obj.find("message");
    if (itCode == obj.end() || itMsg == obj.end()) {
        return std::nullopt;
    }
    if (!itCode->second || !itMsg->second) {
        return std::nullopt;
    }
    if (!itCode->second->IsInteger() || !itMsg->second->IsString()) {
        return std::nullopt;
    }
    McpError e;
    e.code = static_cast<int>(std::get<int64_t>(itCode->second->value));
    e.message = std::get<std::string>(itMsg->second->value);
    auto itData = obj.find("data");
    if (itData != obj.end() && itData->second) {
        e.data = *(itData->second);
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Build the typed error carried by a ProtocolException.
inline McpError mcpErrorFromException(const ProtocolException& ex) {
    McpError e;
    e.code = ex.Code();
    e.message = ex.what();
    e.data = ex.Data();
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace mcpserve
