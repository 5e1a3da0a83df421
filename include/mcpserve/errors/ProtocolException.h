//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProtocolException.h
// Purpose: Exception types raised by the dispatch core (protocol errors, located errors, registration)
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>

#include "mcpserve/JSONRPCTypes.h"

namespace mcpserve {
namespace errors {

//==========================================================================================================
// ProtocolException
// Purpose: Protocol-level failure that maps one-to-one onto a JSON-RPC error object.
// Fields:
//   code: JSON-RPC error code (see JSONRPCErrorCodes).
//   method: Offending JSON-RPC method, empty when not known at the throw site.
//   data: Optional structured payload copied into error.data.
// Notes:
//   Thrown from validation, routing and handler code; caught uniformly by JsonRpcHandler.
//==========================================================================================================
class ProtocolException : public std::runtime_error {
public:
    ProtocolException(int code, const std::string& message,
                      std::optional<JSONValue> data = std::nullopt,
                      std::string method = std::string())
        : std::runtime_error(message), code_(code), method_(std::move(method)), data_(std::move(data)) {}

    int Code() const noexcept { return code_; }
    const std::string& Method() const noexcept { return method_; }
    const std::optional<JSONValue>& Data() const noexcept { return data_; }

    // Returns a copy bound to the given method (used when the throw site did not know it)
    ProtocolException WithMethod(const std::string& method) const {
        return ProtocolException(code_, what(), data_, method);
    }

    ///////////////////////////////////////// Named constructors /////////////////////////////////////////
    static ProtocolException UnsupportedVersion(const std::string& version) {
        return ProtocolException(JSONRPCErrorCodes::UnsupportedProtocolVersion,
                                 "Unsupported protocol version: " + version, std::nullopt, "initialize");
    }

    static ProtocolException CapabilityNegotiationFailed(const std::string& reason) {
        return ProtocolException(JSONRPCErrorCodes::CapabilityNegotiationFailed,
                                 "Capability negotiation failed: " + reason, std::nullopt, "initialize");
    }

    static ProtocolException InvalidJsonRpc(const std::string& reason) {
        return ProtocolException(JSONRPCErrorCodes::InvalidRequest, "Invalid JSON-RPC message: " + reason);
    }

    static ProtocolException MessageTooLarge(std::size_t size, std::size_t maxSize) {
        return ProtocolException(JSONRPCErrorCodes::MessageTooLarge,
                                 "Message too large: " + std::to_string(size) + " bytes (max: " +
                                 std::to_string(maxSize) + ")");
    }

    static ProtocolException UnsupportedMethod(const std::string& method) {
        return ProtocolException(JSONRPCErrorCodes::MethodNotFound, "Method not found: " + method,
                                 std::nullopt, method);
    }

    static ProtocolException InitializationRequired() {
        return ProtocolException(JSONRPCErrorCodes::InitializationRequired,
                                 "Server must be initialized before processing requests");
    }

    static ProtocolException AlreadyInitialized() {
        return ProtocolException(JSONRPCErrorCodes::AlreadyInitialized, "Server is already initialized",
                                 std::nullopt, "initialize");
    }

private:
    int code_;
    std::string method_;
    std::optional<JSONValue> data_;
};

//==========================================================================================================
// LocatedError
// Purpose: Runtime error that records where it was raised. Components may throw it so that debug-mode
//          error data can report file and line for unexpected failures.
//==========================================================================================================
class LocatedError : public std::runtime_error {
public:
    explicit LocatedError(const std::string& message,
                          std::source_location where = std::source_location::current())
        : std::runtime_error(message), location_(where) {}

    const std::source_location& Location() const noexcept { return location_; }

private:
    std::source_location location_;
};

//==========================================================================================================
// RegistrationError
// Purpose: Raised by the component registry when a registration request is rejected.
//==========================================================================================================
class RegistrationError : public std::invalid_argument {
public:
    enum class Code {
        EmptyName,
        NullHandler,
        DuplicateName
    };

    RegistrationError(Code code, const std::string& message)
        : std::invalid_argument(message), code_(code) {}

    Code GetCode() const noexcept { return code_; }

private:
    Code code_;
};

} // namespace errors
} // namespace mcpserve
