//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CapabilityNegotiator.h
// Purpose: Intersection of server-enabled and client-declared MCP capabilities
//==========================================================================================================

#pragma once

#include <string>

#include "mcpserve/JSONRPCTypes.h"
#include "mcpserve/ServerConfig.h"

namespace mcpserve {

//==========================================================================================================
// CapabilityNegotiator
// Purpose: Computes the capabilities object returned by initialize.
// Notes:
//   Capabilities: tools, resources, prompts, logging, completion. A capability is present only when the
//   server enables it and the client declares it (any value other than false/null). Every capability is
//   {} since the server sends no list_changed notifications and has no resource subscriptions.
//==========================================================================================================
class CapabilityNegotiator {
public:
    //==========================================================================================================
    // Negotiate
    // Args:
    //   clientCapabilities: "capabilities" object from initialize params (non-objects count as empty).
    //   config: Server configuration carrying the capability toggles.
    // Returns:
    //   Negotiated capabilities object.
    //==========================================================================================================
    JSONValue::Object Negotiate(const JSONValue& clientCapabilities, const ServerConfig& config) const;

    // Server-side capabilities (every enabled capability as {})
    JSONValue::Object DefaultServerCapabilities(const ServerConfig& config) const;

    static bool HasCapability(const JSONValue::Object& capabilities, const std::string& capability);
};

} // namespace mcpserve
