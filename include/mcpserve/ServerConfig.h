//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Server configuration passed to the dispatcher and handlers at construction
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "mcpserve/Protocol.h"
#include "mcpserve/validation/Validation.h"

namespace mcpserve {

//==========================================================================================================
// HttpEndpointConfig
// Purpose: Default listen address for the HTTP transport.
//==========================================================================================================
struct HttpEndpointConfig {
    std::string host{"127.0.0.1"};
    unsigned short port{8000};
    std::string path{"/mcp"};
};

//==========================================================================================================
// ServerConfig
// Purpose: Everything the dispatch core needs to know about the deployment.
// Fields:
//   serverInfo: Name/version reported by initialize.
//   protocolVersion: Version reported by initialize.
//   capabilities: Server-side capability toggles and sub-feature flags.
//   debug: Adds exception details to internal errors and enables handler debug logging.
//   defaultPageSize: Page size of list calls without a cursor.
//   maxMessageSize: Upper bound on raw request size in bytes; 0 disables the check.
//   strictLifecycle: Reject requests before initialize and repeated initialize calls.
//   validationMode: Strict checks handler result shapes before they are serialized.
//   http: Default HTTP listen address.
//==========================================================================================================
struct ServerConfig {
    Implementation serverInfo{"MCP Server", ""};
    std::string protocolVersion{PROTOCOL_VERSION};
    ServerCapabilities capabilities;
    bool debug{false};
    int64_t defaultPageSize{DEFAULT_PAGE_SIZE};
    std::size_t maxMessageSize{10u * 1024u * 1024u};
    bool strictLifecycle{false};
    validation::ValidationMode validationMode{validation::ValidationMode::Off};
    HttpEndpointConfig http;

    ServerConfig();

    //==========================================================================================================
    // FromEnvironment
    // Purpose: Builds a config from the defaults overridden by MCPSERVE_* environment variables.
    // Notes:
    //   Malformed numeric values keep the default and log a warning.
    //==========================================================================================================
    static ServerConfig FromEnvironment();
};

} // namespace mcpserve
