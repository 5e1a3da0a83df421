//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Server-side transport interfaces: byte streams in, JSON-RPC payloads to the core, replies out
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace mcpserve {

//==========================================================================================================
// IServerTransport
// Purpose: Moves raw JSON-RPC payloads between a peer and the dispatch core.
// Notes:
//   - A transport never inspects payloads: it hands every received frame to the message handler and
//     relays the returned text unchanged. std::nullopt means "nothing to send back".
//   - Implementations serialize their writes; handlers may be invoked from a transport-owned thread.
//==========================================================================================================
class IServerTransport {
public:
    using MessageHandler = std::function<std::optional<std::string>(const std::string& payload)>;
    using ErrorHandler = std::function<void(const std::string& error)>;

    virtual ~IServerTransport() = default;

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts serving on a background thread.
    // Returns:
    //   Future that becomes ready once the transport is accepting input.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Stops serving and releases resources.
    // Returns:
    //   Future that completes when the transport has stopped.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;

    /////////////////////////////////////////// Handlers ///////////////////////////////////////////
    //==========================================================================================================
    // Registers the payload handler (typically IJsonRpcHandler::ProcessRequest).
    // Args:
    //   handler: Callback receiving one framed payload and returning the reply, if any.
    //==========================================================================================================
    virtual void SetMessageHandler(MessageHandler handler) = 0;

    //==========================================================================================================
    // Registers an error handler to receive transport errors (including end of input).
    // Args:
    //   handler: Callback with error string.
    //==========================================================================================================
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

// Concrete transports are declared in their respective headers:
//  - mcpserve/StdioTransport.hpp
//  - mcpserve/HTTPServer.hpp

//==========================================================================================================
// IServerTransportFactory
// Purpose: Factory for creating transports from configuration strings.
//==========================================================================================================
class IServerTransportFactory {
public:
    virtual ~IServerTransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance using the provided configuration.
    // Args:
    //   config: Transport-specific configuration string (e.g. "content-length" or "http://127.0.0.1:8000/mcp").
    // Returns:
    //   A unique_ptr to a newly created IServerTransport.
    //==========================================================================================================
    virtual std::unique_ptr<IServerTransport> CreateTransport(const std::string& config) = 0;
};

} // namespace mcpserve
