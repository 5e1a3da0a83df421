//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageProcessor.h
// Purpose: Method dispatcher: connection lifecycle, initialize/ping and routing to the component handlers
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "mcpserve/JSONRPCTypes.h"
#include "mcpserve/Protocol.h"
#include "mcpserve/Registry.h"
#include "mcpserve/ServerConfig.h"
#include "mcpserve/handlers/BaseHandler.h"
#include "mcpserve/handlers/PromptHandler.h"
#include "mcpserve/handlers/ResourceHandler.h"
#include "mcpserve/handlers/ToolHandler.h"

namespace mcpserve {

//==========================================================================================================
// MessageProcessor
// Purpose: Routes a JSON-RPC method to its owner and keeps the per-connection lifecycle state.
// Routing:
//   initialize, ping                     -> handled here
//   tools/*                              -> ToolHandler
//   resources/templates/list             -> handled here (registry templates, paginated)
//   resources/*                          -> ResourceHandler
//   prompts/*                            -> PromptHandler
//   completion/complete                  -> handled here when the completion capability is enabled
//   logging/setLevel                     -> handled here when the logging capability is enabled
// Lifecycle:
//   A request other than initialize/ping that arrives before initialize auto-initializes the session with
//   default client capabilities, unless ServerConfig::strictLifecycle is set (then -32023).
// Notes:
//   Lifecycle state is guarded by a mutex; handler calls run without holding it.
//==========================================================================================================
class MessageProcessor {
public:
    //==========================================================================================================
    // Constructs the dispatcher and its three handlers.
    // Args:
    //   registry: Component registry shared with the handlers (must not be null).
    //   config: Server configuration; copied.
    // Throws:
    //   std::invalid_argument when registry is null.
    //==========================================================================================================
    explicit MessageProcessor(std::shared_ptr<IComponentRegistry> registry, ServerConfig config = ServerConfig());
    ~MessageProcessor();

    MessageProcessor(const MessageProcessor&) = delete;
    MessageProcessor& operator=(const MessageProcessor&) = delete;

    //==========================================================================================================
    // Route
    // Purpose: Serves one request.
    // Args:
    //   method: JSON-RPC method.
    //   params: Request params (empty object when absent).
    //   context: Request id and metadata flag forwarded to the handler.
    // Returns:
    //   The result member of the response.
    // Throws:
    //   errors::ProtocolException for protocol failures (-32601 "Method not found: <method>" for unknown
    //   methods). Other exceptions escape only from dispatcher bugs and are mapped by JsonRpcHandler.
    //==========================================================================================================
    JSONValue Route(const std::string& method, const JSONValue::Object& params,
                    const RequestContext& context = RequestContext{});

    // Handles a client notification; never throws for unknown methods (logged at debug)
    void HandleNotification(const std::string& method, const JSONValue::Object& params);

    bool IsInitialized() const;
    JSONValue::Object GetClientCapabilities() const;
    std::optional<Implementation> GetClientInfo() const;
    JSONValue::Object GetNegotiatedCapabilities() const;

    Implementation GetServerInfo() const;
    // Replaces the fields of info that are non-empty
    void SetServerInfo(const Implementation& info);

    // Forgets the session (transport disconnect): not initialized, no client capabilities
    void Reset();

    const ServerConfig& GetConfig() const;
    void SetDebug(bool enabled);
    bool IsDebug() const;

    ToolHandler& GetToolHandler();
    ResourceHandler& GetResourceHandler();
    PromptHandler& GetPromptHandler();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpserve
