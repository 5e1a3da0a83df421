//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcHandler.h
// Purpose: Interface for the outermost JSON-RPC layer (parse, envelope validation, dispatch, serialization)
//========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "mcpserve/JSONRPCTypes.h"
#include "mcpserve/MessageProcessor.h"

namespace mcpserve {

class IJsonRpcHandler {
public:
    virtual ~IJsonRpcHandler() = default;

    enum class MessageKind {
        Request,
        Notification,
        Response,
        Batch,
        Invalid
    };

    // Classify a parsed message without dispatching it. Envelope errors are reported as Invalid.
    virtual MessageKind Classify(const JSONValue& message) const = 0;

    //========================================================================================================
    // ProcessRequest
    // Purpose: Handles one raw JSON-RPC payload (single message or batch).
    // Args:
    //   rawText: Payload as received from the transport.
    // Returns:
    //   Serialized response (an array for batches), or std::nullopt when nothing must be sent back
    //   (notifications, peer responses, batches made only of notifications).
    // Notes:
    //   Never throws for bad input: parse errors, oversize payloads and envelope errors become JSON-RPC
    //   error responses.
    //========================================================================================================
    virtual std::optional<std::string> ProcessRequest(const std::string& rawText) = 0;
};

// Factory: returns the default handler bound to a dispatcher (throws std::invalid_argument when null)
std::unique_ptr<IJsonRpcHandler> MakeJsonRpcHandler(std::shared_ptr<MessageProcessor> processor);

} // namespace mcpserve
