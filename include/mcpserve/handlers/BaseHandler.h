//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BaseHandler.h
// Purpose: Shared validation, response shaping, logging and exception translation for method handlers
//==========================================================================================================

#pragma once

#include <atomic>
#include <exception>
#include <optional>
#include <string>
#include <vector>

#include "mcpserve/Cursor.h"
#include "mcpserve/JSONRPCTypes.h"
#include "mcpserve/validation/ParamValidator.h"

namespace mcpserve {

//==========================================================================================================
// RequestContext
// Purpose: Per-request data threaded from the JSON-RPC layer into the handlers.
// Fields:
//   requestId: Id of the request being served (absent for internal calls).
//   addMetadata: Attach a _meta block to success results.
//==========================================================================================================
struct RequestContext {
    std::optional<JSONRPCId> requestId;
    bool addMetadata{false};
};

//==========================================================================================================
// BaseHandler
// Purpose: Abstract base of the tool/resource/prompt handlers.
// Notes:
//   Handlers keep no per-request state. The debug flag is atomic so it can be flipped while serving.
//==========================================================================================================
class BaseHandler {
public:
    //==========================================================================================================
    // Constructs the handler.
    // Args:
    //   handlerName: Name used in log prefixes and in _meta.handler.
    //   debug: Enables debug logging and exception details in internal errors.
    //==========================================================================================================
    explicit BaseHandler(std::string handlerName, bool debug = false);
    virtual ~BaseHandler() = default;

    BaseHandler(const BaseHandler&) = delete;
    BaseHandler& operator=(const BaseHandler&) = delete;

    //==========================================================================================================
    // Handle
    // Purpose: Entry point used by the dispatcher.
    // Args:
    //   method: MCP method name.
    //   params: Request params (an empty object when the request carried none).
    //   context: Request id and metadata flag.
    // Returns:
    //   Result value placed in the JSON-RPC response.
    // Throws:
    //   errors::ProtocolException for every failure. Non-protocol exceptions are logged, shaped by
    //   handleException and rethrown as ProtocolException with the shaped code, message and data.
    //==========================================================================================================
    JSONValue Handle(const std::string& method, const JSONValue::Object& params,
                     const RequestContext& context = RequestContext{});

    virtual std::vector<std::string> GetSupportedMethods() const = 0;
    bool SupportsMethod(const std::string& method) const;

    const std::string& GetHandlerName() const { return handlerName; }
    void SetDebug(bool enabled) { debug.store(enabled); }
    bool IsDebug() const { return debug.load(); }

protected:
    // Method-specific work; only called for supported methods
    virtual JSONValue handleMethod(const std::string& method, const JSONValue::Object& params,
                                   const RequestContext& context) = 0;

    //==========================================================================================================
    // validateRequest
    // Purpose: Rule-based params validation (see validation::ValidateParams).
    // Throws:
    //   ProtocolException -32602 "Invalid parameters: <messages joined by ', '>".
    //==========================================================================================================
    void validateRequest(const JSONValue::Object& params, const validation::RuleSet& rules,
                         const validation::MessageMap& messages = {}) const;

    // Throws -32602 "Missing required parameters: a, b" listing absent keys in the given order
    void validateRequiredParams(const JSONValue::Object& params, const std::vector<std::string>& required) const;

    //==========================================================================================================
    // createSuccessResponse
    // Purpose: Returns the result, adding _meta {handler, timestamp, request_id?} when requested.
    //==========================================================================================================
    JSONValue createSuccessResponse(const JSONValue& result, const RequestContext& context) const;

    // {error:{code, message, data?}}
    JSONValue createErrorResponse(const std::string& message, int code = JSONRPCErrorCodes::InternalError,
                                  const std::optional<JSONValue>& data = std::nullopt) const;

    //==========================================================================================================
    // handleException
    // Purpose: Logs an exception and converts it to the error-shaped value.
    // Returns:
    //   ProtocolException: its code, message and data.
    //   Anything else: -32603 "Internal server error"; data {exception_type, file, line, trace} in debug mode.
    //==========================================================================================================
    JSONValue handleException(std::exception_ptr error, const std::string& method,
                              const RequestContext& context) const;

    // Copy of params with credential-like keys replaced by "[REDACTED]" (for logs only)
    JSONValue::Object sanitizeForLogging(const JSONValue::Object& params) const;

    //==========================================================================================================
    // formatContent
    // Purpose: Wraps a value as a content block.
    // Args:
    //   type: "text" (strings as-is, others compact JSON), "json" (pretty JSON for objects/arrays),
    //         "resource" ({type:"resource", resource}). Unknown types behave like "text".
    //==========================================================================================================
    JSONValue formatContent(const JSONValue& content, const std::string& type = "text") const;

    ///////////////////////////////////////////// List pagination /////////////////////////////////////////////
    // Decoded "cursor" param, or {0, defaultPageSize} when absent. Throws -32602 for a malformed cursor.
    Cursor resolveCursor(const JSONValue::Object& params, int64_t defaultPageSize) const;

    // {<key>: items, nextCursor?} where items is one already-sliced page
    JSONValue buildPage(const std::string& key, std::vector<JSONValue> items,
                        const std::optional<std::string>& nextCursor) const;

    void logInfo(const std::string& message) const;
    void logDebug(const std::string& message) const;
    void logWarning(const std::string& message) const;
    void logError(const std::string& message) const;

private:
    std::string handlerName;
    std::atomic<bool> debug;
};

} // namespace mcpserve
