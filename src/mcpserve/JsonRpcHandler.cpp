//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcHandler.cpp
// Purpose: Default implementation of the JSON-RPC layer
//========================================================================================================

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "logging/Logger.h"
#include "mcpserve/JsonRpcHandler.h"
#include "mcpserve/errors/Errors.h"
#include "mcpserve/errors/ProtocolException.h"
#include "mcpserve/validation/Validators.h"

namespace mcpserve {

namespace {

// Valid JSON-RPC id types: string, integer, null
std::optional<JSONRPCId> readId(const JSONValue& v) {
    if (v.IsString()) {
        return JSONRPCId{std::get<std::string>(v.value)};
    }
    if (v.IsInteger()) {
        return JSONRPCId{std::get<int64_t>(v.value)};
    }
    if (v.IsNull()) {
        return JSONRPCId{nullptr};
    }
    return std::nullopt;
}

bool hasKey(const JSONValue::Object& o, const char* key) {
    return o.find(key) != o.end();
}

std::unique_ptr<JSONRPCResponse> invalidRequest(const JSONRPCId& id, const std::string& reason) {
    LOG_WARN("Invalid JSON-RPC request: {}", reason);
    return CreateErrorResponse(id, JSONRPCErrorCodes::InvalidRequest, "Invalid Request");
}

class JsonRpcHandler : public IJsonRpcHandler {
public:
    explicit JsonRpcHandler(std::shared_ptr<MessageProcessor> processor) : processor(std::move(processor)) {
        if (!this->processor) {
            throw std::invalid_argument("JsonRpcHandler requires a MessageProcessor");
        }
    }

    MessageKind Classify(const JSONValue& message) const override {
        if (message.IsArray()) {
            return MessageKind::Batch;
        }
        if (!message.IsObject()) {
            return MessageKind::Invalid;
        }
        const auto& obj = std::get<JSONValue::Object>(message.value);
        const bool hasMethod = hasKey(obj, "method");
        if (!hasMethod && (hasKey(obj, "result") || hasKey(obj, "error"))) {
            return MessageKind::Response;
        }
        auto version = json::getString(obj, "jsonrpc");
        auto method = json::getString(obj, "method");
        if (!version.has_value() || version.value() != "2.0" || !method.has_value() || method->empty()) {
            return MessageKind::Invalid;
        }
        if (!hasKey(obj, "id")) {
            return MessageKind::Notification;
        }
        const JSONValue* id = json::find(obj, "id");
        if (id == nullptr || !readId(*id).has_value()) {
            return MessageKind::Invalid;
        }
        return MessageKind::Request;
    }

    std::optional<std::string> ProcessRequest(const std::string& rawText) override {
        FUNC_SCOPE();
        const std::size_t maxSize = processor->GetConfig().maxMessageSize;
        if (maxSize > 0 && rawText.size() > maxSize) {
            const auto ex = errors::ProtocolException::MessageTooLarge(rawText.size(), maxSize);
            LOG_WARN("{}", ex.what());
            return errors::makeErrorResponse(JSONRPCId{nullptr}, errors::mcpErrorFromException(ex))->Serialize();
        }

        JSONValue root;
        try {
            root = ParseJSON(rawText);
        } catch (const JSONParseError& e) {
            LOG_WARN("JSON parse error at offset {}: {}", e.offset, e.what());
            return CreateErrorResponse(JSONRPCId{nullptr}, JSONRPCErrorCodes::ParseError, "Parse error")->Serialize();
        }

        if (root.IsArray()) {
            return processBatch(std::get<JSONValue::Array>(root.value));
        }
        auto response = processMessage(root);
        if (!response) {
            return std::nullopt;
        }
        return response->Serialize();
    }

private:
    std::optional<std::string> processBatch(const JSONValue::Array& batch) {
        if (batch.empty()) {
            return invalidRequest(JSONRPCId{nullptr}, "empty batch")->Serialize();
        }
        LOG_DEBUG("Processing batch of {} messages", batch.size());
        std::vector<std::string> parts;
        for (const auto& item : batch) {
            std::unique_ptr<JSONRPCResponse> response;
            if (!item || !item->IsObject()) {
                response = invalidRequest(JSONRPCId{nullptr}, "batch element is not an object");
            } else {
                response = processMessage(*item);
            }
            if (response) {
                parts.push_back(response->Serialize());
            }
        }
        if (parts.empty()) {
            return std::nullopt;
        }
        std::string out = "[";
        for (std::size_t i = 0; i < parts.size(); ++i) {
            if (i) out += ",";
            out += parts[i];
        }
        out += "]";
        return out;
    }

    // Returns null when no response is due
    std::unique_ptr<JSONRPCResponse> processMessage(const JSONValue& message) {
        if (!message.IsObject()) {
            return invalidRequest(JSONRPCId{nullptr}, "message is not an object");
        }
        const auto& obj = std::get<JSONValue::Object>(message.value);

        // Echo the id whenever it is usable, even for envelope errors
        JSONRPCId echoId{nullptr};
        bool idValid = true;
        if (const JSONValue* idVal = json::find(obj, "id"); idVal != nullptr) {
            auto id = readId(*idVal);
            if (id.has_value()) {
                echoId = id.value();
            } else {
                idValid = false;
            }
        }

        const MessageKind kind = Classify(message);
        if (kind == MessageKind::Response) {
            LOG_DEBUG("Ignoring JSON-RPC response from peer: id={}", SerializeId(echoId));
            return nullptr;
        }
        if (kind == MessageKind::Invalid) {
            if (!idValid) {
                return invalidRequest(echoId, "id must be a string, integer or null");
            }
            return invalidRequest(echoId, "jsonrpc must be \"2.0\" and method a non-empty string");
        }

        const std::string method = json::getString(obj, "method").value();
        JSONValue::Object params;
        if (const JSONValue* p = json::find(obj, "params"); p != nullptr && !p->IsNull()) {
            if (p->IsArray()) {
                if (kind == MessageKind::Notification) {
                    LOG_WARN("Dropping notification {} with positional params", method);
                    return nullptr;
                }
                return CreateErrorResponse(echoId, JSONRPCErrorCodes::InvalidParams,
                                           "Invalid params: params must be an object");
            }
            if (!p->IsObject()) {
                if (kind == MessageKind::Notification) {
                    LOG_WARN("Dropping notification {} with non-object params", method);
                    return nullptr;
                }
                return invalidRequest(echoId, "params must be an object");
            }
            params = std::get<JSONValue::Object>(p->value);
        }

        if (kind == MessageKind::Notification) {
            try {
                processor->HandleNotification(method, params);
            } catch (const std::exception& e) {
                LOG_ERROR("Notification handler exception: {}: {}", method, e.what());
            }
            return nullptr;
        }
        return dispatch(echoId, method, params);
    }

    std::unique_ptr<JSONRPCResponse> dispatch(const JSONRPCId& id, const std::string& method,
                                              const JSONValue::Object& params) {
        LOG_DEBUG("Dispatching {} id={}", method, SerializeId(id));
        RequestContext context;
        context.requestId = id;
        try {
            JSONValue result = processor->Route(method, params, context);
            if (processor->GetConfig().validationMode == validation::ValidationMode::Strict &&
                !validation::validateResultForMethod(method, result)) {
                LOG_ERROR("Result of {} failed strict validation: {}", method, SerializeJSON(result));
                return CreateErrorResponse(id, JSONRPCErrorCodes::InternalError, "Result failed strict validation");
            }
            return std::make_unique<JSONRPCResponse>(id, std::move(result));
        } catch (const errors::ProtocolException& e) {
            LOG_DEBUG("Protocol error for {}: {} ({})", method, e.what(), e.Code());
            return errors::makeErrorResponse(id, errors::mcpErrorFromException(e));
        } catch (const std::exception& e) {
            LOG_ERROR("Request handler exception: {}: {}", method, e.what());
            const std::string message = processor->IsDebug() ? std::string("Internal error: ") + e.what()
                                                             : std::string("Internal error");
            return CreateErrorResponse(id, JSONRPCErrorCodes::InternalError, message);
        }
    }

    std::shared_ptr<MessageProcessor> processor;
};

} // namespace

std::unique_ptr<IJsonRpcHandler> MakeJsonRpcHandler(std::shared_ptr<MessageProcessor> processor) {
    return std::make_unique<JsonRpcHandler>(std::move(processor));
}

} // namespace mcpserve
