//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PromptHandler.cpp
// Purpose: PromptHandler implementation
//==========================================================================================================

#include <format>

#include "logging/Logger.h"
#include "mcpserve/errors/ProtocolException.h"
#include "mcpserve/handlers/PromptHandler.h"

namespace mcpserve {

namespace {
bool looksLikeMessage(const JSONValue& v) {
    if (!v.IsObject()) return false;
    const auto& o = std::get<JSONValue::Object>(v.value);
    return json::find(o, "role") != nullptr || json::find(o, "content") != nullptr;
}

std::string typeNameOr(const IPrompt& prompt, const std::string& fallback) {
    try {
        return prompt.TypeName();
    } catch (const std::exception&) {
        return fallback;
    } catch (...) {
        return fallback;
    }
}
} // namespace

PromptHandler::PromptHandler(std::shared_ptr<IComponentRegistry> reg, const ServerConfig& config)
    : BaseHandler("PromptHandler", config.debug), registry(std::move(reg)), defaultPageSize(config.defaultPageSize) {
    if (!registry) {
        throw std::invalid_argument("PromptHandler requires a registry");
    }
}

std::vector<std::string> PromptHandler::GetSupportedMethods() const {
    return {Methods::ListPrompts, Methods::GetPrompt};
}

JSONValue PromptHandler::handleMethod(const std::string& method, const JSONValue::Object& params,
                                      const RequestContext& context) {
    logDebug("Handling " + method + " params=" + SerializeJSON(JSONValue{sanitizeForLogging(params)}));
    if (method == Methods::ListPrompts) {
        return handlePromptsList(params, context);
    }
    return handlePromptsGet(params, context);
}

std::string PromptHandler::describe(const ComponentEntry& entry) const {
    auto prompt = entry.AsPrompt();
    try {
        return prompt->Description();
    } catch (const std::exception& e) {
        logWarning(std::format("Failed to get description for prompt {}: {}", entry.name, e.what()));
        return "Prompt: " + typeNameOr(*prompt, "Prompt");
    } catch (...) {
        logWarning("Failed to get description for prompt " + entry.name + ": non-standard exception");
        return "Prompt: " + typeNameOr(*prompt, "Prompt");
    }
}

JSONValue PromptHandler::PromptDefinition(const ComponentEntry& entry) const {
    JSONValue arguments{JSONValue::Array{}};
    try {
        arguments = entry.AsPrompt()->Arguments();
    } catch (const std::exception& e) {
        logWarning(std::format("Failed to get arguments for prompt {}: {}", entry.name, e.what()));
    } catch (...) {
        logWarning("Failed to get arguments for prompt " + entry.name + ": non-standard exception");
    }
    JSONValue::Object def;
    def["name"] = json::make(entry.name);
    def["description"] = json::make(describe(entry));
    def["arguments"] = json::make(std::move(arguments));
    return JSONValue{def};
}

JSONValue PromptHandler::handlePromptsList(const JSONValue::Object& params, const RequestContext& context) {
    const Cursor cursor = resolveCursor(params, defaultPageSize);
    const auto entries = registry->All(ComponentType::Prompt);
    const PageSlice page = Paginate(entries.size(), cursor);

    std::vector<JSONValue> prompts;
    prompts.reserve(page.end - page.begin);
    for (std::size_t i = page.begin; i < page.end; ++i) {
        prompts.push_back(PromptDefinition(entries[i]));
    }
    logInfo(std::format("Prompts list generated: {} of {} (offset {})", prompts.size(), entries.size(), cursor.offset));
    return createSuccessResponse(buildPage("prompts", std::move(prompts), page.nextCursor), context);
}

JSONValue::Array PromptHandler::FormatPromptMessages(const JSONValue& result) const {
    if (result.IsArray()) {
        const auto& arr = std::get<JSONValue::Array>(result.value);
        bool allMessages = true;
        for (const auto& p : arr) {
            if (!p || !looksLikeMessage(*p)) {
                allMessages = false;
                break;
            }
        }
        if (allMessages) {
            return arr;
        }
    } else if (looksLikeMessage(result)) {
        return JSONValue::Array{json::make(result)};
    }

    std::string text;
    if (result.IsString()) {
        text = std::get<std::string>(result.value);
    } else if (result.IsScalar()) {
        text = SerializeJSON(result);
    } else {
        text = SerializePrettyJSON(result, 4);
    }
    JSONValue::Object block;
    block["type"] = json::make("text");
    block["text"] = json::make(text);
    JSONValue::Object message;
    message["role"] = json::make("user");
    message["content"] = json::make(JSONValue{JSONValue::Array{json::make(JSONValue{block})}});
    return JSONValue::Array{json::make(JSONValue{message})};
}

JSONValue PromptHandler::handlePromptsGet(const JSONValue::Object& params, const RequestContext& context) {
    validateRequiredParams(params, {"name"});
    validateRequest(params, {{"name", "required|string"}, {"arguments", "nullable|array"}});

    const std::string promptName = json::getString(params, "name").value();
    JSONValue arguments{JSONValue::Object{}};
    if (const JSONValue* a = json::find(params, "arguments"); a != nullptr && !a->IsNull()) {
        arguments = *a;
    }

    auto entry = registry->Get(ComponentType::Prompt, promptName);
    if (!entry.has_value()) {
        logWarning("Prompt not found: " + promptName);
        throw errors::ProtocolException(JSONRPCErrorCodes::MethodNotFound, "Prompt not found: " + promptName,
                                        std::nullopt, Methods::GetPrompt);
    }
    auto prompt = entry->AsPrompt();

    JSONValue result;
    try {
        if (!prompt->ValidateArguments(arguments)) {
            logError("Invalid arguments for prompt: " + promptName + " arguments=" +
                     SerializeJSON(JSONValue{sanitizeForLogging(json::asObject(arguments))}));
            throw errors::ProtocolException(JSONRPCErrorCodes::InvalidParams,
                                            "Invalid arguments for prompt: " + promptName, std::nullopt,
                                            Methods::GetPrompt);
        }
        logInfo("Processing prompt: " + promptName);
        result = prompt->Process(arguments);
    } catch (const errors::ProtocolException&) {
        throw;
    } catch (const ComponentNotInvocable& e) {
        logError(std::format("Prompt {} cannot be processed: {}", promptName, e.what()));
        return createErrorResponse("Prompt is not processable", JSONRPCErrorCodes::InternalError);
    } catch (const std::exception& e) {
        logError(std::format("Prompt processing failed: {}: {}", promptName, e.what()));
        return createErrorResponse(std::string("Failed to process prompt: ") + e.what(),
                                   JSONRPCErrorCodes::InternalError);
    } catch (...) {
        logError("Prompt processing failed: " + promptName + ": non-standard exception");
        return createErrorResponse("Failed to process prompt: unknown error", JSONRPCErrorCodes::InternalError);
    }

    JSONValue::Object response;
    response["description"] = json::make(describe(*entry));
    response["messages"] = json::make(JSONValue{FormatPromptMessages(result)});
    logInfo("Prompt processed successfully: " + promptName);
    return createSuccessResponse(JSONValue{response}, context);
}

} // namespace mcpserve
