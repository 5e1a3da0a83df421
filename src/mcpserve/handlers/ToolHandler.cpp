//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolHandler.cpp
// Purpose: ToolHandler implementation
//==========================================================================================================

#include <format>

#include "logging/Logger.h"
#include "mcpserve/LegacyComponents.h"
#include "mcpserve/errors/ProtocolException.h"
#include "mcpserve/handlers/ToolHandler.h"

namespace mcpserve {

ToolHandler::ToolHandler(std::shared_ptr<IComponentRegistry> reg, const ServerConfig& config)
    : BaseHandler("ToolHandler", config.debug), registry(std::move(reg)), defaultPageSize(config.defaultPageSize) {
    if (!registry) {
        throw std::invalid_argument("ToolHandler requires a registry");
    }
}

std::vector<std::string> ToolHandler::GetSupportedMethods() const {
    return {Methods::ListTools, Methods::CallTool};
}

JSONValue ToolHandler::handleMethod(const std::string& method, const JSONValue::Object& params,
                                    const RequestContext& context) {
    logDebug("Handling " + method + " params=" + SerializeJSON(JSONValue{sanitizeForLogging(params)}));
    if (method == Methods::ListTools) {
        return handleToolsList(params, context);
    }
    return handleToolsCall(params, context);
}

JSONValue ToolHandler::ToolDefinition(const ComponentEntry& entry) const {
    auto tool = entry.AsTool();
    std::string typeName = "Tool";
    try {
        typeName = tool->TypeName();
    } catch (const std::exception& e) {
        logWarning(std::format("Failed to resolve type of tool {}: {}", entry.name, e.what()));
    } catch (...) {
        logWarning("Failed to resolve type of tool " + entry.name + ": non-standard exception");
    }

    std::string description;
    try {
        description = tool->Description();
    } catch (const std::exception& e) {
        logWarning(std::format("Failed to get description for tool {}: {}", entry.name, e.what()));
        description = "Tool: " + typeName;
    } catch (...) {
        logWarning("Failed to get description for tool " + entry.name + ": non-standard exception");
        description = "Tool: " + typeName;
    }

    JSONValue schema;
    try {
        schema = tool->InputSchema();
    } catch (const std::exception& e) {
        logWarning(std::format("Failed to get input schema for tool {}: {}", entry.name, e.what()));
        schema = DefaultInputSchema();
    } catch (...) {
        logWarning("Failed to get input schema for tool " + entry.name + ": non-standard exception");
        schema = DefaultInputSchema();
    }

    JSONValue::Object def;
    def["name"] = json::make(entry.name);
    def["description"] = json::make(description);
    def["inputSchema"] = json::make(std::move(schema));
    return JSONValue{def};
}

JSONValue ToolHandler::handleToolsList(const JSONValue::Object& params, const RequestContext& context) {
    const Cursor cursor = resolveCursor(params, defaultPageSize);
    const auto entries = registry->All(ComponentType::Tool);
    const PageSlice page = Paginate(entries.size(), cursor);

    std::vector<JSONValue> tools;
    tools.reserve(page.end - page.begin);
    for (std::size_t i = page.begin; i < page.end; ++i) {
        tools.push_back(ToolDefinition(entries[i]));
    }
    logInfo(std::format("Tools list generated: {} of {} (offset {})", tools.size(), entries.size(), cursor.offset));
    return createSuccessResponse(buildPage("tools", std::move(tools), page.nextCursor), context);
}

JSONValue ToolHandler::handleToolsCall(const JSONValue::Object& params, const RequestContext& context) {
    validateRequiredParams(params, {"name"});
    validateRequest(params, {{"name", "required|string"}, {"arguments", "nullable|array"}});

    const std::string toolName = json::getString(params, "name").value();
    JSONValue arguments{JSONValue::Object{}};
    if (const JSONValue* a = json::find(params, "arguments"); a != nullptr && !a->IsNull()) {
        arguments = *a;
    }

    auto entry = registry->Get(ComponentType::Tool, toolName);
    if (!entry.has_value()) {
        logWarning("Tool not found: " + toolName);
        throw errors::ProtocolException(JSONRPCErrorCodes::MethodNotFound, "Tool not found: " + toolName,
                                        std::nullopt, Methods::CallTool);
    }
    auto tool = entry->AsTool();

    JSONValue::Array content;
    bool isError = false;
    try {
        if (!tool->ValidateArguments(arguments)) {
            logError("Invalid arguments for tool: " + toolName + " arguments=" +
                     SerializeJSON(JSONValue{sanitizeForLogging(json::asObject(arguments))}));
            throw errors::ProtocolException(JSONRPCErrorCodes::InvalidParams, "Invalid arguments for tool: " + toolName,
                                            std::nullopt, Methods::CallTool);
        }
        logInfo("Executing tool: " + toolName);
        JSONValue result = tool->Execute(arguments);
        content.push_back(json::make(formatContent(result, "text")));
        logInfo("Tool executed successfully: " + toolName);
    } catch (const errors::ProtocolException&) {
        throw;
    } catch (const std::exception& e) {
        logError(std::format("Tool execution failed: {}: {}", toolName, e.what()));
        content.clear();
        content.push_back(json::make(formatContent(JSONValue(std::string("Tool execution failed: ") + e.what()), "text")));
        isError = true;
    } catch (...) {
        logError("Tool execution failed: " + toolName + ": non-standard exception");
        content.clear();
        content.push_back(json::make(formatContent(JSONValue("Tool execution failed: unknown error"), "text")));
        isError = true;
    }

    JSONValue::Object response;
    response["content"] = json::make(JSONValue{std::move(content)});
    response["isError"] = json::make(JSONValue(isError));
    return createSuccessResponse(JSONValue{response}, context);
}

} // namespace mcpserve
