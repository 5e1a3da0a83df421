//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResourceHandler.cpp
// Purpose: ResourceHandler implementation
//==========================================================================================================

#include <format>

#include "logging/Logger.h"
#include "mcpserve/errors/ProtocolException.h"
#include "mcpserve/handlers/ResourceHandler.h"

namespace mcpserve {

namespace {
const char* const kCoreKeys[] = {"uri", "name", "description", "mimeType"};

bool isCoreKey(const std::string& key) {
    for (const char* k : kCoreKeys) {
        if (key == k) return true;
    }
    return false;
}

bool hasTypeKey(const JSONValue& v) {
    return v.IsObject() && json::find(std::get<JSONValue::Object>(v.value), "type") != nullptr;
}
} // namespace

ResourceHandler::ResourceHandler(std::shared_ptr<IComponentRegistry> reg, const ServerConfig& config)
    : BaseHandler("ResourceHandler", config.debug), registry(std::move(reg)), defaultPageSize(config.defaultPageSize) {
    if (!registry) {
        throw std::invalid_argument("ResourceHandler requires a registry");
    }
}

std::vector<std::string> ResourceHandler::GetSupportedMethods() const {
    return {Methods::ListResources, Methods::ReadResource};
}

JSONValue ResourceHandler::handleMethod(const std::string& method, const JSONValue::Object& params,
                                        const RequestContext& context) {
    logDebug("Handling " + method + " params=" + SerializeJSON(JSONValue{sanitizeForLogging(params)}));
    if (method == Methods::ListResources) {
        return handleResourcesList(params, context);
    }
    return handleResourcesRead(params, context);
}

std::string ResourceHandler::ResolveUri(const ComponentEntry& entry) const {
    try {
        std::string uri = entry.AsResource()->Uri();
        if (!uri.empty()) {
            return uri;
        }
    } catch (const std::exception& e) {
        logWarning(std::format("Failed to get URI for resource {}: {}", entry.name, e.what()));
    } catch (...) {
        logWarning("Failed to get URI for resource " + entry.name + ": non-standard exception");
    }
    return "resource://" + entry.name;
}

JSONValue ResourceHandler::ResourceDefinition(const ComponentEntry& entry) const {
    auto resource = entry.AsResource();
    JSONValue::Object def;
    def["name"] = json::make(entry.name);
    bool failed = false;
    try {
        std::string uri = resource->Uri();
        def["uri"] = json::make(uri.empty() ? "resource://" + entry.name : uri);
        def["description"] = json::make(resource->Description());
        def["mimeType"] = json::make(resource->MimeType());
        for (const auto& [key, value] : resource->Metadata()) {
            if (isCoreKey(key)) {
                logDebug(std::format("Ignoring metadata key '{}' of resource {}", key, entry.name));
                continue;
            }
            def[key] = value ? value : json::make(JSONValue());
        }
    } catch (const std::exception& e) {
        logWarning(std::format("Failed to get definition for resource {}: {}", entry.name, e.what()));
        failed = true;
    } catch (...) {
        logWarning("Failed to get definition for resource " + entry.name + ": non-standard exception");
        failed = true;
    }
    if (failed) {
        std::string typeName = "Resource";
        try {
            typeName = resource->TypeName();
        } catch (const std::exception& inner) {
            logWarning(std::format("Failed to resolve type of resource {}: {}", entry.name, inner.what()));
        } catch (...) {
            logWarning("Failed to resolve type of resource " + entry.name + ": non-standard exception");
        }
        def.clear();
        def["uri"] = json::make("resource://" + entry.name);
        def["name"] = json::make(entry.name);
        def["description"] = json::make("Resource: " + typeName);
        def["mimeType"] = json::make("text/plain");
    }
    return JSONValue{def};
}

JSONValue ResourceHandler::handleResourcesList(const JSONValue::Object& params, const RequestContext& context) {
    const Cursor cursor = resolveCursor(params, defaultPageSize);
    const auto entries = registry->All(ComponentType::Resource);
    const PageSlice page = Paginate(entries.size(), cursor);

    std::vector<JSONValue> resources;
    resources.reserve(page.end - page.begin);
    for (std::size_t i = page.begin; i < page.end; ++i) {
        resources.push_back(ResourceDefinition(entries[i]));
    }
    logInfo(std::format("Resources list generated: {} of {} (offset {})", resources.size(), entries.size(),
                        cursor.offset));
    return createSuccessResponse(buildPage("resources", std::move(resources), page.nextCursor), context);
}

JSONValue ResourceHandler::formatResourceContent(const JSONValue& item) const {
    if (hasTypeKey(item)) {
        return item;
    }
    JSONValue::Object block;
    block["type"] = json::make("text");
    if (item.IsString()) {
        block["text"] = json::make(std::get<std::string>(item.value));
        return JSONValue{block};
    }
    if (item.IsObject()) {
        const auto& obj = std::get<JSONValue::Object>(item.value);
        const bool partial = json::find(obj, "text") || json::find(obj, "uri") || json::find(obj, "mimeType");
        if (partial) {
            // Content item missing only its type
            for (const char* key : {"text", "uri", "mimeType"}) {
                if (const JSONValue* v = json::find(obj, key)) {
                    block[key] = json::make(*v);
                }
            }
            return JSONValue{block};
        }
    }
    block["text"] = json::make(item.IsScalar() ? SerializeJSON(item) : SerializePrettyJSON(item, 4));
    return JSONValue{block};
}

JSONValue::Array ResourceHandler::FormatContents(const JSONValue& content) const {
    const JSONValue* items = &content;
    if (content.IsObject()) {
        const JSONValue* inner = json::find(std::get<JSONValue::Object>(content.value), "contents");
        if (inner != nullptr && inner->IsArray()) {
            items = inner;
        }
    }
    JSONValue::Array out;
    if (items->IsArray()) {
        for (const auto& p : std::get<JSONValue::Array>(items->value)) {
            out.push_back(json::make(formatResourceContent(p ? *p : JSONValue())));
        }
    } else {
        out.push_back(json::make(formatResourceContent(*items)));
    }
    return out;
}

JSONValue ResourceHandler::handleResourcesRead(const JSONValue::Object& params, const RequestContext& context) {
    validateRequiredParams(params, {"uri"});
    validateRequest(params, {{"uri", "required|string"}});
    const std::string uri = json::getString(params, "uri").value();

    std::optional<ComponentEntry> match;
    for (const auto& entry : registry->All(ComponentType::Resource)) {
        if (ResolveUri(entry) == uri) {
            match = entry;
            break;
        }
    }
    if (!match.has_value()) {
        logWarning("Resource not found for URI: " + uri);
        throw errors::ProtocolException(JSONRPCErrorCodes::MethodNotFound, "Resource not found: " + uri,
                                        std::nullopt, Methods::ReadResource);
    }

    JSONValue::Object readParams = params;
    readParams.erase("uri");

    logInfo("Reading resource: " + uri);
    JSONValue content;
    try {
        content = match->AsResource()->Read(readParams);
    } catch (const ComponentNotInvocable& e) {
        logError(std::format("Resource {} cannot be read: {}", uri, e.what()));
        return createErrorResponse("Resource is not readable", JSONRPCErrorCodes::InternalError);
    } catch (const std::exception& e) {
        logError(std::format("Resource read failed: {}: {}", uri, e.what()));
        return createErrorResponse(std::string("Failed to read resource: ") + e.what(), JSONRPCErrorCodes::InternalError);
    } catch (...) {
        logError("Resource read failed: " + uri + ": non-standard exception");
        return createErrorResponse("Failed to read resource: unknown error", JSONRPCErrorCodes::InternalError);
    }

    JSONValue::Array contents = FormatContents(content);
    logInfo(std::format("Resource read successfully: {} ({} content items)", uri, contents.size()));
    JSONValue::Object response;
    response["contents"] = json::make(JSONValue{std::move(contents)});
    return createSuccessResponse(JSONValue{response}, context);
}

} // namespace mcpserve
