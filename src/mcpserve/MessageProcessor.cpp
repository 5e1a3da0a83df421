//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageProcessor.cpp
// Purpose: MessageProcessor implementation
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>

#include "logging/Logger.h"
#include "mcpserve/CapabilityNegotiator.h"
#include "mcpserve/Cursor.h"
#include "mcpserve/MessageProcessor.h"
#include "mcpserve/errors/ProtocolException.h"
#include "mcpserve/validation/ParamValidator.h"

namespace mcpserve {

namespace {

// Where a method is served; Unknown covers disabled capabilities too
enum class Target {
    Initialize,
    Ping,
    Tools,
    Resources,
    ResourceTemplates,
    Prompts,
    Completion,
    SetLevel,
    Unknown
};

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::shared_ptr<IComponentRegistry> requireRegistry(std::shared_ptr<IComponentRegistry> registry) {
    if (!registry) {
        throw std::invalid_argument("MessageProcessor requires a registry");
    }
    return registry;
}

JSONValue::Object defaultClientParams() {
    JSONValue::Object caps;
    caps["tools"] = json::make(JSONValue{JSONValue::Object{}});
    caps["resources"] = json::make(JSONValue{JSONValue::Object{}});
    caps["prompts"] = json::make(JSONValue{JSONValue::Object{}});
    JSONValue::Object clientInfo;
    clientInfo["name"] = json::make("HTTP Client");
    clientInfo["version"] = json::make("1.0.0");
    JSONValue::Object params;
    params["protocolVersion"] = json::make(PROTOCOL_VERSION);
    params["capabilities"] = json::make(JSONValue{caps});
    params["clientInfo"] = json::make(JSONValue{clientInfo});
    return params;
}

JSONValue templateToJson(const ResourceTemplate& t) {
    JSONValue::Object o;
    o["uriTemplate"] = json::make(t.uriTemplate);
    o["name"] = json::make(t.name);
    if (t.description.has_value()) {
        o["description"] = json::make(t.description.value());
    }
    if (t.mimeType.has_value()) {
        o["mimeType"] = json::make(t.mimeType.value());
    }
    return JSONValue{o};
}

std::string joinFailures(const std::vector<std::string>& failures) {
    std::string joined;
    for (const auto& f : failures) {
        if (!joined.empty()) joined += ", ";
        joined += f;
    }
    return joined;
}

} // namespace

class MessageProcessor::Impl {
public:
    std::shared_ptr<IComponentRegistry> registry;
    ServerConfig config;
    ToolHandler tools;
    ResourceHandler resources;
    PromptHandler prompts;
    CapabilityNegotiator negotiator;
    std::atomic<bool> debug;

    mutable std::mutex stateMutex;
    bool initializeHandled{false};
    bool initialized{false};
    JSONValue::Object clientCapabilities;
    std::optional<Implementation> clientInfo;
    JSONValue::Object negotiatedCapabilities;
    Implementation serverInfo;

    Impl(std::shared_ptr<IComponentRegistry> reg, ServerConfig cfg)
        : registry(requireRegistry(std::move(reg))), config(std::move(cfg)), tools(registry, config),
          resources(registry, config), prompts(registry, config), debug(config.debug),
          serverInfo(config.serverInfo) {}

    Target classify(const std::string& method) const {
        if (method == Methods::Initialize) return Target::Initialize;
        if (method == Methods::Ping) return Target::Ping;
        if (method == Methods::ListResourceTemplates) return Target::ResourceTemplates;
        if (startsWith(method, "tools/")) {
            return tools.SupportsMethod(method) ? Target::Tools : Target::Unknown;
        }
        if (startsWith(method, "resources/")) {
            return resources.SupportsMethod(method) ? Target::Resources : Target::Unknown;
        }
        if (startsWith(method, "prompts/")) {
            return prompts.SupportsMethod(method) ? Target::Prompts : Target::Unknown;
        }
        if (method == Methods::Complete && config.capabilities.completion.enabled) return Target::Completion;
        if (method == Methods::SetLogLevel && config.capabilities.logging.enabled) return Target::SetLevel;
        return Target::Unknown;
    }

    // Stores client data and negotiates; caller holds stateMutex
    void applyInitialize(const JSONValue::Object& params) {
        JSONValue caps{JSONValue::Object{}};
        if (const JSONValue* c = json::find(params, "capabilities"); c != nullptr) {
            caps = *c;
        }
        clientCapabilities = json::asObject(caps);

        clientInfo.reset();
        if (const JSONValue* ci = json::find(params, "clientInfo"); ci != nullptr && ci->IsObject()) {
            const auto& info = std::get<JSONValue::Object>(ci->value);
            clientInfo = Implementation(json::getString(info, "name").value_or("unknown"),
                                        json::getString(info, "version").value_or(""));
        }

        negotiatedCapabilities = negotiator.Negotiate(caps, config);
        initializeHandled = true;
        LOG_INFO("MCP initialization: client={} protocolVersion={} capabilities={}",
                 clientInfo ? clientInfo->name : std::string("unknown"),
                 json::getString(params, "protocolVersion").value_or("unknown"),
                 SerializeJSON(JSONValue{negotiatedCapabilities}));
    }

    JSONValue handleInitialize(const JSONValue::Object& params) {
        const auto requested = json::getString(params, "protocolVersion");
        const auto& supported = SupportedProtocolVersions();
        const bool versionKnown = !requested.has_value() ||
                                  std::find(supported.begin(), supported.end(), requested.value()) != supported.end();

        std::lock_guard<std::mutex> lock(stateMutex);
        if (config.strictLifecycle) {
            if (initializeHandled) {
                LOG_WARN("Rejected repeated initialize request");
                throw errors::ProtocolException::AlreadyInitialized();
            }
            if (!versionKnown) {
                LOG_WARN("Rejected unsupported protocol version: {}", requested.value());
                throw errors::ProtocolException::UnsupportedVersion(requested.value());
            }
        } else if (!versionKnown) {
            LOG_WARN("Client requested unknown protocol version {}; answering with {}", requested.value(),
                     config.protocolVersion);
        }

        applyInitialize(params);

        JSONValue::Object info;
        info["name"] = json::make(serverInfo.name);
        info["version"] = json::make(serverInfo.version);
        JSONValue::Object result;
        result["protocolVersion"] = json::make(config.protocolVersion);
        result["capabilities"] = json::make(JSONValue{negotiatedCapabilities});
        result["serverInfo"] = json::make(JSONValue{info});
        return JSONValue{result};
    }

    void ensureInitialized(const std::string& method) {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (initializeHandled) {
            return;
        }
        if (config.strictLifecycle) {
            LOG_WARN("Rejected {} before initialize", method);
            throw errors::ProtocolException::InitializationRequired().WithMethod(method);
        }
        applyInitialize(defaultClientParams());
        initialized = true;
        LOG_INFO("MCP server auto-initialized for {}", method);
    }

    JSONValue handleResourceTemplatesList(const JSONValue::Object& params) const {
        Cursor cursor{0, config.defaultPageSize};
        if (const JSONValue* c = json::find(params, "cursor"); c != nullptr && !c->IsNull()) {
            std::optional<Cursor> decoded;
            if (c->IsString()) {
                decoded = DecodeCursor(std::get<std::string>(c->value));
            }
            if (!decoded.has_value()) {
                throw errors::ProtocolException(JSONRPCErrorCodes::InvalidParams, "Invalid parameters: Invalid cursor",
                                                std::nullopt, Methods::ListResourceTemplates);
            }
            cursor = decoded.value();
        }

        const auto templates = registry->ResourceTemplates();
        const PageSlice page = Paginate(templates.size(), cursor);
        JSONValue::Array items;
        items.reserve(page.end - page.begin);
        for (std::size_t i = page.begin; i < page.end; ++i) {
            items.push_back(json::make(templateToJson(templates[i])));
        }
        JSONValue::Object result;
        result["resourceTemplates"] = json::make(JSONValue{items});
        if (page.nextCursor.has_value()) {
            result["nextCursor"] = json::make(page.nextCursor.value());
        }
        return JSONValue{result};
    }

    JSONValue handleComplete(const JSONValue::Object& params) const {
        LOG_DEBUG("completion/complete params={}", SerializeJSON(JSONValue{params}));
        JSONValue::Object completion;
        completion["values"] = json::make(JSONValue{JSONValue::Array{}});
        completion["total"] = json::make(JSONValue{static_cast<int64_t>(0)});
        completion["hasMore"] = json::make(JSONValue{false});
        JSONValue::Object result;
        result["completion"] = json::make(JSONValue{completion});
        return JSONValue{result};
    }

    JSONValue handleSetLevel(const JSONValue::Object& params) const {
        const auto failures = validation::ValidateParams(
            params, {{"level", "required|string|in:debug,info,notice,warning,error,critical,alert,emergency"}});
        if (!failures.empty()) {
            throw errors::ProtocolException(JSONRPCErrorCodes::InvalidParams,
                                            "Invalid parameters: " + joinFailures(failures), std::nullopt,
                                            Methods::SetLogLevel);
        }
        const std::string level = json::getString(params, "level").value();
        Logger::setLogLevelFromString(level);
        LOG_INFO("Log level set to {}", level);
        return JSONValue{JSONValue::Object{}};
    }
};

MessageProcessor::MessageProcessor(std::shared_ptr<IComponentRegistry> registry, ServerConfig config)
    : pImpl(std::make_unique<Impl>(std::move(registry), std::move(config))) {}

MessageProcessor::~MessageProcessor() = default;

JSONValue MessageProcessor::Route(const std::string& method, const JSONValue::Object& params,
                                  const RequestContext& context) {
    FUNC_SCOPE();
    const Target target = pImpl->classify(method);
    switch (target) {
        case Target::Initialize:
            return pImpl->handleInitialize(params);
        case Target::Ping:
            return JSONValue{JSONValue::Object{}};
        case Target::Unknown:
            LOG_WARN("Method not found: {}", method);
            throw errors::ProtocolException::UnsupportedMethod(method);
        default:
            break;
    }

    pImpl->ensureInitialized(method);

    switch (target) {
        case Target::Tools:
            return pImpl->tools.Handle(method, params, context);
        case Target::Resources:
            return pImpl->resources.Handle(method, params, context);
        case Target::Prompts:
            return pImpl->prompts.Handle(method, params, context);
        case Target::ResourceTemplates:
            return pImpl->handleResourceTemplatesList(params);
        case Target::Completion:
            return pImpl->handleComplete(params);
        case Target::SetLevel:
            return pImpl->handleSetLevel(params);
        default:
            break;
    }
    throw errors::ProtocolException::UnsupportedMethod(method);
}

void MessageProcessor::HandleNotification(const std::string& method, const JSONValue::Object& params) {
    FUNC_SCOPE();
    if (method == Methods::Initialized || method == "initialized") {
        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        pImpl->initialized = true;
        LOG_INFO("MCP server initialized by client");
        return;
    }
    if (method == Methods::Cancelled) {
        std::string requestId = "unknown";
        if (const JSONValue* id = json::find(params, "requestId"); id != nullptr) {
            requestId = SerializeJSON(*id);
        }
        LOG_INFO("Request cancelled by client: requestId={} reason={}", requestId,
                 json::getString(params, "reason").value_or("none"));
        return;
    }
    LOG_DEBUG("Ignoring notification: {}", method);
}

bool MessageProcessor::IsInitialized() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->initialized;
}

JSONValue::Object MessageProcessor::GetClientCapabilities() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->clientCapabilities;
}

std::optional<Implementation> MessageProcessor::GetClientInfo() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->clientInfo;
}

JSONValue::Object MessageProcessor::GetNegotiatedCapabilities() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->negotiatedCapabilities;
}

Implementation MessageProcessor::GetServerInfo() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->serverInfo;
}

void MessageProcessor::SetServerInfo(const Implementation& info) {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    if (!info.name.empty()) pImpl->serverInfo.name = info.name;
    if (!info.version.empty()) pImpl->serverInfo.version = info.version;
}

void MessageProcessor::Reset() {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    pImpl->initializeHandled = false;
    pImpl->initialized = false;
    pImpl->clientCapabilities.clear();
    pImpl->clientInfo.reset();
    pImpl->negotiatedCapabilities.clear();
    LOG_INFO("MCP session reset");
}

const ServerConfig& MessageProcessor::GetConfig() const {
    return pImpl->config;
}

void MessageProcessor::SetDebug(bool enabled) {
    pImpl->debug.store(enabled);
    pImpl->tools.SetDebug(enabled);
    pImpl->resources.SetDebug(enabled);
    pImpl->prompts.SetDebug(enabled);
}

bool MessageProcessor::IsDebug() const {
    return pImpl->debug.load();
}

ToolHandler& MessageProcessor::GetToolHandler() {
    return pImpl->tools;
}

ResourceHandler& MessageProcessor::GetResourceHandler() {
    return pImpl->resources;
}

PromptHandler& MessageProcessor::GetPromptHandler() {
    return pImpl->prompts;
}

} // namespace mcpserve
