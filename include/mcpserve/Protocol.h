//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol constants, component kinds, capability descriptors and method names
//==========================================================================================================

#pragma once

#include "mcpserve/JSONRPCTypes.h"
#include <optional>
#include <string>
#include <vector>

namespace mcpserve {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP Protocol version advertised by initialize
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Versions accepted from clients when lifecycle checks are strict
inline const std::vector<std::string>& SupportedProtocolVersions() {
    static const std::vector<std::string> versions{"2024-11-05", "2025-03-26", "2025-06-18"};
    return versions;
}

// Page size used when a list request carries no cursor
constexpr int64_t DEFAULT_PAGE_SIZE = 50;

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information (serverInfo / clientInfo)
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Component kinds ///////////////////////////////////////////
enum class ComponentType {
    Tool,
    Resource,
    Prompt
};

inline const char* toString(ComponentType type) {
    switch (type) {
        case ComponentType::Tool: return "tool";
        case ComponentType::Resource: return "resource";
        case ComponentType::Prompt: return "prompt";
    }
    return "unknown";
}

inline std::optional<ComponentType> componentTypeFromString(const std::string& s) {
    if (s == "tool") return ComponentType::Tool;
    if (s == "resource") return ComponentType::Resource;
    if (s == "prompt") return ComponentType::Prompt;
    return std::nullopt;
}

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
// Server-side capability toggles; a disabled capability is never advertised
struct ToolsCapability {
    bool enabled = true;
};

struct ResourcesCapability {
    bool enabled = true;
};

struct PromptsCapability {
    bool enabled = true;
};

struct LoggingCapability {
    bool enabled = true;
};

struct CompletionCapability {
    bool enabled = false;
};

struct ServerCapabilities {
    ToolsCapability tools;
    ResourcesCapability resources;
    PromptsCapability prompts;
    LoggingCapability logging;
    CompletionCapability completion;
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct ResourceTemplate {
    std::string uriTemplate;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;

    ResourceTemplate() = default;
    ResourceTemplate(std::string uriTemplate, std::string name,
                     std::optional<std::string> description = std::nullopt,
                     std::optional<std::string> mimeType = std::nullopt)
        : uriTemplate(std::move(uriTemplate)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}
};

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* ListResourceTemplates = "resources/templates/list";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";
    constexpr const char* Complete = "completion/complete";
    constexpr const char* SetLogLevel = "logging/setLevel";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Cancelled = "notifications/cancelled";
}

} // namespace mcpserve
