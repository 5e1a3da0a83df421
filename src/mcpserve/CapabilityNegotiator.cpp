//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: CapabilityNegotiator.cpp
// Purpose: Capability negotiation
//==========================================================================================================

#include <utility>

#include "logging/Logger.h"
#include "mcpserve/CapabilityNegotiator.h"

namespace mcpserve {

namespace {

// Declared = present and neither false nor null
const JSONValue* declared(const JSONValue::Object& client, const std::string& capability) {
    const JSONValue* v = json::find(client, capability);
    if (v == nullptr || v->IsNull()) return nullptr;
    if (v->IsBool() && !std::get<bool>(v->value)) return nullptr;
    return v;
}
} // namespace

JSONValue::Object CapabilityNegotiator::DefaultServerCapabilities(const ServerConfig& config) const {
    const auto& caps = config.capabilities;
    const std::pair<const char*, bool> toggles[] = {{"tools", caps.tools.enabled},
                                                    {"resources", caps.resources.enabled},
                                                    {"prompts", caps.prompts.enabled},
                                                    {"logging", caps.logging.enabled},
                                                    {"completion", caps.completion.enabled}};
    JSONValue::Object server;
    for (const auto& [name, enabled] : toggles) {
        // No list_changed or subscribe support, so capabilities carry no sub-features
        if (enabled) {
            server[name] = json::make(JSONValue{JSONValue::Object{}});
        }
    }
    return server;
}

JSONValue::Object CapabilityNegotiator::Negotiate(const JSONValue& clientCapabilities,
                                                  const ServerConfig& config) const {
    const JSONValue::Object client = json::asObject(clientCapabilities);
    const JSONValue::Object server = DefaultServerCapabilities(config);

    JSONValue::Object negotiated;
    for (const auto& entry : server) {
        if (declared(client, entry.first) == nullptr) {
            continue;
        }
        negotiated[entry.first] = json::make(JSONValue{JSONValue::Object{}});
    }
    LOG_DEBUG("Capability negotiation completed: client={} server={} negotiated={}", SerializeJSON(clientCapabilities),
              SerializeJSON(JSONValue{server}), SerializeJSON(JSONValue{negotiated}));
    return negotiated;
}

bool CapabilityNegotiator::HasCapability(const JSONValue::Object& capabilities, const std::string& capability) {
    return json::find(capabilities, capability) != nullptr;
}

} // namespace mcpserve
