//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Environment-driven server configuration
//==========================================================================================================

#include <limits>
#include <optional>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpserve/ServerConfig.h"
#include "mcpserve/version.h"

namespace mcpserve {

namespace {

// Returns the parsed value when set and within [minValue, maxValue]; logs and returns nullopt otherwise
std::optional<int64_t> readIntEnv(const char* name, int64_t minValue, int64_t maxValue) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return std::nullopt;
    }
    auto parsed = GetEnvInt(name);
    if (!parsed.has_value() || parsed.value() < minValue || parsed.value() > maxValue) {
        LOG_WARN("Ignoring {}='{}': expected an integer in [{}, {}]", name, raw, minValue, maxValue);
        return std::nullopt;
    }
    return parsed;
}

void readBoolEnv(const char* name, bool& target) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return;
    }
    auto parsed = ParseBoolString(raw);
    if (!parsed.has_value()) {
        LOG_WARN("Ignoring {}='{}': expected a boolean", name, raw);
        return;
    }
    target = parsed.value();
}

} // namespace

ServerConfig::ServerConfig() {
    serverInfo.version = getVersionString();
}

ServerConfig ServerConfig::FromEnvironment() {
    ServerConfig cfg;
    cfg.serverInfo.name = GetEnvOrDefault("MCPSERVE_SERVER_NAME", cfg.serverInfo.name);
    cfg.serverInfo.version = GetEnvOrDefault("MCPSERVE_SERVER_VERSION", cfg.serverInfo.version);
    cfg.protocolVersion = GetEnvOrDefault("MCPSERVE_PROTOCOL_VERSION", cfg.protocolVersion);

    readBoolEnv("MCPSERVE_TOOLS_ENABLED", cfg.capabilities.tools.enabled);
    readBoolEnv("MCPSERVE_RESOURCES_ENABLED", cfg.capabilities.resources.enabled);
    readBoolEnv("MCPSERVE_PROMPTS_ENABLED", cfg.capabilities.prompts.enabled);
    readBoolEnv("MCPSERVE_LOGGING_ENABLED", cfg.capabilities.logging.enabled);
    readBoolEnv("MCPSERVE_COMPLETION_ENABLED", cfg.capabilities.completion.enabled);

    readBoolEnv("MCPSERVE_DEBUG", cfg.debug);
    readBoolEnv("MCPSERVE_STRICT_LIFECYCLE", cfg.strictLifecycle);

    if (auto v = readIntEnv("MCPSERVE_PAGE_SIZE", 1, std::numeric_limits<int32_t>::max())) {
        cfg.defaultPageSize = v.value();
    }
    if (auto v = readIntEnv("MCPSERVE_MAX_MESSAGE_SIZE", 0, std::numeric_limits<int64_t>::max())) {
        cfg.maxMessageSize = static_cast<std::size_t>(v.value());
    }

    const std::string mode = GetEnvOrDefault("MCPSERVE_VALIDATION", "");
    if (!mode.empty()) {
        cfg.validationMode = validation::parseMode(mode);
    }

    cfg.http.host = GetEnvOrDefault("MCPSERVE_HTTP_HOST", cfg.http.host);
    if (auto v = readIntEnv("MCPSERVE_HTTP_PORT", 1, 65535)) {
        cfg.http.port = static_cast<unsigned short>(v.value());
    }
    cfg.http.path = GetEnvOrDefault("MCPSERVE_HTTP_PATH", cfg.http.path);

    LOG_DEBUG("ServerConfig: name={} version={} protocol={} debug={} pageSize={} maxMessageSize={} strict={} validation={}",
              cfg.serverInfo.name, cfg.serverInfo.version, cfg.protocolVersion, cfg.debug, cfg.defaultPageSize,
              cfg.maxMessageSize, cfg.strictLifecycle, validation::toString(cfg.validationMode));
    return cfg;
}

} // namespace mcpserve
