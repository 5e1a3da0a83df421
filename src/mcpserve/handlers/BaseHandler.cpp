//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: BaseHandler.cpp
// Purpose: BaseHandler implementation
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <format>
#include <iomanip>
#include <sstream>

#include "logging/Logger.h"
#include "mcpserve/Components.h"
#include "mcpserve/errors/ProtocolException.h"
#include "mcpserve/handlers/BaseHandler.h"

namespace mcpserve {

namespace {

// ISO-8601 UTC with millisecond precision, e.g. 2025-01-31T12:00:00.123Z
std::string isoTimestampUtc() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm buf{};
    ::gmtime_r(&t, &buf);
    std::ostringstream oss;
    oss << std::put_time(&buf, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return oss.str();
}

std::string lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

// One line per nesting level: "#0 std::runtime_error: outer"
void appendTrace(const std::exception& e, std::vector<std::string>& lines) {
    lines.push_back(std::format("#{} {}: {}", lines.size(), DemangledTypeName(e), e.what()));
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& inner) {
        appendTrace(inner, lines);
    } catch (...) {
        lines.push_back(std::format("#{} <non-standard exception>", lines.size()));
    }
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i) out += '\n';
        out += lines[i];
    }
    return out;
}

std::string describeId(const RequestContext& context) {
    return context.requestId.has_value() ? SerializeId(context.requestId.value()) : std::string("null");
}

} // namespace

BaseHandler::BaseHandler(std::string name, bool debugEnabled)
    : handlerName(std::move(name)), debug(debugEnabled) {
    if (debugEnabled) {
        LOG_DEBUG("Initializing {}", handlerName);
    }
}

bool BaseHandler::SupportsMethod(const std::string& method) const {
    const auto methods = GetSupportedMethods();
    return std::find(methods.begin(), methods.end(), method) != methods.end();
}

JSONValue BaseHandler::Handle(const std::string& method, const JSONValue::Object& params,
                              const RequestContext& context) {
    FUNC_SCOPE();
    if (!SupportsMethod(method)) {
        throw errors::ProtocolException(JSONRPCErrorCodes::MethodNotFound, "Unsupported method: " + method,
                                        std::nullopt, method);
    }
    try {
        return handleMethod(method, params, context);
    } catch (const errors::ProtocolException&) {
        throw;
    } catch (...) {
        const JSONValue shaped = handleException(std::current_exception(), method, context);
        const auto& error = std::get<JSONValue::Object>(std::get<JSONValue::Object>(shaped.value).at("error")->value);
        const int code = static_cast<int>(std::get<int64_t>(error.at("code")->value));
        const std::string message = std::get<std::string>(error.at("message")->value);
        std::optional<JSONValue> data;
        if (const JSONValue* d = json::find(error, "data")) {
            data = *d;
        }
        throw errors::ProtocolException(code, message, std::move(data), method);
    }
}

void BaseHandler::validateRequest(const JSONValue::Object& params, const validation::RuleSet& rules,
                                  const validation::MessageMap& messages) const {
    if (rules.empty()) {
        return;
    }
    const auto failures = validation::ValidateParams(params, rules, messages);
    if (failures.empty()) {
        return;
    }
    std::string joined;
    for (std::size_t i = 0; i < failures.size(); ++i) {
        if (i) joined += ", ";
        joined += failures[i];
    }
    logError("Request validation failed: " + joined + " params=" + SerializeJSON(JSONValue{sanitizeForLogging(params)}));
    throw errors::ProtocolException(JSONRPCErrorCodes::InvalidParams, "Invalid parameters: " + joined);
}

void BaseHandler::validateRequiredParams(const JSONValue::Object& params,
                                         const std::vector<std::string>& required) const {
    std::string missing;
    for (const auto& key : required) {
        if (params.find(key) == params.end()) {
            if (!missing.empty()) missing += ", ";
            missing += key;
        }
    }
    if (!missing.empty()) {
        logError("Missing required parameters: " + missing);
        throw errors::ProtocolException(JSONRPCErrorCodes::InvalidParams, "Missing required parameters: " + missing);
    }
}

JSONValue BaseHandler::createSuccessResponse(const JSONValue& result, const RequestContext& context) const {
    // Metadata can only be merged into object results
    if (!context.addMetadata || !result.IsObject()) {
        logDebug("Success response created for request " + describeId(context));
        return result;
    }
    JSONValue::Object merged = std::get<JSONValue::Object>(result.value);
    JSONValue::Object meta;
    meta["handler"] = json::make(handlerName);
    meta["timestamp"] = json::make(isoTimestampUtc());
    if (context.requestId.has_value()) {
        meta["request_id"] = json::make(IdToJSONValue(context.requestId.value()));
    }
    merged["_meta"] = json::make(JSONValue{meta});
    logDebug("Success response created with metadata for request " + describeId(context));
    return JSONValue{merged};
}

JSONValue BaseHandler::createErrorResponse(const std::string& message, int code,
                                           const std::optional<JSONValue>& data) const {
    JSONValue::Object wrapper;
    wrapper["error"] = json::make(CreateErrorObject(code, message, data));
    logError(std::format("Error response created: code={} message={}", code, message));
    return JSONValue{wrapper};
}

JSONValue BaseHandler::handleException(std::exception_ptr error, const std::string& method,
                                       const RequestContext& context) const {
    try {
        std::rethrow_exception(error);
    } catch (const errors::ProtocolException& e) {
        logError(std::format("Protocol error in {}: {} (code {}, request {})", method, e.what(), e.Code(),
                             describeId(context)));
        return createErrorResponse(e.what(), e.Code(), e.Data());
    } catch (const std::exception& e) {
        const std::string type = DemangledTypeName(e);
        std::string file = "unknown";
        int64_t line = 0;
        if (auto located = dynamic_cast<const errors::LocatedError*>(&e)) {
            file = located->Location().file_name();
            line = static_cast<int64_t>(located->Location().line());
        }
        logError(std::format("Unexpected error in {}: {} [{} at {}:{}] (request {})", method, e.what(), type, file,
                             line, describeId(context)));
        std::optional<JSONValue> data;
        if (IsDebug()) {
            std::vector<std::string> trace;
            appendTrace(e, trace);
            JSONValue::Object d;
            d["exception_type"] = json::make(type);
            d["file"] = json::make(file);
            d["line"] = json::make(JSONValue(line));
            d["trace"] = json::make(joinLines(trace));
            data = JSONValue{d};
        }
        return createErrorResponse("Internal server error", JSONRPCErrorCodes::InternalError, data);
    } catch (...) {
        logError(std::format("Unexpected non-standard exception in {} (request {})", method, describeId(context)));
        std::optional<JSONValue> data;
        if (IsDebug()) {
            JSONValue::Object d;
            d["exception_type"] = json::make("unknown");
            d["file"] = json::make("unknown");
            d["line"] = json::make(JSONValue(static_cast<int64_t>(0)));
            d["trace"] = json::make("#0 <non-standard exception>");
            data = JSONValue{d};
        }
        return createErrorResponse("Internal server error", JSONRPCErrorCodes::InternalError, data);
    }
}

JSONValue::Object BaseHandler::sanitizeForLogging(const JSONValue::Object& params) const {
    static const std::vector<std::string> sensitiveKeys{"password", "token", "secret", "key", "auth", "credential"};
    JSONValue::Object sanitized = params;
    for (auto& [key, value] : sanitized) {
        const std::string k = lower(key);
        if (std::find(sensitiveKeys.begin(), sensitiveKeys.end(), k) != sensitiveKeys.end()) {
            value = json::make("[REDACTED]");
        }
    }
    return sanitized;
}

JSONValue BaseHandler::formatContent(const JSONValue& content, const std::string& type) const {
    JSONValue::Object block;
    if (type == "resource") {
        block["type"] = json::make("resource");
        block["resource"] = json::make(content);
        return JSONValue{block};
    }
    block["type"] = json::make("text");
    if (type == "json") {
        block["text"] = json::make(content.IsScalar() ? SerializeJSON(content) : SerializePrettyJSON(content, 4));
    } else if (content.IsString()) {
        block["text"] = json::make(std::get<std::string>(content.value));
    } else {
        block["text"] = json::make(SerializeJSON(content));
    }
    return JSONValue{block};
}

Cursor BaseHandler::resolveCursor(const JSONValue::Object& params, int64_t defaultPageSize) const {
    validateRequest(params, {{"cursor", "nullable|string"}});
    auto cursorText = json::getString(params, "cursor");
    if (!cursorText.has_value()) {
        return Cursor{0, defaultPageSize};
    }
    auto cursor = DecodeCursor(cursorText.value());
    if (!cursor.has_value()) {
        logWarning("Rejected undecodable cursor");
        throw errors::ProtocolException(JSONRPCErrorCodes::InvalidParams, "Invalid parameters: Invalid cursor");
    }
    return cursor.value();
}

JSONValue BaseHandler::buildPage(const std::string& key, std::vector<JSONValue> items,
                                 const std::optional<std::string>& nextCursor) const {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (auto& item : items) {
        arr.push_back(json::make(std::move(item)));
    }
    JSONValue::Object page;
    page[key] = json::make(JSONValue{std::move(arr)});
    if (nextCursor.has_value()) {
        page["nextCursor"] = json::make(nextCursor.value());
    }
    return JSONValue{page};
}

void BaseHandler::logInfo(const std::string& message) const {
    LOG_INFO("[{}] {}", handlerName, message);
}

void BaseHandler::logDebug(const std::string& message) const {
    if (IsDebug()) {
        LOG_DEBUG("[{}] {}", handlerName, message);
    }
}

void BaseHandler::logWarning(const std::string& message) const {
    LOG_WARN("[{}] {}", handlerName, message);
}

void BaseHandler::logError(const std::string& message) const {
    LOG_ERROR("[{}] {}", handlerName, message);
}

} // namespace mcpserve
