//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validators.h
// Purpose: Lightweight validators for the result shapes produced by the tool/resource/prompt handlers
//==========================================================================================================

#pragma once

#include <string>

#include "mcpserve/JSONRPCTypes.h"

namespace mcpserve {
namespace validation {

//------------------------------ Primitive helpers ------------------------------
inline const JSONValue* findMember(const JSONValue::Object& o, const char* key) {
    auto it = o.find(key);
    if (it == o.end() || !it->second) return nullptr;
    return it->second.get();
}

inline bool isStringMember(const JSONValue::Object& o, const char* key) {
    const JSONValue* v = findMember(o, key);
    return v != nullptr && v->IsString();
}

//------------------------------ Content blocks ------------------------------
// A content block is an object with a string "type"; text blocks also carry a string "text"
inline bool isContentItem(const JSONValue& v) {
    if (!v.IsObject()) return false;
    const auto& o = std::get<JSONValue::Object>(v.value);
    const JSONValue* type = findMember(o, "type");
    if (type == nullptr || !type->IsString()) return false;
    if (std::get<std::string>(type->value) == "text") {
        return isStringMember(o, "text");
    }
    return true;
}

inline bool isContentArray(const JSONValue& v) {
    if (!v.IsArray()) return false;
    for (const auto& p : std::get<JSONValue::Array>(v.value)) {
        if (!p || !isContentItem(*p)) return false;
    }
    return true;
}

//------------------------------ Soft failure shape ------------------------------
// {error:{code:int, message:string}} returned in-band by resources/read and prompts/get
inline bool isSoftErrorJson(const JSONValue& v) {
    if (!v.IsObject()) return false;
    const auto& obj = std::get<JSONValue::Object>(v.value);
    const JSONValue* err = findMember(obj, "error");
    if (err == nullptr || !err->IsObject()) return false;
    const auto& e = std::get<JSONValue::Object>(err->value);
    const JSONValue* code = findMember(e, "code");
    return code != nullptr && code->IsInteger() && isStringMember(e, "message");
}

//------------------------------ Result validators ------------------------------
inline bool validateCallToolResultJson(const JSONValue& v) {
    if (!v.IsObject()) return false;
    const auto& obj = std::get<JSONValue::Object>(v.value);
    const JSONValue* content = findMember(obj, "content");
    if (content == nullptr || !isContentArray(*content)) return false;
    const JSONValue* isError = findMember(obj, "isError");
    return isError == nullptr || isError->IsBool();
}

inline bool validateReadResourceResultJson(const JSONValue& v) {
    if (isSoftErrorJson(v)) return true;
    if (!v.IsObject()) return false;
    const auto& obj = std::get<JSONValue::Object>(v.value);
    const JSONValue* contents = findMember(obj, "contents");
    return contents != nullptr && isContentArray(*contents);
}

inline bool validateGetPromptResultJson(const JSONValue& v) {
    if (isSoftErrorJson(v)) return true;
    if (!v.IsObject()) return false;
    const auto& obj = std::get<JSONValue::Object>(v.value);
    if (!isStringMember(obj, "description")) return false;
    const JSONValue* messages = findMember(obj, "messages");
    if (messages == nullptr || !messages->IsArray()) return false;
    for (const auto& p : std::get<JSONValue::Array>(messages->value)) {
        if (!p || !p->IsObject()) return false;
        const auto& m = std::get<JSONValue::Object>(p->value);
        if (findMember(m, "role") == nullptr && findMember(m, "content") == nullptr) return false;
    }
    return true;
}

//------------------------------ Dispatch by method ------------------------------
// Methods without a registered validator always pass
inline bool validateResultForMethod(const std::string& method, const JSONValue& result) {
    if (method == "tools/call") return validateCallToolResultJson(result);
    if (method == "resources/read") return validateReadResourceResultJson(result);
    if (method == "prompts/get") return validateGetPromptResultJson(result);
    return true;
}

} // namespace validation
} // namespace mcpserve
