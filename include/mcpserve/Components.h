//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Components.h
// Purpose: Capability interfaces implemented by registered tools, resources and prompts
//==========================================================================================================

#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <typeinfo>

#include <boost/core/demangle.hpp>

#include "mcpserve/JSONRPCTypes.h"

namespace mcpserve {

//==========================================================================================================
// ComponentNotInvocable
// Purpose: Raised at call time by a component that has no way to execute/read/process.
//==========================================================================================================
class ComponentNotInvocable : public std::logic_error {
public:
    explicit ComponentNotInvocable(const std::string& message) : std::logic_error(message) {}
};

//==========================================================================================================
// DemangledTypeName
// Purpose: Human-readable dynamic type name of a polymorphic object (e.g. "app::CalculatorTool").
//==========================================================================================================
template <typename T>
std::string DemangledTypeName(const T& object) {
    return boost::core::demangle(typeid(object).name());
}

//==========================================================================================================
// ITool
// Purpose: Invocable unit of functionality exposed through tools/list and tools/call.
// Notes:
//   Implementations are shared across requests and must tolerate concurrent calls.
//==========================================================================================================
class ITool {
public:
    virtual ~ITool() = default;

    //==========================================================================================================
    // Description
    // Purpose: Text shown to the client in tools/list.
    //==========================================================================================================
    virtual std::string Description() const = 0;

    //==========================================================================================================
    // InputSchema
    // Purpose: JSON Schema object describing the accepted arguments.
    //==========================================================================================================
    virtual JSONValue InputSchema() const = 0;

    //==========================================================================================================
    // ValidateArguments
    // Purpose: Optional pre-flight check; returning false yields an Invalid params error.
    //==========================================================================================================
    virtual bool ValidateArguments(const JSONValue& arguments) const {
        (void)arguments;
        return true;
    }

    //==========================================================================================================
    // Execute
    // Purpose: Runs the tool. Any JSON value may be returned; strings are sent as text content and other
    //          values as compact JSON text.
    // Throws:
    //   Any exception; the caller reports it to the client as a failed tool result.
    //==========================================================================================================
    virtual JSONValue Execute(const JSONValue& arguments) = 0;

    // Name used in fallback descriptions and log lines
    virtual std::string TypeName() const { return DemangledTypeName(*this); }
};

//==========================================================================================================
// IResource
// Purpose: URI-addressable readable data exposed through resources/list and resources/read.
//==========================================================================================================
class IResource {
public:
    virtual ~IResource() = default;

    virtual std::string Uri() const = 0;
    virtual std::string Description() const = 0;
    virtual std::string MimeType() const { return "text/plain"; }

    // Extra key/value pairs flattened into the resources/list entry
    virtual JSONValue::Object Metadata() const { return {}; }

    //==========================================================================================================
    // Read
    // Purpose: Produces the resource content.
    // Args:
    //   params: resources/read params without the "uri" key (extra params flow through).
    // Returns:
    //   An array of content blocks, a plain list, an object with "contents", or any single value.
    //==========================================================================================================
    virtual JSONValue Read(const JSONValue::Object& params) = 0;

    virtual std::string TypeName() const { return DemangledTypeName(*this); }
};

//==========================================================================================================
// IPrompt
// Purpose: Parameterized template producing a conversation message sequence.
//==========================================================================================================
class IPrompt {
public:
    virtual ~IPrompt() = default;

    virtual std::string Description() const = 0;

    // Array of {name, description?, required?} argument descriptors
    virtual JSONValue Arguments() const { return JSONValue(JSONValue::Array{}); }

    virtual bool ValidateArguments(const JSONValue& arguments) const {
        (void)arguments;
        return true;
    }

    //==========================================================================================================
    // Process
    // Purpose: Renders the prompt. A list of {role, content} messages, a single message, or any other value
    //          (wrapped as one user text message) may be returned.
    //==========================================================================================================
    virtual JSONValue Process(const JSONValue& arguments) = 0;

    virtual std::string TypeName() const { return DemangledTypeName(*this); }
};

} // namespace mcpserve
