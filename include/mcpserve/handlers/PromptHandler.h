//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PromptHandler.h
// Purpose: prompts/list and prompts/get
//==========================================================================================================

#pragma once

#include <memory>

#include "mcpserve/Registry.h"
#include "mcpserve/ServerConfig.h"
#include "mcpserve/handlers/BaseHandler.h"

namespace mcpserve {

class PromptHandler : public BaseHandler {
public:
    PromptHandler(std::shared_ptr<IComponentRegistry> registry, const ServerConfig& config = ServerConfig());

    std::vector<std::string> GetSupportedMethods() const override;

    // {name, description, arguments} with "Prompt: <TypeName>" / [] fallbacks
    JSONValue PromptDefinition(const ComponentEntry& entry) const;

    //==========================================================================================================
    // FormatPromptMessages
    // Purpose: Normalizes a Process result into a message list.
    //   - an array whose elements are all objects with "role" or "content": returned as-is
    //   - a single such object: wrapped in a one-element list
    //   - anything else: [{role:"user", content:[{type:"text", text}]}] where text is the string itself,
    //     pretty JSON for arrays/objects, or compact JSON for other scalars
    //==========================================================================================================
    JSONValue::Array FormatPromptMessages(const JSONValue& result) const;

protected:
    JSONValue handleMethod(const std::string& method, const JSONValue::Object& params,
                           const RequestContext& context) override;

private:
    JSONValue handlePromptsList(const JSONValue::Object& params, const RequestContext& context);
    JSONValue handlePromptsGet(const JSONValue::Object& params, const RequestContext& context);
    std::string describe(const ComponentEntry& entry) const;

    std::shared_ptr<IComponentRegistry> registry;
    int64_t defaultPageSize;
};

} // namespace mcpserve
