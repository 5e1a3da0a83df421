//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LegacyComponents.h
// Purpose: Adapters that turn loosely-shaped (dynamic) handlers into ITool/IResource/IPrompt
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "mcpserve/Components.h"

namespace mcpserve {

//==========================================================================================================
// LegacyTool
// Purpose: ITool over a bag of optional hooks. Every accessor walks a fixed precedence chain:
//   description:  getDescription -> description -> descriptionProperty -> "Tool: <TypeName>"
//   inputSchema:  getInputSchema -> inputSchema -> inputSchemaProperty
//                 -> {type:"object", properties:{}, additionalProperties:true}
//   dispatch:     execute -> invoke -> ComponentNotInvocable("Tool is not executable")
//   validation:   validateArguments when set, otherwise accepted
//==========================================================================================================
class LegacyTool : public ITool {
public:
    struct Hooks {
        std::string typeName;
        std::function<std::string()> getDescription;
        std::function<std::string()> description;
        std::optional<std::string> descriptionProperty;
        std::function<JSONValue()> getInputSchema;
        std::function<JSONValue()> inputSchema;
        std::optional<JSONValue> inputSchemaProperty;
        std::function<bool(const JSONValue&)> validateArguments;
        std::function<JSONValue(const JSONValue&)> execute;
        std::function<JSONValue(const JSONValue&)> invoke;
    };

    explicit LegacyTool(Hooks hooks);

    std::string Description() const override;
    JSONValue InputSchema() const override;
    bool ValidateArguments(const JSONValue& arguments) const override;
    JSONValue Execute(const JSONValue& arguments) override;
    std::string TypeName() const override;

private:
    Hooks hooks;
};

//==========================================================================================================
// LegacyResource
// Purpose: IResource over optional hooks.
//   uri:          getUri -> uri -> uriProperty -> "" (the handler substitutes resource://<registered-name>)
//   description:  getDescription -> description -> descriptionProperty -> "Resource: <TypeName>"
//   mimeType:     getMimeType -> mimeType -> mimeTypeProperty -> "text/plain"
//   metadata:     getMetadata -> metadataProperty -> {}
//   dispatch:     read -> getContent -> invoke -> ComponentNotInvocable("Resource is not readable")
//==========================================================================================================
class LegacyResource : public IResource {
public:
    using ReadFn = std::function<JSONValue(const JSONValue::Object&)>;

    struct Hooks {
        std::string typeName;
        std::function<std::string()> getUri;
        std::function<std::string()> uri;
        std::optional<std::string> uriProperty;
        std::function<std::string()> getDescription;
        std::function<std::string()> description;
        std::optional<std::string> descriptionProperty;
        std::function<std::string()> getMimeType;
        std::function<std::string()> mimeType;
        std::optional<std::string> mimeTypeProperty;
        std::function<JSONValue::Object()> getMetadata;
        std::optional<JSONValue::Object> metadataProperty;
        ReadFn read;
        ReadFn getContent;
        ReadFn invoke;
    };

    explicit LegacyResource(Hooks hooks);

    std::string Uri() const override;
    std::string Description() const override;
    std::string MimeType() const override;
    JSONValue::Object Metadata() const override;
    JSONValue Read(const JSONValue::Object& params) override;
    std::string TypeName() const override;

private:
    Hooks hooks;
};

//==========================================================================================================
// LegacyPrompt
// Purpose: IPrompt over optional hooks.
//   description:  getDescription -> description -> descriptionProperty -> "Prompt: <TypeName>"
//   arguments:    getArguments -> arguments -> argumentsProperty -> []
//   dispatch:     process -> get -> invoke -> ComponentNotInvocable("Prompt is not processable")
//==========================================================================================================
class LegacyPrompt : public IPrompt {
public:
    struct Hooks {
        std::string typeName;
        std::function<std::string()> getDescription;
        std::function<std::string()> description;
        std::optional<std::string> descriptionProperty;
        std::function<JSONValue()> getArguments;
        std::function<JSONValue()> arguments;
        std::optional<JSONValue> argumentsProperty;
        std::function<bool(const JSONValue&)> validateArguments;
        std::function<JSONValue(const JSONValue&)> process;
        std::function<JSONValue(const JSONValue&)> get;
        std::function<JSONValue(const JSONValue&)> invoke;
    };

    explicit LegacyPrompt(Hooks hooks);

    std::string Description() const override;
    JSONValue Arguments() const override;
    bool ValidateArguments(const JSONValue& arguments) const override;
    JSONValue Process(const JSONValue& arguments) override;
    std::string TypeName() const override;

private:
    Hooks hooks;
};

// Default input schema for tools that declare none
JSONValue DefaultInputSchema();

///////////////////////////////////////// Plain-callable helpers /////////////////////////////////////////
// Wrap a bare function as a component (the callable becomes the invoke hook)
std::shared_ptr<ITool> MakeTool(std::function<JSONValue(const JSONValue&)> fn,
                                std::optional<std::string> description = std::nullopt,
                                std::optional<JSONValue> inputSchema = std::nullopt);

std::shared_ptr<IResource> MakeResource(std::string uri, LegacyResource::ReadFn fn,
                                        std::optional<std::string> description = std::nullopt,
                                        std::optional<std::string> mimeType = std::nullopt);

std::shared_ptr<IPrompt> MakePrompt(std::function<JSONValue(const JSONValue&)> fn,
                                    std::optional<std::string> description = std::nullopt,
                                    std::optional<JSONValue> arguments = std::nullopt);

} // namespace mcpserve
