//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LegacyComponents.cpp
// Purpose: Precedence-chain adapters for dynamic tools, resources and prompts
//==========================================================================================================

#include "mcpserve/LegacyComponents.h"

namespace mcpserve {

JSONValue DefaultInputSchema() {
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>(std::string("object"));
    schema["properties"] = std::make_shared<JSONValue>(JSONValue::Object{});
    schema["additionalProperties"] = std::make_shared<JSONValue>(true);
    return JSONValue{schema};
}

////////////////////////////////////////////////// LegacyTool //////////////////////////////////////////////////
LegacyTool::LegacyTool(Hooks h) : hooks(std::move(h)) {}

std::string LegacyTool::TypeName() const {
    return hooks.typeName.empty() ? DemangledTypeName(*this) : hooks.typeName;
}

std::string LegacyTool::Description() const {
    if (hooks.getDescription) return hooks.getDescription();
    if (hooks.description) return hooks.description();
    if (hooks.descriptionProperty.has_value()) return hooks.descriptionProperty.value();
    return "Tool: " + TypeName();
}

JSONValue LegacyTool::InputSchema() const {
    if (hooks.getInputSchema) return hooks.getInputSchema();
    if (hooks.inputSchema) return hooks.inputSchema();
    if (hooks.inputSchemaProperty.has_value()) return hooks.inputSchemaProperty.value();
    return DefaultInputSchema();
}

bool LegacyTool::ValidateArguments(const JSONValue& arguments) const {
    return hooks.validateArguments ? hooks.validateArguments(arguments) : true;
}

JSONValue LegacyTool::Execute(const JSONValue& arguments) {
    if (hooks.execute) return hooks.execute(arguments);
    if (hooks.invoke) return hooks.invoke(arguments);
    throw ComponentNotInvocable("Tool is not executable");
}

//////////////////////////////////////////////// LegacyResource ////////////////////////////////////////////////
LegacyResource::LegacyResource(Hooks h) : hooks(std::move(h)) {}

std::string LegacyResource::TypeName() const {
    return hooks.typeName.empty() ? DemangledTypeName(*this) : hooks.typeName;
}

std::string LegacyResource::Uri() const {
    if (hooks.getUri) return hooks.getUri();
    if (hooks.uri) return hooks.uri();
    if (hooks.uriProperty.has_value()) return hooks.uriProperty.value();
    return std::string();
}

std::string LegacyResource::Description() const {
    if (hooks.getDescription) return hooks.getDescription();
    if (hooks.description) return hooks.description();
    if (hooks.descriptionProperty.has_value()) return hooks.descriptionProperty.value();
    return "Resource: " + TypeName();
}

std::string LegacyResource::MimeType() const {
    if (hooks.getMimeType) return hooks.getMimeType();
    if (hooks.mimeType) return hooks.mimeType();
    if (hooks.mimeTypeProperty.has_value()) return hooks.mimeTypeProperty.value();
    return "text/plain";
}

JSONValue::Object LegacyResource::Metadata() const {
    if (hooks.getMetadata) return hooks.getMetadata();
    if (hooks.metadataProperty.has_value()) return hooks.metadataProperty.value();
    return {};
}

JSONValue LegacyResource::Read(const JSONValue::Object& params) {
    if (hooks.read) return hooks.read(params);
    if (hooks.getContent) return hooks.getContent(params);
    if (hooks.invoke) return hooks.invoke(params);
    throw ComponentNotInvocable("Resource is not readable");
}

///////////////////////////////////////////////// LegacyPrompt /////////////////////////////////////////////////
LegacyPrompt::LegacyPrompt(Hooks h) : hooks(std::move(h)) {}

std::string LegacyPrompt::TypeName() const {
    return hooks.typeName.empty() ? DemangledTypeName(*this) : hooks.typeName;
}

std::string LegacyPrompt::Description() const {
    if (hooks.getDescription) return hooks.getDescription();
    if (hooks.description) return hooks.description();
    if (hooks.descriptionProperty.has_value()) return hooks.descriptionProperty.value();
    return "Prompt: " + TypeName();
}

JSONValue LegacyPrompt::Arguments() const {
    if (hooks.getArguments) return hooks.getArguments();
    if (hooks.arguments) return hooks.arguments();
    if (hooks.argumentsProperty.has_value()) return hooks.argumentsProperty.value();
    return JSONValue(JSONValue::Array{});
}

bool LegacyPrompt::ValidateArguments(const JSONValue& arguments) const {
    return hooks.validateArguments ? hooks.validateArguments(arguments) : true;
}

JSONValue LegacyPrompt::Process(const JSONValue& arguments) {
    if (hooks.process) return hooks.process(arguments);
    if (hooks.get) return hooks.get(arguments);
    if (hooks.invoke) return hooks.invoke(arguments);
    throw ComponentNotInvocable("Prompt is not processable");
}

///////////////////////////////////////////// Plain-callable helpers /////////////////////////////////////////////
std::shared_ptr<ITool> MakeTool(std::function<JSONValue(const JSONValue&)> fn,
                                std::optional<std::string> description,
                                std::optional<JSONValue> inputSchema) {
    LegacyTool::Hooks hooks;
    hooks.typeName = "Closure";
    hooks.invoke = std::move(fn);
    hooks.descriptionProperty = std::move(description);
    hooks.inputSchemaProperty = std::move(inputSchema);
    return std::make_shared<LegacyTool>(std::move(hooks));
}

std::shared_ptr<IResource> MakeResource(std::string uri, LegacyResource::ReadFn fn,
                                        std::optional<std::string> description,
                                        std::optional<std::string> mimeType) {
    LegacyResource::Hooks hooks;
    hooks.typeName = "Closure";
    hooks.uriProperty = std::move(uri);
    hooks.invoke = std::move(fn);
    hooks.descriptionProperty = std::move(description);
    hooks.mimeTypeProperty = std::move(mimeType);
    return std::make_shared<LegacyResource>(std::move(hooks));
}

std::shared_ptr<IPrompt> MakePrompt(std::function<JSONValue(const JSONValue&)> fn,
                                    std::optional<std::string> description,
                                    std::optional<JSONValue> arguments) {
    LegacyPrompt::Hooks hooks;
    hooks.typeName = "Closure";
    hooks.invoke = std::move(fn);
    hooks.descriptionProperty = std::move(description);
    hooks.argumentsProperty = std::move(arguments);
    return std::make_shared<LegacyPrompt>(std::move(hooks));
}

} // namespace mcpserve
