//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ResourceHandler.h
// Purpose: resources/list and resources/read
//==========================================================================================================

#pragma once

#include <memory>

#include "mcpserve/Registry.h"
#include "mcpserve/ServerConfig.h"
#include "mcpserve/handlers/BaseHandler.h"

namespace mcpserve {

//==========================================================================================================
// ResourceHandler
// Purpose: Lists registered resources (paginated) and reads them by URI.
// Notes:
//   Read failures are returned in-band as {error:{code:-32603, message}} instead of being thrown.
//==========================================================================================================
class ResourceHandler : public BaseHandler {
public:
    ResourceHandler(std::shared_ptr<IComponentRegistry> registry, const ServerConfig& config = ServerConfig());

    std::vector<std::string> GetSupportedMethods() const override;

    //==========================================================================================================
    // Builds {uri, name, description, mimeType, ...metadata}. Metadata keys never replace the four core keys.
    // On any accessor failure the entry falls back to {uri:"resource://<name>", name,
    // description:"Resource: <TypeName>", mimeType:"text/plain"}.
    //==========================================================================================================
    JSONValue ResourceDefinition(const ComponentEntry& entry) const;

    // URI of a registration; "resource://<name>" when the resource reports none or throws
    std::string ResolveUri(const ComponentEntry& entry) const;

    // Normalizes whatever Read returned into a list of content blocks
    JSONValue::Array FormatContents(const JSONValue& content) const;

protected:
    JSONValue handleMethod(const std::string& method, const JSONValue::Object& params,
                           const RequestContext& context) override;

private:
    JSONValue handleResourcesList(const JSONValue::Object& params, const RequestContext& context);
    JSONValue handleResourcesRead(const JSONValue::Object& params, const RequestContext& context);
    JSONValue formatResourceContent(const JSONValue& item) const;

    std::shared_ptr<IComponentRegistry> registry;
    int64_t defaultPageSize;
};

} // namespace mcpserve
