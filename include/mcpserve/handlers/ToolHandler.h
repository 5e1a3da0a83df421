//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolHandler.h
// Purpose: tools/list and tools/call
//==========================================================================================================

#pragma once

#include <memory>

#include "mcpserve/Registry.h"
#include "mcpserve/ServerConfig.h"
#include "mcpserve/handlers/BaseHandler.h"

namespace mcpserve {

//==========================================================================================================
// ToolHandler
// Purpose: Lists registered tools (paginated) and executes them.
// Notes:
//   Execution failures are reported in-band ({content:[...], isError:true}); only protocol problems
//   (bad params, unknown tool, rejected arguments) raise ProtocolException.
//==========================================================================================================
class ToolHandler : public BaseHandler {
public:
    ToolHandler(std::shared_ptr<IComponentRegistry> registry, const ServerConfig& config = ServerConfig());

    std::vector<std::string> GetSupportedMethods() const override;

    //==========================================================================================================
    // Builds {name, description, inputSchema} for one registration. Accessors that throw are replaced by
    // the fallbacks ("Tool: <TypeName>" and the permissive default schema) and logged as warnings.
    //==========================================================================================================
    JSONValue ToolDefinition(const ComponentEntry& entry) const;

protected:
    JSONValue handleMethod(const std::string& method, const JSONValue::Object& params,
                           const RequestContext& context) override;

private:
    JSONValue handleToolsList(const JSONValue::Object& params, const RequestContext& context);
    JSONValue handleToolsCall(const JSONValue::Object& params, const RequestContext& context);

    std::shared_ptr<IComponentRegistry> registry;
    int64_t defaultPageSize;
};

} // namespace mcpserve
