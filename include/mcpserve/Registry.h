//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registry.h
// Purpose: Component registry - name to handler lookup for tools, resources and prompts
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "mcpserve/Components.h"
#include "mcpserve/Protocol.h"

namespace mcpserve {

// Shared handle to a registered component of any kind
using ComponentHandle = std::variant<std::shared_ptr<ITool>, std::shared_ptr<IResource>, std::shared_ptr<IPrompt>>;

//==========================================================================================================
// ComponentEntry
// Purpose: One registration as seen by the handlers.
// Fields:
//   name: Registered name (unique within its ComponentType).
//   handler: The component; its alternative always matches the ComponentType it was registered under.
//   options: Free-form registration options.
//==========================================================================================================
struct ComponentEntry {
    std::string name;
    ComponentHandle handler;
    JSONValue::Object options;

    ComponentType Type() const { return static_cast<ComponentType>(handler.index()); }

    std::shared_ptr<ITool> AsTool() const;
    std::shared_ptr<IResource> AsResource() const;
    std::shared_ptr<IPrompt> AsPrompt() const;
};

//==========================================================================================================
// IComponentRegistry
// Purpose: Registry interface consumed by the handlers (read side) and by startup code (write side).
// Notes:
//   All methods are safe to call concurrently.
//==========================================================================================================
class IComponentRegistry {
public:
    virtual ~IComponentRegistry() = default;

    ///////////////////////////////////////////////// Read side /////////////////////////////////////////////////
    virtual bool Has(ComponentType type, const std::string& name) const = 0;
    virtual std::optional<ComponentEntry> Get(ComponentType type, const std::string& name) const = 0;

    //==========================================================================================================
    // Returns a snapshot of every entry of the given type in registration order.
    // Args:
    //   type: Component kind.
    // Returns:
    //   Copy of the entries; later registrations do not affect it.
    //==========================================================================================================
    virtual std::vector<ComponentEntry> All(ComponentType type) const = 0;

    virtual std::size_t Count(ComponentType type) const = 0;
    virtual std::vector<std::string> Names(ComponentType type) const = 0;

    //////////////////////////////////////////////// Write side /////////////////////////////////////////////////
    //==========================================================================================================
    // Registers a tool.
    // Args:
    //   name: Unique, non-empty tool name.
    //   tool: Non-null tool.
    //   options: Registration options stored with the entry.
    // Throws:
    //   errors::RegistrationError (EmptyName, NullHandler, DuplicateName).
    //==========================================================================================================
    virtual void RegisterTool(const std::string& name, std::shared_ptr<ITool> tool,
                              JSONValue::Object options = {}) = 0;

    virtual void RegisterResource(const std::string& name, std::shared_ptr<IResource> resource,
                                  JSONValue::Object options = {}) = 0;

    virtual void RegisterPrompt(const std::string& name, std::shared_ptr<IPrompt> prompt,
                                JSONValue::Object options = {}) = 0;

    // Removes an entry; returns false when nothing was registered under that name
    virtual bool Unregister(ComponentType type, const std::string& name) = 0;

    // Removes every component and resource template
    virtual void Clear() = 0;

    //////////////////////////////////////////// Resource templates /////////////////////////////////////////////
    //==========================================================================================================
    // Registers a resource template; an existing template with the same uriTemplate is replaced in place.
    //==========================================================================================================
    virtual void RegisterResourceTemplate(const ResourceTemplate& resourceTemplate) = 0;
    virtual std::vector<ResourceTemplate> ResourceTemplates() const = 0;
};

//==========================================================================================================
// ComponentRegistry
// Purpose: Standard in-process registry guarded by a reader/writer lock.
//==========================================================================================================
class ComponentRegistry : public IComponentRegistry {
public:
    ComponentRegistry();
    ~ComponentRegistry() override;

    bool Has(ComponentType type, const std::string& name) const override;
    std::optional<ComponentEntry> Get(ComponentType type, const std::string& name) const override;
    std::vector<ComponentEntry> All(ComponentType type) const override;
    std::size_t Count(ComponentType type) const override;
    std::vector<std::string> Names(ComponentType type) const override;

    void RegisterTool(const std::string& name, std::shared_ptr<ITool> tool,
                      JSONValue::Object options = {}) override;
    void RegisterResource(const std::string& name, std::shared_ptr<IResource> resource,
                          JSONValue::Object options = {}) override;
    void RegisterPrompt(const std::string& name, std::shared_ptr<IPrompt> prompt,
                        JSONValue::Object options = {}) override;
    bool Unregister(ComponentType type, const std::string& name) override;
    void Clear() override;

    void RegisterResourceTemplate(const ResourceTemplate& resourceTemplate) override;
    std::vector<ResourceTemplate> ResourceTemplates() const override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpserve
