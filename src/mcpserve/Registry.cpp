//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registry.cpp
// Purpose: Component registry implementation
//==========================================================================================================

#include <algorithm>
#include <array>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcpserve/Registry.h"
#include "mcpserve/errors/ProtocolException.h"

namespace mcpserve {

std::shared_ptr<ITool> ComponentEntry::AsTool() const {
    auto p = std::get_if<std::shared_ptr<ITool>>(&handler);
    return p ? *p : nullptr;
}

std::shared_ptr<IResource> ComponentEntry::AsResource() const {
    auto p = std::get_if<std::shared_ptr<IResource>>(&handler);
    return p ? *p : nullptr;
}

std::shared_ptr<IPrompt> ComponentEntry::AsPrompt() const {
    auto p = std::get_if<std::shared_ptr<IPrompt>>(&handler);
    return p ? *p : nullptr;
}

class ComponentRegistry::Impl {
public:
    // Registration order is the vector order; the index map accelerates lookups
    struct Bucket {
        std::vector<ComponentEntry> entries;
        std::unordered_map<std::string, std::size_t> index;
    };

    mutable std::shared_mutex mutex;
    std::array<Bucket, 3> buckets;
    std::vector<ResourceTemplate> templates;

    Bucket& bucket(ComponentType type) { return buckets[static_cast<std::size_t>(type)]; }
    const Bucket& bucket(ComponentType type) const { return buckets[static_cast<std::size_t>(type)]; }

    void add(ComponentType type, const std::string& name, ComponentHandle handler, JSONValue::Object options) {
        if (name.empty()) {
            throw errors::RegistrationError(errors::RegistrationError::Code::EmptyName,
                                            std::string("Cannot register ") + toString(type) + " with an empty name");
        }
        const bool isNull = std::visit([](const auto& p) { return p == nullptr; }, handler);
        if (isNull) {
            throw errors::RegistrationError(errors::RegistrationError::Code::NullHandler,
                                            std::string("Cannot register ") + toString(type) + " '" + name +
                                            "' without a handler");
        }
        std::unique_lock<std::shared_mutex> lock(mutex);
        auto& b = bucket(type);
        if (b.index.count(name) != 0) {
            throw errors::RegistrationError(errors::RegistrationError::Code::DuplicateName,
                                            std::string("A ") + toString(type) + " named '" + name +
                                            "' is already registered");
        }
        b.index.emplace(name, b.entries.size());
        b.entries.push_back(ComponentEntry{name, std::move(handler), std::move(options)});
        LOG_DEBUG("Registered {} '{}'", toString(type), name);
    }
};

ComponentRegistry::ComponentRegistry() : pImpl(std::make_unique<Impl>()) {}

ComponentRegistry::~ComponentRegistry() = default;

bool ComponentRegistry::Has(ComponentType type, const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    return pImpl->bucket(type).index.count(name) != 0;
}

std::optional<ComponentEntry> ComponentRegistry::Get(ComponentType type, const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    const auto& b = pImpl->bucket(type);
    auto it = b.index.find(name);
    if (it == b.index.end()) {
        return std::nullopt;
    }
    return b.entries[it->second];
}

std::vector<ComponentEntry> ComponentRegistry::All(ComponentType type) const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    return pImpl->bucket(type).entries;
}

std::size_t ComponentRegistry::Count(ComponentType type) const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    return pImpl->bucket(type).entries.size();
}

std::vector<std::string> ComponentRegistry::Names(ComponentType type) const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    std::vector<std::string> names;
    names.reserve(pImpl->bucket(type).entries.size());
    for (const auto& e : pImpl->bucket(type).entries) {
        names.push_back(e.name);
    }
    return names;
}

void ComponentRegistry::RegisterTool(const std::string& name, std::shared_ptr<ITool> tool,
                                     JSONValue::Object options) {
    pImpl->add(ComponentType::Tool, name, ComponentHandle{std::move(tool)}, std::move(options));
}

void ComponentRegistry::RegisterResource(const std::string& name, std::shared_ptr<IResource> resource,
                                         JSONValue::Object options) {
    pImpl->add(ComponentType::Resource, name, ComponentHandle{std::move(resource)}, std::move(options));
}

void ComponentRegistry::RegisterPrompt(const std::string& name, std::shared_ptr<IPrompt> prompt,
                                       JSONValue::Object options) {
    pImpl->add(ComponentType::Prompt, name, ComponentHandle{std::move(prompt)}, std::move(options));
}

bool ComponentRegistry::Unregister(ComponentType type, const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(pImpl->mutex);
    auto& b = pImpl->bucket(type);
    auto it = b.index.find(name);
    if (it == b.index.end()) {
        return false;
    }
    b.entries.erase(b.entries.begin() + static_cast<std::ptrdiff_t>(it->second));
    // Reindex the tail to keep registration order intact
    b.index.clear();
    for (std::size_t i = 0; i < b.entries.size(); ++i) {
        b.index.emplace(b.entries[i].name, i);
    }
    LOG_DEBUG("Unregistered {} '{}'", toString(type), name);
    return true;
}

void ComponentRegistry::Clear() {
    std::unique_lock<std::shared_mutex> lock(pImpl->mutex);
    for (auto& b : pImpl->buckets) {
        b.entries.clear();
        b.index.clear();
    }
    pImpl->templates.clear();
}

void ComponentRegistry::RegisterResourceTemplate(const ResourceTemplate& resourceTemplate) {
    std::unique_lock<std::shared_mutex> lock(pImpl->mutex);
    auto it = std::find_if(pImpl->templates.begin(), pImpl->templates.end(), [&](const ResourceTemplate& t) {
        return t.uriTemplate == resourceTemplate.uriTemplate;
    });
    if (it != pImpl->templates.end()) {
        *it = resourceTemplate;
    } else {
        pImpl->templates.push_back(resourceTemplate);
    }
}

std::vector<ResourceTemplate> ComponentRegistry::ResourceTemplates() const {
    std::shared_lock<std::shared_mutex> lock(pImpl->mutex);
    return pImpl->templates;
}

} // namespace mcpserve
