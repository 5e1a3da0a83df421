//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_registry.cpp
// Purpose: Tests for the component registry
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "mcpserve/LegacyComponents.h"
#include "mcpserve/Registry.h"
#include "mcpserve/errors/ProtocolException.h"

using namespace mcpserve;

namespace {
std::shared_ptr<ITool> noopTool() {
    return MakeTool([](const JSONValue&) { return JSONValue(); });
}

errors::RegistrationError::Code registrationCode(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const errors::RegistrationError& e) {
        return e.GetCode();
    }
    ADD_FAILURE() << "expected RegistrationError";
    return errors::RegistrationError::Code::EmptyName;
}
} // namespace

TEST(ComponentRegistry, RegisterAndLookup) {
    ComponentRegistry registry;
    registry.RegisterTool("a", noopTool(), {{"group", std::make_shared<JSONValue>("math")}});
    registry.RegisterPrompt("a", MakePrompt([](const JSONValue&) { return JSONValue(); }));

    EXPECT_TRUE(registry.Has(ComponentType::Tool, "a"));
    EXPECT_TRUE(registry.Has(ComponentType::Prompt, "a"));
    EXPECT_FALSE(registry.Has(ComponentType::Resource, "a"));

    auto entry = registry.Get(ComponentType::Tool, "a");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->Type(), ComponentType::Tool);
    EXPECT_NE(entry->AsTool(), nullptr);
    EXPECT_EQ(entry->AsPrompt(), nullptr);
    EXPECT_EQ(entry->options.count("group"), 1u);
    EXPECT_FALSE(registry.Get(ComponentType::Tool, "b").has_value());
}

TEST(ComponentRegistry, PreservesRegistrationOrder) {
    ComponentRegistry registry;
    for (const char* name : {"zeta", "alpha", "mid"}) {
        registry.RegisterTool(name, noopTool());
    }
    EXPECT_EQ(registry.Names(ComponentType::Tool), (std::vector<std::string>{"zeta", "alpha", "mid"}));
    EXPECT_EQ(registry.Count(ComponentType::Tool), 3u);

    ASSERT_TRUE(registry.Unregister(ComponentType::Tool, "alpha"));
    EXPECT_FALSE(registry.Unregister(ComponentType::Tool, "alpha"));
    EXPECT_EQ(registry.Names(ComponentType::Tool), (std::vector<std::string>{"zeta", "mid"}));
    EXPECT_TRUE(registry.Get(ComponentType::Tool, "mid").has_value());
}

TEST(ComponentRegistry, RejectsBadRegistrations) {
    ComponentRegistry registry;
    registry.RegisterTool("dup", noopTool());
    using Code = errors::RegistrationError::Code;
    EXPECT_EQ(registrationCode([&] { registry.RegisterTool("", noopTool()); }), Code::EmptyName);
    EXPECT_EQ(registrationCode([&] { registry.RegisterTool("x", nullptr); }), Code::NullHandler);
    EXPECT_EQ(registrationCode([&] { registry.RegisterTool("dup", noopTool()); }), Code::DuplicateName);
    EXPECT_EQ(registry.Count(ComponentType::Tool), 1u);
}

TEST(ComponentRegistry, AllReturnsSnapshot) {
    ComponentRegistry registry;
    registry.RegisterTool("one", noopTool());
    auto snapshot = registry.All(ComponentType::Tool);
    registry.RegisterTool("two", noopTool());
    EXPECT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(registry.All(ComponentType::Tool).size(), 2u);
}

TEST(ComponentRegistry, ResourceTemplatesReplaceByUriTemplate) {
    ComponentRegistry registry;
    registry.RegisterResourceTemplate(ResourceTemplate("a://{x}", "first"));
    registry.RegisterResourceTemplate(ResourceTemplate("b://{y}", "second"));
    registry.RegisterResourceTemplate(ResourceTemplate("a://{x}", "replaced"));
    auto templates = registry.ResourceTemplates();
    ASSERT_EQ(templates.size(), 2u);
    EXPECT_EQ(templates[0].name, "replaced");

    registry.RegisterTool("t", noopTool());
    registry.Clear();
    EXPECT_TRUE(registry.ResourceTemplates().empty());
    EXPECT_EQ(registry.Count(ComponentType::Tool), 0u);
}

TEST(ComponentRegistry, ConcurrentRegistrationAndReads) {
    ComponentRegistry registry;
    std::atomic<bool> done{false};
    std::thread reader([&] {
        while (!done.load()) {
            for (const auto& entry : registry.All(ComponentType::Tool)) {
                EXPECT_NE(entry.AsTool(), nullptr);
            }
        }
    });
    for (int i = 0; i < 200; ++i) {
        registry.RegisterTool("tool" + std::to_string(i), noopTool());
    }
    done.store(true);
    reader.join();
    EXPECT_EQ(registry.Count(ComponentType::Tool), 200u);
}

TEST(ComponentTypeNames, StringConversions) {
    EXPECT_STREQ(toString(ComponentType::Resource), "resource");
    EXPECT_EQ(componentTypeFromString("prompt"), ComponentType::Prompt);
    EXPECT_FALSE(componentTypeFromString("widget").has_value());
}
