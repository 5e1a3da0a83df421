//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_resource_handler.cpp
// Purpose: Tests for resources/list and resources/read
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "mcpserve/LegacyComponents.h"
#include "mcpserve/errors/ProtocolException.h"
#include "mcpserve/handlers/ResourceHandler.h"
#include "test_helpers.h"

using namespace mcpserve;
using namespace testutil;

namespace {

class SettingsResource : public IResource {
public:
    std::string Uri() const override { return "config://settings"; }
    std::string Description() const override { return "Application settings"; }
    std::string MimeType() const override { return "application/json"; }
    JSONValue::Object Metadata() const override {
        return Obj({{"category", JSONValue("config")}, {"uri", JSONValue("config://hijacked")}});
    }
    JSONValue Read(const JSONValue::Object& params) override {
        lastParams = params;
        return Val(Obj({{"debug", JSONValue(false)}}));
    }
    JSONValue::Object lastParams;
};

class ThrowingUriResource : public IResource {
public:
    std::string Uri() const override { throw std::runtime_error("no uri"); }
    std::string Description() const override { return "unused"; }
    JSONValue Read(const JSONValue::Object&) override { return JSONValue("body"); }
    std::string TypeName() const override { return "ThrowingUriResource"; }
};

// Throws values that do not derive from std::exception
class ForeignThrowingResource : public IResource {
public:
    std::string Uri() const override { throw 42; }
    std::string Description() const override { return "unused"; }
    JSONValue Read(const JSONValue::Object&) override { return JSONValue("body"); }
    std::string TypeName() const override { throw 7; }
};

struct ResourceFixture {
    std::shared_ptr<ComponentRegistry> registry = std::make_shared<ComponentRegistry>();
    ResourceHandler handler{registry};
};

JSONValue::Array readContents(ResourceHandler& handler, const std::string& uri,
                              JSONValue::Object extra = {}) {
    extra["uri"] = std::make_shared<JSONValue>(uri);
    JSONValue result = handler.Handle("resources/read", extra);
    return Items(At(result, "contents"));
}

} // namespace

TEST(ResourceHandler, ListFlattensMetadataWithoutOverridingCoreKeys) {
    ResourceFixture f;
    f.registry->RegisterResource("settings", std::make_shared<SettingsResource>());
    JSONValue result = f.handler.Handle("resources/list", {});
    const auto& resources = Items(At(result, "resources"));
    ASSERT_EQ(resources.size(), 1u);
    const JSONValue& def = *resources[0];
    EXPECT_EQ(Str(At(def, "uri")), "config://settings");
    EXPECT_EQ(Str(At(def, "name")), "settings");
    EXPECT_EQ(Str(At(def, "description")), "Application settings");
    EXPECT_EQ(Str(At(def, "mimeType")), "application/json");
    EXPECT_EQ(Str(At(def, "category")), "config");
    EXPECT_FALSE(Has(result, "nextCursor"));
}

TEST(ResourceHandler, ListFallsBackWhenAccessorsThrow) {
    ResourceFixture f;
    f.registry->RegisterResource("odd", std::make_shared<ThrowingUriResource>());
    JSONValue result = f.handler.Handle("resources/list", {});
    const JSONValue& def = *Items(At(result, "resources"))[0];
    EXPECT_EQ(Str(At(def, "uri")), "resource://odd");
    EXPECT_EQ(Str(At(def, "description")), "Resource: ThrowingUriResource");
    EXPECT_EQ(Str(At(def, "mimeType")), "text/plain");
    EXPECT_EQ(f.handler.ResolveUri(*f.registry->Get(ComponentType::Resource, "odd")), "resource://odd");
}

TEST(ResourceHandler, ListFallsBackOnNonStandardExceptions) {
    ResourceFixture f;
    f.registry->RegisterResource("foreign", std::make_shared<ForeignThrowingResource>());
    JSONValue result;
    ASSERT_NO_THROW(result = f.handler.Handle("resources/list", {}));
    const JSONValue& def = *Items(At(result, "resources"))[0];
    EXPECT_EQ(Str(At(def, "uri")), "resource://foreign");
    EXPECT_EQ(Str(At(def, "name")), "foreign");
    EXPECT_EQ(Str(At(def, "description")), "Resource: Resource");
    EXPECT_EQ(Str(At(def, "mimeType")), "text/plain");
    EXPECT_EQ(f.handler.ResolveUri(*f.registry->Get(ComponentType::Resource, "foreign")), "resource://foreign");

    auto contents = readContents(f.handler, "resource://foreign");
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(Str(At(*contents[0], "text")), "body");
}

TEST(ResourceHandler, ReadResolvesByUriAndForwardsExtraParams) {
    ResourceFixture f;
    auto settings = std::make_shared<SettingsResource>();
    f.registry->RegisterResource("settings", settings);

    auto contents = readContents(f.handler, "config://settings", Obj({{"section", JSONValue("db")}}));
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(Str(At(*contents[0], "type")), "text");
    EXPECT_NE(Str(At(*contents[0], "text")).find("\"debug\": false"), std::string::npos);
    EXPECT_EQ(settings->lastParams.size(), 1u);
    EXPECT_TRUE(settings->lastParams.count("section"));
}

TEST(ResourceHandler, ReadFallsBackToRegisteredNameUri) {
    ResourceFixture f;
    LegacyResource::Hooks hooks;
    hooks.getContent = [](const JSONValue::Object&) { return JSONValue("plain text"); };
    f.registry->RegisterResource("notes", std::make_shared<LegacyResource>(hooks));

    auto contents = readContents(f.handler, "resource://notes");
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(Str(At(*contents[0], "text")), "plain text");
}

TEST(ResourceHandler, FormatContentsNormalizesShapes) {
    ResourceFixture f;
    // Typed blocks pass through
    auto typed = f.handler.FormatContents(Arr({Val(Obj({{"type", JSONValue("blob")}, {"blob", JSONValue("AA==")}}))}));
    ASSERT_EQ(typed.size(), 1u);
    EXPECT_EQ(Str(At(*typed[0], "type")), "blob");

    // {contents:[...]} is unwrapped; partial items get a text type
    auto wrapped = f.handler.FormatContents(
        Val(Obj({{"contents", Arr({Val(Obj({{"uri", JSONValue("a://b")}, {"text", JSONValue("hi")}})), JSONValue("x")})}})));
    ASSERT_EQ(wrapped.size(), 2u);
    EXPECT_EQ(Str(At(*wrapped[0], "type")), "text");
    EXPECT_EQ(Str(At(*wrapped[0], "uri")), "a://b");
    EXPECT_EQ(Str(At(*wrapped[1], "text")), "x");

    // Scalars are compact JSON
    auto number = f.handler.FormatContents(JSONValue(int64_t{12}));
    ASSERT_EQ(number.size(), 1u);
    EXPECT_EQ(Str(At(*number[0], "text")), "12");
}

TEST(ResourceHandler, ReadFailuresAreSoft) {
    ResourceFixture f;
    f.registry->RegisterResource("broken", MakeResource("test://broken", [](const JSONValue::Object&) -> JSONValue {
        throw std::runtime_error("io error");
    }));
    LegacyResource::Hooks unreadable;
    unreadable.uriProperty = "test://unreadable";
    f.registry->RegisterResource("unreadable", std::make_shared<LegacyResource>(unreadable));

    JSONValue broken = f.handler.Handle("resources/read", Obj({{"uri", JSONValue("test://broken")}}));
    EXPECT_EQ(Int(At(At(broken, "error"), "code")), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(Str(At(At(broken, "error"), "message")), "Failed to read resource: io error");

    JSONValue inert = f.handler.Handle("resources/read", Obj({{"uri", JSONValue("test://unreadable")}}));
    EXPECT_EQ(Str(At(At(inert, "error"), "message")), "Resource is not readable");
}

TEST(ResourceHandler, ReadParamErrors) {
    ResourceFixture f;
    try {
        f.handler.Handle("resources/read", {});
        FAIL() << "expected missing uri";
    } catch (const errors::ProtocolException& e) {
        EXPECT_EQ(e.Code(), JSONRPCErrorCodes::InvalidParams);
        EXPECT_STREQ(e.what(), "Missing required parameters: uri");
    }
    try {
        f.handler.Handle("resources/read", Obj({{"uri", JSONValue("test://missing")}}));
        FAIL() << "expected unknown uri";
    } catch (const errors::ProtocolException& e) {
        EXPECT_EQ(e.Code(), JSONRPCErrorCodes::MethodNotFound);
        EXPECT_STREQ(e.what(), "Resource not found: test://missing");
    }
}

TEST(ResourceHandler, ListIsPaginated) {
    ServerConfig config;
    config.defaultPageSize = 2;
    auto registry = std::make_shared<ComponentRegistry>();
    for (const char* name : {"a", "b", "c"}) {
        registry->RegisterResource(name, MakeResource(std::string("mem://") + name,
                                                      [](const JSONValue::Object&) { return JSONValue("x"); }));
    }
    ResourceHandler handler(registry, config);
    JSONValue first = handler.Handle("resources/list", {});
    EXPECT_EQ(Items(At(first, "resources")).size(), 2u);
    ASSERT_TRUE(Has(first, "nextCursor"));
    JSONValue second = handler.Handle("resources/list", Obj({{"cursor", At(first, "nextCursor")}}));
    const auto& rest = Items(At(second, "resources"));
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(Str(At(*rest[0], "uri")), "mem://c");
}
