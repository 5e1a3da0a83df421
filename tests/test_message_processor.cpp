//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_message_processor.cpp
// Purpose: Tests for MessageProcessor routing and lifecycle state
//==========================================================================================================

#include <gtest/gtest.h>

#include <memory>

#include "logging/Logger.h"
#include "mcpserve/Cursor.h"
#include "mcpserve/LegacyComponents.h"
#include "mcpserve/MessageProcessor.h"
#include "mcpserve/errors/ProtocolException.h"
#include "test_helpers.h"

using namespace mcpserve;
using namespace testutil;

namespace {

int routeErrorCode(MessageProcessor& processor, const std::string& method, const JSONValue::Object& params = {}) {
    try {
        processor.Route(method, params);
    } catch (const errors::ProtocolException& e) {
        return e.Code();
    }
    return 0;
}

} // namespace

TEST(MessageProcessor, NullRegistryThrows) {
    EXPECT_THROW(MessageProcessor(nullptr), std::invalid_argument);
}

TEST(MessageProcessor, InitializeStoresClientState) {
    auto registry = std::make_shared<ComponentRegistry>();
    MessageProcessor processor(registry);
    EXPECT_FALSE(processor.IsInitialized());

    auto params = Obj({{"protocolVersion", JSONValue("2025-03-26")},
                       {"capabilities", Val(Obj({{"tools", Val(Obj({{"listChanged", JSONValue(true)}}))},
                                                 {"logging", Val({})}}))},
                       {"clientInfo", Val(Obj({{"name", JSONValue("inspector")}, {"version", JSONValue("2.1")}}))}});
    JSONValue result = processor.Route(Methods::Initialize, params);

    // Server answers with its own version regardless of the requested one
    EXPECT_EQ(Str(At(result, "protocolVersion")), PROTOCOL_VERSION);
    ASSERT_TRUE(processor.GetClientInfo().has_value());
    EXPECT_EQ(processor.GetClientInfo()->name, "inspector");
    EXPECT_EQ(processor.GetClientInfo()->version, "2.1");
    EXPECT_EQ(processor.GetClientCapabilities().size(), 2u);

    const auto negotiated = processor.GetNegotiatedCapabilities();
    EXPECT_TRUE(negotiated.count("tools"));
    EXPECT_TRUE(negotiated.count("logging"));
    EXPECT_FALSE(negotiated.count("resources"));
    // The client's listChanged is not echoed back; no capability carries sub-features
    EXPECT_EQ(SerializeJSON(At(At(result, "capabilities"), "tools")), "{}");

    // initialize alone does not complete the handshake
    EXPECT_FALSE(processor.IsInitialized());
    processor.HandleNotification(Methods::Initialized, {});
    EXPECT_TRUE(processor.IsInitialized());
}

TEST(MessageProcessor, RequestBeforeInitializeAutoInitializes) {
    auto registry = std::make_shared<ComponentRegistry>();
    MessageProcessor processor(registry);

    JSONValue result = processor.Route(Methods::ListTools, {});
    EXPECT_TRUE(Items(At(result, "tools")).empty());
    EXPECT_TRUE(processor.IsInitialized());
    ASSERT_TRUE(processor.GetClientInfo().has_value());
    EXPECT_EQ(processor.GetClientInfo()->name, "HTTP Client");
    EXPECT_EQ(processor.GetClientInfo()->version, "1.0.0");
    const auto caps = processor.GetClientCapabilities();
    EXPECT_TRUE(caps.count("tools"));
    EXPECT_TRUE(caps.count("resources"));
    EXPECT_TRUE(caps.count("prompts"));
}

TEST(MessageProcessor, StrictLifecycleRejections) {
    ServerConfig config;
    config.strictLifecycle = true;
    MessageProcessor processor(std::make_shared<ComponentRegistry>(), config);

    try {
        processor.Route(Methods::ListPrompts, {});
        FAIL() << "expected InitializationRequired";
    } catch (const errors::ProtocolException& e) {
        EXPECT_EQ(e.Code(), JSONRPCErrorCodes::InitializationRequired);
        EXPECT_EQ(e.Method(), Methods::ListPrompts);
    }

    EXPECT_EQ(routeErrorCode(processor, Methods::Initialize, Obj({{"protocolVersion", JSONValue("1999-01-01")}})),
              JSONRPCErrorCodes::UnsupportedProtocolVersion);
    EXPECT_EQ(routeErrorCode(processor, Methods::Initialize, Obj({{"protocolVersion", JSONValue("2024-11-05")}})), 0);
    EXPECT_EQ(routeErrorCode(processor, Methods::Initialize), JSONRPCErrorCodes::AlreadyInitialized);
}

TEST(MessageProcessor, LenientLifecycleAcceptsRepeatedInitialize) {
    MessageProcessor processor(std::make_shared<ComponentRegistry>());
    EXPECT_EQ(routeErrorCode(processor, Methods::Initialize, Obj({{"protocolVersion", JSONValue("1999-01-01")}})), 0);
    EXPECT_EQ(routeErrorCode(processor, Methods::Initialize), 0);
}

TEST(MessageProcessor, PingNeedsNoInitialization) {
    ServerConfig config;
    config.strictLifecycle = true;
    MessageProcessor processor(std::make_shared<ComponentRegistry>(), config);
    JSONValue result = processor.Route(Methods::Ping, {});
    EXPECT_TRUE(result.IsObject());
    EXPECT_TRUE(std::get<JSONValue::Object>(result.value).empty());
}

TEST(MessageProcessor, UnknownMethodBeatsLifecycleCheck) {
    ServerConfig config;
    config.strictLifecycle = true;
    MessageProcessor processor(std::make_shared<ComponentRegistry>(), config);
    EXPECT_EQ(routeErrorCode(processor, "resources/subscribe"), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(routeErrorCode(processor, "foo"), JSONRPCErrorCodes::MethodNotFound);
}

TEST(MessageProcessor, DisabledCapabilitiesAreNotRouted) {
    ServerConfig config;
    config.capabilities.completion.enabled = false;
    config.capabilities.logging.enabled = false;
    MessageProcessor processor(std::make_shared<ComponentRegistry>(), config);
    EXPECT_EQ(routeErrorCode(processor, Methods::Complete), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(routeErrorCode(processor, Methods::SetLogLevel, Obj({{"level", JSONValue("info")}})),
              JSONRPCErrorCodes::MethodNotFound);
}

TEST(MessageProcessor, CompletionReturnsEmptyValues) {
    ServerConfig config;
    config.capabilities.completion.enabled = true;
    MessageProcessor processor(std::make_shared<ComponentRegistry>(), config);
    JSONValue result = processor.Route(Methods::Complete, Obj({{"ref", Val({})}}));
    const JSONValue& completion = At(result, "completion");
    EXPECT_TRUE(Items(At(completion, "values")).empty());
    EXPECT_EQ(Int(At(completion, "total")), 0);
    EXPECT_FALSE(Bool(At(completion, "hasMore")));
}

TEST(MessageProcessor, SetLevelValidatesAndApplies) {
    const LogLevel saved = Logger::getLogLevel();
    MessageProcessor processor(std::make_shared<ComponentRegistry>());

    EXPECT_EQ(routeErrorCode(processor, Methods::SetLogLevel, Obj({{"level", JSONValue("verbose")}})),
              JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(routeErrorCode(processor, Methods::SetLogLevel), JSONRPCErrorCodes::InvalidParams);

    JSONValue result = processor.Route(Methods::SetLogLevel, Obj({{"level", JSONValue("error")}}));
    EXPECT_TRUE(result.IsObject());
    EXPECT_EQ(Logger::getLogLevel(), LogLevel::LOG_ERROR_LEVEL);
    Logger::setLogLevel(saved);
}

TEST(MessageProcessor, ResourceTemplatesArePaginated) {
    auto registry = std::make_shared<ComponentRegistry>();
    registry->RegisterResourceTemplate(ResourceTemplate("file:///{path}", "files", std::string("Files")));
    registry->RegisterResourceTemplate(ResourceTemplate("db://{table}", "tables", std::nullopt, std::string("text/csv")));
    registry->RegisterResourceTemplate(ResourceTemplate("log://{day}", "logs"));
    MessageProcessor processor(registry);

    JSONValue first = processor.Route(Methods::ListResourceTemplates,
                                      Obj({{"cursor", JSONValue(EncodeCursor(Cursor{0, 2}))}}));
    const auto& items = Items(At(first, "resourceTemplates"));
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(Str(At(*items[0], "uriTemplate")), "file:///{path}");
    EXPECT_EQ(Str(At(*items[0], "description")), "Files");
    EXPECT_FALSE(Has(*items[0], "mimeType"));
    EXPECT_EQ(Str(At(*items[1], "mimeType")), "text/csv");
    ASSERT_TRUE(Has(first, "nextCursor"));

    JSONValue second = processor.Route(Methods::ListResourceTemplates, Obj({{"cursor", At(first, "nextCursor")}}));
    EXPECT_EQ(Items(At(second, "resourceTemplates")).size(), 1u);
    EXPECT_FALSE(Has(second, "nextCursor"));

    EXPECT_EQ(routeErrorCode(processor, Methods::ListResourceTemplates, Obj({{"cursor", JSONValue("@@")}})),
              JSONRPCErrorCodes::InvalidParams);
}

TEST(MessageProcessor, ResetForgetsSession) {
    MessageProcessor processor(std::make_shared<ComponentRegistry>());
    processor.Route(Methods::ListTools, {});
    ASSERT_TRUE(processor.IsInitialized());
    processor.Reset();
    EXPECT_FALSE(processor.IsInitialized());
    EXPECT_FALSE(processor.GetClientInfo().has_value());
    EXPECT_TRUE(processor.GetClientCapabilities().empty());
}

TEST(MessageProcessor, ServerInfoAndDebugPropagation) {
    ServerConfig config;
    config.serverInfo = Implementation("Demo", "3.0.0");
    MessageProcessor processor(std::make_shared<ComponentRegistry>(), config);

    processor.SetServerInfo(Implementation("Renamed", ""));
    EXPECT_EQ(processor.GetServerInfo().name, "Renamed");
    EXPECT_EQ(processor.GetServerInfo().version, "3.0.0");
    JSONValue init = processor.Route(Methods::Initialize, {});
    EXPECT_EQ(Str(At(At(init, "serverInfo"), "name")), "Renamed");

    EXPECT_FALSE(processor.IsDebug());
    processor.SetDebug(true);
    EXPECT_TRUE(processor.IsDebug());
    EXPECT_TRUE(processor.GetToolHandler().IsDebug());
    EXPECT_TRUE(processor.GetResourceHandler().IsDebug());
    EXPECT_TRUE(processor.GetPromptHandler().IsDebug());
}

TEST(MessageProcessor, RequestContextAddsMetadata) {
    auto registry = std::make_shared<ComponentRegistry>();
    registry->RegisterTool("echo", MakeTool([](const JSONValue& a) { return a; }));
    MessageProcessor processor(registry);

    RequestContext context;
    context.requestId = JSONRPCId{int64_t{42}};
    context.addMetadata = true;
    JSONValue result = processor.Route(Methods::CallTool, Obj({{"name", JSONValue("echo")}}), context);
    const JSONValue& meta = At(result, "_meta");
    EXPECT_EQ(Str(At(meta, "handler")), "ToolHandler");
    EXPECT_EQ(Int(At(meta, "request_id")), 42);
    EXPECT_FALSE(Str(At(meta, "timestamp")).empty());
}
