//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_handle_jsonrpc.cpp
// Purpose: End-to-end tests of the JSON-RPC layer (raw text in, raw text out)
//==========================================================================================================

#include <gtest/gtest.h>

#include <format>
#include <memory>
#include <string>

#include "mcpserve/Cursor.h"
#include "mcpserve/JsonRpcHandler.h"
#include "mcpserve/LegacyComponents.h"
#include "mcpserve/Registry.h"
#include "test_helpers.h"

using namespace mcpserve;
using namespace testutil;

namespace {

struct Fixture {
    std::shared_ptr<ComponentRegistry> registry = std::make_shared<ComponentRegistry>();
    std::shared_ptr<MessageProcessor> processor;
    std::unique_ptr<IJsonRpcHandler> handler;

    explicit Fixture(ServerConfig config = ServerConfig()) {
        processor = std::make_shared<MessageProcessor>(registry, config);
        handler = MakeJsonRpcHandler(processor);
    }

    JSONValue call(const std::string& raw) {
        auto out = handler->ProcessRequest(raw);
        if (!out.has_value()) {
            ADD_FAILURE() << "expected a response for " << raw;
            return JSONValue();
        }
        return ParseJSON(out.value());
    }
};

std::shared_ptr<ITool> echoTool() {
    return MakeTool([](const JSONValue& args) { return args; }, std::string("Echo"));
}

} // namespace

//==========================================================================================================
// Verifies initialize followed by tools/list without any transport.
//==========================================================================================================
TEST(JsonRpcHandler, InitializeAndListTools) {
    Fixture f;
    f.registry->RegisterTool("echo", echoTool());

    JSONValue init = f.call(R"({"jsonrpc":"2.0","id":"1","method":"initialize",)"
                            R"("params":{"protocolVersion":"2024-11-05","capabilities":{"tools":{}},)"
                            R"("clientInfo":{"name":"test","version":"0.1"}}})");
    EXPECT_EQ(Str(At(init, "id")), "1");
    const JSONValue& result = At(init, "result");
    EXPECT_EQ(Str(At(result, "protocolVersion")), "2024-11-05");
    EXPECT_TRUE(Has(At(result, "capabilities"), "tools"));
    EXPECT_FALSE(Has(At(result, "capabilities"), "prompts"));
    EXPECT_EQ(Str(At(At(result, "serverInfo"), "name")), "MCP Server");

    JSONValue list = f.call(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    EXPECT_EQ(Int(At(list, "id")), 2);
    const auto& tools = Items(At(At(list, "result"), "tools"));
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(Str(At(*tools[0], "name")), "echo");
    EXPECT_EQ(Str(At(*tools[0], "description")), "Echo");
}

TEST(JsonRpcHandler, EmptyToolListHasNoNextCursor) {
    Fixture f;
    JSONValue resp = f.call(R"({"jsonrpc":"2.0","id":1,"method":"tools/list","params":{}})");
    const JSONValue& result = At(resp, "result");
    EXPECT_TRUE(Items(At(result, "tools")).empty());
    EXPECT_FALSE(Has(result, "nextCursor"));
    EXPECT_FALSE(Has(resp, "error"));
}

TEST(JsonRpcHandler, ToolsCallWithoutNameIsInvalidParams) {
    Fixture f;
    JSONValue resp = f.call(R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{}})");
    const JSONValue& err = At(resp, "error");
    EXPECT_EQ(Int(At(err, "code")), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(Str(At(err, "message")), "Missing required parameters: name");
    EXPECT_EQ(Int(At(resp, "id")), 7);
}

TEST(JsonRpcHandler, ReadMissingResourceIsMethodNotFound) {
    Fixture f;
    JSONValue resp = f.call(R"({"jsonrpc":"2.0","id":3,"method":"resources/read","params":{"uri":"test://missing"}})");
    const JSONValue& err = At(resp, "error");
    EXPECT_EQ(Int(At(err, "code")), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(Str(At(err, "message")), "Resource not found: test://missing");
}

TEST(JsonRpcHandler, InvokeOnlyPromptReturnsUserTextMessage) {
    Fixture f;
    f.registry->RegisterPrompt("greet", MakePrompt([](const JSONValue&) { return JSONValue("Hi"); }));

    JSONValue resp = f.call(R"({"jsonrpc":"2.0","id":4,"method":"prompts/get","params":{"name":"greet"}})");
    const JSONValue& result = At(resp, "result");
    const auto& messages = Items(At(result, "messages"));
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(Str(At(*messages[0], "role")), "user");
    const auto& content = Items(At(*messages[0], "content"));
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(Str(At(*content[0], "type")), "text");
    EXPECT_EQ(Str(At(*content[0], "text")), "Hi");
    EXPECT_EQ(Str(At(result, "description")), "Prompt: Closure");
}

TEST(JsonRpcHandler, SixtyToolsArePagedByCursor) {
    Fixture f;
    for (int i = 0; i < 60; ++i) {
        f.registry->RegisterTool(std::format("tool_{:02}", i), echoTool());
    }
    const std::string cursor = EncodeCursor(Cursor{0, 50});
    JSONValue resp = f.call(std::format(R"({{"jsonrpc":"2.0","id":1,"method":"tools/list","params":{{"cursor":"{}"}}}})",
                                        cursor));
    const JSONValue& result = At(resp, "result");
    const auto& tools = Items(At(result, "tools"));
    ASSERT_EQ(tools.size(), 50u);
    EXPECT_EQ(Str(At(*tools[0], "name")), "tool_00");
    EXPECT_EQ(Str(At(*tools[49], "name")), "tool_49");

    auto next = DecodeCursor(Str(At(result, "nextCursor")));
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->offset, 50);
    EXPECT_EQ(next->limit, 50);

    JSONValue page2 = f.call(std::format(R"({{"jsonrpc":"2.0","id":2,"method":"tools/list","params":{{"cursor":"{}"}}}})",
                                         Str(At(result, "nextCursor"))));
    const JSONValue& result2 = At(page2, "result");
    EXPECT_EQ(Items(At(result2, "tools")).size(), 10u);
    EXPECT_FALSE(Has(result2, "nextCursor"));
}

TEST(JsonRpcHandler, MalformedCursorIsInvalidParams) {
    Fixture f;
    JSONValue resp = f.call(R"({"jsonrpc":"2.0","id":1,"method":"prompts/list","params":{"cursor":"%%%"}})");
    EXPECT_EQ(Int(At(At(resp, "error"), "code")), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(Str(At(At(resp, "error"), "message")), "Invalid parameters: Invalid cursor");
}

TEST(JsonRpcHandler, ParseErrorHasNullId) {
    Fixture f;
    JSONValue resp = f.call("{not json");
    EXPECT_EQ(Int(At(At(resp, "error"), "code")), JSONRPCErrorCodes::ParseError);
    EXPECT_EQ(Str(At(At(resp, "error"), "message")), "Parse error");
    EXPECT_TRUE(At(resp, "id").IsNull());
}

TEST(JsonRpcHandler, NullIdRequestIsAnsweredWithNullId) {
    Fixture f;
    JSONValue resp = f.call(R"({"jsonrpc":"2.0","id":null,"method":"ping"})");
    ASSERT_TRUE(Has(resp, "id"));
    EXPECT_TRUE(At(resp, "id").IsNull());
    EXPECT_TRUE(Has(resp, "result"));
    EXPECT_FALSE(Has(resp, "error"));
    EXPECT_EQ(f.handler->Classify(ParseJSON(R"({"jsonrpc":"2.0","id":null,"method":"ping"})")),
              IJsonRpcHandler::MessageKind::Request);
}

TEST(JsonRpcHandler, InvalidEnvelopeEchoesId) {
    Fixture f;
    JSONValue badVersion = f.call(R"({"jsonrpc":"1.0","id":9,"method":"ping"})");
    EXPECT_EQ(Int(At(At(badVersion, "error"), "code")), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(Int(At(badVersion, "id")), 9);

    JSONValue noMethod = f.call(R"({"jsonrpc":"2.0","id":"x"})");
    EXPECT_EQ(Int(At(At(noMethod, "error"), "code")), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(Str(At(noMethod, "id")), "x");

    JSONValue badId = f.call(R"({"jsonrpc":"2.0","id":{"a":1},"method":"ping"})");
    EXPECT_EQ(Int(At(At(badId, "error"), "code")), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_TRUE(At(badId, "id").IsNull());

    JSONValue scalar = f.call("42");
    EXPECT_EQ(Int(At(At(scalar, "error"), "code")), JSONRPCErrorCodes::InvalidRequest);
}

TEST(JsonRpcHandler, PositionalParamsAreRejected) {
    Fixture f;
    JSONValue resp = f.call(R"({"jsonrpc":"2.0","id":1,"method":"tools/list","params":[1,2]})");
    EXPECT_EQ(Int(At(At(resp, "error"), "code")), JSONRPCErrorCodes::InvalidParams);

    JSONValue scalar = f.call(R"({"jsonrpc":"2.0","id":2,"method":"tools/list","params":"x"})");
    EXPECT_EQ(Int(At(At(scalar, "error"), "code")), JSONRPCErrorCodes::InvalidRequest);

    JSONValue nullParams = f.call(R"({"jsonrpc":"2.0","id":3,"method":"tools/list","params":null})");
    EXPECT_TRUE(Has(nullParams, "result"));
}

TEST(JsonRpcHandler, UnknownMethodIsMethodNotFound) {
    Fixture f;
    JSONValue resp = f.call(R"({"jsonrpc":"2.0","id":1,"method":"sampling/createMessage"})");
    EXPECT_EQ(Int(At(At(resp, "error"), "code")), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(Str(At(At(resp, "error"), "message")), "Method not found: sampling/createMessage");

    JSONValue sub = f.call(R"({"jsonrpc":"2.0","id":2,"method":"tools/unknown"})");
    EXPECT_EQ(Int(At(At(sub, "error"), "code")), JSONRPCErrorCodes::MethodNotFound);
}

TEST(JsonRpcHandler, NotificationsProduceNoOutput) {
    Fixture f;
    EXPECT_FALSE(f.handler->ProcessRequest(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").has_value());
    EXPECT_TRUE(f.processor->IsInitialized());
    EXPECT_FALSE(f.handler->ProcessRequest(R"({"jsonrpc":"2.0","method":"notifications/cancelled",)"
                                           R"("params":{"requestId":5,"reason":"user"}})").has_value());
    EXPECT_FALSE(f.handler->ProcessRequest(R"({"jsonrpc":"2.0","method":"no/such/notification"})").has_value());
    EXPECT_FALSE(f.handler->ProcessRequest(R"({"jsonrpc":"2.0","method":"notifications/x","params":[1]})").has_value());
}

TEST(JsonRpcHandler, PeerResponsesAreIgnored) {
    Fixture f;
    EXPECT_FALSE(f.handler->ProcessRequest(R"({"jsonrpc":"2.0","id":1,"result":{}})").has_value());
    EXPECT_FALSE(f.handler->ProcessRequest(R"({"jsonrpc":"2.0","id":1,"error":{"code":-1,"message":"x"}})").has_value());
}

TEST(JsonRpcHandler, BatchMixesResponsesAndSkipsNotifications) {
    Fixture f;
    JSONValue resp = f.call(R"([{"jsonrpc":"2.0","id":1,"method":"ping"},)"
                            R"({"jsonrpc":"2.0","method":"notifications/initialized"},)"
                            R"({"jsonrpc":"2.0","id":2,"method":"nope"},)"
                            R"(5])");
    const auto& items = Items(resp);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(Int(At(*items[0], "id")), 1);
    EXPECT_TRUE(Has(*items[0], "result"));
    EXPECT_EQ(Int(At(At(*items[1], "error"), "code")), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(Int(At(At(*items[2], "error"), "code")), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_TRUE(At(*items[2], "id").IsNull());
}

TEST(JsonRpcHandler, BatchEdgeCases) {
    Fixture f;
    JSONValue empty = f.call("[]");
    EXPECT_EQ(Int(At(At(empty, "error"), "code")), JSONRPCErrorCodes::InvalidRequest);

    EXPECT_FALSE(f.handler->ProcessRequest(R"([{"jsonrpc":"2.0","method":"notifications/initialized"}])").has_value());
}

TEST(JsonRpcHandler, OversizedMessageIsRejectedBeforeParsing) {
    ServerConfig config;
    config.maxMessageSize = 32;
    Fixture f(config);
    JSONValue resp = f.call(std::string(R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{"pad":")") +
                            std::string(64, 'x') + "\"}}");
    EXPECT_EQ(Int(At(At(resp, "error"), "code")), JSONRPCErrorCodes::MessageTooLarge);
    EXPECT_TRUE(At(resp, "id").IsNull());
}

TEST(JsonRpcHandler, ToolFailureIsInBand) {
    Fixture f;
    f.registry->RegisterTool("boom", MakeTool([](const JSONValue&) -> JSONValue { throw std::runtime_error("kaput"); }));
    JSONValue resp = f.call(R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"boom"}})");
    const JSONValue& result = At(resp, "result");
    EXPECT_TRUE(Bool(At(result, "isError")));
    EXPECT_EQ(Str(At(*Items(At(result, "content"))[0], "text")), "Tool execution failed: kaput");
}

TEST(JsonRpcHandler, StrictLifecycleRequiresInitialize) {
    ServerConfig config;
    config.strictLifecycle = true;
    Fixture f(config);

    JSONValue early = f.call(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    EXPECT_EQ(Int(At(At(early, "error"), "code")), JSONRPCErrorCodes::InitializationRequired);

    JSONValue ping = f.call(R"({"jsonrpc":"2.0","id":2,"method":"ping"})");
    EXPECT_TRUE(Has(ping, "result"));

    JSONValue init = f.call(R"({"jsonrpc":"2.0","id":3,"method":"initialize","params":{"protocolVersion":"2024-11-05"}})");
    EXPECT_TRUE(Has(init, "result"));

    JSONValue again = f.call(R"({"jsonrpc":"2.0","id":4,"method":"initialize","params":{}})");
    EXPECT_EQ(Int(At(At(again, "error"), "code")), JSONRPCErrorCodes::AlreadyInitialized);

    JSONValue list = f.call(R"({"jsonrpc":"2.0","id":5,"method":"tools/list"})");
    EXPECT_TRUE(Has(list, "result"));
}

TEST(JsonRpcHandler, ResourceReadFailureIsInBand) {
    ServerConfig config;
    config.debug = true;
    Fixture f(config);
    f.registry->RegisterResource("broken", MakeResource("test://broken", [](const JSONValue::Object&) -> JSONValue {
        throw std::runtime_error("disk gone");
    }));
    JSONValue resp = f.call(R"({"jsonrpc":"2.0","id":1,"method":"resources/read","params":{"uri":"test://broken"}})");
    const JSONValue& err = At(At(resp, "result"), "error");
    EXPECT_EQ(Int(At(err, "code")), JSONRPCErrorCodes::InternalError);
    EXPECT_EQ(Str(At(err, "message")), "Failed to read resource: disk gone");
}

TEST(JsonRpcHandler, ClassifyDistinguishesMessageKinds) {
    Fixture f;
    EXPECT_EQ(f.handler->Classify(ParseJSON(R"({"jsonrpc":"2.0","id":1,"method":"ping"})")),
              IJsonRpcHandler::MessageKind::Request);
    EXPECT_EQ(f.handler->Classify(ParseJSON(R"({"jsonrpc":"2.0","method":"x"})")),
              IJsonRpcHandler::MessageKind::Notification);
    EXPECT_EQ(f.handler->Classify(ParseJSON(R"({"jsonrpc":"2.0","id":1,"result":1})")),
              IJsonRpcHandler::MessageKind::Response);
    EXPECT_EQ(f.handler->Classify(ParseJSON("[]")), IJsonRpcHandler::MessageKind::Batch);
    EXPECT_EQ(f.handler->Classify(ParseJSON(R"({"jsonrpc":"2.0","id":1.5,"method":"ping"})")),
              IJsonRpcHandler::MessageKind::Invalid);
}

TEST(JsonRpcHandler, NullProcessorIsRejected) {
    EXPECT_THROW(MakeJsonRpcHandler(nullptr), std::invalid_argument);
}
