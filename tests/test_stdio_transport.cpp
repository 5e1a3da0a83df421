//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_transport.cpp
// Purpose: Stream-backed tests for the stdio transport (line and Content-Length framing)
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "mcpserve/JsonRpcHandler.h"
#include "mcpserve/LegacyComponents.h"
#include "mcpserve/Registry.h"
#include "mcpserve/StdioTransport.hpp"
#include "test_helpers.h"

using namespace mcpserve;
using namespace testutil;

namespace {

// Runs the transport over the given input until end of input and returns everything written
std::string runToEnd(StdioTransport::Options opts, const std::string& input,
                     IServerTransport::MessageHandler handler) {
    std::istringstream in(input);
    std::ostringstream out;
    StdioTransport transport(opts, in, out);
    transport.SetMessageHandler(std::move(handler));

    auto ended = std::make_shared<std::promise<void>>();
    auto endedFuture = ended->get_future();
    transport.SetErrorHandler([ended](const std::string& error) {
        if (error == "StdioTransport: end of input") {
            ended->set_value();
        }
    });

    transport.Start().get();
    EXPECT_EQ(endedFuture.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_FALSE(transport.IsRunning());
    transport.Stop().get();
    return out.str();
}

std::vector<std::string> splitLines(const std::string& s) {
    std::vector<std::string> lines;
    std::istringstream iss(s);
    std::string line;
    while (std::getline(iss, line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

TEST(StdioTransport, LineFramingEchoesRepliesAndSkipsBlankLines) {
    std::vector<std::string> seen;
    const std::string output = runToEnd(StdioTransport::Options{}, "first\n\n   \r\nsecond\r\nlast",
                                        [&seen](const std::string& payload) -> std::optional<std::string> {
                                            seen.push_back(payload);
                                            return "re:" + payload;
                                        });
    EXPECT_EQ(seen, (std::vector<std::string>{"first", "second", "last"}));
    EXPECT_EQ(splitLines(output), (std::vector<std::string>{"re:first", "re:second", "re:last"}));
}

TEST(StdioTransport, NoReplyWritesNothing) {
    const std::string output = runToEnd(StdioTransport::Options{}, "a\nb\n",
                                        [](const std::string&) -> std::optional<std::string> { return std::nullopt; });
    EXPECT_TRUE(output.empty());
}

TEST(StdioTransport, HandlerExceptionsDoNotStopTheLoop) {
    int calls = 0;
    const std::string output = runToEnd(StdioTransport::Options{}, "boom\nok\n",
                                        [&calls](const std::string& payload) -> std::optional<std::string> {
                                            ++calls;
                                            if (payload == "boom") throw std::runtime_error("bad payload");
                                            return payload;
                                        });
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(output, "ok\n");
}

TEST(StdioTransport, ContentLengthFramingRoundTrip) {
    StdioTransport::Options opts;
    opts.framing = StdioTransport::Framing::ContentLength;
    const std::string input = std::string("Content-Length: 5\r\n\r\nhello") + "\r\n" +
                              "Content-Length: 3\r\n\r\nabc";
    std::vector<std::string> seen;
    const std::string output = runToEnd(opts, input, [&seen](const std::string& payload) -> std::optional<std::string> {
        seen.push_back(payload);
        return payload + "!";
    });
    EXPECT_EQ(seen, (std::vector<std::string>{"hello", "abc"}));
    EXPECT_EQ(output, "Content-Length: 6\r\n\r\nhello!Content-Length: 4\r\n\r\nabc!");
}

TEST(StdioTransport, ContentLengthDropsBadFrames) {
    StdioTransport::Options opts;
    opts.framing = StdioTransport::Framing::ContentLength;
    opts.maxContentLength = 4;
    const std::string input = std::string("Content-Length: nope\r\n\r\n") +
                              "Content-Length: 6\r\n\r\ntoobig" +
                              "Content-Length: 2\r\n\r\nok";
    std::vector<std::string> seen;
    runToEnd(opts, input, [&seen](const std::string& payload) -> std::optional<std::string> {
        seen.push_back(payload);
        return std::nullopt;
    });
    EXPECT_EQ(seen, (std::vector<std::string>{"ok"}));
}

TEST(StdioTransport, ServesJsonRpcEndToEnd) {
    auto registry = std::make_shared<ComponentRegistry>();
    registry->RegisterTool("echo", MakeTool([](const JSONValue& args) { return args; }));
    std::shared_ptr<IJsonRpcHandler> rpc = MakeJsonRpcHandler(std::make_shared<MessageProcessor>(registry));

    const std::string input =
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","capabilities":{"tools":{}},"clientInfo":{"name":"t","version":"1"}}})"
        "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})"
        "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})"
        "\n";
    const std::string output = runToEnd(StdioTransport::Options{}, input, [rpc](const std::string& payload) {
        return rpc->ProcessRequest(payload);
    });

    auto lines = splitLines(output);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(Int(At(ParseJSON(lines[0]), "id")), 1);
    JSONValue list = ParseJSON(lines[1]);
    EXPECT_EQ(Int(At(list, "id")), 2);
    EXPECT_EQ(Items(At(At(list, "result"), "tools")).size(), 1u);
}

TEST(StdioTransportFactory, SelectsFraming) {
    StdioTransportFactory factory;
    EXPECT_NE(factory.CreateTransport(""), nullptr);
    EXPECT_NE(factory.CreateTransport("Content-Length"), nullptr);
    EXPECT_NE(factory.CreateTransport("carrier-pigeon"), nullptr);
}
