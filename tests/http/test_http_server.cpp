//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/http/test_http_server.cpp
// Purpose: Loopback tests for the HTTP server transport using a synchronous Beast client
//==========================================================================================================

#include <gtest/gtest.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <memory>
#include <string>

#include "mcpserve/HTTPServer.hpp"
#include "mcpserve/JsonRpcHandler.h"
#include "mcpserve/LegacyComponents.h"
#include "mcpserve/Registry.h"
#include "test_helpers.h"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using namespace mcpserve;
using namespace testutil;

namespace {

http::response<http::string_body> sendRequest(unsigned short port, http::verb verb, const std::string& target,
                                              const std::string& body = std::string()) {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    stream.connect(resolver.resolve("127.0.0.1", std::to_string(port)));

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::content_type, "application/json");
    req.body() = body;
    req.prepare_payload();
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto registry = std::make_shared<ComponentRegistry>();
        registry->RegisterTool("echo", MakeTool([](const JSONValue& args) { return args; }));
        rpc = MakeJsonRpcHandler(std::make_shared<MessageProcessor>(registry));

        HTTPServer::Options opts;
        opts.port = "0";
        server = std::make_unique<HTTPServer>(opts);
        std::shared_ptr<IJsonRpcHandler> handler = rpc;
        server->SetMessageHandler([handler](const std::string& payload) { return handler->ProcessRequest(payload); });
        server->Start().get();
        port = server->GetPort();
        ASSERT_NE(port, 0);
    }

    void TearDown() override {
        if (server) {
            server->Stop().get();
        }
    }

    std::shared_ptr<IJsonRpcHandler> rpc;
    std::unique_ptr<HTTPServer> server;
    unsigned short port{0};
};

} // namespace

TEST_F(HttpServerTest, PostReturnsJsonRpcReply) {
    auto res = sendRequest(port, http::verb::post, "/mcp", R"({"jsonrpc":"2.0","id":7,"method":"tools/list"})");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(std::string(res[http::field::content_type]), "application/json");
    JSONValue body = ParseJSON(res.body());
    EXPECT_EQ(Int(At(body, "id")), 7);
    EXPECT_EQ(Items(At(At(body, "result"), "tools")).size(), 1u);
}

TEST_F(HttpServerTest, NotificationIsAccepted) {
    auto res = sendRequest(port, http::verb::post, "/mcp", R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    EXPECT_EQ(res.result(), http::status::accepted);
    EXPECT_TRUE(res.body().empty());
}

TEST_F(HttpServerTest, ParseErrorsAreStillHttp200) {
    auto res = sendRequest(port, http::verb::post, "/mcp?session=1", "{not json");
    EXPECT_EQ(res.result(), http::status::ok);
    JSONValue body = ParseJSON(res.body());
    EXPECT_TRUE(At(body, "id").IsNull());
    EXPECT_EQ(Int(At(At(body, "error"), "code")), -32700);
}

TEST_F(HttpServerTest, RoutingErrors) {
    auto wrongVerb = sendRequest(port, http::verb::get, "/mcp");
    EXPECT_EQ(wrongVerb.result(), http::status::method_not_allowed);
    EXPECT_EQ(std::string(wrongVerb[http::field::allow]), "POST");

    EXPECT_EQ(sendRequest(port, http::verb::post, "/other", "{}").result(), http::status::not_found);

    auto health = sendRequest(port, http::verb::get, "/mcp/health");
    EXPECT_EQ(health.result(), http::status::ok);
    EXPECT_EQ(health.body(), R"({"status":"ok"})");
}

TEST(HttpServer, MissingHandlerIsServiceUnavailable) {
    HTTPServer::Options opts;
    opts.port = "0";
    HTTPServer server(opts);
    server.Start().get();
    auto res = sendRequest(server.GetPort(), http::verb::post, "/mcp", R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_EQ(res.result(), http::status::service_unavailable);
    EXPECT_EQ(Int(At(At(ParseJSON(res.body()), "error"), "code")), -32603);
    server.Stop().get();
}

TEST(HttpServer, InvalidPortFailsStart) {
    HTTPServer::Options opts;
    opts.port = "not-a-port";
    HTTPServer server(opts);
    EXPECT_ANY_THROW(server.Start().get());
    EXPECT_EQ(server.GetPort(), 0);
}

TEST(HTTPServerFactory, ParseOptions) {
    auto plain = HTTPServerFactory::ParseOptions("http://0.0.0.0:9000/rpc/");
    EXPECT_EQ(plain.scheme, "http");
    EXPECT_EQ(plain.address, "0.0.0.0");
    EXPECT_EQ(plain.port, "9000");
    EXPECT_EQ(plain.path, "/rpc");

    auto tls = HTTPServerFactory::ParseOptions(" https://[::1]:8443?cert=c.pem&key=k.pem&x=1 ");
    EXPECT_EQ(tls.scheme, "https");
    EXPECT_EQ(tls.address, "::1");
    EXPECT_EQ(tls.port, "8443");
    EXPECT_EQ(tls.path, "/mcp");
    EXPECT_EQ(tls.certFile, "c.pem");
    EXPECT_EQ(tls.keyFile, "k.pem");

    auto bare = HTTPServerFactory::ParseOptions("localhost");
    EXPECT_EQ(bare.address, "localhost");
    EXPECT_EQ(bare.port, "8000");
}
