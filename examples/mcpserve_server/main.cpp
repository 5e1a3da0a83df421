//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcpserve demo server (stdio or HTTP) with sample tools, resources and prompts
//==========================================================================================================

#include "logging/Logger.h"
#include "env/EnvVars.h"
#include "mcpserve/Components.h"
#include "mcpserve/HTTPServer.hpp"
#include "mcpserve/JsonRpcHandler.h"
#include "mcpserve/LegacyComponents.h"
#include "mcpserve/MessageProcessor.h"
#include "mcpserve/Registry.h"
#include "mcpserve/ServerConfig.h"
#include "mcpserve/StdioTransport.hpp"
#include "mcpserve/version.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <chrono>
#include <csignal>
#include <cstddef>
#include <ctime>
#include <future>
#include <iomanip>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>

using namespace mcpserve;

namespace {

//==========================================================================================================
// Parses simple key=value style command-line options.
// Args:
//   argc: Argument count
//   argv: Argument values
//   key: Option name including leading dashes (e.g., "--transport")
// Returns:
//   Optional value string when present; empty optional otherwise
//==========================================================================================================
std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

std::shared_ptr<JSONValue> str(const std::string& s) {
    return std::make_shared<JSONValue>(s);
}

JSONValue stringProperty(const std::string& description) {
    JSONValue::Object p;
    p["type"] = str("string");
    p["description"] = str(description);
    return JSONValue{p};
}

JSONValue numberProperty(const std::string& description) {
    JSONValue::Object p;
    p["type"] = str("number");
    p["description"] = str(description);
    return JSONValue{p};
}

double numberArg(const JSONValue::Object& args, const std::string& key) {
    const JSONValue* v = json::find(args, key);
    if (v == nullptr || !v->IsNumber()) {
        throw std::invalid_argument("argument '" + key + "' must be a number");
    }
    if (v->IsInteger()) {
        return static_cast<double>(std::get<int64_t>(v->value));
    }
    return std::get<double>(v->value);
}

///////////////////////////////////////////// Demo components /////////////////////////////////////////////
class CalculatorTool : public ITool {
public:
    std::string Description() const override {
        return "Performs basic arithmetic (add, subtract, multiply, divide) on two numbers";
    }

    JSONValue InputSchema() const override {
        JSONValue::Array ops;
        for (const char* op : {"add", "subtract", "multiply", "divide"}) {
            ops.push_back(str(op));
        }
        JSONValue::Object operation;
        operation["type"] = str("string");
        operation["enum"] = std::make_shared<JSONValue>(JSONValue{ops});

        JSONValue::Object props;
        props["operation"] = std::make_shared<JSONValue>(JSONValue{operation});
        props["a"] = std::make_shared<JSONValue>(numberProperty("First operand"));
        props["b"] = std::make_shared<JSONValue>(numberProperty("Second operand"));

        JSONValue::Array required{str("operation"), str("a"), str("b")};
        JSONValue::Object schema;
        schema["type"] = str("object");
        schema["properties"] = std::make_shared<JSONValue>(JSONValue{props});
        schema["required"] = std::make_shared<JSONValue>(JSONValue{required});
        return JSONValue{schema};
    }

    bool ValidateArguments(const JSONValue& arguments) const override {
        if (!arguments.IsObject()) {
            return false;
        }
        const auto& args = std::get<JSONValue::Object>(arguments.value);
        auto op = json::getString(args, "operation");
        const JSONValue* a = json::find(args, "a");
        const JSONValue* b = json::find(args, "b");
        return op.has_value() && a != nullptr && a->IsNumber() && b != nullptr && b->IsNumber();
    }

    JSONValue Execute(const JSONValue& arguments) override {
        const auto args = json::asObject(arguments);
        const std::string op = json::getString(args, "operation").value_or("");
        const double a = numberArg(args, "a");
        const double b = numberArg(args, "b");
        double result = 0.0;
        if (op == "add") {
            result = a + b;
        } else if (op == "subtract") {
            result = a - b;
        } else if (op == "multiply") {
            result = a * b;
        } else if (op == "divide") {
            if (b == 0.0) {
                throw std::domain_error("Division by zero");
            }
            result = a / b;
        } else {
            throw std::invalid_argument("Unknown operation: " + op);
        }
        JSONValue::Object out;
        out["operation"] = str(op);
        out["result"] = std::make_shared<JSONValue>(result);
        return JSONValue{out};
    }
};

class ServerConfigResource : public IResource {
public:
    explicit ServerConfigResource(const ServerConfig& config) : config(config) {}

    std::string Uri() const override { return "config://server"; }
    std::string Description() const override { return "Effective server configuration"; }
    std::string MimeType() const override { return "application/json"; }

    JSONValue::Object Metadata() const override {
        JSONValue::Object meta;
        meta["category"] = str("system");
        return meta;
    }

    JSONValue Read(const JSONValue::Object& params) override {
        (void)params;
        JSONValue::Object cfg;
        cfg["name"] = str(config.serverInfo.name);
        cfg["version"] = str(config.serverInfo.version);
        cfg["protocolVersion"] = str(config.protocolVersion);
        cfg["pageSize"] = std::make_shared<JSONValue>(static_cast<int64_t>(config.defaultPageSize));
        cfg["strictLifecycle"] = std::make_shared<JSONValue>(config.strictLifecycle);
        cfg["validation"] = str(validation::toString(config.validationMode));

        JSONValue::Object block;
        block["uri"] = str(Uri());
        block["mimeType"] = str(MimeType());
        block["text"] = str(SerializePrettyJSON(JSONValue{cfg}, 4));
        return JSONValue{JSONValue::Array{std::make_shared<JSONValue>(JSONValue{block})}};
    }

private:
    ServerConfig config;
};

class EmailTemplatePrompt : public IPrompt {
public:
    std::string Description() const override { return "Drafts a short email to a recipient about a topic"; }

    JSONValue Arguments() const override {
        auto argument = [](const std::string& name, const std::string& description, bool required) {
            JSONValue::Object a;
            a["name"] = str(name);
            a["description"] = str(description);
            a["required"] = std::make_shared<JSONValue>(required);
            return std::make_shared<JSONValue>(JSONValue{a});
        };
        return JSONValue{JSONValue::Array{argument("recipient", "Who the email is for", true),
                                          argument("topic", "What the email is about", false)}};
    }

    bool ValidateArguments(const JSONValue& arguments) const override {
        return json::getString(json::asObject(arguments), "recipient").has_value();
    }

    JSONValue Process(const JSONValue& arguments) override {
        const auto args = json::asObject(arguments);
        const std::string recipient = json::getString(args, "recipient").value_or("there");
        const std::string topic = json::getString(args, "topic").value_or("our next steps");
        return JSONValue{"Write a friendly, concise email to " + recipient + " about " + topic + "."};
    }
};

std::string currentTimeIso() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm buf{};
    ::gmtime_r(&now, &buf);
    std::ostringstream oss;
    oss << std::put_time(&buf, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

void registerDemoComponents(IComponentRegistry& registry, const ServerConfig& config) {
    registry.RegisterTool("calculator", std::make_shared<CalculatorTool>());

    JSONValue::Object echoProps;
    echoProps["message"] = std::make_shared<JSONValue>(stringProperty("Text to echo back"));
    JSONValue::Object echoSchema;
    echoSchema["type"] = str("object");
    echoSchema["properties"] = std::make_shared<JSONValue>(JSONValue{echoProps});
    echoSchema["required"] = std::make_shared<JSONValue>(JSONValue{JSONValue::Array{str("message")}});
    registry.RegisterTool("echo",
                          MakeTool([](const JSONValue& args) {
                              return JSONValue{json::getString(json::asObject(args), "message").value_or("")};
                          }, std::string("Echo a message"), JSONValue{echoSchema}));

    // Hook-based tool: description from a property, dispatch through invoke
    LegacyTool::Hooks clockHooks;
    clockHooks.typeName = "ClockTool";
    clockHooks.descriptionProperty = "Returns the current UTC time";
    clockHooks.invoke = [](const JSONValue&) { return JSONValue{currentTimeIso()}; };
    registry.RegisterTool("clock", std::make_shared<LegacyTool>(std::move(clockHooks)));

    registry.RegisterResource("server-config", std::make_shared<ServerConfigResource>(config));
    registry.RegisterResourceTemplate(ResourceTemplate("config://server/{section}", "server-config-section",
                                                       std::string("One section of the server configuration"),
                                                       std::string("application/json")));

    registry.RegisterPrompt("email-template", std::make_shared<EmailTemplatePrompt>());
}

} // namespace

int main(int argc, char** argv) {
    FUNC_SCOPE();
    const std::string transportKind = getArgValue(argc, argv, "--transport").value_or("stdio");
    if (transportKind == "stdio") {
        // stdout carries JSON-RPC frames
        Logger::setUseStderr(true);
    }
    Logger::setLogLevelFromString(GetEnvOrDefault("MCPSERVE_LOG_LEVEL", "INFO"));
    if (auto lvl = getArgValue(argc, argv, "--log-level"); lvl.has_value()) {
        if (!Logger::setLogLevelFromString(lvl.value())) {
            LOG_WARN("Unknown --log-level '{}'; keeping current level", lvl.value());
        }
    }
    if (auto file = getArgValue(argc, argv, "--log-file"); file.has_value()) {
        Logger::setLogFile(file.value());
    }

    ServerConfig config = ServerConfig::FromEnvironment();
    LOG_INFO("mcpserve {} starting ({} transport)", getVersionString(), transportKind);

    auto registry = std::make_shared<ComponentRegistry>();
    registerDemoComponents(*registry, config);
    auto processor = std::make_shared<MessageProcessor>(registry, config);
    std::shared_ptr<IJsonRpcHandler> rpc = MakeJsonRpcHandler(processor);
    auto onMessage = [rpc](const std::string& payload) { return rpc->ProcessRequest(payload); };

    if (transportKind == "stdio") {
        StdioTransportFactory factory;
        auto transport = factory.CreateTransport(getArgValue(argc, argv, "--framing").value_or("line"));
        std::promise<void> stopped;
        std::once_flag once;
        transport->SetMessageHandler(onMessage);
        transport->SetErrorHandler([&stopped, &once](const std::string& err) {
            LOG_INFO("Server stopping: {}", err);
            std::call_once(once, [&stopped]() { stopped.set_value(); });
        });
        transport->Start().get();
        stopped.get_future().wait();
        transport->Stop().get();
        return 0;
    }

    if (transportKind == "http") {
        const std::string defaultUrl = "http://" + config.http.host + ":" + std::to_string(config.http.port) +
                                       config.http.path;
        const std::string url = getArgValue(argc, argv, "--http").value_or(defaultUrl);
        HTTPServerFactory factory;
        std::unique_ptr<IServerTransport> server;
        try {
            server = factory.CreateTransport(url);
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to create HTTP server for {}: {}", url, e.what());
            return 1;
        }
        server->SetMessageHandler(onMessage);
        server->SetErrorHandler([](const std::string& err) { LOG_ERROR("HTTPServer error: {}", err); });
        try {
            server->Start().get();
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to start HTTP server on {}: {}", url, e.what());
            return 1;
        }

        boost::asio::io_context signalContext;
        boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
        signals.async_wait([](const boost::system::error_code& ec, int signo) {
            if (!ec) {
                LOG_INFO("Received signal {}; shutting down", signo);
            }
        });
        signalContext.run();
        server->Stop().get();
        return 0;
    }

    LOG_ERROR("Unknown --transport option: {} (expected stdio|http)", transportKind);
    return 2;
}
