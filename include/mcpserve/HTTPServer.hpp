//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS JSON-RPC endpoint using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <string>
#include <future>
#include <functional>
#include <memory>
#include "mcpserve/Transport.h"

namespace mcpserve {

  //==========================================================================================================
  // HTTPServer
  // Purpose: Serves MCP over HTTP: every POST to the endpoint path carries one JSON-RPC payload.
  // Responses:
  //   POST <path>           200 application/json with the reply, or 202 with an empty body when the
  //                         payload produced no reply (notifications)
  //   other verb on <path>  405 (Allow: POST)
  //   GET <path>/health     200 {"status":"ok"}
  //   anything else         404
  //==========================================================================================================
  class HTTPServer : public IServerTransport {
  public:
    //==========================================================================================================
    // Options
    // Purpose: Configuration for bind address/port, endpoint path, and TLS files.
    // Fields:
    //   address: Bind address (default: 127.0.0.1)
    //   port: Listen port (default: 8000; "0" picks an ephemeral port, see GetPort)
    //   path: JSON-RPC endpoint path
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"8000"};
        std::string path{"/mcp"};
        std::string scheme{"http"}; // "http" or "https"
        std::string certFile; // PEM (required for https)
        std::string keyFile;  // PEM (required for https)
    };

    explicit HTTPServer(const Options& opts);
    ~HTTPServer();

    //==========================================================================================================
    // Binds the listener and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the listener is bound and the I/O context is running. It holds an
    //   exception when the port is invalid or the bind fails.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the server: closes acceptor, stops I/O context, and joins background thread.
    // Returns:
    //   Future that completes when shutdown has finished.
    //==========================================================================================================
    std::future<void> Stop() override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    // Port the listener is bound to (0 before Start)
    unsigned short GetPort() const;

  private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
  };

  //==========================================================================================================
  // HTTPServerFactory
  // Purpose: Factory for creating HTTP/HTTPS servers from a configuration string. The configuration
  //          format is uri format, intentionally simple and stable:
  //            - "http://<address>:<port>/<path>" (e.g., http://127.0.0.1:8000/mcp)
  //            - "https://<address>:<port>/<path>?cert=<pem>&key=<pem>"
  //          Unknown parameters are ignored. If scheme is omitted, defaults to http; a missing path
  //          keeps "/mcp".
  //==========================================================================================================
  class HTTPServerFactory : public IServerTransportFactory {
  public:
    std::unique_ptr<IServerTransport> CreateTransport(const std::string& config) override;

    // Parsed options, exposed for callers that need the address before starting
    static HTTPServer::Options ParseOptions(const std::string& config);
  };

} // namespace mcpserve
