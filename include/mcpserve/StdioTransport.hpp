//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.hpp
// Purpose: Concrete stdio-based server transport
//==========================================================================================================
#pragma once

#include "mcpserve/Transport.h"
#include <cstddef>
#include <iosfwd>
#include <memory>

namespace mcpserve {

//==========================================================================================================
// StdioTransport
// Purpose: JSON-RPC transport over an input/output stream pair (stdin/stdout by default) for local
//          tool integrations.
// Notes:
//   - Line framing: one JSON payload per line; blank lines are skipped.
//   - Content-Length framing: "Content-Length: N\r\n\r\n<body>"; a bad header is logged and the frame dropped.
//   - Replies use the same framing and are written under a mutex.
//   - End of input is reported to the error handler as "StdioTransport: end of input".
//==========================================================================================================
class StdioTransport : public IServerTransport {
public:
    enum class Framing {
        Line,
        ContentLength
    };

    struct Options {
        Framing framing{Framing::Line};
        std::size_t maxContentLength{10 * 1024 * 1024};
    };

    StdioTransport();
    explicit StdioTransport(const Options& opts);
    // Streams must outlive the transport
    StdioTransport(const Options& opts, std::istream& in, std::ostream& out);
    virtual ~StdioTransport();

    ////////////////////////////////////////// IServerTransport //////////////////////////////////////////
    //==========================================================================================================
    // Starts the reader loop.
    // Returns:
    //   Future that completes when the loop is running.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the reader loop. A reader blocked on a read that never completes is detached.
    // Returns:
    //   Future that completes when stopped.
    //==========================================================================================================
    std::future<void> Stop() override;

    void SetMessageHandler(MessageHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    // True while the reader loop runs (false after end of input or Stop)
    bool IsRunning() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// StdioTransportFactory
// Purpose: Factory for creating stdio transports. Config: "" or "line" for line framing,
//          "content-length" for Content-Length framing.
//==========================================================================================================
class StdioTransportFactory : public IServerTransportFactory {
public:
    std::unique_ptr<IServerTransport> CreateTransport(const std::string& config) override;
};

} // namespace mcpserve
