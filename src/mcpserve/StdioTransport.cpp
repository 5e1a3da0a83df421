//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioTransport.cpp
// Purpose: stdio-based server transport implementation
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <future>
#include <iostream>
#include <limits>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "logging/Logger.h"
#include "mcpserve/ContentFramer.h"
#include "mcpserve/StdioTransport.hpp"

namespace mcpserve {

namespace {

// Reader state shared with the reader thread so a detached reader never outlives it
struct ReaderLoop {
    std::istream& in;
    std::ostream& out;
    StdioTransport::Options opts;
    std::unique_ptr<IContentFramer> framer;

    std::mutex handlerMutex;
    IServerTransport::MessageHandler messageHandler;
    IServerTransport::ErrorHandler errorHandler;

    std::mutex writeMutex;
    std::atomic<bool> running{false};
    std::atomic<bool> exited{false};

    ReaderLoop(std::istream& i, std::ostream& o, const StdioTransport::Options& op)
        : in(i), out(o), opts(op),
          framer(op.framing == StdioTransport::Framing::ContentLength ? MakeContentLengthFramer(op.maxContentLength)
                                                                      : MakeLineFramer(op.maxContentLength)) {}

    void reportError(const std::string& msg) {
        IServerTransport::ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            handler = errorHandler;
        }
        if (handler) {
            try {
                handler(msg);
            } catch (const std::exception& e) {
                LOG_ERROR("StdioTransport: error handler exception: {}", e.what());
            }
        }
    }

    static bool isBlank(const std::string& s) {
        return std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isspace(c) != 0; });
    }

    std::optional<std::string> readLineFrame() {
        std::string line;
        while (running.load() && std::getline(in, line)) {
            std::string buffer = line + "\n";
            auto r = framer->tryDecodeEx(buffer);
            if (r.status != IContentFramer::DecodeStatus::Ok || !r.payload.has_value()) {
                LOG_WARN("StdioTransport: dropping line of {} bytes", line.size());
                continue;
            }
            if (isBlank(r.payload.value())) {
                continue;
            }
            return r.payload;
        }
        return std::nullopt;
    }

    std::optional<std::string> readContentLengthFrame() {
        while (running.load()) {
            std::string header;
            std::string line;
            bool sawHeader = false;
            bool complete = false;
            while (std::getline(in, line)) {
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                if (line.empty()) {
                    if (!sawHeader) {
                        continue; // stray separator between frames
                    }
                    complete = true;
                    break;
                }
                sawHeader = true;
                header += line + "\r\n";
            }
            if (!complete) {
                if (sawHeader) {
                    LOG_WARN("StdioTransport: end of input inside a frame header");
                }
                return std::nullopt;
            }
            header += "\r\n";

            auto r = framer->tryDecodeEx(header);
            if (r.status == IContentFramer::DecodeStatus::Ok) {
                return r.payload;
            }
            if (r.status == IContentFramer::DecodeStatus::BodyTooLarge) {
                LOG_WARN("StdioTransport: dropping frame with oversized body");
                if (r.frameSize > header.size()) {
                    const std::size_t skip = r.frameSize - header.size();
                    in.ignore(static_cast<std::streamsize>(
                        std::min<std::size_t>(skip, static_cast<std::size_t>(std::numeric_limits<std::streamsize>::max()))));
                }
                continue;
            }
            if (r.status != IContentFramer::DecodeStatus::Incomplete || r.frameSize < header.size()) {
                LOG_WARN("StdioTransport: dropping frame with invalid header");
                continue;
            }

            const std::size_t contentLength = r.frameSize - header.size();
            std::string frame = header;
            frame.resize(r.frameSize);
            std::size_t total = 0;
            while (total < contentLength) {
                in.read(&frame[header.size() + total], static_cast<std::streamsize>(contentLength - total));
                std::streamsize got = in.gcount();
                if (got <= 0) {
                    LOG_WARN("Unexpected EOF while reading body (read {} of {} bytes)", total, contentLength);
                    return std::nullopt;
                }
                total += static_cast<std::size_t>(got);
            }
            auto done = framer->tryDecodeEx(frame);
            if (done.status == IContentFramer::DecodeStatus::Ok) {
                return done.payload;
            }
            LOG_WARN("StdioTransport: failed to decode frame of {} bytes", frame.size());
        }
        return std::nullopt;
    }

    void writeFrame(const std::string& payload) {
        std::lock_guard<std::mutex> lk(writeMutex);
        out << framer->encode(payload);
        out.flush();
        if (!out.good()) {
            LOG_ERROR("StdioTransport: write failed");
            reportError("StdioTransport: write failed");
        }
    }

    void run() {
        for (;;) {
            std::optional<std::string> payload = opts.framing == StdioTransport::Framing::ContentLength
                                                     ? readContentLengthFrame()
                                                     : readLineFrame();
            if (!payload.has_value()) {
                break;
            }
            IServerTransport::MessageHandler handler;
            {
                std::lock_guard<std::mutex> lk(handlerMutex);
                handler = messageHandler;
            }
            if (!handler) {
                LOG_WARN("StdioTransport: no message handler; dropping {} bytes", payload->size());
                continue;
            }
            std::optional<std::string> reply;
            try {
                reply = handler(payload.value());
            } catch (const std::exception& e) {
                LOG_ERROR("StdioTransport: message handler exception: {}", e.what());
                reportError(std::string("StdioTransport: message handler exception: ") + e.what());
                continue;
            }
            if (reply.has_value()) {
                writeFrame(reply.value());
            }
        }
        // Only a loop that was not stopped reports end of input
        const bool wasRunning = running.exchange(false);
        exited.store(true);
        if (wasRunning) {
            LOG_INFO("StdioTransport: end of input");
            reportError("StdioTransport: end of input");
        }
    }
};

} // namespace

class StdioTransport::Impl {
public:
    std::shared_ptr<ReaderLoop> loop;
    std::thread readerThread;

    Impl(const StdioTransport::Options& opts, std::istream& in, std::ostream& out)
        : loop(std::make_shared<ReaderLoop>(in, out, opts)) {}

    ~Impl() {
        stop();
    }

    void stop() {
        loop->running.store(false);
        if (readerThread.joinable()) {
            if (loop->exited.load()) {
                readerThread.join();
            } else {
                // Best-effort: avoid blocking if the thread is stuck in a blocking read
                readerThread.detach();
            }
        }
    }
};

StdioTransport::StdioTransport() : StdioTransport(Options{}) {}

StdioTransport::StdioTransport(const Options& opts) : StdioTransport(opts, std::cin, std::cout) {}

StdioTransport::StdioTransport(const Options& opts, std::istream& in, std::ostream& out)
    : pImpl(std::make_unique<Impl>(opts, in, out)) {}

StdioTransport::~StdioTransport() = default;

std::future<void> StdioTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> ready;
    auto fut = ready.get_future();
    if (pImpl->readerThread.joinable()) {
        LOG_WARN("StdioTransport: already started");
        ready.set_value();
        return fut;
    }
    pImpl->loop->exited.store(false);
    pImpl->loop->running.store(true);
    auto loop = pImpl->loop;
    pImpl->readerThread = std::thread([loop, pr = std::move(ready)]() mutable {
        pr.set_value();
        loop->run();
    });
    LOG_INFO("StdioTransport: started ({} framing)",
             pImpl->loop->opts.framing == Framing::ContentLength ? "content-length" : "line");
    return fut;
}

std::future<void> StdioTransport::Stop() {
    FUNC_SCOPE();
    std::promise<void> done;
    auto fut = done.get_future();
    pImpl->stop();
    done.set_value();
    return fut;
}

void StdioTransport::SetMessageHandler(MessageHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->loop->handlerMutex);
    pImpl->loop->messageHandler = std::move(handler);
}

void StdioTransport::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->loop->handlerMutex);
    pImpl->loop->errorHandler = std::move(handler);
}

bool StdioTransport::IsRunning() const {
    return pImpl->loop->running.load();
}

std::unique_ptr<IServerTransport> StdioTransportFactory::CreateTransport(const std::string& config) {
    StdioTransport::Options opts;
    std::string cfg;
    for (char c : config) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            cfg.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    if (cfg == "content-length" || cfg == "contentlength") {
        opts.framing = StdioTransport::Framing::ContentLength;
    } else if (!cfg.empty() && cfg != "line") {
        LOG_WARN("StdioTransportFactory: unknown framing '{}', using line framing", config);
    }
    return std::make_unique<StdioTransport>(opts);
}

} // namespace mcpserve
