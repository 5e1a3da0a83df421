//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Interface for message framing on byte-stream transports (newline or Content-Length)
//========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <memory>

namespace mcpserve {

class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,
        BodyTooLarge
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // header+sep or full frame bytes to drop when appropriate
        std::size_t frameSize{0};           // full frame size once the length header is parsed (0 otherwise)
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

// "Content-Length: N\r\n\r\n<body>" frames; larger bodies are rejected with BodyTooLarge
std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = 10 * 1024 * 1024);

// One payload per line; a trailing '\r' is stripped and blank lines decode to empty payloads
std::unique_ptr<IContentFramer> MakeLineFramer(std::size_t maxLineLength = 10 * 1024 * 1024);

} // namespace mcpserve
