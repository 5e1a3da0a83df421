//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentLengthFramer.cpp
// Purpose: Content-Length and newline framers for the stdio transport
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <limits>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "mcpserve/ContentFramer.h"

namespace mcpserve {

namespace {

// Parses the decimal value of a Content-Length header; nullopt for anything but digits
std::optional<unsigned long long> parseLength(const std::string& value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        return std::numeric_limits<unsigned long long>::max();
    }
}

class ContentLengthFramer : public IContentFramer {
public:
    explicit ContentLengthFramer(std::size_t maxLen) : maxContentLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string header = "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n";
        std::string frame; frame.reserve(header.size() + payload.size());
        frame.append(header);
        frame.append(payload);
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        const std::string sep = "\r\n\r\n";
        std::size_t headerEnd = buffer.find(sep);
        if (headerEnd == std::string::npos) {
            return { DecodeStatus::Incomplete, std::nullopt, 0, 0 };
        }
        const std::size_t headerAndSep = headerEnd + sep.size();

        std::size_t pos = 0;
        std::size_t contentLength = 0;
        bool haveLength = false;
        while (pos < headerEnd) {
            std::size_t eol = buffer.find("\r\n", pos);
            if (eol == std::string::npos || eol > headerEnd) {
                eol = headerEnd;
            }
            std::string line = buffer.substr(pos, eol - pos);
            auto colon = line.find(':');
            if (colon != std::string::npos) {
                std::string name = line.substr(0, colon);
                std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
                std::string value = line.substr(colon + 1);
                value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch){ return !std::isspace(ch); }));
                value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
                if (name == "content-length") {
                    auto v64 = parseLength(value);
                    if (!v64.has_value()) {
                        LOG_WARN("Invalid Content-Length header: {}", value);
                        return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep, 0 };
                    }
                    if (v64.value() > maxContentLength || v64.value() > std::numeric_limits<std::size_t>::max()) {
                        LOG_WARN("Content-Length {} exceeds limits (max={})", v64.value(), maxContentLength);
                        // frameSize lets stream readers skip the oversized body
                        const std::size_t skip = v64.value() > std::numeric_limits<std::size_t>::max() - headerAndSep
                                                     ? 0
                                                     : headerAndSep + static_cast<std::size_t>(v64.value());
                        return { DecodeStatus::BodyTooLarge, std::nullopt, headerAndSep, skip };
                    }
                    contentLength = static_cast<std::size_t>(v64.value());
                    haveLength = true;
                }
            }
            pos = eol + 2;
        }

        if (!haveLength) {
            LOG_WARN("Missing Content-Length header");
            return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep, 0 };
        }

        if (contentLength > std::numeric_limits<std::size_t>::max() - headerAndSep) {
            LOG_WARN("Frame size overflow detected (header={}, len={})", headerAndSep, contentLength);
            return { DecodeStatus::InvalidHeader, std::nullopt, headerAndSep, 0 };
        }
        std::size_t frameTotal = headerAndSep + contentLength;
        if (buffer.size() < frameTotal) {
            return { DecodeStatus::Incomplete, std::nullopt, 0, frameTotal };
        }

        std::string payload = buffer.substr(headerAndSep, contentLength);
        return { DecodeStatus::Ok, std::make_optional(std::move(payload)), frameTotal, frameTotal };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.status == DecodeStatus::Ok && r.payload.has_value()) {
            if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
                buffer.erase(0, r.bytesConsumed);
            }
            return r.payload;
        }
        // Drop a rejected header so the next frame can be found
        if ((r.status == DecodeStatus::InvalidHeader || r.status == DecodeStatus::BodyTooLarge) &&
            r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
            buffer.erase(0, r.bytesConsumed);
        }
        return std::nullopt;
    }

private:
    std::size_t maxContentLength;
};

class LineFramer : public IContentFramer {
public:
    explicit LineFramer(std::size_t maxLen) : maxLineLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame; frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t eol = buffer.find('\n');
        if (eol == std::string::npos) {
            if (buffer.size() > maxLineLength) {
                LOG_WARN("Line exceeds limit without terminator (size={}, max={})", buffer.size(), maxLineLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, buffer.size(), 0 };
            }
            return { DecodeStatus::Incomplete, std::nullopt, 0, 0 };
        }
        std::size_t len = eol;
        if (len > 0 && buffer[len - 1] == '\r') {
            --len;
        }
        if (len > maxLineLength) {
            LOG_WARN("Line of {} bytes exceeds max {}", len, maxLineLength);
            return { DecodeStatus::BodyTooLarge, std::nullopt, eol + 1, eol + 1 };
        }
        return { DecodeStatus::Ok, buffer.substr(0, len), eol + 1, eol + 1 };
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
            buffer.erase(0, r.bytesConsumed);
        }
        if (r.status == DecodeStatus::Ok) {
            return r.payload;
        }
        return std::nullopt;
    }

private:
    std::size_t maxLineLength;
};

} // namespace

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength) {
    return std::make_unique<ContentLengthFramer>(maxContentLength);
}

std::unique_ptr<IContentFramer> MakeLineFramer(std::size_t maxLineLength) {
    return std::make_unique<LineFramer>(maxLineLength);
}

} // namespace mcpserve
