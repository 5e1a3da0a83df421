//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Cursor.cpp
// Purpose: Base64 cursor codec (OpenSSL EVP block coder) and page slicing
//==========================================================================================================

#include <algorithm>
#include <format>
#include <limits>
#include <vector>

#include <openssl/evp.h>

#include "logging/Logger.h"
#include "mcpserve/Cursor.h"
#include "mcpserve/JSONRPCTypes.h"

namespace mcpserve {

namespace {
std::string base64Encode(const std::string& raw) {
    // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a terminating NUL
    std::vector<unsigned char> out(4 * ((raw.size() + 2) / 3) + 1);
    int n = ::EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(raw.data()),
                              static_cast<int>(raw.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(n));
}

std::optional<std::string> base64Decode(std::string text) {
    if (text.empty()) {
        return std::nullopt;
    }
    // Accept unpadded input
    while (text.size() % 4 != 0) {
        text.push_back('=');
    }
    std::size_t padding = 0;
    if (text.back() == '=') ++padding;
    if (text.size() >= 2 && text[text.size() - 2] == '=') ++padding;

    std::vector<unsigned char> out(3 * (text.size() / 4) + 1);
    int n = ::EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                              static_cast<int>(text.size()));
    if (n < 0 || static_cast<std::size_t>(n) < padding) {
        return std::nullopt;
    }
    // EVP_DecodeBlock counts padding as zero bytes
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(n) - padding);
}

std::optional<int64_t> integerField(const JSONValue::Object& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->second || !it->second->IsInteger()) {
        return std::nullopt;
    }
    return std::get<int64_t>(it->second->value);
}
} // namespace

std::string EncodeCursor(const Cursor& cursor) {
    return base64Encode(std::format("{{\"offset\":{},\"limit\":{}}}", cursor.offset, cursor.limit));
}

std::optional<Cursor> DecodeCursor(const std::string& encoded) {
    auto raw = base64Decode(encoded);
    if (!raw.has_value()) {
        LOG_DEBUG("Cursor is not valid base64");
        return std::nullopt;
    }
    JSONValue parsed;
    try {
        parsed = ParseJSON(raw.value());
    } catch (const JSONParseError& e) {
        LOG_DEBUG("Cursor payload is not JSON: {}", e.what());
        return std::nullopt;
    }
    if (!parsed.IsObject()) {
        return std::nullopt;
    }
    const auto& obj = std::get<JSONValue::Object>(parsed.value);
    auto offset = integerField(obj, "offset");
    // An absent limit means the default page size; a present one must be a positive integer
    std::optional<int64_t> limit = DEFAULT_PAGE_SIZE;
    if (obj.find("limit") != obj.end()) {
        limit = integerField(obj, "limit");
    }
    if (!offset.has_value() || !limit.has_value() || offset.value() < 0 || limit.value() <= 0) {
        return std::nullopt;
    }
    return Cursor{offset.value(), limit.value()};
}

PageSlice Paginate(std::size_t total, const Cursor& cursor) {
    PageSlice page;
    const auto offset = static_cast<uint64_t>(std::max<int64_t>(cursor.offset, 0));
    const auto limit = static_cast<uint64_t>(std::max<int64_t>(cursor.limit, 1));
    page.begin = static_cast<std::size_t>(std::min<uint64_t>(offset, total));
    // Saturating offset + limit
    const uint64_t stop = (limit > std::numeric_limits<uint64_t>::max() - offset) ? std::numeric_limits<uint64_t>::max()
                                                                                  : offset + limit;
    page.end = static_cast<std::size_t>(std::min<uint64_t>(stop, total));
    if (stop < total) {
        page.nextCursor = EncodeCursor(Cursor{static_cast<int64_t>(stop), static_cast<int64_t>(limit)});
    }
    return page;
}

} // namespace mcpserve
