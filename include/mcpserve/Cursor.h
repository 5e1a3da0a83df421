//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Cursor.h
// Purpose: Opaque pagination cursor codec and page slicing for list operations
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "mcpserve/Protocol.h"

namespace mcpserve {

//==========================================================================================================
// Cursor
// Purpose: Entire pagination state of a list request (stateless server side).
// Fields:
//   offset: Index of the first item of the page (>= 0).
//   limit: Maximum number of items in the page (> 0).
//==========================================================================================================
struct Cursor {
    int64_t offset{0};
    int64_t limit{DEFAULT_PAGE_SIZE};

    bool operator==(const Cursor& other) const = default;
};

//==========================================================================================================
// EncodeCursor
// Purpose: Encodes a cursor as base64 of the compact JSON text {"offset":N,"limit":M}.
// Returns:
//   Opaque cursor string suitable for nextCursor.
//==========================================================================================================
std::string EncodeCursor(const Cursor& cursor);

//==========================================================================================================
// DecodeCursor
// Purpose: Decodes a cursor produced by EncodeCursor (or any base64 JSON object of the same shape).
// Returns:
//   The cursor, or std::nullopt when the text is not valid base64, not a JSON object with integer
//   offset/limit, or violates offset >= 0 / limit > 0.
//==========================================================================================================
std::optional<Cursor> DecodeCursor(const std::string& encoded);

//==========================================================================================================
// PageSlice
// Purpose: Result of applying a cursor to a list of `total` items.
// Fields:
//   begin/end: Half-open index range of the page.
//   nextCursor: Encoded cursor for the following page; absent when no items remain.
//==========================================================================================================
struct PageSlice {
    std::size_t begin{0};
    std::size_t end{0};
    std::optional<std::string> nextCursor;
};

PageSlice Paginate(std::size_t total, const Cursor& cursor);

} // namespace mcpserve
