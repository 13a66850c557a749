// SPDX-License-Identifier: MIT

// lib/stream/chunk.hpp
#pragma once

#include <cstddef>
#include <cstring>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace chunk_pipe {

// Immutable byte buffer handed over by a producer.
//
// Chunks are shared by reference count so that a queue and its checkpoint
// can hold the same bytes without copying them. Nothing mutates the bytes
// once the chunk is built.
using Chunk = std::shared_ptr<const std::vector<std::byte>>;

// Build a chunk by taking ownership of an existing byte vector.
inline Chunk MakeChunk(std::vector<std::byte> bytes) {
    return std::make_shared<const std::vector<std::byte>>(std::move(bytes));
}

// Build a chunk by copying a byte range.
inline Chunk MakeChunk(std::span<const std::byte> bytes) {
    return MakeChunk(std::vector<std::byte>(bytes.begin(), bytes.end()));
}

// Build a chunk by copying characters (test data, text protocols).
inline Chunk MakeChunk(std::string_view text) {
    std::vector<std::byte> bytes(text.size());
    if (!text.empty()) {
        std::memcpy(bytes.data(), text.data(), text.size());
    }
    return MakeChunk(std::move(bytes));
}

// Length of a chunk; a null chunk counts as empty.
inline size_t ChunkSize(const Chunk& chunk) noexcept {
    return chunk ? chunk->size() : 0;
}

}  // namespace chunk_pipe
