// SPDX-License-Identifier: MIT

// lib/stream/chunk_queue.hpp
#pragma once

#include <algorithm>
#include <cassert>
#include <cstddef>
#include <cstring>
#include <deque>

#include "lib/stream/chunk.hpp"

namespace chunk_pipe {

// Queue of chunks representing received but not yet consumed data.
// Supports append at the back and partial consumption from the front.
//
// Invariants:
// - head_offset_ < size of the front chunk whenever the queue is non-empty
// - head_offset_ == 0 when the queue is empty
// - total_size_ == sum of chunk sizes - head_offset_
//
// The queue is a value type: copying it copies the chunk sequence and the
// offsets while sharing the immutable chunk bytes. A copy is therefore an
// independent snapshot that later Append/Consume calls on the original
// cannot disturb.
//
// Thread safety: Not thread-safe. All operations must be called from the same
// thread.
class ChunkQueue {
public:
    // Add chunk to the back of the queue. Empty and null chunks are dropped
    // so the front chunk always has unconsumed bytes.
    void Append(Chunk chunk) {
        if (ChunkSize(chunk) == 0) return;
        total_size_ += chunk->size();
        chunks_.push_back(std::move(chunk));
    }

    // Copy up to max_len bytes from the front chunk into dest and consume them.
    // Never crosses a chunk boundary. Returns the number of bytes copied;
    // returns 0 only when the queue is empty or max_len == 0.
    size_t ReadFront(std::byte* dest, size_t max_len) noexcept {
        if (chunks_.empty() || max_len == 0) return 0;

        const auto& front = *chunks_.front();
        size_t copied = std::min(max_len, front.size() - head_offset_);
        std::memcpy(dest, front.data() + head_offset_, copied);
        Consume(copied);
        return copied;
    }

    // Consume bytes from front, dropping chunks as they are exhausted.
    // If bytes == 0, this is a no-op.
    void Consume(size_t bytes) noexcept {
        while (bytes > 0 && !chunks_.empty()) {
            size_t available = chunks_.front()->size() - head_offset_;

            if (bytes >= available) {
                // Consume entire chunk
                bytes -= available;
                total_size_ -= available;
                head_offset_ = 0;
                chunks_.pop_front();
            } else {
                // Partial consume
                head_offset_ += bytes;
                total_size_ -= bytes;
                bytes = 0;
            }
        }
    }

    // Pointer to the first unconsumed byte. Caller must check Empty() first.
    const std::byte* FrontData() const noexcept {
        assert(!chunks_.empty() && "FrontData: queue is empty");
        return chunks_.front()->data() + head_offset_;
    }

    // Contiguous bytes available from the front (in the oldest chunk).
    size_t ContiguousSize() const noexcept {
        if (chunks_.empty()) return 0;
        return chunks_.front()->size() - head_offset_;
    }

    // Total unconsumed bytes. O(1) - cached value.
    size_t Size() const noexcept { return total_size_; }

    // Check if queue is empty (no unconsumed data).
    bool Empty() const noexcept { return chunks_.empty(); }

    // Number of chunks in queue.
    size_t ChunkCount() const noexcept { return chunks_.size(); }

    // Bytes already consumed from the oldest chunk.
    size_t HeadOffset() const noexcept { return head_offset_; }

    // Chunk at position index (0 is the oldest).
    const Chunk& ChunkAt(size_t index) const { return chunks_.at(index); }

    // Clear all data.
    void Clear() noexcept {
        chunks_.clear();
        head_offset_ = 0;
        total_size_ = 0;
    }

    // Structural equality: same offsets and byte-equal chunks in order.
    friend bool operator==(const ChunkQueue& a, const ChunkQueue& b) {
        if (a.head_offset_ != b.head_offset_ || a.total_size_ != b.total_size_ ||
            a.chunks_.size() != b.chunks_.size()) {
            return false;
        }
        for (size_t i = 0; i < a.chunks_.size(); ++i) {
            if (a.chunks_[i] != b.chunks_[i] && *a.chunks_[i] != *b.chunks_[i]) {
                return false;
            }
        }
        return true;
    }

private:
    std::deque<Chunk> chunks_;  // O(1) front removal
    size_t head_offset_ = 0;    // Bytes consumed from first chunk
    size_t total_size_ = 0;     // Cached total unconsumed bytes
};

}  // namespace chunk_pipe
