// SPDX-License-Identifier: MIT

// lib/stream/async_input_buffer.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

#include "lib/stream/byte_source.hpp"
#include "lib/stream/chunk.hpp"
#include "lib/stream/chunk_queue.hpp"

namespace chunk_pipe {

/// Configuration for an AsyncInputBuffer.
struct InputBufferConfig {
    size_t bound = 64 * 1024;   ///< Push is rejected once this many bytes are buffered

    /// General purpose preset: room for a few network reads.
    static InputBufferConfig Defaults() {
        return InputBufferConfig{.bound = 64 * 1024};
    }

    /// Small buffer for interactive streams: throttles the producer early.
    static InputBufferConfig LowLatency() {
        return InputBufferConfig{.bound = 4 * 1024};
    }
};

/// In-memory byte buffer that lets push-driven input feed a blocking-style
/// reader.
///
/// The producer calls Push() with each chunk as it arrives. The consumer
/// reads through the ByteSource interface; when nothing is buffered, Read()
/// throws Suspension instead of blocking. The scheduler catches it, pushes
/// more input, calls Restore() and re-runs the consumer call from the start.
///
/// Rollback covers this buffer only. A consumer is safe to drive this way as
/// long as it performs all reads for one call before changing any state of
/// its own; reads interleaved with state changes leave the consumer in a
/// position that Restore() cannot undo. Checkpoint immediately before each
/// call and treat the whole call as the unit of retry.
///
/// Thread safety: Not thread-safe. Producer and consumer calls must be
/// sequenced by a single owner.
class AsyncInputBuffer : public ByteSource {
public:
    explicit AsyncInputBuffer(InputBufferConfig config = {})
        : bound_(config.bound) {}

    /// Offer a chunk. Accepted when fewer than Bound() bytes are buffered,
    /// regardless of the chunk's own size, so one accepted push may take
    /// Available() past Bound().
    /// @return false if the chunk was rejected (backpressure); state unchanged.
    bool Push(Chunk chunk);

    /// Copy up to max_length bytes into target[offset, offset + max_length)
    /// from the oldest chunk. Never spans two chunks, so callers needing an
    /// exact count must loop.
    /// @throws Suspension if nothing is buffered.
    size_t Read(std::byte* target, size_t offset, size_t max_length);

    /// ByteSource interface: Read(target.data(), 0, target.size()).
    size_t Read(std::span<std::byte> target) override;

    /// Read exactly one byte.
    /// @throws Suspension if nothing is buffered.
    uint8_t ReadByte();

    /// Discard up to bytes from the front as if they had been read.
    /// Used by readers that access FrontData() in place.
    void Consume(size_t bytes) noexcept { queue_.Consume(bytes); }

    /// Snapshot the queue into the checkpoint slot, replacing any previous one.
    void Checkpoint();

    /// Overwrite the queue with the checkpoint. Chunks pushed since the
    /// checkpoint are discarded. The checkpoint is kept for further restores.
    /// @throws std::logic_error if no checkpoint is held.
    void Restore();

    /// Drop the checkpoint without touching the queue.
    /// @throws std::logic_error if no checkpoint is held.
    void Release();

    bool HasCheckpoint() const noexcept { return checkpoint_.has_value(); }

    /// Total unconsumed bytes.
    size_t Available() const noexcept { return queue_.Size(); }

    /// Bytes already consumed from the oldest chunk.
    size_t HeadOffset() const noexcept { return queue_.HeadOffset(); }

    size_t Bound() const noexcept { return bound_; }

    bool Empty() const noexcept { return queue_.Empty(); }

    /// Live queue contents (for inspection).
    const ChunkQueue& Queue() const noexcept { return queue_; }

    /// Drop all buffered data and the checkpoint.
    void Clear() noexcept;

private:
    const size_t bound_;
    ChunkQueue queue_;
    std::optional<ChunkQueue> checkpoint_;  // Single slot, overwritten on Checkpoint()
};

}  // namespace chunk_pipe
