// SPDX-License-Identifier: MIT

// lib/stream/async_input_buffer.cpp
#include "lib/stream/async_input_buffer.hpp"

#include <stdexcept>

#include "lib/stream/suspension.hpp"

namespace chunk_pipe {

bool AsyncInputBuffer::Push(Chunk chunk) {
    // Bound is checked against the pre-push size only
    if (queue_.Size() >= bound_) return false;
    queue_.Append(std::move(chunk));
    return true;
}

size_t AsyncInputBuffer::Read(std::byte* target, size_t offset, size_t max_length) {
    if (queue_.Empty()) {
        throw Suspension{};
    }
    return queue_.ReadFront(target + offset, max_length);
}

size_t AsyncInputBuffer::Read(std::span<std::byte> target) {
    return Read(target.data(), 0, target.size());
}

uint8_t AsyncInputBuffer::ReadByte() {
    std::byte b{};
    Read(&b, 0, 1);
    return static_cast<uint8_t>(b);
}

void AsyncInputBuffer::Checkpoint() {
    checkpoint_ = queue_;
}

void AsyncInputBuffer::Restore() {
    if (!checkpoint_) {
        throw std::logic_error("AsyncInputBuffer::Restore() called without a checkpoint");
    }
    queue_ = *checkpoint_;
}

void AsyncInputBuffer::Release() {
    if (!checkpoint_) {
        throw std::logic_error("AsyncInputBuffer::Release() called without a checkpoint");
    }
    checkpoint_.reset();
}

void AsyncInputBuffer::Clear() noexcept {
    queue_.Clear();
    checkpoint_.reset();
}

}  // namespace chunk_pipe
