// SPDX-License-Identifier: MIT

// lib/stream/async_streambuf.hpp
#pragma once

#include <streambuf>

#include "lib/stream/async_input_buffer.hpp"

namespace chunk_pipe {

/// std::streambuf view of an AsyncInputBuffer for decoders written against
/// std::istream.
///
/// The get area is a window into the oldest buffered chunk, so no bytes are
/// copied. Bytes taken from the window are consumed from the buffer lazily:
/// on the next underflow(), sync(), Checkpoint() or Restore(). When nothing
/// is buffered underflow() throws Suspension.
///
/// std::istream swallows exceptions thrown by its streambuf unless badbit is
/// in its exception mask. Attach with:
///
///     std::istream in(&sbuf);
///     in.exceptions(std::ios::badbit);
///
/// and call in.clear() at the start of each retried call, since the
/// suspension leaves badbit set.
///
/// While a window is open the buffer must not be read through any other
/// path. Pushing more chunks is fine.
class AsyncStreambuf : public std::streambuf {
public:
    explicit AsyncStreambuf(AsyncInputBuffer& input) : input_(input) {}

    AsyncStreambuf(const AsyncStreambuf&) = delete;
    AsyncStreambuf& operator=(const AsyncStreambuf&) = delete;

    /// Commit the window and checkpoint the underlying buffer.
    void Checkpoint();

    /// Roll the underlying buffer back and drop the window.
    /// @throws std::logic_error if no checkpoint is held.
    void Restore();

    /// Drop the underlying buffer's checkpoint.
    /// @throws std::logic_error if no checkpoint is held.
    void Release();

    AsyncInputBuffer& Input() noexcept { return input_; }

protected:
    int_type underflow() override;
    std::streamsize showmanyc() override;
    int sync() override;

private:
    // Consume bytes already taken from the window and close it.
    void Commit() noexcept;

    AsyncInputBuffer& input_;
};

}  // namespace chunk_pipe
