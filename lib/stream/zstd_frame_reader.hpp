// SPDX-License-Identifier: MIT

// lib/stream/zstd_frame_reader.hpp
#pragma once

#include <zstd.h>

#include <cstddef>
#include <expected>
#include <utility>
#include <vector>

#include "lib/stream/byte_source.hpp"
#include "lib/stream/error.hpp"

namespace chunk_pipe {

/// Configuration for ZstdFrameReader.
struct FrameReaderConfig {
    size_t max_frame_size = 256 * 1024 * 1024;  ///< Decoded size limit per frame
    size_t read_size = 128 * 1024;              ///< Largest single Read() request

    /// Preset for small control messages: tight output limit.
    static FrameReaderConfig SmallFrames() {
        return FrameReaderConfig{
            .max_frame_size = 1024 * 1024,
            .read_size = 16 * 1024,
        };
    }
};

// ZstdFrameReader - blocking-style decoder for one zstd frame at a time.
//
// ReadFrame() pulls compressed bytes from a ByteSource with plain Read()
// calls and returns the decoded frame. It never reads past the end of the
// frame: the first request is the 4-byte magic number and every later
// request is derived from the decoder's next-input hint, trimmed so that it
// cannot extend beyond the current block. Bytes of the following frame stay
// in the source.
//
// Each call resets the decoder session before reading, and all decoder state
// lives inside the call. If the source throws (e.g. Suspension), the call can
// be re-run from the start once the source has been rolled back.
class ZstdFrameReader {
public:
    explicit ZstdFrameReader(FrameReaderConfig config = {});
    ~ZstdFrameReader() { Cleanup(); }

    ZstdFrameReader(const ZstdFrameReader&) = delete;
    ZstdFrameReader& operator=(const ZstdFrameReader&) = delete;

    ZstdFrameReader(ZstdFrameReader&& other) noexcept
        : config_(other.config_),
          dctx_(std::exchange(other.dctx_, nullptr)),
          in_buf_(std::move(other.in_buf_)),
          out_buf_(std::move(other.out_buf_)) {}

    ZstdFrameReader& operator=(ZstdFrameReader&& other) noexcept {
        if (this != &other) {
            Cleanup();
            config_ = other.config_;
            dctx_ = std::exchange(other.dctx_, nullptr);
            in_buf_ = std::move(other.in_buf_);
            out_buf_ = std::move(other.out_buf_);
        }
        return *this;
    }

    /// Decode the next frame from source.
    /// Exceptions thrown by source.Read() propagate unchanged.
    std::expected<std::vector<std::byte>, Error> ReadFrame(ByteSource& source);

    /// Callable form, so the reader can be handed to PullDecoder directly.
    std::expected<std::vector<std::byte>, Error> operator()(ByteSource& source) {
        return ReadFrame(source);
    }

    const FrameReaderConfig& Config() const noexcept { return config_; }

private:
    void Cleanup();

    static constexpr size_t kMagicSize = 4;
    static constexpr size_t kBlockHeaderSize = 3;

    FrameReaderConfig config_;
    ZSTD_DCtx* dctx_ = nullptr;

    // Per-call scratch, contents are not carried between calls
    std::vector<std::byte> in_buf_;
    std::vector<std::byte> out_buf_;
};

}  // namespace chunk_pipe
