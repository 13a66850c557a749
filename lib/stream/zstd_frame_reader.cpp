// SPDX-License-Identifier: MIT

// lib/stream/zstd_frame_reader.cpp
#include "lib/stream/zstd_frame_reader.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <span>
#include <stdexcept>
#include <string>

namespace chunk_pipe {

ZstdFrameReader::ZstdFrameReader(FrameReaderConfig config)
    : config_(config),
      in_buf_(std::max(config.read_size, kMagicSize)),
      out_buf_(ZSTD_DStreamOutSize()) {
    dctx_ = ZSTD_createDCtx();
    if (!dctx_) {
        throw std::runtime_error("Failed to create ZSTD_DCtx");
    }
}

void ZstdFrameReader::Cleanup() {
    if (dctx_) {
        ZSTD_freeDCtx(dctx_);
        dctx_ = nullptr;
    }
}

std::expected<std::vector<std::byte>, Error> ZstdFrameReader::ReadFrame(ByteSource& source) {
    if (!dctx_) {
        return std::unexpected(Error{ErrorCode::InvalidState, "Decoder not initialized"});
    }

    size_t reset = ZSTD_DCtx_reset(dctx_, ZSTD_reset_session_only);
    if (ZSTD_isError(reset)) {
        return std::unexpected(Error{ErrorCode::DecompressionError,
            fmt::format("Failed to reset ZSTD_DCtx: {}", ZSTD_getErrorName(reset))});
    }

    std::vector<std::byte> frame;
    size_t want = kMagicSize;

    while (true) {
        size_t request = std::min(want, in_buf_.size());
        size_t got = source.Read(std::span{in_buf_.data(), request});
        ZSTD_inBuffer in = {in_buf_.data(), got, 0};

        size_t result = 0;
        bool output_full = false;
        do {
            ZSTD_outBuffer out = {out_buf_.data(), out_buf_.size(), 0};
            result = ZSTD_decompressStream(dctx_, &out, &in);
            if (ZSTD_isError(result)) {
                return std::unexpected(Error{ErrorCode::DecompressionError,
                    fmt::format("ZSTD decompression failed: {}", ZSTD_getErrorName(result))});
            }

            if (out.pos > config_.max_frame_size - frame.size()) {
                return std::unexpected(Error{ErrorCode::BufferOverflow,
                    fmt::format("Decoded frame exceeds {} bytes", config_.max_frame_size)});
            }
            frame.insert(frame.end(), out_buf_.begin(),
                         out_buf_.begin() + static_cast<std::ptrdiff_t>(out.pos));
            output_full = out.pos == out.size;

            if (result == 0) {
                if (in.pos < in.size) {
                    return std::unexpected(Error{ErrorCode::DecompressionError,
                        fmt::format("Read {} bytes past end of zstd frame", in.size - in.pos)});
                }
                return frame;
            }
        } while (in.pos < in.size || output_full);

        // The hint after a block header covers the block plus the header of
        // the block after it. The last block has no successor, so leave the
        // header out; a short request only costs another round.
        want = result > kBlockHeaderSize ? result - kBlockHeaderSize : result;
    }
}

}  // namespace chunk_pipe
