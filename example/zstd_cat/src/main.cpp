// SPDX-License-Identifier: MIT

// example/zstd_cat/src/main.cpp
//
// Decode a stream of zstd frames read in fixed-size chunks and write the
// decoded frames to stdout.
//
//   zstd_cat [--bound N] [--chunk N] [path]
//
// Reads stdin when no path is given.
#include <fmt/format.h>

#include <charconv>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "lib/stream/async_input_buffer.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/pull_decoder.hpp"
#include "lib/stream/zstd_frame_reader.hpp"

namespace {

using namespace chunk_pipe;

struct StdoutSink {
    size_t frames = 0;
    bool failed = false;
    bool done = false;

    void OnRecord(std::vector<std::byte>&& frame) {
        std::cout.write(reinterpret_cast<const char*>(frame.data()),
                        static_cast<std::streamsize>(frame.size()));
        ++frames;
    }
    void OnError(const Error& e) {
        fmt::print(stderr, "zstd_cat: {} error: {}\n", error_category(e.code), e.message);
        failed = true;
    }
    void OnDone() { done = true; }
};

std::optional<size_t> ParseSize(std::string_view text) {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
        return std::nullopt;
    }
    return value;
}

void Usage() {
    fmt::print(stderr, "usage: zstd_cat [--bound N] [--chunk N] [path]\n");
}

}  // namespace

int main(int argc, char** argv) {
    InputBufferConfig config = InputBufferConfig::Defaults();
    size_t chunk_size = 4096;
    std::string_view path;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if ((arg == "--bound" || arg == "--chunk") && i + 1 < argc) {
            auto value = ParseSize(argv[++i]);
            if (!value) {
                Usage();
                return 2;
            }
            if (arg == "--bound") {
                config.bound = *value;
            } else {
                chunk_size = *value;
            }
        } else if (!arg.starts_with("--") && path.empty()) {
            path = arg;
        } else {
            Usage();
            return 2;
        }
    }

    std::ifstream file;
    std::istream* in = &std::cin;
    if (!path.empty()) {
        file.open(std::string(path), std::ios::binary);
        if (!file) {
            fmt::print(stderr, "zstd_cat: cannot open {}\n", path);
            return 1;
        }
        in = &file;
    }

    auto sink = std::make_shared<StdoutSink>();
    PullDecoder<ZstdFrameReader, StdoutSink> decoder(ZstdFrameReader{}, sink, config);

    std::vector<std::byte> buf(chunk_size);
    while (!decoder.IsClosed()) {
        in->read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
        auto got = static_cast<size_t>(in->gcount());
        if (got > 0) {
            decoder.OnData(MakeChunk(std::span<const std::byte>{buf.data(), got}));
        }
        if (!*in) break;
    }

    if (in->bad()) {
        decoder.OnError(Error{ErrorCode::TruncatedInput, "Read error on input"});
    } else {
        decoder.OnDone();
    }

    std::cout.flush();
    if (sink->failed || !sink->done) return 1;
    fmt::print(stderr, "zstd_cat: {} frame(s)\n", sink->frames);
    return 0;
}
