// SPDX-License-Identifier: MIT

// lib/stream/async_streambuf.cpp
#include "lib/stream/async_streambuf.hpp"

#include "lib/stream/suspension.hpp"

namespace chunk_pipe {

void AsyncStreambuf::Checkpoint() {
    Commit();
    input_.Checkpoint();
}

void AsyncStreambuf::Restore() {
    input_.Restore();
    // The window points into chunks the restored queue may no longer hold
    setg(nullptr, nullptr, nullptr);
}

void AsyncStreambuf::Release() {
    input_.Release();
}

void AsyncStreambuf::Commit() noexcept {
    if (eback() == nullptr) return;
    input_.Consume(static_cast<size_t>(gptr() - eback()));
    setg(nullptr, nullptr, nullptr);
}

AsyncStreambuf::int_type AsyncStreambuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }

    Commit();
    if (input_.Empty()) {
        throw Suspension{};
    }

    const ChunkQueue& queue = input_.Queue();
    // The streambuf interface takes char*; the window is only ever read
    char* begin = const_cast<char*>(reinterpret_cast<const char*>(queue.FrontData()));
    setg(begin, begin, begin + queue.ContiguousSize());
    return traits_type::to_int_type(*gptr());
}

std::streamsize AsyncStreambuf::showmanyc() {
    // Never -1: an empty buffer means "not yet", not end of stream
    Commit();
    return static_cast<std::streamsize>(input_.Available());
}

int AsyncStreambuf::sync() {
    Commit();
    return 0;
}

}  // namespace chunk_pipe
