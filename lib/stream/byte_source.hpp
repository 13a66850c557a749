// SPDX-License-Identifier: MIT

// lib/stream/byte_source.hpp
#pragma once

#include <cstddef>
#include <span>

namespace chunk_pipe {

/// Interface for blocking-style byte readers.
///
/// Read() follows classic blocking-stream semantics: it copies at least one
/// byte into target (unless target is empty) and may return fewer bytes than
/// requested. Implementations that cannot make progress throw instead of
/// returning 0; a return of 0 for a non-empty target is never used.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Copy up to target.size() bytes into target.
    /// @return number of bytes copied.
    virtual size_t Read(std::span<std::byte> target) = 0;
};

/// Fill target completely, looping over short reads.
/// Any exception thrown by the source propagates with target partially filled.
inline void ReadExact(ByteSource& source, std::span<std::byte> target) {
    size_t filled = 0;
    while (filled < target.size()) {
        filled += source.Read(target.subspan(filled));
    }
}

}  // namespace chunk_pipe
