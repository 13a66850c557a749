// SPDX-License-Identifier: MIT

// lib/stream/suspension.hpp
#pragma once

#include <exception>

namespace chunk_pipe {

/// Thrown by a blocking-style read when no buffered data is available.
///
/// This is a control-flow signal, not a fault and not end of stream. It must
/// unwind the whole delegating call up to the scheduler, which feeds more
/// input, rolls the buffer back to its checkpoint and re-runs the call from
/// the beginning. The type carries no state: all instances are equivalent.
class Suspension final : public std::exception {
public:
    const char* what() const noexcept override {
        return "no buffered input available";
    }

    friend constexpr bool operator==(const Suspension&, const Suspension&) noexcept {
        return true;
    }
};

}  // namespace chunk_pipe
