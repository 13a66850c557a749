// SPDX-License-Identifier: MIT

// lib/stream/suspendable.hpp
#pragma once

namespace chunk_pipe {

/// Interface for pipeline stages that support backpressure.
///
/// Uses suspend-count semantics:
/// - Suspend() increments the count; Resume() decrements it.
/// - IsSuspended() returns true when the count is greater than zero.
/// - Actual pause/resume only happens on 0-to-1 and 1-to-0 transitions,
///   allowing nested suspend calls from multiple downstream sources.
///
/// Thread safety: all calls must come from the thread driving the pipeline.
///
/// OnDone coordination:
/// - If OnDone() arrives while suspended, it is deferred until Resume()
///   brings the count back to zero.
class Suspendable {
public:
    virtual ~Suspendable() = default;

    /// Increment the suspend count. While suspended the stage delivers
    /// nothing downstream.
    virtual void Suspend() = 0;

    /// Decrement the suspend count. When the count goes from 1 to 0,
    /// the stage processes buffered input and completes any deferred OnDone.
    virtual void Resume() = 0;

    /// Stop the stage. No further callbacks after Close().
    virtual void Close() = 0;

    /// @return true if the stage is currently suspended (count > 0).
    virtual bool IsSuspended() const = 0;
};

}  // namespace chunk_pipe
