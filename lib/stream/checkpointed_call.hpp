// SPDX-License-Identifier: MIT

// lib/stream/checkpointed_call.hpp
#pragma once

#include <concepts>
#include <expected>
#include <functional>
#include <type_traits>
#include <utility>

#include "lib/stream/suspension.hpp"

namespace chunk_pipe {

// Checkpointable interface - input that can snapshot and roll back its state
template<typename I>
concept Checkpointable = requires(I& i) {
    { i.Checkpoint() } -> std::same_as<void>;
    { i.Restore() } -> std::same_as<void>;
    { i.Release() } -> std::same_as<void>;
};

/// Outcome of one attempt at a blocking-style call: its value, or Suspension
/// when the input ran dry before the call could finish.
template<typename T>
using Attempt = std::expected<T, Suspension>;

/// Run op as a single retryable unit against input.
///
/// Checkpoints input, then invokes op. On success the checkpoint is released
/// and op's result returned. When op throws Suspension from any depth, input
/// is rolled back at once and the suspension is returned as a value; the
/// caller may then push more input and call RunCheckpointed again, which
/// re-executes op from the beginning. Rolling back before the caller pushes
/// keeps chunks pushed between attempts.
///
/// Any other exception rolls input back and propagates unchanged.
template<Checkpointable I, typename Op>
    requires std::invocable<Op&>
auto RunCheckpointed(I& input, Op&& op) -> Attempt<std::invoke_result_t<Op&>> {
    using R = std::invoke_result_t<Op&>;

    input.Checkpoint();
    try {
        if constexpr (std::is_void_v<R>) {
            std::invoke(op);
            input.Release();
            return {};
        } else {
            R result = std::invoke(op);
            input.Release();
            return result;
        }
    } catch (const Suspension& s) {
        input.Restore();
        input.Release();
        return std::unexpected(s);
    } catch (...) {
        input.Restore();
        input.Release();
        throw;
    }
}

}  // namespace chunk_pipe
