// SPDX-License-Identifier: MIT

// lib/stream/pull_decoder.hpp
#pragma once

#include <fmt/format.h>

#include <cassert>
#include <concepts>
#include <memory>
#include <type_traits>
#include <utility>

#include "lib/stream/async_input_buffer.hpp"
#include "lib/stream/byte_source.hpp"
#include "lib/stream/checkpointed_call.hpp"
#include "lib/stream/chunk.hpp"
#include "lib/stream/error.hpp"
#include "lib/stream/suspendable.hpp"

namespace chunk_pipe {

// BlockingDecoder interface - callable that reads one unit from a ByteSource
// and returns std::expected<Unit, Error>
template<typename D>
concept BlockingDecoder = std::invocable<D&, ByteSource&> &&
    std::same_as<typename std::invoke_result_t<D&, ByteSource&>::error_type, Error> &&
    requires { typename std::invoke_result_t<D&, ByteSource&>::value_type; };

// Unit produced by a BlockingDecoder
template<BlockingDecoder D>
using DecodedUnit = typename std::invoke_result_t<D&, ByteSource&>::value_type;

// UnitSink interface - receives decoded units and terminal signals
template<typename S, typename T>
concept UnitSink = requires(S& s, T&& unit, const Error& e) {
    { s.OnRecord(std::move(unit)) } -> std::same_as<void>;
    { s.OnError(e) } -> std::same_as<void>;
    { s.OnDone() } -> std::same_as<void>;
};

// PullDecoder - joins a push-driven producer to a blocking-style decoder.
//
// The producer hands chunks to OnData(). They are buffered in an
// AsyncInputBuffer and the decoder is run against it, one unit per call,
// under RunCheckpointed(). A call that runs out of input is rolled back and
// re-run from the beginning once more chunks arrive. Each decoded unit goes
// to the sink's OnRecord().
//
// Backpressure: the sink may Suspend() the stage. While suspended nothing is
// decoded and chunks keep being buffered until the buffer's bound is reached.
// The first rejected chunk is held and the upstream is suspended. Resume()
// drains the buffer, re-offers the held chunk and resumes the upstream.
//
// A rejected push while not suspended means the buffer is full of one
// incomplete unit: that unit needs more than the bound, reported as
// BufferOverflow.
//
// Thread safety: Not thread-safe. All calls must come from the thread
// driving the pipeline.
template<BlockingDecoder D, UnitSink<DecodedUnit<D>> S>
class PullDecoder : public Suspendable {
public:
    PullDecoder(D decoder, std::shared_ptr<S> sink, InputBufferConfig config = {})
        : decoder_(std::move(decoder)), sink_(std::move(sink)), input_(config) {}

    // Producer interface: receive the next chunk
    void OnData(Chunk chunk);

    // Forward errors from upstream
    void OnError(const Error& e);

    // Handle end of input from upstream
    void OnDone();

    // Set upstream for backpressure propagation
    void SetUpstream(Suspendable* up) { upstream_ = up; }

    // Suspendable interface
    void Suspend() override { ++suspend_count_; }
    void Resume() override;
    void Close() override;
    bool IsSuspended() const override { return suspend_count_ > 0; }

    bool IsClosed() const { return closed_; }

    // True while a rejected chunk is waiting for room in the buffer
    bool HasHeldChunk() const { return held_ != nullptr; }

    const AsyncInputBuffer& Input() const { return input_; }

private:
    enum class DrainResult { Complete, Suspended, Stopped };

    // Decode units until input runs out, the sink suspends us, or we close
    DrainResult Drain();

    // Drain, then check for leftover input and emit OnDone
    void Finish();

    void EmitError(const Error& e) {
        if (finalized_) return;
        finalized_ = true;
        sink_->OnError(e);
    }

    void EmitOverflow() {
        EmitError(Error{ErrorCode::BufferOverflow,
            fmt::format("Decoder unit needs more than {} buffered bytes", input_.Bound())});
        Close();
    }

    D decoder_;
    std::shared_ptr<S> sink_;
    AsyncInputBuffer input_;
    Chunk held_;                       // Rejected chunk awaiting room
    Suspendable* upstream_ = nullptr;  // Upstream for backpressure propagation

    int suspend_count_ = 0;
    bool done_pending_ = false;   // OnDone received while suspended
    bool closed_ = false;
    bool finalized_ = false;      // OnError or OnDone already delivered
};

// Implementation

template<BlockingDecoder D, UnitSink<DecodedUnit<D>> S>
void PullDecoder<D, S>::OnData(Chunk chunk) {
    if (closed_) return;

    if (held_) {
        // Upstream kept producing after we suspended it
        EmitError(Error{ErrorCode::InvalidState, "Chunk delivered while upstream is suspended"});
        Close();
        return;
    }

    if (!input_.Push(chunk)) {
        if (!IsSuspended()) {
            EmitOverflow();
            return;
        }
        held_ = std::move(chunk);
        if (upstream_) upstream_->Suspend();
        return;
    }

    if (IsSuspended()) return;
    Drain();
}

template<BlockingDecoder D, UnitSink<DecodedUnit<D>> S>
auto PullDecoder<D, S>::Drain() -> DrainResult {
    while (!closed_) {
        if (IsSuspended()) return DrainResult::Suspended;
        if (input_.Empty()) return DrainResult::Complete;

        auto attempt = RunCheckpointed(input_, [this] {
            return decoder_(static_cast<ByteSource&>(input_));
        });
        if (!attempt) {
            // Incomplete unit; input was rolled back to its start
            return DrainResult::Complete;
        }

        auto& decoded = *attempt;
        if (!decoded) {
            EmitError(decoded.error());
            Close();
            return DrainResult::Stopped;
        }
        sink_->OnRecord(std::move(*decoded));
    }
    return DrainResult::Stopped;
}

template<BlockingDecoder D, UnitSink<DecodedUnit<D>> S>
void PullDecoder<D, S>::Resume() {
    assert(suspend_count_ > 0 && "Resume called more times than Suspend");
    if (--suspend_count_ > 0 || closed_) return;

    if (Drain() != DrainResult::Complete) return;

    if (held_) {
        Chunk chunk = std::move(held_);
        held_.reset();
        if (!input_.Push(std::move(chunk))) {
            EmitOverflow();
            return;
        }
        if (upstream_) upstream_->Resume();
        // Resuming upstream may have delivered more data, or closed us
        if (closed_ || Drain() != DrainResult::Complete) return;
    }

    if (done_pending_) {
        done_pending_ = false;
        Finish();
    }
}

template<BlockingDecoder D, UnitSink<DecodedUnit<D>> S>
void PullDecoder<D, S>::OnError(const Error& e) {
    if (closed_) return;
    EmitError(e);
    Close();
}

template<BlockingDecoder D, UnitSink<DecodedUnit<D>> S>
void PullDecoder<D, S>::OnDone() {
    if (closed_) return;

    // OnDone can arrive while suspended; complete it on Resume()
    if (IsSuspended() || held_) {
        done_pending_ = true;
        return;
    }
    Finish();
}

template<BlockingDecoder D, UnitSink<DecodedUnit<D>> S>
void PullDecoder<D, S>::Finish() {
    auto result = Drain();
    if (result == DrainResult::Stopped) return;
    if (result == DrainResult::Suspended) {
        done_pending_ = true;
        return;
    }

    if (!input_.Empty()) {
        EmitError(Error{ErrorCode::TruncatedInput,
            fmt::format("Input ended inside a unit ({} bytes left)", input_.Available())});
        Close();
        return;
    }

    if (!finalized_) {
        finalized_ = true;
        sink_->OnDone();
    }
    Close();
}

template<BlockingDecoder D, UnitSink<DecodedUnit<D>> S>
void PullDecoder<D, S>::Close() {
    if (closed_) return;
    closed_ = true;
    done_pending_ = false;
    held_.reset();
    input_.Clear();
}

}  // namespace chunk_pipe
