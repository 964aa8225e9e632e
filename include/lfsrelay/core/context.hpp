#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace lfsrelay {

/// Execution context carried through every storage call.
///
/// Holds a cancellation flag and an optional deadline. Contexts form a tree:
/// cancelling a parent cancels every child derived from it, while cancelling
/// a child leaves the parent untouched. Copies share the same state.
class Context {
public:
    using Clock = std::chrono::steady_clock;

    /// A root context that is only cancelled by an explicit cancel().
    Context();

    /// Derive a child that can be cancelled independently.
    Context with_cancel() const;

    /// Derive a child whose deadline is the earlier of the parent's and @p deadline.
    Context with_deadline(Clock::time_point deadline) const;
    Context with_timeout(std::chrono::milliseconds timeout) const;

    void cancel() const;

    /// True once cancel() was called on this context or an ancestor,
    /// or once the deadline has passed.
    bool cancelled() const;

    std::optional<Clock::time_point> deadline() const;

    /// "context cancelled" or "context deadline exceeded"; empty if still live.
    std::string reason() const;

    /// Throws storage::CancellationError if cancelled().
    void check() const;

    /// Sleep for @p duration, waking early on cancellation.
    /// @return true if the context was cancelled before the time elapsed.
    bool wait_for(std::chrono::milliseconds duration) const;

private:
    struct State;
    explicit Context(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

}  // namespace lfsrelay
