#pragma once

#include "lfsrelay/core/constants.hpp"
#include "lfsrelay/core/context.hpp"
#include "lfsrelay/storage/backend.hpp"
#include "lfsrelay/storage/errors.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace lfsrelay::storage {

struct RetryPolicy {
    int max_attempts = constants::DEFAULT_RETRY_MAX_ATTEMPTS;
    std::chrono::milliseconds initial_delay = constants::DEFAULT_RETRY_INITIAL_DELAY;
    std::chrono::milliseconds max_delay = constants::DEFAULT_RETRY_MAX_DELAY;
    double multiplier = constants::DEFAULT_RETRY_MULTIPLIER;
};

// Called before each retry with the operation name, the attempt that
// failed (1-based), the error and the delay about to be waited.
using RetryObserver = std::function<void(const std::string& op, int attempt,
                                         const BackendError& error,
                                         std::chrono::milliseconds delay)>;

/// Runs an operation until it succeeds, throws something other than
/// BackendError, or exhausts the policy. Backoff waits end early with
/// CancellationError when the context is cancelled.
class Retrier {
public:
    explicit Retrier(RetryPolicy policy = {}) : policy_(policy) {}

    /// @p prepare runs before every retry (not before the first attempt);
    /// returning false rethrows the last error instead of retrying.
    template <typename Fn>
    auto run(const Context& ctx, const std::string& op, Fn&& fn,
             const std::function<bool()>& prepare = {}) -> decltype(fn()) {
        std::chrono::milliseconds delay = policy_.initial_delay;
        for (int attempt = 1;; ++attempt) {
            ctx.check();
            try {
                return fn();
            } catch (const BackendError& e) {
                if (attempt >= policy_.max_attempts) throw;
                if (prepare && !prepare()) throw;
                backoff(ctx, op, attempt, e, delay);
            }
        }
    }

    void set_observer(RetryObserver observer) { observer_ = std::move(observer); }

    const RetryPolicy& policy() const { return policy_; }

    /// Delay after @p current: multiplied, capped at max_delay, never shorter.
    std::chrono::milliseconds next_delay(std::chrono::milliseconds current) const;

private:
    void backoff(const Context& ctx, const std::string& op, int attempt,
                 const BackendError& error, std::chrono::milliseconds& delay) const;

    RetryPolicy policy_;
    RetryObserver observer_;
};

/// Storage decorator that routes every call through a Retrier.
///
/// get/put rewind their stream before each retry; a stream that cannot be
/// rewound ends the operation with the original error.
class RetryingStorage : public Storage {
public:
    RetryingStorage(std::unique_ptr<Storage> backend, RetryPolicy policy = {});

    std::string type_name() const override;
    Object stat(const Context& ctx, const std::string& url) override;
    std::vector<Object> list(const Context& ctx, const std::string& url) override;
    Object get(const Context& ctx, const std::string& url, Writer& dest) override;
    Object put(const Context& ctx, const std::string& url, Reader& src) override;
    std::string join(const std::string& url, const std::string& sub) const override;

    Retrier& retrier() { return retrier_; }
    Storage& backend() { return *backend_; }

private:
    std::unique_ptr<Storage> backend_;
    Retrier retrier_;
};

}  // namespace lfsrelay::storage
