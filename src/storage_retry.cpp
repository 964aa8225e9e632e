#include "lfsrelay/storage/retry.hpp"
#include "lfsrelay/core/log.hpp"

#include <algorithm>

namespace lfsrelay::storage {

// ============================================================================
// Retrier
// ============================================================================

std::chrono::milliseconds Retrier::next_delay(std::chrono::milliseconds current) const {
    auto scaled = std::chrono::milliseconds(
        static_cast<int64_t>(static_cast<double>(current.count()) * policy_.multiplier));
    scaled = std::max(scaled, current);
    return std::min(scaled, std::max(policy_.max_delay, current));
}

void Retrier::backoff(const Context& ctx, const std::string& op, int attempt,
                      const BackendError& error, std::chrono::milliseconds& delay) const {
    log_warn("%s failed (attempt %d/%d), retrying in %lld ms: %s", op.c_str(), attempt,
             policy_.max_attempts, static_cast<long long>(delay.count()), error.what());
    if (observer_) {
        observer_(op, attempt, error, delay);
    }

    if (ctx.wait_for(delay)) {
        throw CancellationError(op + ": " + ctx.reason() + " while waiting to retry");
    }
    delay = next_delay(delay);
}

// ============================================================================
// RetryingStorage
// ============================================================================

RetryingStorage::RetryingStorage(std::unique_ptr<Storage> backend, RetryPolicy policy)
    : backend_(std::move(backend)), retrier_(policy) {}

std::string RetryingStorage::type_name() const {
    return backend_->type_name();
}

Object RetryingStorage::stat(const Context& ctx, const std::string& url) {
    return retrier_.run(ctx, "stat " + url, [&] { return backend_->stat(ctx, url); });
}

std::vector<Object> RetryingStorage::list(const Context& ctx, const std::string& url) {
    return retrier_.run(ctx, "list " + url, [&] { return backend_->list(ctx, url); });
}

Object RetryingStorage::get(const Context& ctx, const std::string& url, Writer& dest) {
    return retrier_.run(ctx, "get " + url,
        [&] { return backend_->get(ctx, url, dest); },
        [&] { return dest.rewind(); });
}

Object RetryingStorage::put(const Context& ctx, const std::string& url, Reader& src) {
    return retrier_.run(ctx, "put " + url,
        [&] { return backend_->put(ctx, url, src); },
        [&] { return src.rewind(); });
}

std::string RetryingStorage::join(const std::string& url, const std::string& sub) const {
    return backend_->join(url, sub);
}

}  // namespace lfsrelay::storage
