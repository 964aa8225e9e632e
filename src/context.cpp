#include "lfsrelay/core/context.hpp"
#include "lfsrelay/storage/errors.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace lfsrelay {

struct Context::State {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
    std::optional<Clock::time_point> deadline;
    std::vector<std::weak_ptr<State>> children;

    void cancel() {
        std::vector<std::shared_ptr<State>> to_cancel;
        {
            std::lock_guard lock(mutex);
            if (cancelled) return;
            cancelled = true;
            for (auto& weak : children) {
                if (auto child = weak.lock()) to_cancel.push_back(std::move(child));
            }
            children.clear();
        }
        cv.notify_all();
        for (auto& child : to_cancel) {
            child->cancel();
        }
    }
};

Context::Context() : state_(std::make_shared<State>()) {}

Context::Context(std::shared_ptr<State> state) : state_(std::move(state)) {}

Context Context::with_cancel() const {
    auto child = std::make_shared<State>();
    bool parent_cancelled = false;
    {
        std::lock_guard lock(state_->mutex);
        child->deadline = state_->deadline;
        if (state_->cancelled) {
            parent_cancelled = true;
        } else {
            // Drop registrations of children that no longer exist
            auto& kids = state_->children;
            kids.erase(std::remove_if(kids.begin(), kids.end(),
                                      [](const std::weak_ptr<State>& w) { return w.expired(); }),
                       kids.end());
            kids.push_back(child);
        }
    }
    if (parent_cancelled) child->cancelled = true;
    return Context(std::move(child));
}

Context Context::with_deadline(Clock::time_point deadline) const {
    Context child = with_cancel();
    std::lock_guard lock(child.state_->mutex);
    if (!child.state_->deadline || deadline < *child.state_->deadline) {
        child.state_->deadline = deadline;
    }
    return child;
}

Context Context::with_timeout(std::chrono::milliseconds timeout) const {
    return with_deadline(Clock::now() + timeout);
}

void Context::cancel() const {
    state_->cancel();
}

bool Context::cancelled() const {
    std::lock_guard lock(state_->mutex);
    if (state_->cancelled) return true;
    return state_->deadline && Clock::now() >= *state_->deadline;
}

std::optional<Context::Clock::time_point> Context::deadline() const {
    std::lock_guard lock(state_->mutex);
    return state_->deadline;
}

std::string Context::reason() const {
    std::lock_guard lock(state_->mutex);
    if (state_->cancelled) return "context cancelled";
    if (state_->deadline && Clock::now() >= *state_->deadline) {
        return "context deadline exceeded";
    }
    return {};
}

void Context::check() const {
    auto why = reason();
    if (!why.empty()) {
        throw storage::CancellationError(why);
    }
}

bool Context::wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock lock(state_->mutex);
    auto until = Clock::now() + duration;
    if (state_->deadline && *state_->deadline < until) {
        until = *state_->deadline;
    }
    state_->cv.wait_until(lock, until, [this] { return state_->cancelled; });
    if (state_->cancelled) return true;
    return state_->deadline && Clock::now() >= *state_->deadline;
}

}  // namespace lfsrelay
