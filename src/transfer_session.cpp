#include "lfsrelay/transfer_session.hpp"
#include "lfsrelay/core/log.hpp"
#include "lfsrelay/metrics.hpp"
#include "lfsrelay/storage/errors.hpp"
#include "lfsrelay/storage/io.hpp"

#include <optional>
#include <system_error>

namespace lfsrelay {

namespace {

const char* event_name(const Message& message) {
    static const char* const names[] = {
        "init", "upload", "download", "terminate", "progress", "complete", "error"};
    return names[message.index()];
}

// Object ids name files in the data directory, so they must be a single
// path component.
bool valid_oid(const std::string& oid) {
    return !oid.empty() && oid != "." && oid != ".." &&
           oid.find('/') == std::string::npos && oid.find('\0') == std::string::npos;
}

}  // namespace

const char* session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::AwaitingInit: return "awaiting-init";
        case SessionState::Active: return "active";
        case SessionState::Terminated: return "terminated";
    }
    return "unknown";
}

// ============================================================================
// ProgressWatcher
// ============================================================================

ProgressWatcher::ProgressWatcher(Comms& comms, std::string oid,
                                 std::function<uint64_t()> sample,
                                 std::chrono::milliseconds interval)
    : comms_(comms)
    , oid_(std::move(oid))
    , sample_(std::move(sample))
    , interval_(interval) {
    thread_ = std::thread(&ProgressWatcher::run, this);
}

ProgressWatcher::~ProgressWatcher() {
    stop();
}

void ProgressWatcher::stop() {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    report();
}

void ProgressWatcher::run() {
    std::unique_lock lock(mutex_);
    while (true) {
        if (cv_.wait_for(lock, interval_, [this] { return stopping_; })) break;
        lock.unlock();
        report();
        lock.lock();
    }
}

void ProgressWatcher::report() {
    uint64_t current = sample_();
    if (current <= last_) return;
    comms_.send_progress(oid_, current, current - last_);
    last_ = current;
}

// ============================================================================
// TransferSession
// ============================================================================

TransferSession::TransferSession(storage::Storage& storage, Comms& comms,
                                 SessionOptions options, Context context,
                                 MetricsExporter* metrics)
    : storage_(storage)
    , comms_(comms)
    , options_(std::move(options))
    , context_(std::move(context))
    , metrics_(metrics) {}

HandleResult TransferSession::handle(const Message& message) {
    if (auto* init = std::get_if<InitMessage>(&message)) {
        if (state_ == SessionState::Terminated) {
            return HandleResult::success();
        }
        if (state_ == SessionState::Active) {
            log_warn("Repeated init, acknowledging again");
            comms_.send_initialized();
            return HandleResult::success();
        }
        log_info("Session started: operation=%s remote=%s concurrent=%d",
                 init->operation.c_str(), init->remote.c_str(), init->concurrent ? 1 : 0);
        comms_.send_initialized();
        state_ = SessionState::Active;
        return HandleResult::success();
    }

    if (std::holds_alternative<TerminateMessage>(message)) {
        log_info("Session terminated");
        state_ = SessionState::Terminated;
        return HandleResult::success();
    }

    auto* up = std::get_if<UploadMessage>(&message);
    auto* down = std::get_if<DownloadMessage>(&message);
    if (!up && !down) {
        return HandleResult::failure(std::string("unexpected ") + event_name(message) +
                                     " message");
    }
    if (state_ != SessionState::Active) {
        return HandleResult::failure(std::string(event_name(message)) +
                                     " not allowed in state " +
                                     session_state_to_string(state_));
    }

    const std::string& oid = up ? up->oid : down->oid;
    if (!valid_oid(oid)) {
        log_error("Rejecting transfer with invalid oid \"%s\"", oid.c_str());
        comms_.send_error(oid, constants::ERROR_CODE_LOCAL_FILE, "invalid oid \"" + oid + "\"");
        record(up ? Direction::Upload : Direction::Download, false, 0);
        return HandleResult::success();
    }

    if (up) {
        return transfer(Direction::Upload, oid, [&] { return upload(*up); });
    }
    return transfer(Direction::Download, oid, [&] { return download(*down); });
}

HandleResult TransferSession::run() {
    while (state_ != SessionState::Terminated) {
        HandleResult result;
        try {
            result = handle(comms_.receive());
        } catch (const ProtocolError& e) {
            result = HandleResult::failure(e.what());
        }
        if (!result.ok) {
            log_error("Session aborted: %s", result.error.c_str());
            return result;
        }
    }
    return HandleResult::success();
}

HandleResult TransferSession::transfer(Direction direction, const std::string& oid,
                                       const std::function<uint64_t()>& run) {
    const char* what = direction == Direction::Upload ? "Upload" : "Download";

    std::optional<ScopedTimer> timer;
    if (metrics_) {
        timer.emplace(direction == Direction::Upload ? metrics_->upload_duration()
                                                     : metrics_->download_duration());
    }

    int code = constants::ERROR_CODE_INTERNAL;
    std::string message;
    try {
        uint64_t bytes = run();
        record(direction, true, bytes);
        return HandleResult::success();
    } catch (const storage::StorageError& e) {
        code = constants::ERROR_CODE_STORAGE;
        message = e.what();
    } catch (const std::system_error& e) {
        code = constants::ERROR_CODE_LOCAL_FILE;
        message = e.what();
    } catch (const std::exception& e) {
        message = e.what();
    } catch (...) {
        message = "unknown error";
    }

    log_error("%s %s failed (code %d): %s", what, oid.c_str(), code, message.c_str());
    comms_.send_error(oid, code, message);
    record(direction, false, 0);
    return HandleResult::success();
}

uint64_t TransferSession::upload(const UploadMessage& msg) {
    auto url = storage_.join(options_.base_url, msg.oid);
    log_info("Uploading %s to %s", msg.path.c_str(), url.c_str());

    storage::FileReader file(msg.path);
    storage::CountingReader counted(file);
    {
        ProgressWatcher watcher(comms_, msg.oid, [&counted] { return counted.count(); },
                                options_.progress_interval);
        storage_.put(context_, url, counted);
        watcher.stop();
    }

    comms_.send_complete(msg.oid, "");
    return counted.count();
}

uint64_t TransferSession::download(const DownloadMessage& msg) {
    auto path = std::filesystem::absolute(options_.data_dir / msg.oid);
    auto url = storage_.join(options_.base_url, msg.oid);
    log_info("Downloading %s to %s", url.c_str(), path.c_str());

    storage::ensure_dir(path.parent_path());
    storage::FileWriter file(path);
    storage::CountingWriter counted(file);
    try {
        {
            ProgressWatcher watcher(comms_, msg.oid, [&counted] { return counted.count(); },
                                    options_.progress_interval);
            storage_.get(context_, url, counted);
            watcher.stop();
        }
        file.close();
    } catch (...) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            log_warn("Cannot remove partial download %s: %s", path.c_str(),
                     ec.message().c_str());
        }
        throw;
    }

    comms_.send_complete(msg.oid, path.string());
    return counted.count();
}

void TransferSession::record(Direction direction, bool ok, uint64_t bytes) {
    if (!metrics_) return;
    if (direction == Direction::Upload) {
        (ok ? metrics_->uploads_success() : metrics_->uploads_failure()).Increment();
        if (ok) metrics_->upload_bytes_total().Increment(static_cast<double>(bytes));
    } else {
        (ok ? metrics_->downloads_success() : metrics_->downloads_failure()).Increment();
        if (ok) metrics_->download_bytes_total().Increment(static_cast<double>(bytes));
    }
}

}  // namespace lfsrelay
