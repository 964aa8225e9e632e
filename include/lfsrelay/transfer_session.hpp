#pragma once

#include "lfsrelay/comms.hpp"
#include "lfsrelay/core/constants.hpp"
#include "lfsrelay/core/context.hpp"
#include "lfsrelay/storage/backend.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace lfsrelay {

class MetricsExporter;

/// Outcome of handling one message. ok == false means the session cannot
/// continue; per-object transfer failures are reported to git-lfs and
/// still count as ok.
struct HandleResult {
    bool ok = true;
    std::string error;

    static HandleResult success() { return {}; }
    static HandleResult failure(std::string error) { return {false, std::move(error)}; }
};

enum class SessionState { AwaitingInit, Active, Terminated };

const char* session_state_to_string(SessionState state);

struct SessionOptions {
    std::string base_url;
    std::filesystem::path data_dir = constants::DEFAULT_DATA_DIR;
    std::chrono::milliseconds progress_interval = constants::PROGRESS_INTERVAL;
};

/// Samples a byte counter on a background thread and reports progress for
/// one object until stopped.
///
/// Samples lower than the last reported one (a stream rewound for a retry)
/// are skipped, so bytesSoFar never decreases. stop() joins the thread and
/// reports one last sample if the counter moved; after it returns nothing
/// more is written for this object.
class ProgressWatcher {
public:
    ProgressWatcher(Comms& comms, std::string oid, std::function<uint64_t()> sample,
                    std::chrono::milliseconds interval);
    ~ProgressWatcher();

    ProgressWatcher(const ProgressWatcher&) = delete;
    ProgressWatcher& operator=(const ProgressWatcher&) = delete;

    void stop();

    uint64_t last_reported() const { return last_; }

private:
    void run();
    void report();

    Comms& comms_;
    std::string oid_;
    std::function<uint64_t()> sample_;
    std::chrono::milliseconds interval_;
    uint64_t last_ = 0;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
    std::thread thread_;
};

/// git-lfs standalone transfer agent session.
///
/// Reads one message at a time from Comms and runs at most one storage
/// operation at a time. A failed transfer produces exactly one error record
/// for its oid and the session carries on; only protocol violations end it.
class TransferSession {
public:
    /// @param storage  Backend used for every transfer (normally retry-wrapped).
    /// @param context  Governs the whole session; cancelling it aborts the
    ///                 in-flight transfer, which is then reported as an error.
    /// @param metrics  Optional, not owned.
    TransferSession(storage::Storage& storage, Comms& comms, SessionOptions options,
                    Context context = Context(), MetricsExporter* metrics = nullptr);

    /// Process one inbound message.
    HandleResult handle(const Message& message);

    /// Receive and handle messages until terminate or end of input.
    HandleResult run();

    /// Abort the in-flight transfer and any later ones.
    void cancel() { context_.cancel(); }

    SessionState state() const { return state_; }
    const Context& context() const { return context_; }

private:
    enum class Direction { Upload, Download };

    HandleResult transfer(Direction direction, const std::string& oid,
                          const std::function<uint64_t()>& run);
    uint64_t upload(const UploadMessage& msg);
    uint64_t download(const DownloadMessage& msg);
    void record(Direction direction, bool ok, uint64_t bytes);

    storage::Storage& storage_;
    Comms& comms_;
    SessionOptions options_;
    Context context_;
    MetricsExporter* metrics_;
    SessionState state_ = SessionState::AwaitingInit;
};

}  // namespace lfsrelay
