#include "lfsrelay/agent_config.hpp"
#include "lfsrelay/comms.hpp"
#include "lfsrelay/core/context.hpp"
#include "lfsrelay/core/log.hpp"
#include "lfsrelay/metrics.hpp"
#include "lfsrelay/storage/backend.hpp"
#include "lfsrelay/storage/errors.hpp"
#include "lfsrelay/storage/retry.hpp"
#include "lfsrelay/transfer_session.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <ctime>
#include <iostream>
#include <map>
#include <memory>
#include <pthread.h>
#include <string>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace {

// Cancels the session context on SIGINT/SIGTERM. The signals are blocked in
// every thread and collected here with sigtimedwait, so cancel() never runs
// in signal context.
class SignalWatcher {
public:
    explicit SignalWatcher(lfsrelay::Context context) : context_(std::move(context)) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals_, nullptr);
        thread_ = std::thread([this] { loop(); });
    }

    ~SignalWatcher() {
        stop_ = true;
        if (thread_.joinable()) thread_.join();
    }

private:
    void loop() {
        timespec timeout{0, 200 * 1000 * 1000};
        while (!stop_) {
            int sig = sigtimedwait(&signals_, nullptr, &timeout);
            if (sig > 0) {
                lfsrelay::log_warn("Received signal %d, cancelling transfers", sig);
                context_.cancel();
            }
        }
    }

    lfsrelay::Context context_;
    sigset_t signals_;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

void log_config(const lfsrelay::AgentConfig& config) {
    lfsrelay::log_info("lfs-relay starting (PID %d)", static_cast<int>(getpid()));
    lfsrelay::log_info("  base-url: %s", config.base_url.c_str());
    lfsrelay::log_info("  data-dir: %s", config.data_dir.c_str());
    lfsrelay::log_info("  retry: %d attempts, %lld-%lld ms, x%.1f",
                       config.retry.max_attempts,
                       static_cast<long long>(config.retry.initial_delay.count()),
                       static_cast<long long>(config.retry.max_delay.count()),
                       config.retry.multiplier);
    if (!config.storage.google_cloud.credentials_file.empty()) {
        lfsrelay::log_info("  gcs-credentials-file: ****");
    }
    if (!config.storage.swift.user_name.empty()) {
        lfsrelay::log_info("  swift-user: %s", config.storage.swift.user_name.c_str());
    }
    if (!config.metrics_file.empty()) {
        lfsrelay::log_info("  metrics-file: %s", config.metrics_file.c_str());
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = lfsrelay::AgentConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // stdout belongs to git-lfs; everything else goes to the log file.
    if (!lfsrelay::open_log_file(config.log_file)) {
        std::cerr << "Warning: cannot open log file " << config.log_file
                  << ", logging to stderr\n";
    }
    lfsrelay::set_verbose(config.verbose);
    log_config(config);

    try {
        lfsrelay::storage::ensure_dir(config.data_dir);
    } catch (const std::system_error& e) {
        lfsrelay::log_error("Cannot create data directory %s: %s",
                            config.data_dir.c_str(), e.what());
        return 1;
    }

    // Before any thread is started, so they all inherit the blocked mask.
    lfsrelay::Context context;
    SignalWatcher signals(context);

    std::unique_ptr<lfsrelay::storage::Storage> backend;
    try {
        backend = lfsrelay::storage::make_storage(config.base_url, config.storage);
    } catch (const lfsrelay::storage::StorageError& e) {
        lfsrelay::log_error("Failed to create storage: %s", e.what());
        std::cerr << "lfs-relay: " << e.what() << "\n";
        return 1;
    }
    lfsrelay::log_info("Using %s storage", backend->type_name().c_str());

    std::unique_ptr<lfsrelay::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<lfsrelay::MetricsExporter>(
            config.metrics_file,
            std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"backend", backend->type_name()}});
        metrics->start();
    }

    lfsrelay::storage::RetryingStorage storage(std::move(backend), config.retry);
    if (metrics) {
        storage.retrier().set_observer(
            [&metrics](const std::string&, int, const lfsrelay::storage::BackendError&,
                       std::chrono::milliseconds) {
                metrics->storage_retries_total().Increment();
            });
    }

    lfsrelay::Comms comms(std::cin, std::cout);
    lfsrelay::SessionOptions options{config.base_url, config.data_dir};
    lfsrelay::TransferSession session(storage, comms, options, context, metrics.get());
    auto result = session.run();

    if (metrics) {
        metrics->stop();
    }

    if (!result.ok) {
        std::cerr << "lfs-relay: " << result.error << "\n";
        lfsrelay::close_log_file();
        return 1;
    }
    lfsrelay::log_info("lfs-relay exited cleanly");
    lfsrelay::close_log_file();
    return 0;
}
