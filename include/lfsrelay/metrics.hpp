#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace lfsrelay {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports transfer metrics to a Prometheus textfile for node_exporter pickup.
///
/// A background writer thread serializes the registry every write_interval
/// using temp+rename, and stop() writes one final snapshot. An agent lives
/// only as long as one git-lfs command, so the final write is the one that
/// usually matters.
class MetricsExporter {
public:
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    void start();
    void stop();

    /// Write the registry to the .prom file now. Returns false on I/O error.
    bool write_file();

    prometheus::Counter& uploads_success() { return *uploads_success_; }
    prometheus::Counter& uploads_failure() { return *uploads_failure_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& downloads_success() { return *downloads_success_; }
    prometheus::Counter& downloads_failure() { return *downloads_failure_; }
    prometheus::Counter& download_bytes_total() { return *download_bytes_total_; }
    prometheus::Counter& storage_retries_total() { return *storage_retries_total_; }

    prometheus::Histogram& upload_duration() { return *upload_duration_; }
    prometheus::Histogram& download_duration() { return *download_duration_; }

private:
    void writer_loop();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* downloads_success_;
    prometheus::Counter* downloads_failure_;
    prometheus::Counter* download_bytes_total_;
    prometheus::Counter* storage_retries_total_;

    prometheus::Histogram* upload_duration_;
    prometheus::Histogram* download_duration_;

    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace lfsrelay
