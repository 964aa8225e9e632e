#include "lfsrelay/metrics.hpp"
#include "lfsrelay/core/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace lfsrelay {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& transfers_family = prometheus::BuildCounter()
        .Name("lfsrelay_transfers_total")
        .Help("Transfers finished, by direction and result")
        .Labels(labels)
        .Register(*registry_);
    uploads_success_ = &transfers_family.Add({{"direction", "upload"}, {"result", "success"}});
    uploads_failure_ = &transfers_family.Add({{"direction", "upload"}, {"result", "failure"}});
    downloads_success_ = &transfers_family.Add({{"direction", "download"}, {"result", "success"}});
    downloads_failure_ = &transfers_family.Add({{"direction", "download"}, {"result", "failure"}});

    auto& bytes_family = prometheus::BuildCounter()
        .Name("lfsrelay_transfer_bytes_total")
        .Help("Bytes moved by successful transfers")
        .Labels(labels)
        .Register(*registry_);
    upload_bytes_total_ = &bytes_family.Add({{"direction", "upload"}});
    download_bytes_total_ = &bytes_family.Add({{"direction", "download"}});

    storage_retries_total_ = &prometheus::BuildCounter()
        .Name("lfsrelay_storage_retries_total")
        .Help("Storage operations retried after a transient backend error")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    auto& duration_family = prometheus::BuildHistogram()
        .Name("lfsrelay_transfer_duration_seconds")
        .Help("Transfer duration in seconds")
        .Labels(labels)
        .Register(*registry_);
    const prometheus::Histogram::BucketBoundaries buckets{
        0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 900};
    upload_duration_ = &duration_family.Add({{"direction", "upload"}}, buckets);
    download_duration_ = &duration_family.Add({{"direction", "download"}}, buckets);
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        write_file();
    }
}

bool MetricsExporter::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("metrics: cannot open %s", tmp_path.c_str());
        return false;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) {
        log_warn("metrics: write to %s failed", tmp_path.c_str());
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("metrics: rename to %s failed: %s", prom_file_path_.c_str(),
                 ec.message().c_str());
        return false;
    }
    return true;
}

}  // namespace lfsrelay
