#pragma once

#include "lfsrelay/storage/backend.hpp"
#include "lfsrelay/storage/retry.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace lfsrelay {

/// Configuration for one run of the transfer agent.
///
/// Sources, lowest precedence first: built-in defaults, the JSON file named
/// by LFSRELAY_CONFIG, command line flags (a --config file is applied at
/// its position among them), then LFSRELAY_BASE_URL if no base URL was set.
struct AgentConfig {
    // Remote location that object ids are joined onto, e.g. "gs://bucket/lfs"
    std::string base_url;

    // Downloads land here before git-lfs moves them into place
    std::filesystem::path data_dir;

    bool verbose = false;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector); disabled when empty
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    storage::StorageConfig storage;
    storage::RetryPolicy retry;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error or --help (prints to stderr).
    static std::optional<AgentConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in data_dir and log_file when unset.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace lfsrelay
