#include "lfsrelay/agent_config.hpp"
#include "lfsrelay/core/constants.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace lfsrelay {

namespace {

const char* kUsage =
    "Usage: lfs-relay [options]\n"
    "\n"
    "git-lfs standalone custom transfer agent. Speaks the git-lfs custom\n"
    "transfer protocol on stdin/stdout.\n"
    "\n"
    "  --base-url <url>          Remote location for objects: gs://bucket/prefix,\n"
    "                            swift://container/prefix, ftp://host/path or\n"
    "                            file:///path (or LFSRELAY_BASE_URL env)\n"
    "  --config <path>           JSON config file (or LFSRELAY_CONFIG env)\n"
    "  --data-dir <path>         Download staging directory (default: .lfs-relay/data)\n"
    "  --log-file <path>         Log file (default: .lfs-relay/logs/agent.log)\n"
    "  --verbose                 Debug logging\n"
    "  --metrics-file <path>     Prometheus .prom file for node_exporter textfile collector\n"
    "  --metrics-interval <secs> Metrics write interval (default: 15)\n"
    "  --help                    Show this help\n"
    "\n"
    "Example .lfsconfig:\n"
    "  [lfs]\n"
    "    standalonetransferagent = lfs-relay\n"
    "  [lfs \"customtransfer.lfs-relay\"]\n"
    "    path = lfs-relay\n"
    "    args = --base-url gs://my-bucket/lfs\n";

// Overlay fields present in @p j onto @p c.
void load_storage_json(const nlohmann::json& j, storage::StorageConfig& c) {
    if (j.contains("google_cloud") && j["google_cloud"].is_object()) {
        auto& g = j["google_cloud"];
        if (g.contains("disabled")) c.google_cloud.disabled = g["disabled"].get<bool>();
        if (g.contains("credentials_file"))
            c.google_cloud.credentials_file = g["credentials_file"].get<std::string>();
        if (g.contains("endpoint")) c.google_cloud.endpoint = g["endpoint"].get<std::string>();
    }

    if (j.contains("swift") && j["swift"].is_object()) {
        auto& s = j["swift"];
        if (s.contains("disabled")) c.swift.disabled = s["disabled"].get<bool>();
        if (s.contains("user_name")) c.swift.user_name = s["user_name"].get<std::string>();
        if (s.contains("password")) c.swift.password = s["password"].get<std::string>();
        if (s.contains("auth_url")) c.swift.auth_url = s["auth_url"].get<std::string>();
        if (s.contains("tenant_name")) c.swift.tenant_name = s["tenant_name"].get<std::string>();
        if (s.contains("tenant_id")) c.swift.tenant_id = s["tenant_id"].get<std::string>();
        if (s.contains("region_name")) c.swift.region_name = s["region_name"].get<std::string>();
        if (s.contains("chunk_size_bytes"))
            c.swift.chunk_size_bytes = s["chunk_size_bytes"].get<uint64_t>();
        if (s.contains("max_retries")) c.swift.max_retries = s["max_retries"].get<int>();
    }

    if (j.contains("ftp") && j["ftp"].is_object()) {
        auto& f = j["ftp"];
        if (f.contains("disabled")) c.ftp.disabled = f["disabled"].get<bool>();
        if (f.contains("timeout_secs"))
            c.ftp.timeout = std::chrono::seconds(f["timeout_secs"].get<int64_t>());
        if (f.contains("user")) c.ftp.user = f["user"].get<std::string>();
        if (f.contains("password")) c.ftp.password = f["password"].get<std::string>();
    }

    if (j.contains("local") && j["local"].is_object()) {
        auto& l = j["local"];
        if (l.contains("disabled")) c.local.disabled = l["disabled"].get<bool>();
        if (l.contains("allowed_root")) c.local.allowed_root = l["allowed_root"].get<std::string>();
    }
}

void load_retry_json(const nlohmann::json& r, storage::RetryPolicy& p) {
    if (r.contains("max_attempts")) p.max_attempts = r["max_attempts"].get<int>();
    if (r.contains("initial_delay_ms"))
        p.initial_delay = std::chrono::milliseconds(r["initial_delay_ms"].get<int64_t>());
    if (r.contains("max_delay_ms"))
        p.max_delay = std::chrono::milliseconds(r["max_delay_ms"].get<int64_t>());
    if (r.contains("multiplier")) p.multiplier = r["multiplier"].get<double>();
}

}  // namespace

std::optional<AgentConfig> AgentConfig::from_args(int argc, char* argv[]) {
    AgentConfig config;

    if (const char* env = std::getenv("LFSRELAY_CONFIG"); env && *env) {
        if (!config.load_json(env)) return std::nullopt;
    }

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--base-url") {
            auto* v = next_arg(i, "--base-url");
            if (!v) return std::nullopt;
            config.base_url = v;
        } else if (arg == "--config") {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        } else if (arg == "--data-dir") {
            auto* v = next_arg(i, "--data-dir");
            if (!v) return std::nullopt;
            config.data_dir = v;
        } else if (arg == "--log-file") {
            auto* v = next_arg(i, "--log-file");
            if (!v) return std::nullopt;
            config.log_file = v;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--metrics-file") {
            auto* v = next_arg(i, "--metrics-file");
            if (!v) return std::nullopt;
            config.metrics_file = v;
        } else if (arg == "--metrics-interval") {
            auto* v = next_arg(i, "--metrics-interval");
            if (!v) return std::nullopt;
            try {
                config.metrics_interval_secs = std::stoull(v);
            } catch (const std::exception&) {
                std::cerr << "Error: --metrics-interval expects a number, got: " << v << "\n";
                return std::nullopt;
            }
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << kUsage;
            return std::nullopt;
        } else {
            std::cerr << "Error: unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    if (config.base_url.empty()) {
        if (const char* env = std::getenv("LFSRELAY_BASE_URL")) {
            config.base_url = env;
        }
    }

    config.apply_defaults();
    return config;
}

bool AgentConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("base_url")) base_url = j["base_url"].get<std::string>();
        if (j.contains("data_dir")) data_dir = j["data_dir"].get<std::string>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval"))
            metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("storage") && j["storage"].is_object()) {
            load_storage_json(j["storage"], storage);
        }
        if (j.contains("retry") && j["retry"].is_object()) {
            load_retry_json(j["retry"], retry);
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config " << path << ": " << e.what() << "\n";
        return false;
    }
}

void AgentConfig::apply_defaults() {
    if (data_dir.empty()) data_dir = constants::DEFAULT_DATA_DIR;
    if (log_file.empty()) log_file = constants::DEFAULT_LOG_FILE;
}

std::string AgentConfig::validate() const {
    if (base_url.empty()) return "base_url is required (--base-url or LFSRELAY_BASE_URL)";
    if (data_dir.empty()) return "data_dir must not be empty";
    if (retry.max_attempts < 1) return "retry.max_attempts must be >= 1";
    if (retry.initial_delay.count() < 0) return "retry.initial_delay_ms must be >= 0";
    if (retry.max_delay < retry.initial_delay)
        return "retry.max_delay_ms must be >= retry.initial_delay_ms";
    if (retry.multiplier < 1.0) return "retry.multiplier must be >= 1.0";
    if (storage.ftp.timeout.count() <= 0) return "storage.ftp.timeout_secs must be > 0";
    if (!metrics_file.empty() && metrics_interval_secs == 0)
        return "metrics_interval must be > 0";
    return {};
}

}  // namespace lfsrelay
