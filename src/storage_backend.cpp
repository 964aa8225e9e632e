#include "lfsrelay/storage/backend.hpp"
#include "lfsrelay/storage/backends.hpp"
#include "lfsrelay/storage/errors.hpp"
#include "lfsrelay/core/log.hpp"

#include <cstdlib>

namespace lfsrelay::storage {

namespace {

bool has_env(const char* name) {
    const char* value = std::getenv(name);
    return value && *value;
}

}  // namespace

// ============================================================================
// Configuration validity
// ============================================================================

bool GoogleCloudConfig::valid() const {
    return !disabled;
}

bool SwiftConfig::valid() const {
    bool user = !user_name.empty() || has_env("OS_USERNAME");
    bool pass = !password.empty() || has_env("OS_PASSWORD");
    bool auth = !auth_url.empty() || has_env("OS_AUTH_URL");
    bool tenant = !tenant_name.empty() || has_env("OS_TENANT_NAME") || has_env("OS_PROJECT_NAME");
    bool tenant_id_set = !tenant_id.empty() || has_env("OS_TENANT_ID") || has_env("OS_PROJECT_ID");
    bool region = !region_name.empty() || has_env("OS_REGION_NAME");

    return !disabled && user && pass && auth && tenant && tenant_id_set && region;
}

bool FtpConfig::valid() const {
    return !disabled;
}

bool LocalConfig::valid() const {
    return !disabled;
}

// ============================================================================
// URL helpers
// ============================================================================

std::string join_url(const std::string& base, const std::string& sub) {
    if (sub.empty()) {
        return base;
    }
    std::string result = base;
    if (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    return result + "/" + sub;
}

BucketPath split_bucket_url(const std::string& url, const std::string& protocol,
                            const std::string& backend) {
    if (!url.starts_with(protocol)) {
        throw UnsupportedProtocolError(backend);
    }
    std::string rest = url.substr(protocol.size());
    if (rest.empty()) {
        throw InvalidAddressError(backend, url);
    }

    BucketPath parts;
    auto slash = rest.find('/');
    if (slash == std::string::npos) {
        parts.bucket = rest;
    } else {
        parts.bucket = rest.substr(0, slash);
        parts.path = rest.substr(slash + 1);
    }
    if (parts.bucket.empty()) {
        throw InvalidAddressError(backend, url);
    }
    return parts;
}

// ============================================================================
// Dispatcher
// ============================================================================

std::unique_ptr<Storage> make_storage(const std::string& url, const StorageConfig& config) {
    if (url.starts_with(GS_PROTOCOL)) {
        if (!config.google_cloud.valid()) {
            throw ConfigurationError("failed to configure Google Storage backend");
        }
        log_debug("Using Google Cloud Storage backend for %s", url.c_str());
        return std::make_unique<GoogleCloudStorage>(config.google_cloud);
    }

    if (url.starts_with(SWIFT_PROTOCOL)) {
        if (!config.swift.valid()) {
            throw ConfigurationError("failed to configure Swift storage backend");
        }
        log_debug("Using Swift backend for %s", url.c_str());
        return std::make_unique<SwiftStorage>(config.swift);
    }

    if (url.starts_with(FTP_PROTOCOL)) {
        if (!config.ftp.valid()) {
            throw ConfigurationError("failed to configure ftp storage backend");
        }
        log_debug("Using FTP backend for %s", url.c_str());
        return std::make_unique<FtpStorage>(config.ftp);
    }

    if (url.starts_with(FILE_PROTOCOL)) {
        if (!config.local.valid()) {
            throw ConfigurationError("failed to configure local storage backend");
        }
        log_debug("Using local filesystem backend for %s", url.c_str());
        return std::make_unique<LocalStorage>(config.local);
    }

    throw UnsupportedProtocolError("no storage backend matches \"" + url + "\"");
}

}  // namespace lfsrelay::storage
