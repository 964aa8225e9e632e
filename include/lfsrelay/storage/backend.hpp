#pragma once

#include "lfsrelay/core/constants.hpp"
#include "lfsrelay/core/context.hpp"
#include "lfsrelay/storage/io.hpp"
#include "lfsrelay/storage/object.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace lfsrelay::storage {

// URL prefixes understood by make_storage()
constexpr const char* GS_PROTOCOL = "gs://";
constexpr const char* SWIFT_PROTOCOL = "swift://";
constexpr const char* FTP_PROTOCOL = "ftp://";
constexpr const char* FILE_PROTOCOL = "file://";

// ============================================================================
// Backend configuration
// ============================================================================

struct GoogleCloudConfig {
    bool disabled = false;
    // Service account or authorized-user key file. When empty,
    // GOOGLE_APPLICATION_CREDENTIALS and then the metadata server are tried.
    std::string credentials_file;
    // Empty for Google, set for an emulator ("http://localhost:4443")
    std::string endpoint;

    bool valid() const;
};

struct SwiftConfig {
    bool disabled = false;
    std::string user_name;
    std::string password;
    std::string auth_url;
    std::string tenant_name;
    std::string tenant_id;
    std::string region_name;
    // Segment size for static large objects, clamped into [100 MB, 5 GB]
    uint64_t chunk_size_bytes = constants::SWIFT_DEFAULT_CHUNK_SIZE;
    int max_retries = constants::SWIFT_DEFAULT_MAX_RETRIES;

    /// Every credential must be present here or in the OS_* environment.
    bool valid() const;
};

struct FtpConfig {
    bool disabled = false;
    std::chrono::milliseconds timeout = constants::DEFAULT_FTP_TIMEOUT;
    std::string user = constants::DEFAULT_FTP_USER;
    std::string password = constants::DEFAULT_FTP_PASSWORD;

    bool valid() const;
};

struct LocalConfig {
    bool disabled = false;
    // When set, file:// URLs must resolve inside this directory
    std::filesystem::path allowed_root;

    bool valid() const;
};

struct StorageConfig {
    GoogleCloudConfig google_cloud;
    SwiftConfig swift;
    FtpConfig ftp;
    LocalConfig local;
};

// ============================================================================
// Storage contract
// ============================================================================

// A remote object store addressed by protocol-prefixed URLs.
//
// Every operation takes the Context governing it and throws a StorageError
// subclass on failure (see errors.hpp). Implementations are used from one
// thread at a time.
class Storage {
public:
    virtual ~Storage() = default;

    // Backend name for logging ("gcs", "swift", "ftp", "local")
    virtual std::string type_name() const = 0;

    // Metadata for exactly one object. Throws NotFoundError otherwise.
    virtual Object stat(const Context& ctx, const std::string& url) = 0;

    // Every regular file at or under url, fully materialised. Directory
    // markers and symbolic links are skipped.
    virtual std::vector<Object> list(const Context& ctx, const std::string& url) = 0;

    // Stream the object into dest. Partial writes are not rolled back.
    virtual Object get(const Context& ctx, const std::string& url, Writer& dest) = 0;

    // Stream src to url and return the stored object's metadata.
    virtual Object put(const Context& ctx, const std::string& url, Reader& src) = 0;

    // Compose a child URL. Pure string manipulation.
    virtual std::string join(const std::string& url, const std::string& sub) const = 0;
};

/// Build the backend for @p url's protocol prefix.
/// Throws UnsupportedProtocolError for an unknown prefix and
/// ConfigurationError when the matching config is disabled or incomplete.
/// No connection is attempted before the configuration is validated.
std::unique_ptr<Storage> make_storage(const std::string& url, const StorageConfig& config);

/// Strip one trailing '/' from @p base and append "/" + @p sub.
/// An empty @p sub returns @p base unchanged.
std::string join_url(const std::string& base, const std::string& sub);

struct BucketPath {
    std::string bucket;
    std::string path;
};

/// Split "<protocol><bucket>/<path>". Throws UnsupportedProtocolError when
/// the prefix is missing and InvalidAddressError when nothing follows it.
BucketPath split_bucket_url(const std::string& url, const std::string& protocol,
                            const std::string& backend);

}  // namespace lfsrelay::storage
