#pragma once

#include "lfsrelay/net/ftp.hpp"
#include "lfsrelay/net/http.hpp"
#include "lfsrelay/storage/backend.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lfsrelay::storage {

// ============================================================================
// Google Cloud Storage (JSON API)
// ============================================================================

class GoogleCloudStorage : public Storage {
public:
    /// Loads the credentials file if one is configured (or named by
    /// GOOGLE_APPLICATION_CREDENTIALS). Throws ConfigurationError if the
    /// file cannot be read or is not a recognised key file.
    explicit GoogleCloudStorage(const GoogleCloudConfig& config);
    ~GoogleCloudStorage() override;

    std::string type_name() const override { return "gcs"; }
    Object stat(const Context& ctx, const std::string& url) override;
    std::vector<Object> list(const Context& ctx, const std::string& url) override;
    Object get(const Context& ctx, const std::string& url, Writer& dest) override;
    Object put(const Context& ctx, const std::string& url, Reader& src) override;
    std::string join(const std::string& url, const std::string& sub) const override;

private:
    struct Credentials;

    std::string api_base() const;
    std::string upload_base() const;
    std::string object_url(const BucketPath& u) const;
    void add_auth_header(const Context& ctx, net::HttpRequest& request);
    std::string access_token(const Context& ctx);
    [[noreturn]] void fail(const std::string& what, const std::string& url,
                           const net::HttpResponse& response) const;

    GoogleCloudConfig config_;
    std::unique_ptr<Credentials> credentials_;
    std::unique_ptr<net::HttpClient> http_client_;

    std::mutex token_mutex_;
    std::string cached_token_;
    std::chrono::steady_clock::time_point token_expiry_;
    std::optional<bool> metadata_server_available_;
};

struct GcsListPage {
    std::vector<Object> objects;     // folder placeholders ("dir/") removed
    std::string next_page_token;     // empty on the last page
};

/// Decode one page of an objects.list response. Throws BackendError on
/// malformed JSON.
GcsListPage parse_gcs_list_page(const std::string& body);

/// Content-Range for a resumable upload piece of @p length bytes at
/// @p offset. The last piece states the total size; an empty last piece
/// finalizes an upload that ended on a piece boundary.
std::string gcs_content_range(uint64_t offset, uint64_t length, bool last);

/// Sign @p data with an RSA private key in PEM form (RS256).
/// Returns an empty vector if the key cannot be parsed.
std::vector<uint8_t> rsa_sign_sha256(const std::string& pem_key, const std::string& data);

// ============================================================================
// OpenStack Swift
// ============================================================================

/// Segment size actually used for static large object uploads.
uint64_t clamp_swift_chunk_size(uint64_t requested);

/// Keystone API version implied by an auth URL: 3 if it contains "v3",
/// 2 if it contains "v2", 1 otherwise.
int keystone_version(const std::string& auth_url);

class SwiftStorage : public Storage {
public:
    /// Fills missing credentials from the OS_* environment and
    /// authenticates. Throws ConfigurationError if authentication fails.
    explicit SwiftStorage(const SwiftConfig& config);
    ~SwiftStorage() override;

    std::string type_name() const override { return "swift"; }
    Object stat(const Context& ctx, const std::string& url) override;
    std::vector<Object> list(const Context& ctx, const std::string& url) override;
    Object get(const Context& ctx, const std::string& url, Writer& dest) override;
    Object put(const Context& ctx, const std::string& url, Reader& src) override;
    std::string join(const std::string& url, const std::string& sub) const override;

    uint64_t chunk_size() const { return chunk_size_; }

private:
    void authenticate(const Context& ctx);
    void authenticate_v1(const Context& ctx);
    void authenticate_v2(const Context& ctx);
    void authenticate_v3(const Context& ctx);

    net::HttpResponse send(const Context& ctx, net::HttpRequest request);
    std::string container_url(const std::string& container) const;
    std::string object_url(const std::string& container, const std::string& name) const;
    void ensure_container(const Context& ctx, const std::string& container);
    std::string put_segment(const Context& ctx, const std::string& container,
                            const std::string& name, Reader& src);
    [[noreturn]] void fail(const std::string& what, const std::string& url,
                           const net::HttpResponse& response) const;

    SwiftConfig config_;
    uint64_t chunk_size_;
    std::unique_ptr<net::HttpClient> http_client_;
    std::string storage_url_;
    std::string auth_token_;
};

// ============================================================================
// FTP
// ============================================================================

class FtpStorage : public Storage {
public:
    explicit FtpStorage(const FtpConfig& config);

    std::string type_name() const override { return "ftp"; }
    Object stat(const Context& ctx, const std::string& url) override;
    std::vector<Object> list(const Context& ctx, const std::string& url) override;
    Object get(const Context& ctx, const std::string& url, Writer& dest) override;
    Object put(const Context& ctx, const std::string& url, Reader& src) override;
    std::string join(const std::string& url, const std::string& sub) const override;

    struct Endpoint {
        std::string server;    // "ftp://host:port"
        std::string path;      // decoded, relative to the login directory
        std::string user;
        std::string password;
    };

    /// Resolve the server, path and login for @p url. A user embedded in the
    /// URL replaces the configured one; without an embedded password the
    /// configured password is cleared.
    Endpoint resolve(const std::string& url) const;

private:
    FtpConfig config_;
};

/// Metadata for @p url from the LIST of its path. Throws NotFoundError unless
/// there is exactly one entry, it names @p path, and it is a regular file.
Object ftp_stat_entry(const std::vector<net::FtpEntry>& entries, const std::string& url,
                      const std::string& path);

// ============================================================================
// Local filesystem
// ============================================================================

class LocalStorage : public Storage {
public:
    explicit LocalStorage(const LocalConfig& config);

    std::string type_name() const override { return "local"; }
    Object stat(const Context& ctx, const std::string& url) override;
    std::vector<Object> list(const Context& ctx, const std::string& url) override;
    Object get(const Context& ctx, const std::string& url, Writer& dest) override;
    Object put(const Context& ctx, const std::string& url, Reader& src) override;
    std::string join(const std::string& url, const std::string& sub) const override;

    /// Map a file:// URL onto the host filesystem.
    std::filesystem::path url_to_path(const std::string& url) const;

private:
    LocalConfig config_;
};

}  // namespace lfsrelay::storage
