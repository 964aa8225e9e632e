#pragma once

#include "lfsrelay/core/context.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lfsrelay::storage {
class Reader;
class Writer;
}  // namespace lfsrelay::storage

namespace lfsrelay::net {

enum class HttpMethod { Get, Head, Post, Put, Delete };

bool is_success_status(int status);

// 408, 429 and 5xx other than 501
bool is_retryable_status(int status);

// Header fields in arrival order. Name lookups ignore case.
class HttpHeaders {
public:
    // Replace every field named @p name
    void set(const std::string& name, const std::string& value);
    void append(const std::string& name, const std::string& value);

    std::optional<std::string> get(const std::string& name) const;
    std::optional<uint64_t> content_length() const;

    const std::vector<std::pair<std::string, std::string>>& entries() const { return entries_; }
    void clear() { entries_.clear(); }

private:
    std::vector<std::pair<std::string, std::string>> entries_;
};

struct HttpRequest {
    HttpRequest() = default;
    HttpRequest(HttpMethod m, std::string u) : method(m), url(std::move(u)) {}

    HttpMethod method = HttpMethod::Get;
    std::string url;
    HttpHeaders headers;
    std::string body;

    // Streamed request body, used instead of `body` when set. With no
    // body_size the upload is sent with chunked transfer encoding.
    storage::Reader* body_source = nullptr;
    std::optional<uint64_t> body_size;

    // Streamed response body. Only 2xx bodies are streamed; error bodies
    // are still collected into HttpResponse::body.
    storage::Writer* response_sink = nullptr;

    // Cancellation for the transfer; its deadline caps total_timeout.
    const Context* context = nullptr;

    std::chrono::milliseconds connect_timeout{0};  // 0 = client default
    std::chrono::milliseconds total_timeout{0};    // 0 = no limit

    void set_body(std::string data, const std::string& content_type);
};

struct HttpResponse {
    int status = 0;
    HttpHeaders headers;
    std::string body;

    // Set when the exchange failed below HTTP; status is 0 then
    std::string transport_error;

    bool ok() const { return transport_error.empty() && is_success_status(status); }

    // "HTTP <status>: <body excerpt>" or the transport error
    std::string describe() const;
};

struct HttpRetry {
    int max_retries = 3;
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{60000};
};

struct HttpClientConfig {
    std::string user_agent = "lfs-relay/1.0";
    std::chrono::milliseconds connect_timeout{30000};

    // Cap on bodies collected in memory, 0 = unlimited
    size_t max_buffered_body = 64 * 1024 * 1024;
};

/// libcurl-backed HTTP client. Easy handles are pooled and reused so
/// consecutive requests to one host keep their connection.
///
/// Errors raised by a streamed body (including storage::CancellationError
/// from a ContextReader/ContextWriter) are rethrown from perform().
class HttpClient {
public:
    explicit HttpClient(HttpClientConfig config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse perform(const HttpRequest& request);

    /// Repeats transport failures and retryable statuses, doubling the
    /// delay each time. Requests that stream a body run once.
    HttpResponse perform_retrying(const HttpRequest& request, const HttpRetry& retry = {});

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

struct ParsedUrl {
    std::string scheme;
    std::string host;
    int port = 0;          // 0 when absent
    std::string path;      // leading '/' kept, still percent-encoded
    std::string query;
    std::string userinfo;  // "user[:password]", still percent-encoded

    std::optional<std::string> username() const;
    std::optional<std::string> password() const;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

std::string url_encode(const std::string& str);
std::string url_decode(const std::string& str);

// url_encode() each '/'-separated segment, keeping the separators
std::string url_encode_path(const std::string& path);

std::string base64_encode(const std::vector<uint8_t>& data);
std::string base64_encode(const std::string& str);

// URL-safe alphabet, no padding (JWT)
std::string base64url_encode(const std::vector<uint8_t>& data);
std::string base64url_encode(const std::string& str);

/// Format as RFC 3339 UTC ("2024-01-02T03:04:05Z").
std::string format_rfc3339(std::chrono::system_clock::time_point tp);

/// Parse RFC 3339 ("2024-01-02T03:04:05.123Z", offsets allowed).
std::optional<std::chrono::system_clock::time_point> parse_rfc3339(const std::string& s);

/// Parse an RFC 7231 HTTP date ("Tue, 15 Nov 1994 08:12:31 GMT").
std::optional<std::chrono::system_clock::time_point> parse_http_date(const std::string& s);

}  // namespace lfsrelay::net
