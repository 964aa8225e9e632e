#include "lfsrelay/net/http.hpp"
#include "lfsrelay/storage/errors.hpp"
#include "lfsrelay/storage/io.hpp"

#include <curl/curl.h>
#include <openssl/evp.h>

#include <algorithm>
#include <cinttypes>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <exception>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>

namespace lfsrelay::net {

// ============================================================================
// Utility functions
// ============================================================================

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_retryable_status(int status) {
    return status == 408 || status == 429 || (status >= 500 && status != 501);
}

std::string url_encode(const std::string& str) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

std::string url_encode_path(const std::string& path) {
    std::string result;
    size_t start = 0;
    while (true) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) {
            result += url_encode(path.substr(start));
            break;
        }
        result += url_encode(path.substr(start, slash - start));
        result += '/';
        start = slash + 1;
    }
    return result;
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::string url_decode(const std::string& str) {
    std::string decoded;
    decoded.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int h1 = hex_digit(str[i + 1]);
            int h2 = hex_digit(str[i + 2]);
            if (h1 >= 0 && h2 >= 0) {
                int value = (h1 << 4) | h2;
                // Reject embedded null bytes (%00) to prevent truncation
                if (value != 0) {
                    decoded += static_cast<char>(value);
                }
                i += 2;
                continue;
            }
        }
        decoded += str[i];
    }

    return decoded;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data.data(),
                            static_cast<int>(data.size()));
    out.resize(n < 0 ? 0 : static_cast<size_t>(n));
    return out;
}

std::string base64_encode(const std::string& str) {
    return base64_encode(std::vector<uint8_t>(str.begin(), str.end()));
}

std::string base64url_encode(const std::vector<uint8_t>& data) {
    std::string result = base64_encode(data);
    for (auto& ch : result) {
        if (ch == '+') ch = '-';
        else if (ch == '/') ch = '_';
    }
    while (!result.empty() && result.back() == '=') result.pop_back();
    return result;
}

std::string base64url_encode(const std::string& str) {
    return base64url_encode(std::vector<uint8_t>(str.begin(), str.end()));
}

// ============================================================================
// Timestamps
// ============================================================================

std::string format_rfc3339(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf;
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_buf);
    return buf;
}

std::optional<std::chrono::system_clock::time_point> parse_rfc3339(const std::string& s) {
    std::tm tm_buf{};
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
                    &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec, &consumed) != 6) {
        return std::nullopt;
    }
    tm_buf.tm_year -= 1900;
    tm_buf.tm_mon -= 1;

    size_t pos = static_cast<size_t>(consumed);
    std::chrono::nanoseconds fraction{0};
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int64_t scale = 100000000;
        int64_t nanos = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            nanos += (s[pos] - '0') * scale;
            scale /= 10;
            ++pos;
        }
        fraction = std::chrono::nanoseconds(nanos);
    }

    int offset_seconds = 0;
    if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
        int hh = 0, mm = 0;
        if (std::sscanf(s.c_str() + pos + 1, "%2d:%2d", &hh, &mm) != 2) {
            return std::nullopt;
        }
        offset_seconds = (hh * 3600 + mm * 60) * (s[pos] == '+' ? 1 : -1);
    } else if (pos >= s.size() || (s[pos] != 'Z' && s[pos] != 'z')) {
        return std::nullopt;
    }

    std::time_t t = timegm(&tm_buf);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    auto tp = std::chrono::system_clock::from_time_t(t - offset_seconds);
    return tp + std::chrono::duration_cast<std::chrono::system_clock::duration>(fraction);
}

std::optional<std::chrono::system_clock::time_point> parse_http_date(const std::string& s) {
    std::tm tm_buf{};
    const char* end = strptime(s.c_str(), "%a, %d %b %Y %H:%M:%S", &tm_buf);
    if (!end) return std::nullopt;
    std::time_t t = timegm(&tm_buf);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(t);
}

// ============================================================================
// Headers, requests, responses
// ============================================================================

namespace {

bool same_name(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

}  // namespace

void HttpHeaders::set(const std::string& name, const std::string& value) {
    std::erase_if(entries_, [&](const auto& field) { return same_name(field.first, name); });
    entries_.emplace_back(name, value);
}

void HttpHeaders::append(const std::string& name, const std::string& value) {
    entries_.emplace_back(name, value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    for (const auto& [field, value] : entries_) {
        if (same_name(field, name)) return value;
    }
    return std::nullopt;
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto val = get("Content-Length");
    if (!val || val->empty() ||
        val->find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    uint64_t length = 0;
    if (std::sscanf(val->c_str(), "%" SCNu64, &length) != 1) return std::nullopt;
    return length;
}

void HttpRequest::set_body(std::string data, const std::string& content_type) {
    body = std::move(data);
    headers.set("Content-Type", content_type);
}

std::string HttpResponse::describe() const {
    if (!transport_error.empty()) return transport_error;
    std::string msg = "HTTP " + std::to_string(status);
    if (!body.empty()) {
        msg += ": " + (body.size() > 200 ? body.substr(0, 200) + "..." : body);
    }
    return msg;
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    ParsedUrl result;

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }
    result.scheme = url.substr(0, scheme_end);
    size_t pos = scheme_end + 3;

    // Userinfo ends at the last '@' before the path
    size_t slash_pos = url.find('/', pos);
    size_t at_pos = url.rfind('@', slash_pos == std::string::npos ? std::string::npos : slash_pos);
    if (at_pos != std::string::npos && at_pos >= pos) {
        result.userinfo = url.substr(pos, at_pos - pos);
        pos = at_pos + 1;
    }

    size_t host_end = url.find_first_of("/?#", pos);
    if (host_end == std::string::npos) {
        host_end = url.size();
    }

    std::string host_port = url.substr(pos, host_end - pos);
    if (!host_port.empty() && host_port.front() == '[') {
        size_t bracket_end = host_port.find(']');
        if (bracket_end == std::string::npos) return std::nullopt;
        result.host = host_port.substr(1, bracket_end - 1);
        if (bracket_end + 1 < host_port.size() && host_port[bracket_end + 1] == ':') {
            try {
                result.port = std::stoi(host_port.substr(bracket_end + 2));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        }
    } else {
        size_t colon_pos = host_port.rfind(':');
        if (colon_pos != std::string::npos) {
            result.host = host_port.substr(0, colon_pos);
            try {
                result.port = std::stoi(host_port.substr(colon_pos + 1));
            } catch (const std::exception&) {
                return std::nullopt;
            }
        } else {
            result.host = host_port;
        }
    }

    pos = host_end;

    if (pos < url.size() && url[pos] == '/') {
        size_t path_end = url.find_first_of("?#", pos);
        if (path_end == std::string::npos) {
            path_end = url.size();
        }
        result.path = url.substr(pos, path_end - pos);
        pos = path_end;
    }

    if (pos < url.size() && url[pos] == '?') {
        size_t query_end = url.find('#', pos);
        if (query_end == std::string::npos) {
            query_end = url.size();
        }
        result.query = url.substr(pos + 1, query_end - pos - 1);
    }

    return result;
}

std::optional<std::string> ParsedUrl::username() const {
    if (userinfo.empty()) return std::nullopt;
    return url_decode(userinfo.substr(0, userinfo.find(':')));
}

std::optional<std::string> ParsedUrl::password() const {
    auto colon = userinfo.find(':');
    if (colon == std::string::npos) return std::nullopt;
    return url_decode(userinfo.substr(colon + 1));
}

// ============================================================================
// libcurl callbacks
// ============================================================================

namespace {

struct Exchange {
    CURL* curl = nullptr;
    HttpResponse* response = nullptr;
    storage::Writer* sink = nullptr;
    storage::Reader* source = nullptr;
    const Context* context = nullptr;
    size_t body_limit = 0;
    size_t body_offset = 0;       // read position in a buffered request body
    const std::string* request_body = nullptr;
    bool over_limit = false;
    std::exception_ptr stream_error;
};

size_t on_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ex = static_cast<Exchange*>(userdata);
    size_t bytes = size * nmemb;

    long status = 0;
    curl_easy_getinfo(ex->curl, CURLINFO_RESPONSE_CODE, &status);

    if (ex->sink && is_success_status(static_cast<int>(status))) {
        try {
            ex->sink->write(reinterpret_cast<const uint8_t*>(ptr), bytes);
        } catch (...) {
            ex->stream_error = std::current_exception();
            return 0;
        }
        return bytes;
    }

    if (ex->body_limit > 0 && ex->response->body.size() + bytes > ex->body_limit) {
        ex->over_limit = true;
        return 0;
    }
    ex->response->body.append(ptr, bytes);
    return bytes;
}

size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ex = static_cast<Exchange*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    if (line.empty()) return bytes;

    // Each status line (redirect, 100-continue) begins a fresh response
    if (line.starts_with("HTTP/")) {
        ex->response->headers.clear();
        ex->response->body.clear();
        return bytes;
    }

    auto colon = line.find(':');
    if (colon == std::string::npos) return bytes;
    auto value_start = line.find_first_not_of(" \t", colon + 1);
    ex->response->headers.append(
        line.substr(0, colon),
        value_start == std::string::npos ? std::string{} : line.substr(value_start));
    return bytes;
}

size_t on_read(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ex = static_cast<Exchange*>(userdata);
    size_t room = size * nitems;

    if (ex->source) {
        try {
            return ex->source->read(reinterpret_cast<uint8_t*>(buffer), room);
        } catch (...) {
            ex->stream_error = std::current_exception();
            return CURL_READFUNC_ABORT;
        }
    }

    size_t n = std::min(room, ex->request_body->size() - ex->body_offset);
    std::memcpy(buffer, ex->request_body->data() + ex->body_offset, n);
    ex->body_offset += n;
    return n;
}

int on_progress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ex = static_cast<Exchange*>(clientp);
    // Non-zero aborts with CURLE_ABORTED_BY_CALLBACK
    return ex->context && ex->context->cancelled() ? 1 : 0;
}

}  // namespace

// ============================================================================
// HttpClient
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(HttpClientConfig config) : config_(std::move(config)) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_ALL); });
    }

    ~Impl() {
        std::lock_guard lock(pool_mutex_);
        for (CURL* handle : idle_) {
            curl_easy_cleanup(handle);
        }
    }

    HttpResponse perform(const HttpRequest& request) {
        if (request.context) {
            request.context->check();
        }

        HttpResponse response;
        CURL* curl = acquire();
        if (!curl) {
            response.transport_error = "cannot create curl handle";
            return response;
        }

        Exchange ex;
        ex.curl = curl;
        ex.response = &response;
        ex.sink = request.response_sink;
        ex.source = request.body_source;
        ex.context = request.context;
        ex.body_limit = config_.max_buffered_body;
        ex.request_body = &request.body;

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        configure_method(curl, request);

        curl_slist* header_list = build_headers(request);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_READFUNCTION, on_read);
        curl_easy_setopt(curl, CURLOPT_READDATA, &ex);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, on_body);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ex);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, on_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ex);
        if (request.context) {
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, on_progress);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ex);
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        }

        auto connect_timeout = request.connect_timeout.count() > 0 ? request.connect_timeout
                                                                   : config_.connect_timeout;
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(connect_timeout.count()));
        if (auto total = total_timeout(request); total.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(total.count()));
        }

        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

        CURLcode res = curl_easy_perform(curl);
        if (res == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
            response.status = static_cast<int>(status);
        } else if (res == CURLE_WRITE_ERROR && ex.over_limit) {
            response.transport_error = "response body larger than " +
                                       std::to_string(config_.max_buffered_body) + " bytes";
        } else {
            response.transport_error = curl_easy_strerror(res);
        }

        curl_slist_free_all(header_list);
        release(curl);

        if (ex.stream_error) {
            std::rethrow_exception(ex.stream_error);
        }
        // Report our own cancellation or deadline rather than curl's view of it
        if ((res == CURLE_ABORTED_BY_CALLBACK || res == CURLE_OPERATION_TIMEDOUT) &&
            request.context) {
            request.context->check();
        }
        return response;
    }

    HttpResponse perform_retrying(const HttpRequest& request, const HttpRetry& retry) {
        if (request.body_source || request.response_sink) {
            return perform(request);
        }

        auto delay = retry.initial_delay;
        for (int attempt = 0;; ++attempt) {
            HttpResponse response = perform(request);
            bool transient = !response.transport_error.empty() ||
                             is_retryable_status(response.status);
            if (!transient || attempt >= retry.max_retries) {
                return response;
            }

            if (request.context) {
                if (request.context->wait_for(delay)) {
                    request.context->check();
                }
            } else {
                std::this_thread::sleep_for(delay);
            }
            delay = std::min(delay * 2, retry.max_delay);
        }
    }

private:
    static void configure_method(CURL* curl, const HttpRequest& request) {
        bool streamed = request.body_source != nullptr;
        auto length = static_cast<curl_off_t>(
            streamed ? request.body_size.value_or(0) : request.body.size());
        bool length_known = !streamed || request.body_size.has_value();

        switch (request.method) {
            case HttpMethod::Get:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::Head:
                curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
                break;
            case HttpMethod::Delete:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
            case HttpMethod::Post:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                if (length_known) {
                    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, length);
                }
                break;
            case HttpMethod::Put:
                // An empty PUT still sends Content-Length: 0 (servers answer 411 otherwise)
                curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
                if (length_known) {
                    curl_easy_setopt(curl, CURLOPT_INFILESIZE_LARGE, length);
                }
                break;
        }
    }

    static curl_slist* build_headers(const HttpRequest& request) {
        curl_slist* list = nullptr;
        for (const auto& [name, value] : request.headers.entries()) {
            std::string line = value.empty() ? name + ";" : name + ": " + value;
            list = curl_slist_append(list, line.c_str());
        }
        if (request.body_source && !request.body_size) {
            list = curl_slist_append(list, "Transfer-Encoding: chunked");
        }
        // No "Expect: 100-continue" round trip before uploads
        return curl_slist_append(list, "Expect:");
    }

    static std::chrono::milliseconds total_timeout(const HttpRequest& request) {
        auto total = request.total_timeout;
        if (!request.context) return total;
        auto deadline = request.context->deadline();
        if (!deadline) return total;

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            *deadline - Context::Clock::now());
        remaining = std::max(remaining, std::chrono::milliseconds(1));
        return total.count() == 0 ? remaining : std::min(total, remaining);
    }

    CURL* acquire() {
        std::lock_guard lock(pool_mutex_);
        if (idle_.empty()) return curl_easy_init();
        CURL* handle = idle_.back();
        idle_.pop_back();
        return handle;
    }

    void release(CURL* handle) {
        curl_easy_reset(handle);
        std::lock_guard lock(pool_mutex_);
        if (idle_.size() < kMaxIdle) {
            idle_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    static constexpr size_t kMaxIdle = 4;

    HttpClientConfig config_;
    std::mutex pool_mutex_;
    std::vector<CURL*> idle_;
};

HttpClient::HttpClient(HttpClientConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::perform(const HttpRequest& request) {
    return impl_->perform(request);
}

HttpResponse HttpClient::perform_retrying(const HttpRequest& request, const HttpRetry& retry) {
    return impl_->perform_retrying(request, retry);
}

}  // namespace lfsrelay::net
