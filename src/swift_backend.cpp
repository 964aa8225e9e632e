#include "lfsrelay/storage/backends.hpp"
#include "lfsrelay/storage/errors.hpp"
#include "lfsrelay/core/constants.hpp"
#include "lfsrelay/core/log.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <initializer_list>

namespace lfsrelay::storage {

using json = nlohmann::json;

namespace {

constexpr int SWIFT_LIST_PAGE_SIZE = 10000;

std::string env_or(const std::string& value, std::initializer_list<const char*> names) {
    if (!value.empty()) return value;
    for (const char* name : names) {
        const char* env = std::getenv(name);
        if (env && *env) return env;
    }
    return "";
}

std::string unquote(std::string s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return s;
}

std::string trim_slash(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

// Swift listings carry "2024-01-02T03:04:05.123456" without a zone; it is UTC
std::chrono::system_clock::time_point parse_swift_time(const std::string& s) {
    std::string stamp = s;
    if (!stamp.empty() && stamp.back() != 'Z' && stamp.find('+', 10) == std::string::npos) {
        stamp += 'Z';
    }
    return net::parse_rfc3339(stamp).value_or(std::chrono::system_clock::time_point{});
}

std::string segment_timestamp() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now - secs);
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%lld.%06lld",
                  static_cast<long long>(secs.count()), static_cast<long long>(micros.count()));
    return buf;
}

// One segment of the source: the bytes already peeked, then at most
// `limit` more from the underlying reader.
class SegmentReader : public Reader {
public:
    SegmentReader(Reader& inner, std::vector<uint8_t> head, uint64_t limit)
        : inner_(inner), head_(std::move(head)), remaining_(limit) {}

    size_t read(uint8_t* buffer, size_t length) override {
        if (head_pos_ < head_.size()) {
            size_t n = std::min(length, head_.size() - head_pos_);
            std::copy_n(head_.data() + head_pos_, n, buffer);
            head_pos_ += n;
            count_ += n;
            return n;
        }
        if (remaining_ == 0) return 0;
        size_t want = static_cast<size_t>(std::min<uint64_t>(length, remaining_));
        size_t n = inner_.read(buffer, want);
        remaining_ -= n;
        count_ += n;
        return n;
    }

    uint64_t count() const { return count_; }

private:
    Reader& inner_;
    std::vector<uint8_t> head_;
    size_t head_pos_ = 0;
    uint64_t remaining_;
    uint64_t count_ = 0;
};

struct Segment {
    std::string name;
    std::string etag;
    uint64_t size = 0;
};

}  // namespace

uint64_t clamp_swift_chunk_size(uint64_t requested) {
    if (requested < constants::SWIFT_MIN_CHUNK_SIZE) {
        return constants::SWIFT_DEFAULT_CHUNK_SIZE;
    }
    if (requested > constants::SWIFT_MAX_CHUNK_SIZE) {
        return constants::SWIFT_MAX_CHUNK_SIZE;
    }
    return requested;
}

int keystone_version(const std::string& auth_url) {
    if (auth_url.find("v3") != std::string::npos) return 3;
    if (auth_url.find("v2") != std::string::npos) return 2;
    return 1;
}

// ============================================================================
// SwiftStorage
// ============================================================================

SwiftStorage::SwiftStorage(const SwiftConfig& config)
    : config_(config), chunk_size_(clamp_swift_chunk_size(config.chunk_size_bytes)) {
    // Settings already in the config win over the environment
    config_.user_name = env_or(config_.user_name, {"OS_USERNAME"});
    config_.password = env_or(config_.password, {"OS_PASSWORD"});
    config_.auth_url = env_or(config_.auth_url, {"OS_AUTH_URL"});
    config_.tenant_name = env_or(config_.tenant_name, {"OS_TENANT_NAME", "OS_PROJECT_NAME"});
    config_.tenant_id = env_or(config_.tenant_id, {"OS_TENANT_ID", "OS_PROJECT_ID"});
    config_.region_name = env_or(config_.region_name, {"OS_REGION_NAME"});

    net::HttpClientConfig http_config;
    http_config.user_agent = "lfs-relay-swift/1.0";
    http_client_ = std::make_unique<net::HttpClient>(http_config);

    try {
        authenticate(Context{});
    } catch (const BackendError& e) {
        throw ConfigurationError(e.what());
    }
    log_info("swift: authenticated against %s (keystone v%d), storage at %s",
             config_.auth_url.c_str(), keystone_version(config_.auth_url), storage_url_.c_str());
}

SwiftStorage::~SwiftStorage() = default;

void SwiftStorage::authenticate(const Context& ctx) {
    switch (keystone_version(config_.auth_url)) {
        case 3: authenticate_v3(ctx); break;
        case 2: authenticate_v2(ctx); break;
        default: authenticate_v1(ctx); break;
    }
    if (storage_url_.empty() || auth_token_.empty()) {
        throw BackendError("swift: authentication returned no storage URL or token");
    }
    storage_url_ = trim_slash(storage_url_);
}

void SwiftStorage::authenticate_v1(const Context& ctx) {
    net::HttpRequest request(net::HttpMethod::Get, config_.auth_url);
    request.headers.set("X-Auth-User", config_.user_name);
    request.headers.set("X-Auth-Key", config_.password);
    request.context = &ctx;

    auto response = http_client_->perform_retrying(request, net::HttpRetry{config_.max_retries});
    if (!response.ok()) {
        throw BackendError("swift: v1 authentication failed: " + response.describe());
    }
    storage_url_ = response.headers.get("X-Storage-Url").value_or("");
    auth_token_ = response.headers.get("X-Auth-Token").value_or("");
}

void SwiftStorage::authenticate_v2(const Context& ctx) {
    json body = {
        {"auth", {
            {"passwordCredentials", {
                {"username", config_.user_name},
                {"password", config_.password},
            }},
            {"tenantName", config_.tenant_name},
            {"tenantId", config_.tenant_id},
        }},
    };

    net::HttpRequest request(net::HttpMethod::Post, trim_slash(config_.auth_url) + "/tokens");
    request.set_body(body.dump(), "application/json");
    request.context = &ctx;

    auto response = http_client_->perform_retrying(request, net::HttpRetry{config_.max_retries});
    if (!response.ok()) {
        throw BackendError("swift: v2 authentication failed: " + response.describe());
    }

    try {
        auto reply = json::parse(response.body);
        const auto& access = reply.at("access");
        auth_token_ = access.at("token").at("id").get<std::string>();

        for (const auto& service : access.at("serviceCatalog")) {
            if (service.value("type", "") != "object-store") continue;
            for (const auto& endpoint : service.at("endpoints")) {
                if (config_.region_name.empty() ||
                    endpoint.value("region", "") == config_.region_name) {
                    storage_url_ = endpoint.value("publicURL", "");
                    return;
                }
            }
        }
    } catch (const json::exception& e) {
        throw BackendError(std::string("swift: decoding v2 token: ") + e.what());
    }
    throw BackendError("swift: no object-store endpoint for region \"" + config_.region_name + "\"");
}

void SwiftStorage::authenticate_v3(const Context& ctx) {
    std::string user_domain = env_or("", {"OS_USER_DOMAIN_NAME"});
    std::string project_domain = env_or("", {"OS_PROJECT_DOMAIN_NAME"});
    if (user_domain.empty()) user_domain = "Default";
    if (project_domain.empty()) project_domain = "Default";

    json project = config_.tenant_id.empty()
        ? json{{"name", config_.tenant_name}, {"domain", {{"name", project_domain}}}}
        : json{{"id", config_.tenant_id}};

    json body = {
        {"auth", {
            {"identity", {
                {"methods", json::array({"password"})},
                {"password", {
                    {"user", {
                        {"name", config_.user_name},
                        {"password", config_.password},
                        {"domain", {{"name", user_domain}}},
                    }},
                }},
            }},
            {"scope", {{"project", project}}},
        }},
    };

    net::HttpRequest request(net::HttpMethod::Post, trim_slash(config_.auth_url) + "/auth/tokens");
    request.set_body(body.dump(), "application/json");
    request.context = &ctx;

    auto response = http_client_->perform_retrying(request, net::HttpRetry{config_.max_retries});
    if (!response.ok()) {
        throw BackendError("swift: v3 authentication failed: " + response.describe());
    }
    auth_token_ = response.headers.get("X-Subject-Token").value_or("");

    try {
        auto reply = json::parse(response.body);
        for (const auto& service : reply.at("token").at("catalog")) {
            if (service.value("type", "") != "object-store") continue;
            for (const auto& endpoint : service.at("endpoints")) {
                if (endpoint.value("interface", "") != "public") continue;
                std::string region = endpoint.value("region", endpoint.value("region_id", ""));
                if (config_.region_name.empty() || region == config_.region_name) {
                    storage_url_ = endpoint.value("url", "");
                    return;
                }
            }
        }
    } catch (const json::exception& e) {
        throw BackendError(std::string("swift: decoding v3 token: ") + e.what());
    }
    throw BackendError("swift: no object-store endpoint for region \"" + config_.region_name + "\"");
}

net::HttpResponse SwiftStorage::send(const Context& ctx, net::HttpRequest request) {
    request.context = &ctx;
    request.headers.set("X-Auth-Token", auth_token_);

    // Streamed bodies run once; the retry decorator replays those operations
    const net::HttpRetry retry{config_.max_retries};
    bool streamed = request.body_source || request.response_sink;
    auto response = http_client_->perform_retrying(request, retry);

    // Expired token: authenticate again and replay once
    if (response.status == 401 && !streamed) {
        log_info("swift: token rejected, re-authenticating");
        authenticate(ctx);
        request.headers.set("X-Auth-Token", auth_token_);
        response = http_client_->perform_retrying(request, retry);
    }
    return response;
}

std::string SwiftStorage::container_url(const std::string& container) const {
    return storage_url_ + "/" + net::url_encode(container);
}

std::string SwiftStorage::object_url(const std::string& container, const std::string& name) const {
    return container_url(container) + "/" + net::url_encode_path(name);
}

void SwiftStorage::fail(const std::string& what, const std::string& url,
                        const net::HttpResponse& response) const {
    std::string message = "swift: " + what + " for URL \"" + url + "\": " + response.describe();
    if (response.status == 404) {
        throw NotFoundError(message);
    }
    throw BackendError(message);
}

Object SwiftStorage::stat(const Context& ctx, const std::string& url) {
    auto u = split_bucket_url(url, SWIFT_PROTOCOL, "swift");
    if (u.path.empty()) {
        throw InvalidAddressError("swift", url);
    }

    auto response = send(ctx, net::HttpRequest(net::HttpMethod::Head, object_url(u.bucket, u.path)));
    if (!response.ok()) {
        fail("getting object info", url, response);
    }

    Object obj;
    obj.url = url;
    obj.name = u.path;
    obj.size = response.headers.content_length().value_or(0);
    obj.etag = unquote(response.headers.get("ETag").value_or(""));
    if (auto modified = net::parse_http_date(response.headers.get("Last-Modified").value_or(""))) {
        obj.last_modified = *modified;
    }
    return obj;
}

std::vector<Object> SwiftStorage::list(const Context& ctx, const std::string& url) {
    auto u = split_bucket_url(url, SWIFT_PROTOCOL, "swift");
    std::vector<Object> objects;
    std::string marker;

    while (true) {
        std::string request_url = container_url(u.bucket) + "?format=json&limit=" +
                                  std::to_string(SWIFT_LIST_PAGE_SIZE) +
                                  "&prefix=" + net::url_encode(u.path);
        if (!marker.empty()) {
            request_url += "&marker=" + net::url_encode(marker);
        }

        auto response = send(ctx, net::HttpRequest(net::HttpMethod::Get, request_url));
        if (response.status == 204) break;  // empty container
        if (!response.ok()) {
            fail("listing objects by prefix", url, response);
        }

        json page;
        try {
            page = json::parse(response.body);
        } catch (const json::exception& e) {
            throw BackendError(std::string("swift: decoding listing: ") + e.what());
        }
        if (!page.is_array() || page.empty()) break;

        for (const auto& item : page) {
            std::string name = item.value("name", "");
            marker = name;
            if (name.empty() || name.ends_with("/")) continue;

            Object obj;
            obj.url = std::string(SWIFT_PROTOCOL) + u.bucket + "/" + name;
            obj.name = name;
            obj.size = item.value("bytes", uint64_t{0});
            obj.etag = item.value("hash", "");
            obj.last_modified = parse_swift_time(item.value("last_modified", ""));
            objects.push_back(std::move(obj));
        }

        if (page.size() < static_cast<size_t>(SWIFT_LIST_PAGE_SIZE)) break;
    }
    return objects;
}

Object SwiftStorage::get(const Context& ctx, const std::string& url, Writer& dest) {
    auto obj = stat(ctx, url);
    auto u = split_bucket_url(url, SWIFT_PROTOCOL, "swift");

    ContextWriter out(ctx, dest);
    net::HttpRequest request(net::HttpMethod::Get, object_url(u.bucket, u.path));
    request.response_sink = &out;

    auto response = send(ctx, request);
    if (!response.ok()) {
        fail("copying file", url, response);
    }
    return obj;
}

void SwiftStorage::ensure_container(const Context& ctx, const std::string& container) {
    auto response = send(ctx, net::HttpRequest(net::HttpMethod::Put, container_url(container)));
    if (!response.ok()) {
        fail("creating container", container, response);
    }
}

std::string SwiftStorage::put_segment(const Context& ctx, const std::string& container,
                                      const std::string& name, Reader& src) {
    net::HttpRequest request(net::HttpMethod::Put, object_url(container, name));
    request.body_source = &src;
    request.headers.set("Content-Type", "application/octet-stream");

    auto response = send(ctx, request);
    if (!response.ok()) {
        fail("uploading segment", container + "/" + name, response);
    }
    return unquote(response.headers.get("ETag").value_or(""));
}

Object SwiftStorage::put(const Context& ctx, const std::string& url, Reader& src) {
    auto u = split_bucket_url(url, SWIFT_PROTOCOL, "swift");
    if (u.path.empty()) {
        throw InvalidAddressError("swift", url);
    }

    ContextReader in(ctx, src);
    const std::string segment_container = u.bucket + "_segments";
    const std::string segment_prefix = u.path + "/" + segment_timestamp();
    std::vector<Segment> segments;

    auto cleanup = [&]() {
        for (const auto& seg : segments) {
            try {
                auto response = send(ctx, net::HttpRequest(net::HttpMethod::Delete, object_url(segment_container, seg.name)));
                if (!response.ok()) {
                    log_warn("swift: leaving segment %s/%s behind: %s", segment_container.c_str(),
                             seg.name.c_str(), response.describe().c_str());
                }
            } catch (const StorageError& e) {
                log_warn("swift: leaving segment %s/%s behind: %s", segment_container.c_str(),
                         seg.name.c_str(), e.what());
            }
        }
    };

    try {
        while (true) {
            // Peek so an exhausted source does not produce an empty segment
            std::vector<uint8_t> head(static_cast<size_t>(
                std::min<uint64_t>(constants::DEFAULT_COPY_BUFFER_SIZE, chunk_size_)));
            size_t n = read_full(in, head.data(), head.size());
            if (n == 0) break;
            head.resize(n);

            if (segments.empty()) {
                ensure_container(ctx, segment_container);
            }

            char index[16];
            std::snprintf(index, sizeof(index), "%08zu", segments.size());

            Segment seg;
            seg.name = segment_prefix + "/" + index;
            SegmentReader reader(in, std::move(head), chunk_size_ - n);
            seg.etag = put_segment(ctx, segment_container, seg.name, reader);
            seg.size = reader.count();
            segments.push_back(seg);

            if (seg.size < chunk_size_) break;
        }

        if (segments.empty()) {
            // Nothing to segment: store an empty object directly
            auto response = send(ctx, net::HttpRequest(net::HttpMethod::Put, object_url(u.bucket, u.path)));
            if (!response.ok()) {
                fail("creating object", url, response);
            }
        } else {
            json manifest = json::array();
            for (const auto& seg : segments) {
                manifest.push_back({
                    {"path", "/" + segment_container + "/" + seg.name},
                    {"etag", seg.etag},
                    {"size_bytes", seg.size},
                });
            }

            net::HttpRequest request(net::HttpMethod::Put,
                                     object_url(u.bucket, u.path) + "?multipart-manifest=put");
            request.set_body(manifest.dump(), "application/json");

            auto response = send(ctx, request);
            if (!response.ok()) {
                fail("closing upload", url, response);
            }
        }
    } catch (const CancellationError&) {
        throw;
    } catch (const StorageError&) {
        cleanup();
        throw;
    }

    log_debug("swift: stored %s in %zu segment(s)", url.c_str(), segments.size());
    return stat(ctx, url);
}

std::string SwiftStorage::join(const std::string& url, const std::string& sub) const {
    return join_url(url, sub);
}

}  // namespace lfsrelay::storage
