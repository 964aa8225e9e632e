#include "lfsrelay/storage/backends.hpp"
#include "lfsrelay/storage/errors.hpp"
#include "lfsrelay/core/constants.hpp"
#include "lfsrelay/core/log.hpp"

#include <nlohmann/json.hpp>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include <cstdlib>
#include <fstream>
#include <iterator>
#include <sstream>
#include <utility>

namespace lfsrelay::storage {

using json = nlohmann::json;

namespace {

constexpr const char* DEFAULT_GCS_ENDPOINT = "https://storage.googleapis.com";
constexpr const char* DEFAULT_TOKEN_URI = "https://oauth2.googleapis.com/token";
constexpr const char* CLOUD_PLATFORM_SCOPE = "https://www.googleapis.com/auth/cloud-platform";
constexpr const char* METADATA_TOKEN_URL =
    "http://metadata.google.internal/computeMetadata/v1/instance/service-accounts/default/token";

// GCS reports sizes as decimal strings
uint64_t json_size(const json& j) {
    auto it = j.find("size");
    if (it == j.end()) return 0;
    if (it->is_string()) {
        try {
            return std::stoull(it->get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    return 0;
}

Object object_from_json(const json& j) {
    Object obj;
    obj.name = j.value("name", "");
    obj.etag = j.value("etag", "");
    obj.size = json_size(j);
    obj.url = std::string(GS_PROTOCOL) + j.value("bucket", "") + "/" + obj.name;
    if (auto updated = net::parse_rfc3339(j.value("updated", ""))) {
        obj.last_modified = *updated;
    }
    return obj;
}

json parse_body(const net::HttpResponse& response, const std::string& what) {
    try {
        return json::parse(response.body);
    } catch (const json::exception& e) {
        throw BackendError("googleStorage: decoding " + what + " response: " + e.what());
    }
}

}  // namespace

GcsListPage parse_gcs_list_page(const std::string& body) {
    json page;
    try {
        page = json::parse(body);
    } catch (const json::exception& e) {
        throw BackendError(std::string("googleStorage: decoding list response: ") + e.what());
    }

    GcsListPage result;
    if (auto items = page.find("items"); items != page.end() && items->is_array()) {
        for (const auto& item : *items) {
            auto obj = object_from_json(item);
            // Folder placeholders
            if (obj.name.empty() || obj.name.ends_with("/")) continue;
            result.objects.push_back(std::move(obj));
        }
    }
    result.next_page_token = page.value("nextPageToken", "");
    return result;
}

std::string gcs_content_range(uint64_t offset, uint64_t length, bool last) {
    if (length == 0) {
        return "bytes */" + std::to_string(offset);
    }
    return "bytes " + std::to_string(offset) + "-" + std::to_string(offset + length - 1) + "/" +
           (last ? std::to_string(offset + length) : std::string("*"));
}


// ============================================================================
// Credentials
// ============================================================================

struct GoogleCloudStorage::Credentials {
    enum class Kind { ServiceAccount, AuthorizedUser };

    Kind kind = Kind::ServiceAccount;
    std::string client_email;
    std::string private_key;
    std::string token_uri;
    std::string client_id;
    std::string client_secret;
    std::string refresh_token;

    static std::unique_ptr<Credentials> load(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            throw ConfigurationError("googleStorage: cannot read credentials file " + path);
        }
        std::ostringstream ss;
        ss << file.rdbuf();

        json j;
        try {
            j = json::parse(ss.str());
        } catch (const json::exception& e) {
            throw ConfigurationError("googleStorage: parsing credentials file " + path + ": " + e.what());
        }

        auto creds = std::make_unique<Credentials>();
        std::string type = j.value("type", "service_account");
        if (type == "service_account") {
            creds->kind = Kind::ServiceAccount;
            creds->client_email = j.value("client_email", "");
            creds->private_key = j.value("private_key", "");
            creds->token_uri = j.value("token_uri", DEFAULT_TOKEN_URI);
            if (creds->client_email.empty() || creds->private_key.empty()) {
                throw ConfigurationError("googleStorage: service account file " + path +
                                         " lacks client_email or private_key");
            }
        } else if (type == "authorized_user") {
            creds->kind = Kind::AuthorizedUser;
            creds->client_id = j.value("client_id", "");
            creds->client_secret = j.value("client_secret", "");
            creds->refresh_token = j.value("refresh_token", "");
            creds->token_uri = DEFAULT_TOKEN_URI;
            if (creds->client_id.empty() || creds->refresh_token.empty()) {
                throw ConfigurationError("googleStorage: authorized user file " + path +
                                         " lacks client_id or refresh_token");
            }
        } else {
            throw ConfigurationError("googleStorage: unsupported credentials type \"" + type + "\"");
        }
        return creds;
    }
};

// RSA-SHA256 signing using OpenSSL
std::vector<uint8_t> rsa_sign_sha256(const std::string& pem_key, const std::string& data) {
    BIO* bio = BIO_new_mem_buf(pem_key.data(), static_cast<int>(pem_key.size()));
    if (!bio) return {};

    EVP_PKEY* pkey = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
    BIO_free(bio);
    if (!pkey) return {};

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        EVP_PKEY_free(pkey);
        return {};
    }

    std::vector<uint8_t> signature;
    if (EVP_DigestSignInit(ctx, nullptr, EVP_sha256(), nullptr, pkey) == 1 &&
        EVP_DigestSignUpdate(ctx, data.data(), data.size()) == 1) {
        size_t sig_len = 0;
        if (EVP_DigestSignFinal(ctx, nullptr, &sig_len) == 1) {
            signature.resize(sig_len);
            if (EVP_DigestSignFinal(ctx, signature.data(), &sig_len) == 1) {
                signature.resize(sig_len);
            } else {
                signature.clear();
            }
        }
    }

    EVP_MD_CTX_free(ctx);
    EVP_PKEY_free(pkey);
    return signature;
}

// ============================================================================
// GoogleCloudStorage
// ============================================================================

GoogleCloudStorage::GoogleCloudStorage(const GoogleCloudConfig& config)
    : config_(config) {
    net::HttpClientConfig http_config;
    http_config.user_agent = "lfs-relay-gcs/1.0";
    http_client_ = std::make_unique<net::HttpClient>(http_config);

    if (!config_.credentials_file.empty()) {
        credentials_ = Credentials::load(config_.credentials_file);
    } else if (const char* env = std::getenv("GOOGLE_APPLICATION_CREDENTIALS"); env && *env) {
        // Application-default discovery: a bad file falls through to the
        // metadata server instead of failing construction.
        try {
            credentials_ = Credentials::load(env);
        } catch (const ConfigurationError& e) {
            log_warn("%s; trying the metadata server", e.what());
        }
    }
}

GoogleCloudStorage::~GoogleCloudStorage() = default;

std::string GoogleCloudStorage::api_base() const {
    return (config_.endpoint.empty() ? std::string(DEFAULT_GCS_ENDPOINT) : config_.endpoint) +
           "/storage/v1";
}

std::string GoogleCloudStorage::upload_base() const {
    return (config_.endpoint.empty() ? std::string(DEFAULT_GCS_ENDPOINT) : config_.endpoint) +
           "/upload/storage/v1";
}

std::string GoogleCloudStorage::object_url(const BucketPath& u) const {
    return api_base() + "/b/" + net::url_encode(u.bucket) + "/o/" + net::url_encode(u.path);
}

void GoogleCloudStorage::add_auth_header(const Context& ctx, net::HttpRequest& request) {
    auto token = access_token(ctx);
    if (!token.empty()) {
        request.headers.set("Authorization", "Bearer " + token);
    }
}

std::string GoogleCloudStorage::access_token(const Context& ctx) {
    std::lock_guard lock(token_mutex_);

    // Reuse the cached token until five minutes before it expires
    auto now = std::chrono::steady_clock::now();
    if (!cached_token_.empty() && now < token_expiry_ - std::chrono::minutes(5)) {
        return cached_token_;
    }

    net::HttpRequest request;
    if (credentials_ && credentials_->kind == Credentials::Kind::ServiceAccount) {
        auto iat = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();

        json header = {{"alg", "RS256"}, {"typ", "JWT"}};
        json claims = {
            {"iss", credentials_->client_email},
            {"scope", CLOUD_PLATFORM_SCOPE},
            {"aud", credentials_->token_uri},
            {"iat", iat},
            {"exp", iat + 3600},
        };
        std::string signing_input = net::base64url_encode(header.dump()) + "." +
                                    net::base64url_encode(claims.dump());

        auto signature = rsa_sign_sha256(credentials_->private_key, signing_input);
        if (signature.empty()) {
            throw ConfigurationError("googleStorage: cannot sign token request with the service account key");
        }
        std::string jwt = signing_input + "." + net::base64url_encode(signature);

        request = net::HttpRequest(net::HttpMethod::Post, credentials_->token_uri);
        request.set_body("grant_type=urn%3Aietf%3Aparams%3Aoauth%3Agrant-type%3Ajwt-bearer&assertion=" + jwt,
                         "application/x-www-form-urlencoded");
    } else if (credentials_) {
        request = net::HttpRequest(net::HttpMethod::Post, credentials_->token_uri);
        request.set_body("grant_type=refresh_token&client_id=" + net::url_encode(credentials_->client_id) +
                         "&client_secret=" + net::url_encode(credentials_->client_secret) +
                         "&refresh_token=" + net::url_encode(credentials_->refresh_token),
                         "application/x-www-form-urlencoded");
    } else {
        if (metadata_server_available_ && !*metadata_server_available_) {
            return "";  // anonymous
        }
        request = net::HttpRequest(net::HttpMethod::Get, METADATA_TOKEN_URL);
        request.headers.set("Metadata-Flavor", "Google");
        request.connect_timeout = std::chrono::milliseconds(1000);
        request.total_timeout = std::chrono::milliseconds(3000);
    }
    request.context = &ctx;

    // The metadata server gets a single attempt
    auto response = credentials_ ? http_client_->perform_retrying(request)
                                 : http_client_->perform(request);
    if (!credentials_) {
        metadata_server_available_ = response.ok();
        if (!response.ok()) {
            log_info("googleStorage: no credentials and no metadata server, using anonymous access");
            return "";
        }
    } else if (!response.ok()) {
        throw BackendError("googleStorage: token exchange failed: " + response.describe());
    }

    auto body = parse_body(response, "token");
    cached_token_ = body.value("access_token", "");
    int64_t expires_in = body.value("expires_in", int64_t{3600});
    token_expiry_ = std::chrono::steady_clock::now() + std::chrono::seconds(expires_in);
    return cached_token_;
}

void GoogleCloudStorage::fail(const std::string& what, const std::string& url,
                              const net::HttpResponse& response) const {
    std::string message = "googleStorage: " + what + " " + url + ": " + response.describe();
    if (response.status == 404) {
        throw NotFoundError(message);
    }
    throw BackendError(message);
}

Object GoogleCloudStorage::stat(const Context& ctx, const std::string& url) {
    auto u = split_bucket_url(url, GS_PROTOCOL, "googleStorage");
    if (u.path.empty()) {
        throw InvalidAddressError("googleStorage", url);
    }

    net::HttpRequest request(net::HttpMethod::Get, object_url(u));
    request.context = &ctx;
    add_auth_header(ctx, request);

    auto response = http_client_->perform_retrying(request);
    if (!response.ok()) {
        fail("calling stat on object", url, response);
    }

    auto obj = object_from_json(parse_body(response, "stat"));
    obj.url = url;
    return obj;
}

std::vector<Object> GoogleCloudStorage::list(const Context& ctx, const std::string& url) {
    auto u = split_bucket_url(url, GS_PROTOCOL, "googleStorage");
    std::vector<Object> objects;
    std::string page_token;

    do {
        std::string request_url = api_base() + "/b/" + net::url_encode(u.bucket) + "/o?prefix=" +
                                  net::url_encode(u.path);
        if (!page_token.empty()) {
            request_url += "&pageToken=" + net::url_encode(page_token);
        }

        net::HttpRequest request(net::HttpMethod::Get, request_url);
        request.context = &ctx;
        add_auth_header(ctx, request);

        auto response = http_client_->perform_retrying(request);
        if (!response.ok()) {
            fail("listing objects under", url, response);
        }

        auto page = parse_gcs_list_page(response.body);
        std::move(page.objects.begin(), page.objects.end(), std::back_inserter(objects));
        page_token = std::move(page.next_page_token);
    } while (!page_token.empty());

    return objects;
}

Object GoogleCloudStorage::get(const Context& ctx, const std::string& url, Writer& dest) {
    auto obj = stat(ctx, url);
    auto u = split_bucket_url(url, GS_PROTOCOL, "googleStorage");

    ContextWriter out(ctx, dest);
    net::HttpRequest request(net::HttpMethod::Get, object_url(u) + "?alt=media");
    request.context = &ctx;
    request.response_sink = &out;
    add_auth_header(ctx, request);

    auto response = http_client_->perform(request);
    if (!response.ok()) {
        fail("getting object", url, response);
    }
    return obj;
}

Object GoogleCloudStorage::put(const Context& ctx, const std::string& url, Reader& src) {
    auto u = split_bucket_url(url, GS_PROTOCOL, "googleStorage");
    if (u.path.empty()) {
        throw InvalidAddressError("googleStorage", url);
    }

    // Start a resumable upload session
    net::HttpRequest start(net::HttpMethod::Post,
                           upload_base() + "/b/" + net::url_encode(u.bucket) +
                               "/o?uploadType=resumable&name=" + net::url_encode(u.path));
    start.set_body(json{{"name", u.path}}.dump(), "application/json");
    start.headers.set("X-Upload-Content-Type", "application/octet-stream");
    start.context = &ctx;
    add_auth_header(ctx, start);

    auto started = http_client_->perform_retrying(start);
    if (!started.ok()) {
        fail("starting upload of", url, started);
    }
    auto session_uri = started.headers.get("Location");
    if (!session_uri || session_uri->empty()) {
        throw BackendError("googleStorage: upload of " + url + " returned no session URI");
    }

    // Send fixed-size pieces; the final piece carries the total size. A
    // source ending on a piece boundary is finalized with an empty piece.
    // Nothing is read before the previous piece has been acknowledged.
    ContextReader in(ctx, src);
    const size_t chunk = constants::GCS_UPLOAD_CHUNK_SIZE;
    std::vector<uint8_t> buffer(chunk);
    uint64_t offset = 0;

    while (true) {
        size_t len = read_full(in, buffer.data(), chunk);
        bool last = len < chunk;

        net::HttpRequest piece(net::HttpMethod::Put, *session_uri);
        piece.body.assign(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(len));
        piece.context = &ctx;
        piece.headers.set("Content-Range", gcs_content_range(offset, len, last));
        add_auth_header(ctx, piece);

        auto response = http_client_->perform(piece);
        offset += len;
        if (last) {
            if (!response.ok()) {
                fail("uploading object", url, response);
            }
            break;
        }
        // 308 Resume Incomplete acknowledges an intermediate piece
        if (response.status != 308) {
            fail("uploading object", url, response);
        }
    }

    log_debug("googleStorage: uploaded %s (%llu bytes)", url.c_str(),
              static_cast<unsigned long long>(offset));
    return stat(ctx, url);
}

std::string GoogleCloudStorage::join(const std::string& url, const std::string& sub) const {
    return join_url(url, sub);
}

}  // namespace lfsrelay::storage
