#include "lfsrelay/net/ftp.hpp"
#include "lfsrelay/net/http.hpp"
#include "lfsrelay/storage/io.hpp"

#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <exception>
#include <mutex>
#include <sstream>

namespace lfsrelay::net {

// ============================================================================
// LIST parsing
// ============================================================================

namespace {

struct Token {
    std::string text;
    size_t offset;
};

std::vector<Token> tokenize(const std::string& line, size_t max_tokens) {
    std::vector<Token> tokens;
    size_t pos = 0;
    while (pos < line.size() && tokens.size() < max_tokens) {
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
        if (pos >= line.size()) break;
        size_t start = pos;
        while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
        tokens.push_back({line.substr(start, pos - start), start});
    }
    return tokens;
}

int month_index(const std::string& name) {
    static const char* months[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                   "jul", "aug", "sep", "oct", "nov", "dec"};
    if (name.size() != 3) return -1;
    std::string lower;
    for (char c : name) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    for (int i = 0; i < 12; ++i) {
        if (lower == months[i]) return i;
    }
    return -1;
}

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::chrono::system_clock::time_point make_time(int year, int month, int day, int hour, int minute) {
    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    return std::chrono::system_clock::from_time_t(timegm(&tm_buf));
}

int year_of(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_buf;
    gmtime_r(&t, &tm_buf);
    return tm_buf.tm_year + 1900;
}

// drwxr-xr-x   2 owner group   4096 Jan 02 10:00 name
// -rw-r--r--   1 owner group 123456 Mar 14  2021 name with spaces
// lrwxrwxrwx   1 owner group      7 Jan 02 10:00 link -> target
std::optional<FtpEntry> parse_unix_line(const std::string& line,
                                        std::chrono::system_clock::time_point now) {
    auto tokens = tokenize(line, 9);
    if (tokens.size() < 8) return std::nullopt;

    const std::string& perms = tokens[0].text;
    if (perms.size() < 10) return std::nullopt;

    FtpEntry entry;
    switch (perms[0]) {
        case '-': entry.type = FtpEntryType::File; break;
        case 'd': entry.type = FtpEntryType::Folder; break;
        case 'l': entry.type = FtpEntryType::Link; break;
        default: return std::nullopt;
    }

    // The group column is missing on some servers; locate the month instead.
    size_t month_pos = 0;
    for (size_t i = 3; i + 2 < tokens.size(); ++i) {
        if (month_index(tokens[i].text) >= 0 && all_digits(tokens[i + 1].text) &&
            all_digits(tokens[i - 1].text)) {
            month_pos = i;
            break;
        }
    }
    if (month_pos == 0) return std::nullopt;

    // Re-split so the name keeps its internal spacing
    auto fields = tokenize(line, month_pos + 3);
    if (fields.size() < month_pos + 3) return std::nullopt;
    size_t name_start = fields[month_pos + 2].offset + fields[month_pos + 2].text.size();
    while (name_start < line.size() && line[name_start] == ' ') ++name_start;
    if (name_start >= line.size()) return std::nullopt;
    entry.name = line.substr(name_start);

    try {
        entry.size = std::stoull(fields[month_pos - 1].text);
    } catch (const std::exception&) {
        return std::nullopt;
    }

    int month = month_index(fields[month_pos].text);
    int day = std::stoi(fields[month_pos + 1].text);
    const std::string& when = fields[month_pos + 2].text;

    if (when.find(':') != std::string::npos) {
        int hour = 0, minute = 0;
        if (std::sscanf(when.c_str(), "%d:%d", &hour, &minute) != 2) return std::nullopt;
        int year = year_of(now);
        entry.time = make_time(year, month, day, hour, minute);
        // No year means "within the last twelve months"
        if (entry.time > now + std::chrono::hours(24)) {
            entry.time = make_time(year - 1, month, day, hour, minute);
        }
    } else if (all_digits(when)) {
        entry.time = make_time(std::stoi(when), month, day, 0, 0);
    } else {
        return std::nullopt;
    }

    if (entry.type == FtpEntryType::Link) {
        auto arrow = entry.name.find(" -> ");
        if (arrow != std::string::npos) {
            entry.link_target = entry.name.substr(arrow + 4);
            entry.name = entry.name.substr(0, arrow);
        }
    }

    return entry;
}

// 01-16-02  11:14AM       <DIR>          epsgroup
// 06-05-2003  03:19PM                 1973 readme.txt
std::optional<FtpEntry> parse_dos_line(const std::string& line) {
    auto tokens = tokenize(line, 3);
    if (tokens.size() < 3) return std::nullopt;

    int month = 0, day = 0, year = 0;
    if (std::sscanf(tokens[0].text.c_str(), "%d-%d-%d", &month, &day, &year) != 3) {
        return std::nullopt;
    }
    if (year < 70) year += 2000;
    else if (year < 100) year += 1900;

    int hour = 0, minute = 0;
    char ampm[3] = {0, 0, 0};
    if (std::sscanf(tokens[1].text.c_str(), "%d:%d%2c", &hour, &minute, ampm) < 2) {
        return std::nullopt;
    }
    if (std::toupper(static_cast<unsigned char>(ampm[0])) == 'P' && hour < 12) hour += 12;
    if (std::toupper(static_cast<unsigned char>(ampm[0])) == 'A' && hour == 12) hour = 0;

    FtpEntry entry;
    entry.time = make_time(year, month - 1, day, hour, minute);

    if (tokens[2].text == "<DIR>") {
        entry.type = FtpEntryType::Folder;
    } else if (all_digits(tokens[2].text)) {
        entry.type = FtpEntryType::File;
        entry.size = std::stoull(tokens[2].text);
    } else {
        return std::nullopt;
    }

    size_t name_start = tokens[2].offset + tokens[2].text.size();
    while (name_start < line.size() && line[name_start] == ' ') ++name_start;
    if (name_start >= line.size()) return std::nullopt;
    entry.name = line.substr(name_start);
    return entry;
}

}  // namespace

std::optional<FtpEntry> parse_ftp_list_line(const std::string& raw,
                                            std::chrono::system_clock::time_point now) {
    std::string line = raw;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }
    if (line.empty()) return std::nullopt;

    if (std::isdigit(static_cast<unsigned char>(line[0]))) {
        return parse_dos_line(line);
    }
    return parse_unix_line(line, now);
}

std::vector<FtpEntry> parse_ftp_listing(const std::string& listing,
                                        std::chrono::system_clock::time_point now) {
    std::vector<FtpEntry> entries;
    std::istringstream in(listing);
    std::string line;
    while (std::getline(in, line)) {
        if (auto entry = parse_ftp_list_line(line, now)) {
            entries.push_back(std::move(*entry));
        }
    }
    return entries;
}

// ============================================================================
// FtpSession
// ============================================================================

namespace {

struct FtpTransfer {
    std::string* listing = nullptr;
    storage::Writer* sink = nullptr;
    storage::Reader* source = nullptr;
    const Context* context = nullptr;
    std::exception_ptr stream_error;
};

size_t ftp_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* xfer = static_cast<FtpTransfer*>(userdata);
    size_t bytes = size * nmemb;
    if (xfer->listing) {
        xfer->listing->append(ptr, bytes);
        return bytes;
    }
    try {
        xfer->sink->write(reinterpret_cast<const uint8_t*>(ptr), bytes);
    } catch (...) {
        xfer->stream_error = std::current_exception();
        return 0;
    }
    return bytes;
}

size_t ftp_read_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* xfer = static_cast<FtpTransfer*>(userdata);
    try {
        return xfer->source->read(reinterpret_cast<uint8_t*>(buffer), size * nitems);
    } catch (...) {
        xfer->stream_error = std::current_exception();
        return CURL_READFUNC_ABORT;
    }
}

int ftp_xferinfo_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* xfer = static_cast<FtpTransfer*>(clientp);
    return xfer->context->cancelled() ? 1 : 0;
}

}  // namespace

class FtpSession::Impl {
public:
    Impl(const std::string& server, const FtpSessionOptions& options)
        : server_(server), options_(options) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });

        while (!server_.empty() && server_.back() == '/') server_.pop_back();

        curl_ = curl_easy_init();
        if (!curl_) {
            throw FtpError("ftp: failed to initialize curl handle", 0);
        }
    }

    ~Impl() {
        // Closes the control connection (QUIT)
        curl_easy_cleanup(curl_);
    }

    std::vector<FtpEntry> list(const Context& ctx, const std::string& path) {
        std::string listing;
        FtpTransfer xfer;
        xfer.listing = &listing;
        xfer.context = &ctx;

        prepare(server_ + "/", xfer);
        std::string command = path.empty() ? "LIST" : "LIST " + path;
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, command.c_str());

        perform(ctx, xfer, "listing", path);
        return parse_ftp_listing(listing, std::chrono::system_clock::now());
    }

    void retrieve(const Context& ctx, const std::string& path, storage::Writer& dest) {
        FtpTransfer xfer;
        xfer.sink = &dest;
        xfer.context = &ctx;

        prepare(server_ + "/" + url_encode_path(path), xfer);
        perform(ctx, xfer, "retrieving", path);
    }

    void store(const Context& ctx, const std::string& path, storage::Reader& src) {
        FtpTransfer xfer;
        xfer.source = &src;
        xfer.context = &ctx;

        prepare(server_ + "/" + url_encode_path(path), xfer);
        curl_easy_setopt(curl_, CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(curl_, CURLOPT_READFUNCTION, ftp_read_callback);
        curl_easy_setopt(curl_, CURLOPT_READDATA, &xfer);
        // MKD each missing segment; if MKD fails, CWD is retried once in
        // case another client created the directory in the meantime.
        curl_easy_setopt(curl_, CURLOPT_FTP_CREATE_MISSING_DIRS,
                         static_cast<long>(CURLFTP_CREATE_DIR_RETRY));

        perform(ctx, xfer, "storing", path);
    }

private:
    void prepare(const std::string& url, FtpTransfer& xfer) {
        xfer.context->check();

        // Options are reset, the logged-in connection is kept
        curl_easy_reset(curl_);
        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_USERNAME, options_.user.c_str());
        curl_easy_setopt(curl_, CURLOPT_PASSWORD, options_.password.c_str());

        curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(options_.timeout.count()));
        long response_timeout = static_cast<long>(
            std::chrono::duration_cast<std::chrono::seconds>(options_.timeout).count());
        curl_easy_setopt(curl_, CURLOPT_SERVER_RESPONSE_TIMEOUT,
                         response_timeout > 0 ? response_timeout : 1L);

        if (auto deadline = xfer.context->deadline()) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - Context::Clock::now());
            curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS,
                             static_cast<long>(std::max<int64_t>(remaining.count(), 1)));
        }

        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, ftp_write_callback);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &xfer);
        curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, ftp_xferinfo_callback);
        curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, &xfer);
        curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
    }

    void perform(const Context& ctx, FtpTransfer& xfer,
                 const std::string& what, const std::string& path) {
        CURLcode res = curl_easy_perform(curl_);

        if (xfer.stream_error) {
            std::rethrow_exception(xfer.stream_error);
        }
        if (res == CURLE_ABORTED_BY_CALLBACK || res == CURLE_OPERATION_TIMEDOUT) {
            ctx.check();
        }
        if (res != CURLE_OK) {
            long code = 0;
            curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &code);
            std::string message = "ftp: " + what + " \"" + path + "\": " + curl_easy_strerror(res);
            if (code > 0) {
                message += " (reply " + std::to_string(code) + ")";
            }
            throw FtpError(message, code);
        }
    }

    std::string server_;
    FtpSessionOptions options_;
    CURL* curl_ = nullptr;
};

FtpSession::FtpSession(const std::string& server, const FtpSessionOptions& options)
    : impl_(std::make_unique<Impl>(server, options)) {}

FtpSession::~FtpSession() = default;

std::vector<FtpEntry> FtpSession::list(const Context& ctx, const std::string& path) {
    return impl_->list(ctx, path);
}

void FtpSession::retrieve(const Context& ctx, const std::string& path, storage::Writer& dest) {
    impl_->retrieve(ctx, path, dest);
}

void FtpSession::store(const Context& ctx, const std::string& path, storage::Reader& src) {
    impl_->store(ctx, path, src);
}

}  // namespace lfsrelay::net
