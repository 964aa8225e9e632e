#pragma once

#include "lfsrelay/core/context.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace lfsrelay::storage {
class Reader;
class Writer;
}

namespace lfsrelay::net {

enum class FtpEntryType {
    File,
    Folder,
    Link
};

struct FtpEntry {
    std::string name;
    FtpEntryType type = FtpEntryType::File;
    uint64_t size = 0;
    std::chrono::system_clock::time_point time;
    std::string link_target;  // only for links
};

/// Parse one line of a LIST reply in Unix ("-rw-r--r-- 1 u g 4 Jan 02 10:00 f")
/// or MS-DOS ("01-02-24  10:00AM  <DIR>  d") format. Dates without a year
/// are placed in the twelve months before @p now.
std::optional<FtpEntry> parse_ftp_list_line(const std::string& line,
                                            std::chrono::system_clock::time_point now);

/// Parse a whole LIST reply, dropping lines that match neither format
/// ("total 12", blank lines).
std::vector<FtpEntry> parse_ftp_listing(const std::string& listing,
                                        std::chrono::system_clock::time_point now);

// FTP failure. response_code is the last server reply (0 if none arrived).
class FtpError : public std::runtime_error {
public:
    FtpError(const std::string& message, long response_code)
        : std::runtime_error(message), response_code_(response_code) {}

    long response_code() const { return response_code_; }

    // 450/550: the server says the file or directory is not there
    bool is_unavailable() const { return response_code_ == 450 || response_code_ == 550; }

private:
    long response_code_;
};

struct FtpSessionOptions {
    std::string user;
    std::string password;
    std::chrono::milliseconds timeout{10000};
};

/// One logged-in FTP control connection, backed by a single libcurl easy
/// handle. Consecutive calls reuse the connection; the destructor closes it.
///
/// Paths are relative to the login directory. Cancellation of the context
/// passed to each call aborts the transfer with storage::CancellationError.
class FtpSession {
public:
    /// @p server is "ftp://host[:port]"; port 21 is used when none is given.
    FtpSession(const std::string& server, const FtpSessionOptions& options);
    ~FtpSession();

    FtpSession(const FtpSession&) = delete;
    FtpSession& operator=(const FtpSession&) = delete;

    /// LIST @p path. Throws FtpError.
    std::vector<FtpEntry> list(const Context& ctx, const std::string& path);

    /// RETR @p path into @p dest. Throws FtpError or whatever dest throws.
    void retrieve(const Context& ctx, const std::string& path, storage::Writer& dest);

    /// STOR @p path from @p src, creating each missing directory first.
    /// A directory created concurrently by someone else is not an error.
    void store(const Context& ctx, const std::string& path, storage::Reader& src);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lfsrelay::net
