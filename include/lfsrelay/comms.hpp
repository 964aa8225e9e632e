#pragma once

#include <cstdint>
#include <istream>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>
#include <variant>

namespace lfsrelay {

// ============================================================================
// git-lfs custom transfer messages
// ============================================================================

struct InitMessage {
    std::string operation;     // "upload" or "download"
    std::string remote;
    bool concurrent = false;
    int concurrent_transfers = 0;
};

struct UploadMessage {
    std::string oid;
    uint64_t size = 0;
    std::string path;          // local file to read
};

struct DownloadMessage {
    std::string oid;
    uint64_t size = 0;
};

struct TerminateMessage {};

struct ProgressMessage {
    std::string oid;
    uint64_t bytes_so_far = 0;
    uint64_t bytes_since_last = 0;
};

struct CompleteMessage {
    std::string oid;
    std::string path;          // "" for uploads
};

struct ErrorMessage {
    std::string oid;
    int code = 0;
    std::string message;
};

using Message = std::variant<InitMessage, UploadMessage, DownloadMessage, TerminateMessage,
                             ProgressMessage, CompleteMessage, ErrorMessage>;

/// Malformed input or a message that is not allowed in the current state.
/// Ends the session.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Decode one inbound line. Throws ProtocolError on invalid JSON, a missing
/// or unknown "event", or fields of the wrong type.
Message parse_message(const std::string& line);

/// Encode an outbound message as a single JSON line (no trailing newline).
std::string serialize_message(const Message& message);

/// Line-delimited JSON channel to git-lfs.
///
/// receive() is only called from the session loop. The send_* methods may be
/// called from progress threads as well; each record is written and flushed
/// as a whole line under a mutex.
class Comms {
public:
    Comms(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    /// Next inbound message. Blank lines are skipped; end of input yields
    /// TerminateMessage. Throws ProtocolError on a bad line or a read error.
    Message receive();

    void send_initialized();
    void send_progress(const std::string& oid, uint64_t bytes_so_far, uint64_t bytes_since_last);
    void send_complete(const std::string& oid, const std::string& path);
    void send_error(const std::string& oid, int code, const std::string& message);

    void send(const Message& message);

private:
    void write_line(const std::string& line);

    std::istream& in_;
    std::ostream& out_;
    std::mutex out_mutex_;
};

}  // namespace lfsrelay
