#include "lfsrelay/comms.hpp"

#include <nlohmann/json.hpp>

namespace lfsrelay {

using json = nlohmann::json;

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r") == std::string::npos;
}

}  // namespace

// ============================================================================
// Message codec
// ============================================================================

Message parse_message(const std::string& line) {
    json j;
    try {
        j = json::parse(line);
    } catch (const json::parse_error& e) {
        throw ProtocolError(std::string("invalid message: ") + e.what());
    }
    if (!j.is_object()) {
        throw ProtocolError("invalid message: not a JSON object");
    }
    if (!j.contains("event") || !j["event"].is_string()) {
        throw ProtocolError("invalid message: missing \"event\"");
    }

    auto event = j["event"].get<std::string>();
    try {
        if (event == "init") {
            InitMessage msg;
            msg.operation = j.value("operation", std::string{});
            msg.remote = j.value("remote", std::string{});
            msg.concurrent = j.value("concurrent", false);
            msg.concurrent_transfers = j.value("concurrenttransfers", 0);
            return msg;
        }
        if (event == "upload") {
            UploadMessage msg;
            msg.oid = j.value("oid", std::string{});
            msg.size = j.value("size", uint64_t{0});
            msg.path = j.value("path", std::string{});
            return msg;
        }
        if (event == "download") {
            DownloadMessage msg;
            msg.oid = j.value("oid", std::string{});
            msg.size = j.value("size", uint64_t{0});
            return msg;
        }
        if (event == "terminate") {
            return TerminateMessage{};
        }
    } catch (const json::exception& e) {
        throw ProtocolError("invalid " + event + " message: " + e.what());
    }
    throw ProtocolError("unknown message type \"" + event + "\"");
}

std::string serialize_message(const Message& message) {
    json j = std::visit(overloaded{
        [](const InitMessage& m) {
            return json{{"event", "init"}, {"operation", m.operation}, {"remote", m.remote},
                        {"concurrent", m.concurrent},
                        {"concurrenttransfers", m.concurrent_transfers}};
        },
        [](const UploadMessage& m) {
            return json{{"event", "upload"}, {"oid", m.oid}, {"size", m.size}, {"path", m.path}};
        },
        [](const DownloadMessage& m) {
            return json{{"event", "download"}, {"oid", m.oid}, {"size", m.size}};
        },
        [](const TerminateMessage&) {
            return json{{"event", "terminate"}};
        },
        [](const ProgressMessage& m) {
            return json{{"event", "progress"}, {"oid", m.oid},
                        {"bytesSoFar", m.bytes_so_far},
                        {"bytesSinceLast", m.bytes_since_last}};
        },
        [](const CompleteMessage& m) {
            return json{{"event", "complete"}, {"oid", m.oid}, {"path", m.path}};
        },
        [](const ErrorMessage& m) {
            return json{{"event", "error"}, {"oid", m.oid},
                        {"error", {{"code", m.code}, {"message", m.message}}}};
        },
    }, message);
    // Error text can carry raw bytes from remote servers.
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// ============================================================================
// Comms
// ============================================================================

Message Comms::receive() {
    std::string line;
    while (std::getline(in_, line)) {
        if (is_blank(line)) continue;
        return parse_message(line);
    }
    if (in_.bad()) {
        throw ProtocolError("reading input message failed");
    }
    return TerminateMessage{};
}

void Comms::send_initialized() {
    write_line("{}");
}

void Comms::send_progress(const std::string& oid, uint64_t bytes_so_far,
                          uint64_t bytes_since_last) {
    send(ProgressMessage{oid, bytes_so_far, bytes_since_last});
}

void Comms::send_complete(const std::string& oid, const std::string& path) {
    send(CompleteMessage{oid, path});
}

void Comms::send_error(const std::string& oid, int code, const std::string& message) {
    send(ErrorMessage{oid, code, message});
}

void Comms::send(const Message& message) {
    write_line(serialize_message(message));
}

void Comms::write_line(const std::string& line) {
    std::lock_guard lock(out_mutex_);
    out_ << line << '\n';
    out_.flush();
}

}  // namespace lfsrelay
