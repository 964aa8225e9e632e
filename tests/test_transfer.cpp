// Test suite for the lfs-relay transfer agent.
//
// Tests:
//   1. Message codec (parse/serialize, blank lines, end of input)
//   2. Progress watcher
//   3. Session lifecycle and protocol violations
//   4. Uploads and downloads against a file:// remote
//   5. Failure reporting (backend errors, local file errors, cancellation)
//   6. Agent configuration (flags, environment, JSON file, validation)
//   7. Metrics export

#include "lfsrelay/agent_config.hpp"
#include "lfsrelay/comms.hpp"
#include "lfsrelay/core/context.hpp"
#include "lfsrelay/metrics.hpp"
#include "lfsrelay/storage/backend.hpp"
#include "lfsrelay/storage/backends.hpp"
#include "lfsrelay/storage/errors.hpp"
#include "lfsrelay/storage/io.hpp"
#include "lfsrelay/storage/retry.hpp"
#include "lfsrelay/transfer_session.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace lfsrelay;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_EMPTY(s, msg)                                          \
    do {                                                              \
        if (!(s).empty()) {                                           \
            std::cout << "FAIL: " << msg << " (got \"" << (s)        \
                      << "\")" << std::endl;                          \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_NOT_EMPTY(s, msg)                                      \
    do {                                                              \
        if ((s).empty()) { FAIL(msg); return; }                       \
    } while (0)

// Evaluates to true if expr throws exactly-or-derived type E.
#define THROWS(expr, E)                                               \
    ([&]() -> bool {                                                  \
        try { (void)(expr); } catch (const E&) { return true; }       \
        catch (const std::exception&) { return false; }               \
        return false;                                                 \
    }())

/// Create a unique temp directory under /tmp.
static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

/// Write binary content to a file.
static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), content.size());
}

/// Read entire file into a string.
static std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

/// Split agent output into parsed JSON records, one per line.
static std::vector<json> output_records(const std::string& output) {
    std::vector<json> records;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) records.push_back(json::parse(line));
    }
    return records;
}

static std::vector<json> records_with_event(const std::vector<json>& records,
                                            const std::string& event) {
    std::vector<json> matching;
    for (const auto& r : records) {
        if (r.value("event", std::string{}) == event) matching.push_back(r);
    }
    return matching;
}

static const char* kInit =
    R"({"event":"init","operation":"upload","remote":"origin","concurrent":false,"concurrenttransfers":1})";

static std::string upload_line(const std::string& oid, const fs::path& path, uint64_t size) {
    return json{{"event", "upload"}, {"oid", oid}, {"size", size}, {"path", path.string()}}.dump();
}

static std::string download_line(const std::string& oid, uint64_t size) {
    return json{{"event", "download"}, {"oid", oid}, {"size", size}}.dump();
}

/// Storage that fails every transfer with a transient error.
class BrokenStorage : public storage::Storage {
public:
    int calls = 0;

    std::string type_name() const override { return "broken"; }
    storage::Object stat(const Context&, const std::string&) override { return fail(); }
    std::vector<storage::Object> list(const Context&, const std::string&) override {
        fail();
        return {};
    }
    storage::Object get(const Context&, const std::string&, storage::Writer&) override {
        return fail();
    }
    storage::Object put(const Context&, const std::string&, storage::Reader&) override {
        return fail();
    }
    std::string join(const std::string& url, const std::string& sub) const override {
        return storage::join_url(url, sub);
    }

private:
    storage::Object fail() {
        ++calls;
        throw storage::BackendError("broken: service unavailable");
    }
};

/// Storage whose get blocks until the context is cancelled.
class StalledStorage : public storage::Storage {
public:
    std::string type_name() const override { return "stalled"; }
    storage::Object stat(const Context& ctx, const std::string&) override { return stall(ctx); }
    std::vector<storage::Object> list(const Context& ctx, const std::string&) override {
        stall(ctx);
        return {};
    }
    storage::Object get(const Context& ctx, const std::string&, storage::Writer& dest) override {
        const uint8_t partial[] = {'p', 'a', 'r'};
        dest.write(partial, sizeof(partial));
        return stall(ctx);
    }
    storage::Object put(const Context& ctx, const std::string&, storage::Reader&) override {
        return stall(ctx);
    }
    std::string join(const std::string& url, const std::string& sub) const override {
        return storage::join_url(url, sub);
    }

private:
    storage::Object stall(const Context& ctx) {
        ctx.wait_for(std::chrono::seconds(30));
        ctx.check();
        throw storage::BackendError("stalled: gave up");
    }
};

/// Storage that consumes the whole upload, then fails the first attempt.
class DropFirstPutStorage : public storage::Storage {
public:
    int attempts = 0;
    std::string stored;

    std::string type_name() const override { return "drop-first"; }
    storage::Object stat(const Context&, const std::string&) override {
        throw storage::NotFoundError("drop-first: nothing stored");
    }
    std::vector<storage::Object> list(const Context&, const std::string&) override { return {}; }
    storage::Object get(const Context&, const std::string&, storage::Writer&) override {
        throw storage::NotFoundError("drop-first: nothing stored");
    }
    storage::Object put(const Context&, const std::string& url, storage::Reader& src) override {
        storage::BufferWriter sink;
        storage::copy_stream(src, sink, 2);
        if (++attempts == 1) {
            throw storage::BackendError("drop-first: connection reset");
        }
        stored = sink.str();
        storage::Object obj;
        obj.url = url;
        obj.size = stored.size();
        return obj;
    }
    std::string join(const std::string& url, const std::string& sub) const override {
        return storage::join_url(url, sub);
    }
};

/// Storage whose put fails with an arbitrary fault.
class FaultyStorage : public storage::Storage {
public:
    explicit FaultyStorage(std::function<void()> fault) : fault_(std::move(fault)) {}

    std::string type_name() const override { return "faulty"; }
    storage::Object stat(const Context&, const std::string&) override {
        throw storage::NotFoundError("faulty: nothing stored");
    }
    std::vector<storage::Object> list(const Context&, const std::string&) override { return {}; }
    storage::Object get(const Context&, const std::string&, storage::Writer&) override {
        throw storage::NotFoundError("faulty: nothing stored");
    }
    storage::Object put(const Context&, const std::string& url, storage::Reader&) override {
        fault_();
        storage::Object obj;
        obj.url = url;
        return obj;
    }
    std::string join(const std::string& url, const std::string& sub) const override {
        return storage::join_url(url, sub);
    }

private:
    std::function<void()> fault_;
};

struct SessionFixture {
    fs::path dir;
    std::string base_url;
    SessionOptions options;

    SessionFixture() {
        dir = make_temp_dir("lfsrelay-session");
        base_url = std::string(storage::FILE_PROTOCOL) + (dir / "remote").string();
        options.base_url = base_url;
        options.data_dir = dir / "data";
        options.progress_interval = std::chrono::milliseconds(5);
    }

    ~SessionFixture() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

// ---------------------------------------------------------------------------
// 1. Message codec
// ---------------------------------------------------------------------------

static void test_message_codec() {
    std::cout << "\n=== Message codec ===" << std::endl;

    {
        TEST(parse_init);
        auto msg = parse_message(R"({"event":"init","operation":"download","remote":"origin","concurrent":true,"concurrenttransfers":8})");
        auto* init = std::get_if<InitMessage>(&msg);
        ASSERT_TRUE(init != nullptr, "init variant");
        ASSERT_EQ(init->operation, "download", "operation");
        ASSERT_EQ(init->remote, "origin", "remote");
        ASSERT_TRUE(init->concurrent, "concurrent");
        ASSERT_EQ(init->concurrent_transfers, 8, "concurrenttransfers");
        PASS();
    }
    {
        TEST(parse_upload_and_download);
        auto up = parse_message(R"({"event":"upload","oid":"abc","size":42,"path":"/tmp/f","action":null})");
        auto* u = std::get_if<UploadMessage>(&up);
        ASSERT_TRUE(u != nullptr, "upload variant");
        ASSERT_EQ(u->oid, "abc", "oid");
        ASSERT_EQ(u->size, 42u, "size");
        ASSERT_EQ(u->path, "/tmp/f", "path");

        auto down = parse_message(R"({"event":"download","oid":"def","size":7})");
        auto* d = std::get_if<DownloadMessage>(&down);
        ASSERT_TRUE(d != nullptr, "download variant");
        ASSERT_EQ(d->size, 7u, "size");

        auto term = parse_message(R"({"event":"terminate"})");
        ASSERT_TRUE(std::holds_alternative<TerminateMessage>(term), "terminate variant");
        PASS();
    }
    {
        TEST(malformed_messages_are_protocol_errors);
        ASSERT_TRUE(THROWS(parse_message("not json"), ProtocolError), "bad json");
        ASSERT_TRUE(THROWS(parse_message("[1,2]"), ProtocolError), "array");
        ASSERT_TRUE(THROWS(parse_message(R"({"oid":"x"})"), ProtocolError), "no event");
        ASSERT_TRUE(THROWS(parse_message(R"({"event":5})"), ProtocolError), "event type");
        ASSERT_TRUE(THROWS(parse_message(R"({"event":"upload","size":"big"})"), ProtocolError),
                    "field type");
        PASS();
    }
    {
        TEST(unknown_event_names_the_type);
        try {
            parse_message(R"({"event":"rename"})");
            FAIL("expected ProtocolError");
            return;
        } catch (const ProtocolError& e) {
            ASSERT_TRUE(std::string(e.what()).find("rename") != std::string::npos,
                        "message names the event");
        }
        PASS();
    }
    {
        TEST(serialize_outbound_records);
        auto progress = json::parse(serialize_message(ProgressMessage{"abc", 10, 4}));
        ASSERT_EQ(progress["event"], "progress", "event");
        ASSERT_EQ(progress["bytesSoFar"], 10, "bytesSoFar");
        ASSERT_EQ(progress["bytesSinceLast"], 4, "bytesSinceLast");

        auto complete = json::parse(serialize_message(CompleteMessage{"abc", ""}));
        ASSERT_EQ(complete["path"], "", "upload path empty");

        auto error = json::parse(serialize_message(ErrorMessage{"abc", 2, "no such file"}));
        ASSERT_EQ(error["oid"], "abc", "oid");
        ASSERT_EQ(error["error"]["code"], 2, "code");
        ASSERT_EQ(error["error"]["message"], "no such file", "message");
        PASS();
    }
    {
        TEST(serialize_tolerates_invalid_utf8);
        std::string raw = "bad \xff\xfe bytes";
        auto line = serialize_message(ErrorMessage{"abc", 1, raw});
        ASSERT_TRUE(json::parse(line)["error"]["message"].is_string(), "still valid JSON");
        PASS();
    }
    {
        TEST(receive_skips_blank_lines_and_ends_with_terminate);
        std::istringstream in("\n  \n" + std::string(kInit) + "\r\n\n");
        std::ostringstream out;
        Comms comms(in, out);
        ASSERT_TRUE(std::holds_alternative<InitMessage>(comms.receive()), "init");
        ASSERT_TRUE(std::holds_alternative<TerminateMessage>(comms.receive()), "eof");
        ASSERT_TRUE(std::holds_alternative<TerminateMessage>(comms.receive()), "eof again");
        PASS();
    }
    {
        TEST(initialized_reply_is_empty_object);
        std::istringstream in;
        std::ostringstream out;
        Comms comms(in, out);
        comms.send_initialized();
        ASSERT_EQ(out.str(), "{}\n", "reply");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 2. Progress watcher
// ---------------------------------------------------------------------------

static void test_progress_watcher() {
    std::cout << "\n=== Progress watcher ===" << std::endl;

    {
        TEST(stop_reports_final_sample_once);
        std::istringstream in;
        std::ostringstream out;
        Comms comms(in, out);
        std::atomic<uint64_t> value{7};
        ProgressWatcher watcher(comms, "abc", [&] { return value.load(); },
                                std::chrono::hours(1));
        watcher.stop();
        value = 9;
        watcher.stop();

        auto records = output_records(out.str());
        ASSERT_EQ(records.size(), 1u, "one record");
        ASSERT_EQ(records[0]["bytesSoFar"], 7, "final sample");
        ASSERT_EQ(records[0]["bytesSinceLast"], 7, "delta");
        ASSERT_EQ(watcher.last_reported(), 7u, "last reported");
        PASS();
    }
    {
        TEST(no_report_without_movement);
        std::istringstream in;
        std::ostringstream out;
        Comms comms(in, out);
        {
            ProgressWatcher watcher(comms, "abc", [] { return uint64_t{0}; },
                                    std::chrono::milliseconds(1));
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        ASSERT_EMPTY(out.str(), "nothing written");
        PASS();
    }
    {
        TEST(samples_never_go_backwards);
        std::istringstream in;
        std::ostringstream out;
        Comms comms(in, out);
        std::atomic<uint64_t> value{0};
        ProgressWatcher watcher(comms, "abc", [&] { return value.load(); },
                                std::chrono::milliseconds(1));
        for (uint64_t v : {5u, 3u, 0u, 8u, 8u, 12u}) {
            value = v;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        watcher.stop();

        auto records = output_records(out.str());
        ASSERT_NOT_EMPTY(records, "some progress");
        uint64_t last = 0;
        uint64_t sum = 0;
        for (const auto& r : records) {
            uint64_t so_far = r["bytesSoFar"].get<uint64_t>();
            ASSERT_TRUE(so_far > last, "strictly increasing");
            ASSERT_EQ(r["bytesSinceLast"].get<uint64_t>(), so_far - last, "delta matches");
            sum += so_far - last;
            last = so_far;
        }
        ASSERT_EQ(last, 12u, "final total");
        ASSERT_EQ(sum, 12u, "deltas add up");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 3. Session lifecycle
// ---------------------------------------------------------------------------

static void test_session_lifecycle() {
    std::cout << "\n=== Session lifecycle ===" << std::endl;

    {
        TEST(init_then_terminate);
        SessionFixture fx;
        storage::LocalStorage local{storage::LocalConfig{}};
        std::istringstream in(std::string(kInit) + "\n" + R"({"event":"terminate"})" + "\n");
        std::ostringstream out;
        Comms comms(in, out);
        TransferSession session(local, comms, fx.options);
        ASSERT_TRUE(session.state() == SessionState::AwaitingInit, "initial state");
        auto result = session.run();
        ASSERT_TRUE(result.ok, "clean exit");
        ASSERT_EQ(out.str(), "{}\n", "only the init reply");
        ASSERT_TRUE(session.state() == SessionState::Terminated, "terminated");
        PASS();
    }
    {
        TEST(end_of_input_terminates);
        SessionFixture fx;
        storage::LocalStorage local{storage::LocalConfig{}};
        std::istringstream in(std::string(kInit) + "\n");
        std::ostringstream out;
        Comms comms(in, out);
        TransferSession session(local, comms, fx.options);
        ASSERT_TRUE(session.run().ok, "clean exit");
        ASSERT_TRUE(session.state() == SessionState::Terminated, "terminated");
        PASS();
    }
    {
        TEST(messages_after_terminate_are_not_read);
        SessionFixture fx;
        write_file(fx.dir / "src", "abcd");
        storage::LocalStorage local{storage::LocalConfig{}};
        std::istringstream in(std::string(kInit) + "\n" + R"({"event":"terminate"})" + "\n" +
                              upload_line("abc123", fx.dir / "src", 4) + "\n");
        std::ostringstream out;
        Comms comms(in, out);
        TransferSession session(local, comms, fx.options);
        ASSERT_TRUE(session.run().ok, "clean exit");
        ASSERT_EQ(out.str(), "{}\n", "upload ignored");
        ASSERT_TRUE(!fs::exists(fx.dir / "remote/abc123"), "nothing stored");
        PASS();
    }
    {
        TEST(transfer_before_init_is_fatal);
        SessionFixture fx;
        storage::LocalStorage local{storage::LocalConfig{}};
        std::istringstream in(download_line("abc123", 4) + "\n");
        std::ostringstream out;
        Comms comms(in, out);
        TransferSession session(local, comms, fx.options);
        auto result = session.run();
        ASSERT_TRUE(!result.ok, "session aborted");
        ASSERT_TRUE(result.error.find("awaiting-init") != std::string::npos, "state named");
        ASSERT_EMPTY(out.str(), "no output");
        PASS();
    }
    {
        TEST(repeated_init_is_acknowledged_again);
        SessionFixture fx;
        write_file(fx.dir / "remote/abc123", "data");
        storage::LocalStorage local{storage::LocalConfig{}};
        std::istringstream in(std::string(kInit) + "\n" + kInit + "\n" +
                              download_line("abc123", 4) + "\n");
        std::ostringstream out;
        Comms comms(in, out);
        TransferSession session(local, comms, fx.options);
        ASSERT_TRUE(session.run().ok, "clean exit");

        auto records = output_records(out.str());
        ASSERT_TRUE(records.size() >= 3, "two acks and a completion");
        ASSERT_EQ(records[0].dump(), "{}", "first ack");
        ASSERT_EQ(records[1].dump(), "{}", "second ack");
        ASSERT_EQ(records_with_event(records, "complete").size(), 1u, "download still runs");
        PASS();
    }
    {
        TEST(outbound_messages_are_rejected);
        SessionFixture fx;
        storage::LocalStorage local{storage::LocalConfig{}};
        std::istringstream in;
        std::ostringstream out;
        Comms comms(in, out);
        TransferSession session(local, comms, fx.options);
        session.handle(InitMessage{});
        auto result = session.handle(ProgressMessage{"abc", 1, 1});
        ASSERT_TRUE(!result.ok, "rejected");
        ASSERT_EQ(result.error, "unexpected progress message", "error text");
        PASS();
    }
    {
        TEST(invalid_oids_fail_only_their_transfer);
        SessionFixture fx;
        write_file(fx.dir / "remote/abc123", "data");
        storage::LocalStorage local{storage::LocalConfig{}};
        std::istringstream in(std::string(kInit) + "\n" +
                              download_line("a/b", 1) + "\n" +
                              download_line("../escape", 1) + "\n" +
                              download_line("", 1) + "\n" +
                              download_line("abc123", 4) + "\n" +
                              R"({"event":"terminate"})" + "\n");
        std::ostringstream out;
        Comms comms(in, out);
        TransferSession session(local, comms, fx.options);
        ASSERT_TRUE(session.run().ok, "session survives");

        auto records = output_records(out.str());
        auto errors = records_with_event(records, "error");
        ASSERT_EQ(errors.size(), 3u, "one error per bad oid");
        ASSERT_EQ(errors[0]["oid"], "a/b", "slash oid");
        ASSERT_EQ(errors[0]["error"]["code"], 2, "local file code");
        ASSERT_EQ(errors[1]["oid"], "../escape", "dot-dot oid");
        ASSERT_EQ(errors[2]["oid"], "", "empty oid");

        auto complete = records_with_event(records, "complete");
        ASSERT_EQ(complete.size(), 1u, "valid oid completes");
        ASSERT_EQ(complete[0]["oid"], "abc123", "completed oid");
        ASSERT_EQ(read_file(fx.dir / "data/abc123"), "data", "downloaded");
        ASSERT_TRUE(!fs::exists(fx.dir / "escape"), "nothing written outside");
        ASSERT_TRUE(!fs::exists(fx.dir / "data/a"), "no nested directory");
        PASS();
    }
    {
        TEST(malformed_input_aborts_run);
        SessionFixture fx;
        storage::LocalStorage local{storage::LocalConfig{}};
        std::istringstream in(std::string(kInit) + "\n{oops\n");
        std::ostringstream out;
        Comms comms(in, out);
        TransferSession session(local, comms, fx.options);
        auto result = session.run();
        ASSERT_TRUE(!result.ok, "aborted");
        ASSERT_NOT_EMPTY(result.error, "reason given");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. Transfers
// ---------------------------------------------------------------------------

static void test_transfers() {
    std::cout << "\n=== Uploads and downloads ===" << std::endl;

    {
        TEST(upload_reports_progress_then_complete);
        SessionFixture fx;
        write_file(fx.dir / "src", "abcd");
        storage::LocalStorage local{storage::LocalConfig{}};
        std::istringstream in(std::string(kInit) + "\n" +
                              upload_line("abc123", fx.dir / "src", 4) + "\n" +
                              R"({"event":"terminate"})" + "\n");
        std::ostringstream out;
        Comms comms(in, out);
        TransferSession session(local, comms, fx.options);
        ASSERT_TRUE(session.run().ok, "clean exit");

        auto records = output_records(out.str());
        ASSERT_TRUE(records.size() >= 3, "init, progress, complete");
        ASSERT_TRUE(records.front().empty(), "init reply");
        auto progress = records_with_event(records, "progress");
        ASSERT_NOT_EMPTY(progress, "progress reported");
        ASSERT_EQ(progress.back()["bytesSoFar"], 4, "final bytesSoFar");
        ASSERT_EQ(progress.back()["oid"], "abc123", "progress oid");

        const auto& last = records.back();
        ASSERT_EQ(last["event"], "complete", "complete is last");
        ASSERT_EQ(last["oid"], "abc123", "oid");
        ASSERT_EQ(last["path"], "", "upload complete has empty path");
        ASSERT_EQ(read_file(fx.dir / "remote/abc123"), "abcd", "object stored");
        PASS();
    }
    {
        TEST(download_places_file_in_data_dir);
        SessionFixture fx;
        write_file(fx.dir / "remote/def456", "hello world");
        storage::LocalStorage local{storage::LocalConfig{}};
        std::istringstream in(std::string(kInit) + "\n" + download_line("def456", 11) + "\n");
        std::ostringstream out;
        Comms comms(in, out);
        TransferSession session(local, comms, fx.options);
        ASSERT_TRUE(session.run().ok, "clean exit");

        auto records = output_records(out.str());
        const auto& last = records.back();
        ASSERT_EQ(last["event"], "complete", "complete");
        auto path = fs::absolute(fx.dir / "data/def456");
        ASSERT_EQ(last["path"], path.string(), "absolute data dir path");
        ASSERT_EQ(read_file(path), "hello world", "content");
        ASSERT_EQ(records_with_event(records, "progress").back()["bytesSoFar"], 11,
                  "progress total");
        PASS();
    }
    {
        TEST(several_transfers_in_one_session);
        SessionFixture fx;
        write_file(fx.dir / "one", "1");
        write_file(fx.dir / "two", "22");
        storage::LocalStorage local{storage::LocalConfig{}};
        std::istringstream in(std::string(kInit) + "\n" +
                              upload_line("oid1", fx.dir / "one", 1) + "\n" +
                              upload_line("oid2", fx.dir / "two", 2) + "\n" +
                              download_line("oid1", 1) + "\n");
        std::ostringstream out;
        Comms comms(in, out);
        TransferSession session(local, comms, fx.options);
        ASSERT_TRUE(session.run().ok, "clean exit");

        auto complete = records_with_event(output_records(out.str()), "complete");
        ASSERT_EQ(complete.size(), 3u, "three completions");
        ASSERT_EQ(complete[0]["oid"], "oid1", "first");
        ASSERT_EQ(complete[1]["oid"], "oid2", "second");
        ASSERT_EQ(read_file(fx.dir / "data/oid1"), "1", "round trip");
        PASS();
    }
    {
        TEST(retried_upload_progress_is_monotonic);
        SessionFixture fx;
        write_file(fx.dir / "src", std::string(64, 'z'));
        storage::RetryPolicy policy;
        policy.initial_delay = std::chrono::milliseconds(1);
        policy.max_delay = std::chrono::milliseconds(1);
        auto inner = std::make_unique<DropFirstPutStorage>();
        auto* raw = inner.get();
        storage::RetryingStorage retrying(std::move(inner), policy);

        std::istringstream in;
        std::ostringstream out;
        Comms comms(in, out);
        TransferSession session(retrying, comms, fx.options);
        session.handle(InitMessage{});
        ASSERT_TRUE(session.handle(UploadMessage{"abc", 64, (fx.dir / "src").string()}).ok,
                    "handled");
        ASSERT_EQ(raw->attempts, 2, "retried once");
        ASSERT_EQ(raw->stored.size(), 64u, "full payload on retry");

        auto records = output_records(out.str());
        uint64_t last = 0;
        for (const auto& r : records_with_event(records, "progress")) {
            uint64_t so_far = r["bytesSoFar"].get<uint64_t>();
            ASSERT_TRUE(so_far > last, "never decreases");
            last = so_far;
        }
        ASSERT_EQ(records.back()["event"], "complete", "completed");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 5. Failure reporting
// ---------------------------------------------------------------------------

static void test_failures() {
    std::cout << "\n=== Failure reporting ===" << std::endl;

    {
        TEST(backend_failure_is_one_error_per_oid);
        SessionFixture fx;
        write_file(fx.dir / "src", "abcd");
        BrokenStorage broken;
        std::istringstream in(std::string(kInit) + "\n" +
                              upload_line("abc123", fx.dir / "src", 4) + "\n" +
                              download_line("def456", 4) + "\n" +
                              R"({"event":"terminate"})" + "\n");
        std::ostringstream out;
        Comms comms(in, out);
        TransferSession session(broken, comms, fx.options);
        ASSERT_TRUE(session.run().ok, "session survives");

        auto records = output_records(out.str());
        auto errors = records_with_event(records, "error");
        ASSERT_EQ(errors.size(), 2u, "two errors");
        ASSERT_EQ(errors[0]["oid"], "abc123", "upload oid");
        ASSERT_EQ(errors[0]["error"]["code"], 1, "storage code");
        ASSERT_EQ(errors[1]["oid"], "def456", "download oid");
        ASSERT_TRUE(records_with_event(records, "complete").empty(), "no completions");
        ASSERT_TRUE(!fs::exists(fx.dir / "data/def456"), "no partial download");
        PASS();
    }
    {
        TEST(missing_object_download_leaves_nothing);
        SessionFixture fx;
        storage::LocalStorage local{storage::LocalConfig{}};
        std::istringstream in;
        std::ostringstream out;
        Comms comms(in, out);
        TransferSession session(local, comms, fx.options);
        session.handle(InitMessage{});
        ASSERT_TRUE(session.handle(DownloadMessage{"missing", 3}).ok, "not fatal");

        auto records = output_records(out.str());
        ASSERT_EQ(records.back()["event"], "error", "error reported");
        ASSERT_EQ(records.back()["error"]["code"], 1, "storage code");
        ASSERT_TRUE(!fs::exists(fx.dir / "data/missing"), "partial file removed");
        PASS();
    }
    {
        TEST(unreadable_upload_source_is_local_file_error);
        SessionFixture fx;
        storage::LocalStorage local{storage::LocalConfig{}};
        std::istringstream in(std::string(kInit) + "\n" +
                              upload_line("abc123", fx.dir / "does-not-exist", 4) + "\n");
        std::ostringstream out;
        Comms comms(in, out);
        TransferSession session(local, comms, fx.options);
        ASSERT_TRUE(session.run().ok, "session survives");

        auto errors = records_with_event(output_records(out.str()), "error");
        ASSERT_EQ(errors.size(), 1u, "one error");
        ASSERT_EQ(errors[0]["error"]["code"], 2, "local file code");
        PASS();
    }
    {
        TEST(unexpected_faults_are_internal_errors);
        SessionFixture fx;
        write_file(fx.dir / "src", "abcd");
        std::vector<std::function<void()>> faults = {
            [] { throw std::logic_error("faulty: broken invariant"); },
            [] { throw 42; },
        };
        for (const auto& fault : faults) {
            FaultyStorage faulty(fault);
            std::istringstream in(std::string(kInit) + "\n" +
                                  upload_line("abc123", fx.dir / "src", 4) + "\n");
            std::ostringstream out;
            Comms comms(in, out);
            TransferSession session(faulty, comms, fx.options);
            ASSERT_TRUE(session.run().ok, "session survives");

            auto errors = records_with_event(output_records(out.str()), "error");
            ASSERT_EQ(errors.size(), 1u, "one error");
            ASSERT_EQ(errors[0]["oid"], "abc123", "oid");
            ASSERT_EQ(errors[0]["error"]["code"], 3, "internal code");
            ASSERT_TRUE(session.state() == SessionState::Terminated, "ran to end of input");
        }

        // The session keeps handling messages after the fault
        FaultyStorage faulty([] { throw 42; });
        std::istringstream in;
        std::ostringstream out;
        Comms comms(in, out);
        TransferSession session(faulty, comms, fx.options);
        session.handle(InitMessage{});
        ASSERT_TRUE(session.handle(UploadMessage{"abc123", 4, (fx.dir / "src").string()}).ok,
                    "fault not fatal");
        ASSERT_TRUE(session.handle(TerminateMessage{}).ok, "terminate handled");
        ASSERT_TRUE(session.state() == SessionState::Terminated, "terminated");
        PASS();
    }
    {
        TEST(cancellation_aborts_inflight_transfer);
        SessionFixture fx;
        StalledStorage stalled;
        std::istringstream in;
        std::ostringstream out;
        Comms comms(in, out);
        TransferSession session(stalled, comms, fx.options);
        session.handle(InitMessage{});

        std::thread canceller([&session] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            session.cancel();
        });
        auto start = std::chrono::steady_clock::now();
        auto result = session.handle(DownloadMessage{"abc123", 10});
        auto elapsed = std::chrono::steady_clock::now() - start;
        canceller.join();

        ASSERT_TRUE(result.ok, "not fatal");
        ASSERT_TRUE(elapsed < std::chrono::seconds(10), "returned promptly");
        auto records = output_records(out.str());
        auto errors = records_with_event(records, "error");
        ASSERT_EQ(errors.size(), 1u, "one error");
        ASSERT_EQ(errors[0]["error"]["code"], 1, "storage code");
        ASSERT_TRUE(records_with_event(records, "complete").empty(), "no completion");
        ASSERT_TRUE(!fs::exists(fx.dir / "data/abc123"), "partial file removed");
        ASSERT_TRUE(session.context().cancelled(), "context cancelled");
        PASS();
    }
    {
        TEST(metrics_count_results);
        SessionFixture fx;
        write_file(fx.dir / "src", "abcd");
        storage::LocalStorage local{storage::LocalConfig{}};
        MetricsExporter metrics(fx.dir / "agent.prom", std::chrono::seconds(60),
                                {{"backend", "local"}});
        std::istringstream in;
        std::ostringstream out;
        Comms comms(in, out);
        TransferSession session(local, comms, fx.options, Context(), &metrics);
        session.handle(InitMessage{});
        session.handle(UploadMessage{"abc", 4, (fx.dir / "src").string()});
        session.handle(DownloadMessage{"missing", 1});

        ASSERT_EQ(metrics.uploads_success().Value(), 1.0, "upload success");
        ASSERT_EQ(metrics.upload_bytes_total().Value(), 4.0, "upload bytes");
        ASSERT_EQ(metrics.downloads_failure().Value(), 1.0, "download failure");
        ASSERT_EQ(metrics.downloads_success().Value(), 0.0, "no download success");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 6. Agent configuration
// ---------------------------------------------------------------------------

static void test_agent_config() {
    std::cout << "\n=== Agent configuration ===" << std::endl;

    unsetenv("LFSRELAY_CONFIG");
    unsetenv("LFSRELAY_BASE_URL");

    {
        TEST(flags_parsed);
        const char* args[] = {"lfs-relay", "--base-url", "gs://bucket/lfs",
                              "--data-dir", "/tmp/lfsrelay-data", "--verbose",
                              "--metrics-file", "/tmp/agent.prom", "--metrics-interval", "5"};
        auto config = AgentConfig::from_args(10, const_cast<char**>(args));
        ASSERT_TRUE(config.has_value(), "parsed");
        ASSERT_EQ(config->base_url, "gs://bucket/lfs", "base url");
        ASSERT_EQ(config->data_dir.string(), "/tmp/lfsrelay-data", "data dir");
        ASSERT_TRUE(config->verbose, "verbose");
        ASSERT_EQ(config->metrics_interval_secs, 5u, "interval");
        ASSERT_EQ(config->log_file.string(), ".lfs-relay/logs/agent.log", "default log file");
        ASSERT_EMPTY(config->validate(), "valid");
        PASS();
    }
    {
        TEST(defaults_applied);
        const char* args[] = {"lfs-relay", "--base-url", "file:///srv/lfs"};
        auto config = AgentConfig::from_args(3, const_cast<char**>(args));
        ASSERT_TRUE(config.has_value(), "parsed");
        ASSERT_EQ(config->data_dir.string(), ".lfs-relay/data", "default data dir");
        ASSERT_TRUE(!config->verbose, "quiet");
        ASSERT_EQ(config->retry.max_attempts, 5, "default attempts");
        PASS();
    }
    {
        TEST(base_url_from_environment);
        setenv("LFSRELAY_BASE_URL", "swift://container/lfs", 1);
        const char* bare[] = {"lfs-relay"};
        auto from_env = AgentConfig::from_args(1, const_cast<char**>(bare));
        const char* flagged[] = {"lfs-relay", "--base-url", "ftp://host/lfs"};
        auto from_flag = AgentConfig::from_args(3, const_cast<char**>(flagged));
        unsetenv("LFSRELAY_BASE_URL");
        ASSERT_TRUE(from_env && from_flag, "parsed");
        ASSERT_EQ(from_env->base_url, "swift://container/lfs", "env used");
        ASSERT_EQ(from_flag->base_url, "ftp://host/lfs", "flag wins");
        PASS();
    }
    {
        TEST(bad_flags_rejected);
        const char* help[] = {"lfs-relay", "--help"};
        ASSERT_TRUE(!AgentConfig::from_args(2, const_cast<char**>(help)), "help");
        const char* unknown[] = {"lfs-relay", "--bogus"};
        ASSERT_TRUE(!AgentConfig::from_args(2, const_cast<char**>(unknown)), "unknown");
        const char* missing[] = {"lfs-relay", "--base-url"};
        ASSERT_TRUE(!AgentConfig::from_args(2, const_cast<char**>(missing)), "missing value");
        const char* nan[] = {"lfs-relay", "--metrics-interval", "soon"};
        ASSERT_TRUE(!AgentConfig::from_args(3, const_cast<char**>(nan)), "not a number");
        PASS();
    }
    {
        TEST(json_config_file);
        auto dir = make_temp_dir("lfsrelay-config");
        write_file(dir / "agent.json", R"({
            "base_url": "gs://bucket/from-file",
            "verbose": true,
            "storage": {
                "google_cloud": {"credentials_file": "/etc/lfs/key.json"},
                "swift": {"user_name": "alice", "region_name": "RegionOne",
                          "chunk_size_bytes": 200000000, "max_retries": 3},
                "ftp": {"timeout_secs": 30, "user": "bob", "password": "pw"},
                "local": {"allowed_root": "/srv/lfs"}
            },
            "retry": {"max_attempts": 7, "initial_delay_ms": 10,
                      "max_delay_ms": 100, "multiplier": 1.5}
        })");
        std::string config_path = (dir / "agent.json").string();
        const char* args[] = {"lfs-relay", "--config", config_path.c_str(),
                              "--base-url", "gs://bucket/from-flag"};
        auto config = AgentConfig::from_args(5, const_cast<char**>(args));
        fs::remove_all(dir);

        ASSERT_TRUE(config.has_value(), "parsed");
        ASSERT_EQ(config->base_url, "gs://bucket/from-flag", "later flag wins");
        ASSERT_TRUE(config->verbose, "verbose from file");
        ASSERT_EQ(config->storage.google_cloud.credentials_file, "/etc/lfs/key.json", "gcs key");
        ASSERT_EQ(config->storage.swift.user_name, "alice", "swift user");
        ASSERT_EQ(config->storage.swift.chunk_size_bytes, 200000000u, "chunk size");
        ASSERT_EQ(config->storage.swift.max_retries, 3, "swift retries");
        ASSERT_EQ(config->storage.ftp.timeout.count(), 30000, "ftp timeout");
        ASSERT_EQ(config->storage.ftp.user, "bob", "ftp user");
        ASSERT_EQ(config->storage.local.allowed_root.string(), "/srv/lfs", "allowed root");
        ASSERT_EQ(config->retry.max_attempts, 7, "attempts");
        ASSERT_EQ(config->retry.initial_delay.count(), 10, "initial delay");
        ASSERT_EQ(config->retry.max_delay.count(), 100, "max delay");
        ASSERT_EQ(config->retry.multiplier, 1.5, "multiplier");
        ASSERT_EMPTY(config->validate(), "valid");
        PASS();
    }
    {
        TEST(config_file_from_environment);
        auto dir = make_temp_dir("lfsrelay-config");
        write_file(dir / "agent.json", R"({"base_url": "ftp://host/env-file"})");
        setenv("LFSRELAY_CONFIG", (dir / "agent.json").c_str(), 1);
        const char* bare[] = {"lfs-relay"};
        auto config = AgentConfig::from_args(1, const_cast<char**>(bare));
        unsetenv("LFSRELAY_CONFIG");
        fs::remove_all(dir);
        ASSERT_TRUE(config.has_value(), "parsed");
        ASSERT_EQ(config->base_url, "ftp://host/env-file", "base url from file");
        PASS();
    }
    {
        TEST(broken_config_file_rejected);
        auto dir = make_temp_dir("lfsrelay-config");
        write_file(dir / "agent.json", "{ not json");
        AgentConfig config;
        ASSERT_TRUE(!config.load_json(dir / "agent.json"), "parse error");
        ASSERT_TRUE(!config.load_json(dir / "absent.json"), "missing file");
        fs::remove_all(dir);
        PASS();
    }
    {
        TEST(validation_errors);
        AgentConfig config;
        config.apply_defaults();
        ASSERT_NOT_EMPTY(config.validate(), "base url required");

        config.base_url = "gs://bucket/lfs";
        ASSERT_EMPTY(config.validate(), "valid");

        config.retry.max_attempts = 0;
        ASSERT_NOT_EMPTY(config.validate(), "zero attempts");
        config.retry.max_attempts = 3;

        config.retry.max_delay = std::chrono::milliseconds(1);
        ASSERT_NOT_EMPTY(config.validate(), "max below initial");
        config.retry.max_delay = config.retry.initial_delay;

        config.retry.multiplier = 0.5;
        ASSERT_NOT_EMPTY(config.validate(), "shrinking multiplier");
        config.retry.multiplier = 2.0;

        config.metrics_file = "/tmp/agent.prom";
        config.metrics_interval_secs = 0;
        ASSERT_NOT_EMPTY(config.validate(), "zero metrics interval");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 7. Metrics export
// ---------------------------------------------------------------------------

static void test_metrics_export() {
    std::cout << "\n=== Metrics export ===" << std::endl;

    {
        TEST(write_file_produces_textfile);
        auto dir = make_temp_dir("lfsrelay-metrics");
        auto prom = dir / "agent.prom";
        MetricsExporter metrics(prom, std::chrono::seconds(60), {{"backend", "gcs"}});
        metrics.uploads_success().Increment();
        metrics.storage_retries_total().Increment(2);
        ASSERT_TRUE(metrics.write_file(), "written");

        auto text = read_file(prom);
        ASSERT_TRUE(text.find("lfsrelay_transfers_total") != std::string::npos, "transfers");
        ASSERT_TRUE(text.find("lfsrelay_storage_retries_total") != std::string::npos, "retries");
        ASSERT_TRUE(text.find("backend=\"gcs\"") != std::string::npos, "constant label");
        ASSERT_TRUE(!fs::exists(dir / "agent.prom.tmp"), "temp renamed away");
        fs::remove_all(dir);
        PASS();
    }
    {
        TEST(stop_writes_final_snapshot);
        auto dir = make_temp_dir("lfsrelay-metrics");
        auto prom = dir / "agent.prom";
        {
            MetricsExporter metrics(prom, std::chrono::seconds(3600), {});
            metrics.start();
            metrics.downloads_failure().Increment();
            metrics.stop();
        }
        ASSERT_TRUE(fs::exists(prom), "file written on stop");
        fs::remove_all(dir);
        PASS();
    }
    {
        TEST(unwritable_path_reports_failure);
        MetricsExporter metrics("/nonexistent-dir/lfsrelay/agent.prom", std::chrono::seconds(60),
                                {});
        ASSERT_TRUE(!metrics.write_file(), "write fails");
        PASS();
    }
}

int main() {
    std::cout << "lfs-relay transfer agent test suite" << std::endl;
    std::cout << "===================================" << std::endl;

    test_message_codec();
    test_progress_watcher();
    test_session_lifecycle();
    test_transfers();
    test_failures();
    test_agent_config();
    test_metrics_export();

    std::cout << "\n===================================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
