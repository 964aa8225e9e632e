#pragma once

#include "lfsrelay/core/context.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace lfsrelay::storage {

// Byte source. read() returns 0 at end of stream and throws on failure.
class Reader {
public:
    virtual ~Reader() = default;
    virtual size_t read(uint8_t* buffer, size_t length) = 0;

    // Restart from the first byte. Streams that cannot do this return false.
    virtual bool rewind() { return false; }
};

// Byte sink. write() either consumes all of @p length or throws.
class Writer {
public:
    virtual ~Writer() = default;
    virtual void write(const uint8_t* data, size_t length) = 0;

    // Discard everything written so far. Returns false if unsupported.
    virtual bool rewind() { return false; }
};

// Optional capability for streams backed by something with its own timeout.
class Deadliner {
public:
    virtual ~Deadliner() = default;
    virtual void set_deadline(Context::Clock::time_point deadline) = 0;
};

// ============================================================================
// Local files (POSIX descriptors)
// ============================================================================

class FileReader : public Reader {
public:
    /// Throws std::system_error if the file cannot be opened.
    explicit FileReader(const std::filesystem::path& path);
    ~FileReader() override;

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;

    size_t read(uint8_t* buffer, size_t length) override;
    bool rewind() override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
};

class FileWriter : public Writer {
public:
    /// Creates or truncates @p path. Throws std::system_error on failure.
    explicit FileWriter(const std::filesystem::path& path);
    ~FileWriter() override;

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    void write(const uint8_t* data, size_t length) override;
    bool rewind() override;

    /// Flush and close. Throws std::system_error if the kernel reports a
    /// deferred write error. Safe to call twice.
    void close();

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
};

// ============================================================================
// In-memory streams
// ============================================================================

class BufferReader : public Reader {
public:
    explicit BufferReader(std::vector<uint8_t> data) : data_(std::move(data)) {}
    explicit BufferReader(const std::string& data) : data_(data.begin(), data.end()) {}

    size_t read(uint8_t* buffer, size_t length) override;
    bool rewind() override { pos_ = 0; return true; }

private:
    std::vector<uint8_t> data_;
    size_t pos_ = 0;
};

class BufferWriter : public Writer {
public:
    void write(const uint8_t* data, size_t length) override {
        data_.insert(data_.end(), data, data + length);
    }
    bool rewind() override { data_.clear(); return true; }

    const std::vector<uint8_t>& data() const { return data_; }
    std::string str() const { return std::string(data_.begin(), data_.end()); }

private:
    std::vector<uint8_t> data_;
};

// ============================================================================
// Cancellation-aware wrappers
// ============================================================================

// Checks the context before and after every read. If the context has a
// deadline and the wrapped reader is a Deadliner, the deadline is applied
// once at construction.
class ContextReader : public Reader {
public:
    ContextReader(const Context& ctx, Reader& inner);

    size_t read(uint8_t* buffer, size_t length) override;
    bool rewind() override { return inner_.rewind(); }

private:
    Context ctx_;
    Reader& inner_;
};

class ContextWriter : public Writer {
public:
    ContextWriter(const Context& ctx, Writer& inner);

    void write(const uint8_t* data, size_t length) override;
    bool rewind() override { return inner_.rewind(); }

private:
    Context ctx_;
    Writer& inner_;
};

// ============================================================================
// Progress counters
// ============================================================================

// Counts bytes passing through. count() may be read from another thread.
class CountingReader : public Reader, public Deadliner {
public:
    explicit CountingReader(Reader& inner) : inner_(inner) {}

    size_t read(uint8_t* buffer, size_t length) override;
    bool rewind() override;
    void set_deadline(Context::Clock::time_point deadline) override;

    uint64_t count() const { return count_.load(std::memory_order_relaxed); }

private:
    Reader& inner_;
    std::atomic<uint64_t> count_{0};
};

class CountingWriter : public Writer, public Deadliner {
public:
    explicit CountingWriter(Writer& inner) : inner_(inner) {}

    void write(const uint8_t* data, size_t length) override;
    bool rewind() override;
    void set_deadline(Context::Clock::time_point deadline) override;

    uint64_t count() const { return count_.load(std::memory_order_relaxed); }

private:
    Writer& inner_;
    std::atomic<uint64_t> count_{0};
};

/// Copy @p src into @p dest until end of stream. Returns bytes copied.
uint64_t copy_stream(Reader& src, Writer& dest,
                     size_t buffer_size = 64 * 1024);

/// Read until @p length bytes are gathered or the stream ends.
size_t read_full(Reader& src, uint8_t* buffer, size_t length);

/// Create @p dir and any missing parents. Throws std::system_error.
void ensure_dir(const std::filesystem::path& dir);

}  // namespace lfsrelay::storage
