#include "lfsrelay/storage/io.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace lfsrelay::storage {

namespace {

std::system_error errno_error(const std::string& what, const std::filesystem::path& path) {
    return std::system_error(errno, std::generic_category(), what + " " + path.string());
}

}  // namespace

// ============================================================================
// FileReader / FileWriter
// ============================================================================

FileReader::FileReader(const std::filesystem::path& path) : path_(path) {
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw errno_error("opening", path);
    }
}

FileReader::~FileReader() {
    if (fd_ >= 0) ::close(fd_);
}

size_t FileReader::read(uint8_t* buffer, size_t length) {
    while (true) {
        ssize_t n = ::read(fd_, buffer, length);
        if (n >= 0) return static_cast<size_t>(n);
        if (errno == EINTR) continue;
        throw errno_error("reading", path_);
    }
}

bool FileReader::rewind() {
    return ::lseek(fd_, 0, SEEK_SET) == 0;
}

FileWriter::FileWriter(const std::filesystem::path& path) : path_(path) {
    fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw errno_error("creating", path);
    }
}

FileWriter::~FileWriter() {
    if (fd_ >= 0) ::close(fd_);
}

void FileWriter::write(const uint8_t* data, size_t length) {
    if (fd_ < 0) {
        throw std::system_error(EBADF, std::generic_category(), "writing closed file " + path_.string());
    }
    size_t written = 0;
    while (written < length) {
        ssize_t n = ::write(fd_, data + written, length - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw errno_error("writing", path_);
        }
        written += static_cast<size_t>(n);
    }
}

bool FileWriter::rewind() {
    if (fd_ < 0) return false;
    if (::ftruncate(fd_, 0) != 0) return false;
    return ::lseek(fd_, 0, SEEK_SET) == 0;
}

void FileWriter::close() {
    if (fd_ < 0) return;
    int fd = fd_;
    fd_ = -1;
    int rc = ::fsync(fd);
    int sync_errno = errno;
    if (::close(fd) != 0) {
        throw errno_error("closing", path_);
    }
    // fsync is unsupported on some special files; that is not a write error
    if (rc != 0 && sync_errno != EINVAL && sync_errno != EROFS) {
        errno = sync_errno;
        throw errno_error("syncing", path_);
    }
}

// ============================================================================
// BufferReader
// ============================================================================

size_t BufferReader::read(uint8_t* buffer, size_t length) {
    size_t n = std::min(length, data_.size() - pos_);
    if (n > 0) {
        std::memcpy(buffer, data_.data() + pos_, n);
        pos_ += n;
    }
    return n;
}

// ============================================================================
// ContextReader / ContextWriter
// ============================================================================

ContextReader::ContextReader(const Context& ctx, Reader& inner)
    : ctx_(ctx), inner_(inner) {
    if (auto deadline = ctx_.deadline()) {
        if (auto* d = dynamic_cast<Deadliner*>(&inner_)) {
            d->set_deadline(*deadline);
        }
    }
}

size_t ContextReader::read(uint8_t* buffer, size_t length) {
    ctx_.check();
    size_t n = inner_.read(buffer, length);
    ctx_.check();
    return n;
}

ContextWriter::ContextWriter(const Context& ctx, Writer& inner)
    : ctx_(ctx), inner_(inner) {
    if (auto deadline = ctx_.deadline()) {
        if (auto* d = dynamic_cast<Deadliner*>(&inner_)) {
            d->set_deadline(*deadline);
        }
    }
}

void ContextWriter::write(const uint8_t* data, size_t length) {
    ctx_.check();
    inner_.write(data, length);
    ctx_.check();
}

// ============================================================================
// CountingReader / CountingWriter
// ============================================================================

size_t CountingReader::read(uint8_t* buffer, size_t length) {
    size_t n = inner_.read(buffer, length);
    count_.fetch_add(n, std::memory_order_relaxed);
    return n;
}

bool CountingReader::rewind() {
    if (!inner_.rewind()) return false;
    count_.store(0, std::memory_order_relaxed);
    return true;
}

void CountingReader::set_deadline(Context::Clock::time_point deadline) {
    if (auto* d = dynamic_cast<Deadliner*>(&inner_)) {
        d->set_deadline(deadline);
    }
}

void CountingWriter::write(const uint8_t* data, size_t length) {
    inner_.write(data, length);
    count_.fetch_add(length, std::memory_order_relaxed);
}

bool CountingWriter::rewind() {
    if (!inner_.rewind()) return false;
    count_.store(0, std::memory_order_relaxed);
    return true;
}

void CountingWriter::set_deadline(Context::Clock::time_point deadline) {
    if (auto* d = dynamic_cast<Deadliner*>(&inner_)) {
        d->set_deadline(deadline);
    }
}

// ============================================================================
// Helpers
// ============================================================================

uint64_t copy_stream(Reader& src, Writer& dest, size_t buffer_size) {
    std::vector<uint8_t> buffer(buffer_size);
    uint64_t total = 0;
    while (true) {
        size_t n = src.read(buffer.data(), buffer.size());
        if (n == 0) break;
        dest.write(buffer.data(), n);
        total += n;
    }
    return total;
}

size_t read_full(Reader& src, uint8_t* buffer, size_t length) {
    size_t filled = 0;
    while (filled < length) {
        size_t n = src.read(buffer + filled, length - filled);
        if (n == 0) break;
        filled += n;
    }
    return filled;
}

void ensure_dir(const std::filesystem::path& dir) {
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) return;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        throw std::system_error(ec, "creating directory " + dir.string());
    }
}

}  // namespace lfsrelay::storage
