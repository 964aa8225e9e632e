#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace lfsrelay::constants {

// Local layout
constexpr const char* DEFAULT_DATA_DIR = ".lfs-relay/data";
constexpr const char* DEFAULT_LOG_FILE = ".lfs-relay/logs/agent.log";

// Protocol
constexpr std::chrono::milliseconds PROGRESS_INTERVAL{250};
constexpr int ERROR_CODE_STORAGE = 1;
constexpr int ERROR_CODE_LOCAL_FILE = 2;
constexpr int ERROR_CODE_INTERNAL = 3;

// Storage retry decorator
constexpr int DEFAULT_RETRY_MAX_ATTEMPTS = 5;
constexpr std::chrono::milliseconds DEFAULT_RETRY_INITIAL_DELAY{1000};
constexpr std::chrono::milliseconds DEFAULT_RETRY_MAX_DELAY{30000};
constexpr double DEFAULT_RETRY_MULTIPLIER = 2.0;

// Swift static large objects (decimal units)
constexpr uint64_t MB = 1000ULL * 1000;
constexpr uint64_t GB = 1000ULL * MB;
constexpr uint64_t SWIFT_MIN_CHUNK_SIZE = 100 * MB;
constexpr uint64_t SWIFT_MAX_CHUNK_SIZE = 5 * GB;
constexpr uint64_t SWIFT_DEFAULT_CHUNK_SIZE = 500 * MB;
constexpr int SWIFT_DEFAULT_MAX_RETRIES = 20;

// Google Cloud Storage resumable uploads; must be a multiple of 256 KiB
constexpr size_t GCS_UPLOAD_CHUNK_SIZE = 8 * 1024 * 1024;

// FTP
constexpr std::chrono::seconds DEFAULT_FTP_TIMEOUT{10};
constexpr const char* DEFAULT_FTP_USER = "anonymous";
constexpr const char* DEFAULT_FTP_PASSWORD = "anonymous";

// Stream copy buffer
constexpr size_t DEFAULT_COPY_BUFFER_SIZE = 64 * 1024;

// HTTP request defaults
constexpr int DEFAULT_HTTP_CONNECT_TIMEOUT_SECONDS = 30;

}  // namespace lfsrelay::constants
