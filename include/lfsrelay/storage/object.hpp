#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace lfsrelay::storage {

// Metadata about a stored object, as reported by the backend at call time
struct Object {
    std::string url;     // fully-qualified, e.g. "gs://bucket/dir/obj.bin"
    std::string name;    // path inside the bucket/host, e.g. "dir/obj.bin"
    std::string etag;    // opaque version tag, empty if the backend has none
    std::chrono::system_clock::time_point last_modified;
    uint64_t size = 0;
};

}  // namespace lfsrelay::storage
