#include "lfsrelay/storage/backends.hpp"
#include "lfsrelay/storage/errors.hpp"
#include "lfsrelay/core/log.hpp"

#include <algorithm>
#include <cerrno>
#include <system_error>

namespace lfsrelay::storage {

namespace {

Object make_object(const std::string& url, const std::filesystem::path& path,
                   const std::string& name) {
    Object obj;
    obj.url = url;
    obj.name = name;
    obj.size = std::filesystem::file_size(path);

    auto ftime = std::filesystem::last_write_time(path);
    obj.last_modified = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(ftime));
    return obj;
}

std::string path_name(const std::filesystem::path& path) {
    std::string name = path.generic_string();
    while (!name.empty() && name.front() == '/') {
        name.erase(name.begin());
    }
    return name;
}

bool is_within(const std::filesystem::path& path, const std::filesystem::path& root) {
    auto [root_end, path_it] = std::mismatch(root.begin(), root.end(), path.begin(), path.end());
    return root_end == root.end();
}

}  // namespace

LocalStorage::LocalStorage(const LocalConfig& config) : config_(config) {}

std::filesystem::path LocalStorage::url_to_path(const std::string& url) const {
    if (!url.starts_with(FILE_PROTOCOL)) {
        throw UnsupportedProtocolError("local");
    }
    std::string rest = url.substr(std::char_traits<char>::length(FILE_PROTOCOL));
    if (rest.empty()) {
        throw InvalidAddressError("local", url);
    }

    std::filesystem::path path(rest);
    if (!config_.allowed_root.empty()) {
        auto root = std::filesystem::weakly_canonical(std::filesystem::absolute(config_.allowed_root));
        auto resolved = std::filesystem::weakly_canonical(std::filesystem::absolute(path));
        if (!is_within(resolved, root)) {
            throw InvalidAddressError("local", url);
        }
    }
    return path;
}

Object LocalStorage::stat(const Context& ctx, const std::string& url) {
    ctx.check();
    auto path = url_to_path(url);

    std::error_code ec;
    auto st = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(st)) {
        throw NotFoundError("local: object not found: " + url);
    }
    if (!std::filesystem::is_regular_file(st)) {
        throw NotFoundError("local: stat on non-regular file: " + url);
    }

    try {
        return make_object(url, path, path_name(path));
    } catch (const std::filesystem::filesystem_error& e) {
        throw BackendError(std::string("local: reading metadata: ") + e.what());
    }
}

std::vector<Object> LocalStorage::list(const Context& ctx, const std::string& url) {
    ctx.check();
    auto path = url_to_path(url);
    std::vector<Object> objects;

    std::error_code ec;
    auto st = std::filesystem::symlink_status(path, ec);
    if (ec || !std::filesystem::exists(st)) {
        return objects;
    }

    try {
        if (std::filesystem::is_regular_file(st)) {
            objects.push_back(make_object(url, path, path_name(path)));
            return objects;
        }
        if (!std::filesystem::is_directory(st)) {
            return objects;
        }

        for (const auto& entry : std::filesystem::recursive_directory_iterator(path)) {
            ctx.check();
            if (entry.is_symlink() || !entry.is_regular_file()) {
                continue;
            }
            auto rel = entry.path().lexically_relative(path).generic_string();
            objects.push_back(make_object(join(url, rel), entry.path(), path_name(entry.path())));
        }
    } catch (const std::filesystem::filesystem_error& e) {
        throw BackendError(std::string("local: listing ") + url + ": " + e.what());
    }

    std::sort(objects.begin(), objects.end(),
              [](const Object& a, const Object& b) { return a.url < b.url; });
    return objects;
}

Object LocalStorage::get(const Context& ctx, const std::string& url, Writer& dest) {
    auto obj = stat(ctx, url);
    auto path = url_to_path(url);

    try {
        FileReader reader(path);
        ContextWriter out(ctx, dest);
        copy_stream(reader, out);
    } catch (const std::system_error& e) {
        if (e.code() == std::errc::no_such_file_or_directory) {
            throw NotFoundError("local: object not found: " + url);
        }
        throw BackendError(std::string("local: copying file: ") + e.what());
    }
    return obj;
}

Object LocalStorage::put(const Context& ctx, const std::string& url, Reader& src) {
    ctx.check();
    auto path = url_to_path(url);

    // Write to a temp file then rename, so readers never see a partial object
    auto temp_path = std::filesystem::path(path.string() + ".tmp." +
        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));

    try {
        if (path.has_parent_path()) {
            ensure_dir(path.parent_path());
        }
        FileWriter writer(temp_path);
        ContextReader in(ctx, src);
        copy_stream(in, writer);
        writer.close();

        std::filesystem::rename(temp_path, path);
    } catch (const StorageError&) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        throw;
    } catch (const std::system_error& e) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        throw BackendError(std::string("local: writing ") + url + ": " + e.what());
    } catch (...) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        throw;
    }

    log_debug("local: stored %s", path.c_str());
    return stat(ctx, url);
}

std::string LocalStorage::join(const std::string& url, const std::string& sub) const {
    return join_url(url, sub);
}

}  // namespace lfsrelay::storage
