#include "lfsrelay/net/ftp.hpp"
#include "lfsrelay/storage/backends.hpp"
#include "lfsrelay/storage/errors.hpp"
#include "lfsrelay/core/log.hpp"

namespace lfsrelay::storage {

namespace {

std::string base_name(const std::string& path) {
    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string join_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

net::FtpSessionOptions session_options(const FtpConfig& config, const FtpStorage::Endpoint& ep) {
    net::FtpSessionOptions opts;
    opts.user = ep.user;
    opts.password = ep.password;
    opts.timeout = config.timeout;
    return opts;
}

[[noreturn]] void rethrow_ftp(const net::FtpError& e, const std::string& url) {
    if (e.is_unavailable()) {
        throw NotFoundError("ftp: object not found: " + url + ": " + e.what());
    }
    throw BackendError(e.what());
}

Object stat_with(net::FtpSession& session, const Context& ctx,
                 const std::string& url, const std::string& path) {
    std::vector<net::FtpEntry> entries;
    try {
        entries = session.list(ctx, path);
    } catch (const net::FtpError& e) {
        rethrow_ftp(e, url);
    }
    return ftp_stat_entry(entries, url, path);
}

void list_with(net::FtpSession& session, const Context& ctx, const std::string& url,
               const std::string& path, std::vector<Object>& out) {
    std::vector<net::FtpEntry> entries;
    try {
        entries = session.list(ctx, path);
    } catch (const net::FtpError& e) {
        rethrow_ftp(e, url);
    }

    // List called on a regular file
    if (entries.size() == 1 && entries[0].type == net::FtpEntryType::File &&
        !path.empty() && (entries[0].name == path || entries[0].name == base_name(path))) {
        Object obj;
        obj.url = url;
        obj.name = path;
        obj.size = entries[0].size;
        obj.last_modified = entries[0].time;
        out.push_back(std::move(obj));
        return;
    }

    for (const auto& entry : entries) {
        switch (entry.type) {
            case net::FtpEntryType::Folder:
                if (entry.name == "." || entry.name == "..") break;
                list_with(session, ctx, join_url(url, entry.name),
                          join_path(path, entry.name), out);
                break;

            case net::FtpEntryType::Link:
                break;

            case net::FtpEntryType::File: {
                Object obj;
                obj.url = join_url(url, entry.name);
                obj.name = join_path(path, entry.name);
                obj.size = entry.size;
                obj.last_modified = entry.time;
                out.push_back(std::move(obj));
                break;
            }
        }
    }
}

}  // namespace

Object ftp_stat_entry(const std::vector<net::FtpEntry>& entries, const std::string& url,
                      const std::string& path) {
    // A directory holding a single file also lists as one entry
    if (entries.size() != 1 ||
        (entries[0].name != path && entries[0].name != base_name(path))) {
        throw NotFoundError("ftp: object not found: " + url);
    }

    const auto& entry = entries[0];
    if (entry.type != net::FtpEntryType::File) {
        throw NotFoundError("ftp: stat on non-regular file type: " + url);
    }

    Object obj;
    obj.url = url;
    obj.name = path;
    obj.size = entry.size;
    obj.last_modified = entry.time;
    return obj;
}

FtpStorage::FtpStorage(const FtpConfig& config) : config_(config) {}

FtpStorage::Endpoint FtpStorage::resolve(const std::string& url) const {
    if (!url.starts_with(FTP_PROTOCOL)) {
        throw UnsupportedProtocolError("ftp");
    }
    if (url.size() == std::char_traits<char>::length(FTP_PROTOCOL)) {
        throw InvalidAddressError("ftp", url);
    }

    auto parsed = net::ParsedUrl::parse(url);
    if (!parsed || parsed->host.empty()) {
        throw InvalidAddressError("ftp", url);
    }

    Endpoint ep;
    std::string host = parsed->host.find(':') != std::string::npos
        ? "[" + parsed->host + "]" : parsed->host;
    ep.server = std::string(FTP_PROTOCOL) + host + ":" +
                std::to_string(parsed->port > 0 ? parsed->port : 21);

    ep.path = net::url_decode(parsed->path);
    while (!ep.path.empty() && ep.path.front() == '/') {
        ep.path.erase(ep.path.begin());
    }

    ep.user = config_.user;
    ep.password = config_.password;
    if (auto user = parsed->username()) {
        // The configured password belongs to the configured user
        ep.user = *user;
        ep.password = parsed->password().value_or("");
    }
    return ep;
}

Object FtpStorage::stat(const Context& ctx, const std::string& url) {
    auto ep = resolve(url);
    try {
        net::FtpSession session(ep.server, session_options(config_, ep));
        return stat_with(session, ctx, url, ep.path);
    } catch (const net::FtpError& e) {
        rethrow_ftp(e, url);
    }
}

std::vector<Object> FtpStorage::list(const Context& ctx, const std::string& url) {
    auto ep = resolve(url);
    std::vector<Object> objects;
    try {
        net::FtpSession session(ep.server, session_options(config_, ep));
        list_with(session, ctx, url, ep.path, objects);
    } catch (const net::FtpError& e) {
        rethrow_ftp(e, url);
    }
    return objects;
}

Object FtpStorage::get(const Context& ctx, const std::string& url, Writer& dest) {
    auto ep = resolve(url);
    try {
        net::FtpSession session(ep.server, session_options(config_, ep));
        auto obj = stat_with(session, ctx, url, ep.path);

        ContextWriter out(ctx, dest);
        session.retrieve(ctx, ep.path, out);
        return obj;
    } catch (const net::FtpError& e) {
        rethrow_ftp(e, url);
    }
}

Object FtpStorage::put(const Context& ctx, const std::string& url, Reader& src) {
    auto ep = resolve(url);
    if (ep.path.empty() || ep.path.back() == '/') {
        throw InvalidAddressError("ftp", url);
    }

    try {
        net::FtpSession session(ep.server, session_options(config_, ep));

        ContextReader in(ctx, src);
        session.store(ctx, ep.path, in);
        log_debug("ftp: stored %s", url.c_str());

        return stat_with(session, ctx, url, ep.path);
    } catch (const net::FtpError& e) {
        throw BackendError(std::string("ftp: uploading file for \"") + url + "\": " + e.what());
    }
}

std::string FtpStorage::join(const std::string& url, const std::string& sub) const {
    return join_url(url, sub);
}

}  // namespace lfsrelay::storage
