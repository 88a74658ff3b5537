/**
 * @file directory_remote_session.cpp
 * @brief Implementation of directory_remote_session
 */

#include "kcenon/delta_fetch/remote/directory_remote_session.h"
#include "kcenon/delta_fetch/core/checksum.h"
#include "kcenon/delta_fetch/core/json_utils.h"

#include <algorithm>
#include <fstream>

namespace kcenon::delta_fetch {

namespace {

auto trim_slashes(const std::string& path) -> std::string {
    auto first = path.find_first_not_of('/');
    if (first == std::string::npos) {
        return {};
    }
    auto last = path.find_last_not_of('/');
    return path.substr(first, last - first + 1);
}

auto join_remote(const std::string& parent, const std::string& name) -> std::string {
    return parent.empty() ? name : parent + "/" + name;
}

}  // namespace

directory_remote_session::directory_remote_session(std::filesystem::path root,
                                                   directory_session_options options)
    : root_(std::move(root))
    , options_(std::move(options)) {
}

auto directory_remote_session::authenticate() -> result<session_info> {
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        return unexpected(error(error_code::auth_failed,
            "remote root is not a readable directory: " + root_.string()));
    }

    session_info info;
    info.account = options_.account;
    info.authenticated_at = std::chrono::system_clock::now();
    info.session_id = checksum::sha256(root_.string() + "@" +
        std::to_string(detail::to_epoch_ms(info.authenticated_at))).substr(0, 16);
    return info;
}

auto directory_remote_session::resolve(const std::string& remote_path) const
    -> result<std::filesystem::path> {
    auto relative = std::filesystem::path(trim_slashes(remote_path)).lexically_normal();
    if (!relative.empty() && *relative.begin() == "..") {
        return unexpected(error(error_code::remote_access_denied,
            "path escapes the remote root: " + remote_path));
    }
    if (relative == ".") {
        return root_;
    }
    return root_ / relative;
}

auto directory_remote_session::describe(const std::filesystem::path& local,
                                        const std::string& remote_path,
                                        bool with_hash) const -> result<remote_item> {
    std::error_code ec;
    auto status = std::filesystem::status(local, ec);
    if (ec || !std::filesystem::exists(status)) {
        return unexpected(error(error_code::remote_not_found,
            "remote path not found: " + remote_path));
    }

    remote_item item;
    item.path = trim_slashes(remote_path);
    item.name = item.path.empty() ? root_.filename().string()
                                  : std::filesystem::path(item.path).filename().string();
    auto mtime = std::filesystem::last_write_time(local, ec);
    if (!ec) {
        item.modified = detail::to_system_time(mtime);
    }

    if (std::filesystem::is_directory(status)) {
        item.kind = item_kind::directory;
        return item;
    }
    if (!std::filesystem::is_regular_file(status)) {
        return unexpected(error(error_code::invalid_remote_item,
            "not a regular file or directory: " + remote_path));
    }

    item.kind = item_kind::file;
    item.size = std::filesystem::file_size(local, ec);
    if (ec) {
        return unexpected(error(error_code::remote_unavailable,
            "cannot stat " + remote_path + ": " + ec.message()));
    }
    if (with_hash && options_.compute_hashes) {
        auto hash = checksum::sha256_file(local);
        if (!hash) {
            return unexpected(error(error_code::remote_unavailable, hash.error().message));
        }
        item.sha256 = hash.value();
    }
    return item;
}

auto directory_remote_session::stat(const std::string& remote_path) -> result<remote_item> {
    auto local = resolve(remote_path);
    if (!local) {
        return unexpected(local.error());
    }
    return describe(local.value(), remote_path, true);
}

auto directory_remote_session::list_children(const std::string& remote_path)
    -> result<std::vector<remote_item>> {
    auto local = resolve(remote_path);
    if (!local) {
        return unexpected(local.error());
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(local.value(), ec)) {
        return unexpected(error(error_code::invalid_remote_item,
            "not a directory: " + remote_path));
    }

    auto parent = trim_slashes(remote_path);
    std::vector<remote_item> children;
    for (const auto& entry : std::filesystem::directory_iterator(local.value(), ec)) {
        auto child = describe(entry.path(), join_remote(parent, entry.path().filename().string()),
                              true);
        if (child) {
            children.push_back(std::move(child.value()));
            continue;
        }
        // Special files, dangling links and entries removed since the
        // directory was read are not part of the listing.
        auto code = child.error().code;
        if (code != error_code::invalid_remote_item && code != error_code::remote_not_found) {
            return unexpected(child.error());
        }
    }
    if (ec) {
        return unexpected(error(error_code::remote_unavailable,
            "cannot list " + remote_path + ": " + ec.message()));
    }

    std::sort(children.begin(), children.end(), [](const auto& a, const auto& b) {
        return a.name < b.name;
    });
    return children;
}

auto directory_remote_session::open_range(const remote_item& item, uint64_t offset,
                                          uint64_t length) -> result<std::vector<std::byte>> {
    auto local = resolve(item.path);
    if (!local) {
        return unexpected(local.error());
    }

    auto current = describe(local.value(), item.path, false);
    if (!current) {
        return unexpected(current.error());
    }
    const auto& now = current.value();
    if (!now.is_file()) {
        return unexpected(error(error_code::invalid_remote_item,
            "not a file: " + item.path));
    }
    if (now.size != item.size ||
        detail::to_epoch_ms(now.modified) != detail::to_epoch_ms(item.modified)) {
        return unexpected(error(error_code::remote_content_changed,
            "remote file changed since it was listed: " + item.path));
    }
    if (offset > now.size || length > now.size - offset) {
        return unexpected(error(error_code::invalid_range,
            "range [" + std::to_string(offset) + ", +" + std::to_string(length) +
            ") outside " + item.path));
    }

    std::ifstream file(local.value(), std::ios::binary);
    if (!file) {
        return unexpected(error(error_code::remote_unavailable,
            "cannot open " + item.path));
    }
    file.seekg(static_cast<std::streamoff>(offset));

    std::vector<std::byte> data(static_cast<std::size_t>(length));
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(length));
    auto got = static_cast<std::size_t>(file.gcount());
    if (got != data.size()) {
        return unexpected(error(error_code::remote_short_read,
            "short read of " + item.path + " at " + std::to_string(offset)));
    }
    return data;
}

}  // namespace kcenon::delta_fetch
