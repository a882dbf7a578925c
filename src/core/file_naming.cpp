/**
 * @file file_naming.cpp
 * @brief Implementation of local file naming helpers
 */

#include <dx/transfer/core/file_naming.h>

namespace dx::transfer {

auto make_unix_filename(std::string_view name) -> result<std::string> {
    if (name.empty() || name == "." || name == "..") {
        return unexpected(
            error{error_code::invalid_file_path, "invalid filename '" + std::string(name) + "'"});
    }

    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '/') {
            out += "%2F";
        } else {
            out += c;
        }
    }
    return out;
}

auto ensure_directory(const std::filesystem::path& dir) -> result<void> {
    std::error_code ec;
    if (std::filesystem::exists(dir, ec)) {
        if (!std::filesystem::is_directory(dir, ec)) {
            return unexpected(error{error_code::invalid_file_path,
                                    "path " + dir.string() +
                                        " already exists, and it is a file, not a directory"});
        }
        return {};
    }

    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return unexpected(error{error_code::file_access_denied,
                                "cannot create directory " + dir.string() + ": " + ec.message()});
    }
    return {};
}

auto resolve_download_path(const std::filesystem::path& destination, std::string_view object_id)
    -> result<std::filesystem::path> {
    std::error_code ec;
    if (std::filesystem::is_directory(destination, ec)) {
        auto slash = object_id.find_last_of('/');
        auto base = slash == std::string_view::npos ? object_id : object_id.substr(slash + 1);
        auto name = make_unix_filename(base);
        if (!name) {
            return unexpected(name.error());
        }
        return destination / name.value();
    }

    auto parent = destination.parent_path();
    if (!parent.empty()) {
        if (auto made = ensure_directory(parent); !made) {
            return unexpected(made.error());
        }
    }
    return destination;
}

}  // namespace dx::transfer
