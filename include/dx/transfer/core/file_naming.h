/**
 * @file file_naming.h
 * @brief Mapping remote object names onto local file names
 */

#ifndef DX_TRANSFER_CORE_FILE_NAMING_H
#define DX_TRANSFER_CORE_FILE_NAMING_H

#include <dx/transfer/core/types.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace dx::transfer {

/**
 * @brief Turn an object name into a valid single Unix file name
 *
 * Slashes become "%2F". Empty names, "." and ".." are rejected with
 * invalid_file_path.
 */
[[nodiscard]] auto make_unix_filename(std::string_view name) -> result<std::string>;

/**
 * @brief Create a directory if missing
 *
 * Fails with invalid_file_path when the path exists as a regular file.
 */
[[nodiscard]] auto ensure_directory(const std::filesystem::path& dir) -> result<void>;

/**
 * @brief Resolve where a downloaded object lands
 *
 * An existing directory receives the object under make_unix_filename of
 * its last path component; anything else is taken as the file path and
 * its parent directory is created.
 */
[[nodiscard]] auto resolve_download_path(const std::filesystem::path& destination,
                                         std::string_view object_id)
    -> result<std::filesystem::path>;

}  // namespace dx::transfer

#endif  // DX_TRANSFER_CORE_FILE_NAMING_H
