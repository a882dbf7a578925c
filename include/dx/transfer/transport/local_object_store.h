/**
 * @file local_object_store.h
 * @brief Directory-backed remote_object_service
 *
 * Stores objects and open upload sessions under a base directory. It
 * behaves like a multipart object store (index-addressed chunk commits,
 * a re-commit replaces the part, checksummed close) and is meant for
 * tests, examples and local staging, not as a production service.
 */

#ifndef DX_TRANSFER_TRANSPORT_LOCAL_OBJECT_STORE_H
#define DX_TRANSFER_TRANSPORT_LOCAL_OBJECT_STORE_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "dx/transfer/core/checksum.h"
#include "dx/transfer/transport/remote_object_service.h"

namespace dx::transfer {

/**
 * @brief Call counters of a local_object_store
 */
struct object_store_statistics {
    uint64_t sessions_opened = 0;
    uint64_t chunks_put = 0;
    uint64_t chunks_get = 0;
    uint64_t objects_closed = 0;
    uint64_t sessions_aborted = 0;
};

class local_object_store final : public remote_object_service {
public:
    /**
     * @brief Create a store rooted at base_path
     * @param base_path Directory holding objects/ and sessions/
     * @param alg Digest reported in chunk acks and metadata
     */
    [[nodiscard]] static auto create(const std::filesystem::path& base_path,
                                     checksum_algorithm alg = checksum_algorithm::md5)
        -> std::shared_ptr<local_object_store>;

    ~local_object_store() override;

    local_object_store(const local_object_store&) = delete;
    auto operator=(const local_object_store&) -> local_object_store& = delete;

    [[nodiscard]] auto open_upload_session(const std::string& object_id,
                                           uint64_t total_size,
                                           const call_options& options = {})
        -> transport_result<std::string> override;

    [[nodiscard]] auto put_chunk(const std::string& session_token,
                                 uint64_t index,
                                 std::span<const std::byte> data,
                                 const call_options& options = {})
        -> transport_result<chunk_ack> override;

    [[nodiscard]] auto get_chunk(const std::string& object_id,
                                 uint64_t index,
                                 uint64_t offset,
                                 uint64_t length,
                                 const call_options& options = {})
        -> transport_result<std::vector<std::byte>> override;

    [[nodiscard]] auto close_object(const std::string& session_token,
                                    const std::string& whole_checksum,
                                    const call_options& options = {})
        -> transport_result<void> override;

    [[nodiscard]] auto get_object_metadata(const std::string& object_id,
                                           const call_options& options = {})
        -> transport_result<object_metadata> override;

    [[nodiscard]] auto abort_upload_session(const std::string& session_token,
                                            const call_options& options = {})
        -> transport_result<void> override;

    [[nodiscard]] auto query_session_checksum(const std::string& session_token,
                                              const call_options& options = {})
        -> transport_result<std::optional<std::string>> override;

    /**
     * @brief Publish a local file directly as a closed object
     *
     * Lets download tests seed the store without an upload.
     */
    [[nodiscard]] auto import_object(const std::string& object_id,
                                     const std::filesystem::path& file_path,
                                     uint64_t chunk_size) -> transport_result<void>;

    [[nodiscard]] auto object_exists(const std::string& object_id) const -> bool;
    [[nodiscard]] auto session_exists(const std::string& session_token) const -> bool;

    [[nodiscard]] auto get_statistics() const -> object_store_statistics;

    [[nodiscard]] auto base_path() const -> const std::filesystem::path&;

private:
    local_object_store(const std::filesystem::path& base_path, checksum_algorithm alg);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace dx::transfer

#endif  // DX_TRANSFER_TRANSPORT_LOCAL_OBJECT_STORE_H
