/**
 * @file transfer.h
 * @brief Main header for the dx_transfer library
 * @version 0.1.0
 *
 * Include this header to access the chunked transfer engine.
 *
 * @code
 * #include <dx/transfer/transfer.h>
 *
 * using namespace dx::transfer;
 *
 * transfer_engine engine(transfer_context{service, nullptr, credentials, nullptr});
 * auto config = transfer_config::builder()
 *     .with_chunk_size(8 * 1024 * 1024)
 *     .with_parallelism(4)
 *     .build();
 * auto handle = engine.start_transfer(transfer_endpoint::local("reads.bam"),
 *                                     transfer_endpoint::remote("project/reads.bam"),
 *                                     config.value());
 * auto outcome = handle.value().await_completion();
 * @endcode
 */

#ifndef DX_TRANSFER_TRANSFER_H
#define DX_TRANSFER_TRANSFER_H

#include <cstdint>
#include <string>

// Core types
#include "dx/transfer/core/types.h"
#include "dx/transfer/core/error_codes.h"
#include "dx/transfer/core/chunk_types.h"
#include "dx/transfer/core/logging.h"

// Transport
#include "dx/transfer/transport/remote_object_service.h"
#include "dx/transfer/transport/chunk_transport.h"
#include "dx/transfer/transport/service_transport.h"

// Engine
#include "dx/transfer/engine/transfer_config.h"
#include "dx/transfer/engine/transfer_types.h"
#include "dx/transfer/engine/transfer_engine.h"

namespace dx::transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace dx::transfer

#endif  // DX_TRANSFER_TRANSFER_H
