// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file feature_flags.h
 * @brief Build-time backend selection for dx_transfer
 *
 * The build defines BUILD_WITH_<SYSTEM> for every kcenon system it found.
 * This header turns those into:
 * - KCENON_WITH_*          : System availability (shared with common_system)
 * - DX_TRANSFER_USE_*      : Backends the library actually compiles against
 *
 * Usage:
 * @code
 * #include <dx/transfer/config/feature_flags.h>
 *
 * #if DX_TRANSFER_USE_THREAD_SYSTEM
 *     auto pool = std::make_shared<kcenon::thread::thread_pool>("chunks");
 * #endif
 * @endcode
 */

#pragma once

#if __has_include(<kcenon/common/config/feature_flags.h>)
#include <kcenon/common/config/feature_flags.h>
#endif

//==============================================================================
// System availability
//==============================================================================

#ifndef KCENON_WITH_COMMON_SYSTEM
    #if defined(BUILD_WITH_COMMON_SYSTEM)
        #define KCENON_WITH_COMMON_SYSTEM 1
    #else
        #define KCENON_WITH_COMMON_SYSTEM 0
    #endif
#endif

// Worker loop executor
#ifndef KCENON_WITH_THREAD_SYSTEM
    #if defined(BUILD_WITH_THREAD_SYSTEM)
        #define KCENON_WITH_THREAD_SYSTEM 1
    #else
        #define KCENON_WITH_THREAD_SYSTEM 0
    #endif
#endif

// Log sink
#ifndef KCENON_WITH_LOGGER_SYSTEM
    #if defined(BUILD_WITH_LOGGER_SYSTEM)
        #define KCENON_WITH_LOGGER_SYSTEM 1
    #else
        #define KCENON_WITH_LOGGER_SYSTEM 0
    #endif
#endif

//==============================================================================
// Resolved backends
//==============================================================================

// thread_system jobs return common_system results
#ifndef DX_TRANSFER_USE_THREAD_SYSTEM
    #if KCENON_WITH_THREAD_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define DX_TRANSFER_USE_THREAD_SYSTEM 1
    #else
        #define DX_TRANSFER_USE_THREAD_SYSTEM 0
    #endif
#endif

#ifndef DX_TRANSFER_USE_LOGGER_SYSTEM
    #if KCENON_WITH_LOGGER_SYSTEM && KCENON_WITH_COMMON_SYSTEM
        #define DX_TRANSFER_USE_LOGGER_SYSTEM 1
    #else
        #define DX_TRANSFER_USE_LOGGER_SYSTEM 0
    #endif
#endif

namespace dx::transfer {

/**
 * @brief Backends compiled into this build, for logs and diagnostics
 */
struct build_features {
    static constexpr bool common_system = KCENON_WITH_COMMON_SYSTEM != 0;
    static constexpr bool thread_system = DX_TRANSFER_USE_THREAD_SYSTEM != 0;
    static constexpr bool logger_system = DX_TRANSFER_USE_LOGGER_SYSTEM != 0;

    [[nodiscard]] static constexpr auto executor() noexcept -> const char* {
        return thread_system ? "thread_system" : "std::thread";
    }

    [[nodiscard]] static constexpr auto log_sink() noexcept -> const char* {
        return logger_system ? "logger_system" : "stderr";
    }
};

}  // namespace dx::transfer

//==============================================================================
// Feature summary (for debugging)
//==============================================================================

#ifdef DX_TRANSFER_PRINT_FEATURE_SUMMARY
    #if DX_TRANSFER_USE_THREAD_SYSTEM
        #pragma message("dx_transfer: chunk workers on thread_system")
    #else
        #pragma message("dx_transfer: chunk workers on std::thread")
    #endif
    #if DX_TRANSFER_USE_LOGGER_SYSTEM
        #pragma message("dx_transfer: logs to logger_system")
    #else
        #pragma message("dx_transfer: logs to stderr")
    #endif
#endif
