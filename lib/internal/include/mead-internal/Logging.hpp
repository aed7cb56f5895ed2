// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Logging.hpp
 * @brief Exception-safe logging macros for mead diagnostics
 *
 * Thin wrapper around spdlog used by every container and codec module.
 * - All macros wrap log calls in try/catch so that a failing sink never turns
 *   into a demux or encode failure
 * - In debug builds (NDEBUG not defined), TRACE and DEBUG logs are compiled in
 * - In release builds, TRACE and DEBUG calls compile to nothing
 * - Runtime log level is controlled by the MEAD_LOG_LEVEL environment variable,
 *   applied once by initLogging()
 */

#pragma once

// In debug mode we keep all log statements.
// In release mode we only consider info and up.
// See : https://github.com/gabime/spdlog/wiki/0.-FAQ#how-to-remove-all-debug-statements-at-compile-time-
//
// Actual logging levels can be configured through the MEAD_LOG_LEVEL environment variable
//
//
// Set the compile-time active log level based on build type
// This controls which log statements are actually compiled into the binary
#ifndef SPDLOG_ACTIVE_LEVEL
#   ifndef NDEBUG
       // Debug builds: include all log levels down to TRACE for maximum diagnostics
#      define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#   else
       // Release builds: only include INFO and above (TRACE/DEBUG compile to nothing)
#      define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#   endif
#endif

#include <string>
#include <spdlog/spdlog.h>
#include <mead/platform.h>

namespace mead::lib
{
    /**
     * Apply the MEAD_LOG_LEVEL environment variable to the default spdlog logger.
     * Accepted values are the spdlog level names (trace, debug, info, warn, error,
     * critical, off). Safe to call from several threads; only the first call acts.
     */
    MEAD_EXPORT
    void initLogging();

    /**
     * Force a runtime log level, overriding MEAD_LOG_LEVEL.
     * @param level spdlog level name; unknown names fall back to "info".
     */
    MEAD_EXPORT
    void setLogLevel(std::string const& level);
}

/**
 * MEAD_TRACE: Most verbose logging for detailed execution traces
 * Used for per-box and per-sample parsing traces.
 * Only compiled in debug builds. Wrapped in try/catch to ensure logging never crashes.
 */
#define MEAD_TRACE(...)                 \
    do                                  \
    {                                   \
        try                             \
        {                               \
            SPDLOG_TRACE(__VA_ARGS__);  \
        }                               \
        catch (...)                     \
        {}                              \
    }                                   \
    while (false)
/**
 * MEAD_DEBUG: Debug-level logging for development diagnostics
 * Used for periodic progress (every Nth frame) and configuration details.
 * Only compiled in debug builds. Exception-safe.
 */
#define MEAD_DEBUG(...)                 \
    do                                  \
    {                                   \
        try                             \
        {                               \
            SPDLOG_DEBUG(__VA_ARGS__);  \
        }                               \
        catch (...)                     \
        {}                              \
    }                                   \
    while (false)

/**
 * MEAD_INFO: Informational logging for normal operations
 * Used for container open/finalize and encoder creation.
 * Compiled in all builds. Exception-safe.
 */
#define MEAD_INFO(...)                 \
    do                                 \
    {                                  \
        try                            \
        {                              \
            SPDLOG_INFO(__VA_ARGS__);  \
        }                              \
        catch (...)                    \
        {}                             \
    }                                  \
    while (false)

/**
 * MEAD_WARN: Warning-level logging for potential issues
 * Used for recoverable oddities: skipped boxes, cropped odd-sized chroma, ignored header fields.
 * Compiled in all builds. Exception-safe.
 */
#define MEAD_WARN(...)                 \
    do                                 \
    {                                  \
        try                            \
        {                              \
            SPDLOG_WARN(__VA_ARGS__);  \
        }                              \
        catch (...)                    \
        {}                             \
    }                                  \
    while (false)

/**
 * MEAD_ERROR: Error-level logging for operation failures
 * Used for foreign codec failures and I/O errors before they are rethrown.
 * Compiled in all builds. Exception-safe.
 */
#define MEAD_ERROR(...)                 \
    do                                  \
    {                                   \
        try                             \
        {                               \
            SPDLOG_ERROR(__VA_ARGS__);  \
        }                               \
        catch (...)                     \
        {}                              \
    }                                   \
    while (false)

/**
 * MEAD_CRITICAL: Critical-level logging for unrecoverable failures
 * Used for failures that leave an encoder handle in an unknown state.
 * Compiled in all builds. Exception-safe.
 */
#define MEAD_CRITICAL(...)                 \
    do                                     \
    {                                      \
        try                                \
        {                                  \
            SPDLOG_CRITICAL(__VA_ARGS__);  \
        }                                  \
        catch (...)                        \
        {}                                 \
    }                                      \
    while (false)
