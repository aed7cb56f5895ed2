// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file mead.h
 * @brief Core mead entry point -- status codes and versioning.
 *
 * This header defines:
 *
 *   1. **meadStatus**      -- The status codes carried by every mead failure and
 *                             returned by the polling calls of the codec layer.
 *   2. **meadVersionType** -- Semantic version of the library at runtime.
 *
 * The C++ layer reports failures by throwing mead::lib::Exception, which carries
 * one of the status codes below. Two codes are not failures: MEAD_ERR_NOT_READY
 * ("poll again") and MEAD_ERR_END_OF_STREAM ("no more output"). They are returned
 * by value from Encoder::receivePacket().
 */

#pragma once

#ifdef __cplusplus
#   include <cstdint>
#else
#   include <stdint.h>
#endif

#include <mead/platform.h>

#ifdef __cplusplus
extern "C"
{
#endif

    /* ======================================================================
     * Status codes
     * ==================================================================== */

    /**
     * Universal status enum for mead.
     */
    typedef enum meadStatus
    {
        MEAD_STATUS_OK,               /**< Success -- the operation completed normally.                                  */
        MEAD_ERR_UNKNOWN,             /**< An unexpected internal error occurred.                                        */
        MEAD_ERR_IO,                  /**< The underlying byte source or sink failed.                                    */
        MEAD_ERR_CONTAINER_PARSE,     /**< The container structure is malformed or truncated.                            */
        MEAD_ERR_CODEC,               /**< The encoder or decoder failed internally (foreign codes are translated).      */
        MEAD_ERR_UNSUPPORTED_FORMAT,  /**< The input is recognised but this build does not implement it.                */
        MEAD_ERR_INVALID_ARG,         /**< The caller violated a documented precondition.                                */
        MEAD_ERR_INVALID_STATE,       /**< The object is being driven concurrently from more than one caller.            */
        MEAD_ERR_NOT_READY,           /**< Transient: the encoder is still buffering, poll again.                        */
        MEAD_ERR_END_OF_STREAM,       /**< Terminal: the encoder has been fully drained.                                 */
    } meadStatus;

    /**
     * Return a stable, human-readable name for a status code.
     * The returned string is a literal owned by the library.
     */
    MEAD_EXPORT
    char const* meadStatusToString(meadStatus status);

    /* ======================================================================
     * Library version
     * ==================================================================== */

    /**
     * Semantic-versioning information for mead.
     *
     * Retrieved at runtime via meadGetVersion(). The `full` string is owned by
     * the library and must NOT be freed by the caller.
     */
    typedef struct meadVersionType
    {
        uint16_t    major;  /**< Major version -- incremented on breaking API changes.            */
        uint16_t    minor;  /**< Minor version -- incremented on backwards-compatible additions.  */
        uint16_t    bugfix; /**< Patch version -- incremented on backwards-compatible bug fixes.  */
        uint16_t    build;  /**< Build counter -- CI build number or 0 for local builds.         */
        char const* full;   /**< Human-readable version string, e.g. "0.3.0+0".                    */
    } meadVersionType;

    /**
     * Retrieve the version of the mead library that is currently linked.
     *
     * @param[out] out_version  Filled with the version information. Must not be NULL.
     * @return MEAD_STATUS_OK on success,
     *         MEAD_ERR_INVALID_ARG if \p out_version is NULL.
     */
    MEAD_EXPORT
    meadStatus meadGetVersion(meadVersionType* out_version);

#ifdef __cplusplus
}
#endif
