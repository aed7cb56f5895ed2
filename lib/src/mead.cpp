// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file mead.cpp
 * @brief Version query and status code names
 */

#include <mead/mead.h>

#ifndef MEAD_VERSION_MAJOR
#   define MEAD_VERSION_MAJOR 0
#endif
#ifndef MEAD_VERSION_MINOR
#   define MEAD_VERSION_MINOR 0
#endif
#ifndef MEAD_VERSION_PATCH
#   define MEAD_VERSION_PATCH 0
#endif
#ifndef MEAD_VERSION_BUILD
#   define MEAD_VERSION_BUILD 0
#endif
#ifndef MEAD_VERSION_FULL
#   define MEAD_VERSION_FULL "0.0.0+0"
#endif

extern "C"
MEAD_EXPORT
meadStatus meadGetVersion(meadVersionType* out_version)
{
    if (out_version == nullptr)
    {
        return MEAD_ERR_INVALID_ARG;
    }

    out_version->major = MEAD_VERSION_MAJOR;
    out_version->minor = MEAD_VERSION_MINOR;
    out_version->bugfix = MEAD_VERSION_PATCH;
    out_version->build = MEAD_VERSION_BUILD;
    out_version->full = MEAD_VERSION_FULL;
    return MEAD_STATUS_OK;
}

extern "C"
MEAD_EXPORT
char const* meadStatusToString(meadStatus status)
{
    switch (status)
    {
        case MEAD_STATUS_OK:              return "MEAD_STATUS_OK";
        case MEAD_ERR_UNKNOWN:            return "MEAD_ERR_UNKNOWN";
        case MEAD_ERR_IO:                 return "MEAD_ERR_IO";
        case MEAD_ERR_CONTAINER_PARSE:    return "MEAD_ERR_CONTAINER_PARSE";
        case MEAD_ERR_CODEC:              return "MEAD_ERR_CODEC";
        case MEAD_ERR_UNSUPPORTED_FORMAT: return "MEAD_ERR_UNSUPPORTED_FORMAT";
        case MEAD_ERR_INVALID_ARG:        return "MEAD_ERR_INVALID_ARG";
        case MEAD_ERR_INVALID_STATE:      return "MEAD_ERR_INVALID_STATE";
        case MEAD_ERR_NOT_READY:          return "MEAD_ERR_NOT_READY";
        case MEAD_ERR_END_OF_STREAM:      return "MEAD_ERR_END_OF_STREAM";
        default:                          return "MEAD_ERR_UNKNOWN";
    }
}
