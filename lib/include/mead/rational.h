// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file rational.h
 * @brief Exact rational type used for frame rates and time bases.
 *
 * Frame rates are carried as numerator / denominator pairs so that NTSC style
 * rates survive every container round trip without rounding:
 *   - 25 fps          -> { numerator = 25,    denominator = 1    }
 *   - 29.97 fps NTSC  -> { numerator = 30000, denominator = 1001 }
 */

#pragma once

#ifdef __cplusplus
#   include <cstdint>
#else
#   include <stdint.h>
#endif

#ifdef __cplusplus
extern "C"
{
#endif

    /**
     * An exact rational number expressed as numerator / denominator.
     * A zero denominator marks an undefined value.
     */
    typedef struct meadRational_t
    {
        int64_t numerator;   /**< The top part of the fraction   (e.g., 30000 for 29.97 fps). */
        int64_t denominator; /**< The bottom part of the fraction (e.g., 1001 for 29.97 fps).  */
    } meadRational;

#ifdef __cplusplus
}
#endif
