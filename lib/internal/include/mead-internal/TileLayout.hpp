// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file TileLayout.hpp
 * @brief AV1 tile grid sizing for multi-threaded encoding
 *
 * AV1 encoders parallelise across tiles. Too few tiles leave cores idle, too
 * many hurt compression. calculateTiles() picks a power-of-two grid:
 *
 *   1. maxCols = largest power of two <= floor(width / 256), at least 1
 *      maxRows = largest power of two <= floor(height / 256), at least 1
 *      (no tile narrower or shorter than 256 pixels)
 *   2. target  = max(2 * threads, 4)
 *   3. scan cols in {1, 2, 4, 8} (outer) and rows in {1, 2, 4, 8} (inner),
 *      skip pairs above the maxima, keep the first pair whose product is
 *      closest to target
 *
 * Examples: 1920x1080 with 8 threads gives 4x4, 64x64 gives 1x1.
 */

#pragma once

#include <cstdint>
#include <mead/platform.h>

namespace mead::lib
{
    struct TileLayout
    {
        std::uint32_t cols = 1;
        std::uint32_t rows = 1;

        constexpr bool operator==(TileLayout const&) const noexcept = default;
    };

    /**
     * @param threads Worker threads, 0 = number of available cores.
     */
    [[nodiscard]]
    MEAD_EXPORT
    TileLayout calculateTiles(std::uint32_t width, std::uint32_t height, std::uint32_t threads);

    /**
     * @return `threads`, or the number of available cores when it is 0 (at least 1).
     */
    [[nodiscard]]
    MEAD_EXPORT
    std::uint32_t resolveThreadCount(std::uint32_t threads) noexcept;
}
