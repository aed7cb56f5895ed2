// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

#include "mead-internal/TileLayout.hpp"
#include <algorithm>
#include <array>
#include <bit>
#include <limits>
#include <thread>

namespace mead::lib
{
    namespace
    {
        constexpr auto MinTileSize = std::uint32_t{256};
        constexpr auto Candidates = std::array<std::uint32_t, 4>{1, 2, 4, 8};

        constexpr std::uint32_t maxTilesAlong(std::uint32_t pixels) noexcept
        {
            return std::max<std::uint32_t>(std::bit_floor(pixels / MinTileSize), 1U);
        }
    }

    std::uint32_t resolveThreadCount(std::uint32_t threads) noexcept
    {
        if (threads != 0)
        {
            return threads;
        }
        return std::max(std::thread::hardware_concurrency(), 1U);
    }

    TileLayout calculateTiles(std::uint32_t width, std::uint32_t height, std::uint32_t threads)
    {
        auto const maxCols = maxTilesAlong(width);
        auto const maxRows = maxTilesAlong(height);
        auto const resolved = static_cast<std::uint64_t>(resolveThreadCount(threads));
        auto const target = std::max<std::uint64_t>(resolved * 2, 4);

        auto best = TileLayout{};
        auto bestDiff = std::numeric_limits<std::uint64_t>::max();
        for (auto const cols : Candidates)
        {
            for (auto const rows : Candidates)
            {
                if ((cols > maxCols) || (rows > maxRows))
                {
                    continue;
                }

                auto const total = static_cast<std::uint64_t>(cols) * rows;
                auto const diff = (total > target) ? (total - target) : (target - total);
                if (diff < bestDiff)
                {
                    bestDiff = diff;
                    best = {cols, rows};
                }
            }
        }
        return best;
    }
}
