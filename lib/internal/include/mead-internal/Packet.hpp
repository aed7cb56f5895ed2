// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Packet.hpp
 * @brief Value types exchanged between the container and codec layers
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mead::lib
{
    /**
     * One compressed access unit. Fully owns its payload and is moved, not
     * shared, from stage to stage.
     *
     * Timestamps are in the time base of the stream that produced the packet
     * (the MP4 track timescale, the IVF header rate, the encoder frame index).
     */
    struct Packet
    {
        std::uint32_t streamIndex = 0;
        std::vector<std::uint8_t> data;
        std::optional<std::int64_t> pts;
        std::optional<std::int64_t> dts;
        bool isKeyframe = false;
    };

    /**
     * Container level information. Computed once when the demuxer opens its
     * source and never changed afterwards.
     */
    struct Metadata
    {
        /// Absent when the container cannot tell (IVF, Y4M, MP4 with a zero timescale)
        std::optional<std::uint64_t> durationMs;
        std::uint32_t streamCount = 0;
        std::string formatName;
    };
}
