// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Mp4Boxes.hpp
 * @brief ISO-BMFF box parsing on in-memory buffers
 *
 * Everything below `moov` is parsed from a byte buffer through ByteReader,
 * which checks every access against the end of the current box. Reading past
 * the end of a box is a container parse failure, never an out of bounds read.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <vector>
#include "mead-internal/Mp4Demuxer.hpp"

namespace mead::lib::mp4
{
    constexpr std::uint32_t makeFourcc(char const (&s)[5]) noexcept
    {
        return (static_cast<std::uint32_t>(static_cast<std::uint8_t>(s[0])) << 24) |
               (static_cast<std::uint32_t>(static_cast<std::uint8_t>(s[1])) << 16) |
               (static_cast<std::uint32_t>(static_cast<std::uint8_t>(s[2])) << 8) |
               static_cast<std::uint32_t>(static_cast<std::uint8_t>(s[3]));
    }

    /**
     * Big-endian cursor over a bounded byte range.
     */
    class ByteReader
    {
    public:
        explicit ByteReader(std::span<std::uint8_t const> data) noexcept;

        [[nodiscard]]
        std::uint8_t u8();
        [[nodiscard]]
        std::uint16_t u16();
        [[nodiscard]]
        std::uint32_t u24();
        [[nodiscard]]
        std::uint32_t u32();
        [[nodiscard]]
        std::uint64_t u64();
        [[nodiscard]]
        std::uint32_t fourcc();

        void skip(std::size_t count);

        /** Take the next `count` bytes as a nested reader. */
        [[nodiscard]]
        ByteReader sub(std::size_t count);

        [[nodiscard]]
        std::span<std::uint8_t const> bytes(std::size_t count);

        [[nodiscard]]
        std::size_t remaining() const noexcept;
        [[nodiscard]]
        std::size_t position() const noexcept;

    private:
        void require(std::size_t count) const;

        std::span<std::uint8_t const> _data;
        std::size_t _pos;
    };

    /**
     * Call `visit(type, payload)` for each box in `reader` until it is empty.
     * Handles 64 bit sizes and size 0 (box extends to the end of the parent).
     */
    void forEachBox(ByteReader& reader, std::function<void(std::uint32_t, ByteReader&)> const& visit);

    struct MovieHeader
    {
        std::uint32_t timescale = 0;
        std::uint64_t duration = 0;
    };

    struct ParsedTrack
    {
        Track info;
        Mp4SampleTable samples;
    };

    struct ParsedMovie
    {
        MovieHeader header;
        std::vector<ParsedTrack> tracks; ///< Sorted by track id
    };

    /**
     * Parse the payload of a `moov` box.
     *
     * @param sourceLength Total size of the file; every sample must lie inside it.
     */
    [[nodiscard]]
    ParsedMovie parseMovie(std::span<std::uint8_t const> moovPayload, std::uint64_t sourceLength);
}
