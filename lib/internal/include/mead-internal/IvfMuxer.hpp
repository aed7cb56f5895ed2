// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file IvfMuxer.hpp
 * @brief Writer for the IVF frame container (AV1/VP8/VP9 elementary streams)
 *
 * Wire format, all integers little-endian:
 *
 *   File header (32 bytes)
 *     0   "DKIF"
 *     4   u16 version (0)
 *     6   u16 header size (32)
 *     8   fourcc ("AV01")
 *     12  u16 width
 *     14  u16 height
 *     16  u32 frame rate denominator
 *     20  u32 frame rate numerator
 *     24  u32 frame count (0, advisory, never rewritten)
 *     28  u32 reserved (0)
 *
 *   Per frame: u32 payload size, u64 timestamp, payload bytes
 *
 * The field at offset 16 holds the denominator and the one at 20 the numerator.
 * Other IVF writers label offset 16 "rate" and 20 "scale"; the order here is
 * kept for compatibility with files mead already produced and is read back in
 * the same order by IvfDemuxer.
 */

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <mead/platform.h>
#include <mead/rational.h>
#include "mead-internal/Muxer.hpp"

namespace mead::lib
{
    class MEAD_EXPORT IvfMuxer final : public Muxer
    {
    public:
        static constexpr std::size_t FileHeaderSize = 32;
        static constexpr std::size_t FrameHeaderSize = 12;

        /**
         * Writes the file header immediately.
         *
         * @param sink Output stream, must outlive the muxer (not owned).
         * @param frameRate Both terms must be positive and fit in 32 bits.
         * @param fourcc Exactly four characters.
         * @throws Exception (MEAD_ERR_INVALID_ARG) on bad parameters,
         *         (MEAD_ERR_IO) if the header cannot be written.
         */
        IvfMuxer(std::ostream& sink, std::uint16_t width, std::uint16_t height, meadRational frameRate, std::string const& fourcc = "AV01");

        /**
         * Append one frame. Only stream index 0 is accepted. The frame
         * timestamp is the packet pts, or the running frame counter when the
         * packet has none.
         */
        void writePacket(Packet packet) override;

        void finalize() && override;

        [[nodiscard]]
        std::uint32_t frameCount() const noexcept;
        [[nodiscard]]
        std::uint16_t width() const noexcept;
        [[nodiscard]]
        std::uint16_t height() const noexcept;

    private:
        void write(std::uint8_t const* data, std::size_t size);

        std::ostream* _sink;
        std::uint16_t _width;
        std::uint16_t _height;
        std::uint32_t _frameCount;
    };
}
