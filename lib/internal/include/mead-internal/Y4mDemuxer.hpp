// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Y4mDemuxer.hpp
 * @brief Reader for YUV4MPEG2 raw video streams
 *
 * Stream layout:
 *
 *   YUV4MPEG2 W<width> H<height> F<num>:<den> [I<c>] [A<n>:<d>] [C<tag>] [X<any>]\n
 *   FRAME[ <params>]\n <Y bytes> <U bytes> <V bytes>
 *   FRAME ...
 *
 * Chroma planes are stored with rounded-up dimensions ((w+1)/2 for 4:2:0 and
 * 4:2:2). Frames use floor dimensions, so the last column/row of an odd sized
 * chroma plane is dropped on the way in.
 *
 * The source is read strictly forward, so stdin works.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <mead/platform.h>
#include <mead/rational.h>
#include "mead-internal/Frame.hpp"
#include "mead-internal/MediaSource.hpp"
#include "mead-internal/Packet.hpp"

namespace mead::lib
{
    class MEAD_EXPORT Y4mDemuxer
    {
    public:
        /// Longest accepted header or FRAME line, newline included
        static constexpr std::size_t MaxLineLength = 1024;
        /// Largest accepted W or H
        static constexpr std::uint32_t MaxDimension = 65536;
        /// Largest accepted frame payload (all planes, as stored)
        static constexpr std::uint64_t MaxFrameBytes = std::uint64_t{1} << 30;

        /**
         * Reads and validates the stream header.
         *
         * @throws Exception (MEAD_ERR_CONTAINER_PARSE) for a missing magic, a
         *         missing or zero W/H/F, a malformed number or a frame larger
         *         than MaxDimension / MaxFrameBytes,
         *         (MEAD_ERR_INVALID_ARG) for a colorspace other than 420*, 422, 444.
         */
        explicit Y4mDemuxer(std::unique_ptr<MediaSource> source);

        /**
         * Read the next frame, pts = index of the frame in the stream.
         * @return std::nullopt at a clean end of stream.
         * @throws Exception (MEAD_ERR_CONTAINER_PARSE) for a bad marker or truncated data.
         */
        [[nodiscard]]
        std::optional<Frame> readFrame();

        [[nodiscard]]
        std::uint32_t width() const noexcept;
        [[nodiscard]]
        std::uint32_t height() const noexcept;
        [[nodiscard]]
        meadRational frameRate() const noexcept;
        [[nodiscard]]
        PixelFormat pixelFormat() const noexcept;
        /** The C parameter as written ("420" when absent). */
        [[nodiscard]]
        std::string const& colorspaceTag() const noexcept;
        /** The I parameter, '?' when absent. */
        [[nodiscard]]
        char interlacing() const noexcept;
        /** The A parameter, 0:0 (unknown) when absent. */
        [[nodiscard]]
        meadRational pixelAspect() const noexcept;
        /** Frames returned so far. */
        [[nodiscard]]
        std::uint64_t frameCount() const noexcept;
        [[nodiscard]]
        Metadata const& metadata() const noexcept;

    private:
        std::optional<std::string> readLine();
        void parseHeader(std::string const& line);

        std::unique_ptr<MediaSource> _source;
        std::uint32_t _width;
        std::uint32_t _height;
        meadRational _frameRate;
        meadRational _pixelAspect;
        char _interlacing;
        std::string _colorspace;
        PixelFormat _format;
        std::uint64_t _frameCount;
        Metadata _metadata;
        std::vector<std::uint8_t> _scratch;
    };
}
