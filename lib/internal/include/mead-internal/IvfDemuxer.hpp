// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file IvfDemuxer.hpp
 * @brief Reader for the IVF frame container
 *
 * Reads what IvfMuxer writes (see IvfMuxer.hpp for the layout). Header sizes
 * above 32 are accepted and the extra bytes skipped. IVF has no keyframe flag
 * and no duration, so packets are never marked as keyframes and the metadata
 * duration is absent.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <mead/platform.h>
#include "mead-internal/Demuxer.hpp"
#include "mead-internal/MediaSource.hpp"

namespace mead::lib
{
    struct IvfHeader
    {
        std::uint16_t version = 0;
        std::uint16_t headerSize = 0;
        std::string fourcc;
        std::uint16_t width = 0;
        std::uint16_t height = 0;
        std::uint32_t rateField16 = 0; ///< Offset 16: frame rate denominator as written by IvfMuxer
        std::uint32_t rateField20 = 0; ///< Offset 20: frame rate numerator as written by IvfMuxer
        std::uint32_t frameCount = 0;  ///< Advisory, usually 0
    };

    class MEAD_EXPORT IvfDemuxer final : public Demuxer
    {
    public:
        /**
         * Reads and validates the file header.
         * @throws Exception (MEAD_ERR_CONTAINER_PARSE) on a bad magic, a header
         *         size below 32 or a truncated header.
         */
        explicit IvfDemuxer(std::unique_ptr<MediaSource> source);

        /** Stream 0 packets, pts = frame timestamp, dts absent. */
        std::optional<Packet> readPacket() override;
        Metadata const& metadata() const noexcept override;

        [[nodiscard]]
        IvfHeader const& header() const noexcept;

    private:
        std::unique_ptr<MediaSource> _source;
        IvfHeader _header;
        Metadata _metadata;
        std::uint64_t _framesRead;
    };
}
