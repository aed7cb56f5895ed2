// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file AudioDecoder.hpp
 * @brief Compressed audio packets to interleaved 32 bit float PCM
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>
#include <mead/platform.h>

namespace mead::lib
{
    enum class AudioCodec
    {
        Opus,
        Aac,
    };

    MEAD_EXPORT
    char const* toString(AudioCodec codec) noexcept;

    /**
     * Map an MP4 sample entry fourcc ("Opus", "mp4a") to a codec.
     */
    [[nodiscard]]
    MEAD_EXPORT
    std::optional<AudioCodec> audioCodecFromFourcc(std::string_view fourcc) noexcept;

    class MEAD_EXPORT AudioDecoder
    {
    public:
        virtual ~AudioDecoder();

        /**
         * Decode one packet.
         *
         * @return Interleaved samples (channelCount() values per sample instant),
         *         or std::nullopt if the packet produced no audio.
         * @throws Exception (MEAD_ERR_CODEC) if the packet is rejected by the codec.
         */
        [[nodiscard]]
        virtual std::optional<std::vector<float>> decode(std::span<std::uint8_t const> packet) = 0;

        [[nodiscard]]
        virtual std::uint32_t sampleRate() const noexcept = 0;
        [[nodiscard]]
        virtual std::uint16_t channelCount() const noexcept = 0;
    };

    /**
     * @throws Exception (MEAD_ERR_UNSUPPORTED_FORMAT) for AAC, or for Opus in a
     *         build without libopus. (MEAD_ERR_INVALID_ARG) for a sample rate or
     *         channel count the codec does not support.
     */
    [[nodiscard]]
    MEAD_EXPORT
    std::unique_ptr<AudioDecoder> createAudioDecoder(AudioCodec codec, std::uint32_t sampleRate, std::uint16_t channelCount);
}
