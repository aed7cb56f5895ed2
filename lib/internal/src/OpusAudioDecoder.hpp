// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <opus.h>
#include "mead-internal/AudioDecoder.hpp"

namespace mead::lib
{
    /**
     * libopus decoder state owned for the lifetime of the object.
     */
    class OpusAudioDecoder final : public AudioDecoder
    {
    public:
        /** Largest frame Opus produces: 120 ms at 48 kHz. */
        static constexpr auto MaxFrameSamples = 5760;

        /**
         * @throws Exception (MEAD_ERR_INVALID_ARG) unless the rate is one of
         *         8000, 12000, 16000, 24000 or 48000 Hz and there are 1 or 2 channels.
         *         (MEAD_ERR_CODEC) if libopus fails to create the decoder.
         */
        OpusAudioDecoder(std::uint32_t sampleRate, std::uint16_t channelCount);
        ~OpusAudioDecoder() override;

        OpusAudioDecoder(OpusAudioDecoder const&) = delete;
        OpusAudioDecoder& operator=(OpusAudioDecoder const&) = delete;

        std::optional<std::vector<float>> decode(std::span<std::uint8_t const> packet) override;
        std::uint32_t sampleRate() const noexcept override;
        std::uint16_t channelCount() const noexcept override;

    private:
        ::OpusDecoder* _decoder;
        std::uint32_t _sampleRate;
        std::uint16_t _channelCount;
    };
}
