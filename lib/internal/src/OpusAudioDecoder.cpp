// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

#include "OpusAudioDecoder.hpp"
#include <algorithm>
#include <array>
#include <climits>
#include "mead-internal/Exception.hpp"
#include "mead-internal/Logging.hpp"

namespace mead::lib
{
    namespace
    {
        constexpr auto SupportedRates = std::array<std::uint32_t, 5>{8000, 12000, 16000, 24000, 48000};
    }

    OpusAudioDecoder::OpusAudioDecoder(std::uint32_t sampleRate, std::uint16_t channelCount)
        : _decoder{nullptr}
        , _sampleRate{sampleRate}
        , _channelCount{channelCount}
    {
        if (std::find(SupportedRates.begin(), SupportedRates.end(), sampleRate) == SupportedRates.end())
        {
            throw Exception::invalidArgument("Opus does not support a sample rate of {} Hz.", sampleRate);
        }
        if ((channelCount != 1) && (channelCount != 2))
        {
            throw Exception::invalidArgument("Opus decoding supports 1 or 2 channels, got {}.", channelCount);
        }

        auto error = int{OPUS_OK};
        _decoder = ::opus_decoder_create(static_cast<opus_int32>(sampleRate), channelCount, &error);
        if ((error != OPUS_OK) || (_decoder == nullptr))
        {
            throw Exception::codec("Failed to create Opus decoder: {}", ::opus_strerror(error));
        }

        MEAD_DEBUG("Created Opus decoder: {} Hz, {} channel(s)", sampleRate, channelCount);
    }

    OpusAudioDecoder::~OpusAudioDecoder()
    {
        ::opus_decoder_destroy(_decoder);
    }

    std::optional<std::vector<float>> OpusAudioDecoder::decode(std::span<std::uint8_t const> packet)
    {
        if (packet.size() > static_cast<std::size_t>(INT_MAX))
        {
            throw Exception::invalidArgument("Opus packet of {} bytes is too large.", packet.size());
        }

        auto pcm = std::vector<float>(static_cast<std::size_t>(MaxFrameSamples) * _channelCount);
        auto const decoded = ::opus_decode_float(
            _decoder, packet.data(), static_cast<opus_int32>(packet.size()), pcm.data(), MaxFrameSamples, 0);
        if (decoded < 0)
        {
            throw Exception::codec("Opus decoding failed: {}", ::opus_strerror(decoded));
        }
        if (decoded == 0)
        {
            return std::nullopt;
        }

        pcm.resize(static_cast<std::size_t>(decoded) * _channelCount);
        return pcm;
    }

    std::uint32_t OpusAudioDecoder::sampleRate() const noexcept
    {
        return _sampleRate;
    }

    std::uint16_t OpusAudioDecoder::channelCount() const noexcept
    {
        return _channelCount;
    }
}
