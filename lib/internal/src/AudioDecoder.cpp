// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

#include "mead-internal/AudioDecoder.hpp"
#include "mead-internal/Exception.hpp"

#ifdef MEAD_HAVE_OPUS
#   include "OpusAudioDecoder.hpp"
#endif

namespace mead::lib
{
    char const* toString(AudioCodec codec) noexcept
    {
        switch (codec)
        {
            case AudioCodec::Opus: return "Opus";
            case AudioCodec::Aac:  return "AAC";
        }
        return "unknown";
    }

    std::optional<AudioCodec> audioCodecFromFourcc(std::string_view fourcc) noexcept
    {
        if (fourcc == "Opus")
        {
            return AudioCodec::Opus;
        }
        if (fourcc == "mp4a")
        {
            return AudioCodec::Aac;
        }
        return std::nullopt;
    }

    AudioDecoder::~AudioDecoder() = default;

    std::unique_ptr<AudioDecoder> createAudioDecoder(AudioCodec codec, std::uint32_t sampleRate, std::uint16_t channelCount)
    {
        switch (codec)
        {
            case AudioCodec::Opus:
#ifdef MEAD_HAVE_OPUS
                return std::make_unique<OpusAudioDecoder>(sampleRate, channelCount);
#else
                static_cast<void>(sampleRate);
                static_cast<void>(channelCount);
                throw Exception::unsupportedFormat("Opus decoding is not available in this build.");
#endif
            case AudioCodec::Aac:
                throw Exception::unsupportedFormat("AAC decoding is not supported.");
        }
        throw Exception::invalidArgument("Unknown audio codec.");
    }
}
