// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Mp4Demuxer.cpp
 * @brief Top level box scan, track views and the sample cursor
 */

#include "mead-internal/Mp4Demuxer.hpp"
#include <array>
#include <span>
#include "mead-internal/Exception.hpp"
#include "mead-internal/Logging.hpp"
#include "ByteOrder.hpp"
#include "Mp4Boxes.hpp"

namespace mead::lib
{
    namespace
    {
        constexpr auto BoxFtyp = mp4::makeFourcc("ftyp");
        constexpr auto BoxMoov = mp4::makeFourcc("moov");

        // Upper bound for the metadata we are willing to hold in memory
        constexpr auto MaxMoovSize = std::uint64_t{256} * 1024 * 1024;

        std::optional<std::uint64_t> toMilliseconds(std::uint64_t duration, std::uint32_t timescale) noexcept
        {
            if (timescale == 0)
            {
                return std::nullopt;
            }
            return (duration / timescale) * 1000 + ((duration % timescale) * 1000) / timescale;
        }
    }

    char const* toString(TrackType type) noexcept
    {
        switch (type)
        {
            case TrackType::Video: return "video";
            case TrackType::Audio: return "audio";
            case TrackType::Other: return "other";
        }
        return "unknown";
    }

    Mp4Demuxer::Mp4Demuxer(std::unique_ptr<MediaSource> source)
        : _source{std::move(source)}
        , _metadata{std::nullopt, 0, "MP4"}
        , _tracks{}
        , _samples{}
        , _selected{}
        , _nextSample{0}
    {
        if (!_source)
        {
            throw Exception::invalidArgument("MP4 demuxer needs a source");
        }

        auto const length = _source->length();
        if (!length.has_value())
        {
            throw Exception::invalidArgument("Cannot determine source length, required for MP4 parsing");
        }
        if (!_source->isSeekable())
        {
            throw Exception::invalidArgument("MP4 parsing requires a seekable source");
        }

        MEAD_INFO("Opening MP4 source ({} bytes)", *length);

        auto hasFtyp = false;
        auto moov = std::optional<std::vector<std::uint8_t>>{};
        auto offset = std::uint64_t{0};
        while (offset < *length)
        {
            if ((*length - offset) < 8)
            {
                throw Exception::containerParse("{} trailing bytes at offset {} do not form a box header", *length - offset, offset);
            }

            auto head = std::array<std::uint8_t, 16>{};
            _source->seek(offset);
            if (!_source->readRecord(std::span{head}.first(8)))
            {
                throw Exception::containerParse("Unexpected end of file at offset {}", offset);
            }

            auto size = static_cast<std::uint64_t>(loadBE<std::uint32_t>(&head[0]));
            auto const type = loadBE<std::uint32_t>(&head[4]);
            auto headerSize = std::uint64_t{8};
            if (size == 1)
            {
                if (!_source->readRecord(std::span{head}.subspan(8, 8)))
                {
                    throw Exception::containerParse("Unexpected end of file in box header at offset {}", offset);
                }
                size = loadBE<std::uint64_t>(&head[8]);
                headerSize = 16;
            }
            else if (size == 0)
            {
                size = *length - offset;
            }

            if ((size < headerSize) || (size > *length - offset))
            {
                throw Exception::containerParse(
                    "Box '{}' at offset {} has size {}, {} bytes left in the file", fourccToString(type), offset, size, *length - offset);
            }

            MEAD_TRACE("Top level box '{}' at {} ({} bytes)", fourccToString(type), offset, size);

            if (type == BoxFtyp)
            {
                hasFtyp = true;
            }
            else if (type == BoxMoov)
            {
                if (moov.has_value())
                {
                    throw Exception::containerParse("More than one 'moov' box");
                }

                auto const payloadSize = size - headerSize;
                if (payloadSize > MaxMoovSize)
                {
                    throw Exception::containerParse("'moov' box of {} bytes exceeds the {} byte limit", payloadSize, MaxMoovSize);
                }

                auto payload = std::vector<std::uint8_t>(static_cast<std::size_t>(payloadSize));
                if (!payload.empty() && !_source->readRecord(payload))
                {
                    throw Exception::containerParse("'moov' box truncated");
                }
                moov = std::move(payload);
            }

            offset += size;
        }

        if (!hasFtyp)
        {
            throw Exception::containerParse("No 'ftyp' box, not an MP4 file");
        }
        if (!moov.has_value())
        {
            throw Exception::containerParse("No 'moov' box");
        }

        auto movie = mp4::parseMovie(*moov, *length);
        _metadata.durationMs = toMilliseconds(movie.header.duration, movie.header.timescale);
        _metadata.streamCount = static_cast<std::uint32_t>(movie.tracks.size());

        _tracks.reserve(movie.tracks.size());
        _samples.reserve(movie.tracks.size());
        for (auto& parsed : movie.tracks)
        {
            _tracks.push_back(std::move(parsed.info));
            _samples.push_back(std::move(parsed.samples));
        }

        MEAD_INFO("MP4 opened: {} tracks, duration: {} ms",
            _metadata.streamCount,
            _metadata.durationMs.has_value() ? std::to_string(*_metadata.durationMs) : std::string{"unknown"});
    }

    Mp4Demuxer::~Mp4Demuxer() = default;

    std::optional<Packet> Mp4Demuxer::readPacket()
    {
        if (!_selected.has_value())
        {
            if (_tracks.empty())
            {
                return std::nullopt;
            }
            _selected = 0;
            _nextSample = 0;
            MEAD_DEBUG("Auto-selected track {}", _tracks.front().id);
        }

        auto const& track = _tracks[*_selected];
        auto const& samples = _samples[*_selected];
        if (_nextSample >= samples.count())
        {
            MEAD_DEBUG("End of track {} after {} samples", track.id, samples.count());
            _selected.reset();
            _nextSample = 0;
            return std::nullopt;
        }

        auto const sample = samples.at(_nextSample);
        auto packet = Packet{};
        packet.streamIndex = track.id;
        packet.data.resize(sample.size);
        packet.pts = static_cast<std::int64_t>(sample.startTime);
        packet.isKeyframe = sample.isSync;

        if (sample.size > 0)
        {
            _source->seek(sample.offset);
            if (!_source->readRecord(packet.data))
            {
                throw Exception::containerParse("Sample {} of track {} is missing from the file", _nextSample + 1, track.id);
            }
        }

        ++_nextSample;
        MEAD_TRACE("Track {} sample {}: {} bytes, pts {}", track.id, _nextSample, sample.size, sample.startTime);
        return packet;
    }

    Metadata const& Mp4Demuxer::metadata() const noexcept
    {
        return _metadata;
    }

    std::vector<Track> const& Mp4Demuxer::tracks() const noexcept
    {
        return _tracks;
    }

    std::size_t Mp4Demuxer::indexOf(std::uint32_t id) const
    {
        for (auto i = std::size_t{0}; i < _tracks.size(); ++i)
        {
            if (_tracks[i].id == id)
            {
                return i;
            }
        }
        throw Exception::invalidArgument("Track {} not found", id);
    }

    Track const& Mp4Demuxer::track(std::uint32_t id) const
    {
        return _tracks[indexOf(id)];
    }

    std::vector<Track const*> Mp4Demuxer::videoTracks() const
    {
        auto result = std::vector<Track const*>{};
        for (auto const& t : _tracks)
        {
            if (t.type == TrackType::Video)
            {
                result.push_back(&t);
            }
        }
        return result;
    }

    std::vector<Track const*> Mp4Demuxer::audioTracks() const
    {
        auto result = std::vector<Track const*>{};
        for (auto const& t : _tracks)
        {
            if (t.type == TrackType::Audio)
            {
                result.push_back(&t);
            }
        }
        return result;
    }

    Mp4Sample Mp4Demuxer::sample(std::uint32_t id, std::uint32_t index) const
    {
        return _samples[indexOf(id)].at(index);
    }

    void Mp4Demuxer::selectTrack(std::uint32_t id)
    {
        _selected = indexOf(id);
        _nextSample = 0;
        MEAD_DEBUG("Selected track {}", id);
    }

    void Mp4Demuxer::selectVideoTrack()
    {
        auto const candidates = videoTracks();
        if (candidates.empty())
        {
            throw Exception::invalidArgument("No video tracks found");
        }
        selectTrack(candidates.front()->id);
    }

    void Mp4Demuxer::selectAudioTrack()
    {
        auto const candidates = audioTracks();
        if (candidates.empty())
        {
            throw Exception::invalidArgument("No audio tracks found");
        }
        selectTrack(candidates.front()->id);
    }

    std::optional<std::uint32_t> Mp4Demuxer::selectedTrack() const noexcept
    {
        if (!_selected.has_value())
        {
            return std::nullopt;
        }
        return _tracks[*_selected].id;
    }
}
