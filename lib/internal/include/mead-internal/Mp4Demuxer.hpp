// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Mp4Demuxer.hpp
 * @brief Streaming reader for MP4 / ISO-BMFF files
 *
 * The demuxer walks the top level boxes of the source, reads `moov` into memory
 * and turns every `trak` into a Track description plus a sample table. The
 * sample table keeps the run-length tables of the file (stts, ctts, stsc, stco,
 * stsz, stss) and works out the position, size and time of sample N when it is
 * asked for. Sample payloads stay in the source and are read one at a time with
 * seek + read, so memory use depends on the amount of metadata, not on the
 * number of samples or the file size.
 *
 * Packet delivery follows a cursor over one track at a time:
 *
 *   selectTrack(id)      -> cursor at the first sample of track `id`
 *   readPacket()         -> next sample of the selected track
 *                           (no selection: the lowest track id is selected first)
 *   end of the track     -> std::nullopt, selection cleared
 *
 * The demuxer never moves on to another track by itself; callers that want
 * more than one track reselect explicitly.
 *
 * Packet fields:
 *   streamIndex = track id
 *   pts         = decode start time of the sample in the track's own timescale
 *   dts         = absent
 *   isKeyframe  = the sample is listed in `stss` (or `stss` is absent)
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <mead/platform.h>
#include "mead-internal/Demuxer.hpp"
#include "mead-internal/MediaSource.hpp"

namespace mead::lib
{
    enum class TrackType
    {
        Video,
        Audio,
        Other,
    };

    MEAD_EXPORT
    char const* toString(TrackType type) noexcept;

    struct VideoProfile
    {
        std::string codec; ///< Sample entry fourcc ("avc1", "av01", ...)
        std::uint16_t width = 0;
        std::uint16_t height = 0;
        std::optional<std::uint8_t> avcProfile; ///< From avcC, when present
        std::optional<std::uint8_t> avcLevel;
    };

    struct AudioProfile
    {
        std::string codec; ///< Sample entry fourcc ("mp4a", "Opus", ...)
        std::optional<std::uint8_t> objectType; ///< MPEG-4 audio object type from esds (2 = AAC LC)
        std::uint32_t sampleRate = 0;
        std::uint16_t channelCount = 0;
    };

    struct Track
    {
        std::uint32_t id = 0;
        TrackType type = TrackType::Other;
        std::string handler; ///< hdlr handler type ("vide", "soun", ...)
        std::uint32_t sampleCount = 0;
        std::uint32_t timescale = 0;
        std::uint64_t duration = 0; ///< In timescale units
        std::string language;       ///< ISO-639-2/T code, "und" when unset
        std::optional<VideoProfile> video;
        std::optional<AudioProfile> audio;
    };

    /** One sample of a track, as described by the sample table. */
    struct Mp4Sample
    {
        std::uint64_t offset = 0;
        std::uint32_t size = 0;
        std::uint64_t startTime = 0;
        std::uint32_t duration = 0;
        std::int32_t renderingOffset = 0;
        bool isSync = false;
    };

    /**
     * Compact sample table of one track.
     *
     * Holds the tables in their run-length form and resolves a sample index
     * with a binary search per table. Sequential lookups inside one chunk reuse
     * the previous position, so walking a track in order costs O(1) per sample
     * even with per-sample sizes. That cache makes lookups not thread safe.
     */
    class MEAD_EXPORT Mp4SampleTable
    {
    public:
        struct TimeRun
        {
            std::uint32_t sampleCount;
            std::uint32_t delta;
        };

        struct OffsetRun
        {
            std::uint32_t sampleCount;
            std::int32_t offset;
        };

        struct ChunkRun
        {
            std::uint32_t firstChunk; ///< 1-based
            std::uint32_t samplesPerChunk;
        };

        struct Tables
        {
            std::uint32_t sampleCount = 0;
            std::uint32_t constantSize = 0;      ///< Non-zero: every sample has this size
            std::vector<std::uint32_t> sizes;    ///< One per sample when constantSize is 0
            std::vector<TimeRun> timeToSample;
            std::vector<OffsetRun> compositionOffsets;
            std::vector<ChunkRun> sampleToChunk;
            std::vector<std::uint64_t> chunkOffsets;
            std::optional<std::vector<std::uint32_t>> syncSamples; ///< 1-based, absent = all sync
        };

        /**
         * Check the tables against each other and against the source length.
         *
         * @throws Exception (MEAD_ERR_CONTAINER_PARSE) if the tables do not
         *         cover every sample or a sample lies outside the source.
         */
        Mp4SampleTable(std::uint32_t trackId, Tables tables, std::uint64_t sourceLength);

        [[nodiscard]]
        std::uint32_t count() const noexcept;

        /** @throws Exception (MEAD_ERR_INVALID_ARG) if index >= count(). */
        [[nodiscard]]
        Mp4Sample at(std::uint32_t index) const;

    private:
        struct TimeEntry
        {
            std::uint32_t firstSample;
            std::uint32_t delta;
            std::uint64_t startTime;
        };

        struct OffsetEntry
        {
            std::uint32_t firstSample;
            std::int32_t offset;
        };

        struct ChunkEntry
        {
            std::uint32_t firstSample;
            std::uint32_t firstChunk;
            std::uint32_t samplesPerChunk;
        };

        struct Position
        {
            std::uint32_t sample;
            std::uint64_t offset;
        };

        std::uint32_t sizeOf(std::uint32_t index) const noexcept;

        std::uint32_t _count;
        std::uint32_t _constantSize;
        std::vector<std::uint32_t> _sizes;
        std::vector<TimeEntry> _times;
        std::vector<OffsetEntry> _renderingOffsets;
        std::vector<ChunkEntry> _chunks;
        std::vector<std::uint64_t> _chunkOffsets;
        std::optional<std::vector<std::uint32_t>> _syncSamples;
        mutable std::optional<Position> _lastPosition;
    };

    class MEAD_EXPORT Mp4Demuxer final : public Demuxer
    {
    public:
        /**
         * Parses the box structure and builds all sample tables.
         *
         * @throws Exception (MEAD_ERR_INVALID_ARG) if the source does not know
         *         its length, (MEAD_ERR_CONTAINER_PARSE) on any malformed or
         *         truncated structure, (MEAD_ERR_IO) on read failures.
         */
        explicit Mp4Demuxer(std::unique_ptr<MediaSource> source);
        ~Mp4Demuxer() override;

        std::optional<Packet> readPacket() override;
        Metadata const& metadata() const noexcept override;

        /** All tracks in ascending id order. */
        [[nodiscard]]
        std::vector<Track> const& tracks() const noexcept;

        /** @throws Exception (MEAD_ERR_INVALID_ARG) for an unknown id. */
        [[nodiscard]]
        Track const& track(std::uint32_t id) const;

        [[nodiscard]]
        std::vector<Track const*> videoTracks() const;
        [[nodiscard]]
        std::vector<Track const*> audioTracks() const;

        /**
         * Sample `index` (0-based) of a track.
         * @throws Exception (MEAD_ERR_INVALID_ARG) for an unknown id or an index past the last sample.
         */
        [[nodiscard]]
        Mp4Sample sample(std::uint32_t id, std::uint32_t index) const;

        /**
         * Select a track and rewind the cursor to its first sample.
         * @throws Exception (MEAD_ERR_INVALID_ARG) for an unknown id.
         */
        void selectTrack(std::uint32_t id);

        /** Select the first video track. @throws Exception (MEAD_ERR_INVALID_ARG) if there is none. */
        void selectVideoTrack();

        /** Select the first audio track. @throws Exception (MEAD_ERR_INVALID_ARG) if there is none. */
        void selectAudioTrack();

        [[nodiscard]]
        std::optional<std::uint32_t> selectedTrack() const noexcept;

    private:
        std::size_t indexOf(std::uint32_t id) const;

        std::unique_ptr<MediaSource> _source;
        Metadata _metadata;
        std::vector<Track> _tracks;
        std::vector<Mp4SampleTable> _samples;
        std::optional<std::size_t> _selected;
        std::uint32_t _nextSample;
    };
}
