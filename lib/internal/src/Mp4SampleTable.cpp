// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Mp4SampleTable.cpp
 * @brief Sample lookup on the run-length tables of one MP4 track
 */

#include <algorithm>
#include <iterator>
#include "mead-internal/Exception.hpp"
#include "mead-internal/Mp4Demuxer.hpp"

namespace mead::lib
{
    namespace
    {
        /** Last entry whose first sample is <= index; the tables always start at sample 0. */
        template<typename Entries>
        auto findRun(Entries const& entries, std::uint32_t index)
        {
            auto const next = std::upper_bound(
                entries.begin(), entries.end(), index, [](std::uint32_t value, auto const& entry) { return value < entry.firstSample; });
            return std::prev(next);
        }
    }

    Mp4SampleTable::Mp4SampleTable(std::uint32_t trackId, Tables tables, std::uint64_t sourceLength)
        : _count{tables.sampleCount}
        , _constantSize{tables.constantSize}
        , _sizes{std::move(tables.sizes)}
        , _times{}
        , _renderingOffsets{}
        , _chunks{}
        , _chunkOffsets{std::move(tables.chunkOffsets)}
        , _syncSamples{std::move(tables.syncSamples)}
        , _lastPosition{}
    {
        if ((_constantSize == 0) && (_sizes.size() != _count))
        {
            throw Exception::containerParse("Track {}: {} sample sizes for {} samples", trackId, _sizes.size(), _count);
        }

        // stts: decode times
        auto sample = std::uint64_t{0};
        auto time = std::uint64_t{0};
        for (auto const& run : tables.timeToSample)
        {
            if (sample >= _count)
            {
                break;
            }
            if (run.sampleCount == 0)
            {
                continue;
            }
            _times.push_back({static_cast<std::uint32_t>(sample), run.delta, time});
            sample += run.sampleCount;
            time += static_cast<std::uint64_t>(run.sampleCount) * run.delta;
        }
        if (sample < _count)
        {
            throw Exception::containerParse("Track {}: 'stts' covers {} of {} samples", trackId, sample, _count);
        }

        // ctts: samples past the end of the table have no offset
        sample = 0;
        for (auto const& run : tables.compositionOffsets)
        {
            if (sample >= _count)
            {
                break;
            }
            if (run.sampleCount == 0)
            {
                continue;
            }
            _renderingOffsets.push_back({static_cast<std::uint32_t>(sample), run.offset});
            sample += run.sampleCount;
        }
        if (!_renderingOffsets.empty() && (sample < _count))
        {
            _renderingOffsets.push_back({static_cast<std::uint32_t>(sample), 0});
        }

        // stsc: chunks [firstChunk, next.firstChunk) hold samplesPerChunk samples each
        auto const chunkCount = static_cast<std::uint64_t>(_chunkOffsets.size());
        auto const& runs = tables.sampleToChunk;
        sample = 0;
        for (auto run = std::size_t{0}; (run < runs.size()) && (sample < _count); ++run)
        {
            auto const& current = runs[run];
            auto const end = (run + 1 < runs.size()) ? static_cast<std::uint64_t>(runs[run + 1].firstChunk) : chunkCount + 1;
            if ((current.firstChunk == 0) || (current.firstChunk > chunkCount) || (end <= current.firstChunk))
            {
                throw Exception::containerParse("Track {}: invalid 'stsc' run starting at chunk {}", trackId, current.firstChunk);
            }
            if (current.samplesPerChunk == 0)
            {
                continue;
            }

            _chunks.push_back({static_cast<std::uint32_t>(sample), current.firstChunk, current.samplesPerChunk});

            auto const lastChunk = std::min(end, chunkCount + 1);
            for (auto chunk = static_cast<std::uint64_t>(current.firstChunk); (chunk < lastChunk) && (sample < _count); ++chunk)
            {
                auto const inChunk = std::min<std::uint64_t>(current.samplesPerChunk, _count - sample);
                auto bytes = std::uint64_t{0};
                if (_constantSize != 0)
                {
                    bytes = inChunk * _constantSize;
                }
                else
                {
                    for (auto i = sample; i < sample + inChunk; ++i)
                    {
                        bytes += _sizes[i];
                    }
                }

                auto const offset = _chunkOffsets[chunk - 1];
                if ((offset > sourceLength) || (bytes > sourceLength - offset))
                {
                    throw Exception::containerParse("Track {}: chunk {} ({} bytes at {}) lies outside the file", trackId, chunk, bytes, offset);
                }
                sample += inChunk;
            }
        }
        if (sample < _count)
        {
            throw Exception::containerParse("Track {}: chunk layout covers {} of {} samples", trackId, sample, _count);
        }

        if (_syncSamples.has_value())
        {
            for (auto const number : *_syncSamples)
            {
                if ((number == 0) || (number > _count))
                {
                    throw Exception::containerParse("Track {}: sync sample {} out of range 1..{}", trackId, number, _count);
                }
            }
            std::sort(_syncSamples->begin(), _syncSamples->end());
        }
    }

    std::uint32_t Mp4SampleTable::count() const noexcept
    {
        return _count;
    }

    std::uint32_t Mp4SampleTable::sizeOf(std::uint32_t index) const noexcept
    {
        return (_constantSize != 0) ? _constantSize : _sizes[index];
    }

    Mp4Sample Mp4SampleTable::at(std::uint32_t index) const
    {
        if (index >= _count)
        {
            throw Exception::invalidArgument("Sample {} requested, the track has {}", index, _count);
        }

        auto result = Mp4Sample{};
        result.size = sizeOf(index);

        auto const time = findRun(_times, index);
        result.startTime = time->startTime + static_cast<std::uint64_t>(index - time->firstSample) * time->delta;
        result.duration = time->delta;

        if (!_renderingOffsets.empty())
        {
            result.renderingOffset = findRun(_renderingOffsets, index)->offset;
        }

        auto const chunk = findRun(_chunks, index);
        auto const relative = index - chunk->firstSample;
        auto const chunkNumber = static_cast<std::uint64_t>(chunk->firstChunk) + relative / chunk->samplesPerChunk;
        auto const firstInChunk = index - relative % chunk->samplesPerChunk;

        auto offset = _chunkOffsets[chunkNumber - 1];
        if (_constantSize != 0)
        {
            offset += static_cast<std::uint64_t>(index - firstInChunk) * _constantSize;
        }
        else
        {
            auto from = firstInChunk;
            if (_lastPosition.has_value() && (_lastPosition->sample >= firstInChunk) && (_lastPosition->sample <= index))
            {
                from = _lastPosition->sample;
                offset = _lastPosition->offset;
            }
            for (auto i = from; i < index; ++i)
            {
                offset += _sizes[i];
            }
            _lastPosition = Position{index, offset};
        }
        result.offset = offset;

        result.isSync = !_syncSamples.has_value() || std::binary_search(_syncSamples->begin(), _syncSamples->end(), index + 1);
        return result;
    }
}
