// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

#include "Utils.hpp"
#include <cstring>
#include <utility>

namespace mead::tests
{
    void BoxWriter::u8(std::uint8_t v)
    {
        _data.push_back(v);
    }

    void BoxWriter::u16(std::uint16_t v)
    {
        u8(static_cast<std::uint8_t>(v >> 8));
        u8(static_cast<std::uint8_t>(v));
    }

    void BoxWriter::u32(std::uint32_t v)
    {
        u16(static_cast<std::uint16_t>(v >> 16));
        u16(static_cast<std::uint16_t>(v));
    }

    void BoxWriter::u64(std::uint64_t v)
    {
        u32(static_cast<std::uint32_t>(v >> 32));
        u32(static_cast<std::uint32_t>(v));
    }

    void BoxWriter::fourcc(char const* code)
    {
        _data.insert(_data.end(), code, code + 4);
    }

    void BoxWriter::zeros(std::size_t count)
    {
        _data.insert(_data.end(), count, 0);
    }

    void BoxWriter::bytes(std::vector<std::uint8_t> const& data)
    {
        _data.insert(_data.end(), data.begin(), data.end());
    }

    std::size_t BoxWriter::begin(char const* type)
    {
        auto const start = _data.size();
        u32(0);
        fourcc(type);
        return start;
    }

    std::size_t BoxWriter::beginFull(char const* type, std::uint8_t version, std::uint32_t flags)
    {
        auto const start = begin(type);
        u8(version);
        u8(static_cast<std::uint8_t>(flags >> 16));
        u16(static_cast<std::uint16_t>(flags));
        return start;
    }

    void BoxWriter::end(std::size_t start)
    {
        auto const size = static_cast<std::uint32_t>(_data.size() - start);
        _data[start + 0] = static_cast<std::uint8_t>(size >> 24);
        _data[start + 1] = static_cast<std::uint8_t>(size >> 16);
        _data[start + 2] = static_cast<std::uint8_t>(size >> 8);
        _data[start + 3] = static_cast<std::uint8_t>(size);
    }

    std::size_t BoxWriter::size() const noexcept
    {
        return _data.size();
    }

    std::vector<std::uint8_t> const& BoxWriter::data() const noexcept
    {
        return _data;
    }

    namespace
    {
        std::uint32_t sampleCountOf(Mp4Track const& track)
        {
            return (track.uniformSampleCount != 0) ? track.uniformSampleCount : static_cast<std::uint32_t>(track.samples.size());
        }

        std::uint64_t sampleSizeOf(Mp4Track const& track, std::size_t index)
        {
            return (track.uniformSampleCount != 0) ? track.uniformSampleSize : track.samples[index].size();
        }

        std::vector<std::uint32_t> chunkLayout(Mp4Track const& track)
        {
            if ((track.uniformSampleCount != 0) || track.chunkSizes.empty())
            {
                return {sampleCountOf(track)};
            }
            return track.chunkSizes;
        }

        std::size_t chunkGap(Mp4Track const& track)
        {
            return track.chunkSizes.empty() ? 0U : 4U;
        }

        /// Consecutive equal values as (count, value) runs
        template<typename T>
        std::vector<std::pair<std::uint32_t, T>> runsOf(std::vector<T> const& values)
        {
            auto runs = std::vector<std::pair<std::uint32_t, T>>{};
            for (auto const& value : values)
            {
                if (!runs.empty() && (runs.back().second == value))
                {
                    ++runs.back().first;
                }
                else
                {
                    runs.emplace_back(1, value);
                }
            }
            return runs;
        }

        /// File offsets of every chunk of every track when the payload starts at `base`
        std::vector<std::vector<std::uint64_t>> chunkOffsetsFrom(std::vector<Mp4Track> const& tracks, std::uint64_t base)
        {
            auto result = std::vector<std::vector<std::uint64_t>>{};
            auto position = base;
            for (auto const& track : tracks)
            {
                auto offsets = std::vector<std::uint64_t>{};
                auto sample = std::size_t{0};
                for (auto const samplesInChunk : chunkLayout(track))
                {
                    position += chunkGap(track);
                    offsets.push_back(position);
                    if (track.uniformSampleCount != 0)
                    {
                        position += static_cast<std::uint64_t>(samplesInChunk) * track.uniformSampleSize;
                        continue;
                    }
                    for (auto i = std::uint32_t{0}; i < samplesInChunk; ++i)
                    {
                        position += sampleSizeOf(track, sample++);
                    }
                }
                result.push_back(std::move(offsets));
            }
            return result;
        }

        void writePayload(BoxWriter& w, std::vector<Mp4Track> const& tracks)
        {
            for (auto const& track : tracks)
            {
                if (track.uniformSampleCount != 0)
                {
                    continue;
                }
                auto sample = std::size_t{0};
                for (auto const samplesInChunk : chunkLayout(track))
                {
                    for (auto i = std::size_t{0}; i < chunkGap(track); ++i)
                    {
                        w.u8(0xEE);
                    }
                    for (auto i = std::uint32_t{0}; i < samplesInChunk; ++i)
                    {
                        w.bytes(track.samples[sample++]);
                    }
                }
            }
        }

        void writeDescriptorLength(BoxWriter& w, std::size_t length, bool padded)
        {
            if (padded)
            {
                w.u8(0x80);
                w.u8(0x80);
                w.u8(0x80);
            }
            w.u8(static_cast<std::uint8_t>(length));
        }

        void writeEsds(BoxWriter& w, std::uint8_t objectType)
        {
            auto config = std::vector<std::uint8_t>{};
            if (objectType < 31)
            {
                config = {static_cast<std::uint8_t>(objectType << 3), 0x10};
            }
            else
            {
                auto const extended = static_cast<std::uint8_t>(objectType - 32);
                config = {static_cast<std::uint8_t>((31 << 3) | (extended >> 3)), static_cast<std::uint8_t>((extended & 0x07) << 5), 0};
            }

            auto const decoderConfigLength = 13 + 2 + config.size();
            auto const esLength = 3 + 2 + decoderConfigLength + 3;

            auto const esds = w.beginFull("esds");
            w.u8(0x03); // ES descriptor, length in the 4 byte form
            writeDescriptorLength(w, esLength, true);
            w.u16(1); // ES_ID
            w.u8(0);  // no dependency, URL or OCR stream
            w.u8(0x04);
            writeDescriptorLength(w, decoderConfigLength, false);
            w.u8(0x40); // MPEG-4 audio
            w.u8(0x15); // audio stream
            w.zeros(3);
            w.u32(128000);
            w.u32(128000);
            w.u8(0x05);
            writeDescriptorLength(w, config.size(), false);
            w.bytes(config);
            w.u8(0x06); // SL config
            writeDescriptorLength(w, 1, false);
            w.u8(0x02);
            w.end(esds);
        }

        void writeSampleEntry(BoxWriter& w, Mp4Track const& track)
        {
            auto const entry = w.begin(track.codec);
            w.zeros(6);
            w.u16(1); // data reference index
            if (std::strcmp(track.handler, "vide") == 0)
            {
                w.zeros(2 + 2 + 12);
                w.u16(track.width);
                w.u16(track.height);
                w.u32(0x00480000);
                w.u32(0x00480000);
                w.u32(0);
                w.u16(1);
                w.zeros(32);
                w.u16(0x18);
                w.u16(0xFFFF);
                if (std::strcmp(track.codec, "avc1") == 0)
                {
                    auto const avcC = w.begin("avcC");
                    w.u8(1);
                    w.u8(100); // High
                    w.u8(0);
                    w.u8(40); // level 4.0
                    w.u8(0xFF);
                    w.u8(0xE0);
                    w.u8(0);
                    w.end(avcC);
                }
            }
            else
            {
                w.u16(0); // version
                w.zeros(2 + 4);
                w.u16(track.channelCount);
                w.u16(16);
                w.zeros(2 + 2);
                w.u32(track.sampleRate << 16);
                if (track.audioObjectType.has_value())
                {
                    writeEsds(w, *track.audioObjectType);
                }
            }
            w.end(entry);
        }

        void writeSampleSizes(BoxWriter& w, Mp4Track const& track)
        {
            auto const sampleCount = sampleCountOf(track);
            if (track.uniformSampleCount != 0)
            {
                auto const stsz = w.beginFull("stsz");
                w.u32(track.uniformSampleSize);
                w.u32(sampleCount);
                w.end(stsz);
                return;
            }

            if (track.compactSizeBits == 0)
            {
                auto const stsz = w.beginFull("stsz");
                w.u32(0);
                w.u32(sampleCount);
                for (auto const& sample : track.samples)
                {
                    w.u32(static_cast<std::uint32_t>(sample.size()));
                }
                w.end(stsz);
                return;
            }

            auto const stz2 = w.beginFull("stz2");
            w.zeros(3);
            w.u8(track.compactSizeBits);
            w.u32(sampleCount);
            for (auto i = std::size_t{0}; i < track.samples.size(); ++i)
            {
                auto const size = track.samples[i].size();
                switch (track.compactSizeBits)
                {
                    case 4:
                    {
                        auto const next = (i + 1 < track.samples.size()) ? track.samples[i + 1].size() : 0U;
                        w.u8(static_cast<std::uint8_t>((size << 4) | next));
                        ++i;
                        break;
                    }
                    case 8:  w.u8(static_cast<std::uint8_t>(size)); break;
                    default: w.u16(static_cast<std::uint16_t>(size)); break;
                }
            }
            w.end(stz2);
        }

        void writeTrak(BoxWriter& w, Mp4Track const& track, std::vector<std::uint64_t> const& chunkOffsets)
        {
            auto const sampleCount = sampleCountOf(track);
            auto timeRuns = std::vector<std::pair<std::uint32_t, std::uint32_t>>{};
            if (track.sampleDeltas.empty())
            {
                timeRuns.emplace_back(sampleCount, track.sampleDelta);
            }
            else
            {
                timeRuns = runsOf(track.sampleDeltas);
            }

            auto totalDuration = std::uint64_t{0};
            for (auto const& [count, delta] : timeRuns)
            {
                totalDuration += static_cast<std::uint64_t>(count) * delta;
            }
            auto const duration = static_cast<std::uint32_t>(totalDuration);

            auto const trak = w.begin("trak");

            auto const tkhd = w.beginFull("tkhd", 0, 3);
            w.u32(0);
            w.u32(0);
            w.u32(track.id);
            w.u32(0);
            w.u32(duration);
            w.zeros(8 + 2 + 2 + 2 + 2 + 36);
            w.u32(static_cast<std::uint32_t>(track.width) << 16);
            w.u32(static_cast<std::uint32_t>(track.height) << 16);
            w.end(tkhd);

            auto const mdia = w.begin("mdia");
            auto const mdhd = w.beginFull("mdhd");
            w.u32(0);
            w.u32(0);
            w.u32(track.timescale);
            w.u32(duration);
            w.u16(0x15C7); // "eng"
            w.u16(0);
            w.end(mdhd);

            auto const hdlr = w.beginFull("hdlr");
            w.u32(0);
            w.fourcc(track.handler);
            w.zeros(12 + 1);
            w.end(hdlr);

            auto const minf = w.begin("minf");
            auto const stbl = w.begin("stbl");

            auto const stsd = w.beginFull("stsd");
            w.u32(1);
            writeSampleEntry(w, track);
            w.end(stsd);

            auto const stts = w.beginFull("stts");
            w.u32(static_cast<std::uint32_t>(timeRuns.size()));
            for (auto const& [count, delta] : timeRuns)
            {
                w.u32(count);
                w.u32(delta);
            }
            w.end(stts);

            if (!track.compositionOffsets.empty())
            {
                auto const runs = runsOf(track.compositionOffsets);
                auto const ctts = w.beginFull("ctts", 1);
                w.u32(static_cast<std::uint32_t>(runs.size()));
                for (auto const& [count, offset] : runs)
                {
                    w.u32(count);
                    w.u32(static_cast<std::uint32_t>(offset));
                }
                w.end(ctts);
            }

            if (track.syncSamples.has_value())
            {
                auto const stss = w.beginFull("stss");
                w.u32(static_cast<std::uint32_t>(track.syncSamples->size()));
                for (auto const number : *track.syncSamples)
                {
                    w.u32(number);
                }
                w.end(stss);
            }

            writeSampleSizes(w, track);

            // One stsc entry per run of chunks with the same sample count
            auto chunkRuns = std::vector<std::pair<std::uint32_t, std::uint32_t>>{};
            auto const layout = chunkLayout(track);
            for (auto chunk = std::size_t{0}; chunk < layout.size(); ++chunk)
            {
                if (chunkRuns.empty() || (chunkRuns.back().second != layout[chunk]))
                {
                    chunkRuns.emplace_back(static_cast<std::uint32_t>(chunk + 1), layout[chunk]);
                }
            }
            auto const stsc = w.beginFull("stsc");
            w.u32(static_cast<std::uint32_t>(chunkRuns.size()));
            for (auto const& [firstChunk, samplesPerChunk] : chunkRuns)
            {
                w.u32(firstChunk);
                w.u32(samplesPerChunk);
                w.u32(1);
            }
            w.end(stsc);

            auto const stco = w.beginFull(track.wideChunkOffsets ? "co64" : "stco");
            w.u32(static_cast<std::uint32_t>(chunkOffsets.size()));
            for (auto const offset : chunkOffsets)
            {
                if (track.wideChunkOffsets)
                {
                    w.u64(offset);
                }
                else
                {
                    w.u32(static_cast<std::uint32_t>(offset));
                }
            }
            w.end(stco);

            w.end(stbl);
            w.end(minf);
            w.end(mdia);
            w.end(trak);
        }

        void writeMoov(BoxWriter& w, std::vector<Mp4Track> const& tracks, Mp4Layout const& layout, std::vector<std::vector<std::uint64_t>> const& chunkOffsets)
        {
            auto const moov = w.begin("moov");
            auto const mvhd = w.beginFull("mvhd");
            w.u32(0);
            w.u32(0);
            w.u32(layout.movieTimescale);
            w.u32(layout.movieDuration);
            w.u32(0x00010000); // rate
            w.u16(0x0100);     // volume
            w.zeros(10 + 36 + 24);
            w.u32(static_cast<std::uint32_t>(tracks.size() + 1));
            w.end(mvhd);
            for (auto i = std::size_t{0}; i < tracks.size(); ++i)
            {
                writeTrak(w, tracks[i], chunkOffsets[i]);
            }
            w.end(moov);
        }

        void writeMdat(BoxWriter& w, std::vector<Mp4Track> const& tracks, Mp4Layout const& layout)
        {
            auto payload = BoxWriter{};
            writePayload(payload, tracks);

            if (layout.mdatToEnd)
            {
                w.u32(0);
                w.fourcc("mdat");
            }
            else if (layout.mdatLargeSize)
            {
                w.u32(1);
                w.fourcc("mdat");
                w.u64(16 + payload.size());
            }
            else
            {
                w.u32(static_cast<std::uint32_t>(8 + payload.size()));
                w.fourcc("mdat");
            }
            w.bytes(payload.data());
        }
    }

    std::vector<std::uint8_t> makeMp4(std::vector<Mp4Track> const& tracks, Mp4Layout const& layout)
    {
        auto w = BoxWriter{};

        auto const ftyp = w.begin("ftyp");
        w.fourcc("isom");
        w.u32(0x200);
        w.fourcc("isom");
        w.fourcc("mp41");
        w.end(ftyp);

        auto const mdatHeader = (layout.mdatLargeSize && !layout.mdatToEnd) ? 16U : 8U;
        auto chunkOffsets = std::vector<std::vector<std::uint64_t>>{};
        if (layout.moovFirst || layout.mdatToEnd)
        {
            // Chunk offsets depend on the size of moov, which does not depend on their values
            auto sizing = BoxWriter{};
            writeMoov(sizing, tracks, layout, chunkOffsetsFrom(tracks, 0));
            chunkOffsets = chunkOffsetsFrom(tracks, w.size() + sizing.size() + mdatHeader);
            writeMoov(w, tracks, layout, chunkOffsets);
            writeMdat(w, tracks, layout);
        }
        else
        {
            chunkOffsets = chunkOffsetsFrom(tracks, w.size() + mdatHeader);
            writeMdat(w, tracks, layout);
            writeMoov(w, tracks, layout, chunkOffsets);
        }

        if (layout.duplicateMoov)
        {
            writeMoov(w, tracks, layout, chunkOffsets);
        }

        return w.data();
    }

    std::vector<std::uint8_t> makeMp4(std::vector<Mp4Track> const& tracks, std::uint32_t movieTimescale, std::uint32_t movieDuration)
    {
        auto layout = Mp4Layout{};
        layout.movieTimescale = movieTimescale;
        layout.movieDuration = movieDuration;
        return makeMp4(tracks, layout);
    }

    std::vector<std::uint8_t> makeY4m(std::string const& header, std::size_t frameCount, std::size_t frameSize)
    {
        auto result = toBytes(header + "\n");
        for (auto i = std::size_t{0}; i < frameCount; ++i)
        {
            auto const marker = toBytes("FRAME\n");
            result.insert(result.end(), marker.begin(), marker.end());
            result.insert(result.end(), frameSize, static_cast<std::uint8_t>(i));
        }
        return result;
    }

    std::vector<std::uint8_t> toBytes(std::string const& text)
    {
        return {text.begin(), text.end()};
    }
}
