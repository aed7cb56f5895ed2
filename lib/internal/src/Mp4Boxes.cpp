// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Mp4Boxes.cpp
 * @brief moov / trak / stbl parsing and sample table construction
 *
 * Box layouts follow ISO/IEC 14496-12 (and 14496-14 / 14496-3 for the esds
 * descriptors). Only the first sample description of a track is interpreted.
 *
 * Every table is size checked against the payload of its box before anything
 * is allocated: a corrupt entry count fails the parse instead of requesting
 * gigabytes of memory.
 */

#include "Mp4Boxes.hpp"
#include <algorithm>
#include <bit>
#include <optional>
#include <utility>
#include "mead-internal/Exception.hpp"
#include "mead-internal/Logging.hpp"
#include "ByteOrder.hpp"

namespace mead::lib::mp4
{
    namespace
    {
        constexpr auto BoxMvhd = makeFourcc("mvhd");
        constexpr auto BoxTrak = makeFourcc("trak");
        constexpr auto BoxTkhd = makeFourcc("tkhd");
        constexpr auto BoxMdia = makeFourcc("mdia");
        constexpr auto BoxMdhd = makeFourcc("mdhd");
        constexpr auto BoxHdlr = makeFourcc("hdlr");
        constexpr auto BoxMinf = makeFourcc("minf");
        constexpr auto BoxStbl = makeFourcc("stbl");
        constexpr auto BoxStsd = makeFourcc("stsd");
        constexpr auto BoxStts = makeFourcc("stts");
        constexpr auto BoxCtts = makeFourcc("ctts");
        constexpr auto BoxStss = makeFourcc("stss");
        constexpr auto BoxStsz = makeFourcc("stsz");
        constexpr auto BoxStz2 = makeFourcc("stz2");
        constexpr auto BoxStsc = makeFourcc("stsc");
        constexpr auto BoxStco = makeFourcc("stco");
        constexpr auto BoxCo64 = makeFourcc("co64");
        constexpr auto BoxAvcC = makeFourcc("avcC");
        constexpr auto BoxEsds = makeFourcc("esds");

        constexpr auto HandlerVideo = makeFourcc("vide");
        constexpr auto HandlerAudio = makeFourcc("soun");

        constexpr auto TagEsDescriptor = std::uint8_t{0x03};
        constexpr auto TagDecoderConfig = std::uint8_t{0x04};
        constexpr auto TagDecoderSpecificInfo = std::uint8_t{0x05};

        struct FullBoxHeader
        {
            std::uint8_t version;
            std::uint32_t flags;
        };

        FullBoxHeader readFullBoxHeader(ByteReader& reader)
        {
            auto const version = reader.u8();
            auto const flags = reader.u24();
            return {version, flags};
        }

        /** Read an entry count and make sure `count` entries of `entrySize` bytes fit. */
        std::uint32_t readEntryCount(ByteReader& reader, std::size_t entrySize, char const* box)
        {
            auto const count = reader.u32();
            if (count > reader.remaining() / entrySize)
            {
                throw Exception::containerParse("'{}' declares {} entries but only holds {} bytes", box, count, reader.remaining());
            }
            return count;
        }

        /** Raw contents of one stbl box. */
        struct SampleTables
        {
            std::uint32_t entryType = 0;
            std::span<std::uint8_t const> entryPayload;
            bool hasEntry = false;

            bool hasStsd = false;
            bool hasStts = false;
            bool hasSizes = false;
            bool hasStsc = false;
            bool hasChunkOffsets = false;

            Mp4SampleTable::Tables runs;
        };

        std::string decodeLanguage(std::uint16_t packed)
        {
            if ((packed & 0x7FFF) == 0)
            {
                return "und";
            }

            auto result = std::string(3, ' ');
            for (auto i = 0; i < 3; ++i)
            {
                auto const c = static_cast<char>(((packed >> (10 - 5 * i)) & 0x1F) + 0x60);
                if ((c < 'a') || (c > 'z'))
                {
                    return "und";
                }
                result[i] = c;
            }
            return result;
        }

        MovieHeader parseMvhd(ByteReader& reader)
        {
            auto header = MovieHeader{};
            auto const [version, flags] = readFullBoxHeader(reader);
            if (version == 1)
            {
                reader.skip(16);
                header.timescale = reader.u32();
                header.duration = reader.u64();
            }
            else
            {
                reader.skip(8);
                header.timescale = reader.u32();
                header.duration = reader.u32();
            }
            return header;
        }

        struct TrackHeader
        {
            std::uint32_t id = 0;
            std::uint16_t width = 0;
            std::uint16_t height = 0;
        };

        TrackHeader parseTkhd(ByteReader& reader)
        {
            auto header = TrackHeader{};
            auto const [version, flags] = readFullBoxHeader(reader);
            if (version == 1)
            {
                reader.skip(16);
                header.id = reader.u32();
                reader.skip(4 + 8);
            }
            else
            {
                reader.skip(8);
                header.id = reader.u32();
                reader.skip(4 + 4);
            }
            // reserved, layer, alternate group, volume, reserved, matrix
            reader.skip(8 + 2 + 2 + 2 + 2 + 36);
            header.width = static_cast<std::uint16_t>(reader.u32() >> 16);
            header.height = static_cast<std::uint16_t>(reader.u32() >> 16);
            return header;
        }

        void parseMdhd(ByteReader& reader, Track& track)
        {
            auto const [version, flags] = readFullBoxHeader(reader);
            if (version == 1)
            {
                reader.skip(16);
                track.timescale = reader.u32();
                track.duration = reader.u64();
            }
            else
            {
                reader.skip(8);
                track.timescale = reader.u32();
                track.duration = reader.u32();
            }
            track.language = decodeLanguage(reader.u16());
        }

        void parseStsd(ByteReader& reader, SampleTables& tables)
        {
            tables.hasStsd = true;
            readFullBoxHeader(reader);
            auto const entryCount = reader.u32();
            if (entryCount == 0)
            {
                return;
            }

            // Only the first sample description is used
            auto first = true;
            forEachBox(reader,
                [&](std::uint32_t type, ByteReader& entry)
                {
                    if (first)
                    {
                        tables.entryType = type;
                        tables.entryPayload = entry.bytes(entry.remaining());
                        tables.hasEntry = true;
                        first = false;
                    }
                });
        }

        void parseStts(ByteReader& reader, SampleTables& tables)
        {
            tables.hasStts = true;
            readFullBoxHeader(reader);
            auto const count = readEntryCount(reader, 8, "stts");
            tables.runs.timeToSample.reserve(count);
            for (auto i = std::uint32_t{0}; i < count; ++i)
            {
                auto const sampleCount = reader.u32();
                auto const delta = reader.u32();
                tables.runs.timeToSample.push_back({sampleCount, delta});
            }
        }

        void parseCtts(ByteReader& reader, SampleTables& tables)
        {
            readFullBoxHeader(reader);
            auto const count = readEntryCount(reader, 8, "ctts");
            tables.runs.compositionOffsets.reserve(count);
            for (auto i = std::uint32_t{0}; i < count; ++i)
            {
                auto const sampleCount = reader.u32();
                // Version 0 declares the offset unsigned, but writers put negative values there too
                auto const offset = static_cast<std::int32_t>(reader.u32());
                tables.runs.compositionOffsets.push_back({sampleCount, offset});
            }
        }

        void parseStss(ByteReader& reader, SampleTables& tables)
        {
            readFullBoxHeader(reader);
            auto const count = readEntryCount(reader, 4, "stss");
            auto syncSamples = std::vector<std::uint32_t>{};
            syncSamples.reserve(count);
            for (auto i = std::uint32_t{0}; i < count; ++i)
            {
                syncSamples.push_back(reader.u32());
            }
            tables.runs.syncSamples = std::move(syncSamples);
        }

        void parseStsz(ByteReader& reader, SampleTables& tables)
        {
            tables.hasSizes = true;
            readFullBoxHeader(reader);
            tables.runs.constantSize = reader.u32();
            if (tables.runs.constantSize != 0)
            {
                tables.runs.sampleCount = reader.u32();
                return;
            }

            tables.runs.sampleCount = readEntryCount(reader, 4, "stsz");
            tables.runs.sizes.reserve(tables.runs.sampleCount);
            for (auto i = std::uint32_t{0}; i < tables.runs.sampleCount; ++i)
            {
                tables.runs.sizes.push_back(reader.u32());
            }
        }

        void parseStz2(ByteReader& reader, SampleTables& tables)
        {
            tables.hasSizes = true;
            readFullBoxHeader(reader);
            reader.skip(3);
            auto const fieldSize = reader.u8();
            if ((fieldSize != 4) && (fieldSize != 8) && (fieldSize != 16))
            {
                throw Exception::containerParse("'stz2' field size {} is not 4, 8 or 16", fieldSize);
            }

            auto const count = reader.u32();
            auto const neededBytes = (static_cast<std::uint64_t>(count) * fieldSize + 7) / 8;
            if (neededBytes > reader.remaining())
            {
                throw Exception::containerParse("'stz2' declares {} entries but only holds {} bytes", count, reader.remaining());
            }

            tables.runs.sampleCount = count;
            tables.runs.sizes.reserve(count);
            for (auto i = std::uint32_t{0}; i < count; ++i)
            {
                switch (fieldSize)
                {
                    case 4:
                    {
                        auto const byte = reader.u8();
                        tables.runs.sizes.push_back(byte >> 4);
                        if (++i < count)
                        {
                            tables.runs.sizes.push_back(byte & 0x0F);
                        }
                        break;
                    }
                    case 8:  tables.runs.sizes.push_back(reader.u8()); break;
                    default: tables.runs.sizes.push_back(reader.u16()); break;
                }
            }
        }

        void parseStsc(ByteReader& reader, SampleTables& tables)
        {
            tables.hasStsc = true;
            readFullBoxHeader(reader);
            auto const count = readEntryCount(reader, 12, "stsc");
            tables.runs.sampleToChunk.reserve(count);
            for (auto i = std::uint32_t{0}; i < count; ++i)
            {
                auto const firstChunk = reader.u32();
                auto const samplesPerChunk = reader.u32();
                reader.skip(4); // sample description index
                tables.runs.sampleToChunk.push_back({firstChunk, samplesPerChunk});
            }
        }

        void parseChunkOffsets(ByteReader& reader, SampleTables& tables, bool wide)
        {
            tables.hasChunkOffsets = true;
            readFullBoxHeader(reader);
            auto const count = readEntryCount(reader, wide ? 8 : 4, wide ? "co64" : "stco");
            tables.runs.chunkOffsets.reserve(count);
            for (auto i = std::uint32_t{0}; i < count; ++i)
            {
                tables.runs.chunkOffsets.push_back(wide ? reader.u64() : reader.u32());
            }
        }

        void parseStbl(ByteReader& reader, SampleTables& tables)
        {
            forEachBox(reader,
                [&](std::uint32_t type, ByteReader& box)
                {
                    switch (type)
                    {
                        case BoxStsd: parseStsd(box, tables); break;
                        case BoxStts: parseStts(box, tables); break;
                        case BoxCtts: parseCtts(box, tables); break;
                        case BoxStss: parseStss(box, tables); break;
                        case BoxStsz: parseStsz(box, tables); break;
                        case BoxStz2: parseStz2(box, tables); break;
                        case BoxStsc: parseStsc(box, tables); break;
                        case BoxStco: parseChunkOffsets(box, tables, false); break;
                        case BoxCo64: parseChunkOffsets(box, tables, true); break;
                        default:      break;
                    }
                });
        }

        /** Descriptor header of 14496-1: tag byte plus a 7-bit-per-byte length. */
        std::pair<std::uint8_t, ByteReader> readDescriptor(ByteReader& reader)
        {
            auto const tag = reader.u8();
            auto length = std::size_t{0};
            for (auto i = 0; i < 4; ++i)
            {
                auto const byte = reader.u8();
                length = (length << 7) | (byte & 0x7F);
                if ((byte & 0x80) == 0)
                {
                    break;
                }
            }
            return {tag, reader.sub(length)};
        }

        /** MPEG-4 audio object type from the AudioSpecificConfig inside esds. */
        std::optional<std::uint8_t> parseEsdsObjectType(ByteReader& reader)
        {
            readFullBoxHeader(reader);

            auto [esTag, es] = readDescriptor(reader);
            if (esTag != TagEsDescriptor)
            {
                return std::nullopt;
            }

            es.skip(2); // ES_ID
            auto const flags = es.u8();
            if ((flags & 0x80) != 0)
            {
                es.skip(2);
            }
            if ((flags & 0x40) != 0)
            {
                es.skip(es.u8());
            }
            if ((flags & 0x20) != 0)
            {
                es.skip(2);
            }

            while (es.remaining() > 0)
            {
                auto [tag, config] = readDescriptor(es);
                if (tag != TagDecoderConfig)
                {
                    continue;
                }

                // objectTypeIndication, streamType, bufferSizeDB, maxBitrate, avgBitrate
                config.skip(1 + 1 + 3 + 4 + 4);
                while (config.remaining() > 0)
                {
                    auto [infoTag, info] = readDescriptor(config);
                    if ((infoTag != TagDecoderSpecificInfo) || (info.remaining() == 0))
                    {
                        continue;
                    }

                    auto const b0 = info.u8();
                    auto objectType = static_cast<std::uint8_t>(b0 >> 3);
                    if (objectType == 31)
                    {
                        auto const b1 = info.u8();
                        objectType = static_cast<std::uint8_t>(32 + (((b0 & 0x07) << 3) | (b1 >> 5)));
                    }
                    return objectType;
                }
            }
            return std::nullopt;
        }

        VideoProfile parseVisualEntry(std::uint32_t type, ByteReader reader)
        {
            auto profile = VideoProfile{};
            profile.codec = fourccToString(type);

            reader.skip(6 + 2);      // reserved, data reference index
            reader.skip(2 + 2 + 12); // pre_defined, reserved, pre_defined
            profile.width = reader.u16();
            profile.height = reader.u16();
            // resolutions, reserved, frame count, compressor name, depth, pre_defined
            reader.skip(4 + 4 + 4 + 2 + 32 + 2 + 2);

            forEachBox(reader,
                [&](std::uint32_t child, ByteReader& box)
                {
                    if (child == BoxAvcC)
                    {
                        box.skip(1); // configurationVersion
                        profile.avcProfile = box.u8();
                        box.skip(1); // profile_compatibility
                        profile.avcLevel = box.u8();
                    }
                });
            return profile;
        }

        AudioProfile parseAudioEntry(std::uint32_t type, ByteReader reader)
        {
            auto profile = AudioProfile{};
            profile.codec = fourccToString(type);

            reader.skip(6 + 2); // reserved, data reference index
            auto const version = reader.u16();
            reader.skip(2 + 4); // revision, vendor
            profile.channelCount = reader.u16();
            reader.skip(2 + 2 + 2); // sample size, compression id, packet size
            profile.sampleRate = reader.u32() >> 16;

            if (version == 1)
            {
                reader.skip(16);
            }
            else if (version == 2)
            {
                reader.skip(4); // sizeOfStructOnly
                profile.sampleRate = static_cast<std::uint32_t>(std::bit_cast<double>(reader.u64()));
                profile.channelCount = static_cast<std::uint16_t>(reader.u32());
                reader.skip(20);
            }

            forEachBox(reader,
                [&](std::uint32_t child, ByteReader& box)
                {
                    if (child == BoxEsds)
                    {
                        profile.objectType = parseEsdsObjectType(box);
                    }
                });
            return profile;
        }

        Mp4SampleTable buildSampleTable(SampleTables& tables, std::uint32_t trackId, std::uint64_t sourceLength)
        {
            auto const require = [&](bool present, char const* box)
            {
                if (!present)
                {
                    throw Exception::containerParse("Track {} has no '{}' box", trackId, box);
                }
            };
            require(tables.hasStsd, "stsd");
            require(tables.hasStts, "stts");
            require(tables.hasSizes, "stsz");
            require(tables.hasStsc, "stsc");
            require(tables.hasChunkOffsets, "stco");

            return Mp4SampleTable{trackId, std::move(tables.runs), sourceLength};
        }

        ParsedTrack parseTrak(ByteReader& reader, std::uint64_t sourceLength)
        {
            auto header = std::optional<TrackHeader>{};
            auto track = Track{};
            auto handler = std::uint32_t{0};
            auto hasMdhd = false;
            auto hasHdlr = false;
            auto hasStbl = false;
            auto tables = SampleTables{};

            forEachBox(reader,
                [&](std::uint32_t type, ByteReader& box)
                {
                    if (type == BoxTkhd)
                    {
                        header = parseTkhd(box);
                    }
                    else if (type == BoxMdia)
                    {
                        forEachBox(box,
                            [&](std::uint32_t mdiaType, ByteReader& mdiaBox)
                            {
                                if (mdiaType == BoxMdhd)
                                {
                                    parseMdhd(mdiaBox, track);
                                    hasMdhd = true;
                                }
                                else if (mdiaType == BoxHdlr)
                                {
                                    readFullBoxHeader(mdiaBox);
                                    mdiaBox.skip(4); // pre_defined
                                    handler = mdiaBox.fourcc();
                                    hasHdlr = true;
                                }
                                else if (mdiaType == BoxMinf)
                                {
                                    forEachBox(mdiaBox,
                                        [&](std::uint32_t minfType, ByteReader& minfBox)
                                        {
                                            if (minfType == BoxStbl)
                                            {
                                                parseStbl(minfBox, tables);
                                                hasStbl = true;
                                            }
                                        });
                                }
                            });
                    }
                });

            if (!header.has_value())
            {
                throw Exception::containerParse("'trak' without 'tkhd'");
            }
            if (header->id == 0)
            {
                throw Exception::containerParse("Track id 0 is reserved");
            }
            if (!hasMdhd || !hasHdlr || !hasStbl)
            {
                throw Exception::containerParse("Track {} lacks one of 'mdhd', 'hdlr', 'stbl'", header->id);
            }

            track.id = header->id;
            track.handler = fourccToString(handler);
            track.type = (handler == HandlerVideo) ? TrackType::Video : (handler == HandlerAudio) ? TrackType::Audio : TrackType::Other;

            if (track.type == TrackType::Video)
            {
                if (tables.hasEntry)
                {
                    track.video = parseVisualEntry(tables.entryType, ByteReader{tables.entryPayload});
                }
                else
                {
                    track.video = VideoProfile{};
                }
                if ((track.video->width == 0) && (track.video->height == 0))
                {
                    track.video->width = header->width;
                    track.video->height = header->height;
                }
            }
            else if (track.type == TrackType::Audio)
            {
                track.audio = tables.hasEntry ? parseAudioEntry(tables.entryType, ByteReader{tables.entryPayload}) : AudioProfile{};
            }

            auto samples = buildSampleTable(tables, track.id, sourceLength);
            track.sampleCount = samples.count();

            MEAD_DEBUG("Track {}: {} '{}', {} samples, timescale {}, language {}",
                track.id,
                toString(track.type),
                track.handler,
                track.sampleCount,
                track.timescale,
                track.language);

            return {std::move(track), std::move(samples)};
        }
    }

    /////////////////////////////////////////////////////////////////////////
    // ByteReader
    /////////////////////////////////////////////////////////////////////////

    ByteReader::ByteReader(std::span<std::uint8_t const> data) noexcept
        : _data{data}
        , _pos{0}
    {}

    void ByteReader::require(std::size_t count) const
    {
        if (count > _data.size() - _pos)
        {
            throw Exception::containerParse("Box truncated: {} bytes needed at offset {}, {} left", count, _pos, _data.size() - _pos);
        }
    }

    std::uint8_t ByteReader::u8()
    {
        require(1);
        return _data[_pos++];
    }

    std::uint16_t ByteReader::u16()
    {
        require(2);
        auto const value = loadBE<std::uint16_t>(&_data[_pos]);
        _pos += 2;
        return value;
    }

    std::uint32_t ByteReader::u24()
    {
        require(3);
        auto const value = (static_cast<std::uint32_t>(_data[_pos]) << 16) | (static_cast<std::uint32_t>(_data[_pos + 1]) << 8) | _data[_pos + 2];
        _pos += 3;
        return value;
    }

    std::uint32_t ByteReader::u32()
    {
        require(4);
        auto const value = loadBE<std::uint32_t>(&_data[_pos]);
        _pos += 4;
        return value;
    }

    std::uint64_t ByteReader::u64()
    {
        require(8);
        auto const value = loadBE<std::uint64_t>(&_data[_pos]);
        _pos += 8;
        return value;
    }

    std::uint32_t ByteReader::fourcc()
    {
        return u32();
    }

    void ByteReader::skip(std::size_t count)
    {
        require(count);
        _pos += count;
    }

    ByteReader ByteReader::sub(std::size_t count)
    {
        return ByteReader{bytes(count)};
    }

    std::span<std::uint8_t const> ByteReader::bytes(std::size_t count)
    {
        require(count);
        auto const result = _data.subspan(_pos, count);
        _pos += count;
        return result;
    }

    std::size_t ByteReader::remaining() const noexcept
    {
        return _data.size() - _pos;
    }

    std::size_t ByteReader::position() const noexcept
    {
        return _pos;
    }

    /////////////////////////////////////////////////////////////////////////
    // Box walking
    /////////////////////////////////////////////////////////////////////////

    void forEachBox(ByteReader& reader, std::function<void(std::uint32_t, ByteReader&)> const& visit)
    {
        while (reader.remaining() > 0)
        {
            if (reader.remaining() < 8)
            {
                throw Exception::containerParse("{} trailing bytes do not form a box header", reader.remaining());
            }

            auto size = static_cast<std::uint64_t>(reader.u32());
            auto const type = reader.fourcc();
            auto headerSize = std::uint64_t{8};
            if (size == 1)
            {
                size = reader.u64();
                headerSize = 16;
            }
            else if (size == 0)
            {
                size = reader.remaining() + headerSize;
            }

            if (size < headerSize)
            {
                throw Exception::containerParse("Box '{}' has an invalid size {}", fourccToString(type), size);
            }
            if (size - headerSize > reader.remaining())
            {
                throw Exception::containerParse("Box '{}' of {} bytes exceeds its parent ({} bytes left)", fourccToString(type), size, reader.remaining());
            }

            auto payload = reader.sub(static_cast<std::size_t>(size - headerSize));
            MEAD_TRACE("Box '{}' ({} bytes)", fourccToString(type), size);
            visit(type, payload);
        }
    }

    ParsedMovie parseMovie(std::span<std::uint8_t const> moovPayload, std::uint64_t sourceLength)
    {
        auto movie = ParsedMovie{};
        auto hasMvhd = false;

        auto reader = ByteReader{moovPayload};
        forEachBox(reader,
            [&](std::uint32_t type, ByteReader& box)
            {
                if (type == BoxMvhd)
                {
                    movie.header = parseMvhd(box);
                    hasMvhd = true;
                }
                else if (type == BoxTrak)
                {
                    movie.tracks.push_back(parseTrak(box, sourceLength));
                }
            });

        if (!hasMvhd)
        {
            throw Exception::containerParse("'moov' has no 'mvhd'");
        }

        std::sort(movie.tracks.begin(), movie.tracks.end(), [](auto const& lhs, auto const& rhs) { return lhs.info.id < rhs.info.id; });
        auto const duplicate = std::adjacent_find(
            movie.tracks.begin(), movie.tracks.end(), [](auto const& lhs, auto const& rhs) { return lhs.info.id == rhs.info.id; });
        if (duplicate != movie.tracks.end())
        {
            throw Exception::containerParse("Track id {} appears twice", duplicate->info.id);
        }

        return movie;
    }
}
