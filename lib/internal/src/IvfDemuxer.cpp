// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

#include "mead-internal/IvfDemuxer.hpp"
#include <algorithm>
#include <array>
#include <cstring>
#include <span>
#include <vector>
#include "mead-internal/Exception.hpp"
#include "mead-internal/Logging.hpp"
#include "ByteOrder.hpp"

namespace mead::lib
{
    namespace
    {
        constexpr auto FileHeaderSize = std::size_t{32};
        constexpr auto FrameHeaderSize = std::size_t{12};
        constexpr auto SkipChunkSize = std::size_t{4096};
    }

    IvfDemuxer::IvfDemuxer(std::unique_ptr<MediaSource> source)
        : _source{std::move(source)}
        , _header{}
        , _metadata{std::nullopt, 1, "IVF"}
        , _framesRead{0}
    {
        if (!_source)
        {
            throw Exception::invalidArgument("IVF demuxer needs a source");
        }

        auto raw = std::array<std::uint8_t, FileHeaderSize>{};
        if (!_source->readRecord(raw))
        {
            throw Exception::containerParse("Empty input, expected an IVF file header");
        }
        if (std::memcmp(raw.data(), "DKIF", 4) != 0)
        {
            throw Exception::containerParse("Not an IVF file: bad signature");
        }

        _header.version = loadLE<std::uint16_t>(&raw[4]);
        _header.headerSize = loadLE<std::uint16_t>(&raw[6]);
        _header.fourcc.assign(reinterpret_cast<char const*>(&raw[8]), 4);
        _header.width = loadLE<std::uint16_t>(&raw[12]);
        _header.height = loadLE<std::uint16_t>(&raw[14]);
        _header.rateField16 = loadLE<std::uint32_t>(&raw[16]);
        _header.rateField20 = loadLE<std::uint32_t>(&raw[20]);
        _header.frameCount = loadLE<std::uint32_t>(&raw[24]);

        if (_header.headerSize < FileHeaderSize)
        {
            throw Exception::containerParse("IVF header size {} is below the minimum of {}", _header.headerSize, FileHeaderSize);
        }

        // Skip header extensions without seeking so that stdin works too
        auto remaining = static_cast<std::size_t>(_header.headerSize - FileHeaderSize);
        auto scratch = std::vector<std::uint8_t>(std::min(remaining, SkipChunkSize));
        while (remaining > 0)
        {
            auto const chunk = std::span{scratch}.first(std::min(remaining, scratch.size()));
            if (!_source->readRecord(chunk))
            {
                throw Exception::containerParse("IVF header truncated");
            }
            remaining -= chunk.size();
        }

        MEAD_DEBUG("Opened IVF stream: {} {}x{}, rate fields {}/{}",
            _header.fourcc,
            _header.width,
            _header.height,
            _header.rateField20,
            _header.rateField16);
    }

    std::optional<Packet> IvfDemuxer::readPacket()
    {
        auto frameHeader = std::array<std::uint8_t, FrameHeaderSize>{};
        if (!_source->readRecord(frameHeader))
        {
            return std::nullopt;
        }

        auto const size = loadLE<std::uint32_t>(&frameHeader[0]);
        auto const timestamp = loadLE<std::uint64_t>(&frameHeader[4]);

        if (auto const length = _source->length(); length.has_value() && (size > *length - std::min(*length, _source->tell())))
        {
            throw Exception::containerParse("IVF frame {} claims {} bytes, more than the input holds", _framesRead, size);
        }

        auto packet = Packet{};
        packet.streamIndex = 0;
        packet.data.resize(size);
        packet.pts = static_cast<std::int64_t>(timestamp);
        if ((size > 0) && !_source->readRecord(packet.data))
        {
            throw Exception::containerParse("IVF frame {} payload missing", _framesRead);
        }

        ++_framesRead;
        MEAD_TRACE("IVF frame {}: {} bytes, ts {}", _framesRead, size, timestamp);
        return packet;
    }

    Metadata const& IvfDemuxer::metadata() const noexcept
    {
        return _metadata;
    }

    IvfHeader const& IvfDemuxer::header() const noexcept
    {
        return _header;
    }
}
