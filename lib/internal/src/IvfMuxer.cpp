// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

#include "mead-internal/IvfMuxer.hpp"
#include <array>
#include <limits>
#include "mead-internal/Exception.hpp"
#include "mead-internal/Logging.hpp"
#include "ByteOrder.hpp"

namespace mead::lib
{
    namespace
    {
        constexpr auto ProgressLogInterval = 100U;
    }

    IvfMuxer::IvfMuxer(std::ostream& sink, std::uint16_t width, std::uint16_t height, meadRational frameRate, std::string const& fourcc)
        : _sink{&sink}
        , _width{width}
        , _height{height}
        , _frameCount{0}
    {
        constexpr auto maxRateTerm = static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max());
        if ((frameRate.numerator <= 0) || (frameRate.denominator <= 0) || (frameRate.numerator > maxRateTerm) ||
            (frameRate.denominator > maxRateTerm))
        {
            throw Exception::invalidArgument("Invalid IVF frame rate {}/{}", frameRate.numerator, frameRate.denominator);
        }
        if (fourcc.size() != 4)
        {
            throw Exception::invalidArgument("IVF fourcc must be 4 characters, got '{}'", fourcc);
        }

        MEAD_INFO("Creating IVF muxer: {}x{} @ {}/{} fps", width, height, frameRate.numerator, frameRate.denominator);

        auto header = std::array<std::uint8_t, FileHeaderSize>{};
        header[0] = 'D';
        header[1] = 'K';
        header[2] = 'I';
        header[3] = 'F';
        storeLE<std::uint16_t>(&header[4], 0);
        storeLE<std::uint16_t>(&header[6], FileHeaderSize);
        for (auto i = std::size_t{0}; i < 4; ++i)
        {
            header[8 + i] = static_cast<std::uint8_t>(fourcc[i]);
        }
        storeLE<std::uint16_t>(&header[12], width);
        storeLE<std::uint16_t>(&header[14], height);
        storeLE<std::uint32_t>(&header[16], static_cast<std::uint32_t>(frameRate.denominator));
        storeLE<std::uint32_t>(&header[20], static_cast<std::uint32_t>(frameRate.numerator));
        storeLE<std::uint32_t>(&header[24], 0);
        storeLE<std::uint32_t>(&header[28], 0);

        write(header.data(), header.size());
    }

    void IvfMuxer::write(std::uint8_t const* data, std::size_t size)
    {
        _sink->write(reinterpret_cast<char const*>(data), static_cast<std::streamsize>(size));
        if (!*_sink)
        {
            throw Exception::io("Failed to write {} bytes to the IVF sink", size);
        }
    }

    void IvfMuxer::writePacket(Packet packet)
    {
        if (_sink == nullptr)
        {
            throw Exception::invalidArgument("IVF muxer already finalized");
        }
        if (packet.streamIndex != 0)
        {
            throw Exception::invalidArgument("IVF only supports a single stream (index 0), got stream {}", packet.streamIndex);
        }
        if (packet.data.size() > std::numeric_limits<std::uint32_t>::max())
        {
            throw Exception::invalidArgument("IVF frame of {} bytes exceeds the 32 bit size field", packet.data.size());
        }

        auto const timestamp = packet.pts.has_value() ? static_cast<std::uint64_t>(*packet.pts) : static_cast<std::uint64_t>(_frameCount);

        auto frameHeader = std::array<std::uint8_t, FrameHeaderSize>{};
        storeLE<std::uint32_t>(&frameHeader[0], static_cast<std::uint32_t>(packet.data.size()));
        storeLE<std::uint64_t>(&frameHeader[4], timestamp);

        write(frameHeader.data(), frameHeader.size());
        write(packet.data.data(), packet.data.size());

        ++_frameCount;
        if ((_frameCount % ProgressLogInterval) == 0)
        {
            MEAD_DEBUG("Wrote {} IVF frames", _frameCount);
        }
    }

    void IvfMuxer::finalize() &&
    {
        if (_sink == nullptr)
        {
            throw Exception::invalidArgument("IVF muxer already finalized");
        }

        auto* sink = _sink;
        _sink = nullptr;

        sink->flush();
        if (!*sink)
        {
            throw Exception::io("Failed to flush the IVF sink");
        }
        MEAD_INFO("IVF muxer finalized: {} frames written", _frameCount);
    }

    std::uint32_t IvfMuxer::frameCount() const noexcept
    {
        return _frameCount;
    }

    std::uint16_t IvfMuxer::width() const noexcept
    {
        return _width;
    }

    std::uint16_t IvfMuxer::height() const noexcept
    {
        return _height;
    }
}
