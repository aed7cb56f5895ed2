// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

#include "mead-internal/Y4mDemuxer.hpp"
#include <charconv>
#include <cstring>
#include <string_view>
#include "mead-internal/Exception.hpp"
#include "mead-internal/Logging.hpp"

namespace mead::lib
{
    namespace
    {
        constexpr auto Magic = std::string_view{"YUV4MPEG2"};
        constexpr auto FrameMarker = std::string_view{"FRAME"};
        constexpr auto ProgressLogInterval = 100U;

        template<typename T>
        T parseNumber(std::string_view text, char param)
        {
            auto value = T{};
            auto const* end = text.data() + text.size();
            auto const [ptr, ec] = std::from_chars(text.data(), end, value);
            if ((ec != std::errc{}) || (ptr != end))
            {
                throw Exception::containerParse("Invalid Y4M parameter {}'{}'", param, text);
            }
            return value;
        }

        meadRational parseRatio(std::string_view text, char param)
        {
            auto const colon = text.find(':');
            if (colon == std::string_view::npos)
            {
                throw Exception::containerParse("Invalid Y4M parameter {}'{}', expected <num>:<den>", param, text);
            }
            return {
                static_cast<std::int64_t>(parseNumber<std::uint32_t>(text.substr(0, colon), param)),
                static_cast<std::int64_t>(parseNumber<std::uint32_t>(text.substr(colon + 1), param)),
            };
        }

        PixelFormat formatFromColorspace(std::string const& tag)
        {
            if ((tag == "420") || (tag == "420jpeg") || (tag == "420paldv") || (tag == "420mpeg2"))
            {
                return PixelFormat::Yuv420p;
            }
            if (tag == "422")
            {
                return PixelFormat::Yuv422p;
            }
            if (tag == "444")
            {
                return PixelFormat::Yuv444p;
            }
            throw Exception::invalidArgument("Unsupported Y4M colorspace: {}", tag);
        }

        /** Dimensions of one stored plane, chroma rounded up as Y4M does. */
        PlaneDimensions storedPlaneDimensions(PixelFormat format, std::size_t plane, std::size_t width, std::size_t height)
        {
            if (plane == 0)
            {
                return {width, height};
            }
            switch (format)
            {
                case PixelFormat::Yuv420p: return {(width + 1) / 2, (height + 1) / 2};
                case PixelFormat::Yuv422p: return {(width + 1) / 2, height};
                default:                   return {width, height};
            }
        }
    }

    Y4mDemuxer::Y4mDemuxer(std::unique_ptr<MediaSource> source)
        : _source{std::move(source)}
        , _width{0}
        , _height{0}
        , _frameRate{0, 0}
        , _pixelAspect{0, 0}
        , _interlacing{'?'}
        , _colorspace{"420"}
        , _format{PixelFormat::Yuv420p}
        , _frameCount{0}
        , _metadata{std::nullopt, 1, "Y4M"}
        , _scratch{}
    {
        if (!_source)
        {
            throw Exception::invalidArgument("Y4M demuxer needs a source");
        }

        auto const header = readLine();
        if (!header.has_value())
        {
            throw Exception::containerParse("Empty input, expected a YUV4MPEG2 header");
        }
        parseHeader(*header);

        MEAD_INFO("Y4M: {}x{} @ {}/{} fps, colorspace: {}", _width, _height, _frameRate.numerator, _frameRate.denominator, _colorspace);
    }

    std::optional<std::string> Y4mDemuxer::readLine()
    {
        auto line = std::string{};
        auto byte = std::uint8_t{0};
        while (true)
        {
            if (_source->read({&byte, 1}) == 0)
            {
                if (line.empty())
                {
                    return std::nullopt;
                }
                throw Exception::containerParse("Y4M line truncated after {} bytes", line.size());
            }
            if (byte == '\n')
            {
                return line;
            }
            if (line.size() + 1 >= MaxLineLength)
            {
                throw Exception::containerParse("Y4M line exceeds {} bytes", MaxLineLength);
            }
            line.push_back(static_cast<char>(byte));
        }
    }

    void Y4mDemuxer::parseHeader(std::string const& line)
    {
        auto text = std::string_view{line};
        if ((text.substr(0, Magic.size()) != Magic) || ((text.size() > Magic.size()) && (text[Magic.size()] != ' ')))
        {
            throw Exception::containerParse("Not a Y4M stream: missing YUV4MPEG2 signature");
        }
        text.remove_prefix(Magic.size());

        auto hasRate = false;
        while (!text.empty())
        {
            auto const next = text.find(' ');
            auto const token = text.substr(0, next);
            text = (next == std::string_view::npos) ? std::string_view{} : text.substr(next + 1);
            if (token.empty())
            {
                continue;
            }

            auto const value = token.substr(1);
            switch (token.front())
            {
                case 'W': _width = parseNumber<std::uint32_t>(value, 'W'); break;
                case 'H': _height = parseNumber<std::uint32_t>(value, 'H'); break;
                case 'F':
                    _frameRate = parseRatio(value, 'F');
                    hasRate = true;
                    break;
                case 'I': _interlacing = value.empty() ? '?' : value.front(); break;
                case 'A': _pixelAspect = parseRatio(value, 'A'); break;
                case 'C': _colorspace = std::string{value}; break;
                case 'X': break;
                default:  MEAD_TRACE("Ignoring unknown Y4M header token '{}'", token); break;
            }
        }

        if ((_width == 0) || (_height == 0))
        {
            throw Exception::containerParse("Y4M header lacks a valid size (W{} H{})", _width, _height);
        }
        if (!hasRate)
        {
            throw Exception::containerParse("Y4M header lacks a frame rate");
        }
        if ((_frameRate.numerator == 0) || (_frameRate.denominator == 0))
        {
            throw Exception::containerParse("Y4M frame rate {}:{} has a zero term", _frameRate.numerator, _frameRate.denominator);
        }

        _format = formatFromColorspace(_colorspace);

        if ((_width > MaxDimension) || (_height > MaxDimension))
        {
            throw Exception::containerParse("Y4M frame size {}x{} exceeds the {} pixel limit", _width, _height, MaxDimension);
        }
        auto frameBytes = std::uint64_t{0};
        for (auto index = std::size_t{0}; index < planeCount(_format); ++index)
        {
            auto const stored = storedPlaneDimensions(_format, index, _width, _height);
            frameBytes += static_cast<std::uint64_t>(stored.width) * stored.height;
        }
        if (frameBytes > MaxFrameBytes)
        {
            throw Exception::containerParse("Y4M frames of {} bytes exceed the {} byte limit", frameBytes, MaxFrameBytes);
        }
    }

    std::optional<Frame> Y4mDemuxer::readFrame()
    {
        auto const marker = readLine();
        if (!marker.has_value())
        {
            return std::nullopt;
        }

        auto const text = std::string_view{*marker};
        if ((text.substr(0, FrameMarker.size()) != FrameMarker) || ((text.size() > FrameMarker.size()) && (text[FrameMarker.size()] != ' ')))
        {
            throw Exception::containerParse("Expected a FRAME marker before frame {}", _frameCount);
        }

        auto frame = Frame{_width, _height, _format};
        for (auto index = std::size_t{0}; index < planeCount(_format); ++index)
        {
            auto const stored = storedPlaneDimensions(_format, index, _width, _height);
            _scratch.resize(stored.width * stored.height);
            if (!_scratch.empty() && !_source->readRecord(_scratch))
            {
                throw Exception::containerParse("Y4M frame {} truncated in plane {}", _frameCount, index);
            }

            auto const plane = frame.planeWriter(index);
            for (auto y = std::size_t{0}; y < plane.height(); ++y)
            {
                std::memcpy(plane.row(y).data(), _scratch.data() + y * stored.width, plane.width());
            }
        }

        frame.setPts(static_cast<std::int64_t>(_frameCount));
        ++_frameCount;
        if ((_frameCount % ProgressLogInterval) == 0)
        {
            MEAD_DEBUG("Read {} frames from Y4M", _frameCount);
        }
        return frame;
    }

    std::uint32_t Y4mDemuxer::width() const noexcept
    {
        return _width;
    }

    std::uint32_t Y4mDemuxer::height() const noexcept
    {
        return _height;
    }

    meadRational Y4mDemuxer::frameRate() const noexcept
    {
        return _frameRate;
    }

    PixelFormat Y4mDemuxer::pixelFormat() const noexcept
    {
        return _format;
    }

    std::string const& Y4mDemuxer::colorspaceTag() const noexcept
    {
        return _colorspace;
    }

    char Y4mDemuxer::interlacing() const noexcept
    {
        return _interlacing;
    }

    meadRational Y4mDemuxer::pixelAspect() const noexcept
    {
        return _pixelAspect;
    }

    std::uint64_t Y4mDemuxer::frameCount() const noexcept
    {
        return _frameCount;
    }

    Metadata const& Y4mDemuxer::metadata() const noexcept
    {
        return _metadata;
    }
}
