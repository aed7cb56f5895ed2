// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

#include "mead-internal/Frame.hpp"
#include <cassert>
#include <cstring>
#include <algorithm>
#include <limits>
#include "mead-internal/Exception.hpp"

namespace mead::lib
{
    namespace
    {
        std::size_t bufferSize(std::size_t rowBytes, std::size_t height)
        {
            if ((height != 0) && (rowBytes > std::numeric_limits<std::size_t>::max() / height))
            {
                throw Exception::invalidArgument("Plane of {} x {} bytes does not fit in memory", rowBytes, height);
            }
            return rowBytes * height;
        }
    }

    char const* toString(PixelFormat format) noexcept
    {
        switch (format)
        {
            case PixelFormat::Yuv420p: return "yuv420p";
            case PixelFormat::Yuv422p: return "yuv422p";
            case PixelFormat::Yuv444p: return "yuv444p";
            case PixelFormat::Rgb24:   return "rgb24";
        }
        return "unknown";
    }

    std::size_t planeCount(PixelFormat format) noexcept
    {
        return (format == PixelFormat::Rgb24) ? 1U : 3U;
    }

    std::vector<PlaneDimensions> planeDimensions(PixelFormat format, std::size_t width, std::size_t height)
    {
        switch (format)
        {
            case PixelFormat::Yuv420p:
                return {
                    {width,     height    },
                    {width / 2, height / 2},
                    {width / 2, height / 2}
                };
            case PixelFormat::Yuv422p:
                return {
                    {width,     height},
                    {width / 2, height},
                    {width / 2, height}
                };
            case PixelFormat::Yuv444p:
                return {
                    {width, height},
                    {width, height},
                    {width, height}
                };
            case PixelFormat::Rgb24:
                if (width > std::numeric_limits<std::size_t>::max() / 3)
                {
                    throw Exception::invalidArgument("RGB frame width {} is too large", width);
                }
                return {
                    {width * 3, height}
                };
        }
        throw Exception::invalidArgument("Unknown pixel format {}", static_cast<int>(format));
    }

    /////////////////////////////////////////////////////////////////////////
    // Plane
    /////////////////////////////////////////////////////////////////////////

    std::unique_ptr<std::uint8_t[], Plane::AlignedDeleter> Plane::allocate(std::size_t size)
    {
        // Zero sized planes (1xN 4:2:0 chroma) still get a valid aligned pointer
        auto const bytes = std::max<std::size_t>(size, 1U);
        auto* ptr = static_cast<std::uint8_t*>(::operator new[](bytes, std::align_val_t{Alignment}));
        std::memset(ptr, 0, bytes);
        return std::unique_ptr<std::uint8_t[], AlignedDeleter>{ptr};
    }

    Plane::Plane(std::size_t width, std::size_t height)
        : _width{width}
        , _height{height}
        , _stride{width}
        , _data{allocate(bufferSize(width, height))}
    {}

    Plane::Plane(std::span<std::uint8_t const> data, std::size_t width, std::size_t height, std::size_t stride)
        : _width{width}
        , _height{height}
        , _stride{stride}
        , _data{}
    {
        if (stride < width)
        {
            throw Exception::invalidArgument("Plane stride {} is smaller than its width {}", stride, width);
        }
        auto const size = bufferSize(stride, height);
        if (data.size() < size)
        {
            throw Exception::invalidArgument("Plane needs {} bytes ({} x {}), got {}", size, stride, height, data.size());
        }

        _data = allocate(size);
        std::memcpy(_data.get(), data.data(), size);
    }

    std::size_t Plane::width() const noexcept
    {
        return _width;
    }

    std::size_t Plane::height() const noexcept
    {
        return _height;
    }

    std::size_t Plane::stride() const noexcept
    {
        return _stride;
    }

    std::span<std::uint8_t const> Plane::data() const noexcept
    {
        return {_data.get(), _stride * _height};
    }

    std::span<std::uint8_t> Plane::data() noexcept
    {
        return {_data.get(), _stride * _height};
    }

    std::span<std::uint8_t const> Plane::row(std::size_t y) const noexcept
    {
        assert(y < _height);
        return {_data.get() + y * _stride, _width};
    }

    std::span<std::uint8_t> Plane::row(std::size_t y) noexcept
    {
        assert(y < _height);
        return {_data.get() + y * _stride, _width};
    }

    /////////////////////////////////////////////////////////////////////////
    // PlaneWriter
    /////////////////////////////////////////////////////////////////////////

    PlaneWriter::PlaneWriter(Plane& plane) noexcept
        : _plane{&plane}
    {}

    std::size_t PlaneWriter::width() const noexcept
    {
        return _plane->width();
    }

    std::size_t PlaneWriter::height() const noexcept
    {
        return _plane->height();
    }

    std::size_t PlaneWriter::stride() const noexcept
    {
        return _plane->stride();
    }

    std::span<std::uint8_t> PlaneWriter::data() const noexcept
    {
        return _plane->data();
    }

    std::span<std::uint8_t> PlaneWriter::row(std::size_t y) const noexcept
    {
        return _plane->row(y);
    }

    /////////////////////////////////////////////////////////////////////////
    // Frame
    /////////////////////////////////////////////////////////////////////////

    Frame::Frame(std::size_t width, std::size_t height, PixelFormat format)
        : _width{width}
        , _height{height}
        , _format{format}
        , _planes{}
        , _pts{}
    {
        auto const dims = planeDimensions(format, width, height);
        _planes.reserve(dims.size());
        for (auto const& dim : dims)
        {
            _planes.emplace_back(dim.width, dim.height);
        }
    }

    std::size_t Frame::width() const noexcept
    {
        return _width;
    }

    std::size_t Frame::height() const noexcept
    {
        return _height;
    }

    PixelFormat Frame::format() const noexcept
    {
        return _format;
    }

    std::span<Plane const> Frame::planes() const noexcept
    {
        return _planes;
    }

    PlaneWriter Frame::planeWriter(std::size_t index)
    {
        if (index >= _planes.size())
        {
            throw Exception::invalidArgument("{} frame has no plane {}", toString(_format), index);
        }
        return PlaneWriter{_planes[index]};
    }

    Plane const* Frame::yuvPlane(std::size_t index) const noexcept
    {
        if ((_format == PixelFormat::Rgb24) || (index >= _planes.size()))
        {
            return nullptr;
        }
        return &_planes[index];
    }

    Plane const* Frame::planeY() const noexcept
    {
        return yuvPlane(0);
    }

    Plane const* Frame::planeU() const noexcept
    {
        return yuvPlane(1);
    }

    Plane const* Frame::planeV() const noexcept
    {
        return yuvPlane(2);
    }

    std::optional<std::int64_t> Frame::pts() const noexcept
    {
        return _pts;
    }

    void Frame::setPts(std::int64_t pts) noexcept
    {
        _pts = pts;
    }

    SharedFrame share(Frame&& frame)
    {
        return std::make_shared<Frame const>(std::move(frame));
    }
}
