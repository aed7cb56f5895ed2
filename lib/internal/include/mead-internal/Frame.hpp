// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Frame.hpp
 * @brief Planar raw video frames with format-driven subsampling
 *
 * A Frame owns one Plane per colour component. The plane shapes are fully
 * determined by (PixelFormat, width, height):
 *
 *   Format   | Planes (w x h each)
 *   ---------|-------------------------------------------
 *   Yuv420p  | Y: w x h,   U,V: w/2 x h/2
 *   Yuv422p  | Y: w x h,   U,V: w/2 x h
 *   Yuv444p  | Y,U,V: w x h
 *   Rgb24    | one interleaved plane: (w*3) x h
 *
 * Chroma sizes use integer division. Containers that store rounded-up chroma
 * (Y4M) crop on the way in.
 *
 * Every plane buffer starts on a 32 byte boundary so that SIMD code in the
 * encoders can load rows without peeling.
 *
 * Ownership: a Frame is built and filled by a single owner, then optionally
 * converted with share() into a SharedFrame that any number of readers (the
 * encoder's lookahead queue included) can hold. A SharedFrame gives no mutable
 * access.
 *
 * The owner fills a frame through PlaneWriter handles. They reach the pixel
 * bytes of a plane but cannot replace the plane, so the plane shapes always
 * match the table above.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <optional>
#include <span>
#include <vector>
#include <mead/platform.h>

namespace mead::lib
{
    enum class PixelFormat
    {
        Yuv420p,
        Yuv422p,
        Yuv444p,
        Rgb24,
    };

    /** Human readable name ("yuv420p", ...). */
    MEAD_EXPORT
    char const* toString(PixelFormat format) noexcept;

    /** Number of planes a frame of this format carries (3, or 1 for Rgb24). */
    [[nodiscard]]
    MEAD_EXPORT
    std::size_t planeCount(PixelFormat format) noexcept;

    struct PlaneDimensions
    {
        std::size_t width;  ///< Bytes per row of payload (Rgb24: 3 * pixels)
        std::size_t height; ///< Rows
    };

    /**
     * Shapes of all planes of a (format, width, height) frame, in plane order.
     */
    [[nodiscard]]
    MEAD_EXPORT
    std::vector<PlaneDimensions> planeDimensions(PixelFormat format, std::size_t width, std::size_t height);

    /**
     * One component of a frame: `height` rows of `width` payload bytes, laid
     * out `stride` bytes apart in a 32 byte aligned buffer.
     */
    class MEAD_EXPORT Plane
    {
    public:
        static constexpr std::size_t Alignment = 32;

        /**
         * Zero-filled plane with stride == width.
         * @throws Exception (MEAD_ERR_INVALID_ARG) if width * height overflows.
         */
        Plane(std::size_t width, std::size_t height);

        /**
         * Plane copied from existing bytes laid out with an explicit stride.
         * @throws Exception (MEAD_ERR_INVALID_ARG) if stride < width,
         *         stride * height overflows or data.size() < stride * height.
         */
        Plane(std::span<std::uint8_t const> data, std::size_t width, std::size_t height, std::size_t stride);

        Plane(Plane&&) noexcept = default;
        Plane& operator=(Plane&&) noexcept = default;
        Plane(Plane const&) = delete;
        Plane& operator=(Plane const&) = delete;

        [[nodiscard]]
        std::size_t width() const noexcept;
        [[nodiscard]]
        std::size_t height() const noexcept;
        [[nodiscard]]
        std::size_t stride() const noexcept;

        /** The whole buffer, stride * height bytes. */
        [[nodiscard]]
        std::span<std::uint8_t const> data() const noexcept;
        [[nodiscard]]
        std::span<std::uint8_t> data() noexcept;

        /**
         * Exactly `width` bytes of row y. y >= height() is a programming error,
         * checked in debug builds only.
         */
        [[nodiscard]]
        std::span<std::uint8_t const> row(std::size_t y) const noexcept;
        [[nodiscard]]
        std::span<std::uint8_t> row(std::size_t y) noexcept;

    private:
        struct AlignedDeleter
        {
            void operator()(std::uint8_t* ptr) const noexcept
            {
                ::operator delete[](ptr, std::align_val_t{Alignment});
            }
        };

        static std::unique_ptr<std::uint8_t[], AlignedDeleter> allocate(std::size_t size);

        std::size_t _width;
        std::size_t _height;
        std::size_t _stride;
        std::unique_ptr<std::uint8_t[], AlignedDeleter> _data;
    };

    /**
     * Write access to the pixel bytes of one plane of a Frame. The handle
     * refers to the frame's storage and must not outlive it.
     */
    class MEAD_EXPORT PlaneWriter
    {
    public:
        [[nodiscard]]
        std::size_t width() const noexcept;
        [[nodiscard]]
        std::size_t height() const noexcept;
        [[nodiscard]]
        std::size_t stride() const noexcept;

        [[nodiscard]]
        std::span<std::uint8_t> data() const noexcept;
        [[nodiscard]]
        std::span<std::uint8_t> row(std::size_t y) const noexcept;

    private:
        friend class Frame;

        explicit PlaneWriter(Plane& plane) noexcept;

        Plane* _plane;
    };

    class MEAD_EXPORT Frame
    {
    public:
        /** Builds the zero-filled plane set of the given format. */
        Frame(std::size_t width, std::size_t height, PixelFormat format);

        Frame(Frame&&) noexcept = default;
        Frame& operator=(Frame&&) noexcept = default;
        Frame(Frame const&) = delete;
        Frame& operator=(Frame const&) = delete;

        [[nodiscard]]
        std::size_t width() const noexcept;
        [[nodiscard]]
        std::size_t height() const noexcept;
        [[nodiscard]]
        PixelFormat format() const noexcept;

        [[nodiscard]]
        std::span<Plane const> planes() const noexcept;

        /**
         * Pixel access to plane `index`.
         * @throws Exception (MEAD_ERR_INVALID_ARG) if index >= planes().size().
         */
        [[nodiscard]]
        PlaneWriter planeWriter(std::size_t index);

        /** @return the plane, or nullptr when the format has no such plane (Rgb24). */
        [[nodiscard]]
        Plane const* planeY() const noexcept;
        [[nodiscard]]
        Plane const* planeU() const noexcept;
        [[nodiscard]]
        Plane const* planeV() const noexcept;

        [[nodiscard]]
        std::optional<std::int64_t> pts() const noexcept;
        void setPts(std::int64_t pts) noexcept;

    private:
        Plane const* yuvPlane(std::size_t index) const noexcept;

        std::size_t _width;
        std::size_t _height;
        PixelFormat _format;
        std::vector<Plane> _planes;
        std::optional<std::int64_t> _pts;
    };

    /** Read-only frame handle that can be held by several owners at once. */
    using SharedFrame = std::shared_ptr<Frame const>;

    /** Give up single ownership of a frame and freeze it. */
    [[nodiscard]]
    MEAD_EXPORT
    SharedFrame share(Frame&& frame);
}
