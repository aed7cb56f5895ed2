// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_frame.cpp
 * @brief Unit tests for planes, frames and plane geometry
 */

#include <cstdint>
#include <limits>
#include <utility>
#include <vector>
#include <catch2/catch_test_macros.hpp>
#include "mead-internal/Frame.hpp"
#include "Utils.hpp"

using namespace mead::lib;
using mead::tests::thrownStatus;

/**
 * @brief Plane geometry of every pixel format, including odd sizes
 */
TEST_CASE("Plane dimensions", "[frame]")
{
    REQUIRE(planeCount(PixelFormat::Yuv420p) == 3);
    REQUIRE(planeCount(PixelFormat::Rgb24) == 1);

    auto const yuv420 = planeDimensions(PixelFormat::Yuv420p, 1920, 1080);
    REQUIRE(yuv420.size() == 3);
    REQUIRE(yuv420[0].width == 1920);
    REQUIRE(yuv420[0].height == 1080);
    REQUIRE(yuv420[1].width == 960);
    REQUIRE(yuv420[2].height == 540);

    auto const odd = planeDimensions(PixelFormat::Yuv420p, 5, 3);
    REQUIRE(odd[1].width == 2);
    REQUIRE(odd[1].height == 1);

    auto const yuv422 = planeDimensions(PixelFormat::Yuv422p, 64, 48);
    REQUIRE(yuv422[1].width == 32);
    REQUIRE(yuv422[1].height == 48);

    auto const rgb = planeDimensions(PixelFormat::Rgb24, 10, 4);
    REQUIRE(rgb.size() == 1);
    REQUIRE(rgb[0].width == 30);
}

/**
 * @brief Frame plane sizes for every format over a range of even sizes
 */
TEST_CASE("Frame plane sizes for all formats", "[frame]")
{
    auto const formats = {PixelFormat::Yuv420p, PixelFormat::Yuv422p, PixelFormat::Yuv444p, PixelFormat::Rgb24};
    auto const sizes = std::vector<std::pair<std::size_t, std::size_t>>{
        {2,    2   },
        {16,   8   },
        {64,   48  },
        {320,  240 },
        {1280, 720 },
        {1920, 1080},
        {2,    1024},
    };

    for (auto const format : formats)
    {
        for (auto const& [w, h] : sizes)
        {
            CAPTURE(toString(format), w, h);
            auto const frame = Frame{w, h, format};
            auto const planes = frame.planes();
            REQUIRE(planes.size() == planeCount(format));

            auto expected = std::vector<std::size_t>{};
            switch (format)
            {
                case PixelFormat::Yuv420p: expected = {w * h, (w / 2) * (h / 2), (w / 2) * (h / 2)}; break;
                case PixelFormat::Yuv422p: expected = {w * h, (w / 2) * h, (w / 2) * h}; break;
                case PixelFormat::Yuv444p: expected = {w * h, w * h, w * h}; break;
                case PixelFormat::Rgb24:   expected = {3 * w * h}; break;
            }

            for (auto i = std::size_t{0}; i < planes.size(); ++i)
            {
                REQUIRE(planes[i].data().size() == expected[i]);
                REQUIRE(planes[i].stride() == planes[i].width());
            }
        }
    }
}

/**
 * @brief Planes are tightly packed in aligned, zeroed storage
 */
TEST_CASE("Plane storage", "[frame]")
{
    auto plane = Plane{100, 7};
    REQUIRE(plane.width() == 100);
    REQUIRE(plane.height() == 7);
    REQUIRE(plane.stride() == plane.width());
    REQUIRE(reinterpret_cast<std::uintptr_t>(plane.data().data()) % Plane::Alignment == 0);
    REQUIRE(plane.data().size() == plane.stride() * plane.height());

    for (auto const b : plane.data())
    {
        REQUIRE(b == 0);
    }

    plane.row(3)[0] = 0xAB;
    REQUIRE(plane.data()[3 * plane.stride()] == 0xAB);
    REQUIRE(plane.row(6).size() == 100);
}

/**
 * @brief Planes built from caller memory copy each row and reject short buffers
 */
TEST_CASE("Plane from existing data", "[frame]")
{
    auto const source = std::vector<std::uint8_t>{1, 2, 3, 0, 4, 5, 6, 0};
    auto const plane = Plane{source, 3, 2, 4};
    REQUIRE(plane.row(0)[2] == 3);
    REQUIRE(plane.row(1)[0] == 4);

    REQUIRE(thrownStatus([&] { static_cast<void>(Plane{source, 5, 2, 4}); }) == MEAD_ERR_INVALID_ARG);
    REQUIRE(thrownStatus([&] { static_cast<void>(Plane{source, 3, 3, 4}); }) == MEAD_ERR_INVALID_ARG);
}

/**
 * @brief Plane sizes whose byte count does not fit in size_t are rejected before allocating
 */
TEST_CASE("Plane size overflow", "[frame]")
{
    auto const huge = std::numeric_limits<std::size_t>::max() / 2 + 1;
    auto const source = std::vector<std::uint8_t>(16, 0);

    REQUIRE(thrownStatus([&] { static_cast<void>(Plane{huge, 2}); }) == MEAD_ERR_INVALID_ARG);
    REQUIRE(thrownStatus([&] { static_cast<void>(Plane{source, 1, 2, huge}); }) == MEAD_ERR_INVALID_ARG);
    REQUIRE(thrownStatus([&] { static_cast<void>(Frame{huge, 2, PixelFormat::Rgb24}); }) == MEAD_ERR_INVALID_ARG);
    REQUIRE(thrownStatus([&] { static_cast<void>(Plane{0, 7}); }) == MEAD_STATUS_OK);
}

/**
 * @brief Writers change pixel bytes in place, the plane shapes stay fixed
 */
TEST_CASE("Frame plane writers", "[frame]")
{
    auto frame = Frame{4, 4, PixelFormat::Yuv420p};

    auto const u = frame.planeWriter(1);
    REQUIRE(u.width() == 2);
    REQUIRE(u.height() == 2);
    u.row(1)[1] = 0x7F;
    u.data()[0] = 0x10;

    REQUIRE(frame.planeU()->row(1)[1] == 0x7F);
    REQUIRE(frame.planeU()->row(0)[0] == 0x10);
    REQUIRE(frame.planeU()->width() == frame.width() / 2);

    REQUIRE(thrownStatus([&] { static_cast<void>(frame.planeWriter(3)); }) == MEAD_ERR_INVALID_ARG);

    auto rgb = Frame{2, 1, PixelFormat::Rgb24};
    REQUIRE(rgb.planeWriter(0).row(0).size() == 6);
    REQUIRE(thrownStatus([&] { static_cast<void>(rgb.planeWriter(1)); }) == MEAD_ERR_INVALID_ARG);
}

/**
 * @brief Frames expose YUV planes by name, RGB frames do not
 */
TEST_CASE("Frame planes and timestamps", "[frame]")
{
    auto frame = Frame{64, 48, PixelFormat::Yuv420p};
    REQUIRE(frame.planes().size() == 3);
    REQUIRE(frame.planeY()->width() == 64);
    REQUIRE(frame.planeU()->width() == 32);
    REQUIRE(frame.planeV()->height() == 24);
    REQUIRE_FALSE(frame.pts().has_value());

    frame.setPts(42);
    auto const shared = share(std::move(frame));
    REQUIRE(shared->pts() == 42);
    REQUIRE(shared->format() == PixelFormat::Yuv420p);

    auto const rgb = Frame{8, 8, PixelFormat::Rgb24};
    REQUIRE(rgb.planes().size() == 1);
    REQUIRE(rgb.planeY() == nullptr);
    REQUIRE(rgb.planeU() == nullptr);
}
