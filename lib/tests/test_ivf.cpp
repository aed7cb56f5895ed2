// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_ivf.cpp
 * @brief Unit tests for the IVF muxer and demuxer
 *
 * IVF layout checked here:
 *   - 32 byte file header, "DKIF", little endian fields
 *   - frame rate denominator at offset 16, numerator at offset 20
 *   - 12 byte frame header: 32 bit size, 64 bit timestamp
 */

#include <cstdint>
#include <cstring>
#include <memory>
#include <sstream>
#include <string>
#include <catch2/catch_test_macros.hpp>
#include "mead-internal/IvfDemuxer.hpp"
#include "mead-internal/IvfMuxer.hpp"
#include "mead-internal/MediaSource.hpp"
#include "Utils.hpp"

using namespace mead::lib;
using mead::tests::thrownStatus;

namespace
{
    std::uint32_t readU32(std::string const& bytes, std::size_t offset)
    {
        auto const* p = reinterpret_cast<std::uint8_t const*>(bytes.data() + offset);
        return p[0] | (p[1] << 8) | (p[2] << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
    }

    std::unique_ptr<MediaSource> sourceFor(std::string const& bytes)
    {
        return std::make_unique<MemorySource>(std::vector<std::uint8_t>{bytes.begin(), bytes.end()});
    }

    Packet makePacket(std::size_t size, std::uint8_t fill, std::optional<std::int64_t> pts)
    {
        auto packet = Packet{};
        packet.data.assign(size, fill);
        packet.pts = pts;
        return packet;
    }
}

/**
 * @brief The file header carries size, fourcc and the rate fields in their fixed order
 */
TEST_CASE("IVF file header layout", "[ivf]")
{
    auto sink = std::ostringstream{};
    auto muxer = IvfMuxer{sink, 1920, 1080, meadRational{30000, 1001}};
    std::move(muxer).finalize();

    auto const bytes = sink.str();
    REQUIRE(bytes.size() == IvfMuxer::FileHeaderSize);
    REQUIRE(bytes.substr(0, 4) == "DKIF");
    REQUIRE(bytes.substr(8, 4) == "AV01");
    REQUIRE((readU32(bytes, 4) >> 16) == 32);
    REQUIRE((readU32(bytes, 12) & 0xFFFF) == 1920);
    REQUIRE((readU32(bytes, 12) >> 16) == 1080);
    REQUIRE(readU32(bytes, 16) == 1001);
    REQUIRE(readU32(bytes, 20) == 30000);
}

/**
 * @brief Packets written by the muxer come back with identical payloads and timestamps
 */
TEST_CASE("IVF mux then demux", "[ivf]")
{
    auto sink = std::ostringstream{};
    auto muxer = IvfMuxer{sink, 64, 48, meadRational{25, 1}};
    muxer.writePacket(makePacket(10, 0x11, 0));
    muxer.writePacket(makePacket(0, 0x00, 1));
    muxer.writePacket(makePacket(300, 0x33, std::nullopt));
    REQUIRE(muxer.frameCount() == 3);
    std::move(muxer).finalize();

    auto const bytes = sink.str();
    REQUIRE(bytes.size() == IvfMuxer::FileHeaderSize + 3 * IvfMuxer::FrameHeaderSize + 310);

    auto demuxer = IvfDemuxer{sourceFor(bytes)};
    REQUIRE(demuxer.header().width == 64);
    REQUIRE(demuxer.header().height == 48);
    REQUIRE(demuxer.header().fourcc == "AV01");
    REQUIRE(demuxer.header().rateField16 == 1);
    REQUIRE(demuxer.header().rateField20 == 25);
    REQUIRE(demuxer.metadata().formatName == "IVF");
    REQUIRE(demuxer.metadata().streamCount == 1);

    auto first = demuxer.readPacket();
    REQUIRE(first.has_value());
    REQUIRE(first->data.size() == 10);
    REQUIRE(first->data[9] == 0x11);
    REQUIRE(first->pts == 0);

    auto empty = demuxer.readPacket();
    REQUIRE(empty.has_value());
    REQUIRE(empty->data.empty());

    // No pts: the frame index is used
    auto third = demuxer.readPacket();
    REQUIRE(third.has_value());
    REQUIRE(third->pts == 2);
    REQUIRE(third->data.size() == 300);

    REQUIRE_FALSE(demuxer.readPacket().has_value());
}

/**
 * @brief Misuse of the muxer is reported as an invalid argument
 */
TEST_CASE("IVF muxer preconditions", "[ivf]")
{
    auto sink = std::ostringstream{};
    REQUIRE(thrownStatus([&] { IvfMuxer{sink, 64, 48, meadRational{0, 1}}; }) == MEAD_ERR_INVALID_ARG);
    REQUIRE(thrownStatus([&] { IvfMuxer{sink, 64, 48, meadRational{25, 1}, "AV1"}; }) == MEAD_ERR_INVALID_ARG);

    auto muxer = IvfMuxer{sink, 64, 48, meadRational{25, 1}};
    auto other = makePacket(4, 1, 0);
    other.streamIndex = 1;
    REQUIRE(thrownStatus([&] { muxer.writePacket(other); }) == MEAD_ERR_INVALID_ARG);

    std::move(muxer).finalize();
    REQUIRE(thrownStatus([&] { muxer.writePacket(makePacket(4, 1, 0)); }) == MEAD_ERR_INVALID_ARG);
}

/**
 * @brief Corrupt and truncated IVF input fails with a container error
 */
TEST_CASE("IVF demuxer rejects malformed input", "[ivf]")
{
    auto sink = std::ostringstream{};
    auto muxer = IvfMuxer{sink, 64, 48, meadRational{25, 1}};
    muxer.writePacket(makePacket(100, 0x42, 0));
    std::move(muxer).finalize();
    auto const good = sink.str();

    SECTION("Bad signature")
    {
        auto bad = good;
        bad[0] = 'X';
        REQUIRE(thrownStatus([&] { IvfDemuxer{sourceFor(bad)}; }) == MEAD_ERR_CONTAINER_PARSE);
    }

    SECTION("Short file header")
    {
        REQUIRE(thrownStatus([&] { IvfDemuxer{sourceFor(good.substr(0, 20))}; }) == MEAD_ERR_CONTAINER_PARSE);
    }

    SECTION("Frame larger than the input")
    {
        auto demuxer = IvfDemuxer{sourceFor(good.substr(0, good.size() - 1))};
        REQUIRE(thrownStatus([&] { static_cast<void>(demuxer.readPacket()); }) == MEAD_ERR_CONTAINER_PARSE);
    }

    SECTION("Truncated frame header")
    {
        auto demuxer = IvfDemuxer{sourceFor(good.substr(0, IvfMuxer::FileHeaderSize + 5))};
        REQUIRE(thrownStatus([&] { static_cast<void>(demuxer.readPacket()); }) == MEAD_ERR_CONTAINER_PARSE);
    }

    SECTION("Extended header is skipped")
    {
        auto extended = good;
        extended[6] = 40;
        extended.insert(IvfMuxer::FileHeaderSize, 8, '\0');
        auto demuxer = IvfDemuxer{sourceFor(extended)};
        REQUIRE(demuxer.header().headerSize == 40);
        auto packet = demuxer.readPacket();
        REQUIRE(packet.has_value());
        REQUIRE(packet->data.size() == 100);
    }
}

/**
 * @brief Non seekable streams are read sequentially
 */
TEST_CASE("IVF demuxer over a stream", "[ivf]")
{
    auto sink = std::ostringstream{};
    auto muxer = IvfMuxer{sink, 16, 16, meadRational{25, 1}};
    muxer.writePacket(makePacket(8, 0x07, 5));
    std::move(muxer).finalize();

    auto input = std::istringstream{sink.str()};
    auto demuxer = IvfDemuxer{std::make_unique<StreamSource>(input)};
    auto packet = demuxer.readPacket();
    REQUIRE(packet.has_value());
    REQUIRE(packet->pts == 5);
    REQUIRE_FALSE(demuxer.readPacket().has_value());
}
