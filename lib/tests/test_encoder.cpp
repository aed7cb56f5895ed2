// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_encoder.cpp
 * @brief Unit tests for the encoder protocol
 *
 * The backends need native libraries, so the state machine is exercised with
 * LookaheadEncoder: a backend that holds a configurable number of frames
 * before releasing packets, the way real AV1 encoders do.
 */

#include <deque>
#include <future>
#include <thread>
#include <catch2/catch_test_macros.hpp>
#include "mead-internal/BufferedEncoder.hpp"
#include "mead-internal/EncoderFactory.hpp"
#include "Utils.hpp"

using namespace mead::lib;
using mead::tests::thrownStatus;

namespace
{
    class LookaheadEncoder final : public BufferedEncoder
    {
    public:
        explicit LookaheadEncoder(std::size_t lookahead)
            : BufferedEncoder{"lookahead", 16, 16, meadRational{25, 1}}
            , _lookahead{lookahead}
            , _endOfStream{false}
            , _endOfStreamCalls{0}
        {}

        std::size_t endOfStreamCalls() const noexcept
        {
            return _endOfStreamCalls;
        }

    protected:
        void doSendFrame(SharedFrame const& frame) override
        {
            _pending.push_back(frame->pts().value_or(-1));
        }

        void doSendEndOfStream() override
        {
            _endOfStream = true;
            ++_endOfStreamCalls;
        }

        meadStatus doReceivePacket(Packet& packet) override
        {
            if (_pending.empty())
            {
                return _endOfStream ? MEAD_ERR_END_OF_STREAM : MEAD_ERR_NOT_READY;
            }
            if (!_endOfStream && (_pending.size() <= _lookahead))
            {
                return MEAD_ERR_NOT_READY;
            }

            packet = Packet{};
            packet.pts = _pending.front();
            packet.data.assign(4, static_cast<std::uint8_t>(_pending.front()));
            packet.isKeyframe = (_pending.front() == 0);
            _pending.pop_front();
            return MEAD_STATUS_OK;
        }

    private:
        std::size_t _lookahead;
        bool _endOfStream;
        std::size_t _endOfStreamCalls;
        std::deque<std::int64_t> _pending;
    };

    /** Blocks inside receivePacket() until released. */
    class BlockingEncoder final : public BufferedEncoder
    {
    public:
        BlockingEncoder()
            : BufferedEncoder{"blocking", 16, 16, meadRational{25, 1}}
        {}

        std::promise<void> entered;
        std::promise<void> release;

    protected:
        void doSendFrame(SharedFrame const&) override
        {}

        void doSendEndOfStream() override
        {}

        meadStatus doReceivePacket(Packet&) override
        {
            entered.set_value();
            release.get_future().wait();
            return MEAD_ERR_NOT_READY;
        }
    };

    SharedFrame makeFrame(std::int64_t pts, std::size_t width = 16, std::size_t height = 16, PixelFormat format = PixelFormat::Yuv420p)
    {
        auto frame = Frame{width, height, format};
        frame.setPts(pts);
        return share(std::move(frame));
    }
}

/**
 * @brief NOT_READY while buffering, END_OF_STREAM only after a full drain
 *
 * With a lookahead of 3 the first packet appears after the fourth frame.
 * Packets keep their pts and come out in order; the drained encoder is Closed
 * and keeps answering END_OF_STREAM.
 */
TEST_CASE("Encoder buffering and drain", "[encoder]")
{
    auto encoder = LookaheadEncoder{3};
    auto packet = Packet{};
    REQUIRE(encoder.state() == EncoderState::Open);

    for (auto i = 0; i < 3; ++i)
    {
        encoder.sendFrame(makeFrame(i));
        REQUIRE(encoder.receivePacket(packet) == MEAD_ERR_NOT_READY);
    }

    encoder.sendFrame(makeFrame(3));
    REQUIRE(encoder.receivePacket(packet) == MEAD_STATUS_OK);
    REQUIRE(packet.pts == 0);
    REQUIRE(packet.isKeyframe);
    REQUIRE(encoder.receivePacket(packet) == MEAD_ERR_NOT_READY);

    encoder.sendFrame(nullptr);
    REQUIRE(encoder.state() == EncoderState::Draining);

    for (auto expected = 1; expected < 4; ++expected)
    {
        REQUIRE(encoder.receivePacket(packet) == MEAD_STATUS_OK);
        REQUIRE(packet.pts == expected);
    }
    REQUIRE(encoder.receivePacket(packet) == MEAD_ERR_END_OF_STREAM);
    REQUIRE(encoder.state() == EncoderState::Closed);
    REQUIRE(encoder.receivePacket(packet) == MEAD_ERR_END_OF_STREAM);

    REQUIRE(encoder.framesSent() == 4);
    REQUIRE(encoder.packetsReceived() == 4);
}

/**
 * @brief finish() drains every packet in emission order
 */
TEST_CASE("Encoder finish", "[encoder]")
{
    auto encoder = LookaheadEncoder{8};
    for (auto i = 0; i < 5; ++i)
    {
        encoder.sendFrame(makeFrame(i));
    }

    auto const packets = encoder.finish();
    REQUIRE(packets.size() == 5);
    for (auto i = 0; i < 5; ++i)
    {
        REQUIRE(packets[i].pts == i);
    }
    REQUIRE(encoder.state() == EncoderState::Closed);

    // Nothing sent at all still drains cleanly
    auto idle = LookaheadEncoder{2};
    REQUIRE(idle.finish().empty());
}

/**
 * @brief Frames after end of stream are rejected, a repeated end of stream is not
 */
TEST_CASE("Encoder end of stream handling", "[encoder]")
{
    auto encoder = LookaheadEncoder{1};
    encoder.sendFrame(makeFrame(0));
    encoder.sendFrame(nullptr);
    encoder.sendFrame(nullptr);
    REQUIRE(encoder.endOfStreamCalls() == 1);

    REQUIRE(thrownStatus([&] { encoder.sendFrame(makeFrame(1)); }) == MEAD_ERR_INVALID_ARG);

    static_cast<void>(encoder.finish());
    REQUIRE(thrownStatus([&] { encoder.sendFrame(makeFrame(2)); }) == MEAD_ERR_INVALID_ARG);
    encoder.sendFrame(nullptr);
}

/**
 * @brief Frames must match the configured size and pixel format
 */
TEST_CASE("Encoder frame validation", "[encoder]")
{
    auto encoder = LookaheadEncoder{1};
    REQUIRE(thrownStatus([&] { encoder.sendFrame(makeFrame(0, 32, 16)); }) == MEAD_ERR_INVALID_ARG);
    REQUIRE(thrownStatus([&] { encoder.sendFrame(makeFrame(0, 16, 16, PixelFormat::Yuv444p)); }) == MEAD_ERR_INVALID_ARG);
    REQUIRE(encoder.framesSent() == 0);
    REQUIRE(encoder.state() == EncoderState::Open);
}

/**
 * @brief A second caller entering while the first is inside the encoder is rejected
 */
TEST_CASE("Encoder rejects concurrent use", "[encoder]")
{
    auto encoder = BlockingEncoder{};
    auto entered = encoder.entered.get_future();

    auto worker = std::thread{[&]
        {
            auto packet = Packet{};
            static_cast<void>(encoder.receivePacket(packet));
        }};

    entered.wait();
    REQUIRE(thrownStatus([&] { encoder.sendFrame(makeFrame(0)); }) == MEAD_ERR_INVALID_STATE);
    auto packet = Packet{};
    REQUIRE(thrownStatus([&] { static_cast<void>(encoder.receivePacket(packet)); }) == MEAD_ERR_INVALID_STATE);

    encoder.release.set_value();
    worker.join();

    encoder.sendFrame(makeFrame(0));
    REQUIRE(encoder.framesSent() == 1);
}

/**
 * @brief Backends absent from the build are reported as unsupported
 */
TEST_CASE("Encoder factory", "[encoder]")
{
    for (auto const backend : {EncoderBackend::Rav1e, EncoderBackend::SvtAv1})
    {
        auto const config = defaultConfig(backend);
        REQUIRE(backendOf(config) == backend);
        if (!isAvailable(backend))
        {
            REQUIRE(thrownStatus([&] { static_cast<void>(createEncoder(64, 64, meadRational{25, 1}, config)); }) == MEAD_ERR_UNSUPPORTED_FORMAT);
        }
        else
        {
            REQUIRE(thrownStatus([&] { static_cast<void>(createEncoder(0, 64, meadRational{25, 1}, config)); }) == MEAD_ERR_INVALID_ARG);
            REQUIRE(thrownStatus([&] { static_cast<void>(createEncoder(64, 64, meadRational{0, 1}, config)); }) == MEAD_ERR_INVALID_ARG);
        }
    }
}
