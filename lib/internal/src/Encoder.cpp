// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Encoder.cpp
 * @brief Encoder protocol and the BufferedEncoder state machine
 */

#include "mead-internal/BufferedEncoder.hpp"
#include "mead-internal/Encoder.hpp"
#include "mead-internal/Exception.hpp"
#include "mead-internal/Logging.hpp"
#include "mead-internal/Rational.hpp"

namespace mead::lib
{
    char const* toString(EncoderState state) noexcept
    {
        switch (state)
        {
            case EncoderState::Open:     return "open";
            case EncoderState::Draining: return "draining";
            case EncoderState::Closed:   return "closed";
        }
        return "unknown";
    }

    /////////////////////////////////////////////////////////////////////////
    // Encoder
    /////////////////////////////////////////////////////////////////////////

    Encoder::~Encoder() = default;

    std::vector<Packet> Encoder::finish()
    {
        sendFrame(nullptr);

        auto packets = std::vector<Packet>{};
        while (true)
        {
            auto packet = Packet{};
            auto const status = receivePacket(packet);
            if (status == MEAD_STATUS_OK)
            {
                packets.push_back(std::move(packet));
            }
            else if (status == MEAD_ERR_END_OF_STREAM)
            {
                return packets;
            }
            // MEAD_ERR_NOT_READY: the backend is still flushing, poll again
        }
    }

    /////////////////////////////////////////////////////////////////////////
    // BufferedEncoder
    /////////////////////////////////////////////////////////////////////////

    BufferedEncoder::EntryGuard::EntryGuard(std::atomic<bool>& busy)
        : _busy{busy}
    {
        if (_busy.exchange(true, std::memory_order_acquire))
        {
            throw Exception::invalidState("Encoder is already being driven by another caller");
        }
    }

    BufferedEncoder::EntryGuard::~EntryGuard()
    {
        _busy.store(false, std::memory_order_release);
    }

    BufferedEncoder::BufferedEncoder(char const* name, std::size_t width, std::size_t height, meadRational frameRate, PixelFormat format)
        : _name{name}
        , _width{width}
        , _height{height}
        , _frameRate{frameRate}
        , _format{format}
        , _state{EncoderState::Open}
        , _busy{false}
        , _framesSent{0}
        , _packetsReceived{0}
    {
        if ((width == 0) || (height == 0))
        {
            throw Exception::invalidArgument("{}: invalid frame size {}x{}", name, width, height);
        }
        if (!isPositive(frameRate))
        {
            throw Exception::invalidArgument("{}: invalid frame rate {}/{}", name, frameRate.numerator, frameRate.denominator);
        }
    }

    void BufferedEncoder::sendFrame(SharedFrame frame)
    {
        auto const guard = EntryGuard{_busy};

        if (!frame)
        {
            if (_state != EncoderState::Open)
            {
                MEAD_DEBUG("{}: end of stream already signalled, ignoring", _name);
                return;
            }

            doSendEndOfStream();
            _state = EncoderState::Draining;
            MEAD_DEBUG("{}: end of stream after {} frames, draining", _name, _framesSent);
            return;
        }

        if (_state != EncoderState::Open)
        {
            throw Exception::invalidArgument("{}: cannot send a frame in state '{}'", _name, toString(_state));
        }
        if (frame->format() != _format)
        {
            throw Exception::invalidArgument("{}: expected {} frames, got {}", _name, toString(_format), toString(frame->format()));
        }
        if ((frame->width() != _width) || (frame->height() != _height))
        {
            throw Exception::invalidArgument("{}: frame size {}x{} does not match the configured {}x{}", _name, frame->width(), frame->height(), _width, _height);
        }

        doSendFrame(frame);
        ++_framesSent;
    }

    meadStatus BufferedEncoder::receivePacket(Packet& packet)
    {
        auto const guard = EntryGuard{_busy};

        if (_state == EncoderState::Closed)
        {
            return MEAD_ERR_END_OF_STREAM;
        }

        auto const status = doReceivePacket(packet);
        switch (status)
        {
            case MEAD_STATUS_OK:
                ++_packetsReceived;
                return status;

            case MEAD_ERR_NOT_READY:
                return status;

            case MEAD_ERR_END_OF_STREAM:
                if (_state == EncoderState::Open)
                {
                    throw Exception::codec("{}: encoder reported end of stream before it was signalled", _name);
                }
                _state = EncoderState::Closed;
                MEAD_INFO("{}: encoded {} frames into {} packets", _name, _framesSent, _packetsReceived);
                return status;

            default:
                throw Exception::codec("{}: unexpected backend status {}", _name, meadStatusToString(status));
        }
    }

    EncoderState BufferedEncoder::state() const noexcept
    {
        return _state;
    }

    std::size_t BufferedEncoder::width() const noexcept
    {
        return _width;
    }

    std::size_t BufferedEncoder::height() const noexcept
    {
        return _height;
    }

    PixelFormat BufferedEncoder::pixelFormat() const noexcept
    {
        return _format;
    }

    meadRational BufferedEncoder::frameRate() const noexcept
    {
        return _frameRate;
    }

    std::uint64_t BufferedEncoder::framesSent() const noexcept
    {
        return _framesSent;
    }

    std::uint64_t BufferedEncoder::packetsReceived() const noexcept
    {
        return _packetsReceived;
    }
}
