// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file BufferedEncoder.hpp
 * @brief State machine common to every encoder backend
 *
 * BufferedEncoder implements the public Encoder protocol once: state
 * transitions, frame validation, the single-caller guard and the bookkeeping
 * of end of stream. A backend only implements three hooks that talk to its
 * native library:
 *
 * - doSendFrame(frame)      : hand a validated frame to the library
 * - doSendEndOfStream()     : tell the library no more frames will come (called once)
 * - doReceivePacket(packet) : MEAD_STATUS_OK, MEAD_ERR_NOT_READY, or
 *                             MEAD_ERR_END_OF_STREAM once fully flushed
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mead/platform.h>
#include <mead/rational.h>
#include "mead-internal/Encoder.hpp"

namespace mead::lib
{
    class MEAD_EXPORT BufferedEncoder : public Encoder
    {
    public:
        BufferedEncoder(BufferedEncoder const&) = delete;
        BufferedEncoder(BufferedEncoder&&) = delete;
        BufferedEncoder& operator=(BufferedEncoder const&) = delete;
        BufferedEncoder& operator=(BufferedEncoder&&) = delete;

        void sendFrame(SharedFrame frame) final;
        meadStatus receivePacket(Packet& packet) final;
        EncoderState state() const noexcept final;

        [[nodiscard]]
        std::size_t width() const noexcept;
        [[nodiscard]]
        std::size_t height() const noexcept;
        [[nodiscard]]
        PixelFormat pixelFormat() const noexcept;
        [[nodiscard]]
        meadRational frameRate() const noexcept;
        /** Frames accepted so far. */
        [[nodiscard]]
        std::uint64_t framesSent() const noexcept;
        /** Packets delivered so far. */
        [[nodiscard]]
        std::uint64_t packetsReceived() const noexcept;

    protected:
        /**
         * @throws Exception (MEAD_ERR_INVALID_ARG) for a zero size or a frame
         *         rate with a non-positive term.
         */
        BufferedEncoder(char const* name, std::size_t width, std::size_t height, meadRational frameRate, PixelFormat format = PixelFormat::Yuv420p);

        virtual void doSendFrame(SharedFrame const& frame) = 0;
        virtual void doSendEndOfStream() = 0;
        virtual meadStatus doReceivePacket(Packet& packet) = 0;

    private:
        /** Marks the encoder busy for the lifetime of one public call. */
        class EntryGuard
        {
        public:
            explicit EntryGuard(std::atomic<bool>& busy);
            ~EntryGuard();

            EntryGuard(EntryGuard const&) = delete;
            EntryGuard& operator=(EntryGuard const&) = delete;

        private:
            std::atomic<bool>& _busy;
        };

        char const* _name;
        std::size_t _width;
        std::size_t _height;
        meadRational _frameRate;
        PixelFormat _format;
        EncoderState _state;
        std::atomic<bool> _busy;
        std::uint64_t _framesSent;
        std::uint64_t _packetsReceived;
    };
}
