// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Rav1eEncoder.hpp
 * @brief AV1 encoding through the rav1e C API
 *
 * Owns one RaContext. rav1e refuses frames once its lookahead is full
 * (RA_ENCODER_STATUS_ENOUGH_DATA), so accepted frames wait in a local queue
 * and are fed to the context whenever it has room: on send and before every
 * receive. The end of stream flush is sent only after that queue is empty.
 *
 * rav1e numbers input frames from 0 in submission order. The pts of every
 * submitted frame is remembered by that number and copied onto the packet
 * reporting it.
 */

#pragma once

#include <cstdint>
#include <deque>
#include <vector>
#include <rav1e/rav1e.h>
#include "mead-internal/BufferedEncoder.hpp"
#include "mead-internal/EncoderConfig.hpp"

namespace mead::lib
{
    class Rav1eEncoder final : public BufferedEncoder
    {
    public:
        /**
         * @throws Exception (MEAD_ERR_INVALID_ARG) for an invalid configuration,
         *         (MEAD_ERR_CODEC) if rav1e rejects it.
         */
        Rav1eEncoder(std::size_t width, std::size_t height, meadRational frameRate, Rav1eConfig const& config);
        ~Rav1eEncoder() override;

    protected:
        void doSendFrame(SharedFrame const& frame) override;
        void doSendEndOfStream() override;
        meadStatus doReceivePacket(Packet& packet) override;

    private:
        /** Push queued frames (and the flush) until rav1e is full. */
        void feed();

        RaContext* _context;
        std::deque<SharedFrame> _queued;
        bool _flushPending;
        bool _flushed;
        std::uint64_t _submitted;
        std::vector<std::int64_t> _ptsByFrameNumber;
    };
}
