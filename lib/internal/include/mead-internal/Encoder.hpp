// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Encoder.hpp
 * @brief Send/receive protocol shared by all video encoders
 *
 *   Open      --sendFrame(nullptr)-->  Draining  --receivePacket() == END_OF_STREAM-->  Closed
 *
 * - sendFrame(frame) is accepted only while Open.
 * - sendFrame(nullptr) signals end of stream. Repeating it is harmless.
 * - receivePacket() returns MEAD_STATUS_OK with a packet, MEAD_ERR_NOT_READY
 *   while the encoder buffers (lookahead, rate control), and
 *   MEAD_ERR_END_OF_STREAM once a drained encoder has nothing left.
 *
 * Encoders may hold several frames before the first packet appears and may
 * reorder internally. Callers poll in a loop and take timestamps from the
 * packets, never from the order in which frames were sent.
 *
 * An encoder instance is driven by one caller at a time; a concurrent call is
 * rejected with MEAD_ERR_INVALID_STATE.
 */

#pragma once

#include <vector>
#include <mead/mead.h>
#include <mead/platform.h>
#include "mead-internal/Frame.hpp"
#include "mead-internal/Packet.hpp"

namespace mead::lib
{
    enum class EncoderState
    {
        Open,
        Draining,
        Closed,
    };

    MEAD_EXPORT
    char const* toString(EncoderState state) noexcept;

    class MEAD_EXPORT Encoder
    {
    public:
        virtual ~Encoder();

        /**
         * Submit a frame, or nullptr to signal end of stream.
         *
         * @throws Exception (MEAD_ERR_INVALID_ARG) for a frame whose size or
         *         format does not match the encoder, or for a frame sent after
         *         end of stream. (MEAD_ERR_CODEC) if the backend fails.
         */
        virtual void sendFrame(SharedFrame frame) = 0;

        /**
         * Poll for an encoded packet.
         *
         * @return MEAD_STATUS_OK (packet filled), MEAD_ERR_NOT_READY or MEAD_ERR_END_OF_STREAM.
         * @throws Exception (MEAD_ERR_CODEC) if the backend fails.
         */
        [[nodiscard]]
        virtual meadStatus receivePacket(Packet& packet) = 0;

        [[nodiscard]]
        virtual EncoderState state() const noexcept = 0;

        /**
         * Signal end of stream and drain every remaining packet in emission order.
         */
        [[nodiscard]]
        std::vector<Packet> finish();
    };
}
