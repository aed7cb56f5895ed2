// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file SvtAv1Encoder.hpp
 * @brief AV1 encoding through the SVT-AV1 C API
 *
 * Owns exactly one EbComponentType handle, acquired in the constructor and
 * released in the destructor (svt_av1_enc_deinit, then
 * svt_av1_enc_deinit_handle). If construction fails after the handle was
 * created, the handle is released before the exception leaves the
 * constructor. The handle never leaves this class.
 *
 * SVT-AV1 copies input pictures during svt_av1_enc_send_picture(), so frames
 * are not retained. Input pts travels through the library and comes back on
 * the output buffer.
 */

#pragma once

#include <cstdint>
#include <svt-av1/EbSvtAv1Enc.h>
#include "mead-internal/BufferedEncoder.hpp"
#include "mead-internal/EncoderConfig.hpp"

namespace mead::lib
{
    class SvtAv1Encoder final : public BufferedEncoder
    {
    public:
        /**
         * @throws Exception (MEAD_ERR_INVALID_ARG) for an invalid configuration
         *         (checked before the handle is acquired),
         *         (MEAD_ERR_UNSUPPORTED_FORMAT) for 10 bit encoding of 8 bit frames,
         *         (MEAD_ERR_CODEC) if SVT-AV1 fails to initialise.
         */
        SvtAv1Encoder(std::size_t width, std::size_t height, meadRational frameRate, SvtAv1Config const& config);
        ~SvtAv1Encoder() override;

    protected:
        void doSendFrame(SharedFrame const& frame) override;
        void doSendEndOfStream() override;
        meadStatus doReceivePacket(Packet& packet) override;

    private:
        EbComponentType* _handle;
        bool _endOfStreamSent;
        bool _endOfStreamReceived;
        std::uint64_t _frameCount;
    };
}
