// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Muxer.hpp
 * @brief Push interface of all container writers
 */

#pragma once

#include <mead/platform.h>
#include "mead-internal/Packet.hpp"

namespace mead::lib
{
    /**
     * A muxer accepts packets and serialises them into its sink.
     *
     * finalize() is rvalue-qualified: it is called as `std::move(muxer).finalize()`
     * and leaves the muxer without a sink. Any later writePacket() or finalize()
     * throws Exception with MEAD_ERR_INVALID_ARG.
     */
    class MEAD_EXPORT Muxer
    {
    public:
        virtual ~Muxer();

        /**
         * @throws Exception (MEAD_ERR_INVALID_ARG) for packets the container
         *         cannot hold or after finalize().
         * @throws Exception (MEAD_ERR_IO) if the sink fails.
         */
        virtual void writePacket(Packet packet) = 0;

        /** Flush everything and release the sink. */
        virtual void finalize() && = 0;
    };
}
