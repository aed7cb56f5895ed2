// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Demuxer.hpp
 * @brief Pull interface of all container readers
 */

#pragma once

#include <optional>
#include <mead/platform.h>
#include "mead-internal/Packet.hpp"

namespace mead::lib
{
    /**
     * A demuxer yields the packets of one elementary stream at a time, in
     * container order. Demuxing is synchronous and single threaded.
     */
    class MEAD_EXPORT Demuxer
    {
    public:
        virtual ~Demuxer();

        /**
         * Read the next packet.
         *
         * @return the packet, or std::nullopt once there is nothing more to read.
         * @throws Exception on I/O or container parse failures.
         */
        [[nodiscard]]
        virtual std::optional<Packet> readPacket() = 0;

        /** Container information computed when the source was opened. */
        [[nodiscard]]
        virtual Metadata const& metadata() const noexcept = 0;
    };
}
