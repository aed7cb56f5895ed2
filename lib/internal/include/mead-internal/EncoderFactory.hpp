// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file EncoderFactory.hpp
 * @brief Creates the encoder backend selected by an EncoderConfig
 */

#pragma once

#include <cstddef>
#include <memory>
#include <mead/platform.h>
#include <mead/rational.h>
#include "mead-internal/Encoder.hpp"
#include "mead-internal/EncoderConfig.hpp"

namespace mead::lib
{
    /**
     * Whether the backend was compiled into this build.
     */
    [[nodiscard]]
    MEAD_EXPORT
    bool isAvailable(EncoderBackend backend) noexcept;

    /**
     * Create an encoder for 8 bit 4:2:0 frames of the given size.
     *
     * @throws Exception (MEAD_ERR_UNSUPPORTED_FORMAT) if the backend is not part of this build.
     *         (MEAD_ERR_INVALID_ARG) for a zero size, a bad frame rate or an invalid configuration.
     *         (MEAD_ERR_CODEC) if the native library refuses to initialise.
     */
    [[nodiscard]]
    MEAD_EXPORT
    std::unique_ptr<Encoder> createEncoder(std::size_t width, std::size_t height, meadRational frameRate, EncoderConfig const& config);
}
