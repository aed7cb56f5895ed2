// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file EncoderConfig.hpp
 * @brief Configuration of the AV1 encoder backends
 *
 * The set of backends is closed, so the configuration is a std::variant with
 * one alternative per backend. createEncoder() dispatches on it once.
 *
 * Tile counts and thread counts use 0 for "pick automatically": threads become
 * the number of available cores, tiles come from calculateTiles() (both tile
 * counts must be non-zero to override the automatic choice).
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>
#include <mead/platform.h>

namespace mead::lib
{
    enum class EncoderBackend
    {
        Rav1e,
        SvtAv1,
    };

    /** "rav1e" or "svt-av1". */
    MEAD_EXPORT
    char const* toString(EncoderBackend backend) noexcept;

    /**
     * Parse a backend name, case-insensitively. Accepts "rav1e", "svt-av1" and "svtav1".
     */
    [[nodiscard]]
    MEAD_EXPORT
    std::optional<EncoderBackend> encoderBackendFromString(std::string_view name);

    struct Rav1eConfig
    {
        std::uint8_t speed = 6;       ///< 0 (slowest, best) .. 10 (fastest)
        std::uint8_t quantizer = 100; ///< 0 .. 255
        std::optional<std::uint32_t> bitrateKbps;
        std::uint32_t tileCols = 0;
        std::uint32_t tileRows = 0;
        std::uint32_t threads = 0;
    };

    struct SvtAv1Config
    {
        std::uint8_t preset = 8; ///< 0 (slowest) .. 13 (fastest)
        std::uint32_t qp = 35;   ///< 0 .. 63
        std::uint32_t bitDepth = 8;
        std::uint32_t tileCols = 0;
        std::uint32_t tileRows = 0;
        std::uint32_t threads = 0; ///< Only used to size the automatic tile grid
    };

    using EncoderConfig = std::variant<Rav1eConfig, SvtAv1Config>;

    [[nodiscard]]
    MEAD_EXPORT
    EncoderBackend backendOf(EncoderConfig const& config) noexcept;

    /** Default configuration of a backend. */
    [[nodiscard]]
    MEAD_EXPORT
    EncoderConfig defaultConfig(EncoderBackend backend);

    /** @throws Exception (MEAD_ERR_INVALID_ARG) for a value out of range. */
    MEAD_EXPORT
    void validate(Rav1eConfig const& config);

    /** @throws Exception (MEAD_ERR_INVALID_ARG) for a value out of range. */
    MEAD_EXPORT
    void validate(SvtAv1Config const& config);
}
