// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file EncoderOptionsParser.hpp
 * @brief Parse encoder options from a JSON object
 *
 * Options are a flat JSON object. Every field is optional; fields the selected
 * backend does not use are ignored with a warning.
 *
 *   Field         | Backend  | Range
 *   --------------|----------|------------------------------
 *   speed         | rav1e    | 0..10
 *   quantizer     | rav1e    | 0..255
 *   bitrateKbps   | rav1e    | >= 1
 *   preset        | svt-av1  | 0..13
 *   qp            | svt-av1  | 0..63
 *   bitDepth      | svt-av1  | 8 or 10
 *   tileCols      | both     | 0 (auto) or a power of two
 *   tileRows      | both     | 0 (auto) or a power of two
 *   threads       | both     | 0 (auto) or more
 *
 * Example:
 * {
 *   "speed": 8,
 *   "quantizer": 80,
 *   "threads": 4
 * }
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <picojson/picojson.h>
#include <mead/platform.h>
#include "mead-internal/EncoderConfig.hpp"

namespace mead::lib
{
    /**
     * Parses encoder options JSON.
     *
     * Thread-safety: Immutable after construction (thread-safe for reads).
     */
    class MEAD_EXPORT EncoderOptionsParser
    {
    public:
        /** Default constructor: no options (backend defaults). */
        EncoderOptionsParser() = default;

        /**
         * Parse a JSON string of encoder options. An empty string means no options.
         *
         * @throws Exception (MEAD_ERR_INVALID_ARG) if the JSON is malformed or
         *         not an object.
         */
        explicit EncoderOptionsParser(std::string const& options);

        /**
         * Build the configuration of a backend: its defaults overridden by the
         * parsed fields.
         *
         * @throws Exception (MEAD_ERR_INVALID_ARG) for a field of the wrong type
         *         or out of range.
         */
        [[nodiscard]]
        EncoderConfig configFor(EncoderBackend backend) const;

    private:
        /** Integer field in [min, max], std::nullopt when absent. */
        std::optional<std::uint32_t> getUnsigned(std::string const& field, std::uint32_t min, std::uint32_t max) const;

        void warnUnused(EncoderBackend backend) const;

        /**
         * Parsed JSON object (picojson), kept so that each backend picks its
         * own fields.
         */
        picojson::object _root;
    };
}
