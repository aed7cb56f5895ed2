// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file EncoderOptionsParser.cpp
 * @brief Encoder options from JSON
 *
 * The options string usually comes straight from the command line
 * (`mead encode --options '{"speed": 8}'`). Values are range checked here so
 * that a typo fails before any native encoder handle is created.
 */

#include "mead-internal/EncoderOptionsParser.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <string_view>
#include "mead-internal/Exception.hpp"
#include "mead-internal/Logging.hpp"

namespace mead::lib
{
    namespace
    {
        constexpr auto Rav1eFields = std::array<std::string_view, 6>{"speed", "quantizer", "bitrateKbps", "tileCols", "tileRows", "threads"};
        constexpr auto SvtAv1Fields = std::array<std::string_view, 6>{"preset", "qp", "bitDepth", "tileCols", "tileRows", "threads"};

        constexpr auto MaxThreads = 256U;
        constexpr auto MaxTiles = 64U;
    }

    EncoderOptionsParser::EncoderOptionsParser(std::string const& options)
    {
        // Empty options string means use all defaults
        if (options.empty())
        {
            return;
        }

        auto jsonValue = picojson::value{};
        auto const err = picojson::parse(jsonValue, options);
        if (!err.empty())
        {
            throw Exception::invalidArgument("Invalid JSON encoder options. {}", err);
        }

        if (!jsonValue.is<picojson::object>())
        {
            throw Exception::invalidArgument("Encoder options must be a JSON object");
        }
        _root = jsonValue.get<picojson::object>();
    }

    std::optional<std::uint32_t> EncoderOptionsParser::getUnsigned(std::string const& field, std::uint32_t min, std::uint32_t max) const
    {
        auto const it = _root.find(field);
        if (it == _root.end())
        {
            return std::nullopt;
        }

        // picojson stores every number as a double
        if (!it->second.is<double>())
        {
            throw Exception::invalidArgument("Encoder option '{}' must be a number", field);
        }

        auto const v = it->second.get<double>();
        if ((std::floor(v) != v) || (v < min) || (v > max))
        {
            throw Exception::invalidArgument("Encoder option '{}' must be an integer in [{}, {}], got {}", field, min, max, v);
        }
        return static_cast<std::uint32_t>(v);
    }

    void EncoderOptionsParser::warnUnused(EncoderBackend backend) const
    {
        auto const& known = (backend == EncoderBackend::Rav1e) ? Rav1eFields : SvtAv1Fields;
        for (auto const& [key, value] : _root)
        {
            if (std::find(known.begin(), known.end(), key) == known.end())
            {
                MEAD_WARN("Encoder option '{}' is not used by {}", key, toString(backend));
            }
        }
    }

    EncoderConfig EncoderOptionsParser::configFor(EncoderBackend backend) const
    {
        warnUnused(backend);

        auto const tileCols = getUnsigned("tileCols", 0, MaxTiles);
        auto const tileRows = getUnsigned("tileRows", 0, MaxTiles);
        auto const threads = getUnsigned("threads", 0, MaxThreads);

        if (backend == EncoderBackend::Rav1e)
        {
            auto config = Rav1eConfig{};
            if (auto const v = getUnsigned("speed", 0, 10); v)
            {
                config.speed = static_cast<std::uint8_t>(*v);
            }
            if (auto const v = getUnsigned("quantizer", 0, 255); v)
            {
                config.quantizer = static_cast<std::uint8_t>(*v);
            }
            config.bitrateKbps = getUnsigned("bitrateKbps", 1, std::numeric_limits<std::uint32_t>::max() / 1000);
            config.tileCols = tileCols.value_or(config.tileCols);
            config.tileRows = tileRows.value_or(config.tileRows);
            config.threads = threads.value_or(config.threads);
            validate(config);
            return config;
        }

        auto config = SvtAv1Config{};
        if (auto const v = getUnsigned("preset", 0, 13); v)
        {
            config.preset = static_cast<std::uint8_t>(*v);
        }
        config.qp = getUnsigned("qp", 0, 63).value_or(config.qp);
        config.bitDepth = getUnsigned("bitDepth", 8, 10).value_or(config.bitDepth);
        config.tileCols = tileCols.value_or(config.tileCols);
        config.tileRows = tileRows.value_or(config.tileRows);
        config.threads = threads.value_or(config.threads);
        validate(config);
        return config;
    }
}
