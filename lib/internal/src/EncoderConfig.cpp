// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

#include "mead-internal/EncoderConfig.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include "mead-internal/Exception.hpp"
#include "mead-internal/VariantUtils.hpp"

namespace mead::lib
{
    namespace
    {
        constexpr auto MaxRav1eSpeed = 10U;
        constexpr auto MaxSvtPreset = 13U;
        constexpr auto MaxSvtQp = 63U;

        void validateTiles(char const* backend, std::uint32_t cols, std::uint32_t rows)
        {
            auto const valid = [](std::uint32_t n) { return (n == 0) || ((n <= 64) && ((n & (n - 1)) == 0)); };
            if (!valid(cols) || !valid(rows))
            {
                throw Exception::invalidArgument("{}: tile counts must be 0 or a power of two up to 64, got {}x{}", backend, cols, rows);
            }
        }
    }

    char const* toString(EncoderBackend backend) noexcept
    {
        switch (backend)
        {
            case EncoderBackend::Rav1e:  return "rav1e";
            case EncoderBackend::SvtAv1: return "svt-av1";
        }
        return "unknown";
    }

    std::optional<EncoderBackend> encoderBackendFromString(std::string_view name)
    {
        auto lower = std::string{name};
        std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "rav1e")
        {
            return EncoderBackend::Rav1e;
        }
        if ((lower == "svt-av1") || (lower == "svtav1"))
        {
            return EncoderBackend::SvtAv1;
        }
        return std::nullopt;
    }

    EncoderBackend backendOf(EncoderConfig const& config) noexcept
    {
        return std::visit(overloaded{
                              [](Rav1eConfig const&) { return EncoderBackend::Rav1e; },
                              [](SvtAv1Config const&) { return EncoderBackend::SvtAv1; },
                          },
            config);
    }

    EncoderConfig defaultConfig(EncoderBackend backend)
    {
        switch (backend)
        {
            case EncoderBackend::Rav1e:  return Rav1eConfig{};
            case EncoderBackend::SvtAv1: return SvtAv1Config{};
        }
        throw Exception::invalidArgument("Unknown encoder backend {}", static_cast<int>(backend));
    }

    void validate(Rav1eConfig const& config)
    {
        if (config.speed > MaxRav1eSpeed)
        {
            throw Exception::invalidArgument("rav1e: speed must be 0-{}, got {}", MaxRav1eSpeed, config.speed);
        }
        if (config.bitrateKbps.has_value() && (*config.bitrateKbps == 0))
        {
            throw Exception::invalidArgument("rav1e: bitrate must be positive");
        }
        validateTiles("rav1e", config.tileCols, config.tileRows);
    }

    void validate(SvtAv1Config const& config)
    {
        if (config.preset > MaxSvtPreset)
        {
            throw Exception::invalidArgument("svt-av1: preset must be 0-{}, got {}", MaxSvtPreset, config.preset);
        }
        if (config.qp > MaxSvtQp)
        {
            throw Exception::invalidArgument("svt-av1: qp must be 0-{}, got {}", MaxSvtQp, config.qp);
        }
        if ((config.bitDepth != 8) && (config.bitDepth != 10))
        {
            throw Exception::invalidArgument("svt-av1: bit depth must be 8 or 10, got {}", config.bitDepth);
        }
        validateTiles("svt-av1", config.tileCols, config.tileRows);
    }
}
