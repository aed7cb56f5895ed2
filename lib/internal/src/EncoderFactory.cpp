// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

#include "mead-internal/EncoderFactory.hpp"
#include <variant>
#include "mead-internal/Exception.hpp"
#include "mead-internal/Logging.hpp"
#include "mead-internal/VariantUtils.hpp"

#ifdef MEAD_HAVE_RAV1E
#   include "Rav1eEncoder.hpp"
#endif
#ifdef MEAD_HAVE_SVTAV1
#   include "SvtAv1Encoder.hpp"
#endif

namespace mead::lib
{
    bool isAvailable(EncoderBackend backend) noexcept
    {
        switch (backend)
        {
            case EncoderBackend::Rav1e:
#ifdef MEAD_HAVE_RAV1E
                return true;
#else
                return false;
#endif
            case EncoderBackend::SvtAv1:
#ifdef MEAD_HAVE_SVTAV1
                return true;
#else
                return false;
#endif
        }
        return false;
    }

    std::unique_ptr<Encoder> createEncoder(std::size_t width, std::size_t height, meadRational frameRate, EncoderConfig const& config)
    {
        auto const backend = backendOf(config);
        if (!isAvailable(backend))
        {
            throw Exception::unsupportedFormat("The {} encoder is not available in this build.", toString(backend));
        }

        MEAD_DEBUG("Creating {} encoder for {}x{} @ {}/{}", toString(backend), width, height, frameRate.numerator, frameRate.denominator);

        return std::visit(
            overloaded{
                [&](Rav1eConfig const& c) -> std::unique_ptr<Encoder>
                {
#ifdef MEAD_HAVE_RAV1E
                    return std::make_unique<Rav1eEncoder>(width, height, frameRate, c);
#else
                    static_cast<void>(c);
                    throw Exception::unsupportedFormat("The rav1e encoder is not available in this build.");
#endif
                },
                [&](SvtAv1Config const& c) -> std::unique_ptr<Encoder>
                {
#ifdef MEAD_HAVE_SVTAV1
                    return std::make_unique<SvtAv1Encoder>(width, height, frameRate, c);
#else
                    static_cast<void>(c);
                    throw Exception::unsupportedFormat("The svt-av1 encoder is not available in this build.");
#endif
                },
            },
            config);
    }
}
