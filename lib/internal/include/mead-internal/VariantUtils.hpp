// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
//
// SPDX-License-Identifier: Apache-2.0

/**
 * @file VariantUtils.hpp
 * @brief Template utilities for working with std::variant
 */

#pragma once

namespace mead::lib
{
    /**
     * @struct overloaded
     * @brief Inline lambda visitor for std::variant
     *
     * USAGE EXAMPLE:
     * ```cpp
     * std::visit(overloaded{
     *     [](Rav1eConfig const& c) { ... },
     *     [](SvtAv1Config const& c) { ... }
     * }, encoderConfig);
     * ```
     *
     * USED IN MEAD:
     * - createEncoder() dispatches on the EncoderConfig alternative
     * - encoderBackendOf() maps a configuration to its backend tag
     *
     * @tparam Ts Parameter pack of callable types (typically lambdas)
     */
    template<class... Ts>
    struct overloaded : Ts...
    {
        using Ts::operator()...; ///< Bring all call operators from base classes into scope
    };
}
