// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Rational.hpp
 * @brief Utility functions for working with meadRational (frame rates, pixel aspect ratios)
 *
 * Frame rates travel through mead as exact rationals (e.g. 30000/1001) from the
 * Y4M header down to the encoder and the IVF header. Nothing here divides.
 *
 * - A frame rate needs both terms strictly positive
 * - Equality is tested via cross-multiplication so non-reduced fractions compare equal
 */

#pragma once

#include <mead/rational.h>

/**
 * Check that a rational is usable as a frame rate: both terms strictly positive.
 */
constexpr bool isPositive(meadRational const& rational) noexcept
{
    return (rational.numerator > 0) && (rational.denominator > 0);
}

/**
 * Test equality of two rational numbers using cross-multiplication.
 * Works for fractions that are not in lowest terms (2/4 == 1/2).
 */
constexpr bool operator==(meadRational const& lhs, meadRational const& rhs) noexcept
{
    return (lhs.numerator * rhs.denominator) == (lhs.denominator * rhs.numerator);
}

constexpr bool operator!=(meadRational const& lhs, meadRational const& rhs) noexcept
{
    return !(lhs == rhs);
}
