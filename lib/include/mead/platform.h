// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file platform.h
 * @brief Symbol visibility for the mead shared library.
 */

#pragma once

/*
 * ---------------------------------------------------------------------------
 * MEAD_EXPORT  --  Shared library symbol visibility
 * ---------------------------------------------------------------------------
 * The library is built with -fvisibility=hidden. On GCC and Clang we use the
 * "default" visibility attribute so the linker exports the symbol from the
 * .so / .dylib. Elsewhere the macro expands to nothing.
 */
#if defined(__GNUC__) || defined(__clang__)
#   define MEAD_EXPORT __attribute__((visibility("default")))
#else
#   define MEAD_EXPORT
#endif
