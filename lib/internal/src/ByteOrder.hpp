// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ByteOrder.hpp
 * @brief Fixed-endian integer packing for the container formats
 *
 * IVF is little-endian, ISO-BMFF is big-endian. The helpers work byte by byte
 * so they are independent of the host order and of alignment.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace mead::lib
{
    template<typename T>
    constexpr void storeLE(std::uint8_t* out, T value) noexcept
    {
        for (auto i = std::size_t{0}; i < sizeof(T); ++i)
        {
            out[i] = static_cast<std::uint8_t>(static_cast<std::uint64_t>(value) >> (8 * i));
        }
    }

    template<typename T>
    constexpr T loadLE(std::uint8_t const* in) noexcept
    {
        auto value = std::uint64_t{0};
        for (auto i = std::size_t{0}; i < sizeof(T); ++i)
        {
            value |= static_cast<std::uint64_t>(in[i]) << (8 * i);
        }
        return static_cast<T>(value);
    }

    template<typename T>
    constexpr T loadBE(std::uint8_t const* in) noexcept
    {
        auto value = std::uint64_t{0};
        for (auto i = std::size_t{0}; i < sizeof(T); ++i)
        {
            value = (value << 8) | in[i];
        }
        return static_cast<T>(value);
    }

    /** Printable form of a four character code, non-printable bytes as '.'. */
    inline std::string fourccToString(std::uint32_t fourcc)
    {
        auto result = std::string(4, '.');
        for (auto i = 0; i < 4; ++i)
        {
            auto const c = static_cast<char>((fourcc >> (8 * (3 - i))) & 0xFF);
            if ((c >= 0x20) && (c < 0x7F))
            {
                result[i] = c;
            }
        }
        return result;
    }
}
