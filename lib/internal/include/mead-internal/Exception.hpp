// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Exception.hpp
 * @brief Exception type used for every failure reported by mead
 *
 * ERROR HANDLING STRATEGY:
 * - Fallible operations throw mead::lib::Exception, which carries a meadStatus
 *   category alongside a formatted message
 * - "No more data" is never an exception: demuxers return std::nullopt and
 *   encoders return MEAD_ERR_NOT_READY / MEAD_ERR_END_OF_STREAM by value
 * - Foreign library error codes (rav1e, SVT-AV1, libopus) are translated into a
 *   MEAD_ERR_CODEC exception whose message includes the library's own text
 *
 * The factory functions use fmt::format for type-safe formatting:
 * ```cpp
 * throw Exception::containerParse("box '{}' exceeds its parent ({} > {})", type, size, limit);
 * ```
 */

#pragma once

#include <exception>
#include <string>
#include <utility>
#include <fmt/format.h>
#include <mead/mead.h>

namespace mead::lib
{
    /**
     * @class Exception
     * @brief Base exception class for the mead library
     *
     * The status code indicates the failure category:
     * I/O, container parse, codec, unsupported format, invalid input.
     */
    class MEAD_EXPORT Exception : public std::exception
    {
    public:
        Exception(std::string msg, meadStatus status);

        /** \brief Make any type of exception.
         */
        template<typename... T>
        static Exception make(meadStatus status, fmt::format_string<T...> fmt, T&&... args)
        {
            return Exception(fmt::format(fmt, std::forward<T>(args)...), status);
        }

        /** \brief Make an MEAD_ERR_INVALID_ARG exception.
         */
        template<typename... T>
        static Exception invalidArgument(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(MEAD_ERR_INVALID_ARG, fmt, std::forward<T>(args)...);
        }

        /** \brief Make an MEAD_ERR_IO exception.
         */
        template<typename... T>
        static Exception io(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(MEAD_ERR_IO, fmt, std::forward<T>(args)...);
        }

        /** \brief Make an MEAD_ERR_CONTAINER_PARSE exception.
         */
        template<typename... T>
        static Exception containerParse(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(MEAD_ERR_CONTAINER_PARSE, fmt, std::forward<T>(args)...);
        }

        /** \brief Make an MEAD_ERR_CODEC exception.
         */
        template<typename... T>
        static Exception codec(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(MEAD_ERR_CODEC, fmt, std::forward<T>(args)...);
        }

        /** \brief Make an MEAD_ERR_UNSUPPORTED_FORMAT exception.
         */
        template<typename... T>
        static Exception unsupportedFormat(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(MEAD_ERR_UNSUPPORTED_FORMAT, fmt, std::forward<T>(args)...);
        }

        /** \brief Make an MEAD_ERR_INVALID_STATE exception.
         */
        template<typename... T>
        static Exception invalidState(fmt::format_string<T...> fmt, T&&... args)
        {
            return make(MEAD_ERR_INVALID_STATE, fmt, std::forward<T>(args)...);
        }

        /** \brief Return the meadStatus code that describes the condition
         * that led to the exception being thrown.
         */
        [[nodiscard]]
        meadStatus status() const noexcept;

        /** \brief Implements std::exception, returns a descriptive string about the error.
         */
        [[nodiscard]]
        char const* what() const noexcept override;

    private:
        std::string _msg;
        meadStatus _status;
    };
}
