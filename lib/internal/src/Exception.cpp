// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Exception.cpp
 * @brief Implementation of the mead exception type
 */

#include "mead-internal/Exception.hpp"

namespace mead::lib
{
    // Construct Exception with message and mead status code
    Exception::Exception(std::string msg, meadStatus status)
        : _msg(std::move(msg))
        , _status(status)
    {}

    // Get the mead status code associated with this exception
    meadStatus Exception::status() const noexcept
    {
        return _status;
    }

    // Implement std::exception::what() - return error message
    char const* Exception::what() const noexcept
    {
        return _msg.c_str();
    }
}
