// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file Logging.cpp
 * @brief Runtime log level configuration for the mead library
 *
 * The logging macros (MEAD_ERROR, MEAD_WARN, MEAD_INFO, MEAD_DEBUG, MEAD_TRACE)
 * live in the header. This translation unit applies the MEAD_LOG_LEVEL
 * environment variable to the default spdlog logger.
 *
 * Initialization is lazy and runs at most once (std::call_once). The library
 * never calls it on its own: tools call it from main(), embedding applications
 * are free to configure spdlog themselves instead.
 *
 * @see Logging.hpp for macro definitions
 */

#include "mead-internal/Logging.hpp"
#include <cstdlib>
#include <mutex>
#include <string>

namespace mead::lib
{
    namespace
    {
        std::once_flag logInitFlag;

        spdlog::level::level_enum levelFromName(std::string const& name)
        {
            // from_str() maps unknown names to "off", which would silence errors
            auto const level = spdlog::level::from_str(name);
            if ((level == spdlog::level::off) && (name != "off"))
            {
                return spdlog::level::info;
            }
            return level;
        }
    }

    void initLogging()
    {
        std::call_once(logInitFlag,
            []()
            {
                if (auto const env = std::getenv("MEAD_LOG_LEVEL"); env != nullptr)
                {
                    spdlog::set_level(levelFromName(env));
                }
                else
                {
                    spdlog::set_level(spdlog::level::info);
                }
            });
    }

    void setLogLevel(std::string const& level)
    {
        initLogging();
        spdlog::set_level(levelFromName(level));
    }
}
