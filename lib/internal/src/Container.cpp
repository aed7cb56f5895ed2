// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

#include "mead-internal/Demuxer.hpp"
#include "mead-internal/Muxer.hpp"

namespace mead::lib
{
    Demuxer::~Demuxer() = default;

    Muxer::~Muxer() = default;
}
