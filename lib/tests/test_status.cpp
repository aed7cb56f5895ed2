// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_status.cpp
 * @brief Unit tests for status codes, versioning, exceptions and audio decoder selection
 */

#include <cstring>
#include <string>
#include <catch2/catch_test_macros.hpp>
#include <mead/mead.h>
#include "mead-internal/AudioDecoder.hpp"
#include "mead-internal/Exception.hpp"
#include "Utils.hpp"

using namespace mead::lib;
using mead::tests::thrownStatus;

/**
 * @brief The version string agrees with the numeric fields
 */
TEST_CASE("Library version", "[status]")
{
    auto version = meadVersionType{};
    REQUIRE(meadGetVersion(&version) == MEAD_STATUS_OK);
    REQUIRE(version.full != nullptr);
    REQUIRE(std::string{version.full}.starts_with(std::to_string(version.major) + "." + std::to_string(version.minor) + "."));
    REQUIRE(meadGetVersion(nullptr) == MEAD_ERR_INVALID_ARG);
}

/**
 * @brief Every status code has a distinct printable name
 */
TEST_CASE("Status names", "[status]")
{
    REQUIRE(std::string{meadStatusToString(MEAD_STATUS_OK)} == "MEAD_STATUS_OK");
    REQUIRE(std::string{meadStatusToString(MEAD_ERR_NOT_READY)} == "MEAD_ERR_NOT_READY");
    REQUIRE(std::string{meadStatusToString(MEAD_ERR_END_OF_STREAM)} == "MEAD_ERR_END_OF_STREAM");
    REQUIRE(std::strcmp(meadStatusToString(MEAD_ERR_CODEC), meadStatusToString(MEAD_ERR_IO)) != 0);
}

/**
 * @brief Exceptions carry the formatted message and the status
 */
TEST_CASE("Exceptions", "[status]")
{
    auto const e = Exception::containerParse("box '{}' is {} bytes", "moov", 12);
    REQUIRE(e.status() == MEAD_ERR_CONTAINER_PARSE);
    REQUIRE(std::string{e.what()} == "box 'moov' is 12 bytes");
    REQUIRE(Exception::make(MEAD_ERR_IO, "x").status() == MEAD_ERR_IO);
}

/**
 * @brief Audio codecs from sample entry fourccs, and decoder availability
 */
TEST_CASE("Audio decoder selection", "[audio]")
{
    REQUIRE(audioCodecFromFourcc("Opus") == AudioCodec::Opus);
    REQUIRE(audioCodecFromFourcc("mp4a") == AudioCodec::Aac);
    REQUIRE_FALSE(audioCodecFromFourcc("opus").has_value());

    REQUIRE(thrownStatus([] { static_cast<void>(createAudioDecoder(AudioCodec::Aac, 48000, 2)); }) == MEAD_ERR_UNSUPPORTED_FORMAT);

#ifdef MEAD_HAVE_OPUS
    auto decoder = createAudioDecoder(AudioCodec::Opus, 48000, 2);
    REQUIRE(decoder->sampleRate() == 48000);
    REQUIRE(decoder->channelCount() == 2);
    REQUIRE(thrownStatus([] { static_cast<void>(createAudioDecoder(AudioCodec::Opus, 44100, 2)); }) == MEAD_ERR_INVALID_ARG);
    REQUIRE(thrownStatus([] { static_cast<void>(createAudioDecoder(AudioCodec::Opus, 48000, 6)); }) == MEAD_ERR_INVALID_ARG);
#else
    REQUIRE(thrownStatus([] { static_cast<void>(createAudioDecoder(AudioCodec::Opus, 48000, 2)); }) == MEAD_ERR_UNSUPPORTED_FORMAT);
#endif
}
