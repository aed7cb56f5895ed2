// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file mead/main.cpp
 * @brief Command line front end for the mead containers and codecs
 *
 * Usage examples:
 *   - Show MP4 tracks:              mead info movie.mp4
 *   - Same, machine readable:       mead info movie.mp4 --json
 *   - Encode raw video to AV1:      mead encode clip.y4m -o clip.ivf --backend rav1e --options '{"speed": 8}'
 *   - Encode from a pipe:           ffmpeg -i in.mov -f yuv4mpegpipe - | mead encode - -o out.ivf
 *   - Decode Opus audio to PCM:     mead decode movie.mp4 -o audio.f32
 *
 * The decoded PCM is interleaved 32 bit float, little endian, at the sample
 * rate and channel count that `mead info` reports for the audio track.
 */

#include <bit>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>
#include <CLI/CLI.hpp>
#include <fmt/color.h>
#include <fmt/format.h>
#include <picojson/picojson.h>
#include <mead/mead.h>
#include "mead-internal/AudioDecoder.hpp"
#include "mead-internal/EncoderFactory.hpp"
#include "mead-internal/EncoderOptionsParser.hpp"
#include "mead-internal/Exception.hpp"
#include "mead-internal/IvfMuxer.hpp"
#include "mead-internal/Logging.hpp"
#include "mead-internal/MediaSource.hpp"
#include "mead-internal/Mp4Demuxer.hpp"
#include "mead-internal/Y4mDemuxer.hpp"

namespace
{
    namespace detail
    {
        bool isTerminal(std::ostream& os) noexcept
        {
            if (&os == &std::cout)
            {
                return ::isatty(::fileno(stdout)) != 0;
            }
            return false;
        }

        std::string formatDuration(std::optional<std::uint64_t> const& durationMs)
        {
            if (!durationMs.has_value())
            {
                return "unknown";
            }
            auto const ms = *durationMs;
            return fmt::format("{}:{:02}:{:02}.{:03}", ms / 3'600'000, (ms / 60'000) % 60, (ms / 1000) % 60, ms % 1000);
        }

        void printTrack(std::ostream& os, mead::lib::Track const& track)
        {
            auto const title = fmt::format("Track {} ({})", track.id, mead::lib::toString(track.type));
            if (isTerminal(os))
            {
                os << "- " << fmt::format(fmt::emphasis::bold, "{}", title) << '\n';
            }
            else
            {
                os << "- " << title << '\n';
            }

            os << '\t' << fmt::format("{: >18}: {}", "Handler", track.handler) << '\n'
               << '\t' << fmt::format("{: >18}: {}", "Samples", track.sampleCount) << '\n'
               << '\t' << fmt::format("{: >18}: {}", "Timescale", track.timescale) << '\n'
               << '\t' << fmt::format("{: >18}: {}", "Duration", track.duration) << '\n'
               << '\t' << fmt::format("{: >18}: {}", "Language", track.language) << '\n';

            if (track.video.has_value())
            {
                auto const& video = *track.video;
                os << '\t' << fmt::format("{: >18}: {}", "Codec", video.codec) << '\n'
                   << '\t' << fmt::format("{: >18}: {}x{}", "Resolution", video.width, video.height) << '\n';
                if (video.avcProfile.has_value())
                {
                    os << '\t' << fmt::format("{: >18}: {} / {}", "AVC profile/level", *video.avcProfile, video.avcLevel.value_or(0)) << '\n';
                }
            }
            if (track.audio.has_value())
            {
                auto const& audio = *track.audio;
                os << '\t' << fmt::format("{: >18}: {}", "Codec", audio.codec) << '\n'
                   << '\t' << fmt::format("{: >18}: {}", "Sample rate", audio.sampleRate) << '\n'
                   << '\t' << fmt::format("{: >18}: {}", "Channels", audio.channelCount) << '\n';
                if (audio.objectType.has_value())
                {
                    os << '\t' << fmt::format("{: >18}: {}", "Object type", *audio.objectType) << '\n';
                }
            }
        }

        picojson::value trackToJson(mead::lib::Track const& track)
        {
            auto obj = picojson::object{};
            obj["id"] = picojson::value{static_cast<double>(track.id)};
            obj["type"] = picojson::value{mead::lib::toString(track.type)};
            obj["handler"] = picojson::value{track.handler};
            obj["sampleCount"] = picojson::value{static_cast<double>(track.sampleCount)};
            obj["timescale"] = picojson::value{static_cast<double>(track.timescale)};
            obj["duration"] = picojson::value{static_cast<double>(track.duration)};
            obj["language"] = picojson::value{track.language};

            if (track.video.has_value())
            {
                auto video = picojson::object{};
                video["codec"] = picojson::value{track.video->codec};
                video["width"] = picojson::value{static_cast<double>(track.video->width)};
                video["height"] = picojson::value{static_cast<double>(track.video->height)};
                if (track.video->avcProfile.has_value())
                {
                    video["avcProfile"] = picojson::value{static_cast<double>(*track.video->avcProfile)};
                }
                if (track.video->avcLevel.has_value())
                {
                    video["avcLevel"] = picojson::value{static_cast<double>(*track.video->avcLevel)};
                }
                obj["video"] = picojson::value{video};
            }
            if (track.audio.has_value())
            {
                auto audio = picojson::object{};
                audio["codec"] = picojson::value{track.audio->codec};
                audio["sampleRate"] = picojson::value{static_cast<double>(track.audio->sampleRate)};
                audio["channelCount"] = picojson::value{static_cast<double>(track.audio->channelCount)};
                if (track.audio->objectType.has_value())
                {
                    audio["objectType"] = picojson::value{static_cast<double>(*track.audio->objectType)};
                }
                obj["audio"] = picojson::value{audio};
            }
            return picojson::value{obj};
        }

        /// Append the samples as 32 bit little endian floats.
        void writeFloatLE(std::ostream& os, std::vector<float> const& samples)
        {
            auto bytes = std::vector<char>(samples.size() * 4);
            for (auto i = std::size_t{0}; i < samples.size(); ++i)
            {
                auto const bits = std::bit_cast<std::uint32_t>(samples[i]);
                bytes[4 * i + 0] = static_cast<char>(bits & 0xFF);
                bytes[4 * i + 1] = static_cast<char>((bits >> 8) & 0xFF);
                bytes[4 * i + 2] = static_cast<char>((bits >> 16) & 0xFF);
                bytes[4 * i + 3] = static_cast<char>((bits >> 24) & 0xFF);
            }
            os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            if (!os)
            {
                throw mead::lib::Exception::io("Failed to write {} PCM bytes", bytes.size());
            }
        }

        std::ofstream openOutput(std::string const& path)
        {
            auto os = std::ofstream{path, std::ios::binary | std::ios::trunc};
            if (!os)
            {
                throw mead::lib::Exception::io("Cannot open '{}' for writing", path);
            }
            return os;
        }
    }

    /**
     * @brief Print the metadata and track list of an MP4 file
     */
    int printInfo(std::string const& path, bool json)
    {
        auto demuxer = mead::lib::Mp4Demuxer{std::make_unique<mead::lib::FileSource>(path)};
        auto const& metadata = demuxer.metadata();

        if (json)
        {
            auto root = picojson::object{};
            root["format"] = picojson::value{metadata.formatName};
            root["streamCount"] = picojson::value{static_cast<double>(metadata.streamCount)};
            if (metadata.durationMs.has_value())
            {
                root["durationMs"] = picojson::value{static_cast<double>(*metadata.durationMs)};
            }
            auto tracks = picojson::array{};
            for (auto const& track : demuxer.tracks())
            {
                tracks.push_back(detail::trackToJson(track));
            }
            root["tracks"] = picojson::value{tracks};
            std::cout << picojson::value{root}.serialize(true);
            return EXIT_SUCCESS;
        }

        std::cout << "--- " << path << " ---" << '\n'
                  << '\t' << fmt::format("{: >18}: {}", "Format", metadata.formatName) << '\n'
                  << '\t' << fmt::format("{: >18}: {}", "Duration", detail::formatDuration(metadata.durationMs)) << '\n'
                  << '\t' << fmt::format("{: >18}: {}", "Tracks", metadata.streamCount) << '\n';
        for (auto const& track : demuxer.tracks())
        {
            detail::printTrack(std::cout, track);
        }
        std::cout << std::flush;
        return EXIT_SUCCESS;
    }

    /**
     * @brief Encode a Y4M stream to AV1 in an IVF file
     *
     * Packets are pulled after every frame so that the encoder never holds more
     * than its own lookahead; the remainder is drained by finish().
     */
    int encode(std::string const& input, std::string const& output, std::string const& backendName, std::string const& options)
    {
        auto const backend = mead::lib::encoderBackendFromString(backendName);
        if (!backend.has_value())
        {
            throw mead::lib::Exception::invalidArgument("Unknown encoder backend '{}', expected rav1e or svt-av1", backendName);
        }
        auto const config = mead::lib::EncoderOptionsParser{options}.configFor(*backend);

        auto source = std::unique_ptr<mead::lib::MediaSource>{};
        if (input == "-")
        {
            source = std::make_unique<mead::lib::StreamSource>(std::cin);
        }
        else
        {
            source = std::make_unique<mead::lib::FileSource>(input);
        }
        auto demuxer = mead::lib::Y4mDemuxer{std::move(source)};

        if (demuxer.pixelFormat() != mead::lib::PixelFormat::Yuv420p)
        {
            throw mead::lib::Exception::unsupportedFormat("AV1 encoding needs 4:2:0 input, got Y4M colorspace '{}'", demuxer.colorspaceTag());
        }
        if ((demuxer.width() > std::numeric_limits<std::uint16_t>::max()) || (demuxer.height() > std::numeric_limits<std::uint16_t>::max()))
        {
            throw mead::lib::Exception::unsupportedFormat("{}x{} does not fit the IVF header", demuxer.width(), demuxer.height());
        }

        auto encoder = mead::lib::createEncoder(demuxer.width(), demuxer.height(), demuxer.frameRate(), config);

        auto sink = detail::openOutput(output);
        auto muxer = mead::lib::IvfMuxer{
            sink, static_cast<std::uint16_t>(demuxer.width()), static_cast<std::uint16_t>(demuxer.height()), demuxer.frameRate()};

        while (auto frame = demuxer.readFrame())
        {
            encoder->sendFrame(mead::lib::share(std::move(*frame)));

            auto packet = mead::lib::Packet{};
            while (encoder->receivePacket(packet) == MEAD_STATUS_OK)
            {
                muxer.writePacket(std::move(packet));
                packet = mead::lib::Packet{};
            }
        }

        for (auto& packet : encoder->finish())
        {
            muxer.writePacket(std::move(packet));
        }
        auto const packets = muxer.frameCount();
        std::move(muxer).finalize();

        MEAD_INFO("Encoded {} frames into {} packets with {}", demuxer.frameCount(), packets, mead::lib::toString(*backend));
        return EXIT_SUCCESS;
    }

    /**
     * @brief Decode the first audio track of an MP4 file to raw PCM
     */
    int decode(std::string const& input, std::string const& output)
    {
        auto demuxer = mead::lib::Mp4Demuxer{std::make_unique<mead::lib::FileSource>(input)};
        demuxer.selectAudioTrack();

        auto const& track = demuxer.track(*demuxer.selectedTrack());
        auto const& profile = track.audio.value();
        auto const codec = mead::lib::audioCodecFromFourcc(profile.codec);
        if (!codec.has_value())
        {
            throw mead::lib::Exception::unsupportedFormat("Audio codec '{}' is not supported", profile.codec);
        }

        auto decoder = mead::lib::createAudioDecoder(*codec, profile.sampleRate, profile.channelCount);
        auto sink = detail::openOutput(output);

        auto frames = std::uint64_t{0};
        while (auto packet = demuxer.readPacket())
        {
            if (auto pcm = decoder->decode(packet->data); pcm.has_value())
            {
                frames += pcm->size() / decoder->channelCount();
                detail::writeFloatLE(sink, *pcm);
            }
        }

        sink.flush();
        if (!sink)
        {
            throw mead::lib::Exception::io("Failed to flush '{}'", output);
        }

        MEAD_INFO("Decoded {} sample frames ({} Hz, {} channels) from track {}", frames, decoder->sampleRate(), decoder->channelCount(), track.id);
        return EXIT_SUCCESS;
    }
}

/**
 * @brief Main entry point for the mead tool
 *
 * @param argc Argument count
 * @param argv Argument values
 * @return EXIT_SUCCESS or EXIT_FAILURE
 */
int main(int argc, char** argv)
{
    auto app = CLI::App{"mead"};
    app.require_subcommand(1);

    auto version = ::meadVersionType{};
    ::meadGetVersion(&version);
    app.set_version_flag("--version", version.full);

    auto logLevel = std::string{};
    app.add_option("--log-level", logLevel, "Log level (trace, debug, info, warn, error, critical, off)");

    auto infoPath = std::string{};
    auto infoJson = false;
    auto infoCmd = app.add_subcommand("info", "Show the tracks of an MP4 file");
    infoCmd->add_option("FILE", infoPath, "The MP4 file")->required()->check(CLI::ExistingFile);
    infoCmd->add_flag("--json", infoJson, "Print JSON instead of text");

    auto encodeInput = std::string{};
    auto encodeOutput = std::string{};
    auto encodeBackend = std::string{"svt-av1"};
    auto encodeOptions = std::string{};
    auto encodeCmd = app.add_subcommand("encode", "Encode a Y4M stream to AV1 in IVF");
    encodeCmd->add_option("INPUT", encodeInput, "The Y4M file, or - for standard input")->required();
    encodeCmd->add_option("-o,--output", encodeOutput, "The IVF file to write")->required();
    encodeCmd->add_option("-b,--backend", encodeBackend, "Encoder backend (rav1e, svt-av1)")->capture_default_str();
    encodeCmd->add_option("--options", encodeOptions, "Encoder options as a JSON object");

    auto decodeInput = std::string{};
    auto decodeOutput = std::string{};
    auto decodeCmd = app.add_subcommand("decode", "Decode the first audio track of an MP4 file to f32le PCM");
    decodeCmd->add_option("INPUT", decodeInput, "The MP4 file")->required()->check(CLI::ExistingFile);
    decodeCmd->add_option("-o,--output", decodeOutput, "The PCM file to write")->required();

    CLI11_PARSE(app, argc, argv);

    mead::lib::initLogging();
    if (!logLevel.empty())
    {
        mead::lib::setLogLevel(logLevel);
    }

    try
    {
        if (infoCmd->parsed())
        {
            return printInfo(infoPath, infoJson);
        }
        if (encodeCmd->parsed())
        {
            return encode(encodeInput, encodeOutput, encodeBackend, encodeOptions);
        }
        if (decodeCmd->parsed())
        {
            return decode(decodeInput, decodeOutput);
        }
    }
    catch (mead::lib::Exception const& e)
    {
        std::cerr << "ERROR: " << e.what() << " (" << ::meadStatusToString(e.status()) << ")" << std::endl;
        return EXIT_FAILURE;
    }
    catch (std::exception const& e)
    {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    std::cerr << "No action specified. Use --help for usage information." << std::endl;
    return EXIT_FAILURE;
}
