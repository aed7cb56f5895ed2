// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

#include "Rav1eEncoder.hpp"
#include "mead-internal/Deferred.hpp"
#include "mead-internal/Exception.hpp"
#include "mead-internal/Logging.hpp"
#include "mead-internal/TileLayout.hpp"

namespace mead::lib
{
    namespace
    {
        constexpr auto BackendName = "rav1e";

        void setOption(RaConfig* config, char const* key, std::int64_t value)
        {
            if (::rav1e_config_parse_int(config, key, static_cast<int>(value)) != 0)
            {
                throw Exception::codec("rav1e rejected option {}={}", key, value);
            }
        }

        char const* statusText(RaEncoderStatus status)
        {
            auto const* text = ::rav1e_status_to_str(status);
            return (text != nullptr) ? text : "unknown status";
        }
    }

    Rav1eEncoder::Rav1eEncoder(std::size_t width, std::size_t height, meadRational frameRate, Rav1eConfig const& config)
        : BufferedEncoder{BackendName, width, height, frameRate}
        , _context{nullptr}
        , _queued{}
        , _flushPending{false}
        , _flushed{false}
        , _submitted{0}
        , _ptsByFrameNumber{}
    {
        validate(config);

        auto const threads = resolveThreadCount(config.threads);
        auto tiles = TileLayout{config.tileCols, config.tileRows};
        if ((config.tileCols == 0) || (config.tileRows == 0))
        {
            tiles = calculateTiles(static_cast<std::uint32_t>(width), static_cast<std::uint32_t>(height), threads);
        }

        MEAD_INFO("AV1 encoder config: {}x{}, speed={}, quantizer={}, tiles={}x{}, threads={}",
            width,
            height,
            config.speed,
            config.quantizer,
            tiles.cols,
            tiles.rows,
            threads);

        auto* raConfig = ::rav1e_config_default();
        if (raConfig == nullptr)
        {
            throw Exception::codec("rav1e_config_default failed");
        }
        auto const releaseConfig = defer([raConfig]() noexcept { ::rav1e_config_unref(raConfig); });

        setOption(raConfig, "width", static_cast<std::int64_t>(width));
        setOption(raConfig, "height", static_cast<std::int64_t>(height));
        setOption(raConfig, "speed", config.speed);
        setOption(raConfig, "quantizer", config.quantizer);
        if (config.bitrateKbps.has_value())
        {
            setOption(raConfig, "bitrate", static_cast<std::int64_t>(*config.bitrateKbps) * 1000);
        }
        setOption(raConfig, "tile_cols", tiles.cols);
        setOption(raConfig, "tile_rows", tiles.rows);
        setOption(raConfig, "threads", threads);

        // Time base is the frame duration
        auto const timeBase = RaRational{static_cast<std::uint64_t>(frameRate.denominator), static_cast<std::uint64_t>(frameRate.numerator)};
        if (::rav1e_config_set_time_base(raConfig, timeBase) != 0)
        {
            throw Exception::codec("rav1e rejected time base {}/{}", timeBase.num, timeBase.den);
        }
        if (::rav1e_config_set_pixel_format(raConfig, 8, RA_CHROMA_SAMPLING_CS420, RA_CHROMA_SAMPLE_POSITION_UNKNOWN, RA_PIXEL_RANGE_LIMITED) != 0)
        {
            throw Exception::codec("rav1e rejected the 8 bit 4:2:0 pixel format");
        }

        _context = ::rav1e_context_new(raConfig);
        if (_context == nullptr)
        {
            throw Exception::codec("rav1e_context_new failed for a {}x{} stream", width, height);
        }
    }

    Rav1eEncoder::~Rav1eEncoder()
    {
        ::rav1e_context_unref(_context);
    }

    void Rav1eEncoder::feed()
    {
        while (!_queued.empty())
        {
            auto const& source = *_queued.front();

            auto* frame = ::rav1e_frame_new(_context);
            if (frame == nullptr)
            {
                throw Exception::codec("rav1e_frame_new failed");
            }
            auto const releaseFrame = defer([frame]() noexcept { ::rav1e_frame_unref(frame); });

            auto const planes = source.planes();
            for (auto index = std::size_t{0}; index < planes.size(); ++index)
            {
                auto const data = planes[index].data();
                ::rav1e_frame_fill_plane(
                    frame, static_cast<int>(index), data.data(), data.size(), static_cast<std::ptrdiff_t>(planes[index].stride()), 1);
            }

            auto const status = ::rav1e_send_frame(_context, frame);
            if (status == RA_ENCODER_STATUS_ENOUGH_DATA)
            {
                return;
            }
            if (status != RA_ENCODER_STATUS_SUCCESS)
            {
                throw Exception::codec("rav1e_send_frame failed: {}", statusText(status));
            }

            _ptsByFrameNumber.push_back(source.pts().value_or(static_cast<std::int64_t>(_submitted)));
            ++_submitted;
            _queued.pop_front();
        }

        if (_flushPending && !_flushed)
        {
            auto const status = ::rav1e_send_frame(_context, nullptr);
            if (status == RA_ENCODER_STATUS_ENOUGH_DATA)
            {
                return;
            }
            if (status != RA_ENCODER_STATUS_SUCCESS)
            {
                throw Exception::codec("rav1e flush failed: {}", statusText(status));
            }
            _flushed = true;
        }
    }

    void Rav1eEncoder::doSendFrame(SharedFrame const& frame)
    {
        _queued.push_back(frame);
        feed();
    }

    void Rav1eEncoder::doSendEndOfStream()
    {
        _flushPending = true;
        feed();
    }

    meadStatus Rav1eEncoder::doReceivePacket(Packet& packet)
    {
        feed();

        RaPacket* raPacket = nullptr;
        auto const status = ::rav1e_receive_packet(_context, &raPacket);
        switch (status)
        {
            case RA_ENCODER_STATUS_SUCCESS:
            {
                auto const releasePacket = defer([raPacket]() noexcept { ::rav1e_packet_unref(raPacket); });

                packet = Packet{};
                packet.streamIndex = 0;
                packet.data.assign(raPacket->data, raPacket->data + raPacket->len);
                packet.isKeyframe = (raPacket->frame_type == RA_FRAME_TYPE_KEY);
                packet.pts = (raPacket->input_frameno < _ptsByFrameNumber.size()) ? _ptsByFrameNumber[raPacket->input_frameno]
                                                                                  : static_cast<std::int64_t>(raPacket->input_frameno);
                MEAD_TRACE("rav1e packet for frame {}: {} bytes", raPacket->input_frameno, raPacket->len);
                return MEAD_STATUS_OK;
            }

            case RA_ENCODER_STATUS_ENCODED:
            case RA_ENCODER_STATUS_NEED_MORE_DATA:
                return MEAD_ERR_NOT_READY;

            case RA_ENCODER_STATUS_LIMIT_REACHED:
                return _flushed ? MEAD_ERR_END_OF_STREAM : MEAD_ERR_NOT_READY;

            default:
                throw Exception::codec("rav1e_receive_packet failed: {}", statusText(status));
        }
    }
}
