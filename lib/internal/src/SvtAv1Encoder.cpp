// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

#include "SvtAv1Encoder.hpp"
#include <algorithm>
#include <bit>
#include "mead-internal/Deferred.hpp"
#include "mead-internal/Exception.hpp"
#include "mead-internal/Logging.hpp"
#include "mead-internal/TileLayout.hpp"

namespace mead::lib
{
    namespace
    {
        constexpr auto BackendName = "svt-av1";

        char const* errorString(EbErrorType code) noexcept
        {
            switch (static_cast<std::uint32_t>(code))
            {
                case 0x00000000: return "Success";
                case 0x80001000: return "Insufficient resources";
                case 0x80001001: return "Undefined error";
                case 0x80001004: return "Invalid component";
                case 0x80001005: return "Bad parameter";
                case 0x80002012: return "Destroy thread failed";
                case 0x80002021: return "Semaphore unresponsive";
                case 0x80002022: return "Destroy semaphore failed";
                case 0x80002030: return "Create mutex failed";
                case 0x80002031: return "Mutex unresponsive";
                case 0x80002032: return "Destroy mutex failed";
                default:         return "Unknown error";
            }
        }

        /** SVT-AV1 takes tile counts as log2. */
        std::int32_t log2Tiles(std::uint32_t count) noexcept
        {
            return static_cast<std::int32_t>(std::countr_zero(std::max<std::uint32_t>(count, 1)));
        }
    }

    SvtAv1Encoder::SvtAv1Encoder(std::size_t width, std::size_t height, meadRational frameRate, SvtAv1Config const& config)
        : BufferedEncoder{BackendName, width, height, frameRate}
        , _handle{nullptr}
        , _endOfStreamSent{false}
        , _endOfStreamReceived{false}
        , _frameCount{0}
    {
        validate(config);
        if (config.bitDepth != 8)
        {
            throw Exception::unsupportedFormat("svt-av1: {} bit encoding needs high bit depth frames, only 8 bit frames are supported", config.bitDepth);
        }

        auto tiles = TileLayout{config.tileCols, config.tileRows};
        if ((config.tileCols == 0) || (config.tileRows == 0))
        {
            tiles = calculateTiles(static_cast<std::uint32_t>(width), static_cast<std::uint32_t>(height), config.threads);
        }

        MEAD_INFO("SVT-AV1 encoder config: {}x{}, preset={}, qp={}, tiles={}x{}", width, height, config.preset, config.qp, tiles.cols, tiles.rows);

        EbComponentType* handle = nullptr;
        auto encConfig = EbSvtAv1EncConfiguration{};
        auto err = ::svt_av1_enc_init_handle(&handle, &encConfig);
        if (err != EB_ErrorNone)
        {
            throw Exception::codec("Failed to initialize SVT-AV1 encoder handle: {} ({:#x})", errorString(err), static_cast<std::uint32_t>(err));
        }
        auto releaseHandle = defer([handle]() noexcept { ::svt_av1_enc_deinit_handle(handle); });

        encConfig.enc_mode = static_cast<decltype(encConfig.enc_mode)>(config.preset);
        encConfig.source_width = static_cast<std::uint32_t>(width);
        encConfig.source_height = static_cast<std::uint32_t>(height);
        encConfig.frame_rate_numerator = static_cast<std::uint32_t>(frameRate.numerator);
        encConfig.frame_rate_denominator = static_cast<std::uint32_t>(frameRate.denominator);
        encConfig.encoder_bit_depth = config.bitDepth;
        encConfig.encoder_color_format = EB_YUV420;
        encConfig.qp = config.qp;
        encConfig.rate_control_mode = 0; // constant quality
        encConfig.tile_columns = log2Tiles(tiles.cols);
        encConfig.tile_rows = log2Tiles(tiles.rows);

        err = ::svt_av1_enc_set_parameter(handle, &encConfig);
        if (err != EB_ErrorNone)
        {
            throw Exception::codec("Failed to set SVT-AV1 encoder parameters: {} ({:#x})", errorString(err), static_cast<std::uint32_t>(err));
        }

        err = ::svt_av1_enc_init(handle);
        if (err != EB_ErrorNone)
        {
            throw Exception::codec("Failed to initialize SVT-AV1 encoder: {} ({:#x})", errorString(err), static_cast<std::uint32_t>(err));
        }

        releaseHandle.dismiss();
        _handle = handle;
    }

    SvtAv1Encoder::~SvtAv1Encoder()
    {
        if (auto const err = ::svt_av1_enc_deinit(_handle); err != EB_ErrorNone)
        {
            MEAD_WARN("svt_av1_enc_deinit failed: {}", errorString(err));
        }
        if (auto const err = ::svt_av1_enc_deinit_handle(_handle); err != EB_ErrorNone)
        {
            MEAD_WARN("svt_av1_enc_deinit_handle failed: {}", errorString(err));
        }
    }

    void SvtAv1Encoder::doSendFrame(SharedFrame const& frame)
    {
        auto const* y = frame->planeY();
        auto const* u = frame->planeU();
        auto const* v = frame->planeV();

        auto picture = EbSvtIOFormat{};
        picture.luma = const_cast<std::uint8_t*>(y->data().data());
        picture.cb = const_cast<std::uint8_t*>(u->data().data());
        picture.cr = const_cast<std::uint8_t*>(v->data().data());
        picture.y_stride = static_cast<std::uint32_t>(y->stride());
        picture.cb_stride = static_cast<std::uint32_t>(u->stride());
        picture.cr_stride = static_cast<std::uint32_t>(v->stride());
        picture.width = static_cast<std::uint32_t>(frame->width());
        picture.height = static_cast<std::uint32_t>(frame->height());
        picture.color_fmt = EB_YUV420;
        picture.bit_depth = EB_EIGHT_BIT;

        auto buffer = EbBufferHeaderType{};
        buffer.size = sizeof(EbBufferHeaderType);
        buffer.p_buffer = reinterpret_cast<std::uint8_t*>(&picture);
        buffer.n_filled_len = static_cast<std::uint32_t>(y->data().size() + u->data().size() + v->data().size());
        buffer.pic_type = EB_AV1_INVALID_PICTURE;
        buffer.pts = frame->pts().value_or(static_cast<std::int64_t>(_frameCount));

        if (auto const err = ::svt_av1_enc_send_picture(_handle, &buffer); err != EB_ErrorNone)
        {
            throw Exception::codec("Failed to send frame {} to SVT-AV1: {} ({:#x})", _frameCount, errorString(err), static_cast<std::uint32_t>(err));
        }
        ++_frameCount;
    }

    void SvtAv1Encoder::doSendEndOfStream()
    {
        auto buffer = EbBufferHeaderType{};
        buffer.size = sizeof(EbBufferHeaderType);
        buffer.flags = EB_BUFFERFLAG_EOS;

        if (auto const err = ::svt_av1_enc_send_picture(_handle, &buffer); err != EB_ErrorNone)
        {
            throw Exception::codec("Failed to send end of stream to SVT-AV1: {} ({:#x})", errorString(err), static_cast<std::uint32_t>(err));
        }
        _endOfStreamSent = true;
    }

    meadStatus SvtAv1Encoder::doReceivePacket(Packet& packet)
    {
        if (_endOfStreamReceived)
        {
            return MEAD_ERR_END_OF_STREAM;
        }

        // Once end of stream was sent the call blocks until a packet is available
        EbBufferHeaderType* output = nullptr;
        auto const err = ::svt_av1_enc_get_packet(_handle, &output, _endOfStreamSent ? 1 : 0);
        if (err == EB_NoErrorEmptyQueue)
        {
            return MEAD_ERR_NOT_READY;
        }
        if (err != EB_ErrorNone)
        {
            throw Exception::codec("Failed to receive a packet from SVT-AV1: {} ({:#x})", errorString(err), static_cast<std::uint32_t>(err));
        }
        if (output == nullptr)
        {
            return MEAD_ERR_NOT_READY;
        }
        auto const releaseOutput = defer([&output]() noexcept { ::svt_av1_enc_release_out_buffer(&output); });

        auto const endOfStream = (output->flags & EB_BUFFERFLAG_EOS) != 0;
        if (endOfStream)
        {
            _endOfStreamReceived = true;
        }
        if (output->n_filled_len == 0)
        {
            return endOfStream ? MEAD_ERR_END_OF_STREAM : MEAD_ERR_NOT_READY;
        }

        packet = Packet{};
        packet.streamIndex = 0;
        packet.data.assign(output->p_buffer, output->p_buffer + output->n_filled_len);
        packet.pts = output->pts;
        packet.isKeyframe = (output->pic_type == EB_AV1_KEY_PICTURE) || (output->pic_type == EB_AV1_INTRA_ONLY_PICTURE);
        MEAD_TRACE("SVT-AV1 packet pts {}: {} bytes", output->pts, output->n_filled_len);
        return MEAD_STATUS_OK;
    }
}
