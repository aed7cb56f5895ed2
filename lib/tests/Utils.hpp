// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <mead/mead.h>
#include "mead-internal/Exception.hpp"

namespace mead::tests
{
    //
    // Big endian box writer used to assemble MP4 files in memory
    //
    class BoxWriter
    {
    public:
        void u8(std::uint8_t v);
        void u16(std::uint16_t v);
        void u32(std::uint32_t v);
        void u64(std::uint64_t v);
        void fourcc(char const* code);
        void zeros(std::size_t count);
        void bytes(std::vector<std::uint8_t> const& data);

        /// Open a box and return its start offset, to be passed to end()
        std::size_t begin(char const* type);
        /// Open a full box (version and flags follow the header)
        std::size_t beginFull(char const* type, std::uint8_t version = 0, std::uint32_t flags = 0);
        /// Patch the size of the box opened at `start`
        void end(std::size_t start);

        [[nodiscard]]
        std::size_t size() const noexcept;
        [[nodiscard]]
        std::vector<std::uint8_t> const& data() const noexcept;

    private:
        std::vector<std::uint8_t> _data;
    };

    /// One track of a synthetic MP4 file
    struct Mp4Track
    {
        std::uint32_t id = 1;
        char const* handler = "vide";
        char const* codec = "avc1";
        std::uint32_t timescale = 30;
        std::uint32_t sampleDelta = 1;
        std::vector<std::vector<std::uint8_t>> samples;
        std::optional<std::vector<std::uint32_t>> syncSamples;

        /// Per sample durations, written as stts runs. Empty: sampleDelta for every sample
        std::vector<std::uint32_t> sampleDeltas;
        /// Per sample composition offsets, written as ctts runs. Empty: no ctts
        std::vector<std::int32_t> compositionOffsets;
        /// Samples per chunk, written as stsc runs with 4 filler bytes before each chunk. Empty: one chunk
        std::vector<std::uint32_t> chunkSizes;
        /// 0 writes stsz, 4, 8 or 16 writes stz2 with that field size
        std::uint8_t compactSizeBits = 0;
        /// co64 instead of stco
        bool wideChunkOffsets = false;

        /// When non-zero, the track has this many samples of uniformSampleSize bytes
        /// and `samples` is ignored. The payload is not written: such a track must
        /// come last, in a file built with Mp4Layout::mdatToEnd.
        std::uint32_t uniformSampleCount = 0;
        std::uint32_t uniformSampleSize = 0;

        std::uint16_t width = 0;
        std::uint16_t height = 0;

        std::uint32_t sampleRate = 0;
        std::uint16_t channelCount = 0;
        /// Written as an esds box with this audio object type
        std::optional<std::uint8_t> audioObjectType;
    };

    /// Top level arrangement of a synthetic MP4 file
    struct Mp4Layout
    {
        std::uint32_t movieTimescale = 1000;
        std::uint32_t movieDuration = 0;
        /// ftyp, moov, mdat instead of ftyp, mdat, moov
        bool moovFirst = false;
        /// mdat header with size 1 and a 64 bit size
        bool mdatLargeSize = false;
        /// mdat header with size 0, the box runs to the end of the file. Implies moovFirst
        bool mdatToEnd = false;
        /// A second copy of moov at the end
        bool duplicateMoov = false;
    };

    std::vector<std::uint8_t> makeMp4(std::vector<Mp4Track> const& tracks, Mp4Layout const& layout);

    /// ftyp, mdat (all sample payloads) and moov, in that order
    std::vector<std::uint8_t> makeMp4(std::vector<Mp4Track> const& tracks, std::uint32_t movieTimescale = 1000, std::uint32_t movieDuration = 0);

    /// A Y4M stream with `frameCount` frames of `frameSize` bytes, frame i filled with the value i
    std::vector<std::uint8_t> makeY4m(std::string const& header, std::size_t frameCount, std::size_t frameSize);

    std::vector<std::uint8_t> toBytes(std::string const& text);

    /// Run `f` and return the status of the mead::lib::Exception it throws, MEAD_STATUS_OK if it returns
    template<typename F>
    meadStatus thrownStatus(F&& f)
    {
        try
        {
            f();
        }
        catch (mead::lib::Exception const& e)
        {
            return e.status();
        }
        return MEAD_STATUS_OK;
    }

} // namespace mead::tests
