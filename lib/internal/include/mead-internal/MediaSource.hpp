// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file MediaSource.hpp
 * @brief Byte sources the demuxers read from
 *
 * The demuxers only need four operations: read some bytes, seek, tell, and
 * (for MP4) the total length. Implementations:
 *
 * - FileSource:   POSIX file descriptor, seekable, length from fstat()
 * - MemorySource: owned byte vector, seekable, known length (tests, embedded use)
 * - StreamSource: any std::istream (stdin), not seekable, unknown length
 *
 * All failures throw Exception with MEAD_ERR_IO. Reading at end of data returns 0.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <span>
#include <vector>
#include <mead/platform.h>

namespace mead::lib
{
    class MEAD_EXPORT MediaSource
    {
    public:
        virtual ~MediaSource();

        /**
         * Read up to buffer.size() bytes.
         * @return the number of bytes read, 0 at end of data.
         */
        [[nodiscard]]
        virtual std::size_t read(std::span<std::uint8_t> buffer) = 0;

        /**
         * Move the read position to an absolute offset.
         * @throws Exception (MEAD_ERR_IO) if the source is not seekable.
         */
        virtual void seek(std::uint64_t offset) = 0;

        [[nodiscard]]
        virtual std::uint64_t tell() const = 0;

        /** Total size in bytes, if the source knows it. */
        [[nodiscard]]
        virtual std::optional<std::uint64_t> length() const = 0;

        [[nodiscard]]
        virtual bool isSeekable() const noexcept = 0;

        /**
         * Fill the whole buffer, looping over short reads.
         * @return false if the source ended before the first byte was read.
         * @throws Exception (MEAD_ERR_IO) if it ended part way through.
         */
        [[nodiscard]]
        bool readExact(std::span<std::uint8_t> buffer);

        /**
         * Same as readExact(), but running out of data part way through is
         * reported as a container parse failure: the caller knows the bytes
         * must be there.
         */
        [[nodiscard]]
        bool readRecord(std::span<std::uint8_t> buffer);

    private:
        std::size_t readFully(std::span<std::uint8_t> buffer);
    };

    class MEAD_EXPORT FileSource final : public MediaSource
    {
    public:
        explicit FileSource(std::filesystem::path const& path);
        ~FileSource() override;

        FileSource(FileSource const&) = delete;
        FileSource& operator=(FileSource const&) = delete;

        std::size_t read(std::span<std::uint8_t> buffer) override;
        void seek(std::uint64_t offset) override;
        std::uint64_t tell() const override;
        std::optional<std::uint64_t> length() const override;
        bool isSeekable() const noexcept override;

    private:
        int _fd;
        std::uint64_t _position;
        std::uint64_t _length;
    };

    class MEAD_EXPORT MemorySource final : public MediaSource
    {
    public:
        explicit MemorySource(std::vector<std::uint8_t> bytes);

        std::size_t read(std::span<std::uint8_t> buffer) override;
        void seek(std::uint64_t offset) override;
        std::uint64_t tell() const override;
        std::optional<std::uint64_t> length() const override;
        bool isSeekable() const noexcept override;

    private:
        std::vector<std::uint8_t> _bytes;
        std::uint64_t _position;
    };

    /**
     * Forward-only source over a stream the caller keeps alive (std::cin).
     */
    class MEAD_EXPORT StreamSource final : public MediaSource
    {
    public:
        explicit StreamSource(std::istream& stream);

        std::size_t read(std::span<std::uint8_t> buffer) override;
        void seek(std::uint64_t offset) override;
        std::uint64_t tell() const override;
        std::optional<std::uint64_t> length() const override;
        bool isSeekable() const noexcept override;

    private:
        std::istream* _stream;
        std::uint64_t _position;
    };
}
