// SPDX-FileCopyrightText: 2025 Contributors to the mead project.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file MediaSource.cpp
 * @brief File, memory and stream byte sources
 */

#include "mead-internal/MediaSource.hpp"
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <system_error>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include "mead-internal/Exception.hpp"
#include "mead-internal/Logging.hpp"

namespace mead::lib
{
    namespace
    {
        std::string lastErrorMessage()
        {
            return std::error_code{errno, std::generic_category()}.message();
        }
    }

    /////////////////////////////////////////////////////////////////////////
    // MediaSource
    /////////////////////////////////////////////////////////////////////////

    MediaSource::~MediaSource() = default;

    std::size_t MediaSource::readFully(std::span<std::uint8_t> buffer)
    {
        auto total = std::size_t{0};
        while (total < buffer.size())
        {
            auto const count = read(buffer.subspan(total));
            if (count == 0)
            {
                break;
            }
            total += count;
        }
        return total;
    }

    bool MediaSource::readExact(std::span<std::uint8_t> buffer)
    {
        auto const count = readFully(buffer);
        if ((count == 0) && !buffer.empty())
        {
            return false;
        }
        if (count < buffer.size())
        {
            throw Exception::io("Unexpected end of data: wanted {} bytes, got {}", buffer.size(), count);
        }
        return true;
    }

    bool MediaSource::readRecord(std::span<std::uint8_t> buffer)
    {
        auto const count = readFully(buffer);
        if ((count == 0) && !buffer.empty())
        {
            return false;
        }
        if (count < buffer.size())
        {
            throw Exception::containerParse("Truncated record: wanted {} bytes, got {}", buffer.size(), count);
        }
        return true;
    }

    /////////////////////////////////////////////////////////////////////////
    // FileSource
    /////////////////////////////////////////////////////////////////////////

    FileSource::FileSource(std::filesystem::path const& path)
        : _fd{::open(path.string().c_str(), O_RDONLY | O_CLOEXEC)}
        , _position{0}
        , _length{0}
    {
        if (_fd < 0)
        {
            throw Exception::io("Failed to open '{}': {}", path.string(), lastErrorMessage());
        }

        struct stat st;
        if (::fstat(_fd, &st) != 0)
        {
            auto const msg = lastErrorMessage();
            ::close(_fd);
            throw Exception::io("Failed to stat '{}': {}", path.string(), msg);
        }
        _length = static_cast<std::uint64_t>(st.st_size);
        MEAD_DEBUG("Opened '{}' ({} bytes)", path.string(), _length);
    }

    FileSource::~FileSource()
    {
        ::close(_fd);
    }

    std::size_t FileSource::read(std::span<std::uint8_t> buffer)
    {
        while (true)
        {
            auto const count = ::read(_fd, buffer.data(), buffer.size());
            if (count >= 0)
            {
                _position += static_cast<std::uint64_t>(count);
                return static_cast<std::size_t>(count);
            }
            if (errno != EINTR)
            {
                throw Exception::io("Read failed at offset {}: {}", _position, lastErrorMessage());
            }
        }
    }

    void FileSource::seek(std::uint64_t offset)
    {
        if (::lseek(_fd, static_cast<off_t>(offset), SEEK_SET) < 0)
        {
            throw Exception::io("Seek to offset {} failed: {}", offset, lastErrorMessage());
        }
        _position = offset;
    }

    std::uint64_t FileSource::tell() const
    {
        return _position;
    }

    std::optional<std::uint64_t> FileSource::length() const
    {
        return _length;
    }

    bool FileSource::isSeekable() const noexcept
    {
        return true;
    }

    /////////////////////////////////////////////////////////////////////////
    // MemorySource
    /////////////////////////////////////////////////////////////////////////

    MemorySource::MemorySource(std::vector<std::uint8_t> bytes)
        : _bytes{std::move(bytes)}
        , _position{0}
    {}

    std::size_t MemorySource::read(std::span<std::uint8_t> buffer)
    {
        if (_position >= _bytes.size())
        {
            return 0;
        }
        auto const count = std::min<std::size_t>(buffer.size(), _bytes.size() - _position);
        std::memcpy(buffer.data(), _bytes.data() + _position, count);
        _position += count;
        return count;
    }

    void MemorySource::seek(std::uint64_t offset)
    {
        // Seeking past the end is allowed, like lseek(); reads there return 0
        _position = offset;
    }

    std::uint64_t MemorySource::tell() const
    {
        return _position;
    }

    std::optional<std::uint64_t> MemorySource::length() const
    {
        return _bytes.size();
    }

    bool MemorySource::isSeekable() const noexcept
    {
        return true;
    }

    /////////////////////////////////////////////////////////////////////////
    // StreamSource
    /////////////////////////////////////////////////////////////////////////

    StreamSource::StreamSource(std::istream& stream)
        : _stream{&stream}
        , _position{0}
    {}

    std::size_t StreamSource::read(std::span<std::uint8_t> buffer)
    {
        if (buffer.empty() || _stream->eof())
        {
            return 0;
        }

        _stream->read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        auto const count = static_cast<std::size_t>(_stream->gcount());
        if (_stream->bad())
        {
            throw Exception::io("Stream read failed at offset {}", _position);
        }
        _position += count;
        return count;
    }

    void StreamSource::seek(std::uint64_t offset)
    {
        throw Exception::io("Cannot seek to offset {}: stream input is not seekable", offset);
    }

    std::uint64_t StreamSource::tell() const
    {
        return _position;
    }

    std::optional<std::uint64_t> StreamSource::length() const
    {
        return std::nullopt;
    }

    bool StreamSource::isSeekable() const noexcept
    {
        return false;
    }
}
