#pragma once

#include <cstddef>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include "../reader_base.hpp"
#include "read_view.hpp"

namespace geotile {

/// Portable file reader on std::ifstream.
///
/// The stream has a single cursor, so each positioned read (seek, then read)
/// holds a mutex. Concurrent callers are correct but serialized; prefer
/// PreadFileReader where POSIX is available.
class StreamFileReader {
private:
    mutable std::ifstream stream_;
    mutable std::mutex mutex_;
    std::size_t file_size_{0};
    std::string path_;

    /// Seek and read up to length bytes. Returns the number of bytes read.
    [[nodiscard]] Result<std::size_t> locked_read(void* dest, std::size_t offset, std::size_t length) const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);

        stream_.clear();
        if (!stream_.seekg(static_cast<std::streamoff>(offset), std::ios::beg)) [[unlikely]] {
            return Err(Error::Code::ReadError, "Failed to seek to offset " + std::to_string(offset) + " in " + path_);
        }
        stream_.read(static_cast<char*>(dest), static_cast<std::streamsize>(length));
        if (stream_.bad()) [[unlikely]] {
            return Err(Error::Code::ReadError, "Failed to read " + path_);
        }
        return Ok(static_cast<std::size_t>(stream_.gcount()));
    }

    void release() noexcept {
        if (stream_.is_open()) {
            stream_.close();
        }
        file_size_ = 0;
    }

public:
    using ReadViewType = read_view::OwnedView;

    static constexpr bool read_must_allocate = true;

    StreamFileReader() noexcept = default;

    /// Open immediately; check is_valid() for the outcome
    explicit StreamFileReader(std::string_view path) noexcept {
        (void)open(path);
    }

    ~StreamFileReader() noexcept = default;

    StreamFileReader(const StreamFileReader&) = delete;
    StreamFileReader& operator=(const StreamFileReader&) = delete;

    // The mutex is not moved; the source must not be in use by another thread
    StreamFileReader(StreamFileReader&& other) noexcept
        : stream_(std::move(other.stream_))
        , file_size_(std::exchange(other.file_size_, 0))
        , path_(std::move(other.path_)) {}

    StreamFileReader& operator=(StreamFileReader&& other) noexcept {
        if (this != &other) {
            std::lock_guard<std::mutex> lock(mutex_);
            release();
            stream_ = std::move(other.stream_);
            file_size_ = std::exchange(other.file_size_, 0);
            path_ = std::move(other.path_);
        }
        return *this;
    }

    [[nodiscard]] Result<void> open(std::string_view path) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        release();

        path_ = path;
        stream_.open(path_, std::ios::binary | std::ios::in | std::ios::ate);
        if (!stream_.is_open()) {
            stream_.clear();
            return Err(Error::Code::FileNotFound, "Failed to open file: " + path_);
        }

        const auto end = stream_.tellg();
        if (end < 0) {
            release();
            return Err(Error::Code::ReadError, "Failed to get file size: " + path_);
        }
        file_size_ = static_cast<std::size_t>(end);
        return Ok();
    }

    void close() noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        release();
    }

    [[nodiscard]] Result<ReadViewType> read(std::size_t offset, std::size_t size) const noexcept {
        if (!is_valid()) [[unlikely]] {
            return Err(Error::Code::ReadError, "File not open");
        }
        auto length = read_view::clamp_read(offset, size, file_size_, path_);
        if (length.is_error()) [[unlikely]] {
            return length.error();
        }

        auto storage = std::shared_ptr<std::byte[]>(new std::byte[length.value()]);
        auto got = locked_read(storage.get(), offset, length.value());
        if (got.is_error()) [[unlikely]] {
            return got.error();
        }
        return Ok(ReadViewType(std::move(storage), got.value()));
    }

    [[nodiscard]] Result<void> read_into(void* dest_buffer, std::size_t offset, std::size_t size) const noexcept {
        if (!is_valid()) [[unlikely]] {
            return Err(Error::Code::ReadError, "File not open");
        }
        auto check = read_view::check_exact_read(offset, size, file_size_, path_);
        if (check.is_error()) [[unlikely]] {
            return check;
        }

        auto got = locked_read(dest_buffer, offset, size);
        if (got.is_error()) [[unlikely]] {
            return got.error();
        }
        if (got.value() != size) [[unlikely]] {
            return Err(Error::Code::UnexpectedEndOfFile,
                       "Short read from " + path_ + ": " + std::to_string(got.value()) + " of " +
                       std::to_string(size) + " bytes at offset " + std::to_string(offset));
        }
        return Ok();
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept {
        if (!is_valid()) [[unlikely]] {
            return Err(Error::Code::ReadError, "File not open");
        }
        return Ok(file_size_);
    }

    [[nodiscard]] bool is_valid() const noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        return stream_.is_open();
    }

    [[nodiscard]] std::string_view path() const noexcept { return path_; }
};

static_assert(RawReader<StreamFileReader>, "StreamFileReader must satisfy RawReader concept");

} // namespace geotile
