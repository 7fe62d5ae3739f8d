#pragma once

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <string>
#include <string_view>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include "../reader_base.hpp"
#include "read_view.hpp"

namespace geotile {

namespace pread_impl {

/// pread until length bytes arrived, end of file, or a hard error. EINTR is retried.
/// Returns the number of bytes read.
[[nodiscard]] inline Result<std::size_t> pread_full(int fd, void* dest, std::size_t offset, std::size_t length,
                                                    std::string_view path) noexcept {
    auto* out = static_cast<std::byte*>(dest);
    std::size_t total = 0;
    while (total < length) {
        const ssize_t n = ::pread(fd, out + total, length - total, static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return Err(Error::Code::ReadError,
                       "pread failed on " + std::string(path) + " at offset " + std::to_string(offset + total) +
                       ": " + std::strerror(errno));
        }
        if (n == 0) {
            break;
        }
        total += static_cast<std::size_t>(n);
    }
    return Ok(total);
}

} // namespace pread_impl

/// POSIX file reader. Reads are pread() calls on one descriptor with no
/// shared cursor, so concurrent reads need no locking.
class PreadFileReader {
private:
    int fd_{-1};
    std::size_t file_size_{0};
    std::string path_;

public:
    using ReadViewType = read_view::OwnedView;

    static constexpr bool read_must_allocate = true;

    PreadFileReader() noexcept = default;

    /// Open immediately; check is_valid() for the outcome
    explicit PreadFileReader(std::string_view path) noexcept {
        (void)open(path);
    }

    ~PreadFileReader() noexcept {
        close();
    }

    PreadFileReader(const PreadFileReader&) = delete;
    PreadFileReader& operator=(const PreadFileReader&) = delete;

    PreadFileReader(PreadFileReader&& other) noexcept
        : fd_(std::exchange(other.fd_, -1))
        , file_size_(std::exchange(other.file_size_, 0))
        , path_(std::move(other.path_)) {}

    PreadFileReader& operator=(PreadFileReader&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = std::exchange(other.fd_, -1);
            file_size_ = std::exchange(other.file_size_, 0);
            path_ = std::move(other.path_);
        }
        return *this;
    }

    [[nodiscard]] Result<void> open(std::string_view path) noexcept {
        close();

        path_ = path;
        fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd_ < 0) {
            return Err(Error::Code::FileNotFound,
                       "Failed to open file: " + path_ + " (" + std::strerror(errno) + ")");
        }

        struct stat st;
        if (::fstat(fd_, &st) != 0) {
            const int saved = errno;
            close();
            return Err(Error::Code::ReadError,
                       "Failed to get file size: " + path_ + " (" + std::strerror(saved) + ")");
        }
        file_size_ = static_cast<std::size_t>(st.st_size);
        return Ok();
    }

    void close() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
        file_size_ = 0;
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
        auto got = pread_impl::pread_full(fd_, storage.get(), offset, length.value(), path_);
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

        auto got = pread_impl::pread_full(fd_, dest_buffer, offset, size, path_);
        if (got.is_error()) [[unlikely]] {
            return got.error();
        }
        // The file shrank after open()
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

    [[nodiscard]] bool is_valid() const noexcept { return fd_ >= 0; }

    [[nodiscard]] std::string_view path() const noexcept { return path_; }
};

static_assert(RawReader<PreadFileReader>, "PreadFileReader must satisfy RawReader concept");

} // namespace geotile
