#pragma once

#include <cstddef>
#include <cstring>
#include <span>
#include <vector>
#include "../reader_base.hpp"
#include "read_view.hpp"

namespace geotile {

namespace buffer_impl {

[[nodiscard]] inline Result<read_view::BorrowedView> read(
    std::span<const std::byte> buffer, std::size_t offset, std::size_t size) noexcept {
    auto length = read_view::clamp_read(offset, size, buffer.size(), "buffer");
    if (length.is_error()) [[unlikely]] {
        return length.error();
    }
    return Ok(read_view::BorrowedView(buffer.subspan(offset, length.value())));
}

[[nodiscard]] inline Result<void> read_into(
    std::span<const std::byte> buffer, void* dest, std::size_t offset, std::size_t size) noexcept {
    auto check = read_view::check_exact_read(offset, size, buffer.size(), "buffer");
    if (check.is_error()) [[unlikely]] {
        return check;
    }
    std::memcpy(dest, buffer.data() + offset, size);
    return Ok();
}

} // namespace buffer_impl

/// Zero-copy reader over memory owned by the caller.
/// Thread-safe as long as the memory is not modified.
class BufferViewReader {
private:
    std::span<const std::byte> buffer_;

public:
    using ReadViewType = read_view::BorrowedView;

    static constexpr bool read_must_allocate = false;

    BufferViewReader() noexcept = default;

    explicit BufferViewReader(std::span<const std::byte> buffer) noexcept
        : buffer_(buffer) {}

    [[nodiscard]] Result<ReadViewType> read(std::size_t offset, std::size_t size) const noexcept {
        return buffer_impl::read(buffer_, offset, size);
    }

    [[nodiscard]] Result<void> read_into(void* dest_buffer, std::size_t offset, std::size_t size) const noexcept {
        return buffer_impl::read_into(buffer_, dest_buffer, offset, size);
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept { return Ok(buffer_.size()); }

    // Empty memory is a valid, zero-length source
    [[nodiscard]] bool is_valid() const noexcept { return true; }
};

static_assert(RawReader<BufferViewReader>, "BufferViewReader must satisfy RawReader concept");

/// Reader over an owned copy of the data, e.g. a raster fetched into memory
class BufferReader {
private:
    std::vector<std::byte> buffer_;

public:
    using ReadViewType = read_view::BorrowedView;

    static constexpr bool read_must_allocate = false;

    BufferReader() noexcept = default;

    explicit BufferReader(std::vector<std::byte> data) noexcept
        : buffer_(std::move(data)) {}

    explicit BufferReader(std::span<const std::byte> data)
        : buffer_(data.begin(), data.end()) {}

    [[nodiscard]] Result<ReadViewType> read(std::size_t offset, std::size_t size) const noexcept {
        return buffer_impl::read(buffer_, offset, size);
    }

    [[nodiscard]] Result<void> read_into(void* dest_buffer, std::size_t offset, std::size_t size) const noexcept {
        return buffer_impl::read_into(buffer_, dest_buffer, offset, size);
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept { return Ok(buffer_.size()); }

    [[nodiscard]] bool is_valid() const noexcept { return true; }
};

static_assert(RawReader<BufferReader>, "BufferReader must satisfy RawReader concept");

} // namespace geotile
