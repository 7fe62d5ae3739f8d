#pragma once

#include <algorithm>
#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include "../reader_base.hpp"

namespace geotile {

/// Views returned by RawReader::read and the range checks every reader shares
namespace read_view {

/// Non-owning view. Valid while the reader's storage is alive.
class BorrowedView {
private:
    std::span<const std::byte> data_;

public:
    BorrowedView() noexcept = default;
    explicit BorrowedView(std::span<const std::byte> data) noexcept : data_(data) {}

    BorrowedView(BorrowedView&&) noexcept = default;
    BorrowedView& operator=(BorrowedView&&) noexcept = default;
    BorrowedView(const BorrowedView&) = delete;
    BorrowedView& operator=(const BorrowedView&) = delete;

    [[nodiscard]] std::span<const std::byte> data() const noexcept { return data_; }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }
};

/// View over a heap buffer allocated for a single read
class OwnedView {
private:
    std::shared_ptr<std::byte[]> storage_;
    std::size_t size_{0};

public:
    OwnedView() noexcept = default;
    OwnedView(std::shared_ptr<std::byte[]> storage, std::size_t size) noexcept
        : storage_(std::move(storage)), size_(size) {}

    OwnedView(OwnedView&&) noexcept = default;
    OwnedView& operator=(OwnedView&&) noexcept = default;
    OwnedView(const OwnedView&) = delete;
    OwnedView& operator=(const OwnedView&) = delete;

    [[nodiscard]] std::span<const std::byte> data() const noexcept { return {storage_.get(), size_}; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] bool empty() const noexcept { return size_ == 0; }
};

static_assert(DataReadOnlyView<BorrowedView>, "BorrowedView must satisfy DataReadOnlyView concept");
static_assert(DataReadOnlyView<OwnedView>, "OwnedView must satisfy DataReadOnlyView concept");

/// Number of bytes a read(offset, size) may return from a source of source_size bytes.
/// The read is clamped at the end of the source; a start at or past the end fails.
[[nodiscard]] inline Result<std::size_t> clamp_read(std::size_t offset, std::size_t size,
                                                    std::size_t source_size, std::string_view source) noexcept {
    if (offset >= source_size) [[unlikely]] {
        return Err(Error::Code::UnexpectedEndOfFile,
                   "Read at offset " + std::to_string(offset) + " beyond end of " + std::string(source) +
                   " (" + std::to_string(source_size) + " bytes)");
    }
    return Ok(std::min(size, source_size - offset));
}

/// A read_into(offset, size) must lie entirely inside the source
[[nodiscard]] inline Result<void> check_exact_read(std::size_t offset, std::size_t size,
                                                   std::size_t source_size, std::string_view source) noexcept {
    if (offset >= source_size || size > source_size - offset) [[unlikely]] {
        return Err(Error::Code::UnexpectedEndOfFile,
                   "Read of " + std::to_string(size) + " bytes at offset " + std::to_string(offset) +
                   " extends beyond end of " + std::string(source) + " (" + std::to_string(source_size) + " bytes)");
    }
    return Ok();
}

} // namespace read_view

} // namespace geotile
