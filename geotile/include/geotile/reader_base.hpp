#pragma once

#include <concepts>
#include <cstddef>
#include <span>
#include <string_view>
#include "types/result.hpp"

namespace geotile {

/// Concept for a read-only view into data with RAII lifetime management
/// Only one thread at a time should access the view
template <typename T>
concept DataReadOnlyView = requires(T view) {
    { view.data() } -> std::same_as<std::span<const std::byte>>;
    { view.size() } -> std::same_as<std::size_t>;
    { view.empty() } -> std::same_as<bool>;

    // Must be movable for Result<T> and transferring ownership
    requires std::move_constructible<T>;
    requires std::is_nothrow_move_constructible_v<T>;
};

/// Concept for a raw reader that provides thread-safe positioned reads.
///
/// Reads are addressed by absolute byte offset; there is no shared cursor.
/// A read may return fewer bytes than requested when it crosses the end of
/// the source. A read starting at or beyond the end fails with
/// Error::Code::UnexpectedEndOfFile.
template <typename T>
concept RawReader = requires(const T reader, void* buffer, std::size_t offset, std::size_t size) {
    // Read operation returning a view (implementation may use zero-copy or allocate)
    // Calls to read() must be threadsafe.
    { reader.read(offset, size) } -> std::same_as<Result<typename T::ReadViewType>>;
    requires DataReadOnlyView<typename T::ReadViewType>;

    // Reads exactly size bytes into the caller's buffer, or fails
    { reader.read_into(buffer, offset, size) } -> std::same_as<Result<void>>;

    { reader.size() } -> std::same_as<Result<std::size_t>>;

    { reader.is_valid() } -> std::same_as<bool>;

    // Hint whether read() must allocate a new buffer or can return zero-copy views.
    // If true, read_into() should be preferred for performance.
    { T::read_must_allocate } -> std::convertible_to<bool>;
};

/// A RawReader backed by a file that can be opened from a path
template <typename T>
concept FileRawReader = RawReader<T> && std::default_initializable<T> &&
    requires(T reader, std::string_view path) {
        { reader.open(path) } -> std::same_as<Result<void>>;
    };

} // namespace geotile
