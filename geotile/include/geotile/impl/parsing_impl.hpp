#pragma once

#include <bit>
#include <cstring>
#include <span>
#include <string>
#include <vector>
#include "../reader_base.hpp"
#include "../types.hpp"
#include "../types/result.hpp"

#ifndef GEOTILE_PARSING_HEADER
#include "../parsing.hpp" // for linters
#endif

namespace geotile {

namespace parsing {

template <RawReader Reader, typename T>
Result<T> read_struct(const Reader& reader, std::size_t offset) noexcept {
    static_assert(std::is_trivially_copyable_v<T>, "read_struct requires a trivially copyable type");

    T value;
    auto result = reader.read_into(&value, offset, sizeof(T));
    if (result.is_error()) [[unlikely]] {
        return result.error().with_context("Failed to read " + std::to_string(sizeof(T)) + " bytes at offset " +
                                           std::to_string(offset));
    }
    return Ok(std::move(value));
}

template <RawReader Reader, typename T, std::endian SourceEndian, std::endian TargetEndian>
Result<T> read_scalar(const Reader& reader, std::size_t offset) noexcept {
    static_assert(std::is_arithmetic_v<T>, "read_scalar requires an arithmetic type");

    auto result = read_struct<Reader, T>(reader, offset);
    if (result.is_error()) [[unlikely]] {
        return result.error();
    }
    T value = result.value();
    convert_endianness<T, SourceEndian, TargetEndian>(value);
    return Ok(value);
}

template <RawReader Reader, typename T, std::endian SourceEndian, std::endian TargetEndian>
Result<void> read_array_into(const Reader& reader, std::size_t offset, std::span<T> output) noexcept {
    if (output.empty()) {
        return Ok();
    }

    std::size_t total_size = output.size() * sizeof(T);

    if constexpr (Reader::read_must_allocate) {
        auto result = reader.read_into(output.data(), offset, total_size);
        if (result.is_error()) [[unlikely]] {
            return result.error().with_context("Failed to read array at offset " + std::to_string(offset));
        }
    } else {
        auto view_result = reader.read(offset, total_size);
        if (view_result.is_error()) [[unlikely]] {
            return view_result.error().with_context("Failed to read array at offset " + std::to_string(offset));
        }

        const auto& view = view_result.value();
        if (view.size() < total_size) [[unlikely]] {
            return Err(Error::Code::UnexpectedEndOfFile,
                       "Incomplete array read at offset " + std::to_string(offset) + ": expected " +
                       std::to_string(total_size) + " bytes, got " + std::to_string(view.size()));
        }

        std::memcpy(output.data(), view.data().data(), total_size);
    }

    if constexpr (SourceEndian != TargetEndian) {
        for (auto& val : output) {
            convert_endianness<T, SourceEndian, TargetEndian>(val);
        }
    }

    return Ok();
}

template <RawReader Reader, typename T, std::endian SourceEndian, std::endian TargetEndian>
Result<std::vector<T>> read_array(const Reader& reader, std::size_t offset, std::size_t count) noexcept {
    if (count == 0) {
        return Ok(std::vector<T>{});
    }

    // Counts come from the file: bound them by the source before allocating
    auto source_size = reader.size();
    if (source_size.is_error()) [[unlikely]] {
        return source_size.error();
    }
    const std::size_t available = offset < source_size.value() ? source_size.value() - offset : 0;
    if (count > available / sizeof(T)) [[unlikely]] {
        return Err(Error::Code::UnexpectedEndOfFile,
                   "Array of " + std::to_string(count) + " elements at offset " + std::to_string(offset) +
                   " extends beyond end of source (" + std::to_string(source_size.value()) + " bytes)");
    }

    std::vector<T> values(count);
    auto result = read_array_into<Reader, T, SourceEndian, TargetEndian>(reader, offset, std::span<T>(values));

    if (result.is_error()) {
        return result.error();
    }

    return Ok(std::move(values));
}

} // namespace parsing

} // namespace geotile
