#pragma once

#include <bit>
#include <cstddef>
#include <span>
#include <vector>
#include "reader_base.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace geotile {

/// Typed reads at absolute offsets on top of a RawReader.
/// Each helper issues exactly one positioned read; nothing depends on a cursor.
namespace parsing {

/// Read a trivially-copyable structure as stored on disk (no byte swapping).
/// Packed wire structs expose endian-aware getters instead.
template <RawReader Reader, typename T>
[[nodiscard]] Result<T> read_struct(const Reader& reader, std::size_t offset) noexcept;

/// Read a single scalar and convert it from SourceEndian to TargetEndian
template <RawReader Reader, typename T, std::endian SourceEndian, std::endian TargetEndian = std::endian::native>
[[nodiscard]] Result<T> read_scalar(const Reader& reader, std::size_t offset) noexcept;

/// Read output.size() consecutive scalars into a pre-allocated span
template <RawReader Reader, typename T, std::endian SourceEndian, std::endian TargetEndian = std::endian::native>
[[nodiscard]] Result<void> read_array_into(const Reader& reader, std::size_t offset, std::span<T> output) noexcept;

/// Read count consecutive scalars
template <RawReader Reader, typename T, std::endian SourceEndian, std::endian TargetEndian = std::endian::native>
[[nodiscard]] Result<std::vector<T>> read_array(const Reader& reader, std::size_t offset, std::size_t count) noexcept;

} // namespace parsing

} // namespace geotile

#define GEOTILE_PARSING_HEADER
#include "impl/parsing_impl.hpp"
