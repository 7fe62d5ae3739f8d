#pragma once

/**
 * @file ifd.hpp
 * @brief Raster header and tag directory decoding
 *
 * The supported profile has a single directory:
 *   - an 8-byte header at offset 0 (identifier, version, signed directory offset)
 *   - a u16 entry count at the directory offset
 *   - that many 12-byte entries
 *   - a trailing 4-byte next-directory offset, kept for diagnostics only
 *
 * @code{.cpp}
 * using namespace geotile;
 *
 * PreadFileReader reader("dem.tif");
 * auto header = ifd::read_header<PreadFileReader, std::endian::little>(reader);
 * if (!header) {
 *     return;
 * }
 * auto dir = ifd::read_directory<PreadFileReader, std::endian::little>(
 *     reader, ifd::DirectoryOffset(header.value().get_directory_offset()));
 * @endcode
 *
 * @note All functions are noexcept and use Result<T> for error handling
 */

#include <bit>
#include <cstdint>
#include <vector>
#include "parsing.hpp"
#include "reader_base.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace geotile {

namespace ifd {

/// Strongly-typed directory offset in the file
struct DirectoryOffset {
    std::size_t value;
    constexpr DirectoryOffset() noexcept : value(0) {}
    constexpr explicit DirectoryOffset(std::size_t offset) noexcept : value(offset) {}
    [[nodiscard]] constexpr bool operator==(const DirectoryOffset& other) const noexcept = default;
};

/// A decoded tag directory. Entries are kept in storage byte order.
template <std::endian SourceEndian>
struct Directory {
    DirectoryOffset offset;
    std::vector<DirectoryEntry<SourceEndian>> entries;
    int32_t next_directory_offset{0};

    [[nodiscard]] std::size_t num_entries() const noexcept;

    /// First entry carrying the given tag, or nullptr
    [[nodiscard]] const DirectoryEntry<SourceEndian>* find(TagCode code) const noexcept;

    /// Size in bytes of a directory with num_entries entries
    [[nodiscard]] static constexpr std::size_t size_in_bytes(std::size_t num_entries) noexcept;
};

/// Read the 8-byte header at offset 0. No validation beyond the read itself.
template <RawReader Reader, std::endian SourceEndian>
[[nodiscard]] Result<RasterHeader<SourceEndian>> read_header(const Reader& reader) noexcept;

/// Validate a directory offset from the header and convert it
[[nodiscard]] inline Result<DirectoryOffset> to_directory_offset(int32_t raw_offset) noexcept;

/// Read the entry count, all entries and the trailing next-directory offset.
/// Entries and the next offset come from a single positioned read.
template <RawReader Reader, std::endian SourceEndian>
[[nodiscard]] Result<Directory<SourceEndian>> read_directory(const Reader& reader, DirectoryOffset offset) noexcept;

/// Resolve the u32 values of an entry. The data-type field is not consulted.
///
/// A single value is taken from the entry's value field, as every TIFF writer
/// stores a one-element LONG table inline. Larger tables are read from
/// value_or_offset in file order.
template <RawReader Reader, std::endian SourceEndian>
[[nodiscard]] Result<std::vector<uint32_t>> read_u32_values(
    const Reader& reader, const DirectoryEntry<SourceEndian>& entry) noexcept;

} // namespace ifd

} // namespace geotile

#define GEOTILE_IFD_HEADER
#include "impl/ifd_impl.hpp"
