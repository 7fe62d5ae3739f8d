#pragma once

// This file contains the implementation of directory operations.
// Do not include this file directly - it is included by ifd.hpp

#include <cstring>
#include <string>
#include <vector>
#include "../parsing.hpp"
#include "../reader_base.hpp"
#include "../types.hpp"
#include "../types/result.hpp"

#ifndef GEOTILE_IFD_HEADER
#include "../ifd.hpp" // for linters
#endif

namespace geotile {

namespace ifd {

template <std::endian SourceEndian>
std::size_t Directory<SourceEndian>::num_entries() const noexcept {
    return entries.size();
}

template <std::endian SourceEndian>
const DirectoryEntry<SourceEndian>* Directory<SourceEndian>::find(TagCode code) const noexcept {
    for (const auto& entry : entries) {
        if (entry.template get_tag_id<std::endian::native>() == static_cast<uint16_t>(code)) {
            return &entry;
        }
    }
    return nullptr;
}

template <std::endian SourceEndian>
constexpr std::size_t Directory<SourceEndian>::size_in_bytes(std::size_t num_entries) noexcept {
    return sizeof(DirectoryHeader<SourceEndian>) +
           num_entries * sizeof(DirectoryEntry<SourceEndian>) +
           sizeof(int32_t);
}

template <RawReader Reader, std::endian SourceEndian>
Result<RasterHeader<SourceEndian>> read_header(const Reader& reader) noexcept {
    auto header_result = parsing::read_struct<Reader, RasterHeader<SourceEndian>>(reader, 0);
    if (header_result.is_error()) [[unlikely]] {
        return header_result.error().with_context("Failed to read raster header");
    }
    return header_result;
}

inline Result<DirectoryOffset> to_directory_offset(int32_t raw_offset) noexcept {
    if (raw_offset < 0) [[unlikely]] {
        return Err(Error::Code::InvalidFormat,
                   "Negative directory offset in header: " + std::to_string(raw_offset));
    }
    return Ok(DirectoryOffset(static_cast<std::size_t>(raw_offset)));
}

template <RawReader Reader, std::endian SourceEndian>
Result<Directory<SourceEndian>> read_directory(const Reader& reader, DirectoryOffset offset) noexcept {
    using HeaderType = DirectoryHeader<SourceEndian>;
    using EntryType = DirectoryEntry<SourceEndian>;

    auto header_result = parsing::read_struct<Reader, HeaderType>(reader, offset.value);
    if (header_result.is_error()) [[unlikely]] {
        return header_result.error().with_context("Failed to read directory entry count at offset " +
                                                  std::to_string(offset.value));
    }

    const std::size_t num_entries =
        static_cast<std::size_t>(header_result.value().template get_num_entries<std::endian::native>());

    Directory<SourceEndian> dir;
    dir.offset = offset;

    // Entries + next directory offset in one read
    const std::size_t total_read_size = num_entries * sizeof(EntryType) + sizeof(int32_t);
    const std::size_t entries_offset = offset.value + sizeof(HeaderType);

    std::vector<std::byte> raw(total_read_size);
    auto read_result = reader.read_into(raw.data(), entries_offset, total_read_size);
    if (read_result.is_error()) [[unlikely]] {
        return read_result.error().with_context("Failed to read " + std::to_string(num_entries) +
                                                " directory entries and next offset");
    }

    dir.entries.resize(num_entries);
    if (num_entries > 0) {
        std::memcpy(dir.entries.data(), raw.data(), num_entries * sizeof(EntryType));
    }

    int32_t next_offset;
    std::memcpy(&next_offset, raw.data() + num_entries * sizeof(EntryType), sizeof(int32_t));
    convert_endianness<int32_t, SourceEndian, std::endian::native>(next_offset);
    dir.next_directory_offset = next_offset;

    return Ok(std::move(dir));
}

template <RawReader Reader, std::endian SourceEndian>
Result<std::vector<uint32_t>> read_u32_values(
    const Reader& reader, const DirectoryEntry<SourceEndian>& entry) noexcept {
    const std::size_t count = static_cast<std::size_t>(entry.template get_count<std::endian::native>());
    const uint32_t value = entry.template get_value_or_offset<std::endian::native>();

    if (count == 0) {
        return Ok(std::vector<uint32_t>{});
    }
    // A single value is stored in the value field itself, as TIFF writers lay out a one-tile
    // offset table. Larger tables are pointed to by the value field.
    if (count == 1) {
        return Ok(std::vector<uint32_t>{value});
    }

    auto values = parsing::read_array<Reader, uint32_t, SourceEndian>(reader, value, count);
    if (values.is_error()) [[unlikely]] {
        return values.error().with_context("Failed to read " + std::to_string(count) + " values of tag " +
                                           std::to_string(entry.template get_tag_id<std::endian::native>()) +
                                           " at offset " + std::to_string(value));
    }
    return values;
}

} // namespace ifd

} // namespace geotile
