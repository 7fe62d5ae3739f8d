#pragma once

#include <bit>
#include <cstdint>
#include <cstddef>
#include <string_view>
#include <type_traits>

#ifndef GEOTILE_TYPES_HEADER
#include "../types.hpp" // for linters
#endif

namespace geotile {

template <typename T>
constexpr T byteswap(T value) noexcept {
    static_assert(std::is_integral_v<T>, "byteswap requires an integral type");
    using U = std::make_unsigned_t<T>;
    U in = static_cast<U>(value);
    U out = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        out = static_cast<U>((out << 8) | (in & 0xFFu));
        in = static_cast<U>(in >> 8);
    }
    return static_cast<T>(out);
}

template <typename T, std::endian SourceEndian, std::endian TargetEndian>
constexpr void convert_endianness([[maybe_unused]] T& value) noexcept {
    static_assert(std::is_integral_v<T>, "raster fields are integers");
    if constexpr (SourceEndian != TargetEndian) {
        value = byteswap(value);
    }
}

namespace detail {

template <std::endian StorageEndian, std::endian TargetEndian, typename T>
[[nodiscard]] constexpr T to_target(T value) noexcept {
    convert_endianness<T, StorageEndian, TargetEndian>(value);
    return value;
}

} // namespace detail

// RasterHeader

template <std::endian StorageEndian>
constexpr bool RasterHeader<StorageEndian>::is_little_endian() const noexcept {
    return identifier[0] == 'I' && identifier[1] == 'I';
}

template <std::endian StorageEndian>
constexpr bool RasterHeader<StorageEndian>::is_valid() const noexcept {
    return is_little_endian() && get_version<std::endian::native>() == 42;
}

template <std::endian StorageEndian>
constexpr uint16_t RasterHeader<StorageEndian>::get_identifier() const noexcept {
    return static_cast<uint16_t>(
        static_cast<uint8_t>(identifier[0]) | (static_cast<uint8_t>(identifier[1]) << 8));
}

template <std::endian StorageEndian>
template <std::endian TargetEndian>
constexpr uint16_t RasterHeader<StorageEndian>::get_version() const noexcept {
    return detail::to_target<StorageEndian, TargetEndian>(version);
}

template <std::endian StorageEndian>
template <std::endian TargetEndian>
constexpr int32_t RasterHeader<StorageEndian>::get_directory_offset() const noexcept {
    return detail::to_target<StorageEndian, TargetEndian>(directory_offset);
}

// DirectoryHeader

template <std::endian StorageEndian>
template <std::endian TargetEndian>
constexpr uint16_t DirectoryHeader<StorageEndian>::get_num_entries() const noexcept {
    return detail::to_target<StorageEndian, TargetEndian>(num_entries);
}

// DirectoryEntry

template <std::endian StorageEndian>
template <std::endian TargetEndian>
constexpr uint16_t DirectoryEntry<StorageEndian>::get_tag_id() const noexcept {
    return detail::to_target<StorageEndian, TargetEndian>(tag_id);
}

template <std::endian StorageEndian>
template <std::endian TargetEndian>
constexpr uint16_t DirectoryEntry<StorageEndian>::get_datatype() const noexcept {
    return detail::to_target<StorageEndian, TargetEndian>(datatype);
}

template <std::endian StorageEndian>
template <std::endian TargetEndian>
constexpr uint32_t DirectoryEntry<StorageEndian>::get_count() const noexcept {
    return detail::to_target<StorageEndian, TargetEndian>(count);
}

template <std::endian StorageEndian>
template <std::endian TargetEndian>
constexpr uint32_t DirectoryEntry<StorageEndian>::get_value_or_offset() const noexcept {
    return detail::to_target<StorageEndian, TargetEndian>(value_or_offset);
}

constexpr std::string_view tag_name(uint16_t tag_id) noexcept {
    switch (static_cast<TagCode>(tag_id)) {
        case TagCode::ImageWidth:                return "ImageWidth";
        case TagCode::ImageLength:               return "ImageLength";
        case TagCode::BitsPerSample:             return "BitsPerSample";
        case TagCode::Compression:               return "Compression";
        case TagCode::PhotometricInterpretation: return "PhotometricInterpretation";
        case TagCode::SamplesPerPixel:           return "SamplesPerPixel";
        case TagCode::TileWidth:                 return "TileWidth";
        case TagCode::TileLength:                return "TileLength";
        case TagCode::TileOffsets:               return "TileOffsets";
        case TagCode::TileByteCounts:            return "TileByteCounts";
        case TagCode::SampleFormat:              return "SampleFormat";
    }
    return "Unknown";
}

constexpr std::string_view datatype_name(uint16_t datatype) noexcept {
    switch (static_cast<TiffDataType>(datatype)) {
        case TiffDataType::Byte:      return "BYTE";
        case TiffDataType::Ascii:     return "ASCII";
        case TiffDataType::Short:     return "SHORT";
        case TiffDataType::Long:      return "LONG";
        case TiffDataType::Rational:  return "RATIONAL";
        case TiffDataType::SByte:     return "SBYTE";
        case TiffDataType::Undefined: return "UNDEFINED";
        case TiffDataType::SShort:    return "SSHORT";
        case TiffDataType::SLong:     return "SLONG";
        case TiffDataType::SRational: return "SRATIONAL";
        case TiffDataType::Float:     return "FLOAT";
        case TiffDataType::Double:    return "DOUBLE";
    }
    return "?";
}

} // namespace geotile
