#pragma once

#include <bit>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace geotile {

/// 8-byte raster file header: byte-order mark, version, directory offset
template <std::endian StorageEndian>
struct [[gnu::packed]] RasterHeader {
    char identifier[2];         // "II" for the supported little-endian profile
    uint16_t version;           // 42 for classic TIFF
    int32_t directory_offset;   // Signed by the on-disk contract; negative is invalid

    [[nodiscard]] constexpr bool is_little_endian() const noexcept;

    /// Identifier is "II" and version 42
    [[nodiscard]] constexpr bool is_valid() const noexcept;

    /// Byte-order mark as a little-endian u16 ("II" == 0x4949)
    [[nodiscard]] constexpr uint16_t get_identifier() const noexcept;

    template <std::endian TargetEndian = std::endian::native>
    [[nodiscard]] constexpr uint16_t get_version() const noexcept;

    template <std::endian TargetEndian = std::endian::native>
    [[nodiscard]] constexpr int32_t get_directory_offset() const noexcept;
};

static_assert(sizeof(RasterHeader<std::endian::little>) == 8, "RasterHeader must be 8 bytes");

/// Tag directory header: number of 12-byte entries that follow
template <std::endian StorageEndian>
struct [[gnu::packed]] DirectoryHeader {
    uint16_t num_entries;

    template <std::endian TargetEndian = std::endian::native>
    [[nodiscard]] constexpr uint16_t get_num_entries() const noexcept;
};

static_assert(sizeof(DirectoryHeader<std::endian::little>) == 2, "DirectoryHeader must be 2 bytes");

/// One 12-byte tag record
template <std::endian StorageEndian>
struct [[gnu::packed]] DirectoryEntry {
    uint16_t tag_id;
    uint16_t datatype;
    uint32_t count;
    uint32_t value_or_offset;

    template <std::endian TargetEndian = std::endian::native>
    [[nodiscard]] constexpr uint16_t get_tag_id() const noexcept;

    template <std::endian TargetEndian = std::endian::native>
    [[nodiscard]] constexpr uint16_t get_datatype() const noexcept;

    template <std::endian TargetEndian = std::endian::native>
    [[nodiscard]] constexpr uint32_t get_count() const noexcept;

    template <std::endian TargetEndian = std::endian::native>
    [[nodiscard]] constexpr uint32_t get_value_or_offset() const noexcept;
};

static_assert(sizeof(DirectoryEntry<std::endian::little>) == 12, "DirectoryEntry must be 12 bytes");

/// Tag codes the raster reader recognises. Everything else is skipped.
enum class TagCode : uint16_t {
    ImageWidth                = 256,
    ImageLength               = 257,
    BitsPerSample             = 258,
    Compression               = 259,
    PhotometricInterpretation = 262,
    SamplesPerPixel           = 277,
    TileWidth                 = 322,
    TileLength                = 323,
    TileOffsets               = 324,
    TileByteCounts            = 325,
    SampleFormat              = 339,
};

/// TIFF field types. The reader does not interpret them but reports them in diagnostics.
enum class TiffDataType : uint16_t {
    Byte      = 1,
    Ascii     = 2,
    Short     = 3,
    Long      = 4,
    Rational  = 5,
    SByte     = 6,
    Undefined = 7,
    SShort    = 8,
    SLong     = 9,
    SRational = 10,
    Float     = 11,
    Double    = 12,
};

[[nodiscard]] constexpr std::string_view tag_name(uint16_t tag_id) noexcept;

[[nodiscard]] constexpr std::string_view datatype_name(uint16_t datatype) noexcept;

template <typename T>
[[nodiscard]] constexpr T byteswap(T value) noexcept;

template <typename T, std::endian SourceEndian, std::endian TargetEndian>
constexpr void convert_endianness(T& value) noexcept;

} // namespace geotile

#define GEOTILE_TYPES_HEADER
#include "impl/types_impl.hpp"
