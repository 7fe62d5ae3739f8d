#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
#include "ifd.hpp"
#include "reader_base.hpp"
#include "tile_grid.hpp"
#include "types.hpp"
#include "types/result.hpp"
#include "types/tile_info.hpp"

namespace geotile {

/// How strictly RasterFile validates the tag directory
struct RasterOptions {
    /// Reject files whose tile offset table length differs from tiles_across * tiles_down.
    /// When false a short table only surfaces as OutOfBounds from sample_pixel.
    bool validate_tile_count = true;

    /// Reject files whose BitsPerSample tag is present and not 16.
    /// A missing BitsPerSample tag is always accepted as 16.
    bool require_16_bit_samples = true;

    /// Reject headers that are not "II" / 42 instead of logging a warning
    bool strict_header = false;
};

/// Random-access reader for a tiled, uncompressed, single-band 16-bit signed
/// raster stored little-endian in a single TIFF directory.
///
/// The directory is decoded once in open()/from_reader(); the object is
/// immutable afterwards. Every pixel access is one positioned read through
/// the Reader, so const methods may be called concurrently whenever the
/// Reader's read() is thread-safe (all readers shipped here are).
///
/// @tparam Reader Raw reader type (PreadFileReader, StreamFileReader, BufferReader, ...)
template <RawReader Reader>
class RasterFile {
public:
    static constexpr std::endian storage_endian = std::endian::little;
    static constexpr std::size_t bytes_per_sample = sizeof(int16_t);

    using reader_type = Reader;
    using sample_type = int16_t;

private:
    Reader reader_;
    RasterOptions options_;
    uint16_t identifier_{0};
    uint16_t version_{0};
    int32_t directory_offset_{0};
    int32_t next_directory_offset_{0};
    uint16_t bits_per_sample_{16};
    TileGrid grid_;
    std::vector<uint32_t> tile_offsets_;

    RasterFile(Reader&& reader, const RasterOptions& options) noexcept;

    [[nodiscard]] Result<void> load_directory() noexcept;

public:
    RasterFile(RasterFile&&) noexcept = default;
    RasterFile& operator=(RasterFile&&) noexcept = default;
    RasterFile(const RasterFile&) = delete;
    RasterFile& operator=(const RasterFile&) = delete;

    /// Open a file by path and decode its directory
    [[nodiscard]] static Result<RasterFile> open(std::string_view path, const RasterOptions& options = {}) noexcept
        requires FileRawReader<Reader>;

    /// Decode the directory of an already-opened reader. The reader is owned afterwards.
    [[nodiscard]] static Result<RasterFile> from_reader(Reader&& reader, const RasterOptions& options = {}) noexcept;

    /// Read the sample at pixel (x, y).
    /// @retval Error::Code::OutOfBounds (x, y) outside the raster, or its tile beyond the offset table
    /// @retval Error::Code::UnexpectedEndOfFile the sample lies past the end of the file
    [[nodiscard]] Result<int16_t> sample_pixel(int64_t x, int64_t y) const noexcept;

    /// Read every sample of one tile (tile_width * tile_length, row-major, edge padding included)
    [[nodiscard]] Result<std::vector<int16_t>> read_tile(uint64_t tile_index) const noexcept;

    /// Tile decomposition and file offset used by sample_pixel
    [[nodiscard]] Result<PixelLocation> locate(int64_t x, int64_t y) const noexcept;

    [[nodiscard]] uint16_t identifier() const noexcept { return identifier_; }
    [[nodiscard]] uint16_t version() const noexcept { return version_; }
    [[nodiscard]] int32_t directory_offset() const noexcept { return directory_offset_; }
    [[nodiscard]] int32_t next_directory_offset() const noexcept { return next_directory_offset_; }
    [[nodiscard]] uint16_t bits_per_sample() const noexcept { return bits_per_sample_; }

    [[nodiscard]] uint32_t image_width() const noexcept { return grid_.image_width(); }
    [[nodiscard]] uint32_t image_height() const noexcept { return grid_.image_height(); }
    [[nodiscard]] uint32_t tile_width() const noexcept { return grid_.tile_width(); }
    [[nodiscard]] uint32_t tile_length() const noexcept { return grid_.tile_length(); }
    [[nodiscard]] uint32_t tiles_across() const noexcept { return grid_.tiles_across(); }
    [[nodiscard]] uint32_t tiles_down() const noexcept { return grid_.tiles_down(); }

    [[nodiscard]] const TileGrid& grid() const noexcept { return grid_; }
    [[nodiscard]] std::span<const uint32_t> tile_offsets() const noexcept { return tile_offsets_; }
    [[nodiscard]] const RasterOptions& options() const noexcept { return options_; }
    [[nodiscard]] const Reader& reader() const noexcept { return reader_; }
};

} // namespace geotile

#define GEOTILE_RASTER_FILE_HEADER
#include "impl/raster_file_impl.hpp"
