#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "../ifd.hpp"
#include "../logging.hpp"
#include "../parsing.hpp"
#include "../tile_grid.hpp"
#include "../types.hpp"
#include "../types/result.hpp"

#ifndef GEOTILE_RASTER_FILE_HEADER
#include "../raster_file.hpp" // for linters
#endif

namespace geotile {

template <RawReader Reader>
RasterFile<Reader>::RasterFile(Reader&& reader, const RasterOptions& options) noexcept
    : reader_(std::move(reader))
    , options_(options) {}

template <RawReader Reader>
Result<RasterFile<Reader>> RasterFile<Reader>::open(std::string_view path, const RasterOptions& options) noexcept
    requires FileRawReader<Reader>
{
    Reader reader;
    auto open_result = reader.open(path);
    if (open_result.is_error()) [[unlikely]] {
        return open_result.error();
    }
    return from_reader(std::move(reader), options);
}

template <RawReader Reader>
Result<RasterFile<Reader>> RasterFile<Reader>::from_reader(Reader&& reader, const RasterOptions& options) noexcept {
    if (!reader.is_valid()) [[unlikely]] {
        return Err(Error::Code::ReadError, "Reader is not open");
    }

    RasterFile raster(std::move(reader), options);
    auto load_result = raster.load_directory();
    if (load_result.is_error()) [[unlikely]] {
        return load_result.error();
    }
    return Ok(std::move(raster));
}

template <RawReader Reader>
Result<void> RasterFile<Reader>::load_directory() noexcept {
    constexpr auto E = storage_endian;

    auto header_result = ifd::read_header<Reader, E>(reader_);
    if (header_result.is_error()) [[unlikely]] {
        return header_result.error();
    }
    const auto& header = header_result.value();

    identifier_ = header.get_identifier();
    version_ = header.template get_version<std::endian::native>();
    directory_offset_ = header.template get_directory_offset<std::endian::native>();

    if (!header.is_valid()) {
        if (options_.strict_header) {
            return Err(Error::Code::InvalidHeader,
                       "Expected little-endian classic TIFF header (\"II\", 42), got identifier 0x" +
                       fmt::format("{:04x}", identifier_) + " version " + std::to_string(version_));
        }
        log::warn("unexpected raster header: identifier 0x{:04x}, version {}; reading as little-endian classic TIFF",
                  identifier_, version_);
    }

    auto offset_result = ifd::to_directory_offset(directory_offset_);
    if (offset_result.is_error()) [[unlikely]] {
        return offset_result.error();
    }

    auto dir_result = ifd::read_directory<Reader, E>(reader_, offset_result.value());
    if (dir_result.is_error()) [[unlikely]] {
        return dir_result.error();
    }
    const auto& dir = dir_result.value();
    next_directory_offset_ = dir.next_directory_offset;

    log::debug("directory at offset {}: {} entries, next directory offset {}",
               dir.offset.value, dir.num_entries(), next_directory_offset_);

    std::optional<uint32_t> image_width;
    std::optional<uint32_t> image_height;
    std::optional<uint32_t> bits_per_sample;
    std::optional<uint32_t> tile_width;
    std::optional<uint32_t> tile_length;
    std::optional<std::vector<uint32_t>> tile_offsets;

    for (const auto& entry : dir.entries) {
        const uint16_t tag_id = entry.template get_tag_id<std::endian::native>();
        const uint32_t value = entry.template get_value_or_offset<std::endian::native>();

        log::debug("tag {} ({}): type {}, count {}, value {}",
                   tag_id, tag_name(tag_id), datatype_name(entry.template get_datatype<std::endian::native>()),
                   entry.template get_count<std::endian::native>(), value);

        switch (static_cast<TagCode>(tag_id)) {
            case TagCode::ImageWidth:
                image_width = value;
                break;
            case TagCode::ImageLength:
                image_height = value;
                break;
            case TagCode::BitsPerSample:
                bits_per_sample = value;
                break;
            case TagCode::TileWidth:
                tile_width = value;
                break;
            case TagCode::TileLength:
                tile_length = value;
                break;
            case TagCode::TileOffsets: {
                auto offsets_result = ifd::read_u32_values<Reader, E>(reader_, entry);
                if (offsets_result.is_error()) [[unlikely]] {
                    return offsets_result.error();
                }
                tile_offsets = std::move(offsets_result.value());
                break;
            }
            default:
                log::trace("ignoring tag {}", tag_id);
                break;
        }
    }

    if (!image_width) {
        return Err(Error::Code::MissingTag, "Required tag ImageWidth (256) not found");
    }
    if (!image_height) {
        return Err(Error::Code::MissingTag, "Required tag ImageLength (257) not found");
    }
    if (!tile_width) {
        return Err(Error::Code::MissingTag, "Required tag TileWidth (322) not found");
    }
    if (!tile_length) {
        return Err(Error::Code::MissingTag, "Required tag TileLength (323) not found");
    }
    if (!tile_offsets) {
        return Err(Error::Code::MissingTag, "Required tag TileOffsets (324) not found");
    }

    if (bits_per_sample) {
        if (*bits_per_sample != 16 && options_.require_16_bit_samples) {
            return Err(Error::Code::UnsupportedFeature,
                       "Only 16-bit samples are supported, BitsPerSample is " + std::to_string(*bits_per_sample));
        }
        bits_per_sample_ = static_cast<uint16_t>(*bits_per_sample);
    }

    auto grid_result = TileGrid::create(*image_width, *image_height, *tile_width, *tile_length);
    if (grid_result.is_error()) [[unlikely]] {
        return grid_result.error();
    }
    grid_ = grid_result.value();

    if (options_.validate_tile_count && tile_offsets->size() != grid_.num_tiles()) {
        return Err(Error::Code::InvalidFormat,
                   "TileOffsets has " + std::to_string(tile_offsets->size()) + " entries, expected " +
                   std::to_string(grid_.num_tiles()) + " (" + std::to_string(grid_.tiles_across()) + "x" +
                   std::to_string(grid_.tiles_down()) + " tiles)");
    }
    tile_offsets_ = std::move(*tile_offsets);

    log::debug("raster {}x{}, tiles {}x{} in a {}x{} grid",
               grid_.image_width(), grid_.image_height(), grid_.tile_width(), grid_.tile_length(),
               grid_.tiles_across(), grid_.tiles_down());

    return Ok();
}

template <RawReader Reader>
Result<PixelLocation> RasterFile<Reader>::locate(int64_t x, int64_t y) const noexcept {
    auto position_result = grid_.position(x, y);
    if (position_result.is_error()) [[unlikely]] {
        return position_result.error();
    }
    const auto& position = position_result.value();

    if (position.tile_index >= tile_offsets_.size()) [[unlikely]] {
        return Err(Error::Code::OutOfBounds,
                   "Tile index " + std::to_string(position.tile_index) + " of pixel (" + std::to_string(x) +
                   ", " + std::to_string(y) + ") beyond offset table of " +
                   std::to_string(tile_offsets_.size()) + " entries");
    }

    PixelLocation location;
    location.position = position;
    location.tile_offset = tile_offsets_[position.tile_index];
    location.byte_offset = location.tile_offset +
        (static_cast<uint64_t>(position.y_in_tile) * grid_.tile_width() + position.x_in_tile) * bytes_per_sample;
    return Ok(location);
}

template <RawReader Reader>
Result<int16_t> RasterFile<Reader>::sample_pixel(int64_t x, int64_t y) const noexcept {
    auto location_result = locate(x, y);
    if (location_result.is_error()) [[unlikely]] {
        return location_result.error();
    }

    return parsing::read_scalar<Reader, int16_t, storage_endian>(
        reader_, static_cast<std::size_t>(location_result.value().byte_offset));
}

template <RawReader Reader>
Result<std::vector<int16_t>> RasterFile<Reader>::read_tile(uint64_t tile_index) const noexcept {
    if (tile_index >= grid_.num_tiles() || tile_index >= tile_offsets_.size()) [[unlikely]] {
        return Err(Error::Code::OutOfBounds,
                   "Tile index " + std::to_string(tile_index) + " outside grid of " +
                   std::to_string(grid_.num_tiles()) + " tiles with " +
                   std::to_string(tile_offsets_.size()) + " offsets");
    }

    return parsing::read_array<Reader, int16_t, storage_endian>(
        reader_, tile_offsets_[tile_index], static_cast<std::size_t>(grid_.samples_per_tile()));
}

} // namespace geotile
