#pragma once

#include <cstdint>

namespace geotile {

/// Column/row of a tile in the row-major tile grid
struct TileCoordinates {
    uint32_t x{0};
    uint32_t y{0};

    [[nodiscard]] constexpr bool operator==(const TileCoordinates& other) const noexcept = default;
};

/// Dimensions of a tile in pixels
struct TileSize {
    uint32_t width{0};
    uint32_t length{0};
};

/// Where a pixel lives in the tile grid
/// @note Describes "which tile and where inside it", not where the tile is stored
struct TilePosition {
    uint64_t tile_index{0};   ///< Row-major tile index
    TileCoordinates tile;     ///< Tile column/row
    uint32_t x_in_tile{0};
    uint32_t y_in_tile{0};
};

/// Full decomposition of a pixel read (logical position + physical byte offset)
struct PixelLocation {
    TilePosition position;
    uint64_t tile_offset{0};  ///< File offset of the tile's first sample
    uint64_t byte_offset{0};  ///< File offset of the pixel's 2-byte sample
};

} // namespace geotile
