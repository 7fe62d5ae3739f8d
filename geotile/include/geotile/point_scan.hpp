#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "raster_file.hpp"
#include "reader_base.hpp"
#include "types/result.hpp"
#include "world_transform.hpp"

namespace geotile {

/// Half-open pixel rectangle [start_x, end_x) x [start_y, end_y)
struct PixelWindow {
    int64_t start_x{0};
    int64_t start_y{0};
    int64_t end_x{0};
    int64_t end_y{0};

    [[nodiscard]] constexpr int64_t width() const noexcept { return end_x - start_x; }
    [[nodiscard]] constexpr int64_t height() const noexcept { return end_y - start_y; }
    [[nodiscard]] constexpr bool empty() const noexcept { return width() <= 0 || height() <= 0; }

    /// Centre pixel, truncating division
    [[nodiscard]] constexpr int64_t center_x() const noexcept { return (start_x + end_x) / 2; }
    [[nodiscard]] constexpr int64_t center_y() const noexcept { return (start_y + end_y) / 2; }

    [[nodiscard]] static constexpr PixelWindow whole(const TileGrid& grid) noexcept {
        return PixelWindow{0, 0, grid.image_width(), grid.image_height()};
    }

    [[nodiscard]] constexpr bool operator==(const PixelWindow& other) const noexcept = default;
};

/// Points reserved up front by scan_window; the cloud grows past this as needed
inline constexpr std::size_t kInitialReservePoints = std::size_t{1} << 16;

struct ScanOptions {
    /// Samples equal to this value are skipped
    int16_t nodata = 32767;

    /// Subtract the world position of the window's centre pixel from every point
    bool recenter = false;
};

/// Flat (x, y, z) triples in world space
struct PointCloud {
    std::vector<double> coordinates;
    WorldPoint offset;            ///< Subtracted from every point (zero unless recentered)
    std::size_t skipped{0};       ///< Samples dropped as no-data

    [[nodiscard]] std::size_t size() const noexcept { return coordinates.size() / 3; }
    [[nodiscard]] bool empty() const noexcept { return coordinates.empty(); }
};

/// Check that a window lies inside a width x height raster and is not inverted
[[nodiscard]] Result<void> validate_window(const PixelWindow& window, uint32_t width, uint32_t height) noexcept;

/// Visit every non-nodata sample of a window in row-major order.
/// The visitor receives the (possibly recentered) world position and the raw sample.
/// Stops at the first read error.
template <RawReader Reader, typename Visitor>
    requires std::invocable<Visitor&, const WorldPoint&, int16_t>
[[nodiscard]] Result<std::size_t> for_each_point(const RasterFile<Reader>& raster,
                                                 const WorldTransform& transform,
                                                 const PixelWindow& window,
                                                 const ScanOptions& options,
                                                 Visitor&& visitor) noexcept;

/// Sample a window into a point cloud.
/// @retval Error::Code::OutOfBounds window inverted or outside the raster
template <RawReader Reader>
[[nodiscard]] Result<PointCloud> scan_window(const RasterFile<Reader>& raster,
                                             const WorldTransform& transform,
                                             const PixelWindow& window,
                                             const ScanOptions& options = {}) noexcept;

} // namespace geotile

#define GEOTILE_POINT_SCAN_HEADER
#include "impl/point_scan_impl.hpp"
