#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <utility>
#include "../logging.hpp"
#include "../types/result.hpp"

#ifndef GEOTILE_POINT_SCAN_HEADER
#include "../point_scan.hpp" // for linters
#endif

namespace geotile {

inline Result<void> validate_window(const PixelWindow& window, uint32_t width, uint32_t height) noexcept {
    if (window.end_x < window.start_x || window.end_y < window.start_y) [[unlikely]] {
        return Err(Error::Code::OutOfBounds,
                   "Inverted window (" + std::to_string(window.start_x) + ", " + std::to_string(window.start_y) +
                   ") - (" + std::to_string(window.end_x) + ", " + std::to_string(window.end_y) + ")");
    }
    if (window.start_x < 0 || window.start_y < 0 ||
        window.end_x > static_cast<int64_t>(width) || window.end_y > static_cast<int64_t>(height)) [[unlikely]] {
        return Err(Error::Code::OutOfBounds,
                   "Window (" + std::to_string(window.start_x) + ", " + std::to_string(window.start_y) +
                   ") - (" + std::to_string(window.end_x) + ", " + std::to_string(window.end_y) +
                   ") outside raster of " + std::to_string(width) + "x" + std::to_string(height));
    }
    return Ok();
}

template <RawReader Reader, typename Visitor>
    requires std::invocable<Visitor&, const WorldPoint&, int16_t>
Result<std::size_t> for_each_point(const RasterFile<Reader>& raster,
                                   const WorldTransform& transform,
                                   const PixelWindow& window,
                                   const ScanOptions& options,
                                   Visitor&& visitor) noexcept {
    auto valid = validate_window(window, raster.image_width(), raster.image_height());
    if (valid.is_error()) [[unlikely]] {
        return valid.error();
    }

    WorldPoint offset{};
    if (options.recenter) {
        offset = transform.pixel_to_world(static_cast<double>(window.center_x()),
                                          static_cast<double>(window.center_y()));
    }

    std::size_t skipped = 0;
    for (int64_t y = window.start_y; y < window.end_y; ++y) {
        for (int64_t x = window.start_x; x < window.end_x; ++x) {
            auto sample = raster.sample_pixel(x, y);
            if (sample.is_error()) [[unlikely]] {
                return sample.error();
            }
            const int16_t z = sample.value();
            if (z == options.nodata) {
                ++skipped;
                continue;
            }
            WorldPoint p = transform.pixel_to_world(static_cast<double>(x), static_cast<double>(y));
            p.x -= offset.x;
            p.y -= offset.y;
            visitor(p, z);
        }
    }

    log::debug("scanned {}x{} window, skipped {} no-data samples", window.width(), window.height(), skipped);
    return Ok(skipped);
}

template <RawReader Reader>
Result<PointCloud> scan_window(const RasterFile<Reader>& raster,
                               const WorldTransform& transform,
                               const PixelWindow& window,
                               const ScanOptions& options) noexcept {
    auto valid = validate_window(window, raster.image_width(), raster.image_height());
    if (valid.is_error()) [[unlikely]] {
        return valid.error();
    }

    PointCloud cloud;
    if (options.recenter) {
        cloud.offset = transform.pixel_to_world(static_cast<double>(window.center_x()),
                                                static_cast<double>(window.center_y()));
    }
    // No-data pixels are dropped, so only a bounded first chunk is reserved
    if (!window.empty()) {
        const auto pixels = static_cast<std::size_t>(window.width()) * static_cast<std::size_t>(window.height());
        cloud.coordinates.reserve(std::min(pixels, kInitialReservePoints) * 3);
    }

    auto result = for_each_point(raster, transform, window, options,
        [&cloud](const WorldPoint& p, int16_t z) {
            cloud.coordinates.push_back(p.x);
            cloud.coordinates.push_back(p.y);
            cloud.coordinates.push_back(static_cast<double>(z));
        });
    if (result.is_error()) [[unlikely]] {
        return result.error();
    }
    cloud.skipped = result.value();
    return Ok(std::move(cloud));
}

} // namespace geotile
