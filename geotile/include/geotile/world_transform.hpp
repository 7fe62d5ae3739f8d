#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <istream>
#include <string_view>
#include "types/result.hpp"

namespace geotile {

/// Approximate metres per degree of latitude at the equator
inline constexpr double kMetersPerDegree = 110000.0;

/// Selects the formula used by WorldTransform::world_to_pixel
enum class InverseMode {
    /// x = (lat - origin_lat) / x_res, y = (lon - origin_lon) / y_res.
    /// Not the algebraic inverse of pixel_to_world (no 110000 factor, origin subtracted).
    Legacy,
    /// x = lat / (x_res * 110000), y = lon / (y_res * 110000).
    /// Exact inverse of pixel_to_world.
    Strict
};

struct WorldPoint {
    double x{0.0};
    double y{0.0};

    [[nodiscard]] constexpr bool operator==(const WorldPoint& other) const noexcept = default;
};

struct PixelPoint {
    double x{0.0};
    double y{0.0};

    [[nodiscard]] constexpr bool operator==(const PixelPoint& other) const noexcept = default;
};

/// Axis-aligned affine transform read from a six-line world file (.tfw).
///
/// Line order: x resolution, rotation, rotation, y resolution, origin X
/// (named origin_lat), origin Y (named origin_lon). The rotation terms are
/// kept for inspection but do not take part in either mapping.
class WorldTransform {
private:
    double x_resolution_{0.0};
    double rotation_y_{0.0};
    double rotation_x_{0.0};
    double y_resolution_{0.0};
    double origin_lat_{0.0};
    double origin_lon_{0.0};

public:
    static constexpr std::size_t num_lines = 6;

    constexpr WorldTransform() noexcept = default;

    constexpr WorldTransform(double x_resolution, double rotation_y, double rotation_x,
                             double y_resolution, double origin_lat, double origin_lon) noexcept
        : x_resolution_(x_resolution)
        , rotation_y_(rotation_y)
        , rotation_x_(rotation_x)
        , y_resolution_(y_resolution)
        , origin_lat_(origin_lat)
        , origin_lon_(origin_lon) {}

    /// Read a world file from disk.
    /// @retval Error::Code::FileNotFound the file cannot be opened
    /// @retval Error::Code::ParseError fewer than six lines, or a line that is not a number
    [[nodiscard]] static Result<WorldTransform> load(const std::filesystem::path& path) noexcept;

    /// Parse the first six lines of a stream. Lines after the sixth are not read.
    [[nodiscard]] static Result<WorldTransform> parse(std::istream& input) noexcept;

    [[nodiscard]] static Result<WorldTransform> parse(std::string_view text) noexcept;

    /// Pixel to world: (x_res * 110000 * x, y_res * 110000 * y). Linear in (x, y).
    [[nodiscard]] constexpr WorldPoint pixel_to_world(double x, double y) const noexcept {
        return WorldPoint{x_resolution_ * kMetersPerDegree * x, y_resolution_ * kMetersPerDegree * y};
    }

    /// World to pixel. A zero resolution yields DivisionByZero.
    [[nodiscard]] Result<PixelPoint> world_to_pixel(double lat, double lon,
                                                    InverseMode mode = InverseMode::Legacy) const noexcept;

    [[nodiscard]] constexpr double x_resolution() const noexcept { return x_resolution_; }
    [[nodiscard]] constexpr double rotation_y() const noexcept { return rotation_y_; }
    [[nodiscard]] constexpr double rotation_x() const noexcept { return rotation_x_; }
    [[nodiscard]] constexpr double y_resolution() const noexcept { return y_resolution_; }
    [[nodiscard]] constexpr double origin_lat() const noexcept { return origin_lat_; }
    [[nodiscard]] constexpr double origin_lon() const noexcept { return origin_lon_; }

    /// The six coefficients in file order
    [[nodiscard]] constexpr std::array<double, num_lines> coefficients() const noexcept {
        return {x_resolution_, rotation_y_, rotation_x_, y_resolution_, origin_lat_, origin_lon_};
    }
};

/// Locate the world file next to a raster.
///
/// Tries, in order: first and last letter of the extension + 'w' (dem.tif -> dem.tfw),
/// then the whole extension + 'w' (dem.tifw). Each candidate is tried in lower case,
/// then upper case.
/// @retval Error::Code::FileNotFound no candidate exists
[[nodiscard]] Result<std::filesystem::path> find_world_file(const std::filesystem::path& raster_path) noexcept;

} // namespace geotile

#define GEOTILE_WORLD_TRANSFORM_HEADER
#include "impl/world_transform_impl.hpp"
