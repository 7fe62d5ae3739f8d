#pragma once

#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include <benchmark/benchmark.h>

namespace geotile_bench {

/// Raster geometry swept by the benchmarks
struct ImageConfig {
    uint32_t width;
    uint32_t height;
    uint32_t tile_width;
    uint32_t tile_height;

    std::string name() const;
    std::size_t num_pixels() const {
        return static_cast<std::size_t>(width) * height;
    }
    uint32_t tiles_across() const { return (width + tile_width - 1) / tile_width; }
    uint32_t tiles_down() const { return (height + tile_height - 1) / tile_height; }
    std::size_t num_tiles() const { return static_cast<std::size_t>(tiles_across()) * tiles_down(); }
};

enum ImagePattern {
    Gradient,
    Random,
    Constant
};

/// Elevation-like sample generator. A fraction of samples can be set to no-data.
class ImageGenerator {
public:
    explicit ImageGenerator(uint64_t seed = 42) : rng_(seed) {}

    /// Row-major samples (width * height)
    std::vector<int16_t> generate(const ImageConfig& config, ImagePattern pattern,
                                  double nodata_fraction = 0.0, int16_t nodata = 32767);

private:
    std::mt19937_64 rng_;
};

/// Directory under the system temp dir holding every generated raster; removed on destruction
class ScratchDirectory {
public:
    ScratchDirectory();
    ~ScratchDirectory();

    /// Path for a new file; remembered for removal
    std::filesystem::path path_for(const std::string& name, const std::string& extension = ".tif");

    void remove_all();

private:
    std::filesystem::path root_;
    std::vector<std::filesystem::path> created_;
};

/// Writes little-endian, uncompressed, single-band tiled 16-bit rasters and their world file
class RasterGenerator {
public:
    explicit RasterGenerator(ScratchDirectory& scratch)
        : scratch_(scratch), generator_() {}

    /// Create a raster file plus a .tfw sidecar; returns the raster path
    std::filesystem::path create_file(
        const std::string& name,
        const ImageConfig& image_config,
        ImagePattern pattern = ImagePattern::Gradient,
        double nodata_fraction = 0.0);

private:
    ScratchDirectory& scratch_;
    ImageGenerator generator_;
};

#ifdef HAVE_LIBTIFF
/// Same layout written through LibTIFF
class LibTiffGenerator {
public:
    explicit LibTiffGenerator(ScratchDirectory& scratch)
        : scratch_(scratch), generator_() {}

    std::filesystem::path create_file(
        const std::string& name,
        const ImageConfig& image_config,
        ImagePattern pattern = ImagePattern::Gradient);

private:
    ScratchDirectory& scratch_;
    ImageGenerator generator_;
};
#endif // HAVE_LIBTIFF

/// Random pixel coordinates inside a raster, generated once per benchmark
std::vector<std::pair<uint32_t, uint32_t>> random_pixels(const ImageConfig& config, std::size_t count,
                                                         uint64_t seed = 7);

} // namespace geotile_bench
