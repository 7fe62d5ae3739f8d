#include "benchmark_helpers.hpp"
#include <algorithm>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#ifdef HAVE_LIBTIFF
#include <tiffio.h>
#endif

namespace geotile_bench {

// ============================================================================
// ImageConfig
// ============================================================================

std::string ImageConfig::name() const {
    std::ostringstream oss;
    oss << width << "x" << height << "_tiles" << tile_width << "x" << tile_height;
    return oss.str();
}

// ============================================================================
// ImageGenerator
// ============================================================================

std::vector<int16_t> ImageGenerator::generate(const ImageConfig& config, ImagePattern pattern,
                                              double nodata_fraction, int16_t nodata) {
    std::vector<int16_t> data(config.num_pixels());

    switch (pattern) {
        case ImagePattern::Gradient:
            for (uint32_t y = 0; y < config.height; ++y) {
                for (uint32_t x = 0; x < config.width; ++x) {
                    data[static_cast<std::size_t>(y) * config.width + x] =
                        static_cast<int16_t>((x + y) % 4000 - 500);
                }
            }
            break;
        case ImagePattern::Random: {
            std::uniform_int_distribution<int> dist(-500, 8848);
            for (auto& val : data) {
                val = static_cast<int16_t>(dist(rng_));
            }
            break;
        }
        case ImagePattern::Constant:
            std::fill(data.begin(), data.end(), int16_t{100});
            break;
    }

    if (nodata_fraction > 0.0) {
        std::bernoulli_distribution hole(nodata_fraction);
        for (auto& val : data) {
            if (hole(rng_)) {
                val = nodata;
            }
        }
    }

    return data;
}

// ============================================================================
// ScratchDirectory
// ============================================================================

ScratchDirectory::ScratchDirectory() {
    root_ = std::filesystem::temp_directory_path() / "geotile_benchmarks";
    std::filesystem::create_directories(root_);
}

ScratchDirectory::~ScratchDirectory() {
    remove_all();
}

std::filesystem::path ScratchDirectory::path_for(const std::string& name, const std::string& extension) {
    auto path = root_ / (name + extension);
    created_.push_back(path);
    return path;
}

void ScratchDirectory::remove_all() {
    for (const auto& path : created_) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
    created_.clear();

    std::error_code ec;
    std::filesystem::remove(root_, ec);
}

// ============================================================================
// RasterGenerator
// ============================================================================

namespace {

void put_u16(std::vector<std::byte>& out, std::size_t offset, uint16_t v) {
    out[offset] = std::byte(v & 0xFF);
    out[offset + 1] = std::byte((v >> 8) & 0xFF);
}

void put_u32(std::vector<std::byte>& out, std::size_t offset, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out[offset + i] = std::byte((v >> (8 * i)) & 0xFF);
    }
}

void write_world_file(const std::filesystem::path& path) {
    std::ofstream file(path, std::ios::trunc);
    file << "0.0001\n0.0\n0.0\n-0.0001\n45.0\n-93.0\n";
}

} // namespace

std::filesystem::path RasterGenerator::create_file(
    const std::string& name,
    const ImageConfig& config,
    ImagePattern pattern,
    double nodata_fraction)
{
    const auto samples = generator_.generate(config, pattern, nodata_fraction);
    const std::size_t tile_bytes = static_cast<std::size_t>(config.tile_width) * config.tile_height * 2;
    const std::size_t num_tiles = config.num_tiles();

    // Header, tiles, offset table, directory
    constexpr uint16_t num_entries = 8;
    const std::size_t tiles_start = 8;
    const std::size_t table_offset = tiles_start + num_tiles * tile_bytes;
    const std::size_t dir_offset = table_offset + num_tiles * 4;
    const std::size_t total = dir_offset + 2 + num_entries * 12 + 4;
    if (total > 0xFFFFFFFFu) {
        throw std::runtime_error("Benchmark raster exceeds 4 GiB: " + config.name());
    }

    std::vector<std::byte> out(total);
    out[0] = std::byte{'I'};
    out[1] = std::byte{'I'};
    put_u16(out, 2, 42);
    put_u32(out, 4, static_cast<uint32_t>(dir_offset));

    for (std::size_t tile = 0; tile < num_tiles; ++tile) {
        const uint32_t tx = static_cast<uint32_t>(tile % config.tiles_across());
        const uint32_t ty = static_cast<uint32_t>(tile / config.tiles_across());
        const std::size_t base = tiles_start + tile * tile_bytes;
        for (uint32_t yt = 0; yt < config.tile_height; ++yt) {
            for (uint32_t xt = 0; xt < config.tile_width; ++xt) {
                const uint32_t x = tx * config.tile_width + xt;
                const uint32_t y = ty * config.tile_height + yt;
                const int16_t v = (x < config.width && y < config.height)
                    ? samples[static_cast<std::size_t>(y) * config.width + x] : int16_t{0};
                put_u16(out, base + (static_cast<std::size_t>(yt) * config.tile_width + xt) * 2,
                        static_cast<uint16_t>(v));
            }
        }
        put_u32(out, table_offset + tile * 4, static_cast<uint32_t>(base));
    }

    const struct { uint16_t id; uint16_t type; uint32_t count; uint32_t value; } entries[num_entries] = {
        {256, 4, 1, config.width},
        {257, 4, 1, config.height},
        {258, 3, 1, 16},
        {259, 3, 1, 1},
        {277, 3, 1, 1},
        {322, 4, 1, config.tile_width},
        {323, 4, 1, config.tile_height},
        {324, 4, static_cast<uint32_t>(num_tiles),
         num_tiles == 1 ? static_cast<uint32_t>(tiles_start) : static_cast<uint32_t>(table_offset)},
    };
    put_u16(out, dir_offset, num_entries);
    std::size_t pos = dir_offset + 2;
    for (const auto& e : entries) {
        put_u16(out, pos, e.id);
        put_u16(out, pos + 2, e.type);
        put_u32(out, pos + 4, e.count);
        put_u32(out, pos + 8, e.value);
        pos += 12;
    }
    put_u32(out, pos, 0);

    auto path = scratch_.path_for(name + "_" + config.name());
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(out.data()), static_cast<std::streamsize>(out.size()));
    file.close();

    write_world_file(scratch_.path_for(name + "_" + config.name(), ".tfw"));
    return path;
}

// ============================================================================
// LibTiffGenerator
// ============================================================================

#ifdef HAVE_LIBTIFF

std::filesystem::path LibTiffGenerator::create_file(
    const std::string& name,
    const ImageConfig& config,
    ImagePattern pattern)
{
    const auto samples = generator_.generate(config, pattern);
    auto path = scratch_.path_for(name + "_libtiff_" + config.name());

    TIFF* tif = TIFFOpen(path.string().c_str(), "wl");
    if (!tif) {
        throw std::runtime_error("Failed to create TIFF file: " + path.string());
    }

    TIFFSetField(tif, TIFFTAG_IMAGEWIDTH, config.width);
    TIFFSetField(tif, TIFFTAG_IMAGELENGTH, config.height);
    TIFFSetField(tif, TIFFTAG_BITSPERSAMPLE, 16);
    TIFFSetField(tif, TIFFTAG_SAMPLESPERPIXEL, 1);
    TIFFSetField(tif, TIFFTAG_SAMPLEFORMAT, SAMPLEFORMAT_INT);
    TIFFSetField(tif, TIFFTAG_COMPRESSION, COMPRESSION_NONE);
    TIFFSetField(tif, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_MINISBLACK);
    TIFFSetField(tif, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
    TIFFSetField(tif, TIFFTAG_TILEWIDTH, config.tile_width);
    TIFFSetField(tif, TIFFTAG_TILELENGTH, config.tile_height);

    std::vector<int16_t> tile(static_cast<std::size_t>(config.tile_width) * config.tile_height);
    for (uint32_t y0 = 0; y0 < config.height; y0 += config.tile_height) {
        for (uint32_t x0 = 0; x0 < config.width; x0 += config.tile_width) {
            std::fill(tile.begin(), tile.end(), int16_t{0});
            const uint32_t th = std::min(config.tile_height, config.height - y0);
            const uint32_t tw = std::min(config.tile_width, config.width - x0);
            for (uint32_t ty = 0; ty < th; ++ty) {
                std::memcpy(&tile[static_cast<std::size_t>(ty) * config.tile_width],
                            &samples[static_cast<std::size_t>(y0 + ty) * config.width + x0],
                            tw * sizeof(int16_t));
            }
            if (TIFFWriteTile(tif, tile.data(), x0, y0, 0, 0) < 0) {
                TIFFClose(tif);
                throw std::runtime_error("Failed to write tile to " + path.string());
            }
        }
    }

    TIFFClose(tif);
    return path;
}

#endif // HAVE_LIBTIFF

// ============================================================================
// Random access pattern
// ============================================================================

std::vector<std::pair<uint32_t, uint32_t>> random_pixels(const ImageConfig& config, std::size_t count,
                                                         uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<uint32_t> dx(0, config.width - 1);
    std::uniform_int_distribution<uint32_t> dy(0, config.height - 1);
    std::vector<std::pair<uint32_t, uint32_t>> pixels(count);
    for (auto& p : pixels) {
        p = {dx(rng), dy(rng)};
    }
    return pixels;
}

} // namespace geotile_bench
