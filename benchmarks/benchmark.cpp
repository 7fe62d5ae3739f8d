#include <benchmark/benchmark.h>
#include <filesystem>
#include <memory>

#include "benchmark_helpers.hpp"

#include "../geotile/include/geotile/point_scan.hpp"
#include "../geotile/include/geotile/raster_file.hpp"
#include "../geotile/include/geotile/readers/reader_stream.hpp"
#include "../geotile/include/geotile/world_transform.hpp"
#ifdef HAVE_LIBTIFF
#include <tiffio.h>
#endif

/// StreamFileReader serializes reads behind a mutex; pread is lock-free.
#if defined(__linux__) || defined(__unix__) || defined(__APPLE__)
    #include "../geotile/include/geotile/readers/reader_unix_pread.hpp"
    using FileReader = geotile::PreadFileReader;
#else
    using FileReader = geotile::StreamFileReader;
#endif

namespace fs = std::filesystem;

using namespace geotile;
using namespace geotile_bench;

namespace {

ImageConfig config_from_range(const benchmark::State& state) {
    const auto width = static_cast<uint32_t>(state.range(0));
    const auto tile = static_cast<uint32_t>(state.range(1));
    return ImageConfig{width, width, tile, tile};
}

} // namespace

// ============================================================================
// Directory decoding
// ============================================================================

template <typename Reader>
static void BM_Open(benchmark::State& state) {
    // Parameters: width, tile size
    const ImageConfig config = config_from_range(state);

    ScratchDirectory scratch;
    RasterGenerator gen(scratch);
    auto filepath = gen.create_file("open", config);

    for (auto _ : state) {
        auto raster = RasterFile<Reader>::open(filepath.string());
        if (!raster.is_ok()) {
            state.SkipWithError(("Failed to open raster " + raster.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(raster.value().tile_offsets().data());
    }

    state.SetItemsProcessed(state.iterations());
    state.counters["tiles"] = static_cast<double>(config.num_tiles());
}

#ifdef HAVE_LIBTIFF
static void BM_LibTIFF_Open(benchmark::State& state) {
    const ImageConfig config = config_from_range(state);

    ScratchDirectory scratch;
    LibTiffGenerator gen(scratch);
    auto filepath = gen.create_file("open", config);

    for (auto _ : state) {
        TIFF* tif = TIFFOpen(filepath.string().c_str(), "r");
        if (!tif) {
            state.SkipWithError("Failed to open TIFF file");
            return;
        }
        uint32_t w = 0;
        TIFFGetField(tif, TIFFTAG_IMAGEWIDTH, &w);
        benchmark::DoNotOptimize(w);
        TIFFClose(tif);
    }

    state.SetItemsProcessed(state.iterations());
}
#endif // HAVE_LIBTIFF

// ============================================================================
// Random single-pixel access
// ============================================================================

template <typename Reader>
static void BM_SamplePixel_Random(benchmark::State& state) {
    const ImageConfig config = config_from_range(state);

    ScratchDirectory scratch;
    RasterGenerator gen(scratch);
    auto filepath = gen.create_file("sample_random", config, ImagePattern::Random);

    auto raster = RasterFile<Reader>::open(filepath.string());
    if (!raster.is_ok()) {
        state.SkipWithError(("Failed to open raster " + raster.error().message).c_str());
        return;
    }
    const auto pixels = random_pixels(config, 4096);

    std::size_t i = 0;
    for (auto _ : state) {
        const auto [x, y] = pixels[i++ % pixels.size()];
        auto sample = raster.value().sample_pixel(x, y);
        if (!sample.is_ok()) {
            state.SkipWithError(("Failed to sample " + sample.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(sample.value());
    }

    state.SetItemsProcessed(state.iterations());
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * sizeof(int16_t)));
}

// ============================================================================
// Whole-raster reads
// ============================================================================

template <typename Reader>
static void BM_ReadTile_All(benchmark::State& state) {
    const ImageConfig config = config_from_range(state);

    ScratchDirectory scratch;
    RasterGenerator gen(scratch);
    auto filepath = gen.create_file("read_tiles", config);

    auto raster = RasterFile<Reader>::open(filepath.string());
    if (!raster.is_ok()) {
        state.SkipWithError(("Failed to open raster " + raster.error().message).c_str());
        return;
    }

    std::size_t bytes_processed = 0;
    for (auto _ : state) {
        for (uint64_t tile = 0; tile < raster.value().grid().num_tiles(); ++tile) {
            auto samples = raster.value().read_tile(tile);
            if (!samples.is_ok()) {
                state.SkipWithError(("Failed to read tile " + samples.error().message).c_str());
                return;
            }
            benchmark::DoNotOptimize(samples.value().data());
            bytes_processed += samples.value().size() * sizeof(int16_t);
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(bytes_processed));
}

#ifdef HAVE_LIBTIFF
static void BM_LibTIFF_ReadTile_All(benchmark::State& state) {
    const ImageConfig config = config_from_range(state);

    ScratchDirectory scratch;
    LibTiffGenerator gen(scratch);
    auto filepath = gen.create_file("read_tiles", config);

    TIFF* tif = TIFFOpen(filepath.string().c_str(), "r");
    if (!tif) {
        state.SkipWithError("Failed to open TIFF file");
        return;
    }
    std::vector<int16_t> tile_buffer(static_cast<std::size_t>(config.tile_width) * config.tile_height);

    std::size_t bytes_processed = 0;
    for (auto _ : state) {
        for (uint32_t y = 0; y < config.height; y += config.tile_height) {
            for (uint32_t x = 0; x < config.width; x += config.tile_width) {
                if (TIFFReadTile(tif, tile_buffer.data(), x, y, 0, 0) < 0) {
                    TIFFClose(tif);
                    state.SkipWithError("Failed to read tile");
                    return;
                }
                benchmark::DoNotOptimize(tile_buffer.data());
                bytes_processed += tile_buffer.size() * sizeof(int16_t);
            }
        }
    }

    TIFFClose(tif);
    state.SetBytesProcessed(static_cast<int64_t>(bytes_processed));
}
#endif // HAVE_LIBTIFF

// ============================================================================
// Point cloud extraction
// ============================================================================

static void BM_ScanWindow(benchmark::State& state) {
    const ImageConfig config = config_from_range(state);
    const double nodata_fraction = static_cast<double>(state.range(2)) / 100.0;

    ScratchDirectory scratch;
    RasterGenerator gen(scratch);
    auto filepath = gen.create_file("scan", config, ImagePattern::Gradient, nodata_fraction);

    auto raster = RasterFile<FileReader>::open(filepath.string());
    auto world_path = find_world_file(filepath);
    if (!raster.is_ok() || !world_path.is_ok()) {
        state.SkipWithError("Failed to open raster or world file");
        return;
    }
    auto transform = WorldTransform::load(world_path.value());
    if (!transform.is_ok()) {
        state.SkipWithError(("Failed to load world file " + transform.error().message).c_str());
        return;
    }

    ScanOptions options;
    options.recenter = true;
    const auto window = PixelWindow::whole(raster.value().grid());

    for (auto _ : state) {
        auto cloud = scan_window(raster.value(), transform.value(), window, options);
        if (!cloud.is_ok()) {
            state.SkipWithError(("Failed to scan " + cloud.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(cloud.value().coordinates.data());
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(config.num_pixels()));
}

// ============================================================================
// Registration
// ============================================================================

// Params: width, tile size
BENCHMARK(BM_Open<FileReader>)
    ->Args({256, 64})
    ->Args({2048, 256})
    ->Args({2048, 64})
    ->Name("Geotile/Open/pread");

BENCHMARK(BM_Open<StreamFileReader>)
    ->Args({256, 64})
    ->Args({2048, 256})
    ->Args({2048, 64})
    ->Name("Geotile/Open/stream");

#ifdef HAVE_LIBTIFF
BENCHMARK(BM_LibTIFF_Open)
    ->Args({256, 64})
    ->Args({2048, 256})
    ->Args({2048, 64})
    ->Name("LibTIFF/Open");
#endif // HAVE_LIBTIFF

BENCHMARK(BM_SamplePixel_Random<FileReader>)
    ->Args({2048, 256})
    ->Name("Geotile/SamplePixel/Random/pread");

BENCHMARK(BM_SamplePixel_Random<StreamFileReader>)
    ->Args({2048, 256})
    ->Name("Geotile/SamplePixel/Random/stream");

BENCHMARK(BM_ReadTile_All<FileReader>)
    ->Args({2048, 256})
    ->Args({2048, 64})
    ->Name("Geotile/ReadTile/All/pread")
    ->Unit(benchmark::kMillisecond);

BENCHMARK(BM_ReadTile_All<StreamFileReader>)
    ->Args({2048, 256})
    ->Args({2048, 64})
    ->Name("Geotile/ReadTile/All/stream")
    ->Unit(benchmark::kMillisecond);

#ifdef HAVE_LIBTIFF
BENCHMARK(BM_LibTIFF_ReadTile_All)
    ->Args({2048, 256})
    ->Args({2048, 64})
    ->Name("LibTIFF/ReadTile/All")
    ->Unit(benchmark::kMillisecond);
#endif // HAVE_LIBTIFF

// Params: width, tile size, percent no-data
BENCHMARK(BM_ScanWindow)
    ->Args({512, 128, 0})
    ->Args({512, 128, 25})
    ->Name("Geotile/ScanWindow")
    ->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
