// geotile_scan: sample a window of a tiled 16-bit raster and print world-space
// "x y z" points, one per line, skipping no-data samples.

#include <charconv>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/core.h>

#include "geotile/geotile.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitRuntime = 1;
constexpr int kExitUsage = 2;

struct Arguments {
    std::string raster_path;
    std::optional<std::string> world_path;
    std::optional<geotile::PixelWindow> window;
    geotile::ScanOptions scan;
    bool info = false;
    bool verbose = false;
};

void print_usage(std::string_view program) {
    fmt::print(stderr,
               "usage: {} <raster> [--world <file>] [--window x0 y0 x1 y1]\n"
               "       [--nodata <v>] [--recenter] [--info] [--verbose]\n",
               program);
}

template <typename T>
std::optional<T> parse_integer(std::string_view text) {
    T value{};
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

/// Returns an error message on failure
std::optional<std::string> parse_arguments(int argc, char** argv, Arguments& args) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        auto remaining = [&](int n) { return i + n < argc; };

        if (arg == "--world") {
            if (!remaining(1)) {
                return std::string("--world needs a file name");
            }
            args.world_path = argv[++i];
        } else if (arg == "--window") {
            if (!remaining(4)) {
                return std::string("--window needs four integers");
            }
            int64_t bounds[4];
            for (auto& bound : bounds) {
                auto value = parse_integer<int64_t>(argv[++i]);
                if (!value) {
                    return fmt::format("--window: '{}' is not an integer", argv[i]);
                }
                bound = *value;
            }
            args.window = geotile::PixelWindow{bounds[0], bounds[1], bounds[2], bounds[3]};
        } else if (arg == "--nodata") {
            if (!remaining(1)) {
                return std::string("--nodata needs a value");
            }
            auto value = parse_integer<int16_t>(argv[++i]);
            if (!value) {
                return fmt::format("--nodata: '{}' is not a 16-bit integer", argv[i]);
            }
            args.scan.nodata = *value;
        } else if (arg == "--recenter") {
            args.scan.recenter = true;
        } else if (arg == "--info") {
            args.info = true;
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg.starts_with("--")) {
            return fmt::format("unknown option '{}'", arg);
        } else if (args.raster_path.empty()) {
            args.raster_path = std::string(arg);
        } else {
            return fmt::format("unexpected argument '{}'", arg);
        }
    }

    if (args.raster_path.empty()) {
        return std::string("missing raster file");
    }
    return std::nullopt;
}

int report(const geotile::Error& error) {
    fmt::print(stderr, "geotile_scan: {} ({})\n", error.message, geotile::to_string(error.category()));
    return kExitRuntime;
}

void print_info(const geotile::FileRaster& raster, const std::string& world_path,
                const geotile::WorldTransform& transform) {
    fmt::print("identifier:        0x{:04x}\n", raster.identifier());
    fmt::print("version:           {}\n", raster.version());
    fmt::print("directory offset:  {}\n", raster.directory_offset());
    fmt::print("next directory:    {}\n", raster.next_directory_offset());
    fmt::print("bits per sample:   {}\n", raster.bits_per_sample());
    fmt::print("image:             {} x {}\n", raster.image_width(), raster.image_height());
    fmt::print("tile:              {} x {}\n", raster.tile_width(), raster.tile_length());
    fmt::print("tiles:             {} x {} ({} offsets)\n",
               raster.tiles_across(), raster.tiles_down(), raster.tile_offsets().size());
    fmt::print("world file:        {}\n", world_path);
    fmt::print("resolution:        {} {}\n", transform.x_resolution(), transform.y_resolution());
    fmt::print("rotation:          {} {}\n", transform.rotation_y(), transform.rotation_x());
    fmt::print("origin:            {} {}\n", transform.origin_lat(), transform.origin_lon());
}

} // namespace

int main(int argc, char** argv) {
    Arguments args;
    if (auto usage_error = parse_arguments(argc, argv, args)) {
        fmt::print(stderr, "geotile_scan: {}\n", *usage_error);
        print_usage(argc > 0 ? argv[0] : "geotile_scan");
        return kExitUsage;
    }

    if (args.verbose) {
        geotile::log::set_level(geotile::log::Level::Debug);
    }

    auto raster_result = geotile::FileRaster::open(args.raster_path);
    if (raster_result.is_error()) {
        return report(raster_result.error());
    }
    const auto& raster = raster_result.value();

    std::string world_path;
    if (args.world_path) {
        world_path = *args.world_path;
    } else {
        auto found = geotile::find_world_file(args.raster_path);
        if (found.is_error()) {
            return report(found.error());
        }
        world_path = found.value().string();
    }

    auto transform_result = geotile::WorldTransform::load(world_path);
    if (transform_result.is_error()) {
        return report(transform_result.error());
    }
    const auto& transform = transform_result.value();

    if (args.info) {
        print_info(raster, world_path, transform);
        return kExitOk;
    }

    const geotile::PixelWindow window = args.window.value_or(geotile::PixelWindow::whole(raster.grid()));
    auto scan_result = geotile::for_each_point(raster, transform, window, args.scan,
        [](const geotile::WorldPoint& p, int16_t z) {
            fmt::print("{} {} {}\n", p.x, p.y, z);
        });
    if (scan_result.is_error()) {
        return report(scan_result.error());
    }

    geotile::log::info("{} no-data samples skipped", scan_result.value());
    return kExitOk;
}
