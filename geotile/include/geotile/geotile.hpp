#pragma once

/// Main header for the geotile library
///
/// Random-access sampling of tiled 16-bit rasters and their world files.
///
/// Key features:
/// - No exceptions: uses Result<T> for error handling
/// - Positioned reads through the RawReader concept (pread, stream, memory)
/// - One directory decode per file, then one read per sampled pixel
/// - World file (.tfw) parsing with forward and inverse pixel/world mapping
///
/// Example usage:
/// ```cpp
/// #include <geotile/geotile.hpp>
///
/// using namespace geotile;
///
/// auto raster = FileRaster::open("dem.tif");
/// if (!raster) {
///     // Handle raster.error()
/// }
///
/// auto world = find_world_file("dem.tif").and_then([](const auto& path) {
///     return WorldTransform::load(path);
/// });
///
/// auto cloud = scan_window(raster.value(), world.value(), PixelWindow{0, 0, 256, 256});
/// ```

#include "types/result.hpp"
#include "types/tile_info.hpp"
#include "types.hpp"
#include "logging.hpp"
#include "reader_base.hpp"
#include "readers/reader_buffer.hpp"
#include "readers/reader_stream.hpp"
#if defined(__unix__) || defined(__APPLE__)
#include "readers/reader_unix_pread.hpp"
#endif
#include "parsing.hpp"
#include "ifd.hpp"
#include "tile_grid.hpp"
#include "raster_file.hpp"
#include "world_transform.hpp"
#include "point_scan.hpp"

namespace geotile {

/// Default file reader for the platform
#if defined(__unix__) || defined(__APPLE__)
using FileReader = PreadFileReader;
#else
using FileReader = StreamFileReader;
#endif

using FileRaster = RasterFile<FileReader>;

} // namespace geotile
