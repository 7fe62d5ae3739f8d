#include <gtest/gtest.h>
#include <atomic>
#include <bit>
#include <cstring>
#include <filesystem>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "../geotile/include/geotile/logging.hpp"
#include "../geotile/include/geotile/raster_file.hpp"
#include "../geotile/include/geotile/readers/reader_buffer.hpp"
#include "../geotile/include/geotile/readers/reader_stream.hpp"

#ifdef __unix__
#include "../geotile/include/geotile/readers/reader_unix_pread.hpp"
#endif

#include "raster_builder.hpp"

namespace fs = std::filesystem;
using namespace geotile;
using geotile_test::RasterBuilder;

// ============================================================================
// Test Fixtures
// ============================================================================

/// Opens the same generated raster through every reader type
template <typename ReaderT>
class RasterFileTest : public ::testing::Test {
protected:
    std::vector<std::byte> bytes;
    fs::path path;

    void TearDown() override {
        if (!path.empty()) {
            geotile_test::remove_file(path);
        }
    }

    Result<RasterFile<ReaderT>> open_raster(const RasterBuilder& builder, const RasterOptions& options = {}) {
        bytes = builder.build();
        if constexpr (FileRawReader<ReaderT>) {
            path = geotile_test::create_test_file("geotile_test_raster.tif", bytes);
            return RasterFile<ReaderT>::open(path.string(), options);
        } else if constexpr (std::is_same_v<ReaderT, BufferViewReader>) {
            return RasterFile<ReaderT>::from_reader(BufferViewReader(std::span<const std::byte>(bytes)), options);
        } else {
            return RasterFile<ReaderT>::from_reader(BufferReader(std::span<const std::byte>(bytes)), options);
        }
    }
};

using ReaderTypes = ::testing::Types<
    BufferViewReader,
    BufferReader,
    StreamFileReader
#ifdef __unix__
    , PreadFileReader
#endif
>;

TYPED_TEST_SUITE(RasterFileTest, ReaderTypes);

// ============================================================================
// Directory decoding
// ============================================================================

TYPED_TEST(RasterFileTest, OpensAndExposesGeometry) {
    auto raster_result = this->open_raster(RasterBuilder(100, 70, 32, 16));
    ASSERT_TRUE(raster_result.is_ok()) << raster_result.error().message;
    const auto& raster = raster_result.value();

    EXPECT_EQ(raster.identifier(), 0x4949);
    EXPECT_EQ(raster.version(), 42);
    EXPECT_GT(raster.directory_offset(), 8);
    EXPECT_EQ(raster.next_directory_offset(), 0);
    EXPECT_EQ(raster.bits_per_sample(), 16);
    EXPECT_EQ(raster.image_width(), 100u);
    EXPECT_EQ(raster.image_height(), 70u);
    EXPECT_EQ(raster.tile_width(), 32u);
    EXPECT_EQ(raster.tile_length(), 16u);
    EXPECT_EQ(raster.tiles_across(), 4u);
    EXPECT_EQ(raster.tiles_down(), 5u);
    EXPECT_EQ(raster.tile_offsets().size(), 20u);
}

TYPED_TEST(RasterFileTest, SamplesMatchWrittenPixels) {
    RasterBuilder builder(37, 29, 16, 8);
    auto raster_result = this->open_raster(builder);
    ASSERT_TRUE(raster_result.is_ok()) << raster_result.error().message;
    const auto& raster = raster_result.value();

    for (uint32_t y = 0; y < 29; ++y) {
        for (uint32_t x = 0; x < 37; ++x) {
            auto sample = raster.sample_pixel(x, y);
            ASSERT_TRUE(sample.is_ok()) << x << ", " << y << ": " << sample.error().message;
            EXPECT_EQ(sample.value(), builder.pixel(x, y)) << x << ", " << y;
        }
    }
}

TYPED_TEST(RasterFileTest, NegativeSamplesAreSigned) {
    RasterBuilder builder(4, 4, 4, 4);
    builder.with_pixels([](uint32_t x, uint32_t y) { return static_cast<int16_t>(-1000 - static_cast<int>(x + 4 * y)); });
    auto raster_result = this->open_raster(builder);
    ASSERT_TRUE(raster_result.is_ok());

    auto sample = raster_result.value().sample_pixel(3, 2);
    ASSERT_TRUE(sample.is_ok());
    EXPECT_EQ(sample.value(), -1011);
}

TYPED_TEST(RasterFileTest, SamplePixelIsIdempotent) {
    auto raster_result = this->open_raster(RasterBuilder(20, 20, 8, 8));
    ASSERT_TRUE(raster_result.is_ok());
    const auto& raster = raster_result.value();

    auto first = raster.sample_pixel(13, 17);
    ASSERT_TRUE(first.is_ok());
    for (int i = 0; i < 10; ++i) {
        auto again = raster.sample_pixel(13, 17);
        ASSERT_TRUE(again.is_ok());
        EXPECT_EQ(again.value(), first.value());
        // Interleave another read to move any underlying cursor
        (void)raster.sample_pixel(0, 0);
    }
}

TYPED_TEST(RasterFileTest, ReadTileAgreesWithSamplePixel) {
    RasterBuilder builder(21, 13, 8, 8);
    auto raster_result = this->open_raster(builder);
    ASSERT_TRUE(raster_result.is_ok());
    const auto& raster = raster_result.value();

    for (uint64_t tile = 0; tile < raster.grid().num_tiles(); ++tile) {
        auto samples = raster.read_tile(tile);
        ASSERT_TRUE(samples.is_ok()) << samples.error().message;
        ASSERT_EQ(samples.value().size(), 64u);

        const uint32_t tx = static_cast<uint32_t>(tile % raster.tiles_across());
        const uint32_t ty = static_cast<uint32_t>(tile / raster.tiles_across());
        for (uint32_t yt = 0; yt < 8; ++yt) {
            for (uint32_t xt = 0; xt < 8; ++xt) {
                const int64_t x = tx * 8 + xt;
                const int64_t y = ty * 8 + yt;
                if (x >= 21 || y >= 13) {
                    continue;  // padding
                }
                auto sample = raster.sample_pixel(x, y);
                ASSERT_TRUE(sample.is_ok());
                EXPECT_EQ(samples.value()[yt * 8 + xt], sample.value());
            }
        }
    }

    auto beyond = raster.read_tile(raster.grid().num_tiles());
    ASSERT_TRUE(beyond.is_error());
    EXPECT_EQ(beyond.error().code, Error::Code::OutOfBounds);
}

TYPED_TEST(RasterFileTest, OutOfBoundsPixelsRejected) {
    auto raster_result = this->open_raster(RasterBuilder(10, 10, 4, 4));
    ASSERT_TRUE(raster_result.is_ok());
    const auto& raster = raster_result.value();

    const std::vector<std::pair<int64_t, int64_t>> outside = {{-1, 0}, {0, -1}, {10, 0}, {0, 10}, {1000, 1000}};
    for (const auto& [x, y] : outside) {
        auto sample = raster.sample_pixel(x, y);
        ASSERT_TRUE(sample.is_error());
        EXPECT_EQ(sample.error().code, Error::Code::OutOfBounds);
        EXPECT_EQ(sample.error().category(), Error::Category::OutOfRange);
    }
}

// ============================================================================
// Concrete layouts
// ============================================================================

TEST(RasterFileLayoutTest, ExplicitTileOffsetsSelectByteOffset) {
    RasterBuilder builder(4, 4, 2, 2);
    builder.with_tile_offsets({100, 200, 300, 400})
           .with_pixels([](uint32_t x, uint32_t y) { return static_cast<int16_t>(x * 10 + y); });
    auto bytes = builder.build();

    auto raster_result = RasterFile<BufferViewReader>::from_reader(
        BufferViewReader(std::span<const std::byte>(bytes)));
    ASSERT_TRUE(raster_result.is_ok()) << raster_result.error().message;
    const auto& raster = raster_result.value();

    ASSERT_EQ(raster.tiles_across(), 2u);
    ASSERT_EQ(raster.tiles_down(), 2u);
    EXPECT_EQ(std::vector<uint32_t>(raster.tile_offsets().begin(), raster.tile_offsets().end()),
              (std::vector<uint32_t>{100, 200, 300, 400}));

    auto location = raster.locate(3, 3);
    ASSERT_TRUE(location.is_ok());
    EXPECT_EQ(location.value().position.tile_index, 3u);
    EXPECT_EQ(location.value().position.x_in_tile, 1u);
    EXPECT_EQ(location.value().position.y_in_tile, 1u);
    EXPECT_EQ(location.value().tile_offset, 400u);
    EXPECT_EQ(location.value().byte_offset, 406u);

    int16_t raw;
    std::memcpy(&raw, bytes.data() + 406, sizeof(raw));
    auto sample = raster.sample_pixel(3, 3);
    ASSERT_TRUE(sample.is_ok());
    EXPECT_EQ(sample.value(), 33);
    if constexpr (std::endian::native == std::endian::little) {
        EXPECT_EQ(sample.value(), raw);
    }
}

TEST(RasterFileLayoutTest, SingleTileOffsetIsInline) {
    RasterBuilder builder(3, 3, 4, 4);
    auto bytes = builder.build();

    auto raster_result = RasterFile<BufferReader>::from_reader(BufferReader(std::span<const std::byte>(bytes)));
    ASSERT_TRUE(raster_result.is_ok()) << raster_result.error().message;
    ASSERT_EQ(raster_result.value().tile_offsets().size(), 1u);
    EXPECT_EQ(raster_result.value().tile_offsets()[0], 8u);

    auto sample = raster_result.value().sample_pixel(2, 2);
    ASSERT_TRUE(sample.is_ok());
    EXPECT_EQ(sample.value(), builder.pixel(2, 2));
}

TEST(RasterFileLayoutTest, UnknownTagsAreIgnored) {
    RasterBuilder builder(8, 8, 4, 4);
    builder.with_extra_tag({339, geotile_test::kShort, 1, 2})
           .with_extra_tag({33550, 12, 3, 0})   // ModelPixelScale, never dereferenced
           .with_extra_tag({42113, 2, 6, 0});   // GDAL_NODATA
    auto bytes = builder.build();

    auto raster_result = RasterFile<BufferReader>::from_reader(BufferReader(std::span<const std::byte>(bytes)));
    ASSERT_TRUE(raster_result.is_ok()) << raster_result.error().message;
    EXPECT_EQ(raster_result.value().image_width(), 8u);
}

TEST(RasterFileLayoutTest, MissingBitsPerSampleAssumes16) {
    auto bytes = RasterBuilder(8, 8, 4, 4).with_bits_per_sample(std::nullopt).build();

    auto raster_result = RasterFile<BufferReader>::from_reader(BufferReader(std::span<const std::byte>(bytes)));
    ASSERT_TRUE(raster_result.is_ok());
    EXPECT_EQ(raster_result.value().bits_per_sample(), 16);
}

TEST(RasterFileLayoutTest, PermissiveTileCountDefersToOutOfRange) {
    // 2x2 grid but only two offsets
    auto bytes = RasterBuilder(4, 4, 2, 2).with_offset_count(2).build();

    RasterOptions options;
    options.validate_tile_count = false;
    auto raster_result = RasterFile<BufferReader>::from_reader(
        BufferReader(std::span<const std::byte>(bytes)), options);
    ASSERT_TRUE(raster_result.is_ok()) << raster_result.error().message;
    const auto& raster = raster_result.value();

    EXPECT_TRUE(raster.sample_pixel(3, 1).is_ok());

    auto sample = raster.sample_pixel(0, 2);
    ASSERT_TRUE(sample.is_error());
    EXPECT_EQ(sample.error().code, Error::Code::OutOfBounds);

    auto tile = raster.read_tile(3);
    ASSERT_TRUE(tile.is_error());
    EXPECT_EQ(tile.error().code, Error::Code::OutOfBounds);
}

TEST(RasterFileLayoutTest, LenientHeaderIsAccepted) {
    auto bytes = RasterBuilder(4, 4, 4, 4).with_identifier('M', 'M').with_version(7).build();

    auto raster_result = RasterFile<BufferReader>::from_reader(BufferReader(std::span<const std::byte>(bytes)));
    ASSERT_TRUE(raster_result.is_ok());
    EXPECT_EQ(raster_result.value().identifier(), 0x4D4D);
    EXPECT_EQ(raster_result.value().version(), 7);
}

TEST(RasterFileLayoutTest, MoveKeepsReaderAlive) {
    RasterBuilder builder(16, 16, 8, 8);
    auto bytes = builder.build();
    auto path = geotile_test::create_test_file("geotile_test_move.tif", bytes);

    auto raster_result = RasterFile<StreamFileReader>::open(path.string());
    ASSERT_TRUE(raster_result.is_ok());

    RasterFile<StreamFileReader> raster = std::move(raster_result).value();
    auto moved = std::move(raster);
    auto sample = moved.sample_pixel(15, 15);
    ASSERT_TRUE(sample.is_ok());
    EXPECT_EQ(sample.value(), builder.pixel(15, 15));

    geotile_test::remove_file(path);
}

#ifdef __unix__
TEST(RasterFileLayoutTest, ConcurrentSamplingWithPread) {
    RasterBuilder builder(64, 64, 16, 16);
    auto bytes = builder.build();
    auto path = geotile_test::create_test_file("geotile_test_concurrent.tif", bytes);

    auto raster_result = RasterFile<PreadFileReader>::open(path.string());
    ASSERT_TRUE(raster_result.is_ok());
    const auto& raster = raster_result.value();

    std::atomic<int> errors{0};
    std::vector<std::thread> threads;
    for (uint32_t t = 0; t < 4; ++t) {
        threads.emplace_back([&, t]() {
            for (uint32_t y = t; y < 64; y += 4) {
                for (uint32_t x = 0; x < 64; ++x) {
                    auto sample = raster.sample_pixel(x, y);
                    if (!sample.is_ok() || sample.value() != builder.pixel(x, y)) {
                        errors++;
                    }
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(errors.load(), 0);

    geotile_test::remove_file(path);
}
#endif

// ============================================================================
// Rejected files
// ============================================================================

namespace {

Result<RasterFile<BufferReader>> open_bytes(const std::vector<std::byte>& bytes, const RasterOptions& options = {}) {
    return RasterFile<BufferReader>::from_reader(BufferReader(std::span<const std::byte>(bytes)), options);
}

void expect_error(const Result<RasterFile<BufferReader>>& result, Error::Code code) {
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, code) << result.error().message;
}

} // namespace

class RasterFileMissingTagTest : public ::testing::TestWithParam<uint16_t> {};

TEST_P(RasterFileMissingTagTest, RequiredTagAbsent) {
    auto bytes = RasterBuilder(8, 8, 4, 4).without_tag(GetParam()).build();
    auto result = open_bytes(bytes);
    expect_error(result, Error::Code::MissingTag);
    EXPECT_EQ(result.error().category(), Error::Category::Format);
}

INSTANTIATE_TEST_SUITE_P(RequiredTags, RasterFileMissingTagTest,
                         ::testing::Values(uint16_t{256}, uint16_t{257}, uint16_t{322}, uint16_t{323}, uint16_t{324}));

TEST(RasterFileErrorTest, ZeroTileDimensions) {
    expect_error(open_bytes(RasterBuilder(8, 8, 0, 4).with_tile_offsets({8}).build()), Error::Code::InvalidFormat);
    expect_error(open_bytes(RasterBuilder(8, 8, 4, 0).with_tile_offsets({8}).build()), Error::Code::InvalidFormat);
}

TEST(RasterFileErrorTest, EightBitSamplesUnsupported) {
    auto bytes = RasterBuilder(8, 8, 4, 4).with_bits_per_sample(8).build();
    expect_error(open_bytes(bytes), Error::Code::UnsupportedFeature);

    RasterOptions options;
    options.require_16_bit_samples = false;
    auto relaxed = open_bytes(bytes, options);
    ASSERT_TRUE(relaxed.is_ok());
    EXPECT_EQ(relaxed.value().bits_per_sample(), 8);
}

TEST(RasterFileErrorTest, TileCountMismatch) {
    auto short_table = RasterBuilder(4, 4, 2, 2).with_offset_count(2).build();
    auto result = open_bytes(short_table);
    expect_error(result, Error::Code::InvalidFormat);
    EXPECT_NE(result.error().message.find("expected 4"), std::string::npos);
}

TEST(RasterFileErrorTest, StrictHeaderRejectsBigEndianMarker) {
    auto bytes = RasterBuilder(4, 4, 4, 4).with_identifier('M', 'M').build();
    RasterOptions options;
    options.strict_header = true;
    auto result = open_bytes(bytes, options);
    expect_error(result, Error::Code::InvalidHeader);
    EXPECT_EQ(result.error().category(), Error::Category::Format);
}

TEST(RasterFileErrorTest, LenientHeaderLogsWarning) {
    std::vector<std::string> messages;
    log::set_sink([&messages](log::Level level, std::string_view message) {
        if (level == log::Level::Warn) {
            messages.emplace_back(message);
        }
    });

    auto result = open_bytes(RasterBuilder(4, 4, 4, 4).with_version(43).build());
    log::reset_sink();

    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_NE(messages[0].find("version 43"), std::string::npos);
}

TEST(RasterFileErrorTest, NegativeDirectoryOffset) {
    auto bytes = RasterBuilder(4, 4, 4, 4).with_directory_offset(-16).build();
    expect_error(open_bytes(bytes), Error::Code::InvalidFormat);
}

TEST(RasterFileErrorTest, DirectoryBeyondEndOfFile) {
    auto bytes = RasterBuilder(4, 4, 4, 4).with_directory_offset(1 << 20).build();
    auto result = open_bytes(bytes);
    expect_error(result, Error::Code::UnexpectedEndOfFile);
    EXPECT_EQ(result.error().category(), Error::Category::IO);
}

TEST(RasterFileErrorTest, TruncatedDirectory) {
    auto bytes = RasterBuilder(8, 8, 4, 4).build();
    bytes.resize(bytes.size() - 20);
    expect_error(open_bytes(bytes), Error::Code::UnexpectedEndOfFile);
}

TEST(RasterFileErrorTest, TileOffsetPastEndOfFile) {
    auto bytes = RasterBuilder(4, 4, 2, 2).with_tile_offsets({100, 200, 300, 400}).build();

    // Offset table follows the last tile (408) at the next even offset
    constexpr std::size_t last_entry = 408 + 3 * 4;
    uint32_t stored;
    std::memcpy(&stored, bytes.data() + last_entry, sizeof(stored));
    if constexpr (std::endian::native == std::endian::little) {
        ASSERT_EQ(stored, 400u);
    }
    const uint32_t far = 0x7FFFFF00u;
    const std::byte patched[4] = {std::byte(far & 0xFF), std::byte((far >> 8) & 0xFF),
                                  std::byte((far >> 16) & 0xFF), std::byte((far >> 24) & 0xFF)};
    std::memcpy(bytes.data() + last_entry, patched, sizeof(patched));

    auto raster_result = open_bytes(bytes);
    ASSERT_TRUE(raster_result.is_ok()) << raster_result.error().message;
    EXPECT_TRUE(raster_result.value().sample_pixel(1, 1).is_ok());

    auto sample = raster_result.value().sample_pixel(3, 3);
    ASSERT_TRUE(sample.is_error());
    EXPECT_EQ(sample.error().code, Error::Code::UnexpectedEndOfFile);
}

namespace {

/// 256-byte file: header, a five-tag directory at 8, zero padding
std::vector<std::byte> minimal_raster(uint32_t width, uint32_t height, uint32_t tile_width, uint32_t tile_length,
                                      uint32_t offset_count, uint32_t offsets_value) {
    geotile_test::ByteWriter w;
    w.put_chars('I', 'I');
    w.put_u16(42);
    w.put_i32(8);
    w.put_u16(5);
    const geotile_test::TagRecord tags[] = {
        {256, geotile_test::kLong, 1, width},
        {257, geotile_test::kLong, 1, height},
        {322, geotile_test::kLong, 1, tile_width},
        {323, geotile_test::kLong, 1, tile_length},
        {324, geotile_test::kLong, offset_count, offsets_value},
    };
    for (const auto& tag : tags) {
        w.put_u16(tag.id);
        w.put_u16(tag.type);
        w.put_u32(tag.count);
        w.put_u32(tag.value);
    }
    w.put_i32(0);
    w.pad_to(256);
    return w.take();
}

} // namespace

TEST(RasterFileErrorTest, OffsetCountLargerThanFile) {
    auto bytes = minimal_raster(8, 8, 4, 4, 0xFFFFFFF0u, 100);
    auto result = RasterFile<BufferViewReader>::from_reader(BufferViewReader(std::span<const std::byte>(bytes)));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::UnexpectedEndOfFile) << result.error().message;
}

TEST(RasterFileErrorTest, TileLargerThanFile) {
    // One 65536x65536 tile at offset 100: the first sample exists, the tile does not
    auto bytes = minimal_raster(1, 1, 65536, 65536, 1, 100);
    auto raster_result = open_bytes(bytes);
    ASSERT_TRUE(raster_result.is_ok()) << raster_result.error().message;
    EXPECT_TRUE(raster_result.value().sample_pixel(0, 0).is_ok());

    auto tile = raster_result.value().read_tile(0);
    ASSERT_TRUE(tile.is_error());
    EXPECT_EQ(tile.error().code, Error::Code::UnexpectedEndOfFile);
}

TEST(RasterFileErrorTest, MissingFile) {
    auto result = RasterFile<StreamFileReader>::open("/nonexistent/geotile/raster.tif");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::FileNotFound);
}
