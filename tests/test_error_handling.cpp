#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../geotile/include/geotile/logging.hpp"
#include "../geotile/include/geotile/types/result.hpp"

using namespace geotile;

// ============================================================================
// Error codes and categories
// ============================================================================

class ErrorCategoryTest : public ::testing::TestWithParam<std::pair<Error::Code, Error::Category>> {};

TEST_P(ErrorCategoryTest, CodeMapsToCategory) {
    const auto [code, category] = GetParam();
    const Error error{code, "message"};
    EXPECT_EQ(error.category(), category);
    EXPECT_EQ(error.is_error(), code != Error::Code::Success);
}

INSTANTIATE_TEST_SUITE_P(AllCodes, ErrorCategoryTest, ::testing::Values(
    std::make_pair(Error::Code::Success, Error::Category::None),
    std::make_pair(Error::Code::FileNotFound, Error::Category::IO),
    std::make_pair(Error::Code::ReadError, Error::Category::IO),
    std::make_pair(Error::Code::UnexpectedEndOfFile, Error::Category::IO),
    std::make_pair(Error::Code::InvalidHeader, Error::Category::Format),
    std::make_pair(Error::Code::InvalidFormat, Error::Category::Format),
    std::make_pair(Error::Code::MissingTag, Error::Category::Format),
    std::make_pair(Error::Code::UnsupportedFeature, Error::Category::Format),
    std::make_pair(Error::Code::ParseError, Error::Category::Format),
    std::make_pair(Error::Code::OutOfBounds, Error::Category::OutOfRange),
    std::make_pair(Error::Code::DivisionByZero, Error::Category::Division)));

TEST(ErrorHandling, CategoryNames) {
    EXPECT_EQ(to_string(Error::Category::IO), "io error");
    EXPECT_EQ(to_string(Error::Category::Format), "format error");
    EXPECT_EQ(to_string(Error::Category::OutOfRange), "out of range");
    EXPECT_EQ(to_string(Error::Category::Division), "division error");
}

// ============================================================================
// Result
// ============================================================================

namespace {

Result<int> halve(int value) {
    if (value % 2 != 0) {
        return Err(Error::Code::InvalidFormat, "odd value " + std::to_string(value));
    }
    return Ok(value / 2);
}

} // namespace

TEST(ErrorHandling, ResultHoldsValueOrError) {
    auto ok = halve(8);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_EQ(ok.value(), 4);

    auto bad = halve(3);
    ASSERT_TRUE(bad.is_error());
    EXPECT_FALSE(static_cast<bool>(bad));
    EXPECT_EQ(bad.error().code, Error::Code::InvalidFormat);
    EXPECT_EQ(bad.error().message, "odd value 3");
    EXPECT_EQ(bad.value_or(-1), -1);
}

TEST(ErrorHandling, ResultChaining) {
    auto quarter = halve(12).and_then(halve);
    ASSERT_TRUE(quarter.is_ok());
    EXPECT_EQ(quarter.value(), 3);

    auto failed = halve(6).and_then(halve);
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().message, "odd value 3");

    auto text = halve(10).transform([](int v) { return std::to_string(v); });
    ASSERT_TRUE(text.is_ok());
    EXPECT_EQ(text.value(), "5");
}

TEST(ErrorHandling, VoidResult) {
    Result<void> ok = Ok();
    EXPECT_TRUE(ok.is_ok());

    Result<void> bad = Err(Error::Code::ReadError, "boom");
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().category(), Error::Category::IO);
}

TEST(ErrorHandling, ContextKeepsCode) {
    Error inner = Err(Error::Code::UnexpectedEndOfFile, "short read");
    Error outer = inner.with_context("tile 3").with_context("dem.tif");

    EXPECT_EQ(outer.code, Error::Code::UnexpectedEndOfFile);
    EXPECT_EQ(outer.category(), Error::Category::IO);
    EXPECT_EQ(outer.message, "dem.tif: tile 3: short read");
    EXPECT_EQ(inner.message, "short read");
}

// ============================================================================
// Logging
// ============================================================================

class LoggingTest : public ::testing::Test {
protected:
    std::vector<std::pair<log::Level, std::string>> messages;

    void SetUp() override {
        log::set_sink([this](log::Level level, std::string_view message) {
            messages.emplace_back(level, std::string(message));
        });
    }

    void TearDown() override {
        log::reset_sink();
        log::set_level(log::Level::Warn);
    }
};

TEST_F(LoggingTest, DefaultLevelIsWarn) {
    EXPECT_EQ(log::level(), log::Level::Warn);
    log::debug("hidden {}", 1);
    log::info("hidden {}", 2);
    log::warn("shown {}", 3);
    log::error("shown {}", 4);

    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].first, log::Level::Warn);
    EXPECT_EQ(messages[0].second, "shown 3");
    EXPECT_EQ(messages[1].first, log::Level::Error);
}

TEST_F(LoggingTest, LevelThreshold) {
    log::set_level(log::Level::Trace);
    EXPECT_TRUE(log::enabled(log::Level::Trace));
    log::trace("tag {} ({})", 256, "ImageWidth");
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].second, "tag 256 (ImageWidth)");

    log::set_level(log::Level::Off);
    EXPECT_FALSE(log::enabled(log::Level::Error));
    log::error("dropped");
    EXPECT_EQ(messages.size(), 1u);
}

TEST_F(LoggingTest, LevelNames) {
    EXPECT_EQ(log::to_string(log::Level::Warn), "warning");
    EXPECT_EQ(log::to_string(log::Level::Debug), "debug");
}
