#pragma once

#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include "../types/result.hpp"

#ifndef GEOTILE_WORLD_TRANSFORM_HEADER
#include "../world_transform.hpp" // for linters
#endif

namespace geotile {

namespace world_file_impl {

[[nodiscard]] inline std::string_view trim(std::string_view text) noexcept {
    constexpr std::string_view whitespace = " \t\r\n\v\f";
    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

/// Parse one line as a complete floating-point literal
[[nodiscard]] inline Result<double> parse_number(std::string_view line, std::size_t line_number) noexcept {
    std::string_view text = trim(line);
    // from_chars rejects an explicit plus sign
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }

    if (text.empty()) {
        return Err(Error::Code::ParseError, "World file line " + std::to_string(line_number) + " is empty");
    }

    double value = 0.0;
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (ec != std::errc{} || ptr != last) {
        return Err(Error::Code::ParseError,
                   "World file line " + std::to_string(line_number) + " is not a number: \"" +
                   std::string(trim(line)) + "\"");
    }
    return Ok(value);
}

} // namespace world_file_impl

inline Result<WorldTransform> WorldTransform::parse(std::istream& input) noexcept {
    std::array<double, num_lines> values{};
    std::string line;
    for (std::size_t i = 0; i < num_lines; ++i) {
        if (!std::getline(input, line)) {
            return Err(Error::Code::ParseError,
                       "World file has " + std::to_string(i) + " lines, expected " + std::to_string(num_lines));
        }
        auto value = world_file_impl::parse_number(line, i + 1);
        if (value.is_error()) {
            return value.error();
        }
        values[i] = value.value();
    }

    return Ok(WorldTransform(values[0], values[1], values[2], values[3], values[4], values[5]));
}

inline Result<WorldTransform> WorldTransform::parse(std::string_view text) noexcept {
    std::istringstream input{std::string(text)};
    return parse(input);
}

inline Result<WorldTransform> WorldTransform::load(const std::filesystem::path& path) noexcept {
    std::ifstream input(path);
    if (!input) {
        return Err(Error::Code::FileNotFound, "Failed to open world file: " + path.string());
    }
    auto result = parse(input);
    if (result.is_error()) {
        return result.error().with_context(path.string());
    }
    return result;
}

inline Result<PixelPoint> WorldTransform::world_to_pixel(double lat, double lon, InverseMode mode) const noexcept {
    if (x_resolution_ == 0.0 || y_resolution_ == 0.0) [[unlikely]] {
        return Err(Error::Code::DivisionByZero,
                   "World file resolution is zero (x " + std::to_string(x_resolution_) + ", y " +
                   std::to_string(y_resolution_) + ")");
    }

    switch (mode) {
        case InverseMode::Legacy:
            return Ok(PixelPoint{(lat - origin_lat_) / x_resolution_, (lon - origin_lon_) / y_resolution_});
        case InverseMode::Strict:
            return Ok(PixelPoint{lat / (x_resolution_ * kMetersPerDegree), lon / (y_resolution_ * kMetersPerDegree)});
    }
    return Err(Error::Code::InvalidFormat, "Unknown inverse mode");
}

inline Result<std::filesystem::path> find_world_file(const std::filesystem::path& raster_path) noexcept {
    namespace fs = std::filesystem;

    const std::string extension = raster_path.extension().string();
    if (extension.size() < 2) {
        return Err(Error::Code::FileNotFound,
                   "Cannot derive a world file name from " + raster_path.string() + " (no extension)");
    }

    // ".tif" -> "tfw", then "tifw"
    const std::string ext = extension.substr(1);
    std::vector<std::string> candidates;
    candidates.push_back(std::string{ext.front(), ext.back(), 'w'});
    candidates.push_back(ext + 'w');

    auto to_case = [](std::string s, bool upper) {
        for (auto& c : s) {
            const auto uc = static_cast<unsigned char>(c);
            c = static_cast<char>(upper ? std::toupper(uc) : std::tolower(uc));
        }
        return s;
    };

    for (const auto& candidate : candidates) {
        for (bool upper : {false, true}) {
            fs::path world_path = raster_path;
            world_path.replace_extension(to_case(candidate, upper));
            std::error_code ec;
            if (fs::is_regular_file(world_path, ec)) {
                return Ok(std::move(world_path));
            }
        }
    }

    return Err(Error::Code::FileNotFound, "No world file found for " + raster_path.string());
}

} // namespace geotile
