#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace geotile {

/// Failure reported by every fallible geotile operation
struct Error {
    enum class Code {
        Success,
        FileNotFound,
        ReadError,
        UnexpectedEndOfFile,
        InvalidHeader,
        InvalidFormat,
        MissingTag,
        UnsupportedFeature,
        ParseError,
        OutOfBounds,
        DivisionByZero
    };

    /// Coarse classification used by callers that only care about the failure family
    enum class Category {
        None,
        IO,          ///< File cannot be opened or a read came back short
        Format,      ///< Structurally invalid raster or world file
        OutOfRange,  ///< Pixel or tile coordinate outside the raster
        Division     ///< Degenerate (zero) resolution in an inverse transform
    };

    Code code;
    std::string message;

    constexpr Error(Code c, std::string msg = "") noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] constexpr bool is_success() const noexcept { return code == Code::Success; }
    [[nodiscard]] constexpr bool is_error() const noexcept { return code != Code::Success; }

    [[nodiscard]] constexpr Category category() const noexcept {
        switch (code) {
            case Code::Success:
                return Category::None;
            case Code::FileNotFound:
            case Code::ReadError:
            case Code::UnexpectedEndOfFile:
                return Category::IO;
            case Code::InvalidHeader:
            case Code::InvalidFormat:
            case Code::MissingTag:
            case Code::UnsupportedFeature:
            case Code::ParseError:
                return Category::Format;
            case Code::OutOfBounds:
                return Category::OutOfRange;
            case Code::DivisionByZero:
                return Category::Division;
        }
        return Category::None;
    }

    /// Same code, message prefixed with "<context>: "
    [[nodiscard]] Error with_context(std::string_view context) const {
        return Error{code, std::string(context) + ": " + message};
    }
};

[[nodiscard]] constexpr std::string_view to_string(Error::Category category) noexcept {
    switch (category) {
        case Error::Category::None:       return "none";
        case Error::Category::IO:         return "io error";
        case Error::Category::Format:     return "format error";
        case Error::Category::OutOfRange: return "out of range";
        case Error::Category::Division:   return "division error";
    }
    return "unknown";
}

/// Value or Error. Accessing the wrong alternative is undefined; check is_ok() first.
template <typename T>
class [[nodiscard]] Result {
private:
    std::variant<T, Error> data_;

public:
    using value_type = T;

    constexpr Result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : data_(std::in_place_index<0>, std::move(value)) {}

    constexpr Result(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>)
        : data_(std::in_place_index<0>, value) {}

    constexpr Result(Error&& error) noexcept
        : data_(std::in_place_index<1>, std::move(error)) {}

    constexpr Result(const Error& error) noexcept
        : data_(std::in_place_index<1>, error) {}

    [[nodiscard]] constexpr bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] constexpr bool is_error() const noexcept { return data_.index() == 1; }
    [[nodiscard]] constexpr explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] constexpr T& value() & noexcept { return *std::get_if<0>(&data_); }
    [[nodiscard]] constexpr const T& value() const& noexcept { return *std::get_if<0>(&data_); }
    [[nodiscard]] constexpr T&& value() && noexcept { return std::move(*std::get_if<0>(&data_)); }

    [[nodiscard]] constexpr const Error& error() const noexcept { return *std::get_if<1>(&data_); }

    template <typename U>
    [[nodiscard]] constexpr T value_or(U&& fallback) const& {
        return is_ok() ? value() : static_cast<T>(std::forward<U>(fallback));
    }

    /// Chain an operation returning another Result; errors pass through unchanged
    template <typename F>
    [[nodiscard]] constexpr auto and_then(F&& func) const& -> std::invoke_result_t<F, const T&> {
        using Next = std::invoke_result_t<F, const T&>;
        if (is_error()) {
            return Next{error()};
        }
        return std::forward<F>(func)(value());
    }

    /// Map the value; errors pass through unchanged
    template <typename F>
    [[nodiscard]] constexpr auto transform(F&& func) const& -> Result<std::invoke_result_t<F, const T&>> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_error()) {
            return Result<U>{error()};
        }
        return Result<U>{std::forward<F>(func)(value())};
    }
};

template <>
class [[nodiscard]] Result<void> {
private:
    std::variant<std::monostate, Error> data_;

public:
    using value_type = void;

    constexpr Result() noexcept = default;

    constexpr Result(Error&& error) noexcept
        : data_(std::in_place_index<1>, std::move(error)) {}

    constexpr Result(const Error& error) noexcept
        : data_(std::in_place_index<1>, error) {}

    [[nodiscard]] constexpr bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] constexpr bool is_error() const noexcept { return data_.index() == 1; }
    [[nodiscard]] constexpr explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] constexpr const Error& error() const noexcept { return *std::get_if<1>(&data_); }
};

template <typename T>
[[nodiscard]] constexpr Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>{std::forward<T>(value)};
}

[[nodiscard]] constexpr Result<void> Ok() {
    return Result<void>{};
}

[[nodiscard]] inline Error Err(Error::Code code, std::string message = "") {
    return Error{code, std::move(message)};
}

} // namespace geotile
