#pragma once

#include <atomic>
#include <cstdio>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <fmt/core.h>

namespace geotile {

/// Leveled diagnostics formatted with {fmt}.
///
/// The library never logs failures it returns as Result errors. It only traces
/// directory decoding (Debug / Trace) and warns about tolerated header oddities.
/// Messages below the current level are not formatted at all.
namespace log {

enum class Level {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

/// Receives every emitted message. Must not throw.
using Sink = std::function<void(Level, std::string_view)>;

[[nodiscard]] constexpr std::string_view to_string(Level level) noexcept {
    switch (level) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info:  return "info";
        case Level::Warn:  return "warning";
        case Level::Error: return "error";
        case Level::Off:   return "off";
    }
    return "?";
}

namespace detail {

struct State {
    std::atomic<Level> level{Level::Warn};
    std::mutex sink_mutex;
    Sink sink;
};

inline State& state() noexcept {
    static State instance;
    return instance;
}

inline void stderr_sink(Level level, std::string_view message) noexcept {
    fmt::print(stderr, "[geotile] {}: {}\n", to_string(level), message);
}

} // namespace detail

inline void set_level(Level level) noexcept {
    detail::state().level.store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline Level level() noexcept {
    return detail::state().level.load(std::memory_order_relaxed);
}

[[nodiscard]] inline bool enabled(Level message_level) noexcept {
    return message_level != Level::Off && message_level >= level();
}

/// Replace the output sink. An empty sink restores the default stderr output.
inline void set_sink(Sink sink) noexcept {
    auto& s = detail::state();
    std::lock_guard<std::mutex> lock(s.sink_mutex);
    s.sink = std::move(sink);
}

inline void reset_sink() noexcept {
    set_sink(Sink{});
}

inline void emit(Level message_level, std::string_view message) noexcept {
    auto& s = detail::state();
    std::lock_guard<std::mutex> lock(s.sink_mutex);
    if (s.sink) {
        s.sink(message_level, message);
    } else {
        detail::stderr_sink(message_level, message);
    }
}

template <typename... Args>
void write(Level message_level, fmt::format_string<Args...> format, Args&&... args) noexcept {
    if (!enabled(message_level)) {
        return;
    }
    emit(message_level, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void trace(fmt::format_string<Args...> format, Args&&... args) noexcept {
    write(Level::Trace, format, std::forward<Args>(args)...);
}

template <typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) noexcept {
    write(Level::Debug, format, std::forward<Args>(args)...);
}

template <typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) noexcept {
    write(Level::Info, format, std::forward<Args>(args)...);
}

template <typename... Args>
void warn(fmt::format_string<Args...> format, Args&&... args) noexcept {
    write(Level::Warn, format, std::forward<Args>(args)...);
}

template <typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) noexcept {
    write(Level::Error, format, std::forward<Args>(args)...);
}

} // namespace log

} // namespace geotile
