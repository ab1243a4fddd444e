#pragma once

/// @file log.hpp
/// Minimal leveled logger. Lines look like "[Model] WARN: ..." and go to
/// stderr unless a sink is installed.

#include <exception>
#include <functional>
#include <sstream>
#include <string>
#include <string_view>

namespace kibitz::log {

enum class Level : int { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

/// Receives every emitted record.
using Sink = std::function<void(Level, std::string_view component, std::string_view message)>;

/// Global threshold. Defaults to Info, or KIBITZ_LOG_LEVEL when set
/// ("debug", "info", "warn", "error", "off").
[[nodiscard]] Level level() noexcept;
void set_level(Level lvl) noexcept;

/// Replace the output sink; an empty function restores stderr.
/// Returns the previous sink.
Sink set_sink(Sink sink);

[[nodiscard]] bool enabled(Level lvl) noexcept;

[[nodiscard]] std::string_view level_name(Level lvl) noexcept;

/// Parse a level name (case-insensitive). Returns false for unknown names.
[[nodiscard]] bool parse_level(std::string_view text, Level& out) noexcept;

/// Emit one record. The sink runs outside the logger's lock, so it may log
/// itself. Never throws: a failing sink is reported on stderr instead.
void write(Level lvl, std::string_view component, std::string_view message) noexcept;

namespace detail {

template <typename... Args>
void emit(Level lvl, std::string_view component, const Args&... args) noexcept {
    if (!enabled(lvl))
        return;
    try {
        std::ostringstream os;
        (os << ... << args);
        write(lvl, component, os.str());
    } catch (const std::exception&) {
        write(Level::Error, component, "log message could not be formatted");
    }
}

}  // namespace detail

template <typename... Args>
void debug(std::string_view component, const Args&... args) noexcept {
    detail::emit(Level::Debug, component, args...);
}

template <typename... Args>
void info(std::string_view component, const Args&... args) noexcept {
    detail::emit(Level::Info, component, args...);
}

template <typename... Args>
void warn(std::string_view component, const Args&... args) noexcept {
    detail::emit(Level::Warn, component, args...);
}

template <typename... Args>
void error(std::string_view component, const Args&... args) noexcept {
    detail::emit(Level::Error, component, args...);
}

}  // namespace kibitz::log
