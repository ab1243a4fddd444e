/// @file log.cpp
/// Logger state: threshold and sink.

#include <kibitz/log.hpp>

#include <atomic>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <mutex>
#include <utility>

namespace kibitz::log {

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != b[i])
            return false;
    }
    return true;
}

Level initial_level() noexcept {
    Level lvl = Level::Info;
    if (const char* env = std::getenv("KIBITZ_LOG_LEVEL")) {
        if (!parse_level(env, lvl))
            lvl = Level::Info;
    }
    return lvl;
}

std::atomic<int>& level_storage() noexcept {
    static std::atomic<int> lvl{static_cast<int>(initial_level())};
    return lvl;
}

std::mutex& sink_mutex() {
    static std::mutex m;
    return m;
}

Sink& sink_storage() {
    static Sink sink;
    return sink;
}

}  // namespace

Level level() noexcept {
    return static_cast<Level>(level_storage().load(std::memory_order_relaxed));
}

void set_level(Level lvl) noexcept {
    level_storage().store(static_cast<int>(lvl), std::memory_order_relaxed);
}

bool enabled(Level lvl) noexcept {
    return lvl != Level::Off && static_cast<int>(lvl) >= static_cast<int>(level());
}

Sink set_sink(Sink sink) {
    std::lock_guard lock(sink_mutex());
    Sink previous = std::move(sink_storage());
    sink_storage() = std::move(sink);
    return previous;
}

std::string_view level_name(Level lvl) noexcept {
    switch (lvl) {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
        case Level::Off:
            return "OFF";
    }
    return "?";
}

bool parse_level(std::string_view text, Level& out) noexcept {
    if (iequals(text, "debug")) {
        out = Level::Debug;
    } else if (iequals(text, "info")) {
        out = Level::Info;
    } else if (iequals(text, "warn") || iequals(text, "warning")) {
        out = Level::Warn;
    } else if (iequals(text, "error")) {
        out = Level::Error;
    } else if (iequals(text, "off") || iequals(text, "none")) {
        out = Level::Off;
    } else {
        return false;
    }
    return true;
}

namespace {

void to_stderr(Level lvl, std::string_view component, std::string_view message) noexcept {
    std::lock_guard lock(sink_mutex());
    std::cerr << '[' << component << "] ";
    if (lvl != Level::Info)
        std::cerr << level_name(lvl) << ": ";
    std::cerr << message << '\n';
}

}  // namespace

void write(Level lvl, std::string_view component, std::string_view message) noexcept {
    Sink sink;
    try {
        std::lock_guard lock(sink_mutex());
        sink = sink_storage();
    } catch (const std::exception&) {
        to_stderr(Level::Error, "Log", "could not reach the installed sink");
    }
    if (!sink) {
        to_stderr(lvl, component, message);
        return;
    }
    try {
        sink(lvl, component, message);
    } catch (const std::exception& e) {
        to_stderr(Level::Error, "Log", "sink failed; record follows");
        to_stderr(Level::Error, "Log", e.what());
        to_stderr(lvl, component, message);
    } catch (...) {
        to_stderr(Level::Error, "Log", "sink failed with a non-standard exception; record follows");
        to_stderr(lvl, component, message);
    }
}

}  // namespace kibitz::log
