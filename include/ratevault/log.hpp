// Ratevault - Logging
// Leveled, process-wide log sink (stderr by default)

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace ratevault::log {

enum class Level : uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

inline constexpr const char* to_string(Level l) noexcept {
    switch (l) {
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
        case Level::Off: return "OFF";
    }
    return "UNKNOWN";
}

// "debug", "info", "warn", "error", "off" (case-insensitive).
// Throws std::invalid_argument otherwise.
Level level_from_string(std::string_view name);

void set_level(Level level) noexcept;
[[nodiscard]] Level level() noexcept;

// Redirects output; nullptr restores stderr. The stream must outlive its use.
void set_sink(std::ostream* sink);

void write(Level level, std::string_view message);

inline void debug(std::string_view m) { write(Level::Debug, m); }
inline void info(std::string_view m) { write(Level::Info, m); }
inline void warn(std::string_view m) { write(Level::Warn, m); }
inline void error(std::string_view m) { write(Level::Error, m); }

}  // namespace ratevault::log
