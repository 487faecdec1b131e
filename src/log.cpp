// Ratevault - Logging Implementation

#include <ratevault/log.hpp>

#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace ratevault::log {

namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_sink_mutex;
std::ostream* g_sink = nullptr;

std::string now_to_string() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return buf;
}

}  // namespace

Level level_from_string(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    if (lower == "off") return Level::Off;
    throw std::invalid_argument("Unknown log level: " + std::string(name));
}

void set_level(Level level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

Level level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

void set_sink(std::ostream* sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = sink;
}

void write(Level lvl, std::string_view message) {
    if (lvl == Level::Off || lvl < level()) return;

    std::string line = now_to_string() + " [" + to_string(lvl) + "] " + std::string(message) + "\n";

    std::lock_guard<std::mutex> lock(g_sink_mutex);
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out << line;
    out.flush();
}

}  // namespace ratevault::log
