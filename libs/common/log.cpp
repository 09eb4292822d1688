/**
 * @file log.cpp
 * @brief Leveled diagnostics on stderr
 */

#include "cverify/log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>
#include <print>

namespace cverify::log {

namespace {

std::atomic<Level> g_level{Level::kInfo};
std::mutex g_write_mutex;

[[nodiscard]] constexpr std::string_view level_name(Level level) noexcept
{
    switch (level) {
        case Level::kError:
            return "error";
        case Level::kWarn:
            return "warn";
        case Level::kInfo:
            return "info";
        case Level::kDebug:
            return "debug";
    }
    return "info";
}

}  // namespace

void set_level(Level level) noexcept
{
    g_level.store(level);
}

Level level() noexcept
{
    return g_level.load();
}

std::optional<Level> parse_level(std::string_view name)
{
    if (name == "error") {
        return Level::kError;
    }
    if (name == "warn") {
        return Level::kWarn;
    }
    if (name == "info") {
        return Level::kInfo;
    }
    if (name == "debug") {
        return Level::kDebug;
    }
    return std::nullopt;
}

void write(Level level, std::string_view component, std::string_view message)
{
    std::lock_guard lock(g_write_mutex);
    std::println(stderr, "[{}] [{}] {}", level_name(level), component, message);
}

}  // namespace cverify::log
