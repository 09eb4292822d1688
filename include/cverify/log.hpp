#pragma once

/**
 * @file log.hpp
 * @brief Leveled diagnostics on stderr
 *
 * Lines are written as "[level] [component] message" with std::println so
 * that concurrent workers never interleave within a line.
 */

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace cverify::log {

enum class Level : std::uint8_t {
    kError = 0,
    kWarn = 1,
    kInfo = 2,
    kDebug = 3
};

void set_level(Level level) noexcept;
[[nodiscard]] Level level() noexcept;

/// Parse "error" | "warn" | "info" | "debug"
[[nodiscard]] std::optional<Level> parse_level(std::string_view name);

void write(Level level, std::string_view component, std::string_view message);

template <typename... Args>
void error(std::string_view component, std::format_string<Args...> fmt, Args&&... args)
{
    if (level() >= Level::kError) {
        write(Level::kError, component, std::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void warn(std::string_view component, std::format_string<Args...> fmt, Args&&... args)
{
    if (level() >= Level::kWarn) {
        write(Level::kWarn, component, std::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void info(std::string_view component, std::format_string<Args...> fmt, Args&&... args)
{
    if (level() >= Level::kInfo) {
        write(Level::kInfo, component, std::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void debug(std::string_view component, std::format_string<Args...> fmt, Args&&... args)
{
    if (level() >= Level::kDebug) {
        write(Level::kDebug, component, std::format(fmt, std::forward<Args>(args)...));
    }
}

}  // namespace cverify::log
