#pragma once

/**
 * @file log.hpp
 * @brief Severity-tagged diagnostics on stderr with a replaceable sink
 *
 * Output format: "[level] [component] message"
 */

#include <format>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace axiom::log {

enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

[[nodiscard]] std::string_view level_name(Level level) noexcept;

using Sink = std::function<void(Level level, std::string_view component, std::string_view message)>;

/**
 * Replace the process-wide sink. An empty sink restores the stderr sink.
 * @return The previously installed sink
 */
Sink set_sink(Sink sink);

/// Messages below this level are dropped (default: kInfo)
void set_min_level(Level level) noexcept;

[[nodiscard]] Level min_level() noexcept;

void write(Level level, std::string_view component, std::string_view message);

template <typename... Args>
void debug(std::string_view component, std::format_string<Args...> fmt, Args&&... args)
{
    if (min_level() <= Level::kDebug) {
        write(Level::kDebug, component, std::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void info(std::string_view component, std::format_string<Args...> fmt, Args&&... args)
{
    if (min_level() <= Level::kInfo) {
        write(Level::kInfo, component, std::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void warn(std::string_view component, std::format_string<Args...> fmt, Args&&... args)
{
    if (min_level() <= Level::kWarn) {
        write(Level::kWarn, component, std::format(fmt, std::forward<Args>(args)...));
    }
}

template <typename... Args>
void error(std::string_view component, std::format_string<Args...> fmt, Args&&... args)
{
    write(Level::kError, component, std::format(fmt, std::forward<Args>(args)...));
}

}  // namespace axiom::log
