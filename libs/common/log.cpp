/**
 * @file log.cpp
 * @brief Process-wide diagnostics sink
 */

#include "axiom/log.hpp"

#include <atomic>
#include <cstdio>
#include <mutex>
#include <print>

namespace axiom::log {

namespace {

std::mutex& sink_mutex()
{
    static std::mutex mutex;
    return mutex;
}

Sink& current_sink()
{
    static Sink sink;
    return sink;
}

std::atomic<Level>& threshold()
{
    static std::atomic<Level> level{Level::kInfo};
    return level;
}

}  // namespace

std::string_view level_name(Level level) noexcept
{
    switch (level) {
        case Level::kDebug:
            return "debug";
        case Level::kInfo:
            return "info";
        case Level::kWarn:
            return "warn";
        case Level::kError:
            return "error";
    }
    return "unknown";
}

Sink set_sink(Sink sink)
{
    std::lock_guard lock(sink_mutex());
    Sink previous = std::move(current_sink());
    current_sink() = std::move(sink);
    return previous;
}

void set_min_level(Level level) noexcept
{
    threshold().store(level, std::memory_order_relaxed);
}

Level min_level() noexcept
{
    return threshold().load(std::memory_order_relaxed);
}

void write(Level level, std::string_view component, std::string_view message)
{
    if (level < min_level()) {
        return;
    }
    std::lock_guard lock(sink_mutex());
    if (current_sink()) {
        current_sink()(level, component, message);
        return;
    }
    std::println(stderr, "[{}] [{}] {}", level_name(level), component, message);
}

}  // namespace axiom::log
