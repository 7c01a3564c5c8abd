/**
 * @file log.cpp
 * @brief global logger state: threshold, optional file mirror, optional capture sink
 */
#include "tio/common/log.hpp"

#include <atomic>
#include <cstdio>
#include <fstream>
#include <mutex>
#include <string>

#include <fmt/format.h>

namespace tio::common
{
namespace
{

struct LoggerState
{
    std::mutex    mutex;
    std::ofstream file;
    LogSink       sink;
};

auto state() -> LoggerState &
{
    static LoggerState instance;
    return instance;
}

std::atomic<LogLevel> g_threshold{LogLevel::Info};

} // namespace

auto parse_log_level(std::string_view text) noexcept -> std::optional<LogLevel>
{
    if (text == "debug")
    {
        return LogLevel::Debug;
    }
    if (text == "info")
    {
        return LogLevel::Info;
    }
    if (text == "warn" || text == "warning")
    {
        return LogLevel::Warn;
    }
    if (text == "error")
    {
        return LogLevel::Error;
    }
    return std::nullopt;
}

auto to_string(LogLevel level) noexcept -> std::string_view
{
    switch (level)
    {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    }
    return "info";
}

void set_log_level(LogLevel level) noexcept
{
    g_threshold.store(level, std::memory_order_relaxed);
}

auto log_level() noexcept -> LogLevel
{
    return g_threshold.load(std::memory_order_relaxed);
}

auto open_log_file(const std::filesystem::path &path) -> bool
{
    auto                  &logger = state();
    const std::scoped_lock lock{logger.mutex};
    if (logger.file.is_open())
    {
        logger.file.close();
    }
    logger.file.open(path, std::ios::out | std::ios::app);
    return logger.file.is_open();
}

void close_log_file()
{
    auto                  &logger = state();
    const std::scoped_lock lock{logger.mutex};
    if (logger.file.is_open())
    {
        logger.file.close();
    }
}

void set_log_sink(LogSink sink)
{
    auto                  &logger = state();
    const std::scoped_lock lock{logger.mutex};
    logger.sink = std::move(sink);
}

void write_log(LogLevel level, std::string_view channel, std::string_view message)
{
    if (level < log_level())
    {
        return;
    }

    // info lines keep the bare "[channel] message" shape, everything else gets tagged
    const auto line = level == LogLevel::Info ? fmt::format("{} {}", channel, message)
                                              : fmt::format("{} {}: {}", channel, to_string(level), message);

    auto                  &logger = state();
    const std::scoped_lock lock{logger.mutex};
    if (logger.sink)
    {
        logger.sink(level, line);
    }
    else
    {
        std::FILE *stream = level >= LogLevel::Warn ? stderr : stdout;
        fmt::print(stream, "{}\n", line);
        std::fflush(stream);
    }
    if (logger.file.is_open())
    {
        logger.file << line << '\n';
        logger.file.flush();
    }
}

} // namespace tio::common
