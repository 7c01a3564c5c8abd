/**
 * @file log.hpp
 * @brief channel-prefixed fmt logger shared by every TIOpt module uwu
 *
 * each subsystem logs through a prefix like `[tio::search]` so a long
 * exhaustive run reads like a story. lines go to stdout (debug/info) or stderr
 * (warn/error), optionally get mirrored into a log file, and tests can swap in
 * a capture sink to assert on warnings. all writes hold one mutex so worker
 * threads never interleave half lines.
 *
 * example (basic usage):
 * @code
 * using namespace tio::common;
 * set_log_level(LogLevel::Debug);
 * log(LogLevel::Info, "[tio::search]", "{} candidates queued", 1024);
 * @endcode
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace tio::common
{

/**
 * @brief severity threshold, ordered so `<` means "less important"
 */
enum class LogLevel : std::uint8_t
{
    Debug = 0U,
    Info  = 1U,
    Warn  = 2U,
    Error = 3U
};

/**
 * @brief capture callback used by tests (receives the fully formatted line)
 */
using LogSink = std::function<void(LogLevel level, std::string_view line)>;

/**
 * @brief maps "debug" / "info" / "warn" / "error" onto LogLevel
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] text case-sensitive level name from config
 * @return level or std::nullopt for anything else
 */
[[nodiscard]] auto parse_log_level(std::string_view text) noexcept -> std::optional<LogLevel>;

/**
 * @brief short lowercase label for a level ("warn", ...)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto to_string(LogLevel level) noexcept -> std::string_view;

/**
 * @brief sets the process-wide threshold
 *
 * ⚠️ IMPURE FUNCTION (mutates the global logger state)
 */
void set_log_level(LogLevel level) noexcept;

/**
 * @brief reads the process-wide threshold
 */
[[nodiscard]] auto log_level() noexcept -> LogLevel;

/**
 * @brief mirrors every emitted line into a file (appends)
 *
 * ⚠️ IMPURE FUNCTION (file I/O)
 *
 * @param[in] path log file path, parent directory must already exist
 * @return false when the file could not be opened
 */
[[nodiscard]] auto open_log_file(const std::filesystem::path &path) -> bool;

/**
 * @brief closes the mirror file if one is open
 */
void close_log_file();

/**
 * @brief replaces console output with a capture sink (empty function restores stdout/stderr)
 *
 * ⚠️ IMPURE FUNCTION
 */
void set_log_sink(LogSink sink);

/**
 * @brief emits one already formatted message under a channel prefix
 *
 * ⚠️ IMPURE FUNCTION (console / file / sink I/O under a mutex)
 *
 * @param[in] level severity, dropped when below the threshold
 * @param[in] channel prefix such as "[tio::movea]"
 * @param[in] message body text
 */
void write_log(LogLevel level, std::string_view channel, std::string_view message);

/**
 * @brief fmt-powered convenience wrapper around write_log
 *
 * formatting only happens when the level passes the threshold so debug spam in
 * hot loops costs one atomic load.
 */
template <typename... Args>
void log(LogLevel level, std::string_view channel, fmt::format_string<Args...> format, Args &&...args)
{
    if (level < log_level())
    {
        return;
    }
    write_log(level, channel, fmt::format(format, std::forward<Args>(args)...));
}

} // namespace tio::common
