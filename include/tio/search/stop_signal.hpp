/**
 * @file stop_signal.hpp
 * @brief cooperative Ctrl-C handling for long searches
 *
 * ScopedStopSignal installs SIGINT/SIGTERM handlers that only flip an atomic
 * flag. engines poll stop_requested() between chunks, finish the chunk in
 * flight, and return a partial report. the previous handlers come back when
 * the guard goes out of scope.
 */
#pragma once

#include <csignal>

namespace tio::search
{

/**
 * @brief true once SIGINT/SIGTERM arrived (or request_stop() was called)
 */
[[nodiscard]] auto stop_requested() noexcept -> bool;

/// sets the flag by hand (tests, embedding applications)
void request_stop() noexcept;

/// clears the flag before a new run
void reset_stop() noexcept;

class ScopedStopSignal
{
public:
    ScopedStopSignal();
    ~ScopedStopSignal();

    ScopedStopSignal(const ScopedStopSignal &)                     = delete;
    auto operator=(const ScopedStopSignal &) -> ScopedStopSignal & = delete;

private:
    using Handler = void (*)(int);

    Handler previous_interrupt_{SIG_DFL};
    Handler previous_terminate_{SIG_DFL};
};

} // namespace tio::search
