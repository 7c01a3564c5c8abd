/**
 * @file stop_signal.cpp
 * @brief process-wide stop flag fed by SIGINT / SIGTERM
 */
#include "tio/search/stop_signal.hpp"

#include <atomic>

namespace tio::search
{
namespace
{

std::atomic<bool> g_stop_flag{false};

static_assert(std::atomic<bool>::is_always_lock_free, "signal handler needs a lock-free flag");

extern "C" void handle_stop_signal(int /*signal*/)
{
    g_stop_flag.store(true, std::memory_order_relaxed);
}

} // namespace

auto stop_requested() noexcept -> bool
{
    return g_stop_flag.load(std::memory_order_relaxed);
}

void request_stop() noexcept
{
    g_stop_flag.store(true, std::memory_order_relaxed);
}

void reset_stop() noexcept
{
    g_stop_flag.store(false, std::memory_order_relaxed);
}

ScopedStopSignal::ScopedStopSignal()
{
    reset_stop();
    previous_interrupt_ = std::signal(SIGINT, handle_stop_signal);
    previous_terminate_ = std::signal(SIGTERM, handle_stop_signal);
}

ScopedStopSignal::~ScopedStopSignal()
{
    std::signal(SIGINT, previous_interrupt_ == SIG_ERR ? SIG_DFL : previous_interrupt_);
    std::signal(SIGTERM, previous_terminate_ == SIG_ERR ? SIG_DFL : previous_terminate_);
}

} // namespace tio::search
