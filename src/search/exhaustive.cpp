/**
 * @file exhaustive.cpp
 * @brief chunked exhaustive walk over the montage space with stop + cap handling
 */
#include "tio/search/exhaustive.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include "tio/common/log.hpp"
#include "tio/search/stop_signal.hpp"
#include "tio/search/worker_pool.hpp"

namespace tio::search
{
namespace
{

constexpr std::string_view kLogChannel = "[tio::search]";

using Clock = std::chrono::steady_clock;

[[nodiscard]] auto seconds_since(Clock::time_point start) -> double
{
    return std::chrono::duration<double>(Clock::now() - start).count();
}

void log_progress(std::size_t done, std::size_t target, double elapsed)
{
    const double percent = target == 0U ? 100.0 : 100.0 * static_cast<double>(done) / static_cast<double>(target);
    const double rate    = elapsed > 0.0 ? static_cast<double>(done) / elapsed : 0.0;
    const double eta     = rate > 0.0 ? static_cast<double>(target - done) / rate : 0.0;
    common::log(common::LogLevel::Info, kLogChannel, "progress {}/{} ({:.1f}%) {:.1f} montages/s, eta {:.0f}s", done,
                target, percent, rate, eta);
}

} // namespace

ExhaustiveSearchEngine::ExhaustiveSearchEngine(config::SearchSettings settings, MontageSpace space,
                                               leadfield::ElectrodeIndex electrodes, MontageEvaluator evaluator)
    : settings_{std::move(settings)}, space_{std::move(space)}, electrodes_{std::move(electrodes)},
      evaluator_{std::move(evaluator)}
{
}

auto ExhaustiveSearchEngine::stop_requested_predicate() -> StopPredicate
{
    return []() { return stop_requested(); };
}

auto ExhaustiveSearchEngine::run(const StopPredicate &should_stop) const -> SearchReport
{
    const auto start = Clock::now();

    SearchReport report{};
    report.total          = space_.size();
    report.limit_exceeded = space_.schedule().limit_exceeded;

    const auto target     = std::min(report.total, settings_.max_candidates.value_or(report.total));
    const auto chunk_size = std::max<std::size_t>(1U, settings_.chunk_size);
    const auto interval   = std::max<std::size_t>(1U, settings_.progress_interval);

    common::log(common::LogLevel::Info, kLogChannel, "{} candidates ({} montages x {} ratios), evaluating {} on {} workers",
                report.total, space_.montage_count(), space_.schedule().ratios.size(), target, settings_.workers);

    WorkerPool  pool{settings_.workers};
    std::size_t next_progress = interval;

    for (std::size_t first = 0; first < target; first += chunk_size)
    {
        if (should_stop && should_stop())
        {
            report.interrupted = true;
            common::log(common::LogLevel::Warn, kLogChannel, "stop requested, keeping {} completed candidates",
                        report.processed + report.failed);
            break;
        }

        const auto count    = std::min(chunk_size, target - first);
        auto       outcomes = pool.map_ids<CandidateOutcome>(first, count, [this](std::size_t id) {
            const auto montage = space_.at(id);
            return evaluator_.evaluate(montage.electrodes, montage.currents.ch1_mA, montage.currents.ch2_mA);
        });

        for (std::size_t offset = 0; offset < outcomes.size(); ++offset)
        {
            const auto id      = first + offset;
            const auto montage = space_.at(id);
            auto      &outcome = outcomes[offset];
            if (!outcome)
            {
                ++report.failed;
                // repeated electrodes are expected in bucketed spaces, backend failures are not
                const auto level = outcome.error().reason == SkipReason::EvaluationFailed ? common::LogLevel::Warn
                                                                                           : common::LogLevel::Debug;
                common::log(level, kLogChannel, "skipped {}: {}: {}", montage_name(electrodes_, montage),
                            to_string(outcome.error().reason), outcome.error().detail);
                continue;
            }
            report.results.push_back(MontageResult{id, montage_name(electrodes_, montage), montage.currents.ch1_mA,
                                                   montage.currents.ch2_mA, std::move(*outcome)});
            ++report.processed;
        }

        const auto done = report.processed + report.failed;
        if (done >= next_progress || done == target)
        {
            log_progress(done, target, seconds_since(start));
            while (next_progress <= done)
            {
                next_progress += interval;
            }
        }
    }

    report.unprocessed     = report.total - report.processed - report.failed;
    report.elapsed_seconds = seconds_since(start);
    common::log(common::LogLevel::Info, kLogChannel, "done: {} evaluated, {} failed, {} unprocessed in {:.2f}s",
                report.processed, report.failed, report.unprocessed, report.elapsed_seconds);
    return report;
}

} // namespace tio::search
