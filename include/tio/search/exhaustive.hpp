/**
 * @file exhaustive.hpp
 * @brief ex-search: evaluate every montage x current ratio, in order, in parallel uwu
 *
 * the engine walks MontageSpace ids in chunks. each chunk fans out over the
 * WorkerPool as (id, candidate) tasks and comes back reassembled by id, so
 * the report order is the enumeration order no matter how threads race.
 * between chunks it logs progress and polls the stop predicate; a stop lets
 * the chunk in flight finish and returns everything completed so far.
 *
 * counting rule the report always satisfies:
 *   processed (evaluated ok) + failed + unprocessed == total
 *
 * example (basic usage):
 * @code
 * auto space = tio::search::build_montage_space(config, bundle.electrodes);
 * tio::search::ExhaustiveSearchEngine engine{config.search, *space, bundle.electrodes, evaluator};
 * const tio::search::ScopedStopSignal guard{};
 * const auto report = engine.run();
 * @endcode
 */
#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

#include "tio/config/config.hpp"
#include "tio/leadfield/leadfield.hpp"
#include "tio/roi/roi.hpp"
#include "tio/search/evaluation.hpp"
#include "tio/search/montage_space.hpp"

namespace tio::search
{

/**
 * @brief one successfully evaluated candidate
 */
struct MontageResult
{
    std::size_t     id{0U};
    std::string     montage;
    double          ch1_mA{0.0};
    double          ch2_mA{0.0};
    roi::RoiMetrics metrics;
};

struct SearchReport
{
    std::vector<MontageResult> results; ///< enumeration order
    std::size_t                processed{0U};
    std::size_t                failed{0U};
    std::size_t                unprocessed{0U};
    std::size_t                total{0U};
    bool                       interrupted{false};
    bool                       limit_exceeded{false};
    double                     elapsed_seconds{0.0};
};

class ExhaustiveSearchEngine
{
public:
    using StopPredicate = std::function<bool()>;

    ExhaustiveSearchEngine(config::SearchSettings settings, MontageSpace space, leadfield::ElectrodeIndex electrodes,
                           MontageEvaluator evaluator);

    /**
     * @brief evaluates the space (or its first max_candidates ids)
     *
     * ⚠️ IMPURE FUNCTION (threads, progress logging)
     *
     * @param[in] should_stop polled once per chunk, defaults to the process stop flag
     */
    [[nodiscard]] auto run(const StopPredicate &should_stop = stop_requested_predicate()) const -> SearchReport;

    [[nodiscard]] auto space() const noexcept -> const MontageSpace & { return space_; }

private:
    [[nodiscard]] static auto stop_requested_predicate() -> StopPredicate;

    config::SearchSettings    settings_;
    MontageSpace              space_;
    leadfield::ElectrodeIndex electrodes_;
    MontageEvaluator          evaluator_;
};

} // namespace tio::search
