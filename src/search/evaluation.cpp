/**
 * @file evaluation.cpp
 * @brief one candidate montage in, ROI metrics or a skip reason out
 */
#include "tio/search/evaluation.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <new>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "tio/field/stim_pattern.hpp"

namespace tio::search
{
namespace
{

[[nodiscard]] auto gather(const std::vector<double> &values, const std::vector<std::size_t> &slots)
    -> std::vector<double>
{
    std::vector<double> out(slots.size());
    for (std::size_t i = 0; i < slots.size(); ++i)
    {
        out[i] = values[slots[i]];
    }
    return out;
}

[[nodiscard]] auto slots_for(const std::vector<std::size_t> &subset, const std::vector<std::size_t> &indices)
    -> std::vector<std::size_t>
{
    std::vector<std::size_t> slots(indices.size());
    for (std::size_t i = 0; i < indices.size(); ++i)
    {
        const auto it = std::lower_bound(subset.begin(), subset.end(), indices[i]);
        slots[i]      = static_cast<std::size_t>(it - subset.begin());
    }
    return slots;
}

[[nodiscard]] auto join_context(const std::vector<std::string> &context) -> std::string
{
    return context.empty() ? std::string{} : fmt::format(" ({})", fmt::join(context, "."));
}

} // namespace

auto to_string(SkipReason reason) noexcept -> std::string_view
{
    switch (reason)
    {
    case SkipReason::InfeasibleMontage:
        return "infeasible montage";
    case SkipReason::EvaluationFailed:
        return "evaluation failed";
    }
    return "unknown";
}

auto make_evaluation_targets(roi::RoiSelection roi, roi::RoiSelection reference) -> EvaluationTargets
{
    EvaluationTargets targets{};
    targets.subset.reserve(roi.indices.size() + reference.indices.size());
    std::set_union(roi.indices.begin(), roi.indices.end(), reference.indices.begin(), reference.indices.end(),
                   std::back_inserter(targets.subset));
    targets.roi_slots       = slots_for(targets.subset, roi.indices);
    targets.reference_slots = slots_for(targets.subset, reference.indices);
    targets.roi             = std::move(roi);
    targets.reference       = std::move(reference);
    return targets;
}

MontageEvaluator::MontageEvaluator(std::shared_ptr<const leadfield::LeadfieldMatrix> leadfield,
                                   std::shared_ptr<const compute::FieldBackend> backend, EvaluationTargets targets)
    : leadfield_{std::move(leadfield)}, backend_{std::move(backend)}, targets_{std::move(targets)}
{
}

auto MontageEvaluator::evaluate(const std::array<std::size_t, 4> &electrodes, double ch1_mA, double ch2_mA) const
    -> CandidateOutcome
{
    auto patterns = field::bipolar_patterns(leadfield_->electrode_count(), electrodes, ch1_mA, ch2_mA);
    if (!patterns)
    {
        return std::unexpected(Skipped{SkipReason::InfeasibleMontage, patterns.error().message});
    }

    try
    {
        const std::span<const std::size_t> subset{targets_.subset};
        auto amplitudes = backend_->ti_field(*leadfield_, patterns->channel1, patterns->channel2, subset);
        if (!amplitudes)
        {
            return std::unexpected(Skipped{SkipReason::EvaluationFailed,
                                           amplitudes.error().message + join_context(amplitudes.error().context)});
        }
        if (amplitudes->size() != targets_.subset.size())
        {
            return std::unexpected(Skipped{SkipReason::EvaluationFailed,
                                           fmt::format("backend returned {} amplitudes for {} elements",
                                                       amplitudes->size(), targets_.subset.size())});
        }

        const auto roi_values = gather(*amplitudes, targets_.roi_slots);
        std::expected<roi::RoiMetrics, roi::RoiError> metrics;
        if (targets_.reference.empty())
        {
            metrics = roi::calculate_roi_metrics(roi_values, targets_.roi.volumes);
        }
        else
        {
            const auto reference_values = gather(*amplitudes, targets_.reference_slots);
            metrics = roi::calculate_roi_metrics(roi_values, targets_.roi.volumes,
                                                 std::span<const double>{reference_values},
                                                 std::span<const double>{targets_.reference.volumes});
        }
        if (!metrics)
        {
            return std::unexpected(Skipped{SkipReason::EvaluationFailed, metrics.error().message});
        }
        return *metrics;
    }
    catch (const std::bad_alloc &)
    {
        throw;
    }
    catch (const std::exception &ex)
    {
        return std::unexpected(Skipped{SkipReason::EvaluationFailed, ex.what()});
    }
}

} // namespace tio::search
