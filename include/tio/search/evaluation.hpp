/**
 * @file evaluation.hpp
 * @brief one montage in, ROI/GM metrics (or a recorded skip) out uwu
 *
 * MontageEvaluator owns the element subset a search cares about: the ROI and
 * the grey-matter reference set, merged into one ascending index list so each
 * candidate costs exactly one backend ti_field call. the envelope is then
 * split back into ROI and GM slices and folded into RoiMetrics.
 *
 * a candidate never throws or aborts a batch. infeasible montages (repeated
 * electrode, out-of-range row) and anything that goes wrong while evaluating
 * come back as Skipped inside CandidateOutcome.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <vector>

#include "tio/compute/backend.hpp"
#include "tio/leadfield/leadfield.hpp"
#include "tio/roi/roi.hpp"

namespace tio::search
{

enum class SkipReason : std::uint8_t
{
    InfeasibleMontage,
    EvaluationFailed
};

[[nodiscard]] auto to_string(SkipReason reason) noexcept -> std::string_view;

struct Skipped
{
    SkipReason  reason{SkipReason::EvaluationFailed};
    std::string detail;
};

using CandidateOutcome = std::expected<roi::RoiMetrics, Skipped>;

/**
 * @brief ROI + reference selections flattened into one evaluation subset
 */
struct EvaluationTargets
{
    roi::RoiSelection        roi;
    roi::RoiSelection        reference;     ///< grey matter (or whole grid for MOVEA without GM)
    std::vector<std::size_t> subset;        ///< ascending union of both index sets
    std::vector<std::size_t> roi_slots;     ///< position of each roi element inside subset
    std::vector<std::size_t> reference_slots;
};

/**
 * @brief merges two selections into one subset + slot maps
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto make_evaluation_targets(roi::RoiSelection roi, roi::RoiSelection reference) -> EvaluationTargets;

class MontageEvaluator
{
public:
    MontageEvaluator(std::shared_ptr<const leadfield::LeadfieldMatrix> leadfield,
                     std::shared_ptr<const compute::FieldBackend> backend, EvaluationTargets targets);

    /**
     * @brief TI metrics for a bipolar montage (E1+, E1-, E2+, E2- rows)
     *
     * thread-safe: only reads shared immutable state and the backend.
     *
     * @return metrics, or Skipped{InfeasibleMontage} for repeated / out-of-range
     *         rows, or Skipped{EvaluationFailed} for backend or metric errors
     */
    [[nodiscard]] auto evaluate(const std::array<std::size_t, 4> &electrodes, double ch1_mA, double ch2_mA) const
        -> CandidateOutcome;

    [[nodiscard]] auto targets() const noexcept -> const EvaluationTargets & { return targets_; }
    [[nodiscard]] auto leadfield() const noexcept -> const leadfield::LeadfieldMatrix & { return *leadfield_; }

private:
    std::shared_ptr<const leadfield::LeadfieldMatrix> leadfield_;
    std::shared_ptr<const compute::FieldBackend>      backend_;
    EvaluationTargets                                 targets_;
};

} // namespace tio::search
