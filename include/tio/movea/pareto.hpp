/**
 * @file pareto.hpp
 * @brief dominance + the archived Pareto front for intensity vs focality uwu
 *
 * both objectives are costs (smaller is better):
 * - intensity cost = 1 / (mean TI in the ROI + 1e-10)
 * - focality cost  = mean TI over the reference set (grey matter or whole grid)
 *
 * A dominates B iff A <= B in both and A < B in at least one. the archive
 * keeps only finite, mutually non-dominated solutions across generations.
 */
#pragma once

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace tio::movea
{

using Objectives = std::array<double, 2>;

/**
 * @brief one montage on (or near) the front, ready for reporting
 */
struct ParetoSolution
{
    std::array<std::size_t, 4> electrodes{}; ///< E1+, E1-, E2+, E2- leadfield rows
    std::array<std::string, 4> names;
    double                     current_ratio{0.5}; ///< share of total current on channel 1
    double                     ch1_mA{0.0};
    double                     ch2_mA{0.0};
    double                     intensity_cost{0.0};
    double                     intensity_field{0.0}; ///< 1 / intensity_cost
    double                     focality_cost{0.0};
    double                     focality_ratio{0.0}; ///< intensity_field / focality_cost, 0 when the cost is 0

    [[nodiscard]] auto objectives() const noexcept -> Objectives { return {intensity_cost, focality_cost}; }
};

/**
 * @brief ✨ PURE FUNCTION ✨ A <= B everywhere and A < B somewhere
 */
[[nodiscard]] auto dominates(const Objectives &a, const Objectives &b) noexcept -> bool;

/**
 * @brief indices of the non-dominated entries, ascending
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto find_non_dominated(std::span<const Objectives> objectives) -> std::vector<std::size_t>;

/**
 * @brief ✨ PURE FUNCTION ✨ true when both objectives are finite
 */
[[nodiscard]] auto is_finite(const Objectives &objectives) noexcept -> bool;

class ParetoFront
{
public:
    /**
     * @brief adds a solution unless it is infinite, dominated or already present
     *
     * members the newcomer dominates are evicted.
     *
     * @return true when the solution joined the front
     */
    auto insert(const ParetoSolution &solution) -> bool;

    [[nodiscard]] auto members() const noexcept -> std::span<const ParetoSolution> { return members_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return members_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return members_.empty(); }

    /// members ordered by intensity field, strongest first
    [[nodiscard]] auto sorted_by_intensity() const -> std::vector<ParetoSolution>;

private:
    std::vector<ParetoSolution> members_;
};

} // namespace tio::movea
