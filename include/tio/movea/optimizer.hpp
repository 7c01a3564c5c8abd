/**
 * @file optimizer.hpp
 * @brief MOVEA-style evolutionary montage search (intensity vs focality) uwu
 *
 * an individual is four distinct electrodes plus a current ratio r: channel 1
 * gets I*r, channel 2 gets I*(1-r), with r clamped to the configured bounds.
 * generate_pareto_solutions() runs an NSGA-flavored loop (non-dominated
 * elitism, dominance tournaments, union crossover, swap mutation) and keeps
 * an archived front across generations. optimize() is the single-objective
 * GA that only chases ROI intensity.
 *
 * every random draw comes from one std::mt19937_64 seeded from the config,
 * reseeded at the start of each run, so the same config + data reproduces
 * the same front.
 *
 * example (basic usage):
 * @code
 * tio::movea::MoveaOptimizer optimizer{config, bundle, backend};
 * if (auto target = optimizer.set_target(spec); !target) { return EXIT_FAILURE; }
 * auto front = optimizer.generate_pareto_solutions();
 * @endcode
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <memory>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <vector>

#include "tio/compute/backend.hpp"
#include "tio/config/config.hpp"
#include "tio/leadfield/leadfield.hpp"
#include "tio/movea/pareto.hpp"
#include "tio/roi/roi.hpp"
#include "tio/search/evaluation.hpp"

namespace tio::movea
{

struct MoveaError
{
    std::string              message;
    std::vector<std::string> context;
};

inline constexpr double kInfiniteCost = std::numeric_limits<double>::infinity();

/// 1 / (mean + kIntensityEpsilon) keeps the intensity cost finite for dead fields
inline constexpr double kIntensityEpsilon = 1.0e-10;

struct Individual
{
    std::array<std::size_t, 4> electrodes{};
    double                     ratio{0.5};
};

/**
 * @brief single-objective run outcome
 */
struct OptimizationResult
{
    ParetoSolution      best;
    std::vector<double> history; ///< best intensity cost after each generation
    std::size_t         evaluations{0U};
};

class MoveaOptimizer
{
public:
    /**
     * @brief wires the optimizer to a loaded bundle and a field backend
     *
     * ⚠️ IMPURE FUNCTION (logs dropped candidate electrodes)
     *
     * reads `optimizer`, `search.workers`, `electrodes.pool` (empty = every
     * electrode) and `grey_matter.tags` out of the config.
     */
    MoveaOptimizer(const config::Config &config, const leadfield::LeadfieldBundle &bundle,
                   std::shared_ptr<const compute::FieldBackend> backend);

    /**
     * @brief resolves the ROI, a target with zero elements is a DomainError
     */
    [[nodiscard]] auto set_target(const roi::RoiSpec &spec) -> std::expected<void, roi::DomainError>;

    [[nodiscard]] auto target_size() const noexcept -> std::size_t;

    /**
     * @brief intensity cost of one montage
     *
     * ✨ PURE FUNCTION ✨ (given the target)
     *
     * @param[in] indices leadfield rows E1+, E1-, E2+, E2-
     * @param[in] current_ratio share of total current on channel 1
     * @return +inf when there are not exactly four distinct in-range indices,
     *         otherwise 1 / (TImean_ROI + 1e-10)
     */
    [[nodiscard]] auto evaluate_montage(std::span<const std::int64_t> indices, double current_ratio) const -> double;

    /**
     * @brief [intensity cost, focality cost], [+inf, +inf] for invalid indices
     */
    [[nodiscard]] auto evaluate_montage_dual(std::span<const std::int64_t> indices, double current_ratio) const
        -> Objectives;

    /**
     * @brief dual objectives for a whole population, evaluated on the worker pool
     *
     * ⚠️ IMPURE FUNCTION (threads)
     *
     * an individual whose evaluation throws gets [+inf, +inf]. output order
     * matches input order.
     */
    [[nodiscard]] auto evaluate_population(std::span<const Individual> population) const -> std::vector<Objectives>;

    /**
     * @brief multi-objective run, archived front sorted by intensity field (descending)
     *
     * ⚠️ IMPURE FUNCTION (rng, threads, logging)
     */
    [[nodiscard]] auto generate_pareto_solutions() -> std::expected<std::vector<ParetoSolution>, MoveaError>;

    /**
     * @brief single-objective elitist GA
     *
     * ⚠️ IMPURE FUNCTION (rng, threads, logging)
     */
    [[nodiscard]] auto optimize() -> std::expected<OptimizationResult, MoveaError>;

    /// fills names, currents and derived fields for an evaluated individual
    [[nodiscard]] auto make_solution(const Individual &individual, const Objectives &objectives) const
        -> ParetoSolution;

    [[nodiscard]] auto candidates() const noexcept -> std::span<const std::size_t> { return candidates_; }

private:
    [[nodiscard]] auto check_ready() const -> std::expected<void, MoveaError>;
    [[nodiscard]] auto clamp_ratio(double ratio) const noexcept -> double;
    [[nodiscard]] auto evaluate_individual(const Individual &individual) const -> Objectives;
    [[nodiscard]] auto evaluate_outcome(const search::MontageEvaluator &evaluator, std::span<const std::int64_t> indices,
                                        double current_ratio) const -> std::optional<roi::RoiMetrics>;
    [[nodiscard]] auto evaluate_costs(std::span<const Individual> population) const -> std::vector<double>;
    [[nodiscard]] auto random_individual() -> Individual;
    [[nodiscard]] auto tournament(std::span<const Individual> population, std::span<const Objectives> objectives)
        -> const Individual &;
    [[nodiscard]] auto crossover(const Individual &first, const Individual &second) -> Individual;
    void mutate(Individual &individual);
    [[nodiscard]] auto chance(double probability) -> bool;

    config::OptimizerSettings                         settings_;
    std::size_t                                       workers_{1U};
    std::shared_ptr<const leadfield::LeadfieldMatrix> leadfield_;
    std::shared_ptr<const mesh::ElementGrid>          grid_;
    leadfield::ElectrodeIndex                         electrodes_;
    std::shared_ptr<const compute::FieldBackend>      backend_;
    std::vector<std::size_t>                          candidates_;
    roi::RoiSelection                                 reference_;
    std::unique_ptr<search::MontageEvaluator>         evaluator_;     ///< ROI + focality reference
    std::unique_ptr<search::MontageEvaluator>         roi_evaluator_; ///< ROI only, single objective
    std::mt19937_64                                   rng_;
};

} // namespace tio::movea
