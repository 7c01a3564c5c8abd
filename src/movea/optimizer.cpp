/**
 * @file optimizer.cpp
 * @brief evolutionary montage search: single-objective GA and the NSGA-II front uwu
 */
#include "tio/movea/optimizer.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <numeric>
#include <utility>

#include <fmt/format.h>

#include "tio/common/log.hpp"
#include "tio/search/worker_pool.hpp"

namespace tio::movea
{
namespace
{

constexpr std::string_view kLogChannel = "[tio::movea]";

[[nodiscard]] auto make_error(std::string message, std::initializer_list<std::string> ctx = {}) -> MoveaError
{
    MoveaError err{};
    err.message = std::move(message);
    err.context.assign(ctx.begin(), ctx.end());
    return err;
}

[[nodiscard]] auto whole_grid(const mesh::ElementGrid &grid) -> roi::RoiSelection
{
    roi::RoiSelection selection{};
    selection.indices.resize(grid.size());
    std::iota(selection.indices.begin(), selection.indices.end(), std::size_t{0});
    selection.volumes = grid.volumes;
    return selection;
}

[[nodiscard]] auto to_signed(const std::array<std::size_t, 4> &electrodes) -> std::array<std::int64_t, 4>
{
    return {static_cast<std::int64_t>(electrodes[0]), static_cast<std::int64_t>(electrodes[1]),
            static_cast<std::int64_t>(electrodes[2]), static_cast<std::int64_t>(electrodes[3])};
}

/// exactly four distinct rows inside [0, electrode_count)
[[nodiscard]] auto validate_indices(std::span<const std::int64_t> indices, std::size_t electrode_count)
    -> std::optional<std::array<std::size_t, 4>>
{
    if (indices.size() != 4U)
    {
        return std::nullopt;
    }
    std::array<std::size_t, 4> rows{};
    for (std::size_t i = 0; i < 4U; ++i)
    {
        if (indices[i] < 0 || static_cast<std::uint64_t>(indices[i]) >= electrode_count)
        {
            return std::nullopt;
        }
        rows[i] = static_cast<std::size_t>(indices[i]);
        for (std::size_t j = 0; j < i; ++j)
        {
            if (rows[j] == rows[i])
            {
                return std::nullopt;
            }
        }
    }
    return rows;
}

} // namespace

MoveaOptimizer::MoveaOptimizer(const config::Config &config, const leadfield::LeadfieldBundle &bundle,
                               std::shared_ptr<const compute::FieldBackend> backend)
    : settings_{config.optimizer}, workers_{std::max<std::size_t>(1U, config.search.workers)},
      leadfield_{bundle.leadfield}, grid_{bundle.grid}, electrodes_{bundle.electrodes}, backend_{std::move(backend)},
      rng_{config.optimizer.seed}
{
    if (config.electrodes.pool.empty())
    {
        candidates_.resize(electrodes_.size());
        std::iota(candidates_.begin(), candidates_.end(), std::size_t{0});
    }
    else
    {
        for (const auto &name : config.electrodes.pool)
        {
            const auto row = electrodes_.find(name);
            if (!row)
            {
                common::log(common::LogLevel::Warn, kLogChannel, "electrode '{}' (pool) not in leadfield, ignored",
                            name);
                continue;
            }
            if (std::find(candidates_.begin(), candidates_.end(), *row) == candidates_.end())
            {
                candidates_.push_back(*row);
            }
        }
    }

    reference_ = roi::find_grey_matter_indices(*grid_, config.grey_matter_tags);
    if (reference_.empty())
    {
        common::log(common::LogLevel::Info, kLogChannel, "no grey matter elements, focality uses the whole grid");
        reference_ = whole_grid(*grid_);
    }

    evaluator_ = std::make_unique<search::MontageEvaluator>(
        leadfield_, backend_, search::make_evaluation_targets(roi::RoiSelection{}, reference_));
    roi_evaluator_ = std::make_unique<search::MontageEvaluator>(
        leadfield_, backend_, search::make_evaluation_targets(roi::RoiSelection{}, roi::RoiSelection{}));
}

auto MoveaOptimizer::set_target(const roi::RoiSpec &spec) -> std::expected<void, roi::DomainError>
{
    auto selection = roi::resolve_roi(*grid_, spec);
    if (!selection)
    {
        return std::unexpected(roi::DomainError{selection.error().message, selection.error().context});
    }
    if (selection->empty())
    {
        return std::unexpected(roi::DomainError{"target region contains no elements", {"set_target"}});
    }

    common::log(common::LogLevel::Info, kLogChannel, "target: {} elements, focality reference: {} elements",
                selection->size(), reference_.size());
    evaluator_ = std::make_unique<search::MontageEvaluator>(leadfield_, backend_,
                                                            search::make_evaluation_targets(*selection, reference_));
    roi_evaluator_ = std::make_unique<search::MontageEvaluator>(
        leadfield_, backend_, search::make_evaluation_targets(std::move(*selection), roi::RoiSelection{}));
    return {};
}

auto MoveaOptimizer::target_size() const noexcept -> std::size_t
{
    return roi_evaluator_->targets().roi.size();
}

auto MoveaOptimizer::clamp_ratio(double ratio) const noexcept -> double
{
    return std::clamp(ratio, settings_.ratio_bounds[0], settings_.ratio_bounds[1]);
}

auto MoveaOptimizer::evaluate_outcome(const search::MontageEvaluator &evaluator, std::span<const std::int64_t> indices,
                                      double current_ratio) const -> std::optional<roi::RoiMetrics>
{
    const auto rows = validate_indices(indices, leadfield_->electrode_count());
    if (!rows)
    {
        return std::nullopt;
    }
    const double ratio   = clamp_ratio(current_ratio);
    const double total   = settings_.total_current_mA;
    auto         outcome = evaluator.evaluate(*rows, total * ratio, total * (1.0 - ratio));
    if (!outcome)
    {
        common::log(common::LogLevel::Debug, kLogChannel, "montage skipped: {}: {}",
                    search::to_string(outcome.error().reason), outcome.error().detail);
        return std::nullopt;
    }
    return *outcome;
}

auto MoveaOptimizer::evaluate_montage(std::span<const std::int64_t> indices, double current_ratio) const -> double
{
    const auto metrics = evaluate_outcome(*roi_evaluator_, indices, current_ratio);
    if (!metrics)
    {
        return kInfiniteCost;
    }
    return 1.0 / (metrics->timean_roi + kIntensityEpsilon);
}

auto MoveaOptimizer::evaluate_montage_dual(std::span<const std::int64_t> indices, double current_ratio) const
    -> Objectives
{
    const auto metrics = evaluate_outcome(*evaluator_, indices, current_ratio);
    if (!metrics)
    {
        return {kInfiniteCost, kInfiniteCost};
    }
    return {1.0 / (metrics->timean_roi + kIntensityEpsilon), metrics->timean_gm.value_or(0.0)};
}

auto MoveaOptimizer::evaluate_individual(const Individual &individual) const -> Objectives
{
    const auto indices = to_signed(individual.electrodes);
    return evaluate_montage_dual(indices, individual.ratio);
}

auto MoveaOptimizer::evaluate_population(std::span<const Individual> population) const -> std::vector<Objectives>
{
    search::WorkerPool pool{std::min(workers_, std::max<std::size_t>(1U, population.size()))};
    return pool.map_ids<Objectives>(0U, population.size(), [this, population](std::size_t id) -> Objectives {
        try
        {
            return evaluate_individual(population[id]);
        }
        catch (const std::exception &ex)
        {
            common::log(common::LogLevel::Debug, kLogChannel, "individual {} failed: {}", id, ex.what());
            return {kInfiniteCost, kInfiniteCost};
        }
    });
}

auto MoveaOptimizer::evaluate_costs(std::span<const Individual> population) const -> std::vector<double>
{
    search::WorkerPool pool{std::min(workers_, std::max<std::size_t>(1U, population.size()))};
    return pool.map_ids<double>(0U, population.size(), [this, population](std::size_t id) -> double {
        try
        {
            const auto indices = to_signed(population[id].electrodes);
            return evaluate_montage(indices, population[id].ratio);
        }
        catch (const std::exception &ex)
        {
            common::log(common::LogLevel::Debug, kLogChannel, "individual {} failed: {}", id, ex.what());
            return kInfiniteCost;
        }
    });
}

auto MoveaOptimizer::check_ready() const -> std::expected<void, MoveaError>
{
    if (candidates_.size() < 4U)
    {
        return std::unexpected(make_error(
            fmt::format("need at least 4 candidate electrodes, have {}", candidates_.size()), {"electrodes", "pool"}));
    }
    if (target_size() == 0U)
    {
        return std::unexpected(make_error("no target set", {"set_target"}));
    }
    if (settings_.population < 2U)
    {
        return std::unexpected(make_error("population must hold at least 2 individuals", {"optimizer", "population"}));
    }
    return {};
}

auto MoveaOptimizer::chance(double probability) -> bool
{
    std::uniform_real_distribution<double> unit{0.0, 1.0};
    return unit(rng_) < probability;
}

auto MoveaOptimizer::random_individual() -> Individual
{
    auto pool = candidates_;
    for (std::size_t i = 0; i < 4U; ++i)
    {
        std::uniform_int_distribution<std::size_t> pick{i, pool.size() - 1U};
        std::swap(pool[i], pool[pick(rng_)]);
    }
    std::uniform_real_distribution<double> ratio{settings_.ratio_bounds[0], settings_.ratio_bounds[1]};

    Individual individual{};
    std::copy_n(pool.begin(), 4, individual.electrodes.begin());
    individual.ratio = ratio(rng_);
    return individual;
}

auto MoveaOptimizer::tournament(std::span<const Individual> population, std::span<const Objectives> objectives)
    -> const Individual &
{
    std::vector<std::size_t> order(population.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    const auto rounds = std::min(std::max<std::size_t>(1U, settings_.tournament_size), order.size());
    for (std::size_t i = 0; i < rounds; ++i)
    {
        std::uniform_int_distribution<std::size_t> pick{i, order.size() - 1U};
        std::swap(order[i], order[pick(rng_)]);
    }

    std::size_t best = order[0];
    for (std::size_t i = 1; i < rounds; ++i)
    {
        if (dominates(objectives[order[i]], objectives[best]))
        {
            best = order[i];
        }
    }
    return population[best];
}

auto MoveaOptimizer::crossover(const Individual &first, const Individual &second) -> Individual
{
    Individual child = first;

    std::vector<std::size_t> pool(first.electrodes.begin(), first.electrodes.end());
    pool.insert(pool.end(), second.electrodes.begin(), second.electrodes.end());
    std::sort(pool.begin(), pool.end());
    pool.erase(std::unique(pool.begin(), pool.end()), pool.end());
    if (pool.size() >= 4U)
    {
        for (std::size_t i = 0; i < 4U; ++i)
        {
            std::uniform_int_distribution<std::size_t> pick{i, pool.size() - 1U};
            std::swap(pool[i], pool[pick(rng_)]);
        }
        std::copy_n(pool.begin(), 4, child.electrodes.begin());
    }

    std::uniform_real_distribution<double> unit{0.0, 1.0};
    const double                           alpha = unit(rng_);
    child.ratio = clamp_ratio((alpha * first.ratio) + ((1.0 - alpha) * second.ratio));
    return child;
}

void MoveaOptimizer::mutate(Individual &individual)
{
    if (chance(settings_.mutation_rate))
    {
        std::vector<std::size_t> unused;
        unused.reserve(candidates_.size());
        for (const auto row : candidates_)
        {
            if (std::find(individual.electrodes.begin(), individual.electrodes.end(), row) ==
                individual.electrodes.end())
            {
                unused.push_back(row);
            }
        }
        if (!unused.empty())
        {
            std::uniform_int_distribution<std::size_t> slot{0U, 3U};
            std::uniform_int_distribution<std::size_t> pick{0U, unused.size() - 1U};
            individual.electrodes[slot(rng_)] = unused[pick(rng_)];
        }
    }
    if (chance(settings_.mutation_rate) && settings_.ratio_sigma > 0.0)
    {
        std::normal_distribution<double> noise{0.0, settings_.ratio_sigma};
        individual.ratio = clamp_ratio(individual.ratio + noise(rng_));
    }
}

auto MoveaOptimizer::make_solution(const Individual &individual, const Objectives &objectives) const
    -> ParetoSolution
{
    ParetoSolution solution{};
    solution.electrodes = individual.electrodes;
    for (std::size_t i = 0; i < 4U; ++i)
    {
        solution.names[i] = electrodes_.name(individual.electrodes[i]);
    }
    solution.current_ratio   = clamp_ratio(individual.ratio);
    solution.ch1_mA          = settings_.total_current_mA * solution.current_ratio;
    solution.ch2_mA          = settings_.total_current_mA * (1.0 - solution.current_ratio);
    solution.intensity_cost  = objectives[0];
    solution.intensity_field = (objectives[0] > 0.0 && std::isfinite(objectives[0])) ? 1.0 / objectives[0] : 0.0;
    solution.focality_cost   = objectives[1];
    solution.focality_ratio  = objectives[1] > 0.0 ? solution.intensity_field / objectives[1] : 0.0;
    return solution;
}

auto MoveaOptimizer::generate_pareto_solutions() -> std::expected<std::vector<ParetoSolution>, MoveaError>
{
    if (auto ready = check_ready(); !ready)
    {
        return std::unexpected(ready.error());
    }
    rng_.seed(settings_.seed);

    const auto              population_size = settings_.population;
    std::vector<Individual> population;
    population.reserve(population_size);
    for (std::size_t i = 0; i < population_size; ++i)
    {
        population.push_back(random_individual());
    }

    common::log(common::LogLevel::Info, kLogChannel,
                "multi-objective run: population {}, generations {}, {} candidate electrodes, seed {}",
                population_size, settings_.generations, candidates_.size(), settings_.seed);

    ParetoFront archive;
    for (std::size_t generation = 0; generation < settings_.generations; ++generation)
    {
        const auto objectives = evaluate_population(population);
        const auto front      = find_non_dominated(objectives);
        for (const auto index : front)
        {
            if (is_finite(objectives[index]))
            {
                archive.insert(make_solution(population[index], objectives[index]));
            }
        }
        common::log(common::LogLevel::Info, kLogChannel, "generation {}/{}: {} non-dominated, archive {}",
                    generation + 1U, settings_.generations, front.size(), archive.size());

        if (generation + 1U == settings_.generations)
        {
            break;
        }

        std::vector<Individual> next;
        next.reserve(population_size);
        for (const auto index : front)
        {
            if (next.size() == population_size)
            {
                break;
            }
            next.push_back(population[index]);
        }
        while (next.size() < population_size)
        {
            const auto &first  = tournament(population, objectives);
            const auto &second = tournament(population, objectives);
            Individual  child  = chance(settings_.crossover_rate) ? crossover(first, second) : first;
            mutate(child);
            next.push_back(child);
        }
        population = std::move(next);
    }

    if (archive.empty())
    {
        common::log(common::LogLevel::Warn, kLogChannel, "no feasible montage reached the Pareto archive");
    }
    return archive.sorted_by_intensity();
}

auto MoveaOptimizer::optimize() -> std::expected<OptimizationResult, MoveaError>
{
    if (auto ready = check_ready(); !ready)
    {
        return std::unexpected(ready.error());
    }
    rng_.seed(settings_.seed);

    const auto              population_size = settings_.population;
    const auto              elite_size      = std::min(population_size, std::max<std::size_t>(2U, population_size / 10U));
    const auto              parent_span     = std::max<std::size_t>(1U, population_size / 2U);
    std::vector<Individual> population;
    population.reserve(population_size);
    for (std::size_t i = 0; i < population_size; ++i)
    {
        population.push_back(random_individual());
    }

    common::log(common::LogLevel::Info, kLogChannel, "single-objective run: population {}, generations {}, elite {}",
                population_size, settings_.generations, elite_size);

    OptimizationResult result{};
    Individual         best{};
    double             best_cost = kInfiniteCost;

    for (std::size_t generation = 0; generation < settings_.generations; ++generation)
    {
        const auto costs = evaluate_costs(population);
        result.evaluations += costs.size();

        std::vector<std::size_t> order(population.size());
        std::iota(order.begin(), order.end(), std::size_t{0});
        std::stable_sort(order.begin(), order.end(),
                         [&costs](std::size_t lhs, std::size_t rhs) { return costs[lhs] < costs[rhs]; });

        if (costs[order[0]] < best_cost)
        {
            best_cost = costs[order[0]];
            best      = population[order[0]];
            common::log(common::LogLevel::Debug, kLogChannel, "generation {}: new best cost {:.6f}", generation + 1U,
                        best_cost);
        }
        result.history.push_back(best_cost);

        if (generation + 1U == settings_.generations)
        {
            break;
        }

        std::vector<Individual> next;
        next.reserve(population_size);
        for (std::size_t i = 0; i < elite_size; ++i)
        {
            next.push_back(population[order[i]]);
        }
        std::uniform_int_distribution<std::size_t> parent{0U, parent_span - 1U};
        while (next.size() < population_size)
        {
            const auto &first  = population[order[parent(rng_)]];
            const auto &second = population[order[parent(rng_)]];
            Individual  child  = chance(settings_.crossover_rate) ? crossover(first, second) : first;
            mutate(child);
            next.push_back(child);
        }
        population = std::move(next);
    }

    if (!std::isfinite(best_cost))
    {
        return std::unexpected(make_error("no feasible montage found", {"optimize"}));
    }
    result.best = make_solution(best, evaluate_individual(best));
    common::log(common::LogLevel::Info, kLogChannel, "best {}-{} / {}-{} at {:.4f} V/m after {} evaluations",
                result.best.names[0], result.best.names[1], result.best.names[2], result.best.names[3],
                result.best.intensity_field, result.evaluations);
    return result;
}

} // namespace tio::movea
