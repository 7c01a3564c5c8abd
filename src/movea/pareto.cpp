/**
 * @file pareto.cpp
 * @brief non-dominated sorting, crowding distance and front selection
 */
#include "tio/movea/pareto.hpp"

#include <algorithm>
#include <cmath>

namespace tio::movea
{

auto dominates(const Objectives &a, const Objectives &b) noexcept -> bool
{
    return a[0] <= b[0] && a[1] <= b[1] && (a[0] < b[0] || a[1] < b[1]);
}

auto find_non_dominated(std::span<const Objectives> objectives) -> std::vector<std::size_t>
{
    std::vector<std::size_t> front;
    for (std::size_t i = 0; i < objectives.size(); ++i)
    {
        bool dominated = false;
        for (std::size_t j = 0; j < objectives.size() && !dominated; ++j)
        {
            dominated = (i != j) && dominates(objectives[j], objectives[i]);
        }
        if (!dominated)
        {
            front.push_back(i);
        }
    }
    return front;
}

auto is_finite(const Objectives &objectives) noexcept -> bool
{
    return std::isfinite(objectives[0]) && std::isfinite(objectives[1]);
}

auto ParetoFront::insert(const ParetoSolution &solution) -> bool
{
    const auto candidate = solution.objectives();
    if (!is_finite(candidate))
    {
        return false;
    }
    for (const auto &member : members_)
    {
        const auto existing = member.objectives();
        if (dominates(existing, candidate))
        {
            return false;
        }
        if (existing == candidate && member.electrodes == solution.electrodes)
        {
            return false;
        }
    }
    std::erase_if(members_, [&candidate](const ParetoSolution &member) {
        return dominates(candidate, member.objectives());
    });
    members_.push_back(solution);
    return true;
}

auto ParetoFront::sorted_by_intensity() const -> std::vector<ParetoSolution>
{
    auto sorted = members_;
    std::stable_sort(sorted.begin(), sorted.end(), [](const ParetoSolution &lhs, const ParetoSolution &rhs) {
        return lhs.intensity_field > rhs.intensity_field;
    });
    return sorted;
}

} // namespace tio::movea
