/**
 * @file montage_space.cpp
 * @brief current ratio grid + lazy montage enumeration (bucketed / all-combinations)
 */
#include "tio/search/montage_space.hpp"

#include <algorithm>
#include <cmath>
#include <span>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>

#include "tio/common/log.hpp"

namespace tio::search
{
namespace
{

constexpr std::string_view kLogChannel = "[tio::search]";

[[nodiscard]] auto make_error(std::string message, std::initializer_list<std::string> ctx = {}) -> SearchError
{
    SearchError err{};
    err.message = std::move(message);
    err.context.assign(ctx.begin(), ctx.end());
    return err;
}

/// names -> leadfield rows, unknown names dropped with a warning, first occurrence wins
[[nodiscard]] auto resolve_pool(const leadfield::ElectrodeIndex &electrodes, std::span<const std::string> names,
                                std::string_view role) -> std::vector<std::size_t>
{
    std::vector<std::size_t>        rows;
    std::unordered_set<std::size_t> seen;
    rows.reserve(names.size());
    for (const auto &name : names)
    {
        const auto row = electrodes.find(name);
        if (!row)
        {
            common::log(common::LogLevel::Warn, kLogChannel, "electrode '{}' ({}) not in leadfield, ignored", name,
                        role);
            continue;
        }
        if (seen.insert(*row).second)
        {
            rows.push_back(*row);
        }
    }
    return rows;
}

} // namespace

auto Montage::distinct() const noexcept -> bool
{
    for (std::size_t i = 0; i < electrodes.size(); ++i)
    {
        for (std::size_t j = i + 1U; j < electrodes.size(); ++j)
        {
            if (electrodes[i] == electrodes[j])
            {
                return false;
            }
        }
    }
    return true;
}

auto generate_current_ratios(double total_mA, double step_mA, double limit_mA) -> RatioSchedule
{
    RatioSchedule schedule{};
    if (!(step_mA > 0.0) || !(total_mA > 0.0))
    {
        return schedule;
    }
    const double epsilon     = step_mA * 0.01;
    schedule.limit_exceeded  = (total_mA - limit_mA) < (step_mA - epsilon);
    const double min_current = std::max(total_mA - limit_mA, step_mA);

    // ch1 = limit - k * step instead of repeated subtraction so long walks don't drift
    for (std::size_t k = 0;; ++k)
    {
        const double ch1 = limit_mA - (static_cast<double>(k) * step_mA);
        if (ch1 < min_current - epsilon)
        {
            break;
        }
        const double ch2 = total_mA - ch1;
        if (ch1 <= limit_mA + epsilon && ch2 <= limit_mA + epsilon && ch1 >= step_mA - epsilon &&
            ch2 >= step_mA - epsilon)
        {
            schedule.ratios.push_back(CurrentRatio{ch1, ch2});
        }
    }
    return schedule;
}

auto permutation_count(std::size_t n) noexcept -> std::size_t
{
    if (n < 4U)
    {
        return 0U;
    }
    return n * (n - 1U) * (n - 2U) * (n - 3U);
}

MontageSpace::MontageSpace(config::SearchMode mode, std::array<std::vector<std::size_t>, 4> pools,
                           RatioSchedule schedule)
    : mode_{mode}, pools_{std::move(pools)}, schedule_{std::move(schedule)}
{
    size_ = montage_count() * schedule_.ratios.size();
}

auto MontageSpace::bucketed(std::array<std::vector<std::size_t>, 4> pools, RatioSchedule schedule) -> MontageSpace
{
    return MontageSpace{config::SearchMode::Bucketed, std::move(pools), std::move(schedule)};
}

auto MontageSpace::all_combinations(std::vector<std::size_t> pool, RatioSchedule schedule) -> MontageSpace
{
    std::array<std::vector<std::size_t>, 4> pools{};
    pools[0] = std::move(pool);
    return MontageSpace{config::SearchMode::AllCombinations, std::move(pools), std::move(schedule)};
}

auto MontageSpace::montage_count() const noexcept -> std::size_t
{
    if (mode_ == config::SearchMode::AllCombinations)
    {
        return permutation_count(pools_[0].size());
    }
    return pools_[0].size() * pools_[1].size() * pools_[2].size() * pools_[3].size();
}

auto MontageSpace::at(std::size_t id) const -> Montage
{
    const auto ratio_count = schedule_.ratios.size();
    Montage    montage{};
    montage.currents    = schedule_.ratios[id % ratio_count];
    std::size_t ordinal = id / ratio_count;

    if (mode_ == config::SearchMode::Bucketed)
    {
        // mixed radix with e2_minus as the fastest digit
        for (std::size_t role = 4U; role-- > 0U;)
        {
            const auto radix         = pools_[role].size();
            montage.electrodes[role] = pools_[role][ordinal % radix];
            ordinal /= radix;
        }
        return montage;
    }

    // lexicographic rank -> permutation, picking from what is left each step
    std::vector<std::size_t> remaining = pools_[0];
    std::size_t              block     = permutation_count(remaining.size()) / remaining.size();
    for (std::size_t role = 0; role < 4U; ++role)
    {
        const auto pick          = ordinal / block;
        ordinal                  = ordinal % block;
        montage.electrodes[role] = remaining[pick];
        remaining.erase(remaining.begin() + static_cast<std::ptrdiff_t>(pick));
        if (role < 3U)
        {
            block /= remaining.size();
        }
    }
    return montage;
}

auto build_montage_space(const config::Config &config, const leadfield::ElectrodeIndex &electrodes)
    -> std::expected<MontageSpace, SearchError>
{
    const auto &search = config.search;
    const auto  limit  = search.channel_limit_mA.value_or(search.total_current_mA / 2.0);
    auto schedule      = generate_current_ratios(search.total_current_mA, search.current_step_mA, limit);
    if (schedule.limit_exceeded)
    {
        common::log(common::LogLevel::Warn, kLogChannel,
                    "channel limit {:.2f} mA cannot absorb {:.2f} mA total at {:.2f} mA steps", limit,
                    search.total_current_mA, search.current_step_mA);
    }
    if (schedule.ratios.empty())
    {
        return std::unexpected(make_error(fmt::format("no current ratio fits total {} mA, step {} mA, limit {} mA",
                                                      search.total_current_mA, search.current_step_mA, limit),
                                          {"search"}));
    }

    if (search.mode == config::SearchMode::AllCombinations)
    {
        auto pool = resolve_pool(electrodes, config.electrodes.pool, "pool");
        if (pool.size() < 4U)
        {
            return std::unexpected(make_error(
                fmt::format("all_combinations needs at least 4 known electrodes, got {}", pool.size()),
                {"electrodes", "pool"}));
        }
        return MontageSpace::all_combinations(std::move(pool), std::move(schedule));
    }

    const std::array<std::pair<std::string_view, const std::vector<std::string> *>, 4> roles{{
        {"e1_plus", &config.electrodes.e1_plus},
        {"e1_minus", &config.electrodes.e1_minus},
        {"e2_plus", &config.electrodes.e2_plus},
        {"e2_minus", &config.electrodes.e2_minus},
    }};
    std::array<std::vector<std::size_t>, 4> pools{};
    for (std::size_t role = 0; role < roles.size(); ++role)
    {
        pools[role] = resolve_pool(electrodes, *roles[role].second, roles[role].first);
        if (pools[role].empty())
        {
            return std::unexpected(
                make_error("no known electrode left in pool", {"electrodes", std::string{roles[role].first}}));
        }
    }
    return MontageSpace::bucketed(std::move(pools), std::move(schedule));
}

auto montage_name(const leadfield::ElectrodeIndex &electrodes, const Montage &montage) -> std::string
{
    return fmt::format("{}_{}_and_{}_{}_I1-{:.1f}mA_I2-{:.1f}mA", electrodes.name(montage.electrodes[0]),
                       electrodes.name(montage.electrodes[1]), electrodes.name(montage.electrodes[2]),
                       electrodes.name(montage.electrodes[3]), montage.currents.ch1_mA, montage.currents.ch2_mA);
}

} // namespace tio::search
