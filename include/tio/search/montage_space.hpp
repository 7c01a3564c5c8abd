/**
 * @file montage_space.hpp
 * @brief the montage x current-ratio space the exhaustive engine walks uwu
 *
 * a montage is four electrode roles (E1+, E1-, E2+, E2-) plus one current per
 * channel. the space is never materialized: a candidate id decodes straight
 * into its montage, so a few hundred million candidates cost nothing until
 * they are evaluated. enumeration order is fixed, which keeps chunked parallel
 * runs reproducible and lets max_candidates mean "the first K".
 *
 * order:
 * - bucketed: e1_plus, e1_minus, e2_plus, e2_minus, then ratio (innermost)
 * - all_combinations: lexicographic 4-permutations of the pool, then ratio
 */
#pragma once

#include <array>
#include <cstddef>
#include <expected>
#include <string>
#include <vector>

#include "tio/config/config.hpp"
#include "tio/leadfield/leadfield.hpp"

namespace tio::search
{

struct SearchError
{
    std::string              message;
    std::vector<std::string> context;
};

/**
 * @brief one (channel 1, channel 2) current split in mA
 */
struct CurrentRatio
{
    double ch1_mA{0.0};
    double ch2_mA{0.0};
};

/**
 * @brief ratio list plus whether the per-channel limit could not absorb the total
 */
struct RatioSchedule
{
    std::vector<CurrentRatio> ratios;
    bool                      limit_exceeded{false};
};

/**
 * @brief electrode rows in role order + the current split
 */
struct Montage
{
    std::array<std::size_t, 4> electrodes{}; ///< E1+, E1-, E2+, E2-
    CurrentRatio               currents;

    /// true when all four roles use different electrodes
    [[nodiscard]] auto distinct() const noexcept -> bool;
};

/**
 * @brief walks channel 1 down from `limit` in `step` increments
 *
 * ✨ PURE FUNCTION ✨
 *
 * pairs (ch1, total - ch1) are kept when both lie in [step - eps, limit + eps]
 * with eps = step * 0.01. limit_exceeded reports total - limit < step - eps,
 * i.e. the cap pushes channel 2 below one step.
 *
 * @param[in] total_mA total current over both channels
 * @param[in] step_mA ratio resolution
 * @param[in] limit_mA per-channel cap
 */
[[nodiscard]] auto generate_current_ratios(double total_mA, double step_mA, double limit_mA) -> RatioSchedule;

/**
 * @brief ordered 4-permutation count P(n, 4), 0 for n < 4
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto permutation_count(std::size_t n) noexcept -> std::size_t;

/**
 * @brief id-addressable candidate space
 */
class MontageSpace
{
public:
    /// bucketed space over four role pools
    [[nodiscard]] static auto bucketed(std::array<std::vector<std::size_t>, 4> pools, RatioSchedule schedule)
        -> MontageSpace;

    /// all ordered quadruples of distinct electrodes out of one pool
    [[nodiscard]] static auto all_combinations(std::vector<std::size_t> pool, RatioSchedule schedule)
        -> MontageSpace;

    [[nodiscard]] auto mode() const noexcept -> config::SearchMode { return mode_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return size_; }
    [[nodiscard]] auto montage_count() const noexcept -> std::size_t;
    [[nodiscard]] auto schedule() const noexcept -> const RatioSchedule & { return schedule_; }

    /**
     * @brief decodes candidate `id` (must be < size())
     *
     * ✨ PURE FUNCTION ✨
     */
    [[nodiscard]] auto at(std::size_t id) const -> Montage;

private:
    MontageSpace(config::SearchMode mode, std::array<std::vector<std::size_t>, 4> pools, RatioSchedule schedule);

    config::SearchMode                      mode_{config::SearchMode::Bucketed};
    std::array<std::vector<std::size_t>, 4> pools_{};
    RatioSchedule                           schedule_{};
    std::size_t                             size_{0U};
};

/**
 * @brief resolves the config's electrode pools and ratio knobs into a space
 *
 * ⚠️ IMPURE FUNCTION (logs dropped electrode names and the limit warning)
 *
 * unknown names are dropped with a warning like everywhere else. a role pool
 * that ends up empty, an all_combinations pool under four electrodes or an
 * empty ratio list is a SearchError.
 */
[[nodiscard]] auto build_montage_space(const config::Config &config, const leadfield::ElectrodeIndex &electrodes)
    -> std::expected<MontageSpace, SearchError>;

/**
 * @brief canonical key "E1p_E1m_and_E2p_E2m_I1-1.0mA_I2-1.0mA"
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto montage_name(const leadfield::ElectrodeIndex &electrodes, const Montage &montage) -> std::string;

} // namespace tio::search
