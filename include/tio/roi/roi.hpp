/**
 * @file roi.hpp
 * @brief ROI + grey matter element selection and volume-weighted TI metrics uwu
 *
 * a region resolves exactly once into ascending element indices plus their
 * volumes. both search engines then evaluate the envelope on that subset only
 * and fold it into RoiMetrics:
 *
 * - TImax_ROI: max envelope inside the ROI (0 when empty)
 * - TImean_ROI: volume-weighted mean inside the ROI
 * - TImean_GM: volume-weighted mean over grey matter (absent without GM)
 * - Focality: TImean_ROI / TImean_GM (absent when GM is empty or its mean is 0)
 *
 * example (basic usage):
 * @code
 * using namespace tio::roi;
 * const auto target = find_sphere_element_indices(grid, {10.0, -20.0, 5.0}, 3.0);
 * const auto gm     = find_grey_matter_indices(grid);
 * @endcode
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "tio/common/math.hpp"
#include "tio/config/config.hpp"
#include "tio/mesh/grid.hpp"

namespace tio::roi
{

/**
 * @brief ROI input could not be resolved (missing csv, no atlas channel, ...)
 */
struct RoiError
{
    std::string              message;
    std::vector<std::string> context;
};

/**
 * @brief a syntactically fine ROI that selects nothing usable
 */
struct DomainError
{
    std::string              message;
    std::vector<std::string> context;
};

/**
 * @brief ascending element indices and matching volumes
 */
struct RoiSelection
{
    std::vector<std::size_t> indices;
    std::vector<double>      volumes;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return indices.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return indices.empty(); }
};

/**
 * @brief resolved ROI description, sphere or atlas label
 */
struct RoiSpec
{
    std::optional<common::Vec3> center;
    double                      radius{0.0};
    std::optional<std::int32_t> atlas_label;
};

/**
 * @brief metrics of one evaluated montage
 */
struct RoiMetrics
{
    double                timax_roi{0.0};
    double                timean_roi{0.0};
    std::optional<double> timean_gm;
    std::optional<double> focality;
    std::size_t           n_elements{0U};
};

/**
 * @brief elements whose center lies inside a closed sphere
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] grid element grid
 * @param[in] center sphere center (mm)
 * @param[in] radius sphere radius (mm), membership is |c - center|² <= radius²
 * @return ascending indices + volumes
 */
[[nodiscard]] auto find_sphere_element_indices(const mesh::ElementGrid &grid, const common::Vec3 &center,
                                               double radius) -> RoiSelection;

/**
 * @brief elements whose tissue tag is one of `tags`
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto find_grey_matter_indices(const mesh::ElementGrid &grid, std::span<const std::int32_t> tags)
    -> RoiSelection;

/**
 * @brief find_grey_matter_indices with the default grey matter tag {2}
 */
[[nodiscard]] auto find_grey_matter_indices(const mesh::ElementGrid &grid) -> RoiSelection;

/**
 * @brief elements carrying one atlas label
 *
 * ✨ PURE FUNCTION ✨
 *
 * @return selection or RoiError when the grid has no atlas channel
 */
[[nodiscard]] auto find_atlas_label_indices(const mesh::ElementGrid &grid, std::int32_t label)
    -> std::expected<RoiSelection, RoiError>;

/**
 * @brief dispatches a RoiSpec onto sphere or atlas selection
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto resolve_roi(const mesh::ElementGrid &grid, const RoiSpec &spec)
    -> std::expected<RoiSelection, RoiError>;

/**
 * @brief reads a ROI center from csv: the first row holding any number
 *
 * ⚠️ IMPURE FUNCTION (file I/O)
 *
 * rows without a single numeric cell (headers, blanks) are skipped. the
 * coordinate row must then be exactly three finite numbers, anything else
 * is a RoiError rather than a guess.
 */
[[nodiscard]] auto load_roi_center_from_csv(const std::filesystem::path &path)
    -> std::expected<common::Vec3, RoiError>;

/**
 * @brief turns the configured ROI (inline center, csv, named preset or atlas) into a RoiSpec
 *
 * ⚠️ IMPURE FUNCTION (reads the csv or presets file when one is configured)
 *
 * preset failures (unknown name, unreadable file) keep the ConfigError's
 * message and breadcrumbs.
 */
[[nodiscard]] auto roi_spec_from_config(const config::Config &config) -> std::expected<RoiSpec, RoiError>;

/**
 * @brief folds envelope samples into RoiMetrics
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] values envelope per ROI element (V/m)
 * @param[in] volumes weight per ROI element
 * @param[in] gm_values envelope per grey matter element, optional
 * @param[in] gm_volumes weight per grey matter element, optional
 * @return metrics or RoiError when a value/volume pair has different lengths
 */
[[nodiscard]] auto calculate_roi_metrics(std::span<const double> values, std::span<const double> volumes,
                                         std::optional<std::span<const double>> gm_values  = std::nullopt,
                                         std::optional<std::span<const double>> gm_volumes = std::nullopt)
    -> std::expected<RoiMetrics, RoiError>;

/**
 * @brief volume-weighted mean, 0 when the weights sum to 0
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto weighted_mean(std::span<const double> values, std::span<const double> weights) noexcept -> double;

} // namespace tio::roi
