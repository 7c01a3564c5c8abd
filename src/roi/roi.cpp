/**
 * @file roi.cpp
 * @brief element selection by sphere / tag / atlas label + metric folding
 */
#include "tio/roi/roi.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <fstream>
#include <string_view>

#include <fmt/format.h>

#include "tio/config/roi_presets.hpp"

namespace tio::roi
{
namespace
{

constexpr std::array<std::int32_t, 1> kDefaultGreyMatterTags{2};

[[nodiscard]] auto fail(std::string message, std::vector<std::string> ctx) -> std::unexpected<RoiError>
{
    return std::unexpected(RoiError{std::move(message), std::move(ctx)});
}

template <typename Predicate>
[[nodiscard]] auto select_where(const mesh::ElementGrid &grid, Predicate &&keep) -> RoiSelection
{
    RoiSelection selection{};
    for (std::size_t i = 0; i < grid.size(); ++i)
    {
        if (keep(i))
        {
            selection.indices.push_back(i);
            selection.volumes.push_back(grid.volumes[i]);
        }
    }
    return selection;
}

[[nodiscard]] auto trim(std::string_view text) noexcept -> std::string_view
{
    const auto first = text.find_first_not_of(" \t\r\"");
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\"");
    return text.substr(first, last - first + 1U);
}

[[nodiscard]] auto parse_double(std::string_view text) noexcept -> std::optional<double>
{
    text = trim(text);
    if (!text.empty() && text.front() == '+')
    {
        text.remove_prefix(1U);
    }
    double value{};
    const auto *end    = text.data() + text.size();
    const auto  result = std::from_chars(text.data(), end, value);
    if (text.empty() || result.ec != std::errc{} || result.ptr != end)
    {
        return std::nullopt;
    }
    return value;
}

} // namespace

auto find_sphere_element_indices(const mesh::ElementGrid &grid, const common::Vec3 &center, double radius)
    -> RoiSelection
{
    const auto radius_squared = radius * radius;
    return select_where(grid, [&](std::size_t i) {
        return common::squared_distance(grid.centers[i], center) <= radius_squared;
    });
}

auto find_grey_matter_indices(const mesh::ElementGrid &grid, std::span<const std::int32_t> tags) -> RoiSelection
{
    return select_where(grid, [&](std::size_t i) { return std::ranges::find(tags, grid.tags[i]) != tags.end(); });
}

auto find_grey_matter_indices(const mesh::ElementGrid &grid) -> RoiSelection
{
    return find_grey_matter_indices(grid, kDefaultGreyMatterTags);
}

auto find_atlas_label_indices(const mesh::ElementGrid &grid, std::int32_t label)
    -> std::expected<RoiSelection, RoiError>
{
    if (!grid.atlas_labels)
    {
        return fail("grid has no atlas labels, cannot select by label", {"roi", "atlas_label"});
    }
    const auto &labels = *grid.atlas_labels;
    return select_where(grid, [&](std::size_t i) { return labels[i] == label; });
}

auto resolve_roi(const mesh::ElementGrid &grid, const RoiSpec &spec) -> std::expected<RoiSelection, RoiError>
{
    if (spec.atlas_label)
    {
        return find_atlas_label_indices(grid, *spec.atlas_label);
    }
    if (!spec.center)
    {
        return fail("ROI needs a center or an atlas label", {"roi"});
    }
    if (!(spec.radius > 0.0))
    {
        return fail(fmt::format("ROI radius must be > 0 (got {})", spec.radius), {"roi", "radius"});
    }
    return find_sphere_element_indices(grid, *spec.center, spec.radius);
}

auto load_roi_center_from_csv(const std::filesystem::path &path) -> std::expected<common::Vec3, RoiError>
{
    std::ifstream file{path};
    if (!file)
    {
        return fail(fmt::format("failed to open ROI csv: {}", path.string()), {path.string()});
    }

    std::string line;
    std::size_t line_number = 0U;
    while (std::getline(file, line))
    {
        ++line_number;
        std::vector<std::string_view> cells;
        std::string_view              rest{line};
        for (;;)
        {
            const auto comma = rest.find(',');
            cells.push_back(rest.substr(0U, comma));
            if (comma == std::string_view::npos)
            {
                break;
            }
            rest.remove_prefix(comma + 1U);
        }

        // header and blank rows carry no numbers, the first row that does is the coordinate row
        const bool any_numeric = std::ranges::any_of(cells, [](std::string_view cell) {
            return parse_double(cell).has_value();
        });
        if (!any_numeric)
        {
            continue;
        }

        const auto row = fmt::format("line {}", line_number);
        if (cells.size() != 3U)
        {
            return fail(fmt::format("ROI csv coordinate row needs 3 cells, found {}", cells.size()),
                        {path.string(), row});
        }
        std::array<double, 3> xyz{};
        for (std::size_t axis = 0; axis < 3U; ++axis)
        {
            const auto value = parse_double(cells[axis]);
            if (!value || !std::isfinite(*value))
            {
                return fail(fmt::format("ROI csv cell '{}' is not a finite coordinate", trim(cells[axis])),
                            {path.string(), row, fmt::format("[{}]", axis)});
            }
            xyz[axis] = *value;
        }
        return common::Vec3{xyz[0], xyz[1], xyz[2]};
    }
    return fail(fmt::format("no row with three coordinates in {} ({} lines read)", path.string(), line_number),
                {path.string()});
}

auto roi_spec_from_config(const config::Config &config) -> std::expected<RoiSpec, RoiError>
{
    RoiSpec spec{};
    spec.radius      = config.roi.radius;
    spec.atlas_label = config.roi.atlas_label;
    if (config.roi.center)
    {
        const auto &c = *config.roi.center;
        spec.center   = common::Vec3{c[0], c[1], c[2]};
    }
    else if (config.roi.csv)
    {
        auto center = load_roi_center_from_csv(config.resolve_path(*config.roi.csv));
        if (!center)
        {
            return std::unexpected(center.error());
        }
        spec.center = *center;
    }
    else if (config.roi.preset)
    {
        const auto mni = config::resolve_roi_preset(config);
        if (!mni)
        {
            return fail(mni.error().message, mni.error().context);
        }
        spec.center = common::Vec3{(*mni)[0], (*mni)[1], (*mni)[2]};
    }
    return spec;
}

auto weighted_mean(std::span<const double> values, std::span<const double> weights) noexcept -> double
{
    double weighted = 0.0;
    double total    = 0.0;
    const auto count = std::min(values.size(), weights.size());
    for (std::size_t i = 0; i < count; ++i)
    {
        weighted += values[i] * weights[i];
        total += weights[i];
    }
    return total > 0.0 ? weighted / total : 0.0;
}

auto calculate_roi_metrics(std::span<const double> values, std::span<const double> volumes,
                           std::optional<std::span<const double>> gm_values,
                           std::optional<std::span<const double>> gm_volumes) -> std::expected<RoiMetrics, RoiError>
{
    if (values.size() != volumes.size())
    {
        return fail(fmt::format("{} ROI values for {} volumes", values.size(), volumes.size()), {"roi_metrics"});
    }
    RoiMetrics metrics{};
    metrics.n_elements = values.size();
    if (!values.empty())
    {
        metrics.timax_roi  = *std::ranges::max_element(values);
        metrics.timean_roi = weighted_mean(values, volumes);
    }

    if (gm_values && !gm_values->empty())
    {
        if (!gm_volumes || gm_volumes->size() != gm_values->size())
        {
            return fail(fmt::format("{} grey matter values without matching volumes", gm_values->size()),
                        {"roi_metrics", "grey_matter"});
        }
        const auto gm_mean = weighted_mean(*gm_values, *gm_volumes);
        metrics.timean_gm  = gm_mean;
        if (gm_mean > 0.0)
        {
            metrics.focality = metrics.timean_roi / gm_mean;
        }
    }
    return metrics;
}

} // namespace tio::roi
