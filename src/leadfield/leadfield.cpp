/**
 * @file leadfield.cpp
 * @brief leadfield tensor validation + yaml-cpp manifest loader
 */
#include "tio/leadfield/leadfield.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "tio/common/log.hpp"
#include "tio/leadfield/hdf5.hpp"
#include "tio/leadfield/npy.hpp"
#include "tio/mesh/mesh.hpp"

namespace tio::leadfield
{
namespace
{

constexpr std::string_view kLogChannel = "[tio::leadfield]";

[[nodiscard]] auto fail(std::string message, std::vector<std::string> ctx) -> std::unexpected<DataError>
{
    return std::unexpected(DataError{std::move(message), std::move(ctx)});
}

[[nodiscard]] auto from_npy(const NpyError &error) -> std::unexpected<DataError>
{
    return fail(error.message, error.context);
}

[[nodiscard]] auto manifest_path_entry(const YAML::Node &node, const std::filesystem::path &base, std::string key)
    -> std::expected<std::optional<std::filesystem::path>, DataError>
{
    const auto entry = node[key];
    if (!entry || entry.IsNull())
    {
        return std::optional<std::filesystem::path>{};
    }
    if (!entry.IsScalar())
    {
        return fail(fmt::format("manifest entry '{}' must be a path", key), {key});
    }
    std::filesystem::path path{entry.as<std::string>()};
    if (path.is_relative())
    {
        path = base / path;
    }
    return std::optional<std::filesystem::path>{std::move(path)};
}

[[nodiscard]] auto load_grid_from_arrays(const YAML::Node &grid_node, const std::filesystem::path &base)
    -> std::expected<mesh::ElementGrid, DataError>
{
    auto centers_path = manifest_path_entry(grid_node, base, "centers");
    if (!centers_path)
    {
        return std::unexpected(centers_path.error());
    }
    if (!centers_path->has_value())
    {
        return fail("grid needs either 'centers' or 'mesh'", {"grid"});
    }
    auto centers = load_npy_f64(**centers_path);
    if (!centers)
    {
        return from_npy(centers.error());
    }
    if (centers->shape.size() != 2U || centers->shape[1] != 3U)
    {
        return fail("grid centers must have shape [n, 3]", {"grid", "centers"});
    }

    mesh::ElementGrid grid{};
    const auto        count = centers->shape[0];
    grid.centers.resize(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        grid.centers[i] = common::Vec3{centers->values[(i * 3U) + 0U], centers->values[(i * 3U) + 1U],
                                       centers->values[(i * 3U) + 2U]};
    }

    auto volumes_path = manifest_path_entry(grid_node, base, "volumes");
    if (!volumes_path)
    {
        return std::unexpected(volumes_path.error());
    }
    if (volumes_path->has_value())
    {
        auto volumes = load_npy_f64(**volumes_path);
        if (!volumes)
        {
            return from_npy(volumes.error());
        }
        grid.volumes = std::move(volumes->values);
    }
    else
    {
        grid.volumes.assign(count, 1.0);
    }

    auto tags_path = manifest_path_entry(grid_node, base, "tags");
    if (!tags_path)
    {
        return std::unexpected(tags_path.error());
    }
    if (tags_path->has_value())
    {
        auto tags = load_npy_i32(**tags_path);
        if (!tags)
        {
            return from_npy(tags.error());
        }
        grid.tags = std::move(tags->values);
    }
    else
    {
        // voxel leadfields are usually exported from grey matter only
        grid.tags.assign(count, 2);
    }

    auto atlas_path = manifest_path_entry(grid_node, base, "atlas");
    if (!atlas_path)
    {
        return std::unexpected(atlas_path.error());
    }
    if (atlas_path->has_value())
    {
        auto atlas = load_npy_i32(**atlas_path);
        if (!atlas)
        {
            return from_npy(atlas.error());
        }
        grid.atlas_labels = std::move(atlas->values);
    }
    return grid;
}

[[nodiscard]] auto load_grid(const YAML::Node &root, const std::filesystem::path &base)
    -> std::expected<mesh::ElementGrid, DataError>
{
    const auto grid_node = root["grid"];
    if (!grid_node || !grid_node.IsMap())
    {
        return fail("manifest is missing the 'grid' mapping", {"grid"});
    }

    auto mesh_path = manifest_path_entry(grid_node, base, "mesh");
    if (!mesh_path)
    {
        return std::unexpected(mesh_path.error());
    }
    if (!mesh_path->has_value())
    {
        return load_grid_from_arrays(grid_node, base);
    }

    auto parsed = mesh::load_gmsh_file(**mesh_path);
    if (!parsed)
    {
        return fail(parsed.error().message, parsed.error().context);
    }
    auto grid = mesh::build_grid_from_mesh(*parsed);
    if (!grid)
    {
        auto ctx = grid.error().context;
        ctx.insert(ctx.begin(), mesh_path->value().string());
        return fail(grid.error().message, std::move(ctx));
    }

    auto atlas_path = manifest_path_entry(grid_node, base, "atlas");
    if (!atlas_path)
    {
        return std::unexpected(atlas_path.error());
    }
    if (atlas_path->has_value())
    {
        auto atlas = load_npy_i32(**atlas_path);
        if (!atlas)
        {
            return from_npy(atlas.error());
        }
        grid->atlas_labels = std::move(atlas->values);
    }
    return std::move(*grid);
}

/// [electrodes, elements, 3] tensor from a .npy array or a SimNIBS .hdf5 file
[[nodiscard]] auto load_matrix(const std::filesystem::path &tensor_path, bool from_hdf5)
    -> std::expected<LeadfieldMatrix, DataError>
{
    if (from_hdf5)
    {
        auto tensor = read_hdf5_tensor(tensor_path);
        if (!tensor)
        {
            return std::unexpected(tensor.error());
        }
        return LeadfieldMatrix::create(tensor->electrode_count, tensor->element_count, std::move(tensor->values));
    }

    auto tensor = load_npy_f32(tensor_path);
    if (!tensor)
    {
        return from_npy(tensor.error());
    }
    if (tensor->shape.size() != 3U || tensor->shape[2] != 3U)
    {
        return fail("leadfield array must have shape [n_electrodes, n_elements, 3]", {tensor_path.string()});
    }
    return LeadfieldMatrix::create(tensor->shape[0], tensor->shape[1], std::move(tensor->values));
}

} // namespace

LeadfieldMatrix::LeadfieldMatrix(std::size_t electrode_count, std::size_t element_count,
                                 std::vector<float> values) noexcept
    : electrode_count_(electrode_count), element_count_(element_count), values_(std::move(values))
{
}

auto LeadfieldMatrix::create(std::size_t electrode_count, std::size_t element_count, std::vector<float> values)
    -> std::expected<LeadfieldMatrix, DataError>
{
    if (electrode_count == 0U || element_count == 0U)
    {
        return fail("leadfield must have at least one electrode and one element", {"leadfield"});
    }
    const auto expected_size = electrode_count * element_count * 3U;
    if (values.size() != expected_size)
    {
        return fail(fmt::format("leadfield buffer holds {} values, shape [{}, {}, 3] needs {}", values.size(),
                                electrode_count, element_count, expected_size),
                    {"leadfield"});
    }
    const auto bad = std::ranges::find_if(values, [](float v) { return !std::isfinite(v); });
    if (bad != values.end())
    {
        return fail("leadfield contains non-finite values",
                    {"leadfield", fmt::format("[{}]", std::distance(values.begin(), bad))});
    }
    return LeadfieldMatrix{electrode_count, element_count, std::move(values)};
}

auto ElectrodeIndex::create(std::vector<std::string> names) -> std::expected<ElectrodeIndex, DataError>
{
    ElectrodeIndex index{};
    index.rows_.reserve(names.size());
    for (std::size_t row = 0; row < names.size(); ++row)
    {
        if (names[row].empty())
        {
            return fail("electrode names must be non-empty", {"electrodes", fmt::format("[{}]", row)});
        }
        if (!index.rows_.emplace(names[row], row).second)
        {
            return fail(fmt::format("duplicate electrode name '{}'", names[row]),
                        {"electrodes", fmt::format("[{}]", row)});
        }
    }
    index.names_ = std::move(names);
    return index;
}

auto ElectrodeIndex::find(std::string_view name) const -> std::optional<std::size_t>
{
    const auto it = rows_.find(std::string{name});
    if (it == rows_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

auto make_bundle(LeadfieldMatrix matrix, mesh::ElementGrid grid, std::vector<std::string> electrode_names)
    -> std::expected<LeadfieldBundle, DataError>
{
    if (auto valid = mesh::validate_grid(grid); !valid)
    {
        auto ctx = valid.error().context;
        ctx.insert(ctx.begin(), "grid");
        return fail(valid.error().message, std::move(ctx));
    }
    if (grid.size() != matrix.element_count())
    {
        return fail(fmt::format("grid has {} elements but leadfield has {}", grid.size(), matrix.element_count()),
                    {"grid"});
    }
    if (electrode_names.size() != matrix.electrode_count())
    {
        return fail(fmt::format("{} electrode names for {} leadfield rows", electrode_names.size(),
                                matrix.electrode_count()),
                    {"electrodes"});
    }
    auto index = ElectrodeIndex::create(std::move(electrode_names));
    if (!index)
    {
        return std::unexpected(index.error());
    }
    return LeadfieldBundle{
        .leadfield  = std::make_shared<const LeadfieldMatrix>(std::move(matrix)),
        .grid       = std::make_shared<const mesh::ElementGrid>(std::move(grid)),
        .electrodes = std::move(*index),
    };
}

auto load_leadfield_bundle(const std::filesystem::path &manifest_path) -> std::expected<LeadfieldBundle, DataError>
{
    YAML::Node root;
    try
    {
        root = YAML::LoadFile(manifest_path.string());
    }
    catch (const YAML::BadFile &ex)
    {
        return fail(fmt::format("unable to open leadfield manifest: {}", ex.what()), {manifest_path.string()});
    }
    catch (const YAML::Exception &ex)
    {
        return fail(fmt::format("YAML parse error: {}", ex.what()), {manifest_path.string()});
    }
    if (!root.IsMap())
    {
        return fail("leadfield manifest root must be a mapping", {manifest_path.string()});
    }
    const auto base = manifest_path.parent_path();

    std::vector<std::string> names;
    const auto               names_node = root["electrodes"];
    if (!names_node || !names_node.IsSequence())
    {
        return fail("manifest needs an 'electrodes' name list", {manifest_path.string(), "electrodes"});
    }
    try
    {
        names = names_node.as<std::vector<std::string>>();
    }
    catch (const YAML::Exception &ex)
    {
        return fail(ex.what(), {manifest_path.string(), "electrodes"});
    }

    auto tensor_path = manifest_path_entry(root, base, "leadfield");
    if (!tensor_path)
    {
        return std::unexpected(tensor_path.error());
    }
    if (!tensor_path->has_value())
    {
        return fail("manifest needs a 'leadfield' array path", {manifest_path.string(), "leadfield"});
    }
    const bool from_hdf5 = is_hdf5_path(**tensor_path);
    auto       matrix    = load_matrix(**tensor_path, from_hdf5);
    if (!matrix)
    {
        return std::unexpected(matrix.error());
    }

    // SimNIBS files carry their own mesh, an explicit grid mapping still wins
    auto grid = (from_hdf5 && !root["grid"]) ? read_hdf5_grid(**tensor_path, matrix->element_count())
                                             : load_grid(root, base);
    if (!grid)
    {
        auto error = grid.error();
        error.context.insert(error.context.begin(), manifest_path.string());
        return std::unexpected(std::move(error));
    }

    auto bundle = make_bundle(std::move(*matrix), std::move(*grid), std::move(names));
    if (!bundle)
    {
        return bundle;
    }
    common::log(common::LogLevel::Info, kLogChannel, "loaded {} electrodes x {} elements from {}",
                bundle->leadfield->electrode_count(), bundle->leadfield->element_count(), manifest_path.string());
    return bundle;
}

} // namespace tio::leadfield
