/**
 * @file grid.cpp
 * @brief mesh cells to element grid: centroids, tet volumes, tag checks
 */
#include "tio/mesh/grid.hpp"

#include <array>
#include <cmath>

#include <fmt/format.h>

namespace tio::mesh
{
namespace
{

constexpr double kVolumeEpsilon = 1.0e-15;

// six tets sharing the 0-6 diagonal, gmsh hexahedron node order
constexpr std::array<std::array<std::size_t, 4>, 6> kHexSplit{{
    {0U, 1U, 2U, 6U},
    {0U, 2U, 3U, 6U},
    {0U, 3U, 7U, 6U},
    {0U, 7U, 4U, 6U},
    {0U, 4U, 5U, 6U},
    {0U, 5U, 1U, 6U},
}};

} // namespace

auto tetrahedron_volume(const common::Vec3 &a, const common::Vec3 &b, const common::Vec3 &c,
                        const common::Vec3 &d) noexcept -> double
{
    const auto e0 = common::subtract(b, a);
    const auto e1 = common::subtract(c, a);
    const auto e2 = common::subtract(d, a);
    return std::abs(common::dot(e0, common::cross(e1, e2))) / 6.0;
}

auto validate_grid(const ElementGrid &grid) -> std::expected<void, GridError>
{
    const auto count = grid.centers.size();
    if (grid.volumes.size() != count)
    {
        return std::unexpected(GridError{
            fmt::format("grid volumes length {} does not match {} centers", grid.volumes.size(), count), {"volumes"}});
    }
    if (grid.tags.size() != count)
    {
        return std::unexpected(
            GridError{fmt::format("grid tags length {} does not match {} centers", grid.tags.size(), count), {"tags"}});
    }
    if (grid.atlas_labels && grid.atlas_labels->size() != count)
    {
        return std::unexpected(GridError{
            fmt::format("grid atlas length {} does not match {} centers", grid.atlas_labels->size(), count), {"atlas"}});
    }
    for (std::size_t i = 0; i < count; ++i)
    {
        if (!std::isfinite(grid.volumes[i]) || grid.volumes[i] < 0.0)
        {
            return std::unexpected(GridError{"element volume must be finite and >= 0", {"volumes", fmt::format("[{}]", i)}});
        }
    }
    return {};
}

auto build_grid_from_mesh(const Mesh &mesh) -> std::expected<ElementGrid, GridError>
{
    ElementGrid grid{};
    grid.centers.reserve(mesh.cells.size());
    grid.volumes.reserve(mesh.cells.size());
    grid.tags.reserve(mesh.cells.size());

    for (std::size_t index = 0; index < mesh.cells.size(); ++index)
    {
        const auto &cell       = mesh.cells[index];
        const auto  node_count = static_cast<std::size_t>(cell.type);
        const auto  at         = [&](std::size_t local) -> const common::Vec3 & { return mesh.nodes[cell.nodes[local]]; };

        common::Vec3 center{0.0, 0.0, 0.0};
        for (std::size_t local = 0; local < node_count; ++local)
        {
            center = common::add(center, at(local));
        }
        center = common::scale(center, 1.0 / static_cast<double>(node_count));

        double volume = 0.0;
        if (cell.type == CellType::Tetrahedron4)
        {
            volume = tetrahedron_volume(at(0U), at(1U), at(2U), at(3U));
        }
        else
        {
            for (const auto &tet : kHexSplit)
            {
                volume += tetrahedron_volume(at(tet[0]), at(tet[1]), at(tet[2]), at(tet[3]));
            }
        }
        if (volume <= kVolumeEpsilon)
        {
            return std::unexpected(GridError{"degenerate cell volume", {"cells", fmt::format("[{}]", index)}});
        }

        grid.centers.push_back(center);
        grid.volumes.push_back(volume);
        grid.tags.push_back(cell.physical_tag);
    }
    return grid;
}

} // namespace tio::mesh
