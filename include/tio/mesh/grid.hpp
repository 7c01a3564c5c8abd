/**
 * @file grid.hpp
 * @brief per-element evaluation grid (centers, volumes, tissue tags, atlas labels)
 *
 * the leadfield rows are indexed by "element", which is either a mesh volume
 * cell or a voxel. ElementGrid is the structure-of-arrays view of those
 * elements that ROI selection and volume-weighted metrics need. it is built
 * once by the leadfield loader and only ever read afterwards.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

#include "tio/common/math.hpp"
#include "tio/mesh/mesh.hpp"

namespace tio::mesh
{

struct GridError
{
    std::string              message;
    std::vector<std::string> context;
};

/**
 * @brief SoA element grid, all arrays share one length
 */
struct ElementGrid
{
    std::vector<common::Vec3>                centers;      ///< element centroids in mm
    std::vector<double>                      volumes;      ///< mm³, voxel grids use 1.0
    std::vector<std::int32_t>                tags;         ///< tissue tag per element
    std::optional<std::vector<std::int32_t>> atlas_labels; ///< optional parcellation labels

    [[nodiscard]] auto size() const noexcept -> std::size_t { return centers.size(); }
};

/**
 * @brief checks array lengths agree and volumes are finite and non-negative
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto validate_grid(const ElementGrid &grid) -> std::expected<void, GridError>;

/**
 * @brief turns mesh volume cells into grid elements (centroid, volume, physical tag)
 *
 * ✨ PURE FUNCTION ✨
 *
 * tet volumes use |e0 · (e1 × e2)| / 6, hexes are split into six tets around
 * the 0-6 diagonal. degenerate cells are rejected because a zero weight would
 * silently vanish from every volume-weighted mean.
 *
 * @param[in] mesh parsed Gmsh mesh
 * @return grid with one element per volume cell, in file order
 */
[[nodiscard]] auto build_grid_from_mesh(const Mesh &mesh) -> std::expected<ElementGrid, GridError>;

/**
 * @brief unsigned tetrahedron volume
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto tetrahedron_volume(const common::Vec3 &a, const common::Vec3 &b, const common::Vec3 &c,
                                      const common::Vec3 &d) noexcept -> double;

} // namespace tio::mesh
