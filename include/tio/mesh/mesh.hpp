/**
 * @file mesh.hpp
 * @brief gmsh 4.1 ASCII head-mesh ingestion for leadfield grids uwu
 *
 * leadfields are solved on tetrahedral head meshes where every volume cell
 * carries a tissue tag (physical group id: 1 = white matter, 2 = grey matter,
 * ...). this header exposes just enough of the Gmsh 4.1 ASCII format to turn
 * such a mesh into node positions + tagged volume cells. surface and line
 * elements are skipped on purpose since the optimizer only evaluates fields
 * inside volume elements.
 *
 * @note expects Gmsh 4.x ASCII files (binary meshes are rejected with a clear error)
 *
 * example (basic usage):
 * @code
 * using namespace tio::mesh;
 * auto mesh_result = load_gmsh_file("subject/head.msh");
 * if (!mesh_result) {
 *     fmt::print(stderr, "mesh error: {}\n", mesh_result.error().message);
 *     return;
 * }
 * // mesh_result->cells[i].physical_tag is the tissue tag uwu
 * @endcode
 */
#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tio/common/math.hpp"

namespace tio::mesh
{

/**
 * @brief mesh loader error payload with section breadcrumbs
 */
struct MeshError
{
    std::string              message; ///< what broke
    std::vector<std::string> context; ///< e.g. {"Elements", "elementTag=12"}
};

/**
 * @brief volume topologies we know how to measure
 */
enum class CellType : std::uint8_t
{
    Tetrahedron4 = 4U,
    Hexahedron8  = 8U
};

/**
 * @brief one tagged volume cell referencing indices into Mesh::nodes
 */
struct Cell
{
    CellType                     type{CellType::Tetrahedron4};
    std::array<std::uint32_t, 8> nodes{};         ///< only the first 4 are meaningful for tets
    std::int32_t                 physical_tag{0}; ///< tissue tag (falls back to the entity tag)
};

/**
 * @brief minimal mesh: positions, volume cells and physical group names
 */
struct Mesh
{
    std::vector<common::Vec3>                     nodes;
    std::vector<Cell>                             cells;
    std::unordered_map<std::int32_t, std::string> physical_names; ///< 3D group id -> name
};

using MeshResult = std::expected<Mesh, MeshError>;

/**
 * @brief reads a Gmsh 4.x ASCII mesh from disk
 *
 * ⚠️ IMPURE FUNCTION (file I/O)
 *
 * @param[in] path .msh file path
 * @return Mesh or MeshError with context breadcrumbs
 */
[[nodiscard]] auto load_gmsh_file(const std::filesystem::path &path) -> MeshResult;

/**
 * @brief parses already buffered .msh text (tests/tooling)
 *
 * ✨ PURE FUNCTION ✨ (no I/O, output depends only on the text)
 */
[[nodiscard]] auto load_gmsh_from_string(std::string_view ascii_contents) -> MeshResult;

/**
 * @brief number of node tags a Gmsh element type carries
 *
 * covers points (15), lines (1), triangles (2), quads (3), tets (4) and hexes (5).
 *
 * @return node count or 0 for unsupported types
 */
[[nodiscard]] auto gmsh_node_count(std::uint32_t gmsh_type) noexcept -> std::size_t;

} // namespace tio::mesh
