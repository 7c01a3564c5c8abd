/**
 * @file hdf5.hpp
 * @brief SimNIBS leadfield files (.hdf5) read straight through the HDF5 C++ API uwu
 *
 * SimNIBS writes its leadfields as one HDF5 file with the tensor and the
 * tetrahedral mesh it was computed on:
 *
 * @code
 * mesh_leadfield/leadfields/tdcs_leadfield  [n_electrodes, n_elements, 3]  float
 * mesh_leadfield/nodes/node_coord           [n_nodes, 3]                   mm
 * mesh_leadfield/elm/node_number_list       [n_cells, 4]                   1-based node ids
 * mesh_leadfield/elm/elm_type               [n_cells]   optional, 4 = tetrahedron
 * mesh_leadfield/elm/tag1                   [n_cells]   optional tissue tag
 * @endcode
 *
 * a manifest whose `leadfield` entry ends in .h5 / .hdf5 goes through here.
 * the grid comes from the file's own mesh unless the manifest also has a
 * `grid` mapping.
 */
#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <vector>

#include "tio/leadfield/leadfield.hpp"
#include "tio/mesh/grid.hpp"

namespace tio::leadfield
{

/**
 * @brief raw tensor as stored, shape already checked to be [e, n, 3]
 */
struct Hdf5Tensor
{
    std::size_t        electrode_count{0U};
    std::size_t        element_count{0U};
    std::vector<float> values;
};

/**
 * @brief true for .h5 / .hdf5 (any case)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto is_hdf5_path(const std::filesystem::path &path) -> bool;

/**
 * @brief reads mesh_leadfield/leadfields/tdcs_leadfield
 *
 * ⚠️ IMPURE FUNCTION (file I/O)
 *
 * @param[in] path SimNIBS leadfield file
 * @return tensor or DataError (unreadable file, missing dataset, wrong rank)
 */
[[nodiscard]] auto read_hdf5_tensor(const std::filesystem::path &path) -> std::expected<Hdf5Tensor, DataError>;

/**
 * @brief element grid from the file's tetrahedra: centroid, volume, tag1
 *
 * ⚠️ IMPURE FUNCTION (file I/O)
 *
 * non-tetrahedral cells are dropped when elm_type is present. the remaining
 * cell count must equal the leadfield's element count, so a leadfield
 * computed on another mesh is caught here instead of mis-indexed later.
 *
 * @param[in] path SimNIBS leadfield file
 * @param[in] element_count elements per leadfield row
 * @return grid or DataError
 */
[[nodiscard]] auto read_hdf5_grid(const std::filesystem::path &path, std::size_t element_count)
    -> std::expected<mesh::ElementGrid, DataError>;

} // namespace tio::leadfield
