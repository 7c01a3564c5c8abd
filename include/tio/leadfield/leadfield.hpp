/**
 * @file leadfield.hpp
 * @brief immutable leadfield tensor, electrode name index and the manifest loader uwu
 *
 * the leadfield is the whole trick behind fast montage search: row e holds the
 * field (mV/mm) every element sees when electrode e injects unit current
 * against the reference. any stimulation pattern is then a linear combination
 * of rows, no FEM solve needed per candidate.
 *
 * on disk a leadfield is a small YAML manifest (parsed with yaml-cpp) pointing
 * at .npy arrays:
 *
 * @code{.yaml}
 * leadfield: leadfield.npy        # [n_electrodes, n_elements, 3], mV/mm
 * electrodes: [E001, E002, E003]  # one name per leadfield row
 * grid:
 *   centers: centers.npy          # [n_elements, 3] mm
 *   volumes: volumes.npy          # optional [n_elements], default 1.0
 *   tags: tags.npy                # optional [n_elements], default 2 (grey matter)
 *   atlas: atlas.npy              # optional [n_elements]
 *   # or instead: mesh: head.msh  # gmsh volume cells define the grid
 * @endcode
 *
 * `leadfield` may also point at a SimNIBS .hdf5 file (see hdf5.hpp). its own
 * tetrahedral mesh then supplies the grid and the `grid` mapping is optional.
 *
 * the loaded bundle hands out shared_ptr<const ...> so worker threads share
 * one copy of the tensor without any locking.
 */
#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tio/common/math.hpp"
#include "tio/mesh/grid.hpp"

namespace tio::leadfield
{

/**
 * @brief missing / corrupt input data (fatal for a run)
 */
struct DataError
{
    std::string              message;
    std::vector<std::string> context;
};

/**
 * @brief dense float tensor [electrodes][elements][3] in mV/mm
 */
class LeadfieldMatrix
{
public:
    /**
     * @brief validates the shape against the flat buffer
     *
     * ✨ PURE FUNCTION ✨
     *
     * @param[in] electrode_count leadfield rows
     * @param[in] element_count elements per row
     * @param[in] values flat C-order buffer of size electrodes * elements * 3
     * @return matrix or DataError on shape mismatch / non-finite values
     */
    [[nodiscard]] static auto create(std::size_t electrode_count, std::size_t element_count, std::vector<float> values)
        -> std::expected<LeadfieldMatrix, DataError>;

    [[nodiscard]] auto electrode_count() const noexcept -> std::size_t { return electrode_count_; }
    [[nodiscard]] auto element_count() const noexcept -> std::size_t { return element_count_; }

    /**
     * @brief field vector of one electrode at one element (unchecked)
     */
    [[nodiscard]] auto at(std::size_t electrode, std::size_t element) const noexcept -> common::Vec3
    {
        const auto *base = values_.data() + (((electrode * element_count_) + element) * 3U);
        return common::Vec3{base[0], base[1], base[2]};
    }

    /**
     * @brief contiguous row of one electrode, element_count * 3 floats
     */
    [[nodiscard]] auto row(std::size_t electrode) const noexcept -> std::span<const float>
    {
        return std::span<const float>{values_}.subspan(electrode * element_count_ * 3U, element_count_ * 3U);
    }

    [[nodiscard]] auto data() const noexcept -> std::span<const float> { return values_; }

private:
    LeadfieldMatrix(std::size_t electrode_count, std::size_t element_count, std::vector<float> values) noexcept;

    std::size_t        electrode_count_{0U};
    std::size_t        element_count_{0U};
    std::vector<float> values_;
};

/**
 * @brief electrode name <-> leadfield row lookup, immutable after construction
 */
class ElectrodeIndex
{
public:
    ElectrodeIndex() = default;

    /**
     * @brief builds the lookup, duplicate or empty names are a DataError
     */
    [[nodiscard]] static auto create(std::vector<std::string> names) -> std::expected<ElectrodeIndex, DataError>;

    [[nodiscard]] auto find(std::string_view name) const -> std::optional<std::size_t>;
    [[nodiscard]] auto name(std::size_t index) const -> const std::string & { return names_.at(index); }
    [[nodiscard]] auto names() const noexcept -> std::span<const std::string> { return names_; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return names_.size(); }

private:
    std::vector<std::string>                     names_;
    std::unordered_map<std::string, std::size_t> rows_;
};

/**
 * @brief everything an engine needs, shared read-only
 */
struct LeadfieldBundle
{
    std::shared_ptr<const LeadfieldMatrix>   leadfield;
    std::shared_ptr<const mesh::ElementGrid> grid;
    ElectrodeIndex                           electrodes;
};

/**
 * @brief assembles a bundle from in-memory parts and cross-checks every size
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto make_bundle(LeadfieldMatrix matrix, mesh::ElementGrid grid, std::vector<std::string> electrode_names)
    -> std::expected<LeadfieldBundle, DataError>;

/**
 * @brief reads the YAML manifest and every array it references
 *
 * ⚠️ IMPURE FUNCTION (file I/O, logs a one-line summary)
 *
 * @param[in] manifest_path manifest file, relative entries resolve against its directory
 * @return bundle or DataError naming the offending file
 */
[[nodiscard]] auto load_leadfield_bundle(const std::filesystem::path &manifest_path)
    -> std::expected<LeadfieldBundle, DataError>;

} // namespace tio::leadfield
