/**
 * @file hdf5.cpp
 * @brief H5Cpp reader for SimNIBS leadfield tensors and their tetrahedral mesh
 *
 * every H5::Exception is caught in this TU and turned into a DataError that
 * names the file and the dataset, so nothing from libhdf5 escapes upward.
 */
#include "tio/leadfield/hdf5.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <H5Cpp.h>
#include <fmt/format.h>

#include "tio/common/log.hpp"

namespace tio::leadfield
{
namespace
{

constexpr std::string_view kLogChannel  = "[tio::leadfield]";
constexpr std::string_view kTensorPath  = "mesh_leadfield/leadfields/tdcs_leadfield";
constexpr std::string_view kNodesPath   = "mesh_leadfield/nodes/node_coord";
constexpr std::string_view kCellsPath   = "mesh_leadfield/elm/node_number_list";
constexpr std::string_view kTypesPath   = "mesh_leadfield/elm/elm_type";
constexpr std::string_view kTagsPath    = "mesh_leadfield/elm/tag1";
constexpr std::int32_t     kTetrahedron = 4;
constexpr std::int32_t     kDefaultTag  = 2;

[[nodiscard]] auto fail(std::string message, std::vector<std::string> ctx) -> std::unexpected<DataError>
{
    return std::unexpected(DataError{std::move(message), std::move(ctx)});
}

/// libhdf5 prints its own error stack to stderr by default
void silence_hdf5_error_stack()
{
    static const bool silenced = [] {
        H5::Exception::dontPrint();
        return true;
    }();
    static_cast<void>(silenced);
}

template <typename T>
struct Hdf5Array
{
    std::vector<std::size_t> shape;
    std::vector<T>           values;
};

[[nodiscard]] auto open_file(const std::filesystem::path &path) -> std::expected<H5::H5File, DataError>
{
    silence_hdf5_error_stack();
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
    {
        return fail(fmt::format("HDF5 leadfield not found: {}", path.string()), {path.string()});
    }
    try
    {
        return H5::H5File{path.string(), H5F_ACC_RDONLY};
    }
    catch (const H5::Exception &ex)
    {
        return fail(fmt::format("failed to open HDF5 file: {}", ex.getDetailMsg()), {path.string()});
    }
}

/// nameExists() on a path whose parent group is missing is an error, not false
[[nodiscard]] auto dataset_exists(const H5::H5File &file, std::string_view name) -> bool
{
    try
    {
        std::size_t start = 0U;
        for (;;)
        {
            const auto slash = name.find('/', start);
            if (!file.nameExists(std::string{name.substr(0U, slash)}))
            {
                return false;
            }
            if (slash == std::string_view::npos)
            {
                return true;
            }
            start = slash + 1U;
        }
    }
    catch (const H5::Exception &)
    {
        return false;
    }
}

template <typename T>
[[nodiscard]] auto read_dataset(H5::H5File &file, std::string_view name, const H5::PredType &memory_type,
                                const std::filesystem::path &path) -> std::expected<Hdf5Array<T>, DataError>
{
    std::string dataset_name{name};
    if (!dataset_exists(file, name))
    {
        return fail(fmt::format("HDF5 file has no dataset '{}'", name), {path.string(), std::move(dataset_name)});
    }
    try
    {
        const auto dataset = file.openDataSet(dataset_name);
        const auto type    = dataset.getTypeClass();
        if (type != H5T_FLOAT && type != H5T_INTEGER)
        {
            return fail(fmt::format("dataset '{}' is not numeric", name), {path.string(), std::move(dataset_name)});
        }

        const auto space = dataset.getSpace();
        const int  rank  = space.getSimpleExtentNdims();
        if (rank <= 0)
        {
            return fail(fmt::format("dataset '{}' is not an array", name), {path.string(), std::move(dataset_name)});
        }
        std::vector<hsize_t> dims(static_cast<std::size_t>(rank));
        space.getSimpleExtentDims(dims.data());

        Hdf5Array<T> out{};
        std::size_t  count = 1U;
        for (const auto dim : dims)
        {
            const auto extent = static_cast<std::size_t>(dim);
            if (extent != 0U && count > std::numeric_limits<std::size_t>::max() / sizeof(T) / extent)
            {
                return fail(fmt::format("dataset '{}' is too large to load", name),
                            {path.string(), std::move(dataset_name)});
            }
            count *= extent;
            out.shape.push_back(extent);
        }
        out.values.resize(count);
        if (count > 0U)
        {
            dataset.read(out.values.data(), memory_type);
        }
        return out;
    }
    catch (const H5::Exception &ex)
    {
        return fail(fmt::format("failed to read '{}': {}", name, ex.getDetailMsg()),
                    {path.string(), std::move(dataset_name)});
    }
}

template <typename T>
[[nodiscard]] auto read_optional_column(H5::H5File &file, std::string_view name, const H5::PredType &memory_type,
                                        const std::filesystem::path &path, std::size_t rows)
    -> std::expected<std::optional<std::vector<T>>, DataError>
{
    if (!dataset_exists(file, name))
    {
        return std::optional<std::vector<T>>{};
    }
    auto column = read_dataset<T>(file, name, memory_type, path);
    if (!column)
    {
        return std::unexpected(column.error());
    }
    if (column->values.size() != rows)
    {
        return fail(fmt::format("dataset '{}' has {} entries for {} cells", name, column->values.size(), rows),
                    {path.string(), std::string{name}});
    }
    return std::optional<std::vector<T>>{std::move(column->values)};
}

} // namespace

auto is_hdf5_path(const std::filesystem::path &path) -> bool
{
    auto extension = path.extension().string();
    std::ranges::transform(extension, extension.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension == ".h5" || extension == ".hdf5";
}

auto read_hdf5_tensor(const std::filesystem::path &path) -> std::expected<Hdf5Tensor, DataError>
{
    auto file = open_file(path);
    if (!file)
    {
        return std::unexpected(file.error());
    }
    auto tensor = read_dataset<float>(*file, kTensorPath, H5::PredType::NATIVE_FLOAT, path);
    if (!tensor)
    {
        return std::unexpected(tensor.error());
    }
    if (tensor->shape.size() != 3U || tensor->shape[2] != 3U)
    {
        return fail("tdcs_leadfield must have shape [n_electrodes, n_elements, 3]",
                    {path.string(), std::string{kTensorPath}});
    }
    common::log(common::LogLevel::Debug, kLogChannel, "hdf5 tensor [{}, {}, 3] from {}", tensor->shape[0],
                tensor->shape[1], path.string());
    return Hdf5Tensor{
        .electrode_count = tensor->shape[0],
        .element_count   = tensor->shape[1],
        .values          = std::move(tensor->values),
    };
}

auto read_hdf5_grid(const std::filesystem::path &path, std::size_t element_count)
    -> std::expected<mesh::ElementGrid, DataError>
{
    auto file = open_file(path);
    if (!file)
    {
        return std::unexpected(file.error());
    }

    auto nodes = read_dataset<double>(*file, kNodesPath, H5::PredType::NATIVE_DOUBLE, path);
    if (!nodes)
    {
        return std::unexpected(nodes.error());
    }
    if (nodes->shape.size() != 2U || nodes->shape[1] != 3U)
    {
        return fail("node_coord must have shape [n_nodes, 3]", {path.string(), std::string{kNodesPath}});
    }
    const auto node_count = nodes->shape[0];

    auto cells = read_dataset<std::int32_t>(*file, kCellsPath, H5::PredType::NATIVE_INT32, path);
    if (!cells)
    {
        return std::unexpected(cells.error());
    }
    if (cells->shape.size() != 2U || cells->shape[1] < 4U)
    {
        return fail("node_number_list must have shape [n_cells, 4]", {path.string(), std::string{kCellsPath}});
    }
    const auto cell_count = cells->shape[0];
    const auto columns    = cells->shape[1];

    auto types = read_optional_column<std::int32_t>(*file, kTypesPath, H5::PredType::NATIVE_INT32, path, cell_count);
    if (!types)
    {
        return std::unexpected(types.error());
    }
    auto tags = read_optional_column<std::int32_t>(*file, kTagsPath, H5::PredType::NATIVE_INT32, path, cell_count);
    if (!tags)
    {
        return std::unexpected(tags.error());
    }

    const auto vertex = [&](std::int32_t id) {
        const auto row = static_cast<std::size_t>(id - 1);
        return common::Vec3{nodes->values[(row * 3U) + 0U], nodes->values[(row * 3U) + 1U],
                            nodes->values[(row * 3U) + 2U]};
    };

    mesh::ElementGrid grid{};
    for (std::size_t cell = 0; cell < cell_count; ++cell)
    {
        if (*types && (**types)[cell] != kTetrahedron)
        {
            continue;
        }
        std::array<common::Vec3, 4> corners{};
        for (std::size_t k = 0; k < 4U; ++k)
        {
            const auto id = cells->values[(cell * columns) + k];
            if (id < 1 || static_cast<std::size_t>(id) > node_count)
            {
                return fail(fmt::format("node id {} outside 1..{}", id, node_count),
                            {path.string(), std::string{kCellsPath}, fmt::format("[{}]", cell)});
            }
            corners[k] = vertex(id);
        }

        common::Vec3 center{};
        for (const auto &corner : corners)
        {
            for (std::size_t axis = 0; axis < 3U; ++axis)
            {
                center[axis] += corner[axis] / 4.0;
            }
        }
        const auto volume = mesh::tetrahedron_volume(corners[0], corners[1], corners[2], corners[3]);
        if (!(volume > 0.0))
        {
            return fail("degenerate tetrahedron", {path.string(), std::string{kCellsPath}, fmt::format("[{}]", cell)});
        }
        grid.centers.push_back(center);
        grid.volumes.push_back(volume);
        grid.tags.push_back(*tags ? (**tags)[cell] : kDefaultTag);
    }

    if (grid.size() != element_count)
    {
        return fail(fmt::format("mesh has {} tetrahedra but leadfield has {} elements", grid.size(), element_count),
                    {path.string(), std::string{kCellsPath}});
    }
    common::log(common::LogLevel::Debug, kLogChannel, "hdf5 mesh: {} tetrahedra from {} cells, {} nodes",
                grid.size(), cell_count, node_count);
    return grid;
}

} // namespace tio::leadfield
