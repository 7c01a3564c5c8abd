/**
 * @file mesh.cpp
 * @brief gmsh 4.x ASCII parser that keeps only tagged volume cells
 *
 * the file is first cut into "$Section ... $EndSection" blocks, then the
 * blocks we care about ($MeshFormat, $PhysicalNames, $Entities, $Nodes,
 * $Elements) are decoded in dependency order. entity -> physical tag mapping
 * comes from $Entities so each volume cell ends up with its tissue tag.
 */
#include "tio/mesh/mesh.hpp"

#include <fstream>
#include <limits>
#include <optional>
#include <sstream>

#include <fmt/format.h>

namespace tio::mesh
{
namespace
{

using Sections = std::unordered_map<std::string, std::string>;

struct EntityTags
{
    // (dimension, entity tag) -> first physical tag
    std::unordered_map<std::uint64_t, std::int32_t> physical_by_entity;
};

constexpr auto entity_key(std::uint32_t dimension, std::uint32_t tag) noexcept -> std::uint64_t
{
    return (static_cast<std::uint64_t>(dimension) << 32U) | static_cast<std::uint64_t>(tag);
}

[[nodiscard]] auto trim(std::string_view value) -> std::string_view
{
    const auto start = value.find_first_not_of(" \t\r");
    if (start == std::string_view::npos)
    {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r");
    return value.substr(start, end - start + 1U);
}

[[nodiscard]] auto split_sections(std::string_view text) -> std::expected<Sections, MeshError>
{
    Sections           sections;
    std::istringstream input{std::string(text)};
    std::string        line;
    while (std::getline(input, line))
    {
        const auto header = trim(line);
        if (header.empty() || header.front() != '$' || header.starts_with("$End"))
        {
            continue;
        }
        const std::string name{header.substr(1)};
        const std::string terminator = "$End" + name;
        std::string       body;
        bool              closed = false;
        while (std::getline(input, line))
        {
            if (trim(line) == terminator)
            {
                closed = true;
                break;
            }
            body.append(line);
            body.push_back('\n');
        }
        if (!closed)
        {
            return std::unexpected(MeshError{fmt::format("section ${} is missing {}", name, terminator), {name}});
        }
        sections.insert_or_assign(name, std::move(body));
    }
    return sections;
}

[[nodiscard]] auto check_format(const Sections &sections) -> std::expected<void, MeshError>
{
    const auto it = sections.find("MeshFormat");
    if (it == sections.end())
    {
        // older exporters occasionally drop the header, assume 4.1 ASCII
        return {};
    }
    std::istringstream stream{it->second};
    double             version   = 0.0;
    int                file_type = -1;
    stream >> version >> file_type;
    if (!stream || version < 4.0 || version >= 5.0)
    {
        return std::unexpected(MeshError{fmt::format("unsupported Gmsh format version {}", version), {"MeshFormat"}});
    }
    if (file_type != 0)
    {
        return std::unexpected(MeshError{"binary Gmsh files are not supported", {"MeshFormat"}});
    }
    return {};
}

[[nodiscard]] auto parse_physical_names(const std::string &body) -> std::unordered_map<std::int32_t, std::string>
{
    std::unordered_map<std::int32_t, std::string> names;
    std::istringstream                            stream{body};
    std::size_t                                   count = 0U;
    stream >> count;
    std::string line;
    std::getline(stream, line);
    for (std::size_t i = 0; i < count && std::getline(stream, line); ++i)
    {
        std::istringstream entry{line};
        std::uint32_t      dimension = 0U;
        std::int32_t       tag       = 0;
        std::string        name;
        entry >> dimension >> tag;
        std::getline(entry >> std::ws, name);
        if (name.size() >= 2U && name.front() == '"' && name.back() == '"')
        {
            name = name.substr(1U, name.size() - 2U);
        }
        if (dimension == 3U)
        {
            names.insert_or_assign(tag, std::move(name));
        }
    }
    return names;
}

[[nodiscard]] auto parse_entities(const std::string &body) -> std::expected<EntityTags, MeshError>
{
    EntityTags         tags;
    std::istringstream stream{body};
    std::string        line;
    if (!std::getline(stream, line))
    {
        return std::unexpected(MeshError{"empty $Entities section", {"Entities"}});
    }
    std::array<std::size_t, 4> counts{};
    std::istringstream         header{line};
    header >> counts[0] >> counts[1] >> counts[2] >> counts[3];

    for (std::uint32_t dimension = 0U; dimension < 4U; ++dimension)
    {
        for (std::size_t i = 0; i < counts[dimension]; ++i)
        {
            if (!std::getline(stream, line))
            {
                return std::unexpected(MeshError{"unexpected EOF inside $Entities",
                                                 {"Entities", fmt::format("dim{}", dimension)}});
            }
            std::istringstream entry{line};
            std::uint32_t      tag = 0U;
            entry >> tag;
            // points store one xyz triple, everything else a bounding box
            const int coordinate_count = dimension == 0U ? 3 : 6;
            double    ignored          = 0.0;
            for (int c = 0; c < coordinate_count; ++c)
            {
                entry >> ignored;
            }
            std::size_t physical_count = 0U;
            entry >> physical_count;
            if (physical_count > 0U)
            {
                std::int32_t physical = 0;
                entry >> physical;
                tags.physical_by_entity.emplace(entity_key(dimension, tag), physical);
            }
        }
    }
    return tags;
}

[[nodiscard]] auto parse_nodes(const std::string &body, std::unordered_map<std::uint64_t, std::uint32_t> &index_of)
    -> std::expected<std::vector<common::Vec3>, MeshError>
{
    std::istringstream stream{body};
    std::size_t        blocks = 0U;
    std::size_t        total  = 0U;
    std::uint64_t      min_tag{};
    std::uint64_t      max_tag{};
    if (!(stream >> blocks >> total >> min_tag >> max_tag))
    {
        return std::unexpected(MeshError{"malformed $Nodes header", {"Nodes"}});
    }

    std::vector<common::Vec3> positions;
    positions.reserve(total);
    for (std::size_t block = 0; block < blocks; ++block)
    {
        std::uint32_t dimension{};
        std::uint32_t tag{};
        int           parametric{};
        std::size_t   count{};
        if (!(stream >> dimension >> tag >> parametric >> count))
        {
            return std::unexpected(MeshError{"malformed $Nodes block header", {"Nodes", fmt::format("block{}", block)}});
        }
        if (parametric != 0)
        {
            return std::unexpected(MeshError{"parametric nodes are not supported", {"Nodes", fmt::format("block{}", block)}});
        }
        std::vector<std::uint64_t> node_tags(count);
        for (auto &node_tag : node_tags)
        {
            stream >> node_tag;
        }
        for (const auto node_tag : node_tags)
        {
            common::Vec3 position{};
            if (!(stream >> position[0] >> position[1] >> position[2]))
            {
                return std::unexpected(MeshError{"unexpected EOF reading node coordinates", {"Nodes"}});
            }
            index_of.insert_or_assign(node_tag, static_cast<std::uint32_t>(positions.size()));
            positions.push_back(position);
        }
    }
    if (positions.size() != total)
    {
        return std::unexpected(MeshError{"node count mismatch", {"Nodes"}});
    }
    return positions;
}

[[nodiscard]] auto to_cell_type(std::uint32_t gmsh_type) -> std::optional<CellType>
{
    switch (gmsh_type)
    {
    case 4U:
        return CellType::Tetrahedron4;
    case 5U:
        return CellType::Hexahedron8;
    default:
        return std::nullopt;
    }
}

[[nodiscard]] auto parse_elements(const std::string &body, const EntityTags &entities,
                                  const std::unordered_map<std::uint64_t, std::uint32_t> &index_of)
    -> std::expected<std::vector<Cell>, MeshError>
{
    std::istringstream stream{body};
    std::size_t        blocks = 0U;
    std::size_t        total  = 0U;
    std::uint64_t      min_tag{};
    std::uint64_t      max_tag{};
    if (!(stream >> blocks >> total >> min_tag >> max_tag))
    {
        return std::unexpected(MeshError{"malformed $Elements header", {"Elements"}});
    }

    std::vector<Cell> cells;
    std::size_t       seen = 0U;
    for (std::size_t block = 0; block < blocks; ++block)
    {
        std::uint32_t dimension{};
        std::uint32_t entity{};
        std::uint32_t gmsh_type{};
        std::size_t   count{};
        if (!(stream >> dimension >> entity >> gmsh_type >> count))
        {
            return std::unexpected(MeshError{"malformed $Elements block header", {"Elements", fmt::format("block{}", block)}});
        }
        const auto node_count = gmsh_node_count(gmsh_type);
        if (node_count == 0U)
        {
            return std::unexpected(MeshError{fmt::format("unsupported Gmsh element type {}", gmsh_type),
                                             {"Elements", fmt::format("entityTag={}", entity)}});
        }
        const auto cell_type = dimension == 3U ? to_cell_type(gmsh_type) : std::nullopt;
        if (dimension == 3U && !cell_type)
        {
            return std::unexpected(MeshError{fmt::format("unsupported volume element type {}", gmsh_type),
                                             {"Elements", fmt::format("entityTag={}", entity)}});
        }
        const auto   physical_it = entities.physical_by_entity.find(entity_key(dimension, entity));
        const auto   tissue_tag  = physical_it != entities.physical_by_entity.end() ? physical_it->second
                                                                                    : static_cast<std::int32_t>(entity);

        for (std::size_t i = 0; i < count; ++i, ++seen)
        {
            std::uint64_t element_tag{};
            stream >> element_tag;
            Cell cell{};
            cell.physical_tag = tissue_tag;
            cell.nodes.fill(std::numeric_limits<std::uint32_t>::max());
            for (std::size_t n = 0; n < node_count; ++n)
            {
                std::uint64_t node_tag{};
                if (!(stream >> node_tag))
                {
                    return std::unexpected(MeshError{"unexpected EOF reading element data",
                                                     {"Elements", fmt::format("elementTag={}", element_tag)}});
                }
                if (!cell_type)
                {
                    continue;
                }
                const auto it = index_of.find(node_tag);
                if (it == index_of.end())
                {
                    return std::unexpected(MeshError{fmt::format("element references unknown node {}", node_tag),
                                                     {"Elements", fmt::format("elementTag={}", element_tag)}});
                }
                cell.nodes[n] = it->second;
            }
            if (cell_type)
            {
                cell.type = *cell_type;
                cells.push_back(cell);
            }
        }
    }
    if (seen != total)
    {
        return std::unexpected(MeshError{"element count mismatch", {"Elements"}});
    }
    return cells;
}

} // namespace

auto gmsh_node_count(std::uint32_t gmsh_type) noexcept -> std::size_t
{
    switch (gmsh_type)
    {
    case 15U:
        return 1U; // point
    case 1U:
        return 2U; // line
    case 2U:
        return 3U; // triangle
    case 3U:
        return 4U; // quadrangle
    case 4U:
        return 4U; // tetrahedron
    case 5U:
        return 8U; // hexahedron
    default:
        return 0U;
    }
}

auto load_gmsh_file(const std::filesystem::path &path) -> MeshResult
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        return std::unexpected(MeshError{fmt::format("failed to open mesh file: {}", path.string()), {path.string()}});
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    auto mesh = load_gmsh_from_string(buffer.str());
    if (!mesh)
    {
        auto error = mesh.error();
        error.context.insert(error.context.begin(), path.string());
        return std::unexpected(std::move(error));
    }
    return mesh;
}

auto load_gmsh_from_string(std::string_view ascii_contents) -> MeshResult
{
    auto sections = split_sections(ascii_contents);
    if (!sections)
    {
        return std::unexpected(sections.error());
    }
    if (auto format = check_format(*sections); !format)
    {
        return std::unexpected(format.error());
    }

    const auto nodes_it = sections->find("Nodes");
    if (nodes_it == sections->end())
    {
        return std::unexpected(MeshError{"missing $Nodes section", {}});
    }
    const auto elements_it = sections->find("Elements");
    if (elements_it == sections->end())
    {
        return std::unexpected(MeshError{"missing $Elements section", {}});
    }

    Mesh mesh{};
    if (const auto names_it = sections->find("PhysicalNames"); names_it != sections->end())
    {
        mesh.physical_names = parse_physical_names(names_it->second);
    }

    EntityTags entities{};
    if (const auto entities_it = sections->find("Entities"); entities_it != sections->end())
    {
        auto parsed = parse_entities(entities_it->second);
        if (!parsed)
        {
            return std::unexpected(parsed.error());
        }
        entities = std::move(*parsed);
    }

    std::unordered_map<std::uint64_t, std::uint32_t> index_of;
    auto                                             nodes = parse_nodes(nodes_it->second, index_of);
    if (!nodes)
    {
        return std::unexpected(nodes.error());
    }
    mesh.nodes = std::move(*nodes);

    auto cells = parse_elements(elements_it->second, entities, index_of);
    if (!cells)
    {
        return std::unexpected(cells.error());
    }
    mesh.cells = std::move(*cells);
    return mesh;
}

} // namespace tio::mesh
