/**
 * @file roi_presets.cpp
 * @brief yaml-cpp loader + case-insensitive lookup for named ROI targets
 */
#include "tio/config/roi_presets.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <yaml-cpp/yaml.h>

namespace tio::config
{
namespace
{

[[nodiscard]] auto fail(std::string message, std::vector<std::string> ctx) -> std::unexpected<ConfigError>
{
    return std::unexpected(ConfigError{std::move(message), std::move(ctx)});
}

[[nodiscard]] auto to_lower(std::string_view text) -> std::string
{
    std::string lowered{text};
    std::ranges::transform(lowered, lowered.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

[[nodiscard]] auto parse_region(const std::string &name, const YAML::Node &node)
    -> std::expected<RoiPreset, ConfigError>
{
    std::vector<std::string> ctx{"regions", name};
    if (!node.IsMap())
    {
        return fail(fmt::format("preset '{}' must be a mapping", name), std::move(ctx));
    }

    RoiPreset preset{};
    preset.key   = to_lower(name);
    preset.label = name;
    if (const auto label = node["name"]; label && !label.IsNull())
    {
        if (!label.IsScalar())
        {
            ctx.emplace_back("name");
            return fail(fmt::format("preset '{}' name must be a string", name), std::move(ctx));
        }
        preset.label = label.as<std::string>();
    }

    const auto mni = node["mni"];
    ctx.emplace_back("mni");
    if (!mni || !mni.IsSequence() || mni.size() != 3U)
    {
        return fail(fmt::format("preset '{}' needs mni: [x, y, z]", name), std::move(ctx));
    }
    for (std::size_t axis = 0; axis < 3U; ++axis)
    {
        try
        {
            preset.mni[axis] = mni[axis].as<double>();
        }
        catch (const YAML::Exception &ex)
        {
            ctx.emplace_back(fmt::format("[{}]", axis));
            return fail(ex.what(), std::move(ctx));
        }
        if (!std::isfinite(preset.mni[axis]))
        {
            ctx.emplace_back(fmt::format("[{}]", axis));
            return fail(fmt::format("preset '{}' coordinate must be finite", name), std::move(ctx));
        }
    }
    return preset;
}

} // namespace

auto parse_roi_presets(const YAML::Node &root) -> std::expected<RoiPresetTable, ConfigError>
{
    if (!root || !root.IsMap())
    {
        return fail("presets file needs a 'regions' mapping", {"regions"});
    }
    const auto regions = root["regions"];
    if (!regions || !regions.IsMap())
    {
        return fail("presets file needs a 'regions' mapping", {"regions"});
    }

    RoiPresetTable table;
    for (const auto &entry : regions)
    {
        std::string name;
        try
        {
            name = entry.first.as<std::string>();
        }
        catch (const YAML::Exception &ex)
        {
            return fail(ex.what(), {"regions"});
        }
        auto preset = parse_region(name, entry.second);
        if (!preset)
        {
            return std::unexpected(preset.error());
        }
        auto key = preset->key;
        if (!table.emplace(std::move(key), std::move(*preset)).second)
        {
            return fail(fmt::format("preset '{}' collides with another region ignoring case", name),
                        {"regions", name});
        }
    }
    if (table.empty())
    {
        return fail("presets file defines no regions", {"regions"});
    }
    return table;
}

auto load_roi_presets(const std::filesystem::path &path) -> std::expected<RoiPresetTable, ConfigError>
{
    YAML::Node root;
    try
    {
        root = YAML::LoadFile(path.string());
    }
    catch (const YAML::BadFile &ex)
    {
        return fail(fmt::format("unable to open presets file: {}", ex.what()), {path.string()});
    }
    catch (const YAML::Exception &ex)
    {
        return fail(fmt::format("YAML parse error: {}", ex.what()), {path.string()});
    }

    auto table = parse_roi_presets(root);
    if (!table)
    {
        auto error = table.error();
        error.context.insert(error.context.begin(), path.string());
        return std::unexpected(std::move(error));
    }
    return table;
}

auto find_roi_preset(const RoiPresetTable &table, std::string_view name) -> std::expected<RoiPreset, ConfigError>
{
    const auto it = table.find(to_lower(name));
    if (it == table.end())
    {
        std::vector<std::string_view> available;
        available.reserve(table.size());
        for (const auto &[key, preset] : table)
        {
            available.push_back(key);
        }
        return fail(fmt::format("unknown ROI preset '{}', available presets: {}", name, fmt::join(available, ", ")),
                    {"roi", "preset"});
    }
    return it->second;
}

auto resolve_roi_preset(const Config &config) -> std::expected<std::array<double, 3>, ConfigError>
{
    if (!config.roi.preset)
    {
        return fail("roi does not name a preset", {"roi", "preset"});
    }
    if (!config.roi.presets_file)
    {
        return fail("roi.preset needs roi.presets_file", {"roi", "presets_file"});
    }
    const auto table = load_roi_presets(config.resolve_path(*config.roi.presets_file));
    if (!table)
    {
        return std::unexpected(table.error());
    }
    const auto preset = find_roi_preset(*table, *config.roi.preset);
    if (!preset)
    {
        return std::unexpected(preset.error());
    }
    return preset->mni;
}

} // namespace tio::config
