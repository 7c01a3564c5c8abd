/**
 * @file roi_presets.hpp
 * @brief named ROI targets (motor, dlpfc, ...) resolved to MNI centers uwu
 *
 * a presets file maps lowercase region names to a coordinate in the same
 * frame as the leadfield grid:
 *
 * @code{.yaml}
 * regions:
 *   motor:
 *     name: Motor Cortex   # optional display label
 *     mni: [47, -13, 52]
 *   hippocampus:
 *     mni: [-31, -20, -14]
 * @endcode
 *
 * lookups ignore case, so `roi.preset: Motor` finds `motor`.
 */
#pragma once

#include <array>
#include <expected>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "tio/config/config.hpp"

namespace YAML
{
class Node;
} // namespace YAML

namespace tio::config
{

struct RoiPreset
{
    std::string           key;   ///< lowercase lookup name
    std::string           label; ///< display name, defaults to key
    std::array<double, 3> mni{};
};

/// sorted by key so "available presets" listings are stable
using RoiPresetTable = std::map<std::string, RoiPreset, std::less<>>;

/**
 * @brief validates a parsed presets document
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] root YAML root holding a `regions` mapping
 * @return table or ConfigError (missing regions, bad coordinates, names that collide ignoring case)
 */
[[nodiscard]] auto parse_roi_presets(const YAML::Node &root) -> std::expected<RoiPresetTable, ConfigError>;

/**
 * @brief loads + validates a presets YAML file
 *
 * ⚠️ IMPURE FUNCTION (file I/O)
 */
[[nodiscard]] auto load_roi_presets(const std::filesystem::path &path) -> std::expected<RoiPresetTable, ConfigError>;

/**
 * @brief case-insensitive lookup, unknown names list what is available
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto find_roi_preset(const RoiPresetTable &table, std::string_view name)
    -> std::expected<RoiPreset, ConfigError>;

/**
 * @brief resolves `roi.preset` against `roi.presets_file` for a loaded config
 *
 * ⚠️ IMPURE FUNCTION (reads the presets file)
 *
 * @param[in] config config whose roi section names a preset
 * @return MNI center or ConfigError (no preset configured, unreadable file, unknown name)
 */
[[nodiscard]] auto resolve_roi_preset(const Config &config) -> std::expected<std::array<double, 3>, ConfigError>;

} // namespace tio::config
