/**
 * @file config.hpp
 * @brief YAML run configuration for montage searches that absolutely slaps uwu
 *
 * this header defines the typed run model for TIOpt. a single YAML document
 * names the leadfield manifest, the target ROI, the electrode pools, which
 * search strategy to run (exhaustive ex-search or the MOVEA evolutionary
 * optimizer) plus its knobs, and where results + logs go. the loader is built
 * on yaml-cpp, validates everything up front, and reports failures through
 * std::expected with breadcrumbs like `electrodes.e1_plus[2]` so a typo never
 * costs a twelve hour run.
 *
 * the resulting Config is immutable and gets passed into each engine's
 * constructor. there is no global config state anywhere.
 *
 * @note yaml-cpp 0.7+ powers parsing
 *
 * example (basic usage):
 * @code
 * using tio::config::load_config_from_file;
 * auto config_result = load_config_from_file("runs/hippocampus.yaml");
 * if (!config_result) {
 *     fmt::print(stderr, "config error: {}\n", config_result.error().message);
 *     return EXIT_FAILURE;
 * }
 * const auto& config = *config_result;
 * // config.search.total_current_mA is validated > 0 already uwu
 * @endcode
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "tio/common/log.hpp"

namespace YAML
{
class Node;
} // namespace YAML

namespace tio::config
{

/**
 * @brief which engine a run drives
 */
enum class Strategy : std::uint8_t
{
    Exhaustive,
    Evolutionary
};

/**
 * @brief exhaustive enumeration layout
 *
 * Bucketed crosses four role pools, AllCombinations draws ordered quadruples of
 * distinct electrodes out of one pool.
 */
enum class SearchMode : std::uint8_t
{
    Bucketed,
    AllCombinations
};

/**
 * @brief MOVEA objective flavor (single scalar cost vs intensity/focality pair)
 */
enum class Objective : std::uint8_t
{
    Single,
    Multi
};

/**
 * @brief config failure payload with dotted breadcrumbs
 */
struct ConfigError
{
    std::string              message; ///< what went wrong
    std::vector<std::string> context; ///< path into the YAML tree ("search", "current_step_mA")
};

/**
 * @brief target region description (sphere from inline center, CSV or named preset, or atlas label)
 */
struct RoiSettings
{
    std::string                          name{"roi"};
    std::optional<std::array<double, 3>> center;       ///< mm, same frame as the grid
    std::optional<std::filesystem::path> csv;          ///< first numeric row gives the center
    std::optional<std::string>           preset;       ///< region name looked up in presets_file
    std::optional<std::filesystem::path> presets_file; ///< see roi_presets.hpp, required with preset
    std::optional<std::int32_t>          atlas_label;  ///< label id in the grid's atlas channel
    double                               radius{0.0};  ///< mm, required for sphere flavors
};

/**
 * @brief role pools for bucketed search and the shared pool for everything else
 */
struct ElectrodeSettings
{
    std::vector<std::string> e1_plus;
    std::vector<std::string> e1_minus;
    std::vector<std::string> e2_plus;
    std::vector<std::string> e2_minus;
    std::vector<std::string> pool; ///< all_combinations pool, MOVEA candidate set (empty = every electrode)
};

/**
 * @brief exhaustive search knobs
 */
struct SearchSettings
{
    SearchMode                 mode{SearchMode::Bucketed};
    double                     total_current_mA{2.0};
    double                     current_step_mA{0.1};
    std::optional<double>      channel_limit_mA; ///< per-channel cap, defaults to total / 2
    std::size_t                workers{1U};
    std::size_t                chunk_size{64U};
    std::size_t                progress_interval{100U};
    std::optional<std::size_t> max_candidates;
};

/**
 * @brief MOVEA knobs
 */
struct OptimizerSettings
{
    Objective             objective{Objective::Multi};
    std::size_t           generations{50U};
    std::size_t           population{30U};
    std::uint64_t         seed{42U};
    std::array<double, 2> ratio_bounds{0.1, 0.9};
    double                total_current_mA{2.0};
    double                crossover_rate{0.8};
    double                mutation_rate{0.2};
    double                ratio_sigma{0.1};
    std::size_t           tournament_size{3U};
};

/**
 * @brief compute backend selection
 */
struct ExecutionSettings
{
    bool                                 use_gpu{false};
    std::optional<std::filesystem::path> shader_dir;
    std::string                          device_substring;
};

struct OutputSettings
{
    std::filesystem::path directory;
    bool                  write_csv{true};
    bool                  write_yaml{true};
};

struct LoggingSettings
{
    common::LogLevel                     level{common::LogLevel::Info};
    std::optional<std::filesystem::path> file;
};

/**
 * @brief fully validated run description
 */
struct Config
{
    std::filesystem::path     base_directory;     ///< directory of the YAML file ("" for in-memory docs)
    std::filesystem::path     leadfield_manifest; ///< as written, resolve via resolve_path
    RoiSettings               roi;
    std::vector<std::int32_t> grey_matter_tags{2};
    ElectrodeSettings         electrodes;
    Strategy                  strategy{Strategy::Exhaustive};
    SearchSettings            search;
    OptimizerSettings         optimizer;
    ExecutionSettings         execution;
    OutputSettings            output;
    LoggingSettings           logging;

    /**
     * @brief anchors a relative path at base_directory
     *
     * ✨ PURE FUNCTION ✨
     */
    [[nodiscard]] auto resolve_path(const std::filesystem::path &path) const -> std::filesystem::path;
};

using ConfigResult = std::expected<Config, ConfigError>;

/**
 * @brief loads + validates a YAML file, recording its directory as base_directory
 *
 * ⚠️ IMPURE FUNCTION (file I/O)
 *
 * @param[in] path YAML file path
 * @return Config or ConfigError (unreadable file, YAML syntax, schema violations)
 */
[[nodiscard]] auto load_config_from_file(const std::filesystem::path &path) -> ConfigResult;

/**
 * @brief same as load_config_from_file for in-memory YAML (tests, tooling)
 */
[[nodiscard]] auto load_config_from_string(std::string_view yaml_text) -> ConfigResult;

/**
 * @brief validates an already parsed YAML tree
 */
[[nodiscard]] auto parse_config_node(const YAML::Node &root) -> ConfigResult;

/**
 * @brief electrode names must start with a letter followed by letters/digits
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] name candidate electrode label ("E001", "Fp1")
 * @return true when the label matches `^[A-Za-z][A-Za-z0-9]*$`
 */
[[nodiscard]] auto is_valid_electrode_name(std::string_view name) -> bool;

/**
 * @brief returns the index of the first invalid name in a list, if any
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto find_invalid_electrode_name(std::span<const std::string> names) -> std::optional<std::size_t>;

} // namespace tio::config
