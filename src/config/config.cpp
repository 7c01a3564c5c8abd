/**
 * @file config.cpp
 * @brief yaml-cpp backed loader for the run config with loud, breadcrumbed validation uwu
 *
 * each top-level section gets its own parse_* helper that fills the Config in
 * place and bails with a ConfigError on the first violation. scalar helpers
 * convert YAML exceptions into errors so nothing throws past this TU.
 */
#include "tio/config/config.hpp"

#include <algorithm>
#include <initializer_list>
#include <iterator>
#include <regex>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

namespace tio::config
{
namespace
{

using Status = std::expected<void, ConfigError>;

[[nodiscard]] auto fail(std::string message, std::initializer_list<std::string> ctx) -> std::unexpected<ConfigError>
{
    return std::unexpected(ConfigError{std::move(message), std::vector<std::string>(ctx)});
}

[[nodiscard]] auto fail(std::string message, std::vector<std::string> ctx) -> std::unexpected<ConfigError>
{
    return std::unexpected(ConfigError{std::move(message), std::move(ctx)});
}

[[nodiscard]] auto is_present(const YAML::Node &node) -> bool
{
    return node && !node.IsNull();
}

/// optional scalar lookup, YAML conversion failures become breadcrumbed errors
template <typename T>
[[nodiscard]] auto read_optional(const YAML::Node &section, std::string_view section_name, const std::string &key)
    -> std::expected<std::optional<T>, ConfigError>
{
    const auto node = section[key];
    if (!is_present(node))
    {
        return std::optional<T>{};
    }
    if (!node.IsScalar())
    {
        return fail(fmt::format("{}.{} must be a scalar", section_name, key), {std::string{section_name}, key});
    }
    try
    {
        return std::optional<T>{node.as<T>()};
    }
    catch (const YAML::Exception &ex)
    {
        return fail(ex.what(), {std::string{section_name}, key});
    }
}

[[nodiscard]] auto read_count(const YAML::Node &section, std::string_view section_name, const std::string &key,
                              std::size_t minimum, std::size_t &out) -> Status
{
    auto value = read_optional<long long>(section, section_name, key);
    if (!value)
    {
        return std::unexpected(value.error());
    }
    if (!value->has_value())
    {
        return {};
    }
    if (**value < static_cast<long long>(minimum))
    {
        return fail(fmt::format("{}.{} must be >= {}", section_name, key, minimum), {std::string{section_name}, key});
    }
    out = static_cast<std::size_t>(**value);
    return {};
}

[[nodiscard]] auto node_to_vec3(const YAML::Node &node, std::vector<std::string> ctx)
    -> std::expected<std::array<double, 3>, ConfigError>
{
    if (!node.IsSequence() || node.size() != 3U)
    {
        return fail("expected sequence[3] for coordinate", std::move(ctx));
    }
    std::array<double, 3> values{};
    for (std::size_t i = 0; i < 3U; ++i)
    {
        try
        {
            values[i] = node[i].as<double>();
        }
        catch (const YAML::Exception &ex)
        {
            ctx.emplace_back(fmt::format("[{}]", i));
            return fail(ex.what(), std::move(ctx));
        }
    }
    return values;
}

[[nodiscard]] auto node_to_name_list(const YAML::Node &node, std::vector<std::string> ctx)
    -> std::expected<std::vector<std::string>, ConfigError>
{
    if (!node.IsSequence())
    {
        return fail("expected sequence of electrode names", std::move(ctx));
    }
    std::vector<std::string> names;
    names.reserve(node.size());
    for (std::size_t i = 0; i < node.size(); ++i)
    {
        auto child_ctx = ctx;
        child_ctx.emplace_back(fmt::format("[{}]", i));
        try
        {
            names.emplace_back(node[i].as<std::string>());
        }
        catch (const YAML::Exception &ex)
        {
            return fail(ex.what(), std::move(child_ctx));
        }
        if (!is_valid_electrode_name(names.back()))
        {
            return fail(fmt::format("invalid electrode name '{}'", names.back()), std::move(child_ctx));
        }
    }
    return names;
}

[[nodiscard]] auto parse_leadfield(const YAML::Node &root, Config &cfg) -> Status
{
    const auto section = root["leadfield"];
    if (!section || !section.IsMap())
    {
        return fail("missing 'leadfield' section", {"leadfield"});
    }
    auto manifest = read_optional<std::string>(section, "leadfield", "manifest");
    if (!manifest)
    {
        return std::unexpected(manifest.error());
    }
    if (!manifest->has_value() || manifest->value().empty())
    {
        return fail("leadfield.manifest must be a non-empty path", {"leadfield", "manifest"});
    }
    cfg.leadfield_manifest = std::filesystem::path{manifest->value()};
    return {};
}

[[nodiscard]] auto parse_roi(const YAML::Node &root, Config &cfg) -> Status
{
    const auto section = root["roi"];
    if (!section || !section.IsMap())
    {
        return fail("missing 'roi' section", {"roi"});
    }
    auto &roi = cfg.roi;

    auto name = read_optional<std::string>(section, "roi", "name");
    if (!name)
    {
        return std::unexpected(name.error());
    }
    roi.name = name->value_or("roi");

    if (const auto center = section["center"]; is_present(center))
    {
        auto parsed = node_to_vec3(center, {"roi", "center"});
        if (!parsed)
        {
            return std::unexpected(parsed.error());
        }
        roi.center = *parsed;
    }

    auto csv = read_optional<std::string>(section, "roi", "csv");
    if (!csv)
    {
        return std::unexpected(csv.error());
    }
    if (csv->has_value())
    {
        roi.csv = std::filesystem::path{csv->value()};
    }

    auto preset = read_optional<std::string>(section, "roi", "preset");
    if (!preset)
    {
        return std::unexpected(preset.error());
    }
    if (preset->has_value())
    {
        if (preset->value().empty())
        {
            return fail("roi.preset must be a non-empty name", {"roi", "preset"});
        }
        roi.preset = preset->value();
    }

    auto presets_file = read_optional<std::string>(section, "roi", "presets_file");
    if (!presets_file)
    {
        return std::unexpected(presets_file.error());
    }
    if (presets_file->has_value())
    {
        roi.presets_file = std::filesystem::path{presets_file->value()};
    }
    if (roi.preset && !roi.presets_file)
    {
        return fail("roi.preset needs roi.presets_file", {"roi", "presets_file"});
    }

    auto label = read_optional<std::int32_t>(section, "roi", "atlas_label");
    if (!label)
    {
        return std::unexpected(label.error());
    }
    roi.atlas_label = *label;

    const int flavors = static_cast<int>(roi.center.has_value()) + static_cast<int>(roi.csv.has_value()) +
                        static_cast<int>(roi.preset.has_value()) + static_cast<int>(roi.atlas_label.has_value());
    if (flavors != 1)
    {
        return fail("roi needs exactly one of center, csv, preset or atlas_label", {"roi"});
    }

    auto radius = read_optional<double>(section, "roi", "radius");
    if (!radius)
    {
        return std::unexpected(radius.error());
    }
    if (!roi.atlas_label)
    {
        if (!radius->has_value() || radius->value() <= 0.0)
        {
            return fail("roi.radius must be > 0 for spherical regions", {"roi", "radius"});
        }
        roi.radius = radius->value();
    }
    return {};
}

[[nodiscard]] auto parse_grey_matter(const YAML::Node &root, Config &cfg) -> Status
{
    const auto section = root["grey_matter"];
    if (!is_present(section))
    {
        return {};
    }
    const auto tags = section["tags"];
    if (!tags || !tags.IsSequence() || tags.size() == 0U)
    {
        return fail("grey_matter.tags must be a non-empty sequence", {"grey_matter", "tags"});
    }
    cfg.grey_matter_tags.clear();
    for (std::size_t i = 0; i < tags.size(); ++i)
    {
        try
        {
            cfg.grey_matter_tags.push_back(tags[i].as<std::int32_t>());
        }
        catch (const YAML::Exception &ex)
        {
            return fail(ex.what(), {"grey_matter", "tags", fmt::format("[{}]", i)});
        }
    }
    return {};
}

[[nodiscard]] auto parse_strategy(const YAML::Node &root, Config &cfg) -> Status
{
    auto strategy = read_optional<std::string>(root, "root", "strategy");
    if (!strategy)
    {
        return std::unexpected(strategy.error());
    }
    const auto text = strategy->value_or("exhaustive");
    if (text == "exhaustive")
    {
        cfg.strategy = Strategy::Exhaustive;
    }
    else if (text == "evolutionary")
    {
        cfg.strategy = Strategy::Evolutionary;
    }
    else
    {
        return fail(fmt::format("unknown strategy '{}' (expected exhaustive | evolutionary)", text), {"strategy"});
    }
    return {};
}

[[nodiscard]] auto parse_search(const YAML::Node &root, Config &cfg) -> Status
{
    auto &search = cfg.search;
    search.workers = std::max<std::size_t>(1U, std::thread::hardware_concurrency());

    const auto section = root["search"];
    if (!is_present(section))
    {
        return {};
    }
    if (!section.IsMap())
    {
        return fail("search must be a mapping", {"search"});
    }

    auto mode = read_optional<std::string>(section, "search", "mode");
    if (!mode)
    {
        return std::unexpected(mode.error());
    }
    const auto mode_text = mode->value_or("bucketed");
    if (mode_text == "bucketed")
    {
        search.mode = SearchMode::Bucketed;
    }
    else if (mode_text == "all_combinations")
    {
        search.mode = SearchMode::AllCombinations;
    }
    else
    {
        return fail(fmt::format("unknown search mode '{}'", mode_text), {"search", "mode"});
    }

    auto total = read_optional<double>(section, "search", "total_current_mA");
    auto step  = read_optional<double>(section, "search", "current_step_mA");
    auto limit = read_optional<double>(section, "search", "channel_limit_mA");
    for (const auto *value : {&total, &step, &limit})
    {
        if (!*value)
        {
            return std::unexpected(value->error());
        }
    }
    search.total_current_mA = total->value_or(search.total_current_mA);
    search.current_step_mA  = step->value_or(search.current_step_mA);
    search.channel_limit_mA = *limit;

    if (search.total_current_mA <= 0.0)
    {
        return fail("search.total_current_mA must be > 0", {"search", "total_current_mA"});
    }
    if (search.current_step_mA <= 0.0 || search.current_step_mA > search.total_current_mA)
    {
        return fail("search.current_step_mA must be in (0, total_current_mA]", {"search", "current_step_mA"});
    }
    if (search.channel_limit_mA &&
        (*search.channel_limit_mA <= 0.0 || *search.channel_limit_mA > search.total_current_mA))
    {
        return fail("search.channel_limit_mA must be in (0, total_current_mA]", {"search", "channel_limit_mA"});
    }

    if (auto status = read_count(section, "search", "workers", 1U, search.workers); !status)
    {
        return status;
    }
    if (auto status = read_count(section, "search", "chunk_size", 1U, search.chunk_size); !status)
    {
        return status;
    }
    if (auto status = read_count(section, "search", "progress_interval", 1U, search.progress_interval); !status)
    {
        return status;
    }
    std::size_t cap = 0U;
    if (section["max_candidates"])
    {
        if (auto status = read_count(section, "search", "max_candidates", 1U, cap); !status)
        {
            return status;
        }
        search.max_candidates = cap;
    }
    return {};
}

[[nodiscard]] auto parse_optimizer(const YAML::Node &root, Config &cfg) -> Status
{
    const auto section = root["optimizer"];
    if (!is_present(section))
    {
        return {};
    }
    if (!section.IsMap())
    {
        return fail("optimizer must be a mapping", {"optimizer"});
    }
    auto &opt = cfg.optimizer;

    auto objective = read_optional<std::string>(section, "optimizer", "objective");
    if (!objective)
    {
        return std::unexpected(objective.error());
    }
    const auto objective_text = objective->value_or("multi");
    if (objective_text == "multi")
    {
        opt.objective = Objective::Multi;
    }
    else if (objective_text == "single")
    {
        opt.objective = Objective::Single;
    }
    else
    {
        return fail(fmt::format("unknown objective '{}' (expected single | multi)", objective_text),
                    {"optimizer", "objective"});
    }

    if (auto status = read_count(section, "optimizer", "generations", 1U, opt.generations); !status)
    {
        return status;
    }
    if (auto status = read_count(section, "optimizer", "population", 4U, opt.population); !status)
    {
        return status;
    }
    if (auto status = read_count(section, "optimizer", "tournament_size", 2U, opt.tournament_size); !status)
    {
        return status;
    }

    auto seed = read_optional<std::uint64_t>(section, "optimizer", "seed");
    if (!seed)
    {
        return std::unexpected(seed.error());
    }
    opt.seed = seed->value_or(opt.seed);

    if (const auto bounds = section["ratio_bounds"]; is_present(bounds))
    {
        if (!bounds.IsSequence() || bounds.size() != 2U)
        {
            return fail("optimizer.ratio_bounds must be [low, high]", {"optimizer", "ratio_bounds"});
        }
        try
        {
            opt.ratio_bounds = {bounds[0].as<double>(), bounds[1].as<double>()};
        }
        catch (const YAML::Exception &ex)
        {
            return fail(ex.what(), {"optimizer", "ratio_bounds"});
        }
        if (!(opt.ratio_bounds[0] > 0.0 && opt.ratio_bounds[0] <= opt.ratio_bounds[1] && opt.ratio_bounds[1] < 1.0))
        {
            return fail("optimizer.ratio_bounds must satisfy 0 < low <= high < 1", {"optimizer", "ratio_bounds"});
        }
    }

    struct RateField
    {
        const char *key;
        double     *target;
        double      low;
        double      high;
    };
    const std::array<RateField, 4> rates{{
        {"total_current_mA", &opt.total_current_mA, 1.0e-12, 1.0e12},
        {"crossover_rate", &opt.crossover_rate, 0.0, 1.0},
        {"mutation_rate", &opt.mutation_rate, 0.0, 1.0},
        {"ratio_sigma", &opt.ratio_sigma, 0.0, 1.0},
    }};
    for (const auto &field : rates)
    {
        auto value = read_optional<double>(section, "optimizer", field.key);
        if (!value)
        {
            return std::unexpected(value.error());
        }
        if (!value->has_value())
        {
            continue;
        }
        if (**value < field.low || **value > field.high)
        {
            return fail(fmt::format("optimizer.{} out of range", field.key), {"optimizer", field.key});
        }
        *field.target = **value;
    }
    return {};
}

[[nodiscard]] auto parse_electrodes(const YAML::Node &root, Config &cfg) -> Status
{
    const auto section = root["electrodes"];
    if (!section || !section.IsMap())
    {
        return fail("missing 'electrodes' section", {"electrodes"});
    }
    auto &electrodes = cfg.electrodes;

    const std::array<std::pair<const char *, std::vector<std::string> *>, 5> lists{{
        {"e1_plus", &electrodes.e1_plus},
        {"e1_minus", &electrodes.e1_minus},
        {"e2_plus", &electrodes.e2_plus},
        {"e2_minus", &electrodes.e2_minus},
        {"pool", &electrodes.pool},
    }};
    for (const auto &[key, target] : lists)
    {
        const auto node = section[key];
        if (!is_present(node))
        {
            continue;
        }
        auto names = node_to_name_list(node, {"electrodes", key});
        if (!names)
        {
            return std::unexpected(names.error());
        }
        *target = std::move(*names);
    }

    if (cfg.strategy == Strategy::Evolutionary)
    {
        if (!electrodes.pool.empty() && electrodes.pool.size() < 4U)
        {
            return fail("electrodes.pool needs at least 4 electrodes for the optimizer", {"electrodes", "pool"});
        }
        return {};
    }

    if (cfg.search.mode == SearchMode::AllCombinations)
    {
        if (electrodes.pool.size() < 4U)
        {
            return fail("electrodes.pool needs at least 4 electrodes for all_combinations",
                        {"electrodes", "pool"});
        }
        return {};
    }

    for (const auto &[key, target] : lists)
    {
        if (std::string_view{key} != "pool" && target->empty())
        {
            return fail(fmt::format("electrodes.{} must be a non-empty list for bucketed search", key),
                        {"electrodes", key});
        }
    }
    return {};
}

[[nodiscard]] auto parse_execution(const YAML::Node &root, Config &cfg) -> Status
{
    const auto section = root["execution"];
    if (!is_present(section))
    {
        return {};
    }
    auto use_gpu    = read_optional<bool>(section, "execution", "use_gpu");
    auto shader_dir = read_optional<std::string>(section, "execution", "shader_dir");
    auto device     = read_optional<std::string>(section, "execution", "device_substring");
    if (!use_gpu)
    {
        return std::unexpected(use_gpu.error());
    }
    if (!shader_dir)
    {
        return std::unexpected(shader_dir.error());
    }
    if (!device)
    {
        return std::unexpected(device.error());
    }
    cfg.execution.use_gpu = use_gpu->value_or(false);
    if (shader_dir->has_value())
    {
        cfg.execution.shader_dir = std::filesystem::path{shader_dir->value()};
    }
    cfg.execution.device_substring = device->value_or("");
    return {};
}

[[nodiscard]] auto parse_output(const YAML::Node &root, Config &cfg) -> Status
{
    const auto section = root["output"];
    if (!section || !section.IsMap())
    {
        return fail("missing 'output' section", {"output"});
    }
    auto directory = read_optional<std::string>(section, "output", "directory");
    if (!directory)
    {
        return std::unexpected(directory.error());
    }
    if (!directory->has_value() || directory->value().empty())
    {
        return fail("output.directory must be a non-empty path", {"output", "directory"});
    }
    cfg.output.directory = std::filesystem::path{directory->value()};

    auto write_csv  = read_optional<bool>(section, "output", "write_csv");
    auto write_yaml = read_optional<bool>(section, "output", "write_yaml");
    if (!write_csv)
    {
        return std::unexpected(write_csv.error());
    }
    if (!write_yaml)
    {
        return std::unexpected(write_yaml.error());
    }
    cfg.output.write_csv  = write_csv->value_or(true);
    cfg.output.write_yaml = write_yaml->value_or(true);
    return {};
}

[[nodiscard]] auto parse_logging(const YAML::Node &root, Config &cfg) -> Status
{
    const auto section = root["logging"];
    if (!is_present(section))
    {
        return {};
    }
    auto level = read_optional<std::string>(section, "logging", "level");
    if (!level)
    {
        return std::unexpected(level.error());
    }
    if (level->has_value())
    {
        const auto parsed = common::parse_log_level(level->value());
        if (!parsed)
        {
            return fail(fmt::format("unknown log level '{}'", level->value()), {"logging", "level"});
        }
        cfg.logging.level = *parsed;
    }
    auto file = read_optional<std::string>(section, "logging", "file");
    if (!file)
    {
        return std::unexpected(file.error());
    }
    if (file->has_value())
    {
        cfg.logging.file = std::filesystem::path{file->value()};
    }
    return {};
}

} // namespace

auto Config::resolve_path(const std::filesystem::path &path) const -> std::filesystem::path
{
    if (path.is_absolute() || base_directory.empty())
    {
        return path;
    }
    return base_directory / path;
}

auto is_valid_electrode_name(std::string_view name) -> bool
{
    static const std::regex pattern{"^[A-Za-z][A-Za-z0-9]*$"};
    return std::regex_match(name.begin(), name.end(), pattern);
}

auto find_invalid_electrode_name(std::span<const std::string> names) -> std::optional<std::size_t>
{
    const auto it = std::ranges::find_if(names, [](const std::string &name) { return !is_valid_electrode_name(name); });
    if (it == names.end())
    {
        return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(names.begin(), it));
}

auto load_config_from_file(const std::filesystem::path &path) -> ConfigResult
{
    try
    {
        const auto node   = YAML::LoadFile(path.string());
        auto       result = parse_config_node(node);
        if (result)
        {
            result->base_directory = path.parent_path();
        }
        return result;
    }
    catch (const YAML::BadFile &ex)
    {
        return fail(fmt::format("unable to open config file: {}", ex.what()), {path.string()});
    }
    catch (const YAML::Exception &ex)
    {
        return fail(fmt::format("YAML parse error: {}", ex.what()), {path.string()});
    }
}

auto load_config_from_string(std::string_view yaml_text) -> ConfigResult
{
    try
    {
        const auto node = YAML::Load(std::string{yaml_text});
        return parse_config_node(node);
    }
    catch (const YAML::Exception &ex)
    {
        return fail(fmt::format("YAML parse error: {}", ex.what()), std::vector<std::string>{});
    }
}

auto parse_config_node(const YAML::Node &root) -> ConfigResult
{
    if (!root || !root.IsMap())
    {
        return fail("config root must be a mapping", std::vector<std::string>{});
    }

    Config cfg{};
    // strategy + search first: electrode validation depends on both
    for (const auto parser : {&parse_leadfield, &parse_roi, &parse_grey_matter, &parse_strategy, &parse_search,
                              &parse_optimizer, &parse_electrodes, &parse_execution, &parse_output, &parse_logging})
    {
        if (auto status = parser(root, cfg); !status)
        {
            return std::unexpected(status.error());
        }
    }
    return cfg;
}

} // namespace tio::config
