/**
 * @file config_validation_test.cpp
 * @brief run config loader validation because parsing bugs are cringe uwu
 */
#include <filesystem>
#include <functional>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <string>
#include <utility>
#include <vector>

#include "support/config_builder.hpp"
#include "test_config.hpp"
#include "tio/config/config.hpp"
#include "tio/config/roi_presets.hpp"
#include "tio/roi/roi.hpp"

using testing::ElementsAre;
using testing::ElementsAreArray;
using testing::HasSubstr;

namespace
{

[[nodiscard]] auto test_data_path(std::string_view file) -> std::filesystem::path
{
    return std::filesystem::path{TIO_TEST_DATA_DIR} / file;
}

[[nodiscard]] auto make_good_config() -> tio::config::Config
{
    const auto result = tio::test_support::load_config();
    if (!result)
    {
        throw std::runtime_error("expected default builder to succeed: " + result.error().message);
    }
    return result.value();
}

void replace_once(std::string &text, std::string_view from, std::string_view to)
{
    const auto pos = text.find(from);
    ASSERT_NE(pos, std::string::npos) << "fixture text lacks '" << from << "'";
    text.replace(pos, from.size(), to);
}

} // namespace

TEST(ConfigValidation, ParsesGoldenConfigFromBuilder)
{
    const auto config = make_good_config();
    EXPECT_EQ(config.leadfield_manifest.generic_string(), "data/leadfield.yaml");
    EXPECT_TRUE(config.base_directory.empty());
    EXPECT_EQ(config.roi.name, "hippocampus");
    ASSERT_TRUE(config.roi.center.has_value());
    EXPECT_THAT(*config.roi.center, ElementsAre(10.0, -20.0, 5.0));
    EXPECT_DOUBLE_EQ(config.roi.radius, 3.0);
    EXPECT_FALSE(config.roi.atlas_label.has_value());
    EXPECT_THAT(config.grey_matter_tags, ElementsAre(2));
    EXPECT_THAT(config.electrodes.e1_plus, ElementsAre("E001"));
    EXPECT_THAT(config.electrodes.e2_minus, ElementsAre("E004"));
    EXPECT_EQ(config.strategy, tio::config::Strategy::Exhaustive);
    EXPECT_EQ(config.search.mode, tio::config::SearchMode::Bucketed);
    EXPECT_DOUBLE_EQ(config.search.total_current_mA, 2.0);
    EXPECT_DOUBLE_EQ(config.search.current_step_mA, 0.5);
    EXPECT_FALSE(config.search.channel_limit_mA.has_value());
    EXPECT_EQ(config.search.workers, 2U);
    EXPECT_EQ(config.search.chunk_size, 4U);
    EXPECT_EQ(config.search.progress_interval, 10U);
    EXPECT_EQ(config.optimizer.objective, tio::config::Objective::Multi);
    EXPECT_EQ(config.optimizer.population, 8U);
    EXPECT_EQ(config.optimizer.seed, 42U);
    EXPECT_FALSE(config.execution.use_gpu);
    EXPECT_EQ(config.output.directory.generic_string(), "results");
    EXPECT_TRUE(config.output.write_csv);
    EXPECT_EQ(config.logging.level, tio::common::LogLevel::Info);
}

TEST(ConfigValidation, LoadsConfigFromFixtureOnDisk)
{
    const auto yaml_path = test_data_path("run_config.yaml");
    const auto result    = tio::config::load_config_from_file(yaml_path);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->base_directory, yaml_path.parent_path());
    EXPECT_EQ(result->strategy, tio::config::Strategy::Evolutionary);
    EXPECT_EQ(result->optimizer.objective, tio::config::Objective::Single);
    EXPECT_EQ(result->optimizer.generations, 12U);
    EXPECT_EQ(result->optimizer.tournament_size, 4U);
    EXPECT_THAT(result->optimizer.ratio_bounds, ElementsAre(0.2, 0.8));
    EXPECT_DOUBLE_EQ(result->optimizer.total_current_mA, 4.0);
    EXPECT_THAT(result->grey_matter_tags, ElementsAre(2, 3));
    EXPECT_EQ(result->electrodes.pool.size(), 6U);
    EXPECT_FALSE(result->output.write_yaml);
    EXPECT_EQ(result->logging.level, tio::common::LogLevel::Debug);
    EXPECT_EQ(result->resolve_path(result->leadfield_manifest),
              yaml_path.parent_path() / "leadfield" / "manifest.yaml");
}

TEST(ConfigValidation, RoiCsvResolvesAgainstConfigDirectory)
{
    const auto result = tio::config::load_config_from_file(test_data_path("run_config.yaml"));
    ASSERT_TRUE(result.has_value()) << result.error().message;

    const auto spec = tio::roi::roi_spec_from_config(*result);
    ASSERT_TRUE(spec.has_value()) << spec.error().message;
    ASSERT_TRUE(spec->center.has_value());
    EXPECT_THAT(*spec->center, ElementsAre(1.5, -2.0, 3.25));
    EXPECT_DOUBLE_EQ(spec->radius, 4.5);
}

TEST(ConfigValidation, AbsolutePathsAreNotRebased)
{
    auto config           = make_good_config();
    config.base_directory = "/data/subject01";
    EXPECT_EQ(config.resolve_path("/abs/leadfield.yaml"), std::filesystem::path{"/abs/leadfield.yaml"});
    EXPECT_EQ(config.resolve_path("rel.yaml"), std::filesystem::path{"/data/subject01/rel.yaml"});
}

TEST(ConfigValidation, AllCombinationsAcceptsPoolWithoutRoleLists)
{
    tio::test_support::ConfigBuilderOptions options;
    options.search_mode = "all_combinations";
    options.e1_plus.clear();
    options.e1_minus.clear();
    options.e2_plus.clear();
    options.e2_minus.clear();
    options.pool = {"E001", "E002", "E003", "E004", "E005"};

    const auto parsed = tio::test_support::load_config(options);
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ(parsed->search.mode, tio::config::SearchMode::AllCombinations);
    EXPECT_EQ(parsed->electrodes.pool.size(), 5U);
}

TEST(ConfigValidation, AtlasRoiNeedsNoRadius)
{
    tio::test_support::ConfigBuilderOptions options;
    options.roi_center.reset();
    options.roi_radius.reset();
    options.roi_atlas_label = 17;

    const auto parsed = tio::test_support::load_config(options);
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    ASSERT_TRUE(parsed->roi.atlas_label.has_value());
    EXPECT_EQ(*parsed->roi.atlas_label, 17);
}

TEST(ConfigValidation, PresetRoiResolvesToItsCenter)
{
    tio::test_support::ConfigBuilderOptions options;
    options.roi_center.reset();
    options.roi_preset       = "Motor";
    options.roi_presets_file = test_data_path("roi_presets.yaml").string();

    const auto parsed = tio::test_support::load_config(options);
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    ASSERT_TRUE(parsed->roi.preset.has_value());
    EXPECT_EQ(*parsed->roi.preset, "Motor");

    const auto spec = tio::roi::roi_spec_from_config(*parsed);
    ASSERT_TRUE(spec.has_value()) << spec.error().message;
    ASSERT_TRUE(spec->center.has_value());
    EXPECT_THAT(*spec->center, ElementsAre(47.0, -13.0, 52.0));
    EXPECT_DOUBLE_EQ(spec->radius, 3.0);
}

TEST(ConfigValidation, UnknownPresetListsTheAvailableOnes)
{
    tio::test_support::ConfigBuilderOptions options;
    options.roi_center.reset();
    options.roi_preset       = "amygdala";
    options.roi_presets_file = test_data_path("roi_presets.yaml").string();

    const auto parsed = tio::test_support::load_config(options);
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;

    const auto resolved = tio::config::resolve_roi_preset(*parsed);
    ASSERT_FALSE(resolved.has_value());
    EXPECT_THAT(resolved.error().message,
                HasSubstr("unknown ROI preset 'amygdala', available presets: dlpfc, hippocampus, motor"));
    EXPECT_THAT(resolved.error().context, ElementsAre("roi", "preset"));

    const auto spec = tio::roi::roi_spec_from_config(*parsed);
    ASSERT_FALSE(spec.has_value());
    EXPECT_THAT(spec.error().message, HasSubstr("unknown ROI preset 'amygdala'"));
    EXPECT_THAT(spec.error().context, ElementsAre("roi", "preset"));

    options.roi_preset       = "motor";
    options.roi_presets_file = test_data_path("missing_presets.yaml").string();
    const auto no_file       = tio::test_support::load_config(options);
    ASSERT_TRUE(no_file.has_value()) << no_file.error().message;
    const auto unreadable = tio::config::resolve_roi_preset(*no_file);
    ASSERT_FALSE(unreadable.has_value());
    EXPECT_THAT(unreadable.error().message, HasSubstr("unable to open presets file"));
}

TEST(RoiPresets, LookupIgnoresCase)
{
    const auto table = tio::config::load_roi_presets(test_data_path("roi_presets.yaml"));
    ASSERT_TRUE(table.has_value()) << table.error().message;
    EXPECT_EQ(table->size(), 3U);

    const auto motor = tio::config::find_roi_preset(*table, "MOTOR");
    ASSERT_TRUE(motor.has_value()) << motor.error().message;
    EXPECT_EQ(motor->key, "motor");
    EXPECT_EQ(motor->label, "Motor Cortex");
    EXPECT_THAT(motor->mni, ElementsAre(47.0, -13.0, 52.0));

    // keys are stored lowercase, the label keeps the file's spelling
    const auto hippocampus = tio::config::find_roi_preset(*table, "hippocampus");
    ASSERT_TRUE(hippocampus.has_value()) << hippocampus.error().message;
    EXPECT_EQ(hippocampus->label, "Hippocampus");
    EXPECT_THAT(hippocampus->mni, ElementsAre(-31.0, -20.0, -14.0));
}

TEST(RoiPresets, RejectsMalformedDocuments)
{
    const auto no_regions = tio::config::parse_roi_presets(YAML::Load("motor: {mni: [1, 2, 3]}"));
    ASSERT_FALSE(no_regions.has_value());
    EXPECT_THAT(no_regions.error().message, HasSubstr("'regions' mapping"));

    const auto short_mni = tio::config::parse_roi_presets(YAML::Load("regions: {motor: {mni: [1, 2]}}"));
    ASSERT_FALSE(short_mni.has_value());
    EXPECT_THAT(short_mni.error().message, HasSubstr("needs mni: [x, y, z]"));
    EXPECT_THAT(short_mni.error().context, ElementsAre("regions", "motor", "mni"));

    const auto bad_axis = tio::config::parse_roi_presets(YAML::Load("regions: {motor: {mni: [1, up, 3]}}"));
    ASSERT_FALSE(bad_axis.has_value());
    EXPECT_THAT(bad_axis.error().context, ElementsAre("regions", "motor", "mni", "[1]"));

    const auto collision =
        tio::config::parse_roi_presets(YAML::Load("regions: {Motor: {mni: [1, 2, 3]}, motor: {mni: [4, 5, 6]}}"));
    ASSERT_FALSE(collision.has_value());
    EXPECT_THAT(collision.error().message, HasSubstr("collides with another region ignoring case"));
}

TEST(ConfigValidation, ElectrodeNamePattern)
{
    EXPECT_TRUE(tio::config::is_valid_electrode_name("E001"));
    EXPECT_TRUE(tio::config::is_valid_electrode_name("Fp1"));
    EXPECT_FALSE(tio::config::is_valid_electrode_name(""));
    EXPECT_FALSE(tio::config::is_valid_electrode_name("1E"));
    EXPECT_FALSE(tio::config::is_valid_electrode_name("E-1"));
    EXPECT_FALSE(tio::config::is_valid_electrode_name("E 1"));

    const std::vector<std::string> names{"C3", "C4", "bad_name", "O1"};
    const auto                     invalid = tio::config::find_invalid_electrode_name(names);
    ASSERT_TRUE(invalid.has_value());
    EXPECT_EQ(*invalid, 2U);
}

TEST(ConfigValidation, ReportsMissingFile)
{
    const auto result = tio::config::load_config_from_file(test_data_path("definitely_missing.yaml"));
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().message, HasSubstr("unable to open config file"));
}

struct InvalidConfigCase
{
    std::string                             name;
    tio::test_support::ConfigBuilderOptions options;
    std::string                             expected_message_substring;
    std::vector<std::string>                expected_context;
    std::function<void(std::string &)>      mutate_yaml; ///< optional for bespoke tweaks
};

class ConfigInvalidTest : public ::testing::TestWithParam<InvalidConfigCase>
{};

TEST_P(ConfigInvalidTest, ReportsDetailedValidationErrors)
{
    auto yaml = tio::test_support::make_config_yaml(GetParam().options);
    if (GetParam().mutate_yaml)
    {
        GetParam().mutate_yaml(yaml);
    }
    const auto result = tio::config::load_config_from_string(yaml);
    ASSERT_FALSE(result.has_value()) << "expected failure for case: " << GetParam().name;
    EXPECT_THAT(result.error().message, HasSubstr(GetParam().expected_message_substring));
    if (!GetParam().expected_context.empty())
    {
        EXPECT_THAT(result.error().context, ElementsAreArray(GetParam().expected_context));
    }
}

auto make_invalid_cases() -> std::vector<InvalidConfigCase>
{
    using tio::test_support::ConfigBuilderOptions;

    std::vector<InvalidConfigCase> cases;

    {
        ConfigBuilderOptions opts{};
        opts.include_leadfield = false;
        cases.push_back({"MissingLeadfieldSection", opts, "missing 'leadfield' section", {"leadfield"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.include_roi = false;
        cases.push_back({"MissingRoiSection", opts, "missing 'roi' section", {"roi"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.roi_atlas_label = 3;
        cases.push_back({"RoiWithTwoFlavors", opts, "exactly one of center, csv, preset or atlas_label", {"roi"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.roi_preset       = "motor";
        opts.roi_presets_file = "presets.yaml";
        cases.push_back({"RoiCenterAndPreset", opts, "exactly one of center, csv, preset or atlas_label", {"roi"},
                         nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.roi_center.reset();
        opts.roi_preset = "motor";
        cases.push_back({"PresetWithoutPresetsFile", opts, "roi.preset needs roi.presets_file",
                         {"roi", "presets_file"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.roi_center.reset();
        opts.roi_preset       = "motor";
        opts.roi_presets_file = "presets.yaml";
        opts.roi_radius.reset();
        cases.push_back({"PresetWithoutRadius", opts, "roi.radius must be > 0", {"roi", "radius"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.roi_radius = 0.0;
        cases.push_back({"ZeroRoiRadius", opts, "roi.radius must be > 0", {"roi", "radius"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.roi_radius.reset();
        cases.push_back({"MissingRoiRadius", opts, "roi.radius must be > 0", {"roi", "radius"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        cases.push_back({"RoiCenterWithTwoCoordinates",
                         opts,
                         "expected sequence[3]",
                         {"roi", "center"},
                         [](std::string &yaml) { replace_once(yaml, "center: [10, -20, 5]", "center: [10, -20]"); }});
    }

    {
        ConfigBuilderOptions opts{};
        opts.strategy = "simulated_annealing";
        cases.push_back({"UnknownStrategy", opts, "unknown strategy 'simulated_annealing'", {"strategy"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.search_mode = "random";
        cases.push_back({"UnknownSearchMode", opts, "unknown search mode 'random'", {"search", "mode"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.current_step_mA = 0.0;
        cases.push_back({"ZeroCurrentStep",
                         opts,
                         "search.current_step_mA must be in (0, total_current_mA]",
                         {"search", "current_step_mA"},
                         nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.current_step_mA = 2.5;
        cases.push_back({"StepLargerThanTotal",
                         opts,
                         "search.current_step_mA must be in (0, total_current_mA]",
                         {"search", "current_step_mA"},
                         nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.channel_limit_mA = 3.0;
        cases.push_back({"ChannelLimitAboveTotal",
                         opts,
                         "search.channel_limit_mA must be in (0, total_current_mA]",
                         {"search", "channel_limit_mA"},
                         nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.workers = 0U;
        cases.push_back({"ZeroWorkers", opts, "search.workers must be >= 1", {"search", "workers"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.e1_minus.clear();
        cases.push_back({"BucketedMissingRoleList",
                         opts,
                         "electrodes.e1_minus must be a non-empty list for bucketed search",
                         {"electrodes", "e1_minus"},
                         nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.search_mode = "all_combinations";
        opts.pool        = {"E001", "E002", "E003"};
        cases.push_back({"AllCombinationsPoolTooSmall",
                         opts,
                         "electrodes.pool needs at least 4 electrodes for all_combinations",
                         {"electrodes", "pool"},
                         nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.strategy = "evolutionary";
        opts.pool     = {"E001", "E002"};
        cases.push_back({"OptimizerPoolTooSmall",
                         opts,
                         "electrodes.pool needs at least 4 electrodes for the optimizer",
                         {"electrodes", "pool"},
                         nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.e2_plus = {"E003", "3bad"};
        cases.push_back({"InvalidElectrodeName",
                         opts,
                         "invalid electrode name '3bad'",
                         {"electrodes", "e2_plus", "[1]"},
                         nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.objective = "pareto";
        cases.push_back(
            {"UnknownObjective", opts, "unknown objective 'pareto'", {"optimizer", "objective"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.population = 3U;
        cases.push_back(
            {"PopulationTooSmall", opts, "optimizer.population must be >= 4", {"optimizer", "population"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.ratio_bounds = {0.9, 0.1};
        cases.push_back({"InvertedRatioBounds",
                         opts,
                         "optimizer.ratio_bounds must satisfy 0 < low <= high < 1",
                         {"optimizer", "ratio_bounds"},
                         nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        cases.push_back({"MutationRateAboveOne",
                         opts,
                         "optimizer.mutation_rate out of range",
                         {"optimizer", "mutation_rate"},
                         [](std::string &yaml) {
                             replace_once(yaml, "  seed: 42\n", "  seed: 42\n  mutation_rate: 1.5\n");
                         }});
    }

    {
        ConfigBuilderOptions opts{};
        opts.include_output = false;
        cases.push_back({"MissingOutputSection", opts, "missing 'output' section", {"output"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.log_level = "chatty";
        cases.push_back({"UnknownLogLevel", opts, "unknown log level 'chatty'", {"logging", "level"}, nullptr});
    }

    {
        ConfigBuilderOptions opts{};
        opts.grey_matter_tags.clear();
        cases.push_back({"EmptyGreyMatterTags",
                         opts,
                         "grey_matter.tags must be a non-empty sequence",
                         {"grey_matter", "tags"},
                         nullptr});
    }

    return cases;
}

INSTANTIATE_TEST_SUITE_P(RunConfigInvalidCases, ConfigInvalidTest, ::testing::ValuesIn(make_invalid_cases()),
                         [](const ::testing::TestParamInfo<InvalidConfigCase> &test_info) {
                             return test_info.param.name;
                         });
