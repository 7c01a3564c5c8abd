/**
 * @file tio_search.cpp
 * @brief command-line driver: config in, montage rankings out uwu
 *
 * usage: tio_search <run.yaml>
 *
 * exit codes: 0 success, 1 any fatal error, 130 interrupted (partial results
 * were still written).
 */
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string_view>
#include <system_error>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "tio/common/log.hpp"
#include "tio/compute/backend.hpp"
#include "tio/config/config.hpp"
#include "tio/leadfield/leadfield.hpp"
#include "tio/movea/optimizer.hpp"
#include "tio/roi/roi.hpp"
#include "tio/search/evaluation.hpp"
#include "tio/search/exhaustive.hpp"
#include "tio/search/montage_space.hpp"
#include "tio/search/results_writer.hpp"
#include "tio/search/stop_signal.hpp"

namespace
{

constexpr std::string_view kLogChannel      = "[tio::app]";
constexpr int              kExitInterrupted = 130;

template <typename Error>
void report_error(std::string_view label, const Error &error)
{
    if (error.context.empty())
    {
        tio::common::log(tio::common::LogLevel::Error, kLogChannel, "{}: {}", label, error.message);
        return;
    }
    tio::common::log(tio::common::LogLevel::Error, kLogChannel, "{}: {} ({})", label, error.message,
                     fmt::join(error.context, "."));
}

void setup_logging(const tio::config::Config &config)
{
    tio::common::set_log_level(config.logging.level);
    if (!config.logging.file)
    {
        return;
    }
    const auto path = config.resolve_path(*config.logging.file);
    if (!path.parent_path().empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
        {
            tio::common::log(tio::common::LogLevel::Warn, kLogChannel, "could not create {}: {}",
                             path.parent_path().string(), ec.message());
        }
    }
    if (!tio::common::open_log_file(path))
    {
        tio::common::log(tio::common::LogLevel::Warn, kLogChannel, "could not open log file {}, console only",
                         path.string());
    }
}

auto run_exhaustive(const tio::config::Config &config, const tio::leadfield::LeadfieldBundle &bundle,
                    const std::shared_ptr<const tio::compute::FieldBackend> &backend, const tio::roi::RoiSpec &spec,
                    const std::filesystem::path &output_directory) -> int
{
    auto target = tio::roi::resolve_roi(*bundle.grid, spec);
    if (!target)
    {
        report_error("roi error", target.error());
        return EXIT_FAILURE;
    }
    if (target->empty())
    {
        tio::common::log(tio::common::LogLevel::Error, kLogChannel, "roi '{}' contains no elements", config.roi.name);
        return EXIT_FAILURE;
    }
    auto grey_matter = tio::roi::find_grey_matter_indices(*bundle.grid, config.grey_matter_tags);
    tio::common::log(tio::common::LogLevel::Info, kLogChannel, "roi '{}': {} elements, grey matter: {} elements",
                     config.roi.name, target->size(), grey_matter.size());

    auto space = tio::search::build_montage_space(config, bundle.electrodes);
    if (!space)
    {
        report_error("search error", space.error());
        return EXIT_FAILURE;
    }

    tio::search::MontageEvaluator evaluator{
        bundle.leadfield, backend,
        tio::search::make_evaluation_targets(std::move(*target), std::move(grey_matter))};
    const tio::search::ExhaustiveSearchEngine engine{config.search, std::move(*space), bundle.electrodes,
                                                     std::move(evaluator)};

    tio::search::SearchReport report{};
    {
        const tio::search::ScopedStopSignal stop_guard{};
        report = engine.run();
    }

    bool write_failed = false;
    if (config.output.write_csv)
    {
        if (auto written = tio::search::write_final_csv(output_directory / "final_output.csv", report); !written)
        {
            report_error("write error", written.error());
            write_failed = true;
        }
    }
    if (config.output.write_yaml)
    {
        if (auto written = tio::search::write_analysis_yaml(output_directory / "analysis_results.yaml", config,
                                                            report, backend->name());
            !written)
        {
            report_error("write error", written.error());
            write_failed = true;
        }
    }
    if (write_failed)
    {
        return EXIT_FAILURE;
    }
    return report.interrupted ? kExitInterrupted : EXIT_SUCCESS;
}

auto run_evolutionary(const tio::config::Config &config, const tio::leadfield::LeadfieldBundle &bundle,
                      const std::shared_ptr<const tio::compute::FieldBackend> &backend, const tio::roi::RoiSpec &spec,
                      const std::filesystem::path &output_directory) -> int
{
    tio::movea::MoveaOptimizer optimizer{config, bundle, backend};
    if (auto target = optimizer.set_target(spec); !target)
    {
        report_error("target error", target.error());
        return EXIT_FAILURE;
    }

    std::vector<tio::movea::ParetoSolution> solutions;
    if (config.optimizer.objective == tio::config::Objective::Multi)
    {
        auto front = optimizer.generate_pareto_solutions();
        if (!front)
        {
            report_error("optimizer error", front.error());
            return EXIT_FAILURE;
        }
        solutions = std::move(*front);
    }
    else
    {
        auto result = optimizer.optimize();
        if (!result)
        {
            report_error("optimizer error", result.error());
            return EXIT_FAILURE;
        }
        solutions.push_back(result->best);
    }

    bool write_failed = false;
    if (config.output.write_csv)
    {
        if (auto written = tio::search::write_pareto_csv(output_directory / "pareto_solutions.csv", solutions);
            !written)
        {
            report_error("write error", written.error());
            write_failed = true;
        }
    }
    if (config.output.write_yaml)
    {
        if (auto written = tio::search::write_analysis_yaml(output_directory / "analysis_results.yaml", config,
                                                            solutions, backend->name());
            !written)
        {
            report_error("write error", written.error());
            write_failed = true;
        }
    }
    return write_failed ? EXIT_FAILURE : EXIT_SUCCESS;
}

} // namespace

int main(int argc, char **argv)
{
    if (argc != 2 || std::string_view{argv[1]} == "--help" || std::string_view{argv[1]} == "-h")
    {
        fmt::print(stderr, "usage: {} <run.yaml>\n", argc > 0 ? argv[0] : "tio_search");
        return argc == 2 ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    const auto config_result = tio::config::load_config_from_file(argv[1]);
    if (!config_result)
    {
        report_error("config error", config_result.error());
        return EXIT_FAILURE;
    }
    const auto &config = *config_result;
    setup_logging(config);

    const auto bundle = tio::leadfield::load_leadfield_bundle(config.resolve_path(config.leadfield_manifest));
    if (!bundle)
    {
        report_error("leadfield error", bundle.error());
        return EXIT_FAILURE;
    }

    const auto spec = tio::roi::roi_spec_from_config(config);
    if (!spec)
    {
        report_error("roi error", spec.error());
        return EXIT_FAILURE;
    }

    const auto backend          = tio::compute::make_backend(config.execution, bundle->leadfield);
    const auto output_directory = config.resolve_path(config.output.directory);

    const int status = config.strategy == tio::config::Strategy::Exhaustive
                           ? run_exhaustive(config, *bundle, backend, *spec, output_directory)
                           : run_evolutionary(config, *bundle, backend, *spec, output_directory);
    tio::common::close_log_file();
    return status;
}
