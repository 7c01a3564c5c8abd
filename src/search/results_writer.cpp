/**
 * @file results_writer.cpp
 * @brief final_output.csv, pareto_solutions.csv and analysis_results.yaml writers uwu
 */
#include "tio/search/results_writer.hpp"

#include <fstream>
#include <system_error>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "tio/common/log.hpp"

namespace tio::search
{
namespace
{

constexpr std::string_view kLogChannel = "[tio::search]";

[[nodiscard]] auto make_error(std::string message, std::initializer_list<std::string> ctx = {}) -> WriteError
{
    WriteError err{};
    err.message = std::move(message);
    err.context.assign(ctx.begin(), ctx.end());
    return err;
}

[[nodiscard]] auto open_output(const std::filesystem::path &path, std::ofstream &file) -> WriteResult
{
    if (!path.parent_path().empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
        {
            return std::unexpected(make_error(fmt::format("failed to create directory: {}", ec.message()),
                                              {path.parent_path().string()}));
        }
    }
    file.open(path, std::ios::trunc);
    if (!file)
    {
        return std::unexpected(make_error("failed to open output file", {path.string()}));
    }
    return {};
}

[[nodiscard]] auto finish(const std::filesystem::path &path, std::ofstream &file) -> WriteResult
{
    file.flush();
    if (!file)
    {
        return std::unexpected(make_error("failed while writing output file", {path.string()}));
    }
    common::log(common::LogLevel::Info, kLogChannel, "wrote {}", path.string());
    return {};
}

[[nodiscard]] auto metric_cell(const std::optional<double> &value) -> std::string
{
    return value ? fmt::format("{:.4f}", *value) : std::string{};
}

void emit_optional(YAML::Emitter &out, std::string_view key, const std::optional<double> &value)
{
    out << YAML::Key << std::string{key};
    if (value)
    {
        out << YAML::Value << *value;
    }
    else
    {
        out << YAML::Value << YAML::Null;
    }
}

void emit_run_header(YAML::Emitter &out, const config::Config &config, std::string_view backend_name)
{
    out << YAML::Key << "roi" << YAML::Value << config.roi.name;
    out << YAML::Key << "strategy" << YAML::Value
        << (config.strategy == config::Strategy::Exhaustive ? "exhaustive" : "evolutionary");
    out << YAML::Key << "backend" << YAML::Value << std::string{backend_name};
}

[[nodiscard]] auto write_yaml_document(const std::filesystem::path &path, const YAML::Emitter &out) -> WriteResult
{
    if (!out.good())
    {
        return std::unexpected(make_error(fmt::format("yaml emitter failed: {}", out.GetLastError()), {path.string()}));
    }
    std::ofstream file;
    if (auto opened = open_output(path, file); !opened)
    {
        return opened;
    }
    file << out.c_str() << '\n';
    return finish(path, file);
}

} // namespace

auto display_montage_name(std::string_view montage) -> std::string
{
    std::string     display{montage};
    constexpr auto  kSeparator = std::string_view{"_and_"};
    if (const auto pos = display.find(kSeparator); pos != std::string::npos)
    {
        display.replace(pos, kSeparator.size(), " <> ");
    }
    return display;
}

auto composite_index(const roi::RoiMetrics &metrics) noexcept -> std::optional<double>
{
    if (!metrics.focality)
    {
        return std::nullopt;
    }
    return metrics.timean_roi * *metrics.focality;
}

auto write_final_csv(const std::filesystem::path &path, const SearchReport &report) -> WriteResult
{
    std::ofstream file;
    if (auto opened = open_output(path, file); !opened)
    {
        return opened;
    }

    file << "Montage,Current_Ch1_mA,Current_Ch2_mA,TImax_ROI,TImean_ROI,TImean_GM,Focality,Composite_Index,"
            "n_elements\n";
    for (const auto &result : report.results)
    {
        const auto &m = result.metrics;
        file << fmt::format("{},{:.1f},{:.1f},{:.4f},{:.4f},{},{},{},{}\n", display_montage_name(result.montage),
                            result.ch1_mA, result.ch2_mA, m.timax_roi, m.timean_roi, metric_cell(m.timean_gm),
                            metric_cell(m.focality), metric_cell(composite_index(m)), m.n_elements);
    }
    return finish(path, file);
}

auto write_analysis_yaml(const std::filesystem::path &path, const config::Config &config, const SearchReport &report,
                         std::string_view backend_name) -> WriteResult
{
    YAML::Emitter out;
    out << YAML::BeginMap;
    emit_run_header(out, config, backend_name);

    out << YAML::Key << "summary" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "total" << YAML::Value << report.total;
    out << YAML::Key << "processed" << YAML::Value << report.processed;
    out << YAML::Key << "failed" << YAML::Value << report.failed;
    out << YAML::Key << "unprocessed" << YAML::Value << report.unprocessed;
    out << YAML::Key << "interrupted" << YAML::Value << report.interrupted;
    out << YAML::Key << "channel_limit_exceeded" << YAML::Value << report.limit_exceeded;
    out << YAML::Key << "elapsed_seconds" << YAML::Value << report.elapsed_seconds;
    out << YAML::EndMap;

    out << YAML::Key << "results" << YAML::Value << YAML::BeginSeq;
    for (const auto &result : report.results)
    {
        const auto &m = result.metrics;
        out << YAML::BeginMap;
        out << YAML::Key << "montage" << YAML::Value << result.montage;
        out << YAML::Key << "current_ch1_mA" << YAML::Value << result.ch1_mA;
        out << YAML::Key << "current_ch2_mA" << YAML::Value << result.ch2_mA;
        out << YAML::Key << "TImax_ROI" << YAML::Value << m.timax_roi;
        out << YAML::Key << "TImean_ROI" << YAML::Value << m.timean_roi;
        emit_optional(out, "TImean_GM", m.timean_gm);
        emit_optional(out, "Focality", m.focality);
        emit_optional(out, "Composite_Index", composite_index(m));
        out << YAML::Key << "n_elements" << YAML::Value << m.n_elements;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return write_yaml_document(path, out);
}

auto write_analysis_yaml(const std::filesystem::path &path, const config::Config &config,
                         std::span<const movea::ParetoSolution> solutions, std::string_view backend_name)
    -> WriteResult
{
    YAML::Emitter out;
    out << YAML::BeginMap;
    emit_run_header(out, config, backend_name);
    out << YAML::Key << "seed" << YAML::Value << config.optimizer.seed;
    out << YAML::Key << "generations" << YAML::Value << config.optimizer.generations;
    out << YAML::Key << "population" << YAML::Value << config.optimizer.population;

    out << YAML::Key << "solutions" << YAML::Value << YAML::BeginSeq;
    for (const auto &solution : solutions)
    {
        out << YAML::BeginMap;
        out << YAML::Key << "electrodes" << YAML::Value << YAML::Flow << YAML::BeginSeq;
        for (const auto &name : solution.names)
        {
            out << name;
        }
        out << YAML::EndSeq;
        out << YAML::Key << "current_ratio" << YAML::Value << solution.current_ratio;
        out << YAML::Key << "current_ch1_mA" << YAML::Value << solution.ch1_mA;
        out << YAML::Key << "current_ch2_mA" << YAML::Value << solution.ch2_mA;
        out << YAML::Key << "intensity_cost" << YAML::Value << solution.intensity_cost;
        out << YAML::Key << "intensity_field" << YAML::Value << solution.intensity_field;
        out << YAML::Key << "focality_cost" << YAML::Value << solution.focality_cost;
        out << YAML::Key << "focality_ratio" << YAML::Value << solution.focality_ratio;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return write_yaml_document(path, out);
}

auto write_pareto_csv(const std::filesystem::path &path, std::span<const movea::ParetoSolution> solutions)
    -> WriteResult
{
    std::ofstream file;
    if (auto opened = open_output(path, file); !opened)
    {
        return opened;
    }

    file << "Rank,E1_plus,E1_minus,E2_plus,E2_minus,Current_Ratio,Current_Ch1_mA,Current_Ch2_mA,Intensity_Cost,"
            "Intensity_Field,Focality_Cost,Focality_Ratio\n";
    for (std::size_t rank = 0; rank < solutions.size(); ++rank)
    {
        const auto &s = solutions[rank];
        file << fmt::format("{},{},{},{},{},{:.4f},{:.3f},{:.3f},{:.6g},{:.6f},{:.6f},{:.6f}\n", rank + 1U,
                            s.names[0], s.names[1], s.names[2], s.names[3], s.current_ratio, s.ch1_mA, s.ch2_mA,
                            s.intensity_cost, s.intensity_field, s.focality_cost, s.focality_ratio);
    }
    return finish(path, file);
}

} // namespace tio::search
