/**
 * @file results_writer.hpp
 * @brief CSV + YAML persistence for ex-search reports and MOVEA fronts uwu
 *
 * files written into the run's output directory:
 * - final_output.csv: one row per evaluated montage (Montage, Current_Ch1_mA,
 *   Current_Ch2_mA, TImax_ROI, TImean_ROI, TImean_GM, Focality,
 *   Composite_Index, n_elements). absent metrics are empty cells.
 * - analysis_results.yaml: run summary + per-montage metrics (yaml-cpp emitter)
 * - pareto_solutions.csv: MOVEA front, strongest intensity first
 */
#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "tio/config/config.hpp"
#include "tio/movea/pareto.hpp"
#include "tio/roi/roi.hpp"
#include "tio/search/exhaustive.hpp"

namespace tio::search
{

struct WriteError
{
    std::string              message;
    std::vector<std::string> context;
};

using WriteResult = std::expected<void, WriteError>;

/**
 * @brief "E1_E2_and_E3_E4_I1-1.0mA_I2-1.0mA" -> "E1_E2 <> E3_E4_I1-1.0mA_I2-1.0mA"
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto display_montage_name(std::string_view montage) -> std::string;

/**
 * @brief TImean_ROI * Focality, absent when focality is absent
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto composite_index(const roi::RoiMetrics &metrics) noexcept -> std::optional<double>;

/**
 * @brief ⚠️ IMPURE FUNCTION (file I/O) writes final_output.csv content to `path`
 */
[[nodiscard]] auto write_final_csv(const std::filesystem::path &path, const SearchReport &report) -> WriteResult;

/**
 * @brief ⚠️ IMPURE FUNCTION (file I/O) run summary + results as YAML
 */
[[nodiscard]] auto write_analysis_yaml(const std::filesystem::path &path, const config::Config &config,
                                       const SearchReport &report, std::string_view backend_name) -> WriteResult;

/**
 * @brief ⚠️ IMPURE FUNCTION (file I/O) MOVEA variant of the YAML summary
 */
[[nodiscard]] auto write_analysis_yaml(const std::filesystem::path &path, const config::Config &config,
                                       std::span<const movea::ParetoSolution> solutions,
                                       std::string_view backend_name) -> WriteResult;

/**
 * @brief ⚠️ IMPURE FUNCTION (file I/O) pareto_solutions.csv
 */
[[nodiscard]] auto write_pareto_csv(const std::filesystem::path &path,
                                    std::span<const movea::ParetoSolution> solutions) -> WriteResult;

} // namespace tio::search
