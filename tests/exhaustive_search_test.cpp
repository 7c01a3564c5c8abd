/**
 * @file exhaustive_search_test.cpp
 * @brief ex-search accounting, interruption, caps and partial-failure isolation uwu
 */
#include <atomic>
#include <memory>
#include <stdexcept>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "support/leadfield_fixtures.hpp"
#include "support/log_capture.hpp"
#include "support/mock_backend.hpp"
#include "tio/search/exhaustive.hpp"
#include "tio/search/stop_signal.hpp"

using testing::_;
using testing::HasSubstr;
using testing::NiceMock;

namespace
{

/// 20 elements on the x axis, even ones grey matter
[[nodiscard]] auto half_grey_grid() -> tio::mesh::ElementGrid
{
    auto grid = tio::test_support::make_line_grid(20U);
    for (std::size_t i = 0; i < grid.size(); ++i)
    {
        grid.tags[i] = (i % 2U == 0U) ? 2 : 1;
    }
    return grid;
}

class ExhaustiveSearchTest : public ::testing::Test
{
protected:
    void SetUp() override { tio::search::reset_stop(); }
    void TearDown() override { tio::search::reset_stop(); }

    [[nodiscard]] auto targets() const -> tio::search::EvaluationTargets
    {
        auto roi = tio::roi::find_sphere_element_indices(*bundle_.grid, tio::common::Vec3{5.0, 0.0, 0.0}, 3.0);
        auto gm  = tio::roi::find_grey_matter_indices(*bundle_.grid);
        return tio::search::make_evaluation_targets(std::move(roi), std::move(gm));
    }

    [[nodiscard]] auto evaluator(std::shared_ptr<const tio::compute::FieldBackend> backend) const
        -> tio::search::MontageEvaluator
    {
        return tio::search::MontageEvaluator{bundle_.leadfield, std::move(backend), targets()};
    }

    /// 2 * 2 * 1 * 1 montages x 3 ratios = 12 candidates, all distinct
    [[nodiscard]] static auto distinct_space() -> tio::search::MontageSpace
    {
        return tio::search::MontageSpace::bucketed({{{0U, 1U}, {2U, 3U}, {4U}, {5U}}},
                                                   tio::search::generate_current_ratios(2.0, 0.5, 1.5));
    }

    [[nodiscard]] auto engine(tio::search::MontageSpace space, std::shared_ptr<const tio::compute::FieldBackend> backend,
                              std::size_t workers = 2U) -> tio::search::ExhaustiveSearchEngine
    {
        settings_.workers = workers;
        return tio::search::ExhaustiveSearchEngine{settings_, std::move(space), bundle_.electrodes,
                                                   evaluator(std::move(backend))};
    }

    static void expect_accounting(const tio::search::SearchReport &report)
    {
        EXPECT_EQ(report.processed + report.failed + report.unprocessed, report.total);
        EXPECT_EQ(report.results.size(), report.processed);
    }

    tio::leadfield::LeadfieldBundle bundle_ = tio::test_support::make_test_bundle(
        6U, 20U, tio::test_support::make_varied_values(6U, 20U), half_grey_grid());
    std::shared_ptr<const tio::compute::FieldBackend> cpu_ = std::make_shared<const tio::compute::CpuBackend>();
    tio::config::SearchSettings                       settings_{.chunk_size = 5U, .progress_interval = 7U};
};

} // namespace

TEST_F(ExhaustiveSearchTest, EvaluatesEveryCandidateInIdOrder)
{
    const auto search = engine(distinct_space(), cpu_);
    const auto report = search.run([] { return false; });

    EXPECT_EQ(report.total, 12U);
    EXPECT_EQ(report.processed, 12U);
    EXPECT_EQ(report.failed, 0U);
    EXPECT_EQ(report.unprocessed, 0U);
    EXPECT_FALSE(report.interrupted);
    EXPECT_FALSE(report.limit_exceeded);
    expect_accounting(report);

    for (std::size_t i = 0; i < report.results.size(); ++i)
    {
        EXPECT_EQ(report.results[i].id, i);
    }
    const auto &first = report.results.front();
    EXPECT_EQ(first.montage, "E001_E003_and_E005_E006_I1-1.5mA_I2-0.5mA");
    EXPECT_DOUBLE_EQ(first.ch1_mA, 1.5);
    EXPECT_DOUBLE_EQ(first.ch2_mA, 0.5);

    const auto direct = evaluator(cpu_).evaluate({0U, 2U, 4U, 5U}, 1.5, 0.5);
    ASSERT_TRUE(direct.has_value());
    EXPECT_DOUBLE_EQ(first.metrics.timax_roi, direct->timax_roi);
    EXPECT_DOUBLE_EQ(first.metrics.timean_roi, direct->timean_roi);
    ASSERT_TRUE(first.metrics.focality.has_value());
    EXPECT_EQ(first.metrics.n_elements, 7U);
}

TEST_F(ExhaustiveSearchTest, ResultsDoNotDependOnWorkerCount)
{
    const auto serial   = engine(distinct_space(), cpu_, 1U).run([] { return false; });
    const auto parallel = engine(distinct_space(), cpu_, 4U).run([] { return false; });
    ASSERT_EQ(serial.results.size(), parallel.results.size());
    for (std::size_t i = 0; i < serial.results.size(); ++i)
    {
        EXPECT_EQ(serial.results[i].montage, parallel.results[i].montage);
        EXPECT_DOUBLE_EQ(serial.results[i].metrics.timean_roi, parallel.results[i].metrics.timean_roi);
    }
}

TEST_F(ExhaustiveSearchTest, RepeatedElectrodesAreSkippedAsInfeasible)
{
    const auto report = engine(distinct_space(), cpu_).run([] { return false; });
    EXPECT_EQ(report.failed, 0U);

    // e2_minus 0 collides with e1_plus 0 for the first montage
    auto colliding = tio::search::MontageSpace::bucketed({{{0U, 1U}, {2U}, {4U}, {0U}}},
                                                         tio::search::generate_current_ratios(2.0, 0.5, 1.0));
    const tio::test_support::ScopedLogCapture capture{tio::common::LogLevel::Debug};
    const auto skipped = engine(std::move(colliding), cpu_).run([] { return false; });
    EXPECT_EQ(capture.count(tio::common::LogLevel::Debug, "infeasible montage"), 1U);
    EXPECT_EQ(capture.count(tio::common::LogLevel::Warn, "skipped"), 0U);
    EXPECT_EQ(skipped.total, 2U);
    EXPECT_EQ(skipped.failed, 1U);
    EXPECT_EQ(skipped.processed, 1U);
    ASSERT_EQ(skipped.results.size(), 1U);
    EXPECT_EQ(skipped.results.front().id, 1U);
    expect_accounting(skipped);
}

TEST_F(ExhaustiveSearchTest, StopPredicateKeepsCompletedChunksOnly)
{
    std::atomic<int> polls{0};
    const auto       report = engine(distinct_space(), cpu_).run([&polls] { return polls.fetch_add(1) >= 2; });

    EXPECT_TRUE(report.interrupted);
    EXPECT_EQ(report.processed, 10U);
    EXPECT_EQ(report.unprocessed, 2U);
    expect_accounting(report);
    EXPECT_EQ(report.results.back().id, 9U);
}

TEST_F(ExhaustiveSearchTest, ProcessStopFlagIsTheDefaultPredicate)
{
    const tio::test_support::ScopedLogCapture capture{tio::common::LogLevel::Warn};
    tio::search::request_stop();
    const auto report = engine(distinct_space(), cpu_).run();
    EXPECT_TRUE(report.interrupted);
    EXPECT_EQ(report.processed, 0U);
    EXPECT_EQ(report.unprocessed, 12U);
    expect_accounting(report);
    EXPECT_EQ(capture.count(tio::common::LogLevel::Warn, "stop requested"), 1U);
}

TEST_F(ExhaustiveSearchTest, MaxCandidatesCapsTheWalk)
{
    settings_.max_candidates = 7U;
    const auto report        = engine(distinct_space(), cpu_).run([] { return false; });
    EXPECT_FALSE(report.interrupted);
    EXPECT_EQ(report.processed, 7U);
    EXPECT_EQ(report.unprocessed, 5U);
    expect_accounting(report);
}

TEST_F(ExhaustiveSearchTest, BackendFailuresAreIsolatedPerCandidate)
{
    auto mock = std::make_shared<NiceMock<tio::test_support::MockFieldBackend>>();
    mock->delegate_to_cpu();
    const tio::compute::CpuBackend cpu;
    // electrode 1 as channel 1 anode fails, E001 -> E004 on channel 1 throws
    ON_CALL(*mock, ti_field(_, _, _, _))
        .WillByDefault([&cpu](const tio::leadfield::LeadfieldMatrix &lf, std::span<const double> stim1,
                              std::span<const double> stim2,
                              std::optional<std::span<const std::size_t>> indices) -> tio::field::FieldResult {
            if (stim1[1] > 0.0)
            {
                return std::unexpected(tio::field::FieldError{"device lost", {"mock"}});
            }
            if (stim1[0] > 0.0 && stim1[3] < 0.0)
            {
                throw std::runtime_error("driver exploded");
            }
            return cpu.ti_field(lf, stim1, stim2, indices);
        });

    const tio::test_support::ScopedLogCapture capture{tio::common::LogLevel::Warn};
    const auto report = engine(distinct_space(), mock).run([] { return false; });
    EXPECT_EQ(report.failed, 6U + 3U);
    EXPECT_EQ(capture.count(tio::common::LogLevel::Warn, "evaluation failed"), 9U);
    EXPECT_EQ(capture.count(tio::common::LogLevel::Warn, "device lost"), 6U);
    EXPECT_EQ(capture.count(tio::common::LogLevel::Warn, "driver exploded"), 3U);
    EXPECT_EQ(report.processed, 3U);
    expect_accounting(report);
    for (const auto &result : report.results)
    {
        EXPECT_THAT(result.montage, testing::StartsWith("E001_E003_"));
    }
}

TEST_F(ExhaustiveSearchTest, EvaluatorReportsSkipReasons)
{
    auto mock = std::make_shared<NiceMock<tio::test_support::MockFieldBackend>>();
    mock->delegate_to_cpu();
    ON_CALL(*mock, ti_field(_, _, _, _)).WillByDefault([](auto &&...) -> tio::field::FieldResult {
        throw std::runtime_error("driver exploded");
    });

    const auto evaluator = tio::search::MontageEvaluator{bundle_.leadfield, mock, targets()};
    const auto thrown    = evaluator.evaluate({0U, 1U, 2U, 3U}, 1.0, 1.0);
    ASSERT_FALSE(thrown.has_value());
    EXPECT_EQ(thrown.error().reason, tio::search::SkipReason::EvaluationFailed);
    EXPECT_THAT(thrown.error().detail, HasSubstr("driver exploded"));

    const auto repeated = evaluator.evaluate({0U, 1U, 2U, 0U}, 1.0, 1.0);
    ASSERT_FALSE(repeated.has_value());
    EXPECT_EQ(repeated.error().reason, tio::search::SkipReason::InfeasibleMontage);
    EXPECT_EQ(tio::search::to_string(repeated.error().reason), "infeasible montage");
}

TEST(EvaluationTargets, SubsetIsTheSortedUnionWithSlots)
{
    tio::roi::RoiSelection roi{{2U, 5U, 9U}, {1.0, 1.0, 1.0}};
    tio::roi::RoiSelection gm{{0U, 2U, 4U, 9U}, {1.0, 1.0, 1.0, 1.0}};
    const auto             targets = tio::search::make_evaluation_targets(roi, gm);
    EXPECT_THAT(targets.subset, testing::ElementsAre(0U, 2U, 4U, 5U, 9U));
    EXPECT_THAT(targets.roi_slots, testing::ElementsAre(1U, 3U, 4U));
    EXPECT_THAT(targets.reference_slots, testing::ElementsAre(0U, 1U, 2U, 4U));
}
