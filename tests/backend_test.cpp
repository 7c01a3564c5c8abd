/**
 * @file backend_test.cpp
 * @brief compute backend selection + cpu/gpu parity for the two field primitives
 */
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <span>
#include <vector>

#include "support/leadfield_fixtures.hpp"
#include "support/log_capture.hpp"
#include "tio/compute/backend.hpp"
#include "tio/field/envelope.hpp"

#ifdef TIO_HAS_VULKAN
#include "tio/gpu/vulkan_backend.hpp"
#endif

using testing::DoubleNear;
using testing::HasSubstr;

namespace
{

struct BackendFixture : ::testing::Test
{
    tio::leadfield::LeadfieldBundle bundle = tio::test_support::make_test_bundle(6U, 40U);
    std::vector<double>             stim1{1.25, -1.25, 0.0, 0.0, 0.0, 0.0};
    std::vector<double>             stim2{0.0, 0.0, 0.0, 0.75, -0.75, 0.0};
    std::vector<std::size_t>        subset{39U, 3U, 17U, 0U, 22U};
};

} // namespace

TEST_F(BackendFixture, CpuBackendMatchesFieldFunctions)
{
    const tio::compute::CpuBackend cpu;
    EXPECT_EQ(cpu.name(), "cpu");

    const auto expected = tio::field::calculate_ti_field_from_leadfield(*bundle.leadfield, stim1, stim2);
    const auto actual   = cpu.ti_field(*bundle.leadfield, stim1, stim2, std::nullopt);
    ASSERT_TRUE(expected.has_value());
    ASSERT_TRUE(actual.has_value()) << actual.error().message;
    EXPECT_EQ(*actual, *expected);

    const auto sub = cpu.ti_field(*bundle.leadfield, stim1, stim2, std::span<const std::size_t>{subset});
    ASSERT_TRUE(sub.has_value()) << sub.error().message;
    ASSERT_EQ(sub->size(), subset.size());
    for (std::size_t i = 0; i < subset.size(); ++i)
    {
        EXPECT_DOUBLE_EQ((*sub)[i], (*expected)[subset[i]]);
    }
}

TEST_F(BackendFixture, CpuBackendPropagatesContractionErrors)
{
    const tio::compute::CpuBackend cpu;
    const std::vector<double>      short_stim{1.0, -1.0};
    const auto                     result = cpu.ti_field(*bundle.leadfield, short_stim, stim2, std::nullopt);
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().message, HasSubstr("leadfield has 6 electrodes"));
}

TEST_F(BackendFixture, MakeBackendDefaultsToCpu)
{
    tio::config::ExecutionSettings settings{};
    const auto                     backend = tio::compute::make_backend(settings, bundle.leadfield);
    ASSERT_NE(backend, nullptr);
    EXPECT_EQ(backend->name(), "cpu");
}

TEST_F(BackendFixture, UnsatisfiableGpuRequestFallsBackToCpu)
{
    const tio::test_support::ScopedLogCapture capture{tio::common::LogLevel::Warn};
    tio::config::ExecutionSettings            settings{};
    settings.use_gpu    = true;
    settings.shader_dir = std::filesystem::path{"/nonexistent/tio/shaders"};
    settings.device_substring = "no-such-device-anywhere";

    const auto backend = tio::compute::make_backend(settings, bundle.leadfield);
    ASSERT_NE(backend, nullptr);
    EXPECT_EQ(backend->name(), "cpu");
    EXPECT_EQ(capture.count(tio::common::LogLevel::Warn, "falling back to cpu"), 1U);
}

#ifdef TIO_HAS_VULKAN

TEST_F(BackendFixture, VulkanMatchesCpuWithinFloatPrecision)
{
    tio::config::ExecutionSettings settings{};
    settings.use_gpu = true;
    auto gpu         = tio::gpu::VulkanBackend::create(settings, bundle.leadfield);
    if (!gpu)
    {
        GTEST_SKIP() << "no usable Vulkan device: " << gpu.error().message;
    }

    const tio::compute::CpuBackend cpu;
    const auto expected = cpu.ti_field(*bundle.leadfield, stim1, stim2, std::span<const std::size_t>{subset});
    const auto actual   = (*gpu)->ti_field(*bundle.leadfield, stim1, stim2, std::span<const std::size_t>{subset});
    ASSERT_TRUE(expected.has_value());
    ASSERT_TRUE(actual.has_value()) << actual.error().message;
    ASSERT_EQ(actual->size(), expected->size());
    for (std::size_t i = 0; i < expected->size(); ++i)
    {
        EXPECT_THAT((*actual)[i], DoubleNear((*expected)[i], 1e-4 + (1e-4 * (*expected)[i])));
    }

    const auto field_cpu = cpu.contract(*bundle.leadfield, stim1, std::nullopt);
    const auto field_gpu = (*gpu)->contract(*bundle.leadfield, stim1, std::nullopt);
    ASSERT_TRUE(field_gpu.has_value()) << field_gpu.error().message;
    ASSERT_EQ(field_gpu->size(), field_cpu->size());
    for (std::size_t i = 0; i < field_cpu->size(); ++i)
    {
        for (std::size_t axis = 0; axis < 3U; ++axis)
        {
            EXPECT_NEAR((*field_gpu)[i][axis], (*field_cpu)[i][axis], 1e-5);
        }
    }
}

TEST_F(BackendFixture, VulkanFallsBackForForeignLeadfield)
{
    tio::config::ExecutionSettings settings{};
    settings.use_gpu = true;
    auto gpu         = tio::gpu::VulkanBackend::create(settings, bundle.leadfield);
    if (!gpu)
    {
        GTEST_SKIP() << "no usable Vulkan device: " << gpu.error().message;
    }
    const auto other    = tio::test_support::make_test_bundle(6U, 10U);
    const auto expected = tio::field::calculate_ti_field_from_leadfield(*other.leadfield, stim1, stim2);
    const auto actual   = (*gpu)->ti_field(*other.leadfield, stim1, stim2, std::nullopt);
    ASSERT_TRUE(actual.has_value()) << actual.error().message;
    EXPECT_EQ(*actual, *expected);
}

#endif
