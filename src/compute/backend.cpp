/**
 * @file backend.cpp
 * @brief CPU field backend and the backend factory (Vulkan when built + requested)
 */
#include "tio/compute/backend.hpp"

#include <utility>

#include "tio/common/log.hpp"

#ifdef TIO_HAS_VULKAN
#include "tio/gpu/vulkan_backend.hpp"
#endif

namespace tio::compute
{
namespace
{

constexpr std::string_view kLogChannel = "[tio::compute]";

} // namespace

auto FieldBackend::ti_field(const leadfield::LeadfieldMatrix &leadfield, std::span<const double> stim1,
                            std::span<const double> stim2, std::optional<std::span<const std::size_t>> indices) const
    -> field::FieldResult
{
    auto field1 = contract(leadfield, stim1, indices);
    if (!field1)
    {
        return std::unexpected(field1.error());
    }
    auto field2 = contract(leadfield, stim2, indices);
    if (!field2)
    {
        return std::unexpected(field2.error());
    }
    return envelope(*field1, *field2);
}

auto CpuBackend::contract(const leadfield::LeadfieldMatrix &leadfield, std::span<const double> stim,
                          std::optional<std::span<const std::size_t>> indices) const -> field::VectorResult
{
    return field::contract_leadfield(leadfield, stim, indices);
}

auto CpuBackend::envelope(std::span<const common::Vec3> e1, std::span<const common::Vec3> e2) const
    -> field::FieldResult
{
    return field::envelope_field(e1, e2);
}

auto gpu_compiled_in() noexcept -> bool
{
#ifdef TIO_HAS_VULKAN
    return true;
#else
    return false;
#endif
}

auto make_backend(const config::ExecutionSettings &settings,
                  std::shared_ptr<const leadfield::LeadfieldMatrix> leadfield) -> std::shared_ptr<const FieldBackend>
{
    if (!settings.use_gpu)
    {
        common::log(common::LogLevel::Debug, kLogChannel, "using cpu backend");
        return std::make_shared<const CpuBackend>();
    }

#ifdef TIO_HAS_VULKAN
    auto gpu = gpu::VulkanBackend::create(settings, std::move(leadfield));
    if (gpu)
    {
        common::log(common::LogLevel::Info, kLogChannel, "using vulkan backend on {}", (*gpu)->device_name());
        return std::shared_ptr<const FieldBackend>{std::move(*gpu)};
    }
    common::log(common::LogLevel::Warn, kLogChannel, "vulkan backend unavailable ({}), falling back to cpu",
                gpu.error().message);
#else
    (void)leadfield;
    common::log(common::LogLevel::Warn, kLogChannel,
                "execution.use_gpu requested but this build has no vulkan backend, falling back to cpu");
#endif
    return std::make_shared<const CpuBackend>();
}

} // namespace tio::compute
