/**
 * @file vulkan_backend.hpp
 * @brief Vulkan compute implementation of compute::FieldBackend uwu
 *
 * the leadfield is uploaded once (float32) into a host-visible VMA buffer.
 * each call writes the current pattern(s), dispatches `leadfield_contract`
 * once per channel and `ti_envelope` once, then reads the result back. one
 * command buffer and one queue means submissions are serialized by a mutex,
 * so worker threads can share the backend but will queue behind each other.
 *
 * results match CpuBackend within float32 tolerance. calls for a leadfield
 * other than the uploaded one are answered by the CPU path.
 *
 * @note only compiled when the build enables TIO_BUILD_GPU
 */
#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "tio/compute/backend.hpp"
#include "tio/config/config.hpp"
#include "tio/gpu/vulkan_context.hpp"
#include "tio/leadfield/leadfield.hpp"

namespace tio::gpu
{

class VulkanBackend final : public compute::FieldBackend
{
public:
    /**
     * @brief brings up the device, uploads the leadfield and builds both pipelines
     *
     * ⚠️ IMPURE FUNCTION (driver calls, device memory, reads .spv files)
     *
     * @param[in] settings execution block (shader_dir, device_substring)
     * @param[in] leadfield tensor to keep resident
     * @return backend or BackendError describing the first failing step
     */
    [[nodiscard]] static auto create(const config::ExecutionSettings &settings,
                                     std::shared_ptr<const leadfield::LeadfieldMatrix> leadfield)
        -> std::expected<std::unique_ptr<VulkanBackend>, compute::BackendError>;

    ~VulkanBackend() override;

    [[nodiscard]] auto name() const noexcept -> std::string_view override { return "vulkan"; }
    [[nodiscard]] auto device_name() const -> const std::string & { return context_.device_summary().name; }

    [[nodiscard]] auto contract(const leadfield::LeadfieldMatrix &leadfield, std::span<const double> stim,
                                std::optional<std::span<const std::size_t>> indices) const
        -> field::VectorResult override;

    [[nodiscard]] auto envelope(std::span<const common::Vec3> e1, std::span<const common::Vec3> e2) const
        -> field::FieldResult override;

    [[nodiscard]] auto ti_field(const leadfield::LeadfieldMatrix &leadfield, std::span<const double> stim1,
                                std::span<const double> stim2,
                                std::optional<std::span<const std::size_t>> indices) const
        -> field::FieldResult override;

private:
    class Runtime;

    VulkanBackend(VulkanContext context, std::shared_ptr<const leadfield::LeadfieldMatrix> leadfield);

    VulkanContext                                     context_;
    std::shared_ptr<const leadfield::LeadfieldMatrix> leadfield_;
    std::unique_ptr<Runtime>                          runtime_;
    compute::CpuBackend                               cpu_;
    mutable std::mutex                                mutex_;
};

/**
 * @brief directory the build placed the compiled .spv files in
 */
[[nodiscard]] auto default_shader_directory() -> std::filesystem::path;

} // namespace tio::gpu
