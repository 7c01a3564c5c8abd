/**
 * @file vulkan_context.hpp
 * @brief RAII Vulkan instance + compute device + VMA allocator for the field kernels uwu
 *
 * this header declares the bootstrapper the Vulkan field backend sits on. it
 * owns instance creation, physical device selection, the single compute queue
 * and the VMA allocator, and exposes debug-utils naming/labels so captures in
 * RenderDoc / RGP read nicely.
 *
 * design vibes:
 * - RAII all the things (move-only, destroy in reverse creation order)
 * - failures come back as std::expected<..., VulkanError> with breadcrumbs
 * - compute only, no surfaces, no swapchains, no descriptor buffers
 *
 * @note only compiled when the build enables TIO_BUILD_GPU
 * @note requires a Vulkan 1.2 capable driver and VulkanMemoryAllocator
 */
#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <vulkan/vulkan.h>

struct VmaAllocator_T;

using VmaAllocator = VmaAllocator_T *;

namespace tio::gpu
{

/**
 * @brief structured error payload for Vulkan bootstrap failures
 */
struct VulkanError
{
    std::string              message;             ///< human readable summary
    std::vector<std::string> context;             ///< breadcrumb trail (API, stage, etc.)
    VkResult                 result{VK_SUCCESS}; ///< raw VkResult for debugging
};

/**
 * @brief the compute queue we own
 */
struct QueueInfo
{
    std::uint32_t family_index{0U};
    std::uint32_t queue_index{0U};
    VkQueue       queue{VK_NULL_HANDLE};
};

/**
 * @brief physical device capability summary for logs
 *
 * ✨ PURE FUNCTION ✨ (immutable snapshot of the selected GPU)
 */
struct DeviceSummary
{
    std::string          name;
    std::uint32_t        api_version{0U};
    std::uint32_t        driver_version{0U};
    VkPhysicalDeviceType type{VK_PHYSICAL_DEVICE_TYPE_OTHER};
    std::uint32_t        vendor_id{0U};
    std::uint32_t        max_workgroup_invocations{0U};
};

/**
 * @brief creation parameters for `VulkanContext::create`
 */
struct ContextCreateInfo
{
    bool             enable_validation{false};      ///< request VK_LAYER_KHRONOS_validation if present
    std::string_view preferred_device_substring{}; ///< fuzzy device name match, empty = best score
};

/**
 * @brief RAII container owning instance/device/allocator
 *
 * ⚠️ IMPURE FUNCTION ⚠️ (creation talks to the driver, accessors are pure)
 */
class VulkanContext
{
public:
    VulkanContext() = default;

    [[nodiscard]] static auto create(const ContextCreateInfo &info = {}) -> std::expected<VulkanContext, VulkanError>;

    VulkanContext(const VulkanContext &)                     = delete;
    auto operator=(const VulkanContext &) -> VulkanContext & = delete;

    VulkanContext(VulkanContext &&other) noexcept;
    auto operator=(VulkanContext &&other) noexcept -> VulkanContext &;

    ~VulkanContext();

    [[nodiscard]] auto device() const noexcept -> VkDevice { return device_; }
    [[nodiscard]] auto allocator() const noexcept -> VmaAllocator { return allocator_; }
    [[nodiscard]] auto queue_info() const noexcept -> const QueueInfo & { return queue_info_; }
    [[nodiscard]] auto device_summary() const noexcept -> const DeviceSummary & { return summary_; }

    /**
     * @brief attaches a debug name to a Vulkan object (no-op without debug utils)
     *
     * ⚠️ IMPURE FUNCTION ⚠️
     */
    void set_object_name(std::uint64_t handle, VkObjectType type, std::string_view name) const;

    /**
     * @brief opens a debug label region on a command buffer
     */
    void push_debug_label(VkCommandBuffer cmd, std::string_view name,
                          std::array<float, 4U> color = {0.3F, 0.4F, 0.9F, 1.0F}) const;

    /**
     * @brief closes the most recent debug label region
     */
    void pop_debug_label(VkCommandBuffer cmd) const;

private:
    VkInstance               instance_{VK_NULL_HANDLE};
    VkDebugUtilsMessengerEXT debug_messenger_{VK_NULL_HANDLE};
    VkPhysicalDevice         physical_device_{VK_NULL_HANDLE};
    VkDevice                 device_{VK_NULL_HANDLE};
    VmaAllocator             allocator_{VK_NULL_HANDLE};
    QueueInfo                queue_info_{};
    DeviceSummary            summary_{};

    PFN_vkSetDebugUtilsObjectNameEXT set_object_name_fn_{nullptr};
    PFN_vkCmdBeginDebugUtilsLabelEXT begin_label_fn_{nullptr};
    PFN_vkCmdEndDebugUtilsLabelEXT   end_label_fn_{nullptr};

    void destroy();
};

} // namespace tio::gpu
