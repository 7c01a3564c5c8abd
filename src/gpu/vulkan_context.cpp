/**
 * @file vulkan_context.cpp
 * @brief Vulkan instance / compute queue / VMA allocator bring-up
 */
#include "tio/gpu/vulkan_context.hpp"

#include <algorithm>
#include <span>
#include <tuple>
#include <utility>

#include <fmt/format.h>

#include "tio/common/log.hpp"

#define VMA_IMPLEMENTATION
#include "vk_mem_alloc.h"

namespace tio::gpu
{
namespace
{

constexpr std::string_view kLogChannel = "[tio::gpu]";

[[nodiscard]] auto make_error(std::string message, VkResult result, std::initializer_list<std::string> ctx)
    -> VulkanError
{
    VulkanError err{};
    err.message = std::move(message);
    err.context.assign(ctx.begin(), ctx.end());
    err.result = result;
    return err;
}

[[nodiscard]] auto make_error(std::string message, std::initializer_list<std::string> ctx) -> VulkanError
{
    return make_error(std::move(message), VK_ERROR_UNKNOWN, ctx);
}

[[nodiscard]] auto version_to_string(std::uint32_t version) -> std::string
{
    return fmt::format("{}.{}.{}", VK_API_VERSION_MAJOR(version), VK_API_VERSION_MINOR(version),
                       VK_API_VERSION_PATCH(version));
}

[[nodiscard]] auto has_layer(std::string_view name) -> bool
{
    std::uint32_t count = 0U;
    vkEnumerateInstanceLayerProperties(&count, nullptr);
    std::vector<VkLayerProperties> layers(count);
    if(count != 0U)
    {
        vkEnumerateInstanceLayerProperties(&count, layers.data());
    }
    return std::ranges::any_of(layers, [name](const VkLayerProperties &layer) {
        return std::string_view{layer.layerName} == name;
    });
}

[[nodiscard]] auto has_instance_extension(std::string_view name) -> bool
{
    std::uint32_t count = 0U;
    vkEnumerateInstanceExtensionProperties(nullptr, &count, nullptr);
    std::vector<VkExtensionProperties> extensions(count);
    if(count != 0U)
    {
        vkEnumerateInstanceExtensionProperties(nullptr, &count, extensions.data());
    }
    return std::ranges::any_of(extensions, [name](const VkExtensionProperties &ext) {
        return std::string_view{ext.extensionName} == name;
    });
}

[[nodiscard]] auto device_type_to_string(VkPhysicalDeviceType type) -> std::string_view
{
    switch(type)
    {
    case VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU:
        return "integrated";
    case VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU:
        return "discrete";
    case VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU:
        return "virtual";
    case VK_PHYSICAL_DEVICE_TYPE_CPU:
        return "cpu";
    default:
        return "other";
    }
}

/// prefers a compute-only family (async compute) over the graphics one
[[nodiscard]] auto pick_compute_queue_family(VkPhysicalDevice device) -> std::optional<QueueInfo>
{
    std::uint32_t family_count = 0U;
    vkGetPhysicalDeviceQueueFamilyProperties(device, &family_count, nullptr);
    std::vector<VkQueueFamilyProperties> families(family_count);
    vkGetPhysicalDeviceQueueFamilyProperties(device, &family_count, families.data());

    std::optional<QueueInfo> fallback;
    for(std::uint32_t i = 0U; i < family_count; ++i)
    {
        const auto flags   = families[i].queueFlags;
        const bool compute = (flags & VK_QUEUE_COMPUTE_BIT) != 0U;
        if(!compute)
        {
            continue;
        }
        if((flags & VK_QUEUE_GRAPHICS_BIT) == 0U)
        {
            return QueueInfo{i, 0U, VK_NULL_HANDLE};
        }
        if(!fallback)
        {
            fallback = QueueInfo{i, 0U, VK_NULL_HANDLE};
        }
    }
    return fallback;
}

[[nodiscard]] auto score_device(const VkPhysicalDeviceProperties &props) -> std::uint32_t
{
    std::uint32_t score = 0U;
    if(props.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU)
    {
        score += 1000U;
    }
    if(props.deviceType == VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU)
    {
        score += 500U;
    }
    score += std::min<std::uint32_t>(props.limits.maxComputeWorkGroupInvocations, 2048U);
    return score;
}

void destroy_messenger(VkInstance instance, VkDebugUtilsMessengerEXT messenger)
{
    if(messenger == VK_NULL_HANDLE)
    {
        return;
    }
    const auto destroy_fn = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
        vkGetInstanceProcAddr(instance, "vkDestroyDebugUtilsMessengerEXT"));
    if(destroy_fn != nullptr)
    {
        destroy_fn(instance, messenger, nullptr);
    }
}

[[nodiscard]] auto build_instance(const ContextCreateInfo &info)
    -> std::expected<std::tuple<VkInstance, VkDebugUtilsMessengerEXT>, VulkanError>
{
    std::vector<const char *> enabled_layers;
    if(info.enable_validation && has_layer("VK_LAYER_KHRONOS_validation"))
    {
        enabled_layers.push_back("VK_LAYER_KHRONOS_validation");
    }

    const bool                debug_utils = has_instance_extension(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    std::vector<const char *> enabled_extensions;
    if(debug_utils)
    {
        enabled_extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    }

    VkApplicationInfo app_info{};
    app_info.sType              = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    app_info.pApplicationName   = "TIOpt";
    app_info.applicationVersion = VK_MAKE_API_VERSION(0, 0, 1, 0);
    app_info.pEngineName        = "tio";
    app_info.engineVersion      = VK_MAKE_API_VERSION(0, 0, 1, 0);
    app_info.apiVersion         = VK_API_VERSION_1_2;

    VkInstanceCreateInfo create_info{};
    create_info.sType                   = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    create_info.pApplicationInfo        = &app_info;
    create_info.enabledLayerCount       = static_cast<std::uint32_t>(enabled_layers.size());
    create_info.ppEnabledLayerNames     = enabled_layers.empty() ? nullptr : enabled_layers.data();
    create_info.enabledExtensionCount   = static_cast<std::uint32_t>(enabled_extensions.size());
    create_info.ppEnabledExtensionNames = enabled_extensions.empty() ? nullptr : enabled_extensions.data();

    VkInstance     instance = VK_NULL_HANDLE;
    const VkResult result   = vkCreateInstance(&create_info, nullptr, &instance);
    if(result != VK_SUCCESS)
    {
        return std::unexpected(make_error("vkCreateInstance failed", result, {"vkCreateInstance"}));
    }

    VkDebugUtilsMessengerEXT debug_messenger = VK_NULL_HANDLE;
    if(info.enable_validation && debug_utils)
    {
        VkDebugUtilsMessengerCreateInfoEXT messenger_info{};
        messenger_info.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
        messenger_info.messageSeverity =
            VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
        messenger_info.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
                                     VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT |
                                     VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
        messenger_info.pfnUserCallback = [](VkDebugUtilsMessageSeverityFlagBitsEXT severity,
                                            VkDebugUtilsMessageTypeFlagsEXT,
                                            const VkDebugUtilsMessengerCallbackDataEXT *callback_data,
                                            void *) -> VkBool32 {
            const auto level = severity >= VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT ? common::LogLevel::Error
                                                                                          : common::LogLevel::Warn;
            common::log(level, "[tio::gpu::validation]", "{}", callback_data->pMessage);
            return VK_FALSE;
        };

        const auto create_messenger = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(instance, "vkCreateDebugUtilsMessengerEXT"));
        if(create_messenger != nullptr &&
           create_messenger(instance, &messenger_info, nullptr, &debug_messenger) != VK_SUCCESS)
        {
            common::log(common::LogLevel::Warn, kLogChannel, "debug messenger creation failed, continuing without");
            debug_messenger = VK_NULL_HANDLE;
        }
    }

    return std::tuple{instance, debug_messenger};
}

struct DeviceSelection
{
    VkPhysicalDevice physical{VK_NULL_HANDLE};
    VkDevice         logical{VK_NULL_HANDLE};
    DeviceSummary    summary;
    QueueInfo        queue;
};

[[nodiscard]] auto build_device(const ContextCreateInfo &info, VkInstance instance)
    -> std::expected<DeviceSelection, VulkanError>
{
    std::uint32_t physical_count = 0U;
    vkEnumeratePhysicalDevices(instance, &physical_count, nullptr);
    if(physical_count == 0U)
    {
        return std::unexpected(
            make_error("vkEnumeratePhysicalDevices returned zero devices", {"vkEnumeratePhysicalDevices"}));
    }
    std::vector<VkPhysicalDevice> physical_devices(physical_count);
    vkEnumeratePhysicalDevices(instance, &physical_count, physical_devices.data());

    struct Candidate
    {
        VkPhysicalDevice           physical{VK_NULL_HANDLE};
        VkPhysicalDeviceProperties properties{};
        QueueInfo                  queue;
        std::uint32_t              score{0U};
    };

    std::vector<Candidate> candidates;
    candidates.reserve(physical_devices.size());
    for(VkPhysicalDevice device : physical_devices)
    {
        VkPhysicalDeviceProperties props{};
        vkGetPhysicalDeviceProperties(device, &props);
        if(props.apiVersion < VK_API_VERSION_1_2)
        {
            continue;
        }
        auto queue = pick_compute_queue_family(device);
        if(!queue)
        {
            continue;
        }
        candidates.push_back(Candidate{device, props, *queue, score_device(props)});
    }

    if(candidates.empty())
    {
        return std::unexpected(make_error("no Vulkan 1.2 device with a compute queue", {"device enumeration"}));
    }

    auto chosen_it = candidates.end();
    if(!info.preferred_device_substring.empty())
    {
        chosen_it = std::ranges::find_if(candidates, [&](const Candidate &candidate) {
            return std::string_view{candidate.properties.deviceName}.find(info.preferred_device_substring) !=
                   std::string_view::npos;
        });
        if(chosen_it == candidates.end())
        {
            common::log(common::LogLevel::Warn, kLogChannel, "no device matches '{}', picking by score",
                        info.preferred_device_substring);
        }
    }
    if(chosen_it == candidates.end())
    {
        chosen_it = std::ranges::max_element(candidates, {}, &Candidate::score);
    }
    const Candidate &chosen = *chosen_it;

    const float             queue_priority = 1.0F;
    VkDeviceQueueCreateInfo queue_info{};
    queue_info.sType            = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
    queue_info.queueFamilyIndex = chosen.queue.family_index;
    queue_info.queueCount       = 1U;
    queue_info.pQueuePriorities = &queue_priority;

    VkDeviceCreateInfo device_info{};
    device_info.sType                = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    device_info.queueCreateInfoCount = 1U;
    device_info.pQueueCreateInfos    = &queue_info;

    VkDevice       device        = VK_NULL_HANDLE;
    const VkResult create_result = vkCreateDevice(chosen.physical, &device_info, nullptr, &device);
    if(create_result != VK_SUCCESS)
    {
        return std::unexpected(make_error("vkCreateDevice failed", create_result, {"vkCreateDevice"}));
    }

    QueueInfo queue = chosen.queue;
    vkGetDeviceQueue(device, queue.family_index, queue.queue_index, &queue.queue);

    DeviceSelection selection{};
    selection.physical                          = chosen.physical;
    selection.logical                           = device;
    selection.queue                             = queue;
    selection.summary.name                      = chosen.properties.deviceName;
    selection.summary.api_version               = chosen.properties.apiVersion;
    selection.summary.driver_version            = chosen.properties.driverVersion;
    selection.summary.type                      = chosen.properties.deviceType;
    selection.summary.vendor_id                 = chosen.properties.vendorID;
    selection.summary.max_workgroup_invocations = chosen.properties.limits.maxComputeWorkGroupInvocations;
    return selection;
}

[[nodiscard]] auto create_allocator(VkInstance instance, VkPhysicalDevice physical_device, VkDevice device)
    -> std::expected<VmaAllocator, VulkanError>
{
    VmaVulkanFunctions functions{};
    functions.vkGetInstanceProcAddr = &vkGetInstanceProcAddr;
    functions.vkGetDeviceProcAddr   = &vkGetDeviceProcAddr;

    VmaAllocatorCreateInfo create_info{};
    create_info.instance         = instance;
    create_info.physicalDevice   = physical_device;
    create_info.device           = device;
    create_info.vulkanApiVersion = VK_API_VERSION_1_2;
    create_info.pVulkanFunctions = &functions;

    VmaAllocator   allocator = VK_NULL_HANDLE;
    const VkResult result    = vmaCreateAllocator(&create_info, &allocator);
    if(result != VK_SUCCESS)
    {
        return std::unexpected(make_error("vmaCreateAllocator failed", result, {"vmaCreateAllocator"}));
    }
    return allocator;
}

} // namespace

auto VulkanContext::create(const ContextCreateInfo &info) -> std::expected<VulkanContext, VulkanError>
{
    auto instance_result = build_instance(info);
    if(!instance_result)
    {
        return std::unexpected(instance_result.error());
    }
    auto [instance, messenger] = *instance_result;

    auto device_result = build_device(info, instance);
    if(!device_result)
    {
        destroy_messenger(instance, messenger);
        vkDestroyInstance(instance, nullptr);
        return std::unexpected(device_result.error());
    }
    auto selection = std::move(*device_result);

    auto allocator_result = create_allocator(instance, selection.physical, selection.logical);
    if(!allocator_result)
    {
        vkDestroyDevice(selection.logical, nullptr);
        destroy_messenger(instance, messenger);
        vkDestroyInstance(instance, nullptr);
        return std::unexpected(allocator_result.error());
    }

    VulkanContext context;
    context.instance_        = instance;
    context.debug_messenger_ = messenger;
    context.physical_device_ = selection.physical;
    context.device_          = selection.logical;
    context.allocator_       = *allocator_result;
    context.queue_info_      = selection.queue;
    context.summary_         = std::move(selection.summary);

    context.set_object_name_fn_ = reinterpret_cast<PFN_vkSetDebugUtilsObjectNameEXT>(
        vkGetDeviceProcAddr(context.device_, "vkSetDebugUtilsObjectNameEXT"));
    context.begin_label_fn_ = reinterpret_cast<PFN_vkCmdBeginDebugUtilsLabelEXT>(
        vkGetDeviceProcAddr(context.device_, "vkCmdBeginDebugUtilsLabelEXT"));
    context.end_label_fn_ = reinterpret_cast<PFN_vkCmdEndDebugUtilsLabelEXT>(
        vkGetDeviceProcAddr(context.device_, "vkCmdEndDebugUtilsLabelEXT"));

    context.set_object_name(reinterpret_cast<std::uint64_t>(context.queue_info_.queue), VK_OBJECT_TYPE_QUEUE,
                            "tio/compute-queue");

    common::log(common::LogLevel::Info, kLogChannel, "selected device: {} (vendor 0x{:04x}, type {}, api {} / driver {})",
                context.summary_.name, context.summary_.vendor_id, device_type_to_string(context.summary_.type),
                version_to_string(context.summary_.api_version), version_to_string(context.summary_.driver_version));
    common::log(common::LogLevel::Debug, kLogChannel, "compute queue family {}, max workgroup invocations {}",
                context.queue_info_.family_index, context.summary_.max_workgroup_invocations);
    return context;
}

VulkanContext::VulkanContext(VulkanContext &&other) noexcept
{
    *this = std::move(other);
}

auto VulkanContext::operator=(VulkanContext &&other) noexcept -> VulkanContext &
{
    if(this != &other)
    {
        destroy();
        instance_           = std::exchange(other.instance_, VK_NULL_HANDLE);
        debug_messenger_    = std::exchange(other.debug_messenger_, VK_NULL_HANDLE);
        physical_device_    = std::exchange(other.physical_device_, VK_NULL_HANDLE);
        device_             = std::exchange(other.device_, VK_NULL_HANDLE);
        allocator_          = std::exchange(other.allocator_, VK_NULL_HANDLE);
        queue_info_         = std::exchange(other.queue_info_, QueueInfo{});
        summary_            = std::exchange(other.summary_, DeviceSummary{});
        set_object_name_fn_ = std::exchange(other.set_object_name_fn_, nullptr);
        begin_label_fn_     = std::exchange(other.begin_label_fn_, nullptr);
        end_label_fn_       = std::exchange(other.end_label_fn_, nullptr);
    }
    return *this;
}

VulkanContext::~VulkanContext()
{
    destroy();
}

void VulkanContext::set_object_name(std::uint64_t handle, VkObjectType type, std::string_view name) const
{
    if(set_object_name_fn_ == nullptr || handle == 0U)
    {
        return;
    }
    const std::string             owned{name};
    VkDebugUtilsObjectNameInfoEXT info{};
    info.sType        = VK_STRUCTURE_TYPE_DEBUG_UTILS_OBJECT_NAME_INFO_EXT;
    info.objectType   = type;
    info.objectHandle = handle;
    info.pObjectName  = owned.c_str();
    set_object_name_fn_(device_, &info);
}

void VulkanContext::push_debug_label(VkCommandBuffer cmd, std::string_view name, std::array<float, 4U> color) const
{
    if(begin_label_fn_ == nullptr)
    {
        return;
    }
    const std::string    owned{name};
    VkDebugUtilsLabelEXT label{};
    label.sType      = VK_STRUCTURE_TYPE_DEBUG_UTILS_LABEL_EXT;
    label.pLabelName = owned.c_str();
    std::ranges::copy(color, label.color);
    begin_label_fn_(cmd, &label);
}

void VulkanContext::pop_debug_label(VkCommandBuffer cmd) const
{
    if(end_label_fn_ == nullptr)
    {
        return;
    }
    end_label_fn_(cmd);
}

void VulkanContext::destroy()
{
    if(allocator_ != VK_NULL_HANDLE)
    {
        vmaDestroyAllocator(allocator_);
        allocator_ = VK_NULL_HANDLE;
    }
    if(device_ != VK_NULL_HANDLE)
    {
        vkDestroyDevice(device_, nullptr);
        device_ = VK_NULL_HANDLE;
    }
    if(instance_ != VK_NULL_HANDLE)
    {
        destroy_messenger(instance_, debug_messenger_);
        debug_messenger_ = VK_NULL_HANDLE;
        vkDestroyInstance(instance_, nullptr);
        instance_ = VK_NULL_HANDLE;
    }
}

} // namespace tio::gpu
