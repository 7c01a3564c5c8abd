/**
 * @file vulkan_backend.cpp
 * @brief descriptor plumbing, VMA buffers and dispatch for the two field kernels
 */
#include "tio/gpu/vulkan_backend.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <limits>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "tio/common/log.hpp"

#include "vk_mem_alloc.h"

#ifndef TIO_SHADER_DIR
#define TIO_SHADER_DIR "shaders"
#endif

namespace tio::gpu
{
namespace
{

constexpr std::string_view kLogChannel = "[tio::gpu]";
constexpr auto             kWaveSize   = 64U;

/// mirrors `FieldParams` in both compute shaders
struct alignas(16) FieldUniform
{
    std::uint32_t electrode_count{0U};
    std::uint32_t element_count{0U};
    std::uint32_t output_count{0U};
    std::uint32_t use_indices{0U};
    float         scale{0.0F};
    float         epsilon{0.0F};
    float         padding0{0.0F};
    float         padding1{0.0F};
};

struct MappedBuffer
{
    VkBuffer      buffer{VK_NULL_HANDLE};
    VmaAllocation allocation{VK_NULL_HANDLE};
    VkDeviceSize  size{0U};
    void         *mapped{nullptr};
};

inline auto ceil_divide(std::uint32_t numerator, std::uint32_t denominator) noexcept -> std::uint32_t
{
    return static_cast<std::uint32_t>((numerator + denominator - 1U) / denominator);
}

[[nodiscard]] auto make_error(std::string message, std::initializer_list<std::string> ctx) -> compute::BackendError
{
    compute::BackendError err{};
    err.message = std::move(message);
    err.context.assign(ctx.begin(), ctx.end());
    return err;
}

/// same checks and messages as field::contract_leadfield so callers see one error shape
[[nodiscard]] auto validate_request(const leadfield::LeadfieldMatrix &leadfield, std::span<const double> stim,
                                    std::optional<std::span<const std::size_t>> indices)
    -> std::expected<void, field::FieldError>
{
    if (stim.size() != leadfield.electrode_count())
    {
        return std::unexpected(field::FieldError{fmt::format("stimulation pattern has {} entries, leadfield has {} electrodes",
                                                             stim.size(), leadfield.electrode_count()),
                                                 {"contract_leadfield", "stim"}});
    }
    if (indices)
    {
        for (std::size_t i = 0; i < indices->size(); ++i)
        {
            if ((*indices)[i] >= leadfield.element_count())
            {
                return std::unexpected(field::FieldError{
                    fmt::format("element index {} out of range ({} elements)", (*indices)[i], leadfield.element_count()),
                    {"contract_leadfield", fmt::format("indices[{}]", i)}});
            }
        }
    }
    return {};
}

} // namespace

class VulkanBackend::Runtime
{
public:
    static auto create(const VulkanContext &context, const leadfield::LeadfieldMatrix &leadfield,
                       const std::filesystem::path &shader_directory)
        -> std::expected<std::unique_ptr<Runtime>, compute::BackendError>
    {
        auto ptr = std::unique_ptr<Runtime>(new Runtime(context, leadfield));
        if (auto init = ptr->initialize(shader_directory); !init)
        {
            return std::unexpected(init.error());
        }
        return ptr;
    }

    Runtime(const Runtime &)                     = delete;
    auto operator=(const Runtime &) -> Runtime & = delete;

    ~Runtime() { destroy(); }

    /// contracts `stim` into field slot `slot` (0 or 1), pattern + indices already validated
    [[nodiscard]] auto run_contract(std::size_t slot, std::span<const double> stim,
                                    std::optional<std::span<const std::size_t>> indices)
        -> std::expected<std::uint32_t, compute::BackendError>;

    /// envelope of field slots 0 and 1 over `count` entries
    [[nodiscard]] auto run_envelope(std::uint32_t count) -> std::expected<void, compute::BackendError>;

    [[nodiscard]] auto upload_fields(std::span<const common::Vec3> e1, std::span<const common::Vec3> e2)
        -> std::expected<void, compute::BackendError>;

    [[nodiscard]] auto read_field(std::size_t slot, std::uint32_t count)
        -> std::expected<std::vector<common::Vec3>, compute::BackendError>;

    [[nodiscard]] auto read_envelope(std::uint32_t count) -> std::expected<std::vector<double>, compute::BackendError>;

private:
    Runtime(const VulkanContext &context, const leadfield::LeadfieldMatrix &leadfield)
        : context_{&context}, electrode_count_{static_cast<std::uint32_t>(leadfield.electrode_count())},
          element_count_{static_cast<std::uint32_t>(leadfield.element_count())}, leadfield_{&leadfield}
    {
    }

    auto initialize(const std::filesystem::path &shader_directory) -> std::expected<void, compute::BackendError>;
    void destroy();

    auto create_command_resources() -> std::expected<void, compute::BackendError>;
    auto create_descriptor_layouts() -> std::expected<void, compute::BackendError>;
    auto create_buffer(VkDeviceSize size, VkBufferUsageFlags usage, std::string_view name, MappedBuffer &out)
        -> std::expected<void, compute::BackendError>;
    auto allocate_fixed_buffers() -> std::expected<void, compute::BackendError>;
    auto ensure_capacity(std::uint32_t count) -> std::expected<void, compute::BackendError>;
    auto create_descriptor_pool_and_sets() -> std::expected<void, compute::BackendError>;
    void write_descriptor_sets();
    auto create_pipelines(const std::filesystem::path &shader_directory) -> std::expected<void, compute::BackendError>;
    auto write_uniform(std::uint32_t output_count, bool use_indices) -> std::expected<void, compute::BackendError>;
    [[nodiscard]] auto dispatch(VkPipeline pipeline, VkDescriptorSet storage_set, std::uint32_t group_count,
                                std::string_view label) -> std::expected<void, compute::BackendError>;
    [[nodiscard]] auto load_shader_module(const std::filesystem::path &path, VkShaderModule *out_module)
        -> std::expected<void, compute::BackendError>;
    [[nodiscard]] auto flush(const MappedBuffer &buffer, VkDeviceSize size) -> std::expected<void, compute::BackendError>;
    [[nodiscard]] auto invalidate(const MappedBuffer &buffer, VkDeviceSize size)
        -> std::expected<void, compute::BackendError>;
    void destroy_buffer(MappedBuffer &buffer);

    const VulkanContext                *context_{};
    std::uint32_t                       electrode_count_{0U};
    std::uint32_t                       element_count_{0U};
    const leadfield::LeadfieldMatrix   *leadfield_{};
    std::uint32_t                       capacity_{0U};

    VkCommandPool   command_pool_{VK_NULL_HANDLE};
    VkCommandBuffer command_buffer_{VK_NULL_HANDLE};

    VkDescriptorSetLayout uniform_layout_{VK_NULL_HANDLE};
    VkDescriptorSetLayout storage_layout_{VK_NULL_HANDLE};
    VkPipelineLayout      pipeline_layout_{VK_NULL_HANDLE};

    VkDescriptorPool               descriptor_pool_{VK_NULL_HANDLE};
    VkDescriptorSet                uniform_set_{VK_NULL_HANDLE};
    std::array<VkDescriptorSet, 2> contract_sets_{VK_NULL_HANDLE, VK_NULL_HANDLE};
    VkDescriptorSet                envelope_set_{VK_NULL_HANDLE};

    VkShaderModule contract_module_{VK_NULL_HANDLE};
    VkShaderModule envelope_module_{VK_NULL_HANDLE};
    VkPipeline     contract_pipeline_{VK_NULL_HANDLE};
    VkPipeline     envelope_pipeline_{VK_NULL_HANDLE};

    MappedBuffer                uniform_{};
    MappedBuffer                leadfield_buffer_{};
    std::array<MappedBuffer, 2> stim_{};
    MappedBuffer                indices_{};
    std::array<MappedBuffer, 2> field_{};
    MappedBuffer                envelope_{};
};

auto VulkanBackend::Runtime::initialize(const std::filesystem::path &shader_directory)
    -> std::expected<void, compute::BackendError>
{
    if (auto status = create_command_resources(); !status)
    {
        return status;
    }
    if (auto status = allocate_fixed_buffers(); !status)
    {
        return status;
    }
    if (auto status = create_descriptor_layouts(); !status)
    {
        return status;
    }
    if (auto status = create_descriptor_pool_and_sets(); !status)
    {
        return status;
    }
    if (auto status = ensure_capacity(element_count_); !status)
    {
        return status;
    }
    return create_pipelines(shader_directory);
}

void VulkanBackend::Runtime::destroy_buffer(MappedBuffer &buffer)
{
    if (buffer.buffer != VK_NULL_HANDLE)
    {
        vmaDestroyBuffer(context_->allocator(), buffer.buffer, buffer.allocation);
    }
    buffer = MappedBuffer{};
}

void VulkanBackend::Runtime::destroy()
{
    if (context_ == nullptr)
    {
        return;
    }
    const VkDevice device = context_->device();

    if (command_buffer_ != VK_NULL_HANDLE && command_pool_ != VK_NULL_HANDLE)
    {
        vkFreeCommandBuffers(device, command_pool_, 1U, &command_buffer_);
        command_buffer_ = VK_NULL_HANDLE;
    }
    if (command_pool_ != VK_NULL_HANDLE)
    {
        vkDestroyCommandPool(device, command_pool_, nullptr);
        command_pool_ = VK_NULL_HANDLE;
    }
    for (VkPipeline *pipeline : {&contract_pipeline_, &envelope_pipeline_})
    {
        if (*pipeline != VK_NULL_HANDLE)
        {
            vkDestroyPipeline(device, *pipeline, nullptr);
            *pipeline = VK_NULL_HANDLE;
        }
    }
    for (VkShaderModule *module : {&contract_module_, &envelope_module_})
    {
        if (*module != VK_NULL_HANDLE)
        {
            vkDestroyShaderModule(device, *module, nullptr);
            *module = VK_NULL_HANDLE;
        }
    }
    if (pipeline_layout_ != VK_NULL_HANDLE)
    {
        vkDestroyPipelineLayout(device, pipeline_layout_, nullptr);
        pipeline_layout_ = VK_NULL_HANDLE;
    }
    for (VkDescriptorSetLayout *layout : {&uniform_layout_, &storage_layout_})
    {
        if (*layout != VK_NULL_HANDLE)
        {
            vkDestroyDescriptorSetLayout(device, *layout, nullptr);
            *layout = VK_NULL_HANDLE;
        }
    }
    if (descriptor_pool_ != VK_NULL_HANDLE)
    {
        vkDestroyDescriptorPool(device, descriptor_pool_, nullptr);
        descriptor_pool_ = VK_NULL_HANDLE;
    }

    destroy_buffer(uniform_);
    destroy_buffer(leadfield_buffer_);
    destroy_buffer(stim_[0]);
    destroy_buffer(stim_[1]);
    destroy_buffer(indices_);
    destroy_buffer(field_[0]);
    destroy_buffer(field_[1]);
    destroy_buffer(envelope_);

    context_ = nullptr;
}

auto VulkanBackend::Runtime::create_command_resources() -> std::expected<void, compute::BackendError>
{
    VkCommandPoolCreateInfo pool_info{};
    pool_info.sType            = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    pool_info.queueFamilyIndex = context_->queue_info().family_index;
    pool_info.flags            = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;

    if (const VkResult pool_result = vkCreateCommandPool(context_->device(), &pool_info, nullptr, &command_pool_);
        pool_result != VK_SUCCESS)
    {
        return std::unexpected(make_error("vkCreateCommandPool failed", {"gpu_runtime"}));
    }

    VkCommandBufferAllocateInfo alloc_info{};
    alloc_info.sType              = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    alloc_info.commandPool        = command_pool_;
    alloc_info.level              = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    alloc_info.commandBufferCount = 1U;

    if (const VkResult alloc_result = vkAllocateCommandBuffers(context_->device(), &alloc_info, &command_buffer_);
        alloc_result != VK_SUCCESS)
    {
        return std::unexpected(make_error("vkAllocateCommandBuffers failed", {"gpu_runtime"}));
    }

    context_->set_object_name(reinterpret_cast<std::uint64_t>(command_pool_), VK_OBJECT_TYPE_COMMAND_POOL,
                              "tio_field_command_pool");
    context_->set_object_name(reinterpret_cast<std::uint64_t>(command_buffer_), VK_OBJECT_TYPE_COMMAND_BUFFER,
                              "tio_field_command_buffer");
    return {};
}

auto VulkanBackend::Runtime::create_descriptor_layouts() -> std::expected<void, compute::BackendError>
{
    const VkDescriptorSetLayoutBinding uniform_binding{
        .binding            = 0U,
        .descriptorType     = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER,
        .descriptorCount    = 1U,
        .stageFlags         = VK_SHADER_STAGE_COMPUTE_BIT,
        .pImmutableSamplers = nullptr,
    };

    VkDescriptorSetLayoutCreateInfo uniform_info{};
    uniform_info.sType        = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    uniform_info.bindingCount = 1U;
    uniform_info.pBindings    = &uniform_binding;

    if (const VkResult result = vkCreateDescriptorSetLayout(context_->device(), &uniform_info, nullptr, &uniform_layout_);
        result != VK_SUCCESS)
    {
        return std::unexpected(make_error("vkCreateDescriptorSetLayout failed (uniform)", {"gpu_runtime"}));
    }

    std::array<VkDescriptorSetLayoutBinding, 4U> storage_bindings{};
    for (std::uint32_t index = 0U; index < storage_bindings.size(); ++index)
    {
        storage_bindings[index] = VkDescriptorSetLayoutBinding{
            .binding            = index,
            .descriptorType     = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER,
            .descriptorCount    = 1U,
            .stageFlags         = VK_SHADER_STAGE_COMPUTE_BIT,
            .pImmutableSamplers = nullptr,
        };
    }

    VkDescriptorSetLayoutCreateInfo storage_info{};
    storage_info.sType        = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
    storage_info.bindingCount = static_cast<std::uint32_t>(storage_bindings.size());
    storage_info.pBindings    = storage_bindings.data();

    if (const VkResult result = vkCreateDescriptorSetLayout(context_->device(), &storage_info, nullptr, &storage_layout_);
        result != VK_SUCCESS)
    {
        return std::unexpected(make_error("vkCreateDescriptorSetLayout failed (storage)", {"gpu_runtime"}));
    }

    const std::array<VkDescriptorSetLayout, 2U> layouts{uniform_layout_, storage_layout_};

    VkPipelineLayoutCreateInfo pipeline_layout_info{};
    pipeline_layout_info.sType          = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
    pipeline_layout_info.setLayoutCount = static_cast<std::uint32_t>(layouts.size());
    pipeline_layout_info.pSetLayouts    = layouts.data();

    if (const VkResult result =
            vkCreatePipelineLayout(context_->device(), &pipeline_layout_info, nullptr, &pipeline_layout_);
        result != VK_SUCCESS)
    {
        return std::unexpected(make_error("vkCreatePipelineLayout failed", {"gpu_runtime"}));
    }
    context_->set_object_name(reinterpret_cast<std::uint64_t>(pipeline_layout_), VK_OBJECT_TYPE_PIPELINE_LAYOUT,
                              "tio_field_pipeline_layout");
    return {};
}

auto VulkanBackend::Runtime::create_buffer(VkDeviceSize size, VkBufferUsageFlags usage, std::string_view name,
                                           MappedBuffer &out) -> std::expected<void, compute::BackendError>
{
    VkBufferCreateInfo buffer_info{};
    buffer_info.sType       = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    buffer_info.size        = std::max<VkDeviceSize>(size, 16U);
    buffer_info.usage       = usage;
    buffer_info.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    VmaAllocationCreateInfo alloc_info{};
    alloc_info.flags         = VMA_ALLOCATION_CREATE_HOST_ACCESS_RANDOM_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
    alloc_info.usage         = VMA_MEMORY_USAGE_AUTO_PREFER_HOST;
    alloc_info.requiredFlags = VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT;

    VmaAllocationInfo allocation_info{};
    const VkResult    result = vmaCreateBuffer(context_->allocator(), &buffer_info, &alloc_info, &out.buffer,
                                               &out.allocation, &allocation_info);
    if (result != VK_SUCCESS)
    {
        return std::unexpected(make_error("vmaCreateBuffer failed", {std::string{name}, "gpu_runtime"}));
    }
    out.size   = buffer_info.size;
    out.mapped = allocation_info.pMappedData;
    if (out.mapped == nullptr)
    {
        return std::unexpected(make_error("buffer mapping returned null pointer", {std::string{name}, "gpu_runtime"}));
    }
    context_->set_object_name(reinterpret_cast<std::uint64_t>(out.buffer), VK_OBJECT_TYPE_BUFFER, name);
    return {};
}

auto VulkanBackend::Runtime::allocate_fixed_buffers() -> std::expected<void, compute::BackendError>
{
    if (auto status = create_buffer(sizeof(FieldUniform), VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT, "tio_field_uniform",
                                    uniform_);
        !status)
    {
        return status;
    }

    const auto values = leadfield_->data();
    if (auto status = create_buffer(values.size_bytes(), VK_BUFFER_USAGE_STORAGE_BUFFER_BIT, "tio_field_leadfield",
                                    leadfield_buffer_);
        !status)
    {
        return status;
    }
    std::memcpy(leadfield_buffer_.mapped, values.data(), values.size_bytes());
    if (auto status = flush(leadfield_buffer_, values.size_bytes()); !status)
    {
        return status;
    }

    const VkDeviceSize stim_bytes = static_cast<VkDeviceSize>(electrode_count_) * sizeof(float);
    if (auto status = create_buffer(stim_bytes, VK_BUFFER_USAGE_STORAGE_BUFFER_BIT, "tio_field_stim_ch1", stim_[0]);
        !status)
    {
        return status;
    }
    return create_buffer(stim_bytes, VK_BUFFER_USAGE_STORAGE_BUFFER_BIT, "tio_field_stim_ch2", stim_[1]);
}

auto VulkanBackend::Runtime::ensure_capacity(std::uint32_t count) -> std::expected<void, compute::BackendError>
{
    if (count <= capacity_ && indices_.buffer != VK_NULL_HANDLE)
    {
        return {};
    }
    const std::uint32_t capacity = std::max({count, capacity_, 1U});
    destroy_buffer(indices_);
    destroy_buffer(field_[0]);
    destroy_buffer(field_[1]);
    destroy_buffer(envelope_);

    const VkBufferUsageFlags storage_usage = VK_BUFFER_USAGE_STORAGE_BUFFER_BIT;
    const VkDeviceSize       vector_bytes  = static_cast<VkDeviceSize>(capacity) * 3U * sizeof(float);
    if (auto status = create_buffer(static_cast<VkDeviceSize>(capacity) * sizeof(std::uint32_t), storage_usage,
                                    "tio_field_indices", indices_);
        !status)
    {
        return status;
    }
    if (auto status = create_buffer(vector_bytes, storage_usage, "tio_field_e1", field_[0]); !status)
    {
        return status;
    }
    if (auto status = create_buffer(vector_bytes, storage_usage, "tio_field_e2", field_[1]); !status)
    {
        return status;
    }
    if (auto status = create_buffer(static_cast<VkDeviceSize>(capacity) * sizeof(float), storage_usage,
                                    "tio_field_envelope", envelope_);
        !status)
    {
        return status;
    }
    capacity_ = capacity;
    write_descriptor_sets();
    return {};
}

auto VulkanBackend::Runtime::create_descriptor_pool_and_sets() -> std::expected<void, compute::BackendError>
{
    const std::array<VkDescriptorPoolSize, 2U> pool_sizes{
        VkDescriptorPoolSize{.type = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, .descriptorCount = 1U},
        VkDescriptorPoolSize{.type = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, .descriptorCount = 12U},
    };

    VkDescriptorPoolCreateInfo pool_info{};
    pool_info.sType         = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
    pool_info.maxSets       = 4U;
    pool_info.poolSizeCount = static_cast<std::uint32_t>(pool_sizes.size());
    pool_info.pPoolSizes    = pool_sizes.data();

    if (const VkResult result = vkCreateDescriptorPool(context_->device(), &pool_info, nullptr, &descriptor_pool_);
        result != VK_SUCCESS)
    {
        return std::unexpected(make_error("vkCreateDescriptorPool failed", {"gpu_runtime"}));
    }

    const std::array<VkDescriptorSetLayout, 4U> layouts{uniform_layout_, storage_layout_, storage_layout_,
                                                        storage_layout_};

    VkDescriptorSetAllocateInfo alloc_info{};
    alloc_info.sType              = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
    alloc_info.descriptorPool     = descriptor_pool_;
    alloc_info.descriptorSetCount = static_cast<std::uint32_t>(layouts.size());
    alloc_info.pSetLayouts        = layouts.data();

    std::array<VkDescriptorSet, 4U> sets{};
    if (const VkResult result = vkAllocateDescriptorSets(context_->device(), &alloc_info, sets.data());
        result != VK_SUCCESS)
    {
        return std::unexpected(make_error("vkAllocateDescriptorSets failed", {"gpu_runtime"}));
    }
    uniform_set_      = sets[0];
    contract_sets_[0] = sets[1];
    contract_sets_[1] = sets[2];
    envelope_set_     = sets[3];
    return {};
}

void VulkanBackend::Runtime::write_descriptor_sets()
{
    const auto buffer_info = [](const MappedBuffer &buffer) {
        return VkDescriptorBufferInfo{
            .buffer = buffer.buffer,
            .offset = 0U,
            .range  = buffer.size,
        };
    };

    // infos must outlive vkUpdateDescriptorSets, so they live in a fixed array
    const std::array<VkDescriptorBufferInfo, 8U> infos{
        buffer_info(uniform_),  buffer_info(leadfield_buffer_), buffer_info(stim_[0]),  buffer_info(stim_[1]),
        buffer_info(indices_),  buffer_info(field_[0]),         buffer_info(field_[1]), buffer_info(envelope_),
    };
    enum Slot : std::size_t
    {
        kUniform,
        kLeadfield,
        kStim1,
        kStim2,
        kIndices,
        kField1,
        kField2,
        kEnvelope
    };

    std::vector<VkWriteDescriptorSet> writes{};
    writes.reserve(13U);
    const auto add_write = [&writes, &infos](VkDescriptorSet set, std::uint32_t binding, VkDescriptorType type,
                                             std::size_t slot) {
        VkWriteDescriptorSet write{};
        write.sType           = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        write.dstSet          = set;
        write.dstBinding      = binding;
        write.dstArrayElement = 0U;
        write.descriptorCount = 1U;
        write.descriptorType  = type;
        write.pBufferInfo     = &infos[slot];
        writes.emplace_back(write);
    };

    add_write(uniform_set_, 0U, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, kUniform);

    constexpr auto storage = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
    add_write(contract_sets_[0], 0U, storage, kLeadfield);
    add_write(contract_sets_[0], 1U, storage, kStim1);
    add_write(contract_sets_[0], 2U, storage, kIndices);
    add_write(contract_sets_[0], 3U, storage, kField1);
    add_write(contract_sets_[1], 0U, storage, kLeadfield);
    add_write(contract_sets_[1], 1U, storage, kStim2);
    add_write(contract_sets_[1], 2U, storage, kIndices);
    add_write(contract_sets_[1], 3U, storage, kField2);
    add_write(envelope_set_, 0U, storage, kField1);
    add_write(envelope_set_, 1U, storage, kField2);
    add_write(envelope_set_, 2U, storage, kEnvelope);
    add_write(envelope_set_, 3U, storage, kIndices);

    vkUpdateDescriptorSets(context_->device(), static_cast<std::uint32_t>(writes.size()), writes.data(), 0U, nullptr);
}

auto VulkanBackend::Runtime::load_shader_module(const std::filesystem::path &path, VkShaderModule *out_module)
    -> std::expected<void, compute::BackendError>
{
    std::ifstream file{path, std::ios::binary | std::ios::ate};
    if (!file)
    {
        return std::unexpected(make_error("failed to open shader", {path.string()}));
    }
    const auto size = static_cast<std::streamsize>(file.tellg());
    if (size <= 0)
    {
        return std::unexpected(make_error("shader file empty", {path.string()}));
    }
    file.seekg(0, std::ios::beg);
    const auto byte_count = static_cast<std::size_t>(size);
    if ((byte_count % sizeof(std::uint32_t)) != 0U)
    {
        return std::unexpected(make_error("shader byte size misaligned", {path.string()}));
    }

    std::vector<std::uint32_t> words(byte_count / sizeof(std::uint32_t));
    if (!file.read(reinterpret_cast<char *>(words.data()), size))
    {
        return std::unexpected(make_error("failed to read shader", {path.string()}));
    }

    VkShaderModuleCreateInfo create_info{};
    create_info.sType    = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
    create_info.codeSize = byte_count;
    create_info.pCode    = words.data();

    if (const VkResult result = vkCreateShaderModule(context_->device(), &create_info, nullptr, out_module);
        result != VK_SUCCESS)
    {
        return std::unexpected(make_error("vkCreateShaderModule failed", {path.string()}));
    }
    return {};
}

auto VulkanBackend::Runtime::create_pipelines(const std::filesystem::path &shader_directory)
    -> std::expected<void, compute::BackendError>
{
    if (auto status = load_shader_module(shader_directory / "leadfield_contract.spv", &contract_module_); !status)
    {
        return status;
    }
    if (auto status = load_shader_module(shader_directory / "ti_envelope.spv", &envelope_module_); !status)
    {
        return status;
    }

    auto make_info = [this](VkShaderModule module) {
        VkPipelineShaderStageCreateInfo stage_info{};
        stage_info.sType  = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
        stage_info.stage  = VK_SHADER_STAGE_COMPUTE_BIT;
        stage_info.module = module;
        stage_info.pName  = "main";

        VkComputePipelineCreateInfo info{};
        info.sType  = VK_STRUCTURE_TYPE_COMPUTE_PIPELINE_CREATE_INFO;
        info.stage  = stage_info;
        info.layout = pipeline_layout_;
        return info;
    };

    const auto contract_info = make_info(contract_module_);
    const auto envelope_info = make_info(envelope_module_);

    if (const VkResult result = vkCreateComputePipelines(context_->device(), VK_NULL_HANDLE, 1U, &contract_info,
                                                         nullptr, &contract_pipeline_);
        result != VK_SUCCESS)
    {
        return std::unexpected(make_error("vkCreateComputePipelines failed (contract)", {"gpu_runtime"}));
    }
    if (const VkResult result = vkCreateComputePipelines(context_->device(), VK_NULL_HANDLE, 1U, &envelope_info,
                                                         nullptr, &envelope_pipeline_);
        result != VK_SUCCESS)
    {
        return std::unexpected(make_error("vkCreateComputePipelines failed (envelope)", {"gpu_runtime"}));
    }

    context_->set_object_name(reinterpret_cast<std::uint64_t>(contract_pipeline_), VK_OBJECT_TYPE_PIPELINE,
                              "tio_leadfield_contract");
    context_->set_object_name(reinterpret_cast<std::uint64_t>(envelope_pipeline_), VK_OBJECT_TYPE_PIPELINE,
                              "tio_ti_envelope");
    return {};
}

auto VulkanBackend::Runtime::flush(const MappedBuffer &buffer, VkDeviceSize size)
    -> std::expected<void, compute::BackendError>
{
    if (buffer.allocation == VK_NULL_HANDLE)
    {
        return {};
    }
    if (vmaFlushAllocation(context_->allocator(), buffer.allocation, 0U, size) != VK_SUCCESS)
    {
        return std::unexpected(make_error("vmaFlushAllocation failed", {"gpu_runtime"}));
    }
    return {};
}

auto VulkanBackend::Runtime::invalidate(const MappedBuffer &buffer, VkDeviceSize size)
    -> std::expected<void, compute::BackendError>
{
    if (buffer.allocation == VK_NULL_HANDLE)
    {
        return {};
    }
    if (vmaInvalidateAllocation(context_->allocator(), buffer.allocation, 0U, size) != VK_SUCCESS)
    {
        return std::unexpected(make_error("vmaInvalidateAllocation failed", {"gpu_runtime"}));
    }
    return {};
}

auto VulkanBackend::Runtime::write_uniform(std::uint32_t output_count, bool use_indices)
    -> std::expected<void, compute::BackendError>
{
    FieldUniform uniform{};
    uniform.electrode_count = electrode_count_;
    uniform.element_count   = element_count_;
    uniform.output_count    = output_count;
    uniform.use_indices     = use_indices ? 1U : 0U;
    uniform.scale           = static_cast<float>(field::kLeadfieldToVoltsPerMeter);
    uniform.epsilon         = static_cast<float>(field::kEnvelopeEpsilon);
    std::memcpy(uniform_.mapped, &uniform, sizeof(uniform));
    return flush(uniform_, sizeof(uniform));
}

auto VulkanBackend::Runtime::dispatch(VkPipeline pipeline, VkDescriptorSet storage_set, std::uint32_t group_count,
                                      std::string_view label) -> std::expected<void, compute::BackendError>
{
    if (group_count == 0U)
    {
        return {};
    }
    if (vkResetCommandBuffer(command_buffer_, 0U) != VK_SUCCESS)
    {
        return std::unexpected(make_error("vkResetCommandBuffer failed", {"gpu_runtime"}));
    }

    VkCommandBufferBeginInfo begin_info{};
    begin_info.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    begin_info.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    if (vkBeginCommandBuffer(command_buffer_, &begin_info) != VK_SUCCESS)
    {
        return std::unexpected(make_error("vkBeginCommandBuffer failed", {"gpu_runtime"}));
    }

    context_->push_debug_label(command_buffer_, label, {0.3F, 0.6F, 0.9F, 1.0F});
    vkCmdBindPipeline(command_buffer_, VK_PIPELINE_BIND_POINT_COMPUTE, pipeline);
    const std::array<VkDescriptorSet, 2U> sets{uniform_set_, storage_set};
    vkCmdBindDescriptorSets(command_buffer_, VK_PIPELINE_BIND_POINT_COMPUTE, pipeline_layout_, 0U,
                            static_cast<std::uint32_t>(sets.size()), sets.data(), 0U, nullptr);
    vkCmdDispatch(command_buffer_, group_count, 1U, 1U);
    context_->pop_debug_label(command_buffer_);

    if (vkEndCommandBuffer(command_buffer_) != VK_SUCCESS)
    {
        return std::unexpected(make_error("vkEndCommandBuffer failed", {"gpu_runtime"}));
    }

    VkSubmitInfo submit_info{};
    submit_info.sType              = VK_STRUCTURE_TYPE_SUBMIT_INFO;
    submit_info.commandBufferCount = 1U;
    submit_info.pCommandBuffers    = &command_buffer_;

    const VkQueue queue = context_->queue_info().queue;
    if (vkQueueSubmit(queue, 1U, &submit_info, VK_NULL_HANDLE) != VK_SUCCESS)
    {
        return std::unexpected(make_error("vkQueueSubmit failed", {"gpu_runtime"}));
    }
    if (vkQueueWaitIdle(queue) != VK_SUCCESS)
    {
        return std::unexpected(make_error("vkQueueWaitIdle failed", {"gpu_runtime"}));
    }
    return {};
}

auto VulkanBackend::Runtime::run_contract(std::size_t slot, std::span<const double> stim,
                                          std::optional<std::span<const std::size_t>> indices)
    -> std::expected<std::uint32_t, compute::BackendError>
{
    const auto count = static_cast<std::uint32_t>(indices ? indices->size() : element_count_);
    if (auto status = ensure_capacity(count); !status)
    {
        return std::unexpected(status.error());
    }

    auto *stim_values = static_cast<float *>(stim_[slot].mapped);
    for (std::size_t e = 0; e < stim.size(); ++e)
    {
        stim_values[e] = static_cast<float>(stim[e]);
    }
    if (auto status = flush(stim_[slot], stim.size() * sizeof(float)); !status)
    {
        return std::unexpected(status.error());
    }
    if (indices)
    {
        auto *index_values = static_cast<std::uint32_t *>(indices_.mapped);
        for (std::size_t k = 0; k < indices->size(); ++k)
        {
            index_values[k] = static_cast<std::uint32_t>((*indices)[k]);
        }
        if (auto status = flush(indices_, indices->size() * sizeof(std::uint32_t)); !status)
        {
            return std::unexpected(status.error());
        }
    }
    if (auto status = write_uniform(count, indices.has_value()); !status)
    {
        return std::unexpected(status.error());
    }
    if (auto status = dispatch(contract_pipeline_, contract_sets_[slot], ceil_divide(count, kWaveSize),
                               "Leadfield Contract");
        !status)
    {
        return std::unexpected(status.error());
    }
    return count;
}

auto VulkanBackend::Runtime::upload_fields(std::span<const common::Vec3> e1, std::span<const common::Vec3> e2)
    -> std::expected<void, compute::BackendError>
{
    if (auto status = ensure_capacity(static_cast<std::uint32_t>(e1.size())); !status)
    {
        return status;
    }
    const std::array<std::span<const common::Vec3>, 2U> sources{e1, e2};
    for (std::size_t slot = 0; slot < sources.size(); ++slot)
    {
        auto *values = static_cast<float *>(field_[slot].mapped);
        for (std::size_t k = 0; k < sources[slot].size(); ++k)
        {
            values[(k * 3U) + 0U] = static_cast<float>(sources[slot][k][0]);
            values[(k * 3U) + 1U] = static_cast<float>(sources[slot][k][1]);
            values[(k * 3U) + 2U] = static_cast<float>(sources[slot][k][2]);
        }
        if (auto status = flush(field_[slot], sources[slot].size() * 3U * sizeof(float)); !status)
        {
            return status;
        }
    }
    return {};
}

auto VulkanBackend::Runtime::run_envelope(std::uint32_t count) -> std::expected<void, compute::BackendError>
{
    if (auto status = write_uniform(count, false); !status)
    {
        return status;
    }
    return dispatch(envelope_pipeline_, envelope_set_, ceil_divide(count, kWaveSize), "TI Envelope");
}

auto VulkanBackend::Runtime::read_field(std::size_t slot, std::uint32_t count)
    -> std::expected<std::vector<common::Vec3>, compute::BackendError>
{
    if (auto status = invalidate(field_[slot], static_cast<VkDeviceSize>(count) * 3U * sizeof(float)); !status)
    {
        return std::unexpected(status.error());
    }
    const auto               *values = static_cast<const float *>(field_[slot].mapped);
    std::vector<common::Vec3> out(count);
    for (std::size_t k = 0; k < count; ++k)
    {
        out[k] = common::Vec3{values[(k * 3U) + 0U], values[(k * 3U) + 1U], values[(k * 3U) + 2U]};
    }
    return out;
}

auto VulkanBackend::Runtime::read_envelope(std::uint32_t count)
    -> std::expected<std::vector<double>, compute::BackendError>
{
    if (auto status = invalidate(envelope_, static_cast<VkDeviceSize>(count) * sizeof(float)); !status)
    {
        return std::unexpected(status.error());
    }
    const auto         *values = static_cast<const float *>(envelope_.mapped);
    std::vector<double> out(values, values + count);
    return out;
}

VulkanBackend::VulkanBackend(VulkanContext context, std::shared_ptr<const leadfield::LeadfieldMatrix> leadfield)
    : context_{std::move(context)}, leadfield_{std::move(leadfield)}
{
}

VulkanBackend::~VulkanBackend()
{
    // runtime objects belong to context_'s device and must go first
    runtime_.reset();
}

auto VulkanBackend::create(const config::ExecutionSettings &settings,
                           std::shared_ptr<const leadfield::LeadfieldMatrix> leadfield)
    -> std::expected<std::unique_ptr<VulkanBackend>, compute::BackendError>
{
    if (!leadfield)
    {
        return std::unexpected(make_error("no leadfield to upload", {"vulkan_backend"}));
    }
    const auto value_count = leadfield->data().size();
    if (value_count > std::numeric_limits<std::uint32_t>::max())
    {
        return std::unexpected(
            make_error(fmt::format("leadfield has {} values, more than 32-bit shader indexing allows", value_count),
                       {"vulkan_backend"}));
    }

    ContextCreateInfo info{};
    info.preferred_device_substring = settings.device_substring;
    auto context = VulkanContext::create(info);
    if (!context)
    {
        compute::BackendError error{context.error().message, context.error().context};
        error.context.push_back(fmt::format("VkResult {}", static_cast<int>(context.error().result)));
        return std::unexpected(std::move(error));
    }

    auto backend = std::unique_ptr<VulkanBackend>(new VulkanBackend(std::move(*context), std::move(leadfield)));
    const auto shader_directory = settings.shader_dir.value_or(default_shader_directory());
    auto runtime = Runtime::create(backend->context_, *backend->leadfield_, shader_directory);
    if (!runtime)
    {
        return std::unexpected(runtime.error());
    }
    backend->runtime_ = std::move(*runtime);
    common::log(common::LogLevel::Info, kLogChannel, "uploaded leadfield ({} electrodes x {} elements, {:.1f} MiB)",
                backend->leadfield_->electrode_count(), backend->leadfield_->element_count(),
                static_cast<double>(value_count * sizeof(float)) / (1024.0 * 1024.0));
    return backend;
}

auto VulkanBackend::contract(const leadfield::LeadfieldMatrix &leadfield, std::span<const double> stim,
                             std::optional<std::span<const std::size_t>> indices) const -> field::VectorResult
{
    if (&leadfield != leadfield_.get())
    {
        return cpu_.contract(leadfield, stim, indices);
    }
    if (auto valid = validate_request(leadfield, stim, indices); !valid)
    {
        return std::unexpected(valid.error());
    }

    const std::scoped_lock lock{mutex_};
    auto                   count = runtime_->run_contract(0U, stim, indices);
    if (count)
    {
        auto field = runtime_->read_field(0U, *count);
        if (field)
        {
            return std::move(*field);
        }
        count = std::unexpected(field.error());
    }
    common::log(common::LogLevel::Warn, kLogChannel, "contract dispatch failed ({}), using cpu", count.error().message);
    return cpu_.contract(leadfield, stim, indices);
}

auto VulkanBackend::envelope(std::span<const common::Vec3> e1, std::span<const common::Vec3> e2) const
    -> field::FieldResult
{
    if (e1.size() != e2.size())
    {
        return cpu_.envelope(e1, e2);
    }
    if (e1.empty())
    {
        return std::vector<double>{};
    }

    const std::scoped_lock lock{mutex_};
    const auto             count  = static_cast<std::uint32_t>(e1.size());
    auto                   status = runtime_->upload_fields(e1, e2);
    if (status)
    {
        status = runtime_->run_envelope(count);
    }
    if (status)
    {
        auto amplitudes = runtime_->read_envelope(count);
        if (amplitudes)
        {
            return std::move(*amplitudes);
        }
        status = std::unexpected(amplitudes.error());
    }
    common::log(common::LogLevel::Warn, kLogChannel, "envelope dispatch failed ({}), using cpu", status.error().message);
    return cpu_.envelope(e1, e2);
}

auto VulkanBackend::ti_field(const leadfield::LeadfieldMatrix &leadfield, std::span<const double> stim1,
                             std::span<const double> stim2, std::optional<std::span<const std::size_t>> indices) const
    -> field::FieldResult
{
    if (&leadfield != leadfield_.get())
    {
        return cpu_.ti_field(leadfield, stim1, stim2, indices);
    }
    if (auto valid = validate_request(leadfield, stim1, indices); !valid)
    {
        return std::unexpected(valid.error());
    }
    if (auto valid = validate_request(leadfield, stim2, indices); !valid)
    {
        return std::unexpected(valid.error());
    }

    const std::scoped_lock lock{mutex_};
    auto                   count = runtime_->run_contract(0U, stim1, indices);
    if (count)
    {
        count = runtime_->run_contract(1U, stim2, indices);
    }
    if (count)
    {
        if (auto status = runtime_->run_envelope(*count); !status)
        {
            count = std::unexpected(status.error());
        }
    }
    if (count)
    {
        auto amplitudes = runtime_->read_envelope(*count);
        if (amplitudes)
        {
            return std::move(*amplitudes);
        }
        count = std::unexpected(amplitudes.error());
    }
    common::log(common::LogLevel::Warn, kLogChannel, "ti dispatch failed ({}), using cpu", count.error().message);
    return cpu_.ti_field(leadfield, stim1, stim2, indices);
}

auto default_shader_directory() -> std::filesystem::path
{
    return std::filesystem::path{TIO_SHADER_DIR};
}

} // namespace tio::gpu
