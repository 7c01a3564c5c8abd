/**
 * @file backend.hpp
 * @brief strategy seam between the search engines and whatever crunches the numbers uwu
 *
 * both engines only ever need two numeric primitives: "contract the leadfield
 * with a current pattern" and "turn two field arrays into an envelope". this
 * header puts them behind FieldBackend so the engines never see a Vulkan
 * header. CpuBackend is stateless and always available; the Vulkan backend
 * only exists in builds configured with TIO_BUILD_GPU.
 *
 * example (basic usage):
 * @code
 * auto backend = tio::compute::make_backend(config.execution, bundle.leadfield);
 * auto ti = backend->ti_field(*bundle.leadfield, stim.channel1, stim.channel2, subset);
 * @endcode
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "tio/common/math.hpp"
#include "tio/config/config.hpp"
#include "tio/field/envelope.hpp"
#include "tio/leadfield/leadfield.hpp"

namespace tio::compute
{

/**
 * @brief backend could not be brought up (driver, shaders, device memory)
 */
struct BackendError
{
    std::string              message;
    std::vector<std::string> context;
};

/**
 * @brief the two field primitives every evaluation goes through
 *
 * implementations must be callable from several worker threads at once.
 */
class FieldBackend
{
public:
    FieldBackend()                                          = default;
    FieldBackend(const FieldBackend &)                      = delete;
    auto operator=(const FieldBackend &) -> FieldBackend & = delete;
    virtual ~FieldBackend()                                 = default;

    [[nodiscard]] virtual auto name() const noexcept -> std::string_view = 0;

    /**
     * @brief leadfield x current pattern -> field vectors (V/m)
     */
    [[nodiscard]] virtual auto contract(const leadfield::LeadfieldMatrix &leadfield, std::span<const double> stim,
                                        std::optional<std::span<const std::size_t>> indices) const
        -> field::VectorResult = 0;

    /**
     * @brief elementwise TI envelope
     */
    [[nodiscard]] virtual auto envelope(std::span<const common::Vec3> e1, std::span<const common::Vec3> e2) const
        -> field::FieldResult = 0;

    /**
     * @brief contract both channels then take the envelope
     *
     * the default runs the two primitives back to back, device backends
     * override it to keep the intermediate fields resident.
     */
    [[nodiscard]] virtual auto ti_field(const leadfield::LeadfieldMatrix &leadfield, std::span<const double> stim1,
                                        std::span<const double> stim2,
                                        std::optional<std::span<const std::size_t>> indices) const
        -> field::FieldResult;
};

/**
 * @brief plain C++ implementation on top of tio::field
 */
class CpuBackend final : public FieldBackend
{
public:
    [[nodiscard]] auto name() const noexcept -> std::string_view override { return "cpu"; }

    [[nodiscard]] auto contract(const leadfield::LeadfieldMatrix &leadfield, std::span<const double> stim,
                                std::optional<std::span<const std::size_t>> indices) const
        -> field::VectorResult override;

    [[nodiscard]] auto envelope(std::span<const common::Vec3> e1, std::span<const common::Vec3> e2) const
        -> field::FieldResult override;
};

/**
 * @brief true when this binary was built with the Vulkan backend
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto gpu_compiled_in() noexcept -> bool;

/**
 * @brief picks the backend requested by `execution.use_gpu`
 *
 * ⚠️ IMPURE FUNCTION (may initialize a Vulkan device, logs the choice)
 *
 * GPU requests that cannot be honored (not compiled in, no device, missing
 * shaders) log a warning and fall back to CpuBackend. this never fails.
 *
 * @param[in] settings execution block of the run config
 * @param[in] leadfield tensor the GPU backend uploads once
 * @return shared backend, safe to hand to several workers
 */
[[nodiscard]] auto make_backend(const config::ExecutionSettings &settings,
                                std::shared_ptr<const leadfield::LeadfieldMatrix> leadfield)
    -> std::shared_ptr<const FieldBackend>;

} // namespace tio::compute
