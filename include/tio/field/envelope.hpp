/**
 * @file envelope.hpp
 * @brief temporal-interference envelope math + leadfield contraction uwu
 *
 * two high-frequency channels with slightly different carriers produce a
 * beating field whose envelope amplitude is what neurons actually respond to.
 * for per-element field vectors E1, E2 the maximal envelope amplitude over all
 * directions is (Grossman 2017):
 *
 * - align: flip one vector when E1 · E2 < 0 so the angle is <= 90°
 * - let small / large be the lower / higher magnitude vector
 * - |small| <= |large| cos θ  ->  2 |small|
 * - otherwise                 ->  2 |small × (large - small)| / |large - small|
 *
 * this header implements that envelope for one element, for whole fields,
 * the directional TI vector + multi-channel mTI variant, and the leadfield
 * contraction that turns per-electrode currents into field vectors.
 *
 * example (basic usage):
 * @code
 * using namespace tio;
 * const common::Vec3 e1{1.0, 0.0, 0.0};
 * const common::Vec3 e2{0.0, 1.0, 0.0};
 * const auto amplitude = field::envelope(e1, e2);
 * // amplitude == sqrt(2) uwu
 * @endcode
 */
#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "tio/common/math.hpp"
#include "tio/leadfield/leadfield.hpp"

namespace tio::field
{

/**
 * @brief size / index mismatch in a field primitive
 */
struct FieldError
{
    std::string              message;
    std::vector<std::string> context;
};

using FieldResult  = std::expected<std::vector<double>, FieldError>;
using VectorResult = std::expected<std::vector<common::Vec3>, FieldError>;

/// magnitudes and differences at or below this are treated as zero
inline constexpr double kEnvelopeEpsilon = 1.0e-10;

/// mV/mm per mA in the leadfield -> V/m
inline constexpr double kLeadfieldToVoltsPerMeter = 1.0e-3;

/**
 * @brief maximal TI envelope amplitude for one pair of field vectors
 *
 * ✨ PURE FUNCTION ✨
 *
 * this function is pure because:
 * - output depends only on the two vectors
 * - noexcept, no allocation, no logging
 *
 * @param[in] e1 channel 1 field
 * @param[in] e2 channel 2 field
 * @return amplitude >= 0, never NaN for finite inputs
 *
 * @post envelope(e, e) == 2 |e|
 */
[[nodiscard]] auto envelope(const common::Vec3 &e1, const common::Vec3 &e2) noexcept -> double;

/**
 * @brief elementwise envelope over two equally long fields
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto envelope_field(std::span<const common::Vec3> e1, std::span<const common::Vec3> e2) -> FieldResult;

/**
 * @brief directional TI vector whose magnitude equals envelope(e1, e2)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto ti_vector(const common::Vec3 &e1, const common::Vec3 &e2) noexcept -> common::Vec3;

/**
 * @brief elementwise ti_vector
 */
[[nodiscard]] auto ti_vectors(std::span<const common::Vec3> e1, std::span<const common::Vec3> e2) -> VectorResult;

/**
 * @brief multi-channel TI: TI(TI(e1, e2), TI(e3, e4)) per element
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto mti_vectors(std::span<const common::Vec3> e1, std::span<const common::Vec3> e2,
                               std::span<const common::Vec3> e3, std::span<const common::Vec3> e4) -> VectorResult;

/**
 * @brief field (V/m) produced by a per-electrode current pattern (mA)
 *
 * ✨ PURE FUNCTION ✨
 *
 * field[k] = Σ_e leadfield[e][k] * stim[e] / 1000. electrodes with zero
 * current are skipped so sparse bipolar patterns cost four rows, not all.
 *
 * @param[in] leadfield tensor in mV/mm
 * @param[in] stim one current per electrode (mA), length == electrode_count
 * @param[in] indices optional element subset; output follows its order
 * @return field vectors or FieldError on length / index mismatch
 */
[[nodiscard]] auto contract_leadfield(const leadfield::LeadfieldMatrix &leadfield, std::span<const double> stim,
                                      std::optional<std::span<const std::size_t>> indices = std::nullopt)
    -> VectorResult;

/**
 * @brief TI envelope over the (sub)grid for two stimulation patterns
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] leadfield tensor in mV/mm
 * @param[in] stim1 channel 1 currents (mA)
 * @param[in] stim2 channel 2 currents (mA)
 * @param[in] target_indices optional element subset
 * @return envelope amplitudes in V/m
 */
[[nodiscard]] auto calculate_ti_field_from_leadfield(const leadfield::LeadfieldMatrix &leadfield,
                                                     std::span<const double> stim1, std::span<const double> stim2,
                                                     std::optional<std::span<const std::size_t>> target_indices =
                                                         std::nullopt) -> FieldResult;

} // namespace tio::field
