/**
 * @file envelope.cpp
 * @brief TI envelope amplitude, per element and over whole fields uwu
 */
#include "tio/field/envelope.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

namespace tio::field
{
namespace
{

[[nodiscard]] auto nearly_equal(const common::Vec3 &lhs, const common::Vec3 &rhs) noexcept -> bool
{
    return std::abs(lhs[0] - rhs[0]) <= kEnvelopeEpsilon && std::abs(lhs[1] - rhs[1]) <= kEnvelopeEpsilon &&
           std::abs(lhs[2] - rhs[2]) <= kEnvelopeEpsilon;
}

[[nodiscard]] auto size_mismatch(std::size_t lhs, std::size_t rhs, std::string where) -> std::unexpected<FieldError>
{
    return std::unexpected(
        FieldError{fmt::format("field length mismatch: {} vs {}", lhs, rhs), {std::move(where)}});
}

/// flips e2 against e1 when needed and orders by magnitude (ties keep e1 as the larger)
struct AlignedPair
{
    common::Vec3 large;
    common::Vec3 small;
    double       large_norm;
    double       small_norm;
    double       cos_angle;
};

[[nodiscard]] auto align(const common::Vec3 &e1, common::Vec3 e2) noexcept -> AlignedPair
{
    if (common::dot(e1, e2) < 0.0)
    {
        e2 = common::scale(e2, -1.0);
    }
    const auto n1 = common::magnitude(e1);
    const auto n2 = common::magnitude(e2);

    double cos_angle = 0.0;
    if (n1 > kEnvelopeEpsilon && n2 > kEnvelopeEpsilon)
    {
        cos_angle = std::min(1.0, common::dot(e1, e2) / (n1 * n2));
    }
    if (n1 >= n2)
    {
        return AlignedPair{e1, e2, n1, n2, cos_angle};
    }
    return AlignedPair{e2, e1, n2, n1, cos_angle};
}

} // namespace

auto envelope(const common::Vec3 &e1, const common::Vec3 &e2) noexcept -> double
{
    if (nearly_equal(e1, e2))
    {
        return 2.0 * common::magnitude(e1);
    }
    const auto pair = align(e1, e2);
    if (pair.small_norm <= pair.large_norm * pair.cos_angle)
    {
        return 2.0 * pair.small_norm;
    }
    const auto difference      = common::subtract(pair.large, pair.small);
    const auto difference_norm = common::magnitude(difference);
    if (difference_norm <= kEnvelopeEpsilon)
    {
        return 2.0 * pair.small_norm;
    }
    return 2.0 * common::magnitude(common::cross(pair.small, difference)) / difference_norm;
}

auto ti_vector(const common::Vec3 &e1, const common::Vec3 &e2) noexcept -> common::Vec3
{
    const auto pair = align(e1, e2);
    if (pair.small_norm <= pair.large_norm * pair.cos_angle)
    {
        return common::scale(pair.small, 2.0);
    }
    const auto difference      = common::subtract(pair.large, pair.small);
    const auto difference_norm = common::magnitude(difference);
    if (difference_norm <= kEnvelopeEpsilon)
    {
        return common::scale(pair.small, 2.0);
    }
    return common::scale(common::cross(pair.small, difference), 2.0 / difference_norm);
}

auto envelope_field(std::span<const common::Vec3> e1, std::span<const common::Vec3> e2) -> FieldResult
{
    if (e1.size() != e2.size())
    {
        return size_mismatch(e1.size(), e2.size(), "envelope_field");
    }
    std::vector<double> amplitudes(e1.size());
    for (std::size_t i = 0; i < e1.size(); ++i)
    {
        amplitudes[i] = envelope(e1[i], e2[i]);
    }
    return amplitudes;
}

auto ti_vectors(std::span<const common::Vec3> e1, std::span<const common::Vec3> e2) -> VectorResult
{
    if (e1.size() != e2.size())
    {
        return size_mismatch(e1.size(), e2.size(), "ti_vectors");
    }
    std::vector<common::Vec3> vectors(e1.size());
    for (std::size_t i = 0; i < e1.size(); ++i)
    {
        vectors[i] = ti_vector(e1[i], e2[i]);
    }
    return vectors;
}

auto mti_vectors(std::span<const common::Vec3> e1, std::span<const common::Vec3> e2,
                 std::span<const common::Vec3> e3, std::span<const common::Vec3> e4) -> VectorResult
{
    if (e1.size() != e3.size())
    {
        return size_mismatch(e1.size(), e3.size(), "mti_vectors");
    }
    auto first = ti_vectors(e1, e2);
    if (!first)
    {
        return first;
    }
    auto second = ti_vectors(e3, e4);
    if (!second)
    {
        return second;
    }
    return ti_vectors(*first, *second);
}

auto contract_leadfield(const leadfield::LeadfieldMatrix &leadfield, std::span<const double> stim,
                        std::optional<std::span<const std::size_t>> indices) -> VectorResult
{
    if (stim.size() != leadfield.electrode_count())
    {
        return std::unexpected(FieldError{fmt::format("stimulation pattern has {} entries, leadfield has {} electrodes",
                                                      stim.size(), leadfield.electrode_count()),
                                          {"contract_leadfield", "stim"}});
    }
    const auto element_count = leadfield.element_count();
    if (indices)
    {
        for (std::size_t i = 0; i < indices->size(); ++i)
        {
            if ((*indices)[i] >= element_count)
            {
                return std::unexpected(FieldError{
                    fmt::format("element index {} out of range ({} elements)", (*indices)[i], element_count),
                    {"contract_leadfield", fmt::format("indices[{}]", i)}});
            }
        }
    }

    const auto                output_size = indices ? indices->size() : element_count;
    std::vector<common::Vec3> field(output_size, common::Vec3{0.0, 0.0, 0.0});
    for (std::size_t electrode = 0; electrode < stim.size(); ++electrode)
    {
        const auto current = stim[electrode];
        if (current == 0.0)
        {
            continue;
        }
        const auto weight = current * kLeadfieldToVoltsPerMeter;
        const auto row    = leadfield.row(electrode);
        for (std::size_t k = 0; k < output_size; ++k)
        {
            const auto  element = indices ? (*indices)[k] : k;
            const auto *sample  = row.data() + (element * 3U);
            field[k][0] += weight * static_cast<double>(sample[0]);
            field[k][1] += weight * static_cast<double>(sample[1]);
            field[k][2] += weight * static_cast<double>(sample[2]);
        }
    }
    return field;
}

auto calculate_ti_field_from_leadfield(const leadfield::LeadfieldMatrix &leadfield, std::span<const double> stim1,
                                       std::span<const double> stim2,
                                       std::optional<std::span<const std::size_t>> target_indices) -> FieldResult
{
    auto field1 = contract_leadfield(leadfield, stim1, target_indices);
    if (!field1)
    {
        return std::unexpected(field1.error());
    }
    auto field2 = contract_leadfield(leadfield, stim2, target_indices);
    if (!field2)
    {
        return std::unexpected(field2.error());
    }
    return envelope_field(*field1, *field2);
}

} // namespace tio::field
