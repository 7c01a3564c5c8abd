/**
 * @file stim_pattern.cpp
 * @brief electrode picks + currents to per-channel stimulation vectors
 */
#include "tio/field/stim_pattern.hpp"

#include <optional>
#include <string_view>

#include <fmt/format.h>

#include "tio/common/log.hpp"

namespace tio::field
{
namespace
{

constexpr std::string_view kLogChannel = "[tio::field]";

/// rows of the names the index knows, warning about the rest
[[nodiscard]] auto known_rows(const leadfield::ElectrodeIndex &electrodes, std::span<const std::string> names,
                              std::string_view role) -> std::vector<std::size_t>
{
    std::vector<std::size_t> rows;
    rows.reserve(names.size());
    for (const auto &name : names)
    {
        if (const auto row = electrodes.find(name))
        {
            rows.push_back(*row);
        }
        else
        {
            common::log(common::LogLevel::Warn, kLogChannel, "electrode '{}' ({}) not in leadfield, ignored", name,
                        role);
        }
    }
    return rows;
}

[[nodiscard]] auto build_channel(const leadfield::ElectrodeIndex &electrodes, std::span<const std::string> plus,
                                 std::span<const std::string> minus, double intensity_mA, int channel)
    -> std::vector<double>
{
    std::vector<double> stim(electrodes.size(), 0.0);
    const auto          plus_rows  = known_rows(electrodes, plus, fmt::format("E{}+", channel));
    const auto          minus_rows = known_rows(electrodes, minus, fmt::format("E{}-", channel));
    if (plus_rows.empty() || minus_rows.empty())
    {
        common::log(common::LogLevel::Warn, kLogChannel, "channel {} has no usable {} electrode, zeroed", channel,
                    plus_rows.empty() ? "+" : "-");
        return stim;
    }

    // accumulate so a name listed on both sides still nets to zero
    const auto anode_share   = intensity_mA / static_cast<double>(plus_rows.size());
    const auto cathode_share = intensity_mA / static_cast<double>(minus_rows.size());
    for (const auto row : plus_rows)
    {
        stim[row] += anode_share;
    }
    for (const auto row : minus_rows)
    {
        stim[row] -= cathode_share;
    }
    return stim;
}

} // namespace

auto create_stim_patterns(const leadfield::ElectrodeIndex &electrodes, std::span<const std::string> e1_plus,
                          std::span<const std::string> e1_minus, std::span<const std::string> e2_plus,
                          std::span<const std::string> e2_minus, double intensity_ch1_mA, double intensity_ch2_mA)
    -> StimPatterns
{
    return StimPatterns{
        .channel1 = build_channel(electrodes, e1_plus, e1_minus, intensity_ch1_mA, 1),
        .channel2 = build_channel(electrodes, e2_plus, e2_minus, intensity_ch2_mA, 2),
    };
}

auto create_stim_patterns(const leadfield::ElectrodeIndex &electrodes, std::span<const std::string> e1_plus,
                          std::span<const std::string> e1_minus, std::span<const std::string> e2_plus,
                          std::span<const std::string> e2_minus, double intensity_mA) -> StimPatterns
{
    return create_stim_patterns(electrodes, e1_plus, e1_minus, e2_plus, e2_minus, intensity_mA, intensity_mA);
}

auto bipolar_patterns(std::size_t electrode_count, const std::array<std::size_t, 4> &indices, double ch1_mA,
                      double ch2_mA) -> std::expected<StimPatterns, FieldError>
{
    for (std::size_t i = 0; i < indices.size(); ++i)
    {
        if (indices[i] >= electrode_count)
        {
            return std::unexpected(FieldError{
                fmt::format("electrode index {} out of range ({} electrodes)", indices[i], electrode_count),
                {"bipolar_patterns", fmt::format("[{}]", i)}});
        }
        for (std::size_t j = 0; j < i; ++j)
        {
            if (indices[i] == indices[j])
            {
                return std::unexpected(FieldError{fmt::format("electrode index {} used twice", indices[i]),
                                                  {"bipolar_patterns", fmt::format("[{}]", i)}});
            }
        }
    }

    StimPatterns patterns{std::vector<double>(electrode_count, 0.0), std::vector<double>(electrode_count, 0.0)};
    patterns.channel1[indices[0]] = ch1_mA;
    patterns.channel1[indices[1]] = -ch1_mA;
    patterns.channel2[indices[2]] = ch2_mA;
    patterns.channel2[indices[3]] = -ch2_mA;
    return patterns;
}

} // namespace tio::field
