/**
 * @file stim_pattern.hpp
 * @brief current-balanced per-electrode stimulation vectors for the two TI channels
 *
 * a channel drives its + electrodes with +I and its - electrodes with -I, split
 * evenly across the electrodes that share a role. names the leadfield does not
 * know are skipped with a warning, so every returned vector sums to zero.
 */
#pragma once

#include <array>
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include "tio/field/envelope.hpp"
#include "tio/leadfield/leadfield.hpp"

namespace tio::field
{

/**
 * @brief one current (mA) per leadfield row for each channel
 */
struct StimPatterns
{
    std::vector<double> channel1;
    std::vector<double> channel2;
};

/**
 * @brief builds both channel vectors from named electrode roles
 *
 * ⚠️ IMPURE FUNCTION (logs a warning per unknown name or dead channel)
 *
 * @param[in] electrodes leadfield electrode index
 * @param[in] e1_plus channel 1 anodes
 * @param[in] e1_minus channel 1 cathodes
 * @param[in] e2_plus channel 2 anodes
 * @param[in] e2_minus channel 2 cathodes
 * @param[in] intensity_ch1_mA channel 1 current magnitude
 * @param[in] intensity_ch2_mA channel 2 current magnitude
 * @return patterns whose entries sum to zero per channel
 *
 * @post a channel with no known + or no known - electrode is all zeros
 */
[[nodiscard]] auto create_stim_patterns(const leadfield::ElectrodeIndex &electrodes,
                                        std::span<const std::string> e1_plus, std::span<const std::string> e1_minus,
                                        std::span<const std::string> e2_plus, std::span<const std::string> e2_minus,
                                        double intensity_ch1_mA, double intensity_ch2_mA) -> StimPatterns;

/**
 * @brief same current on both channels
 */
[[nodiscard]] auto create_stim_patterns(const leadfield::ElectrodeIndex &electrodes,
                                        std::span<const std::string> e1_plus, std::span<const std::string> e1_minus,
                                        std::span<const std::string> e2_plus, std::span<const std::string> e2_minus,
                                        double intensity_mA) -> StimPatterns;

/**
 * @brief index-based fast path: indices = {e1+, e1-, e2+, e2-}
 *
 * ✨ PURE FUNCTION ✨
 *
 * @return FieldError when an index is out of range or the four are not distinct
 */
[[nodiscard]] auto bipolar_patterns(std::size_t electrode_count, const std::array<std::size_t, 4> &indices,
                                    double ch1_mA, double ch2_mA) -> std::expected<StimPatterns, FieldError>;

} // namespace tio::field
