/**
 * @file math.hpp
 * @brief tiny 3-vector algebra that the TI envelope math leans on uwu
 *
 * every field sample in TIOpt is a plain 3-vector (V/m or mV/mm depending on
 * which side of the leadfield contraction you are on). this header keeps the
 * handful of helpers we need (dot, cross, magnitude, add/sub/scale and squared
 * distance for ROI spheres) header-only so the hot loops in the search engines
 * inline everything. no Eigen, no GLM, just std::array and constexpr ✨
 *
 * @note targets C++23 with GCC 12+ (std::expected lives elsewhere, this stays
 *       dependency free)
 *
 * example (basic usage):
 * @code
 * using namespace tio::common;
 * constexpr Vec3 a{1.0, 0.0, 0.0};
 * constexpr Vec3 b{0.0, 1.0, 0.0};
 * constexpr Vec3 c = cross(a, b);
 * // c == {0.0, 0.0, 1.0}
 * @endcode
 */
#pragma once

#include <array>
#include <cmath>
#include <limits>

namespace tio::common {

/**
 * @brief field / position 3-vector alias
 *
 * ✨ PURE FUNCTION ✨ (type alias, nothing runs)
 */
using Vec3 = std::array<double, 3>;

/**
 * @brief dot product of two field vectors
 *
 * ✨ PURE FUNCTION ✨
 *
 * this function is pure because:
 * - same inputs give the same scalar every time
 * - no side effects, constexpr + noexcept
 *
 * @param[in] lhs left operand
 * @param[in] rhs right operand
 * @return scalar dot product
 */
[[nodiscard]] constexpr auto dot(const Vec3& lhs, const Vec3& rhs) noexcept -> double
{
    return (lhs[0] * rhs[0]) + (lhs[1] * rhs[1]) + (lhs[2] * rhs[2]);
}

/**
 * @brief right-handed cross product
 *
 * the oblique branch of the TI envelope divides |cross(small, large - small)|
 * by |large - small|, so this one shows up in every evaluation.
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] lhs first operand
 * @param[in] rhs second operand
 * @return vector orthogonal to both operands
 */
[[nodiscard]] constexpr auto cross(const Vec3& lhs, const Vec3& rhs) noexcept -> Vec3
{
    return Vec3{
        (lhs[1] * rhs[2]) - (lhs[2] * rhs[1]),
        (lhs[2] * rhs[0]) - (lhs[0] * rhs[2]),
        (lhs[0] * rhs[1]) - (lhs[1] * rhs[0])
    };
}

[[nodiscard]] constexpr auto add(const Vec3& lhs, const Vec3& rhs) noexcept -> Vec3
{
    return Vec3{lhs[0] + rhs[0], lhs[1] + rhs[1], lhs[2] + rhs[2]};
}

[[nodiscard]] constexpr auto subtract(const Vec3& lhs, const Vec3& rhs) noexcept -> Vec3
{
    return Vec3{lhs[0] - rhs[0], lhs[1] - rhs[1], lhs[2] - rhs[2]};
}

[[nodiscard]] constexpr auto scale(const Vec3& value, double factor) noexcept -> Vec3
{
    return Vec3{value[0] * factor, value[1] * factor, value[2] * factor};
}

/**
 * @brief squared euclidean distance (no sqrt, sphere tests compare against r²)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto squared_distance(const Vec3& lhs, const Vec3& rhs) noexcept -> double
{
    const auto delta = subtract(lhs, rhs);
    return dot(delta, delta);
}

/**
 * @brief euclidean magnitude that flushes subnormal results to zero
 *
 * ✨ PURE FUNCTION ✨
 *
 * this function is pure because:
 * - no state, no side effects, just std::hypot
 * - stable for huge components (hypot avoids the overflow in x² + y² + z²)
 *
 * @param[in] value vector under inspection
 * @return non-negative magnitude
 *
 * @post return value >= 0.0
 * @warning NaN inputs propagate per IEEE 754
 */
[[nodiscard]] inline auto magnitude(const Vec3& value) noexcept -> double
{
    const auto length = std::hypot(value[0], value[1], value[2]);
    if (length < std::numeric_limits<double>::denorm_min()) {
        return 0.0;
    }
    return length;
}

/**
 * @brief unit vector or the zero vector when the input is too tiny to trust
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] value vector to normalize
 * @return unit vector, or {0,0,0} below 1e-12
 */
[[nodiscard]] inline auto safe_normalize(const Vec3& value) noexcept -> Vec3
{
    constexpr double kThreshold = 1.0e-12;
    const auto length = magnitude(value);
    if (length < kThreshold || !std::isfinite(length)) {
        return Vec3{0.0, 0.0, 0.0};
    }
    return scale(value, 1.0 / length);
}

}  // namespace tio::common
