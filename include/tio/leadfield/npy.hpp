/**
 * @file npy.hpp
 * @brief NumPy .npy reader for leadfield tensors and grid channels
 *
 * leadfield exporters dump dense arrays with numpy.save, so this reader
 * understands format versions 1.0 / 2.0 / 3.0, little-endian C-order arrays
 * of float (f4/f8), signed int (i1..i8), unsigned int (u1..u8) and bool (b1).
 * values are converted on load into whatever element type the caller asks for.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tio::leadfield
{

struct NpyError
{
    std::string              message;
    std::vector<std::string> context;
};

/**
 * @brief decoded header: dtype descriptor and shape
 */
struct NpyHeader
{
    char                     kind{'f'};       ///< 'f', 'i', 'u' or 'b'
    std::size_t              item_size{8U};   ///< bytes per scalar
    bool                     fortran_order{false};
    std::vector<std::size_t> shape;

    [[nodiscard]] auto element_count() const noexcept -> std::size_t;
};

/**
 * @brief typed array loaded from disk
 */
template <typename T>
struct NpyArray
{
    std::vector<std::size_t> shape;
    std::vector<T>           values; ///< C order, size == product(shape)
};

/**
 * @brief parses the python-dict header text ("{'descr': '<f8', ...}")
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto parse_npy_header(std::string_view dict_text) -> std::expected<NpyHeader, NpyError>;

/**
 * @brief loads a .npy file converting each scalar to double
 *
 * ⚠️ IMPURE FUNCTION (file I/O)
 */
[[nodiscard]] auto load_npy_f64(const std::filesystem::path &path) -> std::expected<NpyArray<double>, NpyError>;

/**
 * @brief loads a .npy file converting each scalar to float (leadfield storage type)
 *
 * ⚠️ IMPURE FUNCTION (file I/O)
 */
[[nodiscard]] auto load_npy_f32(const std::filesystem::path &path) -> std::expected<NpyArray<float>, NpyError>;

/**
 * @brief loads an integer .npy file (tags, atlas labels); float inputs must hold whole numbers
 *
 * ⚠️ IMPURE FUNCTION (file I/O)
 */
[[nodiscard]] auto load_npy_i32(const std::filesystem::path &path) -> std::expected<NpyArray<std::int32_t>, NpyError>;

} // namespace tio::leadfield
