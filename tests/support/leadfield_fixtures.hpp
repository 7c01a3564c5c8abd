/**
 * @file leadfield_fixtures.hpp
 * @brief tiny leadfields, grids and .npy files for tests uwu
 *
 * tests never ship binary fixtures: write_npy() emits version 1.0 little-endian
 * arrays on the fly into a ScopedTempDir, and make_test_bundle() builds an
 * in-memory LeadfieldBundle through the real make_bundle() validation.
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <unistd.h>

#include <fmt/format.h>

#include "tio/leadfield/leadfield.hpp"
#include "tio/mesh/grid.hpp"

namespace tio::test_support
{

/**
 * @brief unique directory under the system temp dir, removed on destruction
 */
class ScopedTempDir
{
public:
    explicit ScopedTempDir(std::string_view label)
    {
        static std::atomic<std::uint64_t> counter{0U};
        path_ = std::filesystem::temp_directory_path() /
                fmt::format("tio_{}_{}_{}", label, static_cast<std::uint64_t>(::getpid()), counter.fetch_add(1U));
        std::filesystem::create_directories(path_);
    }

    ~ScopedTempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScopedTempDir(const ScopedTempDir &)                     = delete;
    auto operator=(const ScopedTempDir &) -> ScopedTempDir & = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path & { return path_; }
    [[nodiscard]] auto operator/(std::string_view name) const -> std::filesystem::path { return path_ / name; }

private:
    std::filesystem::path path_;
};

template <typename T>
[[nodiscard]] constexpr auto npy_descr() -> std::string_view
{
    if constexpr (std::is_same_v<T, float>)
    {
        return "<f4";
    }
    else if constexpr (std::is_same_v<T, double>)
    {
        return "<f8";
    }
    else if constexpr (std::is_same_v<T, std::int32_t>)
    {
        return "<i4";
    }
    else
    {
        static_assert(std::is_same_v<T, std::int64_t>, "unsupported npy fixture type");
        return "<i8";
    }
}

/**
 * @brief shape tuple as numpy prints it: "(3,)" or "(2, 4, 3)"
 */
inline auto npy_shape_text(const std::vector<std::size_t> &shape) -> std::string
{
    std::string text = "(";
    for (std::size_t i = 0; i < shape.size(); ++i)
    {
        text += (i == 0U ? "" : ", ") + std::to_string(shape[i]);
    }
    text += shape.size() == 1U ? ",)" : ")";
    return text;
}

/**
 * @brief writes a version 1.0 .npy with a caller-supplied header dict and raw payload bytes
 *
 * the header is not checked against the payload, so tests can build files whose
 * shape lies about their size.
 */
inline void write_raw_npy(const std::filesystem::path &path, std::string dict, std::string_view payload)
{
    // magic(6) + version(2) + length(2) + dict + '\n' padded to 64 bytes
    const std::size_t unpadded = 10U + dict.size() + 1U;
    dict.append((64U - (unpadded % 64U)) % 64U, ' ');
    dict.push_back('\n');

    std::ofstream file{path, std::ios::binary | std::ios::trunc};
    if (!file)
    {
        throw std::runtime_error("failed to create npy fixture " + path.string());
    }
    file.write("\x93NUMPY", 6);
    const char version[2] = {1, 0};
    file.write(version, 2);
    const auto length         = static_cast<std::uint16_t>(dict.size());
    const char length_bytes[2] = {static_cast<char>(length & 0xFFU), static_cast<char>((length >> 8U) & 0xFFU)};
    file.write(length_bytes, 2);
    file.write(dict.data(), static_cast<std::streamsize>(dict.size()));
    file.write(payload.data(), static_cast<std::streamsize>(payload.size()));
}

/**
 * @brief writes a C-ordered little-endian .npy (version 1.0)
 */
template <typename T>
void write_npy(const std::filesystem::path &path, const std::vector<std::size_t> &shape, const std::vector<T> &values)
{
    write_raw_npy(path,
                  fmt::format("{{'descr': '{}', 'fortran_order': False, 'shape': {}, }}", npy_descr<T>(),
                              npy_shape_text(shape)),
                  std::string_view{reinterpret_cast<const char *>(values.data()), values.size() * sizeof(T)});
}

inline void write_text(const std::filesystem::path &path, std::string_view text)
{
    std::ofstream file{path, std::ios::trunc};
    file << text;
}

/**
 * @brief n elements on the x axis at (i, 0, 0), unit volume, all tagged `tag`
 */
inline auto make_line_grid(std::size_t element_count, std::int32_t tag = 2) -> mesh::ElementGrid
{
    mesh::ElementGrid grid{};
    for (std::size_t i = 0; i < element_count; ++i)
    {
        grid.centers.push_back(common::Vec3{static_cast<double>(i), 0.0, 0.0});
        grid.volumes.push_back(1.0);
        grid.tags.push_back(tag);
    }
    return grid;
}

/**
 * @brief electrode names E001, E002, ...
 */
inline auto make_electrode_names(std::size_t count) -> std::vector<std::string>
{
    std::vector<std::string> names;
    for (std::size_t i = 0; i < count; ++i)
    {
        names.push_back(fmt::format("E{:03}", i + 1U));
    }
    return names;
}

/**
 * @brief deterministic pseudo-random leadfield, every row distinct
 */
inline auto make_varied_values(std::size_t electrode_count, std::size_t element_count) -> std::vector<float>
{
    std::vector<float> values(electrode_count * element_count * 3U);
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        const auto x = static_cast<double>((i * 7919U + 104729U) % 1009U);
        values[i]    = static_cast<float>((x / 1009.0) - 0.5) * 4.0F;
    }
    return values;
}

inline auto make_test_bundle(std::size_t electrode_count, std::size_t element_count, std::vector<float> values,
                             mesh::ElementGrid grid) -> leadfield::LeadfieldBundle
{
    auto matrix = leadfield::LeadfieldMatrix::create(electrode_count, element_count, std::move(values));
    if (!matrix)
    {
        throw std::runtime_error("fixture leadfield rejected: " + matrix.error().message);
    }
    auto bundle = leadfield::make_bundle(std::move(*matrix), std::move(grid), make_electrode_names(electrode_count));
    if (!bundle)
    {
        throw std::runtime_error("fixture bundle rejected: " + bundle.error().message);
    }
    return std::move(*bundle);
}

inline auto make_test_bundle(std::size_t electrode_count, std::size_t element_count) -> leadfield::LeadfieldBundle
{
    return make_test_bundle(electrode_count, element_count, make_varied_values(electrode_count, element_count),
                            make_line_grid(element_count));
}

} // namespace tio::test_support
