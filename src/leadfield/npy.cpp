/**
 * @file npy.cpp
 * @brief .npy decoding: magic + version, python dict header, raw little-endian payload
 */
#include "tio/leadfield/npy.hpp"

#include <array>
#include <cmath>
#include <cstring>
#include <fstream>
#include <functional>
#include <limits>
#include <numeric>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace tio::leadfield
{
namespace
{

constexpr std::array<char, 6> kMagic{'\x93', 'N', 'U', 'M', 'P', 'Y'};

[[nodiscard]] auto fail(std::string message, std::vector<std::string> ctx) -> std::unexpected<NpyError>
{
    return std::unexpected(NpyError{std::move(message), std::move(ctx)});
}

/// value text that follows `'key':` inside the header dict
[[nodiscard]] auto find_value(std::string_view dict, std::string_view key) -> std::string_view
{
    const auto quoted_single = fmt::format("'{}'", key);
    const auto quoted_double = fmt::format("\"{}\"", key);
    auto       pos           = dict.find(quoted_single);
    auto       key_length    = quoted_single.size();
    if (pos == std::string_view::npos)
    {
        pos        = dict.find(quoted_double);
        key_length = quoted_double.size();
    }
    if (pos == std::string_view::npos)
    {
        return {};
    }
    auto rest  = dict.substr(pos + key_length);
    auto colon = rest.find(':');
    if (colon == std::string_view::npos)
    {
        return {};
    }
    rest             = rest.substr(colon + 1U);
    const auto start = rest.find_first_not_of(" \t");
    if (start == std::string_view::npos)
    {
        return {};
    }
    return rest.substr(start);
}

struct RawArray
{
    NpyHeader         header;
    std::vector<char> payload;
};

[[nodiscard]] auto read_raw(const std::filesystem::path &path) -> std::expected<RawArray, NpyError>
{
    std::ifstream file{path, std::ios::binary};
    if (!file)
    {
        return fail(fmt::format("failed to open npy file: {}", path.string()), {path.string()});
    }

    std::array<char, 6> magic{};
    if (!file.read(magic.data(), magic.size()) || magic != kMagic)
    {
        return fail("not a .npy file (bad magic)", {path.string()});
    }
    std::array<unsigned char, 2> version{};
    if (!file.read(reinterpret_cast<char *>(version.data()), 2))
    {
        return fail("truncated .npy version", {path.string()});
    }

    std::size_t header_length = 0U;
    if (version[0] == 1U)
    {
        std::array<unsigned char, 2> bytes{};
        if (!file.read(reinterpret_cast<char *>(bytes.data()), 2))
        {
            return fail("truncated .npy header length", {path.string()});
        }
        header_length = static_cast<std::size_t>(bytes[0]) | (static_cast<std::size_t>(bytes[1]) << 8U);
    }
    else if (version[0] == 2U || version[0] == 3U)
    {
        std::array<unsigned char, 4> bytes{};
        if (!file.read(reinterpret_cast<char *>(bytes.data()), 4))
        {
            return fail("truncated .npy header length", {path.string()});
        }
        for (std::size_t i = 0; i < 4U; ++i)
        {
            header_length |= static_cast<std::size_t>(bytes[i]) << (8U * i);
        }
    }
    else
    {
        return fail(fmt::format("unsupported .npy version {}.{}", version[0], version[1]), {path.string()});
    }

    std::string dict(header_length, '\0');
    if (!file.read(dict.data(), static_cast<std::streamsize>(header_length)))
    {
        return fail("truncated .npy header", {path.string()});
    }
    auto header = parse_npy_header(dict);
    if (!header)
    {
        auto error = header.error();
        error.context.insert(error.context.begin(), path.string());
        return std::unexpected(std::move(error));
    }
    if (header->fortran_order)
    {
        return fail("fortran-ordered arrays are not supported, save with np.ascontiguousarray", {path.string()});
    }

    // payload must fill the file exactly, checked before anything is allocated
    const auto byte_count    = header->element_count() * header->item_size;
    const auto payload_start = file.tellg();
    file.seekg(0, std::ios::end);
    const auto file_end = file.tellg();
    if (payload_start < 0 || file_end < payload_start)
    {
        return fail("failed to size .npy payload", {path.string()});
    }
    const auto available = static_cast<std::size_t>(file_end - payload_start);
    if (available < byte_count)
    {
        return fail(fmt::format("truncated .npy payload (expected {} bytes, found {})", byte_count, available),
                    {path.string()});
    }
    if (available > byte_count)
    {
        return fail(fmt::format("{} trailing bytes after .npy payload of {} bytes", available - byte_count,
                                byte_count),
                    {path.string()});
    }
    file.seekg(payload_start);

    std::vector<char> payload(byte_count);
    if (byte_count > 0U && !file.read(payload.data(), static_cast<std::streamsize>(byte_count)))
    {
        return fail(fmt::format("truncated .npy payload (expected {} bytes)", byte_count), {path.string()});
    }
    return RawArray{std::move(*header), std::move(payload)};
}

template <typename Source>
[[nodiscard]] auto load_scalar(const char *bytes) noexcept -> Source
{
    Source value{};
    std::memcpy(&value, bytes, sizeof(Source));
    return value;
}

/// reads scalar `index` of the payload as double regardless of the stored dtype
[[nodiscard]] auto scalar_as_double(const RawArray &raw, std::size_t index) noexcept -> double
{
    const char *bytes = raw.payload.data() + (index * raw.header.item_size);
    switch (raw.header.kind)
    {
    case 'f':
        return raw.header.item_size == 4U ? static_cast<double>(load_scalar<float>(bytes)) : load_scalar<double>(bytes);
    case 'i':
        switch (raw.header.item_size)
        {
        case 1U:
            return static_cast<double>(load_scalar<std::int8_t>(bytes));
        case 2U:
            return static_cast<double>(load_scalar<std::int16_t>(bytes));
        case 4U:
            return static_cast<double>(load_scalar<std::int32_t>(bytes));
        default:
            return static_cast<double>(load_scalar<std::int64_t>(bytes));
        }
    case 'u':
    case 'b':
        switch (raw.header.item_size)
        {
        case 1U:
            return static_cast<double>(load_scalar<std::uint8_t>(bytes));
        case 2U:
            return static_cast<double>(load_scalar<std::uint16_t>(bytes));
        case 4U:
            return static_cast<double>(load_scalar<std::uint32_t>(bytes));
        default:
            return static_cast<double>(load_scalar<std::uint64_t>(bytes));
        }
    default:
        return 0.0;
    }
}

template <typename T>
[[nodiscard]] auto convert(const RawArray &raw) -> NpyArray<T>
{
    NpyArray<T> out{};
    out.shape = raw.header.shape;
    const auto count = raw.header.element_count();
    out.values.resize(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        out.values[i] = static_cast<T>(scalar_as_double(raw, i));
    }
    return out;
}

} // namespace

auto NpyHeader::element_count() const noexcept -> std::size_t
{
    return std::accumulate(shape.begin(), shape.end(), std::size_t{1U}, std::multiplies<>{});
}

auto parse_npy_header(std::string_view dict_text) -> std::expected<NpyHeader, NpyError>
{
    NpyHeader header{};

    const auto descr = find_value(dict_text, "descr");
    if (descr.size() < 4U || (descr.front() != '\'' && descr.front() != '"'))
    {
        return fail("npy header is missing 'descr'", {"descr"});
    }
    const char byte_order = descr[1];
    if (byte_order == '>')
    {
        return fail("big-endian npy arrays are not supported", {"descr"});
    }
    if (byte_order != '<' && byte_order != '|' && byte_order != '=')
    {
        return fail(fmt::format("unexpected byte order '{}'", byte_order), {"descr"});
    }
    header.kind = descr[2];
    if (header.kind != 'f' && header.kind != 'i' && header.kind != 'u' && header.kind != 'b')
    {
        return fail(fmt::format("unsupported npy dtype kind '{}'", header.kind), {"descr"});
    }
    std::size_t size = 0U;
    std::size_t pos  = 3U;
    while (pos < descr.size() && descr[pos] >= '0' && descr[pos] <= '9')
    {
        size = (size * 10U) + static_cast<std::size_t>(descr[pos] - '0');
        ++pos;
    }
    const bool valid_size = header.kind == 'f' ? (size == 4U || size == 8U)
                                               : (size == 1U || size == 2U || size == 4U || size == 8U);
    if (!valid_size)
    {
        return fail(fmt::format("unsupported npy item size {} for kind '{}'", size, header.kind), {"descr"});
    }
    header.item_size = size;

    const auto order = find_value(dict_text, "fortran_order");
    if (order.starts_with("True"))
    {
        header.fortran_order = true;
    }
    else if (!order.starts_with("False"))
    {
        return fail("npy header is missing 'fortran_order'", {"fortran_order"});
    }

    const auto shape_text = find_value(dict_text, "shape");
    if (shape_text.empty() || shape_text.front() != '(')
    {
        return fail("npy header is missing 'shape'", {"shape"});
    }
    const auto close = shape_text.find(')');
    if (close == std::string_view::npos)
    {
        return fail("unterminated npy shape tuple", {"shape"});
    }
    constexpr auto kMaxSize = std::numeric_limits<std::size_t>::max();
    const auto     tuple    = shape_text.substr(1U, close - 1U);
    std::size_t    current   = 0U;
    bool           in_number = false;
    for (const char c : tuple)
    {
        if (c >= '0' && c <= '9')
        {
            const auto digit = static_cast<std::size_t>(c - '0');
            if (current > (kMaxSize - digit) / 10U)
            {
                return fail("npy shape dimension overflows size_t", {"shape"});
            }
            current   = (current * 10U) + digit;
            in_number = true;
        }
        else if (c == ',' || c == ' ' || c == 'L')
        {
            if (in_number && c != 'L')
            {
                header.shape.push_back(current);
                current   = 0U;
                in_number = false;
            }
        }
        else
        {
            return fail(fmt::format("unexpected character '{}' in npy shape", c), {"shape"});
        }
    }
    if (in_number)
    {
        header.shape.push_back(current);
    }

    // element_count() * item_size must stay representable
    std::size_t bytes = header.item_size;
    for (const auto dim : header.shape)
    {
        if (dim != 0U && bytes > kMaxSize / dim)
        {
            return fail(fmt::format("npy shape ({}) overflows the addressable size", fmt::join(header.shape, ", ")),
                        {"shape"});
        }
        bytes *= dim;
    }
    return header;
}

auto load_npy_f64(const std::filesystem::path &path) -> std::expected<NpyArray<double>, NpyError>
{
    auto raw = read_raw(path);
    if (!raw)
    {
        return std::unexpected(raw.error());
    }
    return convert<double>(*raw);
}

auto load_npy_f32(const std::filesystem::path &path) -> std::expected<NpyArray<float>, NpyError>
{
    auto raw = read_raw(path);
    if (!raw)
    {
        return std::unexpected(raw.error());
    }
    return convert<float>(*raw);
}

auto load_npy_i32(const std::filesystem::path &path) -> std::expected<NpyArray<std::int32_t>, NpyError>
{
    auto raw = read_raw(path);
    if (!raw)
    {
        return std::unexpected(raw.error());
    }
    const auto count = raw->header.element_count();
    for (std::size_t i = 0; i < count; ++i)
    {
        const auto value = scalar_as_double(*raw, i);
        if (std::trunc(value) != value)
        {
            return fail(fmt::format("non-integer value {} in integer channel", value),
                        {path.string(), fmt::format("[{}]", i)});
        }
    }
    return convert<std::int32_t>(*raw);
}

} // namespace tio::leadfield
