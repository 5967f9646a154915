#pragma once

#include "./io.hpp"

#include <array>
#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

namespace tpipe {

/**
 * @brief The order in which the bytes of a multi-byte value are transmitted
 */
enum class byte_order {
    /// Most significant byte first ("network order")
    big,
    /// Least significant byte first
    little,
    /// The byte order of the current platform. Equal to either `big` or `little`.
    native = std::endian::native == std::endian::big ? big : little,
};

namespace endian_detail {

/// The unsigned integer type with the same width as `T`
template <typename T>
struct unsigned_of {
    using type = std::make_unsigned_t<T>;
};

#ifdef __SIZEOF_INT128__
// The 128-bit integers are a compiler extension, which the standard traits do not recognize in
// strict conformance mode
__extension__ typedef __int128          int128_t;
__extension__ typedef unsigned __int128 uint128_t;

template <>
struct unsigned_of<int128_t> {
    using type = uint128_t;
};

template <>
struct unsigned_of<uint128_t> {
    using type = uint128_t;
};

template <typename T>
inline constexpr bool is_int128_v
    = std::same_as<std::remove_cv_t<T>, int128_t> || std::same_as<std::remove_cv_t<T>, uint128_t>;
#else
template <typename T>
inline constexpr bool is_int128_v = false;
#endif

}  // namespace endian_detail

/**
 * @brief Integer types that can be encoded by read_int() and write_int()
 *
 * These are the standard integer types other than `bool`, and `__int128` and
 * `unsigned __int128` where the compiler provides them.
 */
template <typename T>
concept fixed_width_integer = (std::integral<T> && !std::same_as<std::remove_cv_t<T>, bool>)
    || endian_detail::is_int128_v<T>;

/// Floating point types that can be encoded by read_float() and write_float()
template <typename T>
concept fixed_width_float = std::floating_point<T> && (sizeof(T) == 4 || sizeof(T) == 8);

namespace endian_detail {

template <fixed_width_integer T>
using unsigned_of_t = typename unsigned_of<std::remove_cv_t<T>>::type;

template <typename U>
constexpr std::array<std::byte, sizeof(U)> to_bytes(U value, byte_order order) noexcept {
    std::array<std::byte, sizeof(U)> ret{};
    for (std::size_t i = 0; i < sizeof(U); ++i) {
        const auto shift = 8 * (order == byte_order::big ? sizeof(U) - 1 - i : i);
        ret[i]           = static_cast<std::byte>(static_cast<unsigned char>(value >> shift));
    }
    return ret;
}

template <typename U>
constexpr U from_bytes(const std::array<std::byte, sizeof(U)>& bytes, byte_order order) noexcept {
    U ret = 0;
    for (std::size_t i = 0; i < sizeof(U); ++i) {
        const auto shift = 8 * (order == byte_order::big ? sizeof(U) - 1 - i : i);
        const auto b     = static_cast<U>(std::to_integer<unsigned char>(bytes[i]));
        ret              = static_cast<U>(ret | static_cast<U>(b << shift));
    }
    return ret;
}

template <fixed_width_float F>
using float_bits_t = std::conditional_t<sizeof(F) == 4, std::uint32_t, std::uint64_t>;

}  // namespace endian_detail

/**
 * @brief Read a fixed-width integer from the given source
 *
 * @tparam T The integer type. Exactly sizeof(T) bytes are read.
 * @param src The source to read from
 * @param order The byte order of the encoded value
 *
 * @throws unexpected_eof_error if the source ends before sizeof(T) bytes are read
 */
template <fixed_width_integer T>
[[nodiscard]] T read_int(byte_source& src, byte_order order = byte_order::big) {
    using U = endian_detail::unsigned_of_t<T>;
    std::array<std::byte, sizeof(T)> buf{};
    src.read_exact_into(buf);
    return static_cast<T>(endian_detail::from_bytes<U>(buf, order));
}

/**
 * @brief Write a fixed-width integer into the given sink
 *
 * @param out The sink to write to
 * @param value The value to encode
 * @param order The byte order in which to encode the value
 */
template <fixed_width_integer T>
void write_int(byte_sink& out, T value, byte_order order = byte_order::big) {
    using U    = endian_detail::unsigned_of_t<T>;
    auto bytes = endian_detail::to_bytes(static_cast<U>(value), order);
    out.write_all(bytes);
}

/**
 * @brief Read a float or double from the given source, as the bits of its IEEE-754 encoding
 *
 * @throws unexpected_eof_error if the source ends before sizeof(F) bytes are read
 */
template <fixed_width_float F>
[[nodiscard]] F read_float(byte_source& src, byte_order order = byte_order::big) {
    return std::bit_cast<F>(read_int<endian_detail::float_bits_t<F>>(src, order));
}

/// Write a float or double into the given sink, as the bits of its IEEE-754 encoding
template <fixed_width_float F>
void write_float(byte_sink& out, F value, byte_order order = byte_order::big) {
    write_int(out, std::bit_cast<endian_detail::float_bits_t<F>>(value), order);
}

/**
 * @brief Read up to `count` raw bytes
 *
 * @return std::string The bytes that were read. Shorter than `count` only if the source ended.
 */
[[nodiscard]] inline std::string read_bytes(byte_source& src, std::size_t count) {
    std::string ret;
    ret.resize(count);
    std::size_t nread = 0;
    while (nread != count) {
        auto n = src.read_into(ret.data() + nread, count - nread);
        if (n == 0) {
            break;
        }
        nread += n;
    }
    ret.resize(nread);
    return ret;
}

/// Write all of the given raw bytes
inline void write_bytes(byte_sink& out, trivial_range auto&& data) { out.write_all(data); }

}  // namespace tpipe
