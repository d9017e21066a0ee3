#pragma once
#include <bit>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace iqdec::utils {

enum class ByteOrder { Little, Big };

namespace detail {
template <std::size_t N> struct uint_of_size;
template <> struct uint_of_size<1> { using type = uint8_t; };
template <> struct uint_of_size<2> { using type = uint16_t; };
template <> struct uint_of_size<4> { using type = uint32_t; };
template <> struct uint_of_size<8> { using type = uint64_t; };
} // namespace detail

// Assemble a trivially copyable value of 1/2/4/8 bytes from `p` in the given
// byte order, independent of host endianness.
template <typename T>
inline T load(const uint8_t* p, ByteOrder order) {
    static_assert(std::is_trivially_copyable_v<T>);
    using U = typename detail::uint_of_size<sizeof(T)>::type;
    U v = 0;
    if (order == ByteOrder::Little) {
        for (std::size_t i = 0; i < sizeof(T); ++i) v = static_cast<U>(v | (U(p[i]) << (8 * i)));
    } else {
        for (std::size_t i = 0; i < sizeof(T); ++i) v = static_cast<U>((v << 8) | U(p[i]));
    }
    return std::bit_cast<T>(v);
}

template <typename T> inline T load_le(const uint8_t* p) { return load<T>(p, ByteOrder::Little); }
template <typename T> inline T load_be(const uint8_t* p) { return load<T>(p, ByteOrder::Big); }

} // namespace iqdec::utils
