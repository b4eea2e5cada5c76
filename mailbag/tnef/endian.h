#ifndef ENDIAN_H
#define ENDIAN_H

#include <bit>
#include <concepts>
#include <cstdint>

#ifdef __cplusplus
extern "C++" {

namespace endian {

template <typename T>
concept MultiByteIntegral =
    std::same_as<T, uint8_t>
    || std::same_as<T, uint16_t>
    || std::same_as<T, uint32_t>;

// NOTE: TNEF stores every multi-byte integer in little-endian order
template <MultiByteIntegral V>
constexpr auto little(V value) -> V {
    if constexpr (std::same_as<V, uint8_t>) {
        return value;
    } else if constexpr (std::endian::native == std::endian::little) {
        return value;
    } else {
        return std::byteswap(value);
    }
}

}

}
#endif

#endif // ENDIAN_H
