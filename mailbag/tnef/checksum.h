#ifndef CHECKSUM_H
#define CHECKSUM_H

#include <cstddef>
#include <cstdint>
#include <span>

namespace checksum {

// Sum of every byte, modulo 65536
auto compute(std::span<const std::byte> payload) noexcept -> uint16_t;

auto verify(std::span<const std::byte> payload, uint16_t stored) noexcept
    -> bool;

}

#endif // CHECKSUM_H
