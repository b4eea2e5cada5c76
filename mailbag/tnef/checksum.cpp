#include "checksum.h"

auto checksum::compute(std::span<const std::byte> payload) noexcept
        -> uint16_t {
    uint16_t sum = 0u;

    for (const auto byte : payload) {
        sum = static_cast<uint16_t>(sum + std::to_integer<uint16_t>(byte));
    }

    return sum;
}

auto checksum::verify(std::span<const std::byte> payload, uint16_t stored)
        noexcept -> bool {
    return compute(payload) == stored;
}
