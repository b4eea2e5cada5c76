#include <array>

#include "format.h"
#include "header.h"

namespace {

// NOTE: A short input is only a signature failure if the bytes we do have
// already disagree with the magic.
auto matches_signature_prefix(std::span<const std::byte> prefix) noexcept
        -> bool {
    const auto magic = std::bit_cast<std::array<std::byte, sizeof(uint32_t)>>(
        endian::little(format::signature)
    );

    return std::equal(prefix.begin(), prefix.end(), magic.begin());
}

}

auto header::Header::parse(reader::Reader& reader) noexcept
        -> std::expected<header::Header, parsing::Error> {
    if (reader.remaining() < sizeof(uint32_t)) {
        const auto available = reader.read_bytes(
            static_cast<uint32_t>(reader.remaining())
        );

        if (!available || !matches_signature_prefix(available.value())) {
            return std::unexpected(parsing::invalid_signature());
        }

        return std::unexpected(parsing::truncated_at(0uz));
    }

    if (reader.read_unchecked<uint32_t>() != format::signature) {
        return std::unexpected(parsing::invalid_signature());
    }

    const auto key = reader.read<uint16_t>();

    if (!key) {
        return std::unexpected(parsing::truncated(reader));
    }

    return header::Header{key.value()};
}
