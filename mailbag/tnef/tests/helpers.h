#ifndef HELPERS_H
#define HELPERS_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <initializer_list>
#include <span>
#include <string_view>
#include <vector>

#include "gmock/gmock.h"

#include "tnef/checksum.h"
#include "tnef/endian.h"
#include "tnef/format.h"

MATCHER_P(EqualsBinary, expected, "Binary elements are equal in size and value") {
    if (arg.size() != expected.size()) {
        *result_listener << "Size of spans did not match: "
            << expected.size() << " expected, " << arg.size() << " actual";

        return false;
    }

    for (auto i = 0uz; i < expected.size(); ++i) {
        if (expected[i] != arg[i]) {
            *result_listener << "Encountered mismatch at byte index " << i
                << ", expected "
                << std::format("0x{:02X}", std::to_integer<unsigned>(expected[i]))
                << " but got "
                << std::format("0x{:02X}", std::to_integer<unsigned>(arg[i]));

            return false;
        }
    }

    return true;
}

inline auto bytes(std::initializer_list<uint8_t> values) -> std::vector<std::byte> {
    std::vector<std::byte> result{};
    result.reserve(values.size());

    for (const auto value : values) {
        result.push_back(std::byte{value});
    }

    return result;
}

inline auto text(std::string_view value) -> std::vector<std::byte> {
    std::vector<std::byte> result{};
    result.reserve(value.size());

    for (const auto c : value) {
        result.push_back(static_cast<std::byte>(c));
    }

    return result;
}

// Assembles TNEF fixtures in memory, little-endian throughout
class StreamBuilder {
private:
    std::vector<std::byte> buffer_;
public:
    template <endian::MultiByteIntegral V>
    auto write(V value) -> StreamBuilder& {
        const auto raw = std::bit_cast<std::array<std::byte, sizeof(V)>>(
            endian::little(value)
        );

        buffer_.insert(buffer_.end(), raw.begin(), raw.end());
        return *this;
    }

    auto write(std::span<const std::byte> data) -> StreamBuilder& {
        buffer_.insert(buffer_.end(), data.begin(), data.end());
        return *this;
    }

    auto header(uint16_t key = 0x0001u) -> StreamBuilder& {
        write(format::signature);
        return write(key);
    }

    auto record(
        format::Level level,
        uint32_t id,
        uint32_t value_type,
        std::span<const std::byte> payload
    ) -> StreamBuilder& {
        return record_with_checksum(
            level,
            id,
            value_type,
            payload,
            checksum::compute(payload)
        );
    }

    auto record_with_checksum(
        format::Level level,
        uint32_t id,
        uint32_t value_type,
        std::span<const std::byte> payload,
        uint16_t stored
    ) -> StreamBuilder& {
        write(static_cast<uint8_t>(level));
        write(id);
        write(value_type);
        write(static_cast<uint32_t>(payload.size()));
        write(payload);
        return write(stored);
    }

    auto attach(uint32_t id, format::ValueType type, std::span<const std::byte> payload)
            -> StreamBuilder& {
        return record(
            format::Level::Attachment,
            id,
            static_cast<uint32_t>(type),
            payload
        );
    }

    auto message(uint32_t id, format::ValueType type, std::span<const std::byte> payload)
            -> StreamBuilder& {
        return record(
            format::Level::Message,
            id,
            static_cast<uint32_t>(type),
            payload
        );
    }

    auto view() const noexcept -> std::span<const std::byte> {
        return buffer_;
    }

    auto build() const -> std::vector<std::byte> {
        return buffer_;
    }
};

#endif // HELPERS_H
