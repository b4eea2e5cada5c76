#include <format>

#include "parsing.h"

auto parsing::truncated(const reader::Reader& reader) noexcept
        -> parsing::Error {
    return truncated_at(reader.position());
}

auto parsing::truncated_at(std::size_t offset) noexcept -> parsing::Error {
    return parsing::Error{
        parsing::ErrorKind::UnexpectedEof,
        offset,
        std::nullopt,
        std::nullopt
    };
}

auto parsing::invalid_signature() noexcept -> parsing::Error {
    return parsing::Error{
        parsing::ErrorKind::InvalidSignature,
        0uz,
        std::nullopt,
        std::nullopt
    };
}

auto parsing::invalid_level(std::size_t offset, uint8_t level) noexcept
        -> parsing::Error {
    return parsing::Error{
        parsing::ErrorKind::InvalidLevel,
        offset,
        std::nullopt,
        level
    };
}

auto parsing::checksum_mismatch(std::size_t offset, uint32_t attribute_id)
        noexcept -> parsing::Error {
    return parsing::Error{
        parsing::ErrorKind::ChecksumMismatch,
        offset,
        attribute_id,
        std::nullopt
    };
}

auto parsing::name(parsing::ErrorKind kind) -> const char* {
    switch (kind) {
        case parsing::ErrorKind::InvalidSignature:
            return "InvalidSignature";
        case parsing::ErrorKind::InvalidLevel:
            return "InvalidLevel";
        case parsing::ErrorKind::UnexpectedEof:
            return "UnexpectedEof";
        case parsing::ErrorKind::ChecksumMismatch:
            return "ChecksumMismatch";
    }

    return "Unknown";
}

auto parsing::describe(const parsing::Error& error) -> std::string {
    switch (error.kind) {
        case parsing::ErrorKind::InvalidSignature:
            return "Input does not start with the TNEF signature";
        case parsing::ErrorKind::InvalidLevel:
            return std::format(
                "Invalid attribute level 0x{:02X} at offset {}",
                error.level.value_or(0u),
                error.offset
            );
        case parsing::ErrorKind::UnexpectedEof:
            return std::format(
                "Input truncated in record starting at offset {}",
                error.offset
            );
        case parsing::ErrorKind::ChecksumMismatch:
            return std::format(
                "Checksum mismatch for attribute 0x{:08X} at offset {}",
                error.attribute_id.value_or(0u),
                error.offset
            );
    }

    return std::format("Unknown decode failure at offset {}", error.offset);
}
