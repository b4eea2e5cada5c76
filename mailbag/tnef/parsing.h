#ifndef PARSING_H
#define PARSING_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "reader.h"

namespace parsing {

enum ErrorKind {
    InvalidSignature,
    InvalidLevel,
    UnexpectedEof,
    ChecksumMismatch
};

struct Error {
    ErrorKind kind;
    // NOTE: Byte offset into the input where the failing unit started
    std::size_t offset;
    std::optional<uint32_t> attribute_id;
    std::optional<uint8_t> level;

    auto operator==(const Error&) const -> bool = default;
};

auto truncated(const reader::Reader&) noexcept -> Error;
auto truncated_at(std::size_t offset) noexcept -> Error;
auto invalid_signature() noexcept -> Error;
auto invalid_level(std::size_t offset, uint8_t level) noexcept -> Error;
auto checksum_mismatch(std::size_t offset, uint32_t attribute_id) noexcept
    -> Error;

auto name(ErrorKind) -> const char*;
auto describe(const Error&) -> std::string;

}

#endif // PARSING_H
