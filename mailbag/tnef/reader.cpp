#include "reader.h"

reader::Reader::Reader(std::span<const std::byte> bytes) noexcept
    : remaining_(bytes)
    , consumed_(0uz) {}

auto reader::Reader::read_bytes(uint32_t count)
        -> std::expected<std::span<const std::byte>, reader::Error> {
    if (remaining_.size() < count) {
        return std::unexpected(reader::Error::Truncated);
    }

    const auto result = remaining_.first(count);
    remaining_ = remaining_.subspan(count);
    consumed_ += count;

    return result;
}

auto reader::Reader::remaining() const noexcept -> std::size_t {
    return remaining_.size();
}

auto reader::Reader::position() const noexcept -> std::size_t {
    return consumed_;
}
