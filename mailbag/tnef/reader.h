#ifndef READER_H
#define READER_H

#include <algorithm>
#include <array>
#include <cstddef>
#include <expected>
#include <span>

#include "endian.h"

namespace reader {

enum Error {
    Truncated,
};

// Forward-only cursor over a borrowed buffer. Every read is bounds checked.
class Reader {
private:
    std::span<const std::byte> remaining_;
    std::size_t consumed_;
public:
    explicit Reader(std::span<const std::byte>) noexcept;

    auto read_bytes(uint32_t)
        -> std::expected<std::span<const std::byte>, Error>;

    auto remaining() const noexcept -> std::size_t;
    auto position() const noexcept -> std::size_t;

    template <endian::MultiByteIntegral V>
    auto read_unchecked() -> V {
        std::array<std::byte, sizeof(V)> buffer;
        std::copy_n(remaining_.begin(), sizeof(V), buffer.begin());

        remaining_ = remaining_.subspan(sizeof(V));
        consumed_ += sizeof(V);
        return endian::little(std::bit_cast<V>(buffer));
    }

    template <endian::MultiByteIntegral V>
    auto read() -> std::expected<V, Error> {
        if (remaining_.size() < sizeof(V)) {
            return std::unexpected(Error::Truncated);
        }

        return read_unchecked<V>();
    }
};

}

#endif // READER_H
