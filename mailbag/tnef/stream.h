#ifndef STREAM_H
#define STREAM_H

#include <cstddef>
#include <cstdint>
#include <expected>
#include <iterator>
#include <optional>
#include <span>

#include "attribute.h"
#include "header.h"
#include "parsing.h"
#include "reader.h"

namespace stream {

enum class State {
    Ready,
    Done,
    Errored
};

using Item = std::expected<attribute::Attribute, parsing::Error>;

// Lazy, pull-based sequence of attribute records following the header.
// Borrows the input buffer; every yielded payload is an owned copy.
class AttributeStream {
private:
    reader::Reader reader_;
    header::Header header_;
    State state_;
    std::optional<parsing::Error> error_;
    std::optional<uint32_t> code_page_;
    std::optional<uint32_t> version_;

    auto read_record() -> Item;
    auto observe(const attribute::Attribute&) -> void;
public:
    AttributeStream(reader::Reader, header::Header) noexcept;

    // Returns std::nullopt once the stream is cleanly exhausted. After an
    // error every call yields that same error again.
    auto next() -> std::optional<Item>;

    auto state() const noexcept -> State;
    auto key() const noexcept -> uint16_t;
    auto position() const noexcept -> std::size_t;

    // Filled in once the matching message-level record has been yielded
    auto code_page() const noexcept -> std::optional<uint32_t>;
    auto version() const noexcept -> std::optional<uint32_t>;

    class Iterator {
    private:
        AttributeStream* stream_;
        std::optional<Item> current_;
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Item;
        using difference_type = std::ptrdiff_t;
        using pointer = const Item*;
        using reference = const Item&;

        Iterator() noexcept;
        explicit Iterator(AttributeStream&);

        auto operator*() const -> reference;
        auto operator->() const -> pointer;
        auto operator++() -> Iterator&;
        auto operator++(int) -> void;

        auto operator==(std::default_sentinel_t) const noexcept -> bool;
    };

    // NOTE: Iteration ends after the first error is produced, unlike next()
    auto begin() -> Iterator;
    auto end() noexcept -> std::default_sentinel_t;
};

auto open(std::span<const std::byte>)
    -> std::expected<AttributeStream, parsing::Error>;

}

#endif // STREAM_H
