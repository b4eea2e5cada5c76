#include "checksum.h"
#include "format.h"
#include "stream.h"

stream::AttributeStream::AttributeStream(
    reader::Reader reader,
    header::Header header
) noexcept
    : reader_(reader)
    , header_(header)
    , state_(stream::State::Ready)
    , error_(std::nullopt)
    , code_page_(std::nullopt)
    , version_(std::nullopt) {}

auto stream::AttributeStream::read_record() -> stream::Item {
    const auto start = reader_.position();
    const auto prefix = reader_.read_bytes(format::record_prefix_size);

    if (!prefix) {
        // NOTE: A lone invalid level byte is reported as such, not as EOF
        const auto level = reader_.read<uint8_t>();

        if (level && !format::is_level(level.value())) {
            return std::unexpected(parsing::invalid_level(start, level.value()));
        }

        return std::unexpected(parsing::truncated_at(start));
    }

    reader::Reader prefix_reader{prefix.value()};

    const auto level = prefix_reader.read_unchecked<uint8_t>();

    if (!format::is_level(level)) {
        return std::unexpected(parsing::invalid_level(start, level));
    }

    const auto id = prefix_reader.read_unchecked<uint32_t>();
    const auto value_type = prefix_reader.read_unchecked<uint32_t>();
    const auto length = prefix_reader.read_unchecked<uint32_t>();

    // NOTE: The declared length is never trusted beyond what is left, so
    // nothing is allocated before the bytes are known to exist.
    const auto payload = reader_.read_bytes(length);

    if (!payload) {
        return std::unexpected(parsing::truncated_at(start));
    }

    const auto stored_checksum = reader_.read<uint16_t>();

    if (!stored_checksum) {
        return std::unexpected(parsing::truncated_at(start));
    }

    if (!checksum::verify(payload.value(), stored_checksum.value())) {
        return std::unexpected(parsing::checksum_mismatch(start, id));
    }

    return attribute::Attribute{
        static_cast<format::Level>(level),
        id,
        value_type,
        std::vector<std::byte>(payload.value().begin(), payload.value().end())
    };
}

auto stream::AttributeStream::observe(const attribute::Attribute& attribute)
        -> void {
    if (attribute.level != format::Level::Message) {
        return;
    }

    // NOTE: Both values lead with a u32, the code page is followed by an
    // unused secondary code page
    reader::Reader value_reader{attribute.payload};
    const auto value = value_reader.read<uint32_t>();

    if (!value) {
        return;
    }

    switch (attribute.id) {
        case format::attribute_id::OemCodePage:
            code_page_ = value.value();
            break;
        case format::attribute_id::TnefVersion:
            version_ = value.value();
            break;
        default:
            break;
    }
}

auto stream::AttributeStream::next() -> std::optional<stream::Item> {
    switch (state_) {
        case stream::State::Done:
            return std::nullopt;
        case stream::State::Errored:
            return std::unexpected(error_.value());
        case stream::State::Ready:
            break;
    }

    if (reader_.remaining() == 0uz) {
        state_ = stream::State::Done;
        return std::nullopt;
    }

    auto result = read_record();

    if (!result) {
        state_ = stream::State::Errored;
        error_ = result.error();
    } else {
        observe(result.value());
    }

    return result;
}

auto stream::AttributeStream::state() const noexcept -> stream::State {
    return state_;
}

auto stream::AttributeStream::key() const noexcept -> uint16_t {
    return header_.key;
}

auto stream::AttributeStream::position() const noexcept -> std::size_t {
    return reader_.position();
}

auto stream::AttributeStream::code_page() const noexcept
        -> std::optional<uint32_t> {
    return code_page_;
}

auto stream::AttributeStream::version() const noexcept
        -> std::optional<uint32_t> {
    return version_;
}

stream::AttributeStream::Iterator::Iterator() noexcept
    : stream_(nullptr)
    , current_(std::nullopt) {}

stream::AttributeStream::Iterator::Iterator(stream::AttributeStream& owner)
    : stream_(&owner)
    , current_(owner.next()) {}

auto stream::AttributeStream::Iterator::operator*() const
        -> stream::AttributeStream::Iterator::reference {
    return current_.value();
}

auto stream::AttributeStream::Iterator::operator->() const
        -> stream::AttributeStream::Iterator::pointer {
    return &current_.value();
}

auto stream::AttributeStream::Iterator::operator++()
        -> stream::AttributeStream::Iterator& {
    if (!current_ || !current_.value() || stream_ == nullptr) {
        current_ = std::nullopt;
    } else {
        current_ = stream_->next();
    }

    return *this;
}

auto stream::AttributeStream::Iterator::operator++(int) -> void {
    ++*this;
}

auto stream::AttributeStream::Iterator::operator==(std::default_sentinel_t)
        const noexcept -> bool {
    return !current_.has_value();
}

auto stream::AttributeStream::begin() -> stream::AttributeStream::Iterator {
    return Iterator{*this};
}

auto stream::AttributeStream::end() noexcept -> std::default_sentinel_t {
    return std::default_sentinel;
}

auto stream::open(std::span<const std::byte> buffer)
        -> std::expected<stream::AttributeStream, parsing::Error> {
    reader::Reader reader{buffer};
    const auto header = header::Header::parse(reader);

    if (!header) {
        return std::unexpected(header.error());
    }

    return stream::AttributeStream{reader, header.value()};
}
