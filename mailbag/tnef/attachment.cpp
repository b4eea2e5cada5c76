#include <utility>

#include "attachment.h"
#include "format.h"

attachment::AttachmentReader::AttachmentReader(
    stream::AttributeStream attributes
) noexcept
    : attributes_(std::move(attributes))
    , current_(std::nullopt)
    , error_(std::nullopt)
    , finished_(false) {}

auto attachment::AttachmentReader::open(std::span<const std::byte> buffer)
        -> std::expected<attachment::AttachmentReader, parsing::Error> {
    auto attributes = stream::open(buffer);

    if (!attributes) {
        return std::unexpected(attributes.error());
    }

    return attachment::AttachmentReader{std::move(attributes.value())};
}

auto attachment::AttachmentReader::fold(const attribute::Attribute& attribute)
        -> void {
    // NOTE: Attributes ahead of the first render data marker still get a
    // home rather than being discarded
    if (!current_) {
        current_ = Attachment{};
    }

    auto& target = current_.value();
    const auto& payload = attribute.payload;

    switch (attribute.id) {
        case format::attribute_id::AttachTitle:
            target.name = values::parse_string(payload, attribute.value_type);
            break;
        case format::attribute_id::AttachData:
            target.data.insert(target.data.end(), payload.begin(), payload.end());
            break;
        case format::attribute_id::AttachCreateDate:
            target.created = values::parse_date(payload);
            break;
        case format::attribute_id::AttachModifyDate:
            target.modified = values::parse_date(payload);
            break;
        case format::attribute_id::AttachTransportFilename:
            target.transport_filename = values::parse_string(payload, attribute.value_type);
            break;
        case format::attribute_id::AttachMetaFile:
            target.metafile = payload;
            break;
        case format::attribute_id::Attachment:
            target.properties = payload;
            break;
        default:
            break;
    }
}

auto attachment::AttachmentReader::next() -> std::optional<attachment::Item> {
    if (error_) {
        return std::unexpected(error_.value());
    }

    while (!finished_) {
        const auto item = attributes_.next();

        if (!item) {
            finished_ = true;
            break;
        }

        if (!item.value()) {
            error_ = item.value().error();
            current_ = std::nullopt;
            return std::unexpected(error_.value());
        }

        const auto& attribute = item.value().value();

        if (attribute.level != format::Level::Attachment) {
            continue;
        }

        if (attribute.id == format::attribute_id::AttachRenderData) {
            auto completed = std::exchange(current_, Attachment{});
            current_->rendering = values::parse_rendering_data(attribute.payload);

            if (completed) {
                return std::move(completed.value());
            }

            continue;
        }

        fold(attribute);
    }

    if (current_) {
        auto completed = std::move(current_.value());
        current_ = std::nullopt;
        return std::move(completed);
    }

    return std::nullopt;
}

auto attachment::extract_attachments(
    std::span<const std::byte> buffer,
    std::vector<attachment::Attachment>& out
) -> std::expected<void, parsing::Error> {
    auto reader = attachment::AttachmentReader::open(buffer);

    if (!reader) {
        return std::unexpected(reader.error());
    }

    while (auto item = reader.value().next()) {
        if (!item.value()) {
            return std::unexpected(item.value().error());
        }

        out.push_back(std::move(item.value().value()));
    }

    return {};
}

auto attachment::extract_attachments(std::span<const std::byte> buffer)
        -> std::expected<std::vector<attachment::Attachment>, parsing::Error> {
    std::vector<attachment::Attachment> result{};
    const auto outcome = extract_attachments(buffer, result);

    if (!outcome) {
        return std::unexpected(outcome.error());
    }

    return result;
}
