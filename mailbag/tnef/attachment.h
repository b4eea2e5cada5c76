#ifndef ATTACHMENT_H
#define ATTACHMENT_H

#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "attribute.h"
#include "parsing.h"
#include "stream.h"
#include "values.h"

namespace attachment {

struct Attachment {
    std::optional<std::string> name;
    std::vector<std::byte> data;
    std::optional<values::RenderingData> rendering;
    std::optional<values::DateTime> created;
    std::optional<values::DateTime> modified;
    std::optional<std::string> transport_filename;
    std::vector<std::byte> metafile;
    // NOTE: Raw MAPI property block, left uninterpreted
    std::vector<std::byte> properties;

    auto operator==(const Attachment&) const -> bool = default;
};

using Item = std::expected<Attachment, parsing::Error>;

// Groups attachment-level attributes into attachments. A render data
// attribute closes the current attachment and opens the next one.
class AttachmentReader {
private:
    stream::AttributeStream attributes_;
    std::optional<Attachment> current_;
    std::optional<parsing::Error> error_;
    bool finished_;

    auto fold(const attribute::Attribute&) -> void;
public:
    explicit AttachmentReader(stream::AttributeStream) noexcept;

    static auto open(std::span<const std::byte>)
        -> std::expected<AttachmentReader, parsing::Error>;

    // Yields std::nullopt at the end of input. An attachment still being
    // assembled when an error occurs is dropped and the error is repeated
    // on every later call.
    auto next() -> std::optional<Item>;
};

auto extract_attachments(std::span<const std::byte>)
    -> std::expected<std::vector<Attachment>, parsing::Error>;

// Attachments completed before a failure remain in the output vector
auto extract_attachments(std::span<const std::byte>, std::vector<Attachment>&)
    -> std::expected<void, parsing::Error>;

}

#endif // ATTACHMENT_H
