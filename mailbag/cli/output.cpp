#include <format>
#include <initializer_list>
#include <optional>
#include <string>

#include "output.h"

auto output::file_name(const attachment::Attachment& attachment, std::size_t index)
        -> std::filesystem::path {
    for (const auto& candidate : {attachment.name, attachment.transport_filename}) {
        if (!candidate) {
            continue;
        }

        const auto name = std::filesystem::path{candidate.value()}.filename();

        if (!name.empty() && name != "." && name != "..") {
            return name;
        }
    }

    return std::format("attachment-{}.bin", index);
}

auto output::unique_destination(
    const std::filesystem::path& directory,
    const std::filesystem::path& name
) -> std::filesystem::path {
    auto destination = directory / name;

    const auto stem = name.stem().string();
    const auto extension = name.extension().string();

    for (auto i = 1uz; std::filesystem::exists(destination); ++i) {
        destination = directory / std::format("{}-{}{}", stem, i, extension);
    }

    return destination;
}
