#include <cstdlib>
#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>
#include <span>
#include <stdexcept>
#include <vector>

#include "logging.h"
#include "output.h"
#include "tnef/attachment.h"
#include "tnef/format.h"
#include "tnef/parsing.h"
#include "tnef/stream.h"

using namespace std::literals;

auto root_help() -> void {
    std::println(stderr, "mailbag CLI v0.1.0\n");
    std::println(stderr, "Decodes TNEF (winmail.dat) attachments\n");
    std::println(stderr, "USAGE");
    std::println(stderr, "  $ mailbag inspect - Lists the attributes in a TNEF file");
    std::println(stderr, "  $ mailbag unpack - Writes the attachments of a TNEF file\n");
    std::println(stderr, "Flags:");
    std::println(stderr, "  -h, --help print this message");
}

auto root_usage() -> void {
    std::println(stderr, "Usage:");
    std::println(stderr, "  mailbag (-h|--help)");
    std::println(stderr, "  mailbag inspect <FILE>");
    std::println(stderr, "  mailbag unpack <FILE> <DIRECTORY>");
}

constexpr auto level_name(const format::Level level) -> const char* {
    switch (level) {
        case format::Level::Message:
            return "message";
        case format::Level::Attachment:
            return "attachment";
    }

    return "unknown";
}

auto read_file(const std::filesystem::path& target) -> std::vector<std::byte> {
    if (!std::filesystem::exists(target)) {
        throw std::runtime_error(
            std::format("Requested file ({}) does not exist", target.string())
        );
    }

    std::ifstream file_reader{target, std::ios::binary | std::ios::ate};

    if (!file_reader.is_open()) {
        throw std::runtime_error(
            std::format("Failed to open file ({})", target.string())
        );
    }

    const auto size = file_reader.tellg();

    if (size < 0) {
        throw std::runtime_error(
            std::format("Failed to determine file ({}) size", target.string())
        );
    }

    file_reader.seekg(0, std::ios::beg);

    std::vector<std::byte> contents{};
    contents.resize(static_cast<std::size_t>(size));

    if (!file_reader.read(reinterpret_cast<char*>(contents.data()), size)) {
        throw std::runtime_error(
            std::format("Failed to read file ({}) contents", target.string())
        );
    }

    return contents;
}

auto inspect_tnef_file(const std::filesystem::path& target) -> void {
    const auto contents = read_file(target);
    auto attributes = stream::open(contents);

    if (!attributes) {
        throw std::runtime_error(
            std::format(
                "Failed to parse file ({}): {}",
                target.string(),
                parsing::describe(attributes.error())
            )
        );
    }

    std::println("TNEF Overview:");
    std::println("  Key          - 0x{:04X}", attributes.value().key());
    std::println("Attributes:");

    for (const auto& item : attributes.value()) {
        if (!item) {
            throw std::runtime_error(
                std::format(
                    "Failed to parse file ({}): {}",
                    target.string(),
                    parsing::describe(item.error())
                )
            );
        }

        const auto& attribute = item.value();

        std::println(
            "  {:<10} 0x{:08X} type 0x{:04X} {:>8} bytes",
            level_name(attribute.level),
            attribute.id,
            attribute.value_type,
            attribute.payload.size()
        );
    }

    const auto& summary = attributes.value();

    if (const auto version = summary.version()) {
        std::println("  Version      - 0x{:08X}", version.value());
    }

    if (const auto code_page = summary.code_page()) {
        std::println("  Code Page    - {}", code_page.value());
    }
}

auto unpack_tnef_file(
    const std::filesystem::path& target,
    const std::filesystem::path& directory
) -> void {
    const auto contents = read_file(target);

    std::vector<attachment::Attachment> attachments{};
    const auto outcome = attachment::extract_attachments(contents, attachments);

    if (!std::filesystem::is_directory(directory)) {
        throw std::runtime_error(
            std::format("Output directory ({}) does not exist", directory.string())
        );
    }

    for (auto i = 0uz; i < attachments.size(); ++i) {
        const auto& attachment = attachments[i];
        const auto destination = output::unique_destination(
            directory,
            output::file_name(attachment, i + 1)
        );

        std::ofstream stream{destination, std::ios::binary};

        if (!stream) {
            throw std::runtime_error(
                std::format("Failed to open file ({})", destination.string())
            );
        }

        stream.write(
            reinterpret_cast<const char*>(attachment.data.data()),
            static_cast<std::streamsize>(attachment.data.size())
        );

        if (!stream) {
            throw std::runtime_error(
                std::format("Failed to write file ({})", destination.string())
            );
        }

        logging::info(
            std::format(
                "Wrote {} ({} bytes)",
                destination.string(),
                attachment.data.size()
            )
        );
    }

    if (!outcome) {
        throw std::runtime_error(
            std::format(
                "Failed to parse file ({}) after {} attachment(s): {}",
                target.string(),
                attachments.size(),
                parsing::describe(outcome.error())
            )
        );
    }
}

auto main(int argc, char** argv) -> int {
    if (argc == 2 && (argv[1] == "-h"sv || argv[1] == "--help"sv)) {
        root_help();
        return EXIT_SUCCESS;
    }

    try {
        if (argc == 3 && argv[1] == "inspect"sv) {
            inspect_tnef_file(argv[2]);
        } else if (argc == 4 && argv[1] == "unpack"sv) {
            unpack_tnef_file(argv[2], argv[3]);
        } else {
            root_usage();
            return EXIT_FAILURE;
        }
    } catch (const std::exception& e) {
        logging::error(e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
