#include <algorithm>
#include <iterator>

#include "format.h"
#include "reader.h"
#include "values.h"

auto values::DateTime::to_sys_seconds() const -> std::chrono::sys_seconds {
    const auto date = std::chrono::year_month_day{
        std::chrono::year{year},
        std::chrono::month{month},
        std::chrono::day{day}
    };

    return std::chrono::sys_days{date}
        + std::chrono::hours{hour}
        + std::chrono::minutes{minute}
        + std::chrono::seconds{second};
}

auto values::parse_rendering_data(std::span<const std::byte> payload) noexcept
        -> std::optional<values::RenderingData> {
    if (payload.size() != RenderingData::size) {
        return std::nullopt;
    }

    reader::Reader reader{payload};

    const auto attach_type = reader.read_unchecked<uint16_t>();
    const auto position = reader.read_unchecked<uint32_t>();
    const auto width = reader.read_unchecked<uint16_t>();
    const auto height = reader.read_unchecked<uint16_t>();
    const auto flags = reader.read_unchecked<uint32_t>();

    if (attach_type != static_cast<uint16_t>(AttachType::File)
            && attach_type != static_cast<uint16_t>(AttachType::Ole)) {
        return std::nullopt;
    }

    if (flags != static_cast<uint32_t>(DataFlags::Default)
            && flags != static_cast<uint32_t>(DataFlags::MacBinary)) {
        return std::nullopt;
    }

    return values::RenderingData{
        static_cast<AttachType>(attach_type),
        position,
        width,
        height,
        static_cast<DataFlags>(flags)
    };
}

auto values::parse_date(std::span<const std::byte> payload) noexcept
        -> std::optional<values::DateTime> {
    if (payload.size() != DateTime::size) {
        return std::nullopt;
    }

    reader::Reader reader{payload};

    const auto result = values::DateTime{
        reader.read_unchecked<uint16_t>(),
        reader.read_unchecked<uint16_t>(),
        reader.read_unchecked<uint16_t>(),
        reader.read_unchecked<uint16_t>(),
        reader.read_unchecked<uint16_t>(),
        reader.read_unchecked<uint16_t>(),
        reader.read_unchecked<uint16_t>()
    };

    const auto date = std::chrono::year_month_day{
        std::chrono::year{result.year},
        std::chrono::month{result.month},
        std::chrono::day{result.day}
    };

    if (!date.ok() || result.hour > 23u || result.minute > 59u
            || result.second > 59u) {
        return std::nullopt;
    }

    return result;
}

auto values::parse_string(std::span<const std::byte> payload, uint32_t value_type)
        -> std::string {
    const auto terminated =
        value_type == static_cast<uint32_t>(format::ValueType::String);
    const auto end = terminated
        ? std::find(payload.begin(), payload.end(), std::byte{0})
        : payload.end();

    std::string result{};
    result.reserve(static_cast<std::size_t>(end - payload.begin()));

    std::transform(payload.begin(), end, std::back_inserter(result),
        [](const std::byte b) { return static_cast<char>(b); });

    return result;
}
