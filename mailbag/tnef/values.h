#ifndef VALUES_H
#define VALUES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace values {

enum class AttachType : uint16_t {
    File = 0x0001,
    Ole = 0x0002
};

enum class DataFlags : uint32_t {
    Default = 0x00000000,
    MacBinary = 0x00000001
};

struct RenderingData {
    AttachType attach_type;
    uint32_t position;
    uint16_t width;
    uint16_t height;
    DataFlags flags;

    static constexpr auto size = 14uz;

    auto operator==(const RenderingData&) const -> bool = default;
};

struct DateTime {
    uint16_t year;
    uint16_t month;
    uint16_t day;
    uint16_t hour;
    uint16_t minute;
    uint16_t second;
    uint16_t day_of_week;

    static constexpr auto size = 14uz;

    auto to_sys_seconds() const -> std::chrono::sys_seconds;

    auto operator==(const DateTime&) const -> bool = default;
};

// None of these fail the decode, a malformed value simply yields nothing.
auto parse_rendering_data(std::span<const std::byte>) noexcept
    -> std::optional<RenderingData>;

auto parse_date(std::span<const std::byte>) noexcept
    -> std::optional<DateTime>;

// String typed values end at the first NUL, or at the end of the payload if
// there is none. Every other value type is taken as a fixed-length string.
auto parse_string(std::span<const std::byte>, uint32_t value_type)
    -> std::string;

}

#endif // VALUES_H
