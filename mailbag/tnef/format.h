#ifndef FORMAT_H
#define FORMAT_H

#include <cstddef>
#include <cstdint>

namespace format {

inline constexpr uint32_t signature = 0x223E9F78;

// NOTE: Signature plus the legacy key
inline constexpr std::size_t header_size = sizeof(uint32_t) + sizeof(uint16_t);

// NOTE: Level, attribute ID, value type and payload length
inline constexpr std::size_t record_prefix_size =
    sizeof(uint8_t) + 3 * sizeof(uint32_t);

enum class Level : uint8_t {
    Message = 0x01,
    Attachment = 0x02
};

enum class ValueType : uint32_t {
    Triples = 0x0000,
    String = 0x0001,
    Text = 0x0002,
    Date = 0x0003,
    Short = 0x0004,
    Long = 0x0005,
    Byte = 0x0006,
    Word = 0x0007,
    Dword = 0x0008
};

// NOTE: Identifiers as defined by MS-OXTNEF, the high word repeats the
// attribute's canonical value type.
namespace attribute_id {

inline constexpr uint32_t From = 0x00008000;
inline constexpr uint32_t Subject = 0x00018004;
inline constexpr uint32_t DateSent = 0x00038005;
inline constexpr uint32_t DateReceived = 0x00038006;
inline constexpr uint32_t MessageStatus = 0x00068007;
inline constexpr uint32_t MessageClass = 0x00078008;
inline constexpr uint32_t MessageId = 0x00018009;
inline constexpr uint32_t Body = 0x0002800C;
inline constexpr uint32_t Priority = 0x0004800D;
inline constexpr uint32_t DateModified = 0x00038020;
inline constexpr uint32_t MessageProperties = 0x00069003;
inline constexpr uint32_t RecipientTable = 0x00069004;
inline constexpr uint32_t TnefVersion = 0x00089006;
inline constexpr uint32_t OemCodePage = 0x00069007;

inline constexpr uint32_t AttachData = 0x0006800F;
inline constexpr uint32_t AttachTitle = 0x00018010;
inline constexpr uint32_t AttachMetaFile = 0x00068011;
inline constexpr uint32_t AttachCreateDate = 0x00038012;
inline constexpr uint32_t AttachModifyDate = 0x00038013;
inline constexpr uint32_t AttachTransportFilename = 0x00069001;
inline constexpr uint32_t AttachRenderData = 0x00069002;
inline constexpr uint32_t Attachment = 0x00069005;

}

constexpr auto is_level(uint8_t value) -> bool {
    return value == static_cast<uint8_t>(Level::Message)
        || value == static_cast<uint8_t>(Level::Attachment);
}

}

#endif // FORMAT_H
