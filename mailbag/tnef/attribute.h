#ifndef ATTRIBUTE_H
#define ATTRIBUTE_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "format.h"

namespace attribute {

struct Attribute {
    format::Level level;
    uint32_t id;
    // NOTE: Decides whether a text value is NUL terminated or fixed length
    uint32_t value_type;
    std::vector<std::byte> payload;

    auto operator==(const Attribute&) const -> bool = default;
};

}

#endif // ATTRIBUTE_H
