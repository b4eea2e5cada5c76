#ifndef HEADER_H
#define HEADER_H

#include <cstdint>
#include <expected>

#include "parsing.h"
#include "reader.h"

namespace header {

struct Header {
    // NOTE: Legacy key, carried along but never validated
    uint16_t key;

    static auto parse(reader::Reader&) noexcept
        -> std::expected<Header, parsing::Error>;
};

}

#endif // HEADER_H
