#ifndef OUTPUT_H
#define OUTPUT_H

#include <cstddef>
#include <filesystem>

#include "tnef/attachment.h"

namespace output {

// Picks the title, then the transport filename, then a numbered fallback.
// Only the final path component of a name is ever used.
auto file_name(const attachment::Attachment&, std::size_t index)
    -> std::filesystem::path;

// Appends "-1", "-2", ... before the extension until nothing on disk
// would be overwritten.
auto unique_destination(
    const std::filesystem::path& directory,
    const std::filesystem::path& name
) -> std::filesystem::path;

}

#endif // OUTPUT_H
