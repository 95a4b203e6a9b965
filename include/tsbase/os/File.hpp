#pragma once

#include <string>
#include <string_view>

namespace tsbase::os {

struct ReadTextResult {
    bool ok = false;
    std::string text{};
    std::string err{};
};

/// @brief Reads a whole file as UTF-8.
///
/// A leading byte order mark selects the encoding: EF BB BF is removed,
/// FE FF / FF FE transcode UTF-16 BE / LE. Without a mark the bytes are
/// validated as UTF-8. Line endings are kept as-is.
ReadTextResult read_source_file(std::string_view path);

bool file_exists(std::string_view path);

} // namespace tsbase::os
