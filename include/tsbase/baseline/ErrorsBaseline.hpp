#pragma once

#include <tsbase/diag/DiagCode.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace tsbase::baseline {

struct Hint {
    uint8_t depth = 0; // leading spaces / 2
    std::string_view text{};

    bool operator==(const Hint&) const = default;
};

struct Location {
    uint32_t line = 1;   // 1-based
    uint32_t column = 1; // 1-based

    bool operator==(const Location&) const = default;
};

// Diagnostic without a file, e.g. a rejected compiler option.
struct ConfigError {
    std::string_view code{};
    std::string_view message{};
    std::vector<Hint> hints{};

    bool operator==(const ConfigError&) const = default;
};

struct FileError {
    std::string_view file{};
    std::optional<Location> loc{};
    // underline width in columns; unset when the span covers several lines
    std::optional<uint32_t> length{};
    std::string_view code{};
    std::string_view message{};
    std::vector<Hint> hints{};
    std::vector<FileError> related{};

    bool operator==(const FileError&) const = default;
};

struct ErrorsBaseline {
    std::vector<ConfigError> config_errors{};
    std::vector<FileError> file_errors{};

    bool operator==(const ErrorsBaseline&) const = default;
};

/// @brief Order of files in an errors summary: plain byte order, except that
/// `tsconfig.json` sorts first and any `lib.*.d.ts` sorts last.
/// Returns <0, 0 or >0.
int cmp_file(std::string_view a, std::string_view b);

/// @brief Parses an `.errors.txt` baseline, plain or ANSI-coloured.
///
/// The coloured form is selected when the first byte is ESC. All views point
/// into data. On malformed input a diagnostic is added to bag and
/// std::nullopt is returned.
std::optional<ErrorsBaseline> parse_errors_baseline(std::string_view path, std::string_view data, diag::Bag& bag);

} // namespace tsbase::baseline
