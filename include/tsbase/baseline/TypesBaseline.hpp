#pragma once

#include <tsbase/diag/DiagCode.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace tsbase::baseline {

struct Assertion {
    std::string_view expr{};
    std::string_view expected_type{};

    bool operator==(const Assertion&) const = default;
};

// statements[i] owns assertions[i]
struct TypeBaselineFile {
    std::vector<std::string_view> statements{};
    std::vector<std::vector<Assertion>> assertions{};

    bool operator==(const TypeBaselineFile&) const = default;
};

struct TypesBaseline {
    std::vector<std::string_view> names{};
    std::vector<TypeBaselineFile> files{};

    const TypeBaselineFile* find(std::string_view name) const;

    bool operator==(const TypesBaseline&) const = default;
};

/// @brief Parses a `.types` baseline.
///
/// All views point into data. On malformed input a diagnostic is added to bag
/// and std::nullopt is returned.
std::optional<TypesBaseline> parse_types_baseline(std::string_view path, std::string_view data, diag::Bag& bag);

// '>' followed by one of these opens an assertion; anything else is source text
bool is_assertion_lead(unsigned char c);

} // namespace tsbase::baseline
