#pragma once

#include <tsbase/baseline/ErrorsBaseline.hpp>
#include <tsbase/baseline/TypesBaseline.hpp>

#include <optional>
#include <string_view>

namespace tsbase::baseline {

// Reference output of one test variant. Views point into the caller's buffers.
struct Baseline {
    TypesBaseline types{};
    std::optional<ErrorsBaseline> errors{}; // variant compiles without errors when unset
};

std::optional<Baseline> parse_baseline(std::string_view types_path,
                                       std::string_view types_data,
                                       std::string_view errors_path,
                                       std::optional<std::string_view> errors_data,
                                       diag::Bag& bag);

} // namespace tsbase::baseline
