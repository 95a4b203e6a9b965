#include <tsbase/baseline/Baseline.hpp>

namespace tsbase::baseline {

std::optional<Baseline> parse_baseline(std::string_view types_path,
                                       std::string_view types_data,
                                       std::string_view errors_path,
                                       std::optional<std::string_view> errors_data,
                                       diag::Bag& bag) {
    auto types = parse_types_baseline(types_path, types_data, bag);
    if (!types.has_value()) return std::nullopt;

    Baseline out{};
    out.types = std::move(*types);
    if (errors_data.has_value()) {
        auto errors = parse_errors_baseline(errors_path, *errors_data, bag);
        if (!errors.has_value()) return std::nullopt;
        out.errors = std::move(*errors);
    }
    return out;
}

} // namespace tsbase::baseline
