#pragma once

#include <tsbase/baseline/Baseline.hpp>
#include <tsbase/diag/DiagCode.hpp>
#include <tsbase/unit/TestUnit.hpp>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace tsbase::discover {

struct Options {
    std::filesystem::path repo_root{};
    std::vector<std::string> case_dirs{};
    std::string baseline_dir{};
    std::vector<std::string> skip{}; // path suffixes, '/'-separated
};

struct Counts {
    std::size_t cases = 0;    // case files found, skipped ones included
    std::size_t skipped = 0;  // skip list hits and units without types
    std::size_t variants = 0; // variants handed to the callback
};

// One checked variant. Everything referenced lives until the callback returns.
struct VariantCheck {
    std::string_view case_path{}; // relative to the repo root
    const unit::TestUnit& unit;
    const unit::TestVariant& variant;
    const baseline::Baseline& baseline;
    const std::filesystem::path& repo_root;
};

// Returning false stops the walk; the callback reports its reason in the bag.
using VariantCallback = std::function<bool(const VariantCheck&, diag::Bag&)>;

/// @brief Walks every case directory, parses each case file and its
/// baselines, and calls fn once per variant.
///
/// Stops at the first read or parse failure. Returns false in that case with
/// the diagnostics in bag.
bool run(const Options& opt, const VariantCallback& fn, Counts& counts, diag::Bag& bag);

// Regular files below the case directories, sorted.
bool collect_case_files(const Options& opt, std::vector<std::filesystem::path>& out, diag::Bag& bag);

bool is_skipped(std::string_view rel_path, const std::vector<std::string>& skip);

// "<stem><variant>.<kind>", e.g. "foo(target=es5).errors.txt"
std::string baseline_file_name(std::string_view stem, std::string_view variant, std::string_view kind);

} // namespace tsbase::discover
