#include <tsbase/discover/Discover.hpp>

#include <tsbase/os/File.hpp>
#include <tsbase/text/Bytes.hpp>

#include <algorithm>
#include <optional>

namespace tsbase::discover {

namespace fs = std::filesystem;

namespace {

std::string rel_of(const fs::path& root, const fs::path& p) {
    const fs::path rel = p.lexically_relative(root);
    if (rel.empty()) return p.generic_string();
    return rel.generic_string();
}

bool read_or_report(const fs::path& root, const fs::path& p, diag::Code code, std::string& out, diag::Bag& bag) {
    auto r = os::read_source_file(p.string());
    if (!r.ok) {
        bag.add(code, rel_of(root, p), 1, 1, "failed to read file: " + r.err);
        return false;
    }
    out = std::move(r.text);
    return true;
}

class CaseRunner {
public:
    CaseRunner(const Options& opt, const VariantCallback& fn, Counts& counts, diag::Bag& bag)
        : opt_(opt), fn_(fn), counts_(counts), bag_(bag) {}

    bool run_case(const fs::path& case_file) {
        const std::string case_rel = rel_of(opt_.repo_root, case_file);
        ++counts_.cases;
        if (is_skipped(case_rel, opt_.skip)) {
            ++counts_.skipped;
            return true;
        }

        std::string case_text{};
        if (!read_or_report(opt_.repo_root, case_file, diag::Code::F_READ_FAILED, case_text, bag_)) return false;

        const auto unit = unit::parse_test_unit(case_rel, case_text, bag_);
        if (!unit.has_value()) return false;
        if (unit->settings.no_types_and_symbols) {
            ++counts_.skipped;
            return true;
        }

        const std::string stem = case_file.stem().string();
        auto it = unit->variations.iter();
        unit::TestVariant variant{};
        while (it.next(variant)) {
            if (!run_variant_(case_rel, stem, *unit, variant)) return false;
        }
        return true;
    }

private:
    bool run_variant_(std::string_view case_rel,
                      std::string_view stem,
                      const unit::TestUnit& unit,
                      const unit::TestVariant& variant) {
        const fs::path dir = opt_.repo_root / opt_.baseline_dir;
        const fs::path types_file = dir / baseline_file_name(stem, variant.name, "types");
        const fs::path errors_file = dir / baseline_file_name(stem, variant.name, "errors.txt");
        const std::string types_rel = rel_of(opt_.repo_root, types_file);
        const std::string errors_rel = rel_of(opt_.repo_root, errors_file);

        if (!os::file_exists(types_file.string())) {
            bag_.add(diag::Code::F_MISSING_BASELINE, types_rel, 1, 1,
                     "missing types baseline for " + std::string(case_rel) +
                         (variant.name.empty() ? std::string{} : " variant " + variant.name));
            return false;
        }

        std::string types_text{};
        if (!read_or_report(opt_.repo_root, types_file, diag::Code::F_READ_FAILED, types_text, bag_)) return false;

        std::string errors_text{};
        std::optional<std::string_view> errors_data{};
        if (os::file_exists(errors_file.string())) {
            if (!read_or_report(opt_.repo_root, errors_file, diag::Code::F_READ_FAILED, errors_text, bag_)) {
                return false;
            }
            errors_data = errors_text;
        }

        const auto baseline = baseline::parse_baseline(types_rel, types_text, errors_rel, errors_data, bag_);
        if (!baseline.has_value()) return false;

        ++counts_.variants;
        const VariantCheck check{case_rel, unit, variant, *baseline, opt_.repo_root};
        return fn_(check, bag_);
    }

    const Options& opt_;
    const VariantCallback& fn_;
    Counts& counts_;
    diag::Bag& bag_;
};

} // namespace

bool is_skipped(std::string_view rel_path, const std::vector<std::string>& skip) {
    for (const auto& s : skip) {
        if (s.empty()) continue;
        if (rel_path == s) return true;
        // whole path components only
        if (text::ends_with(rel_path, s) && rel_path[rel_path.size() - s.size() - 1] == '/') return true;
    }
    return false;
}

std::string baseline_file_name(std::string_view stem, std::string_view variant, std::string_view kind) {
    std::string out{};
    out.reserve(stem.size() + variant.size() + kind.size() + 1);
    out.append(stem);
    out.append(variant);
    out.push_back('.');
    out.append(kind);
    return out;
}

bool collect_case_files(const Options& opt, std::vector<fs::path>& out, diag::Bag& bag) {
    out.clear();
    for (const auto& dir : opt.case_dirs) {
        const fs::path root = opt.repo_root / dir;
        std::error_code ec{};
        if (!fs::is_directory(root, ec)) {
            bag.add(diag::Code::F_CASE_DIR_NOT_FOUND, rel_of(opt.repo_root, root), 1, 1,
                    "case directory not found");
            return false;
        }

        for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
            if (it->is_regular_file(ec)) out.push_back(it->path());
        }
        if (ec) {
            bag.add(diag::Code::F_READ_FAILED, rel_of(opt.repo_root, root), 1, 1,
                    "directory traversal failed: " + ec.message());
            return false;
        }
    }
    std::sort(out.begin(), out.end());
    return true;
}

bool run(const Options& opt, const VariantCallback& fn, Counts& counts, diag::Bag& bag) {
    counts = Counts{};

    std::vector<fs::path> files{};
    if (!collect_case_files(opt, files, bag)) return false;

    CaseRunner runner(opt, fn, counts, bag);
    for (const auto& f : files) {
        if (!runner.run_case(f)) return false;
    }
    return true;
}

} // namespace tsbase::discover
