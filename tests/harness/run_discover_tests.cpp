#include <tsbase/discover/Discover.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

    namespace fs = std::filesystem;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static bool write_text(const fs::path& path, const std::string& text) {
        std::error_code ec{};
        fs::create_directories(path.parent_path(), ec);
        std::ofstream ofs(path, std::ios::binary);
        if (!ofs) return false;
        ofs << text;
        return ofs.good();
    }

    static tsbase::discover::Options repo_options_(const fs::path& root) {
        tsbase::discover::Options opt{};
        opt.repo_root = root;
        opt.case_dirs = {"tests/cases/compiler", "tests/cases/conformance"};
        opt.baseline_dir = "tests/baselines/reference";
        opt.skip = {"compiler/corrupted.ts"};
        return opt;
    }

    static fs::path fresh_repo_(const char* name) {
        std::error_code ec{};
        const auto root = fs::temp_directory_path(ec) / name;
        fs::remove_all(root, ec);
        fs::create_directories(root / "tests/cases/compiler", ec);
        fs::create_directories(root / "tests/cases/conformance", ec);
        fs::create_directories(root / "tests/baselines/reference", ec);
        return root;
    }

    static const char* k_simple_types =
        "//// [tests/cases/compiler/a.ts] ////\n"
        "\n"
        "=== a.ts ===\n"
        "let a = 1;\n"
        ">a : number\n"
        ">  : ^^^^^^\n";

    static bool test_fixture_repo_walk_() {
#ifndef TSBASE_TEST_REPO_DIR
        std::cerr << "  - TSBASE_TEST_REPO_DIR is not defined\n";
        return false;
#else
        const fs::path root{TSBASE_TEST_REPO_DIR};
        if (!require_(fs::is_directory(root), "fixture repo must exist")) return false;

        std::vector<std::string> seen{};
        std::size_t with_errors = 0;
        const auto fn = [&](const tsbase::discover::VariantCheck& c, tsbase::diag::Bag&) {
            seen.push_back(std::string(c.case_path) + c.variant.name);
            if (c.baseline.errors.has_value()) ++with_errors;
            return true;
        };

        tsbase::discover::Counts counts{};
        tsbase::diag::Bag bag{};
        const bool ok_run = tsbase::discover::run(repo_options_(root), fn, counts, bag);
        if (!ok_run) std::cerr << bag.render_text();

        bool ok = true;
        ok &= require_(ok_run, "fixture repo must pass");
        ok &= require_(counts.cases == 5, "five case files");
        ok &= require_(counts.skipped == 2, "skip list hit and noTypesAndSymbols");
        ok &= require_(counts.variants == 4, "four variants");
        ok &= require_(with_errors == 1, "one variant carries an errors baseline");

        const std::vector<std::string> want{
            "tests/cases/compiler/multiFile.ts",
            "tests/cases/compiler/simpleVar.ts",
            "tests/cases/conformance/types/targetVariants.ts(target=es5)",
            "tests/cases/conformance/types/targetVariants.ts(target=es2015)",
        };
        ok &= require_(seen == want, "variants are visited in sorted path order");
        if (seen != want) {
            for (const auto& s : seen) std::cerr << "    seen " << s << "\n";
        }
        return ok;
#endif
    }

    static bool test_skip_list_matches_components_() {
        const std::vector<std::string> skip{"compiler/corrupted.ts"};

        bool ok = true;
        ok &= require_(tsbase::discover::is_skipped("tests/cases/compiler/corrupted.ts", skip), "suffix match");
        ok &= require_(tsbase::discover::is_skipped("compiler/corrupted.ts", skip), "exact match");
        ok &= require_(!tsbase::discover::is_skipped("tests/cases/xcompiler/corrupted.ts", skip),
                       "partial component is not a match");
        ok &= require_(!tsbase::discover::is_skipped("tests/cases/compiler/corrupted.tsx", skip), "other file");
        ok &= require_(!tsbase::discover::is_skipped("a.ts", {""}), "empty entries never match");
        return ok;
    }

    static bool test_baseline_file_name_() {
        bool ok = true;
        ok &= require_(tsbase::discover::baseline_file_name("foo", "", "types") == "foo.types", "default variant");
        ok &= require_(tsbase::discover::baseline_file_name("foo", "(target=es5)", "errors.txt") ==
                           "foo(target=es5).errors.txt",
                       "variant name sits between stem and kind");
        return ok;
    }

    static bool test_missing_case_dir_() {
        const auto root = fresh_repo_("tsbase-discover-nodir");
        auto opt = repo_options_(root);
        opt.case_dirs.push_back("tests/cases/projects");

        tsbase::discover::Counts counts{};
        tsbase::diag::Bag bag{};
        const bool ok_run = tsbase::discover::run(
            opt, [](const tsbase::discover::VariantCheck&, tsbase::diag::Bag&) { return true; }, counts, bag);

        bool ok = true;
        ok &= require_(!ok_run, "missing case directory must fail");
        ok &= require_(bag.has_code(tsbase::diag::Code::F_CASE_DIR_NOT_FOUND), "F_CASE_DIR_NOT_FOUND");
        if (!bag.all().empty()) {
            ok &= require_(bag.all()[0].file == "tests/cases/projects", "path is relative to the repo");
        }
        return ok;
    }

    static bool test_missing_types_baseline_() {
        const auto root = fresh_repo_("tsbase-discover-missing");
        if (!write_text(root / "tests/cases/compiler/a.ts", "// @strict: true, false\nlet a = 1;\n")) return false;
        if (!write_text(root / "tests/baselines/reference/a(strict=true).types", k_simple_types)) return false;

        std::size_t calls = 0;
        tsbase::discover::Counts counts{};
        tsbase::diag::Bag bag{};
        const bool ok_run = tsbase::discover::run(
            repo_options_(root),
            [&](const tsbase::discover::VariantCheck&, tsbase::diag::Bag&) {
                ++calls;
                return true;
            },
            counts, bag);

        bool ok = true;
        ok &= require_(!ok_run, "missing baseline must fail");
        ok &= require_(calls == 1, "first variant is checked before the failure");
        ok &= require_(bag.has_code(tsbase::diag::Code::F_MISSING_BASELINE), "F_MISSING_BASELINE");
        if (!bag.all().empty()) {
            ok &= require_(bag.all()[0].file == "tests/baselines/reference/a(strict=false).types",
                           "diagnostic names the missing baseline");
        }
        return ok;
    }

    static bool test_malformed_errors_baseline_() {
        const auto root = fresh_repo_("tsbase-discover-badbaseline");
        if (!write_text(root / "tests/cases/compiler/a.ts", "let a = 1;\n")) return false;
        if (!write_text(root / "tests/baselines/reference/a.types", k_simple_types)) return false;
        if (!write_text(root / "tests/baselines/reference/a.errors.txt", "a.ts(1,5): error TS1: x\n\nnot empty\n")) {
            return false;
        }

        tsbase::discover::Counts counts{};
        tsbase::diag::Bag bag{};
        const bool ok_run = tsbase::discover::run(
            repo_options_(root), [](const tsbase::discover::VariantCheck&, tsbase::diag::Bag&) { return true; },
            counts, bag);

        bool ok = true;
        ok &= require_(!ok_run, "malformed errors baseline must fail");
        ok &= require_(bag.has_code(tsbase::diag::Code::E_SUMMARY_TERMINATOR), "parser diagnostic is kept");
        if (!bag.all().empty()) {
            ok &= require_(bag.all()[0].file == "tests/baselines/reference/a.errors.txt", "baseline path");
        }
        return ok;
    }

    static bool test_callback_stops_walk_() {
        const auto root = fresh_repo_("tsbase-discover-stop");
        if (!write_text(root / "tests/cases/compiler/a.ts", "let a = 1;\n")) return false;
        if (!write_text(root / "tests/cases/compiler/b.ts", "let a = 1;\n")) return false;
        if (!write_text(root / "tests/baselines/reference/a.types", k_simple_types)) return false;
        if (!write_text(root / "tests/baselines/reference/b.types", k_simple_types)) return false;

        std::size_t calls = 0;
        tsbase::discover::Counts counts{};
        tsbase::diag::Bag bag{};
        const bool ok_run = tsbase::discover::run(
            repo_options_(root),
            [&](const tsbase::discover::VariantCheck& c, tsbase::diag::Bag& b) {
                ++calls;
                b.add(tsbase::diag::Code::F_READ_FAILED, std::string(c.case_path), 1, 1, "stop");
                return false;
            },
            counts, bag);

        bool ok = true;
        ok &= require_(!ok_run, "callback failure must stop the walk");
        ok &= require_(calls == 1, "only the first variant is visited");
        ok &= require_(bag.all().size() == 1 && bag.all()[0].file == "tests/cases/compiler/a.ts",
                       "callback diagnostic is returned");
        return ok;
    }

    static bool test_utf16_case_file_() {
        const auto root = fresh_repo_("tsbase-discover-utf16");
        // "let a = 1;\n" as UTF-16 LE with a byte order mark
        std::string bytes = "\xFF\xFE";
        for (const char c : std::string("let a = 1;\n")) {
            bytes.push_back(c);
            bytes.push_back('\0');
        }
        if (!write_text(root / "tests/cases/compiler/a.ts", bytes)) return false;
        if (!write_text(root / "tests/baselines/reference/a.types", k_simple_types)) return false;

        std::string content{};
        tsbase::discover::Counts counts{};
        tsbase::diag::Bag bag{};
        const bool ok_run = tsbase::discover::run(
            repo_options_(root),
            [&](const tsbase::discover::VariantCheck& c, tsbase::diag::Bag&) {
                if (!c.unit.file_contents.empty()) content = std::string(c.unit.file_contents[0]);
                return true;
            },
            counts, bag);

        bool ok = true;
        ok &= require_(ok_run, "UTF-16 case file must be read");
        ok &= require_(content == "let a = 1;\n", "content is transcoded to UTF-8");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"fixture_repo_walk", test_fixture_repo_walk_},
        {"skip_list_matches_components", test_skip_list_matches_components_},
        {"baseline_file_name", test_baseline_file_name_},
        {"missing_case_dir", test_missing_case_dir_},
        {"missing_types_baseline", test_missing_types_baseline_},
        {"malformed_errors_baseline", test_malformed_errors_baseline_},
        {"callback_stops_walk", test_callback_stops_walk_},
        {"utf16_case_file", test_utf16_case_file_},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
