#include <tsbase/cli/Driver.hpp>

#include <tsbase/Version.hpp>
#include <tsbase/baseline/ErrorsBaseline.hpp>
#include <tsbase/baseline/TypesBaseline.hpp>
#include <tsbase/config/Config.hpp>
#include <tsbase/diag/DiagCode.hpp>
#include <tsbase/discover/Discover.hpp>
#include <tsbase/os/File.hpp>
#include <tsbase/unit/TestUnit.hpp>

#include <cstdio>
#include <cstdlib>
#include <iostream>

#if defined(_WIN32)
#include <io.h>
#else
#include <unistd.h>
#endif

namespace tsbase::cli {

namespace {

constexpr const char* kAnsiReset = "\033[0m";
constexpr const char* kAnsiRed = "\033[31m";
constexpr const char* kAnsiYellow = "\033[33m";

bool stderr_is_tty() {
    if (std::getenv("NO_COLOR") != nullptr) return false;
#if defined(_WIN32)
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

bool use_color(config::ColorMode mode) {
    switch (mode) {
        case config::ColorMode::kAlways: return true;
        case config::ColorMode::kNever: return false;
        case config::ColorMode::kAuto: break;
    }
    return stderr_is_tty();
}

void print_diagnostics(const diag::Bag& bag, bool color) {
    for (const auto& d : bag.all()) {
        if (color) std::cerr << kAnsiRed;
        std::cerr << "error[" << diag::code_name(d.code) << "]";
        if (color) std::cerr << kAnsiReset;
        std::cerr << ": " << d.message << "\n";
        std::cerr << " --> " << d.file << ":" << d.line << ":" << d.column << "\n";
    }
}

void print_error(const std::string& msg, bool color) {
    if (color) {
        std::cerr << kAnsiRed << "error: " << kAnsiReset << msg << "\n";
    } else {
        std::cerr << "error: " << msg << "\n";
    }
}

void print_warning(const std::string& msg, bool color) {
    if (color) {
        std::cerr << kAnsiYellow << "warning: " << kAnsiReset << msg << "\n";
    } else {
        std::cerr << "warning: " << msg << "\n";
    }
}

bool read_input(const std::string& path, std::string& out, diag::Bag& bag) {
    auto r = os::read_source_file(path);
    if (!r.ok) {
        bag.add(diag::Code::F_READ_FAILED, path, 1, 1, "failed to read file: " + r.err);
        return false;
    }
    out = std::move(r.text);
    return true;
}

void print_hints(const std::vector<baseline::Hint>& hints, std::string_view indent) {
    for (const auto& h : hints) {
        std::cout << indent << "hint[" << static_cast<int>(h.depth) << "]: " << h.text << "\n";
    }
}

void print_location(const baseline::FileError& e) {
    std::cout << e.file;
    if (e.loc.has_value()) {
        std::cout << ":" << e.loc->line << ":" << e.loc->column;
    }
    std::cout << " len=";
    if (e.length.has_value()) {
        std::cout << *e.length;
    } else {
        std::cout << "-";
    }
}

int run_check(const CheckOptions& opt) {
    const std::filesystem::path repo(opt.repo);
    std::error_code ec{};
    if (!std::filesystem::is_directory(repo, ec)) {
        print_error("not a directory: " + opt.repo, stderr_is_tty());
        return 1;
    }

    config::LoadedConfig loaded{};
    std::string err{};
    std::optional<std::filesystem::path> config_path{};
    if (opt.config_path.has_value()) config_path = std::filesystem::path(*opt.config_path);
    if (!config::load(repo, config_path, loaded, err)) {
        print_error(err, stderr_is_tty());
        return 1;
    }

    std::vector<std::string> warnings = loaded.warnings;
    config::Settings settings = config::materialize(loaded, &warnings);
    if (opt.color.has_value()) {
        if (const auto mode = config::parse_color_mode(*opt.color)) settings.color = *mode;
    }
    if (opt.verbose) settings.verbose = true;

    const bool color = use_color(settings.color);
    for (const auto& w : warnings) print_warning(w, color);

    discover::Options dopt{};
    dopt.repo_root = repo;
    dopt.case_dirs = settings.case_dirs;
    dopt.baseline_dir = settings.baseline_dir;
    dopt.skip = settings.skip;

    const bool verbose = settings.verbose;
    const auto on_variant = [verbose](const discover::VariantCheck& c, diag::Bag&) {
        if (!verbose) return true;
        std::size_t assertions = 0;
        for (const auto& f : c.baseline.types.files) {
            for (const auto& a : f.assertions) assertions += a.size();
        }
        const std::size_t errors = c.baseline.errors.has_value()
                                       ? c.baseline.errors->config_errors.size() + c.baseline.errors->file_errors.size()
                                       : 0;
        std::cout << "ok " << c.case_path << c.variant.name << " (" << c.unit.file_names.size() << " files, "
                  << assertions << " assertions, " << errors << " errors)\n";
        return true;
    };

    discover::Counts counts{};
    diag::Bag bag{};
    if (!discover::run(dopt, on_variant, counts, bag)) {
        print_diagnostics(bag, color);
        return 1;
    }

    std::cout << "checked " << counts.variants << " variants in " << counts.cases << " cases (" << counts.skipped
              << " skipped)\n";
    return 0;
}

int run_unit(const std::string& path) {
    diag::Bag bag{};
    std::string data{};
    if (!read_input(path, data, bag)) {
        print_diagnostics(bag, stderr_is_tty());
        return 1;
    }
    const auto unit = unit::parse_test_unit(path, data, bag);
    if (!unit.has_value()) {
        print_diagnostics(bag, stderr_is_tty());
        return 1;
    }

    for (std::size_t i = 0; i < unit->file_names.size(); ++i) {
        std::cout << "file: " << unit->file_names[i] << " (" << unit->file_contents[i].size() << " bytes)\n";
    }
    for (const auto& [from, to] : unit->symlinks) {
        std::cout << "link: " << from << " -> " << to << "\n";
    }

    const auto& s = unit->settings;
    if (s.base_url.has_value()) std::cout << "baseUrl: " << *s.base_url << "\n";
    if (s.include_built_file.has_value()) std::cout << "includeBuiltFile: " << *s.include_built_file << "\n";
    if (s.lib_files.has_value()) {
        std::cout << "libFiles:";
        for (const auto& f : *s.lib_files) std::cout << " " << f;
        std::cout << "\n";
    }
    if (s.no_implicit_references) std::cout << "noImplicitReferences: true\n";
    if (s.no_types_and_symbols) std::cout << "noTypesAndSymbols: true\n";

    for (const auto idx : unit::select_root_files(*unit)) {
        std::cout << "root: " << unit->file_names[idx] << "\n";
    }

    auto it = unit->variations.iter();
    unit::TestVariant v{};
    while (it.next(v)) {
        std::cout << "variant: " << (v.name.empty() ? std::string("(default)") : v.name) << "\n";
    }
    return 0;
}

int run_types(const std::string& path) {
    diag::Bag bag{};
    std::string data{};
    if (!read_input(path, data, bag)) {
        print_diagnostics(bag, stderr_is_tty());
        return 1;
    }
    const auto types = baseline::parse_types_baseline(path, data, bag);
    if (!types.has_value()) {
        print_diagnostics(bag, stderr_is_tty());
        return 1;
    }

    std::size_t total_statements = 0;
    std::size_t total_assertions = 0;
    for (std::size_t i = 0; i < types->names.size(); ++i) {
        const auto& f = types->files[i];
        std::size_t assertions = 0;
        for (const auto& a : f.assertions) assertions += a.size();
        std::cout << types->names[i] << ": " << f.statements.size() << " statements, " << assertions
                  << " assertions\n";
        total_statements += f.statements.size();
        total_assertions += assertions;
    }
    std::cout << "total: " << types->names.size() << " files, " << total_statements << " statements, "
              << total_assertions << " assertions\n";
    return 0;
}

int run_errors(const std::string& path) {
    diag::Bag bag{};
    std::string data{};
    if (!read_input(path, data, bag)) {
        print_diagnostics(bag, stderr_is_tty());
        return 1;
    }
    const auto errors = baseline::parse_errors_baseline(path, data, bag);
    if (!errors.has_value()) {
        print_diagnostics(bag, stderr_is_tty());
        return 1;
    }

    for (const auto& e : errors->config_errors) {
        std::cout << "config TS" << e.code << ": " << e.message << "\n";
        print_hints(e.hints, "  ");
    }
    for (const auto& e : errors->file_errors) {
        print_location(e);
        std::cout << " TS" << e.code << ": " << e.message << "\n";
        print_hints(e.hints, "  ");
        for (const auto& r : e.related) {
            std::cout << "  related ";
            print_location(r);
            std::cout << " TS" << r.code << ": " << r.message << "\n";
        }
    }
    std::cout << "total: " << errors->config_errors.size() << " config errors, " << errors->file_errors.size()
              << " file errors\n";
    return 0;
}

} // namespace

int run(const Options& opt) {
    if (!opt.ok) {
        print_error(opt.error, stderr_is_tty());
        print_usage(std::cerr);
        return 1;
    }
    if (opt.mode == Mode::kVersion) {
        std::cout << k_version_string << "\n";
        return 0;
    }
    if (opt.mode == Mode::kUsage) {
        print_usage(std::cout);
        return 0;
    }

    switch (opt.command) {
        case Command::kCheck: return run_check(opt.check);
        case Command::kUnit: return run_unit(opt.file);
        case Command::kTypes: return run_types(opt.file);
        case Command::kErrors: return run_errors(opt.file);
        case Command::kNone: break;
    }
    print_usage(std::cerr);
    return 1;
}

} // namespace tsbase::cli
