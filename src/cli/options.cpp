#include <tsbase/cli/Options.hpp>

#include <string_view>
#include <vector>

namespace tsbase::cli {

namespace {

Command to_command(std::string_view s) {
    if (s == "check") return Command::kCheck;
    if (s == "unit") return Command::kUnit;
    if (s == "types") return Command::kTypes;
    if (s == "errors") return Command::kErrors;
    return Command::kNone;
}

const char* command_name(Command c) {
    switch (c) {
        case Command::kCheck: return "check";
        case Command::kUnit: return "unit";
        case Command::kTypes: return "types";
        case Command::kErrors: return "errors";
        case Command::kNone: break;
    }
    return "";
}

bool parse_opt_value(const std::vector<std::string_view>& args,
                     size_t& i,
                     std::string_view key,
                     std::string& out,
                     std::string& err) {
    const auto a = args[i];
    const auto pref = std::string(key) + "=";
    if (a.rfind(pref, 0) == 0) {
        out = std::string(a.substr(pref.size()));
    } else if (i + 1 < args.size()) {
        ++i;
        out = std::string(args[i]);
    } else {
        out.clear();
    }

    if (out.empty()) {
        err = std::string(key) + " requires a value";
        return false;
    }
    return true;
}

bool is_option(std::string_view a, std::string_view key) {
    return a == key || (a.size() > key.size() && a.rfind(key, 0) == 0 && a[key.size()] == '=');
}

} // namespace

void print_usage(std::ostream& os) {
    os
        << "tsbase [-h|--help] [--version] <command> [args]\n"
        << "\n"
        << "Commands:\n"
        << "  check <ts-repo> [--config <file>] [--verbose] [--color <auto|always|never>]\n"
        << "        parse every test case and baseline of a TypeScript checkout\n"
        << "  unit <file>     print a parsed test case\n"
        << "  types <file>    print statement and assertion counts of a .types baseline\n"
        << "  errors <file>   print the diagnostics of an .errors.txt baseline\n";
}

Options parse_options(int argc, char** argv) {
    Options out{};

    if (argc <= 1) {
        out.mode = Mode::kUsage;
        return out;
    }

    std::vector<std::string_view> args{};
    args.reserve(static_cast<size_t>(argc - 1));
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    size_t i = 0;
    for (; i < args.size(); ++i) {
        const auto a = args[i];
        if (a == "-h" || a == "--help") {
            out.mode = Mode::kUsage;
            return out;
        }
        if (a == "--version") {
            out.mode = Mode::kVersion;
            return out;
        }
        if (const auto cmd = to_command(a); cmd != Command::kNone) {
            out.command = cmd;
            out.mode = Mode::kCommand;
            ++i;
            break;
        }

        out.ok = false;
        if (!a.empty() && a[0] == '-') {
            out.error = "unknown global option: " + std::string(a);
        } else {
            out.error = "unknown command: " + std::string(a);
        }
        return out;
    }

    if (out.mode != Mode::kCommand) {
        out.ok = false;
        out.error = "missing command";
        return out;
    }

    std::string positional{};
    for (; i < args.size(); ++i) {
        const auto a = args[i];
        if (a == "-h" || a == "--help") {
            out.mode = Mode::kUsage;
            return out;
        }

        if (out.command == Command::kCheck) {
            if (a == "--verbose" || a == "-v") {
                out.check.verbose = true;
                continue;
            }
            if (is_option(a, "--config")) {
                std::string v;
                if (!parse_opt_value(args, i, "--config", v, out.error)) {
                    out.ok = false;
                    return out;
                }
                out.check.config_path = std::move(v);
                continue;
            }
            if (is_option(a, "--color")) {
                std::string v;
                if (!parse_opt_value(args, i, "--color", v, out.error)) {
                    out.ok = false;
                    return out;
                }
                if (v != "auto" && v != "always" && v != "never") {
                    out.ok = false;
                    out.error = "--color must be auto, always or never";
                    return out;
                }
                out.check.color = std::move(v);
                continue;
            }
        }

        if (!a.empty() && a[0] == '-') {
            out.ok = false;
            out.error = "unknown " + std::string(command_name(out.command)) + " option: " + std::string(a);
            return out;
        }
        if (!positional.empty()) {
            out.ok = false;
            out.error = "unexpected argument: " + std::string(a);
            return out;
        }
        positional = std::string(a);
    }

    if (positional.empty()) {
        out.ok = false;
        out.error = out.command == Command::kCheck ? "check requires a path to a TypeScript repo"
                                                   : std::string(command_name(out.command)) + " requires a file";
        return out;
    }

    if (out.command == Command::kCheck) {
        out.check.repo = std::move(positional);
    } else {
        out.file = std::move(positional);
    }
    return out;
}

} // namespace tsbase::cli
