#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace tsbase::cli {

enum class Mode : uint8_t {
    kUsage,
    kVersion,
    kCommand,
};

enum class Command : uint8_t {
    kNone,
    kCheck,
    kUnit,
    kTypes,
    kErrors,
};

struct CheckOptions {
    std::string repo{};
    std::optional<std::string> config_path{};
    std::optional<std::string> color{}; // overrides output.color
    bool verbose = false;               // forces output.verbose
};

struct Options {
    Mode mode = Mode::kUsage;
    Command command = Command::kNone;

    CheckOptions check{};
    std::string file{}; // unit / types / errors

    bool ok = true;
    std::string error{};
};

void print_usage(std::ostream& os);
Options parse_options(int argc, char** argv);

} // namespace tsbase::cli
