#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tsbase::config {

using Value = std::variant<std::string, int64_t, bool, std::vector<std::string>, std::vector<int64_t>>;
using FlatMap = std::map<std::string, Value>;

enum class ColorMode : uint8_t {
    kAuto,
    kAlways,
    kNever,
};

inline constexpr std::string_view k_config_file_name = "tsbase.toml";

struct LoadedConfig {
    std::filesystem::path path{};
    bool explicit_path = false;
    FlatMap values{};
    std::vector<std::string> warnings{};
};

struct Settings {
    std::vector<std::string> case_dirs{
        "tests/cases/compiler",
        "tests/cases/conformance",
    };
    std::string baseline_dir = "tests/baselines/reference";
    std::vector<std::string> skip{
        "compiler/corrupted.ts",
        "compiler/TransportStream.ts",
        "compiler/checkJsFiles6.ts",
        "compiler/jsFileCompilationWithoutJsExtensions.ts",
    };
    ColorMode color = ColorMode::kAuto;
    bool verbose = false;
};

/// @brief Loads `<repo_root>/tsbase.toml`, or config_path when given.
///
/// A missing default file yields an empty map. A missing or malformed
/// explicit file is an error; a malformed default file only warns.
bool load(const std::filesystem::path& repo_root,
          const std::optional<std::filesystem::path>& config_path,
          LoadedConfig& out,
          std::string& err);

Settings materialize(const LoadedConfig& cfg, std::vector<std::string>* warnings = nullptr);

bool is_known_key(std::string_view key);
std::optional<ColorMode> parse_color_mode(std::string_view text);
const char* color_mode_name(ColorMode mode);

} // namespace tsbase::config
