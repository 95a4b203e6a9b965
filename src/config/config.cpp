#include <tsbase/config/Config.hpp>

#include <tsbase/config/TomlLite.hpp>

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace tsbase::config {

namespace {

const std::unordered_set<std::string>& known_keys_() {
    static const std::unordered_set<std::string> k{
        "discover.case_dirs",
        "discover.baseline_dir",
        "discover.skip",

        "output.color",
        "output.verbose",
    };
    return k;
}

template <typename T>
const T* as_ptr(const Value* v) {
    if (v == nullptr) return nullptr;
    return std::get_if<T>(v);
}

void filter_unknown_keys(FlatMap& values, std::vector<std::string>& warnings, std::string_view source_name) {
    std::vector<std::string> to_erase{};
    for (const auto& [k, _] : values) {
        if (!is_known_key(k)) {
            warnings.push_back(std::string(source_name) + ": unknown key '" + k + "' ignored");
            to_erase.push_back(k);
        }
    }
    for (const auto& k : to_erase) {
        values.erase(k);
    }
}

} // namespace

bool is_known_key(std::string_view key) {
    return known_keys_().contains(std::string(key));
}

std::optional<ColorMode> parse_color_mode(std::string_view text) {
    std::string v(text);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "auto") return ColorMode::kAuto;
    if (v == "always") return ColorMode::kAlways;
    if (v == "never") return ColorMode::kNever;
    return std::nullopt;
}

const char* color_mode_name(ColorMode mode) {
    switch (mode) {
        case ColorMode::kAuto: return "auto";
        case ColorMode::kAlways: return "always";
        case ColorMode::kNever: return "never";
    }
    return "auto";
}

bool load(const std::filesystem::path& repo_root,
          const std::optional<std::filesystem::path>& config_path,
          LoadedConfig& out,
          std::string& err) {
    out = LoadedConfig{};
    out.explicit_path = config_path.has_value();
    out.path = config_path.value_or(repo_root / k_config_file_name);

    std::error_code ec{};
    if (!std::filesystem::is_regular_file(out.path, ec)) {
        if (!out.explicit_path) return true;
        err = "config file not found: " + out.path.string();
        return false;
    }

    std::string parse_err{};
    if (!toml_lite::parse_file(out.path, out.values, out.warnings, parse_err)) {
        out.values.clear();
        if (out.explicit_path) {
            err = parse_err;
            return false;
        }
        out.warnings.push_back("failed to load config: " + parse_err);
        return true;
    }

    filter_unknown_keys(out.values, out.warnings, out.path.string());
    return true;
}

Settings materialize(const LoadedConfig& cfg, std::vector<std::string>* warnings) {
    Settings s{};
    const FlatMap& v = cfg.values;

    auto wrong_type = [&](std::string_view key, const char* expected) {
        if (warnings != nullptr) {
            warnings->push_back("config key '" + std::string(key) + "' has wrong type (expected " + expected + ")");
        }
    };
    auto get_string = [&](std::string_view key, std::string& dst) {
        const auto it = v.find(std::string(key));
        if (it == v.end()) return;
        if (const auto* p = as_ptr<std::string>(&it->second); p != nullptr) {
            dst = *p;
            return;
        }
        wrong_type(key, "string");
    };
    auto get_strings = [&](std::string_view key, std::vector<std::string>& dst) {
        const auto it = v.find(std::string(key));
        if (it == v.end()) return;
        if (const auto* p = as_ptr<std::vector<std::string>>(&it->second); p != nullptr) {
            dst = *p;
            return;
        }
        wrong_type(key, "string array");
    };
    auto get_bool = [&](std::string_view key, bool& dst) {
        const auto it = v.find(std::string(key));
        if (it == v.end()) return;
        if (const auto* p = as_ptr<bool>(&it->second); p != nullptr) {
            dst = *p;
            return;
        }
        wrong_type(key, "bool");
    };

    get_strings("discover.case_dirs", s.case_dirs);
    get_string("discover.baseline_dir", s.baseline_dir);
    get_strings("discover.skip", s.skip);
    get_bool("output.verbose", s.verbose);

    std::string color = color_mode_name(s.color);
    get_string("output.color", color);
    if (const auto mode = parse_color_mode(color)) {
        s.color = *mode;
    } else if (warnings != nullptr) {
        warnings->push_back("config key 'output.color' must be auto, always or never");
    }

    return s;
}

} // namespace tsbase::config
