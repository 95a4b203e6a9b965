#pragma once

#include <tsbase/config/Config.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace tsbase::config::toml_lite {

bool parse_file(const std::filesystem::path& path,
                FlatMap& out,
                std::vector<std::string>& warnings,
                std::string& err);

} // namespace tsbase::config::toml_lite
