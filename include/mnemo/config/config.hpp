#pragma once

#include "mnemo/common/result.hpp"
#include "mnemo/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mnemo::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> load_config_from_string(const std::string &toml);
[[nodiscard]] common::Status save_config(const Config &config);

/// Hard errors fail the result; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace mnemo::config
