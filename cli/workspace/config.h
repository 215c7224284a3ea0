#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace sqlterm::cli {

struct WorkspaceConfig;

/// Values read from the config file; unset fields keep their built-in defaults.
struct WorkspaceSettings {
  std::optional<size_t> page_size;
  std::optional<size_t> tick_ms;
  std::optional<bool> highlight;
  std::optional<std::string> clipboard_command;
  std::optional<bool> clipboard_enabled;
  std::optional<size_t> busy_timeout_ms;
  std::optional<std::string> database_path;
  std::optional<std::string> database_backend;
};

/// Resolves the config path from SQLTERM_CONFIG, XDG_CONFIG_HOME, then HOME.
std::string resolve_config_path();
/// Parses a TOML-subset config file.
/// MUST return false without error when the file does not exist, and MUST set error
/// with the offending line number for invalid values.
bool load_workspace_config(const std::string& path, WorkspaceSettings& out, std::string& error);
/// Expands a leading "~" or "$HOME/" in a user supplied path.
std::string expand_user_path(const std::string& raw);
/// Copies every set field of settings into config.
void apply_workspace_settings(const WorkspaceSettings& settings, WorkspaceConfig& config);

}  // namespace sqlterm::cli
