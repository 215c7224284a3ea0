#include "config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "util/string_util.h"
#include "workspace/core/workspace.h"

namespace sqlterm::cli {

namespace {

std::string get_env(const char* name) {
  if (const char* value = std::getenv(name)) {
    if (*value) return value;
  }
  return {};
}

bool parse_bool(const std::string& raw, bool& out) {
  std::string lower = sqlterm::util::to_lower(raw);
  if (lower == "true") {
    out = true;
    return true;
  }
  if (lower == "false") {
    out = false;
    return true;
  }
  return false;
}

std::string parse_string_value(const std::string& raw, bool& ok) {
  std::string trimmed = sqlterm::util::trim_ws(raw);
  if (trimmed.empty()) {
    ok = false;
    return {};
  }
  if ((trimmed.front() == '"' || trimmed.front() == '\'')) {
    if (trimmed.size() < 2 || trimmed.back() != trimmed.front()) {
      ok = false;
      return {};
    }
    ok = true;
    return trimmed.substr(1, trimmed.size() - 2);
  }
  ok = true;
  return trimmed;
}

std::string invalid_at(const std::string& key, size_t line_no) {
  return "Invalid " + key + " at line " + std::to_string(line_no);
}

}  // namespace

std::string resolve_config_path() {
  std::string override = get_env("SQLTERM_CONFIG");
  if (!override.empty()) {
    return override;
  }
  std::string xdg_config = get_env("XDG_CONFIG_HOME");
  if (!xdg_config.empty()) {
    return (std::filesystem::path(xdg_config) / "sqlterm" / "config.toml").string();
  }
  std::string home = get_env("HOME");
  if (!home.empty()) {
    return (std::filesystem::path(home) / ".config" / "sqlterm" / "config.toml").string();
  }
  return "sqlterm.config.toml";
}

std::string expand_user_path(const std::string& raw) {
  if (raw.empty()) return raw;
  if (raw[0] == '~') {
    std::string home = get_env("HOME");
    if (home.empty()) return raw;
    if (raw.size() == 1) return home;
    if (raw[1] == '/') {
      return home + raw.substr(1);
    }
  }
  if (raw.rfind("$HOME/", 0) == 0) {
    std::string home = get_env("HOME");
    if (!home.empty()) {
      return home + raw.substr(5);
    }
  }
  return raw;
}

bool load_workspace_config(const std::string& path, WorkspaceSettings& out, std::string& error) {
  out = WorkspaceSettings{};
  if (path.empty()) return false;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return false;
  }
  std::ifstream in(path);
  if (!in) {
    error = "Failed to open config: " + path;
    return false;
  }
  std::string section;
  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string trimmed = sqlterm::util::trim_ws(line);
    if (trimmed.empty()) continue;
    if (trimmed[0] == '#') continue;
    if (trimmed.size() >= 2 && trimmed[0] == '/' && trimmed[1] == '/') continue;
    if (trimmed.front() == '[' && trimmed.back() == ']') {
      section = sqlterm::util::trim_ws(trimmed.substr(1, trimmed.size() - 2));
      continue;
    }
    size_t eq = trimmed.find('=');
    if (eq == std::string::npos) continue;
    std::string key = sqlterm::util::trim_ws(trimmed.substr(0, eq));
    std::string value = sqlterm::util::trim_ws(trimmed.substr(eq + 1));
    if (key.empty()) continue;
    std::string full_key = section.empty() ? key : section + "." + key;
    bool ok = false;
    if (full_key == "workspace.page_size" || full_key == "workspace.tick_ms" ||
        full_key == "database.busy_timeout_ms") {
      size_t parsed = 0;
      if (!sqlterm::util::parse_positive_size(value, parsed)) {
        error = invalid_at(full_key, line_no);
        return false;
      }
      if (full_key == "workspace.page_size") {
        out.page_size = parsed;
      } else if (full_key == "workspace.tick_ms") {
        out.tick_ms = parsed;
      } else {
        out.busy_timeout_ms = parsed;
      }
    } else if (full_key == "workspace.highlight" || full_key == "clipboard.enabled") {
      bool parsed = false;
      if (!parse_bool(value, parsed)) {
        error = invalid_at(full_key, line_no);
        return false;
      }
      if (full_key == "workspace.highlight") {
        out.highlight = parsed;
      } else {
        out.clipboard_enabled = parsed;
      }
    } else if (full_key == "clipboard.command") {
      std::string parsed = parse_string_value(value, ok);
      if (!ok) {
        error = invalid_at(full_key, line_no);
        return false;
      }
      out.clipboard_command = parsed;
    } else if (full_key == "database.path") {
      std::string parsed = parse_string_value(value, ok);
      if (!ok) {
        error = invalid_at(full_key, line_no);
        return false;
      }
      out.database_path = expand_user_path(parsed);
    } else if (full_key == "database.backend") {
      std::string parsed = parse_string_value(value, ok);
      if (!ok) {
        error = invalid_at(full_key, line_no);
        return false;
      }
      out.database_backend = sqlterm::util::to_lower(parsed);
    }
  }
  return true;
}

void apply_workspace_settings(const WorkspaceSettings& settings, WorkspaceConfig& config) {
  if (settings.page_size.has_value()) {
    config.page_size = *settings.page_size;
  }
  if (settings.tick_ms.has_value()) {
    config.tick_ms = *settings.tick_ms;
  }
  if (settings.highlight.has_value()) {
    config.highlight = *settings.highlight;
  }
  if (settings.clipboard_command.has_value()) {
    config.clipboard_command = *settings.clipboard_command;
  }
  if (settings.clipboard_enabled.has_value()) {
    config.clipboard_enabled = *settings.clipboard_enabled;
  }
  if (settings.busy_timeout_ms.has_value()) {
    config.connection.busy_timeout_ms = static_cast<int>(*settings.busy_timeout_ms);
  }
  if (settings.database_path.has_value()) {
    config.connection.path = *settings.database_path;
  }
  if (settings.database_backend.has_value()) {
    config.connection.backend = *settings.database_backend;
  }
}

}  // namespace sqlterm::cli
