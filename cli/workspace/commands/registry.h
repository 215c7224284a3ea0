#pragma once

#include <functional>
#include <string>
#include <vector>

namespace sqlterm {
class ResultGridModel;
}  // namespace sqlterm

namespace sqlterm::cli {

struct WorkspaceConfig;

/// State a ":" command may read or change.
/// MUST reference objects that outlive the command dispatch.
struct CommandContext {
  WorkspaceConfig& config;
  ResultGridModel& grid;
  std::string& status;
  bool& status_error;
  bool& quit;
};

/// Returns true when the handler recognised and handled the line.
using CommandHandler = std::function<bool(const std::string&, CommandContext&)>;

class CommandRegistry {
 public:
  void add(CommandHandler handler);
  bool try_handle(const std::string& line, CommandContext& ctx) const;

 private:
  std::vector<CommandHandler> handlers_;
};

void register_default_commands(CommandRegistry& registry);

}  // namespace sqlterm::cli
