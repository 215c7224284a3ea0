#include "registry.h"

#include "export_command.h"
#include "goto_command.h"
#include "help_command.h"
#include "page_size_command.h"
#include "quit_command.h"

namespace sqlterm::cli {

void CommandRegistry::add(CommandHandler handler) {
  handlers_.push_back(std::move(handler));
}

bool CommandRegistry::try_handle(const std::string& line, CommandContext& ctx) const {
  for (const auto& handler : handlers_) {
    if (handler(line, ctx)) {
      return true;
    }
  }
  return false;
}

void register_default_commands(CommandRegistry& registry) {
  registry.add(make_help_command());
  registry.add(make_quit_command());
  registry.add(make_export_command());
  registry.add(make_page_size_command());
  registry.add(make_goto_command());
}

}  // namespace sqlterm::cli
