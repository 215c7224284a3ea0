#pragma once

#include "registry.h"

namespace sqlterm::cli {

CommandHandler make_help_command();

}  // namespace sqlterm::cli
