#pragma once

#include "registry.h"

namespace sqlterm::cli {

CommandHandler make_page_size_command();

}  // namespace sqlterm::cli
