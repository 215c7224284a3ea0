#include "color.h"

#include <iostream>

namespace sqlterm::cli {

Color kColor;

void print_error(const std::string& message, bool color) {
  if (color) std::cerr << kColor.red;
  std::cerr << "Error: " << message << std::endl;
  if (color) std::cerr << kColor.reset;
}

void print_warning(const std::string& message, bool color) {
  if (color) std::cerr << kColor.yellow;
  std::cerr << "Warning: " << message << std::endl;
  if (color) std::cerr << kColor.reset;
}

}  // namespace sqlterm::cli
