#include "terminal.h"

#include <cerrno>
#include <iostream>

#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace sqlterm::cli {
namespace {

struct TermiosState {
  termios value{};
};

}  // namespace

TermiosGuard::TermiosGuard() : ok_(false) {
  auto* state = new TermiosState();
  if (tcgetattr(STDIN_FILENO, &state->value) != 0) {
    delete state;
    return;
  }
  termios raw = state->value;
  raw.c_iflag &= ~(IXON | ICRNL);
  raw.c_lflag &= ~(ECHO | ICANON | ISIG | IEXTEN);
  raw.c_cc[VMIN] = 0;
  raw.c_cc[VTIME] = 0;
  if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) {
    delete state;
    return;
  }
  // Alternate screen, hidden cursor.
  std::cout << "\033[?1049h\033[?25l" << std::flush;
  original_ = state;
  ok_ = true;
}

TermiosGuard::~TermiosGuard() {
  if (!ok_ || !original_) {
    return;
  }
  auto* state = static_cast<TermiosState*>(original_);
  std::cout << "\033[0m\033[?25h\033[?1049l" << std::flush;
  tcsetattr(STDIN_FILENO, TCSANOW, &state->value);
  delete state;
  original_ = nullptr;
}

bool TermiosGuard::ok() const {
  return ok_;
}

TerminalSize terminal_size() {
  TerminalSize size;
  winsize ws{};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
    size.rows = ws.ws_row;
    size.cols = ws.ws_col;
  }
  return size;
}

bool read_input(int timeout_ms, std::string& out) {
  pollfd pfd{};
  pfd.fd = STDIN_FILENO;
  pfd.events = POLLIN;
  int ready = ::poll(&pfd, 1, timeout_ms);
  if (ready < 0) {
    return errno == EINTR;
  }
  if (ready == 0) {
    return true;
  }
  char buf[256];
  ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
  if (n < 0) {
    return errno == EINTR || errno == EAGAIN;
  }
  if (n == 0) {
    return false;
  }
  out.append(buf, static_cast<size_t>(n));
  return true;
}

}  // namespace sqlterm::cli
