#include "dynalias/Signals.hpp"

#include <cerrno>
#include <cstring>
#include <fmt/core.h>

#include <unistd.h>

namespace dynalias {

void set_child_signals() {
  struct sigaction sa{};
  sa.sa_handler = SIG_DFL;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGQUIT, &sa, nullptr);
}

ForegroundSignalGuard::ForegroundSignalGuard() {
  struct sigaction sa{};
  sa.sa_handler = SIG_IGN;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  if (sigaction(SIGINT, &sa, &old_int_) == -1) {
    fmt::print(stderr, "Warning: sigaction(SIGINT): {}\n", std::strerror(errno));
    return;
  }
  if (sigaction(SIGQUIT, &sa, &old_quit_) == -1) {
    fmt::print(stderr, "Warning: sigaction(SIGQUIT): {}\n", std::strerror(errno));
    sigaction(SIGINT, &old_int_, nullptr);
    return;
  }
  installed_ = true;
}

ForegroundSignalGuard::~ForegroundSignalGuard() {
  if (installed_) {
    sigaction(SIGINT, &old_int_, nullptr);
    sigaction(SIGQUIT, &old_quit_, nullptr);
  }
}

TerminalStateGuard::TerminalStateGuard() {
  if (isatty(STDIN_FILENO) == 0) {
    return;
  }
  auto state = std::make_unique<termios>();
  if (tcgetattr(STDIN_FILENO, state.get()) == 0) {
    saved_ = std::move(state);
  }
}

TerminalStateGuard::~TerminalStateGuard() {
  if (saved_ && tcsetattr(STDIN_FILENO, TCSADRAIN, saved_.get()) == -1) {
    fmt::print(stderr, "Warning: failed to restore terminal state: {}\n", std::strerror(errno));
  }
}

} // namespace dynalias
