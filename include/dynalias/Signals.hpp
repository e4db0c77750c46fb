#pragma once

#include <csignal>
#include <memory>

#include <termios.h>

namespace dynalias {

// Called in a forked child before exec: default SIGINT/SIGQUIT handling.
void set_child_signals();

// Parent side of a foreground spawn. Ignores SIGINT/SIGQUIT for its lifetime
// so an interrupt only reaches the child, then restores the previous actions.
class ForegroundSignalGuard {
  struct sigaction old_int_{};
  struct sigaction old_quit_{};
  bool             installed_ = false;

public:
  ForegroundSignalGuard();
  ~ForegroundSignalGuard();
  ForegroundSignalGuard(ForegroundSignalGuard const&)            = delete;
  ForegroundSignalGuard& operator=(ForegroundSignalGuard const&) = delete;
};

// Saves the terminal mode of stdin (when it is a tty) and puts it back on
// destruction, whatever the child did to it.
class TerminalStateGuard {
  std::unique_ptr<termios> saved_;

public:
  TerminalStateGuard();
  ~TerminalStateGuard();
  TerminalStateGuard(TerminalStateGuard const&)            = delete;
  TerminalStateGuard& operator=(TerminalStateGuard const&) = delete;
};

} // namespace dynalias
