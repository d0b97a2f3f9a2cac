#include "termination.h"

#include <atomic>

namespace {

std::atomic_bool s_requested{ false };

static_assert(std::atomic_bool::is_always_lock_free);

}  // namespace

#ifdef _WIN32

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>

namespace {

BOOL WINAPI console_ctrl_handler(DWORD ctrl_type) {
  switch (ctrl_type) {
    case CTRL_C_EVENT:
    case CTRL_BREAK_EVENT:
    case CTRL_CLOSE_EVENT:
      if (s_requested.exchange(true)) { ::ExitProcess(130); }
      return TRUE;
    default: return FALSE;
  }
}

}  // namespace

namespace sous {

void termination_handler_install() { ::SetConsoleCtrlHandler(console_ctrl_handler, TRUE); }

bool termination_requested() { return s_requested.load(); }

}  // namespace sous

#else  // POSIX

#include <unistd.h>

#include <csignal>

namespace {

void signal_handler(int) {
  if (s_requested.exchange(true)) { _exit(130); }
}

}  // namespace

namespace sous {

void termination_handler_install() {
  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

bool termination_requested() { return s_requested.load(); }

}  // namespace sous

#endif
