#include "termination.h"

#include <unistd.h>

#include <csignal>
#include <tuple>

namespace {

std::atomic_bool g_requested{ false };

void signal_handler(int sig) {
  if (g_requested.exchange(true)) { _exit(128 + sig); }
  constexpr char kMsg[]{ "\ncancelling; press Ctrl-C again to exit now\n" };
  std::ignore = write(STDERR_FILENO, kMsg, sizeof(kMsg) - 1);
}

}  // namespace

namespace blext {

void termination_handler_install() {
  struct sigaction sa{};
  sa.sa_handler = signal_handler;
  sigemptyset(&sa.sa_mask);

  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

std::atomic_bool const &termination_requested() { return g_requested; }

}  // namespace blext
