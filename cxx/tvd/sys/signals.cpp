#include "signals.hpp"

#include "../log/log.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>

namespace tvd {

namespace {
int                   interruptLevel = 0;
std::atomic<bool>     received = false;
volatile sig_atomic_t hits = 0;

void Handler(int)
{
  if (hits > 0) { std::_Exit(EXIT_FAILURE); }
  hits = 1;
  received = true;
}
} // namespace

void PushInterrupt()
{
  if (interruptLevel == 0) { std::signal(SIGINT, Handler); }
  interruptLevel++;
}

void PopInterrupt()
{
  interruptLevel--;
  if (interruptLevel == 0) { std::signal(SIGINT, SIG_DFL); }
}

auto InterruptReceived() -> bool
{
  if (received && hits == 1) {
    Log::Print("Signal", "SIGINT received, will terminate when current iteration finishes. Press Ctrl-C again to terminate now.");
    hits = 2;
  }
  return received;
}

void ClearInterrupt()
{
  received = false;
  hits = 0;
}

} // namespace tvd
