#include "iter.hpp"

#include "../log/log.hpp"
#include "../sys/signals.hpp"

#include <atomic>

namespace tvd::Iterating {

namespace {
std::atomic<bool> stopRequested = false;
}

void Starting() { PushInterrupt(); }

void Finished()
{
  PopInterrupt();
  ClearInterrupt();
  stopRequested = false;
}

Scope::Scope() { Starting(); }

Scope::~Scope() { Finished(); }

void RequestStop() { stopRequested = true; }

auto ShouldStop(char const *name) -> bool
{
  if (InterruptReceived()) {
    Log::Print(name, "Interrupted, halting iterations");
    return true;
  } else if (stopRequested) {
    Log::Print(name, "Stop requested, halting iterations");
    return true;
  } else {
    return false;
  }
}

} // namespace tvd::Iterating
