#include "log.hpp"

#include <ctime>
#include <fmt/chrono.h>
#include <mutex>
#include <cstdio>

namespace tvd {
namespace Log {

namespace {
Display                  displayLevel = Display::None;
std::mutex               logMutex;
std::vector<std::string> savedEntries;

auto TheTime() -> std::string
{
  auto const t = std::time(nullptr);
  return fmt::format("{:%H:%M:%S}", fmt::localtime(t));
}
} // namespace

void SetDisplayLevel(Display const l) { displayLevel = l; }

auto DisplayLevel() -> Display { return displayLevel; }

auto IsHigh() -> bool { return displayLevel == Display::High; }

auto FormatEntry(std::string const &category, fmt::string_view fmt, fmt::format_args args) -> std::string
{
  return fmt::format("[{}] [{:<6}] {}", TheTime(), category, fmt::vformat(fmt, args));
}

void SaveEntry(std::string const &s, fmt::text_style const style, Display const level)
{
  std::scoped_lock lock(logMutex);
  // Per-iteration debug lines are only printed, otherwise long solves would fill the history
  if (level <= Display::Low) { savedEntries.push_back(s); }
  if (displayLevel >= level) { fmt::print(stderr, style, "{}\n", s); }
}

auto Saved() -> std::vector<std::string> const & { return savedEntries; }

void ClearSaved()
{
  std::scoped_lock lock(logMutex);
  savedEntries.clear();
}

auto Now() -> Time { return std::chrono::steady_clock::now(); }

auto ToNow(Time const t) -> std::string
{
  std::chrono::duration<double> const elapsed = Now() - t;
  auto const                          mins = static_cast<long>(elapsed.count() / 60.);
  auto const                          secs = elapsed.count() - 60. * mins;
  if (mins > 0) { return fmt::format("{} min {:.3f} s", mins, secs); }
  return fmt::format("{:.3f} s", secs);
}

} // namespace Log
} // namespace tvd
