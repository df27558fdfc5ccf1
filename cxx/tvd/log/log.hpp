#pragma once

#include <chrono>
#include <fmt/color.h>
#include <fmt/ranges.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace tvd {
namespace Log {

/* Messages at or below the display level go to stderr. Warnings always do. */
enum struct Display
{
  None = 0,
  Low = 1,
  High = 2
};

using Time = std::chrono::steady_clock::time_point;

void SetDisplayLevel(Display const l);
auto DisplayLevel() -> Display;
auto IsHigh() -> bool;
auto FormatEntry(std::string const &category, fmt::string_view fmt, fmt::format_args args) -> std::string;
void SaveEntry(std::string const &entry, fmt::text_style const style, Display const level);
auto Saved() -> std::vector<std::string> const &;
void ClearSaved();

template <typename... Args> inline void Print(std::string const &category, fmt::format_string<Args...> fstr, Args &&...args)
{
  SaveEntry(FormatEntry(category, fstr, fmt::make_format_args(args...)), fmt::text_style(), Display::Low);
}

template <typename... Args> inline void Debug(std::string const &category, fmt::format_string<Args...> fstr, Args &&...args)
{
  if (!IsHigh()) { return; }
  SaveEntry(FormatEntry(category, fstr, fmt::make_format_args(args...)), fmt::text_style(), Display::High);
}

template <typename... Args>
inline void Warn(std::string const &category, fmt::format_string<Args...> const &fstr, Args &&...args)
{
  SaveEntry(FormatEntry(category, fstr, fmt::make_format_args(args...)), fmt::fg(fmt::terminal_color::bright_yellow), Display::None);
}

struct Failure : std::runtime_error
{
  template <typename... Args>
  Failure(std::string const &cat, fmt::format_string<Args...> fs, Args &&...args)
    : std::runtime_error(FormatEntry(cat, fs, fmt::make_format_args(args...)))
  {
  }
};

auto Now() -> Time;
/* Elapsed time since t as "1.234 s", or "2 min 3.456 s" */
auto ToNow(Time const t) -> std::string;

} // namespace Log
} // namespace tvd
