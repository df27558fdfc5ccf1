#pragma once
/*
 * Infrastructure for dealing with whether to continue iterating in solvers
 */
namespace tvd::Iterating {
void Starting();
void Finished();
void RequestStop();
auto ShouldStop(char const *name) -> bool;

/* Starting() on construction, Finished() on destruction, so an exception from inside a loop still restores SIGINT */
struct Scope
{
  Scope();
  ~Scope();
  Scope(Scope const &) = delete;
  Scope &operator=(Scope const &) = delete;
};
} // namespace tvd::Iterating
