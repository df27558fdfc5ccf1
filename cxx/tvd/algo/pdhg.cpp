#include "pdhg.hpp"

#include "../log/log.hpp"
#include "../op/diff.hpp"
#include "../op/elementwise.hpp"
#include "../op/power.hpp"
#include "iter.hpp"

#include <cmath>

namespace tvd::PDHG {

auto Opts::Defaults(Real const λ) -> Opts
{
  Real const τ = 1. / std::sqrt(2.);
  return Opts{.λ = λ, .τ = τ, .σ = 1. / (8. * τ), .γ = 0.35 * λ, .imax = 500, .tol = 1.e-10};
}

namespace {

void CheckOpts(Opts const &o)
{
  if (!(o.λ > 0.) || !(o.τ > 0.) || !(o.σ > 0.)) {
    throw Log::Failure("PDHG", "λ {} τ {} σ {} must all be positive", o.λ, o.τ, o.σ);
  }
  if (!(o.γ >= 0.)) { throw Log::Failure("PDHG", "γ {} must not be negative", o.γ); }
  if (o.imax < 1) { throw Log::Failure("PDHG", "Maximum iterations {} must be at least 1", o.imax); }
  if (!(o.tol >= 0.)) { throw Log::Failure("PDHG", "Tolerance {} must not be negative", o.tol); }
  if (o.τ * o.σ * 8. > 1. + 1.e-12) { Log::Warn("PDHG", "τσ·8 = {:4.3E} > 1, iterations may not converge", o.τ * o.σ * 8.); }
}

void CheckShape(Sz2 const &shape)
{
  if (shape[0] < 2 || shape[1] < 2) {
    throw AxisTooShort("PDHG", "Image of shape {} is too small to denoise, both axes need at least 2 pixels", shape);
  }
}

/*
 * Written once for matrices and bundles, only the dual projection differs. The primal and dual variables are warm-started
 * from the data: x̅ = u0 and y = ∇u0 rather than zero.
 */
template <typename T, typename Project> auto Iterate(T const &u0, Opts const &opts, Project &&project, Debug const &debug) -> T
{
  Log::Print("PDHG", "λ {:4.3E} τ {:4.3E} σ {:4.3E} γ {:4.3E} Max iterations {} Tolerance {:4.3E}", opts.λ, opts.τ, opts.σ,
             opts.γ, opts.imax, opts.tol);
  auto const start = Log::Now();

  Real τ = opts.τ;
  Real σ = opts.σ;
  T    x = u0;
  T    x̅ = u0;
  T    xold = u0;
  T    ya = ForwardDiff(u0, 0);
  T    yb = ForwardDiff(u0, 1);
  Real c = 0.;

  Iterating::Scope const scope;
  Index                  ii = 1;
  for (;; ii++) {
    /* Dual ascent on ∇x̅ then project back into the unit ball */
    std::tie(ya, yb) = project(Add(ya, Multiply(σ, ForwardDiff(x̅, 0))), Add(yb, Multiply(σ, ForwardDiff(x̅, 1))));

    /* Primal descent on -div y, then the proximal step of the fidelity term */
    xold = x;
    T const div = Add(BackwardDiff(ya, 0), BackwardDiff(yb, 1));
    x = WeightedAverage(Subtract(x, Multiply(τ, div)), u0, τ, opts.λ);

    Real const θ = 1. / (1. + 2. * opts.γ * τ);
    τ *= θ;
    σ /= θ;

    x̅ = Add(x, Multiply(θ, Subtract(x, xold)));

    c = Norm(Subtract(x, xold)) / Norm(xold);
    Log::Debug("PDHG", "{:02d}: |Δx|/|x| {:4.3E} θ {:4.3E} τ {:4.3E} σ {:4.3E}", ii, c, θ, τ, σ);
    if (debug) { debug(ii, c); }

    if (std::isnan(c)) {
      /* 0/0, the previous iterate was all zeros and nothing changed */
      Log::Print("PDHG", "Iterate did not change");
      break;
    }
    if (c < opts.tol) {
      Log::Print("PDHG", "Δ tolerance reached");
      break;
    }
    if (ii >= opts.imax) {
      Log::Print("PDHG", "Maximum iterations reached");
      break;
    }
    if (Iterating::ShouldStop("PDHG")) { break; }
  }
  Log::Print("PDHG", "Finished after {} iterations, |Δx|/|x| {:4.3E}, took {}", ii, c, Log::ToNow(start));
  return x;
}

} // namespace

auto Run(Re2 const &u0, Opts const &opts, Debug debug) -> Re2
{
  CheckShape(u0.dimensions());
  CheckOpts(opts);
  return Iterate(u0, opts, [](Re2 const &a, Re2 const &b) { return Proxs::BallProject(a, b); }, debug);
}

auto Run(Channels const &u0, Opts const &opts, Proxs::Coupling const coupling, Debug debug) -> Channels
{
  CheckShape(u0.shape());
  CheckOpts(opts);
  switch (coupling) {
  case Proxs::Coupling::Coupled:
    return Iterate(
      u0, opts, [](Channels const &a, Channels const &b) { return Proxs::BallProject(a, b, Proxs::Coupling::Coupled); }, debug);
  case Proxs::Coupling::PerChannel:
    /* Independent problems, so each channel also gets its own convergence test */
    return Channels::Generate([&](Index const ic) {
      Log::Print("PDHG", "Channel {}", ic);
      return Iterate(u0[ic], opts, [](Re2 const &a, Re2 const &b) { return Proxs::BallProject(a, b); }, debug);
    });
  }
  throw Log::Failure("PDHG", "Unknown coupling mode");
}

} // namespace tvd::PDHG
