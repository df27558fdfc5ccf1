#pragma once

#include "../channels.hpp"
#include "../prox/ball.hpp"
#include "../types.hpp"

#include <functional>

namespace tvd::PDHG {

/*
 * Accelerated primal-dual (Chambolle & Pock 2011, Algorithm 2) for the ROF model
 *
 *   min_x  TV(x) + λ/2 |x - u0|²
 *
 * λ      Fidelity weight. Towards 0 the result flattens, large values stay near u0.
 * τ, σ   Initial primal and dual step sizes. Stable if τσ·8 <= 1 (8 bounds |∇|² for 2D differences).
 * γ      Acceleration, usually 0.35λ. θ = 1/(1 + 2γτ) then τ ← θτ, σ ← σ/θ every iteration.
 * imax   Hard limit on iterations.
 * tol    Stop once |x - xold| / |xold| drops below this.
 */
struct Opts
{
  Real  λ, τ, σ, γ;
  Index imax;
  Real  tol;

  static auto Defaults(Real const λ) -> Opts;
};

/* Called after every iteration with the iteration number (from 1) and the convergence ratio */
using Debug = std::function<void(Index const, Real const)>;

auto Run(Re2 const &u0, Opts const &opts, Debug debug = nullptr) -> Re2;
auto Run(Channels const &u0, Opts const &opts, Proxs::Coupling const coupling = Proxs::Coupling::Coupled, Debug debug = nullptr)
  -> Channels;

} // namespace tvd::PDHG
