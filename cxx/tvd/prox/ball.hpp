#pragma once

#include "../channels.hpp"
#include "../types.hpp"

#include <tuple>
#include <utility>

namespace tvd::Proxs {

/*
 * How the dual variables of a colour image are projected. Coupled sums the squared components of all channels before
 * taking the length (vectorial / colour TV), PerChannel projects each channel on its own (three scalar TVs).
 */
enum struct Coupling
{
  Coupled,
  PerChannel
};

auto VectorLength(Re2 const &a, Re2 const &b) -> Re2;
auto VectorLength(Channels const &a, Channels const &b) -> Re2;

/*
 * Pointwise projection of the vector field (a, b) onto the unit ball: a / max(1, |v|), b / max(1, |v|). This is the
 * proximal operator of the convex conjugate of the isotropic TV norm.
 */
auto BallProject(Re2 const &a, Re2 const &b) -> std::pair<Re2, Re2>;
auto BallProject(Channels const &a, Channels const &b, Coupling const c = Coupling::Coupled) -> std::pair<Channels, Channels>;

} // namespace tvd::Proxs
