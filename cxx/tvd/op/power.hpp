#pragma once

#include "../channels.hpp"
#include "../types.hpp"

namespace tvd {

/* a ⊙ a */
template <int N> auto Squared(ReN<N> const &a) -> ReN<N>;
/* Elementwise std::pow. Negative bases with non-integer exponents give NaN, which is passed through. */
template <int N> auto Power(ReN<N> const &a, Real const n) -> ReN<N>;
template <int N> auto Power(ReN<N> const &a, int const n) -> ReN<N>;
/* sqrt(sum(a ⊙ a)) */
template <int N> auto Norm(ReN<N> const &a) -> Real;

auto Squared(Channels const &a) -> Channels;
auto Power(Channels const &a, Real const n) -> Channels;
auto Power(Channels const &a, int const n) -> Channels;
/* Frobenius norm over all three channels together */
auto Norm(Channels const &a) -> Real;

} // namespace tvd
