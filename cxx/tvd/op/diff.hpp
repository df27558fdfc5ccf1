#pragma once

#include "../channels.hpp"
#include "../types.hpp"

namespace tvd {

/*
 * Circular shifts and finite differences along one axis. The boundary wraps, so the element that falls off one edge
 * reappears at the other, and ForwardDiff / BackwardDiff are an exact adjoint pair:
 *
 *   sum(ForwardDiff(A, X) * B) == sum(A * BackwardDiff(B, X))
 *
 * All throw AxisOutOfBounds if axis >= rank and AxisTooShort if the axis has length < 2.
 */

/* out[i] = a[i - 1], index 0 receives the last element */
template <int ND> auto PositiveShift(ReN<ND> const &a, Index const axis) -> ReN<ND>;
/* out[i] = a[i + 1], the last index receives element 0 */
template <int ND> auto NegativeShift(ReN<ND> const &a, Index const axis) -> ReN<ND>;
/* a - PositiveShift(a) */
template <int ND> auto ForwardDiff(ReN<ND> const &a, Index const axis) -> ReN<ND>;
/* a - NegativeShift(a), the transpose of ForwardDiff */
template <int ND> auto BackwardDiff(ReN<ND> const &a, Index const axis) -> ReN<ND>;

auto ForwardDiff(Channels const &a, Index const axis) -> Channels;
auto BackwardDiff(Channels const &a, Index const axis) -> Channels;

} // namespace tvd
