#include "diff.hpp"

#include "../log/log.hpp"
#include "../sys/threads.hpp"

namespace tvd {

namespace {

template <int ND> void CheckAxis(char const *cat, Sz<ND> const &shape, Index const axis)
{
  if (axis < 0 || axis >= ND) { throw AxisOutOfBounds(cat, "Axis {} does not exist in tensor of shape {}", axis, shape); }
  if (shape[axis] < 2) {
    throw AxisTooShort(cat, "Axis {} of shape {} has length {}, need at least 2", axis, shape, shape[axis]);
  }
}

/*
 * Starts and sizes of the two slabs along the axis. The bulk is everything except one plane, the edge is a single plane.
 */
template <int ND> struct Slabs
{
  Sz<ND> f0, fp1, fm1, bulk, edge;

  Slabs(Sz<ND> const &shape, Index const axis)
    : bulk{shape}
    , edge{shape}
  {
    fp1[axis] = 1;
    fm1[axis] = shape[axis] - 1;
    bulk[axis] -= 1;
    edge[axis] = 1;
  }
};

} // namespace

template <int ND> auto PositiveShift(ReN<ND> const &a, Index const axis) -> ReN<ND>
{
  CheckAxis<ND>("Shift", a.dimensions(), axis);
  Slabs<ND> const s(a.dimensions(), axis);
  ReN<ND>         b(a.dimensions());
  b.slice(s.fp1, s.bulk).device(Threads::TensorDevice()) = a.slice(s.f0, s.bulk);
  b.slice(s.f0, s.edge).device(Threads::TensorDevice()) = a.slice(s.fm1, s.edge);
  return b;
}

template <int ND> auto NegativeShift(ReN<ND> const &a, Index const axis) -> ReN<ND>
{
  CheckAxis<ND>("Shift", a.dimensions(), axis);
  Slabs<ND> const s(a.dimensions(), axis);
  ReN<ND>         b(a.dimensions());
  b.slice(s.f0, s.bulk).device(Threads::TensorDevice()) = a.slice(s.fp1, s.bulk);
  b.slice(s.fm1, s.edge).device(Threads::TensorDevice()) = a.slice(s.f0, s.edge);
  return b;
}

template <int ND> auto ForwardDiff(ReN<ND> const &a, Index const axis) -> ReN<ND>
{
  CheckAxis<ND>("Diff", a.dimensions(), axis);
  Log::Debug("Diff", "Forward difference axis {}", axis);
  Slabs<ND> const s(a.dimensions(), axis);
  ReN<ND>         b(a.dimensions());
  b.slice(s.fp1, s.bulk).device(Threads::TensorDevice()) = a.slice(s.fp1, s.bulk) - a.slice(s.f0, s.bulk);
  b.slice(s.f0, s.edge).device(Threads::TensorDevice()) = a.slice(s.f0, s.edge) - a.slice(s.fm1, s.edge);
  return b;
}

template <int ND> auto BackwardDiff(ReN<ND> const &a, Index const axis) -> ReN<ND>
{
  CheckAxis<ND>("Diff", a.dimensions(), axis);
  Log::Debug("Diff", "Backward difference axis {}", axis);
  Slabs<ND> const s(a.dimensions(), axis);
  ReN<ND>         b(a.dimensions());
  b.slice(s.f0, s.bulk).device(Threads::TensorDevice()) = a.slice(s.f0, s.bulk) - a.slice(s.fp1, s.bulk);
  b.slice(s.fm1, s.edge).device(Threads::TensorDevice()) = a.slice(s.fm1, s.edge) - a.slice(s.f0, s.edge);
  return b;
}

template auto PositiveShift<1>(Re1 const &, Index const) -> Re1;
template auto PositiveShift<2>(Re2 const &, Index const) -> Re2;
template auto PositiveShift<3>(Re3 const &, Index const) -> Re3;
template auto NegativeShift<1>(Re1 const &, Index const) -> Re1;
template auto NegativeShift<2>(Re2 const &, Index const) -> Re2;
template auto NegativeShift<3>(Re3 const &, Index const) -> Re3;
template auto ForwardDiff<1>(Re1 const &, Index const) -> Re1;
template auto ForwardDiff<2>(Re2 const &, Index const) -> Re2;
template auto ForwardDiff<3>(Re3 const &, Index const) -> Re3;
template auto BackwardDiff<1>(Re1 const &, Index const) -> Re1;
template auto BackwardDiff<2>(Re2 const &, Index const) -> Re2;
template auto BackwardDiff<3>(Re3 const &, Index const) -> Re3;

auto ForwardDiff(Channels const &a, Index const axis) -> Channels
{
  return Channels::Generate([&](Index const ic) { return ForwardDiff<2>(a[ic], axis); });
}

auto BackwardDiff(Channels const &a, Index const axis) -> Channels
{
  return Channels::Generate([&](Index const ic) { return BackwardDiff<2>(a[ic], axis); });
}

} // namespace tvd
