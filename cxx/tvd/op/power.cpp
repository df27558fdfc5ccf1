#include "power.hpp"

#include "../sys/threads.hpp"
#include "../tensors.hpp"

#include <cmath>

namespace tvd {

template <int N> auto Squared(ReN<N> const &a) -> ReN<N> { return Multiply(a, a); }

template <int N> auto Power(ReN<N> const &a, Real const n) -> ReN<N>
{
  ReN<N> b(a.dimensions());
  b.device(Threads::TensorDevice()) = a.unaryExpr([n](Real const x) { return std::pow(x, n); });
  return b;
}

template <int N> auto Power(ReN<N> const &a, int const n) -> ReN<N> { return Power(a, static_cast<Real>(n)); }

template <int N> auto Norm(ReN<N> const &a) -> Real { return std::sqrt(Norm2<true>(a)); }

template auto Squared<1>(Re1 const &) -> Re1;
template auto Squared<2>(Re2 const &) -> Re2;
template auto Squared<3>(Re3 const &) -> Re3;
template auto Power<1>(Re1 const &, Real const) -> Re1;
template auto Power<2>(Re2 const &, Real const) -> Re2;
template auto Power<3>(Re3 const &, Real const) -> Re3;
template auto Power<1>(Re1 const &, int const) -> Re1;
template auto Power<2>(Re2 const &, int const) -> Re2;
template auto Power<3>(Re3 const &, int const) -> Re3;
template auto Norm<1>(Re1 const &) -> Real;
template auto Norm<2>(Re2 const &) -> Real;
template auto Norm<3>(Re3 const &) -> Real;

auto Squared(Channels const &a) -> Channels { return a.multiply(a); }

auto Power(Channels const &a, Real const n) -> Channels
{
  return Channels::Generate([&](Index const ic) { return Power<2>(a[ic], n); });
}

auto Power(Channels const &a, int const n) -> Channels { return Power(a, static_cast<Real>(n)); }

auto Norm(Channels const &a) -> Real { return std::sqrt(Squared(a).sum()); }

} // namespace tvd
