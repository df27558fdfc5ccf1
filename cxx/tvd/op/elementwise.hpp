#pragma once

#include "../errors.hpp"
#include "../sys/threads.hpp"
#include "../types.hpp"

namespace tvd {

template <int N> void CheckShapes(char const *cat, Sz<N> const &a, Sz<N> const &b)
{
  if (a != b) { throw ShapeMismatch(cat, "Shapes {} and {} do not match", a, b); }
}

/*
 * Every elementwise arithmetic call goes through one of these. Tensor-tensor operands must have identical shapes, a scalar
 * operand is broadcast to every element. The result is always a new tensor.
 */
template <int N, typename F> auto Binary(ReN<N> const &a, ReN<N> const &b, F const &f) -> ReN<N>
{
  CheckShapes<N>("Binary", a.dimensions(), b.dimensions());
  ReN<N> c(a.dimensions());
  c.device(Threads::TensorDevice()) = a.binaryExpr(b, f);
  return c;
}

template <int N, typename F> auto Binary(ReN<N> const &a, Real const b, F const &f) -> ReN<N>
{
  ReN<N> c(a.dimensions());
  c.device(Threads::TensorDevice()) = a.unaryExpr([b, f](Real const x) { return f(x, b); });
  return c;
}

template <int N, typename F> auto Binary(Real const a, ReN<N> const &b, F const &f) -> ReN<N>
{
  ReN<N> c(b.dimensions());
  c.device(Threads::TensorDevice()) = b.unaryExpr([a, f](Real const x) { return f(a, x); });
  return c;
}

#define TVD_BINARY_OP(NAME, FUNCTOR)                                                                                           \
  template <int N> auto NAME(ReN<N> const &a, ReN<N> const &b) -> ReN<N> { return Binary(a, b, FUNCTOR<Real>()); }       \
  template <int N> auto NAME(ReN<N> const &a, Real const b) -> ReN<N> { return Binary(a, b, FUNCTOR<Real>()); }          \
  template <int N> auto NAME(Real const a, ReN<N> const &b) -> ReN<N> { return Binary(a, b, FUNCTOR<Real>()); }

TVD_BINARY_OP(Add, std::plus)
TVD_BINARY_OP(Subtract, std::minus)
TVD_BINARY_OP(Multiply, std::multiplies)
TVD_BINARY_OP(Divide, std::divides)

#undef TVD_BINARY_OP

/*
 * (v + t·l·u0) / (1 + t·l), i.e. pull v back towards the noisy data u0. This is the proximal step for the fidelity term.
 */
template <int N> auto WeightedAverage(ReN<N> const &v, ReN<N> const &u0, Real const t, Real const l) -> ReN<N>
{
  CheckShapes<N>("Average", v.dimensions(), u0.dimensions());
  Real const tl = t * l;
  ReN<N>     c(v.dimensions());
  c.device(Threads::TensorDevice()) = (v + u0 * u0.constant(tl)) / v.constant(1. + tl);
  return c;
}

} // namespace tvd
