#include "ball.hpp"

#include "../log/log.hpp"
#include "../sys/threads.hpp"

namespace tvd::Proxs {

namespace {
auto Divisor(Re2 const &len) -> Re2
{
  Re2 d(len.dimensions());
  d.device(Threads::TensorDevice()) = len.cwiseMax(1.);
  return d;
}
} // namespace

auto VectorLength(Re2 const &a, Re2 const &b) -> Re2
{
  CheckShapes<2>("Ball", a.dimensions(), b.dimensions());
  Re2 len(a.dimensions());
  len.device(Threads::TensorDevice()) = (a.square() + b.square()).sqrt();
  return len;
}

auto VectorLength(Channels const &a, Channels const &b) -> Re2
{
  CheckShapes<2>("Ball", a.shape(), b.shape());
  Re2 len(a.shape());
  len.setZero();
  for (Index ic = 0; ic < Channels::NC; ic++) {
    len.device(Threads::TensorDevice()) += a[ic].square() + b[ic].square();
  }
  len.device(Threads::TensorDevice()) = len.sqrt();
  return len;
}

auto BallProject(Re2 const &a, Re2 const &b) -> std::pair<Re2, Re2>
{
  Re2 const d = Divisor(VectorLength(a, b));
  return {Divide(a, d), Divide(b, d)};
}

auto BallProject(Channels const &a, Channels const &b, Coupling const c) -> std::pair<Channels, Channels>
{
  switch (c) {
  case Coupling::Coupled: {
    Re2 const d = Divisor(VectorLength(a, b));
    return {a.divide(d), b.divide(d)};
  }
  case Coupling::PerChannel: {
    Channels::Array pa, pb;
    for (Index ic = 0; ic < Channels::NC; ic++) {
      std::tie(pa[ic], pb[ic]) = BallProject(a[ic], b[ic]);
    }
    return {Channels(std::move(pa)), Channels(std::move(pb))};
  }
  }
  throw Log::Failure("Ball", "Unknown coupling mode");
}

} // namespace tvd::Proxs
