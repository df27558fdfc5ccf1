#include "channels.hpp"

#include "tensors.hpp"

namespace tvd {

Channels::Channels(Sz2 const sh)
  : shape_{sh}
{
  for (auto &c : channels_) {
    c.resize(sh);
    c.setZero();
  }
}

Channels::Channels(Re2 const &r, Re2 const &g, Re2 const &b)
  : Channels(Array{r, g, b})
{
}

Channels::Channels(Array cs)
  : shape_{cs[0].dimensions()}
  , channels_{std::move(cs)}
{
  for (Index ic = 1; ic < NC; ic++) {
    if (channels_[ic].dimensions() != shape_) {
      throw ShapeMismatch("Channels", "Channel {} had shape {}, expected {}", ic, channels_[ic].dimensions(), shape_);
    }
  }
}

auto Channels::shape() const -> Sz2 const & { return shape_; }

auto Channels::operator[](Index const ic) const -> Re2 const &
{
  if (ic < 0 || ic >= NC) { throw Log::Failure("Channels", "Channel index {} out of range", ic); }
  return channels_[ic];
}

auto Channels::add(Channels const &o) const -> Channels
{
  return Generate([&](Index const ic) { return Add(channels_[ic], o.channels_[ic]); });
}

auto Channels::add(Re2 const &o) const -> Channels
{
  return Generate([&](Index const ic) { return Add(channels_[ic], o); });
}

auto Channels::add(Real const s) const -> Channels
{
  return Generate([&](Index const ic) { return Add(channels_[ic], s); });
}

auto Channels::subtract(Channels const &o) const -> Channels
{
  return Generate([&](Index const ic) { return Subtract(channels_[ic], o.channels_[ic]); });
}

auto Channels::subtract(Re2 const &o) const -> Channels
{
  return Generate([&](Index const ic) { return Subtract(channels_[ic], o); });
}

auto Channels::subtract(Real const s) const -> Channels
{
  return Generate([&](Index const ic) { return Subtract(channels_[ic], s); });
}

auto Channels::multiply(Channels const &o) const -> Channels
{
  return Generate([&](Index const ic) { return Multiply(channels_[ic], o.channels_[ic]); });
}

auto Channels::multiply(Re2 const &o) const -> Channels
{
  return Generate([&](Index const ic) { return Multiply(channels_[ic], o); });
}

auto Channels::multiply(Real const s) const -> Channels
{
  return Generate([&](Index const ic) { return Multiply(s, channels_[ic]); });
}

auto Channels::divide(Channels const &o) const -> Channels
{
  return Generate([&](Index const ic) { return Divide(channels_[ic], o.channels_[ic]); });
}

auto Channels::divide(Re2 const &o) const -> Channels
{
  return Generate([&](Index const ic) { return Divide(channels_[ic], o); });
}

auto Channels::divide(Real const s) const -> Channels
{
  return Generate([&](Index const ic) { return Divide(channels_[ic], s); });
}

auto Channels::sum() const -> Real
{
  Real s = 0.;
  for (auto const &c : channels_) {
    s += Sum(c);
  }
  return s;
}

auto Channels::map(std::function<Real(Real)> const &f) const -> Channels
{
  return Generate([&](Index const ic) {
    Re2 m(shape_);
    m.device(Threads::TensorDevice()) = channels_[ic].unaryExpr(f);
    return m;
  });
}

auto WeightedAverage(Channels const &v, Channels const &u0, Real const t, Real const l) -> Channels
{
  return Channels::Generate([&](Index const ic) { return WeightedAverage(v[ic], u0[ic], t, l); });
}

} // namespace tvd
