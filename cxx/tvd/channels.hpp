#pragma once

#include "op/elementwise.hpp"
#include "types.hpp"

#include <array>

namespace tvd {

/*
 * A colour image as three real-valued matrices of identical shape. Arithmetic is lifted across the channels. Operands may
 * be another bundle, a single matrix (broadcast to every channel) or a scalar.
 */
struct Channels
{
  static constexpr Index NC = 3;
  using Array = std::array<Re2, NC>;

  explicit Channels(Sz2 const shape);
  Channels(Re2 const &red, Re2 const &green, Re2 const &blue);
  Channels(Array cs);

  auto shape() const -> Sz2 const &;
  auto operator[](Index const ic) const -> Re2 const &;

  auto add(Channels const &other) const -> Channels;
  auto add(Re2 const &other) const -> Channels;
  auto add(Real const s) const -> Channels;
  auto subtract(Channels const &other) const -> Channels;
  auto subtract(Re2 const &other) const -> Channels;
  auto subtract(Real const s) const -> Channels;
  auto multiply(Channels const &other) const -> Channels;
  auto multiply(Re2 const &other) const -> Channels;
  auto multiply(Real const s) const -> Channels;
  auto divide(Channels const &other) const -> Channels;
  auto divide(Re2 const &other) const -> Channels;
  auto divide(Real const s) const -> Channels;

  auto sum() const -> Real;
  auto map(std::function<Real(Real)> const &f) const -> Channels;

  /* Build a new bundle by applying f(ic) -> Re2 to each channel index */
  template <typename F> static auto Generate(F &&f) -> Channels
  {
    Array cs;
    for (Index ic = 0; ic < NC; ic++) {
      cs[ic] = f(ic);
    }
    return Channels(std::move(cs));
  }

private:
  Sz2   shape_;
  Array channels_;
};

/* Free functions so the solvers can be written once for both matrices and bundles */
inline auto Add(Channels const &a, Channels const &b) -> Channels { return a.add(b); }
inline auto Subtract(Channels const &a, Channels const &b) -> Channels { return a.subtract(b); }
inline auto Multiply(Real const s, Channels const &a) -> Channels { return a.multiply(s); }
inline auto Multiply(Channels const &a, Channels const &b) -> Channels { return a.multiply(b); }
inline auto Divide(Channels const &a, Re2 const &b) -> Channels { return a.divide(b); }
auto WeightedAverage(Channels const &v, Channels const &u0, Real const t, Real const l) -> Channels;

} // namespace tvd
