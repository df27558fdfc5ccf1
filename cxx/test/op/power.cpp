#include "tvd/op/power.hpp"
#include "tvd/tensors.hpp"

#include <catch2/catch.hpp>
#include <cmath>

using namespace tvd;
using namespace Catch;

TEST_CASE("Power", "[power]")
{
  Re2 a(6, 5);
  a.setRandom();
  a = (a - a.constant(0.5)) * a.constant(100.);

  SECTION("Squares agree")
  {
    Re2 const s = Squared(a);
    Re2 const p = Power(a, 2);
    Re2 const pf = Power(a, 2.);
    Re2 const m = Multiply(a, a);
    for (Index ii = 0; ii < a.dimension(0); ii++) {
      for (Index ij = 0; ij < a.dimension(1); ij++) {
        CHECK(s(ii, ij) == m(ii, ij));
        CHECK(p(ii, ij) == m(ii, ij));
        CHECK(pf(ii, ij) == m(ii, ij));
      }
    }
  }

  SECTION("Real exponents")
  {
    Re2 b(2, 2);
    b.setValues({{4., 9.}, {-8., 0.}});
    Re2 const r = Power(b, 0.5);
    CHECK(r(0, 0) == Catch::Detail::Approx(2.));
    CHECK(r(0, 1) == Catch::Detail::Approx(3.));
    CHECK(std::isnan(r(1, 0)));
    CHECK(r(1, 1) == 0.);
    CHECK(Power(b, 3)(1, 0) == Catch::Detail::Approx(-512.));
  }

  SECTION("Norm")
  {
    Re2 b(2, 2);
    b.setValues({{3., 0.}, {0., -4.}});
    CHECK(Norm(b) == Catch::Detail::Approx(5.));
    CHECK(Norm(a) == Catch::Detail::Approx(std::sqrt(Sum(Squared(a)))));

    Re2 z(3, 3);
    z.setZero();
    CHECK(Norm(z) == 0.);
  }

  SECTION("Channels")
  {
    Re2 b(2, 2);
    b.setValues({{3., 0.}, {0., -4.}});
    Channels const c(b, b, b);
    CHECK(Norm(c) == Catch::Detail::Approx(std::sqrt(75.)));
    CHECK(Squared(c)[1](1, 1) == 16.);
    CHECK(Power(c, 3)[2](0, 0) == Catch::Detail::Approx(27.));
  }
}
