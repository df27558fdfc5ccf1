#include "tvd/op/power.hpp"
#include "tvd/prox/ball.hpp"

#include <catch2/catch.hpp>

using namespace tvd;
using namespace Catch;

TEST_CASE("BallProject", "[prox]")
{
  Re2 a(2, 2), b(2, 2);
  a.setValues({{3., -0.5}, {-3., -0.5}});
  b.setValues({{4., 0.5}, {0., 0.5}});

  SECTION("Lengths")
  {
    Re2 const len = Proxs::VectorLength(a, b);
    CHECK(len(0, 0) == Catch::Detail::Approx(5.));
    CHECK(len(0, 1) == Catch::Detail::Approx(std::sqrt(0.5)));
    CHECK(len(1, 0) == Catch::Detail::Approx(3.));
    CHECK(len(1, 1) == Catch::Detail::Approx(std::sqrt(0.5)));
  }

  SECTION("Only vectors outside the ball are rescaled")
  {
    auto const [pa, pb] = Proxs::BallProject(a, b);
    CHECK(pa(0, 0) == Catch::Detail::Approx(0.6));
    CHECK(pa(0, 1) == Catch::Detail::Approx(-0.5));
    CHECK(pa(1, 0) == Catch::Detail::Approx(-1.));
    CHECK(pa(1, 1) == Catch::Detail::Approx(-0.5));
    CHECK(pb(0, 0) == Catch::Detail::Approx(0.8));
    CHECK(pb(0, 1) == Catch::Detail::Approx(0.5));
    CHECK(pb(1, 0) == Catch::Detail::Approx(0.).margin(1.e-15));
    CHECK(pb(1, 1) == Catch::Detail::Approx(0.5));
    /* Inputs are untouched */
    CHECK(a(0, 0) == 3.);
  }

  SECTION("Zero length")
  {
    Re2 z(3, 3);
    z.setZero();
    auto const [pa, pb] = Proxs::BallProject(z, z);
    CHECK(Norm(pa) == 0.);
    CHECK(Norm(pb) == 0.);
  }

  SECTION("Shapes must match")
  {
    Re2 c(2, 3);
    c.setZero();
    CHECK_THROWS_AS(Proxs::BallProject(a, c), ShapeMismatch);
  }
}

TEST_CASE("BallProject-channels", "[prox]")
{
  Re2 a(1, 2), b(1, 2), z(1, 2);
  /* Each channel on its own is inside the ball, together they are not */
  a.setValues({{0.6, 0.}});
  b.setValues({{0.8, 0.}});
  z.setZero();
  Channels const ca(a, a, z), cb(b, b, z);

  SECTION("Coupled lengths sum over channels")
  {
    Re2 const len = Proxs::VectorLength(ca, cb);
    CHECK(len(0, 0) == Catch::Detail::Approx(std::sqrt(2.)));
    CHECK(len(0, 1) == 0.);
  }

  SECTION("Coupled")
  {
    auto const [pa, pb] = Proxs::BallProject(ca, cb, Proxs::Coupling::Coupled);
    CHECK(pa[0](0, 0) == Catch::Detail::Approx(0.6 / std::sqrt(2.)));
    CHECK(pa[1](0, 0) == Catch::Detail::Approx(0.6 / std::sqrt(2.)));
    CHECK(pb[1](0, 0) == Catch::Detail::Approx(0.8 / std::sqrt(2.)));
    CHECK(pa[2](0, 0) == 0.);
    CHECK(pb[0](0, 1) == 0.);
    /* The coupled field has unit length at that pixel */
    Real len2 = 0.;
    for (Index ic = 0; ic < Channels::NC; ic++) {
      len2 += pa[ic](0, 0) * pa[ic](0, 0) + pb[ic](0, 0) * pb[ic](0, 0);
    }
    CHECK(len2 == Catch::Detail::Approx(1.));
  }

  SECTION("Per channel")
  {
    auto const [pa, pb] = Proxs::BallProject(ca, cb, Proxs::Coupling::PerChannel);
    CHECK(pa[0](0, 0) == Catch::Detail::Approx(0.6));
    CHECK(pa[1](0, 0) == Catch::Detail::Approx(0.6));
    CHECK(pb[1](0, 0) == Catch::Detail::Approx(0.8));
  }
}
