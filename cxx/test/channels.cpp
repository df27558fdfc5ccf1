#include "tvd/channels.hpp"
#include "tvd/op/elementwise.hpp"

#include <catch2/catch.hpp>

using namespace tvd;
using namespace Catch;

TEST_CASE("Elementwise", "[arith]")
{
  Re2 a(2, 3), b(2, 3), c(3, 2);
  a.setConstant(6.);
  b.setConstant(2.);
  c.setZero();

  SECTION("Matrix operands")
  {
    CHECK(Add(a, b)(1, 2) == 8.);
    CHECK(Subtract(a, b)(0, 0) == 4.);
    CHECK(Multiply(a, b)(1, 1) == 12.);
    CHECK(Divide(a, b)(0, 2) == 3.);
  }

  SECTION("Scalars broadcast")
  {
    CHECK(Add(a, 1.)(1, 2) == 7.);
    CHECK(Subtract(1., a)(0, 1) == -5.);
    CHECK(Multiply(0.5, a)(1, 0) == 3.);
    CHECK(Divide(12., a)(0, 0) == 2.);
  }

  SECTION("Shapes must match")
  {
    CHECK_THROWS_AS(Add(a, c), ShapeMismatch);
    CHECK_THROWS_AS(Divide(c, a), ShapeMismatch);
    CHECK_THROWS_AS(WeightedAverage(a, c, 1., 1.), ShapeMismatch);
  }

  SECTION("Operands are not modified")
  {
    Re2 const r = Multiply(a, b);
    CHECK(a(0, 0) == 6.);
    CHECK(b(0, 0) == 2.);
    CHECK(r(0, 0) == 12.);
  }

  SECTION("Weighted average")
  {
    Real const t = 1. / std::sqrt(2.);
    Real const l = 0.008;
    Re2 const  w = WeightedAverage(a, b, t, l);
    CHECK(w(1, 1) == Catch::Detail::Approx((6. + t * l * 2.) / (1. + t * l)));
    /* Large weights pull the result onto the data */
    Re2 const w2 = WeightedAverage(a, b, 1., 1.e12);
    CHECK(w2(0, 0) == Catch::Detail::Approx(2.));
  }
}

TEST_CASE("Channels", "[channels]")
{
  Re2 r(3, 4), g(3, 4), b(3, 4), wrong(4, 3);
  r.setConstant(1.);
  g.setConstant(2.);
  b.setConstant(3.);
  wrong.setZero();

  SECTION("Construction")
  {
    Channels const c(r, g, b);
    CHECK(c.shape()[0] == 3);
    CHECK(c.shape()[1] == 4);
    CHECK(c[1](2, 3) == 2.);
    CHECK_THROWS_AS(Channels(r, wrong, b), ShapeMismatch);
    CHECK_THROWS_AS(Channels(r, g, wrong), ShapeMismatch);
    CHECK_THROWS(c[3]);

    Channels const z(Sz2{5, 2});
    CHECK(z.shape()[0] == 5);
    CHECK(z.shape()[1] == 2);
    CHECK(z.sum() == 0.);
  }

  SECTION("Arithmetic")
  {
    Channels const c(r, g, b);
    CHECK(c.sum() == 12. * 6.);
    CHECK(c.add(c)[2](0, 0) == 6.);
    CHECK(c.subtract(1.)[0](1, 1) == 0.);
    CHECK(c.multiply(2.)[1](2, 0) == 4.);
    CHECK(c.divide(c)[2](2, 3) == 1.);
    CHECK(c.multiply(g)[2](0, 3) == 6.);
    CHECK(c.subtract(r)[1](0, 0) == 1.);
    CHECK(c.map([](Real const x) { return x * x; }).sum() == 12. * 14.);
    CHECK_THROWS_AS(c.add(wrong), ShapeMismatch);
    CHECK_THROWS_AS(c.divide(Channels(Sz2{4, 3})), ShapeMismatch);
  }
}
