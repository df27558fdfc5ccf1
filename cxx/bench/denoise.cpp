#define CATCH_CONFIG_MAIN
#define CATCH_CONFIG_ENABLE_BENCHMARKING

#include "tvd/algo/pdhg.hpp"
#include "tvd/op/diff.hpp"
#include "tvd/prox/ball.hpp"
#include "tvd/sys/threads.hpp"

#include <catch2/catch.hpp>

using namespace tvd;

TEST_CASE("Diff", "[diff]")
{
  Index const sz = 1024;
  Re2         x(sz, sz);
  x.setRandom();

  BENCHMARK("Forward X") { return ForwardDiff(x, 0); };
  BENCHMARK("Forward Y") { return ForwardDiff(x, 1); };
  BENCHMARK("Backward X") { return BackwardDiff(x, 0); };
}

TEST_CASE("Ball", "[ball]")
{
  Index const sz = 1024;
  Channels const a = Channels::Generate([](Index) {
    Re2 c(sz, sz);
    c.setRandom();
    return c;
  });
  Channels const b = Channels::Generate([](Index) {
    Re2 c(sz, sz);
    c.setRandom();
    return c;
  });

  BENCHMARK("Single") { return Proxs::BallProject(a[0], b[0]); };
  BENCHMARK("Coupled") { return Proxs::BallProject(a, b, Proxs::Coupling::Coupled); };
  BENCHMARK("Per channel") { return Proxs::BallProject(a, b, Proxs::Coupling::PerChannel); };
}

TEST_CASE("Denoise", "[pdhg]")
{
  Index const sz = 256;
  Re2         x(sz, sz);
  x.setRandom();
  x = x * x.constant(255.);
  Channels const c(x, x, x);
  auto           opts = PDHG::Opts::Defaults(0.05);
  opts.imax = 20;
  opts.tol = 0.;

  BENCHMARK("Grey") { return PDHG::Run(x, opts); };
  BENCHMARK("Colour") { return PDHG::Run(c, opts); };
  Threads::SetGlobalThreadCount(1);
  BENCHMARK("Grey 1 thread") { return PDHG::Run(x, opts); };
  Threads::SetGlobalThreadCount(0);
}
