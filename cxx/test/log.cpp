#include "tvd/errors.hpp"
#include "tvd/log/log.hpp"
#include "tvd/op/elementwise.hpp"

#include <catch2/catch.hpp>

using namespace tvd;

TEST_CASE("Log-entries", "[log]")
{
  Log::ClearSaved();
  Log::Print("Test", "Value {} of {}", 3, 4);
  Log::Debug("Test", "Only shown at high verbosity");
  Log::Warn("Test", "Careful");

  auto const &saved = Log::Saved();
  REQUIRE(saved.size() == 2);
  /* [HH:MM:SS] [Test  ] Value 3 of 4 */
  CHECK(saved[0].substr(10) == " [Test  ] Value 3 of 4");
  CHECK(saved[1].substr(10) == " [Test  ] Careful");
  Log::ClearSaved();
  CHECK(Log::Saved().empty());
}

TEST_CASE("Log-failures", "[log]")
{
  Sz2 const a{2, 3}, b{3, 2};
  try {
    CheckShapes<2>("Test", a, b);
    FAIL("CheckShapes did not throw");
  } catch (ShapeMismatch const &e) {
    std::string const what = e.what();
    CHECK(what.find("[Test  ]") != std::string::npos);
    CHECK(what.find("Shapes [2, 3] and [3, 2] do not match") != std::string::npos);
  }

  /* Everything the library throws can be caught as a Failure */
  CHECK_THROWS_AS(throw AxisTooShort("Test", "{}", 1), Log::Failure);
  CHECK_THROWS_AS(throw AxisOutOfBounds("Test", "{}", 1), std::runtime_error);
}

TEST_CASE("Log-levels", "[log]")
{
  auto const old = Log::DisplayLevel();
  Log::SetDisplayLevel(Log::Display::High);
  CHECK(Log::IsHigh());
  Log::ClearSaved();
  Log::Debug("Test", "Printed but not kept");
  CHECK(Log::Saved().empty());
  Log::SetDisplayLevel(old);
  CHECK(Log::DisplayLevel() == old);

  auto const t = Log::Now();
  auto const elapsed = Log::ToNow(t);
  CHECK(elapsed.substr(elapsed.size() - 2) == " s");
}
