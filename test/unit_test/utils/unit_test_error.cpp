////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "lhl/utils/Error.hpp"

using namespace lhl;

TEST_CASE("LHLExceptionBase works", "[utilities][error]")
{
  try
  {
    throw LHLExceptionBase("foo");
  }
  catch (const LHLExceptionBase& e)
  {
    // May or may not collect a backtrace.
    REQUIRE_THAT(e.what(), Catch::Matchers::StartsWith("foo"));
  }

  try
  {
    throw LHLExceptionBase("foo", SaveBacktrace);
  }
  catch (const LHLExceptionBase& e)
  {
    REQUIRE_THAT(e.what(), Catch::Matchers::StartsWith("foo\nStack trace:\n"));
  }

  try
  {
    throw LHLExceptionBase("foo", NoSaveBacktrace);
  }
  catch (const LHLExceptionBase& e)
  {
    REQUIRE_THAT(e.what(), Catch::Matchers::Equals("foo"));
  }
}

TEST_CASE("LHLFatalException works", "[utilities][error]")
{
  try
  {
    throw LHLFatalException("foo", 1234);
  }
  catch (const LHLExceptionBase& e)
  {
    REQUIRE_THAT(e.what(),
                 Catch::Matchers::StartsWith("foo1234\nStack trace:\n"));
  }
}

TEST_CASE("LHLNonfatalException works", "[utilities][error]")
{
  try
  {
    throw LHLNonfatalException("bar", ' ', 5);
  }
  catch (const std::exception& e)
  {
    REQUIRE_THAT(e.what(), Catch::Matchers::StartsWith("bar 5"));
  }
}

TEST_CASE("Exceptions copy their message", "[utilities][error]")
{
  LHLNonfatalException e("copied");
  LHLNonfatalException f = e;
  REQUIRE(std::string(e.what()) == std::string(f.what()));
}

TEST_CASE("LHL_ASSERT works", "[utilities][error]")
{
  REQUIRE_NOTHROW(LHL_ASSERT(1 + 1 == 2, LHLNonfatalException, "math"));
  REQUIRE_THROWS_AS(LHL_ASSERT(1 + 1 == 3, LHLNonfatalException, "math"),
                    LHLNonfatalException);
  REQUIRE_THROWS_WITH(
    LHL_ASSERT(false, LHLNonfatalException, "value was ", 3),
    Catch::Matchers::StartsWith("value was 3"));
  REQUIRE_THROWS_AS(LHL_ASSERT_ALWAYS(false, "always"), LHLFatalException);
  REQUIRE_NOTHROW(LHL_ASSERT_ALWAYS(true, "always"));
}
