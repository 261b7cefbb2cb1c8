////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include "lhl/utils/environment_vars.hpp"

#include "lhl/utils/Error.hpp"

#include <stdlib.h>

#include <stdexcept>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using namespace lhl;

// Set an environment variable on construction, and unset it afterward.
struct RAIIEnvVar
{
  RAIIEnvVar(std::string name, std::string value) : env_name(name)
  {
    if (getenv(name.c_str()))
    {
      throw std::runtime_error(
        std::string("Attempt to set environment variable ") + name
        + std::string(" but it is already set in the environment"));
    }

    if (setenv(name.c_str(), value.c_str(), 0) != 0)
    {
      throw std::runtime_error(
        std::string("Failed to set environment variable ") + name);
    }
  }

  ~RAIIEnvVar() { unsetenv(env_name.c_str()); }

  std::string env_name;
};

TEST_CASE("Raw env vars work", "[utilities][environment_vars]")
{
  RAIIEnvVar env_manager("TEST_LHL_FOO_BAR", "1");

  REQUIRE(env::raw::exists("TEST_LHL_FOO_BAR"));
  REQUIRE_FALSE(env::raw::exists("TEST_LHL_BAR_FOO"));
  REQUIRE(env::raw::get_raw("TEST_LHL_FOO_BAR") == "1");
  REQUIRE(env::raw::get_raw("TEST_LHL_BAR_FOO") == "");
  REQUIRE(env::raw::get<int>("TEST_LHL_FOO_BAR") == 1);
  REQUIRE(env::raw::get<bool>("TEST_LHL_FOO_BAR"));
}

TEST_CASE("Settings are registered with defaults",
          "[utilities][environment_vars]")
{
  REQUIRE(env::registered()
          == std::vector<std::string>{"LOG_LEVEL", "DEBUG_BACKTRACE"});
  REQUIRE(env::get_default("LOG_LEVEL") == "warn");
  REQUIRE(env::get_default("DEBUG_BACKTRACE") == "false");
  for (auto const& name : env::registered())
  {
    REQUIRE_FALSE(env::about(name).empty());
  }
}

TEST_CASE("Settings are cached until reloaded",
          "[utilities][environment_vars]")
{
  if (env::raw::exists("LHL_DEBUG_BACKTRACE"))
  {
    throw std::runtime_error("LHL_DEBUG_BACKTRACE already set in env");
  }

  env::reload();
  REQUIRE_FALSE(env::exists("DEBUG_BACKTRACE"));
  REQUIRE(env::get_raw("DEBUG_BACKTRACE") == "false");
  REQUIRE_FALSE(env::get<bool>("DEBUG_BACKTRACE"));

  {
    RAIIEnvVar env_manager("LHL_DEBUG_BACKTRACE", "true");
    REQUIRE_FALSE(env::exists("DEBUG_BACKTRACE"));

    env::reload();
    REQUIRE(env::exists("DEBUG_BACKTRACE"));
    REQUIRE(env::get_raw("DEBUG_BACKTRACE") == "true");
    REQUIRE(env::get<bool>("DEBUG_BACKTRACE"));
  }

  env::reload();
  REQUIRE_FALSE(env::exists("DEBUG_BACKTRACE"));
}

TEST_CASE("Unregistered LHList env vars are rejected",
          "[utilities][environment_vars]")
{
  REQUIRE_THROWS_AS(env::get_raw("NOT_A_REGISTERED_VAR"),
                    LHLNonfatalException);
  REQUIRE_THROWS_AS(env::exists("NOT_A_REGISTERED_VAR"),
                    LHLNonfatalException);
  REQUIRE_THROWS_AS(env::get_default("TEST_VAR1"), LHLNonfatalException);
}
